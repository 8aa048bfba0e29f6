#ifndef PDFSPLIT_PAGE_LIST_HPP
#define PDFSPLIT_PAGE_LIST_HPP

#include <string_view>
#include <vector>

namespace pdfsplit {

/**
 * @brief Parses a comma-separated list of page numbers.
 *
 * Each token is trimmed of surrounding whitespace and read as a base-10
 * integer with an optional sign, e.g. "1, 10,20 ,30" -> {1, 10, 20, 30}.
 * Order and duplicates are kept as written.
 *
 * @param text The list as typed by the user.
 * @return The parsed integers, one per token.
 * @throws SplitError (ErrorKind::InvalidInput) if any token is empty,
 * is not an integer, or does not fit in an int.
 */
std::vector<int> parse_page_list(std::string_view text);

} // namespace pdfsplit

#endif // PDFSPLIT_PAGE_LIST_HPP
