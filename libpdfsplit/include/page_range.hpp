#ifndef PDFSPLIT_PAGE_RANGE_HPP
#define PDFSPLIT_PAGE_RANGE_HPP

#include <string>
#include <vector>

namespace pdfsplit {

/**
 * @brief One planned chapter: pages [start, end] of the source.
 *
 * @note end < start is possible when two break pages are equal; such a
 * range is still in range and produces a zero-page chapter. Out-of-range
 * entries always report a page_count() of 0.
 */
struct PageRange {
    int index = 0;         ///< 1-based position among all break pages
    int start = 0;         ///< First page, 1-based
    int end = 0;           ///< Last page, 1-based, clamped to the page count
    bool in_range = false; ///< False if start lies outside [1, total_pages]

    [[nodiscard]] int page_count() const noexcept {
        return in_range && end >= start ? end - start + 1 : 0;
    }
};

/**
 * @brief Computes one range per break page.
 *
 * Range i starts at break_pages[i] and ends one page before the next
 * break page, or at @p total_pages for the last one. Ends beyond the
 * document are clamped. Out-of-range starts are kept in the result with
 * in_range == false so callers can report them.
 *
 * @param break_pages Break pages, already sorted ascending.
 * @param total_pages Page count of the source.
 */
std::vector<PageRange> plan_ranges(const std::vector<int>& break_pages, int total_pages);

/**
 * @brief Output file name for a range: "{stem}_chapter{NN}_p{start}-{end}.pdf".
 *
 * NN is the range index zero-padded to two digits; larger indexes just
 * get more digits.
 */
std::string chapter_file_name(const std::string& stem, const PageRange& range);

} // namespace pdfsplit

#endif // PDFSPLIT_PAGE_RANGE_HPP
