#include "../../include/page_list.hpp"
#include "../../include/split_error.hpp"
#include <charconv>
#include <system_error>

namespace {

constexpr const char* kMalformedList = "Page list must be comma-separated numbers";

std::string_view trim(std::string_view s) {
    constexpr std::string_view ws = " \t\r\n\f\v";
    const auto first = s.find_first_not_of(ws);
    if (first == std::string_view::npos) return {};
    const auto last = s.find_last_not_of(ws);
    return s.substr(first, last - first + 1);
}

int parse_token(std::string_view token) {
    token = trim(token);
    // from_chars accepts '-' but not '+'
    if (!token.empty() && token.front() == '+') {
        token.remove_prefix(1);
        if (!token.empty() && token.front() == '-') {
            throw pdfsplit::SplitError(pdfsplit::ErrorKind::InvalidInput, kMalformedList);
        }
    }
    int value = 0;
    const char* first = token.data();
    const char* last = token.data() + token.size();
    const auto [ptr, ec] = std::from_chars(first, last, value, 10);
    if (token.empty() || ec != std::errc() || ptr != last) {
        throw pdfsplit::SplitError(pdfsplit::ErrorKind::InvalidInput, kMalformedList);
    }
    return value;
}

} // namespace

namespace pdfsplit {

std::vector<int> parse_page_list(const std::string_view text) {
    std::vector<int> pages;
    std::size_t pos = 0;
    while (true) {
        const auto comma = text.find(',', pos);
        if (comma == std::string_view::npos) {
            pages.push_back(parse_token(text.substr(pos)));
            break;
        }
        pages.push_back(parse_token(text.substr(pos, comma - pos)));
        pos = comma + 1;
    }
    return pages;
}

} // namespace pdfsplit
