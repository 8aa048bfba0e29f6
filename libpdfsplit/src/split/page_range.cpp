#include "../../include/page_range.hpp"
#include <algorithm>
#include <climits>

namespace pdfsplit {

std::vector<PageRange> plan_ranges(const std::vector<int>& break_pages, const int total_pages) {
    std::vector<PageRange> ranges;
    ranges.reserve(break_pages.size());

    for (std::size_t i = 0; i < break_pages.size(); ++i) {
        PageRange r;
        r.index = static_cast<int>(i) + 1;
        r.start = break_pages[i];
        if (i + 1 < break_pages.size()) {
            // computed in long long: break_pages[i + 1] may be INT_MIN
            const long long next = static_cast<long long>(break_pages[i + 1]) - 1;
            r.end = static_cast<int>(std::clamp<long long>(next, INT_MIN, total_pages));
        } else {
            r.end = total_pages;
        }
        r.in_range = r.start >= 1 && r.start <= total_pages;
        ranges.push_back(r);
    }
    return ranges;
}

std::string chapter_file_name(const std::string& stem, const PageRange& range) {
    std::string seq = std::to_string(range.index);
    if (seq.size() < 2) {
        seq.insert(0, 2 - seq.size(), '0');
    }
    return stem + "_chapter" + seq + "_p" + std::to_string(range.start) + "-" +
           std::to_string(range.end) + ".pdf";
}

} // namespace pdfsplit
