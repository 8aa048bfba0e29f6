#include "../../libpdfsplit/include/page_range.hpp"
#include "test_support.hpp"

#include <climits>
#include <iostream>
#include <vector>

using pdfsplit_test::require_;

namespace {

    bool same_(const pdfsplit::PageRange& r, int index, int start, int end, bool in_range) {
        return r.index == index && r.start == start && r.end == end && r.in_range == in_range;
    }

    bool test_chapters_of_hundred_pages_() {
        const auto ranges = pdfsplit::plan_ranges({1, 10, 20, 30}, 100);
        bool ok = require_(ranges.size() == 4, "one range per break page");
        if (!ok) return false;
        ok &= require_(same_(ranges[0], 1, 1, 9, true), "range 1 must be 1-9");
        ok &= require_(same_(ranges[1], 2, 10, 19, true), "range 2 must be 10-19");
        ok &= require_(same_(ranges[2], 3, 20, 29, true), "range 3 must be 20-29");
        ok &= require_(same_(ranges[3], 4, 30, 100, true), "range 4 must run to the last page");
        ok &= require_(ranges[3].page_count() == 71, "30-100 has 71 pages");
        return ok;
    }

    bool test_end_clamped_and_start_out_of_range_() {
        const auto ranges = pdfsplit::plan_ranges({1, 200}, 100);
        bool ok = require_(ranges.size() == 2, "two ranges expected");
        if (!ok) return false;
        ok &= require_(same_(ranges[0], 1, 1, 100, true), "199 must clamp to 100");
        ok &= require_(!ranges[1].in_range && ranges[1].start == 200, "200 must be out of range");
        return ok;
    }

    bool test_single_break_and_last_page_() {
        bool ok = true;
        const auto mid = pdfsplit::plan_ranges({50}, 100);
        ok &= require_(mid.size() == 1 && same_(mid[0], 1, 50, 100, true), "[50] must be 50-100");
        const auto last = pdfsplit::plan_ranges({100}, 100);
        ok &= require_(last.size() == 1 && same_(last[0], 1, 100, 100, true), "[100] is a single page");
        ok &= require_(last[0].page_count() == 1, "single page count");
        return ok;
    }

    bool test_low_starts_out_of_range_() {
        const auto ranges = pdfsplit::plan_ranges({-3, 0, 5}, 10);
        bool ok = require_(ranges.size() == 3, "three ranges expected");
        if (!ok) return false;
        ok &= require_(!ranges[0].in_range && !ranges[1].in_range, "pages below 1 are out of range");
        ok &= require_(same_(ranges[2], 3, 5, 10, true), "third range keeps index 3");
        return ok;
    }

    bool test_equal_breaks_give_empty_range_() {
        const auto ranges = pdfsplit::plan_ranges({10, 10, 20}, 30);
        bool ok = require_(ranges.size() == 3, "three ranges expected");
        if (!ok) return false;
        ok &= require_(same_(ranges[0], 1, 10, 9, true), "first of equal pair is 10-9");
        ok &= require_(ranges[0].page_count() == 0, "10-9 has no pages");
        ok &= require_(same_(ranges[1], 2, 10, 19, true), "second of equal pair is 10-19");
        ok &= require_(same_(ranges[2], 3, 20, 30, true), "last range runs to the end");
        return ok;
    }

    bool test_extreme_values_() {
        const auto ranges = pdfsplit::plan_ranges({INT_MIN, INT_MIN, INT_MAX}, 5);
        bool ok = require_(ranges.size() == 3, "three ranges expected");
        if (!ok) return false;
        ok &= require_(!ranges[0].in_range && !ranges[1].in_range && !ranges[2].in_range,
                       "extreme pages are out of range");
        ok &= require_(ranges[1].end == 5, "INT_MAX - 1 must clamp to the page count");
        return ok;
    }

    bool test_file_names_() {
        bool ok = true;
        ok &= require_(pdfsplit::chapter_file_name("book", {1, 1, 9, true}) == "book_chapter01_p1-9.pdf",
                       "index 1 pads to 01");
        ok &= require_(pdfsplit::chapter_file_name("book", {4, 30, 100, true}) == "book_chapter04_p30-100.pdf",
                       "page numbers are not padded");
        ok &= require_(pdfsplit::chapter_file_name("my.book", {11, 5, 5, true}) == "my.book_chapter11_p5-5.pdf",
                       "two digits stay two digits");
        ok &= require_(pdfsplit::chapter_file_name("b", {123, 7, 8, true}) == "b_chapter123_p7-8.pdf",
                       "three digits are not truncated");
        ok &= require_(pdfsplit::chapter_file_name("b", {1, 10, 9, true}) == "b_chapter01_p10-9.pdf",
                       "empty range keeps its numbers");
        return ok;
    }

} // namespace

int main() {
    bool ok = true;
    ok &= test_chapters_of_hundred_pages_();
    ok &= test_end_clamped_and_start_out_of_range_();
    ok &= test_single_break_and_last_page_();
    ok &= test_low_starts_out_of_range_();
    ok &= test_equal_breaks_give_empty_range_();
    ok &= test_extreme_values_();
    ok &= test_file_names_();
    if (!ok) return 1;
    std::cout << "pdfsplit page range tests passed\n";
    return 0;
}
