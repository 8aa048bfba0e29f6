#ifndef PDFSPLIT_EVENTS_HPP
#define PDFSPLIT_EVENTS_HPP

#include <cstddef>
#include <filesystem>

namespace pdfsplit {

/**
 * @brief Events published by the Splitter.
 *
 * Plain data carriers used with EventBus.
 */

/**
 * @brief Emitted once the source is open and the ranges are planned.
 */
struct SplitStartEvent {
    std::filesystem::path source;  ///< Source document
    int total_pages = 0;           ///< Page count of the source
    std::size_t range_count = 0;   ///< Number of planned ranges, skipped ones included
};

/**
 * @brief Emitted after a chapter file has been written and closed.
 */
struct ChapterWrittenEvent {
    std::filesystem::path path;    ///< Written file
    int index = 0;                 ///< 1-based chapter number
    int start = 0;                 ///< First page (1-based, inclusive)
    int end = 0;                   ///< Last page (1-based, inclusive)
    int page_count = 0;            ///< Pages actually written
};

/**
 * @brief Emitted when a break page lies outside the source.
 */
struct RangeSkippedEvent {
    int index = 0;                 ///< 1-based chapter number that was skipped
    int page = 0;                  ///< Offending break page
    int total_pages = 0;           ///< Page count of the source
};

/**
 * @brief Emitted when all ranges have been handled.
 */
struct SplitCompleteEvent {
    std::filesystem::path source;
    std::size_t files_created = 0;
    std::size_t ranges_skipped = 0;
};

} // namespace pdfsplit

#endif // PDFSPLIT_EVENTS_HPP
