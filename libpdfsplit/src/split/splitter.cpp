#include "../../include/splitter.hpp"
#include "../../include/events.hpp"
#include "../../include/file_utils.hpp"
#include "../../include/logger.hpp"
#include "../../include/split_error.hpp"
#include <string>

namespace pdfsplit {

void Splitter::throw_if_stopped() const {
    if (is_stopped()) {
        throw SplitError(ErrorKind::Interrupted, "Interrupted");
    }
}

std::vector<PageRange> Splitter::plan(const SplitConfig& config) {
    const auto source = backend_.open(config.source_path());
    return plan_ranges(config.break_pages(), source->page_count());
}

std::size_t Splitter::split(const SplitConfig& config) {
    throw_if_stopped();

    const auto source = backend_.open(config.source_path());
    const int total_pages = source->page_count();
    const auto ranges = plan_ranges(config.break_pages(), total_pages);

    ensure_directory(config.destination_dir());

    const std::string stem = config.source_path().stem().string();
    Logger::log(LogLevel::Info,
                "Splitting " + config.source_path().string() + " (" + std::to_string(total_pages) +
                " pages) into " + std::to_string(ranges.size()) + " chapter(s) using " +
                std::string(backend_.get_name()),
                "splitter");
    event_bus_.publish(SplitStartEvent{config.source_path(), total_pages, ranges.size()});

    std::size_t files_created = 0;
    std::size_t ranges_skipped = 0;

    for (const auto& range : ranges) {
        throw_if_stopped();

        if (!range.in_range) {
            Logger::log(LogLevel::Warning,
                        "Page " + std::to_string(range.start) + " is out of range (1-" +
                        std::to_string(total_pages) + "). Skipping.",
                        "splitter");
            event_bus_.publish(RangeSkippedEvent{range.index, range.start, total_pages});
            ++ranges_skipped;
            continue;
        }

        // an empty loop when end < start: equal break pages give a zero-page chapter
        const auto output = source->create_output();
        for (int page = range.start; page <= range.end; ++page) {
            output->append_page(page);
        }

        const auto path = config.destination_dir() / chapter_file_name(stem, range);

        throw_if_stopped();
        output->write(path);

        Logger::log(LogLevel::Debug,
                    "Created: " + path.string() + " (pages " + std::to_string(range.start) + "-" +
                    std::to_string(range.end) + ")",
                    "splitter");
        event_bus_.publish(ChapterWrittenEvent{path, range.index, range.start, range.end,
                                               output->page_count()});
        ++files_created;
    }

    event_bus_.publish(SplitCompleteEvent{config.source_path(), files_created, ranges_skipped});
    return files_created;
}

} // namespace pdfsplit
