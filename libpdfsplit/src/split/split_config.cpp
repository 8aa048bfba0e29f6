#include "../../include/split_config.hpp"
#include "../../include/logger.hpp"
#include "../../include/split_error.hpp"
#include <algorithm>
#include <string>
#include <system_error>
#include <utility>

namespace pdfsplit {

SplitConfig::SplitConfig(std::filesystem::path source_path,
                         std::filesystem::path destination_dir,
                         std::vector<int> break_pages)
    : source_path_(std::move(source_path)),
      destination_dir_(std::move(destination_dir)),
      break_pages_(std::move(break_pages)) {}

SplitConfig SplitConfig::build(std::filesystem::path source_path,
                               std::filesystem::path destination_dir,
                               std::vector<int> break_pages) {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(source_path, ec)) {
        throw SplitError(ErrorKind::NotFound,
                         "Input file '" + source_path.string() + "' not found");
    }

    if (break_pages.empty()) {
        throw SplitError(ErrorKind::InvalidInput, "Page list is empty");
    }

    std::stable_sort(break_pages.begin(), break_pages.end());

    Logger::log(LogLevel::Debug,
                "Config: " + source_path.string() + " -> " + destination_dir.string() +
                " (" + std::to_string(break_pages.size()) + " break pages)",
                "split_config");

    return SplitConfig(std::move(source_path), std::move(destination_dir), std::move(break_pages));
}

} // namespace pdfsplit
