/**
 * @file split_config.hpp
 * @brief Validated, immutable description of one split job.
 */

#ifndef PDFSPLIT_SPLIT_CONFIG_HPP
#define PDFSPLIT_SPLIT_CONFIG_HPP

#include <filesystem>
#include <vector>

namespace pdfsplit {

/**
 * @brief Source, destination and break pages of a split.
 *
 * Only SplitConfig::build() creates instances, so every SplitConfig in
 * circulation has an existing source and a non-empty, non-decreasing
 * break list.
 */
class SplitConfig {
public:
    /**
     * @brief Validates and normalizes the inputs of a split.
     *
     * The break list is sorted ascending. Duplicates are preserved.
     * Apart from checking that the source exists, the filesystem is not
     * touched; the destination may not exist yet.
     *
     * @param source_path The document to split.
     * @param destination_dir Directory that will receive the chapters.
     * @param break_pages 1-based pages at which a new chapter starts.
     * @throws SplitError ErrorKind::NotFound if @p source_path is not an
     * existing file, ErrorKind::InvalidInput if @p break_pages is empty.
     */
    static SplitConfig build(std::filesystem::path source_path,
                             std::filesystem::path destination_dir,
                             std::vector<int> break_pages);

    [[nodiscard]] const std::filesystem::path& source_path() const noexcept { return source_path_; }
    [[nodiscard]] const std::filesystem::path& destination_dir() const noexcept { return destination_dir_; }
    [[nodiscard]] const std::vector<int>& break_pages() const noexcept { return break_pages_; }

private:
    SplitConfig(std::filesystem::path source_path,
                std::filesystem::path destination_dir,
                std::vector<int> break_pages);

    std::filesystem::path source_path_;
    std::filesystem::path destination_dir_;
    std::vector<int> break_pages_;
};

} // namespace pdfsplit

#endif // PDFSPLIT_SPLIT_CONFIG_HPP
