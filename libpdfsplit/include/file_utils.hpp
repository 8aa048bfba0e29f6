#ifndef PDFSPLIT_FILE_UTILS_HPP
#define PDFSPLIT_FILE_UTILS_HPP

#include <cstdio>
#include <filesystem>
#include <memory>

namespace pdfsplit {

    struct FileCloser {
        void operator()(FILE* f) const noexcept {
            if (f) std::fclose(f);
        }
    };

    ///< Owning FILE* handle, closed on every exit path.
    using FilePtr = std::unique_ptr<FILE, FileCloser>;

    /**
     * @brief Opens a file using a filesystem path, handling Windows Unicode correctly.
     * @param path The path to the file.
     * @param mode The standard C fopen mode string (e.g., "rb", "wb").
     * @return FILE* pointer or nullptr if open failed.
     */
    FILE *open_file(const std::filesystem::path &path, const char *mode);

    /**
     * @brief Creates @p dir and all missing parents.
     *
     * Succeeds silently when the directory already exists.
     * @throws SplitError (ErrorKind::Io) if the directory can't be created
     * or a non-directory is in the way.
     */
    void ensure_directory(const std::filesystem::path &dir);

} // namespace pdfsplit

#endif // PDFSPLIT_FILE_UTILS_HPP
