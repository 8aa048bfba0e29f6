#include "../../include/file_utils.hpp"
#include "../../include/logger.hpp"
#include "../../include/split_error.hpp"
#include <string>
#include <system_error>

namespace pdfsplit {

    FILE* open_file(const std::filesystem::path& path, const char* mode) {
#ifdef _WIN32
        // _wfopen accepts wide-char paths (UTF-16), supporting Unicode and long paths.
        std::wstring wmode;
        for (const char* p = mode; *p; ++p) wmode += static_cast<wchar_t>(*p);

        std::error_code ec;
        auto abs_path = std::filesystem::absolute(path, ec);
        if (ec) {
            return _wfopen(path.wstring().c_str(), wmode.c_str());
        }

        // prepend the magic prefix to bypass MAX_PATH
        std::wstring long_path = L"\\\\?\\" + abs_path.wstring();
        return _wfopen(long_path.c_str(), wmode.c_str());
#else
        return std::fopen(path.string().c_str(), mode);
#endif
    }

    void ensure_directory(const std::filesystem::path& dir) {
        std::error_code ec;
        std::filesystem::create_directories(dir, ec);
        if (ec) {
            throw SplitError(ErrorKind::Io,
                "Cannot create output directory '" + dir.string() + "': " + ec.message());
        }
        if (!std::filesystem::is_directory(dir, ec)) {
            throw SplitError(ErrorKind::Io,
                "Output path '" + dir.string() + "' is not a directory");
        }
        Logger::log(LogLevel::Debug, "Output directory ready: " + dir.string(), "file_utils");
    }

} // namespace pdfsplit
