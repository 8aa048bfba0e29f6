/**
 * @file split_error.hpp
 * @brief The single exception type thrown by libpdfsplit.
 */

#ifndef PDFSPLIT_SPLIT_ERROR_HPP
#define PDFSPLIT_SPLIT_ERROR_HPP

#include <stdexcept>
#include <string>

namespace pdfsplit {

/**
 * @brief Closed set of failure kinds.
 *
 * Callers switch over the kind instead of catching several exception
 * types; the CLI maps every kind to an exit code.
 */
enum class ErrorKind {
    NotFound,        ///< Source path does not exist
    InvalidInput,    ///< Empty break list or malformed page list
    CorruptDocument, ///< Source could not be parsed as a PDF
    Io,              ///< Output directory or file could not be written
    Interrupted      ///< A stop was requested while splitting
};

/**
 * @brief Returns a short, stable name for an ErrorKind.
 */
constexpr const char* error_kind_name(const ErrorKind kind) noexcept {
    switch (kind) {
        case ErrorKind::NotFound:        return "NotFound";
        case ErrorKind::InvalidInput:    return "InvalidInput";
        case ErrorKind::CorruptDocument: return "CorruptDocument";
        case ErrorKind::Io:              return "Io";
        case ErrorKind::Interrupted:     return "Interrupted";
    }
    return "";
}

class SplitError final : public std::runtime_error {
public:
    SplitError(const ErrorKind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {}

    [[nodiscard]] ErrorKind kind() const noexcept { return kind_; }

private:
    ErrorKind kind_;
};

} // namespace pdfsplit

#endif // PDFSPLIT_SPLIT_ERROR_HPP
