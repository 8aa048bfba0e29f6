#ifndef PDFSPLIT_EXIT_STATUS_HPP
#define PDFSPLIT_EXIT_STATUS_HPP

#include <exception>
#include <ostream>
#include "../utils/color.hpp"
#include "../../../libpdfsplit/include/split_error.hpp"

namespace pdfsplit {

inline constexpr int EXIT_INTERRUPTED = 130; // standard exit code for SIGINT

constexpr int exit_code_for(const ErrorKind kind) noexcept {
    switch (kind) {
        case ErrorKind::NotFound:
        case ErrorKind::InvalidInput:
        case ErrorKind::CorruptDocument:
        case ErrorKind::Io:
            return 1;
        case ErrorKind::Interrupted:
            return EXIT_INTERRUPTED;
    }
    return 1;
}

// prints the failure the way the CLI reports it and returns the exit code;
// anything that is not a SplitError exits 1
inline int report_failure(const std::exception& e, std::ostream& err) {
    const auto* split_error = dynamic_cast<const SplitError*>(&e);
    if (split_error && split_error->kind() == ErrorKind::Interrupted) {
        err << "\nInterrupted" << std::endl;
        return EXIT_INTERRUPTED;
    }
    err << RED << "Error: " << e.what() << RESET << std::endl;
    return split_error ? exit_code_for(split_error->kind()) : 1;
}

} // namespace pdfsplit

#endif // PDFSPLIT_EXIT_STATUS_HPP
