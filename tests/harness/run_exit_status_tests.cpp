#include "../../pdfsplit_cli/src/cli/exit_status.hpp"
#include "../../libpdfsplit/include/split_error.hpp"
#include "test_support.hpp"

#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>

using pdfsplit_test::require_;

namespace {

    bool test_kind_to_exit_code_() {
        using pdfsplit::ErrorKind;
        bool ok = true;
        ok &= require_(pdfsplit::exit_code_for(ErrorKind::Interrupted) == 130, "Interrupted must exit 130");
        for (const auto kind : {ErrorKind::NotFound, ErrorKind::InvalidInput,
                                ErrorKind::CorruptDocument, ErrorKind::Io}) {
            ok &= require_(pdfsplit::exit_code_for(kind) == 1,
                           std::string(pdfsplit::error_kind_name(kind)) + " must exit 1");
        }
        return ok;
    }

    bool test_interrupted_report_() {
        std::ostringstream err;
        const int rc = pdfsplit::report_failure(
            pdfsplit::SplitError(pdfsplit::ErrorKind::Interrupted, "stop requested"), err);
        bool ok = true;
        ok &= require_(rc == 130, "interrupted split must exit 130");
        ok &= require_(err.str().find("Interrupted") != std::string::npos, "Interrupted must be printed");
        ok &= require_(err.str().find("Error:") == std::string::npos, "an interrupt is not an error line");
        return ok;
    }

    bool test_split_error_report_() {
        std::ostringstream err;
        const int rc = pdfsplit::report_failure(
            pdfsplit::SplitError(pdfsplit::ErrorKind::Io, "disk full"), err);
        bool ok = true;
        ok &= require_(rc == 1, "Io must exit 1");
        ok &= require_(err.str().find("Error: disk full") != std::string::npos, "message must be printed");
        return ok;
    }

    // a backend may let a library exception through; the CLI still exits 1
    bool test_foreign_exception_report_() {
        bool ok = true;
        {
            std::ostringstream err;
            const int rc = pdfsplit::report_failure(std::runtime_error("damaged object"), err);
            ok &= require_(rc == 1, "runtime_error must exit 1");
            ok &= require_(err.str().find("Error: damaged object") != std::string::npos,
                           "runtime_error message must be printed");
        }
        {
            std::ostringstream err;
            const int rc = pdfsplit::report_failure(std::out_of_range("page 0"), err);
            ok &= require_(rc == 1, "out_of_range must exit 1");
        }
        return ok;
    }

} // namespace

int main() {
    bool ok = true;
    ok &= test_kind_to_exit_code_();
    ok &= test_interrupted_report_();
    ok &= test_split_error_report_();
    ok &= test_foreign_exception_report_();
    if (!ok) return 1;
    std::cout << "pdfsplit exit status tests passed\n";
    return 0;
}
