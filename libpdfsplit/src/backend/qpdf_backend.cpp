#include "../../include/qpdf_backend.hpp"
#include "../../include/file_utils.hpp"
#include "../../include/logger.hpp"
#include "../../include/split_error.hpp"
#include <qpdf/QPDF.hh>
#include <qpdf/QPDFLogger.hh>
#include <qpdf/QPDFPageDocumentHelper.hh>
#include <qpdf/QPDFPageObjectHelper.hh>
#include <qpdf/QPDFWriter.hh>
#include <cerrno>
#include <cstring>
#include <memory>
#include <ostream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

// helper: custom streambuf to redirect qpdf messages into our logger,
// one log entry per complete line
struct LoggerStreamBuf final : std::stringbuf {
    LogLevel level;
    std::string module;
    LoggerStreamBuf(const LogLevel lvl, const char* mod) : level(lvl), module(mod) {}
    int sync() override {
        const std::string s = str();
        std::size_t begin = 0;
        for (auto nl = s.find('\n'); nl != std::string::npos; nl = s.find('\n', begin)) {
            emit(s.substr(begin, nl - begin));
            begin = nl + 1;
        }
        str(s.substr(begin));
        return 0;
    }
    ~LoggerStreamBuf() override {
        emit(str());
    }

private:
    void emit(std::string line) const {
        while (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        if (!line.empty()) {
            Logger::log(level, line, module);
        }
    }
};

// qpdf keeps raw ostream pointers, so the streams live as long as the
// QPDF objects that log through them
class QpdfLogRoute {
public:
    QpdfLogRoute()
        : info_buf_(LogLevel::Debug, "qpdf"),
          warn_buf_(LogLevel::Warning, "qpdf"),
          info_os_(&info_buf_),
          warn_os_(&warn_buf_),
          logger_(QPDFLogger::create()) {
        info_os_.setf(std::ios::unitbuf);
        warn_os_.setf(std::ios::unitbuf);
        logger_->setOutputStreams(&info_os_, &warn_os_);
    }

    QpdfLogRoute(const QpdfLogRoute&) = delete;
    QpdfLogRoute& operator=(const QpdfLogRoute&) = delete;

    void attach(QPDF& pdf) const { pdf.setLogger(logger_); }

private:
    LoggerStreamBuf info_buf_;
    LoggerStreamBuf warn_buf_;
    std::ostream info_os_;
    std::ostream warn_os_;
    std::shared_ptr<QPDFLogger> logger_;
};

class QpdfOutputDocument final : public pdfsplit::IOutputDocument {
public:
    QpdfOutputDocument(const std::vector<QPDFPageObjectHelper>& source_pages,
                       const QpdfLogRoute& log_route)
        : source_pages_(source_pages) {
        log_route.attach(pdf_);
        pdf_.emptyPDF();
    }

    void append_page(const int page) override {
        if (page < 1 || static_cast<std::size_t>(page) > source_pages_.size()) {
            throw std::out_of_range("page " + std::to_string(page) + " is outside the source document");
        }
        // a page from another QPDF is copied as a foreign object, content untouched;
        // the copy resolves objects of the source lazily, so damage can surface here
        try {
            QPDFPageDocumentHelper(pdf_).addPage(source_pages_[static_cast<std::size_t>(page) - 1], false);
        } catch (const std::exception& e) {
            throw pdfsplit::SplitError(pdfsplit::ErrorKind::CorruptDocument,
                "Cannot copy page " + std::to_string(page) + ": " + e.what());
        }
        ++page_count_;
    }

    [[nodiscard]] int page_count() const override { return page_count_; }

    void write(const std::filesystem::path& path) override {
        const pdfsplit::FilePtr file(pdfsplit::open_file(path, "wb"));
        if (!file) {
            throw pdfsplit::SplitError(pdfsplit::ErrorKind::Io,
                "Cannot open '" + path.string() + "' for writing: " + std::strerror(errno));
        }

        errno = 0;
        try {
            QPDFWriter writer(pdf_, path.string().c_str(), file.get(), false);
            writer.setDeterministicID(true);
            writer.write();
        } catch (const std::exception& e) {
            throw pdfsplit::SplitError(pdfsplit::ErrorKind::Io,
                "Failed to write '" + path.string() + "': " + e.what());
        }

        if (std::fflush(file.get()) != 0 || std::ferror(file.get())) {
            std::string reason = "Failed to write '" + path.string() + "'";
            if (errno != 0) {
                reason += std::string(": ") + std::strerror(errno);
            }
            throw pdfsplit::SplitError(pdfsplit::ErrorKind::Io, reason);
        }
    }

private:
    const std::vector<QPDFPageObjectHelper>& source_pages_;
    QPDF pdf_;
    int page_count_ = 0;
};

class QpdfSourceDocument final : public pdfsplit::ISourceDocument {
public:
    explicit QpdfSourceDocument(const std::filesystem::path& path) {
        log_route_.attach(pdf_);
        try {
            pdf_.processFile(path.string().c_str());
            pages_ = QPDFPageDocumentHelper(pdf_).getAllPages();
        } catch (const std::exception& e) {
            throw pdfsplit::SplitError(pdfsplit::ErrorKind::CorruptDocument,
                "Cannot read PDF '" + path.string() + "': " + e.what());
        }
        Logger::log(LogLevel::Debug,
                    "Opened " + path.string() + " (" + std::to_string(pages_.size()) + " pages)",
                    "qpdf_backend");
    }

    [[nodiscard]] int page_count() const override {
        return static_cast<int>(pages_.size());
    }

    [[nodiscard]] std::unique_ptr<pdfsplit::IOutputDocument> create_output() override {
        return std::make_unique<QpdfOutputDocument>(pages_, log_route_);
    }

private:
    QpdfLogRoute log_route_;
    QPDF pdf_;
    std::vector<QPDFPageObjectHelper> pages_;
};

} // namespace

namespace pdfsplit {

std::unique_ptr<ISourceDocument> QpdfBackend::open(const std::filesystem::path& path) {
    return std::make_unique<QpdfSourceDocument>(path);
}

} // namespace pdfsplit
