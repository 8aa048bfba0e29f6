/**
 * @file document.hpp
 * @brief Abstract page store used by the Splitter.
 *
 * The Splitter only needs to count pages, copy pages into a fresh
 * document and write that document out. Keeping it behind these
 * interfaces lets the qpdf implementation be swapped for an in-memory
 * one in tests.
 */

#ifndef PDFSPLIT_DOCUMENT_HPP
#define PDFSPLIT_DOCUMENT_HPP

#include <filesystem>
#include <memory>
#include <string_view>

namespace pdfsplit {

/**
 * @brief A new, initially empty document being assembled from source pages.
 */
class IOutputDocument {
public:
    virtual ~IOutputDocument() = default;

    /**
     * @brief Appends a page of the source document, unmodified.
     * @param page 1-based page number in [1, source page_count()].
     */
    virtual void append_page(int page) = 0;

    /// @return Number of pages appended so far.
    [[nodiscard]] virtual int page_count() const = 0;

    /**
     * @brief Writes the document to @p path, replacing any existing file.
     *
     * The file handle is closed before this returns, on success and on
     * failure.
     * @throws SplitError (ErrorKind::Io) if the file can't be written.
     */
    virtual void write(const std::filesystem::path& path) = 0;
};

/**
 * @brief A parsed, read-only source document.
 */
class ISourceDocument {
public:
    virtual ~ISourceDocument() = default;

    /// @return Total number of pages, N.
    [[nodiscard]] virtual int page_count() const = 0;

    /**
     * @brief Creates an empty output document that can receive pages
     * of this source. The source must outlive the output.
     */
    [[nodiscard]] virtual std::unique_ptr<IOutputDocument> create_output() = 0;
};

/**
 * @brief Opens source documents.
 */
class IDocumentBackend {
public:
    virtual ~IDocumentBackend() = default;

    /// @return Human-readable name of the backend (e.g. "qpdf").
    [[nodiscard]] virtual std::string_view get_name() const noexcept = 0;

    /**
     * @brief Parses the document at @p path.
     * @throws SplitError (ErrorKind::CorruptDocument) if it can't be parsed.
     */
    [[nodiscard]] virtual std::unique_ptr<ISourceDocument> open(const std::filesystem::path& path) = 0;
};

} // namespace pdfsplit

#endif // PDFSPLIT_DOCUMENT_HPP
