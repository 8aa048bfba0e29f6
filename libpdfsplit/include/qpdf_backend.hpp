/**
 * @file qpdf_backend.hpp
 * @brief IDocumentBackend implementation for PDF files using qpdf.
 */

#ifndef PDFSPLIT_QPDF_BACKEND_HPP
#define PDFSPLIT_QPDF_BACKEND_HPP

#include "document.hpp"

namespace pdfsplit {

/**
 * @brief Reads and writes PDF documents with qpdf.
 *
 * @details Pages are copied with QPDFPageDocumentHelper::addPage, which
 * pulls the page and everything it references (fonts, images, forms)
 * into the output as foreign objects without rewriting their content.
 * Output is written with a deterministic /ID so that splitting the same
 * file twice yields byte-identical chapters.
 *
 * qpdf warnings are forwarded to Logger under the "qpdf" tag.
 */
class QpdfBackend final : public IDocumentBackend {
public:
    [[nodiscard]] std::string_view get_name() const noexcept override {
        return "qpdf";
    }

    [[nodiscard]] std::unique_ptr<ISourceDocument> open(const std::filesystem::path& path) override;
};

} // namespace pdfsplit

#endif // PDFSPLIT_QPDF_BACKEND_HPP
