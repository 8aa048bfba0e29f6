#ifndef PDFSPLIT_TEST_SUPPORT_HPP
#define PDFSPLIT_TEST_SUPPORT_HPP

#include <qpdf/Buffer.hh>
#include <qpdf/QPDF.hh>
#include <qpdf/QPDFObjectHandle.hh>
#include <qpdf/QPDFPageDocumentHelper.hh>
#include <qpdf/QPDFPageObjectHelper.hh>
#include <qpdf/QPDFWriter.hh>

#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <string>
#include <system_error>
#include <vector>

namespace pdfsplit_test {

    inline bool require_(bool cond, const std::string& msg) {
        if (cond) return true;
        std::cerr << "  - " << msg << "\n";
        return false;
    }

    // fresh, empty directory under the system temp dir
    inline std::filesystem::path fresh_dir(const std::string& name) {
        std::error_code ec{};
        const auto root = std::filesystem::temp_directory_path(ec) / ("pdfsplit-test-" + name);
        std::filesystem::remove_all(root, ec);
        std::filesystem::create_directories(root, ec);
        return root;
    }

    inline bool write_text(const std::filesystem::path& path, const std::string& text) {
        std::ofstream ofs(path, std::ios::binary);
        if (!ofs) return false;
        ofs << text;
        return ofs.good();
    }

    inline std::string read_bytes(const std::filesystem::path& path) {
        std::ifstream ifs(path, std::ios::binary);
        return {std::istreambuf_iterator<char>(ifs), std::istreambuf_iterator<char>()};
    }

    inline std::string page_marker(int page) {
        return "q Q % page " + std::to_string(page) + "\n";
    }

    // writes a PDF of `pages` blank pages; page N's content stream is page_marker(N)
    inline void write_test_pdf(const std::filesystem::path& path, int pages) {
        QPDF pdf;
        pdf.emptyPDF();
        QPDFPageDocumentHelper doc(pdf);
        for (int i = 1; i <= pages; ++i) {
            QPDFObjectHandle page = pdf.makeIndirectObject(QPDFObjectHandle::parse(
                "<< /Type /Page /MediaBox [0 0 612 792] /Resources << >> >>"));
            page.replaceKey("/Contents", QPDFObjectHandle::newStream(&pdf, page_marker(i)));
            doc.addPage(QPDFPageObjectHelper(page), false);
        }
        QPDFWriter writer(pdf, path.string().c_str());
        writer.setStaticID(true);
        writer.write();
    }

    // decoded content stream of every page of the PDF at `path`, in order
    inline std::vector<std::string> read_page_contents(const std::filesystem::path& path) {
        QPDF pdf;
        pdf.processFile(path.string().c_str());
        std::vector<std::string> contents;
        for (auto& page : QPDFPageDocumentHelper(pdf).getAllPages()) {
            const auto buf = page.getObjectHandle().getKey("/Contents").getStreamData(qpdf_dl_generalized);
            contents.emplace_back(reinterpret_cast<const char*>(buf->getBuffer()), buf->getSize());
        }
        return contents;
    }

} // namespace pdfsplit_test

#endif // PDFSPLIT_TEST_SUPPORT_HPP
