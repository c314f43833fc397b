#pragma once

#include <qpdf/QPDF.hh>
#include <qpdf/QPDFObjectHandle.hh>
#include <qpdf/QPDFPageObjectHelper.hh>

#include <string>
#include <string_view>
#include <vector>

namespace docredact::pdf {

/**
 * @brief An in-memory PDF opened with qpdf
 *
 * Owns the input bytes for the lifetime of the QPDF object, which reads
 * from them lazily. Construction throws (qpdf's QPDFExc) on unreadable input.
 */
class PdfDocument {
public:
    explicit PdfDocument(std::string bytes);

    PdfDocument(const PdfDocument&) = delete;
    PdfDocument& operator=(const PdfDocument&) = delete;

    [[nodiscard]] QPDF& qpdf() { return qpdf_; }

    [[nodiscard]] std::vector<QPDFPageObjectHelper> pages();

    [[nodiscard]] QPDFObjectHandle catalog() { return qpdf_.getRoot(); }

    /**
     * @brief Serialize the document
     * @param regenerate_object_streams Rewrite object streams from scratch so
     *        nothing unreferenced survives
     */
    [[nodiscard]] std::string write(bool regenerate_object_streams = false);

private:
    std::string bytes_;
    QPDF qpdf_;
};

/// Decoded content of a page, all content streams concatenated
[[nodiscard]] std::string page_content(QPDFPageObjectHelper& page);

/// Decoded data of a stream object; empty for non-streams
[[nodiscard]] std::string stream_data(QPDFObjectHandle stream);

/// Page /Resources, following /Parent inheritance
[[nodiscard]] QPDFObjectHandle page_resources(QPDFPageObjectHelper& page);

/// Read a six-number array such as a form's /Matrix; identity when absent
[[nodiscard]] bool read_matrix(QPDFObjectHandle array, double out[6]);

} // namespace docredact::pdf
