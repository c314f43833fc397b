#include "pdf/pdf_document.hpp"

#include <qpdf/Buffer.hh>
#include <qpdf/Pl_Buffer.hh>
#include <qpdf/QPDFPageDocumentHelper.hh>
#include <qpdf/QPDFWriter.hh>

namespace docredact::pdf {

PdfDocument::PdfDocument(std::string bytes)
    : bytes_(std::move(bytes)) {
    qpdf_.setSuppressWarnings(true);
    qpdf_.processMemoryFile("document.pdf", bytes_.data(), bytes_.size());
}

std::vector<QPDFPageObjectHelper> PdfDocument::pages() {
    return QPDFPageDocumentHelper(qpdf_).getAllPages();
}

std::string PdfDocument::write(bool regenerate_object_streams) {
    QPDFWriter writer(qpdf_);
    writer.setOutputMemory();
    // Same input, same bytes
    if (!qpdf_.isEncrypted()) {
        writer.setDeterministicID(true);
    }
    if (regenerate_object_streams) {
        writer.setObjectStreamMode(qpdf_o_generate);
    }
    writer.write();

    const auto buffer = writer.getBufferSharedPointer();
    return std::string(reinterpret_cast<const char*>(buffer->getBuffer()), buffer->getSize());
}

std::string page_content(QPDFPageObjectHelper& page) {
    Pl_Buffer sink("page contents");
    page.pipeContents(&sink);
    const auto buffer = sink.getBufferSharedPointer();
    if (!buffer) return {};
    return std::string(reinterpret_cast<const char*>(buffer->getBuffer()), buffer->getSize());
}

std::string stream_data(QPDFObjectHandle stream) {
    if (!stream.isStream()) return {};
    const auto data = stream.getStreamData(qpdf_dl_generalized);
    return std::string(reinterpret_cast<const char*>(data->getBuffer()), data->getSize());
}

QPDFObjectHandle page_resources(QPDFPageObjectHelper& page) {
    // getAttribute walks /Parent for inheritable keys
    return page.getAttribute("/Resources", false);
}

bool read_matrix(QPDFObjectHandle array, double out[6]) {
    static constexpr double kIdentity[6] = {1, 0, 0, 1, 0, 0};
    for (int i = 0; i < 6; ++i) out[i] = kIdentity[i];

    if (!array.isArray() || array.getArrayNItems() != 6) return false;
    for (int i = 0; i < 6; ++i) {
        const auto item = array.getArrayItem(i);
        if (!item.isNumber()) {
            for (int k = 0; k < 6; ++k) out[k] = kIdentity[k];
            return false;
        }
        out[i] = item.getNumericValue();
    }
    return true;
}

} // namespace docredact::pdf
