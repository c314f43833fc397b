#pragma once

#include <qpdf/Buffer.hh>
#include <qpdf/QPDF.hh>
#include <qpdf/QPDFObjectHandle.hh>
#include <qpdf/QPDFPageDocumentHelper.hh>
#include <qpdf/QPDFPageObjectHelper.hh>
#include <qpdf/QPDFWriter.hh>

#include <map>
#include <string>
#include <utility>
#include <vector>

namespace docredact::testing {

/**
 * @brief Builds small PDFs in memory with qpdf
 *
 * Every page gets a Helvetica font as /F1 (no /Widths, so glyph widths
 * fall back to the width factor) and a 612x792 media box. With cid_font()
 * /F1 is instead a Type0 Identity-H font whose ToUnicode map reads the
 * glyph ids written by cid_line().
 */
class PdfBuilder {
public:
    struct Form {
        std::string name;           // resource name without slash
        std::string content;
        std::string matrix;         // e.g. "[1 0 0 1 100 100]"; empty for none
    };

    PdfBuilder& page(std::string content, std::vector<Form> forms = {}) {
        pages_.push_back({std::move(content), std::move(forms), false, {}});
        return *this;
    }

    /// A page whose only content paints an image XObject
    PdfBuilder& image_page() {
        pages_.push_back({"q 200 0 0 200 100 400 cm /Im1 Do Q", {}, true, {}});
        return *this;
    }

    /// Attach a text annotation carrying @p text to the last page
    PdfBuilder& annotate(std::string text) {
        if (!pages_.empty()) pages_.back().annotation = std::move(text);
        return *this;
    }

    PdfBuilder& cid_font() {
        cid_font_ = true;
        return *this;
    }

    PdfBuilder& info(std::string key, std::string value) {
        info_[std::move(key)] = std::move(value);
        return *this;
    }

    PdfBuilder& xmp(std::string xml) {
        xmp_ = std::move(xml);
        return *this;
    }

    PdfBuilder& outline() {
        outline_ = true;
        return *this;
    }

    [[nodiscard]] std::string build() const {
        QPDF pdf;
        pdf.emptyPDF();

        auto font = cid_font_ ? make_cid_font(pdf) : pdf.makeIndirectObject(QPDFObjectHandle::parse(
            "<< /Type /Font /Subtype /Type1 /BaseFont /Helvetica /Encoding /WinAnsiEncoding >>"));

        QPDFPageDocumentHelper helper(pdf);
        for (const auto& def : pages_) {
            auto fonts = QPDFObjectHandle::newDictionary();
            fonts.replaceKey("/F1", font);
            auto resources = QPDFObjectHandle::newDictionary();
            resources.replaceKey("/Font", fonts);

            auto xobjects = QPDFObjectHandle::newDictionary();
            for (const auto& form : def.forms) {
                auto stream = QPDFObjectHandle::newStream(&pdf, form.content);
                auto dict = stream.getDict();
                dict.replaceKey("/Type", QPDFObjectHandle::newName("/XObject"));
                dict.replaceKey("/Subtype", QPDFObjectHandle::newName("/Form"));
                dict.replaceKey("/BBox", QPDFObjectHandle::parse("[0 0 612 792]"));
                if (!form.matrix.empty()) {
                    dict.replaceKey("/Matrix", QPDFObjectHandle::parse(form.matrix));
                }
                auto form_resources = QPDFObjectHandle::newDictionary();
                form_resources.replaceKey("/Font", fonts);
                dict.replaceKey("/Resources", form_resources);
                xobjects.replaceKey("/" + form.name, stream);
            }
            if (def.image) {
                auto image = QPDFObjectHandle::newStream(&pdf, std::string(4, '\x80'));
                auto dict = image.getDict();
                dict.replaceKey("/Type", QPDFObjectHandle::newName("/XObject"));
                dict.replaceKey("/Subtype", QPDFObjectHandle::newName("/Image"));
                dict.replaceKey("/Width", QPDFObjectHandle::newInteger(2));
                dict.replaceKey("/Height", QPDFObjectHandle::newInteger(2));
                dict.replaceKey("/ColorSpace", QPDFObjectHandle::newName("/DeviceGray"));
                dict.replaceKey("/BitsPerComponent", QPDFObjectHandle::newInteger(8));
                xobjects.replaceKey("/Im1", image);
            }
            if (!xobjects.getKeys().empty()) {
                resources.replaceKey("/XObject", xobjects);
            }

            auto page = pdf.makeIndirectObject(QPDFObjectHandle::parse(
                "<< /Type /Page /MediaBox [0 0 612 792] >>"));
            page.replaceKey("/Contents", QPDFObjectHandle::newStream(&pdf, def.content));
            page.replaceKey("/Resources", resources);
            if (!def.annotation.empty()) {
                auto annot = pdf.makeIndirectObject(QPDFObjectHandle::parse(
                    "<< /Type /Annot /Subtype /Text /Rect [10 10 30 30] >>"));
                annot.replaceKey("/Contents", QPDFObjectHandle::newString(def.annotation));
                auto annots = QPDFObjectHandle::newArray();
                annots.appendItem(annot);
                page.replaceKey("/Annots", annots);
            }
            helper.addPage(QPDFPageObjectHelper(page), false);
        }

        if (!info_.empty()) {
            auto info = QPDFObjectHandle::newDictionary();
            for (const auto& [key, value] : info_) {
                info.replaceKey(key, QPDFObjectHandle::newString(value));
            }
            pdf.getTrailer().replaceKey("/Info", pdf.makeIndirectObject(info));
        }

        auto root = pdf.getRoot();
        if (!xmp_.empty()) {
            auto metadata = QPDFObjectHandle::newStream(&pdf, xmp_);
            metadata.getDict().replaceKey("/Type", QPDFObjectHandle::newName("/Metadata"));
            metadata.getDict().replaceKey("/Subtype", QPDFObjectHandle::newName("/XML"));
            root.replaceKey("/Metadata", metadata);
        }
        if (outline_) {
            root.replaceKey("/Outlines", pdf.makeIndirectObject(QPDFObjectHandle::parse(
                "<< /Type /Outlines /Count 0 >>")));
        }

        QPDFWriter writer(pdf);
        writer.setOutputMemory();
        writer.setDeterministicID(true);
        writer.write();
        const auto buffer = writer.getBufferSharedPointer();
        return std::string(reinterpret_cast<const char*>(buffer->getBuffer()), buffer->getSize());
    }

private:
    struct PageDef {
        std::string content;
        std::vector<Form> forms;
        bool image = false;
        std::string annotation;
    };

    // Glyph id = character code - 29, mapped back for printable ASCII
    static QPDFObjectHandle make_cid_font(QPDF& pdf) {
        auto to_unicode = QPDFObjectHandle::newStream(&pdf,
            "/CIDInit /ProcSet findresource begin\n"
            "12 dict begin\n"
            "begincmap\n"
            "1 begincodespacerange\n<0000> <FFFF>\nendcodespacerange\n"
            "1 beginbfrange\n<0003> <0061> <0020>\nendbfrange\n"
            "endcmap\n"
            "CMapName currentdict /CMap defineresource pop\n"
            "end\nend\n");
        auto font = pdf.makeIndirectObject(QPDFObjectHandle::parse(
            "<< /Type /Font /Subtype /Type0 /BaseFont /NotoSans /Encoding /Identity-H"
            " /DescendantFonts [ << /Type /Font /Subtype /CIDFontType2 /BaseFont /NotoSans"
            " /CIDSystemInfo << /Registry (Adobe) /Ordering (Identity) /Supplement 0 >>"
            " /DW 600 >> ] >>"));
        font.replaceKey("/ToUnicode", to_unicode);
        return font;
    }

    std::vector<PageDef> pages_;
    std::map<std::string, std::string> info_;
    std::string xmp_;
    bool cid_font_ = false;
    bool outline_ = false;
};

/// One line of Helvetica text at (x, y)
inline std::string text_line(const std::string& text, double x = 72, double y = 700, double size = 12) {
    return "BT /F1 " + std::to_string(size) + " Tf " + std::to_string(x) + " " +
           std::to_string(y) + " Td (" + text + ") Tj ET";
}

/// One line shown as two-byte glyph ids through the cid_font() /F1
inline std::string cid_line(const std::string& text, double x = 72, double y = 700, double size = 12) {
    static constexpr char kHex[] = "0123456789ABCDEF";
    std::string hex;
    for (const char c : text) {
        const int glyph = static_cast<unsigned char>(c) - 29;
        for (const int shift : {12, 8, 4, 0}) hex += kHex[(glyph >> shift) & 0xF];
    }
    return "BT /F1 " + std::to_string(size) + " Tf " + std::to_string(x) + " " +
           std::to_string(y) + " Td <" + hex + "> Tj ET";
}

} // namespace docredact::testing
