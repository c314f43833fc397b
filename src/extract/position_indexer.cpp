#include "extract/position_indexer.hpp"
#include "core/utils.hpp"
#include "docx/ooxml_package.hpp"
#include "docx/run_map.hpp"
#include "pdf/content_stream.hpp"
#include "pdf/font_metrics.hpp"
#include "pdf/pdf_document.hpp"
#include "pdf/text_state.hpp"

#include <tinyxml2.h>

#include <cmath>
#include <format>
#include <memory>
#include <set>

namespace docredact {

namespace {

// ============================================================================
// PDF
// ============================================================================

/**
 * @brief Appends fragments for one page, inserting separators between them
 */
class PdfTextSink {
public:
    explicit PdfTextSink(IndexedDocument& doc) : doc_(doc) {}

    void begin_page(int page) {
        page_ = page;
        has_previous_ = false;
    }

    void add(const pdf::ShownText& shown) {
        if (shown.text.empty()) return;

        if (!doc_.text.empty()) {
            if (!has_previous_) {
                doc_.text += '\n';   // page boundary
            } else {
                const double size = std::max(shown.font_size, previous_size_);
                if (std::abs(shown.start_y - previous_end_y_) > 0.5 * size) {
                    doc_.text += '\n';
                } else if (shown.start_x - previous_end_x_ > 0.25 * size) {
                    doc_.text += ' ';
                }
            }
        }

        TextFragment fragment;
        fragment.text = shown.text;
        fragment.char_offset = doc_.text.size();
        fragment.page = page_;
        fragment.x = shown.bounds.x1;
        fragment.y = shown.bounds.y1;
        fragment.width = shown.bounds.width();
        fragment.height = shown.bounds.height();
        fragment.has_geometry = true;

        doc_.text += shown.text;
        doc_.positions.fragments.push_back(std::move(fragment));

        has_previous_ = true;
        previous_end_x_ = shown.end_x;
        previous_end_y_ = shown.end_y;
        previous_size_ = shown.font_size;
    }

private:
    IndexedDocument& doc_;
    int page_ = 0;
    bool has_previous_ = false;
    double previous_end_x_ = 0.0;
    double previous_end_y_ = 0.0;
    double previous_size_ = 0.0;
};

struct PdfWalker {
    double width_factor;
    int max_depth;
    PdfTextSink& sink;
    std::set<QPDFObjGen> active;    // forms on the current descent path

    void walk(const std::string& content, QPDFObjectHandle resources,
              const Matrix& base, int depth, const std::string& where) {
        auto ops = pdf::tokenize(content);
        if (ops.is_error()) {
            utils::log::warn(std::format("Skipping unparsable content in {}: {}", where, ops.error_message()));
            return;
        }

        const auto fonts = pdf::load_fonts(resources, width_factor);
        const pdf::ContentInterpreter interpreter(fonts, width_factor);

        interpreter.run(ops.value(), base,
            [this](const pdf::ShownText& shown) { sink.add(shown); },
            [&](const std::string& name, const Matrix& ctm) {
                descend(resources, name, ctm, depth, where);
            });
    }

    void descend(QPDFObjectHandle resources, const std::string& name, const Matrix& ctm,
                 int depth, const std::string& where) {
        if (depth >= max_depth || !resources.isDictionary()) return;
        const auto xobjects = resources.getKey("/XObject");
        if (!xobjects.isDictionary()) return;

        auto form = xobjects.getKey(name);
        if (!form.isStream()) return;
        auto dict = form.getDict();
        const auto subtype = dict.getKey("/Subtype");
        if (!subtype.isName() || subtype.getName() != "/Form") return;

        const auto og = form.getObjGen();
        if (active.contains(og)) return;
        active.insert(og);

        double m[6];
        pdf::read_matrix(dict.getKey("/Matrix"), m);
        const Matrix form_matrix{m[0], m[1], m[2], m[3], m[4], m[5]};

        auto form_resources = dict.getKey("/Resources");
        if (!form_resources.isDictionary()) form_resources = resources;

        try {
            walk(pdf::stream_data(form), form_resources, form_matrix * ctm, depth + 1,
                 std::format("{} form {}", where, name));
        } catch (const std::exception& e) {
            utils::log::warn(std::format("Skipping undecodable form {} in {}: {}", name, where, e.what()));
        }
        active.erase(og);
    }
};

// ============================================================================
// DOCX
// ============================================================================

void index_docx_part(IndexedDocument& doc, const std::string& part, const std::string& xml) {
    tinyxml2::XMLDocument dom(true, tinyxml2::PRESERVE_WHITESPACE);
    if (dom.Parse(xml.c_str(), xml.size()) != tinyxml2::XML_SUCCESS) {
        utils::log::warn(std::format("Skipping unparsable part {}: {}", part, dom.ErrorStr()));
        return;
    }

    const auto paragraphs = docx::elements_named(dom.RootElement(), docx::kParagraph);
    for (size_t p = 0; p < paragraphs.size(); ++p) {
        bool paragraph_started = false;
        for (auto* run : docx::elements_named(paragraphs[p], docx::kRun)) {
            if (docx::nearest_ancestor(run, docx::kParagraph) != paragraphs[p]) continue;
            auto text = docx::run_text(run);
            if (text.empty()) continue;

            if (!paragraph_started && !doc.text.empty()) {
                doc.text += '\n';
            }
            paragraph_started = true;

            TextFragment fragment;
            fragment.char_offset = doc.text.size();
            fragment.part = part;
            fragment.paragraph = static_cast<int>(p);
            doc.text += text;
            fragment.text = std::move(text);
            doc.positions.fragments.push_back(std::move(fragment));
        }
    }
}

} // anonymous namespace

// ============================================================================
// PositionIndexer
// ============================================================================

IndexedDocument PositionIndexer::index(std::string_view bytes, DocumentFormat format) const {
    switch (format) {
        case DocumentFormat::PDF:  return index_pdf(bytes);
        case DocumentFormat::DOCX: return index_docx(bytes);
        case DocumentFormat::UNKNOWN: break;
    }
    throw UnsupportedFormatError("Cannot index a document of unknown format");
}

IndexedDocument PositionIndexer::index_pdf(std::string_view bytes) const {
    IndexedDocument doc;
    doc.format = DocumentFormat::PDF;

    std::unique_ptr<pdf::PdfDocument> pdf;
    try {
        pdf = std::make_unique<pdf::PdfDocument>(std::string(bytes));
    } catch (const std::exception& e) {
        throw RedactionError(ErrorCategory::PARSE_ERROR, std::format("Cannot open PDF: {}", e.what()));
    }

    PdfTextSink sink(doc);
    PdfWalker walker{options_.width_factor, options_.max_form_depth, sink, {}};

    auto pages = pdf->pages();
    doc.page_count = static_cast<int>(pages.size());

    for (size_t i = 0; i < pages.size(); ++i) {
        const int page_number = static_cast<int>(i) + 1;
        const auto where = std::format("page {}", page_number);
        sink.begin_page(page_number);
        try {
            walker.walk(pdf::page_content(pages[i]), pdf::page_resources(pages[i]),
                        Matrix::identity(), 0, where);
        } catch (const std::exception& e) {
            utils::log::warn(std::format("Skipping unreadable {}: {}", where, e.what()));
        }
    }

    utils::log::debug(std::format("Indexed PDF: {} pages, {} fragments, {} chars",
        doc.page_count, doc.positions.size(), doc.text.size()));
    return doc;
}

IndexedDocument PositionIndexer::index_docx(std::string_view bytes) const {
    IndexedDocument doc;
    doc.format = DocumentFormat::DOCX;

    auto package = docx::OoxmlPackage::open(bytes);
    if (package.is_error()) {
        throw RedactionError(ErrorCategory::PARSE_ERROR,
            std::format("Cannot open DOCX: {}", package.error_message()));
    }

    for (const auto& part : docx::wordprocessing_parts(package.value())) {
        index_docx_part(doc, part, *package.value().find(part));
    }

    utils::log::debug(std::format("Indexed DOCX: {} fragments, {} chars",
        doc.positions.size(), doc.text.size()));
    return doc;
}

} // namespace docredact
