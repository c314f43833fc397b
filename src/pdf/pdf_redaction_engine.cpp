#include "pdf/pdf_redaction_engine.hpp"
#include "core/utils.hpp"
#include "pdf/content_stream.hpp"
#include "pdf/pdf_document.hpp"
#include "pdf/text_state.hpp"
#include "redact/box_resolver.hpp"

#include <qpdf/QPDFPageDocumentHelper.hh>

#include <format>
#include <future>
#include <map>
#include <memory>

namespace docredact {

namespace {

std::string number_text(double value) {
    return std::format("{:.3f}", value);
}

// Operations with the same effect on the text state as @p op, minus the glyphs
std::vector<pdf::ContentOperation> advance_only(const pdf::ContentOperation& op,
                                                const pdf::ShownText& shown) {
    std::vector<pdf::ContentOperation> out;
    if (op.op == "\"" && op.operand_count() >= 2) {
        out.push_back(pdf::make_operation("Tw", {op.operands[0].getRawValue()}));
        out.push_back(pdf::make_operation("Tc", {op.operands[1].getRawValue()}));
        out.push_back(pdf::make_operation("T*", {}));
    } else if (op.op == "'") {
        out.push_back(pdf::make_operation("T*", {}));
    }
    if (shown.tj_adjustment != 0.0) {
        out.push_back(pdf::make_operation("TJ", {"[", number_text(shown.tj_adjustment), "]"}));
    }
    return out;
}

// Entity text split at line breaks; pieces shorter than three characters are ignored
std::vector<std::string> sensitive_needles(const std::vector<DetectedEntity>& entities) {
    std::vector<std::string> needles;
    for (const auto& entity : entities) {
        size_t start = 0;
        while (start <= entity.text.size()) {
            const size_t nl = entity.text.find('\n', start);
            auto piece = utils::trim(entity.text.substr(start, nl == std::string::npos ? std::string::npos
                                                                                       : nl - start));
            if (utils::utf8_length(piece) >= 3) needles.push_back(std::move(piece));
            if (nl == std::string::npos) break;
            start = nl + 1;
        }
    }
    return needles;
}

bool contains_any(std::string_view haystack, const std::vector<std::string>& needles) {
    for (const auto& needle : needles) {
        if (utils::contains_icase(haystack, needle)) return true;
    }
    return false;
}

// Raw and decoded text of a form XObject (and the forms it invokes) contain a needle
bool form_contains(QPDFObjectHandle form, QPDFObjectHandle inherited_resources,
                   const std::vector<std::string>& needles, double width_factor, int depth) {
    if (depth > 8 || !form.isStream()) return false;
    auto dict = form.getDict();
    const auto subtype = dict.getKey("/Subtype");
    if (!subtype.isName() || subtype.getName() != "/Form") return false;

    const auto raw = pdf::stream_data(form);
    if (contains_any(raw, needles)) return true;

    auto resources = dict.getKey("/Resources");
    if (!resources.isDictionary()) resources = inherited_resources;

    auto ops = pdf::tokenize(raw);
    if (ops.is_error()) return false;

    const auto fonts = pdf::load_fonts(resources, width_factor);
    const pdf::ContentInterpreter interpreter(fonts, width_factor);
    std::string decoded;
    bool nested_hit = false;
    interpreter.run(ops.value(), Matrix::identity(),
        [&decoded](const pdf::ShownText& shown) { decoded += shown.text; },
        [&](const std::string& name, const Matrix&) {
            if (nested_hit || !resources.isDictionary()) return;
            const auto xobjects = resources.getKey("/XObject");
            if (xobjects.isDictionary()) {
                nested_hit = form_contains(xobjects.getKey(name), resources, needles,
                                           width_factor, depth + 1);
            }
        });
    return nested_hit || contains_any(decoded, needles);
}

std::set<std::string> sensitive_forms(QPDFObjectHandle resources,
                                      const std::vector<std::string>& needles,
                                      double width_factor) {
    std::set<std::string> names;
    if (!resources.isDictionary() || needles.empty()) return names;
    const auto xobjects = resources.getKey("/XObject");
    if (!xobjects.isDictionary()) return names;

    for (const auto& key : xobjects.getKeys()) {
        if (form_contains(xobjects.getKey(key), resources, needles, width_factor, 0)) {
            names.insert(key);
        }
    }
    return names;
}

struct PageJob {
    size_t page_index = 0;
    int page_number = 0;
    std::string content;
    bool content_read = false;
    std::string read_error;
    pdf::FontTable fonts;
    std::vector<Rect> hit_boxes;
    std::vector<Rect> cover_boxes;
    std::set<std::string> drop_xobjects;
};

} // anonymous namespace

// ============================================================================
// Content filtering
// ============================================================================

ContentFilterResult PdfRedactionEngine::filter_content(const std::string& content,
                                                       const pdf::FontTable& fonts,
                                                       const std::vector<Rect>& boxes,
                                                       bool strict,
                                                       double width_factor,
                                                       const std::set<std::string>& drop_xobjects) {
    ContentFilterResult result;

    auto tokenized = pdf::tokenize(content);
    if (tokenized.is_error()) {
        result.error = tokenized.error_message();
        return result;
    }
    const auto& ops = tokenized.value();

    const pdf::ContentInterpreter interpreter(fonts, width_factor);
    const auto shown = interpreter.collect(ops);

    // op index -> shown text, for every text-showing op
    std::map<size_t, const pdf::ShownText*> shows;
    std::vector<bool> hit(ops.size(), false);
    for (const auto& s : shown) {
        shows.emplace(s.op_index, &s);
        for (const auto& box : boxes) {
            if (s.bounds.intersects(box)) {
                hit[s.op_index] = true;
                break;
            }
        }
    }

    std::vector<bool> drop = hit;
    if (strict) {
        // Widen each hit to every text-showing op of its BT..ET block
        size_t block_start = 0;
        bool in_block = false;
        bool block_hit = false;
        for (size_t i = 0; i < ops.size(); ++i) {
            if (ops[i].op == "BT") {
                in_block = true;
                block_start = i;
                block_hit = false;
            } else if (ops[i].op == "ET" && in_block) {
                if (block_hit) {
                    for (size_t k = block_start; k < i; ++k) {
                        if (ops[k].is_text_show()) drop[k] = true;
                    }
                }
                in_block = false;
            } else if (in_block && hit[i]) {
                block_hit = true;
            }
        }
    }

    std::vector<pdf::ContentOperation> filtered;
    filtered.reserve(ops.size());
    for (size_t i = 0; i < ops.size(); ++i) {
        if (drop[i]) {
            const auto it = shows.find(i);
            if (it != shows.end()) {
                for (auto& op : advance_only(ops[i], *it->second)) {
                    filtered.push_back(std::move(op));
                }
            }
            ++result.removed;
            continue;
        }
        if (ops[i].op == "Do" && drop_xobjects.contains(ops[i].name(0))) {
            ++result.removed;
            continue;
        }
        filtered.push_back(ops[i]);
    }

    if (pdf::count_operator(filtered, "BT") != pdf::count_operator(filtered, "ET")) {
        result.balanced = false;
        return result;
    }

    result.content = pdf::serialize(filtered);
    return result;
}

std::string PdfRedactionEngine::overlay(const std::vector<Rect>& boxes) {
    std::string out;
    for (const auto& box : boxes) {
        out += std::format("q 0 0 0 rg {:.2f} {:.2f} {:.2f} {:.2f} re f Q\n",
                           box.x1, box.y1, box.width(), box.height());
    }
    return out;
}

// ============================================================================
// Document-level cleanup
// ============================================================================

void PdfRedactionEngine::strip_hidden_structures(pdf::PdfDocument& pdf, bool strip_annotations) {
    auto root = pdf.catalog();
    for (const char* key : {"/OCProperties", "/Outlines", "/AcroForm", "/PieceInfo",
                            "/Threads", "/OpenAction"}) {
        root.removeKey(key);
    }

    auto names = root.getKey("/Names");
    if (names.isDictionary()) {
        names.removeKey("/EmbeddedFiles");
        names.removeKey("/JavaScript");
        if (names.getKeys().empty()) root.removeKey("/Names");
    }

    for (auto& page : pdf.pages()) {
        auto object = page.getObjectHandle();
        if (strip_annotations) object.removeKey("/Annots");
        object.removeKey("/PieceInfo");
        object.removeKey("/Thumb");
    }
}

void PdfRedactionEngine::ensure_accessibility(pdf::PdfDocument& pdf) {
    auto root = pdf.catalog();

    if (!root.getKey("/StructTreeRoot").isDictionary()) {
        auto tree = QPDFObjectHandle::parse(
            "<< /Type /StructTreeRoot /K [] /ParentTree << /Nums [] >> /RoleMap << >> >>");
        root.replaceKey("/StructTreeRoot", pdf.qpdf().makeIndirectObject(tree));
    }
    if (!root.getKey("/MarkInfo").isDictionary()) {
        root.replaceKey("/MarkInfo", QPDFObjectHandle::parse("<< /Marked true >>"));
    }
    if (!root.getKey("/Lang").isString()) {
        root.replaceKey("/Lang", QPDFObjectHandle::newString("en-US"));
    }

    auto prefs = root.getKey("/ViewerPreferences");
    if (prefs.isDictionary()) {
        prefs.replaceKey("/DisplayDocTitle", QPDFObjectHandle::newBool(true));
    } else {
        root.replaceKey("/ViewerPreferences", QPDFObjectHandle::parse("<< /DisplayDocTitle true >>"));
    }
}

// ============================================================================
// Redaction
// ============================================================================

PdfRedactionOutcome PdfRedactionEngine::redact(std::string_view pdf_bytes,
                                               const std::vector<DetectedEntity>& entities,
                                               const std::vector<ResolvedEntity>& targets,
                                               const RedactionParams& params) const {
    std::unique_ptr<pdf::PdfDocument> pdf;
    try {
        pdf = std::make_unique<pdf::PdfDocument>(std::string(pdf_bytes));
    } catch (const std::exception& e) {
        throw RedactionError(ErrorCategory::PARSE_ERROR, std::format("Cannot open PDF: {}", e.what()));
    }

    PdfRedactionOutcome outcome;
    const auto& padding = params.padding;

    // Boxes grouped by page; entities without geometry have none
    std::map<int, std::vector<Rect>> boxes_by_page;
    for (const auto& target : targets) {
        if (!target.position_found) continue;
        for (const auto& box : target.boxes) {
            boxes_by_page[box.page].push_back(box.rect);
        }
    }

    const auto needles = params.strict ? sensitive_needles(entities) : std::vector<std::string>{};
    auto pages = pdf->pages();

    // ---- Gather private page copies on this thread (qpdf is not thread-safe)
    std::vector<PageJob> jobs;
    for (const auto& [page_number, rects] : boxes_by_page) {
        if (page_number < 1 || page_number > static_cast<int>(pages.size())) continue;

        PageJob job;
        job.page_index = static_cast<size_t>(page_number - 1);
        job.page_number = page_number;
        for (const auto& rect : rects) {
            const auto padded = RedactionBoxResolver::pad(rect, padding);
            job.hit_boxes.push_back(params.strict ? padded : rect);
            job.cover_boxes.push_back(padded);
        }

        auto& page = pages[job.page_index];
        try {
            job.content = pdf::page_content(page);
            job.content_read = true;
            const auto resources = pdf::page_resources(page);
            job.fonts = pdf::load_fonts(resources, options_.width_factor);
            if (params.strict) {
                job.drop_xobjects = sensitive_forms(resources, needles, options_.width_factor);
            }
        } catch (const std::exception& e) {
            job.read_error = e.what();
        }
        jobs.push_back(std::move(job));
    }

    // ---- Filter streams, in parallel for larger documents
    std::vector<ContentFilterResult> results(jobs.size());
    auto filter_job = [&](size_t i) {
        const auto& job = jobs[i];
        if (!job.content_read) return;
        try {
            results[i] = filter_content(job.content, job.fonts, job.hit_boxes, params.strict,
                                        options_.width_factor, job.drop_xobjects);
        } catch (const std::exception& e) {
            results[i].error = e.what();
        }
    };

    if (jobs.size() >= options_.parallel_threshold && options_.parallel_threshold > 0) {
        std::vector<std::future<void>> futures;
        futures.reserve(jobs.size());
        for (size_t i = 0; i < jobs.size(); ++i) {
            futures.push_back(std::async(std::launch::async, filter_job, i));
        }
        for (auto& f : futures) f.get();
    } else {
        for (size_t i = 0; i < jobs.size(); ++i) filter_job(i);
    }

    // ---- Write back on this thread
    auto& qpdf = pdf->qpdf();
    for (size_t i = 0; i < jobs.size(); ++i) {
        const auto& job = jobs[i];
        const auto& result = results[i];
        auto& page = pages[job.page_index];
        const auto location = std::format("page {}", job.page_number);
        const auto cover = overlay(job.cover_boxes);

        if (!job.content_read) {
            outcome.failures.push_back({location, ErrorCategory::PARSE_ERROR,
                std::format("Content stream could not be decoded: {}", job.read_error)});
            utils::log::warn(std::format("{}: undecodable content, overlay only", location));
            page.addPageContents(QPDFObjectHandle::newStream(&qpdf, cover), false);
            continue;
        }

        std::string body = job.content;
        if (result.usable()) {
            body = result.content;
            outcome.removed_operations += result.removed;
            if (!job.drop_xobjects.empty()) {
                auto xobjects = pdf::page_resources(page).getKey("/XObject");
                for (const auto& name : job.drop_xobjects) {
                    if (xobjects.isDictionary()) xobjects.removeKey(name);
                }
                outcome.pruned_forms += job.drop_xobjects.size();
            }
        } else if (result.error) {
            outcome.failures.push_back({location, ErrorCategory::PARSE_ERROR, *result.error});
            utils::log::warn(std::format("{}: unparsable content, overlay only", location));
        } else {
            const StreamIntegrityError integrity(job.page_number,
                "BT/ET imbalance after filtering; original content kept");
            outcome.failures.push_back({location, integrity.category(), integrity.what()});
            utils::log::warn(std::format("{}: {}", location, integrity.what()));
        }

        page.getObjectHandle().replaceKey("/Contents",
            QPDFObjectHandle::newStream(&qpdf, "q\n" + body + "\nQ\n" + cover));
        ++outcome.pages_rewritten;
    }

    strip_hidden_structures(*pdf, options_.strip_annotations);
    if (options_.ensure_accessibility) {
        ensure_accessibility(*pdf);
    }

    if (params.strict) {
        try {
            QPDFPageDocumentHelper(qpdf).removeUnreferencedResources();
        } catch (const std::exception& e) {
            utils::log::warn(std::format("Unreferenced resource cleanup failed: {}", e.what()));
        }
    }

    try {
        outcome.bytes = pdf->write(params.strict);
    } catch (const std::exception& e) {
        throw RedactionError(ErrorCategory::IO_ERROR, std::format("Cannot write PDF: {}", e.what()));
    }

    utils::log::info(std::format("PDF attempt {}: {} pages rewritten, {} operations removed, "
                                 "{} forms pruned, {} failures",
        params.attempt, outcome.pages_rewritten, outcome.removed_operations,
        outcome.pruned_forms, outcome.failures.size()));
    return outcome;
}

} // namespace docredact
