#include "docx/docx_redaction_engine.hpp"
#include "core/utils.hpp"
#include "docx/ooxml_package.hpp"
#include "docx/run_map.hpp"

#include <tinyxml2.h>

#include <algorithm>
#include <cstring>
#include <format>
#include <future>

namespace docredact {

using tinyxml2::XMLDocument;
using tinyxml2::XMLElement;
using tinyxml2::XMLNode;

namespace {

constexpr std::string_view kVbaProject = "word/vbaProject.bin";
constexpr std::string_view kVbaData = "word/vbaData.xml";
constexpr std::string_view kVbaRels = "word/_rels/vbaProject.bin.rels";

constexpr std::string_view kMacroMainType = "application/vnd.ms-word.document.macroEnabled.main+xml";
constexpr std::string_view kMacroTemplateType = "application/vnd.ms-word.template.macroEnabledTemplate.main+xml";
constexpr std::string_view kMainType =
    "application/vnd.openxmlformats-officedocument.wordprocessingml.document.main+xml";
constexpr std::string_view kTemplateType =
    "application/vnd.openxmlformats-officedocument.wordprocessingml.template.main+xml";
constexpr std::string_view kVbaContentType = "application/vnd.ms-office.vbaProject";

// rPr children that follow w:highlight in schema order
constexpr const char* kAfterHighlight[] = {
    "w:u", "w:effect", "w:bdr", "w:shd", "w:fitText", "w:vertAlign", "w:rtl", "w:cs",
    "w:em", "w:lang", "w:eastAsianLayout", "w:specVanish", "w:oMath", "w:rPrChange",
};

bool is_named(const XMLElement* element, const char* name) {
    return element && std::strcmp(element->Name(), name) == 0;
}

void insert_before(XMLNode* reference, XMLNode* node) {
    auto* parent = reference->Parent();
    auto* previous = reference->PreviousSibling();
    if (previous) {
        parent->InsertAfterChild(previous, node);
    } else {
        parent->InsertFirstChild(node);
    }
}

// Cloned run properties of @p run, or a fresh w:rPr
XMLElement* clone_props(XMLDocument& dom, const XMLElement* run) {
    const auto* props = run ? run->FirstChildElement(docx::kRunProps) : nullptr;
    if (props) return props->DeepClone(&dom)->ToElement();
    return dom.NewElement(docx::kRunProps);
}

XMLElement* new_run(XMLDocument& dom, const XMLElement* props_from, const char* leaf_name,
                    std::string_view text) {
    auto* run = dom.NewElement(docx::kRun);
    run->InsertEndChild(clone_props(dom, props_from));
    auto* leaf = dom.NewElement(leaf_name);
    leaf->SetAttribute("xml:space", "preserve");
    leaf->SetText(std::string(text).c_str());
    run->InsertEndChild(leaf);
    return run;
}

void add_black_highlight(XMLDocument& dom, XMLElement* props) {
    if (auto* existing = props->FirstChildElement("w:highlight")) {
        props->DeleteChild(existing);
    }
    auto* highlight = dom.NewElement("w:highlight");
    highlight->SetAttribute("w:val", "black");

    for (auto* child = props->FirstChildElement(); child; child = child->NextSiblingElement()) {
        for (const char* name : kAfterHighlight) {
            if (is_named(child, name)) {
                insert_before(child, highlight);
                return;
            }
        }
    }
    props->InsertEndChild(highlight);
}

XMLElement* make_marker(XMLDocument& dom, const XMLElement* props_from,
                        const DetectedEntity& entity, int id) {
    auto* sdt = dom.NewElement(docx::kSdt);

    auto* sdt_props = dom.NewElement("w:sdtPr");
    auto* id_el = dom.NewElement("w:id");
    id_el->SetAttribute("w:val", id);
    auto* alias = dom.NewElement("w:alias");
    alias->SetAttribute("w:val", std::format("Redacted:Rule-{}@{}", entity.rule_id, entity.rule_version).c_str());
    auto* tag = dom.NewElement("w:tag");
    tag->SetAttribute("w:val", docx::kRedactedTag);
    sdt_props->InsertEndChild(id_el);
    sdt_props->InsertEndChild(alias);
    sdt_props->InsertEndChild(tag);
    sdt->InsertEndChild(sdt_props);

    auto* content = dom.NewElement("w:sdtContent");
    auto* run = new_run(dom, props_from, docx::kText, DocxRedactionEngine::kPlaceholder);
    add_black_highlight(dom, run->FirstChildElement(docx::kRunProps));
    content->InsertEndChild(run);
    sdt->InsertEndChild(content);
    return sdt;
}

/**
 * @brief Split the run owning @p leaf so the leaf is its only content
 * @return The run now holding just w:rPr and the leaf
 */
XMLElement* isolate_leaf(XMLDocument& dom, XMLElement* leaf) {
    auto* run = leaf->Parent()->ToElement();

    std::vector<XMLNode*> before;
    std::vector<XMLNode*> after;
    bool seen = false;
    for (auto* child = run->FirstChild(); child; child = child->NextSibling()) {
        if (child == leaf) {
            seen = true;
            continue;
        }
        if (is_named(child->ToElement(), docx::kRunProps)) continue;
        (seen ? after : before).push_back(child);
    }

    if (!before.empty()) {
        auto* head = dom.NewElement(docx::kRun);
        head->InsertEndChild(clone_props(dom, run));
        for (auto* node : before) head->InsertEndChild(node);
        insert_before(run, head);
    }
    if (!after.empty()) {
        auto* tail = dom.NewElement(docx::kRun);
        tail->InsertEndChild(clone_props(dom, run));
        for (auto* node : after) tail->InsertEndChild(node);
        run->Parent()->InsertAfterChild(run, tail);
    }
    return run;
}

/**
 * @brief Replace map span [start, end) covered by @p segments with a marker
 */
void replace_span(XMLDocument& dom, const std::vector<docx::RunSegment>& segments,
                  size_t start, size_t end, const DetectedEntity& entity, int id) {
    const auto& first = segments.front();
    const auto& last = segments.back();

    const std::string first_text = docx::leaf_text(first.leaf);
    const std::string last_text = docx::leaf_text(last.leaf);
    const std::string prefix = start > first.start ? first_text.substr(0, start - first.start) : "";
    const std::string suffix = end < last.end ? last_text.substr(end - last.start) : "";
    const std::string first_leaf_name = first.leaf->Name();
    const std::string last_leaf_name = last.leaf->Name();

    std::vector<XMLElement*> runs;
    runs.reserve(segments.size());
    for (const auto& segment : segments) {
        runs.push_back(isolate_leaf(dom, segment.leaf));
    }

    XMLElement* marker = nullptr;
    if (first_leaf_name == docx::kText) {
        marker = make_marker(dom, runs.front(), entity, id);
    } else {
        // Deleted text and field instructions keep their leaf type
        marker = new_run(dom, runs.front(), first_leaf_name.c_str(), DocxRedactionEngine::kPlaceholder);
        add_black_highlight(dom, marker->FirstChildElement(docx::kRunProps));
    }
    insert_before(runs.front(), marker);

    if (!prefix.empty()) {
        insert_before(marker, new_run(dom, runs.front(), first_leaf_name.c_str(), prefix));
    }
    if (!suffix.empty()) {
        auto* tail = new_run(dom, runs.back(), last_leaf_name.c_str(), suffix);
        runs.back()->Parent()->InsertAfterChild(runs.back(), tail);
    }

    for (auto* run : runs) {
        run->Parent()->DeleteChild(run);
    }
}

// Placeholder runs left in deleted text or field instructions
bool touches_placeholder(const std::vector<docx::RunSegment>& segments) {
    return std::any_of(segments.begin(), segments.end(), [](const auto& segment) {
        return docx::leaf_text(segment.leaf) == DocxRedactionEngine::kPlaceholder;
    });
}

// Longest first so a shorter entity never splits a longer one
std::vector<const DetectedEntity*> by_length(const std::vector<DetectedEntity>& entities) {
    std::vector<const DetectedEntity*> ordered;
    for (const auto& entity : entities) {
        if (!entity.text.empty()) ordered.push_back(&entity);
    }
    std::stable_sort(ordered.begin(), ordered.end(), [](const auto* a, const auto* b) {
        return a->text.size() > b->text.size();
    });
    return ordered;
}

size_t replace_literal(XMLNode* node, const std::vector<const DetectedEntity*>& entities) {
    size_t count = 0;
    if (auto* text = node->ToText()) {
        std::string value = text->Value();
        size_t n = 0;
        for (const auto* entity : entities) {
            n += utils::replace_all_icase(value, entity->text, DocxRedactionEngine::kPlaceholder);
        }
        if (n > 0) text->SetValue(value.c_str());
        return n;
    }

    if (auto* element = node->ToElement()) {
        std::vector<std::pair<std::string, std::string>> changed;
        for (const auto* attr = element->FirstAttribute(); attr; attr = attr->Next()) {
            std::string value = attr->Value();
            size_t n = 0;
            for (const auto* entity : entities) {
                n += utils::replace_all_icase(value, entity->text, DocxRedactionEngine::kPlaceholder);
            }
            if (n > 0) {
                changed.emplace_back(attr->Name(), std::move(value));
                count += n;
            }
        }
        for (const auto& [name, value] : changed) {
            element->SetAttribute(name.c_str(), value.c_str());
        }
    }

    for (auto* child = node->FirstChild(); child; child = child->NextSibling()) {
        count += replace_literal(child, entities);
    }
    return count;
}

// Apply @p edit to a parsed XML part; unparsable parts are left unchanged
template<typename Edit>
bool edit_xml_part(docx::OoxmlPackage& package, std::string_view name, Edit&& edit) {
    const auto* data = package.find(name);
    if (!data) return false;

    XMLDocument dom(true, tinyxml2::PRESERVE_WHITESPACE);
    if (dom.Parse(data->c_str(), data->size()) != tinyxml2::XML_SUCCESS) {
        utils::log::warn(std::format("Cannot parse {}: {}", name, dom.ErrorStr()));
        return false;
    }
    if (!edit(dom)) return false;
    package.put(name, docx::print_xml(dom));
    return true;
}

bool is_literal_target(std::string_view name) {
    if (!docx::is_xml_part(name)) return false;
    if (name == docx::kContentTypesPart || name.ends_with(".rels")) return false;
    if (name.starts_with("docProps/")) return false;
    if (docx::is_wordprocessing_part(name) || docx::is_custom_xml_part(name)) return false;
    return true;
}

enum class PartKind { WORDPROCESSING, LITERAL };

struct PartJob {
    std::string name;
    PartKind kind = PartKind::WORDPROCESSING;
    int id_base = 0;
};

} // anonymous namespace

// ============================================================================
// Per-part rewriting
// ============================================================================

DocxRedactionEngine::PartResult DocxRedactionEngine::redact_wordprocessing_part(
        const std::string& xml, const std::vector<DetectedEntity>& entities, int id_base) {
    PartResult result;

    XMLDocument dom(true, tinyxml2::PRESERVE_WHITESPACE);
    if (dom.Parse(xml.c_str(), xml.size()) != tinyxml2::XML_SUCCESS) {
        result.error = dom.ErrorStr();
        return result;
    }
    auto* root = dom.RootElement();
    const auto ordered = by_length(entities);
    int next_id = id_base;

    for (const auto kind : {docx::LeafKind::TEXT, docx::LeafKind::DELETED, docx::LeafKind::INSTRUCTION}) {
        // w:t markers drop out of the map; other leaves keep the placeholder
        // as map text, so the search resumes after it
        const size_t placeholder_width = kind == docx::LeafKind::TEXT ? 0 : kPlaceholder.size();

        for (const auto* entity : ordered) {
            size_t from = 0;
            for (;;) {
                const auto map = docx::build_run_map(root, kind);
                const auto match = docx::find_text(map, entity->text, from);
                if (!match) break;

                const auto segments = docx::find_runs_with_text(map, match->first, match->second);
                if (segments.empty()) break;
                if (placeholder_width > 0 && touches_placeholder(segments)) {
                    from = match->first + 1;
                    continue;
                }

                replace_span(dom, segments, match->first, match->second, *entity, next_id++);
                ++result.markers;
                result.replaced_runs += segments.size();
                from = match->first + placeholder_width;
            }
        }
    }

    // Simple fields keep their instruction in an attribute
    for (auto* field : docx::elements_named(root, "w:fldSimple")) {
        const char* instr = field->Attribute("w:instr");
        if (!instr) continue;
        std::string value = instr;
        size_t n = 0;
        for (const auto* entity : ordered) {
            n += utils::replace_all_icase(value, entity->text, kPlaceholder);
        }
        if (n > 0) {
            field->SetAttribute("w:instr", value.c_str());
            result.markers += n;
        }
    }

    result.xml = docx::print_xml(dom);
    return result;
}

DocxRedactionEngine::PartResult DocxRedactionEngine::redact_literal_part(
        const std::string& xml, const std::vector<DetectedEntity>& entities) {
    PartResult result;

    XMLDocument dom(true, tinyxml2::PRESERVE_WHITESPACE);
    if (dom.Parse(xml.c_str(), xml.size()) != tinyxml2::XML_SUCCESS) {
        result.error = dom.ErrorStr();
        return result;
    }

    result.markers = replace_literal(&dom, by_length(entities));
    result.xml = result.markers > 0 ? docx::print_xml(dom) : xml;
    return result;
}

// ============================================================================
// Package-level cleanup
// ============================================================================

std::vector<std::string> DocxRedactionEngine::strip_macros(docx::OoxmlPackage& package) {
    std::vector<std::string> removed;
    for (const auto part : {kVbaProject, kVbaData, kVbaRels}) {
        if (package.remove(part)) removed.emplace_back(part);
    }

    edit_xml_part(package, docx::kContentTypesPart, [](XMLDocument& dom) {
        auto* types = dom.RootElement();
        if (!types) return false;
        bool changed = false;

        std::vector<XMLElement*> doomed;
        for (auto* el = types->FirstChildElement(); el; el = el->NextSiblingElement()) {
            const char* part = el->Attribute("PartName");
            const char* type = el->Attribute("ContentType");
            if (part && (std::string_view(part) == "/word/vbaProject.bin" ||
                         std::string_view(part) == "/word/vbaData.xml")) {
                doomed.push_back(el);
            } else if (type && std::string_view(type) == kVbaContentType) {
                doomed.push_back(el);
            } else if (type && std::string_view(type) == kMacroMainType) {
                el->SetAttribute("ContentType", std::string(kMainType).c_str());
                changed = true;
            } else if (type && std::string_view(type) == kMacroTemplateType) {
                el->SetAttribute("ContentType", std::string(kTemplateType).c_str());
                changed = true;
            }
        }
        for (auto* el : doomed) types->DeleteChild(el);
        return changed || !doomed.empty();
    });

    edit_xml_part(package, docx::kDocumentRelsPart, [](XMLDocument& dom) {
        auto* rels = dom.RootElement();
        if (!rels) return false;
        std::vector<XMLElement*> doomed;
        for (auto* rel = rels->FirstChildElement("Relationship"); rel;
             rel = rel->NextSiblingElement("Relationship")) {
            const char* type = rel->Attribute("Type");
            if (type && std::string_view(type).ends_with("/vbaProject")) doomed.push_back(rel);
        }
        for (auto* rel : doomed) rels->DeleteChild(rel);
        return !doomed.empty();
    });

    if (!removed.empty()) {
        utils::log::info(std::format("Removed {} macro parts", removed.size()));
    }
    return removed;
}

size_t DocxRedactionEngine::neutralize_external_links(docx::OoxmlPackage& package) {
    size_t total = 0;
    for (const auto& name : package.names()) {
        if (!name.ends_with(".rels")) continue;
        edit_xml_part(package, name, [&total](XMLDocument& dom) {
            auto* rels = dom.RootElement();
            if (!rels) return false;
            size_t n = 0;
            for (auto* rel = rels->FirstChildElement("Relationship"); rel;
                 rel = rel->NextSiblingElement("Relationship")) {
                const char* mode = rel->Attribute("TargetMode");
                const char* type = rel->Attribute("Type");
                if (mode && std::string_view(mode) == "External" &&
                    type && std::string_view(type).ends_with("/hyperlink")) {
                    rel->SetAttribute("Target", "#");
                    ++n;
                }
            }
            total += n;
            return n > 0;
        });
    }
    return total;
}

// ============================================================================
// Redaction
// ============================================================================

DocxRedactionOutcome DocxRedactionEngine::redact(std::string_view docx_bytes,
                                                 const std::vector<DetectedEntity>& entities,
                                                 const RedactionParams& params) const {
    auto opened = docx::OoxmlPackage::open(docx_bytes);
    if (opened.is_error()) {
        throw RedactionError(ErrorCategory::PARSE_ERROR,
            std::format("Cannot open DOCX: {}", opened.error_message()));
    }
    auto& package = opened.value();
    DocxRedactionOutcome outcome;

    std::vector<PartJob> jobs;
    int id_base = 1;
    for (const auto& name : package.names()) {
        if (docx::is_wordprocessing_part(name)) {
            jobs.push_back({name, PartKind::WORDPROCESSING, id_base});
            id_base += 100000;
        } else if (docx::is_custom_xml_part(name) || (params.strict && is_literal_target(name))) {
            jobs.push_back({name, PartKind::LITERAL, 0});
        }
    }

    // Workers get private copies of the part bytes
    std::vector<std::string> inputs;
    inputs.reserve(jobs.size());
    for (const auto& job : jobs) inputs.push_back(*package.find(job.name));

    std::vector<PartResult> results(jobs.size());
    auto run_job = [&](size_t i) {
        try {
            results[i] = jobs[i].kind == PartKind::WORDPROCESSING
                ? redact_wordprocessing_part(inputs[i], entities, jobs[i].id_base)
                : redact_literal_part(inputs[i], entities);
        } catch (const std::exception& e) {
            results[i].error = e.what();
        }
    };

    if (jobs.size() >= options_.parallel_threshold && options_.parallel_threshold > 0) {
        std::vector<std::future<void>> futures;
        futures.reserve(jobs.size());
        for (size_t i = 0; i < jobs.size(); ++i) {
            futures.push_back(std::async(std::launch::async, run_job, i));
        }
        for (auto& f : futures) f.get();
    } else {
        for (size_t i = 0; i < jobs.size(); ++i) run_job(i);
    }

    for (size_t i = 0; i < jobs.size(); ++i) {
        auto& result = results[i];
        if (result.error) {
            outcome.failures.push_back({jobs[i].name, ErrorCategory::PARSE_ERROR, *result.error});
            utils::log::warn(std::format("Skipping part {}: {}", jobs[i].name, *result.error));
            continue;
        }
        if (result.markers > 0) {
            package.put(jobs[i].name, std::move(result.xml));
        }
        outcome.markers += result.markers;
        outcome.replaced_runs += result.replaced_runs;
    }

    if (options_.strip_macros) {
        outcome.removed_parts = strip_macros(package);
    }
    if (options_.neutralize_external_links) {
        const auto links = neutralize_external_links(package);
        if (links > 0) utils::log::info(std::format("Neutralized {} external links", links));
    }

    auto bytes = package.to_bytes();
    if (bytes.is_error()) {
        throw RedactionError(ErrorCategory::IO_ERROR,
            std::format("Cannot write DOCX: {}", bytes.error_message()));
    }
    outcome.bytes = std::move(bytes.value());

    utils::log::info(std::format("DOCX attempt {}: {} markers, {} runs replaced, {} failures",
        params.attempt, outcome.markers, outcome.replaced_runs, outcome.failures.size()));
    return outcome;
}

} // namespace docredact
