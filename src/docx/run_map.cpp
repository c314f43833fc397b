#include "docx/run_map.hpp"
#include "core/utils.hpp"

#include <cstring>

namespace docredact::docx {

namespace {

bool named(const tinyxml2::XMLElement* element, std::string_view name) {
    return element && element->Name() && name == element->Name();
}

bool is_leaf(const tinyxml2::XMLElement* element, LeafKind kind) {
    switch (kind) {
        case LeafKind::TEXT:        return named(element, kText);
        case LeafKind::DELETED:     return named(element, kDeletedText);
        case LeafKind::INSTRUCTION: return named(element, kInstrText);
    }
    return false;
}

} // anonymous namespace

// ============================================================================
// Run map
// ============================================================================

RunMap build_run_map(tinyxml2::XMLElement* root, LeafKind kind) {
    RunMap map;
    if (!root) return map;

    const auto paragraphs = elements_named(root, kParagraph);
    int last_paragraph = -1;

    for (size_t p = 0; p < paragraphs.size(); ++p) {
        auto* paragraph = paragraphs[p];
        for (auto* run : elements_named(paragraph, kRun)) {
            if (nearest_ancestor(run, kParagraph) != paragraph) continue;
            if (inside_redaction_marker(run)) continue;

            for (auto* leaf = run->FirstChildElement(); leaf; leaf = leaf->NextSiblingElement()) {
                if (!is_leaf(leaf, kind)) continue;
                const auto text = leaf_text(leaf);
                if (text.empty()) continue;

                if (last_paragraph != static_cast<int>(p) && !map.text.empty()) {
                    map.text += '\n';
                }
                last_paragraph = static_cast<int>(p);

                RunSegment segment;
                segment.run = run;
                segment.leaf = leaf;
                segment.paragraph = static_cast<int>(p);
                segment.start = map.text.size();
                map.text += text;
                segment.end = map.text.size();
                map.segments.push_back(segment);
            }
        }
    }
    return map;
}

std::vector<RunSegment> find_runs_with_text(const RunMap& map, size_t start, size_t end) {
    std::vector<RunSegment> out;
    for (const auto& segment : map.segments) {
        if (segment.start < end && start < segment.end) {
            out.push_back(segment);
        }
    }
    return out;
}

std::optional<std::pair<size_t, size_t>> find_text(const RunMap& map, std::string_view needle,
                                                   size_t from) {
    const size_t pos = utils::find_icase(map.text, needle, from);
    if (pos == std::string::npos) return std::nullopt;
    return std::make_pair(pos, pos + needle.size());
}

// ============================================================================
// Tree helpers
// ============================================================================

void for_each_element(tinyxml2::XMLElement* root,
                      const std::function<void(tinyxml2::XMLElement*)>& fn) {
    if (!root) return;
    fn(root);
    for (auto* child = root->FirstChildElement(); child; child = child->NextSiblingElement()) {
        for_each_element(child, fn);
    }
}

std::vector<tinyxml2::XMLElement*> elements_named(tinyxml2::XMLElement* root, std::string_view name) {
    std::vector<tinyxml2::XMLElement*> out;
    for_each_element(root, [&](tinyxml2::XMLElement* element) {
        if (named(element, name)) out.push_back(element);
    });
    return out;
}

tinyxml2::XMLElement* nearest_ancestor(tinyxml2::XMLElement* element, std::string_view name) {
    for (auto* node = element ? element->Parent() : nullptr; node; node = node->Parent()) {
        auto* parent = node->ToElement();
        if (named(parent, name)) return parent;
    }
    return nullptr;
}

bool inside_redaction_marker(const tinyxml2::XMLElement* element) {
    for (auto* node = element ? element->Parent() : nullptr; node; node = node->Parent()) {
        const auto* sdt = node->ToElement();
        if (!named(sdt, kSdt)) continue;
        const auto* props = sdt->FirstChildElement("w:sdtPr");
        const auto* tag = props ? props->FirstChildElement("w:tag") : nullptr;
        const char* value = tag ? tag->Attribute("w:val") : nullptr;
        if (value && std::strcmp(value, kRedactedTag) == 0) return true;
    }
    return false;
}

std::string run_text(const tinyxml2::XMLElement* run) {
    std::string out;
    if (!run) return out;
    for (auto* leaf = run->FirstChildElement(kText); leaf; leaf = leaf->NextSiblingElement(kText)) {
        out += leaf_text(leaf);
    }
    return out;
}

std::string leaf_text(const tinyxml2::XMLElement* leaf) {
    const char* text = leaf ? leaf->GetText() : nullptr;
    return text ? std::string(text) : std::string();
}

void set_leaf_text(tinyxml2::XMLElement* leaf, std::string_view text) {
    const std::string value(text);
    leaf->SetText(value.c_str());
    if (!value.empty() && (value.front() == ' ' || value.back() == ' ')) {
        leaf->SetAttribute("xml:space", "preserve");
    }
}

std::string print_xml(tinyxml2::XMLDocument& dom) {
    tinyxml2::XMLPrinter printer(nullptr, true);
    dom.Print(&printer);
    return std::string(printer.CStr(), static_cast<size_t>(printer.CStrSize() - 1));
}

} // namespace docredact::docx
