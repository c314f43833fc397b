#include "detect/entity_detector.hpp"
#include "core/utils.hpp"

#include <algorithm>
#include <format>
#include <unordered_set>

namespace docredact {

EntityDetector::EntityDetector(const std::vector<RedactionRule>& rules)
    : rules_(rules) {
    compiled_.reserve(rules_.size());
    for (size_t i = 0; i < rules_.size(); ++i) {
        if (!rules_[i].pattern) continue;
        // Templates are validated before detection, so a failure here means
        // the caller skipped validation.
        compiled_.push_back({i, compile_pattern(*rules_[i].pattern)});
    }
}

std::string EntityDetector::strip_anchors(const std::string& pattern) {
    std::string out = pattern;
    if (!out.empty() && out.front() == '^') {
        out.erase(0, 1);
    }
    if (!out.empty() && out.back() == '$') {
        size_t backslashes = 0;
        for (size_t i = out.size() - 1; i > 0 && out[i - 1] == '\\'; --i) {
            ++backslashes;
        }
        if (backslashes % 2 == 0) {
            out.pop_back();
        }
    }
    return out;
}

std::regex EntityDetector::compile_pattern(const std::string& pattern) {
    return std::regex(strip_anchors(pattern),
                      std::regex::ECMAScript | std::regex::icase | std::regex::optimize);
}

DetectedEntity EntityDetector::make_entity(
    const RedactionRule& rule, std::string text, size_t start, size_t end, EntitySource source) {
    DetectedEntity e;
    e.rule_id = rule.id;
    e.rule_name = rule.name;
    e.rule_version = rule.version_label();
    e.category = rule.category.empty() ? "UNKNOWN" : rule.category;
    e.content_hash = utils::sha256_hex(text);
    e.text = std::move(text);
    e.char_start = start;
    e.char_end = end;
    e.source = source;
    return e;
}

std::vector<DetectedEntity> EntityDetector::detect(const std::string& text) const {
    std::vector<DetectedEntity> found;

    for (const auto& cr : compiled_) {
        const auto& rule = rules_[cr.rule_index];
        size_t matches = 0;
        for (auto it = std::sregex_iterator(text.begin(), text.end(), cr.regex);
             it != std::sregex_iterator(); ++it) {
            const auto& m = *it;
            if (m.length(0) == 0) continue;
            const auto start = static_cast<size_t>(m.position(0));
            const auto end = start + static_cast<size_t>(m.length(0));
            found.push_back(make_entity(rule, m.str(0), start, end));
            ++matches;
        }
        if (matches > 0) {
            utils::log::debug(std::format("Rule '{}' matched {} time(s)", rule.id, matches));
        }
    }

    return resolve_overlaps(std::move(found));
}

std::vector<DetectedEntity> EntityDetector::detect(
    const std::string& text, const std::vector<RedactionRule>& rules) {
    return EntityDetector(rules).detect(text);
}

std::vector<DetectedEntity> EntityDetector::resolve_overlaps(std::vector<DetectedEntity> entities) {
    std::stable_sort(entities.begin(), entities.end(),
        [](const DetectedEntity& a, const DetectedEntity& b) {
            if (a.char_start != b.char_start) return a.char_start < b.char_start;
            return a.length() > b.length();
        });

    std::vector<DetectedEntity> kept;
    kept.reserve(entities.size());

    for (auto& e : entities) {
        // Sorted by start: anything kept before back() ends at or before
        // back().char_start, so only back() can overlap e.
        if (!kept.empty() && kept.back().overlaps(e)) {
            if (e.length() > kept.back().length()) {
                kept.back() = std::move(e);
            }
            continue;
        }
        kept.push_back(std::move(e));
    }
    return kept;
}

std::vector<DetectedEntity> EntityDetector::merge(
    std::vector<DetectedEntity> base,
    const std::vector<DetectedEntity>& supplemental) {

    std::unordered_set<std::string> seen;
    seen.reserve(base.size() + supplemental.size());
    for (const auto& e : base) {
        seen.insert(utils::to_lower(e.text));
    }

    size_t added = 0;
    for (const auto& s : supplemental) {
        if (s.text.empty() || s.char_end <= s.char_start) continue;
        if (!seen.insert(utils::to_lower(s.text)).second) continue;
        base.push_back(s);
        ++added;
    }

    if (added > 0) {
        utils::log::debug(std::format("Merged {} supplemental entit{}", added, added == 1 ? "y" : "ies"));
    }
    return resolve_overlaps(std::move(base));
}

} // namespace docredact
