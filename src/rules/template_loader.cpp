#include "rules/template_loader.hpp"
#include "core/json.hpp"
#include "core/utils.hpp"
#include "detect/entity_detector.hpp"

#include <toml.hpp>

#include <format>
#include <fstream>
#include <regex>
#include <sstream>

using namespace std::string_literals;

namespace docredact {

static constexpr std::string_view kTemplate = "template";
static constexpr std::string_view kRules    = "rules";
static constexpr std::string_view kId       = "id";
static constexpr std::string_view kName     = "name";
static constexpr std::string_view kCategory = "category";
static constexpr std::string_view kSeverity = "severity";
static constexpr std::string_view kPattern  = "pattern";
static constexpr std::string_view kAiPrompt = "ai_prompt";
static constexpr std::string_view kVersion  = "version";
static constexpr std::string_view kChecksum = "checksum";

namespace {

// Strings are taken as-is; numeric versions (version = 2) are rendered as text
std::optional<std::string> toml_text(const toml::table& tbl, std::string_view key) {
    const auto node = tbl[key];
    if (auto s = node.value<std::string>()) return *s;
    if (auto i = node.value<int64_t>()) return std::to_string(*i);
    if (auto d = node.value<double>()) return std::format("{}", *d);
    return std::nullopt;
}

// Empty strings count as absent
std::optional<std::string> non_empty(std::optional<std::string> v) {
    if (v && utils::trim(*v).empty()) return std::nullopt;
    return v;
}

bool ends_with(const std::string& s, std::string_view suffix) {
    return s.size() >= suffix.size() &&
           s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

} // anonymous namespace

// ============================================================================
// Public API
// ============================================================================

TemplateLoader::LoadResult TemplateLoader::load_from_file(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return LoadResult::error(std::format("Cannot open template file: {}", path));
    }

    std::string buffer((std::istreambuf_iterator<char>(file)),
                       std::istreambuf_iterator<char>());
    const auto syntax = ends_with(utils::to_lower(path), ".json")
        ? TemplateSyntax::JSON : TemplateSyntax::TOML;
    return load_from_string(buffer, syntax);
}

TemplateLoader::LoadResult TemplateLoader::load_from_string(
    const std::string& content, TemplateSyntax syntax) {

    auto parsed = parse(content, syntax);
    if (parsed.is_error()) {
        return LoadResult::error(parsed.error_message());
    }

    if (auto err = validate(parsed.value())) {
        return LoadResult::error(std::move(*err));
    }
    return LoadResult::ok(std::move(parsed.value()));
}

RedactionTemplate TemplateLoader::load_or_throw(const std::string& path) {
    auto result = load_from_file(path);
    if (!result.success) {
        throw TemplateValidationError(result.error_message);
    }
    return std::move(result.template_);
}

Result<RedactionTemplate> TemplateLoader::parse(const std::string& content, TemplateSyntax syntax) {
    if (utils::trim(content).empty()) {
        return Result<RedactionTemplate>::error(ErrorCategory::TEMPLATE_ERROR, "Template is required");
    }
    return syntax == TemplateSyntax::JSON ? parse_json(content) : parse_toml(content);
}

// ============================================================================
// Validation
// ============================================================================

std::optional<std::string> TemplateLoader::validate(const RedactionTemplate& tmpl) {
    if (tmpl.rules.empty()) {
        return "Template must have at least one rule"s;
    }

    for (size_t i = 0; i < tmpl.rules.size(); ++i) {
        if (tmpl.rules[i].id.empty()) {
            return std::format("Rule at index {} is missing required field: id", i);
        }
    }

    for (const auto& rule : tmpl.rules) {
        if (rule.name.empty()) {
            return std::format("Rule '{}' is missing required field: name", rule.id);
        }
    }

    for (const auto& rule : tmpl.rules) {
        if (!rule.pattern && !rule.ai_prompt) {
            return std::format("Rule '{}' must have either pattern or ai_prompt", rule.id);
        }
        if (rule.pattern && rule.ai_prompt) {
            return std::format("Rule '{}' must not have both pattern and ai_prompt", rule.id);
        }
    }

    for (const auto& rule : tmpl.rules) {
        if (!rule.pattern) continue;
        try {
            [[maybe_unused]] const auto re = EntityDetector::compile_pattern(*rule.pattern);
        } catch (const std::regex_error& e) {
            return std::format("Rule '{}' has an invalid pattern: {}", rule.id, e.what());
        }
    }

    for (const auto& rule : tmpl.rules) {
        if (!rule.version && !rule.checksum) {
            return std::format("Rule '{}' must have a version or checksum", rule.id);
        }
    }

    return std::nullopt;
}

// ============================================================================
// Checksums
// ============================================================================

std::string TemplateLoader::compute_rule_checksum(const RedactionRule& rule) {
    std::string input;
    input.reserve(128);
    input += rule.id;
    input += '|';
    input += rule.name;
    input += '|';
    input += rule.category;
    input += '|';
    input += rule.pattern.value_or("");
    input += '|';
    input += rule.ai_prompt.value_or("");
    return utils::sha256_hex(input);
}

size_t TemplateLoader::enrich_checksums(RedactionTemplate& tmpl) {
    size_t enriched = 0;
    for (auto& rule : tmpl.rules) {
        if (rule.checksum) continue;
        rule.checksum = compute_rule_checksum(rule);
        ++enriched;
    }
    return enriched;
}

std::string TemplateLoader::to_toml(const RedactionTemplate& tmpl) {
    toml::table root;

    toml::table header;
    header.insert_or_assign(kId, tmpl.id);
    header.insert_or_assign(kName, tmpl.name);
    root.insert_or_assign(kTemplate, std::move(header));

    toml::array rules;
    for (const auto& rule : tmpl.rules) {
        toml::table r;
        r.insert_or_assign(kId, rule.id);
        r.insert_or_assign(kName, rule.name);
        r.insert_or_assign(kCategory, rule.category);
        r.insert_or_assign(kSeverity, rule.severity);
        if (rule.pattern)   r.insert_or_assign(kPattern, *rule.pattern);
        if (rule.ai_prompt) r.insert_or_assign(kAiPrompt, *rule.ai_prompt);
        if (rule.version)   r.insert_or_assign(kVersion, *rule.version);
        if (rule.checksum)  r.insert_or_assign(kChecksum, *rule.checksum);
        rules.push_back(std::move(r));
    }
    root.insert_or_assign(kRules, std::move(rules));

    std::ostringstream out;
    out << root << '\n';
    return out.str();
}

// ============================================================================
// Parsers
// ============================================================================

Result<RedactionTemplate> TemplateLoader::parse_toml(const std::string& content) {
    try {
        const auto doc = toml::parse(content);

        const auto* header = doc[kTemplate].as_table();
        const auto* rules = doc[kRules].as_array();
        if (!header && !rules) {
            return Result<RedactionTemplate>::error(ErrorCategory::TEMPLATE_ERROR,
                "Template is required");
        }

        RedactionTemplate tmpl;
        if (header) {
            tmpl.id = (*header)[kId].value_or(""s);
            tmpl.name = (*header)[kName].value_or(""s);
        }

        if (!rules) {
            return Result<RedactionTemplate>::ok(std::move(tmpl));
        }

        for (const auto& elem : *rules) {
            const auto* node = elem.as_table();
            if (!node) {
                return Result<RedactionTemplate>::error(ErrorCategory::TEMPLATE_ERROR,
                    "Template rules must be an array of tables");
            }
            const auto& tbl = *node;

            RedactionRule rule;
            rule.id = toml_text(tbl, kId).value_or("");
            rule.name = tbl[kName].value_or(""s);
            rule.category = tbl[kCategory].value_or("UNKNOWN"s);
            rule.severity = tbl[kSeverity].value_or("medium"s);
            rule.pattern = non_empty(tbl[kPattern].value<std::string>());
            rule.ai_prompt = non_empty(tbl[kAiPrompt].value<std::string>());
            rule.version = non_empty(toml_text(tbl, kVersion));
            rule.checksum = non_empty(tbl[kChecksum].value<std::string>());
            tmpl.rules.emplace_back(std::move(rule));
        }

        return Result<RedactionTemplate>::ok(std::move(tmpl));

    } catch (const toml::parse_error& e) {
        return Result<RedactionTemplate>::error(ErrorCategory::TEMPLATE_ERROR,
            std::format("TOML parse error: {}", e.what()));
    }
}

Result<RedactionTemplate> TemplateLoader::parse_json(const std::string& content) {
    try {
        const auto doc = JsonValue::parse(content);
        if (!doc.is_object()) {
            return Result<RedactionTemplate>::error(ErrorCategory::TEMPLATE_ERROR,
                "Template is required");
        }

        RedactionTemplate tmpl;
        tmpl.id = doc.string_or(kId, "");
        tmpl.name = doc.string_or(kName, "");

        const auto rules = doc[kRules];
        if (!rules.is_null() && !rules.is_array()) {
            return Result<RedactionTemplate>::error(ErrorCategory::TEMPLATE_ERROR,
                "Template rules must be an array");
        }

        for (const auto& r : rules.elements()) {
            if (!r.is_object()) {
                return Result<RedactionTemplate>::error(ErrorCategory::TEMPLATE_ERROR,
                    "Template rules must be objects");
            }
            RedactionRule rule;
            rule.id = r.string_or(kId, "");
            rule.name = r.string_or(kName, "");
            rule.category = r.string_or(kCategory, "UNKNOWN");
            rule.severity = r.string_or(kSeverity, "medium");
            rule.pattern = non_empty(r.optional_string(kPattern));
            rule.ai_prompt = non_empty(r.optional_string(kAiPrompt));
            if (!rule.ai_prompt) rule.ai_prompt = non_empty(r.optional_string("aiPrompt"));
            rule.version = non_empty(r.optional_string(kVersion));
            rule.checksum = non_empty(r.optional_string(kChecksum));
            tmpl.rules.emplace_back(std::move(rule));
        }

        return Result<RedactionTemplate>::ok(std::move(tmpl));

    } catch (const JsonValue::parse_error& e) {
        return Result<RedactionTemplate>::error(ErrorCategory::TEMPLATE_ERROR, e.what());
    }
}

} // namespace docredact
