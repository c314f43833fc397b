#include "config/config_loader.hpp"
#include "core/utils.hpp"

#include <toml.hpp>

#include <cstdlib>
#include <format>
#include <stdexcept>

using namespace std::string_literals;

namespace docredact {

// ============================================================================
// TOML Parsing Helpers (env expansion)
// ============================================================================

namespace {

/**
 * @brief Expand ${VAR_NAME} patterns with environment variables.
 * Unset variables expand to the empty string.
 */
std::string expand_env_vars(const std::string& input) {
    if (input.find("${") == std::string::npos) return input;

    std::string result;
    result.reserve(input.size());
    size_t i = 0;
    while (i < input.size()) {
        if (i + 1 < input.size() && input[i] == '$' && input[i + 1] == '{') {
            const size_t close = input.find('}', i + 2);
            if (close == std::string::npos) {
                throw std::runtime_error(
                    std::format("Unclosed env var substitution at position {}", i));
            }
            const std::string var_name = input.substr(i + 2, close - i - 2);
            if (const char* env_val = std::getenv(var_name.c_str())) {
                result += env_val;
            }
            i = close + 1;
        } else {
            result += input[i++];
        }
    }
    return result;
}

void expand_env_vars_recursive(toml::table& tbl) {
    for (auto& [key, val] : tbl) {
        if (auto* s = val.as_string()) {
            *s = expand_env_vars(s->get());
        } else if (auto* t = val.as_table()) {
            expand_env_vars_recursive(*t);
        }
    }
}

const toml::table* section(const toml::table& root, std::string_view name) {
    return root[name].as_table();
}

// ---- Section extractors ----------------------------------------------------

LoggingConfig extract_logging(const toml::table& root) {
    LoggingConfig cfg;
    const auto* l = section(root, "logging");
    if (!l) return cfg;

    cfg.level = (*l)["level"].value_or(cfg.level);
    return cfg;
}

RedactionConfig extract_redaction(const toml::table& root) {
    RedactionConfig cfg;
    const auto* r = section(root, "redaction");
    if (!r) return cfg;
    const auto& t = *r;

    cfg.padding.x = t["padding_x"].value_or(cfg.padding.x);
    cfg.padding.y = t["padding_y"].value_or(cfg.padding.y);
    cfg.strict_padding_factor = t["strict_padding_factor"].value_or(cfg.strict_padding_factor);
    cfg.max_attempts = t["max_attempts"].value_or(cfg.max_attempts);
    cfg.min_verification_length = static_cast<size_t>(
        t["min_verification_length"].value_or(static_cast<int64_t>(cfg.min_verification_length)));
    cfg.default_fragment_width = t["default_fragment_width"].value_or(cfg.default_fragment_width);
    cfg.default_fragment_height = t["default_fragment_height"].value_or(cfg.default_fragment_height);
    cfg.parallel_threshold = static_cast<size_t>(
        t["parallel_threshold"].value_or(static_cast<int64_t>(cfg.parallel_threshold)));
    cfg.deadline_ms = static_cast<uint32_t>(t["deadline_ms"].value_or(int64_t{0}));
    return cfg;
}

PdfConfig extract_pdf(const toml::table& root) {
    PdfConfig cfg;
    const auto* p = section(root, "pdf");
    if (!p) return cfg;

    cfg.width_factor = (*p)["width_factor"].value_or(cfg.width_factor);
    cfg.strip_annotations = (*p)["strip_annotations"].value_or(cfg.strip_annotations);
    cfg.ensure_accessibility = (*p)["ensure_accessibility"].value_or(cfg.ensure_accessibility);
    return cfg;
}

DocxConfig extract_docx(const toml::table& root) {
    DocxConfig cfg;
    const auto* d = section(root, "docx");
    if (!d) return cfg;

    cfg.strip_macros = (*d)["strip_macros"].value_or(cfg.strip_macros);
    cfg.neutralize_external_links =
        (*d)["neutralize_external_links"].value_or(cfg.neutralize_external_links);
    return cfg;
}

SuggestionConfig extract_suggestions(const toml::table& root) {
    SuggestionConfig cfg;
    const auto* s = section(root, "suggestions");
    if (!s) return cfg;
    const auto& t = *s;

    cfg.enabled = t["enabled"].value_or(false);
    cfg.provider = t["provider"].value_or(cfg.provider);
    cfg.endpoint = t["endpoint"].value_or(""s);
    cfg.api_key = t["api_key"].value_or(""s);
    cfg.model = t["model"].value_or(""s);
    cfg.timeout_ms = static_cast<uint32_t>(t["timeout_ms"].value_or(int64_t{30000}));
    cfg.max_retries = static_cast<uint32_t>(t["max_retries"].value_or(int64_t{1}));
    return cfg;
}

StorageConfig extract_storage(const toml::table& root) {
    StorageConfig cfg;
    const auto* s = section(root, "storage");
    if (!s) return cfg;

    cfg.root = (*s)["root"].value_or(cfg.root);
    return cfg;
}

EngineConfig extract_all_sections(const toml::table& root) {
    EngineConfig config;
    config.logging = extract_logging(root);
    config.redaction = extract_redaction(root);
    config.pdf = extract_pdf(root);
    config.docx = extract_docx(root);
    config.suggestions = extract_suggestions(root);
    config.storage = extract_storage(root);
    return config;
}

} // anonymous namespace

// ---- Public API ------------------------------------------------------------

ConfigLoader::LoadResult ConfigLoader::validate_and_return(EngineConfig config) {
    const auto errors = validate_config(config);
    if (!errors.empty()) {
        std::string combined = "Config validation failed:";
        for (const auto& err : errors) { combined += "\n  - "; combined += err; }
        return LoadResult::error(std::move(combined));
    }
    return LoadResult::ok(std::move(config));
}

ConfigLoader::LoadResult ConfigLoader::load_from_file(const std::string& config_path) {
    try {
        auto tbl = toml::parse_file(config_path);
        expand_env_vars_recursive(tbl);
        return validate_and_return(extract_all_sections(tbl));
    } catch (const std::exception& e) {
        return LoadResult::error(std::format("Failed to load config: {}", e.what()));
    }
}

ConfigLoader::LoadResult ConfigLoader::load_from_string(const std::string& toml_content) {
    try {
        auto tbl = toml::parse(toml_content);
        expand_env_vars_recursive(tbl);
        return validate_and_return(extract_all_sections(tbl));
    } catch (const std::exception& e) {
        return LoadResult::error(std::format("Failed to parse config: {}", e.what()));
    }
}

// ============================================================================
// Config Validation
// ============================================================================

std::vector<std::string> ConfigLoader::validate_config(const EngineConfig& config) {
    std::vector<std::string> errors;

    if (!utils::log::parse_level(config.logging.level)) {
        errors.push_back(std::format(
            "logging.level must be debug, info, warn or error, got '{}'", config.logging.level));
    }

    const auto& r = config.redaction;
    if (r.padding.x < 0.0 || r.padding.y < 0.0) {
        errors.push_back("redaction.padding_x and redaction.padding_y must be >= 0");
    }
    if (r.strict_padding_factor < 1.0) {
        errors.push_back(std::format(
            "redaction.strict_padding_factor must be >= 1.0, got {}", r.strict_padding_factor));
    }
    if (r.max_attempts < 1 || r.max_attempts > 2) {
        errors.push_back(std::format("redaction.max_attempts must be 1-2, got {}", r.max_attempts));
    }
    if (r.min_verification_length < 1) {
        errors.push_back("redaction.min_verification_length must be >= 1");
    }
    if (r.default_fragment_width <= 0.0 || r.default_fragment_height <= 0.0) {
        errors.push_back("redaction.default_fragment_width and default_fragment_height must be > 0");
    }
    if (r.parallel_threshold < 1) {
        errors.push_back("redaction.parallel_threshold must be >= 1");
    }

    if (config.pdf.width_factor <= 0.0 || config.pdf.width_factor > 2.0) {
        errors.push_back(std::format(
            "pdf.width_factor must be in (0, 2], got {}", config.pdf.width_factor));
    }

    const auto& s = config.suggestions;
    if (s.enabled) {
        if (s.provider != "anthropic" && s.provider != "openai") {
            errors.push_back(std::format(
                "suggestions.provider must be anthropic or openai, got '{}'", s.provider));
        }
        if (s.endpoint.empty()) {
            errors.push_back("suggestions.endpoint required when suggestions are enabled");
        }
        if (s.timeout_ms == 0) {
            errors.push_back("suggestions.timeout_ms must be > 0");
        }
    }

    if (config.storage.root.empty()) {
        errors.push_back("storage.root must not be empty");
    }

    return errors;
}

} // namespace docredact
