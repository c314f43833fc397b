#pragma once

#include "core/error.hpp"
#include "core/types.hpp"

#include <optional>
#include <string>

namespace docredact {

enum class TemplateSyntax {
    TOML,
    JSON
};

/**
 * @brief Redaction template loader (TOML or JSON)
 *
 * Validation is fail-fast and runs before any document I/O. First failing
 * check wins, in this order:
 * - Template present
 * - At least one rule
 * - Every rule has an id
 * - Every rule has a name
 * - Every rule has exactly one of pattern / ai_prompt
 * - Every pattern compiles (case-insensitive)
 * - Every rule has a version or a checksum
 */
class TemplateLoader {
public:
    struct LoadResult {
        bool success;
        std::string error_message;
        RedactionTemplate template_;

        static LoadResult ok(RedactionTemplate tmpl) {
            LoadResult result;
            result.success = true;
            result.template_ = std::move(tmpl);
            return result;
        }

        static LoadResult error(std::string message) {
            LoadResult result;
            result.success = false;
            result.error_message = std::move(message);
            return result;
        }
    };

    /**
     * @brief Load and validate a template file; syntax chosen by extension
     * (.json is JSON, anything else TOML)
     */
    static LoadResult load_from_file(const std::string& path);

    /**
     * @brief Load and validate a template from a string
     */
    static LoadResult load_from_string(const std::string& content, TemplateSyntax syntax);

    /**
     * @brief Load and validate, throwing TemplateValidationError on failure
     */
    static RedactionTemplate load_or_throw(const std::string& path);

    /**
     * @brief Parse without validating (used by the checksum enrichment tool)
     */
    static Result<RedactionTemplate> parse(const std::string& content, TemplateSyntax syntax);

    /**
     * @brief Validate a parsed template
     * @return Error message, or nullopt when valid
     */
    [[nodiscard]] static std::optional<std::string> validate(const RedactionTemplate& tmpl);

    /**
     * @brief SHA-256 over id|name|category|pattern|ai_prompt
     */
    [[nodiscard]] static std::string compute_rule_checksum(const RedactionRule& rule);

    /**
     * @brief Fill in missing checksums. Explicit tool, never called during loading.
     * @return Number of rules that received a checksum
     */
    static size_t enrich_checksums(RedactionTemplate& tmpl);

    /**
     * @brief Serialize a template back to TOML
     */
    [[nodiscard]] static std::string to_toml(const RedactionTemplate& tmpl);

private:
    static Result<RedactionTemplate> parse_toml(const std::string& content);
    static Result<RedactionTemplate> parse_json(const std::string& content);
};

} // namespace docredact
