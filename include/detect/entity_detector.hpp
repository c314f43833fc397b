#pragma once

#include "core/types.hpp"

#include <regex>
#include <string>
#include <vector>

namespace docredact {

/**
 * @brief Rule-based entity detector
 *
 * Scans the whole extracted text (not per paragraph, so matches that span
 * structural boundaries are found) with each pattern rule, case-insensitive.
 * Patterns are compiled once at construction. Rules carrying an ai_prompt
 * instead of a pattern are ignored here; they feed the suggestion provider.
 */
class EntityDetector {
public:
    explicit EntityDetector(const std::vector<RedactionRule>& rules);

    /**
     * @brief Find all matches, resolve overlaps
     * @return Entities ordered by start offset, no two overlapping
     */
    [[nodiscard]] std::vector<DetectedEntity> detect(const std::string& text) const;

    /**
     * @brief One-shot detection with a temporary detector
     */
    [[nodiscard]] static std::vector<DetectedEntity> detect(
        const std::string& text, const std::vector<RedactionRule>& rules);

    /**
     * @brief Merge supplemental (e.g. AI-sourced) entities into a base set
     *
     * A supplemental entity is dropped when its text case-insensitively equals
     * the text of an entity already kept. Overlaps are then resolved again.
     */
    [[nodiscard]] static std::vector<DetectedEntity> merge(
        std::vector<DetectedEntity> base,
        const std::vector<DetectedEntity>& supplemental);

    /**
     * @brief Sort by start offset; of two overlapping spans keep the longer
     * (the earlier one on ties)
     */
    [[nodiscard]] static std::vector<DetectedEntity> resolve_overlaps(
        std::vector<DetectedEntity> entities);

    /**
     * @brief Remove a leading ^ and an unescaped trailing $
     */
    [[nodiscard]] static std::string strip_anchors(const std::string& pattern);

    /**
     * @brief Compile a rule pattern for scanning (anchors stripped, ECMAScript, icase)
     * @throws std::regex_error if the pattern does not compile
     */
    [[nodiscard]] static std::regex compile_pattern(const std::string& pattern);

    [[nodiscard]] static DetectedEntity make_entity(
        const RedactionRule& rule, std::string text, size_t start, size_t end,
        EntitySource source = EntitySource::RULE);

private:
    struct CompiledRule {
        size_t rule_index;
        std::regex regex;
    };

    std::vector<RedactionRule> rules_;
    std::vector<CompiledRule> compiled_;
};

} // namespace docredact
