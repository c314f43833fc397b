#pragma once

#include "core/error.hpp"
#include "core/geometry.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace docredact {

// ============================================================================
// Basic Enums
// ============================================================================

enum class DocumentFormat {
    UNKNOWN,
    PDF,
    DOCX
};

[[nodiscard]] inline const char* format_to_string(DocumentFormat format) {
    switch (format) {
        case DocumentFormat::PDF:     return "pdf";
        case DocumentFormat::DOCX:    return "docx";
        case DocumentFormat::UNKNOWN: return "unknown";
    }
    return "unknown";
}

enum class EntitySource {
    RULE,
    SUGGESTION
};

// ============================================================================
// Template Types
// ============================================================================

/**
 * @brief One detection rule. Immutable once loaded into a run.
 *
 * Exactly one of pattern/ai_prompt is set; version or checksum is always set.
 */
struct RedactionRule {
    std::string id;
    std::string name;
    std::string category = "UNKNOWN";
    std::string severity = "medium";
    std::optional<std::string> pattern;
    std::optional<std::string> ai_prompt;
    std::optional<std::string> version;
    std::optional<std::string> checksum;

    [[nodiscard]] bool is_pattern_rule() const { return pattern.has_value(); }

    // Version if present, otherwise the short checksum
    [[nodiscard]] std::string version_label() const {
        if (version) return *version;
        if (checksum) return checksum->substr(0, 12);
        return {};
    }
};

struct RedactionTemplate {
    std::string id;
    std::string name;
    std::vector<RedactionRule> rules;
};

// ============================================================================
// Position Index
// ============================================================================

/**
 * @brief A run of extracted text with its location in the source document
 *
 * PDF fragments carry page-space geometry. DOCX fragments carry the part
 * name and paragraph index and have no geometry.
 */
struct TextFragment {
    std::string text;
    size_t char_offset = 0;
    int page = 0;               // 1-based; 0 for DOCX
    double x = 0.0;
    double y = 0.0;
    double width = 0.0;
    double height = 0.0;
    bool has_geometry = false;
    std::string part;
    int paragraph = -1;

    [[nodiscard]] size_t end() const { return char_offset + text.size(); }
    [[nodiscard]] Rect rect() const { return Rect::from_xywh(x, y, width, height); }
};

struct PositionIndex {
    std::vector<TextFragment> fragments;

    [[nodiscard]] bool empty() const { return fragments.empty(); }
    [[nodiscard]] size_t size() const { return fragments.size(); }
};

struct IndexedDocument {
    DocumentFormat format = DocumentFormat::UNKNOWN;
    std::string text;
    PositionIndex positions;
    int page_count = 0;

    // Non-whitespace characters in the extracted text
    [[nodiscard]] size_t meaningful_chars() const {
        size_t n = 0;
        for (const char c : text) {
            if (c != ' ' && c != '\n' && c != '\t' && c != '\r') ++n;
        }
        return n;
    }
};

// ============================================================================
// Entities and Boxes
// ============================================================================

struct DetectedEntity {
    std::string rule_id;
    std::string rule_name;
    std::string rule_version;
    std::string category = "UNKNOWN";
    std::string text;
    size_t char_start = 0;
    size_t char_end = 0;        // half-open
    std::optional<int> page;
    std::optional<Rect> geometry;
    std::string content_hash;
    EntitySource source = EntitySource::RULE;

    [[nodiscard]] size_t length() const { return char_end - char_start; }
    [[nodiscard]] bool overlaps(const DetectedEntity& o) const {
        return char_start < o.char_end && o.char_start < char_end;
    }
};

struct RedactionBox {
    int page = 0;
    Rect rect;
};

/**
 * @brief Redaction targets for one entity
 *
 * position_found is false when no fragment overlapped the entity span; the
 * entity is still redacted structurally but visual coverage is unproven.
 */
struct ResolvedEntity {
    size_t entity_index = 0;
    std::vector<RedactionBox> boxes;
    bool position_found = false;
};

// ============================================================================
// Redaction Parameters and Outcomes
// ============================================================================

struct Padding {
    double x = 10.0;
    double y = 4.0;
};

/**
 * @brief Parameters for one redaction attempt
 *
 * Attempt 1 uses the configured padding. The strict attempt scales it and
 * enables whole-block removal plus form XObject pruning.
 */
struct RedactionParams {
    int attempt = 1;
    Padding padding;
    bool strict = false;
};

/// A page or part that could not be processed and was skipped
struct PartFailure {
    std::string location;
    ErrorCategory category = ErrorCategory::INTERNAL_ERROR;
    std::string message;
};

struct VerificationResult {
    bool success = false;
    std::vector<RemainingFragment> remaining;
};

// ============================================================================
// Report
// ============================================================================

struct ReportEntity {
    std::string rule_id;
    std::string rule_name;
    std::string rule_version;
    std::string category;
    std::string entity_hash;
    std::optional<int> page;
    size_t position_start = 0;
    size_t position_end = 0;
    bool position_found = true;
    EntitySource source = EntitySource::RULE;
};

struct RedactionReport {
    std::string report_id;
    std::chrono::system_clock::time_point timestamp;
    std::string user_id;
    std::string document_id;
    std::string template_id;
    DocumentFormat format = DocumentFormat::UNKNOWN;
    size_t total_entities = 0;
    std::vector<ReportEntity> entities;
    std::map<std::string, size_t> counts_by_rule;
    std::map<std::string, size_t> counts_by_page;   // "1", "2", ... or "unknown"
    std::vector<std::string> unresolved_entities;    // entity hashes
    std::vector<PartFailure> failures;
    int attempts = 0;
    bool verification_passed = false;
    bool requires_manual_review = false;
    std::string manual_review_reason;
    std::string content_hash;                        // SHA-256 of the output bytes
    std::vector<std::string> audit_findings;
};

} // namespace docredact
