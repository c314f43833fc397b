#pragma once

#include <tinyxml2.h>

#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace docredact::docx {

// WordprocessingML element names
inline constexpr const char* kParagraph = "w:p";
inline constexpr const char* kRun = "w:r";
inline constexpr const char* kRunProps = "w:rPr";
inline constexpr const char* kText = "w:t";
inline constexpr const char* kDeletedText = "w:delText";
inline constexpr const char* kInstrText = "w:instrText";
inline constexpr const char* kSdt = "w:sdt";
inline constexpr const char* kRedactedTag = "Redacted";

/**
 * @brief Which leaves a run map covers
 *
 * TEXT is the accepted view of the document and matches what the indexer
 * reads, so a tracked deletion inside a phrase does not split it.
 */
enum class LeafKind {
    TEXT,           // w:t
    DELETED,        // w:delText
    INSTRUCTION     // w:instrText
};

/**
 * @brief One text leaf and the run that owns it, with its offsets in the
 * map text
 */
struct RunSegment {
    tinyxml2::XMLElement* run = nullptr;
    tinyxml2::XMLElement* leaf = nullptr;
    int paragraph = -1;
    size_t start = 0;
    size_t end = 0;     // half-open
};

/**
 * @brief Character-offset map over the text leaves of one XML part
 *
 * Paragraph boundaries appear as '\n' in text and belong to no segment.
 * Leaves inside an existing redaction marker (w:sdt tagged "Redacted")
 * are skipped.
 */
struct RunMap {
    std::string text;
    std::vector<RunSegment> segments;
};

[[nodiscard]] RunMap build_run_map(tinyxml2::XMLElement* root, LeafKind kind = LeafKind::TEXT);

/**
 * @brief Segments overlapping [start, end), in document order
 */
[[nodiscard]] std::vector<RunSegment> find_runs_with_text(const RunMap& map, size_t start, size_t end);

/**
 * @brief Case-insensitive search of the map text
 * @return [start, end) of the first occurrence at or after @p from
 */
[[nodiscard]] std::optional<std::pair<size_t, size_t>> find_text(const RunMap& map,
                                                                 std::string_view needle,
                                                                 size_t from = 0);

// ============================================================================
// Tree helpers
// ============================================================================

/// Pre-order walk over every element below (and including) @p root
void for_each_element(tinyxml2::XMLElement* root,
                      const std::function<void(tinyxml2::XMLElement*)>& fn);

/// Elements named @p name, in document order
[[nodiscard]] std::vector<tinyxml2::XMLElement*> elements_named(tinyxml2::XMLElement* root,
                                                                std::string_view name);

/// Closest ancestor named @p name, or nullptr
[[nodiscard]] tinyxml2::XMLElement* nearest_ancestor(tinyxml2::XMLElement* element,
                                                     std::string_view name);

/// True when the element sits inside a w:sdt tagged "Redacted"
[[nodiscard]] bool inside_redaction_marker(const tinyxml2::XMLElement* element);

/// Text of the w:t leaves of one run
[[nodiscard]] std::string run_text(const tinyxml2::XMLElement* run);

/// Leaf text, empty for leaves with no text node
[[nodiscard]] std::string leaf_text(const tinyxml2::XMLElement* leaf);

/// Replace a leaf's text, marking xml:space="preserve" when it has edge spaces
void set_leaf_text(tinyxml2::XMLElement* leaf, std::string_view text);

/// Serialize without adding indentation
[[nodiscard]] std::string print_xml(tinyxml2::XMLDocument& dom);

} // namespace docredact::docx
