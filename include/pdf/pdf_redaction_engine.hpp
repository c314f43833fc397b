#pragma once

#include "core/types.hpp"
#include "pdf/font_metrics.hpp"

#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <vector>

namespace docredact {

namespace pdf { class PdfDocument; }

struct PdfRedactionOptions {
    double width_factor = 0.6;
    bool strip_annotations = true;
    bool ensure_accessibility = true;
    size_t parallel_threshold = 4;
};

struct PdfRedactionOutcome {
    std::string bytes;
    std::vector<PartFailure> failures;
    size_t removed_operations = 0;
    size_t pruned_forms = 0;
    size_t pages_rewritten = 0;
};

/**
 * @brief Result of filtering one content stream
 *
 * On a tokenizer error or BT/ET imbalance, content is empty and the caller
 * keeps the original stream.
 */
struct ContentFilterResult {
    std::string content;
    size_t removed = 0;
    bool balanced = true;
    std::optional<std::string> error;

    [[nodiscard]] bool usable() const { return balanced && !error; }
};

/**
 * @brief Removes text-showing operations under redaction boxes and paints
 * opaque covers over them
 *
 * Per page: tokenize, replay the text state, drop every text-showing
 * operation whose estimated rectangle intersects a box (in strict mode the
 * text of the whole enclosing BT..ET block), check BT/ET balance, and
 * replace the page contents with `q <filtered> Q <overlay>`. Dropped
 * operations are replaced by an equivalent glyph-less advance so following
 * text keeps its position.
 */
class PdfRedactionEngine {
public:
    PdfRedactionEngine() = default;
    explicit PdfRedactionEngine(PdfRedactionOptions options) : options_(options) {}

    /**
     * @brief Redact a PDF
     * @param entities Detected entities; their text drives form pruning in strict mode
     * @param targets Resolved boxes, parallel to @p entities
     * @throws RedactionError (PARSE_ERROR) when the PDF cannot be opened
     */
    [[nodiscard]] PdfRedactionOutcome redact(std::string_view pdf_bytes,
                                             const std::vector<DetectedEntity>& entities,
                                             const std::vector<ResolvedEntity>& targets,
                                             const RedactionParams& params) const;

    /**
     * @brief Filter one content stream against page-space boxes
     *
     * Pure function over private data; safe to run on worker threads.
     * @param drop_xobjects `Do` operations naming these resources are removed
     */
    [[nodiscard]] static ContentFilterResult filter_content(const std::string& content,
                                                            const pdf::FontTable& fonts,
                                                            const std::vector<Rect>& boxes,
                                                            bool strict,
                                                            double width_factor,
                                                            const std::set<std::string>& drop_xobjects = {});

    /// `q 0 0 0 rg x y w h re f Q` per box
    [[nodiscard]] static std::string overlay(const std::vector<Rect>& boxes);

    /// Remove annotations, outlines, optional content, forms, search indices, actions
    static void strip_hidden_structures(pdf::PdfDocument& pdf, bool strip_annotations);

    /// Add a minimal structure tree, MarkInfo, Lang and DisplayDocTitle when missing
    static void ensure_accessibility(pdf::PdfDocument& pdf);

private:
    PdfRedactionOptions options_;
};

} // namespace docredact
