#pragma once

#include "core/geometry.hpp"
#include "pdf/content_stream.hpp"
#include "pdf/font_metrics.hpp"

#include <functional>
#include <string>
#include <vector>

namespace docredact::pdf {

/**
 * @brief Graphics-state parameters saved and restored by q/Q
 *
 * The text state parameters (Tc, Tw, Tz, TL, Tf, Ts) belong to the
 * graphics state and survive ET.
 */
struct GraphicsParams {
    Matrix ctm;
    std::string font;           // resource name, e.g. "/F1"
    double font_size = 0.0;
    double char_spacing = 0.0;
    double word_spacing = 0.0;
    double horizontal_scale = 1.0;
    double leading = 0.0;
    double rise = 0.0;
};

/**
 * @brief Mutable interpreter state threaded through one content stream pass
 */
struct TextState {
    GraphicsParams gs;
    std::vector<GraphicsParams> stack;
    Matrix tm;                  // text matrix
    Matrix tlm;                 // text line matrix
    bool in_text = false;

    explicit TextState(Matrix base = Matrix::identity()) { gs.ctm = base; }
};

/**
 * @brief Geometry and text of one text-showing operation
 */
struct ShownText {
    size_t op_index = 0;
    std::string text;           // UTF-8
    Rect bounds;                // page space, axis aligned
    double start_x = 0.0;       // origin of the first glyph, page space
    double start_y = 0.0;
    double end_x = 0.0;         // origin after the last glyph, page space
    double end_y = 0.0;
    double font_size = 0.0;     // effective size in page space
    double advance = 0.0;       // text space advance of the whole operation
    double tj_adjustment = 0.0; // TJ number producing the same advance with no glyphs
};

/**
 * @brief Apply a state-changing operator (q, Q, cm, BT, ET, Tm, Td, TD,
 * T*, TL, Tf, Tc, Tw, Tz, Ts). Other operators are ignored.
 */
void apply_operation(TextState& state, const ContentOperation& op);

/**
 * @brief Estimate the rectangle of a text-showing operation and advance
 * the text matrix past it
 *
 * For ' and " the line move (and spacing update) happens first. Glyph
 * widths come from @p font; the text-space box spans the advance
 * horizontally and [rise - 0.2 size, rise + size] vertically before being
 * mapped through Tm x CTM.
 */
[[nodiscard]] ShownText show_text(TextState& state, const ContentOperation& op,
                                  const FontMetrics& font);

/**
 * @brief Replays a whole operation list
 *
 * Calls on_text for every text-showing operation and on_xobject for every
 * `Do` (with the CTM in effect). Fonts missing from the table fall back to
 * the width-factor heuristic.
 */
class ContentInterpreter {
public:
    using TextCallback = std::function<void(const ShownText&)>;
    using XObjectCallback = std::function<void(const std::string& name, const Matrix& ctm)>;

    ContentInterpreter(const FontTable& fonts, double width_factor);

    void run(const std::vector<ContentOperation>& ops,
             const Matrix& base,
             const TextCallback& on_text,
             const XObjectCallback& on_xobject = {}) const;

    [[nodiscard]] std::vector<ShownText> collect(const std::vector<ContentOperation>& ops,
                                                 const Matrix& base = Matrix::identity()) const;

private:
    const FontMetrics& font_for(const std::string& name) const;

    const FontTable& fonts_;
    FontMetrics fallback_;
};

} // namespace docredact::pdf
