#include "pdf/text_state.hpp"

#include <cmath>
#include <cstdlib>

namespace docredact::pdf {

namespace {

// TJ adjustments at or beyond this many thousandths of an em read as a space
constexpr double kTjSpaceThreshold = -250.0;

Matrix matrix_from(const ContentOperation& op) {
    return {op.number(0), op.number(1), op.number(2),
            op.number(3), op.number(4), op.number(5)};
}

void next_line(TextState& state, double tx, double ty) {
    state.tlm = Matrix::translate(tx, ty) * state.tlm;
    state.tm = state.tlm;
}

// Advance of one string operand in unscaled text space units
double string_advance(const TextState& state, const FontMetrics& font,
                      const std::string& bytes, std::string& text) {
    const auto& gs = state.gs;
    double advance = 0.0;
    for (const auto code : font.codes(bytes)) {
        double tx = font.glyph_width(code) / 1000.0 * gs.font_size + gs.char_spacing;
        // Word spacing applies to single-byte code 32 only
        if (!font.two_byte() && code == 32) tx += gs.word_spacing;
        advance += tx * gs.horizontal_scale;
        text += font.decode_code(code);
    }
    return advance;
}

} // anonymous namespace

// ============================================================================
// State operators
// ============================================================================

void apply_operation(TextState& state, const ContentOperation& op) {
    const auto& o = op.op;
    auto& gs = state.gs;

    if (o == "q") {
        state.stack.push_back(gs);
    } else if (o == "Q") {
        // Unbalanced Q is tolerated; the state simply stays
        if (!state.stack.empty()) {
            gs = std::move(state.stack.back());
            state.stack.pop_back();
        }
    } else if (o == "cm" && op.operand_count() >= 6) {
        gs.ctm = matrix_from(op) * gs.ctm;
    } else if (o == "BT") {
        state.in_text = true;
        state.tm = Matrix::identity();
        state.tlm = Matrix::identity();
    } else if (o == "ET") {
        state.in_text = false;
    } else if (o == "Tm" && op.operand_count() >= 6) {
        state.tlm = matrix_from(op);
        state.tm = state.tlm;
    } else if (o == "Td" && op.operand_count() >= 2) {
        next_line(state, op.number(0), op.number(1));
    } else if (o == "TD" && op.operand_count() >= 2) {
        gs.leading = -op.number(1);
        next_line(state, op.number(0), op.number(1));
    } else if (o == "T*") {
        next_line(state, 0.0, -gs.leading);
    } else if (o == "TL") {
        gs.leading = op.number(0);
    } else if (o == "Tf" && op.operand_count() >= 2) {
        gs.font = op.name(0);
        gs.font_size = op.number(1);
    } else if (o == "Tc") {
        gs.char_spacing = op.number(0);
    } else if (o == "Tw") {
        gs.word_spacing = op.number(0);
    } else if (o == "Tz") {
        gs.horizontal_scale = op.number(0) / 100.0;
    } else if (o == "Ts") {
        gs.rise = op.number(0);
    }
}

// ============================================================================
// Text showing
// ============================================================================

ShownText show_text(TextState& state, const ContentOperation& op, const FontMetrics& font) {
    auto& gs = state.gs;

    if (op.op == "'") {
        next_line(state, 0.0, -gs.leading);
    } else if (op.op == "\"") {
        gs.word_spacing = op.number(0);
        gs.char_spacing = op.number(1);
        next_line(state, 0.0, -gs.leading);
    }

    ShownText shown;
    double advance = 0.0;

    if (op.op == "TJ") {
        for (const auto& operand : op.operands) {
            const auto type = operand.getType();
            if (type == QPDFTokenizer::tt_string) {
                advance += string_advance(state, font, operand.getValue(), shown.text);
            } else if (type == QPDFTokenizer::tt_integer || type == QPDFTokenizer::tt_real) {
                const double n = std::strtod(operand.getValue().c_str(), nullptr);
                advance -= n / 1000.0 * gs.font_size * gs.horizontal_scale;
                if (n <= kTjSpaceThreshold && !shown.text.empty() && shown.text.back() != ' ') {
                    shown.text += ' ';
                }
            }
        }
    } else {
        // Tj and ' carry the string first; " carries it third
        const size_t index = op.op == "\"" ? 2 : 0;
        advance = string_advance(state, font, op.string(index), shown.text);
    }

    const Matrix trm = state.tm * gs.ctm;
    const double size = std::abs(gs.font_size);
    const Rect text_box = Rect::normalized(0.0, gs.rise - 0.2 * size, advance, gs.rise + size);

    shown.bounds = trm.transform(text_box);
    shown.advance = advance;
    const double scale = gs.font_size * gs.horizontal_scale;
    if (scale != 0.0) shown.tj_adjustment = -advance * 1000.0 / scale;
    trm.apply(0.0, gs.rise, shown.start_x, shown.start_y);
    trm.apply(advance, gs.rise, shown.end_x, shown.end_y);
    shown.font_size = size * std::sqrt(trm.c * trm.c + trm.d * trm.d);

    state.tm = Matrix::translate(advance, 0.0) * state.tm;
    return shown;
}

// ============================================================================
// ContentInterpreter
// ============================================================================

ContentInterpreter::ContentInterpreter(const FontTable& fonts, double width_factor)
    : fonts_(fonts), fallback_(width_factor) {}

const FontMetrics& ContentInterpreter::font_for(const std::string& name) const {
    const auto it = fonts_.find(name);
    return it != fonts_.end() ? it->second : fallback_;
}

void ContentInterpreter::run(const std::vector<ContentOperation>& ops,
                             const Matrix& base,
                             const TextCallback& on_text,
                             const XObjectCallback& on_xobject) const {
    TextState state(base);
    for (size_t i = 0; i < ops.size(); ++i) {
        const auto& op = ops[i];
        if (op.is_text_show()) {
            auto shown = show_text(state, op, font_for(state.gs.font));
            shown.op_index = i;
            if (on_text) on_text(shown);
        } else if (op.op == "Do") {
            if (on_xobject) on_xobject(op.name(0), state.gs.ctm);
        } else {
            apply_operation(state, op);
        }
    }
}

std::vector<ShownText> ContentInterpreter::collect(const std::vector<ContentOperation>& ops,
                                                   const Matrix& base) const {
    std::vector<ShownText> out;
    run(ops, base, [&out](const ShownText& shown) { out.push_back(shown); });
    return out;
}

} // namespace docredact::pdf
