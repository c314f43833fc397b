#include "pdf/content_stream.hpp"

#include <qpdf/BufferInputSource.hh>

#include <charconv>
#include <format>
#include <memory>

namespace docredact::pdf {

namespace {

double parse_number(std::string_view sv) {
    if (!sv.empty() && sv.front() == '+') sv.remove_prefix(1);
    double value = 0.0;
    const auto [ptr, ec] = std::from_chars(sv.data(), sv.data() + sv.size(), value);
    return ec == std::errc{} ? value : 0.0;
}

QPDFTokenizer::token_type_e classify_raw(const std::string& raw) {
    if (raw.empty()) return QPDFTokenizer::tt_word;
    const char c = raw.front();
    if (c == '[') return QPDFTokenizer::tt_array_open;
    if (c == ']') return QPDFTokenizer::tt_array_close;
    if (c == '/') return QPDFTokenizer::tt_name;
    if ((c >= '0' && c <= '9') || c == '-' || c == '+' || c == '.') return QPDFTokenizer::tt_real;
    return QPDFTokenizer::tt_word;
}

} // anonymous namespace

// ============================================================================
// ContentOperation accessors
// ============================================================================

double ContentOperation::number(size_t i) const {
    if (i >= operands.size()) return 0.0;
    const auto type = operands[i].getType();
    if (type != QPDFTokenizer::tt_integer && type != QPDFTokenizer::tt_real) return 0.0;
    return parse_number(operands[i].getValue());
}

std::string ContentOperation::string(size_t i) const {
    if (i >= operands.size()) return {};
    if (operands[i].getType() != QPDFTokenizer::tt_string) return {};
    return operands[i].getValue();
}

std::string ContentOperation::name(size_t i) const {
    if (i >= operands.size()) return {};
    if (operands[i].getType() != QPDFTokenizer::tt_name) return {};
    return operands[i].getValue();
}

// ============================================================================
// Tokenizer
// ============================================================================

Result<std::vector<ContentOperation>> tokenize(std::string_view content) {
    using Ops = std::vector<ContentOperation>;

    auto input = std::make_shared<BufferInputSource>("content stream", std::string(content));
    QPDFTokenizer tokenizer;
    tokenizer.allowEOF();

    Ops ops;
    ContentOperation current;

    for (;;) {
        auto token = tokenizer.readToken(input, "content stream", true);
        const auto type = token.getType();

        if (type == QPDFTokenizer::tt_eof) break;
        if (type == QPDFTokenizer::tt_space || type == QPDFTokenizer::tt_comment) continue;
        if (type == QPDFTokenizer::tt_bad) {
            return Result<Ops>::error(ErrorCategory::PARSE_ERROR,
                std::format("Malformed token at offset {}: {}",
                            input->getLastOffset(), token.getErrorMessage()));
        }

        if (type != QPDFTokenizer::tt_word) {
            current.operands.push_back(std::move(token));
            continue;
        }

        current.op = token.getValue();
        if (current.op == "ID") {
            tokenizer.expectInlineImage(input);
            auto image = tokenizer.readToken(input, "content stream", true);
            if (image.getType() != QPDFTokenizer::tt_inline_image) {
                return Result<Ops>::error(ErrorCategory::PARSE_ERROR,
                    std::format("Unterminated inline image at offset {}", input->getLastOffset()));
            }
            current.inline_image = image.getRawValue();
        }
        ops.push_back(std::move(current));
        current = ContentOperation{};
    }

    return Result<Ops>::ok(std::move(ops));
}

// ============================================================================
// Serializer
// ============================================================================

std::string serialize(const std::vector<ContentOperation>& ops) {
    std::string out;
    out.reserve(ops.size() * 24);

    for (const auto& op : ops) {
        for (const auto& operand : op.operands) {
            out += operand.getRawValue();
            out += ' ';
        }
        out += op.op;
        // Inline image data already carries its leading delimiter and the EI
        out += op.inline_image;
        out += '\n';
    }
    return out;
}

ContentOperation make_operation(std::string op, const std::vector<std::string>& raw_operands) {
    ContentOperation result;
    result.op = std::move(op);
    result.operands.reserve(raw_operands.size());
    for (const auto& raw : raw_operands) {
        result.operands.emplace_back(classify_raw(raw), raw);
    }
    return result;
}

size_t count_operator(const std::vector<ContentOperation>& ops, std::string_view op) {
    size_t n = 0;
    for (const auto& o : ops) {
        if (o.op == op) ++n;
    }
    return n;
}

} // namespace docredact::pdf
