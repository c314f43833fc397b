#pragma once

#include "core/error.hpp"

#include <qpdf/QPDFTokenizer.hh>

#include <string>
#include <string_view>
#include <vector>

namespace docredact::pdf {

/**
 * @brief One operator with its operands, as tokenized from a content stream
 *
 * Operands keep their raw token text so reserialization reproduces them
 * byte for byte. For the inline image operator `ID`, inline_image holds the
 * raw image data through the closing `EI`.
 */
struct ContentOperation {
    std::string op;
    std::vector<QPDFTokenizer::Token> operands;
    std::string inline_image;

    [[nodiscard]] bool is_text_show() const {
        return op == "Tj" || op == "TJ" || op == "'" || op == "\"";
    }

    [[nodiscard]] size_t operand_count() const { return operands.size(); }

    // Numeric operand value; 0.0 when absent or not a number
    [[nodiscard]] double number(size_t i) const;

    // Decoded string operand bytes; empty when absent or not a string
    [[nodiscard]] std::string string(size_t i) const;

    // Name operand including the leading slash; empty when absent or not a name
    [[nodiscard]] std::string name(size_t i) const;
};

/**
 * @brief Tokenize a decoded content stream into operations
 *
 * Comments and whitespace are discarded. Operands left over at end of
 * stream without an operator are dropped.
 */
[[nodiscard]] Result<std::vector<ContentOperation>> tokenize(std::string_view content);

/**
 * @brief Serialize operations back into content stream bytes, one per line
 */
[[nodiscard]] std::string serialize(const std::vector<ContentOperation>& ops);

/**
 * @brief Build a synthetic operation from raw operand strings, e.g.
 * make_operation("Td", {"0", "-12"})
 */
[[nodiscard]] ContentOperation make_operation(std::string op, const std::vector<std::string>& raw_operands);

[[nodiscard]] size_t count_operator(const std::vector<ContentOperation>& ops, std::string_view op);

} // namespace docredact::pdf
