#pragma once

#include "core/types.hpp"

#include <string_view>

namespace docredact {

/**
 * @brief Extracts plain text plus a position index from a document
 *
 * PDF text comes from replaying each page's content streams (and the form
 * XObjects they invoke) through the text state machine, one fragment per
 * text-showing operation with page-space geometry. DOCX text comes from the
 * w:t leaves of every text-bearing part, one fragment per run.
 *
 * Separators inserted between fragments ('\n' or ' ') belong to no
 * fragment but are counted in the offsets.
 */
class PositionIndexer {
public:
    struct Options {
        double width_factor = 0.6;
        int max_form_depth = 8;
    };

    PositionIndexer() = default;
    explicit PositionIndexer(Options options) : options_(options) {}

    /**
     * @brief Index a document
     * @throws UnsupportedFormatError for DocumentFormat::UNKNOWN
     * @throws RedactionError (PARSE_ERROR) when the container cannot be opened
     */
    [[nodiscard]] IndexedDocument index(std::string_view bytes, DocumentFormat format) const;

    [[nodiscard]] IndexedDocument index_pdf(std::string_view bytes) const;
    [[nodiscard]] IndexedDocument index_docx(std::string_view bytes) const;

private:
    Options options_;
};

} // namespace docredact
