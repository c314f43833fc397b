#pragma once

#include "core/types.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace docredact {

/**
 * @brief Text recovered from a finished artifact, with where it was found
 */
struct ExtractedText {
    std::string text;
    std::optional<int> page;
    std::string location;
};

/**
 * @brief Independent re-extraction gate
 *
 * Shares no decoding code with the indexer. PDF page text comes from qpdf's
 * content-stream parser, decoded through each font's ToUnicode map and also
 * taken as raw string bytes, descending into form XObjects. Every stream is
 * also inflated directly with zlib, and every string object in the file is
 * read. DOCX text comes from every text node, the accepted (w:t only) view
 * of WordprocessingML parts and the raw markup of every XML part.
 *
 * Containment is literal and case-insensitive after collapsing whitespace
 * runs to a single space.
 */
class VerificationOracle {
public:
    explicit VerificationOracle(size_t min_length = 3) : min_length_(min_length) {}

    [[nodiscard]] VerificationResult verify(std::string_view bytes,
                                            DocumentFormat format,
                                            const std::vector<std::string>& sensitive_texts) const;

    [[nodiscard]] static std::vector<ExtractedText> extract(std::string_view bytes, DocumentFormat format);
    [[nodiscard]] static std::vector<ExtractedText> extract_pdf(std::string_view bytes);
    [[nodiscard]] static std::vector<ExtractedText> extract_docx(std::string_view bytes);

    /**
     * @brief Texts that must not survive: every entity text, plus for PDF
     * entities spanning several fragments the piece inside each fragment
     *
     * Duplicates (case-insensitive) are dropped.
     */
    [[nodiscard]] static std::vector<std::string> sensitive_texts(const std::vector<DetectedEntity>& entities,
                                                                  const PositionIndex& positions);

    /// Collapse whitespace runs to one space and trim
    [[nodiscard]] static std::string squeeze(std::string_view text);

    /// zlib/gzip inflate; nullopt when the data is not deflate-compressed
    [[nodiscard]] static std::optional<std::string> inflate(std::string_view data);

    [[nodiscard]] size_t min_length() const { return min_length_; }

private:
    size_t min_length_;
};

} // namespace docredact
