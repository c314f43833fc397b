#pragma once

#include "core/types.hpp"

#include <chrono>
#include <optional>
#include <string>
#include <string_view>

namespace docredact {

namespace docx { class OoxmlPackage; }
namespace pdf { class PdfDocument; }

/**
 * @brief Clears identifying document metadata and resets timestamps
 *
 * PDF: the Info dictionary gets neutral /Producer and /Creator values,
 * "[REDACTED]" for /Author, /Title, /Subject and /Keywords, fresh
 * /CreationDate and /ModDate; the catalog /Metadata XMP stream is removed.
 * Running it twice with the same clock gives the same document.
 *
 * DOCX: core, extended (app) and custom document properties.
 */
class MetadataSanitizer {
public:
    static constexpr std::string_view kNeutralProducer = "docredact";
    static constexpr std::string_view kNeutralCreator = "docredact";
    static constexpr std::string_view kRedactedValue = "[REDACTED]";

    MetadataSanitizer() = default;

    /// Pin the clock, used for the reset timestamps
    explicit MetadataSanitizer(std::chrono::system_clock::time_point fixed_now)
        : fixed_now_(fixed_now) {}

    /**
     * @brief Sanitize a whole document
     * @throws RedactionError (PARSE_ERROR) when the container cannot be read,
     *         UnsupportedFormatError for UNKNOWN
     */
    [[nodiscard]] std::string sanitize(std::string_view bytes, DocumentFormat format) const;

    /// Sanitize an open PDF in place
    void sanitize_pdf(pdf::PdfDocument& pdf) const;

    /**
     * @brief Sanitize the property parts of an open package in place
     * @return Number of property parts rewritten
     */
    size_t sanitize_docx(docx::OoxmlPackage& package) const;

private:
    [[nodiscard]] std::chrono::system_clock::time_point now() const;

    std::optional<std::chrono::system_clock::time_point> fixed_now_;
};

} // namespace docredact
