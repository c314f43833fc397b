#pragma once

#include "core/types.hpp"

#include <string_view>

namespace docredact {

// ZIP archives smaller than this cannot hold a minimal WordprocessingML package
inline constexpr size_t kMinDocxSize = 2000;
inline constexpr size_t kMinSignatureSize = 8;

/**
 * @brief Infer the document format from magic bytes
 *
 * `%PDF-` is PDF. A ZIP local-file header (`PK\x03\x04`) is DOCX only when
 * the archive is larger than kMinDocxSize. Anything else is UNKNOWN.
 */
[[nodiscard]] inline DocumentFormat detect_format(std::string_view bytes) {
    if (bytes.size() < kMinSignatureSize) return DocumentFormat::UNKNOWN;
    if (bytes.substr(0, 5) == "%PDF-") return DocumentFormat::PDF;
    if (bytes.substr(0, 4) == std::string_view("PK\x03\x04", 4) && bytes.size() > kMinDocxSize) {
        return DocumentFormat::DOCX;
    }
    return DocumentFormat::UNKNOWN;
}

} // namespace docredact
