#pragma once

#include "core/types.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace docredact {

/**
 * @brief Structural comparison of an original document and its redacted
 * output. Informational only.
 */
struct ThoroughnessReport {
    size_t original_units = 0;      // pages or parts
    size_t redacted_units = 0;
    size_t original_size = 0;       // decoded content bytes
    size_t redacted_size = 0;
    std::vector<std::string> findings;

    [[nodiscard]] bool clean() const { return findings.empty(); }
};

class ThoroughnessAuditor {
public:
    [[nodiscard]] ThoroughnessReport audit(std::string_view original,
                                           std::string_view redacted,
                                           DocumentFormat format) const;

private:
    static void audit_pdf(std::string_view original, std::string_view redacted, ThoroughnessReport& report);
    static void audit_docx(std::string_view original, std::string_view redacted, ThoroughnessReport& report);
};

} // namespace docredact
