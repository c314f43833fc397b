#pragma once

#include "core/types.hpp"

#include <string>
#include <vector>

namespace docredact {

/**
 * @brief Aggregates detected entities into a RedactionReport and
 * serializes it
 *
 * Entity text never enters the report, only its SHA-256 hash.
 */
class ReportBuilder {
public:
    /**
     * @brief Build the entity section of a report
     *
     * @param resolved Box resolution per entity (PDF). Empty for DOCX, where
     *        every entity counts as positioned.
     *
     * Run-level fields (attempts, verification, content hash, failures) are
     * left for the caller.
     */
    [[nodiscard]] static RedactionReport build(const std::vector<DetectedEntity>& entities,
                                               const std::vector<ResolvedEntity>& resolved,
                                               const std::string& document_id,
                                               const std::string& template_id,
                                               DocumentFormat format = DocumentFormat::UNKNOWN);

    [[nodiscard]] static std::string to_json(const RedactionReport& report);

    /// Page key used in counts_by_page
    [[nodiscard]] static std::string page_key(const std::optional<int>& page);
};

} // namespace docredact
