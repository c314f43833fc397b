#pragma once

#include "core/types.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace docredact {

namespace docx { class OoxmlPackage; }

struct DocxRedactionOptions {
    bool strip_macros = true;
    bool neutralize_external_links = true;
    size_t parallel_threshold = 4;
};

struct DocxRedactionOutcome {
    std::string bytes;
    std::vector<PartFailure> failures;
    size_t replaced_runs = 0;
    size_t markers = 0;
    std::vector<std::string> removed_parts;
};

/**
 * @brief Rewrites OOXML runs that carry entity text
 *
 * Each occurrence (case-insensitive) of an entity's text in a part is
 * replaced by a tagged content control showing "[REDACTED]". Runs covering
 * the match are removed; text of the first and last run outside the match
 * survives in cloned runs with the original run properties.
 */
class DocxRedactionEngine {
public:
    static constexpr std::string_view kPlaceholder = "[REDACTED]";

    struct PartResult {
        std::string xml;
        size_t markers = 0;
        size_t replaced_runs = 0;
        std::optional<std::string> error;
    };

    DocxRedactionEngine() = default;
    explicit DocxRedactionEngine(DocxRedactionOptions options) : options_(options) {}

    /**
     * @brief Redact a DOCX package
     *
     * In strict mode every remaining XML part (other than content types,
     * relationships and document properties) also gets literal text and
     * attribute replacement.
     * @throws RedactionError (PARSE_ERROR) when the archive cannot be read,
     *         (IO_ERROR) when it cannot be rewritten
     */
    [[nodiscard]] DocxRedactionOutcome redact(std::string_view docx_bytes,
                                              const std::vector<DetectedEntity>& entities,
                                              const RedactionParams& params) const;

    /**
     * @brief Replace entity text in one WordprocessingML part
     * @param id_base First w:id assigned to markers in this part
     */
    [[nodiscard]] static PartResult redact_wordprocessing_part(const std::string& xml,
                                                               const std::vector<DetectedEntity>& entities,
                                                               int id_base);

    /// Replace entity text in every text node and attribute value
    [[nodiscard]] static PartResult redact_literal_part(const std::string& xml,
                                                        const std::vector<DetectedEntity>& entities);

    /// @return Names of the removed parts
    static std::vector<std::string> strip_macros(docx::OoxmlPackage& package);

    /// @return Number of external hyperlink targets rewritten to "#"
    static size_t neutralize_external_links(docx::OoxmlPackage& package);

private:
    DocxRedactionOptions options_;
};

} // namespace docredact
