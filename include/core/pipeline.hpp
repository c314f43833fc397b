#pragma once

#include "config/config_loader.hpp"
#include "core/types.hpp"
#include "detect/suggestion_provider.hpp"

#include <chrono>
#include <memory>
#include <string>
#include <vector>

namespace docredact {

class IStorage;

struct RedactionRequest {
    std::string bytes;
    RedactionTemplate template_;
    std::string document_id;
    std::string user_id;
};

/**
 * @brief Result of one pipeline run
 *
 * On a manual-review outcome bytes are the untouched input and redacted is
 * false.
 */
struct RedactionOutcome {
    std::string bytes;
    RedactionReport report;
    bool redacted = false;

    [[nodiscard]] bool requires_manual_review() const { return report.requires_manual_review; }
};

struct ProcessResult {
    RedactionOutcome outcome;
    std::string output_url;     // empty when nothing was redacted
    std::string report_url;
};

/**
 * @brief Pipeline coordinator - orchestrates the redaction flow
 *
 * Stages:
 * 1. Format detection (magic bytes)
 * 2. Position indexing
 * 3. Entity detection (+ optional suggestions)
 * 4. Box resolution (PDF)
 * 5. Redact, sanitize metadata, verify; at most two attempts, the second one strict
 * 6. Thoroughness audit, report
 *
 * Every attempt starts from the original bytes. A caller deadline is
 * checked between stages.
 */
class RedactionPipeline {
public:
    explicit RedactionPipeline(EngineConfig config,
                               std::shared_ptr<ISuggestionProvider> suggestions = nullptr);

    /**
     * @brief Run the pipeline on in-memory bytes
     * @throws TemplateValidationError before touching the document
     * @throws UnsupportedFormatError, RedactionError (PARSE_ERROR)
     * @throws VerificationError when text survives the last attempt
     * @throws DeadlineExceededError
     */
    [[nodiscard]] RedactionOutcome run(const RedactionRequest& request) const;

    /**
     * @brief Fetch, run, store the redacted document and `<output>.report.json`
     *
     * The template is validated before the fetch. Manual-review outcomes
     * store only the report.
     * @throws RedactionError (IO_ERROR) on storage failures, plus everything run() throws
     */
    [[nodiscard]] ProcessResult process(IStorage& storage,
                                        const std::string& input_path,
                                        const std::string& output_path,
                                        const RedactionTemplate& tmpl,
                                        const std::string& user_id = {}) const;

    /// Parameters for attempt @p attempt (1-based); attempts after the first are strict
    [[nodiscard]] RedactionParams params_for(int attempt) const;

    /// Attempts actually allowed (configured value capped to 1..2)
    [[nodiscard]] int max_attempts() const;

    /// Suggestion provider from config, or nullptr when disabled
    [[nodiscard]] static std::shared_ptr<ISuggestionProvider> make_suggestion_provider(
        const SuggestionConfig& config);

    [[nodiscard]] const EngineConfig& config() const { return config_; }

private:
    struct AttemptResult {
        std::string bytes;
        std::vector<PartFailure> failures;
    };

    [[nodiscard]] std::vector<DetectedEntity> detect_entities(const IndexedDocument& doc,
                                                              const RedactionTemplate& tmpl) const;

    [[nodiscard]] AttemptResult redact_once(DocumentFormat format,
                                            std::string_view bytes,
                                            const std::vector<DetectedEntity>& entities,
                                            const std::vector<ResolvedEntity>& resolved,
                                            const RedactionParams& params) const;

    [[nodiscard]] RedactionOutcome manual_review(const RedactionRequest& request,
                                                 DocumentFormat format,
                                                 std::string reason) const;

    EngineConfig config_;
    std::shared_ptr<ISuggestionProvider> suggestions_;
};

} // namespace docredact
