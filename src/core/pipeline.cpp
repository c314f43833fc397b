#include "core/pipeline.hpp"
#include "core/file_type.hpp"
#include "core/utils.hpp"
#include "detect/entity_detector.hpp"
#include "detect/llm_suggestion_provider.hpp"
#include "docx/docx_redaction_engine.hpp"
#include "extract/position_indexer.hpp"
#include "pdf/pdf_redaction_engine.hpp"
#include "redact/box_resolver.hpp"
#include "report/report_builder.hpp"
#include "rules/template_loader.hpp"
#include "sanitize/metadata_sanitizer.hpp"
#include "storage/istorage.hpp"
#include "verify/thoroughness_auditor.hpp"
#include "verify/verification_oracle.hpp"

#include <algorithm>
#include <format>

namespace docredact {

namespace {

class Deadline {
public:
    explicit Deadline(uint32_t budget_ms)
        : budget_(budget_ms), start_(std::chrono::steady_clock::now()) {}

    void check(const char* stage) const {
        if (budget_.count() == 0) return;
        const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start_);
        if (elapsed > budget_) {
            throw DeadlineExceededError(std::format(
                "Deadline of {}ms exceeded after {} ({}ms elapsed)",
                budget_.count(), stage, elapsed.count()));
        }
    }

private:
    std::chrono::milliseconds budget_;
    std::chrono::steady_clock::time_point start_;
};

std::vector<RedactionRule> suggestion_hints(const RedactionTemplate& tmpl) {
    std::vector<RedactionRule> hints;
    for (const auto& rule : tmpl.rules) {
        if (rule.ai_prompt) hints.push_back(rule);
    }
    return hints;
}

} // anonymous namespace

// ============================================================================
// Construction
// ============================================================================

RedactionPipeline::RedactionPipeline(EngineConfig config,
                                     std::shared_ptr<ISuggestionProvider> suggestions)
    : config_(std::move(config)), suggestions_(std::move(suggestions)) {}

std::shared_ptr<ISuggestionProvider> RedactionPipeline::make_suggestion_provider(
        const SuggestionConfig& config) {
    if (!config.enabled) return nullptr;

    LlmSuggestionProvider::Config llm;
    llm.provider = config.provider;
    llm.endpoint = config.endpoint;
    llm.api_key = config.api_key;
    llm.model = config.model;
    llm.timeout_ms = config.timeout_ms;
    llm.max_retries = config.max_retries;
    return std::make_shared<LlmSuggestionProvider>(std::move(llm));
}

int RedactionPipeline::max_attempts() const {
    return std::clamp(config_.redaction.max_attempts, 1, 2);
}

RedactionParams RedactionPipeline::params_for(int attempt) const {
    RedactionParams params;
    params.attempt = attempt;
    params.padding = config_.redaction.padding;
    params.strict = attempt > 1;
    if (params.strict) {
        params.padding.x *= config_.redaction.strict_padding_factor;
        params.padding.y *= config_.redaction.strict_padding_factor;
    }
    return params;
}

// ============================================================================
// Stages
// ============================================================================

std::vector<DetectedEntity> RedactionPipeline::detect_entities(const IndexedDocument& doc,
                                                               const RedactionTemplate& tmpl) const {
    auto entities = EntityDetector::detect(doc.text, tmpl.rules);
    utils::log::debug(std::format("Rules matched {} entities", entities.size()));

    const auto hints = suggestion_hints(tmpl);
    if (suggestions_ && !hints.empty()) {
        auto suggested = suggestions_->suggest(doc.text, hints);
        if (suggested.is_ok()) {
            const size_t before = entities.size();
            entities = EntityDetector::merge(std::move(entities), suggested.value());
            utils::log::info(std::format("Suggestions added {} entities",
                                         entities.size() >= before ? entities.size() - before : 0));
        } else {
            utils::log::warn(std::format("Continuing without suggestions: {}",
                                         suggested.error_message()));
        }
    }

    if (entities.empty()) {
        throw NoMatchesError(std::format("No entities matched template '{}'", tmpl.id));
    }
    return entities;
}

RedactionPipeline::AttemptResult RedactionPipeline::redact_once(
        DocumentFormat format, std::string_view bytes,
        const std::vector<DetectedEntity>& entities,
        const std::vector<ResolvedEntity>& resolved,
        const RedactionParams& params) const {
    AttemptResult result;

    switch (format) {
        case DocumentFormat::PDF: {
            PdfRedactionOptions options;
            options.width_factor = config_.pdf.width_factor;
            options.strip_annotations = config_.pdf.strip_annotations;
            options.ensure_accessibility = config_.pdf.ensure_accessibility;
            options.parallel_threshold = config_.redaction.parallel_threshold;

            auto outcome = PdfRedactionEngine(options).redact(bytes, entities, resolved, params);
            utils::log::info(std::format(
                "Attempt {}: {} pages rewritten, {} text operations removed, {} forms pruned",
                params.attempt, outcome.pages_rewritten, outcome.removed_operations,
                outcome.pruned_forms));
            result.bytes = std::move(outcome.bytes);
            result.failures = std::move(outcome.failures);
            break;
        }
        case DocumentFormat::DOCX: {
            DocxRedactionOptions options;
            options.strip_macros = config_.docx.strip_macros;
            options.neutralize_external_links = config_.docx.neutralize_external_links;
            options.parallel_threshold = config_.redaction.parallel_threshold;

            auto outcome = DocxRedactionEngine(options).redact(bytes, entities, params);
            utils::log::info(std::format("Attempt {}: {} markers, {} runs replaced",
                                         params.attempt, outcome.markers, outcome.replaced_runs));
            result.bytes = std::move(outcome.bytes);
            result.failures = std::move(outcome.failures);
            break;
        }
        case DocumentFormat::UNKNOWN:
            throw UnsupportedFormatError("Cannot redact a document of unknown format");
    }
    return result;
}

RedactionOutcome RedactionPipeline::manual_review(const RedactionRequest& request,
                                                  DocumentFormat format,
                                                  std::string reason) const {
    utils::log::warn(std::format("Document {} needs manual review: {}", request.document_id, reason));

    RedactionOutcome outcome;
    outcome.bytes = request.bytes;
    outcome.redacted = false;
    outcome.report = ReportBuilder::build({}, {}, request.document_id, request.template_.id, format);
    outcome.report.user_id = request.user_id;
    outcome.report.requires_manual_review = true;
    outcome.report.manual_review_reason = std::move(reason);
    outcome.report.content_hash = utils::sha256_hex(request.bytes);
    return outcome;
}

// ============================================================================
// Run
// ============================================================================

RedactionOutcome RedactionPipeline::run(const RedactionRequest& request) const {
    if (const auto error = TemplateLoader::validate(request.template_)) {
        throw TemplateValidationError(*error);
    }

    const Deadline deadline(config_.redaction.deadline_ms);
    utils::Timer timer;

    // Stage 1: format
    const auto format = detect_format(request.bytes);
    if (format == DocumentFormat::UNKNOWN) {
        throw UnsupportedFormatError(std::format(
            "Document {} is neither PDF nor DOCX ({} bytes)", request.document_id, request.bytes.size()));
    }
    utils::log::info(std::format("Redacting {} ({}, {} bytes) with template '{}'",
        request.document_id, format_to_string(format), request.bytes.size(), request.template_.id));

    // Stage 2: index
    PositionIndexer::Options index_options;
    index_options.width_factor = config_.pdf.width_factor;
    const auto doc = PositionIndexer(index_options).index(request.bytes, format);
    deadline.check("indexing");

    if (doc.positions.empty() || doc.meaningful_chars() == 0) {
        return manual_review(request, format,
            "No extractable text; the document may be scanned or image-only");
    }
    utils::log::debug(std::format("Indexed {} fragments, {} characters",
                                  doc.positions.size(), doc.text.size()));

    // Stage 3: detect
    std::vector<DetectedEntity> entities;
    try {
        entities = detect_entities(doc, request.template_);
    } catch (const NoMatchesError& e) {
        return manual_review(request, format, e.what());
    }
    deadline.check("detection");

    // Stage 4: resolve
    std::vector<ResolvedEntity> resolved;
    if (format == DocumentFormat::PDF) {
        RedactionBoxResolver::Options resolver_options;
        resolver_options.default_char_width = config_.redaction.default_fragment_width;
        resolver_options.default_height = config_.redaction.default_fragment_height;
        resolved = RedactionBoxResolver(resolver_options).resolve_all(entities, doc.positions);

        const auto unresolved = std::count_if(resolved.begin(), resolved.end(),
            [](const ResolvedEntity& r) { return !r.position_found; });
        if (unresolved > 0) {
            utils::log::warn(std::format("{} of {} entities have no position; visual coverage unproven",
                                         unresolved, resolved.size()));
        }
    }

    // Stage 5: redact, sanitize, verify. The oracle sees exactly the bytes
    // that are returned.
    const VerificationOracle oracle(config_.redaction.min_verification_length);
    const MetadataSanitizer sanitizer;
    const auto sensitive = VerificationOracle::sensitive_texts(entities, doc.positions);

    AttemptResult attempt;
    VerificationResult verification;
    int attempts = 0;
    for (int n = 1; n <= max_attempts(); ++n) {
        attempts = n;
        const auto params = params_for(n);
        attempt = redact_once(format, request.bytes, entities, resolved, params);
        deadline.check("redaction");

        attempt.bytes = sanitizer.sanitize(attempt.bytes, format);
        deadline.check("sanitization");

        verification = oracle.verify(attempt.bytes, format, sensitive);
        deadline.check("verification");

        if (verification.success && attempt.failures.empty()) break;

        utils::log::warn(std::format("Attempt {} incomplete: {} texts remain, {} parts failed",
                                     n, verification.remaining.size(), attempt.failures.size()));
    }

    if (!verification.success) {
        utils::log::error(std::format("Verification failed for {} after {} attempts",
                                      request.document_id, attempts));
        throw VerificationError(
            std::format("{} sensitive texts remain after {} attempts",
                        verification.remaining.size(), attempts),
            verification.remaining);
    }

    // Stage 6: audit, report
    auto final_bytes = std::move(attempt.bytes);

    const auto audit = ThoroughnessAuditor{}.audit(request.bytes, final_bytes, format);

    RedactionOutcome outcome;
    outcome.redacted = true;
    outcome.report = ReportBuilder::build(entities, resolved, request.document_id,
                                          request.template_.id, format);
    auto& report = outcome.report;
    report.user_id = request.user_id;
    report.attempts = attempts;
    report.verification_passed = true;
    report.failures = std::move(attempt.failures);
    report.audit_findings = audit.findings;
    report.content_hash = utils::sha256_hex(final_bytes);
    if (!report.unresolved_entities.empty()) {
        report.requires_manual_review = true;
        report.manual_review_reason = std::format(
            "{} entities could not be located on the page; visual coverage unproven",
            report.unresolved_entities.size());
    }
    outcome.bytes = std::move(final_bytes);

    utils::log::info(std::format("Redacted {}: {} entities, {} attempts, {}ms",
        request.document_id, report.total_entities, attempts, timer.elapsed_ms().count()));
    return outcome;
}

// ============================================================================
// Storage round trip
// ============================================================================

ProcessResult RedactionPipeline::process(IStorage& storage,
                                         const std::string& input_path,
                                         const std::string& output_path,
                                         const RedactionTemplate& tmpl,
                                         const std::string& user_id) const {
    if (const auto error = TemplateLoader::validate(tmpl)) {
        throw TemplateValidationError(*error);
    }

    auto fetched = storage.fetch(input_path);
    if (fetched.is_error()) {
        throw RedactionError(fetched.error_category(), fetched.error_message());
    }

    RedactionRequest request;
    request.bytes = std::move(fetched.value());
    request.template_ = tmpl;
    request.document_id = input_path;
    request.user_id = user_id;

    ProcessResult result;
    result.outcome = run(request);

    if (result.outcome.redacted) {
        auto stored = storage.store(output_path, result.outcome.bytes);
        if (stored.is_error()) {
            throw RedactionError(stored.error_category(), stored.error_message());
        }
        result.output_url = std::move(stored.value());
    }

    auto report = storage.store(output_path + ".report.json",
                                ReportBuilder::to_json(result.outcome.report));
    if (report.is_error()) {
        throw RedactionError(report.error_category(), report.error_message());
    }
    result.report_url = std::move(report.value());
    return result;
}

} // namespace docredact
