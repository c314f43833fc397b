#include "core/pipeline.hpp"
#include "core/file_type.hpp"
#include "core/utils.hpp"
#include "config/config_loader.hpp"
#include "rules/template_loader.hpp"
#include "storage/local_file_storage.hpp"
#include "verify/verification_oracle.hpp"

#include <filesystem>
#include <format>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

using namespace docredact;

namespace {

constexpr int kExitOk = 0;
constexpr int kExitError = 1;
constexpr int kExitManualReview = 2;
constexpr int kExitVerificationFailed = 3;

void print_usage() {
    std::cerr <<
        "Usage:\n"
        "  docredact redact <config.toml> <template> <input> <output>\n"
        "  docredact verify <input> <text>...\n"
        "  docredact enrich <template.toml>\n"
        "\n"
        "Exit codes: 0 success, 2 manual review required, 3 verification failure, 1 other errors\n";
}

// Storage rooted at the file's directory, plus the name inside it
std::pair<LocalFileStorage, std::string> storage_for(const std::string& path) {
    const std::filesystem::path p(path);
    const auto parent = p.parent_path();
    return {LocalFileStorage(parent.empty() ? std::filesystem::path(".") : parent),
            p.filename().string()};
}

void log_remaining(const std::vector<RemainingFragment>& remaining) {
    for (const auto& fragment : remaining) {
        utils::log::error(std::format("  remaining text {} at {}",
            utils::sha256_hex(fragment.text).substr(0, 16), fragment.location));
    }
}

int cmd_redact(const std::vector<std::string>& args) {
    if (args.size() != 4) {
        print_usage();
        return kExitError;
    }
    const auto& config_file = args[0];
    const auto& template_file = args[1];
    const auto& input = args[2];
    const auto& output = args[3];

    utils::log::info(std::format("[1/3] Loading configuration from {}", config_file));
    const auto config_result = ConfigLoader::load_from_file(config_file);
    if (!config_result.success) {
        utils::log::error(std::format("Configuration error: {}", config_result.error_message));
        return kExitError;
    }
    const auto& config = config_result.config;
    if (const auto level = utils::log::parse_level(config.logging.level)) {
        utils::log::set_level(*level);
    }

    // Template problems surface before the document is touched
    utils::log::info(std::format("[2/3] Loading template from {}", template_file));
    const auto template_result = TemplateLoader::load_from_file(template_file);
    if (!template_result.success) {
        utils::log::error(std::format("Template error: {}", template_result.error_message));
        return kExitError;
    }

    utils::log::info(std::format("[3/3] Redacting {} -> {}", input, output));
    RedactionPipeline pipeline(config, RedactionPipeline::make_suggestion_provider(config.suggestions));
    LocalFileStorage storage(config.storage.root);

    try {
        const auto result = pipeline.process(storage, input, output, template_result.template_);
        const auto& report = result.outcome.report;
        std::cout << result.report_url << '\n';

        if (report.requires_manual_review) {
            utils::log::warn(std::format("Manual review required: {}", report.manual_review_reason));
            return kExitManualReview;
        }
        std::cout << result.output_url << '\n';
        utils::log::info(std::format("Done: {} entities redacted in {} attempts",
                                     report.total_entities, report.attempts));
        return kExitOk;
    } catch (const VerificationError& e) {
        utils::log::error(std::format("Verification failed: {}", e.what()));
        log_remaining(e.remaining());
        return kExitVerificationFailed;
    }
}

int cmd_verify(const std::vector<std::string>& args) {
    if (args.size() < 2) {
        print_usage();
        return kExitError;
    }

    auto [storage, name] = storage_for(args[0]);
    const auto bytes = storage.fetch(name);
    if (bytes.is_error()) {
        utils::log::error(bytes.error_message());
        return kExitError;
    }

    const auto format = detect_format(bytes.value());
    if (format == DocumentFormat::UNKNOWN) {
        utils::log::error(std::format("{} is neither PDF nor DOCX", args[0]));
        return kExitError;
    }

    const std::vector<std::string> sensitive(args.begin() + 1, args.end());
    const auto result = VerificationOracle{}.verify(bytes.value(), format, sensitive);
    if (result.success) {
        std::cout << "clean\n";
        return kExitOk;
    }

    std::cout << std::format("{} texts remain\n", result.remaining.size());
    for (const auto& fragment : result.remaining) {
        std::cout << std::format("  {}\n", fragment.location);
    }
    return kExitVerificationFailed;
}

int cmd_enrich(const std::vector<std::string>& args) {
    if (args.size() != 1) {
        print_usage();
        return kExitError;
    }

    auto [storage, name] = storage_for(args[0]);
    const auto content = storage.fetch(name);
    if (content.is_error()) {
        utils::log::error(content.error_message());
        return kExitError;
    }

    auto parsed = TemplateLoader::parse(content.value(), TemplateSyntax::TOML);
    if (parsed.is_error()) {
        utils::log::error(std::format("Template error: {}", parsed.error_message()));
        return kExitError;
    }

    auto& tmpl = parsed.value();
    const size_t added = TemplateLoader::enrich_checksums(tmpl);
    if (added == 0) {
        utils::log::info("No checksums were missing");
        return kExitOk;
    }

    const auto stored = storage.store(name, TemplateLoader::to_toml(tmpl));
    if (stored.is_error()) {
        utils::log::error(stored.error_message());
        return kExitError;
    }
    utils::log::info(std::format("Added {} checksums to {}", added, args[0]));
    return kExitOk;
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    if (argc < 2) {
        print_usage();
        return kExitError;
    }

    const std::string command = argv[1];
    const std::vector<std::string> args(argv + 2, argv + argc);

    try {
        if (command == "redact") return cmd_redact(args);
        if (command == "verify") return cmd_verify(args);
        if (command == "enrich") return cmd_enrich(args);
    } catch (const std::exception& e) {
        utils::log::error(std::format("Fatal: {}", e.what()));
        return kExitError;
    }

    print_usage();
    return kExitError;
}
