#pragma once

#include "detect/suggestion_provider.hpp"

#include <atomic>
#include <cstdint>
#include <string>
#include <vector>

namespace docredact {

/**
 * @brief Suggestion provider backed by a hosted language model
 *
 * Speaks the Anthropic Messages API or the OpenAI chat completions API via
 * httplib::Client. The model is asked for a JSON array of
 * {"text", "category"} objects; every returned string is located
 * case-insensitively in the document text and each occurrence becomes an
 * entity. Strings that do not occur are dropped.
 */
class LlmSuggestionProvider : public ISuggestionProvider {
public:
    struct Config {
        std::string provider = "anthropic";     // anthropic | openai
        std::string endpoint = "https://api.anthropic.com";
        std::string api_key;
        std::string model = "claude-sonnet";
        uint32_t timeout_ms = 30000;
        uint32_t max_retries = 1;
        int max_tokens = 2048;
    };

    explicit LlmSuggestionProvider(Config config);

    [[nodiscard]] Result<std::vector<DetectedEntity>> suggest(
        const std::string& text, const std::vector<RedactionRule>& category_hints) override;

    // ===== Exposed for testing =====

    [[nodiscard]] static std::string build_prompt(const std::vector<RedactionRule>& category_hints);

    [[nodiscard]] static std::string build_request_body(const Config& config,
                                                        const std::string& system_prompt,
                                                        const std::string& user_prompt);

    /// Model output text from an API response body
    [[nodiscard]] static Result<std::string> extract_content(const std::string& body,
                                                             const std::string& provider);

    /**
     * @brief Turn the model's JSON array into located entities
     *
     * Tolerates prose or code fences around the array. A suggestion is
     * attributed to the hint rule whose category (or id) it names, else the
     * first hint.
     */
    [[nodiscard]] static Result<std::vector<DetectedEntity>> parse_suggestions(
        const std::string& content, const std::string& text,
        const std::vector<RedactionRule>& category_hints);

    struct Stats {
        uint64_t api_calls = 0;
        uint64_t api_errors = 0;
    };

    [[nodiscard]] Stats get_stats() const;

private:
    [[nodiscard]] Result<std::string> call_api(const std::string& system_prompt,
                                               const std::string& user_prompt);

    Config config_;

    std::atomic<uint64_t> api_calls_{0};
    std::atomic<uint64_t> api_errors_{0};
};

} // namespace docredact
