#include "detect/llm_suggestion_provider.hpp"
#include "core/json.hpp"
#include "core/utils.hpp"
#include "detect/entity_detector.hpp"

#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wdeprecated-declarations"
#include <httplib.h>
#pragma GCC diagnostic pop

#include <format>
#include <thread>

namespace docredact {

namespace {

constexpr const char* kSystemPrompt =
    "You are a document redaction assistant. Find every piece of text in the "
    "user's document that belongs to one of the listed categories. Reply with "
    "ONLY a JSON array, no explanation, no markdown. Each element is an object "
    "{\"text\": \"<exact text as it appears in the document>\", \"category\": \"<category>\"}. "
    "Copy each text exactly, including punctuation. Reply [] when nothing matches.";

const RedactionRule* rule_for(const std::vector<RedactionRule>& hints, const std::string& category) {
    if (hints.empty()) return nullptr;
    for (const auto& rule : hints) {
        if (!category.empty() && (utils::to_lower(rule.category) == utils::to_lower(category) ||
                                  utils::to_lower(rule.id) == utils::to_lower(category))) {
            return &rule;
        }
    }
    return &hints.front();
}

} // anonymous namespace

// ============================================================================
// Construction
// ============================================================================

LlmSuggestionProvider::LlmSuggestionProvider(Config config)
    : config_(std::move(config)) {}

// ============================================================================
// Prompt and request
// ============================================================================

std::string LlmSuggestionProvider::build_prompt(const std::vector<RedactionRule>& category_hints) {
    std::string prompt = "Categories:\n";
    for (const auto& rule : category_hints) {
        prompt += std::format("- {} ({}): {}\n", rule.category, rule.name,
                              rule.ai_prompt.value_or(rule.name));
    }
    return prompt;
}

std::string LlmSuggestionProvider::build_request_body(const Config& config,
                                                      const std::string& system_prompt,
                                                      const std::string& user_prompt) {
    if (config.provider == "anthropic") {
        return std::format(
            R"({{"model":"{}","max_tokens":{},"system":"{}","messages":[{{"role":"user","content":"{}"}}]}})",
            utils::escape_json(config.model), config.max_tokens,
            utils::escape_json(system_prompt),
            utils::escape_json(user_prompt));
    }
    return std::format(
        R"({{"model":"{}","temperature":0,"max_tokens":{},"messages":[{{"role":"system","content":"{}"}},{{"role":"user","content":"{}"}}]}})",
        utils::escape_json(config.model), config.max_tokens,
        utils::escape_json(system_prompt),
        utils::escape_json(user_prompt));
}

// ============================================================================
// Response parsing
// ============================================================================

Result<std::string> LlmSuggestionProvider::extract_content(const std::string& body,
                                                           const std::string& provider) {
    JsonValue root;
    try {
        root = JsonValue::parse(body);
    } catch (const JsonValue::parse_error& e) {
        return Result<std::string>::error(ErrorCategory::PARSE_ERROR, e.what());
    }

    JsonValue text;
    if (provider == "anthropic") {
        // {"content":[{"type":"text","text":"..."}]}
        for (const auto& block : root["content"].elements()) {
            if (block["text"].is_string()) {
                text = block["text"];
                break;
            }
        }
    } else {
        // {"choices":[{"message":{"content":"..."}}]}
        text = root["choices"][0]["message"]["content"];
    }

    if (!text.is_string()) {
        return Result<std::string>::error(ErrorCategory::PARSE_ERROR,
            "Response carries no text content");
    }
    return Result<std::string>::ok(text.get<std::string>());
}

Result<std::vector<DetectedEntity>> LlmSuggestionProvider::parse_suggestions(
        const std::string& content, const std::string& text,
        const std::vector<RedactionRule>& category_hints) {
    using R = Result<std::vector<DetectedEntity>>;

    const auto open = content.find('[');
    const auto close = content.rfind(']');
    if (open == std::string::npos || close == std::string::npos || close < open) {
        return R::error(ErrorCategory::PARSE_ERROR, "No JSON array in model output");
    }

    JsonValue array;
    try {
        array = JsonValue::parse(content.substr(open, close - open + 1));
    } catch (const JsonValue::parse_error& e) {
        return R::error(ErrorCategory::PARSE_ERROR, e.what());
    }
    if (!array.is_array()) {
        return R::error(ErrorCategory::PARSE_ERROR, "Model output is not an array");
    }

    std::vector<DetectedEntity> out;
    size_t dropped = 0;
    for (const auto& item : array.elements()) {
        std::string needle;
        std::string category;
        if (item.is_string()) {
            needle = item.get<std::string>();
        } else if (item.is_object()) {
            needle = item.string_or("text", "");
            category = item.string_or("category", "");
        }
        needle = utils::trim(needle);
        if (needle.empty()) continue;

        const auto* rule = rule_for(category_hints, category);
        if (!rule) continue;

        size_t pos = utils::find_icase(text, needle);
        if (pos == std::string::npos) {
            ++dropped;
            continue;
        }
        while (pos != std::string::npos) {
            out.push_back(EntityDetector::make_entity(*rule, text.substr(pos, needle.size()),
                                                      pos, pos + needle.size(),
                                                      EntitySource::SUGGESTION));
            pos = utils::find_icase(text, needle, pos + needle.size());
        }
    }

    if (dropped > 0) {
        utils::log::debug(std::format("{} suggestions not found in document text", dropped));
    }
    return R::ok(std::move(out));
}

// ============================================================================
// API call
// ============================================================================

Result<std::string> LlmSuggestionProvider::call_api(const std::string& system_prompt,
                                                    const std::string& user_prompt) {
    api_calls_.fetch_add(1, std::memory_order_relaxed);

    if (config_.api_key.empty()) {
        api_errors_.fetch_add(1, std::memory_order_relaxed);
        return Result<std::string>::error(ErrorCategory::CONFIG_ERROR, "No API key configured");
    }
    if (config_.endpoint.empty()) {
        api_errors_.fetch_add(1, std::memory_order_relaxed);
        return Result<std::string>::error(ErrorCategory::CONFIG_ERROR, "No endpoint configured");
    }

    const auto json_body = build_request_body(config_, system_prompt, user_prompt);

    httplib::Client cli(config_.endpoint);
    cli.set_connection_timeout(std::chrono::milliseconds(config_.timeout_ms));
    cli.set_read_timeout(std::chrono::milliseconds(config_.timeout_ms));

    httplib::Headers headers;
    std::string path;
    if (config_.provider == "anthropic") {
        headers = {
            {"x-api-key", config_.api_key},
            {"anthropic-version", "2023-06-01"},
        };
        path = "/v1/messages";
    } else {
        headers = {
            {"Authorization", "Bearer " + config_.api_key},
        };
        path = "/v1/chat/completions";
    }

    for (uint32_t attempt = 0; attempt <= config_.max_retries; ++attempt) {
        const auto res = cli.Post(path, headers, json_body, "application/json");

        if (!res) {
            if (attempt < config_.max_retries) continue;
            api_errors_.fetch_add(1, std::memory_order_relaxed);
            return Result<std::string>::error(ErrorCategory::IO_ERROR,
                std::format("HTTP request failed: {}", httplib::to_string(res.error())));
        }

        if (res->status == httplib::StatusCode::TooManyRequests_429 && attempt < config_.max_retries) {
            std::this_thread::sleep_for(std::chrono::milliseconds(1000 * (attempt + 1)));
            continue;
        }

        if (res->status != httplib::StatusCode::OK_200) {
            api_errors_.fetch_add(1, std::memory_order_relaxed);
            return Result<std::string>::error(ErrorCategory::IO_ERROR,
                std::format("API error: HTTP {}", res->status));
        }

        auto content = extract_content(res->body, config_.provider);
        if (content.is_error()) api_errors_.fetch_add(1, std::memory_order_relaxed);
        return content;
    }

    api_errors_.fetch_add(1, std::memory_order_relaxed);
    return Result<std::string>::error(ErrorCategory::IO_ERROR, "Max retries exceeded");
}

Result<std::vector<DetectedEntity>> LlmSuggestionProvider::suggest(
        const std::string& text, const std::vector<RedactionRule>& category_hints) {
    using R = Result<std::vector<DetectedEntity>>;
    if (category_hints.empty() || text.empty()) return R::ok({});

    const auto user_prompt = std::format("{}\nDocument:\n{}", build_prompt(category_hints), text);
    utils::Timer timer;
    auto content = call_api(kSystemPrompt, user_prompt);
    if (content.is_error()) {
        utils::log::warn(std::format("Suggestion request failed: {}", content.error_message()));
        return R::error(content.error_category(), content.error_message());
    }

    auto entities = parse_suggestions(content.value(), text, category_hints);
    if (entities.is_ok()) {
        utils::log::info(std::format("Suggestion provider returned {} entities in {}ms",
                                     entities.value().size(), timer.elapsed_ms().count()));
    }
    return entities;
}

LlmSuggestionProvider::Stats LlmSuggestionProvider::get_stats() const {
    return {
        api_calls_.load(std::memory_order_relaxed),
        api_errors_.load(std::memory_order_relaxed)
    };
}

} // namespace docredact
