#pragma once

#include "core/utils.hpp"
#include "detect/entity_detector.hpp"
#include "detect/suggestion_provider.hpp"
#include <atomic>
#include <string>
#include <vector>

namespace docredact::testing {

/**
 * @brief Suggestion provider returning fixed strings, located in the text
 * like a real provider would
 */
class MockSuggestionProvider : public ISuggestionProvider {
public:
    explicit MockSuggestionProvider(std::vector<std::string> suggestions = {},
                                    bool should_succeed = true)
        : suggestions_(std::move(suggestions)), should_succeed_(should_succeed) {}

    [[nodiscard]] Result<std::vector<DetectedEntity>> suggest(
        const std::string& text, const std::vector<RedactionRule>& category_hints) override {
        call_count_.fetch_add(1, std::memory_order_relaxed);
        last_hint_count_ = category_hints.size();
        if (!should_succeed_) {
            return Result<std::vector<DetectedEntity>>::error(ErrorCategory::IO_ERROR, "Mock failure");
        }

        std::vector<DetectedEntity> out;
        if (category_hints.empty()) return Result<std::vector<DetectedEntity>>::ok(out);
        for (const auto& needle : suggestions_) {
            size_t pos = utils::find_icase(text, needle);
            while (pos != std::string::npos) {
                out.push_back(EntityDetector::make_entity(category_hints.front(),
                    text.substr(pos, needle.size()), pos, pos + needle.size(),
                    EntitySource::SUGGESTION));
                pos = utils::find_icase(text, needle, pos + needle.size());
            }
        }
        return Result<std::vector<DetectedEntity>>::ok(std::move(out));
    }

    [[nodiscard]] uint64_t call_count() const { return call_count_.load(std::memory_order_relaxed); }
    [[nodiscard]] size_t last_hint_count() const { return last_hint_count_; }

private:
    std::vector<std::string> suggestions_;
    bool should_succeed_;
    size_t last_hint_count_ = 0;
    std::atomic<uint64_t> call_count_{0};
};

} // namespace docredact::testing
