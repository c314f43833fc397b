#pragma once

#include "core/types.hpp"

#include <string>
#include <vector>

namespace docredact {

/**
 * @brief Source of supplemental entities beyond the pattern rules
 *
 * Implementations receive the rules that carry an ai_prompt as category
 * hints and return entities located in @p text (offsets set, source
 * SUGGESTION). The pipeline treats an error as "no suggestions".
 */
class ISuggestionProvider {
public:
    virtual ~ISuggestionProvider() = default;

    [[nodiscard]] virtual Result<std::vector<DetectedEntity>> suggest(
        const std::string& text, const std::vector<RedactionRule>& category_hints) = 0;
};

} // namespace docredact
