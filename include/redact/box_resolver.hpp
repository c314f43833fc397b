#pragma once

#include "core/types.hpp"

#include <vector>

namespace docredact {

/**
 * @brief Maps entity character spans onto page rectangles
 *
 * Every fragment overlapping [char_start, char_end) contributes the part
 * of its rectangle covering the overlapping characters (per-character
 * width = fragment width / fragment length). Contributions on the same page
 * are united into one box.
 */
class RedactionBoxResolver {
public:
    struct Options {
        // Applied when a fragment has no measured size
        double default_char_width = 6.0;
        double default_height = 14.0;
    };

    RedactionBoxResolver() = default;
    explicit RedactionBoxResolver(Options options) : options_(options) {}

    [[nodiscard]] ResolvedEntity resolve(const DetectedEntity& entity, const PositionIndex& positions) const;

    /**
     * @brief Resolve every entity and record page/geometry on it
     *
     * Entities keep their order; the returned vector is parallel to
     * @p entities.
     */
    [[nodiscard]] std::vector<ResolvedEntity> resolve_all(std::vector<DetectedEntity>& entities,
                                                          const PositionIndex& positions) const;

    /**
     * @brief Region of @p fragment covered by [start, end) (absolute offsets)
     */
    [[nodiscard]] Rect sub_fragment(const TextFragment& fragment, size_t start, size_t end) const;

    [[nodiscard]] static Rect pad(const Rect& box, const Padding& padding) {
        return box.padded(padding.x, padding.y);
    }

private:
    Options options_;
};

} // namespace docredact
