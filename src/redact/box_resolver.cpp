#include "redact/box_resolver.hpp"
#include "core/utils.hpp"

#include <algorithm>
#include <format>
#include <map>

namespace docredact {

Rect RedactionBoxResolver::sub_fragment(const TextFragment& fragment, size_t start, size_t end) const {
    const size_t from = std::max(start, fragment.char_offset) - fragment.char_offset;
    const size_t to = std::min(end, fragment.end()) - fragment.char_offset;

    const std::string_view text(fragment.text);
    const size_t total = std::max<size_t>(utils::utf8_length(text), 1);
    const size_t before = utils::utf8_length(text.substr(0, from));
    const size_t covered = utils::utf8_length(text.substr(from, to - from));

    double width = fragment.width;
    double height = fragment.height;
    if (width <= 0.0) width = static_cast<double>(total) * options_.default_char_width;
    if (height <= 0.0) height = options_.default_height;

    const double char_width = width / static_cast<double>(total);
    const double x1 = fragment.x + char_width * static_cast<double>(before);
    return Rect::from_xywh(x1, fragment.y, char_width * static_cast<double>(covered), height);
}

ResolvedEntity RedactionBoxResolver::resolve(const DetectedEntity& entity,
                                             const PositionIndex& positions) const {
    ResolvedEntity resolved;
    std::map<int, Rect> by_page;

    // Fragments are sorted by offset; stop once past the span
    for (const auto& fragment : positions.fragments) {
        if (fragment.char_offset >= entity.char_end) break;
        if (fragment.end() <= entity.char_start) continue;
        if (!fragment.has_geometry) continue;

        const auto region = sub_fragment(fragment, entity.char_start, entity.char_end);
        const auto [it, inserted] = by_page.try_emplace(fragment.page, region);
        if (!inserted) it->second = it->second.united(region);
    }

    for (const auto& [page, rect] : by_page) {
        resolved.boxes.push_back({page, rect});
    }
    resolved.position_found = !resolved.boxes.empty();
    return resolved;
}

std::vector<ResolvedEntity> RedactionBoxResolver::resolve_all(std::vector<DetectedEntity>& entities,
                                                              const PositionIndex& positions) const {
    std::vector<ResolvedEntity> out;
    out.reserve(entities.size());

    size_t unresolved = 0;
    for (size_t i = 0; i < entities.size(); ++i) {
        auto resolved = resolve(entities[i], positions);
        resolved.entity_index = i;
        if (resolved.position_found) {
            entities[i].page = resolved.boxes.front().page;
            entities[i].geometry = resolved.boxes.front().rect;
        } else {
            ++unresolved;
        }
        out.push_back(std::move(resolved));
    }

    if (unresolved > 0) {
        utils::log::warn(std::format("{} of {} entities have no resolvable geometry",
            unresolved, entities.size()));
    }
    return out;
}

} // namespace docredact
