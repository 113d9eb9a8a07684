#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace mediafetch {

/**
 * Where a download request originated.
 */
enum class SourceKind { Manual, CollectionMember, Other };

/**
 * One downloadable unit (e.g. a track). Immutable once constructed.
 */
struct Item {
    std::string itemId;
    SourceKind sourceKind{SourceKind::Manual};
    // Finer tag kept verbatim for display and round trips: "playlist", "album", "mix", ...
    std::optional<std::string> sourceSubtype;
    std::optional<std::string> sourceId;
    std::optional<std::string> sourceLabel;
};

constexpr const char* sourceKindToString(SourceKind kind) {
    switch (kind) {
        case SourceKind::Manual: return "manual";
        case SourceKind::CollectionMember: return "collection";
        case SourceKind::Other: return "other";
    }
    return "other";
}

// Maps a persisted "sourceType" tag onto a kind. Streaming collection tags
// (playlist, album, mix) are collection members.
inline SourceKind sourceKindFromTag(std::string_view tag) {
    if (tag == "manual")
        return SourceKind::Manual;
    if (tag == "collection" || tag == "playlist" || tag == "album" || tag == "mix")
        return SourceKind::CollectionMember;
    return SourceKind::Other;
}

// The tag written to disk for an item: its subtype when present, else the kind name.
inline std::string sourceTag(SourceKind kind, const std::optional<std::string>& subtype) {
    if (subtype && !subtype->empty())
        return *subtype;
    return sourceKindToString(kind);
}

// Builds an Item from a persisted tag, keeping the tag as subtype when it is finer than the kind.
inline Item makeItemFromTag(std::string itemId, std::string_view tag,
                            std::optional<std::string> sourceId = std::nullopt,
                            std::optional<std::string> sourceLabel = std::nullopt) {
    Item item;
    item.itemId = std::move(itemId);
    item.sourceKind = sourceKindFromTag(tag);
    if (!tag.empty() && tag != sourceKindToString(item.sourceKind))
        item.sourceSubtype = std::string(tag);
    item.sourceId = std::move(sourceId);
    item.sourceLabel = std::move(sourceLabel);
    return item;
}

} // namespace mediafetch
