/*
 * mediafetch/src/ledger/ledger_codec.cpp
 *
 * JSON <-> LedgerSnapshot.
 *
 * Current document shape:
 * {
 *   "schema_version": 1,
 *   "last_updated": "2026-01-01T10:00:00.000000+00:00",
 *   "settings": { "dedup_enabled": true },
 *   "tracks": {
 *     "<itemId>": { "sourceType": "playlist", "sourceId": "pl-1", "sourceName": "Mix",
 *                   "downloadDate": "2026-01-01T10:00:00.000000+00:00" }
 *   }
 * }
 *
 * Legacy shapes still accepted on read (and flagged so the caller re-saves them):
 * - entries stored directly at the document root instead of under "tracks"
 * - "_schema_version" / "_last_updated" metadata keys
 * - "settings.preventDuplicates" instead of "settings.dedup_enabled"
 * - no "settings" object at all
 */

#include <mediafetch/core/timestamp.h>
#include <mediafetch/ledger/ledger.hpp>

#include <nlohmann/json.hpp>

#include <array>
#include <string>

namespace mediafetch::ledger {

using nlohmann::json;

namespace {

constexpr std::array<std::string_view, 6> kReservedKeys = {
    "settings", "tracks", "schema_version", "last_updated", "exported_at", "total_entries"};

bool isReservedKey(std::string_view key) {
    if (!key.empty() && key.front() == '_')
        return true;
    for (auto reserved : kReservedKeys) {
        if (key == reserved)
            return true;
    }
    return false;
}

std::optional<std::string> optionalString(const json& entry, const char* key) {
    auto it = entry.find(key);
    if (it == entry.end() || !it->is_string())
        return std::nullopt;
    return it->get<std::string>();
}

Result<LedgerEntry> decodeEntry(const std::string& itemId, const json& value) {
    if (!value.is_object()) {
        return Error{ErrorCode::ValidationError, "Invalid entry format for item " + itemId};
    }
    auto type = value.find("sourceType");
    auto date = value.find("downloadDate");
    if (type == value.end() || date == value.end() || !type->is_string() || !date->is_string()) {
        return Error{ErrorCode::ValidationError, "Missing required fields for item " + itemId};
    }
    auto completedAt = parseIso8601(date->get_ref<const std::string&>());
    if (!completedAt) {
        return Error{ErrorCode::ValidationError,
                     "Unparsable downloadDate for item " + itemId + ": " + date->get<std::string>()};
    }

    const auto item = makeItemFromTag(itemId, type->get_ref<const std::string&>(),
                                      optionalString(value, "sourceId"),
                                      optionalString(value, "sourceName"));
    LedgerEntry entry;
    entry.itemId = item.itemId;
    entry.sourceKind = item.sourceKind;
    entry.sourceSubtype = item.sourceSubtype;
    entry.sourceId = item.sourceId;
    entry.sourceLabel = item.sourceLabel;
    entry.completedAt = *completedAt;
    return entry;
}

json encodeEntry(const LedgerEntry& entry) {
    json out = json::object();
    out["sourceType"] = entry.sourceTag();
    out["sourceId"] = entry.sourceId ? json(*entry.sourceId) : json(nullptr);
    out["sourceName"] = entry.sourceLabel ? json(*entry.sourceLabel) : json(nullptr);
    out["downloadDate"] = formatIso8601(entry.completedAt);
    return out;
}

} // namespace

Result<DecodeResult> decodeSnapshot(std::string_view text, EntryPolicy policy) {
    json root;
    try {
        root = json::parse(text.begin(), text.end());
    } catch (const json::parse_error& e) {
        return Error{ErrorCode::CorruptedData, std::string("Invalid JSON: ") + e.what()};
    }
    if (!root.is_object()) {
        return Error{ErrorCode::CorruptedData, "Invalid ledger format: expected JSON object"};
    }

    DecodeResult out;
    auto& snap = out.snapshot;

    if (root.contains("_schema_version") || root.contains("_last_updated"))
        out.legacy = true;

    if (auto it = root.find("schema_version"); it != root.end() && it->is_number_integer()) {
        snap.schemaVersion = it->get<int>();
    }
    for (const char* key : {"last_updated", "_last_updated"}) {
        if (auto it = root.find(key); it != root.end() && it->is_string()) {
            snap.lastUpdated = parseIso8601(it->get_ref<const std::string&>());
            break;
        }
    }

    auto settings = root.find("settings");
    if (settings != root.end() && settings->is_object()) {
        if (auto it = settings->find("dedup_enabled"); it != settings->end() && it->is_boolean()) {
            snap.settings.dedupEnabled = it->get<bool>();
            out.hasDedupSetting = true;
        } else if (auto legacyIt = settings->find("preventDuplicates");
                   legacyIt != settings->end() && legacyIt->is_boolean()) {
            snap.settings.dedupEnabled = legacyIt->get<bool>();
            out.hasDedupSetting = true;
            out.legacy = true;
        }
    } else {
        out.legacy = true;
    }

    auto tracks = root.find("tracks");
    if (tracks != root.end() && tracks->is_object()) {
        for (const auto& [itemId, value] : tracks->items()) {
            auto entry = decodeEntry(itemId, value);
            if (!entry) {
                if (policy == EntryPolicy::Strict)
                    return entry.error();
                out.rejected.push_back(entry.error().message);
                continue;
            }
            snap.entries[itemId] = std::move(entry).value();
        }
    } else {
        out.legacy = true;
    }

    // Root-level entries: the pre-"tracks" layout, or strays left next to it.
    for (const auto& [key, value] : root.items()) {
        if (isReservedKey(key))
            continue;
        out.legacy = true;
        auto entry = decodeEntry(key, value);
        if (!entry) {
            if (policy == EntryPolicy::Strict)
                return entry.error();
            out.rejected.push_back(entry.error().message);
            continue;
        }
        // An entry already under "tracks" is authoritative.
        snap.entries.try_emplace(key, std::move(entry).value());
    }

    if (out.legacy)
        snap.schemaVersion = kSchemaVersion;
    return out;
}

std::string encodeSnapshot(const LedgerSnapshot& snapshot,
                           const std::map<std::string, std::string>& extraStrings,
                           const std::map<std::string, std::size_t>& extraCounts) {
    json root = json::object();
    root["schema_version"] = snapshot.schemaVersion;
    if (snapshot.lastUpdated)
        root["last_updated"] = formatIso8601(*snapshot.lastUpdated);
    root["settings"] = json{{"dedup_enabled", snapshot.settings.dedupEnabled}};

    json tracks = json::object();
    for (const auto& [itemId, entry] : snapshot.entries) {
        tracks[itemId] = encodeEntry(entry);
    }
    root["tracks"] = std::move(tracks);

    for (const auto& [k, v] : extraStrings)
        root[k] = v;
    for (const auto& [k, v] : extraCounts)
        root[k] = v;

    return root.dump(2, ' ', false, json::error_handler_t::replace);
}

} // namespace mediafetch::ledger
