/*
 * mediafetch/src/downloader/manifest_json.cpp
 *
 * {
 *   "item": {"id": "111", "sourceType": "playlist", "sourceId": "pl-1", "sourceName": "Mix"},
 *   "totalSize": 40,
 *   "sha256": "<optional hex>",
 *   "encryption": {"scheme": "aes-ctr", "key": "<hex>", "iv": "<hex>"},
 *   "chunks": [{"index": 0, "url": "https://...", "offset": 0, "length": 10, "range": false}]
 * }
 */

#include <mediafetch/core/hex.h>
#include <mediafetch/downloader/manifest_json.hpp>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <fstream>
#include <sstream>
#include <vector>

namespace mediafetch::downloader {

using nlohmann::json;
namespace fs = std::filesystem;

namespace {

Error invalid(const std::string& what) {
    return Error{ErrorCode::ManifestInvalid, what};
}

std::optional<std::string> optionalString(const json& obj, const char* key) {
    auto it = obj.find(key);
    if (it == obj.end() || !it->is_string())
        return std::nullopt;
    return it->get<std::string>();
}

Result<ByteVector> hexField(const json& obj, const char* key) {
    auto it = obj.find(key);
    if (it == obj.end() || it->is_null())
        return ByteVector{};
    if (!it->is_string())
        return invalid(std::string("encryption.") + key + " must be a hex string");
    auto bytes = fromHex(it->get_ref<const std::string&>());
    if (!bytes)
        return invalid(std::string("encryption.") + key + ": " + bytes.error().message);
    return bytes;
}

Result<KeyMaterial> parseEncryption(const json& root) {
    KeyMaterial keys;
    auto enc = root.find("encryption");
    if (enc == root.end() || enc->is_null())
        return keys;
    if (!enc->is_object())
        return invalid("\"encryption\" must be an object");

    const auto schemeName = optionalString(*enc, "scheme").value_or("none");
    auto scheme = cipherSchemeFromString(schemeName);
    if (!scheme)
        return invalid("Unknown encryption scheme \"" + schemeName + "\"");
    keys.scheme = *scheme;

    auto key = hexField(*enc, "key");
    if (!key)
        return key.error();
    auto iv = hexField(*enc, "iv");
    if (!iv)
        return iv.error();
    keys.key = std::move(key).value();
    keys.iv = std::move(iv).value();
    return keys;
}

} // namespace

Result<ManifestDocument> parseManifestDocument(std::string_view text) {
    json root;
    try {
        root = json::parse(text.begin(), text.end());
    } catch (const json::parse_error& e) {
        return invalid(std::string("Invalid manifest JSON: ") + e.what());
    }
    if (!root.is_object())
        return invalid("Manifest must be a JSON object");

    ManifestDocument doc;

    if (auto it = root.find("item"); it != root.end() && it->is_object()) {
        auto id = it->find("id");
        if (id != it->end() && (id->is_string() || id->is_number_integer())) {
            const auto itemId = id->is_string() ? id->get<std::string>()
                                                : std::to_string(id->get<std::int64_t>());
            doc.item = makeItemFromTag(itemId, optionalString(*it, "sourceType").value_or("manual"),
                                       optionalString(*it, "sourceId"),
                                       optionalString(*it, "sourceName"));
        }
    }

    auto keys = parseEncryption(root);
    if (!keys)
        return keys.error();
    doc.manifest.keys = std::move(keys).value();

    auto chunks = root.find("chunks");
    if (chunks == root.end() || !chunks->is_array())
        return invalid("\"chunks\" must be an array");

    try {
        std::uint32_t position = 0;
        for (const auto& c : *chunks) {
            if (!c.is_object())
                return invalid("chunk " + std::to_string(position) + " is not an object");
            ChunkDescriptor d;
            d.index = c.value("index", position);
            d.locator.url = c.value("url", std::string{});
            d.locator.useRangeHeader = c.value("range", false);
            d.range.length = c.at("length").get<std::uint64_t>();
            d.range.offset = c.value("offset", std::uint64_t{0});
            if (!c.contains("offset"))
                d.range.offset = UINT64_MAX; // derived below
            doc.manifest.chunks.push_back(std::move(d));
            ++position;
        }
    } catch (const json::exception& e) {
        return invalid(std::string("Malformed chunk entry: ") + e.what());
    }

    // Derive missing offsets as prefix sums in index order.
    std::vector<ChunkDescriptor*> ordered;
    for (auto& c : doc.manifest.chunks)
        ordered.push_back(&c);
    std::sort(ordered.begin(), ordered.end(),
              [](const ChunkDescriptor* a, const ChunkDescriptor* b) { return a->index < b->index; });
    std::uint64_t sum = 0;
    for (auto* c : ordered) {
        if (c->range.offset == UINT64_MAX)
            c->range.offset = sum;
        sum += c->range.length;
    }

    if (auto it = root.find("totalSize"); it != root.end() && it->is_number_unsigned()) {
        doc.manifest.totalSize = it->get<std::uint64_t>();
    } else if (it != root.end() && it->is_number_integer() && it->get<std::int64_t>() >= 0) {
        doc.manifest.totalSize = static_cast<std::uint64_t>(it->get<std::int64_t>());
    } else {
        doc.manifest.totalSize = sum;
    }

    if (auto sha = optionalString(root, "sha256"); sha && !sha->empty()) {
        std::transform(sha->begin(), sha->end(), sha->begin(),
                       [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });
        doc.manifest.sha256 = std::move(*sha);
    }
    return doc;
}

Result<ManifestDocument> loadManifestDocument(const fs::path& file) {
    std::ifstream in(file, std::ios::binary);
    if (!in) {
        return Error{ErrorCode::NotFound, "Cannot open manifest " + file.string()};
    }
    std::ostringstream ss;
    ss << in.rdbuf();
    auto doc = parseManifestDocument(ss.str());
    if (!doc)
        return Error{doc.error().code, file.string() + ": " + doc.error().message};
    return doc;
}

JsonManifestResolver::JsonManifestResolver(fs::path location) : location_(std::move(location)) {}

Result<Manifest> JsonManifestResolver::resolve(const Item& item) {
    std::error_code ec;
    auto file = fs::is_directory(location_, ec) ? location_ / (item.itemId + ".json") : location_;
    spdlog::debug("Resolving manifest for {} from {}", item.itemId, file.string());
    auto doc = loadManifestDocument(file);
    if (!doc)
        return Error{ErrorCode::ResolutionFailed, doc.error().message};
    return std::move(doc).value().manifest;
}

} // namespace mediafetch::downloader
