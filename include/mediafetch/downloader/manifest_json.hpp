#pragma once

#include <mediafetch/downloader/downloader.hpp>

#include <filesystem>
#include <optional>
#include <string_view>

namespace mediafetch::downloader {

/**
 * A manifest file as written by an upstream resolver: the manifest plus, when present, the
 * item it describes ("item" object).
 */
struct ManifestDocument {
    Manifest manifest;
    std::optional<Item> item;
};

/**
 * Parse a manifest document. Chunks without an "offset" are laid out as prefix sums of their
 * lengths in index order; "totalSize" defaults to the sum of lengths. Malformed documents
 * return ManifestInvalid. The result is not validated; see validateManifest().
 */
Result<ManifestDocument> parseManifestDocument(std::string_view text);
Result<ManifestDocument> loadManifestDocument(const std::filesystem::path& file);

/**
 * IManifestResolver reading manifests from disk: "<dir>/<itemId>.json" when constructed
 * with a directory, or one fixed file otherwise.
 */
class JsonManifestResolver final : public IManifestResolver {
public:
    explicit JsonManifestResolver(std::filesystem::path location);

    Result<Manifest> resolve(const Item& item) override;

private:
    std::filesystem::path location_;
};

} // namespace mediafetch::downloader
