#include <mediafetch/downloader/downloader.hpp>

#include <algorithm>
#include <string>
#include <vector>

namespace mediafetch::downloader {

const char* cipherSchemeToString(CipherScheme scheme) {
    switch (scheme) {
        case CipherScheme::None:
            return "none";
        case CipherScheme::AesCtrStream:
            return "aes-ctr";
        case CipherScheme::AesCbcSharedIv:
            return "aes-cbc";
        case CipherScheme::AesCbcIndexIv:
            return "aes-cbc-index";
    }
    return "none";
}

std::optional<CipherScheme> cipherSchemeFromString(std::string_view name) {
    if (name == "none" || name.empty())
        return CipherScheme::None;
    if (name == "aes-ctr")
        return CipherScheme::AesCtrStream;
    if (name == "aes-cbc")
        return CipherScheme::AesCbcSharedIv;
    if (name == "aes-cbc-index")
        return CipherScheme::AesCbcIndexIv;
    return std::nullopt;
}

Result<void> validateManifest(const Manifest& manifest) {
    if (manifest.chunks.empty()) {
        return Error{ErrorCode::ManifestInvalid, "Manifest has no chunks"};
    }

    std::vector<const ChunkDescriptor*> ordered;
    ordered.reserve(manifest.chunks.size());
    for (const auto& c : manifest.chunks)
        ordered.push_back(&c);
    std::sort(ordered.begin(), ordered.end(),
              [](const ChunkDescriptor* a, const ChunkDescriptor* b) { return a->index < b->index; });

    std::uint64_t expectedOffset = 0;
    for (std::size_t i = 0; i < ordered.size(); ++i) {
        const auto& c = *ordered[i];
        if (c.index != i) {
            return Error{ErrorCode::ManifestInvalid,
                         "Chunk indices must be exactly 0.." +
                             std::to_string(ordered.size() - 1) + " (found " +
                             std::to_string(c.index) + " at position " + std::to_string(i) + ")"};
        }
        if (c.locator.url.empty()) {
            return Error{ErrorCode::ManifestInvalid,
                         "Chunk " + std::to_string(c.index) + " has an empty URL"};
        }
        if (c.range.offset != expectedOffset) {
            return Error{ErrorCode::ManifestInvalid,
                         "Chunk " + std::to_string(c.index) + " starts at " +
                             std::to_string(c.range.offset) + ", expected " +
                             std::to_string(expectedOffset)};
        }
        expectedOffset += c.range.length;
    }
    if (expectedOffset != manifest.totalSize) {
        return Error{ErrorCode::ManifestInvalid, "Chunk lengths sum to " +
                                                     std::to_string(expectedOffset) +
                                                     " but totalSize is " +
                                                     std::to_string(manifest.totalSize)};
    }
    return {};
}

} // namespace mediafetch::downloader
