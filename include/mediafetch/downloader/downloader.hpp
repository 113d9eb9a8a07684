#pragma once

/*
 * mediafetch downloader - public types and collaborator interfaces (C++20)
 *
 * This header defines the data types and abstract interfaces of the chunked
 * download-decrypt-reassemble pipeline. It contains no implementation details.
 *
 * Design principles:
 * - A manifest describes an item as ordered, independently addressable chunks
 * - Chunks are fetched in parallel, decrypted independently, written at their offsets
 * - The destination only ever appears complete (staging file + atomic rename)
 * - Clear separation of concerns (transport, retry, decryption, integrity, reassembly)
 */

#include <mediafetch/core/item.h>
#include <mediafetch/core/types.h>

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace mediafetch::downloader {

// ===================
// Small data objects
// ===================

/**
 * Plaintext byte range of a chunk within the assembled output.
 */
struct ByteRange {
    std::uint64_t offset{0};
    std::uint64_t length{0};
};

/**
 * Where a chunk is fetched from. With useRangeHeader the request carries
 * "Range: bytes=<offset>-<offset+length-1>" against a shared resource.
 */
struct ChunkLocator {
    std::string url;
    bool useRangeHeader{false};
};

struct ChunkDescriptor {
    std::uint32_t index{0};
    ByteRange range{};
    ChunkLocator locator{};
};

/**
 * How chunk ciphertext maps to plaintext.
 */
enum class CipherScheme {
    None,
    // One AES-CTR keystream over the whole stream; counter = 8-byte nonce || 64-bit BE block
    // counter (or a 16-byte IV used as the full initial counter block).
    AesCtrStream,
    // Each chunk is an independent CBC message with the manifest IV.
    AesCbcSharedIv,
    // Each chunk is an independent CBC message; IV = 128-bit BE chunk index.
    AesCbcIndexIv
};

const char* cipherSchemeToString(CipherScheme scheme);
std::optional<CipherScheme> cipherSchemeFromString(std::string_view name);

struct KeyMaterial {
    CipherScheme scheme{CipherScheme::None};
    ByteVector key;
    ByteVector iv;
};

/**
 * Ordered chunk list and decryption parameters for one item. Never mutated by the core.
 */
struct Manifest {
    std::vector<ChunkDescriptor> chunks;
    KeyMaterial keys{};
    std::uint64_t totalSize{0};
    std::optional<std::string> sha256; // lower-case hex of the assembled plaintext
};

/**
 * Structural validation: non-empty, indices exactly 0..n-1, ranges contiguous from 0 in
 * index order summing to totalSize, non-empty URLs. Violations return ManifestInvalid.
 */
Result<void> validateManifest(const Manifest& manifest);

/**
 * Retry/backoff policy.
 */
struct RetryPolicy {
    int maxAttempts{5};
    std::chrono::milliseconds initialBackoff{500};
    double multiplier{2.0};
    std::chrono::milliseconds maxBackoff{15000};
    double jitter{0.2}; // +/- fraction applied to each delay
};

/**
 * HTTP header key/value pair.
 */
struct Header {
    std::string name;
    std::string value;
};

/**
 * TLS configuration.
 */
struct TlsConfig {
    bool insecure{false};
    std::string caPath; // empty = system default
};

struct TransportConfig {
    TlsConfig tls{};
    std::optional<std::string> proxy;
    std::string userAgent{"mediafetch/1.0"};
    std::vector<Header> headers;
    bool followRedirects{true};
};

/**
 * Downloader default configuration.
 */
struct DownloaderConfig {
    std::size_t concurrency{8};
    std::chrono::milliseconds attemptTimeout{60000};
    RetryPolicy retry{};
    TransportConfig transport{};
    bool skipExistingFile{true};
    bool fsync{true};
    std::size_t eventCapacity{4096};
};

// ===================
// Callback signatures
// ===================

using ShouldCancel = std::function<bool()>; // return true to cancel ASAP

// ==========================
// Collaborator interfaces
// ==========================

/**
 * One HTTP GET per call (ranged when the locator asks for it).
 * Implementations classify failures into Timeout, NetworkError, RateLimited, ServerError,
 * Unauthorized, NotFound, HttpError, TlsVerificationFailed or OperationCancelled.
 */
class IChunkTransport {
public:
    virtual ~IChunkTransport() = default;

    virtual Result<ByteVector> fetch(const ChunkLocator& locator, const ByteRange& range,
                                     std::chrono::milliseconds timeout,
                                     const ShouldCancel& shouldCancel) = 0;
};

/**
 * Per-chunk decryption. Must be callable concurrently from worker threads.
 */
class IStreamDecryptor {
public:
    virtual ~IStreamDecryptor() = default;

    virtual Result<ByteVector> decrypt(ByteSpan ciphertext, const KeyMaterial& keys,
                                       const ChunkDescriptor& chunk) const = 0;
};

/**
 * Integrity verifier interface (streaming SHA-256).
 */
class IIntegrityVerifier {
public:
    virtual ~IIntegrityVerifier() = default;
    virtual void reset() = 0;
    virtual Result<void> update(ByteSpan data) = 0;
    virtual Result<std::string> finalize() = 0; // lower-case hex digest
};

/**
 * Supplies the manifest for an item (external collaborator).
 */
class IManifestResolver {
public:
    virtual ~IManifestResolver() = default;
    virtual Result<Manifest> resolve(const Item& item) = 0;
};

// ==========
// Factories
// ==========

std::unique_ptr<IChunkTransport> makeCurlChunkTransport(const TransportConfig& config);
std::unique_ptr<IStreamDecryptor> makeOpenSslStreamDecryptor();
std::unique_ptr<IIntegrityVerifier> makeSha256Verifier();

} // namespace mediafetch::downloader
