#pragma once

#include <mediafetch/downloader/downloader.hpp>

#include <cstddef>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace mediafetch::downloader {

/**
 * Assembles decrypted chunks into one output file.
 *
 * Writes go to a per-job "<destination>.part.<pid>.<n>", preallocated to the manifest's total
 * size, each at its chunk's offset under a per-file mutex. finalize() renames the staging file over the
 * destination only when every chunk has been written. A Reassembler that is destroyed without
 * a successful finalize() removes its staging file, so no truncated destination ever appears.
 */
class Reassembler {
public:
    static Result<std::unique_ptr<Reassembler>> open(const Manifest& manifest,
                                                     const std::filesystem::path& destination,
                                                     bool fsync = true);

    ~Reassembler();

    Reassembler(const Reassembler&) = delete;
    Reassembler& operator=(const Reassembler&) = delete;

    // Idempotent per index. ChunkSizeMismatch if plaintext.size() != range.length.
    Result<void> writeChunk(std::uint32_t index, ByteSpan plaintext);

    [[nodiscard]] bool isComplete() const;
    [[nodiscard]] std::size_t completedCount() const;
    [[nodiscard]] std::uint64_t bytesWritten() const;

    /**
     * Flush, optionally verify SHA-256 of the staged bytes, and atomically rename into the
     * destination. On any failure the staging file is discarded.
     */
    Result<void> finalize(IIntegrityVerifier* verifier = nullptr,
                          const std::optional<std::string>& expectedSha256 = std::nullopt);

    // Close and remove the staging file. Safe to call more than once.
    void discard() noexcept;

    [[nodiscard]] const std::filesystem::path& stagingPath() const noexcept { return staging_; }
    [[nodiscard]] const std::filesystem::path& destination() const noexcept {
        return destination_;
    }

private:
    Reassembler(std::vector<ByteRange> ranges, std::filesystem::path destination,
                std::filesystem::path staging, int fd, bool fsync);

    Result<std::string> hashStagedLocked(IIntegrityVerifier& verifier);
    void closeLocked() noexcept;

    std::vector<ByteRange> ranges_; // by chunk index
    std::filesystem::path destination_;
    std::filesystem::path staging_;
    int fd_{-1};
    bool fsync_{true};

    mutable std::mutex mutex_;
    std::vector<bool> completed_;
    std::size_t completedCount_{0};
    std::uint64_t bytesWritten_{0};
    bool finalized_{false};
    bool discarded_{false};
};

} // namespace mediafetch::downloader
