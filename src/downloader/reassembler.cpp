/*
 * mediafetch/src/downloader/reassembler.cpp
 *
 * Reassembler:
 * - Staging file "<destination>.part.<pid>.<n>" beside the destination (same filesystem, atomic rename)
 * - Restrictive permissions for staging (0600)
 * - Preallocation: posix_fallocate where supported, ftruncate to the exact size always
 * - Finalize: fsync file, optional SHA-256 check, rename, fsync directory
 */

#include <mediafetch/core/fs_utils.h>
#include <mediafetch/downloader/reassembler.hpp>

#include <spdlog/spdlog.h>

#include <cerrno>
#include <system_error>

#include <fcntl.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <unistd.h>

namespace mediafetch::downloader {

namespace fs = std::filesystem;

namespace {

constexpr std::size_t kHashReadBuffer = 1 << 20;

void best_effort_preallocate(int fd, std::uint64_t targetSize) {
    if (targetSize == 0)
        return;
#if defined(__linux__)
    int rc = ::posix_fallocate(fd, 0, static_cast<off_t>(targetSize));
    if (rc != 0) {
        spdlog::debug("posix_fallocate failed ({}); relying on ftruncate", rc);
    }
#else
    (void)fd;
#endif
}

} // namespace

Result<std::unique_ptr<Reassembler>> Reassembler::open(const Manifest& manifest,
                                                       const fs::path& destination, bool fsync) {
    if (auto v = validateManifest(manifest); !v)
        return v.error();

    std::vector<ByteRange> ranges(manifest.chunks.size());
    for (const auto& c : manifest.chunks)
        ranges[c.index] = c.range;

    const auto dir = destination.has_parent_path() ? destination.parent_path() : fs::path{"."};
    std::error_code ec;
    fs::create_directories(dir, ec);
    if (ec) {
        return Error{ErrorCode::IoError,
                     "Failed to create output directory " + dir.string() + ": " + ec.message()};
    }

    // Each job gets its own staging file; O_EXCL never reuses another job's inode.
    fs::path staging;
    int fd = -1;
    for (int attempt = 0; attempt < 8 && fd < 0; ++attempt) {
        staging = uniqueSiblingPath(destination, "part");
        fd = ::open(staging.c_str(), O_RDWR | O_CREAT | O_EXCL | O_CLOEXEC, 0600);
        if (fd < 0 && errno != EEXIST)
            return makeIoError(errno, "open()", staging);
    }
    if (fd < 0) {
        return makeIoError(EEXIST, "open()", staging);
    }

    best_effort_preallocate(fd, manifest.totalSize);
    if (::ftruncate(fd, static_cast<off_t>(manifest.totalSize)) != 0) {
        const int err = errno;
        ::close(fd);
        std::error_code rmEc;
        fs::remove(staging, rmEc);
        return makeIoError(err, "ftruncate()", staging);
    }

    spdlog::debug("Staging {} ({} bytes, {} chunks)", staging.string(), manifest.totalSize,
                  ranges.size());
    return std::unique_ptr<Reassembler>(
        new Reassembler(std::move(ranges), destination, std::move(staging), fd, fsync));
}

Reassembler::Reassembler(std::vector<ByteRange> ranges, fs::path destination, fs::path staging,
                         int fd, bool fsync)
    : ranges_(std::move(ranges)), destination_(std::move(destination)),
      staging_(std::move(staging)), fd_(fd), fsync_(fsync), completed_(ranges_.size(), false) {}

Reassembler::~Reassembler() {
    bool pending;
    {
        std::lock_guard<std::mutex> lk(mutex_);
        pending = !finalized_ && !discarded_;
    }
    if (pending)
        discard();
}

Result<void> Reassembler::writeChunk(std::uint32_t index, ByteSpan plaintext) {
    std::lock_guard<std::mutex> lk(mutex_);
    if (finalized_ || discarded_ || fd_ < 0) {
        return Error{ErrorCode::InvalidState, "Reassembler is closed"};
    }
    if (index >= ranges_.size()) {
        return Error{ErrorCode::InvalidArgument, "Chunk index " + std::to_string(index) +
                                                     " out of range (" +
                                                     std::to_string(ranges_.size()) + " chunks)"};
    }
    const auto& range = ranges_[index];
    if (plaintext.size() != range.length) {
        return Error{ErrorCode::ChunkSizeMismatch,
                     "Chunk " + std::to_string(index) + " decrypted to " +
                         std::to_string(plaintext.size()) + " bytes, expected " +
                         std::to_string(range.length)};
    }
    if (completed_[index])
        return {};

    auto wr = pwriteAll(fd_, plaintext.data(), plaintext.size(), range.offset, staging_);
    if (!wr)
        return wr;

    completed_[index] = true;
    ++completedCount_;
    bytesWritten_ += plaintext.size();
    return {};
}

bool Reassembler::isComplete() const {
    std::lock_guard<std::mutex> lk(mutex_);
    return completedCount_ == ranges_.size();
}

std::size_t Reassembler::completedCount() const {
    std::lock_guard<std::mutex> lk(mutex_);
    return completedCount_;
}

std::uint64_t Reassembler::bytesWritten() const {
    std::lock_guard<std::mutex> lk(mutex_);
    return bytesWritten_;
}

Result<std::string> Reassembler::hashStagedLocked(IIntegrityVerifier& verifier) {
    verifier.reset();
    ByteVector buf(kHashReadBuffer);
    off_t pos = 0;
    for (;;) {
        ssize_t n = ::pread(fd_, buf.data(), buf.size(), pos);
        if (n < 0) {
            if (errno == EINTR)
                continue;
            return makeIoError(errno, "pread()", staging_);
        }
        if (n == 0)
            break;
        auto up = verifier.update(ByteSpan(buf.data(), static_cast<std::size_t>(n)));
        if (!up)
            return up.error();
        pos += n;
    }
    return verifier.finalize();
}

Result<void> Reassembler::finalize(IIntegrityVerifier* verifier,
                                   const std::optional<std::string>& expectedSha256) {
    Result<void> outcome;
    {
        std::lock_guard<std::mutex> lk(mutex_);
        if (finalized_ || discarded_ || fd_ < 0) {
            return Error{ErrorCode::InvalidState, "Reassembler is closed"};
        }
        if (completedCount_ != ranges_.size()) {
            return Error{ErrorCode::InvalidState,
                         "Cannot finalize: " + std::to_string(completedCount_) + " of " +
                             std::to_string(ranges_.size()) + " chunks written"};
        }

        if (fsync_)
            outcome = fsyncFd(fd_, staging_);

        if (outcome && verifier && expectedSha256 && !expectedSha256->empty()) {
            auto digest = hashStagedLocked(*verifier);
            if (!digest) {
                outcome = digest.error();
            } else if (digest.value() != *expectedSha256) {
                outcome = Error{ErrorCode::ChecksumMismatch,
                                "SHA-256 mismatch for " + destination_.string() + ": expected " +
                                    *expectedSha256 + ", got " + digest.value()};
            }
        }

        if (outcome) {
            closeLocked();
            if (::rename(staging_.c_str(), destination_.c_str()) != 0) {
                outcome = makeIoError(errno, "rename()", destination_);
            } else {
                finalized_ = true;
            }
        }
    }

    if (!outcome) {
        discard();
        return outcome;
    }

    if (fsync_) {
        const auto dir =
            destination_.has_parent_path() ? destination_.parent_path() : fs::path{"."};
        auto dr = fsyncDir(dir);
        if (!dr) {
            spdlog::debug("fsync on output dir failed (continuing): {}", dr.error().message);
        }
    }
    spdlog::debug("Finalized {}", destination_.string());
    return {};
}

void Reassembler::closeLocked() noexcept {
    if (fd_ >= 0) {
        ::close(fd_);
        fd_ = -1;
    }
}

void Reassembler::discard() noexcept {
    std::lock_guard<std::mutex> lk(mutex_);
    if (finalized_ || discarded_)
        return;
    closeLocked();
    discarded_ = true;
    std::error_code ec;
    fs::remove(staging_, ec);
    if (ec) {
        spdlog::warn("Failed to remove staging file {}: {}", staging_.string(), ec.message());
    }
}

} // namespace mediafetch::downloader
