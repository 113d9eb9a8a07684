#pragma once

#include <mediafetch/downloader/downloader.hpp>

#include <chrono>
#include <random>

namespace mediafetch::downloader {

/**
 * Bounded-retry wrapper around an IChunkTransport.
 *
 * Only transient failures (Timeout, NetworkError, RateLimited, ServerError) are retried;
 * anything else is returned on the first occurrence. The cancel predicate is checked before
 * every attempt and while sleeping between attempts. Exhaustion returns the last transient
 * error. Stateless across calls, so one instance may serve all workers.
 */
class ChunkFetcher {
public:
    ChunkFetcher(IChunkTransport& transport, RetryPolicy policy,
                 std::chrono::milliseconds attemptTimeout);

    Result<ByteVector> fetch(const ChunkDescriptor& chunk, const ShouldCancel& shouldCancel) const;

    // Delay before retry `retry` (1-based), without jitter applied.
    static std::chrono::milliseconds baseDelay(const RetryPolicy& policy, int retry);

    // Delay with jitter from `rng`, clamped to [0, maxBackoff * (1 + jitter)].
    static std::chrono::milliseconds jitteredDelay(const RetryPolicy& policy, int retry,
                                                   std::mt19937_64& rng);

    const RetryPolicy& policy() const noexcept { return policy_; }

private:
    bool sleepUnlessCancelled(std::chrono::milliseconds delay,
                              const ShouldCancel& shouldCancel) const;

    IChunkTransport& transport_;
    RetryPolicy policy_;
    std::chrono::milliseconds attemptTimeout_;
};

} // namespace mediafetch::downloader
