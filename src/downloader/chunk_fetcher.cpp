#include <mediafetch/downloader/chunk_fetcher.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cmath>
#include <thread>

namespace mediafetch::downloader {

namespace {

constexpr std::chrono::milliseconds kCancelPollSlice{25};

std::mt19937_64& threadRng() {
    thread_local std::mt19937_64 rng{std::random_device{}()};
    return rng;
}

bool isCancelled(const ShouldCancel& shouldCancel) {
    return shouldCancel && shouldCancel();
}

} // namespace

ChunkFetcher::ChunkFetcher(IChunkTransport& transport, RetryPolicy policy,
                           std::chrono::milliseconds attemptTimeout)
    : transport_(transport), policy_(policy), attemptTimeout_(attemptTimeout) {
    if (policy_.maxAttempts < 1)
        policy_.maxAttempts = 1;
    if (policy_.multiplier < 1.0)
        policy_.multiplier = 1.0;
    policy_.jitter = std::clamp(policy_.jitter, 0.0, 1.0);
}

std::chrono::milliseconds ChunkFetcher::baseDelay(const RetryPolicy& policy, int retry) {
    if (retry < 1)
        retry = 1;
    const double scaled = static_cast<double>(policy.initialBackoff.count()) *
                          std::pow(policy.multiplier, static_cast<double>(retry - 1));
    const double capped = std::min(scaled, static_cast<double>(policy.maxBackoff.count()));
    return std::chrono::milliseconds(static_cast<std::int64_t>(capped));
}

std::chrono::milliseconds ChunkFetcher::jitteredDelay(const RetryPolicy& policy, int retry,
                                                      std::mt19937_64& rng) {
    const auto base = baseDelay(policy, retry);
    if (policy.jitter <= 0.0 || base.count() == 0)
        return base;
    std::uniform_real_distribution<double> dist(1.0 - policy.jitter, 1.0 + policy.jitter);
    const double v = static_cast<double>(base.count()) * dist(rng);
    return std::chrono::milliseconds(static_cast<std::int64_t>(std::max(0.0, v)));
}

bool ChunkFetcher::sleepUnlessCancelled(std::chrono::milliseconds delay,
                                        const ShouldCancel& shouldCancel) const {
    const auto deadline = std::chrono::steady_clock::now() + delay;
    while (std::chrono::steady_clock::now() < deadline) {
        if (isCancelled(shouldCancel))
            return false;
        auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now());
        std::this_thread::sleep_for(std::min(left, kCancelPollSlice));
    }
    return !isCancelled(shouldCancel);
}

Result<ByteVector> ChunkFetcher::fetch(const ChunkDescriptor& chunk,
                                       const ShouldCancel& shouldCancel) const {
    Error lastError{ErrorCode::Unknown, "no attempt made"};

    for (int attempt = 1; attempt <= policy_.maxAttempts; ++attempt) {
        if (isCancelled(shouldCancel)) {
            return Error{ErrorCode::OperationCancelled,
                         "Chunk " + std::to_string(chunk.index) + " cancelled"};
        }

        auto r = transport_.fetch(chunk.locator, chunk.range, attemptTimeout_, shouldCancel);
        if (r) {
            if (chunk.locator.useRangeHeader && r.value().size() != chunk.range.length) {
                return Error{ErrorCode::ChunkSizeMismatch,
                             "Chunk " + std::to_string(chunk.index) + ": ranged response of " +
                                 std::to_string(r.value().size()) + " bytes, expected " +
                                 std::to_string(chunk.range.length)};
            }
            if (attempt > 1) {
                spdlog::debug("Chunk {} succeeded on attempt {}", chunk.index, attempt);
            }
            return r;
        }

        lastError = r.error();
        if (!isTransient(lastError.code)) {
            return lastError;
        }
        if (attempt == policy_.maxAttempts)
            break;

        const auto delay = jitteredDelay(policy_, attempt, threadRng());
        spdlog::warn("Chunk {} attempt {}/{} failed ({}); retrying in {} ms", chunk.index, attempt,
                     policy_.maxAttempts, lastError.message, delay.count());
        if (!sleepUnlessCancelled(delay, shouldCancel)) {
            return Error{ErrorCode::OperationCancelled,
                         "Chunk " + std::to_string(chunk.index) + " cancelled during backoff"};
        }
    }

    return Error{lastError.code, "Chunk " + std::to_string(chunk.index) + " failed after " +
                                     std::to_string(policy_.maxAttempts) +
                                     " attempts: " + lastError.message};
}

} // namespace mediafetch::downloader
