#pragma once

#include <mediafetch/common/event_channel.h>
#include <mediafetch/downloader/chunk_fetcher.hpp>
#include <mediafetch/downloader/job.hpp>
#include <mediafetch/downloader/reassembler.hpp>
#include <mediafetch/downloader/worker_pool.h>
#include <mediafetch/ledger/ledger.hpp>

#include <atomic>
#include <chrono>
#include <future>
#include <memory>
#include <mutex>
#include <optional>

namespace mediafetch::downloader {

/**
 * Collaborators shared by every job of a service. All references must outlive the jobs.
 */
struct JobContext {
    WorkerPool& pool;
    ledger::DedupLedger& ledger;
    IChunkTransport& transport;
    IStreamDecryptor& decryptor;
    IManifestResolver* resolver{nullptr};
    EventChannel<JobEvent>* events{nullptr};
    DownloaderConfig config{};
};

/**
 * Drives one job through Pending -> Running -> terminal.
 *
 * The start step and one task per chunk run on the shared WorkerPool; each queued task holds a
 * shared_ptr to the coordinator. The first fatal chunk failure raises the abort flag so
 * siblings stop cooperatively. When every chunk task has reported, the last one finalizes the
 * output and records the item in the ledger.
 */
class JobCoordinator : public std::enable_shared_from_this<JobCoordinator> {
public:
    static std::shared_ptr<JobCoordinator> create(JobId id, JobRequest request, JobContext ctx);

    JobCoordinator(const JobCoordinator&) = delete;
    JobCoordinator& operator=(const JobCoordinator&) = delete;

    // Queue the start step. Must be called once.
    void start();

    // Cooperative: queued chunk tasks are dropped, in-flight ones stop at the next check.
    void cancel();

    [[nodiscard]] JobState state() const;
    [[nodiscard]] std::shared_future<JobResult> result() const { return future_; }
    [[nodiscard]] JobId id() const noexcept { return id_; }
    [[nodiscard]] const Item& item() const noexcept { return request_.item; }

private:
    JobCoordinator(JobId id, JobRequest request, JobContext ctx);

    void runStart(bool dispatched);
    void runChunk(std::uint32_t index, bool dispatched);
    void chunkReported();
    void complete();

    Result<Manifest> obtainManifest();
    void recordFailure(const Error& error, std::optional<std::uint32_t> chunk);
    void transition(JobState next);
    void finish(JobState terminal, std::optional<Error> error = std::nullopt,
                SkipReason skip = SkipReason::None);
    void emit(JobEvent ev);

    const JobId id_;
    const JobRequest request_;
    JobContext ctx_;
    ChunkFetcher fetcher_;
    ShouldCancel abortPredicate_;

    std::atomic<bool> abort_{false};
    std::atomic<bool> cancelRequested_{false};
    std::atomic<std::size_t> remaining_{0};
    std::atomic<std::size_t> done_{0};

    // Written by the start step before chunk tasks are queued; read-only afterwards.
    Manifest manifest_;
    std::unique_ptr<Reassembler> reassembler_;

    mutable std::mutex mutex_;
    JobState state_{JobState::Pending};
    std::optional<Error> firstError_;
    std::optional<std::uint32_t> failedChunk_;
    bool ledgerRecorded_{false};

    std::chrono::steady_clock::time_point startedAt_;
    std::promise<JobResult> promise_;
    std::shared_future<JobResult> future_;
};

} // namespace mediafetch::downloader
