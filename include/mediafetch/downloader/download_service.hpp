#pragma once

#include <mediafetch/common/event_channel.h>
#include <mediafetch/downloader/job.hpp>
#include <mediafetch/downloader/job_coordinator.hpp>
#include <mediafetch/downloader/worker_pool.h>
#include <mediafetch/ledger/ledger.hpp>

#include <atomic>
#include <filesystem>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string_view>
#include <vector>

namespace mediafetch::downloader {

struct JobHandle {
    JobId id{0};
    std::shared_future<JobResult> result;
};

struct DedupStatus {
    bool downloaded{false};
    bool dedupEnabled{true};
    bool wouldSkip{false};
    std::optional<ledger::LedgerEntry> entry;
};

/**
 * Caller-facing API over the pipeline. Owns the worker pool, the event channel and the
 * transport/decryption collaborators; borrows the ledger from the composition root.
 */
class DownloadService {
public:
    struct Collaborators {
        std::unique_ptr<IChunkTransport> transport;   // libcurl when null
        std::unique_ptr<IStreamDecryptor> decryptor;  // OpenSSL when null
        std::unique_ptr<IManifestResolver> resolver;  // optional
    };

    DownloadService(ledger::DedupLedger& ledger, DownloaderConfig config,
                    Collaborators collaborators = {});
    ~DownloadService();

    DownloadService(const DownloadService&) = delete;
    DownloadService& operator=(const DownloadService&) = delete;

    Result<JobHandle> submitJob(JobRequest request);
    bool cancelJob(JobId id);
    void cancelAll();

    [[nodiscard]] DedupStatus queryDedupStatus(std::string_view itemId) const;
    Result<void> setDedupEnabled(bool enabled);
    Result<void> exportHistory(const std::filesystem::path& target) const;
    Result<ledger::ImportReport> importHistory(const std::filesystem::path& source,
                                               ledger::ImportMode mode);
    [[nodiscard]] ledger::LedgerStatistics statistics() const;

    EventChannel<JobEvent>& events() noexcept { return events_; }
    [[nodiscard]] std::vector<JobId> activeJobs() const;
    [[nodiscard]] std::optional<std::shared_future<JobResult>> resultFor(JobId id) const;

    // Stop accepting jobs, cancel running ones and join the workers.
    void shutdown();

private:
    void pruneFinishedLocked();

    ledger::DedupLedger& ledger_;
    DownloaderConfig config_;
    std::unique_ptr<IChunkTransport> transport_;
    std::unique_ptr<IStreamDecryptor> decryptor_;
    std::unique_ptr<IManifestResolver> resolver_;
    EventChannel<JobEvent> events_;
    std::unique_ptr<WorkerPool> pool_;

    mutable std::mutex jobsMutex_;
    std::map<JobId, std::shared_ptr<JobCoordinator>> jobs_;
    std::atomic<JobId> nextId_{1};
    bool shutdown_{false};
};

} // namespace mediafetch::downloader
