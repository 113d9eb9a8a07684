#include <mediafetch/downloader/download_service.hpp>

#include <spdlog/spdlog.h>

namespace mediafetch::downloader {

DownloadService::DownloadService(ledger::DedupLedger& ledger, DownloaderConfig config,
                                 Collaborators collaborators)
    : ledger_(ledger), config_(std::move(config)),
      transport_(std::move(collaborators.transport)),
      decryptor_(std::move(collaborators.decryptor)),
      resolver_(std::move(collaborators.resolver)), events_(config_.eventCapacity) {
    if (!transport_)
        transport_ = makeCurlChunkTransport(config_.transport);
    if (!decryptor_)
        decryptor_ = makeOpenSslStreamDecryptor();
    pool_ = std::make_unique<WorkerPool>(config_.concurrency);
    spdlog::debug("DownloadService started with {} workers", pool_->thread_count());
}

DownloadService::~DownloadService() {
    shutdown();
}

void DownloadService::shutdown() {
    {
        std::lock_guard<std::mutex> lk(jobsMutex_);
        if (shutdown_)
            return;
        shutdown_ = true;
        for (auto& [_, job] : jobs_)
            job->cancel();
    }
    // Joins after the queue drains; cancelled tasks report without doing work.
    pool_->stop();
    std::lock_guard<std::mutex> lk(jobsMutex_);
    jobs_.clear();
}

Result<JobHandle> DownloadService::submitJob(JobRequest request) {
    if (request.item.itemId.empty()) {
        return Error{ErrorCode::InvalidArgument, "submitJob: empty item id"};
    }
    if (request.destination.empty()) {
        return Error{ErrorCode::InvalidArgument, "submitJob: empty destination"};
    }

    std::shared_ptr<JobCoordinator> job;
    {
        std::lock_guard<std::mutex> lk(jobsMutex_);
        if (shutdown_) {
            return Error{ErrorCode::InvalidState, "DownloadService is shut down"};
        }
        pruneFinishedLocked();
        const auto id = nextId_.fetch_add(1);
        JobContext ctx{*pool_, ledger_, *transport_, *decryptor_, resolver_.get(), &events_,
                       config_};
        job = JobCoordinator::create(id, std::move(request), std::move(ctx));
        jobs_.emplace(id, job);
    }

    spdlog::info("Job {} submitted for item {}", job->id(), job->item().itemId);
    job->start();
    return JobHandle{job->id(), job->result()};
}

bool DownloadService::cancelJob(JobId id) {
    std::shared_ptr<JobCoordinator> job;
    {
        std::lock_guard<std::mutex> lk(jobsMutex_);
        auto it = jobs_.find(id);
        if (it == jobs_.end())
            return false;
        job = it->second;
    }
    if (isTerminal(job->state()))
        return false;
    job->cancel();
    return true;
}

void DownloadService::cancelAll() {
    std::vector<std::shared_ptr<JobCoordinator>> snapshot;
    {
        std::lock_guard<std::mutex> lk(jobsMutex_);
        for (auto& [_, job] : jobs_)
            snapshot.push_back(job);
    }
    for (auto& job : snapshot)
        job->cancel();
}

DedupStatus DownloadService::queryDedupStatus(std::string_view itemId) const {
    DedupStatus status;
    status.entry = ledger_.entry(itemId);
    status.downloaded = status.entry.has_value();
    status.dedupEnabled = ledger_.dedupEnabled();
    status.wouldSkip = status.downloaded && status.dedupEnabled;
    return status;
}

Result<void> DownloadService::setDedupEnabled(bool enabled) {
    return ledger_.setDedupEnabled(enabled);
}

Result<void> DownloadService::exportHistory(const std::filesystem::path& target) const {
    return ledger_.exportTo(target);
}

Result<ledger::ImportReport> DownloadService::importHistory(const std::filesystem::path& source,
                                                            ledger::ImportMode mode) {
    return ledger_.importFrom(source, mode);
}

ledger::LedgerStatistics DownloadService::statistics() const {
    return ledger_.statistics();
}

std::vector<JobId> DownloadService::activeJobs() const {
    std::vector<JobId> out;
    std::lock_guard<std::mutex> lk(jobsMutex_);
    for (const auto& [id, job] : jobs_) {
        if (!isTerminal(job->state()))
            out.push_back(id);
    }
    return out;
}

std::optional<std::shared_future<JobResult>> DownloadService::resultFor(JobId id) const {
    std::lock_guard<std::mutex> lk(jobsMutex_);
    auto it = jobs_.find(id);
    if (it == jobs_.end())
        return std::nullopt;
    return it->second->result();
}

void DownloadService::pruneFinishedLocked() {
    for (auto it = jobs_.begin(); it != jobs_.end();) {
        if (isTerminal(it->second->state()))
            it = jobs_.erase(it);
        else
            ++it;
    }
}

} // namespace mediafetch::downloader
