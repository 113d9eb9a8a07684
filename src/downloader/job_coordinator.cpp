/*
 * mediafetch/src/downloader/job_coordinator.cpp
 *
 * Per-job orchestration: dedup gate -> manifest -> staging -> parallel chunk tasks ->
 * finalize -> ledger commit. Terminal state is decided exactly once in finish().
 */

#include <mediafetch/downloader/job_coordinator.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <system_error>

namespace mediafetch::downloader {

namespace fs = std::filesystem;

std::shared_ptr<JobCoordinator> JobCoordinator::create(JobId id, JobRequest request,
                                                       JobContext ctx) {
    return std::shared_ptr<JobCoordinator>(
        new JobCoordinator(id, std::move(request), std::move(ctx)));
}

JobCoordinator::JobCoordinator(JobId id, JobRequest request, JobContext ctx)
    : id_(id), request_(std::move(request)), ctx_(std::move(ctx)),
      fetcher_(ctx_.transport, ctx_.config.retry, ctx_.config.attemptTimeout),
      abortPredicate_([this] { return abort_.load(std::memory_order_acquire); }),
      startedAt_(std::chrono::steady_clock::now()), future_(promise_.get_future().share()) {}

JobState JobCoordinator::state() const {
    std::lock_guard<std::mutex> lk(mutex_);
    return state_;
}

void JobCoordinator::start() {
    auto self = shared_from_this();
    const bool queued = ctx_.pool.enqueueCancellable(
        [self] { return self->cancelRequested_.load(std::memory_order_acquire); },
        [self](bool dispatched) { self->runStart(dispatched); });
    if (!queued) {
        finish(JobState::Failed, Error{ErrorCode::InvalidState, "Worker pool is stopping"});
    }
}

void JobCoordinator::cancel() {
    {
        std::lock_guard<std::mutex> lk(mutex_);
        if (isTerminal(state_))
            return;
    }
    cancelRequested_.store(true, std::memory_order_release);
    abort_.store(true, std::memory_order_release);
    spdlog::info("Job {} ({}) cancellation requested", id_, request_.item.itemId);
}

Result<Manifest> JobCoordinator::obtainManifest() {
    if (request_.manifest)
        return *request_.manifest;
    if (!ctx_.resolver) {
        return Error{ErrorCode::ResolutionFailed,
                     "No manifest supplied and no resolver configured"};
    }
    auto resolved = ctx_.resolver->resolve(request_.item);
    if (!resolved) {
        return Error{ErrorCode::ResolutionFailed,
                     "Manifest resolution failed: " + resolved.error().message};
    }
    return resolved;
}

void JobCoordinator::runStart(bool dispatched) {
    const auto& item = request_.item;
    if (!dispatched || cancelRequested_.load(std::memory_order_acquire)) {
        finish(JobState::Cancelled);
        return;
    }

    if (!request_.force && ctx_.ledger.shouldSkip(item.itemId)) {
        spdlog::info("Job {} ({}) skipped: already downloaded", id_, item.itemId);
        finish(JobState::Skipped, std::nullopt, SkipReason::AlreadyDownloaded);
        return;
    }

    std::error_code ec;
    if (!request_.force && ctx_.config.skipExistingFile && fs::exists(request_.destination, ec)) {
        spdlog::info("Job {} ({}) skipped: {} already exists", id_, item.itemId,
                     request_.destination.string());
        finish(JobState::Skipped, std::nullopt, SkipReason::DestinationExists);
        return;
    }

    auto manifest = obtainManifest();
    if (!manifest) {
        finish(JobState::Failed, manifest.error());
        return;
    }
    if (auto v = validateManifest(manifest.value()); !v) {
        finish(JobState::Failed, v.error());
        return;
    }
    manifest_ = std::move(manifest).value();
    // Chunk tasks look chunks up by index.
    std::sort(manifest_.chunks.begin(), manifest_.chunks.end(),
              [](const ChunkDescriptor& a, const ChunkDescriptor& b) { return a.index < b.index; });

    if (cancelRequested_.load(std::memory_order_acquire)) {
        finish(JobState::Cancelled);
        return;
    }

    auto reassembler = Reassembler::open(manifest_, request_.destination, ctx_.config.fsync);
    if (!reassembler) {
        finish(JobState::Failed, reassembler.error());
        return;
    }
    reassembler_ = std::move(reassembler).value();

    const auto total = manifest_.chunks.size();
    remaining_.store(total, std::memory_order_release);
    transition(JobState::Running);
    spdlog::info("Job {} ({}) running: {} chunks, {} bytes -> {}", id_, item.itemId, total,
                 manifest_.totalSize, request_.destination.string());

    auto self = shared_from_this();
    for (const auto& chunk : manifest_.chunks) {
        const auto index = chunk.index;
        const bool queued = ctx_.pool.enqueueCancellable(
            abortPredicate_, [self, index](bool d) { self->runChunk(index, d); });
        if (!queued) {
            recordFailure(Error{ErrorCode::InvalidState, "Worker pool is stopping"}, index);
            runChunk(index, false);
        }
    }
}

void JobCoordinator::runChunk(std::uint32_t index, bool dispatched) {
    if (dispatched && !abort_.load(std::memory_order_acquire)) {
        const auto& chunk = manifest_.chunks[index];

        auto fetched = fetcher_.fetch(chunk, abortPredicate_);
        if (!fetched) {
            recordFailure(fetched.error(), index);
        } else if (abort_.load(std::memory_order_acquire)) {
            // A sibling failed or the caller cancelled while this fetch was in flight.
        } else if (auto plain = ctx_.decryptor.decrypt(fetched.value(), manifest_.keys, chunk);
                   !plain) {
            recordFailure(plain.error(), index);
        } else if (auto wr = reassembler_->writeChunk(index, plain.value()); !wr) {
            recordFailure(wr.error(), index);
        } else {
            const auto doneNow = done_.fetch_add(1, std::memory_order_acq_rel) + 1;
            spdlog::debug("Job {} chunk {} written ({}/{})", id_, index, doneNow,
                          manifest_.chunks.size());
            JobEvent ev;
            ev.kind = JobEventKind::ChunkCompleted;
            ev.state = JobState::Running;
            ev.chunksDone = doneNow;
            emit(std::move(ev));
        }
    }
    chunkReported();
}

void JobCoordinator::chunkReported() {
    if (remaining_.fetch_sub(1, std::memory_order_acq_rel) == 1) {
        complete();
    }
}

void JobCoordinator::recordFailure(const Error& error, std::optional<std::uint32_t> chunk) {
    std::lock_guard<std::mutex> lk(mutex_);
    if (firstError_ || cancelRequested_.load(std::memory_order_acquire))
        return;
    // A cancellation observed by a chunk is the echo of an abort already raised elsewhere.
    if (error.code == ErrorCode::OperationCancelled && abort_.load(std::memory_order_acquire))
        return;
    firstError_ = error;
    failedChunk_ = chunk;
    abort_.store(true, std::memory_order_release);
    spdlog::warn("Job {} ({}) chunk {} failed [{}]: {}", id_, request_.item.itemId,
                 chunk ? std::to_string(*chunk) : std::string{"-"},
                 categoryToString(categorize(error.code)), error.message);
}

void JobCoordinator::complete() {
    std::optional<Error> failure;
    {
        std::lock_guard<std::mutex> lk(mutex_);
        failure = firstError_;
    }

    if (failure) {
        reassembler_->discard();
        finish(JobState::Failed, failure);
        return;
    }
    if (cancelRequested_.load(std::memory_order_acquire)) {
        reassembler_->discard();
        finish(JobState::Cancelled);
        return;
    }

    auto verifier = makeSha256Verifier();
    auto fin = reassembler_->finalize(verifier.get(), manifest_.sha256);
    if (!fin) {
        finish(JobState::Failed, fin.error());
        return;
    }

    auto rec = ctx_.ledger.record(request_.item);
    {
        std::lock_guard<std::mutex> lk(mutex_);
        ledgerRecorded_ = static_cast<bool>(rec);
    }
    if (!rec) {
        spdlog::error("Job {} ({}) completed but ledger update failed: {}", id_,
                      request_.item.itemId, rec.error().message);
    }
    finish(JobState::Completed);
}

void JobCoordinator::transition(JobState next) {
    {
        std::lock_guard<std::mutex> lk(mutex_);
        if (isTerminal(state_))
            return;
        state_ = next;
    }
    JobEvent ev;
    ev.kind = JobEventKind::StateChanged;
    ev.state = next;
    emit(std::move(ev));
}

void JobCoordinator::finish(JobState terminal, std::optional<Error> error, SkipReason skip) {
    JobResult result;
    {
        std::lock_guard<std::mutex> lk(mutex_);
        if (isTerminal(state_))
            return;
        state_ = terminal;

        result.jobId = id_;
        result.itemId = request_.item.itemId;
        result.state = terminal;
        result.skipReason = skip;
        result.destination = request_.destination;
        result.ledgerRecorded = ledgerRecorded_;
        if (terminal == JobState::Cancelled && !error) {
            error = Error{ErrorCode::OperationCancelled, "Cancelled by caller"};
        }
        if (error) {
            result.category = categorize(error->code);
            if (terminal == JobState::Failed)
                result.failedChunk = failedChunk_;
        }
        result.error = std::move(error);
    }
    if (terminal == JobState::Completed)
        result.bytesWritten = manifest_.totalSize;
    result.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - startedAt_);

    switch (terminal) {
        case JobState::Completed:
            spdlog::info("Job {} ({}) completed: {} bytes in {} ms{}", id_, result.itemId,
                         result.bytesWritten, result.elapsed.count(),
                         result.ledgerRecorded ? "" : " (not recorded in ledger)");
            break;
        case JobState::Failed:
            spdlog::error("Job {} ({}) failed [{}]{}: {}", id_, result.itemId,
                          categoryToString(result.category),
                          result.failedChunk ? " at chunk " + std::to_string(*result.failedChunk)
                                             : std::string{},
                          result.error ? result.error->message : std::string{});
            break;
        case JobState::Cancelled:
            spdlog::info("Job {} ({}) cancelled", id_, result.itemId);
            break;
        default:
            break;
    }

    JobEvent ev;
    ev.kind = JobEventKind::Finished;
    ev.state = terminal;
    ev.result = result;
    emit(std::move(ev));
    promise_.set_value(std::move(result));
}

void JobCoordinator::emit(JobEvent ev) {
    if (!ctx_.events)
        return;
    ev.jobId = id_;
    ev.itemId = request_.item.itemId;
    if (ev.chunksDone == 0)
        ev.chunksDone = done_.load(std::memory_order_acquire);
    ev.chunksTotal = manifest_.chunks.size();
    if (!ctx_.events->try_push(std::move(ev))) {
        spdlog::debug("Job {} event dropped: channel full", id_);
    }
}

} // namespace mediafetch::downloader
