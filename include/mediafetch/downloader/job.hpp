#pragma once

#include <mediafetch/core/item.h>
#include <mediafetch/core/types.h>
#include <mediafetch/downloader/downloader.hpp>

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

namespace mediafetch::downloader {

using JobId = std::uint64_t;

/**
 * Job lifecycle. Skipped, Completed, Failed and Cancelled are terminal.
 */
enum class JobState { Pending, Running, Skipped, Completed, Failed, Cancelled };

constexpr const char* jobStateToString(JobState state) {
    switch (state) {
        case JobState::Pending: return "pending";
        case JobState::Running: return "running";
        case JobState::Skipped: return "skipped";
        case JobState::Completed: return "completed";
        case JobState::Failed: return "failed";
        case JobState::Cancelled: return "cancelled";
    }
    return "pending";
}

constexpr bool isTerminal(JobState state) {
    return state != JobState::Pending && state != JobState::Running;
}

/**
 * Why a job was skipped without doing any work.
 */
enum class SkipReason { None, AlreadyDownloaded, DestinationExists };

/**
 * What a caller submits.
 */
struct JobRequest {
    Item item;
    std::optional<Manifest> manifest; // resolved through the service's resolver when absent
    std::filesystem::path destination;
    // Download even when the ledger has the item or the destination already exists.
    bool force{false};
};

struct JobResult {
    JobId jobId{0};
    std::string itemId;
    JobState state{JobState::Pending};
    SkipReason skipReason{SkipReason::None};
    std::optional<Error> error;
    std::optional<std::uint32_t> failedChunk;
    ErrorCategory category{ErrorCategory::None};
    std::uint64_t bytesWritten{0};
    std::filesystem::path destination;
    bool ledgerRecorded{false};
    std::chrono::milliseconds elapsed{0};
};

enum class JobEventKind { StateChanged, ChunkCompleted, Finished };

struct JobEvent {
    JobId jobId{0};
    std::string itemId;
    JobEventKind kind{JobEventKind::StateChanged};
    JobState state{JobState::Pending};
    std::size_t chunksDone{0};
    std::size_t chunksTotal{0};
    std::optional<JobResult> result; // set on Finished
};

} // namespace mediafetch::downloader
