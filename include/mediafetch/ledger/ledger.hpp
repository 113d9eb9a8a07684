#pragma once

/*
 * mediafetch ledger - durable record of completed downloads
 *
 * LedgerStore owns the on-disk JSON snapshot (atomic replace, corruption quarantine).
 * DedupLedger is the in-process authority built on top of it: membership queries gate new
 * jobs and completed jobs are recorded through it. One instance is constructed by the
 * top-level composition and handed to every job by reference.
 */

#include <mediafetch/core/item.h>
#include <mediafetch/core/types.h>

#include <cstddef>
#include <filesystem>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace mediafetch::ledger {

inline constexpr int kSchemaVersion = 1;

/**
 * One persisted completion.
 */
struct LedgerEntry {
    std::string itemId;
    SourceKind sourceKind{SourceKind::Manual};
    std::optional<std::string> sourceSubtype;
    std::optional<std::string> sourceId;
    std::optional<std::string> sourceLabel;
    TimePoint completedAt{};

    [[nodiscard]] std::string sourceTag() const {
        return mediafetch::sourceTag(sourceKind, sourceSubtype);
    }
};

struct LedgerSettings {
    bool dedupEnabled{true};
};

/**
 * Full in-memory image of the ledger file.
 */
struct LedgerSnapshot {
    int schemaVersion{kSchemaVersion};
    std::optional<TimePoint> lastUpdated;
    LedgerSettings settings{};
    std::unordered_map<std::string, LedgerEntry> entries;
};

enum class LoadStatus {
    Loaded,    // current schema, parsed as-is
    Missing,   // no file yet; empty snapshot returned
    Recovered, // corrupt file quarantined; empty snapshot returned
    Migrated   // legacy shape converted in memory; caller must persist
};

struct LoadOutcome {
    LedgerSnapshot snapshot;
    LoadStatus status{LoadStatus::Loaded};
    std::optional<std::filesystem::path> backupPath;
};

// ---------------------------------------------------------------------------
// JSON codec (ledger_codec.cpp)
// ---------------------------------------------------------------------------

// How decodeSnapshot treats an entry that lacks required fields or has a bad date.
enum class EntryPolicy {
    Strict,     // the whole document is rejected (import)
    SkipInvalid // the entry is dropped and reported in DecodeResult::rejected (load)
};

struct DecodeResult {
    LedgerSnapshot snapshot;
    bool legacy{false};
    // Set when the document carried a dedup setting (current or legacy key).
    bool hasDedupSetting{false};
    // One message per entry dropped under EntryPolicy::SkipInvalid.
    std::vector<std::string> rejected;
};

/**
 * Parse a ledger/export document. Accepts the current shape and the legacy shapes
 * (entries at the root, underscore-prefixed metadata keys, "preventDuplicates").
 * Returns CorruptedData for invalid JSON or a non-object document. With EntryPolicy::Strict,
 * returns ValidationError when an entry lacks "sourceType" or "downloadDate".
 */
Result<DecodeResult> decodeSnapshot(std::string_view text,
                                    EntryPolicy policy = EntryPolicy::Strict);

/**
 * Serialize a snapshot in the current schema. Extra top-level fields (export metadata) are
 * merged in when provided.
 */
std::string encodeSnapshot(const LedgerSnapshot& snapshot,
                           const std::map<std::string, std::string>& extraStrings = {},
                           const std::map<std::string, std::size_t>& extraCounts = {});

// ---------------------------------------------------------------------------
// LedgerStore
// ---------------------------------------------------------------------------

class LedgerStore {
public:
    struct Options {
        bool fsync{true};
        // Invoked after the temporary file is durable and before the rename.
        // Returning false abandons the commit.
        std::function<bool(const std::filesystem::path& tempFile)> commitGate;
    };

    explicit LedgerStore(std::filesystem::path path);
    LedgerStore(std::filesystem::path path, Options options);

    /**
     * Read the backing file. A corrupt file is renamed to "<path>.bak" and an empty snapshot
     * is returned with status Recovered; that condition is never an error. Individual invalid
     * entries are dropped with a warning and the rest is returned with status Migrated.
     */
    Result<LoadOutcome> load();

    /**
     * Atomically replace the backing file with the snapshot. Sets snapshot.lastUpdated on
     * success. On failure the previous file is untouched.
     */
    Result<void> save(LedgerSnapshot& snapshot);

    /**
     * Write a snapshot to an arbitrary path with the same atomic replace semantics.
     */
    Result<void> writeTo(const std::filesystem::path& target, const LedgerSnapshot& snapshot,
                         const std::map<std::string, std::string>& extraStrings = {},
                         const std::map<std::string, std::size_t>& extraCounts = {});

    /**
     * Parse an arbitrary ledger-shaped file without quarantining it.
     */
    static Result<DecodeResult> readFrom(const std::filesystem::path& source);

    [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }
    [[nodiscard]] std::filesystem::path backupPath() const;

private:
    Result<void> atomicWrite(const std::filesystem::path& target, const std::string& payload);

    std::filesystem::path path_;
    Options options_;
};

// ---------------------------------------------------------------------------
// DedupLedger
// ---------------------------------------------------------------------------

enum class ImportMode { Merge, Replace };

struct OpenReport {
    LoadStatus status{LoadStatus::Loaded};
    std::optional<std::filesystem::path> backupPath;
    std::size_t entries{0};
};

struct ImportReport {
    std::size_t imported{0};
    std::size_t total{0};
    ImportMode mode{ImportMode::Merge};
    std::string message;
};

struct LedgerStatistics {
    std::size_t totalEntries{0};
    std::map<SourceKind, std::size_t> bySourceKind;
    std::map<std::string, std::size_t> bySourceTag;
    std::optional<TimePoint> oldest;
    std::optional<TimePoint> newest;
};

class DedupLedger {
public:
    explicit DedupLedger(LedgerStore store);

    DedupLedger(const DedupLedger&) = delete;
    DedupLedger& operator=(const DedupLedger&) = delete;

    /**
     * Load the backing file. Missing files are created, legacy files are migrated and
     * re-saved, corrupt files are quarantined. Must be called before any query.
     */
    Result<OpenReport> open();

    [[nodiscard]] bool isDownloaded(std::string_view itemId) const;
    [[nodiscard]] bool shouldSkip(std::string_view itemId) const;
    [[nodiscard]] std::optional<LedgerEntry> entry(std::string_view itemId) const;

    /**
     * Insert or overwrite the entry for item (most recent download wins) and persist.
     * A persistence failure is returned; the in-memory entry is kept either way.
     */
    Result<void> record(const Item& item);

    // Returns whether an entry existed and was removed.
    bool remove(std::string_view itemId);

    Result<void> clear();

    Result<void> setDedupEnabled(bool enabled);
    [[nodiscard]] bool dedupEnabled() const;
    [[nodiscard]] LedgerSettings settings() const;

    Result<void> exportTo(const std::filesystem::path& target) const;
    Result<ImportReport> importFrom(const std::filesystem::path& source, ImportMode mode);

    [[nodiscard]] LedgerStatistics statistics() const;
    [[nodiscard]] std::map<std::string, std::vector<LedgerEntry>> groupBySource() const;
    [[nodiscard]] std::size_t size() const;
    [[nodiscard]] LedgerSnapshot snapshot() const;
    [[nodiscard]] const std::filesystem::path& path() const noexcept { return store_.path(); }

private:
    Result<void> persistLocked();

    // mutable: exportTo() writes through the store while holding the lock.
    mutable LedgerStore store_;
    mutable std::mutex mutex_;
    LedgerSnapshot snapshot_;
    bool opened_{false};
};

} // namespace mediafetch::ledger
