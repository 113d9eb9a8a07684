/*
 * mediafetch/src/ledger/dedup_ledger.cpp
 *
 * DedupLedger: single in-process authority over the ledger snapshot.
 * Every query and mutation takes mutex_; mutations persist synchronously while holding it,
 * so commits from concurrent jobs are serialized and never interleave on disk.
 */

#include <mediafetch/core/timestamp.h>
#include <mediafetch/ledger/ledger.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <chrono>

namespace mediafetch::ledger {

namespace fs = std::filesystem;

DedupLedger::DedupLedger(LedgerStore store) : store_(std::move(store)) {}

Result<OpenReport> DedupLedger::open() {
    std::lock_guard<std::mutex> lk(mutex_);

    auto loaded = store_.load();
    if (!loaded)
        return loaded.error();

    auto& outcome = loaded.value();
    snapshot_ = std::move(outcome.snapshot);
    opened_ = true;

    OpenReport report;
    report.status = outcome.status;
    report.backupPath = outcome.backupPath;
    report.entries = snapshot_.entries.size();

    switch (outcome.status) {
        case LoadStatus::Loaded:
            break;
        case LoadStatus::Missing:
        case LoadStatus::Migrated:
        case LoadStatus::Recovered: {
            // Persist before serving any query so the file on disk matches what we answer from.
            auto saved = persistLocked();
            if (!saved) {
                if (outcome.status == LoadStatus::Migrated) {
                    spdlog::error("Failed to persist migrated ledger {}: {}",
                                  store_.path().string(), saved.error().message);
                } else {
                    spdlog::warn("Failed to initialize ledger file {}: {}",
                                 store_.path().string(), saved.error().message);
                }
            }
            break;
        }
    }

    if (outcome.status == LoadStatus::Recovered) {
        spdlog::warn("Download ledger was corrupted; started empty. Backup saved to: {}",
                     report.backupPath ? report.backupPath->string() : std::string{"<none>"});
    }
    spdlog::debug("Ledger {} opened with {} entries (dedup {})", store_.path().string(),
                  report.entries, snapshot_.settings.dedupEnabled ? "on" : "off");
    return report;
}

bool DedupLedger::isDownloaded(std::string_view itemId) const {
    std::lock_guard<std::mutex> lk(mutex_);
    return snapshot_.entries.find(std::string(itemId)) != snapshot_.entries.end();
}

bool DedupLedger::shouldSkip(std::string_view itemId) const {
    std::lock_guard<std::mutex> lk(mutex_);
    return snapshot_.settings.dedupEnabled &&
           snapshot_.entries.find(std::string(itemId)) != snapshot_.entries.end();
}

std::optional<LedgerEntry> DedupLedger::entry(std::string_view itemId) const {
    std::lock_guard<std::mutex> lk(mutex_);
    auto it = snapshot_.entries.find(std::string(itemId));
    if (it == snapshot_.entries.end())
        return std::nullopt;
    return it->second;
}

Result<void> DedupLedger::record(const Item& item) {
    if (item.itemId.empty()) {
        return Error{ErrorCode::InvalidArgument, "record: empty item id"};
    }

    std::lock_guard<std::mutex> lk(mutex_);
    LedgerEntry e;
    e.itemId = item.itemId;
    e.sourceKind = item.sourceKind;
    e.sourceSubtype = item.sourceSubtype;
    e.sourceId = item.sourceId;
    e.sourceLabel = item.sourceLabel;
    e.completedAt = std::chrono::system_clock::now();
    snapshot_.entries.insert_or_assign(item.itemId, std::move(e));
    return persistLocked();
}

bool DedupLedger::remove(std::string_view itemId) {
    std::lock_guard<std::mutex> lk(mutex_);
    auto it = snapshot_.entries.find(std::string(itemId));
    if (it == snapshot_.entries.end())
        return false;
    snapshot_.entries.erase(it);
    auto saved = persistLocked();
    if (!saved) {
        spdlog::warn("Removed {} from ledger but failed to persist: {}", itemId,
                     saved.error().message);
    }
    return true;
}

Result<void> DedupLedger::clear() {
    std::lock_guard<std::mutex> lk(mutex_);
    snapshot_.entries.clear();
    return persistLocked();
}

Result<void> DedupLedger::setDedupEnabled(bool enabled) {
    std::lock_guard<std::mutex> lk(mutex_);
    snapshot_.settings.dedupEnabled = enabled;
    return persistLocked();
}

bool DedupLedger::dedupEnabled() const {
    std::lock_guard<std::mutex> lk(mutex_);
    return snapshot_.settings.dedupEnabled;
}

LedgerSettings DedupLedger::settings() const {
    std::lock_guard<std::mutex> lk(mutex_);
    return snapshot_.settings;
}

Result<void> DedupLedger::exportTo(const fs::path& target) const {
    std::lock_guard<std::mutex> lk(mutex_);
    auto r = store_.writeTo(target, snapshot_,
                            {{"exported_at", formatIso8601(std::chrono::system_clock::now())}},
                            {{"total_entries", snapshot_.entries.size()}});
    if (r) {
        spdlog::info("Exported {} ledger entries to {}", snapshot_.entries.size(),
                     target.string());
    }
    return r;
}

Result<ImportReport> DedupLedger::importFrom(const fs::path& source, ImportMode mode) {
    // Parse outside the lock; the file is foreign and may be large.
    auto decoded = LedgerStore::readFrom(source);
    if (!decoded) {
        return Error{decoded.error().code, "Import failed: " + decoded.error().message};
    }
    auto& incoming = decoded.value();

    std::lock_guard<std::mutex> lk(mutex_);
    ImportReport report;
    report.mode = mode;
    report.imported = incoming.snapshot.entries.size();

    if (mode == ImportMode::Replace) {
        snapshot_.entries = std::move(incoming.snapshot.entries);
        report.message = "Successfully imported " + std::to_string(report.imported) +
                         " entries (replaced existing)";
    } else {
        for (auto& [itemId, e] : incoming.snapshot.entries) {
            snapshot_.entries.insert_or_assign(itemId, std::move(e));
        }
        report.message = "Successfully merged " + std::to_string(report.imported) + " entries";
    }
    if (incoming.hasDedupSetting) {
        snapshot_.settings.dedupEnabled = incoming.snapshot.settings.dedupEnabled;
    }
    report.total = snapshot_.entries.size();

    auto saved = persistLocked();
    if (!saved)
        return saved.error();
    spdlog::info("{} from {}", report.message, source.string());
    return report;
}

LedgerStatistics DedupLedger::statistics() const {
    std::lock_guard<std::mutex> lk(mutex_);
    LedgerStatistics stats;
    stats.totalEntries = snapshot_.entries.size();
    for (const auto& [_, e] : snapshot_.entries) {
        stats.bySourceKind[e.sourceKind]++;
        stats.bySourceTag[e.sourceTag()]++;
        if (!stats.oldest || e.completedAt < *stats.oldest)
            stats.oldest = e.completedAt;
        if (!stats.newest || e.completedAt > *stats.newest)
            stats.newest = e.completedAt;
    }
    return stats;
}

std::map<std::string, std::vector<LedgerEntry>> DedupLedger::groupBySource() const {
    std::lock_guard<std::mutex> lk(mutex_);
    std::map<std::string, std::vector<LedgerEntry>> grouped;
    for (const auto& [_, e] : snapshot_.entries) {
        const auto key = e.sourceTag() + "_" + (e.sourceId ? *e.sourceId : std::string{"manual"});
        grouped[key].push_back(e);
    }
    for (auto& [_, list] : grouped) {
        std::sort(list.begin(), list.end(), [](const LedgerEntry& a, const LedgerEntry& b) {
            return a.completedAt < b.completedAt;
        });
    }
    return grouped;
}

std::size_t DedupLedger::size() const {
    std::lock_guard<std::mutex> lk(mutex_);
    return snapshot_.entries.size();
}

LedgerSnapshot DedupLedger::snapshot() const {
    std::lock_guard<std::mutex> lk(mutex_);
    return snapshot_;
}

Result<void> DedupLedger::persistLocked() {
    if (!opened_) {
        return Error{ErrorCode::InvalidState, "Ledger used before open()"};
    }
    auto r = store_.save(snapshot_);
    if (!r) {
        spdlog::warn("Failed to persist ledger {}: {}", store_.path().string(), r.error().message);
    }
    return r;
}

} // namespace mediafetch::ledger
