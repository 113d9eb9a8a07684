/*
 * mediafetch/src/ledger/ledger_store.cpp
 *
 * LedgerStore:
 * - Atomic replace: write "<name>.tmp.<pid>.<n>" beside the target, fsync, rename over the
 *   target, fsync the directory. Readers see either the old or the new complete file.
 * - Corruption quarantine: an unparsable file is renamed to "<name>.bak" (replacing any
 *   previous backup) and an empty snapshot is served instead. Entries missing required
 *   fields are dropped one by one; the remaining entries survive and the file is re-saved.
 */

#include <mediafetch/core/fs_utils.h>
#include <mediafetch/ledger/ledger.hpp>

#include <spdlog/spdlog.h>

#include <cerrno>
#include <fstream>
#include <sstream>
#include <system_error>

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace mediafetch::ledger {

namespace fs = std::filesystem;

namespace {

Result<std::string> readWholeFile(const fs::path& p) {
    std::ifstream in(p, std::ios::binary);
    if (!in) {
        return Error{ErrorCode::IoError, "Failed to open for read: " + p.string()};
    }
    std::ostringstream ss;
    ss << in.rdbuf();
    if (in.bad()) {
        return Error{ErrorCode::IoError, "Failed to read: " + p.string()};
    }
    return ss.str();
}

} // namespace

LedgerStore::LedgerStore(fs::path path) : LedgerStore(std::move(path), Options{}) {}

LedgerStore::LedgerStore(fs::path path, Options options)
    : path_(std::move(path)), options_(std::move(options)) {}

fs::path LedgerStore::backupPath() const {
    auto p = path_;
    p += ".bak";
    return p;
}

Result<LoadOutcome> LedgerStore::load() {
    LoadOutcome out;

    std::error_code ec;
    if (!fs::exists(path_, ec)) {
        out.status = LoadStatus::Missing;
        return out;
    }

    auto text = readWholeFile(path_);
    if (!text)
        return text.error();

    auto decoded = decodeSnapshot(text.value(), EntryPolicy::SkipInvalid);
    if (!decoded) {
        const auto backup = backupPath();
        spdlog::warn("Ledger file {} is corrupt ({}); quarantining to {}", path_.string(),
                     decoded.error().message, backup.string());

        std::error_code renameEc;
        fs::rename(path_, backup, renameEc);
        if (renameEc) {
            std::error_code copyEc;
            fs::copy_file(path_, backup, fs::copy_options::overwrite_existing, copyEc);
            if (copyEc) {
                return Error{ErrorCode::IoError, "Failed to quarantine corrupt ledger " +
                                                     path_.string() + ": " + copyEc.message()};
            }
        }
        out.status = LoadStatus::Recovered;
        out.backupPath = backup;
        return out;
    }

    for (const auto& reason : decoded.value().rejected)
        spdlog::warn("Ledger file {}: dropping entry ({})", path_.string(), reason);

    out.snapshot = std::move(decoded.value().snapshot);
    out.status = decoded.value().legacy || !decoded.value().rejected.empty()
                     ? LoadStatus::Migrated
                     : LoadStatus::Loaded;
    if (decoded.value().legacy) {
        spdlog::info("Ledger file {} uses a legacy layout; migrating", path_.string());
    }
    return out;
}

Result<void> LedgerStore::save(LedgerSnapshot& snapshot) {
    const auto previous = snapshot.lastUpdated;
    snapshot.lastUpdated = std::chrono::system_clock::now();
    auto r = atomicWrite(path_, encodeSnapshot(snapshot));
    if (!r) {
        snapshot.lastUpdated = previous;
        return r;
    }
    return {};
}

Result<void> LedgerStore::writeTo(const fs::path& target, const LedgerSnapshot& snapshot,
                                  const std::map<std::string, std::string>& extraStrings,
                                  const std::map<std::string, std::size_t>& extraCounts) {
    return atomicWrite(target, encodeSnapshot(snapshot, extraStrings, extraCounts));
}

Result<DecodeResult> LedgerStore::readFrom(const fs::path& source) {
    auto text = readWholeFile(source);
    if (!text)
        return text.error();
    return decodeSnapshot(text.value());
}

Result<void> LedgerStore::atomicWrite(const fs::path& target, const std::string& payload) {
    const auto dir = target.has_parent_path() ? target.parent_path() : fs::path{"."};
    std::error_code ec;
    fs::create_directories(dir, ec);
    if (ec) {
        return Error{ErrorCode::IoError,
                     "Failed to create ledger directory " + dir.string() + ": " + ec.message()};
    }

    const auto tmp = uniqueSiblingPath(target, "tmp");
    int fd = ::open(tmp.c_str(), O_WRONLY | O_CREAT | O_EXCL | O_CLOEXEC, 0644);
    if (fd < 0) {
        return makeIoError(errno, "open()", tmp);
    }

    auto discard = [&tmp]() {
        std::error_code rmEc;
        fs::remove(tmp, rmEc);
    };

    auto wr = writeAll(fd, payload.data(), payload.size(), tmp);
    if (wr && options_.fsync) {
        wr = fsyncFd(fd, tmp);
    }
    if (::close(fd) != 0 && wr) {
        wr = makeIoError(errno, "close()", tmp);
    }
    if (!wr) {
        discard();
        return wr;
    }

    if (options_.commitGate && !options_.commitGate(tmp)) {
        discard();
        return Error{ErrorCode::IoError, "Commit abandoned before rename: " + target.string()};
    }

    if (::rename(tmp.c_str(), target.c_str()) != 0) {
        const int err = errno;
        discard();
        return makeIoError(err, "rename()", target);
    }

    if (options_.fsync) {
        auto dr = fsyncDir(dir);
        if (!dr) {
            spdlog::debug("fsync on ledger dir failed (continuing): {}", dr.error().message);
        }
    }
    return {};
}

} // namespace mediafetch::ledger
