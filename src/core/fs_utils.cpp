/*
 * mediafetch/src/core/fs_utils.cpp
 *
 * POSIX durability helpers shared by the ledger store and the reassembler.
 */

#include <mediafetch/core/fs_utils.h>

#include <atomic>
#include <cerrno>
#include <cstring>
#include <string>

#include <fcntl.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <unistd.h>

namespace mediafetch {

namespace fs = std::filesystem;

ErrorCode errorCodeFromErrno(int err) {
    switch (err) {
        case ENOSPC:
#ifdef EDQUOT
        case EDQUOT:
#endif
            return ErrorCode::StorageFull;
        case EACCES:
        case EPERM:
        case EROFS:
            return ErrorCode::PermissionDenied;
        default:
            return ErrorCode::IoError;
    }
}

Error makeIoError(int err, const std::string& what, const fs::path& path) {
    return Error{errorCodeFromErrno(err),
                 what + " failed for " + path.string() + ": " + std::strerror(err)};
}

Result<void> fsyncFd(int fd, const fs::path& pathForErrors) {
#if defined(__APPLE__)
    // F_FULLFSYNC is stricter than fsync on macOS; do both, tolerating the fcntl failure.
    if (::fsync(fd) != 0)
        return makeIoError(errno, "fsync()", pathForErrors);
    (void)::fcntl(fd, F_FULLFSYNC);
#else
    if (::fsync(fd) != 0)
        return makeIoError(errno, "fsync()", pathForErrors);
#endif
    return {};
}

Result<void> fsyncFile(const fs::path& p) {
    int fd = ::open(p.c_str(), O_RDONLY | O_CLOEXEC);
    if (fd < 0)
        return makeIoError(errno, "open() for fsync", p);
    auto r = fsyncFd(fd, p);
    ::close(fd);
    return r;
}

Result<void> fsyncDir(const fs::path& dir) {
    int fd = ::open(dir.c_str(), O_RDONLY | O_DIRECTORY | O_CLOEXEC);
    if (fd < 0)
        return makeIoError(errno, "open(O_DIRECTORY)", dir);
    auto r = fsyncFd(fd, dir);
    ::close(fd);
    return r;
}

Result<void> writeAll(int fd, const void* data, std::size_t size, const fs::path& pathForErrors) {
    const auto* p = static_cast<const char*>(data);
    std::size_t left = size;
    while (left > 0) {
        ssize_t n = ::write(fd, p, left);
        if (n < 0) {
            if (errno == EINTR)
                continue;
            return makeIoError(errno, "write()", pathForErrors);
        }
        p += n;
        left -= static_cast<std::size_t>(n);
    }
    return {};
}

Result<void> pwriteAll(int fd, const void* data, std::size_t size, std::uint64_t offset,
                       const fs::path& pathForErrors) {
    const auto* p = static_cast<const char*>(data);
    std::size_t left = size;
    auto pos = static_cast<off_t>(offset);
    while (left > 0) {
        ssize_t n = ::pwrite(fd, p, left, pos);
        if (n < 0) {
            if (errno == EINTR)
                continue;
            return makeIoError(errno, "pwrite()", pathForErrors);
        }
        p += n;
        pos += n;
        left -= static_cast<std::size_t>(n);
    }
    return {};
}

fs::path uniqueSiblingPath(const fs::path& target, std::string_view tag) {
    static std::atomic<std::uint64_t> counter{0};
    std::string name = target.filename().string();
    name.push_back('.');
    name.append(tag);
    name.push_back('.');
    name.append(std::to_string(::getpid()));
    name.push_back('.');
    name.append(std::to_string(counter.fetch_add(1, std::memory_order_relaxed)));
    return target.parent_path() / name;
}

} // namespace mediafetch
