#pragma once

#include <mediafetch/core/types.h>

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>

namespace mediafetch {

// Map an errno value from a failed file operation onto the resource error codes.
ErrorCode errorCodeFromErrno(int err);

Error makeIoError(int err, const std::string& what, const std::filesystem::path& path);

// Durability helpers (POSIX fsync on a descriptor, a file path, or a directory entry table).
Result<void> fsyncFd(int fd, const std::filesystem::path& pathForErrors);
Result<void> fsyncFile(const std::filesystem::path& p);
Result<void> fsyncDir(const std::filesystem::path& dir);

// Full write of a buffer to a descriptor, retrying on EINTR and short writes.
Result<void> writeAll(int fd, const void* data, std::size_t size,
                      const std::filesystem::path& pathForErrors);

// Positioned full write (pwrite loop).
Result<void> pwriteAll(int fd, const void* data, std::size_t size, std::uint64_t offset,
                       const std::filesystem::path& pathForErrors);

// Unique sibling path for temporary files: "<dir>/<name>.<tag>.<pid>.<counter>".
std::filesystem::path uniqueSiblingPath(const std::filesystem::path& target, std::string_view tag);

} // namespace mediafetch
