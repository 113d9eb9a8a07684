#pragma once

#include <mediafetch/core/types.h>
#include <mediafetch/downloader/downloader.hpp>

#include <filesystem>
#include <string>

namespace mediafetch::config {

struct LedgerConfig {
    std::filesystem::path path; // default: <config dir>/downloaded_history.json
    bool fsync{true};
};

struct LoggingConfig {
    std::string level{"info"};
    std::filesystem::path file; // empty = stderr only
};

/**
 * Effective application configuration: defaults, then the config file, then environment
 * (MEDIAFETCH_LEDGER_PATH, MEDIAFETCH_LOG_LEVEL).
 */
struct AppConfig {
    downloader::DownloaderConfig downloader{};
    LedgerConfig ledger{};
    LoggingConfig logging{};
    std::filesystem::path source; // file the values were read from (may not exist)
};

/**
 * Load configuration from `configPath`. A missing file yields the defaults; a present value
 * that does not parse is an InvalidArgument error naming the section and key.
 */
Result<AppConfig> loadAppConfig(const std::filesystem::path& configPath);

} // namespace mediafetch::config
