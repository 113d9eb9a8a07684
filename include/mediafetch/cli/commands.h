#pragma once

#include <mediafetch/config/app_config.h>
#include <mediafetch/core/types.h>
#include <mediafetch/ledger/ledger.hpp>

#include <atomic>
#include <filesystem>
#include <memory>
#include <string>

namespace CLI {
class App;
}

namespace mediafetch::cli {

// Process exit codes
inline constexpr int kExitOk = 0;
inline constexpr int kExitFailure = 1;
inline constexpr int kExitUsage = 2;
inline constexpr int kExitInterrupted = 130;

// Set from the SIGINT handler; polled by long-running commands.
inline std::atomic<bool> g_interrupted{false};

struct GlobalOptions {
    std::string configPath;
    std::string ledgerPath;
    std::string logLevel;
    std::string logFile;
};

/**
 * Composition root shared by the subcommands: effective configuration, logging and the one
 * DedupLedger instance of the process. Initialized after argument parsing.
 */
class CliRuntime {
public:
    GlobalOptions options;
    int exitCode{kExitOk};

    // Loads config, applies global overrides, configures logging and opens the ledger.
    Result<void> init();

    config::AppConfig& config() { return config_; }
    ledger::DedupLedger& ledger() { return *ledger_; }

private:
    config::AppConfig config_{};
    std::unique_ptr<ledger::DedupLedger> ledger_;
    bool initialized_{false};
};

/**
 * Install the default spdlog logger: colored stderr plus an optional rotating file
 * (10 MiB x 3). Unknown levels fall back to info.
 */
Result<void> setupLogging(const std::string& level, const std::filesystem::path& file);

void registerDownloadCommand(CLI::App& app, std::shared_ptr<CliRuntime> runtime);
void registerHistoryCommand(CLI::App& app, std::shared_ptr<CliRuntime> runtime);

} // namespace mediafetch::cli
