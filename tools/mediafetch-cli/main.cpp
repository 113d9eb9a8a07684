#include <csignal>
#include <memory>

#include <CLI/CLI.hpp>
#include <spdlog/spdlog.h>
#include <mediafetch/cli/commands.h>

namespace {

void onSigint(int) {
    mediafetch::cli::g_interrupted.store(true);
}

} // namespace

int main(int argc, char* argv[]) {
    using namespace mediafetch::cli;

    // Conservative default until CliRuntime::init() applies the configured level
    spdlog::set_level(spdlog::level::warn);
    spdlog::set_pattern("[%H:%M:%S] [%l] %v");

    auto runtime = std::make_shared<CliRuntime>();

    CLI::App app{"mediafetch - chunked, encrypted media downloader with download history"};
    app.require_subcommand(1);
    app.add_option("--config", runtime->options.configPath, "Config file (TOML-style sections).");
    app.add_option("--ledger", runtime->options.ledgerPath, "Download history file.");
    app.add_option("--log-level", runtime->options.logLevel,
                   "trace, debug, info, warn, error or off.")
        ->check(CLI::IsMember({"trace", "debug", "info", "warn", "error", "off"}));
    app.add_option("--log-file", runtime->options.logFile, "Also log to this rotating file.");

    registerDownloadCommand(app, runtime);
    registerHistoryCommand(app, runtime);

    std::signal(SIGINT, onSigint);

    try {
        app.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        const int rc = app.exit(e);
        return rc == 0 ? kExitOk : kExitUsage;
    } catch (const std::exception& e) {
        spdlog::error("Fatal error: {}", e.what());
        return kExitFailure;
    }
    return runtime->exitCode;
}
