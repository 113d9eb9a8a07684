#include <mediafetch/cli/commands.h>
#include <mediafetch/config/config_helpers.h>

#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <vector>

namespace mediafetch::cli {

Result<void> setupLogging(const std::string& level, const std::filesystem::path& file) {
    try {
        std::vector<spdlog::sink_ptr> sinks;
        sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
        if (!file.empty()) {
            sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                file.string(), 10 * 1024 * 1024, 3));
        }

        auto logger = std::make_shared<spdlog::logger>("mediafetch", sinks.begin(), sinks.end());
        spdlog::set_default_logger(logger);

        if (level == "trace")
            spdlog::set_level(spdlog::level::trace);
        else if (level == "debug")
            spdlog::set_level(spdlog::level::debug);
        else if (level == "warn")
            spdlog::set_level(spdlog::level::warn);
        else if (level == "error")
            spdlog::set_level(spdlog::level::err);
        else if (level == "off")
            spdlog::set_level(spdlog::level::off);
        else
            spdlog::set_level(spdlog::level::info);

        spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] [%n] %v");
    } catch (const spdlog::spdlog_ex& e) {
        return Error{ErrorCode::IoError, std::string("Failed to setup logging: ") + e.what()};
    }
    return {};
}

Result<void> CliRuntime::init() {
    if (initialized_)
        return {};

    auto loaded = config::loadAppConfig(config::get_config_path(options.configPath));
    if (!loaded)
        return loaded.error();
    config_ = std::move(loaded).value();

    if (!options.ledgerPath.empty())
        config_.ledger.path = config::expand_tilde(options.ledgerPath);
    if (!options.logLevel.empty())
        config_.logging.level = options.logLevel;
    if (!options.logFile.empty())
        config_.logging.file = config::expand_tilde(options.logFile);

    if (auto lg = setupLogging(config_.logging.level, config_.logging.file); !lg)
        return lg;

    ledger::LedgerStore::Options storeOptions;
    storeOptions.fsync = config_.ledger.fsync;
    ledger_ = std::make_unique<ledger::DedupLedger>(
        ledger::LedgerStore(config_.ledger.path, storeOptions));
    auto opened = ledger_->open();
    if (!opened)
        return opened.error();

    spdlog::debug("Using ledger {} ({} entries)", config_.ledger.path.string(),
                  opened.value().entries);
    initialized_ = true;
    return {};
}

} // namespace mediafetch::cli
