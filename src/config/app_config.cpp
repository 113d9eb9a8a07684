#include <mediafetch/config/app_config.h>
#include <mediafetch/config/config_helpers.h>

#include <spdlog/spdlog.h>

#include <charconv>
#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <stdexcept>
#include <system_error>

namespace mediafetch::config {

namespace fs = std::filesystem;

namespace {

Error badValue(const std::string& section, const std::string& key, const std::string& raw,
               const std::string& expected) {
    return Error{ErrorCode::InvalidArgument, "config [" + section + "] " + key + " = \"" + raw +
                                                 "\": expected " + expected};
}

// Each reader leaves `out` untouched when the key is absent.
class SectionReader {
public:
    SectionReader(const fs::path& file, std::string section)
        : file_(file), section_(std::move(section)) {}

    Result<void> integer(const std::string& key, std::int64_t& out, std::int64_t min) const {
        auto raw = parse_config_value(file_, section_, key);
        if (raw.empty())
            return {};
        std::int64_t v = 0;
        auto [ptr, ec] = std::from_chars(raw.data(), raw.data() + raw.size(), v);
        if (ec != std::errc() || ptr != raw.data() + raw.size() || v < min)
            return badValue(section_, key, raw, "an integer >= " + std::to_string(min));
        out = v;
        return {};
    }

    Result<void> real(const std::string& key, double& out, double min, double max) const {
        auto raw = parse_config_value(file_, section_, key);
        if (raw.empty())
            return {};
        try {
            std::size_t used = 0;
            double v = std::stod(raw, &used);
            if (used != raw.size() || v < min || v > max)
                return badValue(section_, key, raw, "a number in range");
            out = v;
        } catch (const std::invalid_argument&) {
            return badValue(section_, key, raw, "a number");
        } catch (const std::out_of_range&) {
            return badValue(section_, key, raw, "a number in range");
        }
        return {};
    }

    Result<void> boolean(const std::string& key, bool& out) const {
        auto raw = parse_config_value(file_, section_, key);
        if (raw.empty())
            return {};
        auto v = parse_bool(raw);
        if (!v)
            return badValue(section_, key, raw, "true or false");
        out = *v;
        return {};
    }

    void string(const std::string& key, std::string& out) const {
        auto raw = parse_config_value(file_, section_, key);
        if (!raw.empty())
            out = raw;
    }

    void path(const std::string& key, fs::path& out) const {
        auto raw = parse_config_value(file_, section_, key);
        if (!raw.empty())
            out = expand_tilde(raw);
    }

private:
    const fs::path& file_;
    std::string section_;
};

Result<void> loadDownloader(const fs::path& file, downloader::DownloaderConfig& cfg) {
    SectionReader r(file, "downloader");

    std::int64_t concurrency = static_cast<std::int64_t>(cfg.concurrency);
    std::int64_t timeoutMs = cfg.attemptTimeout.count();
    std::int64_t maxAttempts = cfg.retry.maxAttempts;
    std::int64_t backoffMs = cfg.retry.initialBackoff.count();
    std::int64_t maxBackoffMs = cfg.retry.maxBackoff.count();

    for (auto res : {r.integer("concurrency", concurrency, 1), r.integer("timeout_ms", timeoutMs, 1),
                     r.integer("max_attempts", maxAttempts, 1), r.integer("backoff_ms", backoffMs, 0),
                     r.integer("max_backoff_ms", maxBackoffMs, 0),
                     r.real("backoff_mult", cfg.retry.multiplier, 1.0, 100.0),
                     r.real("jitter", cfg.retry.jitter, 0.0, 1.0),
                     r.boolean("tls_insecure", cfg.transport.tls.insecure),
                     r.boolean("skip_existing", cfg.skipExistingFile)}) {
        if (!res)
            return res;
    }

    cfg.concurrency = static_cast<std::size_t>(concurrency);
    cfg.attemptTimeout = std::chrono::milliseconds(timeoutMs);
    cfg.retry.maxAttempts = static_cast<int>(maxAttempts);
    cfg.retry.initialBackoff = std::chrono::milliseconds(backoffMs);
    cfg.retry.maxBackoff = std::chrono::milliseconds(maxBackoffMs);

    r.string("ca_path", cfg.transport.tls.caPath);
    r.string("user_agent", cfg.transport.userAgent);
    std::string proxy;
    r.string("proxy", proxy);
    if (!proxy.empty())
        cfg.transport.proxy = proxy;
    return {};
}

} // namespace

Result<AppConfig> loadAppConfig(const fs::path& configPath) {
    AppConfig cfg;
    cfg.source = configPath;
    cfg.ledger.path = get_config_dir() / "downloaded_history.json";

    std::error_code ec;
    if (!configPath.empty() && fs::exists(configPath, ec)) {
        if (auto r = loadDownloader(configPath, cfg.downloader); !r)
            return r.error();

        SectionReader ledger(configPath, "ledger");
        ledger.path("path", cfg.ledger.path);
        if (auto r = ledger.boolean("fsync", cfg.ledger.fsync); !r)
            return r.error();

        SectionReader logging(configPath, "logging");
        logging.string("level", cfg.logging.level);
        logging.path("file", cfg.logging.file);
        spdlog::debug("Loaded config from {}", configPath.string());
    } else {
        spdlog::debug("No config file at {}; using defaults", configPath.string());
    }

    if (const char* env = std::getenv("MEDIAFETCH_LEDGER_PATH"); env && *env) {
        cfg.ledger.path = expand_tilde(env);
    }
    if (const char* env = std::getenv("MEDIAFETCH_LOG_LEVEL"); env && *env) {
        cfg.logging.level = env;
    }
    return cfg;
}

} // namespace mediafetch::config
