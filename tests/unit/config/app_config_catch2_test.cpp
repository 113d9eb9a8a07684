#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>

#include <mediafetch/config/app_config.h>
#include <mediafetch/config/config_helpers.h>

#include "../../support/temp_dir_scope.hpp"

#include <cstdlib>
#include <optional>
#include <string>

using namespace mediafetch;
using namespace mediafetch::config;
using mediafetch::test_support::TempDirScope;
using mediafetch::test_support::writeTextFile;

namespace {

// Sets an environment variable for the lifetime of the guard.
class EnvGuard {
public:
    EnvGuard(const char* name, const char* value) : name_(name) {
        if (const char* old = std::getenv(name))
            previous_ = old;
        if (value)
            ::setenv(name, value, 1);
        else
            ::unsetenv(name);
    }
    ~EnvGuard() {
        if (previous_)
            ::setenv(name_, previous_->c_str(), 1);
        else
            ::unsetenv(name_);
    }

private:
    const char* name_;
    std::optional<std::string> previous_;
};

} // namespace

TEST_CASE("parse_config_value reads sections, dotted keys and comments", "[config]") {
    auto tmp = TempDirScope::unique_under("mf-config");
    const auto file = tmp / "config.toml";
    writeTextFile(file, R"(# mediafetch
ledger.path = "/tmp/dotted.json"

[downloader]
concurrency = 4   # per job
user_agent = "agent # with hash"

[logging]
level = 'debug'
)");

    CHECK(parse_config_value(file, "downloader", "concurrency") == "4");
    CHECK(parse_config_value(file, "downloader", "user_agent") == "agent # with hash");
    CHECK(parse_config_value(file, "logging", "level") == "debug");
    CHECK(parse_config_value(file, "ledger", "path") == "/tmp/dotted.json");
    CHECK(parse_config_value(file, "logging", "concurrency").empty());
    CHECK(parse_config_value(tmp / "absent.toml", "downloader", "concurrency").empty());
}

TEST_CASE("parse_bool accepts the usual spellings", "[config]") {
    CHECK(parse_bool("true") == std::optional<bool>(true));
    CHECK(parse_bool(" ON ") == std::optional<bool>(true));
    CHECK(parse_bool("1") == std::optional<bool>(true));
    CHECK(parse_bool("no") == std::optional<bool>(false));
    CHECK(parse_bool("Off") == std::optional<bool>(false));
    CHECK_FALSE(parse_bool("maybe").has_value());
}

TEST_CASE("loadAppConfig applies file values over defaults", "[config]") {
    auto tmp = TempDirScope::unique_under("mf-config");
    EnvGuard ledgerEnv("MEDIAFETCH_LEDGER_PATH", nullptr);
    EnvGuard levelEnv("MEDIAFETCH_LOG_LEVEL", nullptr);
    const auto file = tmp / "config.toml";
    writeTextFile(file, R"(
[downloader]
concurrency = 2
timeout_ms = 1500
max_attempts = 7
backoff_ms = 100
max_backoff_ms = 800
backoff_mult = 1.5
jitter = 0.1
tls_insecure = yes
skip_existing = false
proxy = "http://proxy:3128"

[ledger]
path = "/var/lib/mediafetch/history.json"
fsync = off

[logging]
level = warn
)");

    auto cfg = loadAppConfig(file);
    REQUIRE(cfg);
    const auto& c = cfg.value();
    CHECK(c.source == file);
    CHECK(c.downloader.concurrency == 2);
    CHECK(c.downloader.attemptTimeout.count() == 1500);
    CHECK(c.downloader.retry.maxAttempts == 7);
    CHECK(c.downloader.retry.initialBackoff.count() == 100);
    CHECK(c.downloader.retry.maxBackoff.count() == 800);
    CHECK(c.downloader.retry.multiplier == 1.5);
    CHECK(c.downloader.retry.jitter == 0.1);
    CHECK(c.downloader.transport.tls.insecure);
    CHECK_FALSE(c.downloader.skipExistingFile);
    CHECK(c.downloader.transport.proxy == std::optional<std::string>("http://proxy:3128"));
    CHECK(c.ledger.path == "/var/lib/mediafetch/history.json");
    CHECK_FALSE(c.ledger.fsync);
    CHECK(c.logging.level == "warn");
}

TEST_CASE("loadAppConfig uses defaults when the file is missing", "[config]") {
    auto tmp = TempDirScope::unique_under("mf-config");
    EnvGuard xdg("XDG_CONFIG_HOME", tmp.path().c_str());
    EnvGuard ledgerEnv("MEDIAFETCH_LEDGER_PATH", nullptr);
    EnvGuard levelEnv("MEDIAFETCH_LOG_LEVEL", nullptr);

    auto cfg = loadAppConfig(tmp / "missing.toml");
    REQUIRE(cfg);
    CHECK(cfg.value().downloader.concurrency == 8);
    CHECK(cfg.value().downloader.retry.maxAttempts == 5);
    CHECK(cfg.value().ledger.path == tmp.path() / "mediafetch" / "downloaded_history.json");
    CHECK(cfg.value().logging.level == "info");
}

TEST_CASE("loadAppConfig reports unparsable values", "[config]") {
    auto tmp = TempDirScope::unique_under("mf-config");
    const auto file = tmp / "config.toml";

    SECTION("integer") {
        writeTextFile(file, "[downloader]\nconcurrency = lots\n");
        auto cfg = loadAppConfig(file);
        REQUIRE_FALSE(cfg);
        CHECK(cfg.error().code == ErrorCode::InvalidArgument);
        CHECK_THAT(cfg.error().message, Catch::Matchers::ContainsSubstring("[downloader]"));
        CHECK_THAT(cfg.error().message, Catch::Matchers::ContainsSubstring("concurrency"));
    }

    SECTION("out of range") {
        writeTextFile(file, "[downloader]\njitter = 3\n");
        CHECK_FALSE(loadAppConfig(file));
    }

    SECTION("boolean") {
        writeTextFile(file, "[ledger]\nfsync = sometimes\n");
        auto cfg = loadAppConfig(file);
        REQUIRE_FALSE(cfg);
        CHECK_THAT(cfg.error().message, Catch::Matchers::ContainsSubstring("fsync"));
    }
}

TEST_CASE("Environment overrides win over the config file", "[config]") {
    auto tmp = TempDirScope::unique_under("mf-config");
    const auto file = tmp / "config.toml";
    writeTextFile(file, "[ledger]\npath = /from/file.json\n[logging]\nlevel = info\n");
    EnvGuard ledgerEnv("MEDIAFETCH_LEDGER_PATH", "/from/env.json");
    EnvGuard levelEnv("MEDIAFETCH_LOG_LEVEL", "trace");

    auto cfg = loadAppConfig(file);
    REQUIRE(cfg);
    CHECK(cfg.value().ledger.path == "/from/env.json");
    CHECK(cfg.value().logging.level == "trace");
}
