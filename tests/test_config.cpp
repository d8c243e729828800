#include <catch2/catch_test_macros.hpp>
#include "aeon/config.hpp"
#include "aeon/log.hpp"
#include <cstdlib>
#include <string>
#include <vector>

using namespace aeon;

namespace
{
    // Clears the AEON_* overrides around a test
    struct CleanEnv
    {
        CleanEnv() { clear(); }
        ~CleanEnv() { clear(); }

        static void clear()
        {
            for (const char *var : {"AEON_MAX_AGE_MS", "AEON_DID_DIR", "AEON_REPLAY_TTL_MS",
                                    "AEON_REPLAY_MAX_ENTRIES", "AEON_LOG_LEVEL"})
                ::unsetenv(var);
        }
    };
}

TEST_CASE("Config defaults", "[config]")
{
    CleanEnv env;
    auto cfg = ConfigLoader::from_environment();
    REQUIRE(cfg.has_value());
    REQUIRE(cfg->signing.max_age_ms == 300000);
    REQUIRE(cfg->storage.did_directory.empty());
    REQUIRE(cfg->replay.ttl_ms == 600000);
    REQUIRE(cfg->replay.max_entries == 100000);
    REQUIRE(cfg->logging.level == "info");

    auto empty = ConfigLoader::from_string("");
    REQUIRE(empty.has_value());
    REQUIRE(empty->signing.max_age_ms == 300000);
}

TEST_CASE("Config from TOML", "[config]")
{
    CleanEnv env;
    auto cfg = ConfigLoader::from_string(R"(
[signing]
max_age_ms = 5000

[storage]
did_directory = "/var/lib/aeon/dids"

[replay]
ttl_ms = 20000
max_entries = 64

[logging]
level = "debug"
)");
    REQUIRE(cfg.has_value());
    REQUIRE(cfg->signing.max_age_ms == 5000);
    REQUIRE(cfg->storage.did_directory == "/var/lib/aeon/dids");
    REQUIRE(cfg->replay.ttl_ms == 20000);
    REQUIRE(cfg->replay.max_entries == 64);
    REQUIRE(cfg->logging.level == "debug");

    auto j = ConfigLoader::to_json(*cfg);
    REQUIRE(j["signing"]["max_age_ms"] == 5000);
    REQUIRE(j["storage"]["did_directory"] == "/var/lib/aeon/dids");
    REQUIRE(j["replay"]["max_entries"] == 64);
    REQUIRE(j["logging"]["level"] == "debug");
}

TEST_CASE("Config errors", "[config]")
{
    CleanEnv env;

    for (const char *toml : {"[signing\nmax_age_ms = 1",
                             "[signing]\nmax_age_ms = -1",
                             "[replay]\nttl_ms = -5",
                             "[replay]\nmax_entries = -1",
                             "[signing]\nmax_age_ms = \"5000\"",
                             "[signing]\nmax_age_ms = 5000.0",
                             "[replay]\nttl_ms = true",
                             "[replay]\nmax_entries = \"64\"",
                             "[storage]\ndid_directory = 42",
                             "[logging]\nlevel = [\"debug\"]",
                             "signing = 5"})
    {
        auto cfg = ConfigLoader::from_string(toml);
        REQUIRE_FALSE(cfg.has_value());
        REQUIRE(cfg.error().code == ErrorCode::ConfigError);
    }

    auto missing = ConfigLoader::load("/nonexistent/aeon.toml");
    REQUIRE_FALSE(missing.has_value());
    REQUIRE(missing.error().code == ErrorCode::ConfigError);
}

TEST_CASE("Environment overrides take precedence", "[config]")
{
    CleanEnv env;
    ::setenv("AEON_MAX_AGE_MS", "1234", 1);
    ::setenv("AEON_DID_DIR", "/tmp/aeon-dids", 1);
    ::setenv("AEON_REPLAY_TTL_MS", "9999", 1);
    ::setenv("AEON_REPLAY_MAX_ENTRIES", "7", 1);
    ::setenv("AEON_LOG_LEVEL", "warn", 1);

    auto cfg = ConfigLoader::from_string("[signing]\nmax_age_ms = 5000\n");
    REQUIRE(cfg.has_value());
    REQUIRE(cfg->signing.max_age_ms == 1234);
    REQUIRE(cfg->storage.did_directory == "/tmp/aeon-dids");
    REQUIRE(cfg->replay.ttl_ms == 9999);
    REQUIRE(cfg->replay.max_entries == 7);
    REQUIRE(cfg->logging.level == "warn");

    SECTION("Non-numeric values are rejected")
    {
        ::setenv("AEON_MAX_AGE_MS", "5s", 1);
        auto bad = ConfigLoader::from_environment();
        REQUIRE_FALSE(bad.has_value());
        REQUIRE(bad.error().code == ErrorCode::ConfigError);
    }

    SECTION("Negative windows are rejected")
    {
        ::setenv("AEON_MAX_AGE_MS", "-1", 1);
        REQUIRE(ConfigLoader::from_environment().error().code == ErrorCode::ConfigError);
    }
}

TEST_CASE("Log level names", "[config]")
{
    for (const std::string level : {"trace", "debug", "info", "warn", "error", "critical", "off"})
        REQUIRE(log::set_level(level).has_value());

    auto bad = log::set_level("loud");
    REQUIRE_FALSE(bad.has_value());
    REQUIRE(bad.error().code == ErrorCode::ConfigError);

    REQUIRE(log::set_level("info").has_value());
}
