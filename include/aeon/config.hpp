#pragma once

#include "types.hpp"
#include <nlohmann/json.hpp>
#include <cstddef>
#include <cstdint>
#include <string>

namespace aeon
{

    struct SigningConfig
    {
        std::int64_t max_age_ms{5 * 60 * 1000};
    };

    struct StorageConfig
    {
        std::string did_directory; // empty: FileDidStore::default_directory()
    };

    struct ReplayConfig
    {
        std::int64_t ttl_ms{10 * 60 * 1000};
        std::size_t max_entries{100000};
    };

    struct LoggingConfig
    {
        std::string level{"info"};
    };

    struct AeonConfig
    {
        SigningConfig signing{};
        StorageConfig storage{};
        ReplayConfig replay{};
        LoggingConfig logging{};
    };

    /**
     * ConfigLoader loads TOML configs with environment overrides.
     *
     * [signing] max_age_ms, [storage] did_directory, [replay] ttl_ms / max_entries,
     * [logging] level. Environment: AEON_MAX_AGE_MS, AEON_DID_DIR,
     * AEON_REPLAY_TTL_MS, AEON_REPLAY_MAX_ENTRIES, AEON_LOG_LEVEL.
     */
    class ConfigLoader
    {
    public:
        /** Load config from a TOML file path. Environment overrides take precedence. */
        static Result<AeonConfig> load(const std::string &path);

        /** Parse config from TOML string content. */
        static Result<AeonConfig> from_string(const std::string &toml_content);

        /** Defaults plus environment overrides, no file. */
        static Result<AeonConfig> from_environment();

        /** Serialize config to JSON for inspection. */
        static nlohmann::json to_json(const AeonConfig &cfg);

    private:
        static Result<void> apply_env_overrides(AeonConfig &cfg);
        static Result<void> validate(const AeonConfig &cfg);
    };

} // namespace aeon
