#include "aeon/config.hpp"
#include <toml++/toml.h>
#include <charconv>
#include <cstdlib>
#include <format>
#include <fstream>
#include <sstream>

namespace aeon
{
    namespace
    {
        template <typename T>
        Result<T> parse_env_number(const char *var, const char *value)
        {
            T out{};
            const std::string_view s(value);
            auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), out);
            if (s.empty() || ec != std::errc() || ptr != s.data() + s.size())
            {
                return std::unexpected(AeonError::config(
                    std::format("Environment variable {} is not a valid number: '{}'", var, s)));
            }
            return out;
        }

        // A present key of the wrong type is an error, never a silent default
        Result<void> read_integer(const toml::table &section, const char *section_name,
                                  const char *key, std::int64_t &out)
        {
            const toml::node *node = section.get(key);
            if (!node)
                return {};
            auto value = node->value_exact<std::int64_t>();
            if (!value)
            {
                return std::unexpected(AeonError::config(
                    std::format("{}.{} must be an integer", section_name, key)));
            }
            out = *value;
            return {};
        }

        Result<void> read_string(const toml::table &section, const char *section_name,
                                 const char *key, std::string &out)
        {
            const toml::node *node = section.get(key);
            if (!node)
                return {};
            auto value = node->value_exact<std::string>();
            if (!value)
            {
                return std::unexpected(AeonError::config(
                    std::format("{}.{} must be a string", section_name, key)));
            }
            out = *value;
            return {};
        }

        Result<const toml::table *> read_section(const toml::table &tbl, const char *name)
        {
            const toml::node *node = tbl.get(name);
            if (!node)
                return nullptr;
            if (!node->is_table())
                return std::unexpected(AeonError::config(std::format("[{}] must be a table", name)));
            return node->as_table();
        }

        Result<AeonConfig> parse_toml(const toml::table &tbl, AeonConfig cfg)
        {
            auto signing = read_section(tbl, "signing");
            if (!signing)
                return std::unexpected(signing.error());
            if (*signing)
            {
                if (auto r = read_integer(**signing, "signing", "max_age_ms", cfg.signing.max_age_ms); !r)
                    return std::unexpected(r.error());
            }

            auto storage = read_section(tbl, "storage");
            if (!storage)
                return std::unexpected(storage.error());
            if (*storage)
            {
                if (auto r = read_string(**storage, "storage", "did_directory", cfg.storage.did_directory); !r)
                    return std::unexpected(r.error());
            }

            auto replay = read_section(tbl, "replay");
            if (!replay)
                return std::unexpected(replay.error());
            if (*replay)
            {
                if (auto r = read_integer(**replay, "replay", "ttl_ms", cfg.replay.ttl_ms); !r)
                    return std::unexpected(r.error());
                std::int64_t max_entries = static_cast<std::int64_t>(cfg.replay.max_entries);
                if (auto r = read_integer(**replay, "replay", "max_entries", max_entries); !r)
                    return std::unexpected(r.error());
                if (max_entries < 0)
                    return std::unexpected(AeonError::config("replay.max_entries must not be negative"));
                cfg.replay.max_entries = static_cast<std::size_t>(max_entries);
            }

            auto logging = read_section(tbl, "logging");
            if (!logging)
                return std::unexpected(logging.error());
            if (*logging)
            {
                if (auto r = read_string(**logging, "logging", "level", cfg.logging.level); !r)
                    return std::unexpected(r.error());
            }

            return cfg;
        }

    } // namespace

    Result<AeonConfig> ConfigLoader::load(const std::string &path)
    {
        std::ifstream file(path);
        if (!file.is_open())
        {
            return std::unexpected(AeonError::config("Unable to open config file: " + path));
        }
        std::stringstream buffer;
        buffer << file.rdbuf();
        return from_string(buffer.str());
    }

    Result<AeonConfig> ConfigLoader::from_string(const std::string &toml_content)
    {
        AeonConfig cfg{};

        try
        {
            auto tbl = toml::parse(toml_content);
            auto parsed = parse_toml(tbl, cfg);
            if (!parsed)
                return parsed;
            cfg = *parsed;
        }
        catch (const toml::parse_error &e)
        {
            return std::unexpected(AeonError::config(std::string("Failed to parse TOML: ") + e.what()));
        }

        if (auto env = apply_env_overrides(cfg); !env)
            return std::unexpected(env.error());
        if (auto ok = validate(cfg); !ok)
            return std::unexpected(ok.error());
        return cfg;
    }

    Result<AeonConfig> ConfigLoader::from_environment()
    {
        AeonConfig cfg{};
        if (auto env = apply_env_overrides(cfg); !env)
            return std::unexpected(env.error());
        if (auto ok = validate(cfg); !ok)
            return std::unexpected(ok.error());
        return cfg;
    }

    Result<void> ConfigLoader::apply_env_overrides(AeonConfig &cfg)
    {
        if (const char *age = std::getenv("AEON_MAX_AGE_MS"))
        {
            auto v = parse_env_number<std::int64_t>("AEON_MAX_AGE_MS", age);
            if (!v)
                return std::unexpected(v.error());
            cfg.signing.max_age_ms = *v;
        }
        if (const char *dir = std::getenv("AEON_DID_DIR"))
            cfg.storage.did_directory = dir;
        if (const char *ttl = std::getenv("AEON_REPLAY_TTL_MS"))
        {
            auto v = parse_env_number<std::int64_t>("AEON_REPLAY_TTL_MS", ttl);
            if (!v)
                return std::unexpected(v.error());
            cfg.replay.ttl_ms = *v;
        }
        if (const char *max = std::getenv("AEON_REPLAY_MAX_ENTRIES"))
        {
            auto v = parse_env_number<std::size_t>("AEON_REPLAY_MAX_ENTRIES", max);
            if (!v)
                return std::unexpected(v.error());
            cfg.replay.max_entries = *v;
        }
        if (const char *level = std::getenv("AEON_LOG_LEVEL"))
            cfg.logging.level = level;
        return {};
    }

    Result<void> ConfigLoader::validate(const AeonConfig &cfg)
    {
        if (cfg.signing.max_age_ms < 0)
            return std::unexpected(AeonError::config("signing.max_age_ms must not be negative"));
        if (cfg.replay.ttl_ms < 0)
            return std::unexpected(AeonError::config("replay.ttl_ms must not be negative"));
        return {};
    }

    nlohmann::json ConfigLoader::to_json(const AeonConfig &cfg)
    {
        nlohmann::json j;
        j["signing"] = {{"max_age_ms", cfg.signing.max_age_ms}};
        j["storage"] = {{"did_directory", cfg.storage.did_directory}};
        j["replay"] = {{"ttl_ms", cfg.replay.ttl_ms}, {"max_entries", cfg.replay.max_entries}};
        j["logging"] = {{"level", cfg.logging.level}};
        return j;
    }

} // namespace aeon
