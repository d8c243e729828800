#include "aeon/log.hpp"
#include <spdlog/sinks/stdout_color_sinks.h>
#include <mutex>

namespace aeon::log
{

    std::shared_ptr<spdlog::logger> logger()
    {
        static std::once_flag once;
        static std::shared_ptr<spdlog::logger> instance;
        std::call_once(once, []
                       {
            instance = spdlog::get("aeon");
            if (!instance)
            {
                instance = spdlog::stderr_color_mt("aeon");
                instance->set_pattern("[%Y-%m-%dT%H:%M:%S.%eZ] [%n] [%l] %v", spdlog::pattern_time_type::utc);
            } });
        return instance;
    }

    Result<void> set_level(const std::string &level)
    {
        auto parsed = spdlog::level::from_str(level);
        // from_str maps unknown names to "off"
        if (parsed == spdlog::level::off && level != "off")
        {
            return std::unexpected(AeonError::config("Unknown log level: " + level));
        }
        logger()->set_level(parsed);
        return {};
    }

} // namespace aeon::log
