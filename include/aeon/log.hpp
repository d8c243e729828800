#pragma once

#include "types.hpp"
#include <spdlog/spdlog.h>
#include <memory>
#include <string>

namespace aeon::log
{

    /** Shared "aeon" logger (stderr, colored); created on first use. */
    std::shared_ptr<spdlog::logger> logger();

    /**
     * Set the logger threshold by name ("trace", "debug", "info", "warn",
     * "error", "critical", "off"). Unknown names are a ConfigError.
     */
    Result<void> set_level(const std::string &level);

} // namespace aeon::log
