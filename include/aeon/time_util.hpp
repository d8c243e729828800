#pragma once

#include "types.hpp"
#include <chrono>
#include <cstdint>
#include <string>

namespace aeon
{

    /// Current UTC time as milliseconds since the Unix epoch
    std::int64_t epoch_millis_now();

    /// "YYYY-MM-DDTHH:MM:SS.mmmZ"
    std::string format_iso8601(std::chrono::system_clock::time_point tp);

    /**
     * Parse "YYYY-MM-DDTHH:MM:SSZ" or "YYYY-MM-DDTHH:MM:SS.mmmZ" (UTC only)
     */
    Result<std::chrono::system_clock::time_point> parse_iso8601(const std::string &s);

} // namespace aeon
