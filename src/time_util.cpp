#include "aeon/time_util.hpp"
#include <algorithm>
#include <charconv>
#include <ctime>
#include <format>

namespace aeon
{

    namespace
    {
        bool parse_field(const std::string &s, std::size_t pos, std::size_t len, int &out)
        {
            const char *first = s.data() + pos;
            const char *last = first + len;
            // digits only; from_chars alone would take a sign
            if (!std::all_of(first, last, [](char c)
                             { return c >= '0' && c <= '9'; }))
                return false;
            auto [ptr, ec] = std::from_chars(first, last, out);
            return ec == std::errc() && ptr == last;
        }
    } // namespace

    std::int64_t epoch_millis_now()
    {
        return std::chrono::duration_cast<std::chrono::milliseconds>(
                   std::chrono::system_clock::now().time_since_epoch())
            .count();
    }

    std::string format_iso8601(std::chrono::system_clock::time_point tp)
    {
        auto time_t_now = std::chrono::system_clock::to_time_t(tp);
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()) % 1000;
        if (ms.count() < 0)
        {
            // pre-epoch instants: to_time_t truncated toward zero
            ms += std::chrono::milliseconds(1000);
            time_t_now -= 1;
        }

        std::tm tm_buf;
        gmtime_r(&time_t_now, &tm_buf);
        return std::format("{:04d}-{:02d}-{:02d}T{:02d}:{:02d}:{:02d}.{:03d}Z",
                           tm_buf.tm_year + 1900,
                           tm_buf.tm_mon + 1,
                           tm_buf.tm_mday,
                           tm_buf.tm_hour,
                           tm_buf.tm_min,
                           tm_buf.tm_sec,
                           static_cast<int>(ms.count()));
    }

    Result<std::chrono::system_clock::time_point> parse_iso8601(const std::string &s)
    {
        const bool with_ms = s.size() == 24 && s[19] == '.' && s[23] == 'Z';
        const bool plain = s.size() == 20 && s[19] == 'Z';
        if ((!with_ms && !plain) || s[4] != '-' || s[7] != '-' ||
            s[10] != 'T' || s[13] != ':' || s[16] != ':')
        {
            return std::unexpected(AeonError::parsing("Invalid ISO 8601 timestamp: " + s));
        }

        int y = 0, m = 0, d = 0, H = 0, M = 0, S = 0, ms = 0;
        if (!parse_field(s, 0, 4, y) || !parse_field(s, 5, 2, m) || !parse_field(s, 8, 2, d) ||
            !parse_field(s, 11, 2, H) || !parse_field(s, 14, 2, M) || !parse_field(s, 17, 2, S) ||
            (with_ms && !parse_field(s, 20, 3, ms)))
        {
            return std::unexpected(AeonError::parsing("Invalid ISO 8601 timestamp: " + s));
        }
        if (m < 1 || m > 12 || d < 1 || d > 31 || H > 23 || M > 59 || S > 60)
        {
            return std::unexpected(AeonError::parsing("ISO 8601 field out of range: " + s));
        }

        std::tm tm{};
        tm.tm_year = y - 1900;
        tm.tm_mon = m - 1;
        tm.tm_mday = d;
        tm.tm_hour = H;
        tm.tm_min = M;
        tm.tm_sec = S;
        // timegm is a GNU extension (Linux)
        const std::time_t epoch = timegm(&tm);
        return std::chrono::system_clock::from_time_t(epoch) + std::chrono::milliseconds(ms);
    }

} // namespace aeon
