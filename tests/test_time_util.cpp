#include <catch2/catch_test_macros.hpp>
#include "aeon/time_util.hpp"

using namespace aeon;

namespace
{
    std::int64_t millis(std::chrono::system_clock::time_point tp)
    {
        return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
    }
}

TEST_CASE("ISO 8601 formatting", "[time]")
{
    const auto tp = std::chrono::system_clock::time_point(std::chrono::milliseconds(1700000000123));
    REQUIRE(format_iso8601(tp) == "2023-11-14T22:13:20.123Z");
    REQUIRE(format_iso8601(std::chrono::system_clock::time_point{}) == "1970-01-01T00:00:00.000Z");
}

TEST_CASE("ISO 8601 parsing", "[time]")
{
    auto with_ms = parse_iso8601("2023-11-14T22:13:20.123Z");
    REQUIRE(with_ms.has_value());
    REQUIRE(millis(*with_ms) == 1700000000123);

    auto plain = parse_iso8601("2023-11-14T22:13:20Z");
    REQUIRE(plain.has_value());
    REQUIRE(millis(*plain) == 1700000000000);
}

TEST_CASE("ISO 8601 parsing rejects malformed fields", "[time]")
{
    for (const char *bad : {"",
                            "yesterday",
                            "2023-11-14 22:13:20Z",
                            "2023-11-14T22:13:20",
                            "2023-11-14T22:13:20+01:00",
                            "2023-11-14T-1:-1:-1Z",
                            "2023-11-14T+1:13:20Z",
                            "2023-11-14T22:13:20.-12Z",
                            "-023-11-14T22:13:20Z",
                            "2023-13-14T22:13:20Z",
                            "2023-11-00T22:13:20Z",
                            "2023-11-14T24:13:20Z",
                            "2023-11-14T22:60:20Z"})
    {
        auto res = parse_iso8601(bad);
        REQUIRE_FALSE(res.has_value());
        REQUIRE(res.error().code == ErrorCode::ParsingError);
    }
}
