#include <catch2/catch_test_macros.hpp>
#include "aeon/json_canonicalization.hpp"

using namespace aeon::json;
using json = nlohmann::json;

TEST_CASE("Canonical form - simple object sorts keys", "[json]")
{
    json obj = {
        {"z", 3},
        {"a", 1},
        {"m", 2}};

    REQUIRE(CanonicalEncoder::canonicalize(obj) == R"({"a":1,"m":2,"z":3})");
}

TEST_CASE("Canonical form - nested objects sorted at every level", "[json]")
{
    json obj = {
        {"tool", "search"},
        {"args", {{"q", "x"}, {"limit", 10}}}};

    REQUIRE(CanonicalEncoder::canonicalize(obj) == R"({"args":{"limit":10,"q":"x"},"tool":"search"})");
}

TEST_CASE("Canonical form - array order is preserved", "[json]")
{
    json arr = {3, 1, 2, json{{"b", 1}, {"a", 2}}};
    REQUIRE(CanonicalEncoder::canonicalize(arr) == R"([3,1,2,{"a":2,"b":1}])");
}

TEST_CASE("Canonical form - top-level string is returned verbatim", "[json]")
{
    REQUIRE(CanonicalEncoder::canonicalize(json("did:aeon:my-agent")) == "did:aeon:my-agent");
    REQUIRE(CanonicalEncoder::canonicalize(json("he said \"hi\"\n")) == "he said \"hi\"\n");
    REQUIRE(CanonicalEncoder::canonicalize(json("")) == "");
}

TEST_CASE("Canonical form - nested strings are escaped", "[json]")
{
    json obj = {
        {"quote", "He said \"hello\""},
        {"newline", "line1\nline2"},
        {"ctrl", std::string("a\x01")}};

    REQUIRE(CanonicalEncoder::canonicalize(obj) ==
            R"({"ctrl":"a\u0001","newline":"line1\nline2","quote":"He said \"hello\""})");
}

TEST_CASE("Canonical form - scalars", "[json]")
{
    json obj = {
        {"int", 42},
        {"negative", -17},
        {"float", 1.5},
        {"bool_true", true},
        {"bool_false", false},
        {"null_val", nullptr}};

    REQUIRE(CanonicalEncoder::canonicalize(obj) ==
            R"({"bool_false":false,"bool_true":true,"float":1.5,"int":42,"negative":-17,"null_val":null})");

    REQUIRE(CanonicalEncoder::canonicalize(json(42)) == "42");
    REQUIRE(CanonicalEncoder::canonicalize(json(nullptr)) == "null");
    REQUIRE(CanonicalEncoder::canonicalize(json(true)) == "true");
}

TEST_CASE("Canonical form - empty structures", "[json]")
{
    REQUIRE(CanonicalEncoder::canonicalize(json::object()) == "{}");
    REQUIRE(CanonicalEncoder::canonicalize(json::array()) == "[]");
}

TEST_CASE("Canonical form - insertion order does not matter", "[json]")
{
    nlohmann::ordered_json first;
    first["tool"] = "search";
    first["args"]["q"] = "x";
    first["args"]["page"] = 2;

    nlohmann::ordered_json second;
    second["args"]["page"] = 2;
    second["args"]["q"] = "x";
    second["tool"] = "search";

    const auto a = CanonicalEncoder::canonicalize(first);
    const auto b = CanonicalEncoder::canonicalize(second);
    REQUIRE(a == b);
    REQUIRE(a == R"({"args":{"page":2,"q":"x"},"tool":"search"})");

    // and the same bytes as the sorted container
    REQUIRE(CanonicalEncoder::canonicalize(json::parse(first.dump())) == a);
}

TEST_CASE("Canonical form - UTF-8 passes through unescaped", "[json]")
{
    json obj = {{"name", "caf\xc3\xa9"}};
    REQUIRE(CanonicalEncoder::canonicalize(obj) == "{\"name\":\"caf\xc3\xa9\"}");
}

TEST_CASE("Canonical form - invalid UTF-8 does not throw", "[json]")
{
    json obj = {{"bad", std::string("\xff\xfe")}};
    std::string out;
    REQUIRE_NOTHROW(out = CanonicalEncoder::canonicalize(obj));
    REQUIRE(out.starts_with("{\"bad\":\""));
}

TEST_CASE("Canonical form - deep nesting", "[json]")
{
    json value = "leaf";
    for (int i = 0; i < 200; ++i)
    {
        value = json{{"k", value}};
    }
    const auto out = CanonicalEncoder::canonicalize(value);
    REQUIRE(out.size() == 200 * 6 + 6);
    REQUIRE(out.find("\"leaf\"") != std::string::npos);
}

TEST_CASE("Canonical form - from JSON text", "[json]")
{
    auto ok = CanonicalEncoder::canonicalize_string(R"({ "b": [1, 2], "a": {"y": null, "x": true} })");
    REQUIRE(ok.has_value());
    REQUIRE(*ok == R"({"a":{"x":true,"y":null},"b":[1,2]})");

    auto bad = CanonicalEncoder::canonicalize_string("{not json");
    REQUIRE_FALSE(bad.has_value());
    REQUIRE(bad.error().code == aeon::ErrorCode::ParsingError);
}
