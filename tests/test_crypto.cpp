#include <catch2/catch_test_macros.hpp>
#include "aeon/crypto.hpp"
#include <algorithm>
#include <string>

using namespace aeon::crypto;

TEST_CASE("Hex encoding/decoding", "[crypto]")
{
    Bytes data = {0x00, 0x01, 0x7f, 0x80, 0xFE, 0xFF};

    REQUIRE(Hex::encode(data) == "00017f80feff");

    auto decoded = Hex::decode("00017F80feFF");
    REQUIRE(decoded.has_value());
    REQUIRE(*decoded == data);

    auto empty = Hex::decode("");
    REQUIRE(empty.has_value());
    REQUIRE(empty->empty());
}

TEST_CASE("Hex decoding rejects malformed input", "[crypto]")
{
    for (const char *bad : {"abc", "zz", "0g", "00 11", "0x00"})
    {
        auto decoded = Hex::decode(bad);
        REQUIRE_FALSE(decoded.has_value());
        REQUIRE(decoded.error().code == aeon::ErrorCode::InvalidEncoding);
    }
}

TEST_CASE("SHA-256 hashing", "[crypto]")
{
    REQUIRE(SHA256::to_hex(SHA256::hash(std::string_view("abc"))) ==
            "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
}

TEST_CASE("HMAC-SHA256 matches RFC 4231 test case 2", "[crypto]")
{
    Bytes key = {'J', 'e', 'f', 'e'};
    auto tag = HmacSha256::mac(key, "what do ya want for nothing?");
    REQUIRE(Hex::encode(tag.data(), tag.size()) ==
            "5bdcc146bf60754e6a042426089575c75a003f089d2739839dec58b964ec3843");
}

TEST_CASE("Key generation", "[crypto][keys]")
{
    auto k1 = KeyMaterial::generate();
    auto k2 = KeyMaterial::generate();

    REQUIRE(k1.size() == 64);
    REQUIRE(std::all_of(k1.begin(), k1.end(), [](char c)
                        { return (c >= '0' && c <= '9') || (c >= 'a' && c <= 'f'); }));
    REQUIRE(k1 != k2);

    auto bytes = KeyMaterial::decode(k1);
    REQUIRE(bytes.has_value());
    REQUIRE(bytes->size() == kSigningKeyBytes);
    REQUIRE(KeyMaterial::encode(*bytes) == k1);
}

TEST_CASE("Key decoding reports InvalidEncoding", "[crypto][keys]")
{
    auto res = KeyMaterial::decode("not-a-hex-key");
    REQUIRE_FALSE(res.has_value());
    REQUIRE(res.error().code == aeon::ErrorCode::InvalidEncoding);
}

TEST_CASE("Key fingerprint does not reveal the key", "[crypto][keys]")
{
    Bytes key(32);
    for (size_t i = 0; i < key.size(); ++i)
        key[i] = static_cast<uint8_t>(i);
    const auto hex = KeyMaterial::encode(key);

    const auto fp = KeyMaterial::fingerprint(hex);
    REQUIRE(fp == "630dcd2966c43366");
    REQUIRE(hex.find(fp) == std::string::npos);
    REQUIRE(KeyMaterial::fingerprint("zz") == "invalid");
}

TEST_CASE("Constant-time equality", "[crypto]")
{
    Bytes a = {1, 2, 3, 4};
    Bytes b = {1, 2, 3, 4};
    Bytes c = {1, 2, 3, 5};
    Bytes d = {1, 2, 3};

    REQUIRE(constant_time_equal(a, b));
    REQUIRE_FALSE(constant_time_equal(a, c));
    REQUIRE_FALSE(constant_time_equal(a, d));
}

TEST_CASE("Secure random generation", "[crypto]")
{
    auto bytes1 = SecureRandom::generate_bytes(32);
    auto bytes2 = SecureRandom::generate_bytes(32);

    REQUIRE(bytes1.size() == 32);
    REQUIRE(bytes2.size() == 32);
    REQUIRE(bytes1 != bytes2); // Should be different with high probability
}

TEST_CASE("Random UUIDs are version 4", "[crypto]")
{
    auto id = SecureRandom::uuid_v4();
    REQUIRE(id.size() == 36);
    REQUIRE(id[8] == '-');
    REQUIRE(id[13] == '-');
    REQUIRE(id[18] == '-');
    REQUIRE(id[23] == '-');
    REQUIRE(id[14] == '4');
    REQUIRE(std::string("89ab").find(id[19]) != std::string::npos);
    REQUIRE(id != SecureRandom::uuid_v4());
}

TEST_CASE("Secure wipe clears buffers", "[crypto]")
{
    Bytes secret = {1, 2, 3};
    secure_wipe(secret);
    REQUIRE(secret.empty());

    std::string text = "secret";
    secure_wipe(text);
    REQUIRE(text.empty());
}
