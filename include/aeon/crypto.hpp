#pragma once

#include "types.hpp"
#include <array>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace aeon::crypto
{

    // Type aliases for clarity
    using Bytes = std::vector<uint8_t>;
    using SHA256Hash = std::array<uint8_t, 32>;
    using MacTag = std::array<uint8_t, 32>;

    /// Length of a signing key in bytes (256 bits)
    inline constexpr std::size_t kSigningKeyBytes = 32;

    /**
     * Lowercase hex encoding/decoding
     */
    class Hex
    {
    public:
        static std::string encode(const uint8_t *data, std::size_t len);
        static std::string encode(const Bytes &data);

        /**
         * Decode hex text (either case). Fails on odd length or non-hex characters.
         */
        static Result<Bytes> decode(std::string_view hex);
    };

    /**
     * SHA-256 hashing
     */
    class SHA256
    {
    public:
        static SHA256Hash hash(const Bytes &data);
        static SHA256Hash hash(std::string_view data);
        static std::string to_hex(const SHA256Hash &hash);
    };

    /**
     * HMAC-SHA256 keyed hash
     */
    class HmacSha256
    {
    public:
        /**
         * Compute the MAC of message under key
         * @param key Secret key bytes (any length)
         * @param message Data to authenticate
         */
        static MacTag mac(const Bytes &key, std::string_view message);
    };

    /**
     * Cryptographically secure random number generation
     */
    class SecureRandom
    {
    public:
        /**
         * Generate N random bytes
         */
        static Bytes generate_bytes(size_t n);

        /**
         * Random RFC 4122 version 4 UUID, lowercase canonical form
         */
        static std::string uuid_v4();
    };

    /**
     * Equality whose running time depends only on the length of the inputs.
     * Inputs of different length compare unequal.
     */
    bool constant_time_equal(const Bytes &a, const Bytes &b);

    /// Zero the contents of a buffer holding secret material
    void secure_wipe(Bytes &buffer);
    void secure_wipe(std::string &buffer);

    /**
     * Symmetric signing secrets: generation and hex transport encoding
     */
    class KeyMaterial
    {
    public:
        /**
         * Generate a fresh 256-bit key
         * @return 64 lowercase hex characters
         */
        static std::string generate();

        /**
         * Decode a hex key into raw bytes (InvalidEncoding on bad hex)
         */
        static Result<Bytes> decode(std::string_view hex);

        /**
         * Encode raw key bytes as lowercase hex
         */
        static std::string encode(const Bytes &key);

        /**
         * Short, non-reversible identifier for a key, safe to log
         */
        static std::string fingerprint(std::string_view hex_key);
    };

} // namespace aeon::crypto
