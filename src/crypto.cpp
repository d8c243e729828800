#include "aeon/crypto.hpp"
#include <sodium.h>
#include <format>
#include <stdexcept>

namespace aeon::crypto
{

    // Initialize libsodium on library load
    static struct SodiumInitializer
    {
        SodiumInitializer()
        {
            if (sodium_init() < 0)
            {
                throw std::runtime_error("Failed to initialize libsodium");
            }
        }
    } sodium_initializer;

    // ============================================================================
    // Hex Implementation
    // ============================================================================

    std::string Hex::encode(const uint8_t *data, std::size_t len)
    {
        std::string hex(len * 2 + 1, '\0');
        sodium_bin2hex(hex.data(), hex.size(), data, len);
        hex.resize(len * 2);
        return hex;
    }

    std::string Hex::encode(const Bytes &data)
    {
        return encode(data.data(), data.size());
    }

    Result<Bytes> Hex::decode(std::string_view hex)
    {
        if (hex.size() % 2 != 0)
        {
            return std::unexpected(AeonError::invalid_encoding("Hex string has odd length"));
        }

        Bytes decoded(hex.size() / 2);
        size_t decoded_len = 0;
        const char *hex_end = nullptr;

        if (sodium_hex2bin(
                decoded.data(),
                decoded.size(),
                hex.data(),
                hex.size(),
                nullptr, // no ignored characters
                &decoded_len,
                &hex_end) != 0 ||
            hex_end != hex.data() + hex.size() ||
            decoded_len != decoded.size())
        {
            return std::unexpected(AeonError::invalid_encoding("Invalid hex character"));
        }

        return decoded;
    }

    // ============================================================================
    // SHA256 Implementation
    // ============================================================================

    SHA256Hash SHA256::hash(const Bytes &data)
    {
        SHA256Hash output;
        crypto_hash_sha256(output.data(), data.data(), data.size());
        return output;
    }

    SHA256Hash SHA256::hash(std::string_view data)
    {
        SHA256Hash output;
        crypto_hash_sha256(output.data(),
                           reinterpret_cast<const uint8_t *>(data.data()),
                           data.size());
        return output;
    }

    std::string SHA256::to_hex(const SHA256Hash &hash)
    {
        return Hex::encode(hash.data(), hash.size());
    }

    // ============================================================================
    // HmacSha256 Implementation
    // ============================================================================

    MacTag HmacSha256::mac(const Bytes &key, std::string_view message)
    {
        crypto_auth_hmacsha256_state state;
        MacTag tag;

        crypto_auth_hmacsha256_init(&state, key.data(), key.size());
        crypto_auth_hmacsha256_update(&state,
                                      reinterpret_cast<const uint8_t *>(message.data()),
                                      message.size());
        crypto_auth_hmacsha256_final(&state, tag.data());

        sodium_memzero(&state, sizeof(state));
        return tag;
    }

    // ============================================================================
    // SecureRandom Implementation
    // ============================================================================

    Bytes SecureRandom::generate_bytes(size_t n)
    {
        Bytes buffer(n);
        randombytes_buf(buffer.data(), n);
        return buffer;
    }

    std::string SecureRandom::uuid_v4()
    {
        std::array<uint8_t, 16> b;
        randombytes_buf(b.data(), b.size());

        b[6] = static_cast<uint8_t>((b[6] & 0x0f) | 0x40); // version 4
        b[8] = static_cast<uint8_t>((b[8] & 0x3f) | 0x80); // RFC 4122 variant

        const std::string hex = Hex::encode(b.data(), b.size());
        return std::format("{}-{}-{}-{}-{}",
                           hex.substr(0, 8),
                           hex.substr(8, 4),
                           hex.substr(12, 4),
                           hex.substr(16, 4),
                           hex.substr(20, 12));
    }

    // ============================================================================
    // Constant-time helpers
    // ============================================================================

    bool constant_time_equal(const Bytes &a, const Bytes &b)
    {
        // Lengths are not secret (MAC output size is public)
        if (a.size() != b.size())
        {
            return false;
        }
        return sodium_memcmp(a.data(), b.data(), a.size()) == 0;
    }

    void secure_wipe(Bytes &buffer)
    {
        sodium_memzero(buffer.data(), buffer.size());
        buffer.clear();
    }

    void secure_wipe(std::string &buffer)
    {
        sodium_memzero(buffer.data(), buffer.size());
        buffer.clear();
    }

    // ============================================================================
    // KeyMaterial Implementation
    // ============================================================================

    std::string KeyMaterial::generate()
    {
        Bytes key = SecureRandom::generate_bytes(kSigningKeyBytes);
        std::string hex = Hex::encode(key);
        secure_wipe(key);
        return hex;
    }

    Result<Bytes> KeyMaterial::decode(std::string_view hex)
    {
        auto decoded = Hex::decode(hex);
        if (!decoded)
        {
            return std::unexpected(AeonError::invalid_encoding("Signing key is not valid hex"));
        }
        return decoded;
    }

    std::string KeyMaterial::encode(const Bytes &key)
    {
        return Hex::encode(key);
    }

    std::string KeyMaterial::fingerprint(std::string_view hex_key)
    {
        auto decoded = Hex::decode(hex_key);
        if (!decoded)
        {
            return "invalid";
        }
        auto digest = SHA256::hash(*decoded);
        secure_wipe(*decoded);
        return SHA256::to_hex(digest).substr(0, 16);
    }

} // namespace aeon::crypto
