#include "aeon/verifier.hpp"
#include "aeon/log.hpp"
#include <charconv>

namespace aeon
{

    namespace
    {
        bool reject(const char *reason)
        {
            log::logger()->debug("signature rejected: {}", reason);
            return false;
        }
    } // namespace

    bool parse_epoch_millis(std::string_view s, std::int64_t &out)
    {
        if (s.empty())
            return false;
        const char *first = s.data();
        const char *last = s.data() + s.size();
        auto [ptr, ec] = std::from_chars(first, last, out);
        return ec == std::errc() && ptr == last;
    }

    MessageVerifier::MessageVerifier() : clock_(system_clock()) {}

    MessageVerifier::MessageVerifier(Clock clock) : clock_(std::move(clock)) {}

    Result<bool> MessageVerifier::verify(const crypto::Bytes &key,
                                         const Signature &signature,
                                         const nlohmann::json &message,
                                         std::int64_t max_age_ms) const
    {
        if (auto ok = check_signing_key(key); !ok)
            return std::unexpected(ok.error());

        // 1. timestamp
        std::int64_t signed_at = 0;
        if (!parse_epoch_millis(signature.timestamp, signed_at))
            return reject("BAD_TIMESTAMP");

        // 2. symmetric window, inclusive at max_age_ms
        if (max_age_ms < 0)
            return reject("TS_WINDOW");
        const std::int64_t now = clock_();
        const std::uint64_t age = now >= signed_at
                                      ? static_cast<std::uint64_t>(now) - static_cast<std::uint64_t>(signed_at)
                                      : static_cast<std::uint64_t>(signed_at) - static_cast<std::uint64_t>(now);
        if (age > static_cast<std::uint64_t>(max_age_ms))
            return reject("TS_WINDOW");

        // 3. re-derive the MAC from the presented timestamp and nonce
        const MessageSigner signer(clock_, random_nonce_source());
        auto expected = signer.sign(key, message, SignOptions{signature.timestamp, signature.nonce});
        if (!expected)
            return std::unexpected(expected.error());

        // 4. both sides as bytes
        auto presented_mac = crypto::Hex::decode(signature.hash);
        if (!presented_mac)
            return reject("BAD_SIG_FORMAT");
        auto expected_mac = crypto::Hex::decode(expected->hash);
        if (!expected_mac)
            return reject("BAD_SIG_FORMAT");

        // 5. constant-time comparison
        if (!crypto::constant_time_equal(*presented_mac, *expected_mac))
            return reject("BAD_SIG");

        return true;
    }

    Result<bool> MessageVerifier::verify(std::string_view hex_key,
                                         const Signature &signature,
                                         const nlohmann::json &message,
                                         std::int64_t max_age_ms) const
    {
        auto key = crypto::KeyMaterial::decode(hex_key);
        if (!key)
            return std::unexpected(key.error());

        auto verified = verify(*key, signature, message, max_age_ms);
        crypto::secure_wipe(*key);
        return verified;
    }

} // namespace aeon
