#pragma once

#include "types.hpp"
#include "signer.hpp"
#include <nlohmann/json.hpp>
#include <cstdint>
#include <string_view>

namespace aeon
{

    /// Default replay window: five minutes
    inline constexpr std::int64_t kDefaultMaxAgeMillis = 5 * 60 * 1000;

    /**
     * Stateless, time-bounded verification of MessageSigner signatures.
     *
     * Every malformation of the presented signature (unparsable timestamp,
     * timestamp outside the window in either direction, bad hex, wrong MAC)
     * yields false. The error channel is reserved for the verifier's own key:
     * InvalidKey or InvalidEncoding.
     *
     * No nonce is remembered between calls: a captured signature replays until
     * its window closes. Callers that need exactly-once semantics consult a
     * ReplayCache after a successful verify().
     */
    class MessageVerifier
    {
    public:
        MessageVerifier();
        explicit MessageVerifier(Clock clock);

        /**
         * @param key 32-byte secret
         * @param signature Presented (timestamp, nonce, hash)
         * @param message Message the signature claims to cover
         * @param max_age_ms Inclusive bound on |now - timestamp|; negative accepts nothing
         */
        Result<bool> verify(const crypto::Bytes &key,
                            const Signature &signature,
                            const nlohmann::json &message,
                            std::int64_t max_age_ms = kDefaultMaxAgeMillis) const;

        Result<bool> verify(std::string_view hex_key,
                            const Signature &signature,
                            const nlohmann::json &message,
                            std::int64_t max_age_ms = kDefaultMaxAgeMillis) const;

    private:
        Clock clock_;
    };

    /**
     * Strict decimal epoch-millisecond parse: optional '-', digits only,
     * whole string consumed, no overflow.
     */
    bool parse_epoch_millis(std::string_view s, std::int64_t &out);

} // namespace aeon
