#pragma once

#include "types.hpp"
#include "crypto.hpp"
#include <nlohmann/json.hpp>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>

namespace aeon
{

    /// Source of "now" in milliseconds since the Unix epoch
    using Clock = std::function<std::int64_t()>;

    /// Source of fresh per-signature nonces
    using NonceSource = std::function<std::string()>;

    Clock system_clock();
    NonceSource random_nonce_source();

    /**
     * MAC over "<timestamp>:<nonce>:<canonical message>".
     * Wire shape: {"timestamp": "...", "nonce": "...", "hash": "<64 hex>"}
     */
    struct Signature
    {
        std::string timestamp; // decimal epoch milliseconds
        std::string nonce;
        std::string hash; // lowercase hex HMAC-SHA256

        nlohmann::json to_json() const;
        static Result<Signature> from_json(const nlohmann::json &j);

        bool operator==(const Signature &) const = default;
    };

    struct SignOptions
    {
        std::optional<std::string> timestamp;
        std::optional<std::string> nonce;
    };

    /**
     * HMAC-SHA256 message signer.
     *
     * With explicit timestamp and nonce, sign() is a pure function of
     * (key, message, timestamp, nonce); verification relies on this.
     */
    class MessageSigner
    {
    public:
        MessageSigner();
        MessageSigner(Clock clock, NonceSource nonces);

        /**
         * Sign a message with raw key bytes
         * @param key 32-byte secret (InvalidKey otherwise)
         * @param message Any structured value; a bare string is signed verbatim
         * @param options Explicit timestamp/nonce, generated when absent
         */
        Result<Signature> sign(const crypto::Bytes &key,
                               const nlohmann::json &message,
                               const SignOptions &options = {}) const;

        /**
         * Sign with a hex-encoded key (InvalidEncoding if not hex)
         */
        Result<Signature> sign(std::string_view hex_key,
                               const nlohmann::json &message,
                               const SignOptions &options = {}) const;

        /**
         * MAC of the canonical message alone, without timestamp or nonce.
         * Deterministic content digest; carries no freshness.
         */
        static Result<std::string> hash(const crypto::Bytes &key, const nlohmann::json &message);

        /// "<timestamp>:<nonce>:<canonical message>"
        static std::string signing_payload(std::string_view timestamp,
                                           std::string_view nonce,
                                           const nlohmann::json &message);

    private:
        Clock clock_;
        NonceSource nonces_;
    };

    /// Reject keys of the wrong length for the MAC
    Result<void> check_signing_key(const crypto::Bytes &key);

} // namespace aeon
