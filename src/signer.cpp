#include "aeon/signer.hpp"
#include "aeon/json_canonicalization.hpp"
#include "aeon/time_util.hpp"
#include <format>

namespace aeon
{

    Clock system_clock()
    {
        return [] { return epoch_millis_now(); };
    }

    NonceSource random_nonce_source()
    {
        return [] { return crypto::SecureRandom::uuid_v4(); };
    }

    Result<void> check_signing_key(const crypto::Bytes &key)
    {
        if (key.size() != crypto::kSigningKeyBytes)
        {
            return std::unexpected(AeonError::invalid_key(std::format(
                "Signing key must be {} bytes, got {}", crypto::kSigningKeyBytes, key.size())));
        }
        return {};
    }

    nlohmann::json Signature::to_json() const
    {
        return nlohmann::json{{"timestamp", timestamp},
                              {"nonce", nonce},
                              {"hash", hash}};
    }

    Result<Signature> Signature::from_json(const nlohmann::json &j)
    {
        if (!j.is_object())
        {
            return std::unexpected(AeonError::parsing("Signature must be a JSON object"));
        }
        for (const char *field : {"timestamp", "nonce", "hash"})
        {
            if (!j.contains(field) || !j.at(field).is_string())
            {
                return std::unexpected(AeonError::parsing(
                    std::format("Signature field '{}' missing or not a string", field)));
            }
        }
        return Signature{j.at("timestamp").get<std::string>(),
                         j.at("nonce").get<std::string>(),
                         j.at("hash").get<std::string>()};
    }

    MessageSigner::MessageSigner()
        : clock_(system_clock()), nonces_(random_nonce_source()) {}

    MessageSigner::MessageSigner(Clock clock, NonceSource nonces)
        : clock_(std::move(clock)), nonces_(std::move(nonces)) {}

    std::string MessageSigner::signing_payload(std::string_view timestamp,
                                               std::string_view nonce,
                                               const nlohmann::json &message)
    {
        return std::format("{}:{}:{}", timestamp, nonce, json::CanonicalEncoder::canonicalize(message));
    }

    Result<Signature> MessageSigner::sign(const crypto::Bytes &key,
                                          const nlohmann::json &message,
                                          const SignOptions &options) const
    {
        if (auto ok = check_signing_key(key); !ok)
            return std::unexpected(ok.error());

        Signature sig;
        sig.timestamp = options.timestamp ? *options.timestamp : std::to_string(clock_());
        sig.nonce = options.nonce ? *options.nonce : nonces_();

        const std::string payload = signing_payload(sig.timestamp, sig.nonce, message);
        const auto tag = crypto::HmacSha256::mac(key, payload);
        sig.hash = crypto::Hex::encode(tag.data(), tag.size());
        return sig;
    }

    Result<Signature> MessageSigner::sign(std::string_view hex_key,
                                          const nlohmann::json &message,
                                          const SignOptions &options) const
    {
        auto key = crypto::KeyMaterial::decode(hex_key);
        if (!key)
            return std::unexpected(key.error());

        auto sig = sign(*key, message, options);
        crypto::secure_wipe(*key);
        return sig;
    }

    Result<std::string> MessageSigner::hash(const crypto::Bytes &key, const nlohmann::json &message)
    {
        if (auto ok = check_signing_key(key); !ok)
            return std::unexpected(ok.error());

        const auto tag = crypto::HmacSha256::mac(key, json::CanonicalEncoder::canonicalize(message));
        return crypto::Hex::encode(tag.data(), tag.size());
    }

} // namespace aeon
