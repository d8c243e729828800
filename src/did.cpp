#include "aeon/did.hpp"
#include "aeon/log.hpp"
#include "aeon/time_util.hpp"
#include <algorithm>
#include <format>

namespace aeon
{

    namespace
    {
        // Decode, check length, and return the lowercase canonical hex form
        Result<std::string> normalize_signing_key(std::string_view hex)
        {
            auto key = crypto::KeyMaterial::decode(hex);
            if (!key)
                return std::unexpected(key.error());
            if (auto ok = check_signing_key(*key); !ok)
            {
                crypto::secure_wipe(*key);
                return std::unexpected(ok.error());
            }
            std::string normalized = crypto::KeyMaterial::encode(*key);
            crypto::secure_wipe(*key);
            return normalized;
        }
    } // namespace

    bool is_valid_did_name(std::string_view name)
    {
        return !name.empty() && std::all_of(name.begin(), name.end(), [](char c)
                                            { return (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') || c == '-'; });
    }

    // ============================================================================
    // IdentityDocument
    // ============================================================================

    IdentityDocument::IdentityDocument(std::string name,
                                       std::string signing_key,
                                       std::chrono::system_clock::time_point created_at,
                                       std::optional<nlohmann::json> metadata)
        : did_(std::string(kDidPrefix) + name),
          name_(std::move(name)),
          signing_key_(std::move(signing_key)),
          created_at_(created_at),
          metadata_(std::move(metadata))
    {
    }

    nlohmann::json IdentityDocument::to_json(bool include_secret) const
    {
        nlohmann::json j;
        j["did"] = did_;
        j["name"] = name_;
        if (include_secret)
            j["signingKey"] = signing_key_;
        else
            j["signingKeyFingerprint"] = crypto::KeyMaterial::fingerprint(signing_key_);
        j["createdAt"] = format_iso8601(created_at_);
        if (metadata_)
            j["metadata"] = *metadata_;
        return j;
    }

    Result<IdentityDocument> IdentityDocument::from_json(const nlohmann::json &j)
    {
        if (!j.is_object())
            return std::unexpected(AeonError::parsing("Identity document must be a JSON object"));

        for (const char *field : {"did", "name", "signingKey", "createdAt"})
        {
            if (!j.contains(field) || !j.at(field).is_string())
            {
                return std::unexpected(AeonError::parsing(
                    std::format("Identity document field '{}' missing or not a string", field)));
            }
        }

        auto name = j.at("name").get<std::string>();
        if (!is_valid_did_name(name))
            return std::unexpected(AeonError::invalid_name("Invalid DID name in document: " + name));

        const auto did = j.at("did").get<std::string>();
        if (did != std::string(kDidPrefix) + name)
            return std::unexpected(AeonError::invalid_did("DID does not match name: " + did));

        auto key = normalize_signing_key(j.at("signingKey").get<std::string>());
        if (!key)
            return std::unexpected(key.error());

        auto created_at = parse_iso8601(j.at("createdAt").get<std::string>());
        if (!created_at)
            return std::unexpected(created_at.error());

        std::optional<nlohmann::json> metadata;
        if (j.contains("metadata") && !j.at("metadata").is_null())
            metadata = j.at("metadata");

        return IdentityDocument(std::move(name), std::move(*key), *created_at, std::move(metadata));
    }

    // ============================================================================
    // DidIssuer
    // ============================================================================

    DidIssuer::DidIssuer() : clock_(system_clock()) {}

    DidIssuer::DidIssuer(Clock clock) : clock_(std::move(clock)) {}

    Result<IdentityDocument> DidIssuer::create(const std::string &name,
                                               std::optional<std::string> signing_key,
                                               std::optional<nlohmann::json> metadata) const
    {
        if (!is_valid_did_name(name))
        {
            return std::unexpected(AeonError::invalid_name(
                "Invalid DID name. Use lowercase letters, numbers, and hyphens."));
        }

        std::string key;
        if (signing_key)
        {
            auto normalized = normalize_signing_key(*signing_key);
            if (!normalized)
                return std::unexpected(normalized.error());
            key = std::move(*normalized);
        }
        else
        {
            key = crypto::KeyMaterial::generate();
        }

        const auto created_at = std::chrono::system_clock::time_point(
            std::chrono::duration_cast<std::chrono::system_clock::duration>(
                std::chrono::milliseconds(clock_())));

        IdentityDocument doc(name, std::move(key), created_at, std::move(metadata));
        log::logger()->info("issued {} key={}", doc.did(), crypto::KeyMaterial::fingerprint(doc.signing_key()));
        return doc;
    }

    Result<std::string> DidIssuer::parse_name(std::string_view did)
    {
        if (!did.starts_with(kDidPrefix))
        {
            return std::unexpected(AeonError::invalid_did(
                std::format("Invalid AEON DID format: {}", did)));
        }
        const std::string_view name = did.substr(kDidPrefix.size());
        if (!is_valid_did_name(name))
        {
            return std::unexpected(AeonError::invalid_did(
                std::format("Invalid AEON DID name: {}", did)));
        }
        return std::string(name);
    }

    // ============================================================================
    // AgentIdentity
    // ============================================================================

    AgentIdentity::AgentIdentity(IdentityDocument document)
        : document_(std::move(document))
    {
    }

    AgentIdentity::AgentIdentity(IdentityDocument document, MessageSigner signer, MessageVerifier verifier)
        : document_(std::move(document)),
          signer_(std::move(signer)),
          verifier_(std::move(verifier))
    {
    }

    Result<Signature> AgentIdentity::sign(const nlohmann::json &message, const SignOptions &options) const
    {
        return signer_.sign(document_.signing_key(), message, options);
    }

    Result<Signature> AgentIdentity::sign_identity() const
    {
        return sign(nlohmann::json(document_.did()));
    }

    Result<bool> AgentIdentity::verify(const Signature &signature,
                                       const nlohmann::json &message,
                                       std::int64_t max_age_ms) const
    {
        return verifier_.verify(document_.signing_key(), signature, message, max_age_ms);
    }

} // namespace aeon
