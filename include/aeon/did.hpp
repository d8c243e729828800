#pragma once

#include "types.hpp"
#include "signer.hpp"
#include "verifier.hpp"
#include <nlohmann/json.hpp>
#include <chrono>
#include <optional>
#include <string>
#include <string_view>

namespace aeon
{

    /// "did:aeon:"
    inline constexpr std::string_view kDidPrefix = "did:aeon:";

    /// True if name is non-empty and only [a-z0-9-]
    bool is_valid_did_name(std::string_view name);

    /**
     * Identity document binding did:aeon:<name> to a signing key.
     *
     * Immutable once constructed; key rotation means issuing a new document.
     */
    class IdentityDocument
    {
    public:
        const std::string &did() const { return did_; }
        const std::string &name() const { return name_; }

        /** Hex-encoded 256-bit secret. Never log this. */
        const std::string &signing_key() const { return signing_key_; }

        std::chrono::system_clock::time_point created_at() const { return created_at_; }
        const std::optional<nlohmann::json> &metadata() const { return metadata_; }

        /**
         * Serialize for storage. With include_secret == false the key is
         * replaced by its fingerprint.
         */
        nlohmann::json to_json(bool include_secret = true) const;

        /**
         * Load a stored document; did, name and key are validated again.
         */
        static Result<IdentityDocument> from_json(const nlohmann::json &j);

    private:
        friend class DidIssuer;

        IdentityDocument(std::string name,
                         std::string signing_key,
                         std::chrono::system_clock::time_point created_at,
                         std::optional<nlohmann::json> metadata);

        std::string did_;
        std::string name_;
        std::string signing_key_;
        std::chrono::system_clock::time_point created_at_;
        std::optional<nlohmann::json> metadata_;
    };

    /**
     * Issues did:aeon identities. No registry lookup is made; uniqueness of
     * names across a deployment is the caller's concern.
     */
    class DidIssuer
    {
    public:
        DidIssuer();
        explicit DidIssuer(Clock clock);

        /**
         * @param name [a-z0-9-]+ (InvalidName otherwise)
         * @param signing_key Hex key; generated when absent
         * @param metadata Opaque, passed through
         */
        Result<IdentityDocument> create(const std::string &name,
                                        std::optional<std::string> signing_key = std::nullopt,
                                        std::optional<nlohmann::json> metadata = std::nullopt) const;

        /**
         * Extract the name from "did:aeon:<name>" (InvalidDid otherwise)
         */
        static Result<std::string> parse_name(std::string_view did);

    private:
        Clock clock_;
    };

    /**
     * An identity document together with the signing operations that use its key.
     */
    class AgentIdentity
    {
    public:
        explicit AgentIdentity(IdentityDocument document);
        AgentIdentity(IdentityDocument document, MessageSigner signer, MessageVerifier verifier);

        const IdentityDocument &document() const { return document_; }
        const std::string &did() const { return document_.did(); }

        Result<Signature> sign(const nlohmann::json &message, const SignOptions &options = {}) const;

        /** Sign the bare DID string; used to authenticate a connection */
        Result<Signature> sign_identity() const;

        Result<bool> verify(const Signature &signature,
                            const nlohmann::json &message,
                            std::int64_t max_age_ms = kDefaultMaxAgeMillis) const;

    private:
        IdentityDocument document_;
        MessageSigner signer_;
        MessageVerifier verifier_;
    };

} // namespace aeon
