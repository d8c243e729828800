#pragma once

#include "types.hpp"
#include "signer.hpp"
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <string>
#include <string_view>
#include <unordered_map>

namespace aeon
{
    /**
     * Thread-safe record of consumed (agent DID, nonce) pairs for callers that
     * need exactly-once acceptance on top of MessageVerifier's time window.
     *
     * Entries expire after ttl_ms; the TTL should be at least twice the
     * verifier's max_age_ms so a nonce cannot outlive its record. Unexpired
     * entries are never evicted: when max_entries live pairs are held, new
     * pairs are rejected until some expire.
     */
    class ReplayCache
    {
    public:
        struct Config
        {
            std::int64_t ttl_ms{10 * 60 * 1000};
            std::size_t max_entries{100000};
        };

        ReplayCache();
        explicit ReplayCache(const Config &cfg, Clock clock = system_clock());

        /**
         * Record the pair. Returns false if it was already present (replay) or
         * the cache is full of unexpired entries.
         */
        bool check_and_insert(std::string_view agent_did, std::string_view nonce);

        /** Drop expired entries. */
        void gc();

        std::size_t size() const;

    private:
        void drop_expired_locked(std::int64_t now);

        Config cfg_;
        Clock clock_;
        mutable std::mutex mutex_;
        std::unordered_map<std::string, std::int64_t> seen_; // key -> inserted_at (ms)
    };

} // namespace aeon
