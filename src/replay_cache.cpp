#include "aeon/replay_cache.hpp"
#include "aeon/log.hpp"
#include <string>

namespace aeon
{
    namespace
    {
        // length-prefixed so no (did, nonce) pair can collide with another
        std::string make_key(std::string_view agent_did, std::string_view nonce)
        {
            std::string key = std::to_string(agent_did.size());
            key.reserve(key.size() + 1 + agent_did.size() + nonce.size());
            key.push_back(':');
            key.append(agent_did);
            key.append(nonce);
            return key;
        }
    } // namespace

    ReplayCache::ReplayCache() : cfg_{}, clock_(system_clock()) {}

    ReplayCache::ReplayCache(const Config &cfg, Clock clock)
        : cfg_(cfg), clock_(std::move(clock)) {}

    bool ReplayCache::check_and_insert(std::string_view agent_did, std::string_view nonce)
    {
        const std::int64_t now = clock_();
        auto key = make_key(agent_did, nonce);

        std::lock_guard lock(mutex_);

        auto it = seen_.find(key);
        if (it != seen_.end())
        {
            if (now - it->second <= cfg_.ttl_ms)
            {
                log::logger()->warn("replayed nonce from {}", agent_did);
                return false;
            }
            it->second = now;
            return true;
        }

        if (seen_.size() >= cfg_.max_entries)
        {
            drop_expired_locked(now);
            // live entries are never evicted; a full cache rejects
            if (seen_.size() >= cfg_.max_entries)
            {
                log::logger()->warn("replay cache full ({} live entries), rejecting nonce from {}",
                                    seen_.size(), agent_did);
                return false;
            }
        }

        seen_.emplace(std::move(key), now);
        return true;
    }

    void ReplayCache::gc()
    {
        const std::int64_t now = clock_();
        std::lock_guard lock(mutex_);
        drop_expired_locked(now);
    }

    std::size_t ReplayCache::size() const
    {
        std::lock_guard lock(mutex_);
        return seen_.size();
    }

    void ReplayCache::drop_expired_locked(std::int64_t now)
    {
        std::erase_if(seen_, [&](const auto &kv)
                      { return now - kv.second > cfg_.ttl_ms; });
    }

} // namespace aeon
