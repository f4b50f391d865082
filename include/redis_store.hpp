#pragma once

#include <string>
#include <memory>
#include <atomic>
#include <sw/redis++/redis++.h>

#include "credential_store.hpp"
#include "pool_config.hpp"

namespace credpool {

 
// Redis-backed CredentialStore: the durable source of truth for pool state
// and cached responses across process restarts.
//
// Layout (all keys under the configured prefix):
//   pool:row:<param>  HASH  use_count, last_used
//   pool:fresh        ZSET  fresh rows, score = use_count * 1e10 + last_used
//   pool:spent        ZSET  exhausted rows, score = last_used
//   pool:limit        STRING freshness limit the fresh/spent split was built with
//   cache:<key>       HASH  value, ts (expires after the cache TTL)
// Every mutation runs as one Lua script, which Redis executes atomically.
class RedisStore : public CredentialStore {
public:
    RedisStore(const PoolConfig& config, EpochClock clock = system_epoch_seconds);
    ~RedisStore() override = default;

    RedisStore(const RedisStore&) = delete;
    RedisStore& operator=(const RedisStore&) = delete;

    // Connection health check.
    bool is_connected() const { return connected_; }

    std::optional<std::string> get_cache(const std::string& key) override;
    void set_cache(const std::string& key, const std::string& value) override;

    std::size_t add_credentials(const std::vector<std::string>& params) override;
    long long count_available() override;
    std::optional<std::string> allocate() override;

    std::optional<CredentialRow> find(const std::string& param) override;
    PoolStats stats() override;

    // Deletes every key under this store's prefix. Returns the number removed.
    long long clear();

private:
    std::unique_ptr<sw::redis::Redis> redis_;
    std::atomic<bool> connected_{false};

    const std::string prefix_;
    const long long fresh_use_limit_;
    const long long cooldown_sec_;
    const long long cache_ttl_sec_;
    EpochClock clock_;

    std::string row_key(const std::string& param) const { return prefix_ + "pool:row:" + param; }
    std::string fresh_key() const { return prefix_ + "pool:fresh"; }
    std::string spent_key() const { return prefix_ + "pool:spent"; }
    std::string limit_key() const { return prefix_ + "pool:limit"; }
    std::string cache_key(const std::string& key) const { return prefix_ + "cache:" + key; }

    void ensure_connected() const;
    void apply_fresh_use_limit();
};

}
