#pragma once

#include <string>
#include <map>
#include <unordered_map>
#include <mutex>

#include "credential_store.hpp"
#include "pool_config.hpp"

namespace credpool {

// In-process CredentialStore. A single mutex makes each operation one
// serializable read-modify-write. State lives as long as the object.
class MemoryStore : public CredentialStore {
public:
    explicit MemoryStore(const PoolConfig& config, EpochClock clock = system_epoch_seconds);
    ~MemoryStore() override = default;

    MemoryStore(const MemoryStore&) = delete;
    MemoryStore& operator=(const MemoryStore&) = delete;

    std::optional<std::string> get_cache(const std::string& key) override;
    void set_cache(const std::string& key, const std::string& value) override;

    std::size_t add_credentials(const std::vector<std::string>& params) override;
    long long count_available() override;
    std::optional<std::string> allocate() override;

    std::optional<CredentialRow> find(const std::string& param) override;
    PoolStats stats() override;

private:
    struct CacheEntry {
        std::string value;
        long long stored_at;
    };

    struct Row {
        long long use_count;
        long long last_used;
        unsigned long long seq;  // Insertion order, breaks ordering ties
    };

    const long long fresh_use_limit_;
    const long long cooldown_sec_;
    const long long cache_ttl_sec_;
    EpochClock clock_;

    std::unordered_map<std::string, CacheEntry> cache_;
    std::map<std::string, Row> pool_;
    unsigned long long next_seq_ = 0;
    mutable std::mutex mutex_;
};

}
