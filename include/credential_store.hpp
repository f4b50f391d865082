#pragma once

#include <string>
#include <vector>
#include <optional>
#include <functional>
#include <chrono>

namespace credpool {

// A single pooled credential and its wear.
struct CredentialRow {
    std::string param;
    long long use_count = 0;
    long long last_used = 0;  // Epoch seconds, 0 when never used
};

struct PoolStats {
    long long total = 0;
    long long fresh = 0;      // use_count below the freshness limit
    long long exhausted = 0;
    long long cooled = 0;     // Exhausted rows that have rested past the cooldown
};

// Source of "now" in epoch seconds. Injected so cooldown and TTL logic is testable.
using EpochClock = std::function<long long()>;

inline long long system_epoch_seconds() {
    auto now = std::chrono::system_clock::now();
    return std::chrono::duration_cast<std::chrono::seconds>(now.time_since_epoch()).count();
}

 
// Abstract interface for the durable state shared by all pool users:
// the time-bounded response cache and the credential pool rows.
// Every operation either completes atomically or throws StoreError with
// the stored state left untouched.
class CredentialStore {
public:
    virtual ~CredentialStore() = default;

    /**
     * Returns the cached value if present and younger than the cache TTL.
     * Expired and missing entries are indistinguishable.
     */
    virtual std::optional<std::string> get_cache(const std::string& key) = 0;

    // Upserts a cache entry stamped with the current time.
    virtual void set_cache(const std::string& key, const std::string& value) = 0;

    /**
     * Inserts new rows with use_count=0 and last_used=0. Params already present
     * are ignored and keep their counters.
     * @return Number of rows actually inserted.
     */
    virtual std::size_t add_credentials(const std::vector<std::string>& params) = 0;

    // Number of fresh rows (use_count below the freshness limit).
    virtual long long count_available() = 0;

    /**
     * Atomically picks a row and marks one use of it.
     * Tier 1: a fresh row ordered by (use_count, last_used).
     * Tier 2: an exhausted row whose last use is older than the cooldown,
     * least recently used first.
     * @return The allocated param, or nullopt with no mutation if neither tier matches.
     */
    virtual std::optional<std::string> allocate() = 0;

    virtual std::optional<CredentialRow> find(const std::string& param) = 0;

    virtual PoolStats stats() = 0;
};

}
