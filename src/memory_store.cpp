#include "memory_store.hpp"
#include <tuple>

namespace credpool {

MemoryStore::MemoryStore(const PoolConfig& config, EpochClock clock)
    : fresh_use_limit_(config.fresh_use_limit)
    , cooldown_sec_(config.cooldown_sec)
    , cache_ttl_sec_(config.cache_ttl_sec)
    , clock_(std::move(clock)) {
}

std::optional<std::string> MemoryStore::get_cache(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = cache_.find(key);
    if (it == cache_.end()) return std::nullopt;
    if (clock_() - it->second.stored_at >= cache_ttl_sec_) return std::nullopt;
    return it->second.value;
}

void MemoryStore::set_cache(const std::string& key, const std::string& value) {
    std::lock_guard<std::mutex> lock(mutex_);
    cache_[key] = CacheEntry{value, clock_()};
}

std::size_t MemoryStore::add_credentials(const std::vector<std::string>& params) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::size_t inserted = 0;
    for (const auto& param : params) {
        auto [it, created] = pool_.try_emplace(param, Row{0, 0, next_seq_});
        if (created) {
            ++next_seq_;
            ++inserted;
        }
    }
    return inserted;
}

long long MemoryStore::count_available() {
    std::lock_guard<std::mutex> lock(mutex_);
    long long count = 0;
    for (const auto& [param, row] : pool_) {
        if (row.use_count < fresh_use_limit_) ++count;
    }
    return count;
}

// Two-tier selection over all rows; the whole pick-and-update runs under mutex_.
std::optional<std::string> MemoryStore::allocate() {
    std::lock_guard<std::mutex> lock(mutex_);
    long long now = clock_();
    long long cooldown_cutoff = now - cooldown_sec_;

    auto best = pool_.end();
    for (auto it = pool_.begin(); it != pool_.end(); ++it) {
        const Row& row = it->second;
        if (row.use_count >= fresh_use_limit_) continue;
        if (best == pool_.end() ||
            std::tie(row.use_count, row.last_used, row.seq) <
            std::tie(best->second.use_count, best->second.last_used, best->second.seq)) {
            best = it;
        }
    }

    if (best == pool_.end()) {
        for (auto it = pool_.begin(); it != pool_.end(); ++it) {
            const Row& row = it->second;
            if (row.use_count < fresh_use_limit_ || row.last_used >= cooldown_cutoff) continue;
            if (best == pool_.end() ||
                std::tie(row.last_used, row.seq) < std::tie(best->second.last_used, best->second.seq)) {
                best = it;
            }
        }
    }

    if (best == pool_.end()) return std::nullopt;

    best->second.use_count += 1;
    best->second.last_used = now;
    return best->first;
}

std::optional<CredentialRow> MemoryStore::find(const std::string& param) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = pool_.find(param);
    if (it == pool_.end()) return std::nullopt;
    return CredentialRow{it->first, it->second.use_count, it->second.last_used};
}

PoolStats MemoryStore::stats() {
    std::lock_guard<std::mutex> lock(mutex_);
    long long cooldown_cutoff = clock_() - cooldown_sec_;
    PoolStats s;
    for (const auto& [param, row] : pool_) {
        ++s.total;
        if (row.use_count < fresh_use_limit_) {
            ++s.fresh;
        } else {
            ++s.exhausted;
            if (row.last_used < cooldown_cutoff) ++s.cooled;
        }
    }
    return s;
}

}
