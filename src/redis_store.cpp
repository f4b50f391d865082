#include "redis_store.hpp"
#include "errors.hpp"
#include "logger.hpp"
#include <iterator>

namespace credpool {

namespace {

// Fresh-set score packs (use_count, last_used) into one double. Epoch seconds
// stay below 1e10 until the year 2286, and the product stays exact in a double.
constexpr const char* kFreshScoreScale = "10000000000";

const std::string kAllocateScript = R"(
    local fresh = KEYS[1]
    local spent = KEYS[2]
    local now = tonumber(ARGV[1])
    local limit = tonumber(ARGV[2])
    local cooldown = tonumber(ARGV[3])
    local row_prefix = ARGV[4]
    local scale = tonumber(ARGV[5])

    -- Tier 1: least used, then least recently used, among fresh rows
    local picked = redis.call('ZRANGE', fresh, 0, 0)
    local param = picked[1]

    -- Tier 2: longest-rested exhausted row past the cooldown
    if not param then
        local cooled = redis.call('ZRANGEBYSCORE', spent, '-inf', '(' .. (now - cooldown), 'LIMIT', 0, 1)
        param = cooled[1]
    end

    if not param then
        return false
    end

    local row = row_prefix .. param
    local uses = redis.call('HINCRBY', row, 'use_count', 1)
    redis.call('HSET', row, 'last_used', now)

    if uses < limit then
        redis.call('ZADD', fresh, uses * scale + now, param)
    else
        redis.call('ZREM', fresh, param)
        redis.call('ZADD', spent, now, param)
    end
    return param
)";

const std::string kAddScript = R"(
    local fresh = KEYS[1]
    local row_prefix = ARGV[1]
    local inserted = 0
    for i = 2, #ARGV do
        local param = ARGV[i]
        if redis.call('HSETNX', row_prefix .. param, 'use_count', 0) == 1 then
            redis.call('HSET', row_prefix .. param, 'last_used', 0)
            redis.call('ZADD', fresh, 0, param)
            inserted = inserted + 1
        end
    end
    return inserted
)";

// Re-sorts every row into fresh/spent when the stored freshness limit differs
// from the configured one, then records the configured limit.
const std::string kRebalanceScript = R"(
    local fresh = KEYS[1]
    local spent = KEYS[2]
    local limit_key = KEYS[3]
    local limit = tonumber(ARGV[1])
    local row_prefix = ARGV[2]
    local scale = tonumber(ARGV[3])

    local stored = redis.call('GET', limit_key)
    if stored and tonumber(stored) == limit then
        return 0
    end

    local moved = 0
    for _, param in ipairs(redis.call('ZRANGE', fresh, 0, -1)) do
        local row = redis.call('HMGET', row_prefix .. param, 'use_count', 'last_used')
        local uses = tonumber(row[1]) or 0
        if uses >= limit then
            redis.call('ZREM', fresh, param)
            redis.call('ZADD', spent, tonumber(row[2]) or 0, param)
            moved = moved + 1
        end
    end
    for _, param in ipairs(redis.call('ZRANGE', spent, 0, -1)) do
        local row = redis.call('HMGET', row_prefix .. param, 'use_count', 'last_used')
        local uses = tonumber(row[1]) or 0
        if uses < limit then
            redis.call('ZREM', spent, param)
            redis.call('ZADD', fresh, uses * scale + (tonumber(row[2]) or 0), param)
            moved = moved + 1
        end
    end

    redis.call('SET', limit_key, limit)
    return moved
)";

const std::string kSetCacheScript = R"(
    redis.call('HSET', KEYS[1], 'value', ARGV[1], 'ts', ARGV[2])
    redis.call('EXPIRE', KEYS[1], ARGV[3])
    return 1
)";

}

RedisStore::RedisStore(const PoolConfig& config, EpochClock clock)
    : prefix_(config.redis_prefix)
    , fresh_use_limit_(config.fresh_use_limit)
    , cooldown_sec_(config.cooldown_sec)
    , cache_ttl_sec_(config.cache_ttl_sec)
    , clock_(std::move(clock)) {
    try {
        redis_ = std::make_unique<sw::redis::Redis>(config.redis_url);
        redis_->ping();
        connected_ = true;
        Logger::log(Logger::Level::INFO, Logger::EventType::STORE, "Redis connected: " + config.redis_url);
        apply_fresh_use_limit();
    } catch (const sw::redis::Error& e) {
        Logger::log(Logger::Level::ERROR, Logger::EventType::STORE,
                    "Redis connection failed: " + std::string(e.what()));
        connected_ = false;
    }
}

void RedisStore::ensure_connected() const {
    if (!connected_) {
        throw StoreError("redis store is not connected");
    }
}

// The fresh/spent split is persisted, so a changed limit must re-sort existing rows.
void RedisStore::apply_fresh_use_limit() {
    std::vector<std::string> keys = {fresh_key(), spent_key(), limit_key()};
    std::vector<std::string> args = {
        std::to_string(fresh_use_limit_),
        row_key(""),
        kFreshScoreScale
    };
    auto moved = redis_->eval<long long>(kRebalanceScript, keys.begin(), keys.end(), args.begin(), args.end());
    if (moved > 0) {
        Logger::log(Logger::Level::WARNING, Logger::EventType::STORE,
                    "Freshness limit is now " + std::to_string(fresh_use_limit_) + ", re-sorted " +
                    std::to_string(moved) + " credentials");
    }
}

std::optional<std::string> RedisStore::get_cache(const std::string& key) {
    ensure_connected();
    try {
        std::vector<sw::redis::OptionalString> fields;
        redis_->hmget(cache_key(key), {"value", "ts"}, std::back_inserter(fields));
        if (fields.size() != 2 || !fields[0] || !fields[1]) return std::nullopt;

        long long stored_at = std::stoll(*fields[1]);
        if (clock_() - stored_at >= cache_ttl_sec_) return std::nullopt;
        return *fields[0];
    } catch (const sw::redis::Error& e) {
        throw StoreError("get_cache failed: " + std::string(e.what()));
    } catch (const std::logic_error&) {
        throw StoreError("get_cache found a corrupt timestamp for " + key);
    }
}

void RedisStore::set_cache(const std::string& key, const std::string& value) {
    ensure_connected();
    try {
        std::vector<std::string> keys = {cache_key(key)};
        std::vector<std::string> args = {
            value,
            std::to_string(clock_()),
            std::to_string(cache_ttl_sec_)
        };
        redis_->eval<long long>(kSetCacheScript, keys.begin(), keys.end(), args.begin(), args.end());
    } catch (const sw::redis::Error& e) {
        throw StoreError("set_cache failed: " + std::string(e.what()));
    }
}

std::size_t RedisStore::add_credentials(const std::vector<std::string>& params) {
    ensure_connected();
    if (params.empty()) return 0;
    try {
        std::vector<std::string> keys = {fresh_key()};
        std::vector<std::string> args;
        args.reserve(params.size() + 1);
        args.push_back(row_key(""));
        args.insert(args.end(), params.begin(), params.end());

        auto inserted = redis_->eval<long long>(kAddScript, keys.begin(), keys.end(), args.begin(), args.end());
        return static_cast<std::size_t>(inserted);
    } catch (const sw::redis::Error& e) {
        throw StoreError("add_credentials failed: " + std::string(e.what()));
    }
}

long long RedisStore::count_available() {
    ensure_connected();
    try {
        return redis_->zcard(fresh_key());
    } catch (const sw::redis::Error& e) {
        throw StoreError("count_available failed: " + std::string(e.what()));
    }
}

std::optional<std::string> RedisStore::allocate() {
    ensure_connected();
    try {
        std::vector<std::string> keys = {fresh_key(), spent_key()};
        std::vector<std::string> args = {
            std::to_string(clock_()),
            std::to_string(fresh_use_limit_),
            std::to_string(cooldown_sec_),
            row_key(""),
            kFreshScoreScale
        };

        auto param = redis_->eval<sw::redis::OptionalString>(
            kAllocateScript, keys.begin(), keys.end(), args.begin(), args.end());
        if (!param) return std::nullopt;
        return *param;
    } catch (const sw::redis::Error& e) {
        throw StoreError("allocate failed: " + std::string(e.what()));
    }
}

std::optional<CredentialRow> RedisStore::find(const std::string& param) {
    ensure_connected();
    try {
        std::vector<sw::redis::OptionalString> fields;
        redis_->hmget(row_key(param), {"use_count", "last_used"}, std::back_inserter(fields));
        if (fields.size() != 2 || !fields[0]) return std::nullopt;

        CredentialRow row;
        row.param = param;
        row.use_count = std::stoll(*fields[0]);
        row.last_used = fields[1] ? std::stoll(*fields[1]) : 0;
        return row;
    } catch (const sw::redis::Error& e) {
        throw StoreError("find failed: " + std::string(e.what()));
    } catch (const std::logic_error&) {
        throw StoreError("find found corrupt counters for " + param);
    }
}

PoolStats RedisStore::stats() {
    ensure_connected();
    try {
        PoolStats s;
        s.fresh = redis_->zcard(fresh_key());
        s.exhausted = redis_->zcard(spent_key());
        s.total = s.fresh + s.exhausted;

        std::string cutoff = "(" + std::to_string(clock_() - cooldown_sec_);
        s.cooled = redis_->command<long long>("ZCOUNT", spent_key(), "-inf", cutoff);
        return s;
    } catch (const sw::redis::Error& e) {
        throw StoreError("stats failed: " + std::string(e.what()));
    }
}

long long RedisStore::clear() {
    ensure_connected();
    try {
        long long removed = 0;
        long long cursor = 0;
        do {
            std::vector<std::string> keys;
            cursor = redis_->scan(cursor, prefix_ + "*", 100, std::back_inserter(keys));
            if (!keys.empty()) {
                removed += redis_->del(keys.begin(), keys.end());
            }
        } while (cursor != 0);
        return removed;
    } catch (const sw::redis::Error& e) {
        throw StoreError("clear failed: " + std::string(e.what()));
    }
}

}
