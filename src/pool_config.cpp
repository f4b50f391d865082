#include "pool_config.hpp"
#include "logger.hpp"
#include <cstdlib>
#include <stdexcept>

namespace credpool {

namespace {

int env_int(const char* name, const char* value) {
    try {
        std::size_t consumed = 0;
        int parsed = std::stoi(value, &consumed);
        if (consumed != std::string(value).size()) {
            throw std::invalid_argument("trailing characters");
        }
        return parsed;
    } catch (const std::exception&) {
        throw std::invalid_argument(std::string(name) + " is not an integer: " + value);
    }
}

std::vector<std::string> split_csv(const std::string& input) {
    std::vector<std::string> parts;
    std::string rest = input;
    size_t pos = 0;
    while ((pos = rest.find(',')) != std::string::npos) {
        if (pos > 0) parts.push_back(rest.substr(0, pos));
        rest.erase(0, pos + 1);
    }
    if (!rest.empty()) {
        parts.push_back(rest);
    }
    return parts;
}

}

void apply_env_overrides(PoolConfig& config) {
    // --- Persistent Store ---
    if (const char* e = std::getenv("CREDPOOL_STORE_BACKEND")) config.store_backend = e;
    if (const char* e = std::getenv("CREDPOOL_REDIS_URL")) config.redis_url = e;
    if (const char* e = std::getenv("CREDPOOL_REDIS_PREFIX")) config.redis_prefix = e;

    // --- Generator Process ---
    if (const char* e = std::getenv("CREDPOOL_GENERATOR_PATH")) config.generator_path = e;
    if (const char* e = std::getenv("CREDPOOL_GENERATOR_ARGS")) config.generator_args = split_csv(e);
    if (const char* e = std::getenv("CREDPOOL_READY_TOKEN")) config.ready_token = e;
    if (const char* e = std::getenv("CREDPOOL_CLUSTER_SIZE")) config.cluster_size = env_int("CREDPOOL_CLUSTER_SIZE", e);
    if (const char* e = std::getenv("CREDPOOL_STARTUP_TIMEOUT_MS")) config.startup_timeout_ms = env_int("CREDPOOL_STARTUP_TIMEOUT_MS", e);
    if (const char* e = std::getenv("CREDPOOL_REQUEST_TIMEOUT_MS")) config.request_timeout_ms = env_int("CREDPOOL_REQUEST_TIMEOUT_MS", e);
    if (const char* e = std::getenv("CREDPOOL_SHUTDOWN_GRACE_MS")) config.shutdown_grace_ms = env_int("CREDPOOL_SHUTDOWN_GRACE_MS", e);

    // --- Pool Policy ---
    if (const char* e = std::getenv("CREDPOOL_POOL_TARGET")) config.pool_target = env_int("CREDPOOL_POOL_TARGET", e);
    if (const char* e = std::getenv("CREDPOOL_LOW_WATER_MARK")) config.low_water_mark = env_int("CREDPOOL_LOW_WATER_MARK", e);
    if (const char* e = std::getenv("CREDPOOL_FRESH_USE_LIMIT")) config.fresh_use_limit = env_int("CREDPOOL_FRESH_USE_LIMIT", e);
    if (const char* e = std::getenv("CREDPOOL_COOLDOWN_SEC")) config.cooldown_sec = env_int("CREDPOOL_COOLDOWN_SEC", e);
    if (const char* e = std::getenv("CREDPOOL_CACHE_TTL_SEC")) config.cache_ttl_sec = env_int("CREDPOOL_CACHE_TTL_SEC", e);
    if (const char* e = std::getenv("CREDPOOL_WARMUP_BACKOFF_MS")) config.warmup_backoff_ms = env_int("CREDPOOL_WARMUP_BACKOFF_MS", e);

    // --- Outbound Headers ---
    if (const char* e = std::getenv("CREDPOOL_CREDENTIAL_HEADER")) config.credential_header = e;
    if (const char* e = std::getenv("CREDPOOL_TRACE_HEADER")) config.trace_header = e;

    if (const char* e = std::getenv("CREDPOOL_LOG_LEVEL")) config.log_level = e;
}

void validate(const PoolConfig& config) {
    if (config.store_backend != "redis" && config.store_backend != "memory") {
        throw std::invalid_argument("store_backend must be 'redis' or 'memory', got '" + config.store_backend + "'");
    }
    if (config.generator_path.empty()) {
        throw std::invalid_argument("generator_path must not be empty");
    }
    if (config.ready_token.empty()) {
        throw std::invalid_argument("ready_token must not be empty");
    }
    if (config.cluster_size < 1) {
        throw std::invalid_argument("cluster_size must be at least 1");
    }
    if (config.fresh_use_limit < 1) {
        throw std::invalid_argument("fresh_use_limit must be at least 1");
    }
    if (config.startup_timeout_ms < 0 || config.request_timeout_ms < 0 ||
        config.shutdown_grace_ms < 0 || config.warmup_backoff_ms < 0) {
        throw std::invalid_argument("timeouts must not be negative");
    }
    if (config.cooldown_sec < 0 || config.cache_ttl_sec < 0) {
        throw std::invalid_argument("cooldown_sec and cache_ttl_sec must not be negative");
    }
    if (config.pool_target < 0 || config.low_water_mark < 0) {
        throw std::invalid_argument("pool_target and low_water_mark must not be negative");
    }
    if (config.low_water_mark > config.pool_target) {
        throw std::invalid_argument("low_water_mark must not exceed pool_target");
    }
    Logger::Level level;
    if (!Logger::parse_level(config.log_level, level)) {
        throw std::invalid_argument("unknown log_level '" + config.log_level + "'");
    }
}

}
