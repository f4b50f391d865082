#pragma once

#include <string>
#include <vector>

namespace credpool {

 
// Runtime configuration for the credential pool, its store and the generator process.
struct PoolConfig {
    // --- Persistent Store ---
    std::string store_backend = "redis";  // "redis" or "memory"
    std::string redis_url = "tcp://127.0.0.1:6379";
    std::string redis_prefix = "credpool:";

    // --- Generator Process ---
    std::string generator_path = "bin/camp-security";
    std::vector<std::string> generator_args = {"server"};
    std::string ready_token = "READY";
    int cluster_size = 2;             // Batch multiplier sent as "cluster <N>"
    int startup_timeout_ms = 10000;
    int request_timeout_ms = 30000;
    int shutdown_grace_ms = 3000;     // SIGTERM grace period before SIGKILL

    // --- Pool Policy ---
    int pool_target = 100;
    int low_water_mark = 20;
    int fresh_use_limit = 2;          // Rows with fewer uses than this are "fresh"
    int cooldown_sec = 3600;
    int cache_ttl_sec = 3000;
    int warmup_backoff_ms = 5000;

    // --- Outbound Headers ---
    std::string credential_header = "specialencodeparam";
    std::string trace_header = "traceparent";

    std::string log_level = "info";
};

/**
 * Overrides fields from CREDPOOL_* environment variables.
 * @throws std::invalid_argument if a numeric variable cannot be parsed.
 */
void apply_env_overrides(PoolConfig& config);

/**
 * Rejects inconsistent or out-of-range settings.
 * @throws std::invalid_argument describing the first offending field.
 */
void validate(const PoolConfig& config);

}
