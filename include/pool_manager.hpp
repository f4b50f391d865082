#pragma once

#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

#include "credential_store.hpp"
#include "generator.hpp"
#include "pool_config.hpp"

namespace net = boost::asio;

namespace credpool {

 
// Allocation front-end for pooled credentials.
// Serves callers from the store, refills synchronously when the pool is dry,
// and keeps the pool topped up with a single background warm-up run.
class PoolManager {
public:
    using Headers = std::map<std::string, std::string>;

    PoolManager(const PoolConfig& config, CredentialStore& store, std::unique_ptr<CredentialGenerator> generator);
    ~PoolManager();

    PoolManager(const PoolManager&) = delete;
    PoolManager& operator=(const PoolManager&) = delete;

    /**
     * Returns a credential for exactly one outbound request.
     * Falls back to one synchronous generator batch when the pool is exhausted.
     * @throws RefillFailed if no credential is available even after the refill.
     * @throws GeneratorError, StoreError from the refill or allocation path.
     */
    std::string get_credential();

    // Credential plus a fresh traceparent, keyed by the configured header names.
    Headers get_headers();

    // Starts the generator ahead of the first request, optionally warming up.
    void prime(bool warm_up = false);

    // Schedules a background warm-up unless one is already active. Never blocks.
    void trigger_warmup();

    bool is_warming_up() const;

    // Waits for the active warm-up run, if any. Returns false on timeout.
    bool wait_for_warmup(std::chrono::milliseconds timeout);

    // Cancels warm-up and stops the generator. Idempotent.
    void close();

    CredentialStore& store() { return store_; }
    CredentialGenerator& generator() { return *generator_; }

private:
    const PoolConfig& config_;
    CredentialStore& store_;
    std::unique_ptr<CredentialGenerator> generator_;

    // Background worker running warm-up steps and backoff timers.
    net::io_context worker_ioc_;
    net::executor_work_guard<net::io_context::executor_type> work_guard_;
    net::steady_timer backoff_timer_;
    std::thread worker_;

    // Held across an emergency refill; close() takes it before stopping the generator.
    std::mutex refill_mutex_;

    mutable std::mutex warmup_mutex_;
    std::condition_variable warmup_cv_;
    bool warming_up_ = false;
    bool closed_ = false;
    std::atomic<bool> cancelled_{false};

    std::string allocate_or_throw();
    std::string emergency_refill();
    void check_low_water();
    void refresh_gauge(long long available);

    void warmup_step();
    void finish_warmup(const std::string& outcome);
};

}
