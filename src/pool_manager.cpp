#include "pool_manager.hpp"
#include "errors.hpp"
#include "logger.hpp"
#include "metrics.hpp"
#include "trace_context.hpp"

#include <boost/asio/post.hpp>
#include <stdexcept>

namespace credpool {

PoolManager::PoolManager(const PoolConfig& config, CredentialStore& store, std::unique_ptr<CredentialGenerator> generator)
    : config_(config)
    , store_(store)
    , generator_(std::move(generator))
    , work_guard_(net::make_work_guard(worker_ioc_))
    , backoff_timer_(worker_ioc_) {
    if (!generator_) {
        throw std::invalid_argument("PoolManager requires a credential generator");
    }
    worker_ = std::thread([this] { worker_ioc_.run(); });
}

PoolManager::~PoolManager() {
    close();
}

std::string PoolManager::get_credential() {
    {
        std::lock_guard<std::mutex> lock(warmup_mutex_);
        if (closed_) throw PoolError("pool manager is closed");
    }

    std::string param;
    try {
        param = allocate_or_throw();
    } catch (const PoolExhausted&) {
        Logger::log(Logger::Level::WARNING, Logger::EventType::REFILL,
                    "Emergency fetch: pool empty. Fetching a new batch...");
        param = emergency_refill();
    }

    MetricsRegistry::instance().increment_counter("credential_allocations_total");
    check_low_water();
    return param;
}

PoolManager::Headers PoolManager::get_headers() {
    Headers headers;
    headers[config_.credential_header] = get_credential();
    headers[config_.trace_header] = TraceContext::generate_traceparent();
    return headers;
}

void PoolManager::prime(bool warm_up) {
    generator_->start();
    if (warm_up) {
        trigger_warmup();
    }
}

std::string PoolManager::allocate_or_throw() {
    auto param = store_.allocate();
    if (!param) {
        MetricsRegistry::instance().increment_counter("pool_exhausted_total");
        throw PoolExhausted("credential pool is exhausted");
    }
    return *param;
}

// Synchronous, caller-blocking replenishment followed by exactly one retry.
std::string PoolManager::emergency_refill() {
    std::lock_guard<std::mutex> refill(refill_mutex_);
    {
        std::lock_guard<std::mutex> lock(warmup_mutex_);
        if (closed_) throw PoolError("pool manager is closed");
    }
    MetricsRegistry::instance().increment_counter("emergency_refills_total");

    auto batch = generator_->request_batch(config_.cluster_size);
    if (batch.empty()) {
        throw RefillFailed("generator returned an empty batch during emergency refill");
    }
    store_.add_credentials(batch);

    auto param = store_.allocate();
    if (!param) {
        throw RefillFailed("no credential available even after emergency refill");
    }
    return *param;
}

// Advisory only: the caller already holds a consumed credential, so a store
// failure here is logged rather than raised.
void PoolManager::check_low_water() {
    long long available = 0;
    try {
        available = store_.count_available();
    } catch (const StoreError& e) {
        Logger::log(Logger::Level::WARNING, Logger::EventType::STORE,
                    "Could not read pool level: " + std::string(e.what()));
        return;
    }
    refresh_gauge(available);

    if (available < config_.low_water_mark && !is_warming_up()) {
        Logger::log(Logger::Level::INFO, Logger::EventType::WARMUP,
                    "Credential pool is low (" + std::to_string(available) + " fresh). Triggering background refill.");
        trigger_warmup();
    }
}

void PoolManager::refresh_gauge(long long available) {
    MetricsRegistry::instance().set_gauge("pool_available", static_cast<double>(available));
}

void PoolManager::trigger_warmup() {
    {
        std::lock_guard<std::mutex> lock(warmup_mutex_);
        if (closed_ || warming_up_) return;
        warming_up_ = true;
    }

    MetricsRegistry::instance().increment_counter("warmup_runs_total");
    Logger::log(Logger::Level::INFO, Logger::EventType::WARMUP,
                "Replenishing credential pool toward " + std::to_string(config_.pool_target));
    net::post(worker_ioc_, [this] { warmup_step(); });
}

bool PoolManager::is_warming_up() const {
    std::lock_guard<std::mutex> lock(warmup_mutex_);
    return warming_up_;
}

bool PoolManager::wait_for_warmup(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(warmup_mutex_);
    return warmup_cv_.wait_for(lock, timeout, [this] { return !warming_up_; });
}

// One iteration of the warm-up loop. Runs on the worker thread only.
void PoolManager::warmup_step() {
    if (cancelled_) {
        finish_warmup("cancelled");
        return;
    }

    bool progressed = false;
    try {
        long long available = store_.count_available();
        refresh_gauge(available);
        if (available >= config_.pool_target) {
            finish_warmup("pool is full (" + std::to_string(available) + "/" +
                          std::to_string(config_.pool_target) + ")");
            return;
        }

        auto batch = generator_->request_batch(config_.cluster_size);
        auto inserted = store_.add_credentials(batch);
        progressed = inserted > 0;
        if (progressed) {
            Logger::log(Logger::Level::DEBUG, Logger::EventType::WARMUP,
                        "Added " + std::to_string(inserted) + " credentials to the pool");
        } else {
            MetricsRegistry::instance().increment_counter("warmup_errors_total");
            Logger::log(Logger::Level::WARNING, Logger::EventType::WARMUP,
                        "Generator batch added no new credentials. Retrying in " +
                        std::to_string(config_.warmup_backoff_ms) + "ms");
        }
    } catch (const std::exception& e) {
        MetricsRegistry::instance().increment_counter("warmup_errors_total");
        Logger::log(Logger::Level::WARNING, Logger::EventType::WARMUP,
                    "Warm-up error: " + std::string(e.what()) + ". Retrying in " +
                    std::to_string(config_.warmup_backoff_ms) + "ms");
    }

    if (cancelled_) {
        finish_warmup("cancelled");
        return;
    }

    if (progressed) {
        net::post(worker_ioc_, [this] { warmup_step(); });
        return;
    }

    backoff_timer_.expires_after(std::chrono::milliseconds(config_.warmup_backoff_ms));
    backoff_timer_.async_wait([this](const boost::system::error_code& ec) {
        if (ec == net::error::operation_aborted || cancelled_) {
            finish_warmup("cancelled");
            return;
        }
        warmup_step();
    });
}

void PoolManager::finish_warmup(const std::string& outcome) {
    Logger::log(Logger::Level::INFO, Logger::EventType::WARMUP, "Warm-up finished: " + outcome);
    {
        std::lock_guard<std::mutex> lock(warmup_mutex_);
        warming_up_ = false;
    }
    warmup_cv_.notify_all();
}

void PoolManager::close() {
    {
        std::lock_guard<std::mutex> lock(warmup_mutex_);
        if (closed_) return;
        closed_ = true;
    }

    // Wake a pending backoff wait; the timer is only touched on the worker thread.
    cancelled_ = true;
    net::post(worker_ioc_, [this] { backoff_timer_.cancel(); });

    // An in-flight batch is bounded by the generator's request timeout.
    auto bound = std::chrono::milliseconds(config_.request_timeout_ms + config_.shutdown_grace_ms);
    if (!wait_for_warmup(bound)) {
        Logger::log(Logger::Level::WARNING, Logger::EventType::LIFECYCLE,
                    "Warm-up did not stop within " + std::to_string(bound.count()) + "ms");
    }

    // A refill that passed the closed check finishes before the generator stops.
    {
        std::lock_guard<std::mutex> refill(refill_mutex_);
        generator_->stop();
    }

    work_guard_.reset();
    if (worker_.joinable()) {
        worker_.join();
    }
    Logger::log(Logger::Level::INFO, Logger::EventType::LIFECYCLE, "Pool manager closed");
}

}
