#pragma once

#include <algorithm>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <filesystem>
#include <fstream>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>
#include <unistd.h>

#include "credential_store.hpp"
#include "errors.hpp"
#include "generator.hpp"

namespace credpool::test {

// Settable epoch clock shared between a test and the store under test.
class ManualClock {
public:
    explicit ManualClock(long long start = 1700000000) : now_(std::make_shared<std::atomic<long long>>(start)) {}

    EpochClock fn() const {
        auto now = now_;
        return [now] { return now->load(); };
    }

    long long now() const { return now_->load(); }
    void set(long long t) { now_->store(t); }
    void advance(long long seconds) { now_->fetch_add(seconds); }

private:
    std::shared_ptr<std::atomic<long long>> now_;
};

// Scripted stand-in for the generator process.
// Queued steps are consumed in order; once empty it either returns empty
// batches or, with auto_generate, unique credentials of size cluster_size.
class FakeGenerator : public CredentialGenerator {
public:
    void push_batch(std::vector<std::string> batch) {
        std::lock_guard<std::mutex> lock(mutex_);
        script_.push_back(Step{false, std::move(batch), ""});
    }

    void push_failure(const std::string& reason) {
        std::lock_guard<std::mutex> lock(mutex_);
        script_.push_back(Step{true, {}, reason});
    }

    void set_auto_generate(bool enabled) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto_generate_ = enabled;
    }

    void set_always_fail(bool enabled) {
        std::lock_guard<std::mutex> lock(mutex_);
        always_fail_ = enabled;
    }

    // While held, request_batch blocks until release() is called.
    void hold() {
        std::lock_guard<std::mutex> lock(mutex_);
        held_ = true;
    }

    void release() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            held_ = false;
        }
        cv_.notify_all();
    }

    void start() override {
        std::lock_guard<std::mutex> lock(mutex_);
        ++starts_;
        running_ = true;
    }

    std::vector<std::string> request_batch(int cluster_size) override {
        std::unique_lock<std::mutex> lock(mutex_);
        ++requests_;
        ++in_flight_;
        max_in_flight_ = std::max(max_in_flight_, in_flight_);
        cv_.wait(lock, [this] { return !held_; });
        --in_flight_;
        running_ = true;

        if (!script_.empty()) {
            Step step = script_.front();
            script_.pop_front();
            if (step.fail) {
                running_ = false;
                throw GeneratorIPCError(step.reason);
            }
            return step.batch;
        }
        if (always_fail_) {
            running_ = false;
            throw GeneratorIPCError("scripted failure");
        }
        std::vector<std::string> batch;
        if (auto_generate_) {
            for (int i = 0; i < cluster_size; ++i) {
                batch.push_back("auto-" + std::to_string(next_id_++));
            }
        }
        return batch;
    }

    void stop() override {
        std::lock_guard<std::mutex> lock(mutex_);
        ++stops_;
        running_ = false;
    }

    bool is_running() const override {
        std::lock_guard<std::mutex> lock(mutex_);
        return running_;
    }

    int starts() const { std::lock_guard<std::mutex> lock(mutex_); return starts_; }
    int stops() const { std::lock_guard<std::mutex> lock(mutex_); return stops_; }
    int requests() const { std::lock_guard<std::mutex> lock(mutex_); return requests_; }
    int max_in_flight() const { std::lock_guard<std::mutex> lock(mutex_); return max_in_flight_; }

private:
    struct Step {
        bool fail;
        std::vector<std::string> batch;
        std::string reason;
    };

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<Step> script_;
    bool auto_generate_ = false;
    bool always_fail_ = false;
    bool held_ = false;
    bool running_ = false;
    int starts_ = 0;
    int stops_ = 0;
    int requests_ = 0;
    int in_flight_ = 0;
    int max_in_flight_ = 0;
    int next_id_ = 0;
};

// Writes an executable /bin/sh script into a per-process temp directory.
inline std::string write_script(const std::string& name, const std::string& body) {
    auto dir = std::filesystem::temp_directory_path() / ("credpool_test_" + std::to_string(::getpid()));
    std::filesystem::create_directories(dir);
    auto path = dir / name;
    {
        std::ofstream out(path, std::ios::trunc);
        out << "#!/bin/sh\n" << body;
    }
    std::filesystem::permissions(path, std::filesystem::perms::owner_all);
    return path.string();
}

inline std::string scratch_path(const std::string& name) {
    auto dir = std::filesystem::temp_directory_path() / ("credpool_test_" + std::to_string(::getpid()));
    std::filesystem::create_directories(dir);
    auto path = dir / name;
    std::filesystem::remove(path);
    return path.string();
}

// Polls `pred` until it holds or `timeout` passes.
template <typename Pred>
bool eventually(Pred pred, std::chrono::milliseconds timeout = std::chrono::milliseconds(3000)) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (pred()) return true;
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    return pred();
}

}
