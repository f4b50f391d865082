#include <gtest/gtest.h>
#include "memory_store.hpp"
#include "test_helpers.hpp"
#include <thread>
#include <vector>
#include <map>
#include <mutex>
#include <chrono>

using namespace credpool;

TEST(StressTest, ConcurrentAllocationNeverOverIssues) {
    PoolConfig config;
    test::ManualClock clock;
    MemoryStore store(config, clock.fn());

    const int rows = 200;
    std::vector<std::string> params;
    for (int i = 0; i < rows; ++i) {
        params.push_back("param_" + std::to_string(i));
    }
    ASSERT_EQ(store.add_credentials(params), static_cast<std::size_t>(rows));

    const int num_threads = 8;
    const int allocs_per_thread = 50;
    std::mutex results_mutex;
    std::map<std::string, int> issued;

    auto worker = [&]() {
        std::vector<std::string> mine;
        for (int i = 0; i < allocs_per_thread; ++i) {
            auto got = store.allocate();
            if (got) mine.push_back(*got);
        }
        std::lock_guard<std::mutex> lock(results_mutex);
        for (const auto& p : mine) issued[p]++;
    };

    std::vector<std::thread> threads;
    auto start = std::chrono::high_resolution_clock::now();
    for (int i = 0; i < num_threads; ++i) {
        threads.emplace_back(worker);
    }
    for (auto& t : threads) {
        t.join();
    }
    auto end = std::chrono::high_resolution_clock::now();

    std::chrono::duration<double> diff = end - start;
    std::cout << "[*] Issued " << num_threads * allocs_per_thread << " credentials in " << diff.count() << "s" << std::endl;

    // 400 allocations over 200 rows with a fresh limit of 2: each row exactly twice.
    ASSERT_EQ(issued.size(), static_cast<std::size_t>(rows));
    for (const auto& [param, count] : issued) {
        EXPECT_EQ(count, 2) << param;
        EXPECT_EQ(store.find(param)->use_count, 2);
    }
    EXPECT_EQ(store.count_available(), 0);
    EXPECT_FALSE(store.allocate().has_value());
}

TEST(StressTest, ConcurrentAddsStayUnique) {
    PoolConfig config;
    MemoryStore store(config);

    std::atomic<std::size_t> inserted{0};
    std::vector<std::thread> threads;
    for (int t = 0; t < 4; ++t) {
        threads.emplace_back([&]() {
            for (int i = 0; i < 100; ++i) {
                inserted += store.add_credentials({"shared_" + std::to_string(i)});
            }
        });
    }
    for (auto& t : threads) {
        t.join();
    }

    EXPECT_EQ(inserted.load(), 100u);
    EXPECT_EQ(store.stats().total, 100);
}
