#include <gtest/gtest.h>
#include "redis_store.hpp"
#include "test_helpers.hpp"
#include <unistd.h>

using namespace credpool;
using credpool::test::ManualClock;

class RedisStoreTest : public ::testing::Test {
protected:
    void SetUp() override {
        config.redis_url = "tcp://127.0.0.1:6379?read_timeout=100ms";
        config.redis_prefix = "credpool_test:" + std::to_string(::getpid()) + ":";
        store = std::make_unique<RedisStore>(config, clock.fn());
        t = clock.now();

        if (store->is_connected()) {
            store->clear();
        }
    }

    void TearDown() override {
        if (store && store->is_connected()) {
            store->clear();
        }
    }

    // Adds `param` alone and uses it `uses` times at time `at`.
    void seed(const std::string& param, int uses, long long at) {
        clock.set(at);
        ASSERT_EQ(store->add_credentials({param}), 1u);
        for (int i = 0; i < uses; ++i) {
            auto got = store->allocate();
            ASSERT_TRUE(got.has_value());
            ASSERT_EQ(*got, param);
        }
        clock.set(t);
    }

    PoolConfig config;
    ManualClock clock;
    std::unique_ptr<RedisStore> store;
    long long t = 0;
};

TEST_F(RedisStoreTest, ConnectionStatus) {
    if (!store->is_connected()) {
        GTEST_SKIP() << "Redis not available at 127.0.0.1:6379";
    }
    EXPECT_TRUE(store->is_connected());
}

TEST_F(RedisStoreTest, DisconnectedStoreRaisesStoreError) {
    PoolConfig offline;
    offline.redis_url = "tcp://127.0.0.1:1";
    RedisStore unreachable(offline);
    ASSERT_FALSE(unreachable.is_connected());
    EXPECT_THROW(unreachable.allocate(), StoreError);
    EXPECT_THROW(unreachable.count_available(), StoreError);
}

TEST_F(RedisStoreTest, NeverUsedRowBeatsOnceUsedRow) {
    if (!store->is_connected()) GTEST_SKIP();

    seed("B", 1, t - 10);
    seed("A", 0, t);

    auto got = store->allocate();
    ASSERT_TRUE(got.has_value());
    EXPECT_EQ(*got, "A");

    auto a = store->find("A");
    ASSERT_TRUE(a.has_value());
    EXPECT_EQ(a->use_count, 1);
    EXPECT_EQ(a->last_used, t);

    auto b = store->find("B");
    EXPECT_EQ(b->use_count, 1);
    EXPECT_EQ(b->last_used, t - 10);
}

TEST_F(RedisStoreTest, CooledExhaustedRowIsReused) {
    if (!store->is_connected()) GTEST_SKIP();

    seed("C", 2, t - 7200);
    auto got = store->allocate();
    ASSERT_TRUE(got.has_value());
    EXPECT_EQ(*got, "C");
    EXPECT_EQ(store->find("C")->use_count, 3);
    EXPECT_EQ(store->find("C")->last_used, t);
}

TEST_F(RedisStoreTest, ExhaustedRowWithinCooldownIsNotReturned) {
    if (!store->is_connected()) GTEST_SKIP();

    seed("D", 2, t - 10);
    EXPECT_FALSE(store->allocate().has_value());
    EXPECT_EQ(store->find("D")->use_count, 2);
}

TEST_F(RedisStoreTest, CooldownBoundaryIsExclusive) {
    if (!store->is_connected()) GTEST_SKIP();

    seed("E", 2, t - config.cooldown_sec);
    EXPECT_FALSE(store->allocate().has_value());

    clock.advance(1);
    auto got = store->allocate();
    ASSERT_TRUE(got.has_value());
    EXPECT_EQ(*got, "E");
}

TEST_F(RedisStoreTest, FreshRowPreferredAndCountedOnlyWhenFresh) {
    if (!store->is_connected()) GTEST_SKIP();

    seed("R2", 2, t - 7200);
    seed("R1", 1, t - 40);
    seed("R0", 0, t);
    EXPECT_EQ(store->count_available(), 2);

    auto stats = store->stats();
    EXPECT_EQ(stats.total, 3);
    EXPECT_EQ(stats.fresh, 2);
    EXPECT_EQ(stats.exhausted, 1);
    EXPECT_EQ(stats.cooled, 1);

    EXPECT_EQ(*store->allocate(), "R0");
    EXPECT_EQ(*store->allocate(), "R1");
    EXPECT_EQ(*store->allocate(), "R0");
    EXPECT_EQ(*store->allocate(), "R2");
}

TEST_F(RedisStoreTest, LongestRestedExhaustedRowWins) {
    if (!store->is_connected()) GTEST_SKIP();

    seed("E1", 2, t - 9000);
    seed("E2", 2, t - 5000);
    EXPECT_EQ(*store->allocate(), "E1");
    EXPECT_EQ(*store->allocate(), "E2");
}

TEST_F(RedisStoreTest, AddCredentialsIsIdempotent) {
    if (!store->is_connected()) GTEST_SKIP();

    seed("X", 1, t - 30);
    EXPECT_EQ(store->add_credentials({"X", "Y"}), 1u);
    EXPECT_EQ(store->add_credentials({"X", "Y"}), 0u);

    auto x = store->find("X");
    EXPECT_EQ(x->use_count, 1);
    EXPECT_EQ(x->last_used, t - 30);
    EXPECT_FALSE(store->find("Z").has_value());
}

TEST_F(RedisStoreTest, CacheRoundTripAndExpiry) {
    if (!store->is_connected()) GTEST_SKIP();

    store->set_cache("GET /feed", "{\"ok\":true}");
    auto hit = store->get_cache("GET /feed");
    ASSERT_TRUE(hit.has_value());
    EXPECT_EQ(*hit, "{\"ok\":true}");

    clock.advance(config.cache_ttl_sec);
    EXPECT_FALSE(store->get_cache("GET /feed").has_value());

    store->set_cache("GET /feed", "{\"ok\":false}");
    EXPECT_EQ(*store->get_cache("GET /feed"), "{\"ok\":false}");
}

TEST_F(RedisStoreTest, StateSurvivesReconnect) {
    if (!store->is_connected()) GTEST_SKIP();

    seed("persisted", 1, t - 5);
    RedisStore reopened(config, clock.fn());
    ASSERT_TRUE(reopened.is_connected());

    auto row = reopened.find("persisted");
    ASSERT_TRUE(row.has_value());
    EXPECT_EQ(row->use_count, 1);
    EXPECT_EQ(row->last_used, t - 5);
}

TEST_F(RedisStoreTest, LoweredFreshUseLimitAppliesToStoredRows) {
    if (!store->is_connected()) GTEST_SKIP();

    PoolConfig wide = config;
    wide.fresh_use_limit = 3;
    {
        RedisStore lenient(wide, clock.fn());
        ASSERT_TRUE(lenient.is_connected());
        ASSERT_EQ(lenient.add_credentials({"X"}), 1u);
        ASSERT_EQ(*lenient.allocate(), "X");
        ASSERT_EQ(*lenient.allocate(), "X");
        EXPECT_EQ(lenient.count_available(), 1);
    }

    RedisStore strict(config, clock.fn());
    ASSERT_TRUE(strict.is_connected());
    EXPECT_EQ(strict.count_available(), 0);
    EXPECT_EQ(strict.stats().exhausted, 1);
    EXPECT_FALSE(strict.allocate().has_value());
    EXPECT_EQ(strict.find("X")->use_count, 2);

    clock.advance(config.cooldown_sec + 1);
    EXPECT_EQ(*strict.allocate(), "X");
}

TEST_F(RedisStoreTest, RaisedFreshUseLimitRestoresExhaustedRows) {
    if (!store->is_connected()) GTEST_SKIP();

    seed("Y", 2, t - 10);
    EXPECT_FALSE(store->allocate().has_value());

    PoolConfig wide = config;
    wide.fresh_use_limit = 3;
    RedisStore lenient(wide, clock.fn());
    ASSERT_TRUE(lenient.is_connected());
    EXPECT_EQ(lenient.count_available(), 1);
    EXPECT_EQ(*lenient.allocate(), "Y");
    EXPECT_EQ(lenient.find("Y")->use_count, 3);
}
