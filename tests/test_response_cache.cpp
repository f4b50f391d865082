#include <gtest/gtest.h>
#include "response_cache.hpp"
#include "memory_store.hpp"
#include "metrics.hpp"
#include "test_helpers.hpp"

using namespace credpool;
namespace json = boost::json;

TEST(ResponseCacheTest, FingerprintWithoutPayload) {
    EXPECT_EQ(ResponseCache::fingerprint("get", "/api/feed"), "GET /api/feed null");
    json::value null_payload;
    EXPECT_EQ(ResponseCache::fingerprint("GET", "/api/feed", &null_payload), "GET /api/feed null");
}

TEST(ResponseCacheTest, FingerprintIgnoresKeyOrder) {
    json::value a = json::parse(R"({"b":1,"a":{"y":[1,2],"x":"s"}})");
    json::value b = json::parse(R"({"a":{"x":"s","y":[1,2]},"b":1})");

    auto fa = ResponseCache::fingerprint("POST", "/api/search", &a);
    auto fb = ResponseCache::fingerprint("post", "/api/search", &b);
    EXPECT_EQ(fa, fb);
    EXPECT_EQ(fa, R"(POST /api/search {"a":{"x":"s","y":[1,2]},"b":1})");
}

TEST(ResponseCacheTest, DifferentPayloadsDiffer) {
    json::value a = json::parse(R"({"page":1})");
    json::value b = json::parse(R"({"page":2})");
    EXPECT_NE(ResponseCache::fingerprint("POST", "/x", &a), ResponseCache::fingerprint("POST", "/x", &b));
    EXPECT_NE(ResponseCache::fingerprint("POST", "/x", &a), ResponseCache::fingerprint("POST", "/y", &a));
}

TEST(ResponseCacheTest, EndpointCannotImitatePayload) {
    json::value empty = json::parse("{}");
    EXPECT_NE(ResponseCache::fingerprint("GET", "/a:{}"), ResponseCache::fingerprint("GET", "/a", &empty));
    EXPECT_NE(ResponseCache::fingerprint("GET", "/a {}"), ResponseCache::fingerprint("GET", "/a", &empty));
    EXPECT_EQ(ResponseCache::fingerprint("GET", "/a b"), "GET /a%20b null");
}

TEST(ResponseCacheTest, LookupMissThenHit) {
    auto& reg = MetricsRegistry::instance();
    reg.reset();

    PoolConfig config;
    test::ManualClock clock;
    MemoryStore store(config, clock.fn());
    ResponseCache cache(store);

    json::value payload = json::parse(R"({"q":"shoes"})");
    EXPECT_FALSE(cache.lookup("POST", "/search", &payload).has_value());

    cache.store("POST", "/search", &payload, "{\"items\":[]}");
    auto hit = cache.lookup("post", "/search", &payload);
    ASSERT_TRUE(hit.has_value());
    EXPECT_EQ(*hit, "{\"items\":[]}");

    EXPECT_EQ(reg.get_counter("cache_misses_total"), 1.0);
    EXPECT_EQ(reg.get_counter("cache_hits_total"), 1.0);

    clock.advance(config.cache_ttl_sec);
    EXPECT_FALSE(cache.lookup("POST", "/search", &payload).has_value());
}
