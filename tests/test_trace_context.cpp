#include <gtest/gtest.h>
#include "trace_context.hpp"
#include <regex>
#include <set>

using namespace credpool;

TEST(TraceContextTest, TraceparentFormat) {
    std::regex pattern("^00-[0-9a-f]{32}-[0-9a-f]{16}-01$");
    for (int i = 0; i < 20; ++i) {
        EXPECT_TRUE(std::regex_match(TraceContext::generate_traceparent(), pattern));
    }
}

TEST(TraceContextTest, TraceparentsAreUnique) {
    std::set<std::string> seen;
    for (int i = 0; i < 1000; ++i) {
        seen.insert(TraceContext::generate_traceparent());
    }
    EXPECT_EQ(seen.size(), 1000u);
}

TEST(TraceContextTest, RandomHexRejectsBadLengths) {
    EXPECT_EQ(TraceContext::random_hex(4).size(), 8u);
    EXPECT_THROW(TraceContext::random_hex(0), std::invalid_argument);
    EXPECT_THROW(TraceContext::random_hex(33), std::invalid_argument);
}
