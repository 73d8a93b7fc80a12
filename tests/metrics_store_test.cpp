// Tests for the in-memory TTL metrics store

#include <gtest/gtest.h>
#include <algorithm>
#include <thread>

#include "metrics_store.hpp"

using namespace std::chrono_literals;

namespace sdc {
namespace test {

class MetricsStoreTest : public ::testing::Test {
protected:
    InMemoryMetricsStore store_;
};

TEST_F(MetricsStoreTest, SetAndGet) {
    EXPECT_TRUE(store_.set_ex("metrics:s1:720p", "{\"fps\":30}", 60s, 100ms));
    auto value = store_.get("metrics:s1:720p");
    ASSERT_TRUE(value.has_value());
    EXPECT_EQ(*value, "{\"fps\":30}");
    EXPECT_FALSE(store_.get("metrics:s1:1080p").has_value());
}

TEST_F(MetricsStoreTest, OverwriteReplacesValue) {
    store_.set_ex("k", "a", 60s, 100ms);
    store_.set_ex("k", "b", 60s, 100ms);
    EXPECT_EQ(store_.get("k").value_or(""), "b");
    EXPECT_EQ(store_.size(), 1u);
}

TEST_F(MetricsStoreTest, ExpiredKeysDisappear) {
    store_.set_ex("short", "x", 0s, 100ms);
    store_.set_ex("long", "y", 60s, 100ms);

    EXPECT_FALSE(store_.get("short").has_value());
    EXPECT_EQ(store_.keys(""), std::vector<std::string>{"long"});
    EXPECT_EQ(store_.size(), 1u);
}

TEST_F(MetricsStoreTest, PrefixQueries) {
    store_.set_ex("metrics:s1:360p", "1", 60s, 100ms);
    store_.set_ex("metrics:s1:720p", "2", 60s, 100ms);
    store_.set_ex("metrics:s2:720p", "3", 60s, 100ms);
    store_.set_ex("network:live:v1", "4", 60s, 100ms);

    auto keys = store_.keys("metrics:s1:");
    std::sort(keys.begin(), keys.end());
    EXPECT_EQ(keys, (std::vector<std::string>{"metrics:s1:360p", "metrics:s1:720p"}));

    EXPECT_EQ(store_.erase_prefix("metrics:s1:"), 2u);
    EXPECT_EQ(store_.erase_prefix("metrics:s1:"), 0u);
    EXPECT_EQ(store_.size(), 2u);
}

TEST_F(MetricsStoreTest, ConcurrentWritersAllLand) {
    std::vector<std::thread> writers;
    for (int t = 0; t < 4; t++) {
        writers.emplace_back([this, t] {
            for (int i = 0; i < 50; i++) {
                std::string key = "k:" + std::to_string(t) + ":" + std::to_string(i);
                EXPECT_TRUE(store_.set_ex(key, "v", 60s, 1000ms));
            }
        });
    }
    for (auto& w : writers) w.join();
    EXPECT_EQ(store_.size(), 200u);
}

} // namespace test
} // namespace sdc
