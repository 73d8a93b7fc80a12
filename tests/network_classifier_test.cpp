// Tests for the network condition classifier
//
// Tests cover:
// - Tier thresholds, all three limits per tier
// - Tier to quality mapping
// - Malformed readings

#include <gtest/gtest.h>
#include <cmath>
#include <limits>

#include "network_classifier.hpp"

namespace sdc {
namespace test {

static NetworkSample sample(double bandwidth, double latency, double loss) {
    NetworkSample s;
    s.bandwidth_kbps = bandwidth;
    s.latency_ms = latency;
    s.packet_loss_pct = loss;
    return s;
}

TEST(NetworkClassifierTest, ExcellentSampleRecommends1080p) {
    auto c = classify(sample(6000, 30, 0.05));
    EXPECT_EQ(c.condition, NetworkCondition::Excellent);
    EXPECT_EQ(c.recommended_quality, "1080p");
}

TEST(NetworkClassifierTest, ThresholdBoundariesAreInclusive) {
    EXPECT_EQ(classify(sample(5000, 50, 0.1)).condition, NetworkCondition::Excellent);
    EXPECT_EQ(classify(sample(2500, 100, 0.5)).condition, NetworkCondition::Good);
    EXPECT_EQ(classify(sample(1200, 200, 1.0)).condition, NetworkCondition::Fair);
}

TEST(NetworkClassifierTest, GoodAndFairTiers) {
    auto good = classify(sample(3000, 80, 0.3));
    EXPECT_EQ(good.condition, NetworkCondition::Good);
    EXPECT_EQ(good.recommended_quality, "720p");

    auto fair = classify(sample(1500, 150, 0.8));
    EXPECT_EQ(fair.condition, NetworkCondition::Fair);
    EXPECT_EQ(fair.recommended_quality, "480p");
}

TEST(NetworkClassifierTest, LowBandwidthHighLossIsPoor) {
    auto c = classify(sample(300, 600, 3.0));
    EXPECT_EQ(c.condition, NetworkCondition::Poor);
    EXPECT_EQ(c.recommended_quality, "360p");
}

TEST(NetworkClassifierTest, EveryLimitOfATierMustHold) {
    // Plenty of bandwidth, but latency only fits "fair"
    EXPECT_EQ(classify(sample(10000, 150, 0.0)).condition, NetworkCondition::Fair);
    // Excellent bandwidth and latency, loss only fits "good"
    EXPECT_EQ(classify(sample(10000, 10, 0.4)).condition, NetworkCondition::Good);
    // Loss above every tier
    EXPECT_EQ(classify(sample(10000, 10, 1.5)).condition, NetworkCondition::Poor);
}

TEST(NetworkClassifierTest, MalformedReadingsArePoor) {
    EXPECT_EQ(classify(sample(-1, 10, 0)).condition, NetworkCondition::Poor);
    EXPECT_EQ(classify(sample(6000, -5, 0)).condition, NetworkCondition::Poor);
    EXPECT_EQ(classify(sample(std::nan(""), 10, 0)).condition, NetworkCondition::Poor);
    EXPECT_EQ(classify(sample(std::numeric_limits<double>::infinity(), 10, 0)).condition,
              NetworkCondition::Poor);
    EXPECT_EQ(classify(sample(6000, 10, -0.1)).recommended_quality, "360p");
}

TEST(NetworkClassifierTest, QualityMappingIsFixed) {
    EXPECT_STREQ(quality_for_condition(NetworkCondition::Excellent), "1080p");
    EXPECT_STREQ(quality_for_condition(NetworkCondition::Good), "720p");
    EXPECT_STREQ(quality_for_condition(NetworkCondition::Fair), "480p");
    EXPECT_STREQ(quality_for_condition(NetworkCondition::Poor), "360p");
}

TEST(NetworkClassifierTest, ConditionNames) {
    EXPECT_STREQ(condition_name(NetworkCondition::Excellent), "excellent");
    EXPECT_STREQ(condition_name(NetworkCondition::Poor), "poor");
}

} // namespace test
} // namespace sdc
