#pragma once

#include <array>
#include <chrono>
#include <string>

namespace sdc {

enum class NetworkCondition {
    Poor = 0,
    Fair = 1,
    Good = 2,
    Excellent = 3,
};

const char* condition_name(NetworkCondition condition);

// One viewer telemetry submission
struct NetworkSample {
    double bandwidth_kbps = 0.0;
    double latency_ms = 0.0;
    double packet_loss_pct = 0.0;
    std::chrono::system_clock::time_point timestamp = std::chrono::system_clock::now();
};

struct Classification {
    NetworkCondition condition = NetworkCondition::Poor;
    std::string recommended_quality = "360p";
};

// Tier thresholds. A tier applies only when all three limits hold.
struct ConditionThreshold {
    NetworkCondition condition;
    double min_bandwidth_kbps;
    double max_latency_ms;
    double max_packet_loss_pct;
};

// Best tier first; anything below the last entry is Poor
const std::array<ConditionThreshold, 3>& condition_thresholds();

// Negative or non-finite readings classify as Poor
Classification classify(const NetworkSample& sample);

// excellent → 1080p, good → 720p, fair → 480p, poor → 360p
const char* quality_for_condition(NetworkCondition condition);

} // namespace sdc
