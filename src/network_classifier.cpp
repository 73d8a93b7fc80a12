#include "network_classifier.hpp"
#include <cmath>

namespace sdc {

const char* condition_name(NetworkCondition condition) {
    switch (condition) {
        case NetworkCondition::Excellent: return "excellent";
        case NetworkCondition::Good: return "good";
        case NetworkCondition::Fair: return "fair";
        case NetworkCondition::Poor: return "poor";
    }
    return "poor";
}

const std::array<ConditionThreshold, 3>& condition_thresholds() {
    static const std::array<ConditionThreshold, 3> thresholds = {{
        {NetworkCondition::Excellent, 5000.0,  50.0, 0.1},
        {NetworkCondition::Good,      2500.0, 100.0, 0.5},
        {NetworkCondition::Fair,      1200.0, 200.0, 1.0},
    }};
    return thresholds;
}

const char* quality_for_condition(NetworkCondition condition) {
    switch (condition) {
        case NetworkCondition::Excellent: return "1080p";
        case NetworkCondition::Good: return "720p";
        case NetworkCondition::Fair: return "480p";
        case NetworkCondition::Poor: return "360p";
    }
    return "360p";
}

static bool is_valid_reading(double value) {
    return std::isfinite(value) && value >= 0.0;
}

Classification classify(const NetworkSample& sample) {
    Classification result;

    if (!is_valid_reading(sample.bandwidth_kbps) ||
        !is_valid_reading(sample.latency_ms) ||
        !is_valid_reading(sample.packet_loss_pct)) {
        return result;
    }

    for (const auto& tier : condition_thresholds()) {
        if (sample.bandwidth_kbps >= tier.min_bandwidth_kbps &&
            sample.latency_ms <= tier.max_latency_ms &&
            sample.packet_loss_pct <= tier.max_packet_loss_pct) {
            result.condition = tier.condition;
            break;
        }
    }

    result.recommended_quality = quality_for_condition(result.condition);
    return result;
}

} // namespace sdc
