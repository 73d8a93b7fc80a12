#pragma once

#include "network_classifier.hpp"
#include <cstddef>
#include <deque>
#include <optional>

namespace sdc {

// Rolling window of one viewer's recent samples with upgrade hysteresis.
// Downgrades apply at once; an upgrade needs the last `upgrade_hold` samples
// to all sit at or above the new tier.
class TelemetryWindow {
public:
    TelemetryWindow(size_t capacity, size_t upgrade_hold);

    struct Entry {
        NetworkSample sample;
        NetworkCondition condition;
    };

    // Returns the damped condition after taking the sample into account
    NetworkCondition add(const NetworkSample& sample);

    std::optional<NetworkCondition> condition() const { return condition_; }
    const std::deque<Entry>& entries() const { return entries_; }
    size_t size() const { return entries_.size(); }

private:
    NetworkCondition held_upgrade() const;

    size_t capacity_;
    size_t upgrade_hold_;
    std::deque<Entry> entries_;
    std::optional<NetworkCondition> condition_;
};

} // namespace sdc
