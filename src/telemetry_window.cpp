#include "telemetry_window.hpp"
#include <algorithm>

namespace sdc {

TelemetryWindow::TelemetryWindow(size_t capacity, size_t upgrade_hold)
    : capacity_(std::max<size_t>(capacity, 1))
    , upgrade_hold_(std::clamp<size_t>(upgrade_hold, 1, std::max<size_t>(capacity, 1)))
{
}

NetworkCondition TelemetryWindow::add(const NetworkSample& sample) {
    NetworkCondition raw = classify(sample).condition;

    entries_.push_back(Entry{sample, raw});
    while (entries_.size() > capacity_) {
        entries_.pop_front();
    }

    if (!condition_ || raw < *condition_) {
        condition_ = raw;
    } else if (raw > *condition_) {
        NetworkCondition held = held_upgrade();
        if (held > *condition_) {
            condition_ = held;
        }
    }

    return *condition_;
}

NetworkCondition TelemetryWindow::held_upgrade() const {
    if (entries_.size() < upgrade_hold_) {
        return *condition_;
    }

    // Worst tier across the hold span is the best one all of them support
    NetworkCondition worst = NetworkCondition::Excellent;
    auto it = entries_.end() - static_cast<std::ptrdiff_t>(upgrade_hold_);
    for (; it != entries_.end(); ++it) {
        worst = std::min(worst, it->condition);
    }
    return worst;
}

} // namespace sdc
