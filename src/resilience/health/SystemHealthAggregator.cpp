#include "health/SystemHealthAggregator.hpp"
#include "log/TaggedLogger.hpp"

#include <string>

namespace RS {

auto systemTierToString(SystemTier tier) -> std::string_view {
    switch (tier) {
    case SystemTier::Normal:
        return "NORMAL";
    case SystemTier::Degraded:
        return "DEGRADED";
    case SystemTier::Emergency:
        return "EMERGENCY";
    case SystemTier::Critical:
        return "CRITICAL";
    }
    return "CRITICAL";
}

SystemHealthAggregator::SystemHealthAggregator(HealthThresholds thresholds)
    : bounds(thresholds) {}

auto SystemHealthAggregator::accumulate(SystemHealth& health, TierView const& view) const -> void {
    ++health.total;
    if (view.recoverable) {
        health.canRecover = true;
    }
    switch (view.tier) {
    case ComponentTier::Normal:
        ++health.normal;
        break;
    case ComponentTier::Reduced:
        ++health.reduced;
        ++health.degraded;
        break;
    case ComponentTier::Fallback:
        ++health.fallback;
        ++health.degraded;
        break;
    case ComponentTier::Emergency:
        ++health.emergency;
        ++health.degraded;
        break;
    case ComponentTier::Failed:
        ++health.failed;
        break;
    }
}

auto SystemHealthAggregator::classify(SystemHealth& health) const -> void {
    health.tier = SystemTier::Normal;
    if (health.total == 0) {
        return;
    }
    auto const total    = static_cast<double>(health.total);
    auto const exceeds  = [total](std::size_t count, double percent) { return static_cast<double>(count) * 100.0 > percent * total; };
    auto const severe   = health.failed + health.emergency;
    auto const impaired = severe + health.fallback;

    if (exceeds(health.failed, this->bounds.criticalFailedPercent)) {
        health.tier = SystemTier::Critical;
    } else if (exceeds(severe, this->bounds.emergencyPercent)) {
        health.tier = SystemTier::Emergency;
    } else if (exceeds(impaired, this->bounds.degradedPercent)) {
        health.tier = SystemTier::Degraded;
    }
}

auto SystemHealthAggregator::aggregate(std::span<TierView const> views) const -> SystemHealth {
    SystemHealth health;
    for (auto const& view : views) {
        this->accumulate(health, view);
    }
    this->classify(health);
    return health;
}

auto SystemHealthAggregator::aggregate(std::initializer_list<std::span<TierView const>> sources) const -> SystemHealth {
    SystemHealth health;
    for (auto const& views : sources) {
        for (auto const& view : views) {
            this->accumulate(health, view);
        }
    }
    this->classify(health);
    return health;
}

auto SystemHealthAggregator::observe(SystemHealth const& health) -> bool {
    auto const previous = this->lastObserved.exchange(health.tier);
    if (previous == health.tier) {
        return false;
    }
    rs_log("System health " + std::string(systemTierToString(previous)) + " -> " + std::string(systemTierToString(health.tier)) + " (" + std::to_string(health.normal) + "/"
                   + std::to_string(health.total) + " normal)",
           "Health");
    return true;
}

} // namespace RS
