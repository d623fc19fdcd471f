#pragma once
#include "health/SystemHealth.hpp"

#include <atomic>
#include <initializer_list>
#include <span>
#include <vector>

namespace RS {

/**
 * SystemHealthAggregator — folds component tiers from every coordinator
 * into one system tier.
 *
 * aggregate() is pure and recomputed on every call. observe() remembers the
 * last reported tier so that tier changes are logged once.
 */
class SystemHealthAggregator {
public:
    explicit SystemHealthAggregator(HealthThresholds thresholds = {});

    [[nodiscard]] auto aggregate(std::span<TierView const> views) const -> SystemHealth;
    [[nodiscard]] auto aggregate(std::initializer_list<std::span<TierView const>> sources) const -> SystemHealth;

    // Returns true when the tier differs from the previously observed one.
    auto observe(SystemHealth const& health) -> bool;

    [[nodiscard]] auto thresholds() const -> HealthThresholds const& { return this->bounds; }

private:
    auto accumulate(SystemHealth& health, TierView const& view) const -> void;
    auto classify(SystemHealth& health) const -> void;

    HealthThresholds        bounds;
    std::atomic<SystemTier> lastObserved{SystemTier::Normal};
};

} // namespace RS
