#pragma once
#include "core/Tier.hpp"

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace RS {

enum class SystemTier : std::uint8_t {
    Normal = 0,
    Degraded,
    Emergency,
    Critical
};

[[nodiscard]] auto systemTierToString(SystemTier tier) -> std::string_view;

// Percentages of all tracked components; a bound is exceeded when the share is strictly above it.
struct HealthThresholds {
    double criticalFailedPercent = 50.0;
    double emergencyPercent      = 30.0;
    double degradedPercent       = 10.0;
};

// Read-only view of one component's tier, projected onto the component scale.
struct TierView {
    std::string   componentId;
    ComponentTier tier        = ComponentTier::Normal;
    bool          recoverable = true;
};

struct SystemHealth {
    SystemTier  tier       = SystemTier::Normal;
    std::size_t total      = 0;
    std::size_t normal     = 0;
    std::size_t degraded   = 0;
    std::size_t failed     = 0;
    std::size_t reduced    = 0;
    std::size_t fallback   = 0;
    std::size_t emergency  = 0;
    bool        canRecover = false;

    [[nodiscard]] auto healthPercentage() const -> double {
        if (this->total == 0) {
            return 100.0;
        }
        return static_cast<double>(this->normal) / static_cast<double>(this->total) * 100.0;
    }
};

// Starting tier derived from a preflight resource check, before any component has failed.
[[nodiscard]] constexpr auto initialSystemTier(std::size_t missingResources) -> SystemTier {
    if (missingResources == 0) {
        return SystemTier::Normal;
    }
    if (missingResources <= 5) {
        return SystemTier::Degraded;
    }
    if (missingResources <= 15) {
        return SystemTier::Emergency;
    }
    return SystemTier::Critical;
}

} // namespace RS
