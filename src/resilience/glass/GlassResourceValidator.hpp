#pragma once
#include "core/Clock.hpp"
#include "core/Tier.hpp"
#include "glass/GlassStyle.hpp"
#include "host/HostEnvironment.hpp"
#include "resource/ResourceCatalog.hpp"
#include "resource/ResourceCatalogValidator.hpp"

#include <array>
#include <chrono>
#include <cstddef>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace RS {

struct GlassKindReport {
    ResourceKind             kind  = ResourceKind::Visual;
    std::size_t              total = 0;
    std::vector<std::string> available;
    std::vector<std::string> missing;
    int                      fallbacksAvailable = 0;

    [[nodiscard]] auto availabilityPercentage() const -> float;
};

struct GlassValidation {
    std::array<GlassKindReport, ResourceKindCount> kinds{};
    std::size_t                                    totalResources    = 0;
    std::size_t                                    totalMissing      = 0;
    int                                            totalFallbacks    = 0;
    double                                         missingPercentage = 0.0;
    bool                                           effectsSupported  = false;
    GlassTier                                      recommendedTier   = GlassTier::Full;
    std::chrono::microseconds                      validationTime{0};
    TimePoint                                      timestamp{};

    [[nodiscard]] auto report(ResourceKind kind) const -> GlassKindReport const& { return this->kinds[static_cast<std::size_t>(kind)]; }
    [[nodiscard]] auto visual() const -> GlassKindReport const& { return this->report(ResourceKind::Visual); }
    [[nodiscard]] auto color() const -> GlassKindReport const& { return this->report(ResourceKind::Color); }
    [[nodiscard]] auto dimension() const -> GlassKindReport const& { return this->report(ResourceKind::Dimension); }
    [[nodiscard]] auto overallAvailabilityPercentage() const -> float;
};

// Capability first, then the share of missing resources.
[[nodiscard]] constexpr auto recommendGlassTier(bool effectsSupported, double missingPercentage) -> GlassTier {
    if (!effectsSupported) {
        return GlassTier::Reduced;
    }
    if (missingPercentage <= 0.0) {
        return GlassTier::Full;
    }
    if (missingPercentage <= 25.0) {
        return GlassTier::Reduced;
    }
    if (missingPercentage <= 50.0) {
        return GlassTier::Minimal;
    }
    return GlassTier::None;
}

/**
 * GlassResourceValidator — validates the glass effect resource set and picks
 * the glass tier the rendering layer should run at.
 *
 * Availability checks are delegated to the ResourceCatalogValidator so that
 * "resolved but failed to load" is treated the same way everywhere.
 */
class GlassResourceValidator {
public:
    GlassResourceValidator(ResourceCatalogValidator const& base, HostEnvironment const& host, Clock const& clock);
    GlassResourceValidator(ResourceCatalogValidator const& base, HostEnvironment const& host, Clock const& clock, std::span<CatalogEntry const> catalog);

    [[nodiscard]] auto validateAll() const -> GlassValidation;
    [[nodiscard]] auto validateKind(ResourceKind kind) const -> GlassKindReport;

    [[nodiscard]] auto fallbackFor(std::string_view name) const -> std::optional<ResourceFallback>;
    [[nodiscard]] auto fallbackOrDefault(std::string_view name, ResourceKind kind) const -> ResourceFallback;
    [[nodiscard]] auto fallbackDimensionPx(std::string_view name, float density) const -> float;

    // Substitutions that apply to the currently missing visual and color resources.
    [[nodiscard]] auto substitutions() const -> std::vector<ResourceSubstitution>;

    [[nodiscard]] auto canUseEffects() const -> bool;
    [[nodiscard]] auto optimalStyle() const -> GlassStyle;

private:
    ResourceCatalogValidator const& base;
    HostEnvironment const&          host;
    Clock const&                    clock;
    std::span<CatalogEntry const>   catalog;
};

} // namespace RS
