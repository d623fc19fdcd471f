#include "glass/GlassResourceValidator.hpp"
#include "glass/GlassCatalog.hpp"
#include "log/TaggedLogger.hpp"

#include <string>

namespace RS {

auto GlassKindReport::availabilityPercentage() const -> float {
    if (this->total == 0) {
        return 100.0f;
    }
    return static_cast<float>(this->available.size()) / static_cast<float>(this->total) * 100.0f;
}

auto GlassValidation::overallAvailabilityPercentage() const -> float {
    if (this->totalResources == 0) {
        return 100.0f;
    }
    auto const available = this->totalResources - this->totalMissing;
    return static_cast<float>(available) / static_cast<float>(this->totalResources) * 100.0f;
}

GlassResourceValidator::GlassResourceValidator(ResourceCatalogValidator const& base, HostEnvironment const& host, Clock const& clock)
    : GlassResourceValidator(base, host, clock, GlassCatalog) {}

GlassResourceValidator::GlassResourceValidator(ResourceCatalogValidator const& base, HostEnvironment const& host, Clock const& clock, std::span<CatalogEntry const> catalog)
    : base(base), host(host), clock(clock), catalog(catalog) {}

auto GlassResourceValidator::validateKind(ResourceKind kind) const -> GlassKindReport {
    GlassKindReport report;
    report.kind = kind;
    for (auto const& entry : this->catalog) {
        if (entry.kind != kind) {
            continue;
        }
        ++report.total;
        if (this->base.isAvailable(entry.descriptor())) {
            report.available.emplace_back(entry.name);
            continue;
        }
        report.missing.emplace_back(entry.name);
        if (entry.fallback.present()) {
            ++report.fallbacksAvailable;
        }
    }
    return report;
}

auto GlassResourceValidator::validateAll() const -> GlassValidation {
    auto const started = std::chrono::steady_clock::now();

    GlassValidation validation;
    for (std::size_t index = 0; index < ResourceKindCount; ++index) {
        auto& report = validation.kinds[index];
        report       = this->validateKind(static_cast<ResourceKind>(index));
        validation.totalResources += report.total;
        validation.totalMissing += report.missing.size();
        validation.totalFallbacks += report.fallbacksAvailable;
    }
    validation.missingPercentage = validation.totalResources == 0
                                           ? 0.0
                                           : static_cast<double>(validation.totalMissing) / static_cast<double>(validation.totalResources) * 100.0;
    validation.effectsSupported = this->host.capabilityProbe();
    validation.recommendedTier  = recommendGlassTier(validation.effectsSupported, validation.missingPercentage);
    validation.validationTime   = std::chrono::duration_cast<std::chrono::microseconds>(std::chrono::steady_clock::now() - started);
    validation.timestamp        = this->clock.now();

    rs_log("Glass validation - missing " + std::to_string(validation.totalMissing) + "/" + std::to_string(validation.totalResources) + ", fallbacks "
                   + std::to_string(validation.totalFallbacks) + ", recommended " + std::string(tierName(validation.recommendedTier)),
           "GlassValidator");
    return validation;
}

auto GlassResourceValidator::fallbackFor(std::string_view name) const -> std::optional<ResourceFallback> {
    if (auto const* entry = findCatalogEntry(this->catalog, name); entry && entry->fallback.present()) {
        return entry->fallback;
    }
    return std::nullopt;
}

auto GlassResourceValidator::fallbackOrDefault(std::string_view name, ResourceKind kind) const -> ResourceFallback {
    if (auto fallback = this->fallbackFor(name)) {
        return *fallback;
    }
    switch (kind) {
    case ResourceKind::Color:
        return GlassDefaultColorFallback;
    case ResourceKind::Dimension:
        return GlassDefaultDimensionFallback;
    case ResourceKind::Visual:
    case ResourceKind::Layout:
        break;
    }
    return GlassDefaultDrawableFallback;
}

auto GlassResourceValidator::fallbackDimensionPx(std::string_view name, float density) const -> float {
    auto const fallback = this->fallbackOrDefault(name, ResourceKind::Dimension);
    auto const dp       = fallback.type == ResourceFallback::Type::Dimension ? fallback.dp : GlassDefaultDimensionFallback.dp;
    return dp * density;
}

auto GlassResourceValidator::substitutions() const -> std::vector<ResourceSubstitution> {
    std::vector<ResourceSubstitution> result;
    for (auto const kind : {ResourceKind::Visual, ResourceKind::Color}) {
        for (auto const& name : this->validateKind(kind).missing) {
            if (auto fallback = this->fallbackFor(name)) {
                rs_log("Mapped missing glass resource '" + name + "' to " + fallback->describe(), "GlassValidator");
                result.push_back(ResourceSubstitution{name, kind, *fallback});
            }
        }
    }
    return result;
}

auto GlassResourceValidator::canUseEffects() const -> bool {
    return this->validateAll().recommendedTier != GlassTier::None;
}

auto GlassResourceValidator::optimalStyle() const -> GlassStyle {
    auto const validation = this->validateAll();
    auto const style      = GlassStyle::Default().withPerformanceAdjustments(validation.effectsSupported, !validation.effectsSupported);
    return GlassStyle::ForTier(validation.recommendedTier, style);
}

} // namespace RS
