#include "glass/GlassStyle.hpp"

namespace RS {

using namespace std::chrono_literals;

auto GlassStyle::Performance() -> GlassStyle {
    GlassStyle style;
    style.enableBlurEffects       = false;
    style.enableElevationShadows  = false;
    style.enableComplexAnimations = false;
    style.focusAnimationDuration  = 150ms;
    style.moveAnimationDuration   = 200ms;
    style.maxAnimationDuration    = 300ms;
    return style;
}

auto GlassStyle::ForTier(GlassTier tier, GlassStyle const& base) -> GlassStyle {
    switch (tier) {
    case GlassTier::Full:
        return base;
    case GlassTier::Reduced:
        return base.withReducedEffects();
    case GlassTier::Minimal:
        return base.withMinimalEffects();
    case GlassTier::None:
        return base.withNoEffects();
    }
    return base.withNoEffects();
}

auto GlassStyle::withPerformanceAdjustments(bool hasHardwareAcceleration, bool isLowEndDevice) const -> GlassStyle {
    if (!isLowEndDevice) {
        return *this;
    }
    GlassStyle style              = *this;
    style.enableBlurEffects       = false;
    style.enableElevationShadows  = hasHardwareAcceleration;
    style.enableComplexAnimations = hasHardwareAcceleration;
    style.focusAnimationDuration  = hasHardwareAcceleration ? 200ms : 150ms;
    style.moveAnimationDuration   = hasHardwareAcceleration ? 300ms : 200ms;
    return style;
}

auto GlassStyle::withReducedEffects() const -> GlassStyle {
    GlassStyle style              = *this;
    style.enableBlurEffects       = false;
    style.enableElevationShadows  = true;
    style.enableComplexAnimations = true;
    style.blurRadius              = 0.0f;
    style.backgroundAlpha         = 0.8f;
    return style;
}

auto GlassStyle::withMinimalEffects() const -> GlassStyle {
    GlassStyle style              = *this;
    style.enableBlurEffects       = false;
    style.enableElevationShadows  = false;
    style.enableComplexAnimations = false;
    style.blurRadius              = 0.0f;
    style.backgroundAlpha         = 0.9f;
    style.borderAlpha             = 0.5f;
    return style;
}

auto GlassStyle::withNoEffects() const -> GlassStyle {
    GlassStyle style              = *this;
    style.enableBlurEffects       = false;
    style.enableElevationShadows  = false;
    style.enableComplexAnimations = false;
    style.blurRadius              = 0.0f;
    style.backgroundAlpha         = 1.0f;
    style.borderAlpha             = 0.0f;
    return style;
}

} // namespace RS
