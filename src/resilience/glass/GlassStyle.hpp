#pragma once
#include "core/Tier.hpp"

#include <chrono>

namespace RS {

/**
 * GlassStyle — the knobs the rendering layer reads when it paints glass
 * surfaces. The engine never paints; it only picks which configuration
 * applies for the current glass tier.
 */
struct GlassStyle {
    float backgroundAlpha      = 0.20f;
    float panelBackgroundAlpha = 0.15f;
    float itemBackgroundAlpha  = 0.08f;
    float borderAlpha          = 0.30f;
    float panelBorderAlpha     = 0.20f;
    float itemBorderAlpha      = 0.10f;
    float cornerRadius         = 12.0f;
    float blurRadius           = 25.0f;
    float focusElevation       = 16.0f;
    float focusScale           = 1.02f;

    std::chrono::milliseconds focusAnimationDuration{50};
    std::chrono::milliseconds moveAnimationDuration{150};
    std::chrono::milliseconds maxAnimationDuration{500};

    bool enableBlurEffects       = true;
    bool enableElevationShadows  = true;
    bool enableComplexAnimations = true;

    static auto Default() -> GlassStyle { return GlassStyle{}; }
    static auto Performance() -> GlassStyle;
    static auto ForTier(GlassTier tier, GlassStyle const& base = Default()) -> GlassStyle;

    [[nodiscard]] auto withPerformanceAdjustments(bool hasHardwareAcceleration, bool isLowEndDevice) const -> GlassStyle;
    [[nodiscard]] auto withReducedEffects() const -> GlassStyle;
    [[nodiscard]] auto withMinimalEffects() const -> GlassStyle;
    [[nodiscard]] auto withNoEffects() const -> GlassStyle;

    auto operator==(GlassStyle const&) const -> bool = default;
};

} // namespace RS
