#include "recovery/FallbackRecipes.hpp"

namespace RS {
namespace {

auto panel(int paddingDp, ColorToken background, float alpha = 1.0f) -> Renderable::Body {
    return PanelSpec{.vertical = true, .paddingDp = paddingDp, .background = background, .alpha = alpha};
}

auto errorText(std::string_view componentId) -> TextSpec {
    return TextSpec{.text       = std::string{"Error: "}.append(componentId).append(" failed"),
                    .color      = ColorToken::HoloRedLight,
                    .textSizeSp = 14.0f,
                    .paddingDp  = 8,
                    .background = ColorToken::BackgroundDark};
}

auto unavailableText() -> TextSpec {
    return TextSpec{.text = "Component unavailable", .color = ColorToken::SecondaryText, .textSizeSp = 14.0f, .paddingDp = 8, .background = std::nullopt};
}

auto fromBody(std::string_view componentId, Renderable::Body body) -> Renderable {
    Renderable renderable;
    renderable.componentId = std::string{componentId};
    renderable.origin      = Renderable::Origin::Fallback;
    renderable.body        = std::move(body);
    return renderable;
}

} // namespace

auto FallbackRecipe<ComponentKind::ToggleSwitch>::make(std::string_view, ComponentTier tier) -> std::optional<Renderable::Body> {
    switch (tier) {
    case ComponentTier::Fallback:
        return SwitchSpec{.checked = false, .enabled = true, .focusable = true, .label = std::nullopt, .paddingDp = 0};
    case ComponentTier::Emergency:
        return SwitchSpec{.checked = false, .enabled = true, .focusable = true, .label = std::string{"Toggle"}, .paddingDp = 0};
    default:
        return std::nullopt;
    }
}

auto FallbackRecipe<ComponentKind::GlassCard>::make(std::string_view, ComponentTier tier) -> std::optional<Renderable::Body> {
    switch (tier) {
    case ComponentTier::Fallback:
        return panel(12, ColorToken::DarkerGray);
    case ComponentTier::Emergency:
        return panel(8, ColorToken::BackgroundDark);
    default:
        return std::nullopt;
    }
}

auto FallbackRecipe<ComponentKind::GlassBackground>::make(std::string_view, ComponentTier tier) -> std::optional<Renderable::Body> {
    switch (tier) {
    case ComponentTier::Fallback:
        return SurfaceSpec{.background = ColorToken::DarkerGray, .alpha = 0.8f};
    case ComponentTier::Emergency:
        return SurfaceSpec{.background = ColorToken::BackgroundDark, .alpha = 1.0f};
    default:
        return std::nullopt;
    }
}

auto FallbackRecipe<ComponentKind::GlassDialog>::make(std::string_view, ComponentTier tier) -> std::optional<Renderable::Body> {
    switch (tier) {
    case ComponentTier::Fallback:
        return panel(16, ColorToken::DarkerGray);
    case ComponentTier::Emergency:
        return panel(8, ColorToken::BackgroundDark);
    default:
        return std::nullopt;
    }
}

auto FallbackRecipe<ComponentKind::SettingsPanel>::make(std::string_view, ComponentTier tier) -> std::optional<Renderable::Body> {
    switch (tier) {
    case ComponentTier::Fallback:
        return panel(16, ColorToken::BackgroundDark);
    case ComponentTier::Emergency:
        return TextSpec{.text       = "Settings unavailable. Press BACK to return.",
                        .color      = ColorToken::White,
                        .textSizeSp = 16.0f,
                        .paddingDp  = 32,
                        .background = ColorToken::BackgroundDark};
    default:
        return std::nullopt;
    }
}

auto FallbackRecipe<ComponentKind::MenuContainer>::make(std::string_view, ComponentTier tier) -> std::optional<Renderable::Body> {
    switch (tier) {
    case ComponentTier::Fallback:
        return panel(16, ColorToken::BackgroundDark);
    case ComponentTier::Emergency:
        return panel(8, ColorToken::Black);
    default:
        return std::nullopt;
    }
}

auto FallbackRecipe<ComponentKind::Generic>::make(std::string_view componentId, ComponentTier tier) -> std::optional<Renderable::Body> {
    switch (tier) {
    case ComponentTier::Normal:
    case ComponentTier::Reduced:
    case ComponentTier::Fallback:
        return TextSpec{.text       = std::string{componentId}.append(" (Fallback)"),
                        .color      = ColorToken::SecondaryText,
                        .textSizeSp = 14.0f,
                        .paddingDp  = 8,
                        .background = std::nullopt};
    case ComponentTier::Emergency:
        return TextSpec{.text = "Component unavailable", .color = ColorToken::SecondaryText, .textSizeSp = 12.0f, .paddingDp = 4, .background = std::nullopt};
    case ComponentTier::Failed:
        return errorText(componentId);
    }
    return errorText(componentId);
}

auto GlassRecipe<GlassSurface::Card>::make(std::string_view, GlassTier tier) -> std::optional<Renderable::Body> {
    if (tier == GlassTier::Reduced || tier == GlassTier::Minimal) {
        return panel(12, ColorToken::DarkerGray);
    }
    return std::nullopt;
}

auto GlassRecipe<GlassSurface::Background>::make(std::string_view, GlassTier tier) -> std::optional<Renderable::Body> {
    if (tier == GlassTier::Reduced || tier == GlassTier::Minimal) {
        return SurfaceSpec{.background = ColorToken::BackgroundDark, .alpha = 0.8f};
    }
    return std::nullopt;
}

auto GlassRecipe<GlassSurface::Dialog>::make(std::string_view, GlassTier tier) -> std::optional<Renderable::Body> {
    if (tier == GlassTier::Reduced || tier == GlassTier::Minimal) {
        return panel(16, ColorToken::BackgroundDark);
    }
    return std::nullopt;
}

auto GlassRecipe<GlassSurface::Generic>::make(std::string_view, GlassTier tier) -> std::optional<Renderable::Body> {
    if (tier == GlassTier::None) {
        return TextSpec{.text       = "Glass UI (Safe Mode)",
                        .color      = ColorToken::White,
                        .textSizeSp = 18.0f,
                        .paddingDp  = 16,
                        .background = ColorToken::BackgroundDark};
    }
    return unavailableText();
}

auto emergencyFallback(std::string_view componentId) -> Renderable {
    return fromBody(componentId, errorText(componentId));
}

auto synthesizeComponentFallback(std::string_view componentId, ComponentTier tier) -> Renderable {
    if (isBottom(tier)) {
        return emergencyFallback(componentId);
    }
    auto const kind = kindOf(componentId);
    if (auto body = ComponentRecipes[static_cast<std::size_t>(kind)](componentId, tier)) {
        return fromBody(componentId, std::move(*body));
    }
    auto generic = FallbackRecipe<ComponentKind::Generic>::make(componentId, tier);
    return fromBody(componentId, generic ? std::move(*generic) : Renderable::Body{errorText(componentId)});
}

auto synthesizeGlassFallback(std::string_view componentId, GlassTier tier) -> Renderable {
    auto const surface = glassSurfaceOf(componentId);
    if (auto body = GlassRecipes[static_cast<std::size_t>(surface)](componentId, tier)) {
        return fromBody(componentId, std::move(*body));
    }
    auto generic = GlassRecipe<GlassSurface::Generic>::make(componentId, tier);
    return fromBody(componentId, generic ? std::move(*generic) : Renderable::Body{unavailableText()});
}

} // namespace RS
