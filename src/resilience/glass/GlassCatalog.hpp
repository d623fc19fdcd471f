#pragma once
#include "resource/ResourceCatalog.hpp"

#include <array>

namespace RS {

inline constexpr std::array<CatalogEntry, 30> GlassCatalog{{
        {"glass_menu_background", ResourceKind::Visual, ResourceFallback::Builtin("menu_panel_bg")},
        {"glass_panel_background", ResourceKind::Visual, ResourceFallback::Builtin("tv_panel_bg")},
        {"glass_item_background", ResourceKind::Visual, ResourceFallback::Builtin("list_item_bg")},
        {"glass_item_focused", ResourceKind::Visual, ResourceFallback::Builtin("focus_background")},
        {"glass_item_moving", ResourceKind::Visual, ResourceFallback::Builtin("focus_background")},
        {"glass_card_background", ResourceKind::Visual, ResourceFallback::Builtin("simple_card_background")},
        {"glass_card_focused", ResourceKind::Visual, ResourceFallback::Builtin("focus_background")},
        {"glass_card_selector", ResourceKind::Visual, ResourceFallback::Builtin("focus_background")},
        {"glassmorphism_overlay", ResourceKind::Visual, ResourceFallback::Builtin("screen_background_dark_transparent")},
        {"blur_background", ResourceKind::Visual, ResourceFallback::Builtin("screen_background_dark")},

        {"glass_background", ResourceKind::Color, ResourceFallback::Palette(ColorToken::BackgroundDark)},
        {"glass_background_focused", ResourceKind::Color, ResourceFallback::Palette(ColorToken::HoloBlueDark)},
        {"glass_border", ResourceKind::Color, ResourceFallback::Palette(ColorToken::DarkerGray)},
        {"glass_border_focused", ResourceKind::Color, ResourceFallback::Palette(ColorToken::HoloBlueBright)},
        {"glass_text_primary", ResourceKind::Color, ResourceFallback::Palette(ColorToken::PrimaryText)},
        {"glass_text_secondary", ResourceKind::Color, ResourceFallback::Palette(ColorToken::SecondaryText)},
        {"glass_highlight", ResourceKind::Color, ResourceFallback::Palette(ColorToken::White)},
        {"glass_highlight_focused", ResourceKind::Color, ResourceFallback::Palette(ColorToken::HoloBlueBright)},
        {"glass_shadow", ResourceKind::Color, ResourceFallback::Palette(ColorToken::Black)},

        {"glass_corner_radius", ResourceKind::Dimension, ResourceFallback::Dp(8.0f)},
        {"glass_elevation", ResourceKind::Dimension, ResourceFallback::Dp(4.0f)},
        {"glass_blur_radius", ResourceKind::Dimension, ResourceFallback::Dp(25.0f)},
        {"glass_border_width", ResourceKind::Dimension, ResourceFallback::Dp(1.0f)},
        {"glass_card_padding", ResourceKind::Dimension, ResourceFallback::Dp(16.0f)},
        {"glass_card_margin", ResourceKind::Dimension, ResourceFallback::Dp(8.0f)},
        {"glass_card_elevation", ResourceKind::Dimension, ResourceFallback::Dp(6.0f)},
        {"glass_text_size_large", ResourceKind::Dimension, ResourceFallback::Dp(20.0f)},
        {"glass_text_size_medium", ResourceKind::Dimension, ResourceFallback::Dp(16.0f)},
        {"glass_text_size_small", ResourceKind::Dimension, ResourceFallback::Dp(14.0f)},
        {"glass_text_size_caption", ResourceKind::Dimension, ResourceFallback::Dp(12.0f)},
}};

static_assert(fallbacksComplete(GlassCatalog), "every glass resource needs a fallback");
static_assert(countOfKind(GlassCatalog, ResourceKind::Layout) == 0, "glass resources are never structural");
static_assert(countOfKind(GlassCatalog, ResourceKind::Visual) == 10);
static_assert(countOfKind(GlassCatalog, ResourceKind::Color) == 9);
static_assert(countOfKind(GlassCatalog, ResourceKind::Dimension) == 11);

// Used for names outside the catalog.
inline constexpr ResourceFallback GlassDefaultDrawableFallback  = ResourceFallback::Builtin("btn_default");
inline constexpr ResourceFallback GlassDefaultColorFallback     = ResourceFallback::Palette(ColorToken::DarkerGray);
inline constexpr ResourceFallback GlassDefaultDimensionFallback = ResourceFallback::Dp(16.0f);

} // namespace RS
