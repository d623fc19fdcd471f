#pragma once
#include "resource/ResourceCatalog.hpp"

#include <array>

namespace RS {

// Resources the settings screen and its toggle switches cannot render without.
inline constexpr std::array<CatalogEntry, 19> SettingsCatalog{{
        {"modern_toggle_track_animated", ResourceKind::Visual, ResourceFallback::Builtin("btn_default")},
        {"modern_toggle_thumb", ResourceKind::Visual, ResourceFallback::Builtin("btn_default_small")},
        {"modern_toggle_thumb_focused", ResourceKind::Visual, ResourceFallback::Builtin("btn_default_small")},

        {"setting", ResourceKind::Layout},
        {"glass_card_preferences", ResourceKind::Layout},
        {"glass_card_configuration", ResourceKind::Layout},
        {"glass_card_actions", ResourceKind::Layout},

        {"focus", ResourceKind::Color, ResourceFallback::Palette(ColorToken::HoloBlueBright)},
        {"glass_border_focused", ResourceKind::Color, ResourceFallback::Palette(ColorToken::White)},
        {"glass_card_background_focused", ResourceKind::Color, ResourceFallback::Palette(ColorToken::DarkerGray)},
        {"glass_border", ResourceKind::Color, ResourceFallback::Palette(ColorToken::DarkerGray)},
        {"glass_card_background", ResourceKind::Color, ResourceFallback::Palette(ColorToken::BackgroundDark)},
        {"glass_highlight_focused", ResourceKind::Color, ResourceFallback::Palette(ColorToken::White)},
        {"info_text_primary", ResourceKind::Color, ResourceFallback::Palette(ColorToken::PrimaryText)},
        {"info_text_secondary", ResourceKind::Color, ResourceFallback::Palette(ColorToken::SecondaryText)},
        {"white", ResourceKind::Color, ResourceFallback::Palette(ColorToken::White)},

        {"tv_min_touch_target", ResourceKind::Dimension, ResourceFallback::Dp(48.0f)},
        {"tv_text_size_medium", ResourceKind::Dimension, ResourceFallback::Dp(16.0f)},
        {"toggle_padding", ResourceKind::Dimension, ResourceFallback::Dp(8.0f)},
}};

static_assert(fallbacksComplete(SettingsCatalog), "every non-layout settings resource needs a fallback");

inline constexpr float DefaultFallbackDimensionDp = 16.0f;

} // namespace RS
