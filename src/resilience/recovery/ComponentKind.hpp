#pragma once

#include <cstddef>
#include <cstdint>
#include <string_view>

namespace RS {

// Widget families with a dedicated fallback recipe on the component scale.
enum class ComponentKind : std::uint8_t {
    ToggleSwitch = 0,
    GlassCard,
    GlassBackground,
    GlassDialog,
    SettingsPanel,
    MenuContainer,
    Generic
};

inline constexpr std::size_t ComponentKindCount = 7;

// Surfaces the glass subsystem knows how to flatten.
enum class GlassSurface : std::uint8_t {
    Card = 0,
    Background,
    Dialog,
    Generic
};

inline constexpr std::size_t GlassSurfaceCount = 4;

[[nodiscard]] auto componentKindToString(ComponentKind kind) -> std::string_view;
[[nodiscard]] auto glassSurfaceToString(GlassSurface surface) -> std::string_view;

/**
 * Maps a component id onto its kind. Matching ignores case and anything
 * from the first '#' on, so "GlassCard#profile" and "glasscard" are both
 * GlassCard. Ids that match no known family are Generic.
 */
[[nodiscard]] auto kindOf(std::string_view componentId) -> ComponentKind;
[[nodiscard]] auto glassSurfaceOf(std::string_view componentId) -> GlassSurface;

} // namespace RS
