#pragma once

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

namespace RS {

// Named palette entries understood by the rendering layer.
enum class ColorToken : std::uint8_t {
    Transparent,
    White,
    Black,
    BackgroundDark,
    DarkerGray,
    HoloBlueDark,
    HoloBlueBright,
    HoloOrangeDark,
    HoloOrangeLight,
    HoloRedLight,
    PrimaryText,
    SecondaryText
};

[[nodiscard]] auto colorTokenToString(ColorToken token) -> std::string_view;

// A view the rendering layer built itself; the engine only carries its handle.
struct LiveView {
    std::string handle;
};

struct SwitchSpec {
    bool                       checked   = false;
    bool                       enabled   = true;
    bool                       focusable = true;
    std::optional<std::string> label;
    int                        paddingDp = 0;
};

struct PanelSpec {
    bool       vertical   = true;
    int        paddingDp  = 0;
    ColorToken background = ColorToken::Transparent;
    float      alpha      = 1.0f;
};

struct SurfaceSpec {
    ColorToken background = ColorToken::BackgroundDark;
    float      alpha      = 1.0f;
};

struct TextSpec {
    std::string               text;
    ColorToken                color      = ColorToken::White;
    float                     textSizeSp = 14.0f;
    int                       paddingDp  = 0;
    std::optional<ColorToken> background;
};

/**
 * Renderable — what the engine hands back to the rendering layer in place
 * of a component that failed to initialize. The body describes the widget
 * to build; `mutatesTree` tells the caller whether installing it requires a
 * structural change to the live UI tree.
 */
struct Renderable {
    enum class Origin : std::uint8_t {
        Live,
        Retried,
        Fallback,
        Placeholder
    };

    using Body = std::variant<LiveView, SwitchSpec, PanelSpec, SurfaceSpec, TextSpec>;

    std::string componentId;
    Origin      origin      = Origin::Fallback;
    Body        body        = TextSpec{};
    bool        mutatesTree = true;

    static auto Live(std::string componentId, std::string handle) -> Renderable;
    static auto Placeholder(std::string componentId, std::string text) -> Renderable;

    [[nodiscard]] auto isPlaceholder() const -> bool { return this->origin == Origin::Placeholder; }
    [[nodiscard]] auto describe() const -> std::string;
};

[[nodiscard]] auto originToString(Renderable::Origin origin) -> std::string_view;

using RetryFn = std::function<std::optional<Renderable>()>;

} // namespace RS
