#include "core/Renderable.hpp"

#include <sstream>
#include <type_traits>
#include <utility>

namespace RS {

auto colorTokenToString(ColorToken token) -> std::string_view {
    switch (token) {
    case ColorToken::Transparent:
        return "transparent";
    case ColorToken::White:
        return "white";
    case ColorToken::Black:
        return "black";
    case ColorToken::BackgroundDark:
        return "background_dark";
    case ColorToken::DarkerGray:
        return "darker_gray";
    case ColorToken::HoloBlueDark:
        return "holo_blue_dark";
    case ColorToken::HoloBlueBright:
        return "holo_blue_bright";
    case ColorToken::HoloOrangeDark:
        return "holo_orange_dark";
    case ColorToken::HoloOrangeLight:
        return "holo_orange_light";
    case ColorToken::HoloRedLight:
        return "holo_red_light";
    case ColorToken::PrimaryText:
        return "primary_text";
    case ColorToken::SecondaryText:
        return "secondary_text";
    }
    return "transparent";
}

auto originToString(Renderable::Origin origin) -> std::string_view {
    switch (origin) {
    case Renderable::Origin::Live:
        return "live";
    case Renderable::Origin::Retried:
        return "retried";
    case Renderable::Origin::Fallback:
        return "fallback";
    case Renderable::Origin::Placeholder:
        return "placeholder";
    }
    return "fallback";
}

auto Renderable::Live(std::string componentId, std::string handle) -> Renderable {
    Renderable renderable;
    renderable.componentId = std::move(componentId);
    renderable.origin      = Origin::Live;
    renderable.body        = LiveView{std::move(handle)};
    return renderable;
}

// Status text that can be shown without touching the view hierarchy.
auto Renderable::Placeholder(std::string componentId, std::string text) -> Renderable {
    Renderable renderable;
    renderable.componentId = std::move(componentId);
    renderable.origin      = Origin::Placeholder;
    renderable.body        = TextSpec{.text = std::move(text), .color = ColorToken::SecondaryText, .textSizeSp = 12.0f, .paddingDp = 8, .background = std::nullopt};
    renderable.mutatesTree = false;
    return renderable;
}

auto Renderable::describe() const -> std::string {
    std::ostringstream oss;
    oss << this->componentId << " <" << originToString(this->origin) << "> ";
    std::visit(
            [&oss](auto const& body) {
                using T = std::decay_t<decltype(body)>;
                if constexpr (std::is_same_v<T, LiveView>) {
                    oss << "live(" << body.handle << ")";
                } else if constexpr (std::is_same_v<T, SwitchSpec>) {
                    oss << "switch(checked=" << body.checked << ", enabled=" << body.enabled;
                    if (body.label) oss << ", label=" << *body.label;
                    oss << ")";
                } else if constexpr (std::is_same_v<T, PanelSpec>) {
                    oss << "panel(" << colorTokenToString(body.background) << ", padding=" << body.paddingDp << "dp)";
                } else if constexpr (std::is_same_v<T, SurfaceSpec>) {
                    oss << "surface(" << colorTokenToString(body.background) << ", alpha=" << body.alpha << ")";
                } else {
                    oss << "text(\"" << body.text << "\")";
                }
            },
            this->body);
    return oss.str();
}

} // namespace RS
