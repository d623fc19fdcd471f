#include "recovery/ComponentKind.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <string>
#include <utility>

namespace RS {
namespace {

constexpr std::array<std::pair<std::string_view, ComponentKind>, 10> KindAliases{{
        {"moderntoggleswitch", ComponentKind::ToggleSwitch},
        {"toggleswitch", ComponentKind::ToggleSwitch},
        {"glasscard", ComponentKind::GlassCard},
        {"glassybackgroundview", ComponentKind::GlassBackground},
        {"glassbackground", ComponentKind::GlassBackground},
        {"glassdialog", ComponentKind::GlassDialog},
        {"settingsfragment", ComponentKind::SettingsPanel},
        {"settingspanel", ComponentKind::SettingsPanel},
        {"menucontainer", ComponentKind::MenuContainer},
        {"menu_container", ComponentKind::MenuContainer},
}};

auto normalizedKey(std::string_view componentId) -> std::string {
    auto const hash = componentId.find('#');
    if (hash != std::string_view::npos) {
        componentId = componentId.substr(0, hash);
    }
    std::string key{componentId};
    std::transform(key.begin(), key.end(), key.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return key;
}

} // namespace

auto componentKindToString(ComponentKind kind) -> std::string_view {
    switch (kind) {
    case ComponentKind::ToggleSwitch:
        return "toggle_switch";
    case ComponentKind::GlassCard:
        return "glass_card";
    case ComponentKind::GlassBackground:
        return "glass_background";
    case ComponentKind::GlassDialog:
        return "glass_dialog";
    case ComponentKind::SettingsPanel:
        return "settings_panel";
    case ComponentKind::MenuContainer:
        return "menu_container";
    case ComponentKind::Generic:
        return "generic";
    }
    return "generic";
}

auto glassSurfaceToString(GlassSurface surface) -> std::string_view {
    switch (surface) {
    case GlassSurface::Card:
        return "card";
    case GlassSurface::Background:
        return "background";
    case GlassSurface::Dialog:
        return "dialog";
    case GlassSurface::Generic:
        return "generic";
    }
    return "generic";
}

auto kindOf(std::string_view componentId) -> ComponentKind {
    auto const key = normalizedKey(componentId);
    for (auto const& [alias, kind] : KindAliases) {
        if (key == alias) {
            return kind;
        }
    }
    return ComponentKind::Generic;
}

auto glassSurfaceOf(std::string_view componentId) -> GlassSurface {
    switch (kindOf(componentId)) {
    case ComponentKind::GlassCard:
        return GlassSurface::Card;
    case ComponentKind::GlassBackground:
        return GlassSurface::Background;
    case ComponentKind::GlassDialog:
        return GlassSurface::Dialog;
    default:
        return GlassSurface::Generic;
    }
}

} // namespace RS
