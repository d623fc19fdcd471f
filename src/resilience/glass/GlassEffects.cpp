#include "glass/GlassEffects.hpp"
#include "diagnostics/DiagnosticLedger.hpp"
#include "host/HostEnvironment.hpp"
#include "log/TaggedLogger.hpp"

#include <string>

namespace RS {

auto glassRoleToString(GlassRole role) -> std::string_view {
    switch (role) {
    case GlassRole::Menu:
        return "menu";
    case GlassRole::Panel:
        return "panel";
    case GlassRole::Item:
        return "item";
    case GlassRole::ItemFocused:
        return "item_focused";
    case GlassRole::ItemMoving:
        return "item_moving";
    case GlassRole::Overlay:
        return "overlay";
    }
    return "item";
}

auto glassBackgroundFor(GlassTier tier, GlassRole role) -> std::optional<ColorToken> {
    switch (tier) {
    case GlassTier::Full:
        return std::nullopt;
    case GlassTier::Reduced:
        switch (role) {
        case GlassRole::Menu:
        case GlassRole::Overlay:
            return ColorToken::BackgroundDark;
        case GlassRole::Panel:
            return ColorToken::DarkerGray;
        case GlassRole::Item:
            return ColorToken::Transparent;
        case GlassRole::ItemFocused:
            return ColorToken::HoloBlueDark;
        case GlassRole::ItemMoving:
            return ColorToken::HoloOrangeDark;
        }
        break;
    case GlassTier::Minimal:
        switch (role) {
        case GlassRole::ItemFocused:
            return ColorToken::HoloBlueDark;
        case GlassRole::ItemMoving:
            return ColorToken::HoloOrangeDark;
        default:
            return ColorToken::DarkerGray;
        }
    case GlassTier::None:
        switch (role) {
        case GlassRole::ItemFocused:
            return ColorToken::HoloBlueBright;
        case GlassRole::ItemMoving:
            return ColorToken::HoloOrangeLight;
        default:
            return ColorToken::BackgroundDark;
        }
    }
    return ColorToken::BackgroundDark;
}

GlassEffects::GlassEffects(HostEnvironment const& host, DiagnosticLedger& ledger)
    : ledger(ledger), initial(host.capabilityProbe() ? GlassTier::Full : GlassTier::Reduced), current(initial) {
    if (this->initial != GlassTier::Full) {
        rs_log("GlassEffects advanced effects not supported, starting at " + std::string{tierName(this->initial)}, "Glass", "WARN");
    }
}

auto GlassEffects::degrade(std::string_view reason) -> GlassTier {
    GlassTier previous = this->current.load(std::memory_order_acquire);
    GlassTier next     = RS::degrade(previous);
    while (!this->current.compare_exchange_weak(previous, next, std::memory_order_acq_rel)) {
        next = RS::degrade(previous);
    }
    rs_log("GlassEffects degraded from " + std::string{tierName(previous)} + " to " + std::string{tierName(next)}, "Glass", "WARN");
    this->ledger.updateComponentState(ComponentId, tierName(next), {{"previousLevel", std::string{tierName(previous)}}, {"reason", std::string{reason}}});
    return next;
}

auto GlassEffects::reset() -> void {
    auto const previous = this->current.exchange(this->initial, std::memory_order_acq_rel);
    if (previous != this->initial) {
        this->ledger.updateComponentState(ComponentId, tierName(this->initial), {{"previousLevel", std::string{tierName(previous)}}, {"reason", "reset"}});
    }
}

auto GlassEffects::style() const -> GlassStyle {
    return GlassStyle::ForTier(this->tier());
}

auto GlassEffects::backgroundFor(GlassRole role) const -> std::optional<ColorToken> {
    return glassBackgroundFor(this->tier(), role);
}

} // namespace RS
