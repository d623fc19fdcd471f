#pragma once
#include "core/Renderable.hpp"
#include "core/Tier.hpp"
#include "glass/GlassStyle.hpp"

#include <atomic>
#include <cstdint>
#include <optional>
#include <string_view>

namespace RS {

class DiagnosticLedger;
struct HostEnvironment;

// Surfaces that receive a glass background in the rendering layer.
enum class GlassRole : std::uint8_t {
    Menu = 0,
    Panel,
    Item,
    ItemFocused,
    ItemMoving,
    Overlay
};

[[nodiscard]] auto glassRoleToString(GlassRole role) -> std::string_view;

/**
 * GlassEffects — the subsystem-wide glass effect tier.
 *
 * Starts at Full, or at Reduced when the host's capability probe fails.
 * degrade() steps one tier down and mirrors the change into the ledger's
 * "GlassEffects" snapshot. The tier is atomic so the rendering layer may
 * read it from any thread.
 */
class GlassEffects {
public:
    static constexpr std::string_view ComponentId = "GlassEffects";

    GlassEffects(HostEnvironment const& host, DiagnosticLedger& ledger);

    [[nodiscard]] auto tier() const -> GlassTier { return this->current.load(std::memory_order_acquire); }
    [[nodiscard]] auto initialTier() const -> GlassTier { return this->initial; }
    [[nodiscard]] auto available() const -> bool { return this->tier() != GlassTier::None; }

    // Returns the tier after the step.
    auto degrade(std::string_view reason = "error_recovery") -> GlassTier;
    auto reset() -> void;

    [[nodiscard]] auto style() const -> GlassStyle;

    // Flat color replacing the glass drawable for a surface; nullopt at Full, where the drawable is used.
    [[nodiscard]] auto backgroundFor(GlassRole role) const -> std::optional<ColorToken>;

private:
    DiagnosticLedger&      ledger;
    GlassTier const        initial;
    std::atomic<GlassTier> current;
};

[[nodiscard]] auto glassBackgroundFor(GlassTier tier, GlassRole role) -> std::optional<ColorToken>;

} // namespace RS
