#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <string_view>
#include <type_traits>

namespace RS {

// Capability tiers for generic UI components, most capable first.
enum class ComponentTier : std::uint8_t {
    Normal = 0,
    Reduced,
    Fallback,
    Emergency,
    Failed
};

// Capability tiers for the glass effect subsystem, most capable first.
enum class GlassTier : std::uint8_t {
    Full = 0,
    Reduced,
    Minimal,
    None
};

template <typename Tier>
struct TierTraits;

template <>
struct TierTraits<ComponentTier> {
    static constexpr ComponentTier Top    = ComponentTier::Normal;
    static constexpr ComponentTier Bottom = ComponentTier::Failed;
    static constexpr std::array<std::string_view, 5> Names{"NORMAL", "REDUCED", "FALLBACK", "EMERGENCY", "FAILED"};
};

template <>
struct TierTraits<GlassTier> {
    static constexpr GlassTier Top    = GlassTier::Full;
    static constexpr GlassTier Bottom = GlassTier::None;
    static constexpr std::array<std::string_view, 4> Names{"FULL_GLASS", "REDUCED_GLASS", "MINIMAL_GLASS", "NO_GLASS"};
};

template <typename Tier>
[[nodiscard]] constexpr auto tierIndex(Tier tier) -> std::size_t {
    return static_cast<std::size_t>(static_cast<std::underlying_type_t<Tier>>(tier));
}

template <typename Tier>
[[nodiscard]] constexpr auto tierName(Tier tier) -> std::string_view {
    auto const index = tierIndex(tier);
    auto const& names = TierTraits<Tier>::Names;
    return index < names.size() ? names[index] : std::string_view{"UNKNOWN"};
}

// Steps exactly one tier down; the bottom tier maps onto itself.
template <typename Tier>
[[nodiscard]] constexpr auto degrade(Tier tier) -> Tier {
    if (tierIndex(tier) >= tierIndex(TierTraits<Tier>::Bottom)) {
        return TierTraits<Tier>::Bottom;
    }
    return static_cast<Tier>(tierIndex(tier) + 1);
}

template <typename Tier>
[[nodiscard]] constexpr auto isBottom(Tier tier) -> bool {
    return tier == TierTraits<Tier>::Bottom;
}

template <typename Tier>
[[nodiscard]] constexpr auto isTop(Tier tier) -> bool {
    return tier == TierTraits<Tier>::Top;
}

// True when lhs offers strictly more capability than rhs.
template <typename Tier>
[[nodiscard]] constexpr auto moreCapable(Tier lhs, Tier rhs) -> bool {
    return tierIndex(lhs) < tierIndex(rhs);
}

// Projection used by health aggregation so both domains share one scale.
[[nodiscard]] constexpr auto toComponentTier(GlassTier tier) -> ComponentTier {
    switch (tier) {
    case GlassTier::Full:
        return ComponentTier::Normal;
    case GlassTier::Reduced:
        return ComponentTier::Reduced;
    case GlassTier::Minimal:
        return ComponentTier::Fallback;
    case GlassTier::None:
        return ComponentTier::Failed;
    }
    return ComponentTier::Failed;
}

[[nodiscard]] constexpr auto toComponentTier(ComponentTier tier) -> ComponentTier {
    return tier;
}

static_assert(degrade(ComponentTier::Normal) == ComponentTier::Reduced);
static_assert(degrade(ComponentTier::Failed) == ComponentTier::Failed);
static_assert(degrade(GlassTier::Minimal) == GlassTier::None);
static_assert(degrade(GlassTier::None) == GlassTier::None);

} // namespace RS
