#pragma once
#include "core/Renderable.hpp"
#include "core/Tier.hpp"
#include "recovery/ComponentKind.hpp"

#include <array>
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace RS {

/**
 * Fallback recipes
 *
 * Every component kind has exactly one FallbackRecipe specialization and
 * every glass surface one GlassRecipe specialization. The primary templates
 * are declared but never defined, so adding an enumerator without a recipe
 * fails to compile when the dispatch table below is instantiated.
 *
 * A recipe returns nothing for tiers it has no opinion on; the synthesize
 * functions then fall back to the generic recipe for that tier, which
 * always produces a body.
 */
template <typename Tier>
using RecipeFn = std::optional<Renderable::Body> (*)(std::string_view componentId, Tier tier);

template <ComponentKind K>
struct FallbackRecipe;

template <GlassSurface S>
struct GlassRecipe;

template <>
struct FallbackRecipe<ComponentKind::ToggleSwitch> {
    static auto make(std::string_view componentId, ComponentTier tier) -> std::optional<Renderable::Body>;
};

template <>
struct FallbackRecipe<ComponentKind::GlassCard> {
    static auto make(std::string_view componentId, ComponentTier tier) -> std::optional<Renderable::Body>;
};

template <>
struct FallbackRecipe<ComponentKind::GlassBackground> {
    static auto make(std::string_view componentId, ComponentTier tier) -> std::optional<Renderable::Body>;
};

template <>
struct FallbackRecipe<ComponentKind::GlassDialog> {
    static auto make(std::string_view componentId, ComponentTier tier) -> std::optional<Renderable::Body>;
};

template <>
struct FallbackRecipe<ComponentKind::SettingsPanel> {
    static auto make(std::string_view componentId, ComponentTier tier) -> std::optional<Renderable::Body>;
};

template <>
struct FallbackRecipe<ComponentKind::MenuContainer> {
    static auto make(std::string_view componentId, ComponentTier tier) -> std::optional<Renderable::Body>;
};

// Always engaged.
template <>
struct FallbackRecipe<ComponentKind::Generic> {
    static auto make(std::string_view componentId, ComponentTier tier) -> std::optional<Renderable::Body>;
};

template <>
struct GlassRecipe<GlassSurface::Card> {
    static auto make(std::string_view componentId, GlassTier tier) -> std::optional<Renderable::Body>;
};

template <>
struct GlassRecipe<GlassSurface::Background> {
    static auto make(std::string_view componentId, GlassTier tier) -> std::optional<Renderable::Body>;
};

template <>
struct GlassRecipe<GlassSurface::Dialog> {
    static auto make(std::string_view componentId, GlassTier tier) -> std::optional<Renderable::Body>;
};

// Always engaged.
template <>
struct GlassRecipe<GlassSurface::Generic> {
    static auto make(std::string_view componentId, GlassTier tier) -> std::optional<Renderable::Body>;
};

namespace Detail {

template <typename Kind, typename Tier, template <Kind> class Recipe, std::size_t... I>
constexpr auto makeRecipeTable(std::index_sequence<I...>) -> std::array<RecipeFn<Tier>, sizeof...(I)> {
    return {&Recipe<static_cast<Kind>(I)>::make...};
}

} // namespace Detail

inline constexpr auto ComponentRecipes
        = Detail::makeRecipeTable<ComponentKind, ComponentTier, FallbackRecipe>(std::make_index_sequence<ComponentKindCount>{});

inline constexpr auto GlassRecipes
        = Detail::makeRecipeTable<GlassSurface, GlassTier, GlassRecipe>(std::make_index_sequence<GlassSurfaceCount>{});

static_assert(ComponentRecipes.size() == static_cast<std::size_t>(ComponentKind::Generic) + 1);
static_assert(GlassRecipes.size() == static_cast<std::size_t>(GlassSurface::Generic) + 1);

// "Error: <id> failed" on a dark background; the answer of last resort.
[[nodiscard]] auto emergencyFallback(std::string_view componentId) -> Renderable;

[[nodiscard]] auto synthesizeComponentFallback(std::string_view componentId, ComponentTier tier) -> Renderable;
[[nodiscard]] auto synthesizeGlassFallback(std::string_view componentId, GlassTier tier) -> Renderable;

} // namespace RS
