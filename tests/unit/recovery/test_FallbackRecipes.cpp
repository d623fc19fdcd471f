#include <doctest/doctest.h>
#include "recovery/FallbackRecipes.hpp"

#include <variant>

using namespace RS;

TEST_SUITE("recovery.fallback_recipes") {

TEST_CASE("component_ids_map_onto_kinds") {
    CHECK(kindOf("ModernToggleSwitch") == ComponentKind::ToggleSwitch);
    CHECK(kindOf("toggleswitch") == ComponentKind::ToggleSwitch);
    CHECK(kindOf("GlassCard#profile") == ComponentKind::GlassCard);
    CHECK(kindOf("GlassyBackgroundView") == ComponentKind::GlassBackground);
    CHECK(kindOf("SettingsFragment") == ComponentKind::SettingsPanel);
    CHECK(kindOf("menu_container") == ComponentKind::MenuContainer);
    CHECK(kindOf("GlassCardFooter") == ComponentKind::Generic);
    CHECK(kindOf("") == ComponentKind::Generic);

    CHECK(glassSurfaceOf("GlassDialog") == GlassSurface::Dialog);
    CHECK(glassSurfaceOf("MenuContainer") == GlassSurface::Generic);
    CHECK(componentKindToString(ComponentKind::SettingsPanel) == "settings_panel");
}

TEST_CASE("toggle_switch_gets_plain_switch") {
    auto fallback = synthesizeComponentFallback("ModernToggleSwitch", ComponentTier::Fallback);
    CHECK(fallback.origin == Renderable::Origin::Fallback);
    REQUIRE(std::holds_alternative<SwitchSpec>(fallback.body));
    CHECK_FALSE(std::get<SwitchSpec>(fallback.body).label.has_value());

    auto emergency = synthesizeComponentFallback("ModernToggleSwitch", ComponentTier::Emergency);
    REQUIRE(std::holds_alternative<SwitchSpec>(emergency.body));
    CHECK(std::get<SwitchSpec>(emergency.body).label == std::optional<std::string>{"Toggle"});
}

TEST_CASE("panels_and_surfaces_per_kind") {
    auto card = synthesizeComponentFallback("GlassCard", ComponentTier::Fallback);
    REQUIRE(std::holds_alternative<PanelSpec>(card.body));
    CHECK(std::get<PanelSpec>(card.body).paddingDp == 12);
    CHECK(std::get<PanelSpec>(card.body).background == ColorToken::DarkerGray);

    auto background = synthesizeComponentFallback("GlassBackground", ComponentTier::Fallback);
    REQUIRE(std::holds_alternative<SurfaceSpec>(background.body));
    CHECK(std::get<SurfaceSpec>(background.body).alpha == doctest::Approx(0.8));

    auto dialog = synthesizeComponentFallback("GlassDialog", ComponentTier::Emergency);
    REQUIRE(std::holds_alternative<PanelSpec>(dialog.body));
    CHECK(std::get<PanelSpec>(dialog.body).paddingDp == 8);

    auto menu = synthesizeComponentFallback("MenuContainer", ComponentTier::Emergency);
    REQUIRE(std::holds_alternative<PanelSpec>(menu.body));
    CHECK(std::get<PanelSpec>(menu.body).background == ColorToken::Black);
}

TEST_CASE("settings_panel_emergency_message") {
    auto emergency = synthesizeComponentFallback("SettingsPanel", ComponentTier::Emergency);
    REQUIRE(std::holds_alternative<TextSpec>(emergency.body));
    auto const& text = std::get<TextSpec>(emergency.body);
    CHECK(text.text == "Settings unavailable. Press BACK to return.");
    CHECK(text.textSizeSp == doctest::Approx(16.0));
    CHECK(text.paddingDp == 32);
}

TEST_CASE("unknown_kinds_use_generic_recipe") {
    auto fallback = synthesizeComponentFallback("ProfileHeader", ComponentTier::Fallback);
    REQUIRE(std::holds_alternative<TextSpec>(fallback.body));
    CHECK(std::get<TextSpec>(fallback.body).text == "ProfileHeader (Fallback)");

    auto emergency = synthesizeComponentFallback("ProfileHeader", ComponentTier::Emergency);
    REQUIRE(std::holds_alternative<TextSpec>(emergency.body));
    CHECK(std::get<TextSpec>(emergency.body).text == "Component unavailable");
    CHECK(std::get<TextSpec>(emergency.body).textSizeSp == doctest::Approx(12.0));

    // Known kinds without an opinion on a tier also fall through.
    auto reduced = synthesizeComponentFallback("GlassCard", ComponentTier::Reduced);
    REQUIRE(std::holds_alternative<TextSpec>(reduced.body));
    CHECK(std::get<TextSpec>(reduced.body).text == "GlassCard (Fallback)");
}

TEST_CASE("failed_tier_is_always_the_error_text") {
    for (auto const* id : {"ModernToggleSwitch", "SettingsPanel", "ProfileHeader"}) {
        auto failed = synthesizeComponentFallback(id, ComponentTier::Failed);
        REQUIRE(std::holds_alternative<TextSpec>(failed.body));
        auto const& text = std::get<TextSpec>(failed.body);
        CHECK(text.text == std::string{"Error: "} + id + " failed");
        CHECK(text.color == ColorToken::HoloRedLight);
        CHECK(text.background == std::optional<ColorToken>{ColorToken::BackgroundDark});
    }
    CHECK(emergencyFallback("x").componentId == "x");
}

TEST_CASE("glass_recipes") {
    auto card = synthesizeGlassFallback("GlassCard", GlassTier::Minimal);
    REQUIRE(std::holds_alternative<PanelSpec>(card.body));
    CHECK(std::get<PanelSpec>(card.body).paddingDp == 12);

    auto background = synthesizeGlassFallback("GlassyBackgroundView", GlassTier::Reduced);
    REQUIRE(std::holds_alternative<SurfaceSpec>(background.body));
    CHECK(std::get<SurfaceSpec>(background.body).background == ColorToken::BackgroundDark);

    auto safeMode = synthesizeGlassFallback("GlassCard", GlassTier::None);
    REQUIRE(std::holds_alternative<TextSpec>(safeMode.body));
    CHECK(std::get<TextSpec>(safeMode.body).text == "Glass UI (Safe Mode)");

    auto other = synthesizeGlassFallback("GlassToolbar", GlassTier::Reduced);
    REQUIRE(std::holds_alternative<TextSpec>(other.body));
    CHECK(std::get<TextSpec>(other.body).text == "Component unavailable");
    CHECK(std::get<TextSpec>(other.body).paddingDp == 8);
}

TEST_CASE("dispatch_tables_cover_every_kind") {
    static_assert(ComponentRecipes.size() == ComponentKindCount);
    static_assert(GlassRecipes.size() == GlassSurfaceCount);
    for (auto const recipe : ComponentRecipes) {
        CHECK(recipe != nullptr);
    }
    CHECK(FallbackRecipe<ComponentKind::Generic>::make("x", ComponentTier::Normal).has_value());
    CHECK_FALSE(FallbackRecipe<ComponentKind::MenuContainer>::make("x", ComponentTier::Normal).has_value());
}

} // TEST_SUITE
