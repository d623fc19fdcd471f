#include <doctest/doctest.h>
#include "core/Renderable.hpp"

#include <string>
#include <variant>

using namespace RS;

TEST_SUITE("core.renderable") {

TEST_CASE("placeholder_does_not_mutate_tree") {
    auto placeholder = Renderable::Placeholder("GlassCard", "GlassCard unavailable");
    CHECK(placeholder.isPlaceholder());
    CHECK_FALSE(placeholder.mutatesTree);
    CHECK(placeholder.componentId == "GlassCard");
    REQUIRE(std::holds_alternative<TextSpec>(placeholder.body));
    CHECK(std::get<TextSpec>(placeholder.body).text == "GlassCard unavailable");
}

TEST_CASE("live_view_carries_handle") {
    auto live = Renderable::Live("ModernToggleSwitch", "view#12");
    CHECK(live.origin == Renderable::Origin::Live);
    CHECK(live.mutatesTree);
    REQUIRE(std::holds_alternative<LiveView>(live.body));
    CHECK(std::get<LiveView>(live.body).handle == "view#12");
}

TEST_CASE("describe_names_origin_and_body") {
    Renderable panel;
    panel.componentId = "MenuContainer";
    panel.body        = PanelSpec{.vertical = true, .paddingDp = 16, .background = ColorToken::BackgroundDark, .alpha = 1.0f};

    auto const text = panel.describe();
    CHECK(text.find("MenuContainer") != std::string::npos);
    CHECK(text.find("<fallback>") != std::string::npos);
    CHECK(text.find("background_dark") != std::string::npos);

    CHECK(Renderable::Placeholder("x", "y").describe().find("<placeholder>") != std::string::npos);
}

TEST_CASE("color_token_names") {
    CHECK(colorTokenToString(ColorToken::HoloRedLight) == "holo_red_light");
    CHECK(colorTokenToString(ColorToken::DarkerGray) == "darker_gray");
    CHECK(originToString(Renderable::Origin::Retried) == "retried");
}

} // TEST_SUITE
