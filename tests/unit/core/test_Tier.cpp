#include <doctest/doctest.h>
#include "core/Tier.hpp"
#include "health/SystemHealth.hpp"

using namespace RS;

TEST_SUITE("core.tier") {

TEST_CASE("component_tiers_degrade_one_step_at_a_time") {
    CHECK(degrade(ComponentTier::Normal) == ComponentTier::Reduced);
    CHECK(degrade(ComponentTier::Reduced) == ComponentTier::Fallback);
    CHECK(degrade(ComponentTier::Fallback) == ComponentTier::Emergency);
    CHECK(degrade(ComponentTier::Emergency) == ComponentTier::Failed);
    CHECK(degrade(ComponentTier::Failed) == ComponentTier::Failed);
}

TEST_CASE("glass_tiers_degrade_one_step_at_a_time") {
    CHECK(degrade(GlassTier::Full) == GlassTier::Reduced);
    CHECK(degrade(GlassTier::Reduced) == GlassTier::Minimal);
    CHECK(degrade(GlassTier::Minimal) == GlassTier::None);
    CHECK(degrade(GlassTier::None) == GlassTier::None);
}

TEST_CASE("repeated_degradation_never_moves_up") {
    ComponentTier tier = ComponentTier::Normal;
    for (int i = 0; i < 10; ++i) {
        ComponentTier next = degrade(tier);
        CHECK_FALSE(moreCapable(next, tier));
        tier = next;
    }
    CHECK(isBottom(tier));
}

TEST_CASE("tier_names") {
    CHECK(tierName(ComponentTier::Normal) == "NORMAL");
    CHECK(tierName(ComponentTier::Emergency) == "EMERGENCY");
    CHECK(tierName(ComponentTier::Failed) == "FAILED");
    CHECK(tierName(GlassTier::Full) == "FULL_GLASS");
    CHECK(tierName(GlassTier::Minimal) == "MINIMAL_GLASS");
    CHECK(tierName(GlassTier::None) == "NO_GLASS");
}

TEST_CASE("more_capable_is_strict") {
    CHECK(moreCapable(ComponentTier::Normal, ComponentTier::Reduced));
    CHECK_FALSE(moreCapable(ComponentTier::Reduced, ComponentTier::Reduced));
    CHECK_FALSE(moreCapable(GlassTier::None, GlassTier::Full));
    CHECK(isTop(GlassTier::Full));
    CHECK_FALSE(isTop(GlassTier::Reduced));
}

TEST_CASE("glass_tiers_project_onto_component_scale") {
    CHECK(toComponentTier(GlassTier::Full) == ComponentTier::Normal);
    CHECK(toComponentTier(GlassTier::Reduced) == ComponentTier::Reduced);
    CHECK(toComponentTier(GlassTier::Minimal) == ComponentTier::Fallback);
    CHECK(toComponentTier(GlassTier::None) == ComponentTier::Failed);
}

TEST_CASE("initial_system_tier_from_missing_resources") {
    CHECK(initialSystemTier(0) == SystemTier::Normal);
    CHECK(initialSystemTier(1) == SystemTier::Degraded);
    CHECK(initialSystemTier(5) == SystemTier::Degraded);
    CHECK(initialSystemTier(6) == SystemTier::Emergency);
    CHECK(initialSystemTier(15) == SystemTier::Emergency);
    CHECK(initialSystemTier(16) == SystemTier::Critical);
}

} // TEST_SUITE
