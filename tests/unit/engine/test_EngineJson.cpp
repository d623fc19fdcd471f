#include <doctest/doctest.h>
#include "ResilienceTestHelper.hpp"
#include "engine/EngineJson.hpp"

#include <memory>

using namespace RS;
using namespace std::chrono_literals;

TEST_SUITE("engine.json") {

TEST_CASE("health_keys") {
    SystemHealth health;
    health.tier       = SystemTier::Degraded;
    health.total      = 4;
    health.normal     = 3;
    health.fallback   = 1;
    health.degraded   = 1;
    health.canRecover = true;

    auto json = SystemHealthToJson(health);
    CHECK(json["tier"] == "DEGRADED");
    CHECK(json["total"] == 4);
    CHECK(json["fallback"] == 1);
    CHECK(json["can_recover"] == true);
    CHECK(json["health_percentage"].get<double>() == doctest::Approx(75.0));
    for (auto const* key : {"normal", "degraded", "failed", "reduced", "emergency"}) {
        CHECK(json.contains(key));
    }
}

TEST_CASE("status_round_trips_through_text") {
    FakeResources    resources;
    FakeHost         host;
    ManualClock      clock;
    InlineExecutor   executor;
    ResilienceEngine engine(resources, host, executor, ResilienceOptions{}, clock);

    engine.onFailure("ProfileHeader", Failure::Make(Failure::Type::Runtime, "inflate failed"));
    engine.onGlassFailure("GlassCard", Failure::Make(Failure::Type::Runtime, "blur failed"));

    auto json = nlohmann::json::parse(SerializeSystemStatus(engine.systemStatus()));
    CHECK(json["preflight_tier"] == "NORMAL");
    CHECK(json["glass_tier"] == "REDUCED_GLASS");
    CHECK(json["glass_available"] == true);
    CHECK(json["health"]["total"] == 2);

    REQUIRE(json["components"].size() == 1);
    auto const& component = json["components"][0];
    CHECK(component["component_id"] == "ProfileHeader");
    CHECK(component["tier"] == "REDUCED");
    CHECK(component["retry_count"] == 1);
    CHECK(component["last_error"] == "inflate failed");

    REQUIRE(json["glass_surfaces"].size() == 1);
    CHECK(json["glass_surfaces"][0]["tier"] == "REDUCED_GLASS");
}

TEST_CASE("glass_validation_keys") {
    FakeResources resources;
    resources.markMissing("glass_shadow");
    FakeHost                 host;
    ManualClock              clock;
    ResourceCatalogValidator base(resources);
    GlassResourceValidator   validator(base, host, clock);

    auto json = GlassValidationToJson(validator.validateAll());
    CHECK(json["total_resources"] == 30);
    CHECK(json["total_missing"] == 1);
    CHECK(json["recommended_tier"] == "REDUCED_GLASS");
    CHECK(json["color"]["kind"] == "color");
    CHECK(json["color"]["missing"][0] == "glass_shadow");
    CHECK(json["visual"]["availability_percentage"].get<double>() == doctest::Approx(100.0));
    CHECK(json["timestamp_ms"] == 1'700'000'000'000LL);
}

TEST_CASE("recovery_summary") {
    FakeResources    resources;
    FakeHost         host;
    ManualClock      clock;
    InlineExecutor   executor;
    ResilienceEngine engine(resources, host, executor, ResilienceOptions{}, clock);

    engine.onFailure("ProfileHeader", Failure::Make(Failure::Type::Runtime, "x"));
    engine.onFailure("ProfileHeader", Failure::Make(Failure::Type::Runtime, "x"));

    auto json = SystemRecoveryToJson(engine.attemptSystemRecovery());
    CHECK(json["any_recovered"] == true);
    CHECK(json["components"]["promoted"] == 1);
    CHECK(json["glass"]["considered"] == 0);
    CHECK(json["before"]["tier"] == "DEGRADED");
    CHECK(json["after"]["tier"] == "NORMAL");
}

} // TEST_SUITE
