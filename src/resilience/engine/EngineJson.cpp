#include "engine/EngineJson.hpp"

#include <string>
#include <utility>

namespace RS {
namespace {

[[nodiscard]] auto to_json(GlassKindReport const& report) -> nlohmann::json {
    return nlohmann::json{
        {"kind", std::string{resourceKindToString(report.kind)}},
        {"total", report.total},
        {"available", report.available},
        {"missing", report.missing},
        {"fallbacks_available", report.fallbacksAvailable},
        {"availability_percentage", report.availabilityPercentage()},
    };
}

[[nodiscard]] auto to_json(RecoverySummary const& summary) -> nlohmann::json {
    return nlohmann::json{
        {"considered", summary.considered},
        {"promoted", summary.promoted},
        {"unchanged", summary.unchanged},
        {"skipped", summary.skipped},
        {"revalidation_failed", summary.revalidationFailed},
    };
}

template <typename Tier>
[[nodiscard]] auto to_json(ComponentState<Tier> const& state) -> nlohmann::json {
    nlohmann::json result{
        {"component_id", state.componentId},
        {"tier", std::string{tierName(state.tier)}},
        {"retry_count", state.retryCount},
        {"recoverable", state.recoverable},
        {"timestamp_ms", toEpochMillis(state.timestamp)},
    };
    if (state.lastError) {
        result["last_error"] = *state.lastError;
    }
    return result;
}

template <typename Tier>
[[nodiscard]] auto to_json(std::vector<ComponentState<Tier>> const& states) -> nlohmann::json {
    nlohmann::json result = nlohmann::json::array();
    for (auto const& state : states) {
        result.push_back(to_json(state));
    }
    return result;
}

} // namespace

auto SystemHealthToJson(SystemHealth const& health) -> nlohmann::json {
    return nlohmann::json{
        {"tier", std::string{systemTierToString(health.tier)}},
        {"total", health.total},
        {"normal", health.normal},
        {"degraded", health.degraded},
        {"failed", health.failed},
        {"reduced", health.reduced},
        {"fallback", health.fallback},
        {"emergency", health.emergency},
        {"can_recover", health.canRecover},
        {"health_percentage", health.healthPercentage()},
    };
}

auto GlassValidationToJson(GlassValidation const& validation) -> nlohmann::json {
    return nlohmann::json{
        {"visual", to_json(validation.visual())},
        {"color", to_json(validation.color())},
        {"dimension", to_json(validation.dimension())},
        {"total_resources", validation.totalResources},
        {"total_missing", validation.totalMissing},
        {"total_fallbacks", validation.totalFallbacks},
        {"missing_percentage", validation.missingPercentage},
        {"overall_availability_percentage", validation.overallAvailabilityPercentage()},
        {"effects_supported", validation.effectsSupported},
        {"recommended_tier", std::string{tierName(validation.recommendedTier)}},
        {"validation_time_us", validation.validationTime.count()},
        {"timestamp_ms", toEpochMillis(validation.timestamp)},
    };
}

auto SystemStatusToJson(SystemStatus const& status) -> nlohmann::json {
    return nlohmann::json{
        {"health", SystemHealthToJson(status.health)},
        {"preflight_tier", std::string{systemTierToString(status.preflightTier)}},
        {"glass_tier", std::string{tierName(status.glassTier)}},
        {"glass_available", status.glassAvailable},
        {"components", to_json(status.components)},
        {"glass_surfaces", to_json(status.glassSurfaces)},
    };
}

auto SystemRecoveryToJson(SystemRecovery const& recovery) -> nlohmann::json {
    return nlohmann::json{
        {"components", to_json(recovery.components)},
        {"glass", to_json(recovery.glass)},
        {"before", SystemHealthToJson(recovery.before)},
        {"after", SystemHealthToJson(recovery.after)},
        {"any_recovered", recovery.anyRecovered()},
    };
}

auto SerializeSystemStatus(SystemStatus const& status, int indent) -> std::string {
    return SystemStatusToJson(status).dump(indent);
}

} // namespace RS
