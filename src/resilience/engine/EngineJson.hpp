#pragma once
#include "engine/ResilienceEngine.hpp"

#include <string>

#include <nlohmann/json.hpp>

namespace RS {

[[nodiscard]] auto SystemHealthToJson(SystemHealth const& health) -> nlohmann::json;
[[nodiscard]] auto GlassValidationToJson(GlassValidation const& validation) -> nlohmann::json;
[[nodiscard]] auto SystemStatusToJson(SystemStatus const& status) -> nlohmann::json;
[[nodiscard]] auto SystemRecoveryToJson(SystemRecovery const& recovery) -> nlohmann::json;

[[nodiscard]] auto SerializeSystemStatus(SystemStatus const& status, int indent = 2) -> std::string;

} // namespace RS
