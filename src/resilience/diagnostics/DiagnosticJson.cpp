#include "diagnostics/DiagnosticJson.hpp"
#include "core/Clock.hpp"

#include <utility>

namespace RS {
namespace {

[[nodiscard]] auto to_json(DeviceInfo const& device) -> nlohmann::json {
    return nlohmann::json{
        {"manufacturer", device.manufacturer},
        {"model", device.model},
        {"os_version", device.osVersion},
        {"api_level", device.apiLevel},
        {"brand", device.brand},
        {"device", device.device},
        {"hardware", device.hardware},
        {"is_emulator", device.isEmulator},
        {"available_memory_mb", device.availableMemoryMB},
        {"total_memory_mb", device.totalMemoryMB},
        {"density", device.density},
    };
}

[[nodiscard]] auto to_json(EnvironmentState const& environment) -> nlohmann::json {
    return nlohmann::json{
        {"host_finishing", environment.hostFinishing},
        {"host_destroyed", environment.hostDestroyed},
        {"manager_destroyed", environment.managerDestroyed},
        {"state_saved", environment.stateSaved},
    };
}

[[nodiscard]] auto to_json(ComponentSnapshot const& snapshot) -> nlohmann::json {
    nlohmann::json details = nlohmann::json::object();
    for (auto const& [key, value] : snapshot.details) {
        details[key] = value;
    }
    return nlohmann::json{
        {"component_id", snapshot.componentId},
        {"state", snapshot.state},
        {"timestamp_ms", toEpochMillis(snapshot.timestamp)},
        {"details", std::move(details)},
    };
}

[[nodiscard]] auto to_json(RecoveryAttempt const& attempt) -> nlohmann::json {
    nlohmann::json result{
        {"strategy", attempt.strategy},
        {"success", attempt.success},
        {"timestamp_ms", toEpochMillis(attempt.timestamp)},
    };
    if (attempt.detail) {
        result["detail"] = *attempt.detail;
    }
    return result;
}

[[nodiscard]] auto to_json(CrashSummary const& summary) -> nlohmann::json {
    nlohmann::json counts = nlohmann::json::object();
    for (auto const& [classification, count] : summary.countsByClass) {
        counts[std::string(crashClassToString(classification))] = count;
    }
    return nlohmann::json{
        {"total_crashes", summary.totalCrashes},
        {"recent_crashes", summary.recentCrashes},
        {"crash_types", std::move(counts)},
        {"most_common_crash_type", summary.mostCommon ? nlohmann::json(std::string(crashClassToString(*summary.mostCommon))) : nlohmann::json(nullptr)},
        {"average_recovery_attempts", summary.averageRecoveryAttempts},
        {"successful_recoveries", summary.successfulRecoveries},
    };
}

} // namespace

auto ValidationReportToJson(ValidationReport const& report) -> nlohmann::json {
    nlohmann::json missing = nlohmann::json::object();
    for (auto const kind : {ResourceKind::Visual, ResourceKind::Layout, ResourceKind::Color, ResourceKind::Dimension}) {
        missing[std::string(resourceKindToString(kind))] = report.missing(kind);
    }
    nlohmann::json substitutions = nlohmann::json::object();
    for (auto const& substitution : report.substitutions) {
        substitutions[substitution.name] = substitution.fallback.describe();
    }
    return nlohmann::json{
        {"all_available", report.allAvailable},
        {"checked", report.checked},
        {"missing", std::move(missing)},
        {"missing_count", report.missingCount()},
        {"fallbacks_available", report.fallbacksAvailable},
        {"substitutions", std::move(substitutions)},
        {"recommended_action", std::string(recoveryActionToString(report.recommendedAction))},
        {"validation_time_us", report.validationTime.count()},
    };
}

auto CrashRecordToJson(CrashRecord const& record) -> nlohmann::json {
    nlohmann::json attempts = nlohmann::json::array();
    for (auto const& attempt : record.recoveryAttempts) {
        attempts.push_back(to_json(attempt));
    }
    nlohmann::json result{
        {"id", record.id},
        {"timestamp_ms", toEpochMillis(record.timestamp)},
        {"classification", std::string(crashClassToString(record.classification))},
        {"error_type", record.errorType},
        {"message", record.message},
        {"stack_summary", record.stackSummary},
        {"context", record.context},
        {"enrichment", std::string(enrichmentStateToString(record.enrichment))},
        {"recovery_attempts", std::move(attempts)},
    };
    if (record.componentId) {
        result["component_id"] = *record.componentId;
    }
    if (record.resourceName) {
        result["resource_name"] = *record.resourceName;
    }
    if (record.enrichmentError) {
        result["enrichment_error"] = *record.enrichmentError;
    }
    if (record.device) {
        result["device"] = to_json(*record.device);
    }
    if (record.environment) {
        result["environment"] = to_json(*record.environment);
    }
    if (record.resources) {
        result["resources"] = ValidationReportToJson(*record.resources);
    }
    if (record.component) {
        result["component"] = to_json(*record.component);
    }
    return result;
}

auto DiagnosticReportToJson(DiagnosticReport const& report) -> nlohmann::json {
    nlohmann::json recent = nlohmann::json::array();
    for (auto const& record : report.recent) {
        recent.push_back(CrashRecordToJson(record));
    }
    nlohmann::json components = nlohmann::json::array();
    for (auto const& snapshot : report.components) {
        components.push_back(to_json(snapshot));
    }
    return nlohmann::json{
        {"version", report.version},
        {"timestamp_ms", toEpochMillis(report.timestamp)},
        {"device", report.device ? to_json(*report.device) : nlohmann::json(nullptr)},
        {"resources", ValidationReportToJson(report.resources)},
        {"summary", to_json(report.summary)},
        {"recent_crashes", std::move(recent)},
        {"component_states", std::move(components)},
        {"recommendations", report.recommendations},
    };
}

auto SerializeDiagnosticReport(DiagnosticReport const& report, int indent) -> std::string {
    return DiagnosticReportToJson(report).dump(indent);
}

} // namespace RS
