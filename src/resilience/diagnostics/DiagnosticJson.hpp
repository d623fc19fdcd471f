#pragma once
#include "diagnostics/CrashRecord.hpp"
#include "resource/ValidationReport.hpp"

#include <string>

#include <nlohmann/json.hpp>

namespace RS {

[[nodiscard]] auto ValidationReportToJson(ValidationReport const& report) -> nlohmann::json;
[[nodiscard]] auto CrashRecordToJson(CrashRecord const& record) -> nlohmann::json;
[[nodiscard]] auto DiagnosticReportToJson(DiagnosticReport const& report) -> nlohmann::json;

[[nodiscard]] auto SerializeDiagnosticReport(DiagnosticReport const& report, int indent = 2) -> std::string;

} // namespace RS
