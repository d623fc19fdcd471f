#pragma once
#include "core/Clock.hpp"
#include "diagnostics/CrashClass.hpp"
#include "host/HostEnvironment.hpp"
#include "resource/ValidationReport.hpp"

#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace RS {

enum class EnrichmentState : std::uint8_t {
    Pending = 0,
    Complete,
    Failed
};

[[nodiscard]] auto enrichmentStateToString(EnrichmentState state) -> std::string_view;

struct RecoveryAttempt {
    std::string                strategy;
    bool                       success = false;
    std::optional<std::string> detail;
    TimePoint                  timestamp{};
};

// Lightweight live status of one component, independent of crash records.
struct ComponentSnapshot {
    std::string                        componentId;
    std::string                        state;
    TimePoint                          timestamp{};
    std::map<std::string, std::string> details;
};

/**
 * CrashRecord — one reported failure.
 *
 * Everything above `enrichment` is fixed when the record is created on the
 * caller's thread. The optional snapshots start empty and are filled in
 * once by the background enrichment job; `recoveryAttempts` grows as the
 * coordinator reports outcomes against the record id.
 */
struct CrashRecord {
    std::string                id;
    TimePoint                  timestamp{};
    std::uint64_t              sequence       = 0;
    CrashClass                 classification = CrashClass::Unknown;
    std::string                errorType;
    std::string                message;
    std::string                stackSummary;
    std::string                context;
    std::optional<std::string> componentId;
    std::optional<std::string> resourceName;

    EnrichmentState                  enrichment = EnrichmentState::Pending;
    std::optional<std::string>       enrichmentError;
    std::optional<DeviceInfo>        device;
    std::optional<EnvironmentState>  environment;
    std::optional<ValidationReport>  resources;
    std::optional<ComponentSnapshot> component;

    std::vector<RecoveryAttempt> recoveryAttempts;

    [[nodiscard]] auto recovered() const -> bool {
        for (auto const& attempt : this->recoveryAttempts) {
            if (attempt.success) {
                return true;
            }
        }
        return false;
    }
};

struct CrashSummary {
    std::size_t                       totalCrashes  = 0;
    std::size_t                       recentCrashes = 0;
    std::map<CrashClass, std::size_t> countsByClass;
    std::optional<CrashClass>         mostCommon;
    double                            averageRecoveryAttempts = 0.0;
    std::size_t                       successfulRecoveries    = 0;
};

struct DiagnosticReport {
    std::string                    version;
    TimePoint                      timestamp{};
    std::optional<DeviceInfo>      device;
    ValidationReport               resources;
    CrashSummary                   summary;
    std::vector<CrashRecord>       recent;
    std::vector<ComponentSnapshot> components;
    std::vector<std::string>       recommendations;
};

} // namespace RS
