#pragma once
#include "resource/ResourceCatalog.hpp"

#include <array>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace RS {

enum class RecoveryAction : std::uint8_t {
    ProceedNormal = 0,
    UseFallbackUI,
    UseEmergencyUI,
    Abort
};

[[nodiscard]] auto recoveryActionToString(RecoveryAction action) -> std::string_view;

struct ResourceSubstitution {
    std::string      name;
    ResourceKind     kind;
    ResourceFallback fallback;
};

/**
 * ValidationReport — outcome of one validation pass. Built once by the
 * validator and treated as immutable afterwards.
 */
struct ValidationReport {
    std::array<std::vector<std::string>, ResourceKindCount> missingByKind{};
    std::vector<ResourceSubstitution>                       substitutions;
    int                                                     fallbacksAvailable = 0;
    bool                                                    allAvailable       = true;
    RecoveryAction                                          recommendedAction  = RecoveryAction::ProceedNormal;
    std::size_t                                             checked            = 0;
    std::chrono::microseconds                               validationTime{0};

    [[nodiscard]] auto missing(ResourceKind kind) const -> std::vector<std::string> const& {
        return this->missingByKind[static_cast<std::size_t>(kind)];
    }
    [[nodiscard]] auto missingCount() const -> std::size_t;
    [[nodiscard]] auto missingNames() const -> std::vector<std::string>;
};

// ProceedNormal when nothing is missing, UseFallbackUI when every missing
// resource has a substitution, UseEmergencyUI when layouts are missing,
// Abort otherwise.
[[nodiscard]] auto deriveRecoveryAction(ValidationReport const& report) -> RecoveryAction;

} // namespace RS
