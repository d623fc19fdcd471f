#pragma once
#include "host/HostEnvironment.hpp"

#include <cstdint>
#include <string>
#include <string_view>

namespace RS {

enum class CommitVerdict : std::uint8_t {
    Safe = 0,
    AllowLossyCommit,
    Unsafe
};

[[nodiscard]] auto commitVerdictToString(CommitVerdict verdict) -> std::string_view;

struct GateDecision {
    CommitVerdict verdict = CommitVerdict::Safe;
    std::string   reason;
};

/**
 * TransactionSafetyGate — may a structural UI mutation be committed now?
 *
 *   host finishing or destroyed, or tree manager destroyed -> Unsafe
 *   state already saved                                     -> AllowLossyCommit
 *   otherwise                                               -> Safe
 *
 * Pure; holds no state of its own.
 */
class TransactionSafetyGate {
public:
    [[nodiscard]] static auto canCommit(EnvironmentState const& state) -> CommitVerdict;
    [[nodiscard]] static auto evaluate(EnvironmentState const& state) -> GateDecision;
};

} // namespace RS
