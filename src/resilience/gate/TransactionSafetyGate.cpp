#include "gate/TransactionSafetyGate.hpp"

namespace RS {

auto commitVerdictToString(CommitVerdict verdict) -> std::string_view {
    switch (verdict) {
    case CommitVerdict::Safe:
        return "SAFE";
    case CommitVerdict::AllowLossyCommit:
        return "ALLOW_STATE_LOSS";
    case CommitVerdict::Unsafe:
        return "UNSAFE";
    }
    return "UNSAFE";
}

auto TransactionSafetyGate::canCommit(EnvironmentState const& state) -> CommitVerdict {
    return evaluate(state).verdict;
}

auto TransactionSafetyGate::evaluate(EnvironmentState const& state) -> GateDecision {
    if (state.hostDestroyed) {
        return {CommitVerdict::Unsafe, "host scope destroyed"};
    }
    if (state.hostFinishing) {
        return {CommitVerdict::Unsafe, "host scope finishing"};
    }
    if (state.managerDestroyed) {
        return {CommitVerdict::Unsafe, "tree manager destroyed"};
    }
    if (state.stateSaved) {
        return {CommitVerdict::AllowLossyCommit, "state already saved"};
    }
    return {CommitVerdict::Safe, "ok"};
}

} // namespace RS
