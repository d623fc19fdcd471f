#include "recovery/RetryClass.hpp"
#include "diagnostics/CrashClass.hpp"

namespace RS {

auto retryClassToString(RetryClass value) -> std::string_view {
    switch (value) {
    case RetryClass::StateLoss:
        return "STATE_LOSS";
    case RetryClass::NotAttached:
        return "NOT_ATTACHED";
    case RetryClass::LifecycleError:
        return "LIFECYCLE_ERROR";
    case RetryClass::IllegalState:
        return "ILLEGAL_STATE";
    case RetryClass::Unknown:
        return "UNKNOWN";
    }
    return "UNKNOWN";
}

auto recoveryStrategyToString(RecoveryStrategy strategy) -> std::string_view {
    switch (strategy) {
    case RecoveryStrategy::RetryWithStateLoss:
        return "RETRY_WITH_STATE_LOSS";
    case RecoveryStrategy::RetryAfterDelay:
        return "RETRY_AFTER_DELAY";
    case RecoveryStrategy::ForceCleanup:
        return "FORCE_CLEANUP";
    case RecoveryStrategy::Abort:
        return "ABORT";
    }
    return "ABORT";
}

auto classifyRetry(Failure const& failure) -> RetryClass {
    if (containsIgnoreCase(failure.message, "state loss")) {
        return RetryClass::StateLoss;
    }
    if (containsIgnoreCase(failure.message, "not attached")) {
        return RetryClass::NotAttached;
    }
    if (containsIgnoreCase(failure.message, "destroyed")) {
        return RetryClass::LifecycleError;
    }
    if (failure.type == Failure::Type::IllegalState) {
        return RetryClass::IllegalState;
    }
    return RetryClass::Unknown;
}

} // namespace RS
