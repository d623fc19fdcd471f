#pragma once
#include "core/Failure.hpp"

#include <chrono>
#include <cstdint>
#include <string_view>

namespace RS {

// Why a retry might succeed; drives the strategy choice in the coordinators.
enum class RetryClass : std::uint8_t {
    StateLoss = 0,
    NotAttached,
    LifecycleError,
    IllegalState,
    Unknown
};

enum class RecoveryStrategy : std::uint8_t {
    RetryWithStateLoss = 0,
    RetryAfterDelay,
    ForceCleanup,
    Abort
};

inline constexpr std::chrono::milliseconds DefaultRetryDelay{500};

[[nodiscard]] auto retryClassToString(RetryClass value) -> std::string_view;
[[nodiscard]] auto recoveryStrategyToString(RecoveryStrategy strategy) -> std::string_view;

// Message wording first ("state loss", "not attached", "destroyed"), then the illegal-state type.
[[nodiscard]] auto classifyRetry(Failure const& failure) -> RetryClass;

[[nodiscard]] constexpr auto strategyFor(RetryClass value) -> RecoveryStrategy {
    switch (value) {
    case RetryClass::StateLoss:
    case RetryClass::IllegalState:
        return RecoveryStrategy::RetryWithStateLoss;
    case RetryClass::NotAttached:
        return RecoveryStrategy::RetryAfterDelay;
    case RetryClass::LifecycleError:
        return RecoveryStrategy::ForceCleanup;
    case RetryClass::Unknown:
        return RecoveryStrategy::Abort;
    }
    return RecoveryStrategy::Abort;
}

} // namespace RS
