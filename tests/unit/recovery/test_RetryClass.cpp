#include <doctest/doctest.h>
#include "recovery/RetryClass.hpp"

using namespace RS;

TEST_SUITE("recovery.retry_class") {

TEST_CASE("message_wording_decides_first") {
    CHECK(classifyRetry(Failure::Make(Failure::Type::Runtime, "commit would cause State Loss")) == RetryClass::StateLoss);
    CHECK(classifyRetry(Failure::Make(Failure::Type::IllegalState, "Fragment not attached to host")) == RetryClass::NotAttached);
    CHECK(classifyRetry(Failure::Make(Failure::Type::IllegalState, "Activity has been destroyed")) == RetryClass::LifecycleError);
}

TEST_CASE("illegal_state_type_without_wording") {
    CHECK(classifyRetry(Failure::Make(Failure::Type::IllegalState, "Can not perform this action after onSaveInstanceState")) == RetryClass::IllegalState);
    CHECK(classifyRetry(Failure::FromError(Error{Error::Code::IllegalState, "commit refused"})) == RetryClass::IllegalState);
}

TEST_CASE("everything_else_is_unknown") {
    CHECK(classifyRetry(Failure::Make(Failure::Type::Runtime, "inflate failed")) == RetryClass::Unknown);
    CHECK(classifyRetry(Failure::MissingResource("glass_border")) == RetryClass::Unknown);
    CHECK(classifyRetry(Failure::Make(Failure::Type::OutOfMemory, "")) == RetryClass::Unknown);
}

TEST_CASE("strategy_table") {
    static_assert(strategyFor(RetryClass::StateLoss) == RecoveryStrategy::RetryWithStateLoss);
    static_assert(strategyFor(RetryClass::IllegalState) == RecoveryStrategy::RetryWithStateLoss);
    static_assert(strategyFor(RetryClass::NotAttached) == RecoveryStrategy::RetryAfterDelay);
    static_assert(strategyFor(RetryClass::LifecycleError) == RecoveryStrategy::ForceCleanup);
    static_assert(strategyFor(RetryClass::Unknown) == RecoveryStrategy::Abort);
    CHECK(DefaultRetryDelay.count() == 500);
}

TEST_CASE("names") {
    CHECK(retryClassToString(RetryClass::NotAttached) == "NOT_ATTACHED");
    CHECK(retryClassToString(RetryClass::Unknown) == "UNKNOWN");
    CHECK(recoveryStrategyToString(RecoveryStrategy::RetryWithStateLoss) == "RETRY_WITH_STATE_LOSS");
    CHECK(recoveryStrategyToString(RecoveryStrategy::ForceCleanup) == "FORCE_CLEANUP");
}

} // TEST_SUITE
