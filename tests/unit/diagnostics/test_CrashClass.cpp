#include <doctest/doctest.h>
#include "diagnostics/CrashClass.hpp"

using namespace RS;

TEST_SUITE("diagnostics.crash_class") {

TEST_CASE("resource_type_wins") {
    auto failure = Failure::MissingResource("glass_card_background");
    failure.message += " while inflating view";
    CHECK(classifyCrash(failure, "settings", "settings") == CrashClass::ResourceNotFound);
}

TEST_CASE("message_wording_picks_lifecycle_then_component") {
    CHECK(classifyCrash(Failure::Make(Failure::Type::IllegalState, "Fragment not attached to a context"), "", "settings")
          == CrashClass::FragmentLifecycleError);
    CHECK(classifyCrash(Failure::Make(Failure::Type::Runtime, "LIFECYCLE owner is gone"), "", "settings") == CrashClass::FragmentLifecycleError);
    CHECK(classifyCrash(Failure::Make(Failure::Type::Runtime, "Custom View failed to measure"), "", "settings") == CrashClass::CustomComponentFailure);
    CHECK(classifyCrash(Failure::Make(Failure::Type::Runtime, "component init"), "", "settings") == CrashClass::CustomComponentFailure);
}

TEST_CASE("allocation_failure_is_memory_error") {
    CHECK(classifyCrash(Failure::Make(Failure::Type::OutOfMemory, "bitmap too large"), "", "settings") == CrashClass::MemoryError);
}

TEST_CASE("domain_keyword_matches_context") {
    auto failure = Failure::Make(Failure::Type::Runtime, "boom");
    CHECK(classifyCrash(failure, "componentFailure:SettingsPanel", "settings") == CrashClass::DomainSpecificError);
    CHECK(classifyCrash(failure, "componentFailure:MenuContainer", "settings") == CrashClass::Unknown);
    CHECK(classifyCrash(failure, "componentFailure:MenuContainer", "menu") == CrashClass::DomainSpecificError);
    // An empty keyword matches nothing.
    CHECK(classifyCrash(failure, "anything", "") == CrashClass::Unknown);
}

TEST_CASE("case_insensitive_search") {
    CHECK(containsIgnoreCase("Can not perform this action after onSaveInstanceState", "SAVEINSTANCE"));
    CHECK_FALSE(containsIgnoreCase("short", "much longer needle"));
    CHECK_FALSE(containsIgnoreCase("text", ""));
}

TEST_CASE("class_names") {
    CHECK(crashClassToString(CrashClass::ResourceNotFound) == "RESOURCE_NOT_FOUND");
    CHECK(crashClassToString(CrashClass::FragmentLifecycleError) == "FRAGMENT_LIFECYCLE_ERROR");
    CHECK(crashClassToString(CrashClass::CustomComponentFailure) == "CUSTOM_COMPONENT_FAILURE");
    CHECK(crashClassToString(CrashClass::MemoryError) == "MEMORY_ERROR");
    CHECK(crashClassToString(CrashClass::DomainSpecificError) == "DOMAIN_SPECIFIC_ERROR");
    CHECK(crashClassToString(CrashClass::Unknown) == "UNKNOWN");
}

} // TEST_SUITE
