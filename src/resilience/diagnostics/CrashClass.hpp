#pragma once
#include "core/Failure.hpp"

#include <cstddef>
#include <cstdint>
#include <string_view>

namespace RS {

// Closed crash taxonomy used by the ledger and its recommendations.
enum class CrashClass : std::uint8_t {
    ResourceNotFound = 0,
    FragmentLifecycleError,
    CustomComponentFailure,
    MemoryError,
    DomainSpecificError,
    Unknown
};

inline constexpr std::size_t CrashClassCount = 6;

[[nodiscard]] auto crashClassToString(CrashClass value) -> std::string_view;

// First matching rule wins: resource type, lifecycle wording, component
// wording, allocation failure, then the domain keyword in the context.
[[nodiscard]] auto classifyCrash(Failure const& failure, std::string_view context, std::string_view domainKeyword) -> CrashClass;

[[nodiscard]] auto containsIgnoreCase(std::string_view haystack, std::string_view needle) -> bool;

} // namespace RS
