#include "diagnostics/CrashClass.hpp"

#include <algorithm>
#include <cctype>

namespace RS {

auto crashClassToString(CrashClass value) -> std::string_view {
    switch (value) {
    case CrashClass::ResourceNotFound:
        return "RESOURCE_NOT_FOUND";
    case CrashClass::FragmentLifecycleError:
        return "FRAGMENT_LIFECYCLE_ERROR";
    case CrashClass::CustomComponentFailure:
        return "CUSTOM_COMPONENT_FAILURE";
    case CrashClass::MemoryError:
        return "MEMORY_ERROR";
    case CrashClass::DomainSpecificError:
        return "DOMAIN_SPECIFIC_ERROR";
    case CrashClass::Unknown:
        return "UNKNOWN";
    }
    return "UNKNOWN";
}

auto containsIgnoreCase(std::string_view haystack, std::string_view needle) -> bool {
    if (needle.empty()) {
        return false;
    }
    auto const it = std::search(haystack.begin(), haystack.end(), needle.begin(), needle.end(), [](char lhs, char rhs) {
        return std::tolower(static_cast<unsigned char>(lhs)) == std::tolower(static_cast<unsigned char>(rhs));
    });
    return it != haystack.end();
}

auto classifyCrash(Failure const& failure, std::string_view context, std::string_view domainKeyword) -> CrashClass {
    if (failure.type == Failure::Type::ResourceNotFound) {
        return CrashClass::ResourceNotFound;
    }
    if (containsIgnoreCase(failure.message, "fragment") || containsIgnoreCase(failure.message, "lifecycle")) {
        return CrashClass::FragmentLifecycleError;
    }
    if (containsIgnoreCase(failure.message, "view") || containsIgnoreCase(failure.message, "component")) {
        return CrashClass::CustomComponentFailure;
    }
    if (failure.type == Failure::Type::OutOfMemory) {
        return CrashClass::MemoryError;
    }
    if (containsIgnoreCase(context, domainKeyword)) {
        return CrashClass::DomainSpecificError;
    }
    return CrashClass::Unknown;
}

} // namespace RS
