#pragma once
#include "core/Clock.hpp"
#include "core/Tier.hpp"

#include <cstddef>
#include <optional>
#include <string>

namespace RS {

// Value snapshot of one tracked component; the coordinator owns the live entry.
template <typename Tier>
struct ComponentState {
    std::string                componentId;
    Tier                       tier = TierTraits<Tier>::Top;
    std::optional<std::string> lastError;
    int                        retryCount  = 0;
    TimePoint                  timestamp{};
    bool                       recoverable = true;
};

struct RecoverySummary {
    std::size_t considered         = 0;
    std::size_t promoted           = 0;
    std::size_t unchanged          = 0;
    std::size_t skipped            = 0;
    bool        revalidationFailed = false;

    [[nodiscard]] auto anyRecovered() const -> bool { return this->promoted > 0; }
};

} // namespace RS
