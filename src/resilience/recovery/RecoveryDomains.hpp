#pragma once
#include "core/Renderable.hpp"
#include "core/Tier.hpp"
#include "recovery/FallbackRecipes.hpp"

#include <string_view>

namespace RS {

/**
 * Domain policies plugged into RecoveryCoordinator. A domain names its tier
 * scale, the label used in logs and ledger snapshots, the context prefix
 * recorded with each failure, and how a fallback is synthesized for a
 * component at a given tier.
 */
struct ComponentDomain {
    using Tier = ComponentTier;

    static constexpr std::string_view Name           = "component";
    static constexpr std::string_view FailureContext = "componentFailure";

    static auto synthesize(std::string_view componentId, Tier tier) -> Renderable {
        return synthesizeComponentFallback(componentId, tier);
    }
};

struct GlassDomain {
    using Tier = GlassTier;

    static constexpr std::string_view Name           = "glass";
    static constexpr std::string_view FailureContext = "glassComponentInitialization";

    static auto synthesize(std::string_view componentId, Tier tier) -> Renderable {
        return synthesizeGlassFallback(componentId, tier);
    }
};

} // namespace RS
