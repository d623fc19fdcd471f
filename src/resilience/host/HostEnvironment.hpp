#pragma once
#include "resource/ResourceDescriptor.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace RS {

using ResourceId = std::uint32_t;

/**
 * ResourceEnvironment — the rendering layer's resource table.
 *
 * resolve() maps a name to an identifier without touching the resource;
 * load() materializes it and may throw (missing file, decode failure, a
 * style referencing another missing resource). Both are called from the
 * validators, possibly from several threads at once, so implementations
 * must be safe for concurrent reads.
 */
struct ResourceEnvironment {
    virtual ~ResourceEnvironment() = default;

    virtual auto resolve(std::string_view name, ResourceKind kind) const -> std::optional<ResourceId> = 0;
    virtual auto load(ResourceId id, ResourceKind kind) const -> void                              = 0;
};

// Snapshot of the host scope used to decide whether a tree mutation may commit.
struct EnvironmentState {
    bool hostFinishing    = false;
    bool hostDestroyed    = false;
    bool managerDestroyed = false;
    bool stateSaved       = false;
};

struct DeviceInfo {
    std::string   manufacturer;
    std::string   model;
    std::string   osVersion;
    int           apiLevel          = 0;
    std::string   brand;
    std::string   device;
    std::string   hardware;
    bool          isEmulator        = false;
    std::int64_t  availableMemoryMB = -1;
    std::int64_t  totalMemoryMB     = -1;
    float         density           = 1.0f;
};

/**
 * HostEnvironment — everything the engine needs from the owning UI scope.
 *
 * environmentState() and capabilityProbe() are queried on the decision path
 * and must be cheap. deviceInfo() runs on a background worker during crash
 * record enrichment and may throw. releaseRegistration() drops whatever the
 * host still holds for a component (a stale view, a pending transaction) so
 * that a later attempt starts clean; it returns false when nothing was held.
 */
struct HostEnvironment {
    virtual ~HostEnvironment() = default;

    virtual auto environmentState() const -> EnvironmentState              = 0;
    virtual auto capabilityProbe() const -> bool                           = 0;
    virtual auto releaseRegistration(std::string_view componentId) -> bool = 0;
    virtual auto deviceInfo() const -> DeviceInfo                          = 0;
};

} // namespace RS
