#pragma once
#include "host/HostEnvironment.hpp"
#include "resource/ResourceCatalog.hpp"
#include "resource/ValidationReport.hpp"

#include <optional>
#include <span>
#include <string_view>

namespace RS {

/**
 * ResourceCatalogValidator — checks named resources against the live
 * ResourceEnvironment.
 *
 * A resource counts as missing when it does not resolve or when loading the
 * resolved resource throws. Loader exceptions are caught and logged here and
 * never reach the caller. Each call is a single authoritative pass with no
 * retries; the validator holds no mutable state, so concurrent calls are safe.
 *
 * Fallbacks for missing names are looked up in the catalog the validator was
 * constructed with (the settings catalog by default).
 */
class ResourceCatalogValidator {
public:
    explicit ResourceCatalogValidator(ResourceEnvironment const& environment);
    ResourceCatalogValidator(ResourceEnvironment const& environment, std::span<CatalogEntry const> fallbackCatalog);

    [[nodiscard]] auto validate(std::span<ResourceDescriptor const> descriptors) const -> ValidationReport;
    [[nodiscard]] auto validateCatalog(std::span<CatalogEntry const> entries) const -> ValidationReport;
    [[nodiscard]] auto validateSettings() const -> ValidationReport;

    [[nodiscard]] auto isAvailable(ResourceDescriptor const& descriptor) const -> bool;
    [[nodiscard]] auto fallbackFor(std::string_view name) const -> std::optional<ResourceFallback>;
    [[nodiscard]] auto fallbackDimensionPx(std::string_view name, float density) const -> float;

    // Visual, color and dimension resources of the settings catalog all resolve.
    [[nodiscard]] auto customComponentsAvailable() const -> bool;

    [[nodiscard]] auto environment() const -> ResourceEnvironment const& { return this->resources; }

private:
    template <typename Lookup>
    auto run(std::span<ResourceDescriptor const> descriptors, Lookup&& lookup) const -> ValidationReport;

    ResourceEnvironment const&    resources;
    std::span<CatalogEntry const> fallbackCatalog;
};

} // namespace RS
