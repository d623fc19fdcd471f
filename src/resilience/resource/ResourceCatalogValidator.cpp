#include "resource/ResourceCatalogValidator.hpp"
#include "log/TaggedLogger.hpp"
#include "resource/SettingsCatalog.hpp"

#include <chrono>
#include <exception>
#include <string>
#include <vector>

namespace RS {

auto recoveryActionToString(RecoveryAction action) -> std::string_view {
    switch (action) {
    case RecoveryAction::ProceedNormal:
        return "PROCEED_NORMAL";
    case RecoveryAction::UseFallbackUI:
        return "USE_FALLBACK_UI";
    case RecoveryAction::UseEmergencyUI:
        return "USE_EMERGENCY_UI";
    case RecoveryAction::Abort:
        return "ABORT_WITH_ERROR";
    }
    return "ABORT_WITH_ERROR";
}

auto ValidationReport::missingCount() const -> std::size_t {
    std::size_t count = 0;
    for (auto const& names : this->missingByKind) {
        count += names.size();
    }
    return count;
}

auto ValidationReport::missingNames() const -> std::vector<std::string> {
    std::vector<std::string> names;
    names.reserve(this->missingCount());
    for (auto const& perKind : this->missingByKind) {
        names.insert(names.end(), perKind.begin(), perKind.end());
    }
    return names;
}

auto deriveRecoveryAction(ValidationReport const& report) -> RecoveryAction {
    auto const missing = report.missingCount();
    if (missing == 0) {
        return RecoveryAction::ProceedNormal;
    }
    if (static_cast<std::size_t>(report.fallbacksAvailable) == missing) {
        return RecoveryAction::UseFallbackUI;
    }
    if (!report.missing(ResourceKind::Layout).empty()) {
        return RecoveryAction::UseEmergencyUI;
    }
    return RecoveryAction::Abort;
}

ResourceCatalogValidator::ResourceCatalogValidator(ResourceEnvironment const& environment)
    : ResourceCatalogValidator(environment, SettingsCatalog) {}

ResourceCatalogValidator::ResourceCatalogValidator(ResourceEnvironment const& environment, std::span<CatalogEntry const> fallbackCatalog)
    : resources(environment), fallbackCatalog(fallbackCatalog) {}

auto ResourceCatalogValidator::isAvailable(ResourceDescriptor const& descriptor) const -> bool {
    auto const id = this->resources.resolve(descriptor.name, descriptor.kind);
    if (!id) {
        rs_log("Missing " + std::string(resourceKindToString(descriptor.kind)) + " resource: " + std::string(descriptor.name), "ResourceValidator");
        return false;
    }
    try {
        this->resources.load(*id, descriptor.kind);
    } catch (std::exception const& error) {
        rs_log("Failed to load " + std::string(resourceKindToString(descriptor.kind)) + " resource " + std::string(descriptor.name) + ": " + error.what(),
               "ResourceValidator", "ERROR");
        return false;
    } catch (...) {
        rs_log("Failed to load resource " + std::string(descriptor.name) + ": non-standard exception", "ResourceValidator", "ERROR");
        return false;
    }
    return true;
}

template <typename Lookup>
auto ResourceCatalogValidator::run(std::span<ResourceDescriptor const> descriptors, Lookup&& lookup) const -> ValidationReport {
    auto const started = std::chrono::steady_clock::now();

    ValidationReport report;
    report.checked = descriptors.size();
    for (auto const& descriptor : descriptors) {
        if (this->isAvailable(descriptor)) {
            continue;
        }
        report.missingByKind[static_cast<std::size_t>(descriptor.kind)].emplace_back(descriptor.name);
        if (descriptor.kind == ResourceKind::Layout) {
            continue;
        }
        if (std::optional<ResourceFallback> fallback = lookup(descriptor.name); fallback && fallback->present()) {
            report.substitutions.push_back(ResourceSubstitution{std::string(descriptor.name), descriptor.kind, *fallback});
            ++report.fallbacksAvailable;
        }
    }
    report.allAvailable      = report.missingCount() == 0;
    report.recommendedAction = deriveRecoveryAction(report);
    report.validationTime    = std::chrono::duration_cast<std::chrono::microseconds>(std::chrono::steady_clock::now() - started);

    rs_log("Validation finished - action " + std::string(recoveryActionToString(report.recommendedAction)) + ", missing " + std::to_string(report.missingCount()) + " of "
                   + std::to_string(report.checked),
           "ResourceValidator");
    return report;
}

auto ResourceCatalogValidator::validate(std::span<ResourceDescriptor const> descriptors) const -> ValidationReport {
    return this->run(descriptors, [this](std::string_view name) { return this->fallbackFor(name); });
}

auto ResourceCatalogValidator::validateCatalog(std::span<CatalogEntry const> entries) const -> ValidationReport {
    std::vector<ResourceDescriptor> descriptors;
    descriptors.reserve(entries.size());
    for (auto const& entry : entries) {
        descriptors.push_back(entry.descriptor());
    }
    return this->run(descriptors, [entries](std::string_view name) -> std::optional<ResourceFallback> {
        if (auto const* entry = findCatalogEntry(entries, name)) {
            return entry->fallback;
        }
        return std::nullopt;
    });
}

auto ResourceCatalogValidator::validateSettings() const -> ValidationReport {
    return this->validateCatalog(SettingsCatalog);
}

auto ResourceCatalogValidator::fallbackFor(std::string_view name) const -> std::optional<ResourceFallback> {
    if (auto const* entry = findCatalogEntry(this->fallbackCatalog, name); entry && entry->fallback.present()) {
        return entry->fallback;
    }
    return std::nullopt;
}

auto ResourceCatalogValidator::fallbackDimensionPx(std::string_view name, float density) const -> float {
    float dp = DefaultFallbackDimensionDp;
    if (auto fallback = this->fallbackFor(name); fallback && fallback->type == ResourceFallback::Type::Dimension) {
        dp = fallback->dp;
    }
    return dp * density;
}

auto ResourceCatalogValidator::customComponentsAvailable() const -> bool {
    bool available = true;
    for (auto const& entry : SettingsCatalog) {
        if (entry.kind == ResourceKind::Layout) {
            continue;
        }
        available = this->isAvailable(entry.descriptor()) && available;
    }
    rs_log(std::string("Custom components validation: ") + (available ? "PASSED" : "FAILED"), "ResourceValidator");
    return available;
}

} // namespace RS
