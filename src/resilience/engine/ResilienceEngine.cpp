#include "engine/ResilienceEngine.hpp"
#include "diagnostics/CrashClass.hpp"
#include "log/TaggedLogger.hpp"

#include <string>
#include <utility>

namespace RS {

ResilienceEngine::ResilienceEngine(ResourceEnvironment const& resources, HostEnvironment& host, ResilienceOptions options, Clock const& clock)
    : ResilienceEngine(resources, host, nullptr, std::move(options), clock) {}

ResilienceEngine::ResilienceEngine(ResourceEnvironment const& resources, HostEnvironment& host, Executor& executor, ResilienceOptions options, Clock const& clock)
    : ResilienceEngine(resources, host, &executor, std::move(options), clock) {}

ResilienceEngine::ResilienceEngine(ResourceEnvironment const& resources, HostEnvironment& host, Executor* injected, ResilienceOptions options, Clock const& clock)
    : config(std::move(options)),
      clock(clock),
      host(host),
      ownedPool(injected != nullptr ? nullptr : std::make_unique<TaskPool>(config.enrichment_workers, config.enrichment_queue_limit)),
      executor(injected != nullptr ? *injected : *ownedPool),
      mainScheduler(clock),
      resourceValidator(resources),
      glassValidator(resourceValidator, host, clock),
      diagnostics(executor, clock, resourceValidator, host, ledgerOptionsFrom(config)),
      effects(host, diagnostics),
      componentCoordinator(diagnostics, host, mainScheduler, clock, coordinatorOptionsFrom(config)),
      glassCoordinator(diagnostics, host, mainScheduler, clock, glassCoordinatorOptionsFrom(config)),
      aggregator(healthThresholdsFrom(config)) {
    this->wire();
    rs_log("ResilienceEngine constructed glass=" + std::string{tierName(this->effects.tier())}, "Engine");
}

ResilienceEngine::~ResilienceEngine() {
    rs_log("ResilienceEngine::~ResilienceEngine", "Engine");
}

auto ResilienceEngine::wire() -> void {
    // A glass-backed component losing its first tier takes the glass effects down with it.
    this->componentCoordinator.setTierListener([this](std::string const& componentId, ComponentTier, ComponentTier next) {
        if (next == ComponentTier::Reduced && containsIgnoreCase(componentId, "glass")) {
            this->effects.degrade();
        }
        this->observeHealth();
    });
    this->glassCoordinator.setTierListener([this](std::string const&, GlassTier previous, GlassTier next) {
        if (previous == GlassTier::Full && next == GlassTier::Reduced) {
            this->effects.degrade();
        }
        this->observeHealth();
    });

    this->componentCoordinator.setRevalidator([this]() -> std::optional<ComponentTier> {
        switch (this->resourceValidator.validateSettings().recommendedAction) {
        case RecoveryAction::ProceedNormal:
            return ComponentTier::Normal;
        case RecoveryAction::UseFallbackUI:
            return ComponentTier::Fallback;
        case RecoveryAction::UseEmergencyUI:
        case RecoveryAction::Abort:
            return std::nullopt;
        }
        return std::nullopt;
    });
    this->glassCoordinator.setRevalidator([this]() -> std::optional<GlassTier> { return this->glassValidator.validateAll().recommendedTier; });
}

auto ResilienceEngine::observeHealth() -> void {
    this->aggregator.observe(this->systemHealth());
}

auto ResilienceEngine::onFailure(std::string_view componentId, Failure const& failure, RetryFn retry) -> Renderable {
    return this->componentCoordinator.onFailure(componentId, failure, std::move(retry));
}

auto ResilienceEngine::onFailure(std::string_view componentId, std::exception_ptr const& error, RetryFn retry) -> Renderable {
    return this->componentCoordinator.onFailure(componentId, Failure::FromException(error), std::move(retry));
}

auto ResilienceEngine::onGlassFailure(std::string_view componentId, Failure const& failure, RetryFn retry) -> Renderable {
    return this->glassCoordinator.onFailure(componentId, failure, std::move(retry));
}

auto ResilienceEngine::onGlassFailure(std::string_view componentId, std::exception_ptr const& error, RetryFn retry) -> Renderable {
    return this->glassCoordinator.onFailure(componentId, Failure::FromException(error), std::move(retry));
}

auto ResilienceEngine::markRecovered(std::string_view componentId) -> bool {
    bool const component = this->componentCoordinator.markRecovered(componentId);
    bool const glass     = this->glassCoordinator.markRecovered(componentId);
    return component || glass;
}

auto ResilienceEngine::validate() const -> ValidationReport {
    return this->resourceValidator.validateSettings();
}

auto ResilienceEngine::validate(std::span<ResourceDescriptor const> descriptors) const -> ValidationReport {
    return this->resourceValidator.validate(descriptors);
}

auto ResilienceEngine::validateAll() const -> GlassValidation {
    return this->glassValidator.validateAll();
}

auto ResilienceEngine::preflightTier() const -> SystemTier {
    return initialSystemTier(this->resourceValidator.validateSettings().missingCount());
}

auto ResilienceEngine::systemHealth() const -> SystemHealth {
    auto const componentViews = this->componentCoordinator.views();
    auto const glassViews     = this->glassCoordinator.views();
    return this->aggregator.aggregate({std::span<TierView const>{componentViews}, std::span<TierView const>{glassViews}});
}

auto ResilienceEngine::systemStatus() -> SystemStatus {
    SystemStatus status;
    status.health         = this->systemHealth();
    status.preflightTier  = this->preflightTier();
    status.glassTier      = this->effects.tier();
    status.glassAvailable = this->effects.available();
    status.components     = this->componentCoordinator.states();
    status.glassSurfaces  = this->glassCoordinator.states();
    this->aggregator.observe(status.health);
    return status;
}

auto ResilienceEngine::diagnosticReport() const -> DiagnosticReport {
    return this->diagnostics.report(this->config.recent_limit);
}

auto ResilienceEngine::diagnosticReport(std::size_t recentLimit) const -> DiagnosticReport {
    return this->diagnostics.report(recentLimit);
}

auto ResilienceEngine::attemptSystemRecovery() -> SystemRecovery {
    SystemRecovery recovery;
    recovery.before     = this->systemHealth();
    recovery.components = this->componentCoordinator.attemptSystemRecovery();
    recovery.glass      = this->glassCoordinator.attemptSystemRecovery();
    recovery.after      = this->systemHealth();
    this->aggregator.observe(recovery.after);
    rs_log("ResilienceEngine::attemptSystemRecovery health " + std::to_string(recovery.before.healthPercentage()) + "% -> "
                   + std::to_string(recovery.after.healthPercentage()) + "%",
           "Engine");
    return recovery;
}

auto ResilienceEngine::pump() -> std::size_t {
    return this->mainScheduler.pump();
}

auto ResilienceEngine::setReplacementSink(std::function<void(Renderable)> sink) -> void {
    this->componentCoordinator.setReplacementSink(sink);
    this->glassCoordinator.setReplacementSink(std::move(sink));
}

auto ResilienceEngine::teardown() -> void {
    rs_log("ResilienceEngine::teardown", "Engine");
    this->componentCoordinator.teardown();
    this->glassCoordinator.teardown();
    this->effects.reset();
    this->diagnostics.teardown();
    this->observeHealth();
}

} // namespace RS
