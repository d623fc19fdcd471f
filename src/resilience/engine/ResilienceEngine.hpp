#pragma once
#include "config/ResilienceOptions.hpp"
#include "core/Clock.hpp"
#include "core/Failure.hpp"
#include "core/Renderable.hpp"
#include "diagnostics/DiagnosticLedger.hpp"
#include "glass/GlassEffects.hpp"
#include "glass/GlassResourceValidator.hpp"
#include "health/SystemHealthAggregator.hpp"
#include "host/HostEnvironment.hpp"
#include "recovery/RecoveryCoordinator.hpp"
#include "resource/ResourceCatalogValidator.hpp"
#include "task/Executor.hpp"
#include "task/MainScheduler.hpp"
#include "task/TaskPool.hpp"

#include <cstddef>
#include <exception>
#include <functional>
#include <memory>
#include <optional>
#include <span>
#include <string_view>
#include <vector>

namespace RS {

struct SystemStatus {
    SystemHealth                               health;
    SystemTier                                 preflightTier  = SystemTier::Normal;
    GlassTier                                  glassTier      = GlassTier::Full;
    bool                                       glassAvailable = true;
    std::vector<ComponentState<ComponentTier>> components;
    std::vector<ComponentState<GlassTier>>     glassSurfaces;
};

struct SystemRecovery {
    RecoverySummary components;
    RecoverySummary glass;
    SystemHealth    before;
    SystemHealth    after;

    [[nodiscard]] auto anyRecovered() const -> bool { return this->components.anyRecovered() || this->glass.anyRecovered(); }
};

/**
 * ResilienceEngine — everything one host scope needs, wired together.
 *
 * Owns the validators, the diagnostic ledger, the generic and glass
 * coordinators, the glass effect controller and the health aggregator.
 * Background enrichment runs on an owned TaskPool unless an Executor is
 * injected. Delayed retries are queued on the engine's MainScheduler; the
 * host calls pump() from its UI loop to run them.
 *
 * No entry point throws. Destroying the engine (or calling teardown()) makes
 * pending retries and late enrichment results no-ops.
 */
class ResilienceEngine {
public:
    ResilienceEngine(ResourceEnvironment const& resources,
                     HostEnvironment&           host,
                     ResilienceOptions          options = {},
                     Clock const&               clock   = SystemClock::Instance());
    ResilienceEngine(ResourceEnvironment const& resources,
                     HostEnvironment&           host,
                     Executor&                  executor,
                     ResilienceOptions          options = {},
                     Clock const&               clock   = SystemClock::Instance());
    ~ResilienceEngine();

    ResilienceEngine(ResilienceEngine const&)                    = delete;
    auto operator=(ResilienceEngine const&) -> ResilienceEngine& = delete;

    auto onFailure(std::string_view componentId, Failure const& failure, RetryFn retry = {}) -> Renderable;
    auto onFailure(std::string_view componentId, std::exception_ptr const& error, RetryFn retry = {}) -> Renderable;
    auto onGlassFailure(std::string_view componentId, Failure const& failure, RetryFn retry = {}) -> Renderable;
    auto onGlassFailure(std::string_view componentId, std::exception_ptr const& error, RetryFn retry = {}) -> Renderable;

    // True when either coordinator tracked the component.
    auto markRecovered(std::string_view componentId) -> bool;

    [[nodiscard]] auto validate() const -> ValidationReport;
    [[nodiscard]] auto validate(std::span<ResourceDescriptor const> descriptors) const -> ValidationReport;
    [[nodiscard]] auto validateAll() const -> GlassValidation;
    [[nodiscard]] auto preflightTier() const -> SystemTier;

    [[nodiscard]] auto systemHealth() const -> SystemHealth;
    auto systemStatus() -> SystemStatus;
    [[nodiscard]] auto diagnosticReport() const -> DiagnosticReport;
    [[nodiscard]] auto diagnosticReport(std::size_t recentLimit) const -> DiagnosticReport;

    auto attemptSystemRecovery() -> SystemRecovery;

    // Runs due delayed retries on the calling thread.
    auto pump() -> std::size_t;

    auto setReplacementSink(std::function<void(Renderable)> sink) -> void;
    auto teardown() -> void;

    [[nodiscard]] auto options() const -> ResilienceOptions const& { return this->config; }
    [[nodiscard]] auto ledger() -> DiagnosticLedger& { return this->diagnostics; }
    [[nodiscard]] auto ledger() const -> DiagnosticLedger const& { return this->diagnostics; }
    [[nodiscard]] auto glassEffects() -> GlassEffects& { return this->effects; }
    [[nodiscard]] auto glassEffects() const -> GlassEffects const& { return this->effects; }
    [[nodiscard]] auto components() -> ComponentCoordinator& { return this->componentCoordinator; }
    [[nodiscard]] auto components() const -> ComponentCoordinator const& { return this->componentCoordinator; }
    [[nodiscard]] auto glass() -> GlassCoordinator& { return this->glassCoordinator; }
    [[nodiscard]] auto glass() const -> GlassCoordinator const& { return this->glassCoordinator; }
    [[nodiscard]] auto scheduler() -> MainScheduler& { return this->mainScheduler; }

private:
    ResilienceEngine(ResourceEnvironment const& resources, HostEnvironment& host, Executor* executor, ResilienceOptions options, Clock const& clock);

    auto wire() -> void;
    auto observeHealth() -> void;

    ResilienceOptions const   config;
    Clock const&              clock;
    HostEnvironment&          host;
    std::unique_ptr<TaskPool> ownedPool;
    Executor&                 executor;
    MainScheduler             mainScheduler;
    ResourceCatalogValidator  resourceValidator;
    GlassResourceValidator    glassValidator;
    DiagnosticLedger          diagnostics;
    GlassEffects              effects;
    ComponentCoordinator      componentCoordinator;
    GlassCoordinator          glassCoordinator;
    SystemHealthAggregator    aggregator;
};

} // namespace RS
