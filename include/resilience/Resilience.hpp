#pragma once
// Umbrella header for embedding the resilience engine in a host application.

#include "config/ResilienceOptions.hpp"
#include "core/Clock.hpp"
#include "core/Error.hpp"
#include "core/Failure.hpp"
#include "core/Renderable.hpp"
#include "core/Tier.hpp"
#include "diagnostics/DiagnosticJson.hpp"
#include "diagnostics/DiagnosticLedger.hpp"
#include "engine/EngineJson.hpp"
#include "engine/ResilienceEngine.hpp"
#include "gate/TransactionSafetyGate.hpp"
#include "glass/GlassEffects.hpp"
#include "glass/GlassResourceValidator.hpp"
#include "health/SystemHealthAggregator.hpp"
#include "host/HostEnvironment.hpp"
#include "recovery/RecoveryCoordinator.hpp"
#include "resource/ResourceCatalogValidator.hpp"
#include "resource/SettingsCatalog.hpp"
