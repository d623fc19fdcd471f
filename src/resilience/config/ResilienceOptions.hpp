#pragma once
#include "core/Error.hpp"
#include "diagnostics/DiagnosticLedger.hpp"
#include "health/SystemHealth.hpp"
#include "recovery/RecoveryCoordinator.hpp"

#include <cstddef>
#include <cstdint>
#include <iosfwd>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace RS {

struct ResilienceOptions {
    int          max_retry_attempts{3};
    int          glass_max_retry_attempts{3};
    std::int64_t retry_delay_ms{500};
    std::size_t  ledger_capacity{50};
    std::size_t  recent_limit{10};
    std::string  domain_keyword{"settings"};
    double       critical_failed_percent{50.0};
    double       emergency_percent{30.0};
    double       degraded_percent{10.0};
    std::size_t  enrichment_workers{1};
    std::size_t  enrichment_queue_limit{256};
    bool         show_help{false};
};

/**
 * Configuration layers, lowest precedence first: built-in defaults, a JSON
 * document (--config), RESILIENCE_* environment variables, command line.
 *
 * Environment variables:
 *   RESILIENCE_MAX_RETRIES, RESILIENCE_GLASS_MAX_RETRIES, RESILIENCE_RETRY_DELAY_MS,
 *   RESILIENCE_LEDGER_CAPACITY, RESILIENCE_RECENT_LIMIT, RESILIENCE_DOMAIN_KEYWORD,
 *   RESILIENCE_ENRICHMENT_WORKERS, RESILIENCE_ENRICHMENT_QUEUE_LIMIT,
 *   RESILIENCE_CRITICAL_PERCENT, RESILIENCE_EMERGENCY_PERCENT, RESILIENCE_DEGRADED_PERCENT
 */
auto ApplyResilienceEnvOverrides(ResilienceOptions& options) -> bool;

auto ValidateResilienceOptions(ResilienceOptions const& options) -> std::optional<std::string>;

// Keys mirror the field names; thresholds live under "health". Unknown keys are rejected.
auto ParseResilienceOptionsJson(std::string_view document, ResilienceOptions base = {}) -> Expected<ResilienceOptions>;
auto LoadResilienceOptionsFile(std::string const& path, ResilienceOptions base = {}) -> Expected<ResilienceOptions>;
auto SerializeResilienceOptions(ResilienceOptions const& options, int indent = 2) -> std::string;

// Arguments the parser does not know are appended to `unrecognized` when
// given, and rejected otherwise.
auto ParseResilienceArguments(int argc, char** argv, std::vector<std::string>* unrecognized = nullptr) -> std::optional<ResilienceOptions>;

void PrintResilienceUsage(std::ostream& out);

[[nodiscard]] auto ledgerOptionsFrom(ResilienceOptions const& options) -> LedgerOptions;
[[nodiscard]] auto coordinatorOptionsFrom(ResilienceOptions const& options) -> CoordinatorOptions;
[[nodiscard]] auto glassCoordinatorOptionsFrom(ResilienceOptions const& options) -> CoordinatorOptions;
[[nodiscard]] auto healthThresholdsFrom(ResilienceOptions const& options) -> HealthThresholds;

} // namespace RS
