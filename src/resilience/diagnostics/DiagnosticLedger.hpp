#pragma once
#include "core/Clock.hpp"
#include "core/Failure.hpp"
#include "core/TransparentString.hpp"
#include "diagnostics/CrashRecord.hpp"
#include "host/HostEnvironment.hpp"
#include "resource/ResourceCatalogValidator.hpp"
#include "task/Executor.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <parallel_hashmap/phmap.h>

namespace RS {

struct LedgerOptions {
    std::size_t capacity      = 50;
    std::string domainKeyword = "settings";
};

/**
 * DiagnosticLedger — scope-owned store of crash records and live component
 * snapshots.
 *
 * recordFailure() classifies synchronously and makes the record visible at
 * once with empty snapshots; device info, environment state, a fresh
 * settings validation and the component's snapshot are gathered by a job
 * on the injected Executor. A failing job marks the record Failed and keeps
 * it. teardown() clears the store; jobs still in flight finish but their
 * results are dropped. The destructor waits for running jobs and turns
 * queued ones into no-ops.
 *
 * Eviction keeps at most `capacity` records, dropping the oldest by
 * timestamp with ties broken by insertion order.
 */
class DiagnosticLedger {
public:
    static constexpr std::string_view Version = "1.0.0";

    DiagnosticLedger(Executor& executor, Clock const& clock, ResourceCatalogValidator const& validator, HostEnvironment const& host, LedgerOptions options = {});
    ~DiagnosticLedger();

    DiagnosticLedger(DiagnosticLedger const&)                    = delete;
    auto operator=(DiagnosticLedger const&) -> DiagnosticLedger& = delete;

    auto recordFailure(Failure const& failure, std::string_view context, std::optional<std::string_view> componentId = std::nullopt) -> std::string;
    auto recordRecoveryAttempt(std::string_view recordId, std::string_view strategy, bool success, std::optional<std::string> detail = std::nullopt) -> bool;
    auto updateComponentState(std::string_view componentId, std::string_view stateName, std::map<std::string, std::string> details = {}) -> void;

    [[nodiscard]] auto report() const -> DiagnosticReport;
    [[nodiscard]] auto report(std::size_t recentLimit) const -> DiagnosticReport;

    [[nodiscard]] auto record(std::string_view recordId) const -> std::optional<CrashRecord>;
    [[nodiscard]] auto records() const -> std::vector<CrashRecord>;
    [[nodiscard]] auto size() const -> std::size_t;
    [[nodiscard]] auto capacity() const -> std::size_t { return this->options.capacity; }
    [[nodiscard]] auto componentSnapshot(std::string_view componentId) const -> std::optional<ComponentSnapshot>;
    [[nodiscard]] auto componentSnapshots() const -> std::vector<ComponentSnapshot>;

    // Blocks until no record is Pending or the timeout expires.
    auto waitForEnrichment(std::chrono::milliseconds timeout) const -> bool;

    auto teardown() -> void;

private:
    using SnapshotMap = phmap::parallel_flat_hash_map<std::string,
                                                      ComponentSnapshot,
                                                      TransparentStringHash,
                                                      std::equal_to<>,
                                                      std::allocator<std::pair<const std::string, ComponentSnapshot>>,
                                                      4,
                                                      std::mutex>;

    // Shared with enrichment jobs so that a job queued behind the ledger's
    // destruction only ever touches this block.
    struct State {
        mutable std::mutex              mutex;
        mutable std::condition_variable changed;
        std::vector<CrashRecord>        records;
        std::uint64_t                   generation = 0;
        std::size_t                     running    = 0;
        bool                            closed     = false;
    };

    struct EnrichmentResult {
        std::optional<DeviceInfo>        device;
        std::optional<EnvironmentState>  environment;
        std::optional<ValidationReport>  resources;
        std::optional<ComponentSnapshot> component;
        std::optional<std::string>       error;
    };

    auto enrich(std::optional<std::string> const& componentId) const -> EnrichmentResult;
    auto submitEnrichment(std::string const& recordId, std::optional<std::string> componentId) -> void;
    auto evictLocked() -> void;
    auto nextRecordId(TimePoint timestamp) -> std::pair<std::string, std::uint64_t>;
    static auto applyEnrichment(State& state, std::uint64_t generation, std::string const& recordId, EnrichmentResult&& result) -> void;

    Executor&                       executor;
    Clock const&                    clock;
    ResourceCatalogValidator const& validator;
    HostEnvironment const&          host;
    LedgerOptions const             options;
    std::shared_ptr<State>          state;
    SnapshotMap                     snapshots;
    std::atomic<std::uint64_t>      sequence{0};
};

[[nodiscard]] auto summarizeCrashes(std::vector<CrashRecord> const& records, std::size_t recentCount) -> CrashSummary;
[[nodiscard]] auto buildRecommendations(CrashSummary const& summary, ValidationReport const& resources, std::vector<CrashRecord> const& records) -> std::vector<std::string>;

} // namespace RS
