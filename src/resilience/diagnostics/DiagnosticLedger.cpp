#include "diagnostics/DiagnosticLedger.hpp"
#include "log/TaggedLogger.hpp"

#include <algorithm>
#include <exception>
#include <set>
#include <sstream>

namespace RS {
namespace {

auto newestFirst(CrashRecord const& lhs, CrashRecord const& rhs) -> bool {
    if (lhs.timestamp != rhs.timestamp) {
        return lhs.timestamp > rhs.timestamp;
    }
    return lhs.sequence > rhs.sequence;
}

auto oldestFirst(CrashRecord const& lhs, CrashRecord const& rhs) -> bool {
    if (lhs.timestamp != rhs.timestamp) {
        return lhs.timestamp < rhs.timestamp;
    }
    return lhs.sequence < rhs.sequence;
}

auto joinNames(std::vector<std::string> const& names) -> std::string {
    std::ostringstream oss;
    bool               first = true;
    for (auto const& name : names) {
        if (!first)
            oss << ", ";
        oss << name;
        first = false;
    }
    return oss.str();
}

} // namespace

auto enrichmentStateToString(EnrichmentState state) -> std::string_view {
    switch (state) {
    case EnrichmentState::Pending:
        return "pending";
    case EnrichmentState::Complete:
        return "complete";
    case EnrichmentState::Failed:
        return "failed";
    }
    return "failed";
}

DiagnosticLedger::DiagnosticLedger(Executor& executor, Clock const& clock, ResourceCatalogValidator const& validator, HostEnvironment const& host, LedgerOptions options)
    : executor(executor), clock(clock), validator(validator), host(host), options(std::move(options)), state(std::make_shared<State>()) {}

DiagnosticLedger::~DiagnosticLedger() {
    std::unique_lock<std::mutex> lock(this->state->mutex);
    this->state->closed = true;
    ++this->state->generation;
    this->state->changed.wait(lock, [this] { return this->state->running == 0; });
}

auto DiagnosticLedger::nextRecordId(TimePoint timestamp) -> std::pair<std::string, std::uint64_t> {
    auto const seq = this->sequence.fetch_add(1, std::memory_order_relaxed) + 1;
    return {"crash_" + std::to_string(toEpochMillis(timestamp)) + "_" + std::to_string(seq), seq};
}

auto DiagnosticLedger::recordFailure(Failure const& failure, std::string_view context, std::optional<std::string_view> componentId) -> std::string {
    auto const timestamp      = this->clock.now();
    auto [recordId, sequence] = this->nextRecordId(timestamp);

    CrashRecord record;
    record.id             = recordId;
    record.timestamp      = timestamp;
    record.sequence       = sequence;
    record.classification = classifyCrash(failure, context, this->options.domainKeyword);
    record.errorType      = failure.typeName;
    record.message        = failure.message.empty() ? std::string{"No message"} : failure.message;
    record.stackSummary   = failure.stackSummary;
    record.context        = std::string(context);
    record.resourceName   = failure.resourceName;
    if (componentId) {
        record.componentId = std::string(*componentId);
    }

    rs_log("Crash " + recordId + " [" + std::string(crashClassToString(record.classification)) + "] " + record.errorType + ": " + record.message + " (context " + record.context
                   + ")",
           "Ledger");

    {
        std::lock_guard<std::mutex> lock(this->state->mutex);
        this->state->records.push_back(std::move(record));
        this->evictLocked();
    }

    std::optional<std::string> owner;
    if (componentId) {
        owner = std::string(*componentId);
    }
    this->submitEnrichment(recordId, std::move(owner));
    return recordId;
}

auto DiagnosticLedger::evictLocked() -> void {
    auto& records = this->state->records;
    if (records.size() <= this->options.capacity) {
        return;
    }
    std::sort(records.begin(), records.end(), oldestFirst);
    auto const excess = records.size() - this->options.capacity;
    records.erase(records.begin(), records.begin() + static_cast<std::ptrdiff_t>(excess));
    rs_log("Evicted " + std::to_string(excess) + " crash record(s)", "Ledger");
}

auto DiagnosticLedger::submitEnrichment(std::string const& recordId, std::optional<std::string> componentId) -> void {
    std::uint64_t generation = 0;
    {
        std::lock_guard<std::mutex> lock(this->state->mutex);
        generation = this->state->generation;
    }

    auto shared = this->state;
    auto job    = [this, shared, generation, recordId, componentId = std::move(componentId)]() {
        {
            std::lock_guard<std::mutex> lock(shared->mutex);
            if (shared->closed || shared->generation != generation) {
                return;
            }
            ++shared->running;
        }
        applyEnrichment(*shared, generation, recordId, this->enrich(componentId));
    };

    std::optional<Error> refused;
    try {
        refused = this->executor.submit(std::move(job));
    } catch (std::exception const& error) {
        refused = Error{Error::Code::UnknownError, std::string{"submit threw: "} + error.what()};
    } catch (...) {
        refused = Error{Error::Code::UnknownError, "submit threw a non-standard exception"};
    }
    if (!refused) {
        return;
    }

    rs_log("Enrichment for " + recordId + " refused: " + describeError(*refused), "Ledger", "ERROR");
    std::lock_guard<std::mutex> lock(this->state->mutex);
    for (auto& record : this->state->records) {
        if (record.id == recordId) {
            record.enrichment      = EnrichmentState::Failed;
            record.enrichmentError = describeError(*refused);
        }
    }
    this->state->changed.notify_all();
}

auto DiagnosticLedger::enrich(std::optional<std::string> const& componentId) const -> EnrichmentResult {
    EnrichmentResult result;
    try {
        result.environment = this->host.environmentState();
        result.device      = this->host.deviceInfo();
        result.resources   = this->validator.validateSettings();
        if (componentId) {
            result.component = this->componentSnapshot(*componentId);
        }
    } catch (std::exception const& error) {
        result.error = std::string("Enrichment failed: ") + error.what();
    } catch (...) {
        result.error = std::string("Enrichment failed: non-standard exception");
    }
    return result;
}

auto DiagnosticLedger::applyEnrichment(State& state, std::uint64_t generation, std::string const& recordId, EnrichmentResult&& result) -> void {
    std::lock_guard<std::mutex> lock(state.mutex);
    --state.running;
    if (!state.closed && state.generation == generation) {
        for (auto& record : state.records) {
            if (record.id != recordId) {
                continue;
            }
            record.device      = std::move(result.device);
            record.environment = result.environment;
            record.resources   = std::move(result.resources);
            record.component   = std::move(result.component);
            if (result.error) {
                record.enrichment      = EnrichmentState::Failed;
                record.enrichmentError = std::move(result.error);
            } else {
                record.enrichment = EnrichmentState::Complete;
            }
            break;
        }
    }
    state.changed.notify_all();
}

auto DiagnosticLedger::recordRecoveryAttempt(std::string_view recordId, std::string_view strategy, bool success, std::optional<std::string> detail) -> bool {
    RecoveryAttempt attempt{std::string(strategy), success, std::move(detail), this->clock.now()};
    std::lock_guard<std::mutex> lock(this->state->mutex);
    for (auto& record : this->state->records) {
        if (record.id == recordId) {
            record.recoveryAttempts.push_back(std::move(attempt));
            rs_log("Recovery attempt for " + record.id + " - " + std::string(strategy) + (success ? " succeeded" : " failed"), "Ledger");
            return true;
        }
    }
    return false;
}

auto DiagnosticLedger::updateComponentState(std::string_view componentId, std::string_view stateName, std::map<std::string, std::string> details) -> void {
    ComponentSnapshot snapshot{std::string(componentId), std::string(stateName), this->clock.now(), std::move(details)};
    this->snapshots.try_emplace_l(
            snapshot.componentId,
            [&](auto& kv) { kv.second = snapshot; },
            snapshot);
    rs_log("Component state " + std::string(componentId) + ": " + std::string(stateName), "Ledger", "INFO");
}

auto DiagnosticLedger::componentSnapshot(std::string_view componentId) const -> std::optional<ComponentSnapshot> {
    std::optional<ComponentSnapshot> result;
    this->snapshots.if_contains(componentId, [&](auto const& kv) { result = kv.second; });
    return result;
}

auto DiagnosticLedger::componentSnapshots() const -> std::vector<ComponentSnapshot> {
    std::vector<ComponentSnapshot> result;
    this->snapshots.for_each([&](auto const& kv) { result.push_back(kv.second); });
    std::sort(result.begin(), result.end(), [](auto const& lhs, auto const& rhs) { return lhs.componentId < rhs.componentId; });
    return result;
}

auto DiagnosticLedger::record(std::string_view recordId) const -> std::optional<CrashRecord> {
    std::lock_guard<std::mutex> lock(this->state->mutex);
    for (auto const& record : this->state->records) {
        if (record.id == recordId) {
            return record;
        }
    }
    return std::nullopt;
}

auto DiagnosticLedger::records() const -> std::vector<CrashRecord> {
    std::vector<CrashRecord> copy;
    {
        std::lock_guard<std::mutex> lock(this->state->mutex);
        copy = this->state->records;
    }
    std::sort(copy.begin(), copy.end(), newestFirst);
    return copy;
}

auto DiagnosticLedger::size() const -> std::size_t {
    std::lock_guard<std::mutex> lock(this->state->mutex);
    return this->state->records.size();
}

auto DiagnosticLedger::waitForEnrichment(std::chrono::milliseconds timeout) const -> bool {
    std::unique_lock<std::mutex> lock(this->state->mutex);
    return this->state->changed.wait_for(lock, timeout, [this] {
        return std::none_of(this->state->records.begin(), this->state->records.end(), [](auto const& record) { return record.enrichment == EnrichmentState::Pending; });
    });
}

auto DiagnosticLedger::teardown() -> void {
    {
        std::lock_guard<std::mutex> lock(this->state->mutex);
        ++this->state->generation;
        this->state->records.clear();
        this->state->changed.notify_all();
    }
    this->snapshots.clear();
    rs_log("Ledger torn down", "Ledger");
}

auto DiagnosticLedger::report() const -> DiagnosticReport {
    return this->report(this->options.capacity);
}

auto DiagnosticLedger::report(std::size_t recentLimit) const -> DiagnosticReport {
    DiagnosticReport report;
    report.version   = std::string(Version);
    report.timestamp = this->clock.now();

    auto const all = this->records();
    auto const recentCount = std::min(recentLimit, all.size());
    report.recent.assign(all.begin(), all.begin() + static_cast<std::ptrdiff_t>(recentCount));
    report.summary    = summarizeCrashes(all, recentCount);
    report.components = this->componentSnapshots();
    report.resources  = this->validator.validateSettings();
    try {
        report.device = this->host.deviceInfo();
    } catch (std::exception const& error) {
        rs_log(std::string("Device info unavailable: ") + error.what(), "Ledger", "ERROR");
    }
    report.recommendations = buildRecommendations(report.summary, report.resources, all);

    rs_log("Diagnostic report - " + std::to_string(report.summary.totalCrashes) + " crashes, " + std::to_string(report.summary.successfulRecoveries) + " recovered", "Ledger");
    return report;
}

auto summarizeCrashes(std::vector<CrashRecord> const& records, std::size_t recentCount) -> CrashSummary {
    CrashSummary summary;
    summary.totalCrashes  = records.size();
    summary.recentCrashes = recentCount;

    std::size_t attempts = 0;
    for (auto const& record : records) {
        ++summary.countsByClass[record.classification];
        attempts += record.recoveryAttempts.size();
        if (record.recovered()) {
            ++summary.successfulRecoveries;
        }
    }
    std::size_t best = 0;
    for (auto const& [classification, count] : summary.countsByClass) {
        if (count > best) {
            best               = count;
            summary.mostCommon = classification;
        }
    }
    if (!records.empty()) {
        summary.averageRecoveryAttempts = static_cast<double>(attempts) / static_cast<double>(records.size());
    }
    return summary;
}

auto buildRecommendations(CrashSummary const& summary, ValidationReport const& resources, std::vector<CrashRecord> const& records) -> std::vector<std::string> {
    std::vector<std::string> recommendations;

    for (auto const kind : {ResourceKind::Visual, ResourceKind::Layout, ResourceKind::Color, ResourceKind::Dimension}) {
        auto const& missing = resources.missing(kind);
        if (!missing.empty()) {
            recommendations.push_back("Add missing " + std::string(resourceKindToString(kind)) + " resources: " + joinNames(missing));
        }
    }

    if (summary.mostCommon == CrashClass::ResourceNotFound) {
        std::set<std::string>    seen;
        std::vector<std::string> names;
        for (auto const& record : records) {
            if (record.classification == CrashClass::ResourceNotFound && record.resourceName && seen.insert(*record.resourceName).second) {
                names.push_back(*record.resourceName);
            }
        }
        if (!names.empty()) {
            recommendations.push_back("Add the resources reported missing at runtime: " + joinNames(names));
        }
    }
    if (summary.mostCommon == CrashClass::FragmentLifecycleError) {
        recommendations.emplace_back("Implement safer fragment lifecycle management");
    }
    if (summary.mostCommon == CrashClass::CustomComponentFailure) {
        recommendations.emplace_back("Add fallback mechanisms for custom UI components");
    }
    if (summary.mostCommon == CrashClass::MemoryError) {
        recommendations.emplace_back("Reduce memory pressure from visual effects");
    }
    if (summary.averageRecoveryAttempts > 3.0) {
        recommendations.emplace_back("Improve error recovery strategies to reduce retry attempts");
    }
    if (recommendations.empty()) {
        recommendations.emplace_back("System appears stable - continue monitoring");
    }
    return recommendations;
}

} // namespace RS
