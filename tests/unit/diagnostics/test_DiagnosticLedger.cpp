#include <doctest/doctest.h>
#include "ResilienceTestHelper.hpp"
#include "diagnostics/DiagnosticLedger.hpp"
#include "task/TaskPool.hpp"

#include <memory>
#include <string>

using namespace RS;
using namespace std::chrono_literals;

namespace {

template <typename ExecutorT>
struct LedgerFixture {
    FakeResources            resources;
    FakeHost                 host;
    ManualClock              clock;
    ExecutorT                executor;
    ResourceCatalogValidator validator{resources};

    auto makeLedger(LedgerOptions options = {}) -> std::unique_ptr<DiagnosticLedger> {
        return std::make_unique<DiagnosticLedger>(this->executor, this->clock, this->validator, this->host, std::move(options));
    }
};

auto runtimeFailure(std::string message) -> Failure {
    return Failure::Make(Failure::Type::Runtime, std::move(message));
}

} // namespace

TEST_SUITE("diagnostics.ledger") {

TEST_CASE("record_is_visible_before_enrichment") {
    LedgerFixture<DeferredExecutor> fx;
    auto                            ledger = fx.makeLedger();

    auto id = ledger->recordFailure(runtimeFailure("inflate failed"), "componentFailure:MenuContainer", "MenuContainer");
    CHECK(id == "crash_1700000000000_1");
    CHECK(fx.executor.queued() == 1);

    auto record = ledger->record(id);
    REQUIRE(record.has_value());
    CHECK(record->enrichment == EnrichmentState::Pending);
    CHECK(record->message == "inflate failed");
    CHECK(record->context == "componentFailure:MenuContainer");
    CHECK(record->componentId == std::optional<std::string>{"MenuContainer"});
    CHECK_FALSE(record->device.has_value());
    CHECK_FALSE(record->resources.has_value());
}

TEST_CASE("enrichment_fills_snapshots") {
    LedgerFixture<DeferredExecutor> fx;
    fx.resources.markMissing("focus");
    auto ledger = fx.makeLedger();

    ledger->updateComponentState("GlassCard", "REDUCED", {{"previous", "NORMAL"}});
    auto id = ledger->recordFailure(runtimeFailure("blur failed"), "glassComponentInitialization:GlassCard", "GlassCard");
    CHECK(fx.executor.runAll() == 1);

    auto record = ledger->record(id);
    REQUIRE(record.has_value());
    CHECK(record->enrichment == EnrichmentState::Complete);
    REQUIRE(record->device.has_value());
    CHECK(record->device->model == "Box 4K");
    REQUIRE(record->environment.has_value());
    CHECK_FALSE(record->environment->hostFinishing);
    REQUIRE(record->resources.has_value());
    CHECK(record->resources->missing(ResourceKind::Color) == std::vector<std::string>{"focus"});
    REQUIRE(record->component.has_value());
    CHECK(record->component->state == "REDUCED");
    CHECK(ledger->waitForEnrichment(0ms));
}

TEST_CASE("empty_message_and_classification") {
    LedgerFixture<InlineExecutor> fx;
    auto                          ledger = fx.makeLedger();

    auto id     = ledger->recordFailure(runtimeFailure(""), "componentFailure:SettingsPanel", "SettingsPanel");
    auto record = ledger->record(id);
    REQUIRE(record.has_value());
    CHECK(record->message == "No message");
    CHECK(record->classification == CrashClass::DomainSpecificError);
    CHECK(record->errorType == "runtime");

    auto missing = ledger->record(ledger->recordFailure(Failure::MissingResource("glass_border"), "validation"));
    REQUIRE(missing.has_value());
    CHECK(missing->classification == CrashClass::ResourceNotFound);
    CHECK(missing->resourceName == std::optional<std::string>{"glass_border"});
    CHECK_FALSE(missing->componentId.has_value());
}

TEST_CASE("capacity_evicts_oldest") {
    LedgerFixture<InlineExecutor> fx;
    auto                          ledger = fx.makeLedger();
    CHECK(ledger->capacity() == 50);

    std::vector<std::string> ids;
    for (int i = 0; i < 55; ++i) {
        ids.push_back(ledger->recordFailure(runtimeFailure("failure " + std::to_string(i)), "test"));
        fx.clock.advance(1ms);
    }

    CHECK(ledger->size() == 50);
    for (int i = 0; i < 5; ++i) {
        CHECK_FALSE(ledger->record(ids[i]).has_value());
    }
    CHECK(ledger->record(ids[5]).has_value());

    auto records = ledger->records();
    REQUIRE(records.size() == 50);
    CHECK(records.front().id == ids.back());
    CHECK(records.back().id == ids[5]);
}

TEST_CASE("equal_timestamps_evict_in_insertion_order") {
    LedgerFixture<InlineExecutor> fx;
    auto                          ledger = fx.makeLedger(LedgerOptions{.capacity = 2, .domainKeyword = "settings"});

    auto first  = ledger->recordFailure(runtimeFailure("a"), "test");
    auto second = ledger->recordFailure(runtimeFailure("b"), "test");
    auto third  = ledger->recordFailure(runtimeFailure("c"), "test");

    CHECK_FALSE(ledger->record(first).has_value());
    CHECK(ledger->record(second).has_value());
    CHECK(ledger->record(third).has_value());
    CHECK(ledger->records().front().id == third);
}

TEST_CASE("refused_enrichment_marks_record_failed") {
    LedgerFixture<RefusingExecutor> fx;
    auto                            ledger = fx.makeLedger();

    auto id     = ledger->recordFailure(runtimeFailure("late"), "test");
    auto record = ledger->record(id);
    REQUIRE(record.has_value());
    CHECK(record->enrichment == EnrichmentState::Failed);
    REQUIRE(record->enrichmentError.has_value());
    CHECK(record->enrichmentError->find("shutting_down") != std::string::npos);
}

TEST_CASE("throwing_executor_marks_record_failed") {
    LedgerFixture<ThrowingExecutor> fx;
    auto                            ledger = fx.makeLedger();

    std::string id;
    CHECK_NOTHROW(id = ledger->recordFailure(runtimeFailure("x"), "test"));
    auto record = ledger->record(id);
    REQUIRE(record.has_value());
    CHECK(record->enrichment == EnrichmentState::Failed);
    CHECK(record->enrichmentError == std::optional<std::string>{"unknown_error:submit threw a non-standard exception"});
}

TEST_CASE("throwing_host_marks_enrichment_failed") {
    LedgerFixture<InlineExecutor> fx;
    fx.host.deviceThrows = true;
    auto ledger          = fx.makeLedger();

    auto record = ledger->record(ledger->recordFailure(runtimeFailure("x"), "test"));
    REQUIRE(record.has_value());
    CHECK(record->enrichment == EnrichmentState::Failed);
    CHECK(record->enrichmentError == std::optional<std::string>{"Enrichment failed: device query failed"});
    CHECK(record->environment.has_value());
    CHECK_FALSE(record->device.has_value());

    auto report = ledger->report();
    CHECK_FALSE(report.device.has_value());
    CHECK(report.summary.totalCrashes == 1);
}

TEST_CASE("recovery_attempts_attach_to_records") {
    LedgerFixture<InlineExecutor> fx;
    auto                          ledger = fx.makeLedger();

    auto id = ledger->recordFailure(runtimeFailure("x"), "test");
    CHECK(ledger->recordRecoveryAttempt(id, "RETRY_WITH_STATE_LOSS", false, "retry threw"));
    CHECK_FALSE(ledger->record(id)->recovered());
    CHECK(ledger->recordRecoveryAttempt(id, "FALLBACK", true));
    CHECK(ledger->record(id)->recovered());
    CHECK(ledger->record(id)->recoveryAttempts.size() == 2);
    CHECK_FALSE(ledger->recordRecoveryAttempt("crash_0_999", "FALLBACK", true));
}

TEST_CASE("component_state_upserts") {
    LedgerFixture<InlineExecutor> fx;
    auto                          ledger = fx.makeLedger();

    ledger->updateComponentState("ModernToggleSwitch", "REDUCED");
    fx.clock.advance(5ms);
    ledger->updateComponentState("ModernToggleSwitch", "FALLBACK", {{"retry_count", "2"}});
    ledger->updateComponentState("GlassCard", "NORMAL");

    auto snapshot = ledger->componentSnapshot("ModernToggleSwitch");
    REQUIRE(snapshot.has_value());
    CHECK(snapshot->state == "FALLBACK");
    CHECK(snapshot->details.at("retry_count") == "2");
    CHECK(snapshot->timestamp == fx.clock.now());

    auto all = ledger->componentSnapshots();
    REQUIRE(all.size() == 2);
    CHECK(all[0].componentId == "GlassCard");
    CHECK_FALSE(ledger->componentSnapshot("Unknown").has_value());
}

TEST_CASE("teardown_discards_pending_enrichment") {
    LedgerFixture<DeferredExecutor> fx;
    auto                            ledger = fx.makeLedger();

    ledger->recordFailure(runtimeFailure("x"), "test", "GlassCard");
    ledger->updateComponentState("GlassCard", "REDUCED");
    ledger->teardown();
    CHECK(ledger->size() == 0);
    CHECK(ledger->componentSnapshots().empty());

    fx.executor.runAll();
    CHECK(ledger->size() == 0);
    CHECK(ledger->records().empty());
}

TEST_CASE("queued_enrichment_after_destruction_is_a_no_op") {
    LedgerFixture<DeferredExecutor> fx;
    {
        auto ledger = fx.makeLedger();
        ledger->recordFailure(runtimeFailure("x"), "test");
        ledger->recordFailure(runtimeFailure("y"), "test");
    }
    CHECK(fx.executor.runAll() == 2);
}

TEST_CASE("background_enrichment_on_task_pool") {
    FakeResources            resources;
    FakeHost                 host;
    ManualClock              clock;
    TaskPool                 pool(2);
    ResourceCatalogValidator validator(resources);
    DiagnosticLedger         ledger(pool, clock, validator, host);

    for (int i = 0; i < 5; ++i) {
        ledger.recordFailure(runtimeFailure("bg " + std::to_string(i)), "test");
    }
    REQUIRE(ledger.waitForEnrichment(5s));
    for (auto const& record : ledger.records()) {
        CHECK(record.enrichment == EnrichmentState::Complete);
    }
}

TEST_CASE("report_lists_recent_newest_first") {
    LedgerFixture<InlineExecutor> fx;
    auto                          ledger = fx.makeLedger();

    for (int i = 0; i < 12; ++i) {
        ledger->recordFailure(runtimeFailure("failure " + std::to_string(i)), "test");
        fx.clock.advance(1ms);
    }
    auto report = ledger->report(10);
    CHECK(report.version == "1.0.0");
    CHECK(report.recent.size() == 10);
    CHECK(report.recent.front().message == "failure 11");
    CHECK(report.summary.totalCrashes == 12);
    CHECK(report.summary.recentCrashes == 10);
    CHECK(report.summary.mostCommon == CrashClass::Unknown);
    REQUIRE(report.device.has_value());
    CHECK(report.recommendations == std::vector<std::string>{"System appears stable - continue monitoring"});
}

TEST_CASE("recommendations_follow_findings") {
    LedgerFixture<InlineExecutor> fx;
    fx.resources.markMissing("focus");
    fx.resources.markMissing("white");
    fx.resources.markMissing("setting");
    auto ledger = fx.makeLedger();

    auto first = ledger->recordFailure(Failure::MissingResource("glass_border"), "test");
    ledger->recordFailure(Failure::MissingResource("toggle_padding"), "test");
    ledger->recordFailure(Failure::MissingResource("glass_border"), "test");
    for (int i = 0; i < 4; ++i) {
        ledger->recordRecoveryAttempt(first, "FALLBACK", false);
    }

    auto report = ledger->report();
    CHECK(report.summary.mostCommon == CrashClass::ResourceNotFound);
    CHECK(report.summary.averageRecoveryAttempts == doctest::Approx(4.0 / 3.0));
    CHECK(report.summary.successfulRecoveries == 0);

    auto const& recommendations = report.recommendations;
    REQUIRE(recommendations.size() == 3);
    CHECK(recommendations[0] == "Add missing layout resources: setting");
    CHECK(recommendations[1] == "Add missing color resources: focus, white");
    CHECK(recommendations[2] == "Add the resources reported missing at runtime: glass_border, toggle_padding");
}

TEST_CASE("class_specific_recommendations") {
    CrashSummary     summary;
    ValidationReport clean;

    summary.mostCommon = CrashClass::FragmentLifecycleError;
    CHECK(buildRecommendations(summary, clean, {}) == std::vector<std::string>{"Implement safer fragment lifecycle management"});

    summary.mostCommon = CrashClass::CustomComponentFailure;
    CHECK(buildRecommendations(summary, clean, {}) == std::vector<std::string>{"Add fallback mechanisms for custom UI components"});

    summary.mostCommon = CrashClass::MemoryError;
    CHECK(buildRecommendations(summary, clean, {}) == std::vector<std::string>{"Reduce memory pressure from visual effects"});

    summary.mostCommon              = CrashClass::Unknown;
    summary.averageRecoveryAttempts = 3.5;
    CHECK(buildRecommendations(summary, clean, {}) == std::vector<std::string>{"Improve error recovery strategies to reduce retry attempts"});
}

} // TEST_SUITE
