#pragma once
#include "core/Clock.hpp"
#include "core/Failure.hpp"
#include "core/Renderable.hpp"
#include "core/Tier.hpp"
#include "core/TransparentString.hpp"
#include "diagnostics/DiagnosticLedger.hpp"
#include "gate/TransactionSafetyGate.hpp"
#include "health/SystemHealth.hpp"
#include "host/HostEnvironment.hpp"
#include "log/TaggedLogger.hpp"
#include "recovery/ComponentState.hpp"
#include "recovery/FallbackRecipes.hpp"
#include "recovery/RecoveryDomains.hpp"
#include "recovery/RetryClass.hpp"
#include "task/MainScheduler.hpp"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstddef>
#include <exception>
#include <functional>
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

struct CoordinatorOptions {
    int                       maxRetryAttempts = 3;
    std::chrono::milliseconds retryDelay       = DefaultRetryDelay;
};

/**
 * RecoveryCoordinator — per-component degradation state machine.
 *
 * Rationale
 * - One template serves every domain that degrades in steps (generic
 *   components, glass surfaces). The Domain policy supplies the tier scale
 *   and the fallback recipes; everything else is shared.
 *
 * Contract
 * - onFailure() records the failure, steps the component one tier down and
 *   always returns something renderable. Retries are bounded by
 *   maxRetryAttempts per component until markRecovered() or
 *   attemptSystemRecovery() resets the counter.
 * - When the host reports that the UI tree may not be mutated, no retry is
 *   attempted and the returned placeholder does not mutate the tree.
 * - A delayed retry (NotAttached) answers with an interim fallback; its own
 *   result is delivered later through the replacement sink, on the thread
 *   that pumps the MainScheduler.
 * - attemptSystemRecovery() only ever promotes.
 *
 * Thread-safety
 * - Decisions are expected on the host's UI thread, but concurrent
 *   onFailure() calls for different ids are safe: the state map is a
 *   parallel map with mutex-guarded submaps and every entry carries its own
 *   atomic retry counter and field lock.
 * - teardown() must not race with onFailure().
 */
template <typename Domain>
class RecoveryCoordinator {
public:
    using Tier            = typename Domain::Tier;
    using State           = ComponentState<Tier>;
    using ReplacementSink = std::function<void(Renderable)>;
    using TierListener    = std::function<void(std::string const& componentId, Tier previous, Tier next)>;
    // Best tier the resources currently support; nullopt means "do not promote".
    using Revalidator = std::function<std::optional<Tier>()>;

    RecoveryCoordinator(DiagnosticLedger& ledger, HostEnvironment& host, MainScheduler& scheduler, Clock const& clock, CoordinatorOptions options = {})
        : ledger(ledger), host(host), scheduler(scheduler), clock(clock), options(options), lifetime(std::make_shared<Lifetime>()) {}

    ~RecoveryCoordinator() { this->retire(); }

    RecoveryCoordinator(RecoveryCoordinator const&)                    = delete;
    auto operator=(RecoveryCoordinator const&) -> RecoveryCoordinator& = delete;

    auto onFailure(std::string_view componentId, Failure const& failure, RetryFn retry = {}) -> Renderable {
        try {
            return this->handleFailure(componentId, failure, std::move(retry));
        } catch (std::exception const& error) {
            rs_log(std::string{"RecoveryCoordinator::onFailure internal error for "}.append(componentId).append(": ").append(error.what()),
                   "Recovery",
                   "ERROR");
            return emergencyFallback(componentId);
        } catch (...) {
            rs_log(std::string{"RecoveryCoordinator::onFailure non-standard exception for "}.append(componentId), "Recovery", "ERROR");
            return emergencyFallback(componentId);
        }
    }

    // The caller initialized the component successfully; it returns to the top tier.
    auto markRecovered(std::string_view componentId) -> bool {
        Entry* entry = this->find(componentId);
        if (entry == nullptr) {
            return false;
        }
        Tier previous = TierTraits<Tier>::Top;
        {
            std::lock_guard<std::mutex> lock(entry->mutex);
            previous           = entry->tier;
            entry->tier        = TierTraits<Tier>::Top;
            entry->recoverable = true;
            entry->lastError.reset();
            entry->timestamp = this->clock.now();
        }
        entry->retryCount.store(0, std::memory_order_release);
        this->ledger.updateComponentState(componentId,
                                          tierName(TierTraits<Tier>::Top),
                                          {{"domain", std::string{Domain::Name}}, {"previous", std::string{tierName(previous)}}, {"reason", "recovered"}});
        this->notifyTierChange(std::string{componentId}, previous, TierTraits<Tier>::Top);
        return true;
    }

    /**
     * Resets the retry budget of every recoverable component and promotes it
     * to the tier the revalidator reports, when that tier is better than the
     * current one. Failed components are skipped. No UI callback is invoked.
     */
    auto attemptSystemRecovery() -> RecoverySummary {
        RecoverySummary summary;
        std::optional<Tier> ceiling;
        Revalidator         revalidate;
        {
            std::lock_guard<std::mutex> lock(this->hooksMutex);
            revalidate = this->revalidator;
        }
        if (revalidate) {
            try {
                ceiling = revalidate();
            } catch (std::exception const& error) {
                rs_log(std::string{"RecoveryCoordinator revalidation failed: "} + error.what(), "Recovery", "ERROR");
                summary.revalidationFailed = true;
            } catch (...) {
                rs_log("RecoveryCoordinator revalidation threw a non-standard exception", "Recovery", "ERROR");
                summary.revalidationFailed = true;
            }
        }

        for (auto const& [componentId, entry] : this->snapshotEntries()) {
            Tier previous = TierTraits<Tier>::Top;
            bool promoted = false;
            {
                std::lock_guard<std::mutex> lock(entry->mutex);
                if (!entry->recoverable) {
                    ++summary.skipped;
                    continue;
                }
                ++summary.considered;
                previous = entry->tier;
                if (ceiling && moreCapable(*ceiling, entry->tier)) {
                    entry->tier      = *ceiling;
                    entry->timestamp = this->clock.now();
                    promoted         = true;
                }
            }
            entry->retryCount.store(0, std::memory_order_release);
            if (!promoted) {
                ++summary.unchanged;
                continue;
            }
            ++summary.promoted;
            this->ledger.updateComponentState(componentId,
                                              tierName(*ceiling),
                                              {{"domain", std::string{Domain::Name}}, {"previous", std::string{tierName(previous)}}, {"reason", "system_recovery"}});
            this->notifyTierChange(componentId, previous, *ceiling);
        }
        rs_log("RecoveryCoordinator<" + std::string{Domain::Name} + ">::attemptSystemRecovery promoted=" + std::to_string(summary.promoted)
                       + " considered=" + std::to_string(summary.considered),
               "Recovery");
        return summary;
    }

    [[nodiscard]] auto state(std::string_view componentId) const -> std::optional<State> {
        Entry* entry = this->find(componentId);
        if (entry == nullptr) {
            return std::nullopt;
        }
        return this->snapshot(std::string{componentId}, *entry);
    }

    // Sorted by component id.
    [[nodiscard]] auto states() const -> std::vector<State> {
        std::vector<State> result;
        for (auto const& [componentId, entry] : this->snapshotEntries()) {
            result.push_back(this->snapshot(componentId, *entry));
        }
        return result;
    }

    // Untracked components are at the top tier.
    [[nodiscard]] auto tier(std::string_view componentId) const -> Tier {
        Entry* entry = this->find(componentId);
        if (entry == nullptr) {
            return TierTraits<Tier>::Top;
        }
        std::lock_guard<std::mutex> lock(entry->mutex);
        return entry->tier;
    }

    [[nodiscard]] auto views() const -> std::vector<TierView> {
        std::vector<TierView> result;
        for (auto const& [componentId, entry] : this->snapshotEntries()) {
            std::lock_guard<std::mutex> lock(entry->mutex);
            result.push_back(TierView{componentId, toComponentTier(entry->tier), entry->recoverable});
        }
        return result;
    }

    [[nodiscard]] auto size() const -> std::size_t { return this->entries.size(); }
    [[nodiscard]] auto coordinatorOptions() const -> CoordinatorOptions const& { return this->options; }

    auto setReplacementSink(ReplacementSink sink) -> void {
        std::lock_guard<std::mutex> lock(this->hooksMutex);
        this->sink = std::move(sink);
    }

    auto setTierListener(TierListener listener) -> void {
        std::lock_guard<std::mutex> lock(this->hooksMutex);
        this->listener = std::move(listener);
    }

    auto setRevalidator(Revalidator revalidator) -> void {
        std::lock_guard<std::mutex> lock(this->hooksMutex);
        this->revalidator = std::move(revalidator);
    }

    // Cancels pending delayed retries and forgets every component.
    auto teardown() -> void {
        this->retire();
        this->lifetime = std::make_shared<Lifetime>();
        this->entries.clear();
        rs_log("RecoveryCoordinator<" + std::string{Domain::Name} + ">::teardown", "Recovery");
    }

private:
    struct Entry {
        mutable std::mutex         mutex;
        std::atomic<int>           retryCount{0};
        Tier                       tier = TierTraits<Tier>::Top;
        std::optional<std::string> lastError;
        TimePoint                  timestamp{};
        bool                       recoverable = true;
    };

    // Shared with scheduled callbacks; a retired lifetime turns them into no-ops.
    struct Lifetime {
        std::atomic<bool> destroyed{false};
    };

    using EntryMap = phmap::parallel_node_hash_map<std::string,
                                                   std::unique_ptr<Entry>,
                                                   TransparentStringHash,
                                                   std::equal_to<>,
                                                   std::allocator<std::pair<const std::string, std::unique_ptr<Entry>>>,
                                                   4,
                                                   std::mutex>;

    struct RetryOutcome {
        std::optional<Renderable>  renderable;
        std::optional<std::string> error;
    };

    auto handleFailure(std::string_view componentId, Failure const& failure, RetryFn retry) -> Renderable {
        auto const retryClass = classifyRetry(failure);
        auto const strategy   = strategyFor(retryClass);
        std::string const id{componentId};

        Entry&    entry   = this->upsert(id);
        int const attempt = entry.retryCount.fetch_add(1, std::memory_order_acq_rel) + 1;
        Tier      previous = TierTraits<Tier>::Top;
        Tier      next     = previous;
        {
            std::lock_guard<std::mutex> lock(entry.mutex);
            previous          = entry.tier;
            next              = degrade(previous);
            entry.tier        = next;
            entry.lastError   = failure.message;
            entry.timestamp   = this->clock.now();
            entry.recoverable = !isBottom(next);
        }
        rs_log("RecoveryCoordinator<" + std::string{Domain::Name} + "> " + id + " " + std::string{tierName(previous)} + " -> " + std::string{tierName(next)}
                       + " attempt=" + std::to_string(attempt) + " class=" + std::string{retryClassToString(retryClass)},
               "Recovery");

        this->ledger.updateComponentState(id,
                                          tierName(next),
                                          {{"domain", std::string{Domain::Name}},
                                           {"previous", std::string{tierName(previous)}},
                                           {"retry_count", std::to_string(attempt)},
                                           {"retry_class", std::string{retryClassToString(retryClass)}}});
        if (previous != next) {
            this->notifyTierChange(id, previous, next);
        }
        std::string const context  = std::string{Domain::FailureContext} + ":" + id;
        std::string const recordId = this->ledger.recordFailure(failure, context, id);

        auto const decision = TransactionSafetyGate::evaluate(this->host.environmentState());
        if (decision.verdict == CommitVerdict::Unsafe) {
            this->ledger.recordRecoveryAttempt(recordId, "BLOCKED_UNSAFE_COMMIT", false, decision.reason);
            return Renderable::Placeholder(id, id + " unavailable");
        }

        if (retry && attempt <= this->options.maxRetryAttempts) {
            if (auto retried = this->runStrategy(strategy, id, recordId, retry, decision)) {
                return std::move(*retried);
            }
        }

        auto fallback = Domain::synthesize(id, next);
        this->ledger.recordRecoveryAttempt(recordId, "FALLBACK", true, std::string{"tier "}.append(tierName(next)));
        return fallback;
    }

    auto runStrategy(RecoveryStrategy strategy, std::string const& componentId, std::string const& recordId, RetryFn& retry, GateDecision const& decision)
            -> std::optional<Renderable> {
        auto const strategyName = recoveryStrategyToString(strategy);
        switch (strategy) {
        case RecoveryStrategy::RetryWithStateLoss: {
            auto outcome = this->invoke(retry);
            if (!outcome.renderable) {
                this->ledger.recordRecoveryAttempt(recordId, strategyName, false, outcome.error.value_or("retry produced nothing"));
                return std::nullopt;
            }
            this->ledger.recordRecoveryAttempt(recordId,
                                               strategyName,
                                               true,
                                               decision.verdict == CommitVerdict::AllowLossyCommit ? "committed allowing state loss" : "committed");
            return this->asRetried(componentId, std::move(*outcome.renderable));
        }
        case RecoveryStrategy::RetryAfterDelay:
            this->scheduleRetry(componentId, recordId, std::move(retry));
            return std::nullopt;
        case RecoveryStrategy::ForceCleanup: {
            bool                       released = false;
            std::optional<std::string> detail;
            try {
                released = this->host.releaseRegistration(componentId);
                detail   = released ? "registration released" : "nothing registered";
            } catch (std::exception const& error) {
                detail = std::string{"release failed: "} + error.what();
            } catch (...) {
                detail = "release failed: non-standard exception";
            }
            this->ledger.recordRecoveryAttempt(recordId, strategyName, released, std::move(detail));
            return std::nullopt;
        }
        case RecoveryStrategy::Abort:
            this->ledger.recordRecoveryAttempt(recordId, strategyName, false, "no retry strategy for this failure");
            return std::nullopt;
        }
        return std::nullopt;
    }

    auto scheduleRetry(std::string const& componentId, std::string const& recordId, RetryFn retry) -> void {
        auto guard  = this->lifetime;
        auto ticket = this->scheduler.scheduleAfter(this->options.retryDelay, [this, guard, componentId, recordId, retry = std::move(retry)]() mutable {
            if (guard->destroyed.load(std::memory_order_acquire)) {
                return;
            }
            this->runDelayedRetry(componentId, recordId, retry);
        });
        std::lock_guard<std::mutex> lock(this->ticketsMutex);
        this->tickets.push_back(ticket);
    }

    auto runDelayedRetry(std::string const& componentId, std::string const& recordId, RetryFn& retry) -> void {
        auto const strategyName = recoveryStrategyToString(RecoveryStrategy::RetryAfterDelay);
        auto const decision     = TransactionSafetyGate::evaluate(this->host.environmentState());
        if (decision.verdict == CommitVerdict::Unsafe) {
            this->ledger.recordRecoveryAttempt(recordId, strategyName, false, decision.reason);
            return;
        }
        auto outcome = this->invoke(retry);
        if (!outcome.renderable) {
            this->ledger.recordRecoveryAttempt(recordId, strategyName, false, outcome.error.value_or("retry produced nothing"));
            return;
        }
        this->ledger.recordRecoveryAttempt(recordId, strategyName, true, "delivered after delay");

        ReplacementSink deliver;
        {
            std::lock_guard<std::mutex> lock(this->hooksMutex);
            deliver = this->sink;
        }
        if (!deliver) {
            rs_log("RecoveryCoordinator delayed retry for " + componentId + " succeeded with no replacement sink", "Recovery", "WARN");
            return;
        }
        try {
            deliver(this->asRetried(componentId, std::move(*outcome.renderable)));
        } catch (std::exception const& error) {
            rs_log("RecoveryCoordinator replacement sink threw for " + componentId + ": " + error.what(), "Recovery", "ERROR");
        } catch (...) {
            rs_log("RecoveryCoordinator replacement sink threw a non-standard exception for " + componentId, "Recovery", "ERROR");
        }
    }

    auto invoke(RetryFn& retry) -> RetryOutcome {
        RetryOutcome outcome;
        try {
            outcome.renderable = retry();
            if (!outcome.renderable) {
                outcome.error = "retry produced nothing";
            }
        } catch (std::exception const& error) {
            outcome.error = std::string{"retry threw: "} + error.what();
        } catch (...) {
            outcome.error = "retry threw a non-standard exception";
        }
        return outcome;
    }

    auto asRetried(std::string const& componentId, Renderable renderable) const -> Renderable {
        if (renderable.componentId.empty()) {
            renderable.componentId = componentId;
        }
        renderable.origin = Renderable::Origin::Retried;
        return renderable;
    }

    auto upsert(std::string const& componentId) -> Entry& {
        auto   fresh  = std::make_unique<Entry>();
        Entry* result = fresh.get();
        this->entries.try_emplace_l(componentId, [&result](auto& kv) { result = kv.second.get(); }, std::move(fresh));
        return *result;
    }

    auto find(std::string_view componentId) const -> Entry* {
        Entry* result = nullptr;
        this->entries.if_contains(componentId, [&result](auto const& kv) { result = kv.second.get(); });
        return result;
    }

    auto snapshotEntries() const -> std::vector<std::pair<std::string, Entry*>> {
        std::vector<std::pair<std::string, Entry*>> result;
        this->entries.for_each([&result](auto const& kv) { result.emplace_back(kv.first, kv.second.get()); });
        std::sort(result.begin(), result.end(), [](auto const& lhs, auto const& rhs) { return lhs.first < rhs.first; });
        return result;
    }

    auto snapshot(std::string componentId, Entry const& entry) const -> State {
        State state;
        state.componentId = std::move(componentId);
        state.retryCount  = entry.retryCount.load(std::memory_order_acquire);
        std::lock_guard<std::mutex> lock(entry.mutex);
        state.tier        = entry.tier;
        state.lastError   = entry.lastError;
        state.timestamp   = entry.timestamp;
        state.recoverable = entry.recoverable;
        return state;
    }

    auto notifyTierChange(std::string const& componentId, Tier previous, Tier next) -> void {
        TierListener notify;
        {
            std::lock_guard<std::mutex> lock(this->hooksMutex);
            notify = this->listener;
        }
        if (!notify) {
            return;
        }
        try {
            notify(componentId, previous, next);
        } catch (std::exception const& error) {
            rs_log("RecoveryCoordinator tier listener threw for " + componentId + ": " + error.what(), "Recovery", "ERROR");
        }
    }

    auto retire() -> void {
        this->lifetime->destroyed.store(true, std::memory_order_release);
        std::vector<MainScheduler::Ticket> pending;
        {
            std::lock_guard<std::mutex> lock(this->ticketsMutex);
            pending.swap(this->tickets);
        }
        for (auto ticket : pending) {
            this->scheduler.cancel(ticket);
        }
    }

    DiagnosticLedger&                  ledger;
    HostEnvironment&                   host;
    MainScheduler&                     scheduler;
    Clock const&                       clock;
    CoordinatorOptions const           options;
    std::shared_ptr<Lifetime>          lifetime;
    EntryMap                           entries;
    mutable std::mutex                 hooksMutex;
    ReplacementSink                    sink;
    TierListener                       listener;
    Revalidator                        revalidator;
    std::mutex                         ticketsMutex;
    std::vector<MainScheduler::Ticket> tickets;
};

using ComponentCoordinator = RecoveryCoordinator<ComponentDomain>;
using GlassCoordinator     = RecoveryCoordinator<GlassDomain>;

} // namespace RS
