#pragma once

#include "core/Error.hpp"

#include <cstddef>
#include <functional>
#include <optional>

namespace RS {

/**
 * Executor — interface for running background jobs off the caller's thread.
 *
 * Rationale
 * ---------
 * Diagnostic enrichment (device snapshots, resource re-validation) must
 * never block the UI thread that reported a failure. The ledger only
 * depends on this interface, so tests can substitute an inline or a
 * deliberately refusing executor.
 *
 * Contract
 * --------
 * - submit(...) returns std::nullopt when the job was accepted, or an Error
 *   on refusal (executor shutting down, queue limit reached). A refused job
 *   is never run.
 * - Jobs are expected to handle their own failures; an exception escaping a
 *   job is logged and counted by the implementation but otherwise ignored.
 * - shutdown() stops accepting jobs, lets in-flight jobs finish and drops
 *   the rest of the queue.
 * - size() returns an implementation-defined capacity (e.g. worker count).
 *
 * Thread-safety
 * -------------
 * Implementations must accept concurrent submit() calls and a shutdown()
 * racing with jobs still in flight.
 */
struct Executor {
    using Job = std::function<void()>;

    virtual ~Executor() = default;

    virtual auto submit(Job job) -> std::optional<Error> = 0;

    // Initiate shutdown (graceful if possible).
    virtual auto shutdown() -> void = 0;

    // Implementation-defined capacity/size (e.g., number of workers).
    virtual auto size() const -> std::size_t = 0;
};

} // namespace RS
