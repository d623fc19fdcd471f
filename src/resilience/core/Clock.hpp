#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>

namespace RS {

using TimePoint = std::chrono::system_clock::time_point;

/**
 * Clock — time source for timestamps and scheduled retries.
 *
 * Components never read the system clock directly; a Clock reference is
 * injected so that ledger ordering and delayed retries are reproducible.
 */
struct Clock {
    virtual ~Clock() = default;

    virtual auto now() const -> TimePoint = 0;
};

class SystemClock final : public Clock {
public:
    auto now() const -> TimePoint override { return std::chrono::system_clock::now(); }

    static auto Instance() -> SystemClock& {
        static SystemClock clock;
        return clock;
    }
};

// Manually driven clock; advance() is the only way time moves.
class ManualClock final : public Clock {
public:
    explicit ManualClock(std::int64_t startMillis = 1'700'000'000'000)
        : millis(startMillis) {}

    auto now() const -> TimePoint override {
        return TimePoint{std::chrono::milliseconds{this->millis.load(std::memory_order_acquire)}};
    }

    auto advance(std::chrono::milliseconds delta) -> void {
        this->millis.fetch_add(delta.count(), std::memory_order_acq_rel);
    }

    auto set(std::int64_t epochMillis) -> void {
        this->millis.store(epochMillis, std::memory_order_release);
    }

private:
    std::atomic<std::int64_t> millis;
};

[[nodiscard]] inline auto toEpochMillis(TimePoint tp) -> std::int64_t {
    return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

} // namespace RS
