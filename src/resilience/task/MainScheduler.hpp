#pragma once
#include "core/Clock.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <optional>

namespace RS {

/**
 * MainScheduler — delayed callbacks that run on the host's UI thread.
 *
 * The host calls pump() from its own loop; every callback whose due time
 * has passed (according to the injected Clock) runs on the pumping thread,
 * in due-time order, ties in scheduling order. Callbacks scheduled while a
 * pump is running are picked up by the next pump.
 */
class MainScheduler {
public:
    using Callback = std::function<void()>;
    using Ticket   = std::uint64_t;

    explicit MainScheduler(Clock const& clock);

    MainScheduler(MainScheduler const&)                    = delete;
    auto operator=(MainScheduler const&) -> MainScheduler& = delete;

    auto scheduleAfter(std::chrono::milliseconds delay, Callback callback) -> Ticket;
    auto cancel(Ticket ticket) -> bool;
    auto cancelAll() -> std::size_t;

    // Runs every due callback; returns how many ran.
    auto pump() -> std::size_t;

    [[nodiscard]] auto pending() const -> std::size_t;
    [[nodiscard]] auto nextDueIn() const -> std::optional<std::chrono::milliseconds>;

private:
    struct Entry {
        Ticket   ticket;
        Callback callback;
    };

    Clock const&                       clock;
    mutable std::mutex                 mutex;
    std::multimap<TimePoint, Entry>    queue;
    Ticket                             nextTicket = 1;
};

} // namespace RS
