#include "task/MainScheduler.hpp"
#include "log/TaggedLogger.hpp"

#include <exception>
#include <string>
#include <utility>
#include <vector>

namespace RS {

MainScheduler::MainScheduler(Clock const& clock)
    : clock(clock) {}

auto MainScheduler::scheduleAfter(std::chrono::milliseconds delay, Callback callback) -> Ticket {
    if (delay.count() < 0) {
        delay = std::chrono::milliseconds{0};
    }
    std::lock_guard<std::mutex> lock(this->mutex);
    auto const ticket = this->nextTicket++;
    this->queue.emplace(this->clock.now() + delay, Entry{ticket, std::move(callback)});
    rs_log("Scheduled callback " + std::to_string(ticket) + " in " + std::to_string(delay.count()) + "ms", "Scheduler");
    return ticket;
}

auto MainScheduler::cancel(Ticket ticket) -> bool {
    std::lock_guard<std::mutex> lock(this->mutex);
    for (auto it = this->queue.begin(); it != this->queue.end(); ++it) {
        if (it->second.ticket == ticket) {
            this->queue.erase(it);
            return true;
        }
    }
    return false;
}

auto MainScheduler::cancelAll() -> std::size_t {
    std::lock_guard<std::mutex> lock(this->mutex);
    auto const dropped = this->queue.size();
    this->queue.clear();
    return dropped;
}

auto MainScheduler::pump() -> std::size_t {
    std::vector<Callback> due;
    {
        std::lock_guard<std::mutex> lock(this->mutex);
        auto const now = this->clock.now();
        auto const end = this->queue.upper_bound(now);
        for (auto it = this->queue.begin(); it != end; ++it) {
            due.push_back(std::move(it->second.callback));
        }
        this->queue.erase(this->queue.begin(), end);
    }

    std::size_t ran = 0;
    for (auto& callback : due) {
        if (!callback) {
            continue;
        }
        try {
            callback();
        } catch (std::exception const& error) {
            rs_log(std::string("Scheduled callback threw: ") + error.what(), "Scheduler", "ERROR");
        } catch (...) {
            rs_log("Scheduled callback threw a non-standard exception", "Scheduler", "ERROR");
        }
        ++ran;
    }
    return ran;
}

auto MainScheduler::pending() const -> std::size_t {
    std::lock_guard<std::mutex> lock(this->mutex);
    return this->queue.size();
}

auto MainScheduler::nextDueIn() const -> std::optional<std::chrono::milliseconds> {
    std::lock_guard<std::mutex> lock(this->mutex);
    if (this->queue.empty()) {
        return std::nullopt;
    }
    auto const remaining = std::chrono::duration_cast<std::chrono::milliseconds>(this->queue.begin()->first - this->clock.now());
    return remaining.count() > 0 ? remaining : std::chrono::milliseconds{0};
}

} // namespace RS
