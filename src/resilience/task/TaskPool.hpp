#pragma once
#include "task/Executor.hpp"

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <mutex>
#include <queue>
#include <thread>
#include <vector>

namespace RS {

class TaskPool : public Executor {
public:
    explicit TaskPool(std::size_t threadCount = std::thread::hardware_concurrency(), std::size_t maxQueued = 0);
    ~TaskPool() override;

    TaskPool(TaskPool const&)                    = delete;
    auto operator=(TaskPool const&) -> TaskPool& = delete;

    auto submit(Job job) -> std::optional<Error> override;
    auto shutdown() -> void override;
    auto size() const -> std::size_t override;

    // Number of jobs that exited by throwing.
    auto failedJobs() const -> std::size_t { return this->failedJobCount.load(std::memory_order_relaxed); }
    auto pendingJobs() const -> std::size_t;

private:
    auto workerFunction() -> void;

    std::vector<std::jthread> workers;
    std::queue<Job>           jobs;
    mutable std::mutex        mutex;
    std::condition_variable   jobCV;
    std::size_t const         maxQueued;
    std::atomic<bool>         shuttingDown{false};
    std::atomic<std::size_t>  activeWorkers{0};
    std::atomic<std::size_t>  failedJobCount{0};
};

} // namespace RS
