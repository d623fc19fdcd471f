#include "task/TaskPool.hpp"
#include "log/TaggedLogger.hpp"

#include <exception>
#include <string>
#include <system_error>
#include <utility>

namespace RS {

TaskPool::TaskPool(std::size_t threadCount, std::size_t maxQueued)
    : maxQueued(maxQueued) {
    rs_log("TaskPool::TaskPool constructing", "TaskPool");
    if (threadCount == 0) threadCount = 1;
    for (std::size_t i = 0; i < threadCount; ++i) {
        try {
            this->workers.emplace_back(&TaskPool::workerFunction, this);
            ++this->activeWorkers;
        } catch (std::system_error const& error) {
            rs_log(std::string("TaskPool::TaskPool failed to spawn worker: ") + error.what(), "TaskPool", "ERROR");
            break;
        }
    }
    rs_log("TaskPool::TaskPool constructed with workers=" + std::to_string(this->activeWorkers.load()), "TaskPool");
}

TaskPool::~TaskPool() {
    rs_log("TaskPool::~TaskPool", "TaskPool");
    this->shutdown();
}

auto TaskPool::submit(Job job) -> std::optional<Error> {
    if (!job) {
        return Error{Error::Code::MalformedInput, "Empty job"};
    }
    {
        std::lock_guard<std::mutex> lock(this->mutex);
        if (this->shuttingDown) {
            rs_log("TaskPool::submit refused: shutting down", "TaskPool");
            return Error{Error::Code::ShuttingDown, "Executor shutting down"};
        }
        if (this->workers.empty()) {
            return Error{Error::Code::ShuttingDown, "Executor has no workers"};
        }
        if (this->maxQueued != 0 && this->jobs.size() >= this->maxQueued) {
            rs_log("TaskPool::submit refused: queue full", "TaskPool");
            return Error{Error::Code::CapacityExceeded, "Executor queue full"};
        }
        this->jobs.push(std::move(job));
    }
    this->jobCV.notify_one();
    return std::nullopt;
}

auto TaskPool::shutdown() -> void {
    rs_log("TaskPool::shutdown begin", "TaskPool");
    {
        std::lock_guard<std::mutex> lock(this->mutex);
        if (this->shuttingDown) {
            for (auto& th : this->workers) {
                if (th.joinable() && th.get_id() != std::this_thread::get_id()) th.join();
            }
            return;
        }
        this->shuttingDown = true;
    }
    this->jobCV.notify_all();

    for (auto& th : this->workers) {
        if (th.joinable() && th.get_id() != std::this_thread::get_id()) {
            th.join();
        }
    }
    this->activeWorkers = 0;

    std::lock_guard<std::mutex> lock(this->mutex);
    this->workers.clear();
    while (!this->jobs.empty()) {
        this->jobs.pop();
    }
    rs_log("TaskPool::shutdown ends", "TaskPool");
}

auto TaskPool::size() const -> std::size_t {
    std::lock_guard<std::mutex> lock(this->mutex);
    return this->workers.size();
}

auto TaskPool::pendingJobs() const -> std::size_t {
    std::lock_guard<std::mutex> lock(this->mutex);
    return this->jobs.size();
}

auto TaskPool::workerFunction() -> void {
    while (true) {
        Job job;
        {
            std::unique_lock<std::mutex> lock(this->mutex);
            this->jobCV.wait(lock, [this] { return this->shuttingDown || !this->jobs.empty(); });
            if (this->shuttingDown) {
                break;
            }
            job = std::move(this->jobs.front());
            this->jobs.pop();
        }

        try {
            job();
        } catch (std::exception const& error) {
            ++this->failedJobCount;
            rs_log(std::string("TaskPool job threw: ") + error.what(), "TaskPool", "ERROR");
        } catch (...) {
            ++this->failedJobCount;
            rs_log("TaskPool job threw a non-standard exception", "TaskPool", "ERROR");
        }
    }
    rs_log("TaskPool::workerFunction exit", "TaskPool");
}

} // namespace RS
