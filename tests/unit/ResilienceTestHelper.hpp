#pragma once

#include "core/Error.hpp"
#include "host/HostEnvironment.hpp"
#include "task/Executor.hpp"

#include <atomic>
#include <functional>
#include <mutex>
#include <optional>
#include <set>
#include <stdexcept>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

namespace RS {

// Resource table where every name resolves unless marked missing or broken.
class FakeResources : public ResourceEnvironment {
public:
    auto resolve(std::string_view name, ResourceKind) const -> std::optional<ResourceId> override {
        std::lock_guard<std::mutex> lock(this->mutex);
        ++this->resolveCount;
        if (this->missingNames.contains(std::string{name})) {
            return std::nullopt;
        }
        auto [it, inserted] = this->ids.try_emplace(std::string{name}, static_cast<ResourceId>(this->names.size() + 1));
        if (inserted) {
            this->names.push_back(it->first);
        }
        return it->second;
    }

    auto load(ResourceId id, ResourceKind) const -> void override {
        std::lock_guard<std::mutex> lock(this->mutex);
        if (id == 0 || id > this->names.size()) {
            throw std::out_of_range("unknown resource id " + std::to_string(id));
        }
        auto const& name = this->names[id - 1];
        if (this->brokenNames.contains(name)) {
            throw std::runtime_error("cannot decode " + name);
        }
    }

    auto markMissing(std::string name) -> void {
        std::lock_guard<std::mutex> lock(this->mutex);
        this->missingNames.insert(std::move(name));
    }

    // Resolves but throws on load.
    auto markBroken(std::string name) -> void {
        std::lock_guard<std::mutex> lock(this->mutex);
        this->brokenNames.insert(std::move(name));
    }

    auto restore(std::string const& name) -> void {
        std::lock_guard<std::mutex> lock(this->mutex);
        this->missingNames.erase(name);
        this->brokenNames.erase(name);
    }

    auto restoreAll() -> void {
        std::lock_guard<std::mutex> lock(this->mutex);
        this->missingNames.clear();
        this->brokenNames.clear();
    }

    auto resolves() const -> std::size_t {
        std::lock_guard<std::mutex> lock(this->mutex);
        return this->resolveCount;
    }

private:
    mutable std::mutex                                   mutex;
    std::set<std::string>                                missingNames;
    std::set<std::string>                                brokenNames;
    mutable std::unordered_map<std::string, ResourceId> ids;
    mutable std::vector<std::string>                     names;
    mutable std::size_t                                  resolveCount = 0;
};

// Thrown by the fakes to model host code that throws outside std::exception.
struct NonStandardHostError {
    std::string where;
};

class FakeHost : public HostEnvironment {
public:
    auto environmentState() const -> EnvironmentState override {
        if (this->stateThrowsNonStandard.load()) {
            throw NonStandardHostError{"environment query"};
        }
        std::lock_guard<std::mutex> lock(this->mutex);
        return this->state;
    }

    auto capabilityProbe() const -> bool override { return this->probe.load(); }

    auto releaseRegistration(std::string_view componentId) -> bool override {
        std::lock_guard<std::mutex> lock(this->mutex);
        this->released.emplace_back(componentId);
        if (this->releaseThrows) {
            throw std::runtime_error("registry locked");
        }
        if (this->releaseThrowsNonStandard) {
            throw NonStandardHostError{"registry"};
        }
        return this->releaseResult;
    }

    auto deviceInfo() const -> DeviceInfo override {
        if (this->deviceThrows.load()) {
            throw std::runtime_error("device query failed");
        }
        DeviceInfo info;
        info.manufacturer      = "Acme";
        info.model             = "Box 4K";
        info.osVersion         = "11";
        info.apiLevel          = 30;
        info.brand             = "acme";
        info.device            = "box";
        info.hardware          = "arm64";
        info.availableMemoryMB = 512;
        info.totalMemoryMB     = 2048;
        info.density           = 2.0f;
        return info;
    }

    auto setState(EnvironmentState next) -> void {
        std::lock_guard<std::mutex> lock(this->mutex);
        this->state = next;
    }

    auto releasedIds() const -> std::vector<std::string> {
        std::lock_guard<std::mutex> lock(this->mutex);
        return this->released;
    }

    std::atomic<bool> probe{true};
    std::atomic<bool> deviceThrows{false};
    bool              releaseResult = true;
    bool              releaseThrows = false;
    bool              releaseThrowsNonStandard = false;
    // Not derived from std::exception.
    std::atomic<bool> stateThrowsNonStandard{false};

private:
    mutable std::mutex       mutex;
    EnvironmentState         state;
    std::vector<std::string> released;
};

// Runs every job on the submitting thread.
class InlineExecutor : public Executor {
public:
    auto submit(Job job) -> std::optional<Error> override {
        ++this->submitted;
        job();
        return std::nullopt;
    }
    auto shutdown() -> void override {}
    auto size() const -> std::size_t override { return 1; }

    std::atomic<int> submitted{0};
};

class RefusingExecutor : public Executor {
public:
    auto submit(Job) -> std::optional<Error> override { return Error{Error::Code::ShuttingDown, "Executor shutting down"}; }
    auto shutdown() -> void override {}
    auto size() const -> std::size_t override { return 0; }
};

// submit() throws instead of returning an Error.
class ThrowingExecutor : public Executor {
public:
    auto submit(Job) -> std::optional<Error> override { throw 42; }
    auto shutdown() -> void override {}
    auto size() const -> std::size_t override { return 0; }
};

// Holds jobs until runAll(), so tests can observe the Pending window.
class DeferredExecutor : public Executor {
public:
    auto submit(Job job) -> std::optional<Error> override {
        std::lock_guard<std::mutex> lock(this->mutex);
        this->jobs.push_back(std::move(job));
        return std::nullopt;
    }
    auto shutdown() -> void override {}
    auto size() const -> std::size_t override { return 1; }

    auto runAll() -> std::size_t {
        std::vector<Job> ready;
        {
            std::lock_guard<std::mutex> lock(this->mutex);
            ready.swap(this->jobs);
        }
        for (auto& job : ready) {
            job();
        }
        return ready.size();
    }

    auto queued() const -> std::size_t {
        std::lock_guard<std::mutex> lock(this->mutex);
        return this->jobs.size();
    }

private:
    mutable std::mutex mutex;
    std::vector<Job>   jobs;
};

} // namespace RS
