#ifdef RS_LOG_DEBUG
#include <doctest/doctest.h>
#include "log/TaggedLogger.hpp"

#include <chrono>
#include <cstdlib>
#include <functional>
#include <initializer_list>
#include <iostream>
#include <optional>
#include <sstream>
#include <string>
#include <thread>
#include <utility>
#include <vector>

using namespace std::chrono_literals;

namespace {

// Sets or clears one variable for the lifetime of the guard.
class EnvGuard {
public:
    EnvGuard(std::string key, const char* value) : key(std::move(key)) {
        if (const char* existing = std::getenv(this->key.c_str())) {
            original = std::string(existing);
        }
        apply(value);
    }

    EnvGuard(const EnvGuard&)            = delete;
    EnvGuard& operator=(const EnvGuard&) = delete;

    EnvGuard(EnvGuard&& other) noexcept
        : key(std::move(other.key)), original(std::move(other.original)), active(other.active) {
        other.active = false;
    }

    ~EnvGuard() {
        if (!active) {
            return;
        }
        if (original) {
            setenv(key.c_str(), original->c_str(), 1);
        } else {
            unsetenv(key.c_str());
        }
    }

private:
    void apply(const char* value) {
        if (value) {
            setenv(this->key.c_str(), value, 1);
        } else {
            unsetenv(this->key.c_str());
        }
    }

    std::string                key;
    std::optional<std::string> original;
    bool                       active{true};
};

class EnvBlock {
public:
    EnvBlock(std::initializer_list<std::pair<std::string, const char*>> vars) {
        guards.reserve(vars.size());
        for (auto const& [name, value] : vars) {
            guards.emplace_back(name, value);
        }
    }

private:
    std::vector<EnvGuard> guards;
};

auto captureStderr(std::function<void()> fn) -> std::string {
    std::ostringstream buffer;
    auto*              original = std::cerr.rdbuf(buffer.rdbuf());
    fn();
    std::cerr.rdbuf(original);
    return buffer.str();
}

void waitForFlush() {
    std::this_thread::sleep_for(20ms);
}

auto cleanEnvironment() -> EnvBlock {
    return EnvBlock{
        {"RESILIENCE_LOG_ENABLED", nullptr},
        {"RESILIENCE_LOG", nullptr},
        {"RESILIENCE_LOG_CLEAR_DEFAULT_SKIPS", nullptr},
        {"RESILIENCE_LOG_ENABLE_TAGS", nullptr},
        {"RESILIENCE_LOG_SKIP_TAGS", nullptr},
    };
}

// Logs one message through a fresh logger configured from the current environment.
template <typename... Tags>
auto emit(std::string const& message, Tags&&... tags) -> std::string {
    return captureStderr([&] {
        RS::TaggedLogger logger;
        logger.log_impl(message, std::source_location::current(), std::forward<Tags>(tags)...);
        waitForFlush();
    });
}

} // namespace

TEST_SUITE("log.tagged_logger") {

TEST_CASE("silent_without_environment") {
    auto env = cleanEnvironment();
    CHECK(emit("component degraded", "Recovery").empty());
}

TEST_CASE("enabled_flag_writes_tags_thread_and_message") {
    auto     env = cleanEnvironment();
    EnvGuard enable("RESILIENCE_LOG_ENABLED", "1");

    auto output = emit("GlassCard NORMAL -> REDUCED", "Recovery");
    CHECK(output.find("[Recovery]") != std::string::npos);
    CHECK(output.find("GlassCard NORMAL -> REDUCED") != std::string::npos);
    CHECK(output.find("Thread 0") != std::string::npos);
}

TEST_CASE("enabled_flag_rejects_false_words") {
    auto env = cleanEnvironment();
    for (char const* value : {"0", "false", "off", ""}) {
        EnvGuard enable("RESILIENCE_LOG_ENABLED", value);
        CHECK(emit("should stay quiet", "Ledger").empty());
    }
}

TEST_CASE("resilience_log_enables_logging") {
    auto     env = cleanEnvironment();
    EnvGuard enable("RESILIENCE_LOG", "on");

    auto output = emit("crash recorded", "Ledger");
    CHECK(output.find("crash recorded") != std::string::npos);
    CHECK(output.find("[Ledger]") != std::string::npos);
}

TEST_CASE("default_skips_hide_noisy_tags") {
    auto     env = cleanEnvironment();
    EnvGuard enable("RESILIENCE_LOG_ENABLED", "1");

    CHECK(emit("state snapshot", "Ledger", "INFO").empty());
    CHECK(emit("job queued", "TaskPool").empty());
    CHECK(emit("callback scheduled", "Scheduler").empty());
}

TEST_CASE("clearing_default_skips_shows_info") {
    auto     env = cleanEnvironment();
    EnvGuard enable("RESILIENCE_LOG_ENABLED", "1");
    EnvGuard clear("RESILIENCE_LOG_CLEAR_DEFAULT_SKIPS", "1");

    CHECK(emit("state snapshot", "Ledger", "INFO").find("state snapshot") != std::string::npos);
}

TEST_CASE("enable_tags_require_every_tag_listed") {
    auto     env = cleanEnvironment();
    EnvGuard enable("RESILIENCE_LOG_ENABLED", "1");
    EnvGuard only("RESILIENCE_LOG_ENABLE_TAGS", "Glass,WARN");

    CHECK(emit("glass degraded", "Glass", "WARN").find("glass degraded") != std::string::npos);
    CHECK(emit("glass degraded", "Glass", "ERROR").empty());
    CHECK(emit("unrelated", "Health").empty());
}

TEST_CASE("skip_tags_are_trimmed_and_added") {
    auto     env = cleanEnvironment();
    EnvGuard enable("RESILIENCE_LOG_ENABLED", "1");
    EnvGuard clear("RESILIENCE_LOG_CLEAR_DEFAULT_SKIPS", "1");
    EnvGuard skip("RESILIENCE_LOG_SKIP_TAGS", " Health , ResourceValidator ");

    CHECK(emit("tier changed", "Health").empty());
    CHECK(emit("missing color", "ResourceValidator").empty());
    CHECK(emit("kept", "Engine").find("kept") != std::string::npos);
}

TEST_CASE("thread_name_appears_in_brackets") {
    auto     env = cleanEnvironment();
    EnvGuard enable("RESILIENCE_LOG_ENABLED", "1");

    auto output = captureStderr([] {
        RS::TaggedLogger logger;
        logger.setThreadName("Worker-7");
        logger.log_impl("enrichment finished", std::source_location::current(), "Ledger");
        waitForFlush();
    });
    CHECK(output.find("[Worker-7]") != std::string::npos);
}

TEST_CASE("runtime_switch_overrides_environment") {
    auto     env = cleanEnvironment();
    EnvGuard enable("RESILIENCE_LOG_ENABLED", "1");

    auto muted = captureStderr([] {
        RS::TaggedLogger logger;
        logger.setLoggingEnabled(false);
        CHECK_FALSE(logger.isLoggingEnabled());
        logger.log_impl("muted", std::source_location::current(), "Engine");
        waitForFlush();
    });
    CHECK(muted.empty());
}

TEST_CASE("macro_joins_tags_and_reports_location") {
    auto     env = cleanEnvironment();
    EnvGuard enable("RESILIENCE_LOG_ENABLED", "1");

    bool const wasEnabled = RS::logger().isLoggingEnabled();
    auto       output     = captureStderr([] {
        RS::set_thread_name("UiThread");
        RS::set_logging_enabled(true);
        rs_log("via macro", "Recovery", "WARN");
        waitForFlush();
    });
    RS::set_logging_enabled(wasEnabled);
    RS::set_thread_name("TestMain");

    CHECK(output.find("Recovery][WARN") != std::string::npos);
    CHECK(output.find("[UiThread]") != std::string::npos);
    CHECK(output.find("log/test_TaggedLogger.cpp:") != std::string::npos);
}

} // TEST_SUITE
#endif // RS_LOG_DEBUG
