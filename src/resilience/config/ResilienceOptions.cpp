#include "config/ResilienceOptions.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <iterator>
#include <sstream>
#include <system_error>

#include <nlohmann/json.hpp>

namespace RS {

namespace {

constexpr int          MaxRetryLimit      = 20;
constexpr std::int64_t MaxRetryDelayMs    = 60'000;
constexpr std::size_t  MaxLedgerCapacity  = 10'000;
constexpr std::size_t  MaxWorkers         = 64;
constexpr std::size_t  MaxQueueLimit      = 100'000;

template <typename T>
bool parse_integer(std::string_view text, T& out) {
    T value{};
    auto result = std::from_chars(text.data(), text.data() + text.size(), value);
    if (result.ec != std::errc{} || result.ptr != text.data() + text.size()) {
        return false;
    }
    out = value;
    return true;
}

template <typename T>
bool parse_integer_in_range(std::string_view text, T min, T max, T& out) {
    T value{};
    if (!parse_integer(text, value)) {
        return false;
    }
    if (value < min || value > max) {
        return false;
    }
    out = value;
    return true;
}

bool parse_percent(std::string_view text, double& out) {
    double value = 0.0;
    auto result  = std::from_chars(text.data(), text.data() + text.size(), value);
    if (result.ec != std::errc{} || result.ptr != text.data() + text.size()) {
        return false;
    }
    if (value < 0.0 || value > 100.0) {
        return false;
    }
    out = value;
    return true;
}

std::optional<bool> parse_bool(std::string_view text) {
    if (text.empty()) {
        return std::nullopt;
    }
    std::string normalized;
    normalized.reserve(text.size());
    std::transform(text.begin(), text.end(), std::back_inserter(normalized), [](unsigned char ch) {
        return static_cast<char>(std::tolower(ch));
    });
    if (normalized == "1" || normalized == "true" || normalized == "yes" || normalized == "on") {
        return true;
    }
    if (normalized == "0" || normalized == "false" || normalized == "no" || normalized == "off") {
        return false;
    }
    return std::nullopt;
}

template <typename Setter>
bool apply_env(char const* key, Setter&& setter) {
    if (const char* raw = std::getenv(key)) {
        return setter(std::string_view{raw});
    }
    return true;
}

template <typename T>
auto env_integer(char const* key, T min, T max, T& out) -> bool {
    return apply_env(key, [&](std::string_view value) {
        if (!parse_integer_in_range<T>(value, min, max, out)) {
            std::cerr << key << " must be within " << min << "-" << max << "\n";
            return false;
        }
        return true;
    });
}

auto env_percent(char const* key, double& out) -> bool {
    return apply_env(key, [&](std::string_view value) {
        if (!parse_percent(value, out)) {
            std::cerr << key << " must be a percentage within 0-100\n";
            return false;
        }
        return true;
    });
}

template <typename T>
auto json_integer(nlohmann::json const& value, std::string const& key, T min, T max, T& out) -> std::optional<Error> {
    if (!value.is_number_integer()) {
        return Error{Error::Code::MalformedInput, key + " must be an integer"};
    }
    auto const raw = value.get<std::int64_t>();
    if (raw < static_cast<std::int64_t>(min) || raw > static_cast<std::int64_t>(max)) {
        return Error{Error::Code::InvalidConfiguration, key + " must be within " + std::to_string(min) + "-" + std::to_string(max)};
    }
    out = static_cast<T>(raw);
    return std::nullopt;
}

auto json_percent(nlohmann::json const& value, std::string const& key, double& out) -> std::optional<Error> {
    if (!value.is_number()) {
        return Error{Error::Code::MalformedInput, key + " must be a number"};
    }
    auto const raw = value.get<double>();
    if (raw < 0.0 || raw > 100.0) {
        return Error{Error::Code::InvalidConfiguration, key + " must be a percentage within 0-100"};
    }
    out = raw;
    return std::nullopt;
}

auto apply_health_json(nlohmann::json const& health, ResilienceOptions& options) -> std::optional<Error> {
    if (!health.is_object()) {
        return Error{Error::Code::MalformedInput, "health must be an object"};
    }
    for (auto it = health.begin(); it != health.end(); ++it) {
        std::string const key = "health." + it.key();
        std::optional<Error> error;
        if (it.key() == "critical_failed_percent") {
            error = json_percent(it.value(), key, options.critical_failed_percent);
        } else if (it.key() == "emergency_percent") {
            error = json_percent(it.value(), key, options.emergency_percent);
        } else if (it.key() == "degraded_percent") {
            error = json_percent(it.value(), key, options.degraded_percent);
        } else {
            error = Error{Error::Code::MalformedInput, "Unknown configuration key: " + key};
        }
        if (error) {
            return error;
        }
    }
    return std::nullopt;
}

} // namespace

auto ValidateResilienceOptions(ResilienceOptions const& options) -> std::optional<std::string> {
    if (options.max_retry_attempts < 0 || options.max_retry_attempts > MaxRetryLimit) {
        return std::string{"--max-retries must be within 0-"} + std::to_string(MaxRetryLimit);
    }
    if (options.glass_max_retry_attempts < 0 || options.glass_max_retry_attempts > MaxRetryLimit) {
        return std::string{"--glass-max-retries must be within 0-"} + std::to_string(MaxRetryLimit);
    }
    if (options.retry_delay_ms < 0 || options.retry_delay_ms > MaxRetryDelayMs) {
        return std::string{"--retry-delay-ms must be within 0-"} + std::to_string(MaxRetryDelayMs);
    }
    if (options.ledger_capacity == 0 || options.ledger_capacity > MaxLedgerCapacity) {
        return std::string{"--ledger-capacity must be within 1-"} + std::to_string(MaxLedgerCapacity);
    }
    if (options.recent_limit == 0) {
        return std::string{"--recent-limit must be >= 1"};
    }
    if (options.domain_keyword.empty()) {
        return std::string{"--domain-keyword must not be empty"};
    }
    if (options.enrichment_workers == 0 || options.enrichment_workers > MaxWorkers) {
        return std::string{"--enrichment-workers must be within 1-"} + std::to_string(MaxWorkers);
    }
    if (options.enrichment_queue_limit > MaxQueueLimit) {
        return std::string{"--enrichment-queue-limit must be <= "} + std::to_string(MaxQueueLimit);
    }
    for (double percent : {options.critical_failed_percent, options.emergency_percent, options.degraded_percent}) {
        if (percent < 0.0 || percent > 100.0) {
            return std::string{"health thresholds must be percentages within 0-100"};
        }
    }
    if (options.degraded_percent > options.emergency_percent) {
        return std::string{"--degraded-percent must not exceed --emergency-percent"};
    }
    return std::nullopt;
}

auto ApplyResilienceEnvOverrides(ResilienceOptions& options) -> bool {
    if (!env_integer<int>("RESILIENCE_MAX_RETRIES", 0, MaxRetryLimit, options.max_retry_attempts)) {
        return false;
    }
    if (!env_integer<int>("RESILIENCE_GLASS_MAX_RETRIES", 0, MaxRetryLimit, options.glass_max_retry_attempts)) {
        return false;
    }
    if (!env_integer<std::int64_t>("RESILIENCE_RETRY_DELAY_MS", 0, MaxRetryDelayMs, options.retry_delay_ms)) {
        return false;
    }
    if (!env_integer<std::size_t>("RESILIENCE_LEDGER_CAPACITY", 1, MaxLedgerCapacity, options.ledger_capacity)) {
        return false;
    }
    if (!env_integer<std::size_t>("RESILIENCE_RECENT_LIMIT", 1, MaxLedgerCapacity, options.recent_limit)) {
        return false;
    }
    if (!env_integer<std::size_t>("RESILIENCE_ENRICHMENT_WORKERS", 1, MaxWorkers, options.enrichment_workers)) {
        return false;
    }
    if (!env_integer<std::size_t>("RESILIENCE_ENRICHMENT_QUEUE_LIMIT", 0, MaxQueueLimit, options.enrichment_queue_limit)) {
        return false;
    }
    if (!apply_env("RESILIENCE_DOMAIN_KEYWORD", [&](std::string_view value) {
            if (value.empty()) {
                std::cerr << "RESILIENCE_DOMAIN_KEYWORD must not be empty\n";
                return false;
            }
            options.domain_keyword = std::string{value};
            return true;
        })) {
        return false;
    }
    if (!env_percent("RESILIENCE_CRITICAL_PERCENT", options.critical_failed_percent)) {
        return false;
    }
    if (!env_percent("RESILIENCE_EMERGENCY_PERCENT", options.emergency_percent)) {
        return false;
    }
    if (!env_percent("RESILIENCE_DEGRADED_PERCENT", options.degraded_percent)) {
        return false;
    }
    return true;
}

auto ParseResilienceOptionsJson(std::string_view document, ResilienceOptions base) -> Expected<ResilienceOptions> {
    auto root = nlohmann::json::parse(document.begin(), document.end(), nullptr, false);
    if (root.is_discarded()) {
        return std::unexpected(Error{Error::Code::MalformedInput, "configuration is not valid JSON"});
    }
    if (!root.is_object()) {
        return std::unexpected(Error{Error::Code::MalformedInput, "configuration must be a JSON object"});
    }

    ResilienceOptions options = std::move(base);
    for (auto it = root.begin(); it != root.end(); ++it) {
        std::string const& key   = it.key();
        auto const&        value = it.value();
        std::optional<Error> error;
        if (key == "max_retry_attempts") {
            error = json_integer<int>(value, key, 0, MaxRetryLimit, options.max_retry_attempts);
        } else if (key == "glass_max_retry_attempts") {
            error = json_integer<int>(value, key, 0, MaxRetryLimit, options.glass_max_retry_attempts);
        } else if (key == "retry_delay_ms") {
            error = json_integer<std::int64_t>(value, key, 0, MaxRetryDelayMs, options.retry_delay_ms);
        } else if (key == "ledger_capacity") {
            error = json_integer<std::size_t>(value, key, 1, MaxLedgerCapacity, options.ledger_capacity);
        } else if (key == "recent_limit") {
            error = json_integer<std::size_t>(value, key, 1, MaxLedgerCapacity, options.recent_limit);
        } else if (key == "enrichment_workers") {
            error = json_integer<std::size_t>(value, key, 1, MaxWorkers, options.enrichment_workers);
        } else if (key == "enrichment_queue_limit") {
            error = json_integer<std::size_t>(value, key, 0, MaxQueueLimit, options.enrichment_queue_limit);
        } else if (key == "domain_keyword") {
            if (!value.is_string()) {
                error = Error{Error::Code::MalformedInput, "domain_keyword must be a string"};
            } else {
                options.domain_keyword = value.get<std::string>();
            }
        } else if (key == "health") {
            error = apply_health_json(value, options);
        } else {
            error = Error{Error::Code::MalformedInput, "Unknown configuration key: " + key};
        }
        if (error) {
            return std::unexpected(*error);
        }
    }

    if (auto invalid = ValidateResilienceOptions(options)) {
        return std::unexpected(Error{Error::Code::InvalidConfiguration, *invalid});
    }
    return options;
}

auto LoadResilienceOptionsFile(std::string const& path, ResilienceOptions base) -> Expected<ResilienceOptions> {
    std::ifstream input(path);
    if (!input) {
        return std::unexpected(Error{Error::Code::NotFound, "cannot open configuration file: " + path});
    }
    std::ostringstream contents;
    contents << input.rdbuf();
    return ParseResilienceOptionsJson(contents.str(), std::move(base));
}

auto SerializeResilienceOptions(ResilienceOptions const& options, int indent) -> std::string {
    nlohmann::json root{
            {"max_retry_attempts", options.max_retry_attempts},
            {"glass_max_retry_attempts", options.glass_max_retry_attempts},
            {"retry_delay_ms", options.retry_delay_ms},
            {"ledger_capacity", options.ledger_capacity},
            {"recent_limit", options.recent_limit},
            {"domain_keyword", options.domain_keyword},
            {"enrichment_workers", options.enrichment_workers},
            {"enrichment_queue_limit", options.enrichment_queue_limit},
            {"health",
             {{"critical_failed_percent", options.critical_failed_percent},
              {"emergency_percent", options.emergency_percent},
              {"degraded_percent", options.degraded_percent}}},
    };
    return root.dump(indent);
}

void PrintResilienceUsage(std::ostream& out) {
    out << "Options:\n"
        << "  --config <file>                 Load options from a JSON document\n"
        << "  --max-retries <n>               Retry budget per component (default 3)\n"
        << "  --glass-max-retries <n>         Retry budget per glass surface (default 3)\n"
        << "  --retry-delay-ms <ms>           Delay before a NotAttached retry (default 500)\n"
        << "  --ledger-capacity <n>           Crash records kept (default 50)\n"
        << "  --recent-limit <n>              Records listed in reports (default 10)\n"
        << "  --domain-keyword <word>         Context keyword for domain-specific crashes (default settings)\n"
        << "  --enrichment-workers <n>        Background enrichment threads (default 1)\n"
        << "  --critical-percent <pct>        Failed share that makes the system Critical (default 50)\n"
        << "  --emergency-percent <pct>       Failed+emergency share for Emergency (default 30)\n"
        << "  --degraded-percent <pct>        Failed+emergency+fallback share for Degraded (default 10)\n"
        << "  --help                          Show this message\n";
}

auto ParseResilienceArguments(int argc, char** argv, std::vector<std::string>* unrecognized) -> std::optional<ResilienceOptions> {
    ResilienceOptions options{};

    auto require_value = [&](int& index, std::string_view flag) -> std::optional<std::string_view> {
        if (index + 1 >= argc) {
            std::cerr << flag << " requires a value\n";
            return std::nullopt;
        }
        return std::string_view{argv[++index]};
    };

    // --config is applied first so that the environment and the remaining flags override it.
    for (int i = 1; i < argc; ++i) {
        if (std::string_view{argv[i]} == "--config") {
            auto value = require_value(i, "--config");
            if (!value) {
                return std::nullopt;
            }
            auto loaded = LoadResilienceOptionsFile(std::string{*value}, options);
            if (!loaded) {
                std::cerr << describeError(loaded.error()) << "\n";
                return std::nullopt;
            }
            options = std::move(*loaded);
        }
    }

    if (!ApplyResilienceEnvOverrides(options)) {
        return std::nullopt;
    }

    for (int i = 1; i < argc; ++i) {
        std::string_view arg{argv[i]};
        if (arg == "--config") {
            ++i;
        } else if (arg == "--help" || arg == "-h") {
            options.show_help = true;
        } else if (arg == "--max-retries" || arg == "--glass-max-retries") {
            if (auto value = require_value(i, arg)) {
                int& target = arg == "--max-retries" ? options.max_retry_attempts : options.glass_max_retry_attempts;
                if (!parse_integer_in_range<int>(*value, 0, MaxRetryLimit, target)) {
                    std::cerr << arg << " must be within 0-" << MaxRetryLimit << "\n";
                    return std::nullopt;
                }
            } else {
                return std::nullopt;
            }
        } else if (arg == "--retry-delay-ms") {
            if (auto value = require_value(i, arg)) {
                if (!parse_integer_in_range<std::int64_t>(*value, 0, MaxRetryDelayMs, options.retry_delay_ms)) {
                    std::cerr << "--retry-delay-ms must be within 0-" << MaxRetryDelayMs << "\n";
                    return std::nullopt;
                }
            } else {
                return std::nullopt;
            }
        } else if (arg == "--ledger-capacity" || arg == "--recent-limit") {
            if (auto value = require_value(i, arg)) {
                std::size_t& target = arg == "--ledger-capacity" ? options.ledger_capacity : options.recent_limit;
                if (!parse_integer_in_range<std::size_t>(*value, 1, MaxLedgerCapacity, target)) {
                    std::cerr << arg << " must be within 1-" << MaxLedgerCapacity << "\n";
                    return std::nullopt;
                }
            } else {
                return std::nullopt;
            }
        } else if (arg == "--enrichment-workers") {
            if (auto value = require_value(i, arg)) {
                if (!parse_integer_in_range<std::size_t>(*value, 1, MaxWorkers, options.enrichment_workers)) {
                    std::cerr << "--enrichment-workers must be within 1-" << MaxWorkers << "\n";
                    return std::nullopt;
                }
            } else {
                return std::nullopt;
            }
        } else if (arg == "--domain-keyword") {
            if (auto value = require_value(i, arg)) {
                if (value->empty()) {
                    std::cerr << "--domain-keyword must not be empty\n";
                    return std::nullopt;
                }
                options.domain_keyword = std::string{*value};
            } else {
                return std::nullopt;
            }
        } else if (arg == "--critical-percent" || arg == "--emergency-percent" || arg == "--degraded-percent") {
            if (auto value = require_value(i, arg)) {
                double& target = arg == "--critical-percent"    ? options.critical_failed_percent
                                 : arg == "--emergency-percent" ? options.emergency_percent
                                                                : options.degraded_percent;
                if (!parse_percent(*value, target)) {
                    std::cerr << arg << " must be a percentage within 0-100\n";
                    return std::nullopt;
                }
            } else {
                return std::nullopt;
            }
        } else if (unrecognized != nullptr) {
            unrecognized->emplace_back(arg);
        } else {
            std::cerr << "Unknown option: " << arg << "\n";
            return std::nullopt;
        }
    }

    if (auto invalid = ValidateResilienceOptions(options)) {
        std::cerr << *invalid << "\n";
        return std::nullopt;
    }
    return options;
}

auto ledgerOptionsFrom(ResilienceOptions const& options) -> LedgerOptions {
    return LedgerOptions{.capacity = options.ledger_capacity, .domainKeyword = options.domain_keyword};
}

auto coordinatorOptionsFrom(ResilienceOptions const& options) -> CoordinatorOptions {
    return CoordinatorOptions{.maxRetryAttempts = options.max_retry_attempts, .retryDelay = std::chrono::milliseconds{options.retry_delay_ms}};
}

auto glassCoordinatorOptionsFrom(ResilienceOptions const& options) -> CoordinatorOptions {
    return CoordinatorOptions{.maxRetryAttempts = options.glass_max_retry_attempts, .retryDelay = std::chrono::milliseconds{options.retry_delay_ms}};
}

auto healthThresholdsFrom(ResilienceOptions const& options) -> HealthThresholds {
    return HealthThresholds{.criticalFailedPercent = options.critical_failed_percent,
                            .emergencyPercent      = options.emergency_percent,
                            .degradedPercent       = options.degraded_percent};
}

} // namespace RS
