#include "resilience/Resilience.hpp"

#include <filesystem>
#include <fstream>
#include <functional>
#include <iostream>
#include <optional>
#include <set>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

namespace {

struct DiagnoseOptions {
    std::set<std::string>                missing;
    bool                                 noEffects = false;
    bool                                 simulate  = false;
    int                                  indent    = 2;
    std::optional<std::filesystem::path> outputPath;
};

void print_usage() {
    std::cout << "Usage: resilience_diagnose [options]\n"
                 "Validates the settings and glass resource catalogs against a simulated host and prints\n"
                 "the system status and diagnostic report as JSON.\n\n"
                 "  --missing <name>                Treat a resource as missing (repeatable)\n"
                 "  --no-effects                    Simulate a host whose blur capability probe fails\n"
                 "  --simulate                      Drive sample component failures and a system recovery\n"
                 "  --indent <n>                    JSON indent (default 2, -1 for compact)\n"
                 "  --output <file>                 Write JSON to file instead of stdout\n";
    RS::PrintResilienceUsage(std::cout);
}

// Every name resolves unless listed as missing.
class SimulatedResources final : public RS::ResourceEnvironment {
public:
    explicit SimulatedResources(std::set<std::string> missing)
        : missing(std::move(missing)) {}

    auto resolve(std::string_view name, RS::ResourceKind) const -> std::optional<RS::ResourceId> override {
        if (this->missing.contains(std::string{name})) {
            return std::nullopt;
        }
        return static_cast<RS::ResourceId>(std::hash<std::string_view>{}(name) | 1u);
    }

    auto load(RS::ResourceId, RS::ResourceKind) const -> void override {}

private:
    std::set<std::string> missing;
};

class SimulatedHost final : public RS::HostEnvironment {
public:
    explicit SimulatedHost(bool effects)
        : effects(effects) {}

    auto environmentState() const -> RS::EnvironmentState override { return {}; }
    auto capabilityProbe() const -> bool override { return this->effects; }
    auto releaseRegistration(std::string_view) -> bool override { return true; }

    auto deviceInfo() const -> RS::DeviceInfo override {
        RS::DeviceInfo info;
        info.manufacturer = "simulated";
        info.model        = "resilience_diagnose";
        info.osVersion    = "n/a";
        info.density      = 1.0f;
        return info;
    }

private:
    bool effects;
};

auto parse_tool_arguments(std::vector<std::string> const& tokens) -> std::optional<DiagnoseOptions> {
    DiagnoseOptions options;
    for (std::size_t i = 0; i < tokens.size(); ++i) {
        std::string_view const token = tokens[i];
        auto next = [&]() -> std::optional<std::string> {
            if (i + 1 >= tokens.size()) {
                std::cerr << token << " requires a value\n";
                return std::nullopt;
            }
            return tokens[++i];
        };
        if (token == "--missing") {
            auto value = next();
            if (!value) {
                return std::nullopt;
            }
            options.missing.insert(*value);
        } else if (token == "--no-effects") {
            options.noEffects = true;
        } else if (token == "--simulate") {
            options.simulate = true;
        } else if (token == "--indent") {
            auto value = next();
            if (!value) {
                return std::nullopt;
            }
            try {
                options.indent = std::stoi(*value);
            } catch (std::exception const&) {
                std::cerr << "--indent must be numeric\n";
                return std::nullopt;
            }
        } else if (token == "--output") {
            auto value = next();
            if (!value || value->empty()) {
                std::cerr << "--output requires a file\n";
                return std::nullopt;
            }
            options.outputPath = std::filesystem::path(*value);
        } else {
            std::cerr << "Unknown flag '" << token << "'" << std::endl;
            return std::nullopt;
        }
    }
    return options;
}

auto simulate_failures(RS::ResilienceEngine& engine) -> nlohmann::json {
    engine.onFailure("ModernToggleSwitch", RS::Failure::Make(RS::Failure::Type::Runtime, "Custom view failed to measure"));
    engine.onFailure("SettingsPanel",
                     RS::Failure::Make(RS::Failure::Type::IllegalState, "Can not perform this action after onSaveInstanceState"),
                     [] { return std::optional<RS::Renderable>{RS::Renderable::Live("SettingsPanel", "settings_panel")}; });
    for (int i = 0; i < 3; ++i) {
        engine.onFailure("MenuContainer", RS::Failure::Make(RS::Failure::Type::Runtime, "menu inflate failed"));
    }
    engine.onGlassFailure("GlassCard", RS::Failure::MissingResource("glass_card_background"));
    return RS::SystemRecoveryToJson(engine.attemptSystemRecovery());
}

auto write_output(std::string const& jsonString, std::optional<std::filesystem::path> const& output) -> bool {
    if (!output) {
        std::cout << jsonString << std::endl;
        return true;
    }
    std::ofstream stream(*output, std::ios::binary);
    if (!stream.is_open()) {
        std::cerr << "Failed to open output file '" << output->string() << "'" << std::endl;
        return false;
    }
    stream << jsonString;
    if (!stream.good()) {
        std::cerr << "Failed to write JSON output" << std::endl;
        return false;
    }
    return true;
}

} // namespace

int main(int argc, char** argv) {
    std::vector<std::string> rest;
    auto                     engineOptions = RS::ParseResilienceArguments(argc, argv, &rest);
    if (!engineOptions) {
        return 1;
    }
    if (engineOptions->show_help) {
        print_usage();
        return 0;
    }
    auto toolOptions = parse_tool_arguments(rest);
    if (!toolOptions) {
        return 1;
    }

    SimulatedResources resources(toolOptions->missing);
    SimulatedHost      host(!toolOptions->noEffects);

    nlohmann::json output = nlohmann::json::object();
    {
        RS::ResilienceEngine engine(resources, host, *engineOptions);
        output["options"]          = nlohmann::json::parse(RS::SerializeResilienceOptions(engine.options()));
        output["glass_validation"] = RS::GlassValidationToJson(engine.validateAll());
        if (toolOptions->simulate) {
            output["recovery"] = simulate_failures(engine);
            if (!engine.ledger().waitForEnrichment(std::chrono::seconds{5})) {
                std::cerr << "Timed out waiting for crash enrichment" << std::endl;
            }
        }
        output["status"] = RS::SystemStatusToJson(engine.systemStatus());
        output["report"] = RS::DiagnosticReportToJson(engine.diagnosticReport());
    }

    return write_output(output.dump(toolOptions->indent), toolOptions->outputPath) ? 0 : 1;
}
