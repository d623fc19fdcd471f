#include <resilience/Resilience.hpp>

#include <chrono>
#include <exception>
#include <iostream>
#include <map>
#include <optional>
#include <set>
#include <stdexcept>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

namespace {

// Resource table of a settings screen shipped without its toggle thumbs.
class ExampleResources final : public RS::ResourceEnvironment {
public:
    auto resolve(std::string_view name, RS::ResourceKind) const -> std::optional<RS::ResourceId> override {
        if (name == "modern_toggle_thumb" || name == "modern_toggle_thumb_focused") {
            return std::nullopt;
        }
        auto [it, inserted] = this->ids.try_emplace(std::string{name}, static_cast<RS::ResourceId>(this->ids.size() + 1));
        return it->second;
    }

    auto load(RS::ResourceId, RS::ResourceKind) const -> void override {}

private:
    mutable std::map<std::string, RS::ResourceId> ids;
};

class ExampleHost final : public RS::HostEnvironment {
public:
    auto environmentState() const -> RS::EnvironmentState override { return this->state; }
    auto capabilityProbe() const -> bool override { return true; }
    auto releaseRegistration(std::string_view componentId) -> bool override { return this->registered.erase(std::string{componentId}) > 0; }

    auto deviceInfo() const -> RS::DeviceInfo override {
        RS::DeviceInfo info;
        info.manufacturer = "Example";
        info.model        = "Living Room Box";
        info.osVersion    = "11";
        info.apiLevel     = 30;
        info.density      = 2.0f;
        return info;
    }

    RS::EnvironmentState  state;
    std::set<std::string> registered{"SettingsFragment"};
};

void show(std::string_view step, RS::Renderable const& renderable) {
    std::cout << step << ": " << renderable.describe() << '\n';
}

} // namespace

int main(int argc, char** argv) {
    std::vector<std::string> unrecognized;
    auto                     options = RS::ParseResilienceArguments(argc, argv, &unrecognized);
    if (!options || !unrecognized.empty()) {
        std::cerr << "Usage: " << argv[0] << " [options]\n";
        RS::PrintResilienceUsage(std::cerr);
        return 1;
    }
    if (options->show_help) {
        RS::PrintResilienceUsage(std::cout);
        return 0;
    }

    ExampleResources     resources;
    ExampleHost          host;
    RS::ResilienceEngine engine(resources, host, *options);
    engine.setReplacementSink([](RS::Renderable renderable) { show("delivered later", renderable); });

    auto const preflight = engine.validate();
    std::cout << "preflight: " << preflight.missingCount() << " missing, action " << RS::recoveryActionToString(preflight.recommendedAction) << ", system tier "
              << RS::systemTierToString(engine.preflightTier()) << '\n';

    // The toggle cannot be built without its thumb drawable.
    show("toggle", engine.onFailure("ModernToggleSwitch", std::make_exception_ptr(RS::ResourceNotFoundError("modern_toggle_thumb"))));

    // A commit after the host saved its state: retried allowing state loss.
    host.state.stateSaved = true;
    show("settings commit",
         engine.onFailure("SettingsPanel",
                          std::make_exception_ptr(RS::IllegalStateError("Can not perform this action after onSaveInstanceState")),
                          [] { return std::optional<RS::Renderable>{RS::Renderable::Live("SettingsPanel", "settings_panel_view")}; }));
    host.state.stateSaved = false;

    // Not attached yet: an interim fallback now, the real view after the retry delay.
    show("glass card",
         engine.onFailure("GlassCard",
                          std::make_exception_ptr(RS::IllegalStateError("Fragment GlassCard not attached to a context")),
                          [] { return std::optional<RS::Renderable>{RS::Renderable::Live("GlassCard", "glass_card_view")}; }));
    std::cout << "glass effects now " << RS::tierName(engine.glassEffects().tier()) << '\n';
    while (engine.scheduler().pending() > 0) {
        if (auto due = engine.scheduler().nextDueIn()) {
            std::this_thread::sleep_for(*due);
        }
        engine.pump();
    }

    // The fragment was destroyed underneath us: its registration is released.
    show("settings fragment", engine.onFailure("SettingsFragment", RS::Failure::Make(RS::Failure::Type::IllegalState, "Activity has been destroyed")));

    // The host is finishing: nothing may touch the tree.
    host.state.hostFinishing = true;
    show("menu while finishing", engine.onFailure("MenuContainer", RS::Failure::Make(RS::Failure::Type::IllegalState, "commit refused")));
    host.state.hostFinishing = false;

    auto const recovery = engine.attemptSystemRecovery();
    std::cout << "system recovery promoted " << recovery.components.promoted + recovery.glass.promoted << " component(s), health "
              << recovery.before.healthPercentage() << "% -> " << recovery.after.healthPercentage() << "%\n";

    if (!engine.ledger().waitForEnrichment(std::chrono::seconds{5})) {
        std::cerr << "enrichment still pending\n";
    }
    std::cout << RS::SerializeSystemStatus(engine.systemStatus()) << '\n';
    std::cout << RS::SerializeDiagnosticReport(engine.diagnosticReport()) << '\n';

    engine.teardown();
    return 0;
}
