#include "ScenarioRegistry.h"
#include "core/LoggingChannels.h"

#include <algorithm>

// Include scenario implementations.
#include "scenarios/EmptyScenario.cpp"
#include "scenarios/HourglassScenario.cpp"
#include "scenarios/RainingSandScenario.cpp"
#include "scenarios/SandPourScenario.cpp"
#include "scenarios/SandboxScenario.cpp"

namespace SandSim {

ScenarioRegistry ScenarioRegistry::createDefault()
{
    ScenarioRegistry registry;

    {
        auto temp = std::make_unique<EmptyScenario>();
        registry.registerScenario(
            "empty", temp->getMetadata(), []() { return std::make_unique<EmptyScenario>(); });
    }

    {
        auto temp = std::make_unique<HourglassScenario>();
        registry.registerScenario("hourglass", temp->getMetadata(), []() {
            return std::make_unique<HourglassScenario>();
        });
    }

    {
        auto temp = std::make_unique<RainingSandScenario>();
        registry.registerScenario("raining_sand", temp->getMetadata(), []() {
            return std::make_unique<RainingSandScenario>();
        });
    }

    {
        auto temp = std::make_unique<SandPourScenario>();
        registry.registerScenario("sand_pour", temp->getMetadata(), []() {
            return std::make_unique<SandPourScenario>();
        });
    }

    {
        auto temp = std::make_unique<SandboxScenario>();
        registry.registerScenario(
            "sandbox", temp->getMetadata(), []() { return std::make_unique<SandboxScenario>(); });
    }

    return registry;
}

void ScenarioRegistry::registerScenario(
    const std::string& id, const ScenarioMetadata& metadata, ScenarioFactory factory)
{
    if (!factory) {
        LoggingChannels::scenario()->error(
            "Attempted to register null factory for scenario ID: {}", id);
        return;
    }

    if (scenarios_.find(id) != scenarios_.end()) {
        LoggingChannels::scenario()->warn(
            "Scenario with ID '{}' already registered, overwriting", id);
    }

    scenarios_[id] = ScenarioEntry{ metadata, std::move(factory) };
    LoggingChannels::scenario()->debug("Registered scenario '{}' ({})", id, metadata.name);
}

std::unique_ptr<Scenario> ScenarioRegistry::createScenario(const std::string& id) const
{
    auto it = scenarios_.find(id);
    if (it == scenarios_.end()) {
        LoggingChannels::scenario()->error("Unknown scenario ID: {}", id);
        return nullptr;
    }
    return it->second.factory();
}

const ScenarioMetadata* ScenarioRegistry::getMetadata(const std::string& id) const
{
    auto it = scenarios_.find(id);
    if (it == scenarios_.end()) {
        return nullptr;
    }
    return &it->second.metadata;
}

std::vector<std::string> ScenarioRegistry::getScenarioIds() const
{
    std::vector<std::string> ids;
    ids.reserve(scenarios_.size());
    for (const auto& [id, entry] : scenarios_) {
        ids.push_back(id);
    }
    std::sort(ids.begin(), ids.end());
    return ids;
}

} // namespace SandSim
