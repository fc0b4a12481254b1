#pragma once

#include "Scenario.h"

#include <functional>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

namespace SandSim {

/**
 * Central registry for all available scenarios.
 * Uses factory functions to create fresh scenario instances.
 */
class ScenarioRegistry {
public:
    ScenarioRegistry() = default;

    /**
     * @brief Create a registry populated with all built-in scenarios.
     */
    static ScenarioRegistry createDefault();

    using ScenarioFactory = std::function<std::unique_ptr<Scenario>()>;
    void registerScenario(
        const std::string& id, const ScenarioMetadata& metadata, ScenarioFactory factory);

    // Create a new scenario instance by ID, nullptr if unknown.
    std::unique_ptr<Scenario> createScenario(const std::string& id) const;

    // Metadata for a scenario by ID (no instance created), nullptr if unknown.
    const ScenarioMetadata* getMetadata(const std::string& id) const;

    // All registered IDs, sorted.
    std::vector<std::string> getScenarioIds() const;

private:
    struct ScenarioEntry {
        ScenarioMetadata metadata;
        ScenarioFactory factory;
    };
    std::unordered_map<std::string, ScenarioEntry> scenarios_;
};

} // namespace SandSim
