#include "engine/tool_registry.hpp"

#include <algorithm>
#include <set>
#include <string>

#include "engine/tools/digital_friction_analyzer.hpp"
#include "engine/tools/environmental_stress_analyzer.hpp"
#include "engine/tools/inflammation_tracker.hpp"
#include "engine/tools/metabolic_scanner.hpp"
#include "engine/tools/sleep_quality_analyzer.hpp"

namespace vita {

ToolRegistry::ToolRegistry()
{
    m_tools.push_back(std::make_unique<MetabolicScanner>());
    m_tools.push_back(std::make_unique<InflammationTracker>());
    m_tools.push_back(std::make_unique<DigitalFrictionAnalyzer>());
    m_tools.push_back(std::make_unique<SleepQualityAnalyzer>());
    m_tools.push_back(std::make_unique<EnvironmentalStressAnalyzer>());
}

ToolRegistry::ToolRegistry(std::vector<std::unique_ptr<AnalysisTool>> tools)
    : m_tools(std::move(tools))
{
}

const AnalysisTool *ToolRegistry::selectTool(const AgentState &state) const
{
    std::set<std::string> investigated;
    for (const auto &observation : state.observations) {
        investigated.insert(observation.toolName);
    }

    std::vector<const AnalysisTool *> candidates;
    for (const auto &tool : m_tools) {
        if (investigated.count(tool->name()) == 0) {
            candidates.push_back(tool.get());
        }
    }
    if (candidates.empty()) {
        return nullptr;
    }

    if (!state.hypotheses.empty()) {
        const DebtType top = state.hypotheses.front().debtType;
        const auto targeted = std::find_if(candidates.begin(), candidates.end(),
                                           [top](const AnalysisTool *tool) {
                                               return tool->targetDebtTypes().count(top) > 0;
                                           });
        if (targeted != candidates.end()) {
            return *targeted;
        }
    }
    return candidates.front();
}

std::vector<const AnalysisTool *> ToolRegistry::allTools() const
{
    std::vector<const AnalysisTool *> tools;
    for (const auto &tool : m_tools) {
        tools.push_back(tool.get());
    }
    return tools;
}

} // namespace vita
