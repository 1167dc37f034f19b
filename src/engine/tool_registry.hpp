#pragma once

#include <memory>
#include <vector>

#include "engine/collaborators.hpp"

namespace vita {

class ToolRegistry : public ToolSelector
{
public:
    // Registers the five built-in tools in priority order.
    ToolRegistry();
    explicit ToolRegistry(std::vector<std::unique_ptr<AnalysisTool>> tools);

    // First uninvestigated tool that targets the top hypothesis, otherwise
    // the first uninvestigated tool. A tool counts as investigated once an
    // observation with its name is in the state.
    const AnalysisTool *selectTool(const AgentState &state) const override;

    std::vector<const AnalysisTool *> allTools() const;

private:
    std::vector<std::unique_ptr<AnalysisTool>> m_tools;
};

} // namespace vita
