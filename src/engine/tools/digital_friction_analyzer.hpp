#pragma once

#include "engine/analysis_tool.hpp"

namespace vita {

// Splits passive screen time into reactive scrolling (started within 30
// minutes after a glucose crash) and genuine digital use. Only genuine minutes
// count toward digital evidence; mostly-reactive scrolling points at a
// metabolic cause instead.
class DigitalFrictionAnalyzer : public AnalysisTool
{
public:
    std::string name() const override;
    std::set<DebtType> targetDebtTypes() const override;

    ToolObservation analyze(const std::vector<Hypothesis> &hypotheses,
                            const HealthDataStore &store,
                            const TimeWindow &window) const override;
};

} // namespace vita
