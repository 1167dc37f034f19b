#pragma once

#include "engine/analysis_tool.hpp"

namespace vita {

class SleepQualityAnalyzer : public AnalysisTool
{
public:
    std::string name() const override;
    std::set<DebtType> targetDebtTypes() const override;

    ToolObservation analyze(const std::vector<Hypothesis> &hypotheses,
                            const HealthDataStore &store,
                            const TimeWindow &window) const override;
};

} // namespace vita
