#pragma once

#include <set>
#include <string>
#include <vector>

#include "common/models.hpp"
#include "store/health_store.hpp"

namespace vita {

// A read-only check run during the Act stage. Implementations query the store
// over the given window and report signed per-category evidence. Store
// failures propagate as DataUnavailableError.
class AnalysisTool
{
public:
    virtual ~AnalysisTool() = default;

    virtual std::string name() const = 0;
    virtual std::set<DebtType> targetDebtTypes() const = 0;

    virtual ToolObservation analyze(const std::vector<Hypothesis> &hypotheses,
                                    const HealthDataStore &store,
                                    const TimeWindow &window) const = 0;
};

} // namespace vita
