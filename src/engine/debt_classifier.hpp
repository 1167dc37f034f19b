#pragma once

#include "engine/collaborators.hpp"

namespace vita {

// posterior = prior + sum(hypothesis prior and confidence terms)
//                   + sum(evidence * observation confidence),
// negatives clamped to zero, then normalized to sum to one.
class DebtClassifier : public DebtRanker
{
public:
    std::vector<RankedDebt> classify(const std::vector<Hypothesis> &hypotheses,
                                     const std::vector<ToolObservation> &observations) const override;
};

} // namespace vita
