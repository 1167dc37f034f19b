#include "engine/debt_classifier.hpp"

#include <algorithm>
#include <map>

namespace vita {

std::vector<RankedDebt> DebtClassifier::classify(const std::vector<Hypothesis> &hypotheses,
                                                 const std::vector<ToolObservation> &observations) const
{
    std::map<DebtType, double> scores = {
        {DebtType::Metabolic, 0.33},
        {DebtType::Digital, 0.33},
        {DebtType::Somatic, 0.34},
    };

    for (const auto &hypothesis : hypotheses) {
        scores[hypothesis.debtType] += hypothesis.priorProbability * 0.2 + hypothesis.confidence * 0.3;
    }

    for (const auto &observation : observations) {
        for (const auto &[type, evidence] : observation.evidence) {
            scores[type] += evidence * observation.confidence;
        }
    }

    double total = 0.0;
    for (auto &entry : scores) {
        entry.second = std::max(entry.second, 0.0);
        total += entry.second;
    }
    if (total <= 0.0) {
        return {};
    }

    std::vector<RankedDebt> ranked;
    for (const auto &[type, score] : scores) {
        ranked.push_back(RankedDebt{type, score / total, score});
    }
    std::stable_sort(ranked.begin(), ranked.end(),
                     [](const RankedDebt &a, const RankedDebt &b) { return a.score > b.score; });
    return ranked;
}

} // namespace vita
