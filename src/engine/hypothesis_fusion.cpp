#include "engine/hypothesis_fusion.hpp"

#include <algorithm>
#include <cstdio>

namespace vita {

void sortByConfidence(std::vector<Hypothesis> &hypotheses)
{
    std::stable_sort(hypotheses.begin(), hypotheses.end(),
                     [](const Hypothesis &a, const Hypothesis &b) {
                         return a.confidence > b.confidence;
                     });
}

std::string formatEvidenceTag(const std::string &toolName, double evidence)
{
    char percent[32] = {};
    std::snprintf(percent, sizeof(percent), "%.0f", evidence * 100.0);
    return toolName + ": " + (evidence > 0.0 ? "+" : "") + percent + "%";
}

std::vector<Hypothesis> foldObservation(std::vector<Hypothesis> hypotheses,
                                        const ToolObservation &observation)
{
    for (auto &hypothesis : hypotheses) {
        const auto it = observation.evidence.find(hypothesis.debtType);
        if (it == observation.evidence.end()) {
            continue;
        }
        const double evidence = it->second;
        hypothesis.confidence = clampUnit(hypothesis.confidence
                                          + evidence * observation.confidence);
        if (evidence > 0.0) {
            hypothesis.supportingEvidence.push_back(
                formatEvidenceTag(observation.toolName, evidence));
        } else if (evidence < 0.0) {
            hypothesis.contradictingEvidence.push_back(
                formatEvidenceTag(observation.toolName, evidence));
        }
    }
    sortByConfidence(hypotheses);
    return hypotheses;
}

const Hypothesis *findHypothesis(const std::vector<Hypothesis> &hypotheses, DebtType type)
{
    for (const auto &hypothesis : hypotheses) {
        if (hypothesis.debtType == type) {
            return &hypothesis;
        }
    }
    return nullptr;
}

} // namespace vita
