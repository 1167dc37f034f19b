#pragma once

#include <string>
#include <vector>

#include "common/models.hpp"

namespace vita {

// Stable descending sort by confidence. Re-sorting a sorted list leaves it
// unchanged, including the relative order of equal-confidence entries.
void sortByConfidence(std::vector<Hypothesis> &hypotheses);

// Folds one tool observation into the hypothesis list:
// confidence += evidence * observation.confidence, clamped to [0, 1].
// Positive evidence is recorded as "<tool>: +NN%", negative as
// "<tool>: -NN%". The result is sorted.
std::vector<Hypothesis> foldObservation(std::vector<Hypothesis> hypotheses,
                                        const ToolObservation &observation);

std::string formatEvidenceTag(const std::string &toolName, double evidence);

const Hypothesis *findHypothesis(const std::vector<Hypothesis> &hypotheses, DebtType type);

} // namespace vita
