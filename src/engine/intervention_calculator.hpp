#pragma once

#include <string>
#include <vector>

#include "common/models.hpp"

namespace vita {

// Counterfactual interventions drawn from fixed template families
// (meal, behavior, sleep, environment). Template values are literal, never
// learned.
class InterventionCalculator
{
public:
    // Families are picked by substrings of the node id ("meal", "behavioral",
    // "screen", "glucose", "environment"). No match yields the general set.
    std::vector<Counterfactual> generateCounterfactuals(const std::string &nodeId) const;

    // Families are picked per explanation from its lowercased causal chain.
    // The result is deduplicated by description and holds at most five
    // entries.
    std::vector<Counterfactual> generateCounterfactualsForSymptom(
        const std::string &symptom,
        const std::vector<CausalExplanation> &explanations) const;

    static std::vector<Counterfactual> mealInterventions();
    static std::vector<Counterfactual> behaviorInterventions();
    static std::vector<Counterfactual> sleepInterventions();
    static std::vector<Counterfactual> environmentInterventions();
    static std::vector<Counterfactual> generalInterventions();
};

} // namespace vita
