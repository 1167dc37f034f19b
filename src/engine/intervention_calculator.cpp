#include "engine/intervention_calculator.hpp"

#include <set>

#include <nlohmann/json.hpp>

#include "common/logging.hpp"
#include "engine/signal_math.hpp"

namespace vita {

namespace {

constexpr std::size_t kMaxSymptomInterventions = 5;

void append(std::vector<Counterfactual> &target, const std::vector<Counterfactual> &family)
{
    target.insert(target.end(), family.begin(), family.end());
}

std::vector<Counterfactual> dedupeByDescription(const std::vector<Counterfactual> &items)
{
    std::set<std::string> seen;
    std::vector<Counterfactual> unique;
    for (const auto &item : items) {
        if (seen.insert(item.description).second) {
            unique.push_back(item);
        }
    }
    return unique;
}

std::string joinChain(const std::vector<std::string> &chain)
{
    std::string joined;
    for (const auto &step : chain) {
        if (!joined.empty()) {
            joined += ' ';
        }
        joined += step;
    }
    return joined;
}

} // namespace

std::vector<Counterfactual> InterventionCalculator::mealInterventions()
{
    return {
        {"Switch to whole wheat flour (-35% glucose spike)", 0.35, Effort::Trivial, 0.85},
        {"Add 15g fat/protein before carbs to flatten curve", 0.25, Effort::Trivial, 0.75},
        {"Pressure cook instead of slow cook (-95% lectins)", 0.40, Effort::Trivial, 0.82},
        {"Take a 10-minute walk after meals", 0.25, Effort::Moderate, 0.78},
    };
}

std::vector<Counterfactual> InterventionCalculator::behaviorInterventions()
{
    return {
        {"Limit passive scrolling to 15-min blocks", 0.45, Effort::Significant, 0.70},
        {"Use Focus Mode during deep work blocks", 0.30, Effort::Moderate, 0.65},
        {"Replace scrolling with a 5-min walk", 0.35, Effort::Moderate, 0.72},
    };
}

std::vector<Counterfactual> InterventionCalculator::sleepInterventions()
{
    return {
        {"Eat dinner 2 hours earlier (+25 min deep sleep)", 0.30, Effort::Moderate, 0.75},
        {"Keep dinner GL below 20", 0.22, Effort::Moderate, 0.68},
        {"Stop screens 1 hour before bed", 0.18, Effort::Significant, 0.60},
    };
}

std::vector<Counterfactual> InterventionCalculator::environmentInterventions()
{
    return {
        {"Exercise indoors when AQI > 100", 0.30, Effort::Trivial, 0.75},
        {"Use air purifier on high-AQI days", 0.25, Effort::Moderate, 0.68},
        {"Take antihistamine on high-pollen days", 0.20, Effort::Trivial, 0.62},
    };
}

std::vector<Counterfactual> InterventionCalculator::generalInterventions()
{
    const auto meal = mealInterventions();
    const auto sleep = sleepInterventions();
    return {meal[0], meal[1], sleep[0]};
}

std::vector<Counterfactual> InterventionCalculator::generateCounterfactuals(const std::string &nodeId) const
{
    std::vector<Counterfactual> result;
    if (nodeId.find("meal") != std::string::npos) {
        append(result, mealInterventions());
    }
    if (nodeId.find("behavioral") != std::string::npos || nodeId.find("screen") != std::string::npos) {
        append(result, behaviorInterventions());
    }
    if (nodeId.find("glucose") != std::string::npos) {
        append(result, mealInterventions());
    }
    if (nodeId.find("environment") != std::string::npos) {
        append(result, environmentInterventions());
    }

    const bool general = result.empty();
    if (general) {
        result = generalInterventions();
    }
    result = dedupeByDescription(result);

    VLOG_DEBUG(QStringLiteral("InterventionCalculator"),
               QStringLiteral("generateCounterfactuals"),
               QStringLiteral("counterfactuals_generated"),
               QStringLiteral("node_query"),
               (general ? QStringLiteral("general_templates") : QStringLiteral("node_templates")),
               vita::logging::defaultWho(),
               QString(),
               (nlohmann::json{{"nodeId", nodeId}, {"count", result.size()}}));
    return result;
}

std::vector<Counterfactual> InterventionCalculator::generateCounterfactualsForSymptom(
    const std::string &symptom,
    const std::vector<CausalExplanation> &explanations) const
{
    std::vector<Counterfactual> result;
    for (const auto &explanation : explanations) {
        const std::string chain = toLowerAscii(joinChain(explanation.causalChain));

        if (containsAny(chain, {"glucose", "meal", "roti", "gl"})) {
            append(result, mealInterventions());
        }
        if (containsAny(chain, {"screen", "scroll", "dopamine"})) {
            append(result, behaviorInterventions());
        }
        if (chain.find("sleep") != std::string::npos) {
            append(result, sleepInterventions());
        }
        if (containsAny(chain, {"aqi", "pollen", "environment"})) {
            append(result, environmentInterventions());
        }
    }

    const bool general = result.empty();
    if (general) {
        result = generalInterventions();
    }
    result = dedupeByDescription(result);
    if (result.size() > kMaxSymptomInterventions) {
        result.resize(kMaxSymptomInterventions);
    }

    VLOG_DEBUG(QStringLiteral("InterventionCalculator"),
               QStringLiteral("generateCounterfactualsForSymptom"),
               QStringLiteral("counterfactuals_generated"),
               QStringLiteral("symptom_query"),
               (general ? QStringLiteral("general_templates") : QStringLiteral("chain_keywords")),
               vita::logging::defaultWho(),
               QString(),
               (nlohmann::json{{"symptom", symptom},
                               {"explanations", explanations.size()},
                               {"count", result.size()}}));
    return result;
}

} // namespace vita
