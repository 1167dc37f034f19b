#pragma once

#include <optional>
#include <string>
#include <vector>

#include "engine/collaborators.hpp"

namespace vita {

struct RuleCondition {
    enum class Check {
        HrvBelow,
        HrvDropPercentAbove,
        GlucoseCrashDeltaAbove,
        GlucoseBelow,
        SleepBelowHours,
        DopamineDebtAbove,
        PassiveMinutesAbove,
        AqiAbove,
        PollenAbove,
        ProteinBelowGrams,
        GlycemicLoadAbove,
        LateMealAtOrAfterHour
    };

    Check check;
    double threshold;
};

struct BioRule {
    std::string id;
    std::string name;
    std::vector<RuleCondition> conditions;
    DebtType conclusion;
    std::string explanation;
    std::string recommendation;
    double confidence;
};

// Window aggregates the rules are evaluated against. A missing value makes
// every condition on it false.
struct RuleContext {
    std::optional<double> avgHrv;
    std::optional<double> baselineHrv;
    std::optional<double> hrvDropPercent;
    std::optional<double> glucoseCrashDelta;
    std::optional<double> currentGlucose;
    std::optional<double> totalSleepHours;
    std::optional<double> maxDopamineDebt;
    std::optional<double> passiveMinutes;
    std::optional<int> maxAqi;
    std::optional<int> maxPollen;
    std::optional<double> totalProteinGrams;
    std::optional<double> maxMealGlycemicLoad;
    std::optional<int> latestMealHour;
};

const std::vector<BioRule> &defaultBioRules();

class BioRuleEngine : public FallbackReasoner
{
public:
    BioRuleEngine();
    explicit BioRuleEngine(std::vector<BioRule> rules);

    // Rules whose conditions all hold, most specific first. Each becomes an
    // explanation with the rule name as its one-step chain.
    std::vector<CausalExplanation> evaluate(
        const std::string &symptom,
        const HealthDataStore &store,
        const std::optional<TimeWindow> &window = std::nullopt) const override;

    static RuleContext gatherContext(const HealthDataStore &store, const TimeWindow &window);
    static bool conditionHolds(const RuleCondition &condition, const RuleContext &context);

private:
    std::vector<BioRule> m_rules;
};

} // namespace vita
