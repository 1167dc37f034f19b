#include "engine/bio_rule_engine.hpp"

#include <algorithm>

#include <nlohmann/json.hpp>

#include "common/logging.hpp"
#include "engine/signal_math.hpp"

namespace vita {

namespace {

constexpr auto kBaselineSpan = std::chrono::hours(24 * 7);

template <typename T>
bool below(const std::optional<T> &value, double threshold)
{
    return value && static_cast<double>(*value) < threshold;
}

template <typename T>
bool above(const std::optional<T> &value, double threshold)
{
    return value && static_cast<double>(*value) > threshold;
}

} // namespace

BioRuleEngine::BioRuleEngine()
    : m_rules(defaultBioRules())
{
}

BioRuleEngine::BioRuleEngine(std::vector<BioRule> rules)
    : m_rules(std::move(rules))
{
}

std::vector<CausalExplanation> BioRuleEngine::evaluate(const std::string &symptom,
                                                       const HealthDataStore &store,
                                                       const std::optional<TimeWindow> &window) const
{
    const TimeWindow effective = window ? *window : TimeWindow::lastHours(6.0);
    const RuleContext context = gatherContext(store, effective);

    std::vector<const BioRule *> matched;
    for (const auto &rule : m_rules) {
        const bool allHold = std::all_of(rule.conditions.begin(), rule.conditions.end(),
                                         [&context](const RuleCondition &condition) {
                                             return conditionHolds(condition, context);
                                         });
        if (allHold) {
            matched.push_back(&rule);
        }
    }

    // More conditions means a more specific rule.
    std::stable_sort(matched.begin(), matched.end(),
                     [](const BioRule *a, const BioRule *b) {
                         return a->conditions.size() > b->conditions.size();
                     });

    std::vector<CausalExplanation> explanations;
    nlohmann::json firedIds = nlohmann::json::array();
    for (const BioRule *rule : matched) {
        explanations.push_back(CausalExplanation{
            symptom,
            {rule->name},
            rule->confidence,
            rule->confidence,
            rule->explanation + " " + rule->recommendation,
        });
        firedIds.push_back(rule->id);
    }

    VLOG_INFO(QStringLiteral("BioRuleEngine"),
              QStringLiteral("evaluate"),
              QStringLiteral("rules_evaluated"),
              QStringLiteral("fallback_reasoning"),
              QStringLiteral("deterministic_rules"),
              vita::logging::defaultWho(),
              QString(),
              (nlohmann::json{{"rules", m_rules.size()}, {"fired", firedIds}}));
    return explanations;
}

RuleContext BioRuleEngine::gatherContext(const HealthDataStore &store, const TimeWindow &window)
{
    RuleContext context;

    const auto hrv = store.querySamples(MetricType::HrvSdnn, window);
    if (!hrv.empty()) {
        context.avgHrv = meanValue(hrv);
    }
    const auto baselineHrv = store.querySamples(MetricType::HrvSdnn,
                                                window.from - kBaselineSpan, window.from);
    if (!baselineHrv.empty()) {
        context.baselineHrv = meanValue(baselineHrv);
    }
    if (context.avgHrv && context.baselineHrv && *context.baselineHrv > 0.0) {
        context.hrvDropPercent = (*context.baselineHrv - *context.avgHrv) / *context.baselineHrv * 100.0;
    }

    const auto glucose = store.queryGlucose(window);
    if (!glucose.empty()) {
        context.currentGlucose = glucose.back().glucoseMgDL;
    }
    if (glucose.size() >= 2) {
        const auto lower = [](const GlucoseReading &a, const GlucoseReading &b) {
            return a.glucoseMgDL < b.glucoseMgDL;
        };
        const auto peak = *std::max_element(glucose.begin(), glucose.end(), lower);
        std::optional<double> nadir;
        for (const auto &reading : glucose) {
            if (reading.timestamp > peak.timestamp
                && (!nadir || reading.glucoseMgDL < *nadir)) {
                nadir = reading.glucoseMgDL;
            }
        }
        if (nadir) {
            context.glucoseCrashDelta = peak.glucoseMgDL - *nadir;
        }
    }

    const auto sleep = store.querySamples(MetricType::SleepAnalysis, window);
    if (!sleep.empty()) {
        context.totalSleepHours = sumValues(sleep);
    }

    double passiveMinutes = 0.0;
    for (const auto &event : store.queryBehaviors(window)) {
        if (event.isPassive()) {
            passiveMinutes += event.minutes();
        }
        if (event.dopamineDebtScore
            && (!context.maxDopamineDebt || *event.dopamineDebtScore > *context.maxDopamineDebt)) {
            context.maxDopamineDebt = event.dopamineDebtScore;
        }
    }
    context.passiveMinutes = passiveMinutes;

    for (const auto &condition : store.queryEnvironment(window)) {
        context.maxAqi = std::max(context.maxAqi.value_or(condition.aqiUS), condition.aqiUS);
        context.maxPollen = std::max(context.maxPollen.value_or(condition.pollenIndex), condition.pollenIndex);
    }

    const auto meals = store.queryMeals(window);
    double protein = 0.0;
    for (const auto &meal : meals) {
        const double gl = meal.glycemicLoad();
        context.maxMealGlycemicLoad = std::max(context.maxMealGlycemicLoad.value_or(gl), gl);
        for (const auto &ingredient : meal.ingredients) {
            if (ingredient.type == "protein") {
                protein += ingredient.quantityGrams.value_or(0.0);
            }
        }
    }
    context.totalProteinGrams = protein;
    if (!meals.empty()) {
        context.latestMealHour = localHour(meals.back().timestamp);
    }

    return context;
}

bool BioRuleEngine::conditionHolds(const RuleCondition &condition, const RuleContext &context)
{
    using Check = RuleCondition::Check;
    switch (condition.check) {
    case Check::HrvBelow:
        return below(context.avgHrv, condition.threshold);
    case Check::HrvDropPercentAbove:
        return above(context.hrvDropPercent, condition.threshold);
    case Check::GlucoseCrashDeltaAbove:
        return above(context.glucoseCrashDelta, condition.threshold);
    case Check::GlucoseBelow:
        return below(context.currentGlucose, condition.threshold);
    case Check::SleepBelowHours:
        return below(context.totalSleepHours, condition.threshold);
    case Check::DopamineDebtAbove:
        return above(context.maxDopamineDebt, condition.threshold);
    case Check::PassiveMinutesAbove:
        return above(context.passiveMinutes, condition.threshold);
    case Check::AqiAbove:
        return above(context.maxAqi, condition.threshold);
    case Check::PollenAbove:
        return above(context.maxPollen, condition.threshold);
    case Check::ProteinBelowGrams:
        return below(context.totalProteinGrams, condition.threshold);
    case Check::GlycemicLoadAbove:
        return above(context.maxMealGlycemicLoad, condition.threshold);
    case Check::LateMealAtOrAfterHour:
        return context.latestMealHour
            && static_cast<double>(*context.latestMealHour) >= condition.threshold;
    }
    return false;
}

} // namespace vita
