#include "engine/tools/sleep_quality_analyzer.hpp"

#include <algorithm>
#include <set>

#include "engine/signal_math.hpp"

namespace vita {

namespace {

constexpr double kPopulationSleepHours = 7.5;
constexpr auto kLastNightLookback = std::chrono::hours(12);
constexpr auto kBaselineSpan = std::chrono::hours(24 * 7);

} // namespace

std::string SleepQualityAnalyzer::name() const
{
    return "SleepQualityAnalyzer";
}

std::set<DebtType> SleepQualityAnalyzer::targetDebtTypes() const
{
    return {DebtType::Somatic, DebtType::Metabolic};
}

ToolObservation SleepQualityAnalyzer::analyze(const std::vector<Hypothesis> &,
                                              const HealthDataStore &store,
                                              const TimeWindow &window) const
{
    // Last night's sleep usually ends before the analysis window opens.
    const auto sleepStart = window.from - kLastNightLookback;
    const auto sleep = store.querySamples(MetricType::SleepAnalysis, sleepStart, window.to);
    const double totalSleepHours = sumValues(sleep);

    const auto baselineSleep = store.querySamples(MetricType::SleepAnalysis,
                                                  window.from - kBaselineSpan, window.from);
    std::set<std::string> days;
    for (const auto &sample : baselineSleep) {
        days.insert(localDayKey(sample.timestamp));
    }
    const double baselineHours = days.empty()
        ? kPopulationSleepHours
        : sumValues(baselineSleep) / static_cast<double>(days.size());

    const double deficit = std::max(baselineHours - totalSleepHours, 0.0);
    const double deficitScore = std::min(deficit / 3.0, 1.0);

    std::size_t lateMeals = 0;
    for (const auto &meal : store.queryMeals(sleepStart, window.to)) {
        if (localHour(meal.timestamp) >= 21 && meal.glycemicLoad() > 25.0) {
            ++lateMeals;
        }
    }

    std::size_t lateScreens = 0;
    for (const auto &event : store.queryBehaviors(sleepStart, window.to)) {
        if (localHour(event.timestamp) >= 22 && event.isPassive()) {
            ++lateScreens;
        }
    }
    const double lateScreenScore = lateScreens == 0 ? 0.0 : 0.2;

    ToolObservation observation;
    observation.toolName = name();
    observation.evidence[DebtType::Somatic] = deficitScore * 0.6 + lateScreenScore;
    if (lateMeals > 0) {
        observation.evidence[DebtType::Metabolic] = 0.3;
    }
    observation.confidence = sleep.empty()
        ? 0.2
        : std::min(static_cast<double>(sleep.size()) / 4.0, 1.0);
    observation.detail = "Sleep: " + formatFixed(totalSleepHours, 1) + "h (baseline: "
        + formatFixed(baselineHours, 1) + "h), Late meals: " + std::to_string(lateMeals)
        + ", Late screens: " + std::to_string(lateScreens);
    return observation;
}

} // namespace vita
