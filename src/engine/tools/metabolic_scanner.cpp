#include "engine/tools/metabolic_scanner.hpp"

#include <algorithm>
#include <iterator>
#include <optional>

#include "engine/signal_math.hpp"

namespace vita {

namespace {

constexpr std::size_t kMinimumReadings = 3;
constexpr auto kAttributionWindowStart = std::chrono::minutes(30);
constexpr auto kAttributionWindowEnd = std::chrono::minutes(150);

bool lowerGlucose(const GlucoseReading &a, const GlucoseReading &b)
{
    return a.glucoseMgDL < b.glucoseMgDL;
}

} // namespace

std::string MetabolicScanner::name() const
{
    return "MetabolicScanner";
}

std::set<DebtType> MetabolicScanner::targetDebtTypes() const
{
    return {DebtType::Metabolic};
}

ToolObservation MetabolicScanner::analyze(const std::vector<Hypothesis> &,
                                          const HealthDataStore &store,
                                          const TimeWindow &window) const
{
    const auto glucose = store.queryGlucose(window);
    const auto meals = store.queryMeals(window);
    const auto hrv = store.querySamples(MetricType::HrvSdnn, window);

    ToolObservation observation;
    observation.toolName = name();

    if (glucose.size() < kMinimumReadings) {
        observation.evidence[DebtType::Metabolic] = 0.0;
        observation.confidence = 0.1;
        observation.detail = "Insufficient glucose data (" + std::to_string(glucose.size()) + " readings)";
        return observation;
    }

    const auto peak = *std::max_element(glucose.begin(), glucose.end(), lowerGlucose);
    std::vector<GlucoseReading> afterPeak;
    std::copy_if(glucose.begin(), glucose.end(), std::back_inserter(afterPeak),
                 [&peak](const GlucoseReading &r) { return r.timestamp > peak.timestamp; });

    std::optional<GlucoseReading> nadir;
    if (!afterPeak.empty()) {
        nadir = *std::min_element(afterPeak.begin(), afterPeak.end(), lowerGlucose);
    }

    const double crashDelta = nadir ? peak.glucoseMgDL - nadir->glucoseMgDL : 0.0;
    const double crashSeverity = std::min(std::max(crashDelta, 0.0) / 60.0, 1.0);

    const double avgHrv = meanValue(hrv);
    double hrvDrop = 0.0;
    if (nadir && avgHrv > 0.0) {
        std::vector<PhysiologicalSample> postCrash;
        std::copy_if(hrv.begin(), hrv.end(), std::back_inserter(postCrash),
                     [&nadir](const PhysiologicalSample &s) { return s.timestamp > nadir->timestamp; });
        if (!postCrash.empty()) {
            hrvDrop = std::max((avgHrv - meanValue(postCrash)) / avgHrv, 0.0);
        }
    }

    const MealEvent *relatedMeal = nullptr;
    if (nadir) {
        for (const auto &meal : meals) {
            const auto delta = nadir->timestamp - meal.timestamp;
            if (delta > kAttributionWindowStart && delta < kAttributionWindowEnd) {
                relatedMeal = &meal;
                break;
            }
        }
    }

    const double mealAttribution = relatedMeal ? 1.0 : 0.0;
    const double score = crashSeverity * 0.5 + std::min(hrvDrop, 1.0) * 0.3 + mealAttribution * 0.2;

    observation.evidence[DebtType::Metabolic] = score;
    if (score > 0.7) {
        observation.evidence[DebtType::Digital] = -0.3;
    }
    observation.confidence = std::min(static_cast<double>(glucose.size()) / 12.0, 1.0);
    observation.detail = "Crash: " + std::to_string(static_cast<int>(crashDelta))
        + "mg/dL, HRV drop: " + std::to_string(static_cast<int>(hrvDrop * 100.0)) + "%, "
        + (relatedMeal ? "Meal: " + relatedMeal->displayName() : std::string("No meal attributed"));
    return observation;
}

} // namespace vita
