#include "engine/tools/inflammation_tracker.hpp"

#include <algorithm>

#include "engine/signal_math.hpp"

namespace vita {

namespace {

constexpr double kPopulationHrvMs = 50.0;
constexpr double kPopulationRestingHr = 65.0;
constexpr auto kBaselineSpan = std::chrono::hours(24 * 7);
constexpr auto kPostPrandialStart = std::chrono::minutes(60);
constexpr auto kPostPrandialEnd = std::chrono::minutes(120);

} // namespace

std::string InflammationTracker::name() const
{
    return "InflammationTracker";
}

std::set<DebtType> InflammationTracker::targetDebtTypes() const
{
    return {DebtType::Metabolic, DebtType::Somatic};
}

ToolObservation InflammationTracker::analyze(const std::vector<Hypothesis> &,
                                             const HealthDataStore &store,
                                             const TimeWindow &window) const
{
    const auto baselineStart = window.from - kBaselineSpan;

    const auto baselineHrv = store.querySamples(MetricType::HrvSdnn, baselineStart, window.from);
    const double avgBaselineHrv = meanValue(baselineHrv, kPopulationHrvMs);
    const auto currentHrv = store.querySamples(MetricType::HrvSdnn, window);
    const double avgCurrentHrv = meanValue(currentHrv, avgBaselineHrv);
    const double hrvDeviation = avgBaselineHrv > 0.0
        ? std::max((avgBaselineHrv - avgCurrentHrv) / avgBaselineHrv, 0.0)
        : 0.0;

    const auto baselineHr = store.querySamples(MetricType::RestingHeartRate, baselineStart, window.from);
    const double avgBaselineHr = meanValue(baselineHr, kPopulationRestingHr);
    const auto currentHr = store.querySamples(MetricType::RestingHeartRate, window);
    const double avgCurrentHr = meanValue(currentHr, avgBaselineHr);
    const double hrElevation = avgBaselineHr > 0.0
        ? std::max((avgCurrentHr - avgBaselineHr) / avgBaselineHr, 0.0)
        : 0.0;

    double postPrandialScore = 0.0;
    for (const auto &meal : store.queryMeals(window)) {
        std::vector<PhysiologicalSample> postMeal;
        for (const auto &sample : currentHrv) {
            const auto delta = sample.timestamp - meal.timestamp;
            if (delta > kPostPrandialStart && delta < kPostPrandialEnd) {
                postMeal.push_back(sample);
            }
        }
        if (postMeal.empty()) {
            continue;
        }
        const double avg = meanValue(postMeal);
        if (avg < avgBaselineHrv * 0.8) {
            postPrandialScore = std::max(postPrandialScore, (avgBaselineHrv - avg) / avgBaselineHrv);
        }
    }

    const double score = hrvDeviation * 0.4 + postPrandialScore * 0.4 + hrElevation * 0.2;

    ToolObservation observation;
    observation.toolName = name();
    observation.evidence[DebtType::Metabolic] = score * 0.6;
    observation.evidence[DebtType::Somatic] = score * 0.4;
    observation.confidence = std::min(
        static_cast<double>(currentHrv.size() + baselineHrv.size()) / 20.0, 1.0);
    observation.detail = "HRV deviation: " + std::to_string(static_cast<int>(hrvDeviation * 100.0))
        + "%, Post-prandial: " + std::to_string(static_cast<int>(postPrandialScore * 100.0))
        + "%, HR elevation: " + std::to_string(static_cast<int>(hrElevation * 100.0)) + "%";
    return observation;
}

} // namespace vita
