#include "engine/tools/environmental_stress_analyzer.hpp"

#include <algorithm>

#include "engine/signal_math.hpp"

namespace vita {

namespace {

constexpr auto kBaselineSpan = std::chrono::hours(24 * 7);

double aqiScore(int aqi)
{
    if (aqi > 150) {
        return 0.8;
    }
    if (aqi > 100) {
        return 0.5;
    }
    if (aqi > 50) {
        return 0.2;
    }
    return 0.0;
}

double pollenScore(int pollen)
{
    if (pollen >= 10) {
        return 0.7;
    }
    if (pollen >= 8) {
        return 0.5;
    }
    if (pollen >= 5) {
        return 0.2;
    }
    return 0.0;
}

double temperatureScore(double celsius)
{
    if (celsius > 38.0) {
        return 0.7;
    }
    if (celsius > 33.0) {
        return 0.4;
    }
    if (celsius < 5.0) {
        return 0.3;
    }
    return 0.0;
}

} // namespace

std::string EnvironmentalStressAnalyzer::name() const
{
    return "EnvironmentalStressAnalyzer";
}

std::set<DebtType> EnvironmentalStressAnalyzer::targetDebtTypes() const
{
    return {DebtType::Somatic};
}

ToolObservation EnvironmentalStressAnalyzer::analyze(const std::vector<Hypothesis> &,
                                                     const HealthDataStore &store,
                                                     const TimeWindow &window) const
{
    const auto environment = store.queryEnvironment(window);

    ToolObservation observation;
    observation.toolName = name();

    if (environment.empty()) {
        observation.evidence[DebtType::Somatic] = 0.0;
        observation.confidence = 0.3;
        observation.detail = "No environmental data available";
        return observation;
    }

    int maxAqi = 0;
    int maxPollen = 0;
    double maxTemp = environment.front().temperatureCelsius;
    double maxUv = 0.0;
    for (const auto &condition : environment) {
        maxAqi = std::max(maxAqi, condition.aqiUS);
        maxPollen = std::max(maxPollen, condition.pollenIndex);
        maxTemp = std::max(maxTemp, condition.temperatureCelsius);
        maxUv = std::max(maxUv, condition.uvIndex);
    }

    const double aqi = aqiScore(maxAqi);
    const double pollen = pollenScore(maxPollen);
    const double heat = temperatureScore(maxTemp);
    const double uv = maxUv > 7.0 ? 0.2 : 0.0;
    const double environmentalScore = std::max({aqi, pollen, heat}) * 0.6
        + std::min(aqi + pollen + heat + uv, 1.0) * 0.4;

    const auto hrv = store.querySamples(MetricType::HrvSdnn, window);
    const auto baselineHrv = store.querySamples(MetricType::HrvSdnn,
                                                window.from - kBaselineSpan, window.from);
    double hrvConfirmation = 0.0;
    if (!hrv.empty() && !baselineHrv.empty()) {
        const double baseline = meanValue(baselineHrv);
        if (baseline > 0.0) {
            const double drop = (baseline - meanValue(hrv)) / baseline;
            if (drop > 0.1) {
                hrvConfirmation = std::min(drop, 0.3);
            }
        }
    }

    observation.evidence[DebtType::Somatic] = std::min(environmentalScore + hrvConfirmation, 1.0);
    observation.confidence = 0.7;
    observation.detail = "AQI: " + std::to_string(maxAqi) + " (" + formatFixed(aqi * 100.0, 0)
        + "%), Pollen: " + std::to_string(maxPollen) + ", Temp: " + formatFixed(maxTemp, 0) + "C";
    return observation;
}

} // namespace vita
