#include "engine/tools/digital_friction_analyzer.hpp"

#include <algorithm>
#include <iterator>

namespace vita {

namespace {

constexpr double kToolConfidence = 0.8;
constexpr double kReactiveMetabolicEvidence = 0.15;
constexpr auto kReactiveWindow = std::chrono::minutes(30);

} // namespace

std::string DigitalFrictionAnalyzer::name() const
{
    return "DigitalFrictionAnalyzer";
}

std::set<DebtType> DigitalFrictionAnalyzer::targetDebtTypes() const
{
    return {DebtType::Digital};
}

ToolObservation DigitalFrictionAnalyzer::analyze(const std::vector<Hypothesis> &,
                                                 const HealthDataStore &store,
                                                 const TimeWindow &window) const
{
    const auto behaviors = store.queryBehaviors(window);
    const auto glucose = store.queryGlucose(window);

    std::vector<BehavioralEvent> passive;
    std::copy_if(behaviors.begin(), behaviors.end(), std::back_inserter(passive),
                 [](const BehavioralEvent &event) { return event.isPassive(); });

    ToolObservation observation;
    observation.toolName = name();
    observation.confidence = kToolConfidence;

    if (passive.empty()) {
        observation.evidence[DebtType::Digital] = 0.0;
        observation.detail = "No passive screen time detected";
        return observation;
    }

    std::vector<std::chrono::system_clock::time_point> crashTimes;
    for (const auto &reading : glucose) {
        if (reading.isCrash()) {
            crashTimes.push_back(reading.timestamp);
        }
    }

    double genuineMinutes = 0.0;
    double reactiveMinutes = 0.0;
    for (const auto &event : passive) {
        const bool reactive = std::any_of(crashTimes.begin(), crashTimes.end(),
                                          [&event](std::chrono::system_clock::time_point crash) {
                                              const auto delta = event.timestamp - crash;
                                              return delta > std::chrono::system_clock::duration::zero()
                                                  && delta < kReactiveWindow;
                                          });
        if (reactive) {
            reactiveMinutes += event.minutes();
        } else {
            genuineMinutes += event.minutes();
        }
    }

    const double totalMinutes = genuineMinutes + reactiveMinutes;
    const double genuineRatio = totalMinutes > 0.0 ? genuineMinutes / totalMinutes : 0.0;
    observation.evidence[DebtType::Digital] = std::min(genuineMinutes / 60.0, 1.0) * genuineRatio;

    if (reactiveMinutes > genuineMinutes) {
        observation.evidence[DebtType::Metabolic] = kReactiveMetabolicEvidence;
    }

    observation.detail = "Genuine digital: " + std::to_string(static_cast<int>(genuineMinutes))
        + "min, Reactive scrolling: " + std::to_string(static_cast<int>(reactiveMinutes)) + "min";
    return observation;
}

} // namespace vita
