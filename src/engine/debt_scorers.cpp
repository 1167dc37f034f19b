#include "engine/debt_scorers.hpp"

#include <algorithm>

#include "engine/signal_math.hpp"

namespace vita {

namespace {

constexpr double kMaxScore = 100.0;
constexpr double kDefaultBaselineHrv = 50.0;

template <typename Rep, typename Period>
bool strictlyBetween(std::chrono::system_clock::duration delta,
                     std::chrono::duration<Rep, Period> low,
                     std::chrono::duration<Rep, Period> high)
{
    return delta > low && delta < high;
}

} // namespace

double MetabolicDebtScorer::score(const HealthDataStore &store,
                                  double windowHours,
                                  std::chrono::system_clock::time_point now) const
{
    const TimeWindow window = TimeWindow::lastHours(windowHours, now);
    const auto meals = store.queryMeals(window);
    const auto glucose = store.queryGlucose(window);
    const auto hrv = store.querySamples(MetricType::HrvSdnn, window);

    if (meals.empty()) {
        return 0.0;
    }

    const auto baseline = store.querySamples(MetricType::HrvSdnn,
                                             window.from - std::chrono::hours(24 * 7),
                                             window.from);
    const double avgBaseline = meanValue(baseline, kDefaultBaselineHrv);

    double totalDebt = 0.0;
    for (const auto &meal : meals) {
        const double glFactor = std::min(meal.glycemicLoad() / 50.0, 1.0);

        std::vector<GlucoseReading> postMeal;
        for (const auto &reading : glucose) {
            if (strictlyBetween(reading.timestamp - meal.timestamp,
                                std::chrono::minutes(0), std::chrono::minutes(150))) {
                postMeal.push_back(reading);
            }
        }
        double spikeMagnitude = 0.0;
        if (!postMeal.empty()) {
            const auto peak = std::max_element(postMeal.begin(), postMeal.end(),
                                               [](const GlucoseReading &a, const GlucoseReading &b) {
                                                   return a.glucoseMgDL < b.glucoseMgDL;
                                               });
            double nadir = peak->glucoseMgDL;
            for (const auto &reading : postMeal) {
                if (reading.timestamp > peak->timestamp) {
                    nadir = std::min(nadir, reading.glucoseMgDL);
                }
            }
            spikeMagnitude = std::min((peak->glucoseMgDL - nadir) / 80.0, 1.0);
        }

        std::vector<PhysiologicalSample> postMealHrv;
        for (const auto &sample : hrv) {
            if (strictlyBetween(sample.timestamp - meal.timestamp,
                                std::chrono::minutes(60), std::chrono::minutes(180))) {
                postMealHrv.push_back(sample);
            }
        }
        const double avgPostMealHrv = meanValue(postMealHrv, avgBaseline);
        const double hrvDrop = avgBaseline > 0.0
            ? std::max((avgBaseline - avgPostMealHrv) / avgBaseline, 0.0)
            : 0.0;

        double cookingModifier = 1.0;
        if (meal.bioavailabilityModifier) {
            cookingModifier = *meal.bioavailabilityModifier > 1.0 ? 0.8 : 1.2;
        }

        const double timingPenalty = localHour(meal.timestamp) >= 20 ? 1.3 : 1.0;

        const double mealDebt = glFactor * 0.3
            + spikeMagnitude * 0.3
            + hrvDrop * 0.25
            + (cookingModifier - 0.8) * 0.15;
        totalDebt += mealDebt * timingPenalty;
    }

    return std::min(totalDebt / static_cast<double>(meals.size()) * 100.0, kMaxScore);
}

double DigitalDebtScorer::score(const HealthDataStore &store,
                                double windowHours,
                                std::chrono::system_clock::time_point now) const
{
    const TimeWindow window = TimeWindow::lastHours(windowHours, now);
    const auto behaviors = store.queryBehaviors(window);
    const auto glucose = store.queryGlucose(window);

    std::vector<std::chrono::system_clock::time_point> crashTimes;
    for (const auto &reading : glucose) {
        if (reading.isCrash()) {
            crashTimes.push_back(reading.timestamp);
        }
    }

    bool anyPassive = false;
    double genuineMinutes = 0.0;
    double maxDopamineDebt = 0.0;
    for (const auto &event : behaviors) {
        if (!event.isPassive()) {
            continue;
        }
        anyPassive = true;
        maxDopamineDebt = std::max(maxDopamineDebt, event.dopamineDebtScore.value_or(0.0));

        const bool reactive = std::any_of(crashTimes.begin(), crashTimes.end(),
                                          [&event](std::chrono::system_clock::time_point crash) {
                                              return strictlyBetween(event.timestamp - crash,
                                                                     std::chrono::minutes(0),
                                                                     std::chrono::minutes(30));
                                          });
        if (!reactive) {
            genuineMinutes += event.minutes();
        }
    }
    if (!anyPassive) {
        return 0.0;
    }

    const double screenTimeFactor = std::min(genuineMinutes / 60.0, 1.0) * 60.0;
    const double dopamineFactor = maxDopamineDebt * 0.4;
    return std::min(screenTimeFactor + dopamineFactor, kMaxScore);
}

double SomaticStressScorer::score(const HealthDataStore &store,
                                  double windowHours,
                                  std::chrono::system_clock::time_point now) const
{
    const TimeWindow window = TimeWindow::lastHours(windowHours, now);

    double envScore = 0.0;
    const auto environment = store.queryEnvironment(window);
    if (!environment.empty()) {
        const auto worst = std::max_element(environment.begin(), environment.end(),
                                            [](const EnvironmentalCondition &a,
                                               const EnvironmentalCondition &b) {
                                                return a.aqiUS < b.aqiUS;
                                            });
        if (worst->aqiUS > 150) {
            envScore += 30.0;
        } else if (worst->aqiUS > 100) {
            envScore += 20.0;
        } else if (worst->aqiUS > 50) {
            envScore += 10.0;
        }

        if (worst->pollenIndex >= 10) {
            envScore += 15.0;
        } else if (worst->pollenIndex >= 8) {
            envScore += 10.0;
        }

        if (worst->temperatureCelsius > 38.0) {
            envScore += 15.0;
        } else if (worst->temperatureCelsius > 33.0 || worst->temperatureCelsius < 5.0) {
            envScore += 10.0;
        }
    }

    // Sleep is looked up from 12 hours before the window so last night counts.
    const auto sleep = store.querySamples(MetricType::SleepAnalysis,
                                          window.from - std::chrono::hours(12), window.to);
    const double totalSleepHours = sumValues(sleep);
    double sleepScore = 0.0;
    if (totalSleepHours < 5.0) {
        sleepScore = 30.0;
    } else if (totalSleepHours < 6.0) {
        sleepScore = 20.0;
    } else if (totalSleepHours < 6.5) {
        sleepScore = 15.0;
    } else if (totalSleepHours < 7.0) {
        sleepScore = 10.0;
    }

    double hrvScore = 0.0;
    const auto hrv = store.querySamples(MetricType::HrvSdnn, window);
    if (!hrv.empty()) {
        const double avg = meanValue(hrv);
        if (avg < 30.0) {
            hrvScore = 20.0;
        } else if (avg < 40.0) {
            hrvScore = 15.0;
        } else if (avg < 50.0) {
            hrvScore = 10.0;
        }
    }

    return std::min(envScore + sleepScore + hrvScore, kMaxScore);
}

} // namespace vita
