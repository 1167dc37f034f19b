#include "engine/maturity_tracker.hpp"

#include <nlohmann/json.hpp>

#include "common/json_utils.hpp"
#include "common/logging.hpp"

namespace vita {

namespace {

constexpr std::size_t kMinRecentGlucose = 50;
constexpr std::size_t kMinMeals = 14;
constexpr double kMinEdgeConfidence = 0.5;
constexpr std::size_t kMinHistoricGlucose = 100;

constexpr auto kDay = std::chrono::hours(24);

} // namespace

EngineMaturityTracker::EngineMaturityTracker(const HealthDataStore &store)
    : m_store(store)
{
}

MaturityPhase EngineMaturityTracker::currentPhase() const
{
    return phaseAt(std::chrono::system_clock::now());
}

MaturityPhase EngineMaturityTracker::phaseAt(std::chrono::system_clock::time_point now) const
{
    const auto twoWeeksAgo = now - 14 * kDay;
    const auto fourWeeksAgo = now - 28 * kDay;
    const auto eightWeeksAgo = now - 56 * kDay;

    const auto recentGlucose = m_store.queryGlucose(twoWeeksAgo, now);
    const auto meals = m_store.queryMeals(eightWeeksAgo, now);
    if (recentGlucose.size() < kMinRecentGlucose || meals.size() < kMinMeals) {
        return MaturityPhase::Passive;
    }

    const auto edges = m_store.queryEdges(EdgeType::MealToGlucose, fourWeeksAgo, now);
    double avgConfidence = 0.0;
    if (!edges.empty()) {
        for (const auto &edge : edges) {
            avgConfidence += edge.confidence;
        }
        avgConfidence /= static_cast<double>(edges.size());
    }
    if (avgConfidence < kMinEdgeConfidence) {
        return MaturityPhase::Correlation;
    }

    const auto olderGlucose = m_store.queryGlucose(eightWeeksAgo, fourWeeksAgo);
    if (olderGlucose.size() < kMinHistoricGlucose) {
        return MaturityPhase::Causal;
    }
    return MaturityPhase::Active;
}

PhaseConfig EngineMaturityTracker::phaseConfig() const
{
    const MaturityPhase phase = currentPhase();
    VLOG_DEBUG(QStringLiteral("EngineMaturityTracker"),
               QStringLiteral("phaseConfig"),
               QStringLiteral("phase_resolved"),
               QStringLiteral("reasoning_tier_selection"),
               QStringLiteral("data_density"),
               vita::logging::defaultWho(),
               QString(),
               (nlohmann::json{{"phase", toMaturityPhaseString(phase)}}));
    return configFor(phase);
}

PhaseConfig EngineMaturityTracker::configFor(MaturityPhase phase)
{
    switch (phase) {
    case MaturityPhase::Passive:
        return PhaseConfig{false, true, false, 0};
    case MaturityPhase::Correlation:
        return PhaseConfig{false, true, false, 1};
    case MaturityPhase::Causal:
        return PhaseConfig{true, true, false, 3};
    case MaturityPhase::Active:
        return PhaseConfig{true, true, true, 3};
    }
    return PhaseConfig{false, true, false, 0};
}

} // namespace vita
