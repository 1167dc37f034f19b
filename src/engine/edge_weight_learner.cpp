#include "engine/edge_weight_learner.hpp"

#include <algorithm>
#include <string>

#include <nlohmann/json.hpp>

#include "common/json_utils.hpp"
#include "common/logging.hpp"

namespace vita {

namespace {

constexpr double kSpikeThresholdMgDL = 140.0;
constexpr double kHighGlycemicLoad = 25.0;
constexpr double kLowGlycemicLoad = 20.0;
constexpr double kMaxConfidence = 0.99;
constexpr auto kResponseWindowStart = std::chrono::minutes(30);
constexpr auto kResponseWindowEnd = std::chrono::minutes(120);

} // namespace

CausalEdge EdgeWeightLearner::updateEdge(const CausalEdge &edge,
                                         bool confirmed,
                                         HealthDataStore &store) const
{
    CausalEdge updated = edge;
    const double observationWeight = 1.0 / (1.0 + edge.confidence * 10.0);

    if (confirmed) {
        updated.causalStrength = edge.causalStrength + (1.0 - edge.causalStrength) * observationWeight;
        updated.confidence = std::min(edge.confidence + 0.02, kMaxConfidence);
    } else {
        updated.causalStrength = edge.causalStrength - edge.causalStrength * observationWeight;
        updated.confidence = std::min(edge.confidence + 0.01, kMaxConfidence);
    }
    // Never lower confidence, even for an edge loaded above the cap.
    updated.confidence = std::max(updated.confidence, edge.confidence);

    store.addEdge(updated);
    return updated;
}

BatchUpdateSummary EdgeWeightLearner::batchUpdate(HealthDataStore &store,
                                                  const TimeWindow &window) const
{
    const auto meals = store.queryMeals(window);
    const auto glucose = store.queryGlucose(window);

    BatchUpdateSummary summary;
    for (const auto &meal : meals) {
        if (meal.id <= 0) {
            continue;
        }
        ++summary.mealsScanned;

        std::vector<GlucoseReading> response;
        for (const auto &reading : glucose) {
            const auto delta = reading.timestamp - meal.timestamp;
            if (delta > kResponseWindowStart && delta < kResponseWindowEnd) {
                response.push_back(reading);
            }
        }
        if (response.empty()) {
            continue;
        }
        ++summary.mealsWithResponse;

        const auto peak = std::max_element(response.begin(), response.end(),
                                           [](const GlucoseReading &a, const GlucoseReading &b) {
                                               return a.glucoseMgDL < b.glucoseMgDL;
                                           });
        const double gl = meal.glycemicLoad();
        const bool spike = peak->glucoseMgDL > kSpikeThresholdMgDL;
        const bool confirmed = (gl > kHighGlycemicLoad && spike)
            || (gl < kLowGlycemicLoad && !spike);

        const std::string mealNodeId = "meal_" + std::to_string(meal.id);
        bool hasMealEdge = false;
        for (const auto &edge : store.queryEdges(mealNodeId)) {
            if (edge.edgeType != EdgeType::MealToGlucose) {
                continue;
            }
            hasMealEdge = true;
            updateEdge(edge, confirmed, store);
            ++summary.edgesUpdated;
        }

        if (!hasMealEdge && peak->id > 0) {
            CausalEdge created;
            created.sourceNodeId = mealNodeId;
            created.targetNodeId = "glucose_" + std::to_string(peak->id);
            created.sourceType = NodeType::Meal;
            created.targetType = NodeType::Glucose;
            created.edgeType = EdgeType::MealToGlucose;
            created.causalStrength = spike ? 0.6 : 0.3;
            created.temporalOffsetSeconds = std::chrono::duration<double>(
                peak->timestamp - meal.timestamp).count();
            created.confidence = 0.3;
            created.createdAt = std::chrono::system_clock::now();
            store.addEdge(created);
            ++summary.edgesCreated;
        }
    }

    store.setMeta("last_edge_update", toIso8601Utc(std::chrono::system_clock::now()));

    VLOG_INFO(QStringLiteral("EdgeWeightLearner"),
              QStringLiteral("batchUpdate"),
              QStringLiteral("edge_batch_update_complete"),
              QStringLiteral("graph_update"),
              QStringLiteral("meal_glucose_pairs"),
              vita::logging::defaultWho(),
              QString(),
              (nlohmann::json{{"meals", summary.mealsScanned},
                              {"withResponse", summary.mealsWithResponse},
                              {"updated", summary.edgesUpdated},
                              {"created", summary.edgesCreated}}));
    return summary;
}

} // namespace vita
