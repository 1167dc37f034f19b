#pragma once

#include <cstddef>

#include "common/models.hpp"
#include "store/health_store.hpp"

namespace vita {

struct BatchUpdateSummary {
    std::size_t mealsScanned = 0;
    std::size_t mealsWithResponse = 0;
    std::size_t edgesUpdated = 0;
    std::size_t edgesCreated = 0;
};

// Online edge-weight updates. Confident edges move less per observation:
// w = 1 / (1 + confidence * 10).
class EdgeWeightLearner
{
public:
    // Confirmed observations pull strength toward 1, disconfirmed toward 0.
    // Confidence grows either way and is capped at 0.99. The updated edge
    // is written back through the store and returned.
    CausalEdge updateEdge(const CausalEdge &edge, bool confirmed, HealthDataStore &store) const;

    // Scans meal -> glucose responses in the window and confirms, disconfirms
    // or creates the meal_to_glucose edge for each meal.
    BatchUpdateSummary batchUpdate(HealthDataStore &store, const TimeWindow &window) const;
};

} // namespace vita
