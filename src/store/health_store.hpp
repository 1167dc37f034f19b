#pragma once

#include <chrono>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "common/models.hpp"

namespace vita {

// Raised by a store when a query or write cannot be served. The reasoning
// core never catches it; callers see it unchanged.
class DataUnavailableError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Read/write access to the personal health graph: time-series records,
// physiological samples, and the persisted causal edges.
class HealthDataStore {
public:
    virtual ~HealthDataStore() = default;

    virtual std::vector<GlucoseReading> queryGlucose(
        std::chrono::system_clock::time_point from,
        std::chrono::system_clock::time_point to) const = 0;
    virtual std::vector<MealEvent> queryMeals(
        std::chrono::system_clock::time_point from,
        std::chrono::system_clock::time_point to) const = 0;
    virtual std::vector<BehavioralEvent> queryBehaviors(
        std::chrono::system_clock::time_point from,
        std::chrono::system_clock::time_point to) const = 0;
    virtual std::vector<EnvironmentalCondition> queryEnvironment(
        std::chrono::system_clock::time_point from,
        std::chrono::system_clock::time_point to) const = 0;
    virtual std::vector<PhysiologicalSample> querySamples(
        MetricType type,
        std::chrono::system_clock::time_point from,
        std::chrono::system_clock::time_point to) const = 0;

    virtual std::vector<CausalEdge> queryEdges(const std::string &fromNodeId) const = 0;
    virtual std::vector<CausalEdge> queryEdges(
        EdgeType type,
        std::chrono::system_clock::time_point from,
        std::chrono::system_clock::time_point to) const = 0;
    virtual std::vector<CausalEdge> listEdges() const = 0;

    // Inserts a new edge (assigning edge.id) or replaces the row with the
    // same id. Strength and confidence are clamped to [0, 1].
    virtual void addEdge(CausalEdge &edge) = 0;

    virtual void addGlucoseReading(GlucoseReading &reading) = 0;
    virtual void addMeal(MealEvent &meal) = 0;
    virtual void addBehavior(BehavioralEvent &event) = 0;
    virtual void addEnvironment(EnvironmentalCondition &condition) = 0;
    virtual void addSample(PhysiologicalSample &sample) = 0;

    virtual std::optional<std::string> getMeta(const std::string &key) const = 0;
    virtual void setMeta(const std::string &key, const std::string &value) = 0;

    std::vector<GlucoseReading> queryGlucose(const TimeWindow &window) const
    {
        return queryGlucose(window.from, window.to);
    }
    std::vector<MealEvent> queryMeals(const TimeWindow &window) const
    {
        return queryMeals(window.from, window.to);
    }
    std::vector<BehavioralEvent> queryBehaviors(const TimeWindow &window) const
    {
        return queryBehaviors(window.from, window.to);
    }
    std::vector<EnvironmentalCondition> queryEnvironment(const TimeWindow &window) const
    {
        return queryEnvironment(window.from, window.to);
    }
    std::vector<PhysiologicalSample> querySamples(MetricType type, const TimeWindow &window) const
    {
        return querySamples(type, window.from, window.to);
    }
};

} // namespace vita
