#pragma once

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "common/enums.hpp"

namespace vita {

// Scores, strengths and confidences all live in [0, 1].
inline double clampUnit(double value)
{
    return std::clamp(value, 0.0, 1.0);
}

// Closed time range [from, to] used by every store query.
struct TimeWindow {
    std::chrono::system_clock::time_point from;
    std::chrono::system_clock::time_point to;

    static TimeWindow lastHours(double hours,
                                std::chrono::system_clock::time_point now
                                = std::chrono::system_clock::now())
    {
        const auto span = std::chrono::duration_cast<std::chrono::system_clock::duration>(
            std::chrono::duration<double, std::ratio<3600>>(hours));
        return TimeWindow{now - span, now};
    }

    bool contains(std::chrono::system_clock::time_point t) const
    {
        return t >= from && t <= to;
    }
};

struct GlucoseReading {
    int64_t id = 0;
    double glucoseMgDL = 0.0;
    std::chrono::system_clock::time_point timestamp;
    GlucoseTrend trend = GlucoseTrend::Stable;
    EnergyState energyState = EnergyState::Stable;
    std::optional<int64_t> relatedMealEventId;

    bool isCrash() const
    {
        return energyState == EnergyState::Crashing
            || energyState == EnergyState::ReactiveLow;
    }
};

struct Ingredient {
    std::string name;
    std::optional<double> quantityGrams;
    std::optional<double> glycemicIndex;
    std::string type;
};

struct MealEvent {
    int64_t id = 0;
    std::chrono::system_clock::time_point timestamp;
    std::string source;
    std::vector<Ingredient> ingredients;
    std::string cookingMethod;
    std::optional<double> estimatedGlycemicLoad;
    std::optional<double> bioavailabilityModifier;

    // Sum of GI * grams * 0.7 / 100 over ingredients that carry both values.
    double computedGlycemicLoad() const
    {
        double total = 0.0;
        for (const auto &ingredient : ingredients) {
            if (ingredient.glycemicIndex && ingredient.quantityGrams) {
                total += *ingredient.glycemicIndex * *ingredient.quantityGrams * 0.7 / 100.0;
            }
        }
        return total;
    }

    double glycemicLoad() const
    {
        return estimatedGlycemicLoad ? *estimatedGlycemicLoad : computedGlycemicLoad();
    }

    std::string displayName() const
    {
        if (!ingredients.empty()) {
            return ingredients.front().name;
        }
        return source.empty() ? std::string("meal") : source;
    }
};

struct BehavioralEvent {
    int64_t id = 0;
    std::chrono::system_clock::time_point timestamp;
    double durationSeconds = 0.0;
    BehaviorCategory category = BehaviorCategory::ActiveWork;
    std::string appName;
    std::optional<double> dopamineDebtScore;

    bool isPassive() const
    {
        return category == BehaviorCategory::PassiveConsumption
            || category == BehaviorCategory::ZombieScrolling;
    }

    double minutes() const
    {
        return durationSeconds / 60.0;
    }
};

struct EnvironmentalCondition {
    int64_t id = 0;
    std::chrono::system_clock::time_point timestamp;
    double temperatureCelsius = 20.0;
    double humidity = 50.0;
    int aqiUS = 0;
    double uvIndex = 0.0;
    int pollenIndex = 0;
};

struct PhysiologicalSample {
    int64_t id = 0;
    MetricType metricType = MetricType::HrvSdnn;
    double value = 0.0;
    std::string unit;
    std::chrono::system_clock::time_point timestamp;
};

// Persisted directed edge between two typed nodes. Node ids carry a category
// prefix (meal_, glucose_, ...). sourceType/targetType are set by the creator
// and take precedence over the prefix when present.
struct CausalEdge {
    std::optional<int64_t> id;
    std::string sourceNodeId;
    std::string targetNodeId;
    std::optional<NodeType> sourceType;
    std::optional<NodeType> targetType;
    EdgeType edgeType = EdgeType::Causal;
    double causalStrength = 0.0;
    double temporalOffsetSeconds = 0.0;
    double confidence = 0.0;
    std::chrono::system_clock::time_point createdAt;

    bool isStrongCausal() const
    {
        return causalStrength >= 0.7 && confidence >= 0.6;
    }
};

struct Hypothesis {
    DebtType debtType = DebtType::Metabolic;
    std::string description;
    double confidence = 0.0;
    std::vector<std::string> causalChain;
    std::vector<std::string> supportingEvidence;
    std::vector<std::string> contradictingEvidence;
    double priorProbability = 0.33;
};

struct ToolObservation {
    std::string toolName;
    std::map<DebtType, double> evidence;
    double confidence = 0.0;
    std::string detail;
};

// Working memory of a single reasoning session.
struct AgentState {
    std::string symptom;
    std::vector<Hypothesis> hypotheses;
    std::vector<ToolObservation> observations;
    bool isResolved = false;
    TimeWindow analysisWindow;
};

struct CausalExplanation {
    std::string symptom;
    std::vector<std::string> causalChain;
    double strength = 0.0;
    double confidence = 0.0;
    std::string narrative;
};

struct Counterfactual {
    std::string description;
    double impact = 0.0;
    Effort effort = Effort::Moderate;
    double confidence = 0.0;
};

struct RankedDebt {
    DebtType type = DebtType::Metabolic;
    double score = 0.0;
    double rawScore = 0.0;
};

struct PhaseConfig {
    bool useReAct = false;
    bool useRules = true;
    bool useLLM = false;
    int maxTools = 0;
};

} // namespace vita
