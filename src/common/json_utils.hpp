#pragma once

#include <chrono>
#include <ctime>
#include <iomanip>
#include <optional>
#include <sstream>
#include <string>
#include <utility>

#include <nlohmann/json.hpp>

#include "common/models.hpp"

namespace vita {

inline std::string toIso8601Utc(std::chrono::system_clock::time_point timestamp)
{
    std::time_t time = std::chrono::system_clock::to_time_t(timestamp);
    std::tm tm{};
#if defined(_WIN32)
    gmtime_s(&tm, &time);
#else
    gmtime_r(&time, &tm);
#endif
    std::ostringstream out;
    out << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
    return out.str();
}

inline std::chrono::system_clock::time_point fromIso8601Utc(const std::string &value)
{
    std::tm tm{};
    std::istringstream in(value);
    in >> std::get_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
    if (in.fail()) {
        return std::chrono::system_clock::time_point{};
    }
#if defined(_WIN32)
    std::time_t time = _mkgmtime(&tm);
#else
    std::time_t time = timegm(&tm);
#endif
    if (time == static_cast<std::time_t>(-1)) {
        return std::chrono::system_clock::time_point{};
    }
    return std::chrono::system_clock::from_time_t(time);
}

inline std::string toDebtTypeString(DebtType type)
{
    switch (type) {
    case DebtType::Metabolic:
        return "metabolic";
    case DebtType::Digital:
        return "digital";
    case DebtType::Somatic:
        return "somatic";
    }
    return "metabolic";
}

inline std::optional<DebtType> parseDebtTypeString(const std::string &value)
{
    if (value == "metabolic") {
        return DebtType::Metabolic;
    }
    if (value == "digital") {
        return DebtType::Digital;
    }
    if (value == "somatic") {
        return DebtType::Somatic;
    }
    return std::nullopt;
}

inline std::string toNodeTypeString(NodeType type)
{
    switch (type) {
    case NodeType::Meal:
        return "meal";
    case NodeType::Environmental:
        return "environmental";
    case NodeType::Behavioral:
        return "behavioral";
    case NodeType::Glucose:
        return "glucose";
    case NodeType::Physiological:
        return "physiological";
    case NodeType::Symptom:
        return "symptom";
    }
    return "symptom";
}

inline std::optional<NodeType> parseNodeTypeString(const std::string &value)
{
    if (value == "meal") {
        return NodeType::Meal;
    }
    if (value == "environmental") {
        return NodeType::Environmental;
    }
    if (value == "behavioral") {
        return NodeType::Behavioral;
    }
    if (value == "glucose") {
        return NodeType::Glucose;
    }
    if (value == "physiological") {
        return NodeType::Physiological;
    }
    if (value == "symptom") {
        return NodeType::Symptom;
    }
    return std::nullopt;
}

inline std::string toEdgeTypeString(EdgeType type)
{
    switch (type) {
    case EdgeType::MealToGlucose:
        return "meal_to_glucose";
    case EdgeType::GlucoseToHrv:
        return "glucose_to_hrv";
    case EdgeType::GlucoseToEnergy:
        return "glucose_to_energy";
    case EdgeType::BehaviorToHrv:
        return "behavior_to_hrv";
    case EdgeType::MealToSleep:
        return "meal_to_sleep";
    case EdgeType::BehaviorToSleep:
        return "behavior_to_sleep";
    case EdgeType::EnvironmentToHrv:
        return "environment_to_hrv";
    case EdgeType::EnvironmentToSleep:
        return "environment_to_sleep";
    case EdgeType::EnvironmentToDigestion:
        return "environment_to_digestion";
    case EdgeType::BehaviorToMeal:
        return "behavior_to_meal";
    case EdgeType::MealToSkin:
        return "meal_to_skin";
    case EdgeType::SleepToSkin:
        return "sleep_to_skin";
    case EdgeType::BehaviorToSkin:
        return "behavior_to_skin";
    case EdgeType::EnvironmentToSkin:
        return "environment_to_skin";
    case EdgeType::SkinToSymptom:
        return "skin_to_symptom";
    case EdgeType::Temporal:
        return "temporal";
    case EdgeType::Causal:
        return "causal";
    }
    return "causal";
}

inline EdgeType parseEdgeTypeString(const std::string &value)
{
    static const std::pair<const char *, EdgeType> kEdgeTypes[] = {
        {"meal_to_glucose", EdgeType::MealToGlucose},
        {"glucose_to_hrv", EdgeType::GlucoseToHrv},
        {"glucose_to_energy", EdgeType::GlucoseToEnergy},
        {"behavior_to_hrv", EdgeType::BehaviorToHrv},
        {"meal_to_sleep", EdgeType::MealToSleep},
        {"behavior_to_sleep", EdgeType::BehaviorToSleep},
        {"environment_to_hrv", EdgeType::EnvironmentToHrv},
        {"environment_to_sleep", EdgeType::EnvironmentToSleep},
        {"environment_to_digestion", EdgeType::EnvironmentToDigestion},
        {"behavior_to_meal", EdgeType::BehaviorToMeal},
        {"meal_to_skin", EdgeType::MealToSkin},
        {"sleep_to_skin", EdgeType::SleepToSkin},
        {"behavior_to_skin", EdgeType::BehaviorToSkin},
        {"environment_to_skin", EdgeType::EnvironmentToSkin},
        {"skin_to_symptom", EdgeType::SkinToSymptom},
        {"temporal", EdgeType::Temporal},
        {"causal", EdgeType::Causal},
    };
    for (const auto &entry : kEdgeTypes) {
        if (value == entry.first) {
            return entry.second;
        }
    }
    return EdgeType::Causal;
}

inline std::string toGlucoseTrendString(GlucoseTrend trend)
{
    switch (trend) {
    case GlucoseTrend::RapidlyRising:
        return "rapidly_rising";
    case GlucoseTrend::Rising:
        return "rising";
    case GlucoseTrend::Stable:
        return "stable";
    case GlucoseTrend::Falling:
        return "falling";
    case GlucoseTrend::RapidlyFalling:
        return "rapidly_falling";
    }
    return "stable";
}

inline GlucoseTrend parseGlucoseTrendString(const std::string &value)
{
    if (value == "rapidly_rising") {
        return GlucoseTrend::RapidlyRising;
    }
    if (value == "rising") {
        return GlucoseTrend::Rising;
    }
    if (value == "falling") {
        return GlucoseTrend::Falling;
    }
    if (value == "rapidly_falling") {
        return GlucoseTrend::RapidlyFalling;
    }
    return GlucoseTrend::Stable;
}

inline std::string toEnergyStateString(EnergyState state)
{
    switch (state) {
    case EnergyState::Stable:
        return "stable";
    case EnergyState::Rising:
        return "rising";
    case EnergyState::Crashing:
        return "crashing";
    case EnergyState::ReactiveLow:
        return "reactive_low";
    }
    return "stable";
}

inline EnergyState parseEnergyStateString(const std::string &value)
{
    if (value == "rising") {
        return EnergyState::Rising;
    }
    if (value == "crashing") {
        return EnergyState::Crashing;
    }
    if (value == "reactive_low") {
        return EnergyState::ReactiveLow;
    }
    return EnergyState::Stable;
}

inline std::string toBehaviorCategoryString(BehaviorCategory category)
{
    switch (category) {
    case BehaviorCategory::ActiveWork:
        return "active_work";
    case BehaviorCategory::PassiveConsumption:
        return "passive_consumption";
    case BehaviorCategory::ZombieScrolling:
        return "zombie_scrolling";
    case BehaviorCategory::StressSignal:
        return "stress_signal";
    case BehaviorCategory::Exercise:
        return "exercise";
    case BehaviorCategory::Rest:
        return "rest";
    }
    return "active_work";
}

inline BehaviorCategory parseBehaviorCategoryString(const std::string &value)
{
    if (value == "passive_consumption") {
        return BehaviorCategory::PassiveConsumption;
    }
    if (value == "zombie_scrolling") {
        return BehaviorCategory::ZombieScrolling;
    }
    if (value == "stress_signal") {
        return BehaviorCategory::StressSignal;
    }
    if (value == "exercise") {
        return BehaviorCategory::Exercise;
    }
    if (value == "rest") {
        return BehaviorCategory::Rest;
    }
    return BehaviorCategory::ActiveWork;
}

inline std::string toMetricTypeString(MetricType type)
{
    switch (type) {
    case MetricType::HrvSdnn:
        return "hrv_sdnn";
    case MetricType::RestingHeartRate:
        return "resting_hr";
    case MetricType::SleepAnalysis:
        return "sleep_analysis";
    case MetricType::BloodGlucose:
        return "blood_glucose";
    case MetricType::BloodOxygen:
        return "blood_oxygen";
    case MetricType::RespiratoryRate:
        return "respiratory_rate";
    case MetricType::ActiveEnergy:
        return "active_energy";
    case MetricType::StepCount:
        return "step_count";
    }
    return "hrv_sdnn";
}

inline std::optional<MetricType> parseMetricTypeString(const std::string &value)
{
    static const std::pair<const char *, MetricType> kMetricTypes[] = {
        {"hrv_sdnn", MetricType::HrvSdnn},
        {"resting_hr", MetricType::RestingHeartRate},
        {"sleep_analysis", MetricType::SleepAnalysis},
        {"blood_glucose", MetricType::BloodGlucose},
        {"blood_oxygen", MetricType::BloodOxygen},
        {"respiratory_rate", MetricType::RespiratoryRate},
        {"active_energy", MetricType::ActiveEnergy},
        {"step_count", MetricType::StepCount},
    };
    for (const auto &entry : kMetricTypes) {
        if (value == entry.first) {
            return entry.second;
        }
    }
    return std::nullopt;
}

inline std::string toEffortString(Effort effort)
{
    switch (effort) {
    case Effort::Trivial:
        return "trivial";
    case Effort::Moderate:
        return "moderate";
    case Effort::Significant:
        return "significant";
    }
    return "moderate";
}

inline Effort parseEffortString(const std::string &value)
{
    if (value == "trivial") {
        return Effort::Trivial;
    }
    if (value == "significant") {
        return Effort::Significant;
    }
    return Effort::Moderate;
}

inline std::string toMaturityPhaseString(MaturityPhase phase)
{
    switch (phase) {
    case MaturityPhase::Passive:
        return "passive";
    case MaturityPhase::Correlation:
        return "correlation";
    case MaturityPhase::Causal:
        return "causal";
    case MaturityPhase::Active:
        return "active";
    }
    return "passive";
}

inline void to_json(nlohmann::json &j, const DebtType &type)
{
    j = toDebtTypeString(type);
}

inline void from_json(const nlohmann::json &j, DebtType &type)
{
    const auto parsed = j.is_string()
        ? parseDebtTypeString(j.get<std::string>())
        : std::nullopt;
    type = parsed.value_or(DebtType::Metabolic);
}

inline void to_json(nlohmann::json &j, const GlucoseReading &reading)
{
    j = nlohmann::json{
        {"id", reading.id},
        {"glucoseMgDL", reading.glucoseMgDL},
        {"timestamp", toIso8601Utc(reading.timestamp)},
        {"trend", toGlucoseTrendString(reading.trend)},
        {"energyState", toEnergyStateString(reading.energyState)}
    };
    if (reading.relatedMealEventId) {
        j["relatedMealEventId"] = *reading.relatedMealEventId;
    }
}

inline void from_json(const nlohmann::json &j, GlucoseReading &reading)
{
    reading.id = j.value("id", static_cast<int64_t>(0));
    reading.glucoseMgDL = j.value("glucoseMgDL", 0.0);
    reading.timestamp = fromIso8601Utc(j.value("timestamp", ""));
    reading.trend = parseGlucoseTrendString(j.value("trend", "stable"));
    reading.energyState = parseEnergyStateString(j.value("energyState", "stable"));
    if (j.contains("relatedMealEventId") && j.at("relatedMealEventId").is_number_integer()) {
        reading.relatedMealEventId = j.at("relatedMealEventId").get<int64_t>();
    } else {
        reading.relatedMealEventId.reset();
    }
}

inline void to_json(nlohmann::json &j, const Ingredient &ingredient)
{
    j = nlohmann::json{{"name", ingredient.name}, {"type", ingredient.type}};
    if (ingredient.quantityGrams) {
        j["quantityGrams"] = *ingredient.quantityGrams;
    }
    if (ingredient.glycemicIndex) {
        j["glycemicIndex"] = *ingredient.glycemicIndex;
    }
}

inline void from_json(const nlohmann::json &j, Ingredient &ingredient)
{
    ingredient.name = j.value("name", "");
    ingredient.type = j.value("type", "");
    if (j.contains("quantityGrams") && j.at("quantityGrams").is_number()) {
        ingredient.quantityGrams = j.at("quantityGrams").get<double>();
    } else {
        ingredient.quantityGrams.reset();
    }
    if (j.contains("glycemicIndex") && j.at("glycemicIndex").is_number()) {
        ingredient.glycemicIndex = j.at("glycemicIndex").get<double>();
    } else {
        ingredient.glycemicIndex.reset();
    }
}

inline void to_json(nlohmann::json &j, const MealEvent &meal)
{
    j = nlohmann::json{
        {"id", meal.id},
        {"timestamp", toIso8601Utc(meal.timestamp)},
        {"source", meal.source},
        {"ingredients", meal.ingredients},
        {"cookingMethod", meal.cookingMethod}
    };
    if (meal.estimatedGlycemicLoad) {
        j["estimatedGlycemicLoad"] = *meal.estimatedGlycemicLoad;
    }
    if (meal.bioavailabilityModifier) {
        j["bioavailabilityModifier"] = *meal.bioavailabilityModifier;
    }
}

inline void from_json(const nlohmann::json &j, MealEvent &meal)
{
    meal.id = j.value("id", static_cast<int64_t>(0));
    meal.timestamp = fromIso8601Utc(j.value("timestamp", ""));
    meal.source = j.value("source", "");
    meal.cookingMethod = j.value("cookingMethod", "");
    if (j.contains("ingredients") && j.at("ingredients").is_array()) {
        meal.ingredients = j.at("ingredients").get<std::vector<Ingredient>>();
    } else {
        meal.ingredients.clear();
    }
    if (j.contains("estimatedGlycemicLoad") && j.at("estimatedGlycemicLoad").is_number()) {
        meal.estimatedGlycemicLoad = j.at("estimatedGlycemicLoad").get<double>();
    } else {
        meal.estimatedGlycemicLoad.reset();
    }
    if (j.contains("bioavailabilityModifier") && j.at("bioavailabilityModifier").is_number()) {
        meal.bioavailabilityModifier = j.at("bioavailabilityModifier").get<double>();
    } else {
        meal.bioavailabilityModifier.reset();
    }
}

inline void to_json(nlohmann::json &j, const BehavioralEvent &event)
{
    j = nlohmann::json{
        {"id", event.id},
        {"timestamp", toIso8601Utc(event.timestamp)},
        {"durationSeconds", event.durationSeconds},
        {"category", toBehaviorCategoryString(event.category)},
        {"appName", event.appName}
    };
    if (event.dopamineDebtScore) {
        j["dopamineDebtScore"] = *event.dopamineDebtScore;
    }
}

inline void from_json(const nlohmann::json &j, BehavioralEvent &event)
{
    event.id = j.value("id", static_cast<int64_t>(0));
    event.timestamp = fromIso8601Utc(j.value("timestamp", ""));
    event.durationSeconds = j.value("durationSeconds", 0.0);
    event.category = parseBehaviorCategoryString(j.value("category", "active_work"));
    event.appName = j.value("appName", "");
    if (j.contains("dopamineDebtScore") && j.at("dopamineDebtScore").is_number()) {
        event.dopamineDebtScore = j.at("dopamineDebtScore").get<double>();
    } else {
        event.dopamineDebtScore.reset();
    }
}

inline void to_json(nlohmann::json &j, const EnvironmentalCondition &condition)
{
    j = nlohmann::json{
        {"id", condition.id},
        {"timestamp", toIso8601Utc(condition.timestamp)},
        {"temperatureCelsius", condition.temperatureCelsius},
        {"humidity", condition.humidity},
        {"aqiUS", condition.aqiUS},
        {"uvIndex", condition.uvIndex},
        {"pollenIndex", condition.pollenIndex}
    };
}

inline void from_json(const nlohmann::json &j, EnvironmentalCondition &condition)
{
    condition.id = j.value("id", static_cast<int64_t>(0));
    condition.timestamp = fromIso8601Utc(j.value("timestamp", ""));
    condition.temperatureCelsius = j.value("temperatureCelsius", 20.0);
    condition.humidity = j.value("humidity", 50.0);
    condition.aqiUS = j.value("aqiUS", 0);
    condition.uvIndex = j.value("uvIndex", 0.0);
    condition.pollenIndex = j.value("pollenIndex", 0);
}

inline void to_json(nlohmann::json &j, const PhysiologicalSample &sample)
{
    j = nlohmann::json{
        {"id", sample.id},
        {"metricType", toMetricTypeString(sample.metricType)},
        {"value", sample.value},
        {"unit", sample.unit},
        {"timestamp", toIso8601Utc(sample.timestamp)}
    };
}

inline void from_json(const nlohmann::json &j, PhysiologicalSample &sample)
{
    sample.id = j.value("id", static_cast<int64_t>(0));
    sample.metricType = parseMetricTypeString(j.value("metricType", "hrv_sdnn"))
        .value_or(MetricType::HrvSdnn);
    sample.value = j.value("value", 0.0);
    sample.unit = j.value("unit", "");
    sample.timestamp = fromIso8601Utc(j.value("timestamp", ""));
}

inline void to_json(nlohmann::json &j, const CausalEdge &edge)
{
    j = nlohmann::json{
        {"sourceNodeId", edge.sourceNodeId},
        {"targetNodeId", edge.targetNodeId},
        {"edgeType", toEdgeTypeString(edge.edgeType)},
        {"causalStrength", edge.causalStrength},
        {"temporalOffsetSeconds", edge.temporalOffsetSeconds},
        {"confidence", edge.confidence},
        {"createdAt", toIso8601Utc(edge.createdAt)}
    };
    if (edge.id) {
        j["id"] = *edge.id;
    }
    if (edge.sourceType) {
        j["sourceType"] = toNodeTypeString(*edge.sourceType);
    }
    if (edge.targetType) {
        j["targetType"] = toNodeTypeString(*edge.targetType);
    }
}

inline void from_json(const nlohmann::json &j, CausalEdge &edge)
{
    if (j.contains("id") && j.at("id").is_number_integer()) {
        edge.id = j.at("id").get<int64_t>();
    } else {
        edge.id.reset();
    }
    edge.sourceNodeId = j.value("sourceNodeId", "");
    edge.targetNodeId = j.value("targetNodeId", "");
    edge.sourceType = parseNodeTypeString(j.value("sourceType", ""));
    edge.targetType = parseNodeTypeString(j.value("targetType", ""));
    edge.edgeType = parseEdgeTypeString(j.value("edgeType", "causal"));
    edge.causalStrength = j.value("causalStrength", 0.0);
    edge.temporalOffsetSeconds = j.value("temporalOffsetSeconds", 0.0);
    edge.confidence = j.value("confidence", 0.0);
    edge.createdAt = fromIso8601Utc(j.value("createdAt", ""));
}

inline void to_json(nlohmann::json &j, const Hypothesis &hypothesis)
{
    j = nlohmann::json{
        {"debtType", hypothesis.debtType},
        {"description", hypothesis.description},
        {"confidence", hypothesis.confidence},
        {"causalChain", hypothesis.causalChain},
        {"supportingEvidence", hypothesis.supportingEvidence},
        {"contradictingEvidence", hypothesis.contradictingEvidence},
        {"priorProbability", hypothesis.priorProbability}
    };
}

inline void to_json(nlohmann::json &j, const ToolObservation &observation)
{
    nlohmann::json evidence = nlohmann::json::object();
    for (const auto &[type, score] : observation.evidence) {
        evidence[toDebtTypeString(type)] = score;
    }
    j = nlohmann::json{
        {"toolName", observation.toolName},
        {"evidence", evidence},
        {"confidence", observation.confidence},
        {"detail", observation.detail}
    };
}

inline void to_json(nlohmann::json &j, const CausalExplanation &explanation)
{
    j = nlohmann::json{
        {"symptom", explanation.symptom},
        {"causalChain", explanation.causalChain},
        {"strength", explanation.strength},
        {"confidence", explanation.confidence},
        {"narrative", explanation.narrative}
    };
}

inline void from_json(const nlohmann::json &j, CausalExplanation &explanation)
{
    explanation.symptom = j.value("symptom", "");
    if (j.contains("causalChain") && j.at("causalChain").is_array()) {
        explanation.causalChain = j.at("causalChain").get<std::vector<std::string>>();
    } else {
        explanation.causalChain.clear();
    }
    explanation.strength = j.value("strength", 0.0);
    explanation.confidence = j.value("confidence", 0.0);
    explanation.narrative = j.value("narrative", "");
}

inline void to_json(nlohmann::json &j, const Counterfactual &counterfactual)
{
    j = nlohmann::json{
        {"description", counterfactual.description},
        {"impact", counterfactual.impact},
        {"effort", toEffortString(counterfactual.effort)},
        {"confidence", counterfactual.confidence}
    };
}

inline void to_json(nlohmann::json &j, const RankedDebt &ranked)
{
    j = nlohmann::json{
        {"type", ranked.type},
        {"score", ranked.score},
        {"rawScore", ranked.rawScore}
    };
}

} // namespace vita
