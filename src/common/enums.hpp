#pragma once

namespace vita {

// Causal category a hypothesis, observation, or ranked score belongs to.
enum class DebtType {
    Metabolic,
    Digital,
    Somatic
};

enum class NodeType {
    Meal,
    Environmental,
    Behavioral,
    Glucose,
    Physiological,
    Symptom
};

enum class EdgeType {
    MealToGlucose,
    GlucoseToHrv,
    GlucoseToEnergy,
    BehaviorToHrv,
    MealToSleep,
    BehaviorToSleep,
    EnvironmentToHrv,
    EnvironmentToSleep,
    EnvironmentToDigestion,
    BehaviorToMeal,
    MealToSkin,
    SleepToSkin,
    BehaviorToSkin,
    EnvironmentToSkin,
    SkinToSymptom,
    Temporal,
    Causal
};

enum class GlucoseTrend {
    RapidlyRising,
    Rising,
    Stable,
    Falling,
    RapidlyFalling
};

enum class EnergyState {
    Stable,
    Rising,
    Crashing,
    ReactiveLow
};

enum class BehaviorCategory {
    ActiveWork,
    PassiveConsumption,
    ZombieScrolling,
    StressSignal,
    Exercise,
    Rest
};

enum class MetricType {
    HrvSdnn,
    RestingHeartRate,
    SleepAnalysis,
    BloodGlucose,
    BloodOxygen,
    RespiratoryRate,
    ActiveEnergy,
    StepCount
};

enum class Effort {
    Trivial,
    Moderate,
    Significant
};

enum class MaturityPhase {
    Passive,
    Correlation,
    Causal,
    Active
};

} // namespace vita
