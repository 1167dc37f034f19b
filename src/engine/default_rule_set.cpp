#include "engine/bio_rule_engine.hpp"

namespace vita {

const std::vector<BioRule> &defaultBioRules()
{
    using Check = RuleCondition::Check;
    static const std::vector<BioRule> rules = {
        {"metabolic_crash_fatigue",
         "Glucose Crash Fatigue",
         {{Check::GlucoseCrashDeltaAbove, 40.0}, {Check::HrvDropPercentAbove, 15.0}},
         DebtType::Metabolic,
         "Post-meal glucose crash with HRV suppression indicates metabolic fatigue.",
         "Add protein or fat before carbs to flatten the glucose curve.",
         0.75},
        {"low_protein_recovery",
         "Low Protein Recovery Deficit",
         {{Check::HrvBelow, 40.0}, {Check::ProteinBelowGrams, 20.0}},
         DebtType::Metabolic,
         "Low HRV combined with insufficient protein intake impairs recovery.",
         "Include 20-30g protein in your next meal for recovery support.",
         0.70},
        {"digital_dopamine_debt",
         "Dopamine Debt Fatigue",
         {{Check::DopamineDebtAbove, 60.0}, {Check::PassiveMinutesAbove, 40.0}},
         DebtType::Digital,
         "Extended passive screen time has depleted dopamine reserves.",
         "Take a 10-minute walk or engage in a focus-mode work block.",
         0.70},
        {"late_meal_sleep",
         "Late Meal Sleep Impact",
         {{Check::LateMealAtOrAfterHour, 21.0}, {Check::GlycemicLoadAbove, 30.0}},
         DebtType::Metabolic,
         "High-GL meal after 9 PM disrupts sleep architecture.",
         "Eat dinner at least 2 hours before bed, keeping GL below 25.",
         0.72},
        {"aqi_stress",
         "Air Quality Stress",
         {{Check::AqiAbove, 100.0}, {Check::HrvDropPercentAbove, 10.0}},
         DebtType::Somatic,
         "Poor air quality is causing oxidative stress and HRV suppression.",
         "Stay indoors and use an air purifier when AQI exceeds 100.",
         0.65},
        {"sleep_deprivation",
         "Sleep Deprivation",
         {{Check::SleepBelowHours, 6.5}, {Check::HrvBelow, 45.0}},
         DebtType::Somatic,
         "Insufficient sleep combined with low HRV indicates recovery deficit.",
         "Prioritize 7.5+ hours tonight. Avoid screens 1 hour before bed.",
         0.75},
        {"reactive_scrolling",
         "Reactive Scrolling Pattern",
         {{Check::GlucoseCrashDeltaAbove, 30.0}, {Check::PassiveMinutesAbove, 20.0}},
         DebtType::Metabolic,
         "Zombie scrolling occurred after a glucose crash, so the fatigue caused the scrolling and not the other way around.",
         "Address the glucose crash with better meal composition. The scrolling will resolve.",
         0.70},
        {"pollen_fatigue",
         "Pollen Sensitivity Fatigue",
         {{Check::PollenAbove, 8.0}, {Check::SleepBelowHours, 7.0}},
         DebtType::Somatic,
         "High pollen is triggering a histamine response, disrupting sleep and causing fatigue.",
         "Consider an antihistamine and keep windows closed on high-pollen days.",
         0.60},
        {"chronic_high_gl",
         "Chronic High Glycemic Load",
         {{Check::GlycemicLoadAbove, 35.0}},
         DebtType::Metabolic,
         "Consistently high glycemic load meals are driving glucose volatility.",
         "Aim for GL below 25 per meal. Switch to whole grains and add protein/fat.",
         0.68},
    };
    return rules;
}

} // namespace vita
