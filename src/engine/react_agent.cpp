#include "engine/react_agent.hpp"

#include <algorithm>
#include <future>

#include <nlohmann/json.hpp>

#include "common/json_utils.hpp"
#include "common/logging.hpp"
#include "engine/hypothesis_fusion.hpp"
#include "engine/signal_math.hpp"

namespace vita {

namespace {

constexpr double kHighGlycemicLoad = 25.0;
constexpr double kVeryHighGlycemicLoad = 35.0;
constexpr double kSleepTargetHours = 7.0;
constexpr double kPlaceholderConfidence = 0.15;

const std::vector<std::string> kSkinKeywords = {
    "skin", "acne", "pimple", "dark circle", "eye bag", "oily", "oiliness",
    "pore", "wrinkle", "redness", "complexion", "face", "breakout", "pigment",
    "spot", "texture", "dry skin", "hydration",
};

const std::vector<std::string> kDarkCircleKeywords = {
    "dark circle", "eye bag", "dark eye", "puffy eye",
};

std::string glLabel(double gl)
{
    return "GL " + std::to_string(static_cast<int>(gl));
}

void replaceOrAppend(std::vector<Hypothesis> &hypotheses, Hypothesis hypothesis)
{
    hypotheses.erase(std::remove_if(hypotheses.begin(), hypotheses.end(),
                                    [&hypothesis](const Hypothesis &h) {
                                        return h.debtType == hypothesis.debtType;
                                    }),
                     hypotheses.end());
    hypotheses.push_back(std::move(hypothesis));
}

QString qs(const std::string &value)
{
    return QString::fromStdString(value);
}

} // namespace

ReActAgent::ReActAgent(const HealthDataStore &store,
                       const ToolSelector &tools,
                       const FallbackReasoner &fallback,
                       const NarrativeGenerator &narratives,
                       const PhaseProvider &phases,
                       const DebtRanker &ranker,
                       AgentConfig config)
    : m_store(store)
    , m_tools(tools)
    , m_fallback(fallback)
    , m_narratives(narratives)
    , m_phases(phases)
    , m_ranker(ranker)
    , m_config(config)
{
}

const AgentConfig &ReActAgent::config() const
{
    return m_config;
}

std::vector<CausalExplanation> ReActAgent::reason(const std::string &symptom) const
{
    vita::logging::CorrelationScope scope(vita::logging::newCorrelationId(QStringLiteral("session")));
    VLOG_INFO(QStringLiteral("ReActAgent"),
              QStringLiteral("reason"),
              QStringLiteral("reasoning_session_start"),
              QStringLiteral("symptom_query"),
              QStringLiteral("react_loop"),
              vita::logging::defaultWho(),
              QString(),
              (nlohmann::json{{"symptom", symptom}, {"windowHours", m_config.windowHours}}));

    ReasoningTrace trace = deliberate(symptom);
    if (trace.ruleOverride) {
        VLOG_INFO(QStringLiteral("ReActAgent"),
                  QStringLiteral("reason"),
                  QStringLiteral("reasoning_session_complete"),
                  (trace.agentEnabled ? QStringLiteral("weak_agent_confidence") : QStringLiteral("agent_disabled_for_phase")),
                  QStringLiteral("rule_engine"),
                  vita::logging::defaultWho(),
                  QString(),
                  (nlohmann::json{{"explanations", trace.ruleOverride->size()},
                                  {"iterations", trace.iterations}}));
        return *trace.ruleOverride;
    }

    auto explanations = buildExplanations(trace.state);
    VLOG_INFO(QStringLiteral("ReActAgent"),
              QStringLiteral("reason"),
              QStringLiteral("reasoning_session_complete"),
              (trace.state.isResolved ? QStringLiteral("resolved") : QStringLiteral("iteration_budget_spent")),
              QStringLiteral("react_loop"),
              vita::logging::defaultWho(),
              QString(),
              (nlohmann::json{{"explanations", explanations.size()},
                              {"iterations", trace.iterations},
                              {"consultedFallback", trace.consultedFallback}}));
    return explanations;
}

ReasoningTrace ReActAgent::deliberate(const std::string &symptom) const
{
    return deliberate(symptom, std::chrono::system_clock::now());
}

ReasoningTrace ReActAgent::deliberate(const std::string &symptom,
                                      std::chrono::system_clock::time_point now) const
{
    ReasoningTrace trace;
    trace.state.symptom = symptom;
    trace.state.analysisWindow = TimeWindow::lastHours(m_config.windowHours, now);

    const PhaseConfig phase = m_phases.phaseConfig();
    if (!phase.useReAct) {
        trace.agentEnabled = false;
        trace.consultedFallback = true;
        trace.ruleOverride = m_fallback.evaluate(symptom, m_store);
        return trace;
    }

    AgentState &state = trace.state;
    state.hypotheses = generateHypotheses(symptom, state.analysisWindow);

    const int maxIterations = std::max(0, std::min(m_config.maxIterations, phase.maxTools));
    for (int i = 0; i < maxIterations && !state.isResolved; ++i) {
        const AnalysisTool *tool = m_tools.selectTool(state);
        if (!tool) {
            break;
        }

        ToolObservation observation = tool->analyze(state.hypotheses, m_store, state.analysisWindow);
        ++trace.iterations;
        VLOG_DEBUG(QStringLiteral("ReActAgent"),
                   QStringLiteral("deliberate"),
                   QStringLiteral("tool_observation"),
                   QStringLiteral("act_stage"),
                   qs(tool->name()),
                   vita::logging::defaultWho(),
                   QString(),
                   (nlohmann::json{{"iteration", trace.iterations}, {"observation", observation}}));

        state.observations.push_back(observation);
        state.hypotheses = foldObservation(std::move(state.hypotheses), observation);

        if (!state.hypotheses.empty()
            && state.hypotheses.front().confidence >= m_config.resolutionThreshold) {
            state.isResolved = true;
        }
    }

    if (!state.isResolved) {
        trace.consultedFallback = true;
        auto ruleResults = m_fallback.evaluate(symptom, m_store, state.analysisWindow);
        const bool weakAgent = state.hypotheses.empty()
            || state.hypotheses.front().confidence < m_config.ruleOverrideCeiling;
        if (!ruleResults.empty() && weakAgent) {
            trace.ruleOverride = std::move(ruleResults);
        }
    }

    return trace;
}

std::vector<Hypothesis> ReActAgent::generateHypotheses(const std::string &symptom,
                                                       const TimeWindow &window) const
{
    const auto glucose = m_store.queryGlucose(window);
    const auto meals = m_store.queryMeals(window);
    const auto behaviors = m_store.queryBehaviors(window);
    const auto environment = m_store.queryEnvironment(window);
    const auto hrv = m_store.querySamples(MetricType::HrvSdnn, window);
    const auto sleep = m_store.querySamples(MetricType::SleepAnalysis, window);

    std::vector<Hypothesis> hypotheses;

    const bool hasCrash = std::any_of(glucose.begin(), glucose.end(),
                                      [](const GlucoseReading &r) { return r.isCrash(); });
    bool hasHighGlMeal = false;
    double maxGl = 0.0;
    for (const auto &meal : meals) {
        const double gl = meal.glycemicLoad();
        if (gl > kHighGlycemicLoad) {
            hasHighGlMeal = true;
            maxGl = std::max(maxGl, gl);
        }
    }

    if (hasCrash || hasHighGlMeal) {
        Hypothesis metabolic;
        metabolic.debtType = DebtType::Metabolic;
        metabolic.description = "Post-meal glucose crash or high glycemic load";
        if (!meals.empty()) {
            const auto &last = meals.back();
            metabolic.causalChain.push_back(last.displayName() + " (" + glLabel(last.glycemicLoad()) + ")");
        }
        if (hasCrash) {
            metabolic.causalChain.push_back("Glucose crash detected");
        }
        if (!hrv.empty()) {
            metabolic.causalChain.push_back("HRV: " + std::to_string(static_cast<int>(meanValue(hrv))) + "ms");
        }
        if (hasCrash) {
            metabolic.confidence = 0.76;
        } else if (maxGl > kVeryHighGlycemicLoad) {
            metabolic.confidence = 0.68;
        } else {
            metabolic.confidence = 0.58;
        }
        metabolic.supportingEvidence.push_back(hasCrash
                                                   ? std::string("Glucose crash detected in window")
                                                   : "High-GL meal (" + glLabel(maxGl) + ") detected");
        metabolic.priorProbability = 0.45;
        hypotheses.push_back(std::move(metabolic));
    } else if (!meals.empty()) {
        Hypothesis metabolic;
        metabolic.debtType = DebtType::Metabolic;
        metabolic.description = "Meal-related metabolic impact";
        metabolic.confidence = 0.40;
        metabolic.causalChain = {"Meals detected, no crash"};
        metabolic.priorProbability = 0.30;
        hypotheses.push_back(std::move(metabolic));
    }

    double passiveMinutes = 0.0;
    std::size_t passiveCount = 0;
    double maxDebt = 0.0;
    for (const auto &event : behaviors) {
        if (!event.isPassive()) {
            continue;
        }
        ++passiveCount;
        passiveMinutes += event.minutes();
        maxDebt = std::max(maxDebt, event.dopamineDebtScore.value_or(0.0));
    }
    if (passiveCount > 0) {
        Hypothesis digital;
        digital.debtType = DebtType::Digital;
        digital.description = "Passive screen time and dopamine debt";
        digital.confidence = std::min(0.45 + passiveMinutes / 200.0, 0.80);
        digital.causalChain = {
            std::to_string(static_cast<int>(passiveMinutes)) + "min passive screen time",
            "Dopamine debt: " + std::to_string(static_cast<int>(maxDebt)),
        };
        digital.supportingEvidence.push_back(std::to_string(passiveCount) + " passive events, "
                                             + std::to_string(static_cast<int>(passiveMinutes))
                                             + " total minutes");
        digital.priorProbability = 0.35;
        hypotheses.push_back(std::move(digital));
    }

    const double totalSleep = sumValues(sleep);
    const bool sleepDeficit = sleep.empty() || totalSleep < kSleepTargetHours;
    const bool envStress = std::any_of(environment.begin(), environment.end(),
                                       [](const EnvironmentalCondition &c) {
                                           return c.aqiUS > 100 || c.pollenIndex >= 8
                                               || c.temperatureCelsius > 33.0;
                                       });
    if (sleepDeficit || envStress) {
        Hypothesis somatic;
        somatic.debtType = DebtType::Somatic;
        somatic.description = "Environmental or sleep-related stress";
        if (sleepDeficit) {
            somatic.causalChain.push_back("Sleep: " + formatFixed(totalSleep, 1) + "h");
        }
        if (envStress && !environment.empty()) {
            const auto &last = environment.back();
            somatic.causalChain.push_back("AQI: " + std::to_string(last.aqiUS)
                                          + ", Pollen: " + std::to_string(last.pollenIndex));
        }
        somatic.confidence = (sleepDeficit && envStress) ? 0.70 : 0.55;
        somatic.supportingEvidence.push_back(sleepDeficit
                                                 ? "Sleep deficit: " + formatFixed(totalSleep, 1) + "h"
                                                 : std::string("Environmental stress detected"));
        somatic.priorProbability = 0.35;
        hypotheses.push_back(std::move(somatic));
    }

    // Skin questions re-route to the category most likely driving them.
    const std::string lowered = toLowerAscii(symptom);
    if (containsAny(lowered, kSkinKeywords)) {
        std::vector<std::string> skinChain;
        if (hasHighGlMeal) {
            skinChain.push_back("High-GL meal (" + glLabel(maxGl) + ") → IGF-1 spike → sebum overproduction");
        }
        if (totalSleep < kSleepTargetHours) {
            skinChain.push_back("Sleep " + formatFixed(totalSleep, 1) + "h → cortisol elevation → skin inflammation");
        }
        if (!environment.empty() && environment.back().aqiUS > 80) {
            skinChain.push_back("AQI " + std::to_string(environment.back().aqiUS)
                                + " → oxidative stress → barrier disruption");
        }
        if (skinChain.empty()) {
            skinChain.push_back("Lifestyle factors → skin condition");
        }

        DebtType skinDebt = DebtType::Somatic;
        if (!containsAny(lowered, kDarkCircleKeywords) && hasHighGlMeal) {
            skinDebt = DebtType::Metabolic;
        }

        const double skinConfidence = hasHighGlMeal && sleepDeficit ? 0.78
            : hasHighGlMeal                                         ? 0.72
                                                                    : 0.62;
        const Hypothesis *existing = findHypothesis(hypotheses, skinDebt);
        if ((existing ? existing->confidence : 0.0) < skinConfidence) {
            Hypothesis skin;
            skin.debtType = skinDebt;
            skin.description = std::string("Skin condition driven by ")
                + (skinDebt == DebtType::Metabolic ? "dietary/metabolic" : "sleep/stress") + " factors";
            skin.confidence = skinConfidence;
            skin.causalChain = std::move(skinChain);
            skin.supportingEvidence = {"Skin-related question detected"};
            skin.priorProbability = 0.45;
            replaceOrAppend(hypotheses, std::move(skin));
        }
    }

    for (const DebtType type : {DebtType::Metabolic, DebtType::Digital, DebtType::Somatic}) {
        if (findHypothesis(hypotheses, type)) {
            continue;
        }
        Hypothesis placeholder;
        placeholder.debtType = type;
        placeholder.description = "No strong indicators for " + toDebtTypeString(type) + " debt";
        placeholder.confidence = kPlaceholderConfidence;
        placeholder.priorProbability = kPlaceholderConfidence;
        hypotheses.push_back(std::move(placeholder));
    }

    sortByConfidence(hypotheses);
    return hypotheses;
}

std::vector<CausalExplanation> ReActAgent::buildExplanations(const AgentState &state) const
{
    const auto ranked = m_ranker.classify(state.hypotheses, state.observations);

    std::vector<const Hypothesis *> selected;
    for (const auto &hypothesis : state.hypotheses) {
        if (selected.size() >= m_config.maxExplanations) {
            break;
        }
        if (hypothesis.confidence > m_config.explanationFloor) {
            selected.push_back(&hypothesis);
        }
    }

    std::vector<std::future<std::string>> narratives;
    narratives.reserve(selected.size());
    for (const Hypothesis *hypothesis : selected) {
        narratives.push_back(m_narratives.generate(state.symptom, *hypothesis, state.observations));
    }

    std::vector<CausalExplanation> explanations;
    for (std::size_t i = 0; i < selected.size(); ++i) {
        const Hypothesis &hypothesis = *selected[i];
        double strength = hypothesis.confidence;
        const auto rank = std::find_if(ranked.begin(), ranked.end(),
                                       [&hypothesis](const RankedDebt &r) {
                                           return r.type == hypothesis.debtType;
                                       });
        if (rank != ranked.end()) {
            strength = rank->score;
        }

        explanations.push_back(CausalExplanation{
            state.symptom,
            hypothesis.causalChain,
            clampUnit(strength),
            hypothesis.confidence,
            narratives[i].get(),
        });
    }
    return explanations;
}

} // namespace vita
