#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <vector>

#include "engine/collaborators.hpp"

namespace vita {

struct AgentConfig {
    double windowHours = 6.0;
    int maxIterations = 3;
    double resolutionThreshold = 0.7;
    double ruleOverrideCeiling = 0.4;
    double explanationFloor = 0.15;
    std::size_t maxExplanations = 3;
};

// Outcome of the synchronous part of a session. When ruleOverride is set the
// session answers with those explanations and no narratives are requested.
struct ReasoningTrace {
    AgentState state;
    bool agentEnabled = true;
    int iterations = 0;
    bool consultedFallback = false;
    std::optional<std::vector<CausalExplanation>> ruleOverride;
};

// Bounded Thought -> Act -> Observe loop over the health store.
//
// reason() generates one hypothesis per debt category, runs up to
// min(maxIterations, phase.maxTools) analysis tools, folds each observation
// into the hypotheses and stops early once the top hypothesis reaches the
// resolution threshold. Undecided sessions consult the fallback reasoner
// once, which wins when the agent's best guess is weak. Store failures
// propagate as DataUnavailableError.
class ReActAgent
{
public:
    ReActAgent(const HealthDataStore &store,
               const ToolSelector &tools,
               const FallbackReasoner &fallback,
               const NarrativeGenerator &narratives,
               const PhaseProvider &phases,
               const DebtRanker &ranker,
               AgentConfig config = AgentConfig());

    std::vector<CausalExplanation> reason(const std::string &symptom) const;

    ReasoningTrace deliberate(const std::string &symptom) const;
    ReasoningTrace deliberate(const std::string &symptom,
                              std::chrono::system_clock::time_point now) const;

    // Thought stage. Always yields one hypothesis per category, sorted.
    std::vector<Hypothesis> generateHypotheses(const std::string &symptom,
                                               const TimeWindow &window) const;

    // Final assembly. Narratives for all selected hypotheses are requested
    // before any is awaited.
    std::vector<CausalExplanation> buildExplanations(const AgentState &state) const;

    const AgentConfig &config() const;

private:
    const HealthDataStore &m_store;
    const ToolSelector &m_tools;
    const FallbackReasoner &m_fallback;
    const NarrativeGenerator &m_narratives;
    const PhaseProvider &m_phases;
    const DebtRanker &m_ranker;
    AgentConfig m_config;
};

} // namespace vita
