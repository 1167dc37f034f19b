#pragma once

#include <string>
#include <vector>

#include "engine/bio_rule_engine.hpp"
#include "engine/causal_dag.hpp"
#include "engine/debt_classifier.hpp"
#include "engine/debt_scorers.hpp"
#include "engine/edge_weight_learner.hpp"
#include "engine/intervention_calculator.hpp"
#include "engine/maturity_tracker.hpp"
#include "engine/narrative_generator.hpp"
#include "engine/react_agent.hpp"
#include "engine/tool_registry.hpp"

namespace vita {

struct ScoredPath {
    CausalDAG::Path nodes;
    double strength = 0.0;
};

struct DebtScores {
    double metabolic = 0.0;
    double digital = 0.0;
    double somatic = 0.0;
};

// Wires the agent, rule engine, maturity tracker, learner and intervention
// templates over one store. The store must outlive the engine.
class CausalityEngine
{
public:
    explicit CausalityEngine(HealthDataStore &store,
                             AgentConfig config = AgentConfig(),
                             TemplateNarrativeGenerator::DraftSource draftSource = {});

    std::vector<CausalExplanation> querySymptom(const std::string &symptom) const;

    std::vector<Counterfactual> generateCounterfactual(const std::string &nodeId) const;
    std::vector<Counterfactual> generateCounterfactual(
        const std::string &symptom,
        const std::vector<CausalExplanation> &explanations) const;

    double digestiveDebtScore(double windowHours = 6.0) const;
    DebtScores debtScores(double windowHours = 6.0) const;

    // Batch edge update over the last `windowHours` (24 by default).
    BatchUpdateSummary updateGraph(double windowHours = 24.0);

    // Paths from `source` to the symptom category over the persisted edges,
    // strongest first.
    std::vector<ScoredPath> causalPaths(NodeType source) const;

    MaturityPhase phase() const;
    PhaseConfig phaseConfig() const;

private:
    HealthDataStore &m_store;
    ToolRegistry m_tools;
    BioRuleEngine m_rules;
    TemplateNarrativeGenerator m_narratives;
    EngineMaturityTracker m_maturity;
    DebtClassifier m_classifier;
    ReActAgent m_agent;
    InterventionCalculator m_interventions;
    EdgeWeightLearner m_learner;
};

} // namespace vita
