#include "engine/causality_engine.hpp"

#include <algorithm>

#include <nlohmann/json.hpp>

#include "common/json_utils.hpp"
#include "common/logging.hpp"

namespace vita {

CausalityEngine::CausalityEngine(HealthDataStore &store,
                                 AgentConfig config,
                                 TemplateNarrativeGenerator::DraftSource draftSource)
    : m_store(store)
    , m_narratives(std::move(draftSource))
    , m_maturity(store)
    , m_agent(store, m_tools, m_rules, m_narratives, m_maturity, m_classifier, config)
{
}

std::vector<CausalExplanation> CausalityEngine::querySymptom(const std::string &symptom) const
{
    return m_agent.reason(symptom);
}

std::vector<Counterfactual> CausalityEngine::generateCounterfactual(const std::string &nodeId) const
{
    return m_interventions.generateCounterfactuals(nodeId);
}

std::vector<Counterfactual> CausalityEngine::generateCounterfactual(
    const std::string &symptom,
    const std::vector<CausalExplanation> &explanations) const
{
    return m_interventions.generateCounterfactualsForSymptom(symptom, explanations);
}

double CausalityEngine::digestiveDebtScore(double windowHours) const
{
    return MetabolicDebtScorer().score(m_store, windowHours);
}

DebtScores CausalityEngine::debtScores(double windowHours) const
{
    const auto now = std::chrono::system_clock::now();
    DebtScores scores;
    scores.metabolic = MetabolicDebtScorer().score(m_store, windowHours, now);
    scores.digital = DigitalDebtScorer().score(m_store, windowHours, now);
    scores.somatic = SomaticStressScorer().score(m_store, windowHours, now);
    return scores;
}

BatchUpdateSummary CausalityEngine::updateGraph(double windowHours)
{
    return m_learner.batchUpdate(m_store, TimeWindow::lastHours(windowHours));
}

std::vector<ScoredPath> CausalityEngine::causalPaths(NodeType source) const
{
    const CausalDAG dag(m_store.listEdges());

    std::vector<ScoredPath> scored;
    for (auto &path : dag.tracePaths(source)) {
        const double strength = dag.pathStrength(path);
        scored.push_back(ScoredPath{std::move(path), strength});
    }
    std::stable_sort(scored.begin(), scored.end(), [](const ScoredPath &a, const ScoredPath &b) {
        return a.strength > b.strength;
    });

    VLOG_DEBUG(QStringLiteral("CausalityEngine"),
               QStringLiteral("causalPaths"),
               QStringLiteral("paths_traced"),
               QStringLiteral("path_query"),
               QStringLiteral("dag_dfs"),
               vita::logging::defaultWho(),
               QString(),
               (nlohmann::json{{"source", toNodeTypeString(source)},
                               {"edges", dag.edgeCount()},
                               {"paths", scored.size()}}));
    return scored;
}

MaturityPhase CausalityEngine::phase() const
{
    return m_maturity.currentPhase();
}

PhaseConfig CausalityEngine::phaseConfig() const
{
    return m_maturity.phaseConfig();
}

} // namespace vita
