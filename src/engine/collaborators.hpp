#pragma once

#include <future>
#include <optional>
#include <string>
#include <vector>

#include "common/models.hpp"
#include "engine/analysis_tool.hpp"
#include "store/health_store.hpp"

namespace vita {

// Picks the next tool to run for a session; nullptr when nothing is left.
class ToolSelector
{
public:
    virtual ~ToolSelector() = default;
    virtual const AnalysisTool *selectTool(const AgentState &state) const = 0;
};

// Deterministic reasoning used when the agent is disabled or undecided.
// Without a window it evaluates the last six hours.
class FallbackReasoner
{
public:
    virtual ~FallbackReasoner() = default;
    virtual std::vector<CausalExplanation> evaluate(
        const std::string &symptom,
        const HealthDataStore &store,
        const std::optional<TimeWindow> &window = std::nullopt) const = 0;
};

class NarrativeGenerator
{
public:
    virtual ~NarrativeGenerator() = default;
    virtual std::future<std::string> generate(const std::string &symptom,
                                              const Hypothesis &hypothesis,
                                              const std::vector<ToolObservation> &observations) const = 0;
};

class PhaseProvider
{
public:
    virtual ~PhaseProvider() = default;
    virtual PhaseConfig phaseConfig() const = 0;
};

class DebtRanker
{
public:
    virtual ~DebtRanker() = default;
    virtual std::vector<RankedDebt> classify(const std::vector<Hypothesis> &hypotheses,
                                             const std::vector<ToolObservation> &observations) const = 0;
};

} // namespace vita
