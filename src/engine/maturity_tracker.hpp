#pragma once

#include <chrono>

#include "engine/collaborators.hpp"

namespace vita {

// Derives the reasoning phase from how much history the store holds and how
// confident the learned meal -> glucose edges are.
class EngineMaturityTracker : public PhaseProvider
{
public:
    explicit EngineMaturityTracker(const HealthDataStore &store);

    MaturityPhase currentPhase() const;
    MaturityPhase phaseAt(std::chrono::system_clock::time_point now) const;
    PhaseConfig phaseConfig() const override;

    static PhaseConfig configFor(MaturityPhase phase);

private:
    const HealthDataStore &m_store;
};

} // namespace vita
