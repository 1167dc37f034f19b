#pragma once

#include <chrono>

#include "store/health_store.hpp"

namespace vita {

// Each scorer returns a 0-100 debt score over the `windowHours` before `now`.

// Per meal: GL factor, post-meal spike magnitude, HRV drop against the
// 7-day baseline, and cooking modifier, with a 1.3x penalty for meals after
// 20:00 local time. Averaged over meals.
class MetabolicDebtScorer
{
public:
    double score(const HealthDataStore &store,
                 double windowHours,
                 std::chrono::system_clock::time_point now = std::chrono::system_clock::now()) const;
};

// Genuine (non-reactive) passive minutes plus the worst dopamine debt score.
// Passive events that start within 30 minutes after a crash do not count.
class DigitalDebtScorer
{
public:
    double score(const HealthDataStore &store,
                 double windowHours,
                 std::chrono::system_clock::time_point now = std::chrono::system_clock::now()) const;
};

class SomaticStressScorer
{
public:
    double score(const HealthDataStore &store,
                 double windowHours,
                 std::chrono::system_clock::time_point now = std::chrono::system_clock::now()) const;
};

} // namespace vita
