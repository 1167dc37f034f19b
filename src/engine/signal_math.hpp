#pragma once

#include <chrono>
#include <string>
#include <vector>

#include "common/models.hpp"

namespace vita {

// Mean of sample values, or `fallback` when there are none.
double meanValue(const std::vector<PhysiologicalSample> &samples, double fallback = 0.0);
double sumValues(const std::vector<PhysiologicalSample> &samples);

// Hour of day (0-23) and calendar day key (yyyy-MM-dd) in local time.
int localHour(std::chrono::system_clock::time_point timestamp);
std::string localDayKey(std::chrono::system_clock::time_point timestamp);

// Fixed-point formatting, "%.1f" style.
std::string formatFixed(double value, int precision);

std::string toLowerAscii(std::string value);
bool containsAny(const std::string &haystack, const std::vector<std::string> &needles);

inline double minutesBetween(std::chrono::system_clock::time_point earlier,
                      std::chrono::system_clock::time_point later)
{
    return std::chrono::duration<double, std::ratio<60>>(later - earlier).count();
}

} // namespace vita
