#include "engine/signal_math.hpp"

#include <algorithm>
#include <cctype>
#include <cstdio>

#include <QDateTime>

namespace vita {

namespace {

QDateTime toLocalDateTime(std::chrono::system_clock::time_point timestamp)
{
    const qint64 ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                          timestamp.time_since_epoch())
                          .count();
    return QDateTime::fromMSecsSinceEpoch(ms, Qt::UTC).toLocalTime();
}

} // namespace

double sumValues(const std::vector<PhysiologicalSample> &samples)
{
    double total = 0.0;
    for (const auto &sample : samples) {
        total += sample.value;
    }
    return total;
}

double meanValue(const std::vector<PhysiologicalSample> &samples, double fallback)
{
    if (samples.empty()) {
        return fallback;
    }
    return sumValues(samples) / static_cast<double>(samples.size());
}

int localHour(std::chrono::system_clock::time_point timestamp)
{
    return toLocalDateTime(timestamp).time().hour();
}

std::string localDayKey(std::chrono::system_clock::time_point timestamp)
{
    return toLocalDateTime(timestamp).date().toString(QStringLiteral("yyyy-MM-dd")).toStdString();
}

std::string formatFixed(double value, int precision)
{
    char buffer[64] = {};
    std::snprintf(buffer, sizeof(buffer), "%.*f", precision, value);
    return buffer;
}

std::string toLowerAscii(std::string value)
{
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

bool containsAny(const std::string &haystack, const std::vector<std::string> &needles)
{
    return std::any_of(needles.begin(), needles.end(),
                       [&haystack](const std::string &needle) {
                           return haystack.find(needle) != std::string::npos;
                       });
}

} // namespace vita
