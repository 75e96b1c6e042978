#include "EngineStatistics.h"

#include "KeyprintExceptions.h"

#include <cmath>

namespace {
double roundTo2(double value) {
    return std::round(value * 100.0) / 100.0;
}
} // namespace

EngineStatistics::EngineStatistics(size_t window) : m_window(window) {
    if (m_window == 0) {
        throw Keyprint::ConfigurationException("statistics window must be >= 1");
    }
}

void EngineStatistics::record(int confidence, double inferenceTimeMs) {
    const double elapsed = (std::isfinite(inferenceTimeMs) && inferenceTimeMs > 0.0) ? inferenceTimeMs : 0.0;

    std::lock_guard<std::mutex> lock(m_mutex);
    m_totalPredictions += 1;
    m_totalInferenceTimeMs += elapsed;
    m_recentScores.push_back(confidence);
    m_recentSum += confidence;
    while (m_recentScores.size() > m_window) {
        m_recentSum -= m_recentScores.front();
        m_recentScores.pop_front();
    }
}

StatisticsSnapshot EngineStatistics::snapshot() const {
    StatisticsSnapshot out;
    std::lock_guard<std::mutex> lock(m_mutex);
    out.totalPredictions = m_totalPredictions;
    out.retainedScores = m_recentScores.size();
    if (m_totalPredictions > 0) {
        out.avgInferenceTimeMs = roundTo2(m_totalInferenceTimeMs / static_cast<double>(m_totalPredictions));
    }
    if (!m_recentScores.empty()) {
        out.avgConfidence = roundTo2(static_cast<double>(m_recentSum) / static_cast<double>(m_recentScores.size()));
    }
    return out;
}

void EngineStatistics::reset() {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_totalPredictions = 0;
    m_totalInferenceTimeMs = 0.0;
    m_recentScores.clear();
    m_recentSum = 0;
}
