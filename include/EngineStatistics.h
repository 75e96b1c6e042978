#pragma once

#include <cstddef>
#include <cstdint>
#include <deque>
#include <mutex>

struct StatisticsSnapshot {
    uint64_t totalPredictions = 0;
    double avgInferenceTimeMs = 0.0; // over all predictions, rounded to 2 decimals
    double avgConfidence = 0.0;      // over the retained window, rounded to 2 decimals
    size_t retainedScores = 0;
};

// Rolling prediction statistics. record() and snapshot() share one mutex that
// is held only for the bookkeeping itself, never across a model evaluation.
class EngineStatistics {
public:
    explicit EngineStatistics(size_t window = 1000);

    void record(int confidence, double inferenceTimeMs);
    StatisticsSnapshot snapshot() const;
    void reset();

    size_t window() const noexcept { return m_window; }

private:
    mutable std::mutex m_mutex;
    size_t m_window;
    uint64_t m_totalPredictions = 0;
    double m_totalInferenceTimeMs = 0.0;
    std::deque<int> m_recentScores;
    int64_t m_recentSum = 0;
};
