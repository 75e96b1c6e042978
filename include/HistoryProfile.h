#pragma once

#include "HistoricalConsistencyScorer.h"

#include <cstddef>

// Typing-speed drift over a caller-supplied history window, ordered oldest
// to newest by timestamp. valid == false for fewer than two patterns.
struct HistoryProfile {
    bool valid = false;
    size_t samples = 0;
    double speedMean = 0.0;
    double speedStd = 0.0;   // population standard deviation
    double speedMin = 0.0;
    double speedMax = 0.0;
    double speedTrend = 0.0; // least-squares slope, wpm per pattern
    double speedCv = 0.0;    // std / mean, 0 when mean is 0
};

HistoryProfile buildHistoryProfile(const PatternHistory& history);
