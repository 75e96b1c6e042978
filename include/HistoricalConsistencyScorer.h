#pragma once

#include "FeatureNormalizer.h"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <vector>

struct HistoricalPattern {
    RawFeatureSet features;
    int64_t timestamp = 0; // Unix seconds
};

using PatternHistory = std::vector<HistoricalPattern>;

class HistoricalConsistencyScorer {
public:
    struct Options {
        double maxDistance = 100.0;   // distance at which similarity reaches 0
        double neutralScore = 50.0;   // returned when no history is supplied
        size_t maxPatterns = 10;      // most recent patterns kept
    };

    HistoricalConsistencyScorer();
    explicit HistoricalConsistencyScorer(Options options);

    // Similarity in [0,100] between `current` and the centroid of `history`.
    // Empty or absent history yields the neutral score.
    double consistency(const FeatureVector& current, const std::optional<PatternHistory>& history) const;
    double consistency(const FeatureVector& current, const PatternHistory& history) const;

    // Coordinate-wise mean of the normalized (and derived) history vectors.
    FeatureVector centroid(const PatternHistory& history) const;

    // At most maxPatterns entries, newest first by timestamp.
    PatternHistory selectRecent(const PatternHistory& history) const;

    const Options& options() const noexcept { return m_options; }

private:
    FeatureNormalizer m_normalizer;
    Options m_options;
};
