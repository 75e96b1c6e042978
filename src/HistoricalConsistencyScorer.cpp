#include "HistoricalConsistencyScorer.h"

#include "KeyprintExceptions.h"

#include <algorithm>
#include <cmath>

HistoricalConsistencyScorer::HistoricalConsistencyScorer() : HistoricalConsistencyScorer(Options{}) {}

HistoricalConsistencyScorer::HistoricalConsistencyScorer(Options options) : m_options(options) {
    if (!std::isfinite(m_options.maxDistance) || m_options.maxDistance <= 0.0) {
        throw Keyprint::ConfigurationException("history max distance must be a positive finite value");
    }
    if (m_options.neutralScore < 0.0 || m_options.neutralScore > 100.0) {
        throw Keyprint::ConfigurationException("neutral history score must be within [0,100]");
    }
    if (m_options.maxPatterns == 0) {
        throw Keyprint::ConfigurationException("max history patterns must be >= 1");
    }
}

PatternHistory HistoricalConsistencyScorer::selectRecent(const PatternHistory& history) const {
    PatternHistory recent = history;
    std::stable_sort(recent.begin(), recent.end(), [](const HistoricalPattern& a, const HistoricalPattern& b) {
        return a.timestamp > b.timestamp;
    });
    if (recent.size() > m_options.maxPatterns) {
        recent.resize(m_options.maxPatterns);
    }
    return recent;
}

FeatureVector HistoricalConsistencyScorer::centroid(const PatternHistory& history) const {
    FeatureVector mean(kFeatureCount, 0.0);
    if (history.empty()) return mean;

    for (const auto& pattern : history) {
        const FeatureVector v = m_normalizer.normalize(pattern.features);
        for (size_t f = 0; f < kFeatureCount; ++f) {
            mean[f] += v[f];
        }
    }
    for (double& v : mean) {
        v /= static_cast<double>(history.size());
    }
    return mean;
}

double HistoricalConsistencyScorer::consistency(const FeatureVector& current,
                                                const std::optional<PatternHistory>& history) const {
    if (!history.has_value()) return m_options.neutralScore;
    return consistency(current, *history);
}

double HistoricalConsistencyScorer::consistency(const FeatureVector& current, const PatternHistory& history) const {
    if (history.empty()) return m_options.neutralScore;

    if (current.size() != kFeatureCount) {
        throw Keyprint::InferenceFailureException("Consistency expects " + std::to_string(kFeatureCount) +
                                                  " features, got " + std::to_string(current.size()));
    }

    const FeatureVector center = centroid(selectRecent(history));

    double sq = 0.0;
    for (size_t f = 0; f < kFeatureCount; ++f) {
        const double d = current[f] - center[f];
        sq += d * d;
    }
    const double distance = std::sqrt(sq);
    if (!std::isfinite(distance)) {
        throw Keyprint::InferenceFailureException("Historical patterns contain non-finite values");
    }

    return std::max(0.0, 100.0 - distance / m_options.maxDistance * 100.0);
}
