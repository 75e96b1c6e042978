#include "HistoryProfile.h"

#include <algorithm>
#include <cmath>
#include <numeric>
#include <vector>

namespace {
double leastSquaresSlope(const std::vector<double>& values) {
    const size_t n = values.size();
    if (n < 2) return 0.0;

    const double xMean = static_cast<double>(n - 1) / 2.0;
    const double yMean = std::accumulate(values.begin(), values.end(), 0.0) / static_cast<double>(n);

    double sxy = 0.0;
    double sxx = 0.0;
    for (size_t i = 0; i < n; ++i) {
        const double dx = static_cast<double>(i) - xMean;
        sxy += dx * (values[i] - yMean);
        sxx += dx * dx;
    }
    return sxx > 0.0 ? sxy / sxx : 0.0;
}
} // namespace

HistoryProfile buildHistoryProfile(const PatternHistory& history) {
    HistoryProfile profile;
    profile.samples = history.size();
    if (history.size() < 2) return profile;

    PatternHistory ordered = history;
    std::stable_sort(ordered.begin(), ordered.end(), [](const HistoricalPattern& a, const HistoricalPattern& b) {
        return a.timestamp < b.timestamp;
    });

    const FeatureNormalizer normalizer;
    std::vector<double> speeds;
    speeds.reserve(ordered.size());
    for (const auto& pattern : ordered) {
        speeds.push_back(normalizer.clipRaw(pattern.features)[kTypingSpeed]);
    }

    const double n = static_cast<double>(speeds.size());
    const double mean = std::accumulate(speeds.begin(), speeds.end(), 0.0) / n;
    double var = 0.0;
    for (double s : speeds) {
        const double d = s - mean;
        var += d * d;
    }
    const double stddev = std::sqrt(var / n);

    const auto [minIt, maxIt] = std::minmax_element(speeds.begin(), speeds.end());

    profile.valid = true;
    profile.speedMean = mean;
    profile.speedStd = stddev;
    profile.speedMin = *minIt;
    profile.speedMax = *maxIt;
    profile.speedTrend = leastSquaresSlope(speeds);
    profile.speedCv = (mean == 0.0) ? 0.0 : stddev / mean;
    return profile;
}
