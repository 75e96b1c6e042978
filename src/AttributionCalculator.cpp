#include "AttributionCalculator.h"

#include "KeyprintExceptions.h"

#include <algorithm>
#include <cmath>
#include <numeric>

namespace {
constexpr double kNumericEps = 1e-12;
}

AttributionCalculator::AttributionCalculator(double relativeStep) : m_relativeStep(relativeStep) {
    if (!std::isfinite(relativeStep) || relativeStep <= 0.0) {
        throw Keyprint::ConfigurationException("Attribution step must be a positive finite value");
    }
}

std::vector<double> AttributionCalculator::sensitivities(const FeatureVector& features, const Scorer& scorer) const {
    if (features.size() != kFeatureCount) {
        throw Keyprint::InferenceFailureException("Attribution expects " + std::to_string(kFeatureCount) +
                                                  " features, got " + std::to_string(features.size()));
    }

    std::vector<double> out(features.size(), 0.0);
    FeatureVector shifted = features;
    for (size_t f = 0; f < features.size(); ++f) {
        const double h = m_relativeStep * std::max(1.0, std::abs(features[f]));

        shifted[f] = features[f] + h;
        const double plusOut = scorer.score(shifted);
        shifted[f] = features[f] - h;
        const double minusOut = scorer.score(shifted);
        shifted[f] = features[f];

        const double grad = (plusOut - minusOut) / (2.0 * h);
        if (!std::isfinite(grad)) {
            throw Keyprint::InferenceFailureException("Non-finite sensitivity for feature " +
                                                      std::string(kFeatureLayout[f].name));
        }
        out[f] = std::abs(grad);
    }
    return out;
}

FeatureImportance AttributionCalculator::importance(const FeatureVector& features, const Scorer& scorer) const {
    std::vector<double> attr = sensitivities(features, scorer);

    const double sum = std::accumulate(attr.begin(), attr.end(), 0.0);
    if (sum > kNumericEps) {
        for (double& v : attr) v /= sum;
    } else {
        std::fill(attr.begin(), attr.end(), 0.0);
    }

    FeatureImportance out;
    out.reserve(kFeatureLayout.size());
    for (size_t f = 0; f < kFeatureLayout.size(); ++f) {
        out.emplace(kFeatureLayout[f].name, attr[f]);
    }
    return out;
}
