#pragma once

#include "FeatureNormalizer.h"
#include "ScoringModel.h"

#include <string>
#include <unordered_map>
#include <vector>

// Feature label (kFeatureLayout name) -> normalized sensitivity share.
using FeatureImportance = std::unordered_map<std::string, double>;

// Local sensitivity of the confidence output to each input, estimated with a
// symmetric finite difference per dimension:
//   |f(x + h e_i) - f(x - h e_i)| / 2h,  h = relativeStep * max(1, |x_i|)
class AttributionCalculator {
public:
    explicit AttributionCalculator(double relativeStep = 1e-3);

    // Absolute sensitivities in layout order (unnormalized).
    std::vector<double> sensitivities(const FeatureVector& features, const Scorer& scorer) const;

    // Sensitivities normalized to sum to 1; all zeros when the model is flat at this point.
    FeatureImportance importance(const FeatureVector& features, const Scorer& scorer) const;

    double relativeStep() const noexcept { return m_relativeStep; }

private:
    double m_relativeStep;
};
