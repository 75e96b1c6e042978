#include "FeatureNormalizer.h"

#include <algorithm>
#include <iterator>

namespace {
// NaN fails both comparisons and passes through; the engine rejects it later.
double clipToBound(double value, const FeatureSlot& slot) {
    if (value < slot.min) return slot.min;
    if (value > slot.max) return slot.max;
    return value;
}
} // namespace

std::array<double, kRawFeatureCount> FeatureNormalizer::clipRaw(const RawFeatureSet& raw) const {
    std::array<double, kRawFeatureCount> out{};
    for (size_t i = 0; i < kRawFeatureCount; ++i) {
        const FeatureSlot& slot = kFeatureLayout[i];
        auto it = raw.find(slot.rawKey);
        const double value = (it == raw.end()) ? 0.0 : it->second;
        out[i] = clipToBound(value, slot);
    }
    return out;
}

FeatureVector FeatureNormalizer::normalize(const RawFeatureSet& raw) const {
    const auto clipped = clipRaw(raw);

    FeatureVector vector(clipped.begin(), clipped.end());
    vector.reserve(kFeatureCount);

    // The +1 keeps both ratios finite at zero error rate / zero transition time.
    vector.push_back(clipped[kTypingSpeed] / (clipped[kErrorRate] + 1.0));
    vector.push_back(clipped[kKeyHoldTime] / (clipped[kTransitionTime] + 1.0));
    return vector;
}

std::vector<FeatureVector> FeatureNormalizer::normalizeBatch(const std::vector<RawFeatureSet>& raws) const {
    std::vector<FeatureVector> out;
    out.reserve(raws.size());
    for (const auto& raw : raws) {
        out.push_back(normalize(raw));
    }
    return out;
}

std::vector<std::string> FeatureNormalizer::featureNames() {
    std::vector<std::string> names;
    names.reserve(kFeatureLayout.size());
    std::transform(kFeatureLayout.begin(), kFeatureLayout.end(), std::back_inserter(names),
                   [](const FeatureSlot& slot) { return std::string(slot.name); });
    return names;
}
