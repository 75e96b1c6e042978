#pragma once

#include <array>
#include <cstddef>
#include <string>
#include <unordered_map>
#include <vector>

// Named raw telemetry as received from the caller (e.g. "typing_speed_wpm" -> 65).
using RawFeatureSet = std::unordered_map<std::string, double>;

// Ordered model input; always kFeatureCount wide when produced by FeatureNormalizer.
using FeatureVector = std::vector<double>;

struct FeatureSlot {
    const char* name;
    const char* rawKey; // nullptr for derived ratios
    double min;
    double max;
};

constexpr size_t kRawFeatureCount = 5;
constexpr size_t kFeatureCount = 7;

// Model input ordering. The scoring network was trained on exactly this order;
// normalization, attribution labels and serialization all read from here.
constexpr std::array<FeatureSlot, kFeatureCount> kFeatureLayout = {{
    {"typing_speed", "typing_speed_wpm", 10.0, 200.0},
    {"key_hold_time", "avg_key_hold_time_ms", 20.0, 500.0},
    {"transition_time", "avg_transition_time_ms", 20.0, 400.0},
    {"error_rate", "error_rate_percent", 0.0, 50.0},
    {"activity_hour", "activity_hour_preference", 0.0, 23.0},
    {"speed_accuracy_ratio", nullptr, 0.0, 0.0},
    {"rhythm_ratio", nullptr, 0.0, 0.0},
}};

enum FeatureIndex : size_t {
    kTypingSpeed = 0,
    kKeyHoldTime = 1,
    kTransitionTime = 2,
    kErrorRate = 3,
    kActivityHour = 4,
    kSpeedAccuracyRatio = 5,
    kRhythmRatio = 6,
};

class FeatureNormalizer {
public:
    // Missing keys read as 0, every raw value is clipped to its bound, then the
    // two derived ratios are appended. Never throws for out-of-range values.
    FeatureVector normalize(const RawFeatureSet& raw) const;

    std::vector<FeatureVector> normalizeBatch(const std::vector<RawFeatureSet>& raws) const;

    // The five clipped raw values only, in layout order.
    std::array<double, kRawFeatureCount> clipRaw(const RawFeatureSet& raw) const;

    static std::vector<std::string> featureNames();
};
