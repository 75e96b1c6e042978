#pragma once

#include "AnomalyModel.h"
#include "AttributionCalculator.h"
#include "EngineStatistics.h"
#include "FeatureNormalizer.h"
#include "HistoricalConsistencyScorer.h"
#include "HistoryProfile.h"
#include "KeyprintConfig.h"
#include "ScoringModel.h"

#include <memory>
#include <optional>
#include <string>
#include <vector>

struct PredictionResult {
    int confidenceScore = 0;              // final (fused) confidence, 0..100
    double anomalyScore = 0.0;            // >= 0, 0.0 when no detector is configured
    FeatureImportance featureImportance;  // sums to 1, or all zero
    int modelConfidence = 0;              // model-only confidence before history fusion
    double historicalConsistency = 50.0;  // value used for fusion, neutral when no history
    bool historyApplied = false;
    bool anomalyAvailable = false;
    bool failed = false;                  // batch error record
    std::string error;
    double inferenceTimeMs = 0.0;
};

struct PredictionRequest {
    std::string subject; // caller identifier, passed through untouched
    RawFeatureSet features;
    std::optional<PatternHistory> history;
};

struct BatchPrediction {
    std::vector<PredictionResult> results;
    size_t successful = 0;
    size_t failed = 0;
};

struct PatternComparison {
    int firstConfidence = 0;
    int secondConfidence = 0;
    double distance = 0.0;   // raw-space Euclidean distance, rounded to 2 decimals
    double similarity = 0.0; // 0..100, rounded to 2 decimals
    bool likelySameUser = false;
};

/**
 * @brief Scoring pipeline: normalize, score, detect anomalies, attribute and
 * blend with caller-supplied history.
 *
 * All public methods are safe to call from many threads at once. Models are
 * immutable after construction; only the statistics are shared mutable state.
 */
class InferenceEngine {
public:
    /**
     * @pre scorer is non-null. A null anomaly scorer disables anomaly detection.
     * @throws Keyprint::ModelUnavailableException when scorer is null.
     * @throws Keyprint::ConfigurationException when config fails validation.
     */
    InferenceEngine(std::shared_ptr<const Scorer> scorer,
                    std::shared_ptr<const AnomalyScorer> anomalyScorer,
                    EngineConfig config = {});

    /**
     * @brief Loads the scoring model and (if configured) the anomaly model.
     * @throws Keyprint::ModelUnavailableException when a model cannot be loaded.
     */
    static std::unique_ptr<InferenceEngine> fromConfig(const EngineConfig& config);

    /**
     * @brief Scores one raw feature set.
     * @post Statistics are updated only when the call returns normally.
     * @throws Keyprint::InferenceFailureException on non-finite features or model
     * failure. Any other exception raised by a model is rethrown as this type.
     */
    PredictionResult predict(const RawFeatureSet& raw,
                             const std::optional<PatternHistory>& history = std::nullopt);

    // Per-entry failures become error records; the batch itself never throws for them.
    BatchPrediction predictBatch(const std::vector<PredictionRequest>& requests);

    PatternComparison compare(const RawFeatureSet& first, const RawFeatureSet& second);

    HistoryProfile profile(const PatternHistory& history) const;

    StatisticsSnapshot statistics() const;

    const EngineConfig& config() const noexcept { return m_config; }
    const Scorer& scorer() const noexcept { return *m_scorer; }
    const AnomalyScorer& anomalyScorer() const noexcept { return *m_anomalyScorer; }

private:
    PredictionResult runPipeline(const RawFeatureSet& raw, const std::optional<PatternHistory>& history) const;
    int fuse(int modelConfidence, double historical) const;

    EngineConfig m_config;
    std::shared_ptr<const Scorer> m_scorer;
    std::shared_ptr<const AnomalyScorer> m_anomalyScorer;
    FeatureNormalizer m_normalizer;
    AttributionCalculator m_attribution;
    HistoricalConsistencyScorer m_history;
    EngineStatistics m_statistics;
};
