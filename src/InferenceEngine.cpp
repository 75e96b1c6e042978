#include "InferenceEngine.h"

#include "KeyprintExceptions.h"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <iostream>
#include <utility>

namespace {
const EngineConfig& validated(const EngineConfig& config) {
    config.validate();
    return config;
}

HistoricalConsistencyScorer::Options historyOptions(const EngineConfig& config) {
    HistoricalConsistencyScorer::Options options;
    options.maxDistance = config.historyMaxDistance;
    options.neutralScore = config.neutralHistoryScore;
    options.maxPatterns = config.maxHistoryPatterns;
    return options;
}

int toPercent(double value) {
    return static_cast<int>(std::clamp<long>(std::lround(value), 0L, 100L));
}

double roundTo2(double value) {
    return std::round(value * 100.0) / 100.0;
}

double rawValue(const RawFeatureSet& raw, size_t index) {
    const auto it = raw.find(kFeatureLayout[index].rawKey);
    return it == raw.end() ? 0.0 : it->second;
}
} // namespace

InferenceEngine::InferenceEngine(std::shared_ptr<const Scorer> scorer,
                                 std::shared_ptr<const AnomalyScorer> anomalyScorer,
                                 EngineConfig config)
    : m_config(validated(config)),
      m_scorer(std::move(scorer)),
      m_anomalyScorer(std::move(anomalyScorer)),
      m_attribution(m_config.attributionStep),
      m_history(historyOptions(m_config)),
      m_statistics(m_config.statisticsWindow) {
    if (!m_scorer) {
        throw Keyprint::ModelUnavailableException("No scoring model supplied");
    }
    if (!m_anomalyScorer) {
        m_anomalyScorer = std::make_shared<NullAnomalyScorer>();
    }
}

std::unique_ptr<InferenceEngine> InferenceEngine::fromConfig(const EngineConfig& config) {
    config.validate();

    std::shared_ptr<const Scorer> scorer = NeuralScorer::fromFile(config.modelPath);
    std::shared_ptr<const AnomalyScorer> anomaly;
    if (!config.anomalyModelPath.empty()) {
        anomaly = AutoencoderAnomalyScorer::fromFile(config.anomalyModelPath);
    } else {
        std::cout << "[Keyprint][Model] role=anomaly status=disabled\n";
    }

    auto engine = std::make_unique<InferenceEngine>(std::move(scorer), std::move(anomaly), config);
    std::cout << "[Keyprint][Engine] version=" << config.modelVersion
              << " scorer=" << engine->scorer().describe()
              << " anomaly=" << engine->anomalyScorer().describe()
              << " confidence_weight=" << config.confidenceWeight
              << " history_weight=" << config.historyWeight << "\n";
    return engine;
}

int InferenceEngine::fuse(int modelConfidence, double historical) const {
    return toPercent(static_cast<double>(modelConfidence) * m_config.confidenceWeight +
                     historical * m_config.historyWeight);
}

PredictionResult InferenceEngine::runPipeline(const RawFeatureSet& raw,
                                              const std::optional<PatternHistory>& history) const {
    const FeatureVector features = m_normalizer.normalize(raw);
    if (features.size() != kFeatureCount) {
        throw Keyprint::InferenceFailureException("Feature vector has " + std::to_string(features.size()) +
                                                  " entries, expected " + std::to_string(kFeatureCount));
    }
    for (size_t i = 0; i < features.size(); ++i) {
        if (!std::isfinite(features[i])) {
            throw Keyprint::InferenceFailureException(std::string("Non-finite value for feature ") +
                                                      kFeatureLayout[i].name);
        }
    }

    PredictionResult result;
    const double score = m_scorer->score(features);
    if (!std::isfinite(score)) {
        throw Keyprint::InferenceFailureException("Scoring model produced a non-finite score");
    }
    result.modelConfidence = toPercent(score * 100.0);
    result.confidenceScore = result.modelConfidence;

    result.anomalyAvailable = m_anomalyScorer->available();
    const double anomaly = m_anomalyScorer->anomaly(features);
    if (!std::isfinite(anomaly)) {
        throw Keyprint::InferenceFailureException("Anomaly model produced a non-finite score");
    }
    result.anomalyScore = std::max(0.0, anomaly);

    result.featureImportance = m_attribution.importance(features, *m_scorer);

    result.historicalConsistency = m_config.neutralHistoryScore;
    const bool hasHistory = history.has_value() && !history->empty();
    if (hasHistory) {
        result.historicalConsistency = m_history.consistency(features, *history);
        result.confidenceScore = fuse(result.modelConfidence, result.historicalConsistency);
        result.historyApplied = true;
    } else if (m_config.blendNeutralHistory) {
        result.confidenceScore = fuse(result.modelConfidence, result.historicalConsistency);
        result.historyApplied = true;
    }
    return result;
}

PredictionResult InferenceEngine::predict(const RawFeatureSet& raw, const std::optional<PatternHistory>& history) {
    const auto start = std::chrono::steady_clock::now();

    PredictionResult result;
    try {
        result = runPipeline(raw, history);
    } catch (const Keyprint::InferenceFailureException&) {
        throw;
    } catch (const std::exception& e) {
        throw Keyprint::InferenceFailureException(e.what());
    }

    const auto end = std::chrono::steady_clock::now();
    result.inferenceTimeMs = std::chrono::duration<double, std::milli>(end - start).count();
    m_statistics.record(result.confidenceScore, result.inferenceTimeMs);
    return result;
}

BatchPrediction InferenceEngine::predictBatch(const std::vector<PredictionRequest>& requests) {
    BatchPrediction batch;
    batch.results.reserve(requests.size());

    for (size_t idx = 0; idx < requests.size(); ++idx) {
        try {
            batch.results.push_back(predict(requests[idx].features, requests[idx].history));
            ++batch.successful;
        } catch (const Keyprint::InferenceFailureException& e) {
            std::cerr << "[Keyprint][Batch] index=" << idx << " error=" << e.what() << "\n";
            PredictionResult failed;
            failed.confidenceScore = 0;
            failed.anomalyScore = 1.0;
            failed.historicalConsistency = m_config.neutralHistoryScore;
            failed.anomalyAvailable = m_anomalyScorer->available();
            failed.failed = true;
            failed.error = e.what();
            batch.results.push_back(std::move(failed));
            ++batch.failed;
        }
    }
    return batch;
}

PatternComparison InferenceEngine::compare(const RawFeatureSet& first, const RawFeatureSet& second) {
    PatternComparison out;
    out.firstConfidence = predict(first).confidenceScore;
    out.secondConfidence = predict(second).confidenceScore;

    // Measured on the values as received; missing keys read as 0.
    double sq = 0.0;
    for (size_t i = 0; i < kRawFeatureCount; ++i) {
        const double d = rawValue(first, i) - rawValue(second, i);
        sq += d * d;
    }
    const double distance = std::sqrt(sq);
    const double similarity = std::max(0.0, 100.0 - distance / m_config.compareMaxDistance * 100.0);
    out.distance = roundTo2(distance);
    out.similarity = roundTo2(similarity);
    out.likelySameUser = similarity > m_config.sameUserThreshold;
    return out;
}

HistoryProfile InferenceEngine::profile(const PatternHistory& history) const {
    return buildHistoryProfile(m_history.selectRecent(history));
}

StatisticsSnapshot InferenceEngine::statistics() const {
    return m_statistics.snapshot();
}
