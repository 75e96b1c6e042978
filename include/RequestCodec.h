#pragma once

#include "EngineStatistics.h"
#include "InferenceEngine.h"
#include "JsonValue.h"

#include <string>
#include <utility>
#include <vector>

// JSON <-> engine types for the HTTP surface. Parsing throws
// Keyprint::RequestException for anything that should map to HTTP 400.
namespace RequestCodec {

constexpr size_t kSubjectLength = 66; // "0x" + 64 hex digits
constexpr size_t kMaxHistoryPatterns = 10;

// {did, features{...}, historical_patterns?[...]}; did is returned lowercased.
PredictionRequest parsePredictRequest(const JsonValue& body);

// Top-level array of predict requests, at most maxBatchSize entries.
std::vector<PredictionRequest> parseBatchRequest(const JsonValue& body, size_t maxBatchSize);

// {pattern1: {features}, pattern2: {features}}; did is optional here.
std::pair<RawFeatureSet, RawFeatureSet> parseCompareRequest(const JsonValue& body);

// All 5 raw keys, integers within the accepted request ranges.
RawFeatureSet parseFeatures(const JsonValue& node, const std::string& label);
// At most kMaxHistoryPatterns entries; activity hour is optional per entry.
PatternHistory parseHistory(const JsonValue& node);

std::string serializeImportance(const FeatureImportance& importance);
std::string serializePrediction(const PredictionResult& result, const std::string& modelVersion, double latencyMs);
std::string serializeBatch(const BatchPrediction& batch, const std::string& modelVersion);
std::string serializeComparison(const PatternComparison& comparison);
std::string serializeStatistics(const StatisticsSnapshot& snapshot, const std::string& modelVersion);
std::string serializeHealth(bool modelLoaded, const std::string& modelVersion);
std::string makeErrorResponse(const std::string& error, double latencyMs);

} // namespace RequestCodec
