#include "RequestCodec.h"

#include "CommonUtils.h"
#include "KeyprintExceptions.h"

#include <cctype>
#include <cmath>
#include <sstream>

namespace {
double roundTo2(double value) {
    if (!std::isfinite(value)) return 0.0;
    return std::round(value * 100.0) / 100.0;
}

struct FieldBounds {
    const char* key;
    double min;
    double max;
};

// Accepted request ranges, wider than the model's clipping bounds. A speed of
// 0 is only valid in history, where it records an idle session.
constexpr FieldBounds kRequestBounds[kRawFeatureCount] = {
    {"typing_speed_wpm", 1.0, 300.0},
    {"avg_key_hold_time_ms", 0.0, 5000.0},
    {"avg_transition_time_ms", 0.0, 5000.0},
    {"error_rate_percent", 0.0, 100.0},
    {"activity_hour_preference", 0.0, 23.0},
};

const JsonValue& requireField(const JsonValue& object, const std::string& key, const std::string& label) {
    const JsonValue* node = object.find(key);
    if (node == nullptr) {
        throw Keyprint::RequestException(label + " requires field '" + key + "'");
    }
    return *node;
}

double requireBoundedInteger(const JsonValue& object, const FieldBounds& bounds, double min, const std::string& label) {
    const JsonValue& node = requireField(object, bounds.key, label);
    if (!node.isInteger()) {
        throw Keyprint::RequestException(label + "." + bounds.key + " must be an integer");
    }
    if (node.numberValue < min || node.numberValue > bounds.max) {
        std::ostringstream msg;
        msg << label << "." << bounds.key << " must be within [" << min << ", " << bounds.max << "]";
        throw Keyprint::RequestException(msg.str());
    }
    return node.numberValue;
}

std::string parseSubject(const JsonValue& body) {
    const JsonValue* did = body.find("did");
    if (did == nullptr || !did->isString()) {
        throw Keyprint::RequestException("Request requires string field 'did'");
    }
    const std::string& value = did->stringValue;
    if (value.size() != RequestCodec::kSubjectLength) {
        throw Keyprint::RequestException("did must be exactly " + std::to_string(RequestCodec::kSubjectLength) +
                                         " characters");
    }
    if (value.compare(0, 2, "0x") != 0) {
        throw Keyprint::RequestException("did must start with '0x'");
    }
    for (size_t i = 2; i < value.size(); ++i) {
        if (std::isxdigit(static_cast<unsigned char>(value[i])) == 0) {
            throw Keyprint::RequestException("did must be a hexadecimal string");
        }
    }
    return CommonUtils::toLower(value);
}

const char* boolText(bool value) {
    return value ? "true" : "false";
}

void writePredictionFields(std::ostringstream& out, const PredictionResult& result, const std::string& modelVersion) {
    out << "\"confidence_score\":" << result.confidenceScore << ","
        << "\"anomaly_score\":" << formatDouble(result.anomalyScore) << ","
        << "\"feature_importance\":" << RequestCodec::serializeImportance(result.featureImportance) << ","
        << "\"model_version\":\"" << escapeJsonString(modelVersion) << "\"";
}
} // namespace

namespace RequestCodec {

RawFeatureSet parseFeatures(const JsonValue& node, const std::string& label) {
    if (!node.isObject()) {
        throw Keyprint::RequestException(label + " must be a JSON object");
    }

    RawFeatureSet features;
    for (const auto& bounds : kRequestBounds) {
        features[bounds.key] = requireBoundedInteger(node, bounds, bounds.min, label);
    }
    return features;
}

PatternHistory parseHistory(const JsonValue& node) {
    PatternHistory history;
    if (node.isNull()) return history;
    if (!node.isArray()) {
        throw Keyprint::RequestException("historical_patterns must be an array");
    }
    if (node.arrayValue.size() > kMaxHistoryPatterns) {
        throw Keyprint::RequestException("historical_patterns accepts at most " +
                                         std::to_string(kMaxHistoryPatterns) + " entries");
    }

    history.reserve(node.arrayValue.size());
    for (size_t i = 0; i < node.arrayValue.size(); ++i) {
        const JsonValue& item = node.arrayValue[i];
        const std::string label = "historical_patterns[" + std::to_string(i) + "]";
        if (!item.isObject()) {
            throw Keyprint::RequestException(label + " must be a JSON object");
        }

        HistoricalPattern pattern;
        for (size_t f = 0; f < kRawFeatureCount; ++f) {
            const FieldBounds& bounds = kRequestBounds[f];
            // Older clients omit the hour; the normalizer reads it as 0.
            if (f == kActivityHour && item.find(bounds.key) == nullptr) continue;
            const double min = f == kTypingSpeed ? 0.0 : bounds.min;
            pattern.features[bounds.key] = requireBoundedInteger(item, bounds, min, label);
        }

        const JsonValue& timestamp = requireField(item, "timestamp", label);
        if (!timestamp.isInteger() || std::abs(timestamp.numberValue) > 9.0e15) {
            throw Keyprint::RequestException(label + ".timestamp must be an integer Unix time");
        }
        pattern.timestamp = static_cast<int64_t>(timestamp.numberValue);
        history.push_back(std::move(pattern));
    }
    return history;
}

PredictionRequest parsePredictRequest(const JsonValue& body) {
    if (!body.isObject()) {
        throw Keyprint::RequestException("Request body must be a JSON object");
    }

    PredictionRequest request;
    request.subject = parseSubject(body);

    const JsonValue* featuresNode = body.find("features");
    if (featuresNode == nullptr) {
        throw Keyprint::RequestException("Request requires 'features' object");
    }
    request.features = parseFeatures(*featuresNode, "features");

    if (const JsonValue* historyNode = body.find("historical_patterns");
        historyNode != nullptr && !historyNode->isNull()) {
        request.history = parseHistory(*historyNode);
    }
    return request;
}

std::vector<PredictionRequest> parseBatchRequest(const JsonValue& body, size_t maxBatchSize) {
    if (!body.isArray()) {
        throw Keyprint::RequestException("Batch body must be a JSON array of requests");
    }
    if (body.arrayValue.size() > maxBatchSize) {
        throw Keyprint::RequestException("Maximum " + std::to_string(maxBatchSize) + " requests per batch");
    }

    std::vector<PredictionRequest> requests;
    requests.reserve(body.arrayValue.size());
    for (size_t i = 0; i < body.arrayValue.size(); ++i) {
        try {
            requests.push_back(parsePredictRequest(body.arrayValue[i]));
        } catch (const Keyprint::RequestException& e) {
            throw Keyprint::RequestException("requests[" + std::to_string(i) + "]: " + e.what());
        }
    }
    return requests;
}

std::pair<RawFeatureSet, RawFeatureSet> parseCompareRequest(const JsonValue& body) {
    if (!body.isObject()) {
        throw Keyprint::RequestException("Request body must be a JSON object");
    }

    auto patternFeatures = [&body](const std::string& key) {
        const JsonValue* pattern = body.find(key);
        if (pattern == nullptr || !pattern->isObject()) {
            throw Keyprint::RequestException("Request requires object field '" + key + "'");
        }
        const JsonValue* features = pattern->find("features");
        if (features == nullptr) {
            throw Keyprint::RequestException(key + " requires 'features' object");
        }
        return parseFeatures(*features, key + ".features");
    };

    return {patternFeatures("pattern1"), patternFeatures("pattern2")};
}

std::string serializeImportance(const FeatureImportance& importance) {
    std::ostringstream out;
    out << '{';
    bool first = true;
    for (const auto& slot : kFeatureLayout) {
        auto it = importance.find(slot.name);
        if (it == importance.end()) continue;
        if (!first) out << ',';
        first = false;
        out << '"' << slot.name << "\":" << formatDouble(it->second);
    }
    out << '}';
    return out.str();
}

std::string serializePrediction(const PredictionResult& result, const std::string& modelVersion, double latencyMs) {
    std::ostringstream out;
    out << '{';
    writePredictionFields(out, result, modelVersion);
    out << ",\"inference_time_ms\":" << formatDouble(roundTo2(latencyMs))
        << ",\"model_confidence\":" << result.modelConfidence
        << ",\"historical_consistency\":" << formatDouble(roundTo2(result.historicalConsistency))
        << ",\"history_applied\":" << boolText(result.historyApplied)
        << ",\"anomaly_available\":" << boolText(result.anomalyAvailable)
        << '}';
    return out.str();
}

std::string serializeBatch(const BatchPrediction& batch, const std::string& modelVersion) {
    std::ostringstream out;
    out << "{\"predictions\":[";
    for (size_t i = 0; i < batch.results.size(); ++i) {
        const PredictionResult& result = batch.results[i];
        if (i > 0) out << ',';
        if (result.failed) {
            out << "{\"error\":\"" << escapeJsonString(result.error) << "\",";
            writePredictionFields(out, result, modelVersion);
            out << '}';
        } else {
            out << serializePrediction(result, modelVersion, result.inferenceTimeMs);
        }
    }
    out << "],"
        << "\"total_count\":" << batch.results.size() << ","
        << "\"successful_count\":" << batch.successful << ","
        << "\"failed_count\":" << batch.failed
        << '}';
    return out.str();
}

std::string serializeComparison(const PatternComparison& comparison) {
    std::ostringstream out;
    out << "{"
        << "\"pattern1_confidence\":" << comparison.firstConfidence << ","
        << "\"pattern2_confidence\":" << comparison.secondConfidence << ","
        << "\"similarity_score\":" << formatDouble(comparison.similarity) << ","
        << "\"distance\":" << formatDouble(comparison.distance) << ","
        << "\"likely_same_user\":" << boolText(comparison.likelySameUser)
        << "}";
    return out.str();
}

std::string serializeStatistics(const StatisticsSnapshot& snapshot, const std::string& modelVersion) {
    std::ostringstream out;
    out << "{"
        << "\"total_predictions\":" << snapshot.totalPredictions << ","
        << "\"avg_inference_time_ms\":" << formatDouble(snapshot.avgInferenceTimeMs) << ","
        << "\"avg_confidence\":" << formatDouble(snapshot.avgConfidence) << ","
        << "\"model_version\":\"" << escapeJsonString(modelVersion) << "\""
        << "}";
    return out.str();
}

std::string serializeHealth(bool modelLoaded, const std::string& modelVersion) {
    std::ostringstream out;
    out << "{"
        << "\"status\":\"" << (modelLoaded ? "healthy" : "unhealthy") << "\","
        << "\"model_loaded\":" << boolText(modelLoaded) << ","
        << "\"model_version\":\"" << escapeJsonString(modelVersion) << "\""
        << "}";
    return out.str();
}

std::string makeErrorResponse(const std::string& error, double latencyMs) {
    std::ostringstream out;
    out << "{"
        << "\"error\":\"" << escapeJsonString(error) << "\","
        << "\"latency_ms\":" << formatDouble(latencyMs)
        << "}";
    return out.str();
}

} // namespace RequestCodec
