#include "RequestCodec.h"

#include "KeyprintExceptions.h"

#include <gtest/gtest.h>

#include <string>

namespace {
const std::string kDid = "0x" + std::string(64, 'a');

std::string featuresJson(int wpm = 65) {
    return R"({"typing_speed_wpm":)" + std::to_string(wpm) +
           R"(,"avg_key_hold_time_ms":120,"avg_transition_time_ms":85,"error_rate_percent":3,"activity_hour_preference":14})";
}

std::string predictJson(const std::string& did, const std::string& extra = "") {
    return R"({"did":")" + did + R"(","features":)" + featuresJson() + extra + "}";
}

bool contains(const std::string& haystack, const std::string& needle) {
    return haystack.find(needle) != std::string::npos;
}
} // namespace

TEST(RequestCodecTest, ParsesPredictRequest) {
    const PredictionRequest request = RequestCodec::parsePredictRequest(parseJsonText(predictJson(kDid)));
    EXPECT_EQ(request.subject, kDid);
    EXPECT_DOUBLE_EQ(request.features.at("typing_speed_wpm"), 65.0);
    EXPECT_DOUBLE_EQ(request.features.at("activity_hour_preference"), 14.0);
    EXPECT_FALSE(request.history.has_value());
}

TEST(RequestCodecTest, LowercasesSubject) {
    const std::string upper = "0x" + std::string(64, 'F');
    const PredictionRequest request = RequestCodec::parsePredictRequest(parseJsonText(predictJson(upper)));
    EXPECT_EQ(request.subject, "0x" + std::string(64, 'f'));
}

TEST(RequestCodecTest, RejectsInvalidSubject) {
    EXPECT_THROW(RequestCodec::parsePredictRequest(parseJsonText(predictJson("0x1234"))),
                 Keyprint::RequestException);
    EXPECT_THROW(RequestCodec::parsePredictRequest(parseJsonText(predictJson("1x" + std::string(64, '0')))),
                 Keyprint::RequestException);
    EXPECT_THROW(RequestCodec::parsePredictRequest(parseJsonText(predictJson("0x" + std::string(64, 'g')))),
                 Keyprint::RequestException);
}

TEST(RequestCodecTest, RejectsMissingOrNonNumericFeatures) {
    const std::string missing = R"({"did":")" + kDid + R"(","features":{"typing_speed_wpm":65}})";
    EXPECT_THROW(RequestCodec::parsePredictRequest(parseJsonText(missing)), Keyprint::RequestException);

    const std::string text = R"({"did":")" + kDid +
        R"(","features":{"typing_speed_wpm":"fast","avg_key_hold_time_ms":120,"avg_transition_time_ms":85,)"
        R"("error_rate_percent":3,"activity_hour_preference":14}})";
    EXPECT_THROW(RequestCodec::parsePredictRequest(parseJsonText(text)), Keyprint::RequestException);

    EXPECT_THROW(RequestCodec::parsePredictRequest(parseJsonText("[]")), Keyprint::RequestException);
}

TEST(RequestCodecTest, EnforcesRequestRanges) {
    auto parseWithSpeed = [](int wpm) {
        const std::string text = R"({"did":")" + kDid + R"(","features":)" + featuresJson(wpm) + "}";
        return RequestCodec::parsePredictRequest(parseJsonText(text));
    };
    EXPECT_DOUBLE_EQ(parseWithSpeed(300).features.at("typing_speed_wpm"), 300.0);
    EXPECT_DOUBLE_EQ(parseWithSpeed(1).features.at("typing_speed_wpm"), 1.0);
    EXPECT_THROW(parseWithSpeed(301), Keyprint::RequestException);
    EXPECT_THROW(parseWithSpeed(0), Keyprint::RequestException);
    EXPECT_THROW(parseWithSpeed(-5), Keyprint::RequestException);

    const std::string lateHour = R"({"did":")" + kDid +
        R"(","features":{"typing_speed_wpm":65,"avg_key_hold_time_ms":120,"avg_transition_time_ms":85,)"
        R"("error_rate_percent":3,"activity_hour_preference":24}})";
    EXPECT_THROW(RequestCodec::parsePredictRequest(parseJsonText(lateHour)), Keyprint::RequestException);

    const std::string slowHold = R"({"did":")" + kDid +
        R"(","features":{"typing_speed_wpm":65,"avg_key_hold_time_ms":5001,"avg_transition_time_ms":85,)"
        R"("error_rate_percent":3,"activity_hour_preference":14}})";
    EXPECT_THROW(RequestCodec::parsePredictRequest(parseJsonText(slowHold)), Keyprint::RequestException);

    const std::string errors = R"({"did":")" + kDid +
        R"(","features":{"typing_speed_wpm":65,"avg_key_hold_time_ms":120,"avg_transition_time_ms":85,)"
        R"("error_rate_percent":101,"activity_hour_preference":14}})";
    EXPECT_THROW(RequestCodec::parsePredictRequest(parseJsonText(errors)), Keyprint::RequestException);
}

TEST(RequestCodecTest, RejectsFractionalFeatures) {
    const std::string text = R"({"did":")" + kDid +
        R"(","features":{"typing_speed_wpm":65.5,"avg_key_hold_time_ms":120,"avg_transition_time_ms":85,)"
        R"("error_rate_percent":3,"activity_hour_preference":14}})";
    try {
        RequestCodec::parsePredictRequest(parseJsonText(text));
        FAIL() << "expected RequestException";
    } catch (const Keyprint::RequestException& e) {
        EXPECT_NE(std::string(e.what()).find("typing_speed_wpm must be an integer"), std::string::npos) << e.what();
    }
}

TEST(RequestCodecTest, ParsesHistoricalPatterns) {
    const std::string history =
        R"(,"historical_patterns":[)"
        R"({"typing_speed_wpm":63,"avg_key_hold_time_ms":118,"avg_transition_time_ms":87,"error_rate_percent":4,"timestamp":1704067200},)"
        R"({"typing_speed_wpm":66,"avg_key_hold_time_ms":121,"avg_transition_time_ms":84,"error_rate_percent":2,"activity_hour_preference":9,"timestamp":1704153600}])";
    const PredictionRequest request = RequestCodec::parsePredictRequest(parseJsonText(predictJson(kDid, history)));

    ASSERT_TRUE(request.history.has_value());
    ASSERT_EQ(request.history->size(), 2u);
    EXPECT_EQ((*request.history)[0].timestamp, 1704067200);
    EXPECT_EQ((*request.history)[0].features.count("activity_hour_preference"), 0u);
    EXPECT_DOUBLE_EQ((*request.history)[1].features.at("activity_hour_preference"), 9.0);
}

TEST(RequestCodecTest, NullHistoryIsAbsent) {
    const PredictionRequest request =
        RequestCodec::parsePredictRequest(parseJsonText(predictJson(kDid, R"(,"historical_patterns":null)")));
    EXPECT_FALSE(request.history.has_value());
}

TEST(RequestCodecTest, RejectsBadHistoricalPatterns) {
    const std::string fractional =
        R"(,"historical_patterns":[{"typing_speed_wpm":63,"avg_key_hold_time_ms":118,)"
        R"("avg_transition_time_ms":87,"error_rate_percent":4,"timestamp":17.5}])";
    EXPECT_THROW(RequestCodec::parsePredictRequest(parseJsonText(predictJson(kDid, fractional))),
                 Keyprint::RequestException);

    const std::string outOfRange =
        R"(,"historical_patterns":[{"typing_speed_wpm":63,"avg_key_hold_time_ms":118,)"
        R"("avg_transition_time_ms":87,"error_rate_percent":400,"timestamp":1704067200}])";
    EXPECT_THROW(RequestCodec::parsePredictRequest(parseJsonText(predictJson(kDid, outOfRange))),
                 Keyprint::RequestException);

    const std::string notArray = R"(,"historical_patterns":{"a":1})";
    EXPECT_THROW(RequestCodec::parsePredictRequest(parseJsonText(predictJson(kDid, notArray))),
                 Keyprint::RequestException);
}

TEST(RequestCodecTest, HistoryIsLimitedToTenPatterns) {
    auto historyOf = [](size_t count) {
        std::string json = R"(,"historical_patterns":[)";
        for (size_t i = 0; i < count; ++i) {
            if (i > 0) json += ",";
            json += R"({"typing_speed_wpm":0,"avg_key_hold_time_ms":118,"avg_transition_time_ms":87,)"
                    R"("error_rate_percent":4,"timestamp":)" + std::to_string(1704067200 + i) + "}";
        }
        return json + "]";
    };

    const PredictionRequest ten = RequestCodec::parsePredictRequest(parseJsonText(predictJson(kDid, historyOf(10))));
    ASSERT_TRUE(ten.history.has_value());
    EXPECT_EQ(ten.history->size(), 10u);
    EXPECT_DOUBLE_EQ((*ten.history)[0].features.at("typing_speed_wpm"), 0.0);

    EXPECT_THROW(RequestCodec::parsePredictRequest(parseJsonText(predictJson(kDid, historyOf(11)))),
                 Keyprint::RequestException);
}

TEST(RequestCodecTest, BatchEnforcesMaximumSize) {
    const std::string two = "[" + predictJson(kDid) + "," + predictJson(kDid) + "]";
    EXPECT_EQ(RequestCodec::parseBatchRequest(parseJsonText(two), 2).size(), 2u);
    EXPECT_THROW(RequestCodec::parseBatchRequest(parseJsonText(two), 1), Keyprint::RequestException);
    EXPECT_THROW(RequestCodec::parseBatchRequest(parseJsonText(predictJson(kDid)), 10), Keyprint::RequestException);
}

TEST(RequestCodecTest, ParsesCompareRequest) {
    const std::string text = R"({"pattern1":{"features":)" + featuresJson(65) +
                             R"(},"pattern2":{"did":")" + kDid + R"(","features":)" + featuresJson(95) + "}}";
    const auto patterns = RequestCodec::parseCompareRequest(parseJsonText(text));
    EXPECT_DOUBLE_EQ(patterns.first.at("typing_speed_wpm"), 65.0);
    EXPECT_DOUBLE_EQ(patterns.second.at("typing_speed_wpm"), 95.0);

    EXPECT_THROW(RequestCodec::parseCompareRequest(parseJsonText(R"({"pattern1":{}})")),
                 Keyprint::RequestException);
}

TEST(RequestCodecTest, SerializesPredictionWithOrderedImportance) {
    PredictionResult result;
    result.confidenceScore = 72;
    result.modelConfidence = 60;
    result.anomalyScore = 0.25;
    result.historicalConsistency = 100.0;
    result.historyApplied = true;
    result.featureImportance = {{"rhythm_ratio", 0.5}, {"typing_speed", 0.5}};

    const std::string json = RequestCodec::serializePrediction(result, "1.0.0", 3.14159);
    EXPECT_TRUE(contains(json, R"("confidence_score":72)")) << json;
    EXPECT_TRUE(contains(json, R"("anomaly_score":0.25)")) << json;
    EXPECT_TRUE(contains(json, R"("feature_importance":{"typing_speed":0.5,"rhythm_ratio":0.5})")) << json;
    EXPECT_TRUE(contains(json, R"("model_version":"1.0.0")")) << json;
    EXPECT_TRUE(contains(json, R"("inference_time_ms":3.14)")) << json;
    EXPECT_TRUE(contains(json, R"("history_applied":true)")) << json;
    EXPECT_TRUE(contains(json, R"("anomaly_available":false)")) << json;

    EXPECT_NO_THROW(parseJsonText(json));
}

TEST(RequestCodecTest, SerializesBatchWithErrorRecords) {
    BatchPrediction batch;
    PredictionResult ok;
    ok.confidenceScore = 70;
    PredictionResult failed;
    failed.failed = true;
    failed.anomalyScore = 1.0;
    failed.error = "Inference Failure: bad \"input\"";
    batch.results = {ok, failed};
    batch.successful = 1;
    batch.failed = 1;

    const std::string json = RequestCodec::serializeBatch(batch, "1.0.0");
    const JsonValue parsed = parseJsonText(json);
    ASSERT_TRUE(parsed.isObject());
    EXPECT_DOUBLE_EQ(parsed.find("total_count")->numberValue, 2.0);
    EXPECT_DOUBLE_EQ(parsed.find("successful_count")->numberValue, 1.0);
    EXPECT_DOUBLE_EQ(parsed.find("failed_count")->numberValue, 1.0);

    const JsonValue& errorRecord = parsed.find("predictions")->arrayValue[1];
    EXPECT_EQ(errorRecord.find("error")->stringValue, failed.error);
    EXPECT_DOUBLE_EQ(errorRecord.find("confidence_score")->numberValue, 0.0);
    EXPECT_DOUBLE_EQ(errorRecord.find("anomaly_score")->numberValue, 1.0);
    EXPECT_TRUE(errorRecord.find("feature_importance")->objectValue.empty());
}

TEST(RequestCodecTest, SerializesStatisticsAndHealth) {
    StatisticsSnapshot snapshot;
    snapshot.totalPredictions = 3;
    snapshot.avgInferenceTimeMs = 1.5;
    snapshot.avgConfidence = 80.0;

    EXPECT_EQ(RequestCodec::serializeStatistics(snapshot, "1.0.0"),
              R"({"total_predictions":3,"avg_inference_time_ms":1.5,"avg_confidence":80,"model_version":"1.0.0"})");
    EXPECT_EQ(RequestCodec::serializeHealth(true, "1.0.0"),
              R"({"status":"healthy","model_loaded":true,"model_version":"1.0.0"})");
}

TEST(RequestCodecTest, SerializesComparison) {
    PatternComparison comparison;
    comparison.firstConfidence = 65;
    comparison.secondConfidence = 95;
    comparison.similarity = 90.0;
    comparison.distance = 30.0;
    comparison.likelySameUser = true;
    EXPECT_EQ(RequestCodec::serializeComparison(comparison),
              R"({"pattern1_confidence":65,"pattern2_confidence":95,"similarity_score":90,)"
              R"("distance":30,"likely_same_user":true})");
}
