#include "KeyprintConfig.h"

#include "KeyprintExceptions.h"
#include "TestSupport.h"

#include <gtest/gtest.h>

#include <fstream>
#include <string>
#include <vector>

using testsupport::TempFile;

namespace {
ServiceConfig parseArgs(std::vector<std::string> args) {
    args.insert(args.begin(), "keyprint_service");
    std::vector<char*> argv;
    for (auto& arg : args) argv.push_back(arg.data());
    return ServiceConfig::fromArgs(static_cast<int>(argv.size()), argv.data());
}

void writeText(const std::string& path, const std::string& text) {
    std::ofstream out(path);
    out << text;
}
} // namespace

TEST(ConfigTest, DefaultsAreValid) {
    const ServiceConfig config;
    EXPECT_NO_THROW(config.validate());
    EXPECT_EQ(config.host, "0.0.0.0");
    EXPECT_EQ(config.port, 8000);
    EXPECT_EQ(config.threadCount, 4u);
    EXPECT_EQ(config.maxBatchSize, 100u);
    EXPECT_EQ(config.engine.modelVersion, "1.0.0");
    EXPECT_DOUBLE_EQ(config.engine.confidenceWeight, 0.7);
    EXPECT_DOUBLE_EQ(config.engine.historyWeight, 0.3);
    EXPECT_DOUBLE_EQ(config.engine.historyMaxDistance, 100.0);
    EXPECT_EQ(config.engine.maxHistoryPatterns, 10u);
    EXPECT_EQ(config.engine.statisticsWindow, 1000u);
    EXPECT_FALSE(config.engine.blendNeutralHistory);
}

TEST(ConfigTest, ParsesCommandLineFlags) {
    const ServiceConfig config = parseArgs({"--model", "/models/scoring.bin", "--anomaly-model", "/models/ae.bin",
                                            "--port", "9001", "--threads", "2", "--confidence-weight", "0.6",
                                            "--history-weight", "0.4", "--blend-neutral-history", "true",
                                            "--verbose"});
    EXPECT_EQ(config.engine.modelPath, "/models/scoring.bin");
    EXPECT_EQ(config.engine.anomalyModelPath, "/models/ae.bin");
    EXPECT_EQ(config.port, 9001);
    EXPECT_EQ(config.threadCount, 2u);
    EXPECT_DOUBLE_EQ(config.engine.confidenceWeight, 0.6);
    EXPECT_DOUBLE_EQ(config.engine.historyWeight, 0.4);
    EXPECT_TRUE(config.engine.blendNeutralHistory);
    EXPECT_TRUE(config.verbose);
}

TEST(ConfigTest, HelpSkipsValidation) {
    const ServiceConfig config = parseArgs({"--confidence-weight", "0.1", "--help"});
    EXPECT_TRUE(config.showHelp);
}

TEST(ConfigTest, RejectsBadCommandLines) {
    EXPECT_THROW(parseArgs({"--port"}), Keyprint::ConfigurationException);
    EXPECT_THROW(parseArgs({"--port", "eighty"}), Keyprint::ConfigurationException);
    EXPECT_THROW(parseArgs({"--port", "70000"}), Keyprint::ConfigurationException);
    EXPECT_THROW(parseArgs({"--threads", "0"}), Keyprint::ConfigurationException);
    EXPECT_THROW(parseArgs({"--no-such-flag", "1"}), Keyprint::ConfigurationException);
    EXPECT_THROW(parseArgs({"stray"}), Keyprint::ConfigurationException);
    EXPECT_THROW(parseArgs({"--confidence-weight", "0.9"}), Keyprint::ConfigurationException);
}

TEST(ConfigTest, LoadsYamlStyleFile) {
    TempFile file("keyprint_config_yaml");
    writeText(file.path(),
              "# service\n"
              "host: 127.0.0.1\n"
              "Port: 8100\n"
              "max-batch-size: 25\n"
              "model_path: \"/srv/models/model.bin\"\n"
              "history_max_distance: 150\n"
              "neutral_history_score: 40\n"
              "statistics_window: 500\n");

    const ServiceConfig config = ServiceConfig::fromFile(file.path(), ServiceConfig{});
    EXPECT_EQ(config.host, "127.0.0.1");
    EXPECT_EQ(config.port, 8100);
    EXPECT_EQ(config.maxBatchSize, 25u);
    EXPECT_EQ(config.engine.modelPath, "/srv/models/model.bin");
    EXPECT_DOUBLE_EQ(config.engine.historyMaxDistance, 150.0);
    EXPECT_DOUBLE_EQ(config.engine.neutralHistoryScore, 40.0);
    EXPECT_EQ(config.engine.statisticsWindow, 500u);
}

TEST(ConfigTest, LoadsJsonStyleFile) {
    TempFile file("keyprint_config_json");
    writeText(file.path(),
              "{\n"
              "  \"model_version\": \"2.1.0\",\n"
              "  \"anomaly_model_path\": \"/srv/models/ae.bin\",\n"
              "  \"verbose\": true\n"
              "}\n");

    const ServiceConfig config = ServiceConfig::fromFile(file.path(), ServiceConfig{});
    EXPECT_EQ(config.engine.modelVersion, "2.1.0");
    EXPECT_EQ(config.engine.anomalyModelPath, "/srv/models/ae.bin");
    EXPECT_TRUE(config.verbose);
}

TEST(ConfigTest, FileErrorsReportLineNumber) {
    TempFile file("keyprint_config_bad");
    writeText(file.path(), "port: 8000\nthreads: many\n");
    try {
        ServiceConfig::fromFile(file.path(), ServiceConfig{});
        FAIL() << "expected ConfigurationException";
    } catch (const Keyprint::ConfigurationException& e) {
        EXPECT_NE(std::string(e.what()).find("line 2"), std::string::npos) << e.what();
    }

    EXPECT_THROW(ServiceConfig::fromFile("/nonexistent/keyprint.yaml", ServiceConfig{}),
                 Keyprint::ConfigurationException);
}

TEST(ConfigTest, CommandLineOverridesConfigFile) {
    TempFile file("keyprint_config_override");
    writeText(file.path(), "port: 8100\nhost: 10.0.0.1\n");

    const ServiceConfig config = parseArgs({"--config", file.path(), "--port", "8200"});
    EXPECT_EQ(config.port, 8200);
    EXPECT_EQ(config.host, "10.0.0.1");
}

TEST(ConfigTest, EngineValidationCatchesInvariantViolations) {
    EngineConfig weights;
    weights.confidenceWeight = 1.2;
    weights.historyWeight = -0.2;
    EXPECT_THROW(weights.validate(), Keyprint::ConfigurationException);

    EngineConfig distance;
    distance.historyMaxDistance = 0.0;
    EXPECT_THROW(distance.validate(), Keyprint::ConfigurationException);

    EngineConfig window;
    window.statisticsWindow = 0;
    EXPECT_THROW(window.validate(), Keyprint::ConfigurationException);

    EngineConfig model;
    model.modelPath.clear();
    EXPECT_THROW(model.validate(), Keyprint::ConfigurationException);

    EngineConfig modelOnly;
    modelOnly.confidenceWeight = 1.0;
    modelOnly.historyWeight = 0.0;
    EXPECT_NO_THROW(modelOnly.validate());
}
