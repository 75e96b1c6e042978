#pragma once
#include <cstddef>
#include <string>

struct EngineConfig {
    std::string modelPath = "models/production/model.bin";
    std::string anomalyModelPath;                 // empty => anomaly detection disabled
    std::string modelVersion = "1.0.0";

    // Fused confidence = model * confidenceWeight + historical * historyWeight.
    double confidenceWeight = 0.7;
    double historyWeight = 0.3;
    // Off by default: without history the model confidence is returned as is,
    // which departs from always blending with the neutral score. Turn on to
    // fuse neutralHistoryScore whenever history is absent or empty.
    bool blendNeutralHistory = false;

    // Euclidean distance (feature space) at which historical similarity hits 0.
    double historyMaxDistance = 100.0;
    double neutralHistoryScore = 50.0;
    size_t maxHistoryPatterns = 10;

    // Raw-space distance at which pattern comparison similarity hits 0.
    double compareMaxDistance = 300.0;
    // Similarity (exclusive) above which two patterns are reported as one user.
    double sameUserThreshold = 70.0;

    size_t statisticsWindow = 1000;
    double attributionStep = 1e-3;

    /**
     * @brief Validates weights, distances and window sizes.
     * @throws Keyprint::ConfigurationException on invalid values.
     */
    void validate() const;
};

struct ServiceConfig {
    std::string host = "0.0.0.0";
    int port = 8000;
    size_t threadCount = 4;
    size_t maxBatchSize = 100;
    bool verbose = false;
    bool showHelp = false;

    EngineConfig engine;

    /**
     * @brief Builds config from CLI args and optional config file override.
     * @post Returns a validated config object (unless --help was requested).
     * @throws Keyprint::ConfigurationException on invalid arguments or values.
     */
    static ServiceConfig fromArgs(int argc, char* argv[]);

    /**
     * @brief Loads config values from a lightweight YAML/JSON-like key:value file.
     * @pre configPath points to a readable text file.
     * @post Returns merged config using `base` as defaults.
     * @throws Keyprint::ConfigurationException on parse/validation failures.
     */
    static ServiceConfig fromFile(const std::string& configPath, const ServiceConfig& base);

    void validate() const;
};

void printUsage(const std::string& prog);
