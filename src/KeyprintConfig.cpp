#include "KeyprintConfig.h"
#include "CommonUtils.h"
#include "KeyprintExceptions.h"
#include <algorithm>
#include <cmath>
#include <fstream>
#include <iostream>
#include <limits>
#include <unordered_map>

namespace {
template <typename T, typename Parser>
T parseNumericStrict(const std::string& value,
                     const std::string& key,
                     const std::string& errorPrefix,
                     Parser parser) {
    try {
        size_t pos = 0;
        T parsed = parser(value, &pos);
        if (pos != value.size()) {
            throw Keyprint::ConfigurationException(errorPrefix + key + ": " + value);
        }
        return parsed;
    } catch (const Keyprint::KeyprintException&) {
        throw;
    } catch (const std::exception& ex) {
        throw Keyprint::ConfigurationException(errorPrefix + key + ": " + value + " (" + ex.what() + ")");
    }
}

std::string stripStructuralTokensOutsideQuotes(const std::string& line) {
    std::string out;
    out.reserve(line.size());

    bool inQuotes = false;
    bool escaped = false;
    for (char c : line) {
        if (escaped) {
            out.push_back(c);
            escaped = false;
            continue;
        }
        if (c == '\\') {
            out.push_back(c);
            escaped = true;
            continue;
        }
        if (c == '"') {
            inQuotes = !inQuotes;
            out.push_back(c);
            continue;
        }
        if (!inQuotes && (c == '{' || c == '}')) {
            continue;
        }
        out.push_back(c);
    }

    size_t lastNonSpace = out.find_last_not_of(" \t\r\n");
    if (lastNonSpace != std::string::npos && out[lastNonSpace] == ',') {
        out.erase(lastNonSpace, 1);
    }
    return out;
}

size_t findSeparatorOutsideQuotes(const std::string& line, char sep) {
    bool inQuotes = false;
    bool escaped = false;
    for (size_t i = 0; i < line.size(); ++i) {
        char c = line[i];
        if (escaped) {
            escaped = false;
            continue;
        }
        if (c == '\\') {
            escaped = true;
            continue;
        }
        if (c == '"') {
            inQuotes = !inQuotes;
            continue;
        }
        if (!inQuotes && c == sep) {
            return i;
        }
    }
    return std::string::npos;
}

std::string maybeUnquote(std::string value) {
    value = CommonUtils::trim(value);
    if (value.size() >= 2 && value.front() == '"' && value.back() == '"') {
        return value.substr(1, value.size() - 2);
    }
    return value;
}

std::string normalizeConfigKey(std::string key) {
    key = CommonUtils::toLower(CommonUtils::trim(key));
    while (!key.empty() && key.front() == '-') key.erase(key.begin());
    std::replace(key.begin(), key.end(), '-', '_');

    static const std::unordered_map<std::string, std::string> aliases = {
        {"model", "model_path"},
        {"anomaly_model", "anomaly_model_path"},
        {"threads", "thread_count"},
    };
    if (const auto it = aliases.find(key); it != aliases.end()) {
        return it->second;
    }
    return key;
}

int parseIntStrict(const std::string& value, const std::string& key, int minValue) {
    int parsed = parseNumericStrict<int>(
        value,
        key,
        "Invalid integer for ",
        [](const std::string& v, size_t* pos) { return std::stoi(v, pos); });
    if (parsed < minValue) {
        throw Keyprint::ConfigurationException("Value for " + key + " must be >= " + std::to_string(minValue));
    }
    return parsed;
}

double parseDoubleStrict(const std::string& value, const std::string& key, double minValue) {
    double parsed = parseNumericStrict<double>(
        value,
        key,
        "Invalid number for ",
        [](const std::string& v, size_t* pos) { return std::stod(v, pos); });
    if (!std::isfinite(parsed) || parsed < minValue) {
        throw Keyprint::ConfigurationException("Value for " + key + " must be a finite number >= " +
                                               std::to_string(minValue));
    }
    return parsed;
}

bool parseBoolStrict(const std::string& value, const std::string& key) {
    std::string v = CommonUtils::toLower(CommonUtils::trim(value));
    if (v == "1" || v == "true" || v == "yes" || v == "on") return true;
    if (v == "0" || v == "false" || v == "no" || v == "off") return false;
    throw Keyprint::ConfigurationException("Invalid boolean for " + key + ": " + value);
}

void assignKeyValue(ServiceConfig& config, const std::string& key, const std::string& value) {
    struct SizeRule {
        size_t ServiceConfig::*member;
        int minValue;
    };
    struct EngineSizeRule {
        size_t EngineConfig::*member;
        int minValue;
    };
    struct EngineDoubleRule {
        double EngineConfig::*member;
        double minValue;
    };

    static const std::unordered_map<std::string, std::string ServiceConfig::*> serviceStringFields = {
        {"host", &ServiceConfig::host}
    };
    static const std::unordered_map<std::string, SizeRule> serviceSizeFields = {
        {"thread_count", {&ServiceConfig::threadCount, 1}},
        {"max_batch_size", {&ServiceConfig::maxBatchSize, 1}}
    };
    static const std::unordered_map<std::string, bool ServiceConfig::*> serviceBoolFields = {
        {"verbose", &ServiceConfig::verbose}
    };
    static const std::unordered_map<std::string, std::string EngineConfig::*> engineStringFields = {
        {"model_path", &EngineConfig::modelPath},
        {"anomaly_model_path", &EngineConfig::anomalyModelPath},
        {"model_version", &EngineConfig::modelVersion}
    };
    static const std::unordered_map<std::string, bool EngineConfig::*> engineBoolFields = {
        {"blend_neutral_history", &EngineConfig::blendNeutralHistory}
    };
    static const std::unordered_map<std::string, EngineSizeRule> engineSizeFields = {
        {"max_history_patterns", {&EngineConfig::maxHistoryPatterns, 1}},
        {"statistics_window", {&EngineConfig::statisticsWindow, 1}}
    };
    static const std::unordered_map<std::string, EngineDoubleRule> engineDoubleFields = {
        {"confidence_weight", {&EngineConfig::confidenceWeight, 0.0}},
        {"history_weight", {&EngineConfig::historyWeight, 0.0}},
        {"history_max_distance", {&EngineConfig::historyMaxDistance, 1e-9}},
        {"neutral_history_score", {&EngineConfig::neutralHistoryScore, 0.0}},
        {"compare_max_distance", {&EngineConfig::compareMaxDistance, 1e-9}},
        {"same_user_threshold", {&EngineConfig::sameUserThreshold, 0.0}},
        {"attribution_step", {&EngineConfig::attributionStep, 1e-12}}
    };

    if (key == "port") {
        config.port = parseIntStrict(value, key, 1);
        return;
    }
    if (const auto it = serviceStringFields.find(key); it != serviceStringFields.end()) {
        config.*(it->second) = value;
        return;
    }
    if (const auto it = serviceSizeFields.find(key); it != serviceSizeFields.end()) {
        config.*(it->second.member) = static_cast<size_t>(parseIntStrict(value, key, it->second.minValue));
        return;
    }
    if (const auto it = serviceBoolFields.find(key); it != serviceBoolFields.end()) {
        config.*(it->second) = parseBoolStrict(value, key);
        return;
    }
    if (const auto it = engineStringFields.find(key); it != engineStringFields.end()) {
        config.engine.*(it->second) = value;
        return;
    }
    if (const auto it = engineBoolFields.find(key); it != engineBoolFields.end()) {
        config.engine.*(it->second) = parseBoolStrict(value, key);
        return;
    }
    if (const auto it = engineSizeFields.find(key); it != engineSizeFields.end()) {
        config.engine.*(it->second.member) = static_cast<size_t>(parseIntStrict(value, key, it->second.minValue));
        return;
    }
    if (const auto it = engineDoubleFields.find(key); it != engineDoubleFields.end()) {
        config.engine.*(it->second.member) = parseDoubleStrict(value, key, it->second.minValue);
        return;
    }

    throw Keyprint::ConfigurationException("Unknown config key: " + key);
}
} // namespace

void printUsage(const std::string& prog) {
    std::cout << "Usage: " << prog << " [options]\n"
              << "Options:\n"
              << "  --config <file>                  key: value config file (CLI flags take precedence)\n"
              << "  --model <file>                   Scoring model binary (default: models/production/model.bin)\n"
              << "  --anomaly-model <file>           Optional autoencoder binary for anomaly scores\n"
              << "  --model-version <str>            Version string reported with each prediction\n"
              << "  --host <addr>                    Bind address (default: 0.0.0.0)\n"
              << "  --port <val>                     Listen port (default: 8000)\n"
              << "  --threads <val>                  HTTP worker threads (default: 4)\n"
              << "  --max-batch-size <val>           Max requests per batch-predict call (default: 100)\n"
              << "  --confidence-weight <0..1>       Model share of the fused confidence (default: 0.7)\n"
              << "  --history-weight <0..1>          History share of the fused confidence (default: 0.3)\n"
              << "  --history-max-distance <val>     Distance at which history similarity reaches 0 (default: 100)\n"
              << "  --max-history-patterns <val>     Most recent patterns used per request (default: 10)\n"
              << "  --blend-neutral-history <bool>   Blend with the neutral score when history is absent\n"
              << "  --verbose                        Log every request\n"
              << "  --help                           Show this help message\n";
}

ServiceConfig ServiceConfig::fromArgs(int argc, char* argv[]) {
    ServiceConfig config;

    std::string configPath;
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "--config") {
            if (i + 1 >= argc) throw Keyprint::ConfigurationException("--config expects a file path");
            configPath = argv[++i];
        }
    }
    if (!configPath.empty()) {
        config = fromFile(configPath, config);
    }

    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "--config") {
            ++i;
        } else if (arg == "--help" || arg == "-h") {
            config.showHelp = true;
        } else if (arg == "--verbose") {
            config.verbose = true;
        } else if (arg.rfind("--", 0) == 0) {
            if (i + 1 >= argc) {
                throw Keyprint::ConfigurationException(arg + " expects a value");
            }
            assignKeyValue(config, normalizeConfigKey(arg), argv[++i]);
        } else {
            throw Keyprint::ConfigurationException("Unexpected argument: " + arg);
        }
    }

    if (!config.showHelp) {
        config.validate();
    }
    return config;
}

ServiceConfig ServiceConfig::fromFile(const std::string& configPath, const ServiceConfig& base) {
    std::ifstream in(configPath);
    if (!in) throw Keyprint::ConfigurationException("Could not open config file: " + configPath);

    ServiceConfig config = base;
    std::string line;
    size_t lineNo = 0;
    while (std::getline(in, line)) {
        ++lineNo;
        line = CommonUtils::trim(line);
        if (line.empty() || line[0] == '#') continue;

        // Support loose YAML (key: value) and loose JSON-ish ("key": "value",)
        line = CommonUtils::trim(stripStructuralTokensOutsideQuotes(line));
        if (line.empty()) continue;

        size_t sep = findSeparatorOutsideQuotes(line, ':');
        if (sep == std::string::npos) continue;

        std::string key = normalizeConfigKey(maybeUnquote(line.substr(0, sep)));
        std::string value = maybeUnquote(line.substr(sep + 1));

        try {
            assignKeyValue(config, key, value);
        } catch (const Keyprint::KeyprintException& ex) {
            throw Keyprint::ConfigurationException(
                "Config parse error at line " + std::to_string(lineNo) +
                ": '" + line + "' -> " + ex.what());
        }
    }

    return config;
}

void EngineConfig::validate() const {
    if (modelPath.empty()) {
        throw Keyprint::ConfigurationException("model_path is required");
    }
    if (confidenceWeight < 0.0 || confidenceWeight > 1.0 || historyWeight < 0.0 || historyWeight > 1.0) {
        throw Keyprint::ConfigurationException("confidence_weight and history_weight must be within [0,1]");
    }
    if (std::abs(confidenceWeight + historyWeight - 1.0) > 1e-9) {
        throw Keyprint::ConfigurationException("confidence_weight + history_weight must equal 1");
    }
    if (!(historyMaxDistance > 0.0) || !std::isfinite(historyMaxDistance)) {
        throw Keyprint::ConfigurationException("history_max_distance must be > 0");
    }
    if (!(compareMaxDistance > 0.0) || !std::isfinite(compareMaxDistance)) {
        throw Keyprint::ConfigurationException("compare_max_distance must be > 0");
    }
    if (sameUserThreshold < 0.0 || sameUserThreshold > 100.0) {
        throw Keyprint::ConfigurationException("same_user_threshold must be within [0,100]");
    }
    if (neutralHistoryScore < 0.0 || neutralHistoryScore > 100.0) {
        throw Keyprint::ConfigurationException("neutral_history_score must be within [0,100]");
    }
    if (maxHistoryPatterns == 0) {
        throw Keyprint::ConfigurationException("max_history_patterns must be >= 1");
    }
    if (statisticsWindow == 0) {
        throw Keyprint::ConfigurationException("statistics_window must be >= 1");
    }
    if (!(attributionStep > 0.0) || !std::isfinite(attributionStep)) {
        throw Keyprint::ConfigurationException("attribution_step must be > 0");
    }
}

void ServiceConfig::validate() const {
    if (host.empty()) {
        throw Keyprint::ConfigurationException("host cannot be empty");
    }
    if (port < 1 || port > std::numeric_limits<uint16_t>::max()) {
        throw Keyprint::ConfigurationException("port must be within [1,65535]");
    }
    if (threadCount == 0) {
        throw Keyprint::ConfigurationException("thread_count must be >= 1");
    }
    if (maxBatchSize == 0) {
        throw Keyprint::ConfigurationException("max_batch_size must be >= 1");
    }
    engine.validate();
}
