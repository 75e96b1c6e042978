#include "InferenceEngine.h"
#include "KeyprintConfig.h"
#include "KeyprintExceptions.h"
#include "PredictionService.h"
#include "RequestMonitor.h"

#include <iostream>
#include <memory>

int main(int argc, char* argv[]) {
    std::cout << "Keyprint: Behavioral Typing-Rhythm Scoring Service Initialization...\n";
    ServiceConfig config;
    try {
        config = ServiceConfig::fromArgs(argc, argv);
    } catch (const Keyprint::KeyprintException& e) {
        std::cerr << "[Keyprint Error] " << e.what() << "\n";
        printUsage(argv[0]);
        return 1;
    }

    if (config.showHelp) {
        printUsage(argv[0]);
        return 0;
    }

    std::unique_ptr<InferenceEngine> engine;
    try {
        engine = InferenceEngine::fromConfig(config.engine);
    } catch (const Keyprint::ModelUnavailableException& e) {
        std::cerr << "[Keyprint Error] " << e.what() << "\n";
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "[Keyprint Exception] " << e.what() << "\n";
        return 1;
    }

    RequestMonitor monitor;
    PredictionService service(*engine, monitor);
    return service.start(config);
}
