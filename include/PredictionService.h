#pragma once

#include "InferenceEngine.h"
#include "KeyprintConfig.h"
#include "RequestMonitor.h"

class PredictionService {
public:
    PredictionService(InferenceEngine& engine, RequestMonitor& monitor);

    // Blocks serving until the listener stops. Returns a process exit code.
    int start(const ServiceConfig& config);

private:
    InferenceEngine& engine;
    RequestMonitor& monitor;
};
