#include "PredictionService.h"

#include "JsonValue.h"
#include "KeyprintExceptions.h"
#include "RequestCodec.h"

#include <algorithm>
#include <chrono>
#include <iostream>
#include <string>
#include <utility>
#include <vector>

#include <httplib.h>

namespace {
using Clock = std::chrono::steady_clock;

struct RouteOutcome {
    std::string payload;
    std::vector<int> confidences;
};

void setJsonResponse(httplib::Response& response, int status, const std::string& payload) {
    response.status = status;
    response.set_content(payload, "application/json");
}

double elapsedMs(Clock::time_point started) {
    return std::chrono::duration<double, std::milli>(Clock::now() - started).count();
}

// Runs one route body and maps the exception hierarchy onto HTTP status codes.
template <typename Handler>
void serveRoute(const std::string& endpoint,
                RequestMonitor& monitor,
                httplib::Response& response,
                Handler&& handler) {
    const auto started = Clock::now();
    int status = 500;
    std::string error;
    try {
        RouteOutcome outcome = handler();
        const double latencyMs = elapsedMs(started);
        monitor.recordSuccess(endpoint, latencyMs, outcome.confidences);
        setJsonResponse(response, 200, outcome.payload);
        logMonitoringLine(endpoint, latencyMs, monitor.snapshot());
        return;
    } catch (const Keyprint::RequestException& e) {
        status = 400;
        error = e.what();
    } catch (const std::exception& e) {
        // InferenceFailure and anything unexpected from the engine.
        error = e.what();
    }

    const double latencyMs = elapsedMs(started);
    monitor.recordError(endpoint, latencyMs);
    setJsonResponse(response, status, RequestCodec::makeErrorResponse(error, latencyMs));
    std::cerr << "[KeyprintService][Error] endpoint=" << endpoint << " status=" << status << " error=" << error
              << "\n";
    logMonitoringLine(endpoint, latencyMs, monitor.snapshot());
}
} // namespace

PredictionService::PredictionService(InferenceEngine& engineRef, RequestMonitor& monitorRef)
    : engine(engineRef), monitor(monitorRef) {}

int PredictionService::start(const ServiceConfig& config) {
    httplib::Server server;
    server.new_task_queue = [threadCount = std::max<size_t>(1, config.threadCount)] {
        return new httplib::ThreadPool(static_cast<int>(threadCount));
    };

    const std::string modelVersion = engine.config().modelVersion;
    const bool verbose = config.verbose;
    const size_t maxBatchSize = config.maxBatchSize;

    server.Post("/api/v1/predict", [this, modelVersion, verbose](const httplib::Request& request,
                                                               httplib::Response& response) {
        serveRoute("/api/v1/predict", monitor, response, [&]() {
            const auto started = Clock::now();
            const PredictionRequest parsed = RequestCodec::parsePredictRequest(parseJsonText(request.body));
            const PredictionResult result = engine.predict(parsed.features, parsed.history);
            const double latencyMs = elapsedMs(started);
            if (verbose) {
                std::cout << "[KeyprintService][Predict] did=" << parsed.subject.substr(0, 10)
                          << "... confidence=" << result.confidenceScore
                          << " history_applied=" << (result.historyApplied ? "true" : "false")
                          << " time_ms=" << latencyMs << "\n";
            }
            return RouteOutcome{RequestCodec::serializePrediction(result, modelVersion, latencyMs),
                                {result.confidenceScore}};
        });
    });

    server.Post("/api/v1/batch-predict", [this, modelVersion, maxBatchSize](const httplib::Request& request,
                                                                          httplib::Response& response) {
        serveRoute("/api/v1/batch-predict", monitor, response, [&]() {
            const std::vector<PredictionRequest> requests =
                RequestCodec::parseBatchRequest(parseJsonText(request.body), maxBatchSize);
            std::cout << "[KeyprintService][Batch] size=" << requests.size() << "\n";

            const BatchPrediction batch = engine.predictBatch(requests);
            RouteOutcome outcome;
            outcome.payload = RequestCodec::serializeBatch(batch, modelVersion);
            for (const auto& result : batch.results) {
                if (!result.failed) outcome.confidences.push_back(result.confidenceScore);
            }
            return outcome;
        });
    });

    server.Post("/api/v1/compare", [this](const httplib::Request& request, httplib::Response& response) {
        serveRoute("/api/v1/compare", monitor, response, [&]() {
            const auto patterns = RequestCodec::parseCompareRequest(parseJsonText(request.body));
            const PatternComparison comparison = engine.compare(patterns.first, patterns.second);
            return RouteOutcome{RequestCodec::serializeComparison(comparison),
                                {comparison.firstConfidence, comparison.secondConfidence}};
        });
    });

    server.Get("/api/v1/stats", [this, modelVersion](const httplib::Request&, httplib::Response& response) {
        setJsonResponse(response, 200, RequestCodec::serializeStatistics(engine.statistics(), modelVersion));
    });

    server.Get("/health", [modelVersion](const httplib::Request&, httplib::Response& response) {
        setJsonResponse(response, 200, RequestCodec::serializeHealth(true, modelVersion));
    });

    server.Get("/ready", [](const httplib::Request&, httplib::Response& response) {
        setJsonResponse(response, 200, "{\"ready\":true}");
    });

    std::cout << "[KeyprintService] model_version=" << modelVersion
              << " scorer=" << engine.scorer().describe()
              << " anomaly=" << engine.anomalyScorer().describe()
              << " host=" << config.host
              << " port=" << config.port
              << " threads=" << std::max<size_t>(1, config.threadCount)
              << " max_batch_size=" << maxBatchSize
              << "\n";

    if (!server.listen(config.host.c_str(), config.port)) {
        std::cerr << "[KeyprintService] failed_to_bind host=" << config.host << " port=" << config.port << "\n";
        return 1;
    }

    return 0;
}
