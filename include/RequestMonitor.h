#pragma once

#include <atomic>
#include <cstdint>
#include <limits>
#include <mutex>
#include <string>
#include <vector>

struct ConfidenceDistribution {
    uint64_t count = 0;
    int min = 0;
    int max = 0;
    double mean = 0.0;
};

struct MonitoringSnapshot {
    uint64_t totalRequests = 0;
    uint64_t predictRequests = 0;
    uint64_t batchRequests = 0;
    uint64_t compareRequests = 0;
    uint64_t errorRequests = 0;
    uint64_t totalPredictions = 0;
    double averageLatencyMs = 0.0;
    ConfidenceDistribution confidence;
};

// Per-endpoint request accounting for the HTTP layer. Independent of the
// engine's own statistics, which only count successful predictions.
class RequestMonitor {
public:
    void recordSuccess(const std::string& endpoint, double latencyMs, const std::vector<int>& confidences);
    void recordError(const std::string& endpoint, double latencyMs);
    MonitoringSnapshot snapshot() const;

private:
    void countEndpoint(const std::string& endpoint);

    std::atomic<uint64_t> totalRequests{0};
    std::atomic<uint64_t> predictRequests{0};
    std::atomic<uint64_t> batchRequests{0};
    std::atomic<uint64_t> compareRequests{0};
    std::atomic<uint64_t> errorRequests{0};
    std::atomic<uint64_t> totalPredictions{0};
    std::atomic<uint64_t> totalLatencyMicros{0};

    mutable std::mutex distributionMutex;
    uint64_t confidenceCount = 0;
    int64_t confidenceSum = 0;
    int confidenceMin = std::numeric_limits<int>::max();
    int confidenceMax = std::numeric_limits<int>::min();
};

void logMonitoringLine(const std::string& endpoint, double latencyMs, const MonitoringSnapshot& snapshot);
