#include "RequestMonitor.h"

#include <algorithm>
#include <cmath>
#include <iostream>
#include <sstream>

namespace {
long long toLatencyMicros(double latencyMs) {
    if (!std::isfinite(latencyMs) || latencyMs <= 0.0) return 0;
    return static_cast<long long>(std::llround(latencyMs * 1000.0));
}
} // namespace

void RequestMonitor::countEndpoint(const std::string& endpoint) {
    totalRequests.fetch_add(1, std::memory_order_relaxed);
    if (endpoint == "/api/v1/predict") {
        predictRequests.fetch_add(1, std::memory_order_relaxed);
    } else if (endpoint == "/api/v1/batch-predict") {
        batchRequests.fetch_add(1, std::memory_order_relaxed);
    } else if (endpoint == "/api/v1/compare") {
        compareRequests.fetch_add(1, std::memory_order_relaxed);
    }
}

void RequestMonitor::recordSuccess(const std::string& endpoint,
                                   double latencyMs,
                                   const std::vector<int>& confidences) {
    countEndpoint(endpoint);
    totalLatencyMicros.fetch_add(static_cast<uint64_t>(toLatencyMicros(latencyMs)), std::memory_order_relaxed);
    totalPredictions.fetch_add(static_cast<uint64_t>(confidences.size()), std::memory_order_relaxed);

    if (confidences.empty()) return;
    std::lock_guard<std::mutex> lock(distributionMutex);
    for (int value : confidences) {
        confidenceCount += 1;
        confidenceSum += value;
        confidenceMin = std::min(confidenceMin, value);
        confidenceMax = std::max(confidenceMax, value);
    }
}

void RequestMonitor::recordError(const std::string& endpoint, double latencyMs) {
    countEndpoint(endpoint);
    errorRequests.fetch_add(1, std::memory_order_relaxed);
    totalLatencyMicros.fetch_add(static_cast<uint64_t>(toLatencyMicros(latencyMs)), std::memory_order_relaxed);
}

MonitoringSnapshot RequestMonitor::snapshot() const {
    MonitoringSnapshot out;
    out.totalRequests = totalRequests.load(std::memory_order_relaxed);
    out.predictRequests = predictRequests.load(std::memory_order_relaxed);
    out.batchRequests = batchRequests.load(std::memory_order_relaxed);
    out.compareRequests = compareRequests.load(std::memory_order_relaxed);
    out.errorRequests = errorRequests.load(std::memory_order_relaxed);
    out.totalPredictions = totalPredictions.load(std::memory_order_relaxed);

    const uint64_t latencyMicros = totalLatencyMicros.load(std::memory_order_relaxed);
    if (out.totalRequests > 0) {
        out.averageLatencyMs = static_cast<double>(latencyMicros) / static_cast<double>(out.totalRequests) / 1000.0;
    }

    std::lock_guard<std::mutex> lock(distributionMutex);
    out.confidence.count = confidenceCount;
    if (confidenceCount > 0) {
        out.confidence.mean = static_cast<double>(confidenceSum) / static_cast<double>(confidenceCount);
        out.confidence.min = confidenceMin;
        out.confidence.max = confidenceMax;
    }
    return out;
}

void logMonitoringLine(const std::string& endpoint, double latencyMs, const MonitoringSnapshot& snapshot) {
    std::ostringstream line;
    line << "[KeyprintService][Monitor] endpoint=" << endpoint
         << " total_requests=" << snapshot.totalRequests
         << " errors=" << snapshot.errorRequests
         << " latency_ms=" << latencyMs
         << " avg_latency_ms=" << snapshot.averageLatencyMs
         << " predictions=" << snapshot.totalPredictions;

    if (snapshot.confidence.count > 0) {
        line << " confidence_mean=" << snapshot.confidence.mean
             << " confidence_min=" << snapshot.confidence.min
             << " confidence_max=" << snapshot.confidence.max;
    }

    std::cout << line.str() << "\n";
}
