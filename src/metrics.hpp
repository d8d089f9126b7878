#pragma once

#include "interceptors.hpp"

#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace capi_pipeline {

/// Aggregate for one "METHOD PATH" endpoint.
struct EndpointMetrics {
    int64_t                                totalRequests = 0;
    int64_t                                totalErrors   = 0;
    std::chrono::nanoseconds               totalLatency{0};
    std::chrono::nanoseconds               averageLatency{0};
    std::chrono::system_clock::time_point  lastRequestTime{};
};

/// Collects per-endpoint request counts, error counts and latency.
///
/// Observers run synchronously on the thread that recorded the sample,
/// after the collector's lock is released, and receive a copy of the
/// endpoint's aggregate.  They may read from the collector.
class MetricsCollector {
public:
    using Observer = std::function<void(const std::string& endpoint,
                                        const EndpointMetrics& metrics)>;

    void addObserver(Observer observer);

    /// Record one completed request.  @p latency is omitted when the
    /// request carried no start time.
    void record(const std::string& endpoint, bool failed,
                std::optional<std::chrono::nanoseconds> latency);

    /// Copy of the aggregate, or nullopt if the endpoint was never seen.
    std::optional<EndpointMetrics> getMetrics(const std::string& endpoint) const;

    std::map<std::string, EndpointMetrics> snapshot() const;

private:
    mutable std::mutex                      mMutex;
    std::map<std::string, EndpointMetrics>  mMetrics;
    std::vector<Observer>                   mObservers;
};

/// "METHOD PATH", the key metrics are aggregated under.
std::string endpointKey(const Request& request);

/// Stamps meta::kStartTime on the request.
RequestInterceptor metricsRequestInterceptor();

/// Records the outcome and latency of the request.
ResponseInterceptor metricsResponseInterceptor(std::shared_ptr<MetricsCollector> collector);

} // namespace capi_pipeline
