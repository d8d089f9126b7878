#include "metrics.hpp"

namespace capi_pipeline {

void MetricsCollector::addObserver(Observer observer) {
    std::lock_guard<std::mutex> lock(mMutex);
    mObservers.push_back(std::move(observer));
}

void MetricsCollector::record(const std::string& endpoint, bool failed,
                              std::optional<std::chrono::nanoseconds> latency) {
    EndpointMetrics       updated;
    std::vector<Observer> observers;
    {
        std::lock_guard<std::mutex> lock(mMutex);

        auto& m = mMetrics[endpoint];
        ++m.totalRequests;
        m.lastRequestTime = std::chrono::system_clock::now();

        if (latency) {
            m.totalLatency  += *latency;
            m.averageLatency = m.totalLatency / m.totalRequests;
        }
        if (failed) {
            ++m.totalErrors;
        }

        updated   = m;
        observers = mObservers;
    }

    for (const auto& observer : observers) {
        observer(endpoint, updated);
    }
}

std::optional<EndpointMetrics>
MetricsCollector::getMetrics(const std::string& endpoint) const {
    std::lock_guard<std::mutex> lock(mMutex);
    auto it = mMetrics.find(endpoint);
    if (it == mMetrics.end()) return std::nullopt;
    return it->second;
}

std::map<std::string, EndpointMetrics> MetricsCollector::snapshot() const {
    std::lock_guard<std::mutex> lock(mMutex);
    return mMetrics;
}

std::string endpointKey(const Request& request) {
    return request.method + " " + request.path;
}

RequestInterceptor metricsRequestInterceptor() {
    return [](const CancelToken&, Request& request) {
        request.metadata[meta::kStartTime] = std::chrono::steady_clock::now();
    };
}

ResponseInterceptor metricsResponseInterceptor(std::shared_ptr<MetricsCollector> collector) {
    return [collector = std::move(collector)](const CancelToken&, const Request& request,
                                              Response& response) {
        std::optional<std::chrono::nanoseconds> latency;

        auto it = request.metadata.find(meta::kStartTime);
        if (it != request.metadata.end()) {
            if (const auto* start = std::any_cast<std::chrono::steady_clock::time_point>(&it->second)) {
                latency = std::chrono::duration_cast<std::chrono::nanoseconds>(
                    std::chrono::steady_clock::now() - *start);
            }
        }

        collector->record(endpointKey(request), response.failed(), latency);
    };
}

} // namespace capi_pipeline
