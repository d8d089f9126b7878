#include "errors.hpp"

#include <nlohmann/json.hpp>

#include <sstream>

namespace capi_pipeline {

namespace {

// Fields of the wrong type read as absent.
std::string stringField(const nlohmann::json& node, const char* key) {
    auto it = node.find(key);
    return it != node.end() && it->is_string() ? it->get<std::string>() : std::string();
}

std::string formatApiError(unsigned int httpStatus,
                           const std::vector<ApiErrorDetail>& errors) {
    auto one = [](const ApiErrorDetail& e) {
        std::ostringstream os;
        os << e.title << ": " << e.detail << " (code: " << e.code << ")";
        return os.str();
    };

    if (errors.empty()) {
        return "unknown error (HTTP " + std::to_string(httpStatus) + ")";
    }
    if (errors.size() == 1) {
        return one(errors.front());
    }

    std::string msg = "multiple errors: [";
    for (std::size_t i = 0; i < errors.size(); ++i) {
        if (i > 0) msg += "; ";
        msg += one(errors[i]);
    }
    msg += "]";
    return msg;
}

template <typename Predicate>
bool matchApiError(const std::exception_ptr& error, Predicate pred) {
    if (!error) return false;
    try {
        std::rethrow_exception(error);
    } catch (const ApiError& e) {
        return pred(e);
    } catch (const std::exception&) {
        return false;
    }
}

} // namespace

const char* errorKindName(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::Authentication:       return "authentication";
        case ErrorKind::Transport:            return "transport";
        case ErrorKind::Api:                  return "api";
        case ErrorKind::CircuitOpen:          return "circuit_open";
        case ErrorKind::CacheDisabled:        return "cache_disabled";
        case ErrorKind::CacheMiss:            return "cache_miss";
        case ErrorKind::CacheExpired:         return "cache_expired";
        case ErrorKind::Cancelled:            return "cancelled";
        case ErrorKind::Timeout:              return "timeout";
        case ErrorKind::UnsupportedResource:  return "unsupported_resource";
        case ErrorKind::UnsupportedOperation: return "unsupported_operation";
        case ErrorKind::InvalidPayload:       return "invalid_payload";
        case ErrorKind::TransactionFailed:    return "transaction_failed";
        case ErrorKind::Config:               return "config";
    }
    return "unknown";
}

PipelineError::PipelineError(ErrorKind kind, const std::string& message)
    : std::runtime_error(message)
    , mKind(kind) {}

AuthenticationError::AuthenticationError(const std::string& message,
                                         std::string upstreamError,
                                         std::string upstreamDescription,
                                         unsigned int httpStatus)
    : PipelineError(ErrorKind::Authentication, message)
    , mUpstreamError(std::move(upstreamError))
    , mUpstreamDescription(std::move(upstreamDescription))
    , mHttpStatus(httpStatus) {}

TransportError::TransportError(const std::string& message)
    : PipelineError(ErrorKind::Transport, message) {}

ApiError::ApiError(unsigned int httpStatus, std::vector<ApiErrorDetail> errors)
    : PipelineError(ErrorKind::Api, formatApiError(httpStatus, errors))
    , mHttpStatus(httpStatus)
    , mErrors(std::move(errors)) {}

const ApiErrorDetail* ApiError::firstError() const {
    return mErrors.empty() ? nullptr : &mErrors.front();
}

bool ApiError::isNotFound() const {
    const auto* first = firstError();
    if (first) return first->code == kErrorCodeNotFound;
    return mHttpStatus == 404;
}

bool ApiError::isUnauthorized() const {
    const auto* first = firstError();
    if (first) return first->code == kErrorCodeNotAuthenticated;
    return mHttpStatus == 401;
}

bool ApiError::isForbidden() const {
    const auto* first = firstError();
    if (first) return first->code == kErrorCodeNotAuthorized;
    return mHttpStatus == 403;
}

ApiError parseApiError(unsigned int httpStatus, const std::string& body) {
    std::vector<ApiErrorDetail> errors;

    const auto parsed = nlohmann::json::parse(body, nullptr, /*allow_exceptions=*/false);
    if (parsed.is_object() && parsed.contains("errors") && parsed["errors"].is_array()) {
        for (const auto& node : parsed["errors"]) {
            if (!node.is_object()) continue;
            ApiErrorDetail detail;
            auto code = node.find("code");
            if (code != node.end() && code->is_number_integer()) {
                detail.code = code->get<int>();
            }
            detail.title  = stringField(node, "title");
            detail.detail = stringField(node, "detail");
            errors.push_back(std::move(detail));
        }
    }
    return ApiError(httpStatus, std::move(errors));
}

CircuitOpenError::CircuitOpenError()
    : PipelineError(ErrorKind::CircuitOpen, "circuit breaker is open") {}

CacheError::CacheError(ErrorKind kind, const std::string& message)
    : PipelineError(kind, message) {}

CancelledError::CancelledError(ErrorKind kind, const std::string& message)
    : PipelineError(kind, message) {}

BatchOperationError::BatchOperationError(ErrorKind kind,
                                         const std::string& operationId,
                                         const std::string& message)
    : PipelineError(kind, message)
    , mOperationId(operationId) {}

ConfigError::ConfigError(const std::string& message)
    : PipelineError(ErrorKind::Config, message) {}

std::optional<ErrorKind> errorKindOf(const std::exception_ptr& error) {
    if (!error) return std::nullopt;
    try {
        std::rethrow_exception(error);
    } catch (const PipelineError& e) {
        return e.kind();
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

std::string describeError(const std::exception_ptr& error) {
    if (!error) return "";
    try {
        std::rethrow_exception(error);
    } catch (const std::exception& e) {
        return e.what();
    }
}

bool isNotFound(const std::exception_ptr& error) {
    return matchApiError(error, [](const ApiError& e) { return e.isNotFound(); });
}

bool isUnauthorized(const std::exception_ptr& error) {
    return matchApiError(error, [](const ApiError& e) { return e.isUnauthorized(); });
}

bool isForbidden(const std::exception_ptr& error) {
    return matchApiError(error, [](const ApiError& e) { return e.isForbidden(); });
}

} // namespace capi_pipeline
