#pragma once

#include <exception>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace capi_pipeline {

/// Closed set of failure categories.  Callers branch on kind() rather than
/// on message text.
enum class ErrorKind {
    Authentication,
    Transport,
    Api,
    CircuitOpen,
    CacheDisabled,
    CacheMiss,
    CacheExpired,
    Cancelled,
    Timeout,
    UnsupportedResource,
    UnsupportedOperation,
    InvalidPayload,
    TransactionFailed,
    Config,
};

/// Stable lower_snake_case name, e.g. "circuit_open".
const char* errorKindName(ErrorKind kind);

/// Base of every exception thrown by the pipeline.
class PipelineError : public std::runtime_error {
public:
    PipelineError(ErrorKind kind, const std::string& message);

    ErrorKind kind() const noexcept { return mKind; }

private:
    ErrorKind mKind;
};

/// No usable credentials, or the token endpoint rejected the grant.
class AuthenticationError : public PipelineError {
public:
    explicit AuthenticationError(const std::string& message,
                                 std::string upstreamError       = "",
                                 std::string upstreamDescription = "",
                                 unsigned int httpStatus         = 0);

    const std::string& upstreamError() const { return mUpstreamError; }
    const std::string& upstreamDescription() const { return mUpstreamDescription; }
    unsigned int httpStatus() const { return mHttpStatus; }

private:
    std::string  mUpstreamError;
    std::string  mUpstreamDescription;
    unsigned int mHttpStatus;
};

/// Connection, TLS, timeout or framing failure below HTTP.
class TransportError : public PipelineError {
public:
    explicit TransportError(const std::string& message);
};

// Well-known Cloud Controller error codes.
constexpr int kErrorCodeServiceUnavailable  = 10001;
constexpr int kErrorCodeNotAuthenticated    = 10002;
constexpr int kErrorCodeNotAuthorized       = 10003;
constexpr int kErrorCodeBadRequest          = 10005;
constexpr int kErrorCodeUnprocessableEntity = 10008;
constexpr int kErrorCodeNotFound            = 10010;
constexpr int kErrorCodeTooManyRequests     = 10013;
constexpr int kErrorCodeUniquenessError     = 10016;

/// One entry of the API's {"errors": [...]} body.
struct ApiErrorDetail {
    int         code = 0;
    std::string title;
    std::string detail;
};

/// REST error: HTTP status plus the decoded error entries.
class ApiError : public PipelineError {
public:
    ApiError(unsigned int httpStatus, std::vector<ApiErrorDetail> errors);

    unsigned int httpStatus() const { return mHttpStatus; }
    const std::vector<ApiErrorDetail>& errors() const { return mErrors; }

    /// First entry, or nullptr when the body carried none.
    const ApiErrorDetail* firstError() const;

    bool isNotFound() const;
    bool isUnauthorized() const;
    bool isForbidden() const;

private:
    unsigned int                mHttpStatus;
    std::vector<ApiErrorDetail> mErrors;
};

/// Decode an error response body.  Bodies that are not the documented
/// shape produce an ApiError with no entries; entry fields of the wrong
/// type decode as 0 or "".
ApiError parseApiError(unsigned int httpStatus, const std::string& body);

class CircuitOpenError : public PipelineError {
public:
    CircuitOpenError();
};

/// Raised by cache backends: CacheDisabled, CacheMiss or CacheExpired.
class CacheError : public PipelineError {
public:
    CacheError(ErrorKind kind, const std::string& message);
};

/// Cancellation or deadline expiry (kind Cancelled or Timeout).
class CancelledError : public PipelineError {
public:
    CancelledError(ErrorKind kind, const std::string& message);
};

/// A single batch operation could not be dispatched.  Only ever stored in a
/// BatchResult.
class BatchOperationError : public PipelineError {
public:
    BatchOperationError(ErrorKind kind, const std::string& operationId,
                        const std::string& message);

    const std::string& operationId() const { return mOperationId; }

private:
    std::string mOperationId;
};

class ConfigError : public PipelineError {
public:
    explicit ConfigError(const std::string& message);
};

/// Kind of a captured exception, if it is a PipelineError.
std::optional<ErrorKind> errorKindOf(const std::exception_ptr& error);

/// what() of a captured exception ("" for a null pointer).
std::string describeError(const std::exception_ptr& error);

bool isNotFound(const std::exception_ptr& error);
bool isUnauthorized(const std::exception_ptr& error);
bool isForbidden(const std::exception_ptr& error);

} // namespace capi_pipeline
