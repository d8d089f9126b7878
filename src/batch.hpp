#pragma once

#include "api_client.hpp"
#include "cancellation.hpp"
#include "errors.hpp"
#include "logger.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <exception>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace capi_pipeline {

enum class OperationType { Create, Update, Delete, Get };

/// "create", "update", "delete", "get".
const char* operationTypeName(OperationType type);

/// Inverse of operationTypeName.  Throws PipelineError(UnsupportedOperation).
OperationType operationTypeFromString(const std::string& name);

struct BatchResult;

/// One unit of work.  Payload shape depends on the verb:
///   create  request body
///   update  {"guid": "...", "request": {...}}
///   delete  "guid" (or {"guid": "..."})
///   get     "guid" (or {"guid": "..."})
struct BatchOperation {
    std::string    id;
    OperationType  type = OperationType::Get;
    std::string    resource;
    nlohmann::json data;
    /// Invoked once with the finalized result, on the worker thread.
    std::function<void(const BatchResult&)> callback;
};

struct BatchResult {
    std::string              id;
    bool                     success = false;
    nlohmann::json           data;
    std::exception_ptr       error;
    std::chrono::nanoseconds duration{0};
};

// ---------------------------------------------------------------------------
// Resource handlers
// ---------------------------------------------------------------------------

/// CRUD entry points for one resource type.  Verbs a handler does not
/// support throw PipelineError(UnsupportedOperation).
class ResourceHandler {
public:
    virtual ~ResourceHandler() = default;

    virtual nlohmann::json create(const CancelToken& cancel, const nlohmann::json& request);
    virtual nlohmann::json update(const CancelToken& cancel, const std::string& guid,
                                  const nlohmann::json& request);
    virtual nlohmann::json remove(const CancelToken& cancel, const std::string& guid);
    virtual nlohmann::json get(const CancelToken& cancel, const std::string& guid);
};

/// Maps the verbs onto a REST collection: POST /collection,
/// PATCH|DELETE|GET /collection/{guid}.
class RestResourceHandler : public ResourceHandler {
public:
    RestResourceHandler(ApiClient& client, std::string collectionPath);

    nlohmann::json create(const CancelToken& cancel, const nlohmann::json& request) override;
    nlohmann::json update(const CancelToken& cancel, const std::string& guid,
                          const nlohmann::json& request) override;
    nlohmann::json remove(const CancelToken& cancel, const std::string& guid) override;
    nlohmann::json get(const CancelToken& cancel, const std::string& guid) override;

    const std::string& collectionPath() const { return mCollectionPath; }

private:
    ApiClient&  mClient;
    std::string mCollectionPath;
};

/// Resource tag -> handler.  Thread-safe.
class ResourceRegistry {
public:
    void registerHandler(const std::string& resource, std::shared_ptr<ResourceHandler> handler);

    /// nullptr when the tag is unknown.
    std::shared_ptr<ResourceHandler> find(const std::string& resource) const;

    std::vector<std::string> resources() const;

private:
    mutable std::mutex                                      mMutex;
    std::map<std::string, std::shared_ptr<ResourceHandler>> mHandlers;
};

/// app, space, organization, route and service_instance over their /v3
/// collections.
void registerDefaultResources(ResourceRegistry& registry, ApiClient& client);

// ---------------------------------------------------------------------------
// Executor
// ---------------------------------------------------------------------------

/// Runs independent operations on a fixed pool of `concurrency` workers.
///
/// Results are positional: results[i] belongs to operations[i].  A failing
/// operation never affects its siblings; its exception is stored in the
/// result.  Each operation runs under a child token that also expires
/// after timeout().
class BatchExecutor {
public:
    static constexpr int kDefaultConcurrency = 5;

    /// A concurrency <= 0 means kDefaultConcurrency.
    explicit BatchExecutor(ResourceRegistry& registry,
                           int concurrency = kDefaultConcurrency,
                           std::shared_ptr<Logger> logger = nullptr);

    void setTimeout(std::chrono::milliseconds timeout) { mTimeout = timeout; }
    std::chrono::milliseconds timeout() const { return mTimeout; }
    int concurrency() const { return mConcurrency; }

    /// Blocks until every operation has finished.
    std::vector<BatchResult> execute(const CancelToken& cancel,
                                     const std::vector<BatchOperation>& operations);

private:
    ResourceRegistry&         mRegistry;
    int                       mConcurrency;
    std::chrono::milliseconds mTimeout{std::chrono::seconds(30)};
    std::shared_ptr<Logger>   mLogger;

    BatchResult runOperation(const CancelToken& cancel, const BatchOperation& operation);
    nlohmann::json dispatch(const CancelToken& cancel, ResourceHandler& handler,
                            const BatchOperation& operation);
};

/// Fluent construction of an operation list.
class BatchBuilder {
public:
    BatchBuilder& create(const std::string& id, const std::string& resource,
                         nlohmann::json request);
    BatchBuilder& update(const std::string& id, const std::string& resource,
                         const std::string& guid, nlohmann::json request);
    BatchBuilder& remove(const std::string& id, const std::string& resource,
                         const std::string& guid);
    BatchBuilder& get(const std::string& id, const std::string& resource,
                      const std::string& guid);
    BatchBuilder& add(BatchOperation operation);

    /// Attach @p callback to the most recently added operation.
    BatchBuilder& onComplete(std::function<void(const BatchResult&)> callback);

    std::vector<BatchOperation> build() const { return mOperations; }
    std::size_t size() const { return mOperations.size(); }

private:
    std::vector<BatchOperation> mOperations;
};

// ---------------------------------------------------------------------------
// Transaction
// ---------------------------------------------------------------------------

/// What a rollback attempt achieved.  Only creates are reversible.
struct RollbackReport {
    bool                               attempted = false;
    std::vector<std::string>           rolledBack;     // ids of undone creates
    std::map<std::string, std::string> failures;       // id -> reason
    std::vector<std::string>           notReversible;  // successful updates/deletes
};

class TransactionFailedError : public PipelineError {
public:
    TransactionFailedError(std::vector<std::string> failedIds,
                           std::vector<BatchResult> results,
                           RollbackReport rollback);

    const std::vector<std::string>& failedIds() const { return mFailedIds; }
    const std::vector<BatchResult>& results() const { return mResults; }
    const RollbackReport& rollback() const { return mRollback; }

private:
    std::vector<std::string> mFailedIds;
    std::vector<BatchResult> mResults;
    RollbackReport           mRollback;
};

/// A batch that, on any failure, deletes what its successful creates made.
/// Updates and deletes cannot be undone and are reported as such.
class BatchTransaction {
public:
    explicit BatchTransaction(BatchExecutor& executor);

    BatchTransaction& add(BatchOperation operation);
    BatchTransaction& setRollback(bool rollback);

    /// Runs the operations.  When any failed and rollback is enabled, rolls
    /// back and throws TransactionFailedError; otherwise returns the
    /// results.
    std::vector<BatchResult> execute(const CancelToken& cancel);

    const std::vector<BatchResult>& results() const { return mResults; }

private:
    BatchExecutor&              mExecutor;
    std::vector<BatchOperation> mOperations;
    std::vector<BatchResult>    mResults;
    bool                        mRollback = true;

    RollbackReport performRollback(const CancelToken& cancel);
};

} // namespace capi_pipeline
