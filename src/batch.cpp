#include "batch.hpp"
#include "util.hpp"

#include <boost/asio/post.hpp>
#include <boost/asio/thread_pool.hpp>

#include <sstream>

namespace capi_pipeline {

const char* operationTypeName(OperationType type) {
    switch (type) {
        case OperationType::Create: return "create";
        case OperationType::Update: return "update";
        case OperationType::Delete: return "delete";
        case OperationType::Get:    return "get";
    }
    return "unknown";
}

OperationType operationTypeFromString(const std::string& name) {
    if (name == "create") return OperationType::Create;
    if (name == "update") return OperationType::Update;
    if (name == "delete") return OperationType::Delete;
    if (name == "get")    return OperationType::Get;
    throw PipelineError(ErrorKind::UnsupportedOperation, "unsupported operation type: " + name);
}

// ---------------------------------------------------------------------------
// ResourceHandler
// ---------------------------------------------------------------------------

nlohmann::json ResourceHandler::create(const CancelToken&, const nlohmann::json&) {
    throw PipelineError(ErrorKind::UnsupportedOperation, "unsupported operation type: create");
}

nlohmann::json ResourceHandler::update(const CancelToken&, const std::string&,
                                       const nlohmann::json&) {
    throw PipelineError(ErrorKind::UnsupportedOperation, "unsupported operation type: update");
}

nlohmann::json ResourceHandler::remove(const CancelToken&, const std::string&) {
    throw PipelineError(ErrorKind::UnsupportedOperation, "unsupported operation type: delete");
}

nlohmann::json ResourceHandler::get(const CancelToken&, const std::string&) {
    throw PipelineError(ErrorKind::UnsupportedOperation, "unsupported operation type: get");
}

RestResourceHandler::RestResourceHandler(ApiClient& client, std::string collectionPath)
    : mClient(client), mCollectionPath(std::move(collectionPath)) {}

nlohmann::json RestResourceHandler::create(const CancelToken& cancel,
                                           const nlohmann::json& request) {
    return responseJson(mClient.post(cancel, mCollectionPath, request));
}

nlohmann::json RestResourceHandler::update(const CancelToken& cancel, const std::string& guid,
                                           const nlohmann::json& request) {
    return responseJson(mClient.patch(cancel, mCollectionPath + "/" + guid, request));
}

nlohmann::json RestResourceHandler::remove(const CancelToken& cancel, const std::string& guid) {
    Response response = mClient.remove(cancel, mCollectionPath + "/" + guid);

    // Asynchronous deletes answer 202 with the job in Location.
    nlohmann::json result = {{"guid", guid}};
    const std::string job = response.header("Location");
    if (!job.empty()) {
        result["job"] = job;
    }
    return result;
}

nlohmann::json RestResourceHandler::get(const CancelToken& cancel, const std::string& guid) {
    return responseJson(mClient.get(cancel, mCollectionPath + "/" + guid));
}

// ---------------------------------------------------------------------------
// ResourceRegistry
// ---------------------------------------------------------------------------

void ResourceRegistry::registerHandler(const std::string& resource,
                                       std::shared_ptr<ResourceHandler> handler) {
    std::lock_guard<std::mutex> lock(mMutex);
    mHandlers[resource] = std::move(handler);
}

std::shared_ptr<ResourceHandler> ResourceRegistry::find(const std::string& resource) const {
    std::lock_guard<std::mutex> lock(mMutex);
    auto it = mHandlers.find(resource);
    return it == mHandlers.end() ? nullptr : it->second;
}

std::vector<std::string> ResourceRegistry::resources() const {
    std::lock_guard<std::mutex> lock(mMutex);
    std::vector<std::string> names;
    names.reserve(mHandlers.size());
    for (const auto& entry : mHandlers) {
        names.push_back(entry.first);
    }
    return names;
}

void registerDefaultResources(ResourceRegistry& registry, ApiClient& client) {
    const std::pair<const char*, const char*> defaults[] = {
        {"app",              "/v3/apps"},
        {"space",            "/v3/spaces"},
        {"organization",     "/v3/organizations"},
        {"route",            "/v3/routes"},
        {"service_instance", "/v3/service_instances"},
    };
    for (const auto& [resource, path] : defaults) {
        registry.registerHandler(resource, std::make_shared<RestResourceHandler>(client, path));
    }
}

// ---------------------------------------------------------------------------
// BatchExecutor
// ---------------------------------------------------------------------------

namespace {

/// Guid carried by a delete/get payload: a bare string or {"guid": ...}.
std::string payloadGuid(const BatchOperation& operation) {
    const auto& data = operation.data;
    if (data.is_string()) {
        return data.get<std::string>();
    }
    if (data.is_object() && data.contains("guid") && data["guid"].is_string()) {
        return data["guid"].get<std::string>();
    }
    throw BatchOperationError(ErrorKind::InvalidPayload, operation.id,
                              std::string("invalid data type for ") +
                                  operationTypeName(operation.type) + " of " + operation.resource);
}

} // namespace

BatchExecutor::BatchExecutor(ResourceRegistry& registry, int concurrency,
                             std::shared_ptr<Logger> logger)
    : mRegistry(registry)
    , mConcurrency(concurrency > 0 ? concurrency : kDefaultConcurrency)
    , mLogger(logger ? std::move(logger) : std::make_shared<NullLogger>()) {}

std::vector<BatchResult> BatchExecutor::execute(const CancelToken& cancel,
                                                const std::vector<BatchOperation>& operations) {
    std::vector<BatchResult> results(operations.size());
    if (operations.empty()) {
        return results;
    }

    // Each worker writes only its own slot.
    boost::asio::thread_pool pool(static_cast<std::size_t>(mConcurrency));
    for (std::size_t i = 0; i < operations.size(); ++i) {
        boost::asio::post(pool, [this, &cancel, &operations, &results, i] {
            results[i] = runOperation(cancel, operations[i]);
        });
    }
    pool.join();

    return results;
}

BatchResult BatchExecutor::runOperation(const CancelToken& cancel, const BatchOperation& operation) {
    const auto start = std::chrono::steady_clock::now();

    BatchResult result;
    result.id = operation.id;

    const CancelToken opCancel = cancel.withTimeout(mTimeout);
    try {
        opCancel.throwIfCancelled();

        auto handler = mRegistry.find(operation.resource);
        if (!handler) {
            throw BatchOperationError(ErrorKind::UnsupportedResource, operation.id,
                                      "unsupported resource type: " + operation.resource);
        }
        result.data    = dispatch(opCancel, *handler, operation);
        result.success = true;
    } catch (const std::exception& e) {
        result.error = std::current_exception();
        mLogger->debug("Batch operation failed", {{"id", operation.id}, {"error", e.what()}});
    }
    result.duration = std::chrono::steady_clock::now() - start;

    if (operation.callback) {
        try {
            operation.callback(result);
        } catch (const std::exception& e) {
            mLogger->error("Batch callback threw", {{"id", operation.id}, {"error", e.what()}});
        }
    }
    return result;
}

nlohmann::json BatchExecutor::dispatch(const CancelToken& cancel, ResourceHandler& handler,
                                       const BatchOperation& operation) {
    switch (operation.type) {
        case OperationType::Create:
            if (!operation.data.is_object()) {
                throw BatchOperationError(ErrorKind::InvalidPayload, operation.id,
                                          "invalid data type for create of " + operation.resource);
            }
            return handler.create(cancel, operation.data);

        case OperationType::Update: {
            const auto& data = operation.data;
            if (!data.is_object() || !data.contains("guid") || !data["guid"].is_string()) {
                throw BatchOperationError(ErrorKind::InvalidPayload, operation.id,
                                          "invalid data type for update of " + operation.resource);
            }
            return handler.update(cancel, data["guid"].get<std::string>(),
                                  data.value("request", nlohmann::json::object()));
        }

        case OperationType::Delete:
            return handler.remove(cancel, payloadGuid(operation));

        case OperationType::Get:
            return handler.get(cancel, payloadGuid(operation));
    }
    throw BatchOperationError(ErrorKind::UnsupportedOperation, operation.id,
                              "unsupported operation type");
}

// ---------------------------------------------------------------------------
// BatchBuilder
// ---------------------------------------------------------------------------

BatchBuilder& BatchBuilder::create(const std::string& id, const std::string& resource,
                                   nlohmann::json request) {
    return add(BatchOperation{id, OperationType::Create, resource, std::move(request), nullptr});
}

BatchBuilder& BatchBuilder::update(const std::string& id, const std::string& resource,
                                   const std::string& guid, nlohmann::json request) {
    nlohmann::json data = {{"guid", guid}, {"request", std::move(request)}};
    return add(BatchOperation{id, OperationType::Update, resource, std::move(data), nullptr});
}

BatchBuilder& BatchBuilder::remove(const std::string& id, const std::string& resource,
                                   const std::string& guid) {
    return add(BatchOperation{id, OperationType::Delete, resource, guid, nullptr});
}

BatchBuilder& BatchBuilder::get(const std::string& id, const std::string& resource,
                                const std::string& guid) {
    return add(BatchOperation{id, OperationType::Get, resource, guid, nullptr});
}

BatchBuilder& BatchBuilder::add(BatchOperation operation) {
    mOperations.push_back(std::move(operation));
    return *this;
}

BatchBuilder& BatchBuilder::onComplete(std::function<void(const BatchResult&)> callback) {
    if (mOperations.empty()) {
        throw std::logic_error("onComplete() called before any operation was added");
    }
    mOperations.back().callback = std::move(callback);
    return *this;
}

// ---------------------------------------------------------------------------
// BatchTransaction
// ---------------------------------------------------------------------------

namespace {
std::string describeFailure(const std::vector<std::string>& failedIds) {
    std::ostringstream os;
    os << "transaction failed, " << failedIds.size() << " operations failed: [";
    for (std::size_t i = 0; i < failedIds.size(); ++i) {
        if (i) os << ' ';
        os << failedIds[i];
    }
    os << ']';
    return os.str();
}
} // namespace

TransactionFailedError::TransactionFailedError(std::vector<std::string> failedIds,
                                               std::vector<BatchResult> results,
                                               RollbackReport rollback)
    : PipelineError(ErrorKind::TransactionFailed, describeFailure(failedIds))
    , mFailedIds(std::move(failedIds))
    , mResults(std::move(results))
    , mRollback(std::move(rollback)) {}

BatchTransaction::BatchTransaction(BatchExecutor& executor) : mExecutor(executor) {}

BatchTransaction& BatchTransaction::add(BatchOperation operation) {
    mOperations.push_back(std::move(operation));
    return *this;
}

BatchTransaction& BatchTransaction::setRollback(bool rollback) {
    mRollback = rollback;
    return *this;
}

std::vector<BatchResult> BatchTransaction::execute(const CancelToken& cancel) {
    mResults = mExecutor.execute(cancel, mOperations);

    std::vector<std::string> failedIds;
    for (const auto& result : mResults) {
        if (!result.success) {
            failedIds.push_back(result.id);
        }
    }

    if (!failedIds.empty() && mRollback) {
        RollbackReport report = performRollback(cancel);
        throw TransactionFailedError(std::move(failedIds), mResults, std::move(report));
    }
    return mResults;
}

RollbackReport BatchTransaction::performRollback(const CancelToken& cancel) {
    RollbackReport report;
    report.attempted = true;

    std::vector<BatchOperation> inverse;
    std::vector<std::string>    originalIds;

    for (std::size_t i = 0; i < mResults.size(); ++i) {
        const BatchResult&    result   = mResults[i];
        const BatchOperation& original = mOperations[i];
        if (!result.success) continue;

        switch (original.type) {
            case OperationType::Create: {
                const auto& data = result.data;
                if (data.is_object() && data.contains("guid") && data["guid"].is_string()) {
                    inverse.push_back(BatchOperation{"rollback_" + original.id,
                                                     OperationType::Delete, original.resource,
                                                     data["guid"], nullptr});
                    originalIds.push_back(original.id);
                } else {
                    report.failures[original.id] = "created resource has no guid";
                }
                break;
            }
            case OperationType::Update:
            case OperationType::Delete:
                report.notReversible.push_back(original.id);
                break;
            case OperationType::Get:
                break;
        }
    }

    if (inverse.empty()) {
        return report;
    }

    auto rollbackResults = mExecutor.execute(cancel, inverse);
    for (std::size_t i = 0; i < rollbackResults.size(); ++i) {
        if (rollbackResults[i].success) {
            report.rolledBack.push_back(originalIds[i]);
        } else {
            report.failures[originalIds[i]] = describeError(rollbackResults[i].error);
        }
    }
    return report;
}

} // namespace capi_pipeline
