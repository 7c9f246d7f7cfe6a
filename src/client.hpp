#pragma once

#include "cancellation.hpp"
#include "config.hpp"
#include "endpoints.hpp"
#include "executor.hpp"
#include "metrics.hpp"
#include "pagination.hpp"
#include "transport.hpp"

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace notion_sync {

/// One paginated operation.  Owns its reporter and cancellation signal, so
/// independent operations never share either.  Not movable: the stream
/// refers to both members.
class PaginatedOperation {
public:
    PaginatedOperation(TransportExecutor& executor,
                       RequestDescriptor initial,
                       const OperatorConfig& config,
                       bool verbose = false);

    PaginatedOperation(const PaginatedOperation&)            = delete;
    PaginatedOperation& operator=(const PaginatedOperation&) = delete;

    std::optional<Page> next() { return mStream.next(); }
    std::vector<Page>   collect() { return mStream.collect(); }

    /// Safe to call from any thread, any number of times.
    void cancel() { mSignal.cancel(); }

    MetricsReporter&    reporter() { return mReporter; }
    CancellationSignal& signal() { return mSignal; }
    const PageStream&   stream() const { return mStream; }

private:
    MetricsReporter    mReporter;
    CancellationSignal mSignal;
    PageStream         mStream;
};

/// One single-shot call.
class SingleOperation {
public:
    SingleOperation(TransportExecutor& executor,
                    RequestDescriptor descriptor,
                    const OperatorConfig& config);

    SingleOperation(const SingleOperation&)            = delete;
    SingleOperation& operator=(const SingleOperation&) = delete;

    const Outcome&        outcome() const { return mCall.outcome(); }
    const nlohmann::json& data() const { return mCall.data(); }
    ResponseMeta          raw() const { return mCall.raw(); }

    /// A handle sharing this operation's single execution.
    CallHandle handle() const { return mCall; }

    void cancel() { mSignal.cancel(); }

    MetricsReporter& reporter() { return mReporter; }

private:
    MetricsReporter    mReporter;
    CancellationSignal mSignal;
    CallHandle         mCall;
};

/// Resource-level entry points over one transport and one HttpConfig.
/// Operations borrow the client's executor, so the client must outlive them.
class Client {
public:
    Client(HttpTransport& transport, HttpConfig config, bool verbose = false);

    /// POST /search, following "next_cursor" through the body's
    /// "start_cursor".
    std::unique_ptr<PaginatedOperation> search(const nlohmann::json& request,
                                               const OperatorConfig& config = {});

    /// GET /pages/{pageId}/properties/{propertyId}, following the cursor
    /// through the "start_cursor" query parameter.
    std::unique_ptr<PaginatedOperation> getPropertyItems(const std::string& pageId,
                                                         const std::string& propertyId,
                                                         const OperatorConfig& config = {});

    /// GET a database, page or block.
    /// @throws std::invalid_argument for ResourceType::Property.
    std::unique_ptr<SingleOperation> get(ResourceType type,
                                         const std::string& id,
                                         const OperatorConfig& config = {});

    const HttpConfig& config() const { return mConfig; }

private:
    HttpConfig        mConfig;
    TransportExecutor mExecutor;
    bool              mVerbose;
};

} // namespace notion_sync
