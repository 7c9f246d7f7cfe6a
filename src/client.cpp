#include "client.hpp"

#include <future>
#include <iostream>
#include <stdexcept>

namespace notion_sync {

namespace {

PaginationLimits checkedLimits(const OperatorConfig& config) {
    // Paginator::paginate validates too; fail before arming any deadline.
    if (config.limits.pages && *config.limits.pages < 1) {
        throw std::invalid_argument("pages limit must be >= 1");
    }
    if (config.limits.results && *config.limits.results < 1) {
        throw std::invalid_argument("results limit must be >= 1");
    }
    return config.limits;
}

} // namespace

// ---------------------------------------------------------------------------
// PaginatedOperation
// ---------------------------------------------------------------------------

PaginatedOperation::PaginatedOperation(TransportExecutor& executor,
                                       RequestDescriptor initial,
                                       const OperatorConfig& config,
                                       bool verbose)
    : mReporter()
    , mSignal()
    , mStream(Paginator(executor, verbose).paginate(std::move(initial),
                                                    checkedLimits(config),
                                                    mReporter, mSignal))
{
    if (config.timeout) {
        mSignal.armDeadline(*config.timeout);
    }
}

// ---------------------------------------------------------------------------
// SingleOperation
// ---------------------------------------------------------------------------

SingleOperation::SingleOperation(TransportExecutor& executor,
                                 RequestDescriptor descriptor,
                                 const OperatorConfig& config)
    : mReporter()
    , mSignal()
    , mCall(std::async(std::launch::deferred,
          [this, &executor, descriptor = std::move(descriptor)] {
              Outcome outcome = executor.run(descriptor, mReporter, mSignal);
              if (outcome.ok()) {
                  mReporter.apply([](MetricsSnapshot& s) { s.requests += 1; });
              }
              return outcome;
          }).share())
{
    if (config.timeout) {
        mSignal.armDeadline(*config.timeout);
    }
}

// ---------------------------------------------------------------------------
// Client
// ---------------------------------------------------------------------------

Client::Client(HttpTransport& transport, HttpConfig config, bool verbose)
    : mConfig(std::move(config))
    , mExecutor(transport, verbose)
    , mVerbose(verbose) {}

std::unique_ptr<PaginatedOperation>
Client::search(const nlohmann::json& request, const OperatorConfig& config) {
    RequestDescriptor descriptor = mConfig.toDescriptor(kSearchEndpoint, HttpMethod::Post);
    descriptor.body            = request.is_null() ? nlohmann::json::object() : request;
    descriptor.cursorPlacement = CursorPlacement::Body;

    if (mVerbose) {
        std::cerr << "[Client] search " << descriptor.body->dump() << "\n";
    }
    return std::make_unique<PaginatedOperation>(mExecutor, std::move(descriptor), config, mVerbose);
}

std::unique_ptr<PaginatedOperation>
Client::getPropertyItems(const std::string& pageId,
                         const std::string& propertyId,
                         const OperatorConfig& config) {
    const auto path = endpointFor(ResourceType::Property,
                                  {{"page_id", pageId}, {"property_id", propertyId}});

    RequestDescriptor descriptor = mConfig.toDescriptor(path, HttpMethod::Get);
    descriptor.body.reset();
    descriptor.cursorPlacement = CursorPlacement::Query;

    if (mVerbose) {
        std::cerr << "[Client] property items " << path << "\n";
    }
    return std::make_unique<PaginatedOperation>(mExecutor, std::move(descriptor), config, mVerbose);
}

std::unique_ptr<SingleOperation>
Client::get(ResourceType type, const std::string& id, const OperatorConfig& config) {
    if (type == ResourceType::Property) {
        throw std::invalid_argument("property requests require both page_id and property_id; "
                                    "use getPropertyItems()");
    }
    const auto path = endpointFor(type, {{"id", id}});

    RequestDescriptor descriptor = mConfig.toDescriptor(path, HttpMethod::Get);
    descriptor.body.reset();

    if (mVerbose) {
        std::cerr << "[Client] get " << path << "\n";
    }
    return std::make_unique<SingleOperation>(mExecutor, std::move(descriptor), config);
}

} // namespace notion_sync
