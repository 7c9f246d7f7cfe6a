#pragma once

#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>

namespace notion_sync {

enum class Stage {
    Requesting,
    Paginating,
    Retrying,
    Timeout,
    Error,
    Complete,
};

const char* toString(Stage stage);

/// Progress of one logical operation.
struct MetricsSnapshot {
    Stage                      stage    = Stage::Requesting;
    int                        requests = 0;
    int                        errors   = 0;
    int                        items    = 0;
    std::optional<std::string> cursor;
    std::optional<std::string> message;
    bool                       cancelled = false;
};

/// Observable state container shared by the executor and the paginator.
///
/// Mutations are applied in order on a single logical timeline.  Readers
/// may take a snapshot() from any thread at any time; subscribers receive a
/// copy of the snapshot after every mutation, on the mutating thread.
class MetricsReporter {
public:
    using Mutation   = std::function<void(MetricsSnapshot&)>;
    using Subscriber = std::function<void(const MetricsSnapshot&)>;

    MetricsReporter() = default;
    explicit MetricsReporter(MetricsSnapshot initial) : mState(std::move(initial)) {}

    MetricsReporter(const MetricsReporter&)            = delete;
    MetricsReporter& operator=(const MetricsReporter&) = delete;

    /// Apply one mutation and notify subscribers.
    void apply(const Mutation& mutation);

    MetricsSnapshot snapshot() const;

    /// @return token for unsubscribe().
    int subscribe(Subscriber subscriber);
    void unsubscribe(int token);

    // ---- common mutations ----
    void setStage(Stage stage);
    void setStage(Stage stage, std::string message);

private:
    mutable std::mutex         mMutex;
    MetricsSnapshot            mState;
    std::map<int, Subscriber>  mSubscribers;
    int                        mNextToken = 1;
};

} // namespace notion_sync
