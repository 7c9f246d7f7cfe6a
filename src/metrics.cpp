#include "metrics.hpp"

#include <vector>

namespace notion_sync {

const char* toString(Stage stage) {
    switch (stage) {
        case Stage::Requesting: return "requesting";
        case Stage::Paginating: return "paginating";
        case Stage::Retrying:   return "retrying";
        case Stage::Timeout:    return "timeout";
        case Stage::Error:      return "error";
        case Stage::Complete:   return "complete";
    }
    return "unknown";
}

void MetricsReporter::apply(const Mutation& mutation) {
    MetricsSnapshot           copy;
    std::vector<Subscriber>   subscribers;
    {
        std::lock_guard<std::mutex> lock(mMutex);
        mutation(mState);
        if (mSubscribers.empty()) {
            return;
        }
        copy = mState;
        subscribers.reserve(mSubscribers.size());
        for (const auto& entry : mSubscribers) {
            subscribers.push_back(entry.second);
        }
    }
    // Subscribers run unlocked so they may read snapshot() themselves.
    for (const auto& subscriber : subscribers) {
        subscriber(copy);
    }
}

MetricsSnapshot MetricsReporter::snapshot() const {
    std::lock_guard<std::mutex> lock(mMutex);
    return mState;
}

int MetricsReporter::subscribe(Subscriber subscriber) {
    std::lock_guard<std::mutex> lock(mMutex);
    const int token = mNextToken++;
    mSubscribers.emplace(token, std::move(subscriber));
    return token;
}

void MetricsReporter::unsubscribe(int token) {
    std::lock_guard<std::mutex> lock(mMutex);
    mSubscribers.erase(token);
}

void MetricsReporter::setStage(Stage stage) {
    apply([stage](MetricsSnapshot& s) { s.stage = stage; });
}

void MetricsReporter::setStage(Stage stage, std::string message) {
    apply([stage, &message](MetricsSnapshot& s) {
        s.stage   = stage;
        s.message = std::move(message);
    });
}

} // namespace notion_sync
