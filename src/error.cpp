#include "error.hpp"

namespace notion_sync {

namespace {

template <class... Ts>
struct Overloaded : Ts... {
    using Ts::operator()...;
};
template <class... Ts>
Overloaded(Ts...) -> Overloaded<Ts...>;

} // namespace

bool isRetryable(const ClassifiedError& error) {
    return std::visit(Overloaded{
        [](const NetworkError&) { return true; },
        [](const TimeoutError&) { return true; },
        [](const HttpError& e) {
            return e.status == 502 || e.status == 503 || e.status == 504;
        },
        [](const Unclassified&) { return false; },
    }, error);
}

std::string describe(const ClassifiedError& error) {
    return std::visit(Overloaded{
        [](const NetworkError& e) { return "network error: " + e.message; },
        [](const TimeoutError& e) { return e.message; },
        [](const HttpError& e) {
            return "HTTP " + std::to_string(e.status) + ": " + e.message;
        },
        [](const Unclassified& e) { return "unclassified error: " + e.message; },
    }, error);
}

unsigned int statusOf(const ClassifiedError& error) {
    if (const auto* http = std::get_if<HttpError>(&error)) {
        return http->status;
    }
    return 0;
}

const char* toString(CancelReason reason) {
    switch (reason) {
        case CancelReason::None:             return "none";
        case CancelReason::Cancelled:        return "cancelled";
        case CancelReason::DeadlineExceeded: return "deadline exceeded";
    }
    return "unknown";
}

} // namespace notion_sync
