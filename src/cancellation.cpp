#include "cancellation.hpp"

#include <algorithm>
#include <utility>

namespace notion_sync {

// ---------------------------------------------------------------------------
// Registration
// ---------------------------------------------------------------------------

CancellationSignal::Registration::Registration(Registration&& other) noexcept
    : mSignal(std::exchange(other.mSignal, nullptr))
    , mId(std::exchange(other.mId, 0)) {}

CancellationSignal::Registration&
CancellationSignal::Registration::operator=(Registration&& other) noexcept {
    if (this != &other) {
        reset();
        mSignal = std::exchange(other.mSignal, nullptr);
        mId     = std::exchange(other.mId, 0);
    }
    return *this;
}

CancellationSignal::Registration::~Registration() {
    reset();
}

void CancellationSignal::Registration::reset() {
    if (mSignal != nullptr) {
        mSignal->unregister(mId);
        mSignal = nullptr;
        mId     = 0;
    }
}

// ---------------------------------------------------------------------------
// Signal
// ---------------------------------------------------------------------------

bool CancellationSignal::cancel(CancelReason reason) {
    if (reason == CancelReason::None) {
        return false;
    }
    std::lock_guard<std::mutex> lock(mMutex);
    if (mReason != CancelReason::None) {
        return false;
    }
    fireLocked(reason);
    return true;
}

void CancellationSignal::armDeadline(std::chrono::milliseconds timeout) {
    std::lock_guard<std::mutex> lock(mMutex);
    mDeadline       = Clock::now() + timeout;
    mDeadlineBudget = timeout;
    // Wake any waiter so it re-plans against the new deadline.
    mCv.notify_all();
}

bool CancellationSignal::poll() {
    std::lock_guard<std::mutex> lock(mMutex);
    checkDeadlineLocked();
    return mReason != CancelReason::None;
}

CancelReason CancellationSignal::reason() const {
    std::lock_guard<std::mutex> lock(mMutex);
    return mReason;
}

std::optional<std::chrono::milliseconds> CancellationSignal::remaining() {
    std::lock_guard<std::mutex> lock(mMutex);
    checkDeadlineLocked();
    if (!mDeadline) {
        return std::nullopt;
    }
    if (mReason != CancelReason::None) {
        return std::chrono::milliseconds(0);
    }
    auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
        *mDeadline - Clock::now());
    return std::max(left, std::chrono::milliseconds(0));
}

std::optional<std::chrono::milliseconds> CancellationSignal::deadlineBudget() const {
    std::lock_guard<std::mutex> lock(mMutex);
    return mDeadlineBudget;
}

bool CancellationSignal::waitFor(std::chrono::milliseconds duration) {
    std::unique_lock<std::mutex> lock(mMutex);
    const auto until = Clock::now() + duration;

    while (true) {
        checkDeadlineLocked();
        if (mReason != CancelReason::None) {
            return false;
        }
        if (Clock::now() >= until) {
            return true;
        }
        auto wakeAt = until;
        if (mDeadline && *mDeadline < wakeAt) {
            wakeAt = *mDeadline;
        }
        mCv.wait_until(lock, wakeAt);
    }
}

CancellationSignal::Registration CancellationSignal::onCancel(Callback callback) {
    {
        std::lock_guard<std::mutex> lock(mMutex);
        checkDeadlineLocked();
        if (mReason == CancelReason::None) {
            const auto id = mNextId++;
            mCallbacks.emplace(id, std::move(callback));
            return Registration(this, id);
        }
    }
    callback();
    return Registration();
}

void CancellationSignal::fireLocked(CancelReason reason) {
    mReason = reason;
    for (auto& entry : mCallbacks) {
        entry.second();
    }
    mCallbacks.clear();
    mCv.notify_all();
}

void CancellationSignal::checkDeadlineLocked() {
    if (mReason == CancelReason::None && mDeadline && Clock::now() >= *mDeadline) {
        fireLocked(CancelReason::DeadlineExceeded);
    }
}

void CancellationSignal::unregister(std::uint64_t id) {
    std::lock_guard<std::mutex> lock(mMutex);
    mCallbacks.erase(id);
}

} // namespace notion_sync
