#pragma once

#include "error.hpp"

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <optional>

namespace notion_sync {

/// One-way, idempotent cancellation flag shared by every suspension point of
/// a single logical operation (one pagination run or one single-shot call).
///
/// The signal fires either through cancel() or when an armed deadline passes.
/// The deadline is evaluated cooperatively: whenever somebody polls, waits, or
/// asks for the remaining time.  Transports bound their own timers by
/// remaining(), so an in-flight call never outlives the deadline.
///
/// Thread-safe.  cancel() may be called from any thread.
class CancellationSignal {
public:
    using Clock    = std::chrono::steady_clock;
    using Callback = std::function<void()>;

    /// RAII handle for an abort callback.  Destroying it unregisters the
    /// callback; once the destructor returns the callback will not run.
    class Registration {
    public:
        Registration() = default;
        Registration(CancellationSignal* signal, std::uint64_t id)
            : mSignal(signal), mId(id) {}
        Registration(Registration&& other) noexcept;
        Registration& operator=(Registration&& other) noexcept;
        Registration(const Registration&)            = delete;
        Registration& operator=(const Registration&) = delete;
        ~Registration();

        void reset();

    private:
        CancellationSignal* mSignal = nullptr;
        std::uint64_t       mId     = 0;
    };

    CancellationSignal() = default;
    CancellationSignal(const CancellationSignal&)            = delete;
    CancellationSignal& operator=(const CancellationSignal&) = delete;

    /// Fire the signal.  Returns true only for the call that actually fired
    /// it; later calls are no-ops.
    bool cancel(CancelReason reason = CancelReason::Cancelled);

    /// Bound the whole operation.  The deadline is measured from now.
    void armDeadline(std::chrono::milliseconds timeout);

    /// Evaluate the deadline and report whether the signal has fired.
    bool poll();

    CancelReason reason() const;

    /// Time left before the deadline, or nullopt when none is armed.
    /// Also fires the signal if the deadline has passed.
    std::optional<std::chrono::milliseconds> remaining();

    /// The timeout the deadline was armed with, if any.
    std::optional<std::chrono::milliseconds> deadlineBudget() const;

    /// Sleep for @p duration unless the signal fires first.
    /// @return true if the full duration elapsed, false if cancelled.
    bool waitFor(std::chrono::milliseconds duration);

    /// Register an abort hook for in-flight work.  If the signal has already
    /// fired the callback runs immediately on the calling thread.
    ///
    /// Callbacks run while the signal's lock is held and must not call back
    /// into this signal.  Posting work to an event loop is fine.
    [[nodiscard]] Registration onCancel(Callback callback);

private:
    void fireLocked(CancelReason reason);
    void checkDeadlineLocked();
    void unregister(std::uint64_t id);

    mutable std::mutex      mMutex;
    std::condition_variable mCv;
    CancelReason            mReason = CancelReason::None;

    std::optional<Clock::time_point>          mDeadline;
    std::optional<std::chrono::milliseconds>  mDeadlineBudget;

    std::map<std::uint64_t, Callback> mCallbacks;
    std::uint64_t                     mNextId = 1;
};

} // namespace notion_sync
