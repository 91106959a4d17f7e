#pragma once

#include <chrono>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <vector>

namespace lazybar {
namespace base {

//-----------------------------------------------------------------------------
// CancelToken - cooperative cancellation for worker threads
//
// A worker blocks in waitFor() instead of sleeping so that cancel() and
// poke() wake it immediately. Code blocked in a syscall registers an
// onCancel() callback that unblocks it (closing a pipe, killing a child).
//-----------------------------------------------------------------------------
class CancelToken {
public:
    using Ptr = std::shared_ptr<CancelToken>;
    using Callback = std::function<void()>;
    using CallbackId = uint64_t;

    enum class WaitResult {
        Timeout,
        Poked,
        Cancelled,
    };

    CancelToken() = default;

    CancelToken(const CancelToken&) = delete;
    CancelToken& operator=(const CancelToken&) = delete;

    // Request cancellation: wakes every waiter and runs registered callbacks
    // once, on the calling thread.
    void cancel();
    bool cancelled() const;

    // Wake waiters without cancelling (new input is available)
    void poke();

    WaitResult waitFor(std::chrono::milliseconds timeout);
    WaitResult waitUntil(std::chrono::steady_clock::time_point deadline);

    // Also returns Poked as soon as `ready` holds. `ready` is evaluated with
    // the token's lock held and must not call back into the token.
    WaitResult waitUntil(std::chrono::steady_clock::time_point deadline,
                         const std::function<bool()>& ready);

    // Runs immediately if already cancelled. Returns an id for removeOnCancel.
    CallbackId onCancel(Callback callback);
    void removeOnCancel(CallbackId id);

private:
    mutable std::mutex _mutex;
    std::condition_variable _cv;
    bool _cancelled = false;
    uint64_t _pokes = 0;
    CallbackId _nextCallbackId = 1;
    std::vector<std::pair<CallbackId, Callback>> _callbacks;
};

} // namespace base
} // namespace lazybar
