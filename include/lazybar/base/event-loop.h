#pragma once

#include "event.h"
#include "event-listener.h"
#include <lazybar/result.hpp>
#include <memory>

namespace lazybar {
namespace base {

//-----------------------------------------------------------------------------
// Waker - thread-safe handle that wakes the loop it was created on
//-----------------------------------------------------------------------------
class Waker {
public:
    using Ptr = std::shared_ptr<Waker>;

    virtual ~Waker() = default;

    // Safe from any thread. Multiple sends before the loop runs collapse into
    // one Wake event. No-op once the owning loop has destroyed the handle.
    virtual void send() noexcept = 0;
};

//-----------------------------------------------------------------------------
// EventLoop - libuv loop with poll, timer, wake and signal handles
//
// Every EventLoop owns its own uv_loop_t so several loops can live in one
// process (tests run one per case). All methods except Waker::send() must be
// called from the thread running start().
//-----------------------------------------------------------------------------
class EventLoop {
public:
    using Ptr = std::shared_ptr<EventLoop>;

    static Result<Ptr> create() noexcept;

    virtual ~EventLoop() = default;

    // Run the loop (blocking) until stop() is called or no handle is active
    virtual int start() = 0;

    // Stop the loop; start() returns after the current iteration
    virtual Result<void> stop() = 0;

    // Close every handle and let libuv finish the close callbacks
    virtual Result<void> close() = 0;

    // Poll (file descriptor) management
    virtual Result<PollId> createPoll() = 0;
    virtual Result<void> configPoll(PollId id, int fd) = 0;
    virtual Result<void> startPoll(PollId id) = 0;
    virtual Result<void> stopPoll(PollId id) = 0;
    virtual Result<void> destroyPoll(PollId id) = 0;
    virtual Result<void> registerPollListener(PollId id, EventListener::Ptr listener) = 0;

    // Timer management
    virtual Result<TimerId> createTimer() = 0;
    virtual Result<void> configTimer(TimerId id, Timeout timeoutMs) = 0;
    virtual Result<void> startTimer(TimerId id) = 0;
    virtual Result<void> stopTimer(TimerId id) = 0;
    virtual Result<void> destroyTimer(TimerId id) = 0;
    virtual Result<void> registerTimerListener(TimerId id, EventListener::Ptr listener) = 0;

    // Cross-thread wake-ups
    virtual Result<WakeId> createWake() = 0;
    virtual Result<Waker::Ptr> waker(WakeId id) = 0;
    virtual Result<void> destroyWake(WakeId id) = 0;
    virtual Result<void> registerWakeListener(WakeId id, EventListener::Ptr listener) = 0;

    // POSIX signals delivered on the loop thread
    virtual Result<SignalId> createSignal(int signum) = 0;
    virtual Result<void> destroySignal(SignalId id) = 0;
    virtual Result<void> registerSignalListener(SignalId id, EventListener::Ptr listener) = 0;

protected:
    EventLoop() = default;
};

} // namespace base
} // namespace lazybar
