#include <lazybar/base/event-loop.h>
#include <ytrace/ytrace.hpp>
#include <uv.h>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace lazybar {
namespace base {

namespace {

// Each handle struct starts with its uv handle so the close callback can
// delete the whole struct through handle->data.
struct PollHandle {
    uv_poll_t poll;
    int fd = -1;
    bool initialized = false;
    std::vector<std::weak_ptr<EventListener>> listeners;
};

struct TimerHandle {
    uv_timer_t timer;
    TimerId id = NoHandleId;
    Timeout timeout = 0;
    std::vector<std::weak_ptr<EventListener>> listeners;
};

// Shared between the loop and any thread holding a Waker
struct WakeState {
    std::mutex mutex;
    uv_async_t* async = nullptr;
};

struct WakeHandle {
    uv_async_t async;
    WakeId id = NoHandleId;
    std::shared_ptr<WakeState> state;
    std::vector<std::weak_ptr<EventListener>> listeners;
};

struct SignalHandle {
    uv_signal_t signal;
    SignalId id = NoHandleId;
    int signum = 0;
    std::vector<std::weak_ptr<EventListener>> listeners;
};

class WakerImpl : public Waker {
public:
    explicit WakerImpl(std::shared_ptr<WakeState> state) : _state(std::move(state)) {}

    void send() noexcept override {
        std::lock_guard<std::mutex> lock(_state->mutex);
        if (_state->async) {
            uv_async_send(_state->async);
        }
    }

private:
    std::shared_ptr<WakeState> _state;
};

template<typename H>
void deleteOnClose(uv_handle_t* handle) {
    delete static_cast<H*>(handle->data);
}

void dispatchTo(const std::vector<std::weak_ptr<EventListener>>& listeners, const Event& event) {
    // Copy: a listener may register or destroy handles while we iterate
    auto copy = listeners;
    for (const auto& wp : copy) {
        if (auto sp = wp.lock()) {
            if (auto res = sp->onEvent(event); !res) {
                yerror("EventLoop: listener failed: {}", error_msg(res));
            }
        }
    }
}

} // anonymous namespace

class EventLoopImpl : public EventLoop {
public:
    EventLoopImpl() = default;

    ~EventLoopImpl() override {
        if (_initialized) {
            if (auto res = close(); !res) {
                ywarn("EventLoop: close at destruction failed: {}", error_msg(res));
            }
            if (uv_loop_close(&_loop) != 0) {
                ywarn("EventLoop: loop closed with active handles");
            }
        }
    }

    Result<void> init() noexcept {
        int r = uv_loop_init(&_loop);
        if (r != 0) {
            return Err<void>(std::string("uv_loop_init failed: ") + uv_strerror(r));
        }
        _loop.data = this;
        _initialized = true;
        return Ok();
    }

    int start() override {
        ydebug("EventLoop::start");
        return uv_run(&_loop, UV_RUN_DEFAULT);
    }

    Result<void> stop() override {
        ydebug("EventLoop::stop");
        uv_stop(&_loop);
        return Ok();
    }

    Result<void> close() override {
        for (auto& [id, ph] : _polls) {
            closePoll(ph);
        }
        _polls.clear();
        for (auto& [id, th] : _timers) {
            closeTimer(th);
        }
        _timers.clear();
        for (auto& [id, wh] : _wakes) {
            closeWake(wh);
        }
        _wakes.clear();
        for (auto& [id, sh] : _signals) {
            closeSignal(sh);
        }
        _signals.clear();
        // Run the close callbacks
        uv_run(&_loop, UV_RUN_DEFAULT);
        return Ok();
    }

    //=========================================================================
    // Poll
    //=========================================================================

    Result<PollId> createPoll() override {
        PollId id = _nextPollId++;
        auto* ph = new PollHandle();
        ph->poll.data = ph;
        _polls[id] = ph;
        return Ok(id);
    }

    Result<void> configPoll(PollId id, int fd) override {
        auto it = _polls.find(id);
        if (it == _polls.end()) {
            return Err<void>("Poll not found");
        }
        auto* ph = it->second;
        if (ph->initialized) {
            return Err<void>("Poll already configured");
        }
        int r = uv_poll_init(&_loop, &ph->poll, fd);
        if (r != 0) {
            yerror("EventLoop::configPoll: uv_poll_init failed for fd={}: {}", fd, uv_strerror(r));
            return Err<void>(std::string("uv_poll_init failed: ") + uv_strerror(r));
        }
        ph->fd = fd;
        ph->initialized = true;
        ph->poll.data = ph;
        ydebug("EventLoop::configPoll: id={} fd={}", id, fd);
        return Ok();
    }

    Result<void> startPoll(PollId id) override {
        auto it = _polls.find(id);
        if (it == _polls.end() || !it->second->initialized) {
            return Err<void>("Poll not found");
        }
        int r = uv_poll_start(&it->second->poll, UV_READABLE, onPollCallback);
        if (r != 0) {
            yerror("EventLoop::startPoll: uv_poll_start failed for fd={}: {}", it->second->fd, uv_strerror(r));
            return Err<void>(std::string("uv_poll_start failed: ") + uv_strerror(r));
        }
        return Ok();
    }

    Result<void> stopPoll(PollId id) override {
        auto it = _polls.find(id);
        if (it == _polls.end() || !it->second->initialized) {
            return Err<void>("Poll not found");
        }
        uv_poll_stop(&it->second->poll);
        return Ok();
    }

    Result<void> destroyPoll(PollId id) override {
        auto it = _polls.find(id);
        if (it == _polls.end()) {
            return Err<void>("Poll not found");
        }
        closePoll(it->second);
        _polls.erase(it);
        return Ok();
    }

    Result<void> registerPollListener(PollId id, EventListener::Ptr listener) override {
        auto it = _polls.find(id);
        if (it == _polls.end()) {
            return Err<void>("Poll not found");
        }
        it->second->listeners.push_back(listener);
        return Ok();
    }

    //=========================================================================
    // Timer
    //=========================================================================

    Result<TimerId> createTimer() override {
        TimerId id = _nextTimerId++;
        auto* th = new TimerHandle();
        th->id = id;
        uv_timer_init(&_loop, &th->timer);
        th->timer.data = th;
        _timers[id] = th;
        ydebug("EventLoop::createTimer: id={}", id);
        return Ok(id);
    }

    Result<void> configTimer(TimerId id, Timeout timeoutMs) override {
        auto it = _timers.find(id);
        if (it == _timers.end()) {
            return Err<void>("Timer not found");
        }
        auto* th = it->second;
        th->timeout = timeoutMs;
        // Restart timer if it's already running
        if (uv_is_active(reinterpret_cast<uv_handle_t*>(&th->timer))) {
            uv_timer_start(&th->timer, onTimerCallback, timeoutMs, timeoutMs);
        }
        return Ok();
    }

    Result<void> startTimer(TimerId id) override {
        auto it = _timers.find(id);
        if (it == _timers.end()) {
            return Err<void>("Timer not found");
        }
        auto* th = it->second;
        if (th->timeout <= 0) {
            return Err<void>("Timer has no timeout configured");
        }
        uv_timer_start(&th->timer, onTimerCallback, th->timeout, th->timeout);
        return Ok();
    }

    Result<void> stopTimer(TimerId id) override {
        auto it = _timers.find(id);
        if (it == _timers.end()) {
            return Err<void>("Timer not found");
        }
        uv_timer_stop(&it->second->timer);
        return Ok();
    }

    Result<void> destroyTimer(TimerId id) override {
        auto it = _timers.find(id);
        if (it == _timers.end()) {
            return Err<void>("Timer not found");
        }
        closeTimer(it->second);
        _timers.erase(it);
        return Ok();
    }

    Result<void> registerTimerListener(TimerId id, EventListener::Ptr listener) override {
        auto it = _timers.find(id);
        if (it == _timers.end()) {
            return Err<void>("Timer not found");
        }
        it->second->listeners.push_back(listener);
        return Ok();
    }

    //=========================================================================
    // Wake
    //=========================================================================

    Result<WakeId> createWake() override {
        WakeId id = _nextWakeId++;
        auto* wh = new WakeHandle();
        wh->id = id;
        int r = uv_async_init(&_loop, &wh->async, onWakeCallback);
        if (r != 0) {
            delete wh;
            return Err<WakeId>(std::string("uv_async_init failed: ") + uv_strerror(r));
        }
        wh->async.data = wh;
        wh->state = std::make_shared<WakeState>();
        wh->state->async = &wh->async;
        _wakes[id] = wh;
        return Ok(id);
    }

    Result<Waker::Ptr> waker(WakeId id) override {
        auto it = _wakes.find(id);
        if (it == _wakes.end()) {
            return Err<Waker::Ptr>("Wake not found");
        }
        return Ok(Waker::Ptr(std::make_shared<WakerImpl>(it->second->state)));
    }

    Result<void> destroyWake(WakeId id) override {
        auto it = _wakes.find(id);
        if (it == _wakes.end()) {
            return Err<void>("Wake not found");
        }
        closeWake(it->second);
        _wakes.erase(it);
        return Ok();
    }

    Result<void> registerWakeListener(WakeId id, EventListener::Ptr listener) override {
        auto it = _wakes.find(id);
        if (it == _wakes.end()) {
            return Err<void>("Wake not found");
        }
        it->second->listeners.push_back(listener);
        return Ok();
    }

    //=========================================================================
    // Signal
    //=========================================================================

    Result<SignalId> createSignal(int signum) override {
        SignalId id = _nextSignalId++;
        auto* sh = new SignalHandle();
        sh->id = id;
        sh->signum = signum;
        uv_signal_init(&_loop, &sh->signal);
        sh->signal.data = sh;
        int r = uv_signal_start(&sh->signal, onSignalCallback, signum);
        if (r != 0) {
            uv_close(reinterpret_cast<uv_handle_t*>(&sh->signal), deleteOnClose<SignalHandle>);
            return Err<SignalId>(std::string("uv_signal_start failed: ") + uv_strerror(r));
        }
        _signals[id] = sh;
        return Ok(id);
    }

    Result<void> destroySignal(SignalId id) override {
        auto it = _signals.find(id);
        if (it == _signals.end()) {
            return Err<void>("Signal not found");
        }
        closeSignal(it->second);
        _signals.erase(it);
        return Ok();
    }

    Result<void> registerSignalListener(SignalId id, EventListener::Ptr listener) override {
        auto it = _signals.find(id);
        if (it == _signals.end()) {
            return Err<void>("Signal not found");
        }
        it->second->listeners.push_back(listener);
        return Ok();
    }

private:
    //=========================================================================
    // Close helpers
    //=========================================================================

    static void closePoll(PollHandle* ph) {
        if (!ph->initialized) {
            delete ph;
            return;
        }
        uv_poll_stop(&ph->poll);
        uv_close(reinterpret_cast<uv_handle_t*>(&ph->poll), deleteOnClose<PollHandle>);
    }

    static void closeTimer(TimerHandle* th) {
        uv_timer_stop(&th->timer);
        uv_close(reinterpret_cast<uv_handle_t*>(&th->timer), deleteOnClose<TimerHandle>);
    }

    static void closeWake(WakeHandle* wh) {
        {
            std::lock_guard<std::mutex> lock(wh->state->mutex);
            wh->state->async = nullptr;
        }
        uv_close(reinterpret_cast<uv_handle_t*>(&wh->async), deleteOnClose<WakeHandle>);
    }

    static void closeSignal(SignalHandle* sh) {
        uv_signal_stop(&sh->signal);
        uv_close(reinterpret_cast<uv_handle_t*>(&sh->signal), deleteOnClose<SignalHandle>);
    }

    //=========================================================================
    // libuv callbacks
    //=========================================================================

    static void onPollCallback(uv_poll_t* handle, int status, int events) {
        auto* ph = static_cast<PollHandle*>(handle->data);
        if (status < 0) {
            ywarn("EventLoop::onPollCallback: error status={} for fd={}", uv_strerror(status), ph->fd);
            dispatchTo(ph->listeners, Event::pollError(ph->fd, status));
            return;
        }
        if (events & UV_READABLE) {
            dispatchTo(ph->listeners, Event::pollReadable(ph->fd));
        }
    }

    static void onTimerCallback(uv_timer_t* handle) {
        auto* th = static_cast<TimerHandle*>(handle->data);
        dispatchTo(th->listeners, Event::timerEvent(th->id));
    }

    static void onWakeCallback(uv_async_t* handle) {
        auto* wh = static_cast<WakeHandle*>(handle->data);
        dispatchTo(wh->listeners, Event::wakeEvent(wh->id));
    }

    static void onSignalCallback(uv_signal_t* handle, int signum) {
        auto* sh = static_cast<SignalHandle*>(handle->data);
        yinfo("EventLoop: signal {} received", signum);
        dispatchTo(sh->listeners, Event::signalEvent(sh->id, signum));
    }

    uv_loop_t _loop{};
    bool _initialized = false;

    std::unordered_map<PollId, PollHandle*> _polls;
    std::unordered_map<TimerId, TimerHandle*> _timers;
    std::unordered_map<WakeId, WakeHandle*> _wakes;
    std::unordered_map<SignalId, SignalHandle*> _signals;
    PollId _nextPollId = 1;
    TimerId _nextTimerId = 1;
    WakeId _nextWakeId = 1;
    SignalId _nextSignalId = 1;
};

// Factory implementation
Result<EventLoop::Ptr> EventLoop::create() noexcept {
    auto loop = std::make_shared<EventLoopImpl>();
    if (auto res = loop->init(); !res) {
        return Err<Ptr>("Failed to initialize EventLoop", res);
    }
    return Ok(Ptr(loop));
}

} // namespace base
} // namespace lazybar
