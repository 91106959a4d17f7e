#include <lazybar/event-bus.h>
#include <lazybar/coalescing-slot.h>
#include <ytrace/ytrace.hpp>
#include <atomic>
#include <csignal>
#include <cstdint>
#include <deque>
#include <optional>

namespace lazybar {

using base::Event;
using base::EventLoop;
using base::NoHandleId;

//=============================================================================
// SlotSink - the adapter-facing end of one coalescing slot
//=============================================================================

using UpdateSlot = CoalescingSlot<WidgetUpdated>;

class SlotSink : public UpdateSink {
public:
    SlotSink(std::shared_ptr<UpdateSlot> slot, base::Waker::Ptr waker)
        : _slot(std::move(slot)), _waker(std::move(waker)) {}

    void publish(WidgetUpdated update) override {
        // A non-empty slot already has a wake-up on its way
        if (_slot->put(std::move(update))) {
            _waker->send();
        }
    }

private:
    std::shared_ptr<UpdateSlot> _slot;
    base::Waker::Ptr _waker;
};

//=============================================================================
// EventBusImpl
//=============================================================================

class EventBusImpl : public EventBus,
                     public base::EventListener,
                     public std::enable_shared_from_this<EventBusImpl> {
public:
    EventBusImpl(EventLoop::Ptr loop, const Options& options)
        : _loop(std::move(loop)), _options(options) {}

    Result<void> init() noexcept {
        if (!_loop) {
            return Err<void>("EventBus: null event loop");
        }
        if (_options.displayEventsPerRound == 0 || _options.roundsPerWake == 0) {
            return Err<void>("EventBus: per-round limits must be positive");
        }

        // The wake handle exists before any adapter can publish
        auto wakeRes = _loop->createWake();
        if (!wakeRes) {
            return Err<void>("EventBus: failed to create wake handle", wakeRes);
        }
        _wakeId = *wakeRes;

        auto wakerRes = _loop->waker(_wakeId);
        if (!wakerRes) {
            return Err<void>("EventBus: failed to get waker", wakerRes);
        }
        _waker = *wakerRes;
        return Ok();
    }

    //=========================================================================
    // Setup
    //=========================================================================

    Result<UpdateSink::Ptr> openSlot(WidgetId id) override {
        if (_running) {
            return Err<UpdateSink::Ptr>("EventBus: cannot open slots while running");
        }
        for (const auto& entry : _slots) {
            if (entry.id == id) {
                return Err<UpdateSink::Ptr>("EventBus: slot already open for widget " + std::to_string(id));
            }
        }
        auto slot = std::make_shared<UpdateSlot>();
        _slots.push_back({id, slot});
        return Ok(UpdateSink::Ptr(std::make_shared<SlotSink>(slot, _waker)));
    }

    Result<void> manage(WidgetAdapter::Ptr adapter) override {
        if (!adapter) {
            return Err<void>("EventBus: null adapter");
        }
        if (_running) {
            return Err<void>("EventBus: cannot add adapters while running");
        }
        _adapters.push_back(std::move(adapter));
        return Ok();
    }

    void setConsumer(BusConsumer* consumer) override { _consumer = consumer; }
    void setDisplaySource(DisplayEventSource* source) override { _display = source; }

    const Stats& stats() const override { return _stats; }

    //=========================================================================
    // Run
    //=========================================================================

    Result<void> run() override {
        if (!_consumer) {
            return Err<void>("EventBus: no consumer");
        }
        if (_running) {
            return Err<void>("EventBus: already running");
        }
        _running = true;

        if (auto res = setupHandles(); !res) {
            shutdownAdapters();
            teardownHandles();
            return Err<void>("EventBus: failed to set up loop handles", res);
        }

        for (auto& adapter : _adapters) {
            if (auto res = adapter->start(); !res) {
                yerror("EventBus: {}", error_msg(res));
                fatal(res.error());
                break;
            }
        }

        // Display events may already be queued from window creation
        if (!_shutdown.load()) {
            _waker->send();
            ydebug("EventBus: running with {} slots, {} adapters", _slots.size(), _adapters.size());
            _loop->start();
        }

        yinfo("EventBus: shutting down");
        shutdownAdapters();
        teardownHandles();

        if (_fatal) {
            return std::unexpected(*_fatal);
        }
        return Ok();
    }

    void requestShutdown() override {
        if (!_shutdown.exchange(true)) {
            ydebug("EventBus: shutdown requested");
        }
        _waker->send();
    }

    //=========================================================================
    // EventListener
    //=========================================================================

    Result<bool> onEvent(const Event& event) override {
        switch (event.type) {
            case Event::Type::Wake:
                _stats.wakes++;
                drain();
                return Ok(true);

            case Event::Type::PollReadable:
                drain();
                return Ok(true);

            case Event::Type::PollError:
                fatal(Error("display connection poll failed (status " +
                            std::to_string(event.poll.status) + ")"));
                return Ok(true);

            case Event::Type::Timer:
                if (event.timer.timerId == _tickTimerId) {
                    _stats.ticks++;
                    if (!deliver(Tick{_stats.ticks})) return Ok(true);
                    drain();
                }
                return Ok(true);

            case Event::Type::Signal:
                yinfo("EventBus: signal {}, shutting down", event.signal.signum);
                requestShutdown();
                return Ok(true);

            default:
                return Ok(false);
        }
    }

private:
    struct SlotEntry {
        WidgetId id;
        std::shared_ptr<UpdateSlot> slot;
    };

    //=========================================================================
    // Handles
    //=========================================================================

    Result<void> setupHandles() {
        auto self = shared_from_this();

        if (auto res = _loop->registerWakeListener(_wakeId, self); !res) {
            return Err<void>("wake listener", res);
        }

        if (_options.tickMs > 0) {
            auto timerRes = _loop->createTimer();
            if (!timerRes) return Err<void>("tick timer", timerRes);
            _tickTimerId = *timerRes;
            if (auto res = _loop->registerTimerListener(_tickTimerId, self); !res) {
                return Err<void>("tick listener", res);
            }
            if (auto res = _loop->configTimer(_tickTimerId, _options.tickMs); !res) {
                return Err<void>("tick config", res);
            }
            if (auto res = _loop->startTimer(_tickTimerId); !res) {
                return Err<void>("tick start", res);
            }
        }

        if (_display) {
            auto pollRes = _loop->createPoll();
            if (!pollRes) return Err<void>("display poll", pollRes);
            _pollId = *pollRes;
            if (auto res = _loop->configPoll(_pollId, _display->eventFd()); !res) {
                return Err<void>("display poll config", res);
            }
            if (auto res = _loop->registerPollListener(_pollId, self); !res) {
                return Err<void>("display poll listener", res);
            }
            if (auto res = _loop->startPoll(_pollId); !res) {
                return Err<void>("display poll start", res);
            }
        }

        if (_options.handleSignals) {
            for (int signum : {SIGINT, SIGTERM}) {
                auto sigRes = _loop->createSignal(signum);
                if (!sigRes) return Err<void>("signal handle", sigRes);
                _signalIds.push_back(*sigRes);
                if (auto res = _loop->registerSignalListener(*sigRes, self); !res) {
                    return Err<void>("signal listener", res);
                }
            }
        }
        return Ok();
    }

    void teardownHandles() {
        // close() destroys every handle, including the wake; later sends are no-ops
        if (auto res = _loop->close(); !res) {
            yerror("EventBus: loop close failed: {}", error_msg(res));
        }
        _tickTimerId = NoHandleId;
        _pollId = NoHandleId;
        _signalIds.clear();
    }

    //=========================================================================
    // Shutdown
    //=========================================================================

    void shutdownAdapters() {
        if (_adapters.empty()) return;

        // Cancel everyone first so the grace periods run concurrently
        for (auto& adapter : _adapters) {
            adapter->requestStop();
        }

        const auto deadline = std::chrono::steady_clock::now() + _options.grace;
        size_t abandoned = 0;
        for (auto& adapter : _adapters) {
            auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
                deadline - std::chrono::steady_clock::now());
            if (left.count() < 0) left = std::chrono::milliseconds(0);
            if (!adapter->waitStopped(left)) {
                abandoned++;
            }
        }
        if (abandoned > 0) {
            ywarn("EventBus: {} of {} adapters abandoned after {}ms grace",
                  abandoned, _adapters.size(), _options.grace.count());
        } else {
            ydebug("EventBus: all {} adapters stopped", _adapters.size());
        }
    }

    void fatal(Error error) {
        yerror("EventBus: fatal: {}", error.to_string());
        if (!_fatal) {
            _fatal = std::move(error);
        }
        _shutdown.store(true);
        if (auto res = _loop->stop(); !res) {
            yerror("EventBus: loop stop failed: {}", error_msg(res));
        }
    }

    //=========================================================================
    // Dispatch
    //=========================================================================

    // Returns false when the consumer failed and the bus is going down
    bool deliver(const BusEvent& event) {
        auto res = _consumer->onBusEvent(event);
        if (!res) {
            fatal(Error("consumer failed", res.error()));
            return false;
        }
        return true;
    }

    bool readDisplay() {
        if (!_display) return true;
        std::vector<DisplayEvent> events;
        auto res = _display->readEvents(events);
        if (!res) {
            fatal(Error("display connection error", res.error()));
            return false;
        }
        for (auto& e : events) {
            _displayQueue.push_back(std::move(e));
        }
        return true;
    }

    bool pendingWork() const {
        if (!_displayQueue.empty()) return true;
        for (const auto& entry : _slots) {
            if (entry.slot->pending()) return true;
        }
        return false;
    }

    //-------------------------------------------------------------------------
    // drain - one batch
    //
    // Each round serves up to displayEventsPerRound display events, then at
    // most one update per widget, round-robin starting after the widget that
    // was served last. The number of rounds is bounded; leftover work re-arms
    // the wake so the loop gets to timers and signals in between.
    //-------------------------------------------------------------------------
    void drain() {
        if (_shutdown.load()) {
            if (auto res = _loop->stop(); !res) {
                yerror("EventBus: loop stop failed: {}", error_msg(res));
            }
            return;
        }

        bool served = false;
        for (size_t round = 0; round < _options.roundsPerWake; ++round) {
            if (!readDisplay()) return;

            size_t roundServed = 0;

            for (size_t i = 0; i < _options.displayEventsPerRound && !_displayQueue.empty(); ++i) {
                DisplayEvent e = std::move(_displayQueue.front());
                _displayQueue.pop_front();
                _stats.displayEventsDelivered++;
                roundServed++;
                if (!deliver(toBusEvent(e))) return;
            }

            const size_t n = _slots.size();
            const size_t start = _cursor;
            for (size_t k = 0; k < n; ++k) {
                size_t idx = (start + 1 + k) % n;
                auto update = _slots[idx].slot->take();
                if (!update) continue;
                _cursor = idx;
                _stats.updatesDelivered++;
                roundServed++;
                if (!deliver(std::move(*update))) return;
            }

            if (roundServed == 0) break;
            served = true;

            if (_shutdown.load()) break;
        }

        if (served || _stats.batches == 0) {
            _stats.batches++;
            auto res = _consumer->onBatchEnd();
            if (!res) {
                fatal(Error("consumer batch end failed", res.error()));
                return;
            }
        }

        if (_shutdown.load()) {
            if (auto res = _loop->stop(); !res) {
                yerror("EventBus: loop stop failed: {}", error_msg(res));
            }
            return;
        }

        if (pendingWork()) {
            _stats.rearms++;
            _waker->send();
        }
    }

    EventLoop::Ptr _loop;
    Options _options;
    BusConsumer* _consumer = nullptr;
    DisplayEventSource* _display = nullptr;

    base::WakeId _wakeId = NoHandleId;
    base::Waker::Ptr _waker;
    base::TimerId _tickTimerId = NoHandleId;
    base::PollId _pollId = NoHandleId;
    std::vector<base::SignalId> _signalIds;

    std::vector<SlotEntry> _slots;
    size_t _cursor = SIZE_MAX;  // index served last; SIZE_MAX + 1 wraps to 0
    std::deque<DisplayEvent> _displayQueue;
    std::vector<WidgetAdapter::Ptr> _adapters;

    bool _running = false;
    std::atomic<bool> _shutdown{false};
    std::optional<Error> _fatal;
    Stats _stats;
};

//=============================================================================
// Factory
//=============================================================================

Result<EventBus::Ptr> EventBus::create(EventLoop::Ptr loop, const Options& options) noexcept {
    auto bus = std::make_shared<EventBusImpl>(std::move(loop), options);
    if (auto res = bus->init(); !res) {
        return Err<Ptr>("Failed to initialize EventBus", res);
    }
    return Ok(Ptr(bus));
}

} // namespace lazybar
