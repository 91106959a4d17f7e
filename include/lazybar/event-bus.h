#pragma once

//=============================================================================
// EventBus
//
// Merges every adapter's update slot, the display event stream and a periodic
// tick into one ordered sequence delivered to a single consumer on the loop
// thread. Also owns shutdown: a request from any thread (or SIGINT/SIGTERM)
// stops the loop and cancels every managed adapter.
//=============================================================================

#include <lazybar/base/event-loop.h>
#include <lazybar/bus-event.h>
#include <lazybar/result.hpp>
#include <lazybar/widget-adapter.h>
#include <chrono>
#include <memory>
#include <vector>

namespace lazybar {

//-----------------------------------------------------------------------------
// BusConsumer - processes one event to completion before the next is taken.
// An error from the consumer is fatal and shuts the bus down.
//-----------------------------------------------------------------------------
class BusConsumer {
public:
    virtual ~BusConsumer() = default;

    virtual Result<void> onBusEvent(const BusEvent& event) = 0;

    // End of one drain batch; coalesced work (painting) is flushed here
    virtual Result<void> onBatchEnd() { return Ok(); }
};

//-----------------------------------------------------------------------------
// DisplayEventSource - the surface side of the display connection
//-----------------------------------------------------------------------------
class DisplayEventSource {
public:
    virtual ~DisplayEventSource() = default;

    // Pollable descriptor; readable when events arrive
    virtual int eventFd() const = 0;

    // Non-blocking: append every queued event. An error means the
    // connection is gone.
    virtual Result<void> readEvents(std::vector<DisplayEvent>& out) = 0;
};

class EventBus {
public:
    using Ptr = std::shared_ptr<EventBus>;

    struct Options {
        int tickMs = 1000;                 // 0 disables the tick
        size_t displayEventsPerRound = 16;
        size_t roundsPerWake = 8;
        std::chrono::milliseconds grace{2000};
        bool handleSignals = true;         // SIGINT/SIGTERM request shutdown
    };

    struct Stats {
        uint64_t wakes = 0;
        uint64_t updatesDelivered = 0;
        uint64_t displayEventsDelivered = 0;
        uint64_t ticks = 0;
        uint64_t batches = 0;
        uint64_t rearms = 0;
    };

    static Result<Ptr> create(base::EventLoop::Ptr loop, const Options& options) noexcept;

    virtual ~EventBus() = default;

    // Setup, before run()

    // Slot for one widget; the returned sink is what its adapter publishes to
    virtual Result<UpdateSink::Ptr> openSlot(WidgetId id) = 0;

    // Started by run(), cancelled and reaped on shutdown
    virtual Result<void> manage(WidgetAdapter::Ptr adapter) = 0;

    virtual void setConsumer(BusConsumer* consumer) = 0;
    virtual void setDisplaySource(DisplayEventSource* source) = 0;

    // Blocks on the loop until shutdown. Returns the fatal error that ended
    // the run, if any.
    virtual Result<void> run() = 0;

    // Thread-safe
    virtual void requestShutdown() = 0;

    virtual const Stats& stats() const = 0;

protected:
    EventBus() = default;
};

} // namespace lazybar
