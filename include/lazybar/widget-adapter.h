#pragma once

#include <lazybar/bus-event.h>
#include <lazybar/content.h>
#include <lazybar/layout-engine.h>
#include <lazybar/result.hpp>
#include <lazybar/widget-source.h>
#include <chrono>
#include <future>
#include <memory>
#include <string>
#include <thread>

namespace lazybar {

/**
 * WidgetAdapter - runs one WidgetSource on its own worker thread
 *
 * Every item the source yields is laid out on the worker thread and published
 * to the bus as a WidgetUpdated. A transient source error publishes the error
 * placeholder and retries after an exponential backoff; the end of the stream
 * publishes the unavailable placeholder and freezes the widget.
 *
 * Shutdown is two-step: requestStop() cancels the source's token, and
 * waitStopped() gives the worker a grace period before abandoning it. An
 * abandoned worker keeps its source alive until it returns on its own.
 */
class WidgetAdapter : public ActionTarget {
public:
    using Ptr = std::shared_ptr<WidgetAdapter>;

    enum class State : uint8_t {
        Idle,        // created, not started
        Running,
        Backoff,     // waiting to retry after an error
        Terminated,  // the source ended its stream
        Stopped,     // worker finished after cancellation
        Abandoned,   // worker missed the grace period
    };

    struct Options {
        std::chrono::milliseconds backoffBase{500};
        std::chrono::milliseconds backoffMax{30000};
        std::string errorText = "!";
        std::string unavailableText = "-";
        Attrs attrs;
    };

    static Result<Ptr> create(WidgetId id, std::string name, WidgetSource::Ptr source,
                              LayoutEngine::Ptr layout, UpdateSink::Ptr sink,
                              const Options& options) noexcept;

    ~WidgetAdapter() override;

    WidgetAdapter(const WidgetAdapter&) = delete;
    WidgetAdapter& operator=(const WidgetAdapter&) = delete;

    Result<void> start();

    // Queue an action for the source and wake it. Called from the bar thread.
    void deliver(const Action& action) override;

    void requestStop();

    // Returns true if the worker finished within `grace`, false if abandoned
    bool waitStopped(std::chrono::milliseconds grace);

    WidgetId id() const { return _id; }
    const std::string& name() const { return _name; }
    const ClickBindings& bindings() const { return _bindings; }
    State state() const;
    uint64_t published() const;

    // base * 2^(failures-1), capped at max; 0 failures means no delay
    static std::chrono::milliseconds backoffDelay(uint32_t failures,
                                                  std::chrono::milliseconds base,
                                                  std::chrono::milliseconds max);

    static const char* stateName(State state);

private:
    struct Shared;

    WidgetAdapter(WidgetId id, std::string name) noexcept;
    Result<void> init(WidgetSource::Ptr source, LayoutEngine::Ptr layout,
                      UpdateSink::Ptr sink, const Options& options) noexcept;

    static void workerLoop(std::shared_ptr<Shared> shared);

    WidgetId _id;
    std::string _name;
    ClickBindings _bindings;
    std::shared_ptr<Shared> _shared;
    std::thread _thread;
    std::future<void> _done;
};

} // namespace lazybar
