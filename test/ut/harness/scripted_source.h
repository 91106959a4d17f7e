#pragma once

//=============================================================================
// ScriptedSource
//
// WidgetSource that plays back a list of steps, then blocks until cancelled.
// Records every action it receives and whether release() ran.
//=============================================================================

#include <lazybar/bus-event.h>
#include <lazybar/widget-source.h>
#include <atomic>
#include <chrono>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace lazybar::test {

class ScriptedSource : public WidgetSource {
public:
    using Ptr = std::shared_ptr<ScriptedSource>;

    struct Step {
        enum class Kind { Item, Error, End };
        Kind kind = Kind::Item;
        ContentItem item;
        std::string error;
        std::chrono::milliseconds delay{0};  // interruptible wait before the step
    };

    static Step text(std::string s, std::chrono::milliseconds delay = {}) {
        return {Step::Kind::Item, ContentItem::text(std::move(s)), {}, delay};
    }
    static Step error(std::string msg, std::chrono::milliseconds delay = {}) {
        return {Step::Kind::Error, {}, std::move(msg), delay};
    }
    static Step end(std::chrono::milliseconds delay = {}) {
        return {Step::Kind::End, {}, {}, delay};
    }

    explicit ScriptedSource(std::vector<Step> steps, ClickBindings bindings = {})
        : _steps(std::move(steps)), _bindings(std::move(bindings)) {}

    static Ptr make(std::vector<Step> steps, ClickBindings bindings = {}) {
        return std::make_shared<ScriptedSource>(std::move(steps), std::move(bindings));
    }

    Result<std::optional<ContentItem>> next(SourceContext& ctx) override {
        _calls++;
        if (_index < _steps.size()) {
            const Step& step = _steps[_index++];
            if (step.delay.count() > 0) {
                auto deadline = std::chrono::steady_clock::now() + step.delay;
                while (ctx.waitUntil(deadline) == SourceContext::WaitResult::Poked) {
                    collect(ctx);
                }
                if (ctx.cancelled()) {
                    _sawCancel.store(true);
                    return Ok(std::optional<ContentItem>());
                }
            }
            switch (step.kind) {
                case Step::Kind::Item:
                    return Ok(std::optional<ContentItem>(step.item));
                case Step::Kind::Error:
                    return Err<std::optional<ContentItem>>(step.error);
                case Step::Kind::End:
                    return Ok(std::optional<ContentItem>());
            }
        }

        // Script exhausted: park like a source blocked on I/O
        _parked.store(true);
        while (!ctx.cancelled()) {
            ctx.waitFor(std::chrono::hours(1));
            collect(ctx);
        }
        _sawCancel.store(true);
        return Ok(std::optional<ContentItem>());
    }

    ClickBindings bindings() const override { return _bindings; }

    void release() override { _released.store(true); }

    std::vector<Action> actions() const {
        std::lock_guard<std::mutex> lock(_mutex);
        return _actions;
    }

    int calls() const { return _calls.load(); }
    bool parked() const { return _parked.load(); }
    bool sawCancel() const { return _sawCancel.load(); }
    bool released() const { return _released.load(); }

private:
    void collect(SourceContext& ctx) {
        while (auto action = ctx.takeAction()) {
            std::lock_guard<std::mutex> lock(_mutex);
            _actions.push_back(*action);
        }
    }

    std::vector<Step> _steps;
    size_t _index = 0;
    ClickBindings _bindings;
    mutable std::mutex _mutex;
    std::vector<Action> _actions;
    std::atomic<int> _calls{0};
    std::atomic<bool> _parked{false};
    std::atomic<bool> _sawCancel{false};
    std::atomic<bool> _released{false};
};

//-----------------------------------------------------------------------------
// RecordingSink - UpdateSink that keeps everything published to it
//-----------------------------------------------------------------------------
class RecordingSink : public UpdateSink {
public:
    void publish(WidgetUpdated update) override {
        std::lock_guard<std::mutex> lock(_mutex);
        _updates.push_back(std::move(update));
    }

    std::vector<WidgetUpdated> updates() const {
        std::lock_guard<std::mutex> lock(_mutex);
        return _updates;
    }

    size_t count() const {
        std::lock_guard<std::mutex> lock(_mutex);
        return _updates.size();
    }

private:
    mutable std::mutex _mutex;
    std::vector<WidgetUpdated> _updates;
};

// Poll `pred` until it holds or `timeout` passes
template<typename Pred>
bool waitFor(Pred pred, std::chrono::milliseconds timeout = std::chrono::milliseconds(3000)) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (pred()) return true;
        std::this_thread::sleep_for(std::chrono::milliseconds(2));
    }
    return pred();
}

} // namespace lazybar::test
