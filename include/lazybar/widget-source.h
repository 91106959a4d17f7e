#pragma once

#include <lazybar/base/cancel-token.h>
#include <lazybar/content.h>
#include <lazybar/result.hpp>
#include <chrono>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>

namespace lazybar {

//-----------------------------------------------------------------------------
// SourceContext - what a source sees of its adapter while it runs
//
// Sources must wait through waitFor() rather than sleeping: it returns early
// on cancellation and whenever a click action is queued.
//-----------------------------------------------------------------------------
class SourceContext {
public:
    using WaitResult = base::CancelToken::WaitResult;

    explicit SourceContext(base::CancelToken::Ptr token) : _token(std::move(token)) {}

    bool cancelled() const { return _token->cancelled(); }

    // Returns Poked right away while an action is queued
    WaitResult waitFor(std::chrono::milliseconds timeout) {
        return waitUntil(std::chrono::steady_clock::now() + timeout);
    }
    WaitResult waitUntil(std::chrono::steady_clock::time_point deadline) {
        return _token->waitUntil(deadline, [this] { return hasAction(); });
    }

    base::CancelToken::CallbackId onCancel(base::CancelToken::Callback callback) {
        return _token->onCancel(std::move(callback));
    }
    void removeOnCancel(base::CancelToken::CallbackId id) { _token->removeOnCancel(id); }

    // Oldest undelivered action, if any
    std::optional<Action> takeAction() {
        std::lock_guard<std::mutex> lock(_mutex);
        if (_actions.empty()) return std::nullopt;
        Action a = std::move(_actions.front());
        _actions.pop_front();
        return a;
    }

    bool hasAction() const {
        std::lock_guard<std::mutex> lock(_mutex);
        return !_actions.empty();
    }

    // Called from the bar thread
    void pushAction(Action action) {
        {
            std::lock_guard<std::mutex> lock(_mutex);
            _actions.push_back(std::move(action));
        }
        _token->poke();
    }

    const base::CancelToken::Ptr& token() const { return _token; }

private:
    base::CancelToken::Ptr _token;
    mutable std::mutex _mutex;
    std::deque<Action> _actions;
};

//-----------------------------------------------------------------------------
// WidgetSource - one lazily produced, possibly infinite stream of content
//
// next() blocks until the next item is ready and returns:
//   Ok(item)          new content
//   Ok(std::nullopt)  the stream has ended; next() is not called again
//   Err(...)          transient failure; the adapter backs off and retries
//
// All methods except bindings() run on the adapter's worker thread.
//-----------------------------------------------------------------------------
class WidgetSource {
public:
    using Ptr = std::shared_ptr<WidgetSource>;

    virtual ~WidgetSource() = default;

    virtual Result<std::optional<ContentItem>> next(SourceContext& ctx) = 0;

    // Buttons this source reacts to; fixed for the source's lifetime
    virtual ClickBindings bindings() const { return {}; }

    // Release files, sockets and children. Called once after the last next().
    virtual void release() {}
};

} // namespace lazybar
