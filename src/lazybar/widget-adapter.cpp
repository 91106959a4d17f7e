#include <lazybar/widget-adapter.h>
#include <ytrace/ytrace.hpp>
#include <algorithm>
#include <atomic>
#include <exception>

namespace lazybar {

//=============================================================================
// Shared worker state
//
// Owned jointly by the adapter and its worker thread so that an abandoned
// worker never touches freed memory.
//=============================================================================

struct WidgetAdapter::Shared {
    WidgetId id = NoWidgetId;
    std::string name;
    WidgetSource::Ptr source;
    LayoutEngine::Ptr layout;
    UpdateSink::Ptr sink;
    Options options;

    base::CancelToken::Ptr token = std::make_shared<base::CancelToken>();
    SourceContext context{token};

    std::atomic<State> state{State::Idle};
    std::atomic<uint64_t> sequence{0};
    std::promise<void> done;

    void publish(const ContentItem& item) {
        WidgetUpdated update;
        update.id = id;
        update.layout = layout->layout(item, options.attrs);
        update.sequence = ++sequence;
        sink->publish(std::move(update));
    }

    void publishPlaceholder(const std::string& text) {
        publish(ContentItem::text(text));
    }
};

//=============================================================================
// WidgetAdapter
//=============================================================================

WidgetAdapter::WidgetAdapter(WidgetId id, std::string name) noexcept
    : _id(id), _name(std::move(name)) {}

WidgetAdapter::~WidgetAdapter() {
    if (!_thread.joinable()) return;

    requestStop();
    if (_done.valid() && _done.wait_for(std::chrono::milliseconds(0)) == std::future_status::ready) {
        _thread.join();
    } else {
        ywarn("WidgetAdapter '{}': still running at destruction, detaching", _name);
        _thread.detach();
    }
}

Result<WidgetAdapter::Ptr> WidgetAdapter::create(WidgetId id, std::string name, WidgetSource::Ptr source,
                                                 LayoutEngine::Ptr layout, UpdateSink::Ptr sink,
                                                 const Options& options) noexcept {
    auto adapter = Ptr(new WidgetAdapter(id, std::move(name)));
    if (auto res = adapter->init(std::move(source), std::move(layout), std::move(sink), options); !res) {
        return Err<Ptr>("Failed to initialize WidgetAdapter", res);
    }
    return Ok(adapter);
}

Result<void> WidgetAdapter::init(WidgetSource::Ptr source, LayoutEngine::Ptr layout,
                                 UpdateSink::Ptr sink, const Options& options) noexcept {
    if (!source) return Err<void>("WidgetAdapter '" + _name + "': null source");
    if (!layout) return Err<void>("WidgetAdapter '" + _name + "': null layout engine");
    if (!sink) return Err<void>("WidgetAdapter '" + _name + "': null update sink");
    if (options.backoffBase.count() <= 0 || options.backoffMax < options.backoffBase) {
        return Err<void>("WidgetAdapter '" + _name + "': invalid backoff range");
    }

    _bindings = source->bindings();

    _shared = std::make_shared<Shared>();
    _shared->id = _id;
    _shared->name = _name;
    _shared->source = std::move(source);
    _shared->layout = std::move(layout);
    _shared->sink = std::move(sink);
    _shared->options = options;
    return Ok();
}

Result<void> WidgetAdapter::start() {
    if (_thread.joinable() || _shared->state.load() != State::Idle) {
        return Err<void>("WidgetAdapter '" + _name + "' already started");
    }
    _done = _shared->done.get_future();
    _shared->state.store(State::Running);
    _thread = std::thread(&WidgetAdapter::workerLoop, _shared);
    return Ok();
}

void WidgetAdapter::deliver(const Action& action) {
    ydebug("WidgetAdapter '{}': action '{}'", _name, action.name);
    _shared->context.pushAction(action);
}

void WidgetAdapter::requestStop() {
    _shared->token->cancel();
}

bool WidgetAdapter::waitStopped(std::chrono::milliseconds grace) {
    if (!_thread.joinable()) {
        return true;
    }
    if (_done.wait_for(grace) == std::future_status::ready) {
        _thread.join();
        return true;
    }
    ywarn("WidgetAdapter '{}': did not stop within {}ms, abandoning worker", _name, grace.count());
    _shared->state.store(State::Abandoned);
    _thread.detach();
    return false;
}

WidgetAdapter::State WidgetAdapter::state() const {
    return _shared->state.load();
}

uint64_t WidgetAdapter::published() const {
    return _shared->sequence.load();
}

std::chrono::milliseconds WidgetAdapter::backoffDelay(uint32_t failures,
                                                      std::chrono::milliseconds base,
                                                      std::chrono::milliseconds max) {
    if (failures == 0) return std::chrono::milliseconds(0);
    auto delay = base;
    for (uint32_t i = 1; i < failures && delay < max; ++i) {
        delay *= 2;
    }
    return std::min(delay, max);
}

const char* WidgetAdapter::stateName(State state) {
    switch (state) {
        case State::Idle:       return "idle";
        case State::Running:    return "running";
        case State::Backoff:    return "backoff";
        case State::Terminated: return "terminated";
        case State::Stopped:    return "stopped";
        case State::Abandoned:  return "abandoned";
    }
    return "?";
}

//=============================================================================
// Worker thread
//=============================================================================

void WidgetAdapter::workerLoop(std::shared_ptr<Shared> shared) {
    auto& token = *shared->token;
    const auto& opts = shared->options;
    uint32_t failures = 0;

    yinfo("Widget '{}' started", shared->name);

    while (!token.cancelled()) {
        Result<std::optional<ContentItem>> res;
        try {
            res = shared->source->next(shared->context);
        } catch (const std::exception& e) {
            res = Err<std::optional<ContentItem>>(std::string("source threw: ") + e.what());
        }

        if (token.cancelled()) {
            break;
        }

        if (!res) {
            failures++;
            auto delay = backoffDelay(failures, opts.backoffBase, opts.backoffMax);
            ywarn("Widget '{}': {} (failure {}, retrying in {}ms)",
                  shared->name, error_msg(res), failures, delay.count());
            shared->publishPlaceholder(opts.errorText);
            shared->state.store(State::Backoff);

            // Actions stay queued for the source; only cancellation cuts the wait short
            auto deadline = std::chrono::steady_clock::now() + delay;
            while (token.waitUntil(deadline) == base::CancelToken::WaitResult::Poked) {
            }
            if (token.cancelled()) break;

            shared->state.store(State::Running);
            continue;
        }

        if (!res->has_value()) {
            yinfo("Widget '{}': source ended, showing unavailable", shared->name);
            shared->publishPlaceholder(opts.unavailableText);
            shared->state.store(State::Terminated);
            break;
        }

        failures = 0;
        shared->publish(**res);
    }

    shared->source->release();

    if (shared->state.load() != State::Terminated) {
        shared->state.store(State::Stopped);
    }
    ydebug("Widget '{}' worker exiting ({})", shared->name, stateName(shared->state.load()));
    shared->done.set_value();
}

} // namespace lazybar
