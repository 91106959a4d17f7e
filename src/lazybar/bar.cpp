#include <lazybar/bar.h>
#include <lazybar/layout-engine.h>
#include <lazybar/widget-adapter.h>
#include <ytrace/ytrace.hpp>
#include <type_traits>
#include <variant>

namespace lazybar {

//=============================================================================
// BarImpl
//=============================================================================

class BarImpl : public Bar, public BusConsumer {
public:
    BarImpl(const BarConfig& config, DisplayConnection::Ptr display, FontFace::Ptr face,
            const Options& options) noexcept
        : _config(config), _display(std::move(display)), _face(std::move(face)), _options(options) {}

    Result<void> init() noexcept {
        if (!_display) {
            return Err<void>("Bar: null display connection");
        }
        if (!_face) {
            return Err<void>("Bar: null font face");
        }
        if (!_options.sourceFactory) {
            return Err<void>("Bar: no source factory");
        }

        auto loop = base::EventLoop::create();
        if (!loop) {
            return Err<void>("Bar: failed to create event loop", loop);
        }

        EventBus::Options busOptions;
        busOptions.tickMs = _config.tickMs;
        busOptions.grace = _config.grace;
        busOptions.handleSignals = _options.handleSignals;
        auto bus = EventBus::create(*loop, busOptions);
        if (!bus) {
            return Err<void>("Bar: failed to create event bus", bus);
        }
        _bus = *bus;

        auto surface = Surface::create(_display, _face);
        if (!surface) {
            return Err<void>("Bar: failed to create surface", surface);
        }
        _surface = *surface;

        LayoutEngine::Options layoutOptions;
        layoutOptions.height = _surface->height();
        layoutOptions.padding = _config.padding;
        layoutOptions.foreground = _config.foreground;
        auto layout = LayoutEngine::create(_face, layoutOptions);
        if (!layout) {
            return Err<void>("Bar: failed to create layout engine", layout);
        }

        std::vector<WidgetSpec> specs;
        specs.reserve(_config.widgets.size());

        for (size_t i = 0; i < _config.widgets.size(); ++i) {
            const WidgetConfig& wc = _config.widgets[i];
            const WidgetId id = static_cast<WidgetId>(i);

            auto source = _options.sourceFactory(wc);
            if (!source) {
                return Err<void>("Bar: failed to create source for '" + wc.id + "'", source);
            }

            auto sink = _bus->openSlot(id);
            if (!sink) {
                return Err<void>("Bar: failed to open slot for '" + wc.id + "'", sink);
            }

            WidgetAdapter::Options adapterOptions;
            adapterOptions.backoffBase = _config.backoffBase;
            adapterOptions.backoffMax = _config.backoffMax;
            adapterOptions.errorText = _config.errorText;
            adapterOptions.unavailableText = _config.unavailableText;
            adapterOptions.attrs = Attrs{_config.foreground, std::nullopt}.overlay(wc.attrs);

            auto adapter = WidgetAdapter::create(id, wc.id, *source, *layout, *sink, adapterOptions);
            if (!adapter) {
                return Err<void>("Bar: failed to create adapter for '" + wc.id + "'", adapter);
            }

            specs.push_back({id, wc.id, wc.zone, wc.priority, (*adapter)->bindings()});
            _router.addTarget(id, *adapter);
            if (auto res = _bus->manage(*adapter); !res) {
                return Err<void>("Bar: failed to manage adapter for '" + wc.id + "'", res);
            }
        }

        PanelComposer::Options composerOptions;
        composerOptions.width = _surface->width();
        composerOptions.height = _surface->height();
        composerOptions.background = _config.background;
        composerOptions.fullRepaintFraction = _config.fullRepaintFraction;
        auto composer = PanelComposer::create(composerOptions, std::move(specs));
        if (!composer) {
            return Err<void>("Bar: failed to create panel composer", composer);
        }
        _composer = *composer;
        syncRouter();

        _bus->setConsumer(this);
        _bus->setDisplaySource(_surface.get());

        // The first batch paints the empty bar
        _pending = RepaintRequest{true, {}};

        yinfo("Bar: {}x{} with {} widgets", _surface->width(), _surface->height(), _config.widgets.size());
        return Ok();
    }

    //=========================================================================
    // Bar interface
    //=========================================================================

    Result<void> run() override {
        auto res = _bus->run();
        if (auto down = _surface->teardown(); !down) {
            ywarn("Bar: surface teardown failed: {}", error_msg(down));
        }
        if (!res) {
            return Err<void>("Bar stopped", res);
        }
        yinfo("Bar: stopped");
        return Ok();
    }

    void requestShutdown() override { _bus->requestShutdown(); }

    const PanelComposer& composer() const override { return *_composer; }
    const Surface& surface() const override { return *_surface; }
    const ClickRouter& router() const override { return _router; }
    const EventBus& bus() const override { return *_bus; }

    //=========================================================================
    // BusConsumer
    //=========================================================================

    Result<void> onBusEvent(const BusEvent& event) override {
        return std::visit([this](const auto& e) -> Result<void> {
            using T = std::decay_t<decltype(e)>;
            if constexpr (std::is_same_v<T, WidgetUpdated>) {
                return onWidgetUpdated(e);
            } else if constexpr (std::is_same_v<T, PointerButton>) {
                auto outcome = _router.route(e);
                ydebug("Bar: button {} at ({}, {}): {}", buttonName(e.button), e.x, e.y, outcomeName(outcome));
                return Ok();
            } else if constexpr (std::is_same_v<T, Exposed>) {
                if (auto res = _surface->expose(e.rect); !res) {
                    return Err<void>("Bar: expose failed", res);
                }
                return Ok();
            } else if constexpr (std::is_same_v<T, Configured>) {
                return onConfigured(e);
            } else {
                if (auto res = _surface->check(); !res) {
                    return Err<void>("display connection lost", res);
                }
                return Ok();
            }
        }, event);
    }

    Result<void> onBatchEnd() override {
        if (_pending.empty()) {
            return Ok();
        }
        RepaintRequest request = _pending;
        _pending = {};
        if (auto res = _surface->paint(_composer->frame(), request); !res) {
            return Err<void>("Bar: paint failed", res);
        }
        return Ok();
    }

private:
    // Clicks are routed against the newest frame, even mid-batch
    void syncRouter() {
        auto frame = _composer->frame();
        if (frame->generation != _routedGeneration) {
            _router.setFrame(frame);
            _routedGeneration = frame->generation;
        }
    }

    Result<void> onWidgetUpdated(const WidgetUpdated& update) {
        auto repaint = _composer->apply(update);
        if (!repaint) {
            ywarn("Bar: dropped update: {}", error_msg(repaint));
            return Ok();
        }
        syncRouter();
        if (*repaint) {
            _pending.merge(**repaint);
        }
        return Ok();
    }

    Result<void> onConfigured(const Configured& configured) {
        if (configured.width <= 0 || configured.height <= 0) {
            ywarn("Bar: ignoring configure to {}x{}", configured.width, configured.height);
            return Ok();
        }
        if (auto res = _surface->resize(configured.width, configured.height); !res) {
            return Err<void>("Bar: resize failed", res);
        }
        if (auto repaint = _composer->resize(configured.width, configured.height)) {
            _pending.merge(*repaint);
        }
        syncRouter();
        return Ok();
    }

    BarConfig _config;
    DisplayConnection::Ptr _display;
    FontFace::Ptr _face;
    Options _options;

    EventBus::Ptr _bus;
    Surface::Ptr _surface;
    PanelComposer::Ptr _composer;
    ClickRouter _router;

    RepaintRequest _pending;
    uint64_t _routedGeneration = 0;
};

//=============================================================================
// Factory
//=============================================================================

Result<Bar::Ptr> Bar::create(const BarConfig& config, DisplayConnection::Ptr display,
                             FontFace::Ptr face, const Options& options) noexcept {
    auto bar = std::make_shared<BarImpl>(config, std::move(display), std::move(face), options);
    if (auto res = bar->init(); !res) {
        return Err<Ptr>("Failed to initialize Bar", res);
    }
    return Ok(Ptr(bar));
}

} // namespace lazybar
