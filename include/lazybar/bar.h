#pragma once

//=============================================================================
// Bar
//
// Wires a validated BarConfig to the engine: one adapter per configured
// widget, the event bus, the panel composer, the click router and the
// surface. run() blocks on the loop thread until shutdown.
//=============================================================================

#include <lazybar/click-router.h>
#include <lazybar/config.h>
#include <lazybar/display.h>
#include <lazybar/event-bus.h>
#include <lazybar/font/font-face.h>
#include <lazybar/panel-composer.h>
#include <lazybar/result.hpp>
#include <lazybar/sources/source-factory.h>
#include <lazybar/surface.h>
#include <memory>

namespace lazybar {

class Bar {
public:
    using Ptr = std::shared_ptr<Bar>;

    struct Options {
        SourceFactory sourceFactory = createSource;
        bool handleSignals = true;
    };

    static Result<Ptr> create(const BarConfig& config, DisplayConnection::Ptr display,
                              FontFace::Ptr face, const Options& options) noexcept;
    static Result<Ptr> create(const BarConfig& config, DisplayConnection::Ptr display,
                              FontFace::Ptr face) noexcept {
        return create(config, std::move(display), std::move(face), Options{});
    }

    virtual ~Bar() = default;

    // Returns the fatal error that ended the run, if any. The surface is
    // torn down either way.
    virtual Result<void> run() = 0;

    // Thread-safe
    virtual void requestShutdown() = 0;

    virtual const PanelComposer& composer() const = 0;
    virtual const Surface& surface() const = 0;
    virtual const ClickRouter& router() const = 0;
    virtual const EventBus& bus() const = 0;

protected:
    Bar() = default;
};

} // namespace lazybar
