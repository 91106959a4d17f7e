//=============================================================================
// EventLoop Tests
//
// Timers, cross-thread wakes and handle cleanup on destruction
//=============================================================================

#include <boost/ut.hpp>
#include <lazybar/base/event-loop.h>
#include <atomic>
#include <functional>
#include <thread>

using namespace boost::ut;
using namespace lazybar;
using namespace lazybar::base;

namespace {

class CallbackListener : public EventListener {
public:
    explicit CallbackListener(std::function<void(const Event&)> fn) : _fn(std::move(fn)) {}

    Result<bool> onEvent(const Event& event) override {
        _fn(event);
        return Ok(true);
    }

private:
    std::function<void(const Event&)> _fn;
};

} // namespace

suite event_loop_tests = [] {
    "a timer fires and its listener can stop the loop"_test = [] {
        auto loop = *EventLoop::create();
        int fired = 0;
        auto listener = std::make_shared<CallbackListener>([&](const Event& e) {
            if (e.type == Event::Type::Timer) {
                fired++;
                expect(loop->stop().has_value());
            }
        });

        auto timer = loop->createTimer();
        expect(timer.has_value());
        expect(loop->configTimer(*timer, 5).has_value());
        expect(loop->registerTimerListener(*timer, listener).has_value());
        expect(loop->startTimer(*timer).has_value());

        loop->start();
        expect(fired == 1_i);
        expect(loop->close().has_value());
    };

    "a wake sent from another thread reaches the loop"_test = [] {
        auto loop = *EventLoop::create();
        std::atomic<int> woken{0};
        auto listener = std::make_shared<CallbackListener>([&](const Event&) {
            woken++;
            expect(loop->stop().has_value());
        });

        auto wake = loop->createWake();
        expect(wake.has_value());
        expect(loop->registerWakeListener(*wake, listener).has_value());
        auto waker = *loop->waker(*wake);

        std::thread sender([waker] { waker->send(); });
        loop->start();
        sender.join();
        expect(woken.load() >= 1_i);
        expect(loop->close().has_value());
    };

    "destroying a loop with live handles closes them"_test = [] {
        Waker::Ptr waker;
        {
            auto loop = *EventLoop::create();
            auto timer = loop->createTimer();
            expect(timer.has_value());
            expect(loop->configTimer(*timer, 1000).has_value());
            expect(loop->startTimer(*timer).has_value());
            auto wake = loop->createWake();
            expect(wake.has_value());
            waker = *loop->waker(*wake);
        }
        // The waker outlives its loop; sending is a no-op
        waker->send();
        expect(waker != nullptr);
    };
};
