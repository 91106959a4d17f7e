//=============================================================================
// EventBus Tests
//
// Fairness across slots, coalescing, display event delivery, fatal errors
// and shutdown of adapters blocked in I/O
//=============================================================================

#include <boost/ut.hpp>
#include <lazybar/event-bus.h>
#include <lazybar/sources/command-source.h>
#include "harness/fake_display.h"
#include "harness/fake_font.h"
#include "harness/scripted_source.h"
#include <algorithm>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <thread>

using namespace boost::ut;
using namespace lazybar;
using namespace lazybar::test;
using namespace std::chrono_literals;

namespace {

class TestConsumer : public BusConsumer {
public:
    std::function<Result<void>(const BusEvent&)> onEvent;
    std::function<Result<void>()> onBatch;

    Result<void> onBusEvent(const BusEvent& event) override {
        events.push_back(event);
        return onEvent ? onEvent(event) : Ok();
    }

    Result<void> onBatchEnd() override {
        batches++;
        return onBatch ? onBatch() : Ok();
    }

    std::vector<WidgetId> updateOrder() const {
        std::vector<WidgetId> out;
        for (const auto& e : events) {
            if (auto u = std::get_if<WidgetUpdated>(&e)) out.push_back(u->id);
        }
        return out;
    }

    std::vector<BusEvent> events;
    int batches = 0;
};

EventBus::Ptr makeBus(int tickMs = 0, std::chrono::milliseconds grace = 2000ms) {
    EventBus::Options options;
    options.tickMs = tickMs;
    options.grace = grace;
    options.handleSignals = false;
    return *EventBus::create(*base::EventLoop::create(), options);
}

WidgetUpdated update(WidgetId id, uint64_t sequence) {
    WidgetUpdated u;
    u.id = id;
    u.sequence = sequence;
    u.layout.width = int(sequence);
    return u;
}

// Shuts the bus down if a test hangs
class Watchdog {
public:
    explicit Watchdog(EventBus::Ptr bus, std::chrono::milliseconds limit = 5000ms)
        : _thread([this, bus, limit] {
              std::unique_lock<std::mutex> lock(_mutex);
              if (!_cv.wait_for(lock, limit, [this] { return _done; })) {
                  bus->requestShutdown();
              }
          }) {}

    ~Watchdog() {
        {
            std::lock_guard<std::mutex> lock(_mutex);
            _done = true;
        }
        _cv.notify_all();
        _thread.join();
    }

private:
    std::mutex _mutex;
    std::condition_variable _cv;
    bool _done = false;
    std::thread _thread;
};

} // namespace

suite event_bus_tests = [] {
    "one update per pending slot per round, in slot order"_test = [] {
        auto bus = makeBus();
        auto s0 = *bus->openSlot(0);
        auto s1 = *bus->openSlot(1);
        auto s2 = *bus->openSlot(2);

        for (uint64_t i = 1; i <= 50; ++i) s0->publish(update(0, i));
        s1->publish(update(1, 1));
        s2->publish(update(2, 1));

        TestConsumer consumer;
        consumer.onBatch = [&] {
            bus->requestShutdown();
            return Ok();
        };
        bus->setConsumer(&consumer);

        Watchdog watchdog(bus);
        expect(bus->run().has_value());
        expect(consumer.updateOrder() == std::vector<WidgetId>{0, 1, 2});
        expect(bus->stats().updatesDelivered == 3_u);
    };

    "a flooding widget does not starve the others"_test = [] {
        auto bus = makeBus();
        auto flood = *bus->openSlot(0);
        auto quiet = *bus->openSlot(1);

        TestConsumer consumer;
        uint64_t seq = 1;
        flood->publish(update(0, seq));
        consumer.onEvent = [&](const BusEvent& e) -> Result<void> {
            auto u = std::get_if<WidgetUpdated>(&e);
            if (u && u->id == 0 && seq < 100) {
                // Refill immediately, as a fast producer would
                flood->publish(update(0, ++seq));
                if (seq == 5) quiet->publish(update(1, 1));
            }
            if (u && u->id == 1) bus->requestShutdown();
            return Ok();
        };
        bus->setConsumer(&consumer);

        Watchdog watchdog(bus);
        expect(bus->run().has_value());
        auto order = consumer.updateOrder();
        auto quietAt = std::find(order.begin(), order.end(), WidgetId(1));
        expect(quietAt != order.end());
        // Published while the flooder's 4th update was delivered; served first in the next round
        expect(std::distance(order.begin(), quietAt) == 4);
    };

    "every widget is served once per round while all keep refilling"_test = [] {
        auto bus = makeBus();
        std::vector<UpdateSink::Ptr> slots;
        for (WidgetId id = 0; id < 4; ++id) slots.push_back(*bus->openSlot(id));

        std::vector<uint64_t> seq(slots.size(), 1);
        for (WidgetId id = 0; id < slots.size(); ++id) slots[id]->publish(update(id, 1));

        constexpr size_t Deliveries = 40;
        TestConsumer consumer;
        size_t delivered = 0;
        consumer.onEvent = [&](const BusEvent& e) -> Result<void> {
            auto u = std::get_if<WidgetUpdated>(&e);
            if (!u) return Ok();
            // Every producer refills as soon as it is drained
            slots[u->id]->publish(update(u->id, ++seq[u->id]));
            if (++delivered == Deliveries) bus->requestShutdown();
            return Ok();
        };
        bus->setConsumer(&consumer);

        Watchdog watchdog(bus);
        expect(bus->run().has_value());

        auto order = consumer.updateOrder();
        expect(order.size() >= Deliveries);
        order.resize(std::min(order.size(), Deliveries));
        for (size_t i = 0; i + slots.size() <= order.size(); i += slots.size()) {
            std::vector<WidgetId> window(order.begin() + i, order.begin() + i + slots.size());
            std::sort(window.begin(), window.end());
            expect(window == std::vector<WidgetId>{0, 1, 2, 3}) << "round starting at" << i;
        }
    };

    "consumer sees an in-order subsequence ending in the last update"_test = [] {
        auto bus = makeBus();
        auto sink = *bus->openSlot(7);
        constexpr uint64_t N = 500;

        TestConsumer consumer;
        consumer.onEvent = [&](const BusEvent& e) -> Result<void> {
            auto u = std::get_if<WidgetUpdated>(&e);
            if (u && u->sequence == N) bus->requestShutdown();
            return Ok();
        };
        bus->setConsumer(&consumer);

        std::thread producer([&] {
            for (uint64_t i = 1; i <= N; ++i) {
                sink->publish(update(7, i));
            }
        });

        Watchdog watchdog(bus);
        auto res = bus->run();
        producer.join();
        expect(res.has_value());

        std::vector<uint64_t> seqs;
        for (const auto& e : consumer.events) {
            if (auto u = std::get_if<WidgetUpdated>(&e)) seqs.push_back(u->sequence);
        }
        expect(!seqs.empty() && seqs.back() == N);
        bool increasing = true;
        for (size_t i = 1; i < seqs.size(); ++i) {
            if (seqs[i] <= seqs[i - 1]) increasing = false;
        }
        expect(increasing);
    };

    "display events are delivered before updates in a round"_test = [] {
        auto bus = makeBus();
        auto sink = *bus->openSlot(0);
        auto display = FakeDisplay::make(800, 24);

        struct Source : DisplayEventSource {
            FakeDisplay::Ptr display;
            int eventFd() const override { return display->fd(); }
            Result<void> readEvents(std::vector<DisplayEvent>& out) override { return display->pollEvents(out); }
        } source;
        source.display = display;

        display->push(PointerButton{10, 5, Button::Left, true});
        display->push(Exposed{{0, 0, 20, 24}});
        sink->publish(update(0, 1));

        TestConsumer consumer;
        consumer.onBatch = [&] {
            bus->requestShutdown();
            return Ok();
        };
        bus->setConsumer(&consumer);
        bus->setDisplaySource(&source);

        Watchdog watchdog(bus);
        expect(bus->run().has_value());
        expect(consumer.events.size() == 3_u);
        expect(std::holds_alternative<PointerButton>(consumer.events[0]));
        expect(std::holds_alternative<Exposed>(consumer.events[1]));
        expect(std::holds_alternative<WidgetUpdated>(consumer.events[2]));
    };

    "ticks arrive periodically"_test = [] {
        auto bus = makeBus(10);
        TestConsumer consumer;
        consumer.onEvent = [&](const BusEvent& e) -> Result<void> {
            if (auto t = std::get_if<Tick>(&e); t && t->count == 3) bus->requestShutdown();
            return Ok();
        };
        bus->setConsumer(&consumer);

        Watchdog watchdog(bus);
        expect(bus->run().has_value());
        expect(bus->stats().ticks >= 3_u);
    };

    "consumer errors are fatal"_test = [] {
        auto bus = makeBus();
        auto sink = *bus->openSlot(0);
        sink->publish(update(0, 1));

        TestConsumer consumer;
        consumer.onEvent = [](const BusEvent&) -> Result<void> { return Err<void>("boom"); };
        bus->setConsumer(&consumer);

        Watchdog watchdog(bus);
        auto res = bus->run();
        expect(!res.has_value());
        expect(error_msg(res).find("boom") != std::string::npos);
    };

    "display connection errors are fatal"_test = [] {
        auto bus = makeBus();
        auto display = FakeDisplay::make(800, 24);
        struct Source : DisplayEventSource {
            FakeDisplay::Ptr display;
            int eventFd() const override { return display->fd(); }
            Result<void> readEvents(std::vector<DisplayEvent>& out) override { return display->pollEvents(out); }
        } source;
        source.display = display;
        display->failConnection();

        TestConsumer consumer;
        bus->setConsumer(&consumer);
        bus->setDisplaySource(&source);

        Watchdog watchdog(bus);
        auto res = bus->run();
        expect(!res.has_value());
        expect(error_msg(res).find("display") != std::string::npos);
    };

    "run without a consumer fails"_test = [] {
        auto bus = makeBus();
        expect(!bus->run().has_value());
    };

    "slots cannot be opened twice"_test = [] {
        auto bus = makeBus();
        expect(bus->openSlot(1).has_value());
        expect(!bus->openSlot(1).has_value());
    };

    "shutdown cancels sources blocked in I/O within the grace period"_test = [] {
        auto bus = makeBus(0, 2000ms);
        LayoutEngine::Options layoutOptions;
        auto engine = *LayoutEngine::create(FakeFontFace::make(), layoutOptions);

        std::vector<ScriptedSource::Ptr> parked;
        for (WidgetId id = 0; id < 2; ++id) {
            auto source = ScriptedSource::make({ScriptedSource::text("ready")});
            parked.push_back(source);
            auto adapter = *WidgetAdapter::create(id, "parked" + std::to_string(id), source, engine,
                                                  *bus->openSlot(id), WidgetAdapter::Options{});
            bus->manage(adapter);
        }

        // A child process blocked in a long sleep
        CommandSource::Options commandOptions;
        commandOptions.command = "sleep 30";
        auto command = *CommandSource::create(commandOptions);
        auto commandAdapter = *WidgetAdapter::create(2, "sleeper", command, engine, *bus->openSlot(2),
                                                     WidgetAdapter::Options{});
        bus->manage(commandAdapter);

        TestConsumer consumer;
        bus->setConsumer(&consumer);

        std::thread stopper([&] {
            waitFor([&] { return parked[0]->parked() && parked[1]->parked(); });
            std::this_thread::sleep_for(50ms);  // let the child start sleeping
            bus->requestShutdown();
        });

        Watchdog watchdog(bus, 10000ms);
        auto start = std::chrono::steady_clock::now();
        auto res = bus->run();
        auto elapsed = std::chrono::steady_clock::now() - start;
        stopper.join();

        expect(res.has_value());
        for (const auto& source : parked) {
            expect(source->sawCancel());
            expect(source->released());
        }
        expect(commandAdapter->state() == WidgetAdapter::State::Stopped);
        expect(elapsed < 5s) << "nobody waited for the sleeping child";
    };
};
