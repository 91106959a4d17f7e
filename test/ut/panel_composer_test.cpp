//=============================================================================
// PanelComposer Tests
//
// Zone placement, overflow elision, click regions and damage
//=============================================================================

#include <boost/ut.hpp>
#include <lazybar/panel-composer.h>
#include <algorithm>

using namespace boost::ut;
using namespace lazybar;

namespace {

constexpr int BAR_H = 24;

LayoutResult sized(int width, Color bg = Color(0xFF112233)) {
    LayoutResult result;
    result.width = width;
    result.height = BAR_H;
    if (width > 0) {
        Run run;
        run.kind = Run::Kind::Box;
        run.box = {0, 0, width, BAR_H};
        run.bg = bg;
        result.runs.push_back(run);
    }
    return result;
}

WidgetSpec spec(WidgetId id, const char* name, Zone zone, int priority = 0, ClickBindings bindings = {}) {
    return {id, name, zone, priority, std::move(bindings)};
}

PanelComposer::Ptr makeComposer(int width, std::vector<WidgetSpec> specs, double fraction = 0.5) {
    PanelComposer::Options options;
    options.width = width;
    options.height = BAR_H;
    options.background = Color(0xFF000000);
    options.fullRepaintFraction = fraction;
    return *PanelComposer::create(options, std::move(specs));
}

uint64_t g_sequence = 0;

std::optional<RepaintRequest> set(PanelComposer& composer, WidgetId id, int width) {
    WidgetUpdated update{id, sized(width), ++g_sequence};
    auto res = composer.apply(update);
    return res ? *res : std::nullopt;
}

ClickBindings leftBound(const char* action) {
    ClickBindings b;
    b.bind(Button::Left, Action{action, ""});
    return b;
}

} // namespace

suite panel_composer_tests = [] {
    "zones: start at 0, end flush right, center in the remaining band"_test = [] {
        auto composer = makeComposer(1000, {
            spec(0, "clock", Zone::Start),
            spec(1, "title", Zone::Center),
            spec(2, "volume", Zone::End),
        });
        set(*composer, 0, 80);
        set(*composer, 1, 200);
        set(*composer, 2, 60);

        expect(composer->widgetRect(0)->x == 0_i);
        expect(composer->widgetRect(2)->x == 940_i);
        expect(composer->widgetRect(1)->x == 410_i);
        expect(composer->zoneLayout(Zone::Center).width == 200_i);
        expect(composer->elided().empty());
    };

    "widgets in a zone are laid out in configuration order"_test = [] {
        auto composer = makeComposer(500, {
            spec(0, "a", Zone::End),
            spec(1, "b", Zone::End),
        });
        set(*composer, 0, 30);
        set(*composer, 1, 50);
        expect(composer->widgetRect(0)->x == 420_i);
        expect(composer->widgetRect(1)->x == 450_i);
    };

    "overflow elides the center zone first, lowest priority first"_test = [] {
        auto composer = makeComposer(200, {
            spec(0, "ws", Zone::Start, 10),
            spec(1, "title", Zone::Center, 5),
            spec(2, "media", Zone::Center, 1),
            spec(3, "clock", Zone::End, 0),
        });
        set(*composer, 0, 60);
        set(*composer, 1, 50);
        set(*composer, 2, 50);
        set(*composer, 3, 60);  // total 220 > 200

        auto elided = composer->elided();
        expect(elided.size() == 1_u);
        expect(elided[0] == 2_u) << "lower priority center widget goes first";
        expect(composer->isElided(2));
        expect(!composer->widgetRect(2).has_value());
        expect(!composer->isElided(3)) << "end zone is kept while the center has candidates";
    };

    "priority ties elide the later configured widget"_test = [] {
        auto composer = makeComposer(100, {
            spec(0, "a", Zone::Center, 3),
            spec(1, "b", Zone::Center, 3),
        });
        set(*composer, 0, 60);
        set(*composer, 1, 60);
        expect(composer->elided() == std::vector<WidgetId>{1});
    };

    "elision is deterministic across runs"_test = [] {
        auto run = [] {
            auto composer = makeComposer(150, {
                spec(0, "a", Zone::Start, 2),
                spec(1, "b", Zone::Center, 2),
                spec(2, "c", Zone::Center, 2),
                spec(3, "d", Zone::End, 1),
                spec(4, "e", Zone::End, 0),
            });
            for (WidgetId id = 0; id < 5; ++id) {
                set(*composer, id, 50);
            }
            return composer->elided();
        };
        auto first = run();
        expect(first == std::vector<WidgetId>{2, 1});
        for (int i = 0; i < 10; ++i) {
            expect(run() == first);
        }
    };

    "shrinking content brings elided widgets back"_test = [] {
        auto composer = makeComposer(100, {
            spec(0, "a", Zone::Start),
            spec(1, "b", Zone::Center),
        });
        set(*composer, 0, 80);
        set(*composer, 1, 40);
        expect(composer->isElided(1));
        set(*composer, 0, 30);
        expect(!composer->isElided(1));
    };

    "widths are clamped to the bar"_test = [] {
        auto composer = makeComposer(100, {spec(0, "wide", Zone::Start)});
        set(*composer, 0, 400);
        expect(composer->widgetRect(0)->w == 100_i);
        set(*composer, 0, -20);
        expect(composer->widgetRect(0)->w == 0_i);
    };

    "click regions never overlap and are sorted"_test = [] {
        auto composer = makeComposer(600, {
            spec(0, "a", Zone::Start, 0, leftBound("a")),
            spec(1, "b", Zone::Start, 0, leftBound("b")),
            spec(2, "c", Zone::Center, 0, leftBound("c")),
            spec(3, "d", Zone::End, 0, leftBound("d")),
            spec(4, "plain", Zone::End),
        });
        const int widths[] = {70, 45, 120, 90, 33};
        for (WidgetId id = 0; id < 5; ++id) {
            set(*composer, id, widths[id]);
        }

        const auto& regions = composer->frame()->regions;
        expect(regions.size() == 4_u) << "widgets without bindings have no region";
        for (size_t i = 1; i < regions.size(); ++i) {
            expect(regions[i - 1].rect.right() <= regions[i].rect.x);
        }
    };

    "elided widgets have no runs or regions"_test = [] {
        auto composer = makeComposer(100, {
            spec(0, "a", Zone::Start, 1, leftBound("a")),
            spec(1, "b", Zone::Center, 0, leftBound("b")),
        });
        set(*composer, 0, 70);
        set(*composer, 1, 50);
        auto frame = composer->frame();
        expect(frame->regions.size() == 1_u);
        for (const auto& run : frame->runs) {
            expect(run.widget == 0_u);
        }
    };

    "unchanged content is not repainted"_test = [] {
        auto composer = makeComposer(1000, {spec(0, "a", Zone::Start)});
        expect(set(*composer, 0, 80).has_value());
        expect(!set(*composer, 0, 80).has_value());
    };

    "damage covers changed widgets only"_test = [] {
        auto composer = makeComposer(1000, {
            spec(0, "a", Zone::Start),
            spec(1, "b", Zone::End),
        });
        set(*composer, 0, 80);
        set(*composer, 1, 60);

        WidgetUpdated update{1, sized(60, Color(0xFF445566)), ++g_sequence};
        auto res = composer->apply(update);
        expect(res.has_value() && res->has_value());
        const auto& request = **res;
        expect(!request.full);
        expect(request.damage == Rect{940, 0, 60, BAR_H});
    };

    "large damage falls back to a full repaint"_test = [] {
        auto composer = makeComposer(1000, {spec(0, "a", Zone::Start)}, 0.25);
        auto request = set(*composer, 0, 300);
        expect(request.has_value() && request->full);
    };

    "stale sequences are ignored"_test = [] {
        auto composer = makeComposer(1000, {spec(0, "a", Zone::Start)});
        composer->apply({0, sized(50), 10});
        auto res = composer->apply({0, sized(70), 9});
        expect(res.has_value() && !res->has_value());
        expect(composer->widgetRect(0)->w == 50_i);
    };

    "unknown widget id is an error"_test = [] {
        auto composer = makeComposer(1000, {spec(0, "a", Zone::Start)});
        expect(!composer->apply({42, sized(10), 1}).has_value());
    };

    "runs are translated into bar coordinates"_test = [] {
        auto composer = makeComposer(1000, {
            spec(0, "a", Zone::Start),
            spec(1, "b", Zone::End),
        });
        set(*composer, 0, 100);
        set(*composer, 1, 60);
        auto frame = composer->frame();
        auto it = std::find_if(frame->runs.begin(), frame->runs.end(),
                               [](const PlacedRun& r) { return r.widget == 1; });
        expect(it != frame->runs.end());
        expect(it->run.box.x == 940_i);
        expect(it->clip == Rect{940, 0, 60, BAR_H});
    };

    "resize relays out and requests a full repaint"_test = [] {
        auto composer = makeComposer(1000, {spec(0, "a", Zone::End)});
        set(*composer, 0, 100);
        auto request = composer->resize(800, BAR_H);
        expect(request.has_value() && request->full);
        expect(composer->widgetRect(0)->x == 700_i);
        expect(!composer->resize(800, BAR_H).has_value());
    };

    "every frame gets a new generation"_test = [] {
        auto composer = makeComposer(1000, {spec(0, "a", Zone::Start)});
        auto g0 = composer->frame()->generation;
        set(*composer, 0, 10);
        expect(composer->frame()->generation > g0);
    };

    "create rejects duplicate ids and bad geometry"_test = [] {
        PanelComposer::Options options;
        options.width = 100;
        options.height = BAR_H;
        expect(!PanelComposer::create(options, {spec(0, "a", Zone::Start), spec(0, "b", Zone::End)}));
        options.width = 0;
        expect(!PanelComposer::create(options, {}));
    };
};
