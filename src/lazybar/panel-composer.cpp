#include <lazybar/panel-composer.h>
#include <ytrace/ytrace.hpp>
#include <algorithm>
#include <array>
#include <unordered_map>

namespace lazybar {

//=============================================================================
// PanelComposerImpl
//=============================================================================

class PanelComposerImpl : public PanelComposer {
public:
    PanelComposerImpl(const Options& options, std::vector<WidgetSpec> specs)
        : _options(options), _specs(std::move(specs)) {}

    Result<void> init() noexcept {
        if (_options.width <= 0 || _options.height <= 0) {
            return Err<void>("PanelComposer: invalid bar size " +
                             std::to_string(_options.width) + "x" + std::to_string(_options.height));
        }
        if (_options.fullRepaintFraction < 0.0 || _options.fullRepaintFraction > 1.0) {
            return Err<void>("PanelComposer: full repaint fraction must be within [0, 1]");
        }

        _widgets.reserve(_specs.size());
        for (size_t i = 0; i < _specs.size(); ++i) {
            const auto& spec = _specs[i];
            if (_index.count(spec.id)) {
                return Err<void>("PanelComposer: duplicate widget id " + std::to_string(spec.id));
            }
            _index[spec.id] = i;
            WidgetState w;
            w.spec = spec;
            w.order = i;
            _widgets.push_back(std::move(w));
        }

        recompute();
        rebuildFrame();
        return Ok();
    }

    //=========================================================================
    // PanelComposer interface
    //=========================================================================

    Result<std::optional<RepaintRequest>> apply(const WidgetUpdated& update) override {
        auto it = _index.find(update.id);
        if (it == _index.end()) {
            return Err<std::optional<RepaintRequest>>("PanelComposer: unknown widget id " +
                                                     std::to_string(update.id));
        }
        WidgetState& w = _widgets[it->second];

        if (update.sequence != 0 && update.sequence <= w.lastSequence) {
            ydebug("PanelComposer: stale update {} for '{}' (have {})",
                   update.sequence, w.spec.name, w.lastSequence);
            return Ok(std::optional<RepaintRequest>());
        }
        w.lastSequence = update.sequence;

        if (w.hasContent && w.layout == update.layout) {
            return Ok(std::optional<RepaintRequest>());
        }

        if (update.layout.width < 0) {
            ywarn("PanelComposer: widget '{}' reported negative width {}, clamped to 0",
                  w.spec.name, update.layout.width);
        } else if (update.layout.width > _options.width) {
            ywarn("PanelComposer: widget '{}' width {} exceeds bar width {}, clamped",
                  w.spec.name, update.layout.width, _options.width);
        }

        std::vector<Rect> before = placements();

        w.layout = update.layout;
        w.hasContent = true;

        recompute();
        rebuildFrame();

        // Damage: old and new rectangles of every widget that moved or changed
        std::vector<Rect> after = placements();
        Rect damage;
        for (size_t i = 0; i < _widgets.size(); ++i) {
            bool changed = (i == it->second) || before[i] != after[i];
            if (!changed) continue;
            damage = damage.united(before[i]).united(after[i]);
        }
        return Ok(decide(damage));
    }

    std::optional<RepaintRequest> resize(int width, int height) override {
        if (width == _options.width && height == _options.height) {
            return std::nullopt;
        }
        if (width <= 0 || height <= 0) {
            ywarn("PanelComposer: ignoring invalid geometry {}x{}", width, height);
            return std::nullopt;
        }
        yinfo("PanelComposer: resized {}x{} -> {}x{}", _options.width, _options.height, width, height);
        _options.width = width;
        _options.height = height;
        recompute();
        rebuildFrame();
        return RepaintRequest{true, {}};
    }

    RenderFrame::Ptr frame() const override { return _frame; }

    ZoneLayout zoneLayout(Zone zone) const override {
        return _zones[static_cast<size_t>(zone)];
    }

    std::optional<Rect> widgetRect(WidgetId id) const override {
        auto it = _index.find(id);
        if (it == _index.end()) return std::nullopt;
        const auto& w = _widgets[it->second];
        if (w.elided) return std::nullopt;
        return w.rect;
    }

    bool isElided(WidgetId id) const override {
        auto it = _index.find(id);
        return it != _index.end() && _widgets[it->second].elided;
    }

    std::vector<WidgetId> elided() const override { return _elided; }

    int width() const override { return _options.width; }
    int height() const override { return _options.height; }

private:
    struct WidgetState {
        WidgetSpec spec;
        size_t order = 0;  // configuration order across all zones
        LayoutResult layout;
        bool hasContent = false;
        uint64_t lastSequence = 0;
        int width = 0;     // clamped
        bool elided = false;
        Rect rect;
    };

    //=========================================================================
    // Layout
    //=========================================================================

    std::vector<Rect> placements() const {
        std::vector<Rect> out;
        out.reserve(_widgets.size());
        for (const auto& w : _widgets) {
            out.push_back(w.elided ? Rect{} : w.rect);
        }
        return out;
    }

    // Lowest priority first; on a tie the later-configured widget goes first
    WidgetState* nextVictim() {
        static constexpr Zone elisionOrder[] = {Zone::Center, Zone::End, Zone::Start};
        for (Zone zone : elisionOrder) {
            WidgetState* victim = nullptr;
            for (auto& w : _widgets) {
                if (w.spec.zone != zone || w.elided || w.width == 0) continue;
                if (!victim || w.spec.priority < victim->spec.priority ||
                    (w.spec.priority == victim->spec.priority && w.order > victim->order)) {
                    victim = &w;
                }
            }
            if (victim) return victim;
        }
        return nullptr;
    }

    void recompute() {
        const int barWidth = _options.width;

        long total = 0;
        for (auto& w : _widgets) {
            w.width = std::clamp(w.layout.width, 0, barWidth);
            w.elided = false;
            total += w.width;
        }

        std::vector<WidgetId> elided;
        while (total > barWidth) {
            WidgetState* victim = nextVictim();
            if (!victim) break;
            victim->elided = true;
            total -= victim->width;
            elided.push_back(victim->spec.id);
        }

        if (elided != _elided) {
            for (WidgetId id : elided) {
                if (std::find(_elided.begin(), _elided.end(), id) == _elided.end()) {
                    const auto& w = _widgets[_index[id]];
                    yinfo("PanelComposer: eliding '{}' ({} zone, priority {})",
                          w.spec.name, zoneName(w.spec.zone), w.spec.priority);
                }
            }
            _elided = std::move(elided);
        }

        std::array<int, ZoneCount> totals{};
        for (const auto& w : _widgets) {
            if (!w.elided) totals[static_cast<size_t>(w.spec.zone)] += w.width;
        }

        const int startW = totals[static_cast<size_t>(Zone::Start)];
        const int centerW = totals[static_cast<size_t>(Zone::Center)];
        const int endW = totals[static_cast<size_t>(Zone::End)];

        _zones[static_cast<size_t>(Zone::Start)] = {0, startW};
        _zones[static_cast<size_t>(Zone::End)] = {barWidth - endW, endW};
        // Centered in the band left between the start and end zones
        _zones[static_cast<size_t>(Zone::Center)] = {startW + (barWidth - startW - endW - centerW) / 2, centerW};

        std::array<int, ZoneCount> pen{};
        for (size_t z = 0; z < ZoneCount; ++z) {
            pen[z] = _zones[z].x;
        }
        for (auto& w : _widgets) {
            if (w.elided) {
                w.rect = {};
                continue;
            }
            int& x = pen[static_cast<size_t>(w.spec.zone)];
            w.rect = {x, 0, w.width, _options.height};
            x += w.width;
        }
    }

    void rebuildFrame() {
        auto frame = std::make_shared<RenderFrame>();
        frame->generation = ++_generation;
        frame->width = _options.width;
        frame->height = _options.height;
        frame->background = _options.background;

        for (const auto& w : _widgets) {
            if (w.elided || w.rect.empty()) continue;

            for (const auto& run : w.layout.runs) {
                PlacedRun placed;
                placed.widget = w.spec.id;
                placed.clip = w.rect;
                placed.run = run;
                placed.run.box = run.box.translated(w.rect.x, w.rect.y);
                for (auto& g : placed.run.glyphs) {
                    g.x += w.rect.x;
                }
                if (!placed.run.box.intersects(placed.clip)) continue;
                frame->runs.push_back(std::move(placed));
            }

            if (!w.spec.bindings.empty()) {
                frame->regions.push_back({w.rect, w.spec.id, w.spec.bindings});
            }
        }

        std::sort(frame->regions.begin(), frame->regions.end(),
                  [](const ClickRegion& a, const ClickRegion& b) { return a.rect.x < b.rect.x; });

        _frame = std::move(frame);
    }

    std::optional<RepaintRequest> decide(const Rect& damage) const {
        if (damage.empty()) {
            return std::nullopt;
        }
        const double barArea = double(_options.width) * double(_options.height);
        if (double(damage.area()) > _options.fullRepaintFraction * barArea) {
            return RepaintRequest{true, {}};
        }
        return RepaintRequest{false, damage};
    }

    Options _options;
    std::vector<WidgetSpec> _specs;
    std::vector<WidgetState> _widgets;
    std::unordered_map<WidgetId, size_t> _index;
    std::array<ZoneLayout, ZoneCount> _zones{};
    std::vector<WidgetId> _elided;
    RenderFrame::Ptr _frame;
    uint64_t _generation = 0;
};

//=============================================================================
// Factory
//=============================================================================

Result<PanelComposer::Ptr> PanelComposer::create(const Options& options, std::vector<WidgetSpec> widgets) noexcept {
    auto composer = std::make_shared<PanelComposerImpl>(options, std::move(widgets));
    if (auto res = composer->init(); !res) {
        return Err<Ptr>("Failed to initialize PanelComposer", res);
    }
    return Ok(Ptr(composer));
}

} // namespace lazybar
