#pragma once

//=============================================================================
// FakeDisplay
//
// In-memory DisplayConnection. Events are queued from the test thread and
// signalled through a pipe so the bus's loop poll sees them like a real
// X connection. Every present() is recorded.
//=============================================================================

#include <lazybar/display.h>
#include <atomic>
#include <fcntl.h>
#include <functional>
#include <mutex>
#include <unistd.h>
#include <vector>

namespace lazybar::test {

class FakeDisplay : public DisplayConnection {
public:
    using Ptr = std::shared_ptr<FakeDisplay>;

    FakeDisplay(int width, int height) : _width(width), _height(height) {
        if (pipe2(_pipe, O_NONBLOCK | O_CLOEXEC) != 0) {
            _pipe[0] = _pipe[1] = -1;
        }
    }

    ~FakeDisplay() override {
        if (_pipe[0] >= 0) close(_pipe[0]);
        if (_pipe[1] >= 0) close(_pipe[1]);
    }

    static Ptr make(int width, int height) { return std::make_shared<FakeDisplay>(width, height); }

    // Test side: safe from any thread
    void push(DisplayEvent event) {
        {
            std::lock_guard<std::mutex> lock(_mutex);
            _queue.push_back(std::move(event));
        }
        char byte = 1;
        [[maybe_unused]] auto n = write(_pipe[1], &byte, 1);
    }

    void failConnection() { _broken.store(true); }

    // Runs on the presenting (loop) thread after each present()
    void setPresentHook(std::function<void()> hook) { _presentHook = std::move(hook); }

    // Runs on the loop thread at every event read; may append events
    void setPollHook(std::function<void(std::vector<DisplayEvent>&)> hook) { _pollHook = std::move(hook); }

    // DisplayConnection
    int fd() const override { return _pipe[0]; }
    int width() const override { return _width; }
    int height() const override { return _height; }

    Result<void> pollEvents(std::vector<DisplayEvent>& out) override {
        char buf[64];
        while (read(_pipe[0], buf, sizeof(buf)) > 0) {
        }
        if (_broken.load()) {
            return Err<void>("fake display: connection broken");
        }
        {
            std::lock_guard<std::mutex> lock(_mutex);
            for (auto& e : _queue) {
                out.push_back(std::move(e));
            }
            _queue.clear();
        }
        if (_pollHook) _pollHook(out);
        return Ok();
    }

    Result<void> present(const PixelBuffer&, const std::vector<Rect>& rects) override {
        if (_broken.load()) {
            return Err<void>("fake display: connection broken");
        }
        {
            std::lock_guard<std::mutex> lock(_mutex);
            _presents++;
            for (const auto& r : rects) {
                _presented.push_back(r);
            }
        }
        if (_presentHook) _presentHook();
        return Ok();
    }

    Result<void> check() override {
        if (_broken.load()) {
            return Err<void>("fake display: connection broken");
        }
        return Ok();
    }

    Result<void> teardown() override {
        _teardowns++;
        return Ok();
    }

    uint64_t presents() const {
        std::lock_guard<std::mutex> lock(_mutex);
        return _presents;
    }

    std::vector<Rect> presented() const {
        std::lock_guard<std::mutex> lock(_mutex);
        return _presented;
    }

    int teardowns() const { return _teardowns.load(); }

private:
    int _width;
    int _height;
    int _pipe[2] = {-1, -1};
    mutable std::mutex _mutex;
    std::vector<DisplayEvent> _queue;
    std::vector<Rect> _presented;
    uint64_t _presents = 0;
    std::atomic<bool> _broken{false};
    std::atomic<int> _teardowns{0};
    std::function<void()> _presentHook;
    std::function<void(std::vector<DisplayEvent>&)> _pollHook;
};

} // namespace lazybar::test
