#include <lazybar/base/cancel-token.h>
#include <algorithm>

namespace lazybar {
namespace base {

void CancelToken::cancel() {
    std::vector<std::pair<CallbackId, Callback>> callbacks;
    {
        std::lock_guard<std::mutex> lock(_mutex);
        if (_cancelled) return;
        _cancelled = true;
        callbacks.swap(_callbacks);
    }
    _cv.notify_all();
    for (auto& [id, cb] : callbacks) {
        cb();
    }
}

bool CancelToken::cancelled() const {
    std::lock_guard<std::mutex> lock(_mutex);
    return _cancelled;
}

void CancelToken::poke() {
    {
        std::lock_guard<std::mutex> lock(_mutex);
        ++_pokes;
    }
    _cv.notify_all();
}

CancelToken::WaitResult CancelToken::waitFor(std::chrono::milliseconds timeout) {
    return waitUntil(std::chrono::steady_clock::now() + timeout);
}

CancelToken::WaitResult CancelToken::waitUntil(std::chrono::steady_clock::time_point deadline) {
    return waitUntil(deadline, [] { return false; });
}

CancelToken::WaitResult CancelToken::waitUntil(std::chrono::steady_clock::time_point deadline,
                                               const std::function<bool()>& ready) {
    std::unique_lock<std::mutex> lock(_mutex);
    const uint64_t seen = _pokes;
    bool isReady = false;
    _cv.wait_until(lock, deadline, [&] {
        isReady = ready();
        return _cancelled || _pokes != seen || isReady;
    });
    if (_cancelled) return WaitResult::Cancelled;
    if (_pokes != seen || isReady) return WaitResult::Poked;
    return WaitResult::Timeout;
}

CancelToken::CallbackId CancelToken::onCancel(Callback callback) {
    {
        std::lock_guard<std::mutex> lock(_mutex);
        if (!_cancelled) {
            CallbackId id = _nextCallbackId++;
            _callbacks.emplace_back(id, std::move(callback));
            return id;
        }
    }
    callback();
    return 0;
}

void CancelToken::removeOnCancel(CallbackId id) {
    std::lock_guard<std::mutex> lock(_mutex);
    _callbacks.erase(std::remove_if(_callbacks.begin(), _callbacks.end(),
                                    [id](const auto& entry) { return entry.first == id; }),
                     _callbacks.end());
}

} // namespace base
} // namespace lazybar
