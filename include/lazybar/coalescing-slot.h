#pragma once

#include <cstdint>
#include <mutex>
#include <optional>

namespace lazybar {

//-----------------------------------------------------------------------------
// CoalescingSlot - single-entry mailbox between one producer and one consumer
//
// put() replaces whatever is pending, so the consumer only ever sees the
// newest value. Values are taken in the order they were put, minus the ones
// that were superseded before the consumer got to them.
//-----------------------------------------------------------------------------
template<typename T>
class CoalescingSlot {
public:
    // Returns true if the slot was empty (the consumer needs a wake-up)
    bool put(T value) {
        std::lock_guard<std::mutex> lock(_mutex);
        bool wasEmpty = !_value.has_value();
        if (!wasEmpty) {
            _superseded++;
        }
        _value = std::move(value);
        _puts++;
        return wasEmpty;
    }

    std::optional<T> take() {
        std::lock_guard<std::mutex> lock(_mutex);
        std::optional<T> out;
        out.swap(_value);
        return out;
    }

    bool pending() const {
        std::lock_guard<std::mutex> lock(_mutex);
        return _value.has_value();
    }

    uint64_t puts() const {
        std::lock_guard<std::mutex> lock(_mutex);
        return _puts;
    }

    uint64_t superseded() const {
        std::lock_guard<std::mutex> lock(_mutex);
        return _superseded;
    }

private:
    mutable std::mutex _mutex;
    std::optional<T> _value;
    uint64_t _puts = 0;
    uint64_t _superseded = 0;
};

} // namespace lazybar
