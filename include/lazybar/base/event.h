#pragma once

#include "types.h"

namespace lazybar {
namespace base {

struct Event {
    enum class Type {
        None,
        // Poll
        PollReadable,
        PollError,
        // Timer
        Timer,
        // Cross-thread wake-up
        Wake,
        // POSIX signal
        Signal,
    };

    struct PollEvent {
        int fd;
        int status;
    };

    struct TimerEvent {
        TimerId timerId;
    };

    struct WakeEvent {
        WakeId wakeId;
    };

    struct SignalEvent {
        SignalId signalId;
        int signum;
    };

    Type type = Type::None;

    union {
        PollEvent poll;
        TimerEvent timer;
        WakeEvent wake;
        SignalEvent signal;
    };

    Event() : poll{-1, 0} {}

    // Factory methods
    static Event pollReadable(int fd) {
        Event e;
        e.type = Type::PollReadable;
        e.poll = {fd, 0};
        return e;
    }

    static Event pollError(int fd, int status) {
        Event e;
        e.type = Type::PollError;
        e.poll = {fd, status};
        return e;
    }

    static Event timerEvent(TimerId timerId) {
        Event e;
        e.type = Type::Timer;
        e.timer = {timerId};
        return e;
    }

    static Event wakeEvent(WakeId wakeId) {
        Event e;
        e.type = Type::Wake;
        e.wake = {wakeId};
        return e;
    }

    static Event signalEvent(SignalId signalId, int signum) {
        Event e;
        e.type = Type::Signal;
        e.signal = {signalId, signum};
        return e;
    }
};

} // namespace base
} // namespace lazybar
