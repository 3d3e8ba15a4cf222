#pragma once
#include "poll.hpp"

namespace fanin {
struct Event;

struct [[nodiscard]] EventWaiter {
    Event* event;

    auto poll(LocalWaker& waker) -> Poll<Unit>;
};

// one-shot notification which can be awaited by a pollable operation
// the event must outlive its waiters, the waiters need not outlive the event
struct Event {
    WakerRef waker;
    bool     notified = false;

    auto wait() -> EventWaiter;
    auto notify() -> void;

    // waiters hold the address of the event
    auto operator=(const Event&) -> Event& = delete;
    auto operator=(Event&&) -> Event&      = delete;

    Event(const Event&) = delete;
    Event(Event&&)      = delete;
    Event()             = default;
};
} // namespace fanin
