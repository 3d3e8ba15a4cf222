#pragma once
#include <utility>

#include "event-pre.hpp"
#include "wake.hpp"

namespace fanin {
inline auto EventWaiter::poll(LocalWaker& waker) -> Poll<Unit> {
    if(std::exchange(event->notified, false)) {
        event->waker.unlink();
        return Unit();
    }
    event->waker.link(waker);
    return pending;
}

inline auto Event::wait() -> EventWaiter {
    return EventWaiter{this};
}

inline auto Event::notify() -> void {
    notified = true;
    // no-op if the waiter was dropped
    wake(waker);
}
} // namespace fanin
