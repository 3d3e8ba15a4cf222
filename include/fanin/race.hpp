#pragma once
#include <utility>

#include "race-pre.hpp"
#include "wake-array.hpp"

#include "assert-def.hpp"

namespace fanin {
template <Pollable... Ops>
    requires(sizeof...(Ops) > 0)
auto Race<Ops...>::poll(LocalWaker& waker) -> Poll<Output> {
    ASSERT(!finished, "race={} polled after completion", (void*)this);
    wakers.register_parent(waker);

    auto result = std::optional<Output>();
    // short-circuits on the first winner, later slots are left untouched
    [this, &result]<size_t... indices>(std::index_sequence<indices...>) {
        (void)(poll_child<indices>(result) || ...);
    }(std::index_sequence_for<Ops...>());
    if(!result) {
        return pending;
    }

    DEBUG("race={} won by slot={}", (void*)this, result->index());
    finished = true;
    return std::move(*result);
}

template <Pollable... Ops>
    requires(sizeof...(Ops) > 0)
template <size_t index>
auto Race<Ops...>::poll_child(std::optional<Output>& result) -> bool {
    if(!wakers.take_and_clear_ready(index)) {
        return false;
    }
    auto polled = std::get<index>(children).poll(wakers.child_waker(index));
    TRACE("race={} polled slot={} ready={}", (void*)this, index, polled.is_ready());
    if(polled.is_pending()) {
        return false;
    }
    result.emplace(std::in_place_index<index>, polled.take());
    return true;
}

template <Pollable... Ops>
    requires(sizeof...(Ops) > 0)
Race<Ops...>::Race(Ops... ops)
    : children(std::move(ops)...) {
}

template <Pollable... Ops>
auto race(Ops... ops) -> Race<Ops...> {
    return Race<Ops...>(std::move(ops)...);
}

template <Pollable Op>
auto RaceVec<Op>::poll(LocalWaker& waker) -> Poll<Output> {
    ASSERT(!finished, "race={} polled after completion", (void*)this);
    wakers.register_parent(waker);

    for(auto i = 0uz; i < children.size(); i += 1) {
        if(!wakers.take_and_clear_ready(i)) {
            continue;
        }
        auto polled = children[i].poll(wakers.child_waker(i));
        TRACE("race={} polled slot={} ready={}", (void*)this, i, polled.is_ready());
        if(polled.is_ready()) {
            DEBUG("race={} won by slot={}", (void*)this, i);
            finished = true;
            return Output{i, polled.take()};
        }
    }
    return pending;
}

template <Pollable Op>
RaceVec<Op>::RaceVec(std::vector<Op> ops)
    : children(std::move(ops)),
      wakers(children.size()) {
    ASSERT(!children.empty(), "race of no operations can never complete");
}

template <Pollable Op>
auto race_vec(std::vector<Op> ops) -> RaceVec<Op> {
    return RaceVec<Op>(std::move(ops));
}
} // namespace fanin

#include "assert-undef.hpp"
