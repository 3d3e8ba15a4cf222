#pragma once
#include <utility>

#include "join-pre.hpp"
#include "maybe-done.hpp"
#include "wake-array.hpp"

#include "assert-def.hpp"

namespace fanin {
template <Pollable... Ops>
    requires(sizeof...(Ops) > 0)
auto Join<Ops...>::poll(LocalWaker& waker) -> Poll<Output> {
    ASSERT(!finished, "join={} polled after completion", (void*)this);
    wakers.register_parent(waker);

    const auto ready = [this]<size_t... indices>(std::index_sequence<indices...>) {
        // every slot is visited, no short-circuit
        auto all = true;
        ((all &= poll_child<indices>()), ...);
        return all;
    }(std::index_sequence_for<Ops...>());
    if(!ready) {
        return pending;
    }

    DEBUG("join={} completed", (void*)this);
    finished = true;
    return [this]<size_t... indices>(std::index_sequence<indices...>) {
        return Output{take_child_output<indices>()...};
    }(std::index_sequence_for<Ops...>());
}

template <Pollable... Ops>
    requires(sizeof...(Ops) > 0)
template <size_t index>
auto Join<Ops...>::poll_child() -> bool {
    auto& child = std::get<index>(children);
    if(child.is_done()) {
        return true;
    }
    if(!wakers.take_and_clear_ready(index)) {
        return false;
    }
    const auto ready = child.poll(wakers.child_waker(index)).is_ready();
    TRACE("join={} polled slot={} ready={}", (void*)this, index, ready);
    return ready;
}

template <Pollable... Ops>
    requires(sizeof...(Ops) > 0)
template <size_t index>
auto Join<Ops...>::take_child_output() -> PollOutput<std::tuple_element_t<index, std::tuple<Ops...>>> {
    auto output = std::get<index>(children).take_output();
    ASSERT(output.has_value(), "join={} slot={} has no output on completion", (void*)this, index);
    return std::move(*output);
}

template <Pollable... Ops>
    requires(sizeof...(Ops) > 0)
Join<Ops...>::Join(Ops... ops)
    : children(std::move(ops)...) {
}

template <Pollable... Ops>
auto join(Ops... ops) -> Join<Ops...> {
    return Join<Ops...>(std::move(ops)...);
}

template <Pollable Op>
auto JoinVec<Op>::poll(LocalWaker& waker) -> Poll<Output> {
    ASSERT(!finished, "join={} polled after completion", (void*)this);
    wakers.register_parent(waker);

    auto ready = true;
    for(auto i = 0uz; i < children.size(); i += 1) {
        auto& child = children[i];
        if(child.is_done()) {
            continue;
        }
        if(!wakers.take_and_clear_ready(i)) {
            ready = false;
            continue;
        }
        const auto child_ready = child.poll(wakers.child_waker(i)).is_ready();
        TRACE("join={} polled slot={} ready={}", (void*)this, i, child_ready);
        ready &= child_ready;
    }
    if(!ready) {
        return pending;
    }

    DEBUG("join={} completed count={}", (void*)this, children.size());
    finished = true;
    auto outputs = Output();
    outputs.reserve(children.size());
    for(auto i = 0uz; i < children.size(); i += 1) {
        auto output = children[i].take_output();
        ASSERT(output.has_value(), "join={} slot={} has no output on completion", (void*)this, i);
        outputs.push_back(std::move(*output));
    }
    return outputs;
}

template <Pollable Op>
JoinVec<Op>::JoinVec(std::vector<Op> ops)
    : wakers(ops.size()) {
    children.reserve(ops.size());
    for(auto& op : ops) {
        children.emplace_back(std::move(op));
    }
}

template <Pollable Op>
auto join_vec(std::vector<Op> ops) -> JoinVec<Op> {
    return JoinVec<Op>(std::move(ops));
}
} // namespace fanin

#include "assert-undef.hpp"
