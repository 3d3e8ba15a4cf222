#pragma once
#include <utility>

#include "maybe-done-pre.hpp"

#include "assert-def.hpp"

namespace fanin {
template <Pollable Op>
auto MaybeDone<Op>::poll(LocalWaker& waker) -> Poll<Unit> {
    switch(state.index()) {
    case active_index: {
        auto result = std::get<active_index>(state).poll(waker);
        if(result.is_pending()) {
            return pending;
        }
        state.template emplace<done_index>(result.take());
    } break;
    case done_index:
        break;
    case gone_index:
        PANIC("MaybeDone polled after its output was taken");
    }
    return Unit();
}

template <Pollable Op>
auto MaybeDone<Op>::take_output() -> std::optional<Output> {
    if(state.index() != done_index) {
        return std::nullopt;
    }
    auto output = std::optional<Output>(std::move(std::get<done_index>(state)));
    state.template emplace<gone_index>();
    return output;
}

template <Pollable Op>
auto MaybeDone<Op>::is_done() const -> bool {
    return state.index() == done_index;
}

template <Pollable Op>
auto MaybeDone<Op>::is_terminated() const -> bool {
    return state.index() != active_index;
}

template <Pollable Op>
MaybeDone<Op>::MaybeDone(Op op)
    : state(std::in_place_index<active_index>, std::move(op)) {
}

template <Pollable Op>
auto maybe_done(Op op) -> MaybeDone<Op> {
    return MaybeDone<Op>(std::move(op));
}
} // namespace fanin

#include "assert-undef.hpp"
