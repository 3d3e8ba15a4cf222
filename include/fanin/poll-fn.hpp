#pragma once
#include <type_traits>
#include <utility>

#include "poll.hpp"

namespace fanin {
template <class F>
    requires IsPoll<std::invoke_result_t<F&, LocalWaker&>>::value
struct [[nodiscard]] PollFn {
    F fn;

    auto poll(LocalWaker& waker) -> std::invoke_result_t<F&, LocalWaker&> {
        return fn(waker);
    }
};

template <class F>
auto poll_fn(F fn) -> PollFn<F> {
    return PollFn<F>{std::move(fn)};
}
} // namespace fanin
