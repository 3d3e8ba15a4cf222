#pragma once
#include <tuple>
#include <vector>

#include "maybe-done-pre.hpp"
#include "wake-array-pre.hpp"

namespace fanin {
// waits for every child, outputs are returned in declaration order
template <Pollable... Ops>
    requires(sizeof...(Ops) > 0)
struct [[nodiscard]] Join {
    using Output = std::tuple<PollOutput<Ops>...>;

    std::tuple<MaybeDone<Ops>...> children;
    WakeArray<sizeof...(Ops)>     wakers;
    bool                          finished = false;

    auto poll(LocalWaker& waker) -> Poll<Output>;

    // private
    template <size_t index>
    auto poll_child() -> bool;
    template <size_t index>
    auto take_child_output() -> PollOutput<std::tuple_element_t<index, std::tuple<Ops...>>>;

    Join(Ops... ops);
};

template <Pollable... Ops>
auto join(Ops... ops) -> Join<Ops...>;

// runtime sized variant of Join for operations of one type
template <Pollable Op>
struct [[nodiscard]] JoinVec {
    using Output = std::vector<PollOutput<Op>>;

    std::vector<MaybeDone<Op>> children;
    WakeVector                 wakers;
    bool                       finished = false;

    auto poll(LocalWaker& waker) -> Poll<Output>;

    JoinVec(std::vector<Op> ops);
};

template <Pollable Op>
auto join_vec(std::vector<Op> ops) -> JoinVec<Op>;
} // namespace fanin
