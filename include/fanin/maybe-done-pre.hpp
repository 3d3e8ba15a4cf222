#pragma once
#include <optional>
#include <variant>

#include "poll.hpp"

namespace fanin {
// memoizes the output of an operation so that it can be polled again after completion
template <Pollable Op>
struct [[nodiscard]] MaybeDone {
    using Output = PollOutput<Op>;

    struct Gone {
    };

    constexpr static auto active_index = 0uz;
    constexpr static auto done_index   = 1uz;
    constexpr static auto gone_index   = 2uz;

    std::variant<Op, Output, Gone> state;

    auto poll(LocalWaker& waker) -> Poll<Unit>;
    auto take_output() -> std::optional<Output>;
    auto is_done() const -> bool;
    auto is_terminated() const -> bool;

    MaybeDone(Op op);
};

template <Pollable Op>
auto maybe_done(Op op) -> MaybeDone<Op>;
} // namespace fanin
