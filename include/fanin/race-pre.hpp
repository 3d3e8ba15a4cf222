#pragma once
#include <optional>
#include <tuple>
#include <variant>
#include <vector>

#include "poll.hpp"
#include "wake-array-pre.hpp"

namespace fanin {
// completes with the output of the first child to complete
// the active alternative of the output is the index of the winning child
// when several children complete in the same poll, the lowest index wins
template <Pollable... Ops>
    requires(sizeof...(Ops) > 0)
struct [[nodiscard]] Race {
    using Output = std::variant<PollOutput<Ops>...>;

    std::tuple<Ops...>        children;
    WakeArray<sizeof...(Ops)> wakers;
    bool                      finished = false;

    auto poll(LocalWaker& waker) -> Poll<Output>;

    // private
    template <size_t index>
    auto poll_child(std::optional<Output>& result) -> bool;

    Race(Ops... ops);
};

template <Pollable... Ops>
auto race(Ops... ops) -> Race<Ops...>;

template <class T>
struct RaceResult {
    size_t index;
    T      output;

    auto operator==(const RaceResult&) const -> bool = default;
};

// runtime sized variant of Race for operations of one type
template <Pollable Op>
struct [[nodiscard]] RaceVec {
    using Output = RaceResult<PollOutput<Op>>;

    std::vector<Op> children;
    WakeVector      wakers;
    bool            finished = false;

    auto poll(LocalWaker& waker) -> Poll<Output>;

    RaceVec(std::vector<Op> ops);
};

template <Pollable Op>
auto race_vec(std::vector<Op> ops) -> RaceVec<Op>;
} // namespace fanin
