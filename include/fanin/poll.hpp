#pragma once
#include <optional>
#include <type_traits>
#include <utility>

#include "wake-pre.hpp"

#include "assert-def.hpp"

namespace fanin {
struct Pending {
};

constexpr auto pending = Pending();

// output of operations which only signal completion
struct Unit {
    auto operator==(const Unit&) const -> bool = default;
};

template <class T>
struct [[nodiscard]] Poll {
    using value_type = T;

    std::optional<T> value;

    auto is_ready() const -> bool {
        return value.has_value();
    }

    auto is_pending() const -> bool {
        return !value.has_value();
    }

    auto take() -> T {
        ASSERT(value.has_value(), "took output of pending poll");
        return std::move(*value);
    }

    auto operator==(const Poll&) const -> bool = default;

    Poll(Pending) {
    }

    Poll(T value)
        : value(std::move(value)) {
    }
};

template <class T>
struct IsPoll : std::false_type {};

template <class T>
struct IsPoll<Poll<T>> : std::true_type {};

template <class T>
concept Pollable = requires(T& op, LocalWaker& waker) {
    requires IsPoll<decltype(op.poll(waker))>::value;
};

template <Pollable T>
using PollOutput = typename decltype(std::declval<T&>().poll(std::declval<LocalWaker&>()))::value_type;
} // namespace fanin

#include "assert-undef.hpp"
