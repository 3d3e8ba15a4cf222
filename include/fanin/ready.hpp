#pragma once
#include <optional>
#include <utility>

#include "poll.hpp"

#include "assert-def.hpp"

namespace fanin {
// completes on its first poll
template <class T>
struct [[nodiscard]] Ready {
    std::optional<T> value;

    auto poll(LocalWaker& /*waker*/) -> Poll<T> {
        ASSERT(value.has_value(), "ready operation polled after completion");
        auto output = std::move(*value);
        value.reset();
        return output;
    }
};

template <class T>
auto ready(T value) -> Ready<T> {
    return Ready<T>{std::move(value)};
}

// never completes and never wakes
template <class T>
struct [[nodiscard]] Never {
    auto poll(LocalWaker& /*waker*/) -> Poll<T> {
        return pending;
    }
};

template <class T>
auto never() -> Never<T> {
    return Never<T>();
}
} // namespace fanin

#include "assert-undef.hpp"
