#pragma once
#include <optional>

namespace fanin {
template <class T>
struct RefGuard;

// strong side of a guard pair
// owns a copyable value and grants read access to at most one RefGuard
template <class T>
struct ValueGuard {
    T            data;
    RefGuard<T>* ref = nullptr;

    auto set(T value) -> void;
    auto get() const -> T;
    auto is_linked() const -> bool;

    // fanin internal
    auto replace_ref(RefGuard<T>* new_ref) -> void;

    auto operator=(const ValueGuard&) -> ValueGuard& = delete;
    auto operator=(ValueGuard&&) -> ValueGuard&      = delete;

    ValueGuard(const ValueGuard&) = delete;
    // the link, if any, moves along with the value
    ValueGuard(ValueGuard&& o);
    ValueGuard(T data = T());
    ~ValueGuard();
};

// weak side of a guard pair
// reads through the linked ValueGuard until either side is destroyed or relinked
template <class T>
struct RefGuard {
    ValueGuard<T>* value = nullptr;

    // last registration wins: the previous partners of both sides are unlinked
    auto link(ValueGuard<T>& new_value) -> void;
    auto unlink() -> void;
    auto read() const -> std::optional<T>;
    auto is_linked() const -> bool;

    // fanin internal
    auto replace_value(ValueGuard<T>* new_value) -> void;

    auto operator=(const RefGuard&) -> RefGuard& = delete;
    auto operator=(RefGuard&&) -> RefGuard&      = delete;

    RefGuard(const RefGuard&) = delete;
    RefGuard(RefGuard&& o);
    RefGuard() = default;
    ~RefGuard();
};
} // namespace fanin
