#pragma once
#include <mutex>
#include <optional>

namespace fanin {
template <class T>
struct AtomicRefGuard;

// thread-safe counterpart of ValueGuard
// every access to either side of any atomic guard pair is serialized by one process-wide mutex,
// since relinking has to inspect and update both sides at once
template <class T>
struct AtomicValueGuard {
    T                  data;
    AtomicRefGuard<T>* ref = nullptr;

    auto set(T value) -> void;
    auto get() const -> T;
    auto is_linked() const -> bool;

    // fanin internal, caller holds the guard mutex
    auto replace_ref(AtomicRefGuard<T>* new_ref) -> void;

    auto operator=(const AtomicValueGuard&) -> AtomicValueGuard& = delete;
    auto operator=(AtomicValueGuard&&) -> AtomicValueGuard&      = delete;

    AtomicValueGuard(const AtomicValueGuard&) = delete;
    AtomicValueGuard(AtomicValueGuard&& o);
    AtomicValueGuard(T data = T());
    ~AtomicValueGuard();
};

template <class T>
struct AtomicRefGuard {
    AtomicValueGuard<T>* value = nullptr;

    auto link(AtomicValueGuard<T>& new_value) -> void;
    auto unlink() -> void;
    auto read() const -> std::optional<T>;
    auto is_linked() const -> bool;

    // fanin internal, caller holds the guard mutex
    auto replace_value(AtomicValueGuard<T>* new_value) -> void;

    auto operator=(const AtomicRefGuard&) -> AtomicRefGuard& = delete;
    auto operator=(AtomicRefGuard&&) -> AtomicRefGuard&      = delete;

    AtomicRefGuard(const AtomicRefGuard&) = delete;
    AtomicRefGuard(AtomicRefGuard&& o);
    AtomicRefGuard() = default;
    ~AtomicRefGuard();
};

namespace impl {
// recursive, since a wake target may touch atomic guards while the mutex is held
inline auto guard_mutex() -> std::recursive_mutex& {
    static auto mutex = std::recursive_mutex();
    return mutex;
}
} // namespace impl
} // namespace fanin
