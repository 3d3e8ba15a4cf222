#pragma once
#include <utility>

#include "atomic-guard-pre.hpp"

namespace fanin {
template <class T>
auto AtomicValueGuard<T>::set(T value) -> void {
    const auto lock = std::scoped_lock(impl::guard_mutex());
    data            = std::move(value);
}

template <class T>
auto AtomicValueGuard<T>::get() const -> T {
    const auto lock = std::scoped_lock(impl::guard_mutex());
    return data;
}

template <class T>
auto AtomicValueGuard<T>::is_linked() const -> bool {
    const auto lock = std::scoped_lock(impl::guard_mutex());
    return ref != nullptr;
}

template <class T>
auto AtomicValueGuard<T>::replace_ref(AtomicRefGuard<T>* const new_ref) -> void {
    if(const auto old = std::exchange(ref, new_ref); old != nullptr) {
        old->value = nullptr;
    }
}

template <class T>
AtomicValueGuard<T>::AtomicValueGuard(AtomicValueGuard&& o) {
    const auto lock = std::scoped_lock(impl::guard_mutex());
    data            = std::move(o.data);
    ref             = std::exchange(o.ref, nullptr);
    if(ref != nullptr) {
        ref->value = this;
    }
}

template <class T>
AtomicValueGuard<T>::AtomicValueGuard(T data)
    : data(std::move(data)) {
}

template <class T>
AtomicValueGuard<T>::~AtomicValueGuard() {
    const auto lock = std::scoped_lock(impl::guard_mutex());
    replace_ref(nullptr);
}

template <class T>
auto AtomicRefGuard<T>::link(AtomicValueGuard<T>& new_value) -> void {
    const auto lock = std::scoped_lock(impl::guard_mutex());
    new_value.replace_ref(this);
    replace_value(&new_value);
}

template <class T>
auto AtomicRefGuard<T>::unlink() -> void {
    const auto lock = std::scoped_lock(impl::guard_mutex());
    replace_value(nullptr);
}

template <class T>
auto AtomicRefGuard<T>::read() const -> std::optional<T> {
    const auto lock = std::scoped_lock(impl::guard_mutex());
    if(value == nullptr) {
        return std::nullopt;
    }
    return value->data;
}

template <class T>
auto AtomicRefGuard<T>::is_linked() const -> bool {
    const auto lock = std::scoped_lock(impl::guard_mutex());
    return value != nullptr;
}

template <class T>
auto AtomicRefGuard<T>::replace_value(AtomicValueGuard<T>* const new_value) -> void {
    if(const auto old = std::exchange(value, new_value); old != nullptr) {
        old->ref = nullptr;
    }
}

template <class T>
AtomicRefGuard<T>::AtomicRefGuard(AtomicRefGuard&& o) {
    const auto lock = std::scoped_lock(impl::guard_mutex());
    value           = std::exchange(o.value, nullptr);
    if(value != nullptr) {
        value->ref = this;
    }
}

template <class T>
AtomicRefGuard<T>::~AtomicRefGuard() {
    const auto lock = std::scoped_lock(impl::guard_mutex());
    replace_value(nullptr);
}
} // namespace fanin
