#pragma once
#include <utility>

#include "guard-pre.hpp"

namespace fanin {
template <class T>
auto ValueGuard<T>::set(T value) -> void {
    data = std::move(value);
}

template <class T>
auto ValueGuard<T>::get() const -> T {
    return data;
}

template <class T>
auto ValueGuard<T>::is_linked() const -> bool {
    return ref != nullptr;
}

template <class T>
auto ValueGuard<T>::replace_ref(RefGuard<T>* const new_ref) -> void {
    if(const auto old = std::exchange(ref, new_ref); old != nullptr) {
        old->value = nullptr;
    }
}

template <class T>
ValueGuard<T>::ValueGuard(ValueGuard&& o)
    : data(std::move(o.data)),
      ref(std::exchange(o.ref, nullptr)) {
    if(ref != nullptr) {
        ref->value = this;
    }
}

template <class T>
ValueGuard<T>::ValueGuard(T data)
    : data(std::move(data)) {
}

template <class T>
ValueGuard<T>::~ValueGuard() {
    replace_ref(nullptr);
}

template <class T>
auto RefGuard<T>::link(ValueGuard<T>& new_value) -> void {
    // when relinking the same pair, the first step unlinks this and the second relinks it
    new_value.replace_ref(this);
    replace_value(&new_value);
}

template <class T>
auto RefGuard<T>::unlink() -> void {
    replace_value(nullptr);
}

template <class T>
auto RefGuard<T>::read() const -> std::optional<T> {
    if(value == nullptr) {
        return std::nullopt;
    }
    return value->data;
}

template <class T>
auto RefGuard<T>::is_linked() const -> bool {
    return value != nullptr;
}

template <class T>
auto RefGuard<T>::replace_value(ValueGuard<T>* const new_value) -> void {
    if(const auto old = std::exchange(value, new_value); old != nullptr) {
        old->ref = nullptr;
    }
}

template <class T>
RefGuard<T>::RefGuard(RefGuard&& o)
    : value(std::exchange(o.value, nullptr)) {
    if(value != nullptr) {
        value->ref = this;
    }
}

template <class T>
RefGuard<T>::~RefGuard() {
    replace_value(nullptr);
}
} // namespace fanin
