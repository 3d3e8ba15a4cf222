#pragma once
#include <mutex>
#include <utility>

#include "atomic-guard.hpp"
#include "guard.hpp"
#include "wake-pre.hpp"

namespace fanin {
inline auto wake(const LocalWaker& waker) -> void {
    if(const auto target = waker.get(); target != nullptr) {
        target->wake();
    }
}

inline auto wake(const WakerRef& ref) -> void {
    if(const auto target = ref.read(); target && *target != nullptr) {
        (*target)->wake();
    }
}

// the target runs under the guard mutex, so it cannot be unlinked and destroyed meanwhile
inline auto wake(const AtomicWaker& waker) -> void {
    const auto lock = std::scoped_lock(impl::guard_mutex());
    if(waker.data != nullptr) {
        waker.data->wake();
    }
}

inline auto wake(const AtomicWakerRef& ref) -> void {
    const auto lock = std::scoped_lock(impl::guard_mutex());
    if(ref.value != nullptr && ref.value->data != nullptr) {
        ref.value->data->wake();
    }
}

template <class F>
auto FnWake<F>::wake() -> void {
    fn();
}

template <class F>
FnWake<F>::FnWake(F fn)
    : fn(std::move(fn)) {
}
} // namespace fanin
