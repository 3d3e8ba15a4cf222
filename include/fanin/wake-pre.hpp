#pragma once
#include "atomic-guard-pre.hpp"
#include "guard-pre.hpp"

namespace fanin {
// receiver of readiness notifications
struct Wake {
    virtual auto wake() -> void = 0;

    virtual ~Wake() = default;
};

// the handle every poll receives
using LocalWaker = ValueGuard<Wake*>;
// a leaf's weak copy of the last handle it received
using WakerRef = RefGuard<Wake*>;

// thread-safe handle family, deliberately not convertible to the local one
using AtomicWaker    = AtomicValueGuard<Wake*>;
using AtomicWakerRef = AtomicRefGuard<Wake*>;

auto wake(const LocalWaker& waker) -> void;
auto wake(const WakerRef& ref) -> void;
auto wake(const AtomicWaker& waker) -> void;
auto wake(const AtomicWakerRef& ref) -> void;

struct NoopWake : Wake {
    auto wake() -> void override {}
};

template <class F>
struct FnWake : Wake {
    F fn;

    auto wake() -> void override;

    FnWake(F fn);
};
} // namespace fanin
