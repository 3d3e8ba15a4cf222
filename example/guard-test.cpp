#include <atomic>
#include <memory>
#include <optional>
#include <thread>
#include <utility>

#include <fanin/atomic-guard.hpp>
#include <fanin/guard.hpp>
#include <fanin/wake.hpp>

#include "test.hpp"

namespace {
auto basic_test() -> void {
    auto ref = fanin::RefGuard<int>();
    ensure(!ref.read());
    {
        auto value = fanin::ValueGuard<int>(2);
        ref.link(value);
        ensure(value.get() == 2);
        ensure(ref.read() == 2);

        value.set(3);
        ensure(value.get() == 3);
        ensure(ref.read() == 3);
    }
    ensure(ref.read() == std::nullopt);
    ensure(!ref.is_linked());
}

auto ref_destroyed_test() -> void {
    auto value = fanin::ValueGuard<int>(7);
    {
        auto ref = fanin::RefGuard<int>();
        ref.link(value);
        ensure(value.is_linked());
    }
    ensure(!value.is_linked());
    ensure(value.get() == 7);
}

auto multiple_registrations_test() -> void {
    auto ref1 = fanin::RefGuard<int>();
    auto ref2 = fanin::RefGuard<int>();
    {
        auto value = fanin::ValueGuard<int>(2);
        ref1.link(value);
        ensure(ref1.read() == 2);

        value.set(3);
        ensure(ref1.read() == 3);

        // the newer registration invalidates ref1
        ref2.link(value);
        ensure(ref1.read() == std::nullopt);
        ensure(ref1.value == nullptr);
        ensure(ref2.read() == 3);

        value.set(4);
        ensure(ref2.read() == 4);
        ensure(ref1.read() == std::nullopt);
    }
    ensure(ref1.read() == std::nullopt);
    ensure(ref2.read() == std::nullopt);
}

auto switch_value_test() -> void {
    auto ref    = fanin::RefGuard<int>();
    auto value1 = fanin::ValueGuard<int>(1);
    auto value2 = fanin::ValueGuard<int>(2);
    ref.link(value1);
    ensure(ref.read() == 1);
    ref.link(value2);
    ensure(ref.read() == 2);
    ensure(!value1.is_linked());
    ensure(value2.is_linked());
}

auto relink_same_pair_test() -> void {
    auto ref   = fanin::RefGuard<int>();
    auto value = fanin::ValueGuard<int>(5);
    for(auto i = 0; i < 3; i += 1) {
        ref.link(value);
        ensure(ref.read() == 5);
        ensure(value.ref == &ref);
    }
}

auto unlink_test() -> void {
    auto ref   = fanin::RefGuard<int>();
    auto value = fanin::ValueGuard<int>(5);
    ref.link(value);
    ref.unlink();
    ensure(ref.read() == std::nullopt);
    ensure(!value.is_linked());
}

auto move_test() -> void {
    auto value = fanin::ValueGuard<int>(9);
    auto ref   = fanin::RefGuard<int>();
    ref.link(value);

    auto moved_ref = std::move(ref);
    ensure(ref.read() == std::nullopt);
    ensure(moved_ref.read() == 9);
    ensure(value.ref == &moved_ref);

    {
        auto moved_value = std::move(value);
        ensure(!value.is_linked());
        ensure(moved_ref.read() == 9);
        moved_value.set(10);
        ensure(moved_ref.read() == 10);
    }
    ensure(moved_ref.read() == std::nullopt);
}

auto atomic_basic_test() -> void {
    auto ref1 = fanin::AtomicRefGuard<int>();
    auto ref2 = fanin::AtomicRefGuard<int>();
    {
        auto value = fanin::AtomicValueGuard<int>(2);
        ref1.link(value);
        ensure(ref1.read() == 2);
        value.set(3);
        ensure(ref1.read() == 3);

        ref2.link(value);
        ensure(ref1.read() == std::nullopt);
        ensure(ref2.read() == 3);
    }
    ensure(ref1.read() == std::nullopt);
    ensure(ref2.read() == std::nullopt);
}

auto atomic_threads_test() -> void {
    constexpr auto count = 10000;

    auto ref      = fanin::AtomicRefGuard<int>();
    auto value    = fanin::AtomicValueGuard<int>(0);
    auto started  = std::atomic_bool(false);
    auto bad_read = std::atomic_bool(false);
    ref.link(value);

    auto writer = std::thread([&value, &started] {
        started.store(true);
        for(auto i = 1; i <= count; i += 1) {
            value.set(i);
        }
    });
    auto last = 0;
    while(!started.load()) {
        std::this_thread::yield();
    }
    for(auto i = 0; i < count; i += 1) {
        const auto read = ref.read();
        // values only grow and the link is never dropped while both sides live
        if(!read || *read < last) {
            bad_read.store(true);
            break;
        }
        last = *read;
    }
    writer.join();
    ensure(!bad_read.load());
    ensure(ref.read() == count);
}

auto atomic_destroy_in_thread_test() -> void {
    auto ref = fanin::AtomicRefGuard<int>();
    {
        auto value = fanin::AtomicValueGuard<int>(1);
        ref.link(value);
        auto owner = std::thread([value = std::move(value)] {});
        owner.join();
    }
    ensure(ref.read() == std::nullopt);
}

struct AtomicCountingWake : fanin::Wake {
    std::atomic_int count = 0;

    auto wake() -> void override {
        count.fetch_add(1);
    }
};

auto atomic_wake_test() -> void {
    auto target = AtomicCountingWake();
    auto ref    = fanin::AtomicWakerRef();
    fanin::wake(ref);
    {
        auto waker = fanin::AtomicWaker(&target);
        ref.link(waker);
        fanin::wake(waker);
        fanin::wake(ref);
        ensure(target.count.load() == 2);
    }
    fanin::wake(ref);
    ensure(target.count.load() == 2);
}

// a target may read atomic guards from inside its wake
auto atomic_wake_reentrant_test() -> void {
    auto seen   = fanin::AtomicRefGuard<int>();
    auto value  = fanin::AtomicValueGuard<int>(4);
    auto result = std::optional<int>();
    auto target = fanin::FnWake([&seen, &result] { result = seen.read(); });
    auto waker  = fanin::AtomicWaker(&target);
    auto ref    = fanin::AtomicWakerRef();
    seen.link(value);
    ref.link(waker);
    fanin::wake(ref);
    ensure(result == 4);
}

auto atomic_wake_concurrent_destroy_test() -> void {
    constexpr auto count = 10000;

    auto ref      = fanin::AtomicWakerRef();
    auto finished = std::atomic_bool(false);
    auto missed   = std::atomic_bool(false);

    // the waking thread keeps hitting ref while each target is unlinked and freed
    auto waking = std::thread([&ref, &finished] {
        while(!finished.load()) {
            fanin::wake(ref);
        }
    });
    for(auto i = 0; i < count; i += 1) {
        const auto target = std::make_unique<AtomicCountingWake>();
        {
            auto waker = fanin::AtomicWaker(target.get());
            ref.link(waker);
            fanin::wake(ref);
        }
        if(target->count.load() == 0) {
            missed.store(true);
        }
    }
    finished.store(true);
    waking.join();
    ensure(!missed.load());
    ensure(!ref.is_linked());
}
} // namespace

auto main() -> int {
    const auto tests = std::array{
        test(basic),
        test(ref_destroyed),
        test(multiple_registrations),
        test(switch_value),
        test(relink_same_pair),
        test(unlink),
        test(move),
        test(atomic_basic),
        test(atomic_threads),
        test(atomic_destroy_in_thread),
        test(atomic_wake),
        test(atomic_wake_reentrant),
        test(atomic_wake_concurrent_destroy),
    };
    return test::run(tests);
}
