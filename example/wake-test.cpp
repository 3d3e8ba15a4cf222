#include <utility>

#include <fanin/wake-array.hpp>
#include <fanin/wake.hpp>

#include "test.hpp"

namespace {
struct CountingWake : fanin::Wake {
    int count = 0;

    auto wake() -> void override {
        count += 1;
    }
};

auto cell_initially_ready_test() -> void {
    auto cell = fanin::WakeCell();
    ensure(cell.is_ready());
    ensure(cell.take_and_clear_ready());
    ensure(!cell.take_and_clear_ready());
    cell.wake();
    ensure(cell.take_and_clear_ready());
}

auto cell_forwarding_test() -> void {
    auto parent_cell  = fanin::WakeCell();
    auto parent_waker = fanin::LocalWaker(&parent_cell);
    auto parent_ref   = fanin::WakerRef();
    parent_ref.link(parent_waker);

    auto child = fanin::WakeCell();
    child.register_parent(parent_ref);
    (void)parent_cell.take_and_clear_ready();
    (void)child.take_and_clear_ready();

    child.wake();
    ensure(child.take_and_clear_ready());
    ensure(parent_cell.take_and_clear_ready());

    // forwarded every time, not only on a false to true transition
    auto counter       = CountingWake();
    auto counter_waker = fanin::LocalWaker(&counter);
    parent_ref.link(counter_waker);
    child.wake();
    child.wake();
    ensure(counter.count == 2);
}

auto cell_parent_gone_test() -> void {
    auto parent_ref = fanin::WakerRef();
    auto child      = fanin::WakeCell();
    child.register_parent(parent_ref);
    {
        auto counter = CountingWake();
        auto waker   = fanin::LocalWaker(&counter);
        parent_ref.link(waker);
        child.wake();
        ensure(counter.count == 1);
    }
    // parent handle destroyed, forwarding becomes a no-op
    child.wake();
    ensure(child.is_ready());
}

auto array_forwarding_test() -> void {
    auto parent_cell  = fanin::WakeCell();
    auto parent_waker = fanin::LocalWaker(&parent_cell);
    auto array        = fanin::WakeArray<3>();
    array.register_parent(parent_waker);
    (void)parent_cell.take_and_clear_ready();
    for(auto i = 0uz; i < array.size(); i += 1) {
        ensure(array.take_and_clear_ready(i));
    }

    fanin::wake(array.child_waker(1));
    ensure(!array.take_and_clear_ready(0));
    ensure(array.take_and_clear_ready(1));
    ensure(!array.take_and_clear_ready(2));
    ensure(parent_cell.take_and_clear_ready());
}

auto array_reregister_test() -> void {
    auto first        = CountingWake();
    auto second       = CountingWake();
    auto first_waker  = fanin::LocalWaker(&first);
    auto second_waker = fanin::LocalWaker(&second);
    auto array        = fanin::WakeArray<2>();

    array.register_parent(first_waker);
    fanin::wake(array.child_waker(0));
    array.register_parent(second_waker);
    fanin::wake(array.child_waker(1));
    ensure(first.count == 1);
    ensure(second.count == 1);
    ensure(!first_waker.is_linked());
}

auto array_outlived_by_leaf_test() -> void {
    auto counter = CountingWake();
    auto waker   = fanin::LocalWaker(&counter);
    auto leaf    = fanin::WakerRef();
    {
        auto array = fanin::WakeArray<1>();
        array.register_parent(waker);
        leaf.link(array.child_waker(0));
        fanin::wake(leaf);
        ensure(counter.count == 1);
    }
    ensure(!leaf.is_linked());
    ensure(!waker.is_linked());
    fanin::wake(leaf);
    ensure(counter.count == 1);
}

auto array_move_test() -> void {
    auto counter = CountingWake();
    auto waker   = fanin::LocalWaker(&counter);
    auto leaf    = fanin::WakerRef();
    auto array   = fanin::WakeArray<2>();
    array.register_parent(waker);
    leaf.link(array.child_waker(1));
    (void)array.take_and_clear_ready(0);
    (void)array.take_and_clear_ready(1);

    auto moved = std::move(array);
    ensure(waker.ref == &moved.parent);
    ensure(leaf.value == &moved.child_waker(1));
    fanin::wake(leaf);
    ensure(counter.count == 1);
    ensure(!moved.take_and_clear_ready(0));
    ensure(moved.take_and_clear_ready(1));
}

auto vector_test() -> void {
    auto counter = CountingWake();
    auto waker   = fanin::LocalWaker(&counter);
    auto vector  = fanin::WakeVector(4);
    ensure(vector.size() == 4);
    vector.register_parent(waker);
    for(auto i = 0uz; i < vector.size(); i += 1) {
        ensure(vector.take_and_clear_ready(i));
    }
    fanin::wake(vector.child_waker(3));
    ensure(vector.take_and_clear_ready(3));
    ensure(counter.count == 1);

    auto moved = std::move(vector);
    fanin::wake(moved.child_waker(0));
    ensure(moved.take_and_clear_ready(0));
    ensure(counter.count == 2);
}

auto index_out_of_range_test() -> void {
    test::death([] {
        auto array = fanin::WakeArray<2>();
        (void)array.take_and_clear_ready(2);
    });
    test::death([] {
        auto vector = fanin::WakeVector(1);
        (void)vector.child_waker(1);
    });
}

auto fn_wake_test() -> void {
    auto count = 0;
    auto fn    = fanin::FnWake([&count] { count += 1; });
    auto waker = fanin::LocalWaker(&fn);
    fanin::wake(waker);
    ensure(count == 1);

    auto noop       = fanin::NoopWake();
    auto noop_waker = fanin::LocalWaker(&noop);
    fanin::wake(noop_waker);
    // a handle pointing nowhere is ignored
    fanin::wake(fanin::LocalWaker(nullptr));
}
} // namespace

auto main() -> int {
    const auto tests = std::array{
        test(cell_initially_ready),
        test(cell_forwarding),
        test(cell_parent_gone),
        test(array_forwarding),
        test(array_reregister),
        test(array_outlived_by_leaf),
        test(array_move),
        test(vector),
        test(index_out_of_range),
        test(fn_wake),
    };
    return test::run(tests);
}
