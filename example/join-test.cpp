#include <string>
#include <tuple>
#include <type_traits>
#include <utility>
#include <vector>

#include <fanin/block-on.hpp>
#include <fanin/event.hpp>
#include <fanin/join.hpp>
#include <fanin/poll-fn.hpp>
#include <fanin/race.hpp>
#include <fanin/ready.hpp>

#include "test.hpp"

namespace {
// wakes itself on every poll and completes with n on the n-th poll
auto counter(int& polls, const int n) {
    return fanin::poll_fn([&polls, n](fanin::LocalWaker& waker) -> fanin::Poll<int> {
        fanin::wake(waker);
        polls += 1;
        if(polls == n) {
            return polls;
        }
        return fanin::pending;
    });
}

auto counters_test() -> void {
    auto root  = fanin::RootWaker();
    auto waker = fanin::LocalWaker(&root);
    auto x1    = 0;
    auto x2    = 0;
    auto join  = fanin::join(counter(x1, 4), counter(x2, 5));
    for(auto i = 0; i < 4; i += 1) {
        root.notified = 0;
        ensure(join.poll(waker) == fanin::pending);
        ensure(root.notified != 0);
    }
    ensure(join.poll(waker) == std::tuple(4, 5));
    ensure(x1 == 4);
    ensure(x2 == 5);
}

auto block_on_test() -> void {
    auto x1 = 0;
    auto x2 = 0;
    ensure(fanin::block_on(fanin::join(counter(x1, 4), counter(x2, 5))) == std::tuple(4, 5));
}

// waiters keep the address of their event
static_assert(!std::is_move_constructible_v<fanin::Event>);
static_assert(!std::is_move_assignable_v<fanin::Event>);

auto declaration_order_test() -> void {
    auto root   = fanin::RootWaker();
    auto waker  = fanin::LocalWaker(&root);
    auto events = std::array<fanin::Event, 3>();
    auto order  = std::vector<int>();
    auto leaf   = [&order](fanin::Event& event, const int id) {
        return fanin::poll_fn([&order, waiter = event.wait(), id](fanin::LocalWaker& waker) mutable -> fanin::Poll<int> {
            if(waiter.poll(waker).is_pending()) {
                return fanin::pending;
            }
            order.push_back(id);
            return id;
        });
    };
    auto join = fanin::join(leaf(events[0], 0), leaf(events[1], 1), leaf(events[2], 2));
    ensure(join.poll(waker).is_pending());

    // complete in reverse order
    for(auto i = 2; i >= 1; i -= 1) {
        root.notified = 0;
        events[i].notify();
        ensure(root.notified == 1);
        ensure(join.poll(waker).is_pending());
    }
    events[0].notify();
    ensure(join.poll(waker) == std::tuple(0, 1, 2));
    ensure((order == std::vector{2, 1, 0}));
}

auto polls_only_woken_test() -> void {
    auto root   = fanin::RootWaker();
    auto waker  = fanin::LocalWaker(&root);
    auto event  = fanin::Event();
    auto calls  = std::array{0, 0};
    auto silent = fanin::poll_fn([&calls](fanin::LocalWaker&) -> fanin::Poll<int> {
        calls[0] += 1;
        return fanin::pending;
    });
    auto woken = fanin::poll_fn([&calls, waiter = event.wait()](fanin::LocalWaker& waker) mutable -> fanin::Poll<int> {
        calls[1] += 1;
        if(waiter.poll(waker).is_pending()) {
            return fanin::pending;
        }
        return 1;
    });
    auto join = fanin::join(std::move(silent), std::move(woken));
    ensure(join.poll(waker).is_pending());
    ensure(calls == (std::array{1, 1}));

    // nothing woke, nothing is polled
    ensure(join.poll(waker).is_pending());
    ensure(calls == (std::array{1, 1}));

    event.notify();
    ensure(join.poll(waker).is_pending());
    ensure(calls == (std::array{1, 2}));
    ensure(std::get<1>(join.children).is_done());
}

auto ready_children_test() -> void {
    auto noop  = fanin::NoopWake();
    auto waker = fanin::LocalWaker(&noop);
    auto join  = fanin::join(fanin::ready(1), fanin::ready(std::string("two")), fanin::ready(3.0));
    ensure(join.poll(waker) == std::tuple(1, std::string("two"), 3.0));
}

auto nested_test() -> void {
    auto root  = fanin::RootWaker();
    auto waker = fanin::LocalWaker(&root);
    auto event = fanin::Event();
    auto join  = fanin::join(fanin::race(event.wait(), fanin::never<fanin::Unit>()), fanin::ready(3));
    ensure(join.poll(waker).is_pending());
    ensure(root.notified == 0);

    // the leaf wake travels through the race and the join up to the root
    event.notify();
    ensure(root.notified == 1);
    auto result = join.poll(waker);
    ensure(result.is_ready());
    const auto [first, second] = result.take();
    ensure(first.index() == 0);
    ensure(second == 3);
}

auto nested_join_test() -> void {
    auto x1 = 0;
    auto x2 = 0;
    auto x3 = 0;
    const auto result = fanin::block_on(fanin::join(fanin::join(counter(x1, 2), counter(x2, 3)), counter(x3, 1)));
    ensure(result == std::tuple(std::tuple(2, 3), 1));
}

auto drop_test() -> void {
    auto root  = fanin::RootWaker();
    auto waker = fanin::LocalWaker(&root);
    auto event = fanin::Event();
    {
        auto join = fanin::join(event.wait(), fanin::never<int>());
        ensure(join.poll(waker).is_pending());
        ensure(event.waker.is_linked());
        ensure(waker.is_linked());
    }
    ensure(!event.waker.is_linked());
    ensure(!waker.is_linked());
    event.notify();
    ensure(root.notified == 0);
}

auto move_test() -> void {
    auto root  = fanin::RootWaker();
    auto waker = fanin::LocalWaker(&root);
    auto event = fanin::Event();
    auto join  = fanin::join(event.wait(), fanin::ready(5));
    ensure(join.poll(waker).is_pending());

    auto moved = std::move(join);
    event.notify();
    ensure(root.notified == 1);
    ensure(moved.poll(waker) == std::tuple(fanin::Unit(), 5));
}

auto vec_test() -> void {
    auto polls = std::vector<int>(4);
    auto ops   = std::vector<decltype(counter(polls[0], 1))>();
    for(auto i = 0; i < 4; i += 1) {
        ops.push_back(counter(polls[i], 4 - i));
    }
    ensure(fanin::block_on(fanin::join_vec(std::move(ops))) == (std::vector{4, 3, 2, 1}));
}

auto vec_empty_test() -> void {
    auto noop  = fanin::NoopWake();
    auto waker = fanin::LocalWaker(&noop);
    auto join  = fanin::join_vec(std::vector<fanin::Ready<int>>());
    auto poll  = join.poll(waker);
    ensure(poll.is_ready());
    ensure(poll.take().empty());
}

auto repoll_test() -> void {
    test::death([] {
        auto noop  = fanin::NoopWake();
        auto waker = fanin::LocalWaker(&noop);
        auto join  = fanin::join(fanin::ready(1), fanin::ready(2));
        (void)join.poll(waker);
        (void)join.poll(waker);
    });
    test::death([] {
        auto noop  = fanin::NoopWake();
        auto waker = fanin::LocalWaker(&noop);
        auto ops   = std::vector<fanin::Ready<int>>();
        ops.push_back(fanin::ready(1));
        auto join = fanin::join_vec(std::move(ops));
        (void)join.poll(waker);
        (void)join.poll(waker);
    });
}

auto stalled_root_test() -> void {
    test::death([] {
        (void)fanin::block_on(fanin::join(fanin::ready(1), fanin::never<int>()));
    });
}

// a wake for a slot already visited in the current poll is served by the next poll
auto deferred_wake_test() -> void {
    auto root  = fanin::RootWaker();
    auto waker = fanin::LocalWaker(&root);
    auto first = fanin::WakerRef();
    auto polls = std::array{0, 0};
    auto late  = fanin::poll_fn([&polls, &first](fanin::LocalWaker& waker) -> fanin::Poll<int> {
        polls[0] += 1;
        first.link(waker);
        return fanin::pending;
    });
    auto waking = fanin::poll_fn([&polls, &first](fanin::LocalWaker&) -> fanin::Poll<int> {
        polls[1] += 1;
        fanin::wake(first);
        return fanin::pending;
    });
    auto join = fanin::join(std::move(late), std::move(waking));
    ensure(join.poll(waker).is_pending());
    ensure(polls == (std::array{1, 1}));
    ensure(join.wakers.slots[0].cell.is_ready());
    ensure(root.notified == 1);

    ensure(join.poll(waker).is_pending());
    ensure(polls == (std::array{2, 1}));
}
} // namespace

auto main() -> int {
    const auto tests = std::array{
        test(counters),
        test(block_on),
        test(declaration_order),
        test(polls_only_woken),
        test(ready_children),
        test(nested),
        test(nested_join),
        test(drop),
        test(move),
        test(vec),
        test(vec_empty),
        test(repoll),
        test(stalled_root),
        test(deferred_wake),
    };
    return test::run(tests);
}
