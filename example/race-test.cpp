#include <string>
#include <utility>
#include <variant>
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

auto silent(int& polls) {
    return fanin::poll_fn([&polls](fanin::LocalWaker&) -> fanin::Poll<int> {
        polls += 1;
        return fanin::pending;
    });
}

auto scenario_test() -> void {
    auto noop         = fanin::NoopWake();
    auto waker        = fanin::LocalWaker(&noop);
    auto polls        = 0;
    auto silent_polls = 0;
    auto race         = fanin::race(silent(silent_polls), counter(polls, 2));
    ensure(race.poll(waker) == fanin::pending);
    const auto result = race.poll(waker);
    ensure(result.is_ready());
    ensure(result.value->index() == 1);
    ensure(std::get<1>(*result.value) == 2);
    // never woke, so polled only once
    ensure(silent_polls == 1);
}

auto counters_test() -> void {
    auto noop  = fanin::NoopWake();
    auto waker = fanin::LocalWaker(&noop);
    auto x1    = 0;
    auto x2    = 0;
    auto race  = fanin::race(counter(x1, 4), counter(x2, 2));
    ensure(race.poll(waker) == fanin::pending);
    ensure(race.poll(waker) == (std::variant<int, int>(std::in_place_index<1>, 2)));
    ensure(x1 == 2);
}

auto never_wake_test() -> void {
    auto noop  = fanin::NoopWake();
    auto waker = fanin::LocalWaker(&noop);
    auto race  = fanin::race(fanin::never<int>(), fanin::never<int>());
    for(auto i = 0; i < 10; i += 1) {
        ensure(race.poll(waker) == fanin::pending);
    }
}

auto tie_break_test() -> void {
    auto noop  = fanin::NoopWake();
    auto waker = fanin::LocalWaker(&noop);
    auto race  = fanin::race(fanin::ready(1), fanin::ready(2));
    ensure(race.poll(waker) == (std::variant<int, int>(std::in_place_index<0>, 1)));

    // both become ready within one poll, the lower index wins
    auto root       = fanin::RootWaker();
    auto root_waker = fanin::LocalWaker(&root);
    auto first      = fanin::Event();
    auto second     = fanin::Event();
    auto later      = fanin::race(fanin::never<std::string>(), first.wait(), second.wait());
    ensure(later.poll(root_waker).is_pending());
    second.notify();
    first.notify();
    ensure(root.notified == 2);
    const auto result = later.poll(root_waker);
    ensure(result.is_ready());
    ensure(result.value->index() == 1);
}

auto losers_untouched_test() -> void {
    auto       noop   = fanin::NoopWake();
    auto       waker  = fanin::LocalWaker(&noop);
    auto       polls  = 0;
    auto       race   = fanin::race(fanin::ready(std::string("winner")), silent(polls));
    const auto result = race.poll(waker);
    ensure(result == (std::variant<std::string, int>(std::in_place_index<0>, "winner")));
    ensure(polls == 0);
}

auto timeout_test() -> void {
    // a deadline is just another raced operation
    auto root     = fanin::RootWaker();
    auto waker    = fanin::LocalWaker(&root);
    auto deadline = fanin::Event();
    auto x1       = 0;
    auto race     = fanin::race(fanin::join(counter(x1, 100), fanin::ready(0)), deadline.wait());
    for(auto i = 0; i < 3; i += 1) {
        ensure(race.poll(waker).is_pending());
    }
    deadline.notify();
    const auto result = race.poll(waker);
    ensure(result.is_ready());
    ensure(result.value->index() == 1);
    ensure(x1 == 4);
}

auto drop_test() -> void {
    auto root  = fanin::RootWaker();
    auto waker = fanin::LocalWaker(&root);
    auto event = fanin::Event();
    {
        auto race = fanin::race(event.wait(), fanin::never<int>());
        ensure(race.poll(waker).is_pending());
    }
    event.notify();
    ensure(root.notified == 0);
    ensure(!waker.is_linked());
}

auto vec_test() -> void {
    auto polls = std::vector<int>(3);
    auto ops   = std::vector<decltype(counter(polls[0], 1))>();
    ops.push_back(counter(polls[0], 5));
    ops.push_back(counter(polls[1], 2));
    ops.push_back(counter(polls[2], 2));
    const auto result = fanin::block_on(fanin::race_vec(std::move(ops)));
    ensure((result == fanin::RaceResult<int>{1, 2}));
    ensure(polls[0] == 2);
    // slot 1 won before slot 2 was polled the second time
    ensure(polls[2] == 1);
}

auto repoll_test() -> void {
    test::death([] {
        auto noop  = fanin::NoopWake();
        auto waker = fanin::LocalWaker(&noop);
        auto race  = fanin::race(fanin::ready(1), fanin::never<int>());
        (void)race.poll(waker);
        (void)race.poll(waker);
    });
    test::death([] {
        auto noop  = fanin::NoopWake();
        auto waker = fanin::LocalWaker(&noop);
        auto ops   = std::vector<fanin::Ready<int>>();
        ops.push_back(fanin::ready(1));
        auto race = fanin::race_vec(std::move(ops));
        (void)race.poll(waker);
        (void)race.poll(waker);
    });
}

auto vec_empty_test() -> void {
    test::death([] {
        (void)fanin::race_vec(std::vector<fanin::Ready<int>>());
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
    auto race = fanin::race(std::move(late), std::move(waking));
    ensure(race.poll(waker).is_pending());
    ensure(polls == (std::array{1, 1}));
    ensure(race.wakers.slots[0].cell.is_ready());
    ensure(root.notified == 1);

    ensure(race.poll(waker).is_pending());
    ensure(polls == (std::array{2, 1}));
}
} // namespace

auto main() -> int {
    const auto tests = std::array{
        test(scenario),
        test(counters),
        test(never_wake),
        test(tie_break),
        test(losers_untouched),
        test(timeout),
        test(drop),
        test(vec),
        test(repoll),
        test(vec_empty),
        test(deferred_wake),
    };
    return test::run(tests);
}
