#include <optional>
#include <string>

#include <fanin/maybe-done.hpp>
#include <fanin/poll-fn.hpp>
#include <fanin/wake.hpp>

#include "test.hpp"

namespace {
auto active_test() -> void {
    auto noop  = fanin::NoopWake();
    auto waker = fanin::LocalWaker(&noop);
    auto calls = 0;
    auto done  = fanin::maybe_done(fanin::poll_fn([&calls](fanin::LocalWaker&) -> fanin::Poll<int> {
        calls += 1;
        if(calls < 2) {
            return fanin::pending;
        }
        return 42;
    }));
    ensure(!done.is_terminated());
    ensure(done.take_output() == std::nullopt);
    ensure(done.poll(waker).is_pending());
    ensure(!done.is_done());
    ensure(done.poll(waker).is_ready());
    ensure(done.is_done());
    ensure(calls == 2);
}

auto idempotent_test() -> void {
    auto noop  = fanin::NoopWake();
    auto waker = fanin::LocalWaker(&noop);
    auto calls = 0;
    auto done  = fanin::maybe_done(fanin::poll_fn([&calls](fanin::LocalWaker&) -> fanin::Poll<std::string> {
        calls += 1;
        return std::string("done");
    }));
    for(auto i = 0; i < 5; i += 1) {
        ensure(done.poll(waker) == fanin::Poll<fanin::Unit>(fanin::Unit()));
    }
    ensure(calls == 1);
    ensure(done.take_output() == "done");
    ensure(done.is_terminated());
    ensure(!done.is_done());
    ensure(done.take_output() == std::nullopt);
    ensure(calls == 1);
}

auto poll_after_take_test() -> void {
    test::death([] {
        auto noop  = fanin::NoopWake();
        auto waker = fanin::LocalWaker(&noop);
        auto done  = fanin::maybe_done(fanin::poll_fn([](fanin::LocalWaker&) -> fanin::Poll<int> { return 1; }));
        (void)done.poll(waker);
        (void)done.take_output();
        (void)done.poll(waker);
    });
}
} // namespace

auto main() -> int {
    const auto tests = std::array{
        test(active),
        test(idempotent),
        test(poll_after_take),
    };
    return test::run(tests);
}
