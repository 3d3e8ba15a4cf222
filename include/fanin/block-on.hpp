#pragma once
#include <cstddef>

#include "poll.hpp"
#include "wake.hpp"

#include "assert-def.hpp"

namespace fanin {
struct RootWaker : Wake {
    size_t notified = 0;

    auto wake() -> void override {
        notified += 1;
    }
};

// drives op to completion on the calling thread
// op is only polled again after it woke the root
template <Pollable Op>
auto block_on(Op op) -> PollOutput<Op> {
    auto root  = RootWaker();
    auto waker = LocalWaker(&root);
    for(auto polls = 1uz;; polls += 1) {
        root.notified = 0;
        auto result   = op.poll(waker);
        if(result.is_ready()) {
            DEBUG("block_on completed after {} polls", polls);
            return result.take();
        }
        TRACE("block_on poll={} notified={}", polls, root.notified);
        ASSERT(root.notified != 0, "root operation is pending without a pending wake after {} polls", polls);
    }
}
} // namespace fanin

#include "assert-undef.hpp"
