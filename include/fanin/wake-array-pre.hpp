#pragma once
#include <array>
#include <atomic>
#include <cstddef>
#include <vector>

#include "wake-pre.hpp"

namespace fanin {
// readiness bookkeeping for one child of a combinator
// only the flag is atomic, the parent link belongs to the polling thread
struct WakeCell : Wake {
    std::atomic_bool ready  = true; // the first poll is never skipped
    const WakerRef*  parent = nullptr;

    auto register_parent(const WakerRef& parent) -> void;
    auto take_and_clear_ready() -> bool;
    auto is_ready() const -> bool;

    // always forwarded, even if already ready
    auto wake() -> void override;

    WakeCell() = default;
    WakeCell(WakeCell&& o);
};

struct WakeSlot {
    WakeCell   cell;
    LocalWaker waker; // handed to the child, always points to cell
};

// fan-in bank of wake cells sharing one parent registration
template <class Slots>
struct BasicWakeArray {
    WakerRef parent;
    Slots    slots;

    auto register_parent(LocalWaker& waker) -> void;
    auto child_waker(size_t index) -> LocalWaker&;
    auto take_and_clear_ready(size_t index) -> bool;
    auto size() const -> size_t;

    // private
    auto rebind() -> void;

    auto operator=(const BasicWakeArray&) -> BasicWakeArray& = delete;
    auto operator=(BasicWakeArray&&) -> BasicWakeArray&      = delete;

    BasicWakeArray(const BasicWakeArray&) = delete;
    BasicWakeArray(BasicWakeArray&& o);
    BasicWakeArray();
    explicit BasicWakeArray(size_t count);
};

template <size_t N>
using WakeArray = BasicWakeArray<std::array<WakeSlot, N>>;

using WakeVector = BasicWakeArray<std::vector<WakeSlot>>;
} // namespace fanin
