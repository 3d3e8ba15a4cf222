#pragma once
#include <utility>

#include "wake-array-pre.hpp"
#include "wake.hpp"

#include "assert-def.hpp"

namespace fanin {
inline auto WakeCell::register_parent(const WakerRef& parent) -> void {
    this->parent = &parent;
}

inline auto WakeCell::take_and_clear_ready() -> bool {
    return ready.exchange(false);
}

inline auto WakeCell::is_ready() const -> bool {
    return ready.load();
}

inline auto WakeCell::wake() -> void {
    ready.store(true);
    if(parent != nullptr) {
        fanin::wake(*parent);
    }
}

inline WakeCell::WakeCell(WakeCell&& o)
    : ready(o.ready.load()),
      parent(std::exchange(o.parent, nullptr)) {
}

template <class Slots>
auto BasicWakeArray<Slots>::register_parent(LocalWaker& waker) -> void {
    parent.link(waker);
}

template <class Slots>
auto BasicWakeArray<Slots>::child_waker(const size_t index) -> LocalWaker& {
    ASSERT(index < slots.size(), "wake array index out of range index={} size={}", index, slots.size());
    return slots[index].waker;
}

template <class Slots>
auto BasicWakeArray<Slots>::take_and_clear_ready(const size_t index) -> bool {
    ASSERT(index < slots.size(), "wake array index out of range index={} size={}", index, slots.size());
    return slots[index].cell.take_and_clear_ready();
}

template <class Slots>
auto BasicWakeArray<Slots>::size() const -> size_t {
    return slots.size();
}

template <class Slots>
auto BasicWakeArray<Slots>::rebind() -> void {
    for(auto& slot : slots) {
        slot.cell.register_parent(parent);
        slot.waker.set(&slot.cell);
    }
}

template <class Slots>
BasicWakeArray<Slots>::BasicWakeArray(BasicWakeArray&& o)
    : parent(std::move(o.parent)),
      slots(std::move(o.slots)) {
    rebind();
}

template <class Slots>
BasicWakeArray<Slots>::BasicWakeArray() {
    rebind();
}

template <class Slots>
BasicWakeArray<Slots>::BasicWakeArray(const size_t count)
    : slots(count) {
    rebind();
}
} // namespace fanin

#include "assert-undef.hpp"
