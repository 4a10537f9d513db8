#pragma once

#include <algorithm>
#include <cstdint>
#include <functional>
#include <utility>
#include <vector>

// Signal — multicast callback list for in-process notifications between game modules.
// Slots may disconnect themselves (or others) while the signal is being emitted.
namespace core {

using SlotId = uint64_t;

template <typename... Args>
class Signal {
public:
    using Fn = std::function<void(const Args&...)>;

    SlotId connect(Fn fn) {
        slots_.push_back({++nextId_, std::move(fn)});
        return nextId_;
    }

    bool disconnect(SlotId id) {
        auto it = std::remove_if(slots_.begin(), slots_.end(), [id](const Slot& s) { return s.id == id; });
        bool removed = it != slots_.end();
        slots_.erase(it, slots_.end());
        return removed;
    }

    void disconnectAll() { slots_.clear(); }

    void emit(const Args&... args) const {
        const auto snapshot = slots_;
        for (const auto& slot : snapshot) {
            if (!connected(slot.id)) continue;
            slot.fn(args...);
        }
    }

    bool connected(SlotId id) const {
        return std::any_of(slots_.begin(), slots_.end(), [id](const Slot& s) { return s.id == id; });
    }
    std::size_t size() const { return slots_.size(); }

private:
    struct Slot {
        SlotId id = 0;
        Fn fn;
    };
    std::vector<Slot> slots_;
    SlotId nextId_ = 0;
};

} // namespace core
