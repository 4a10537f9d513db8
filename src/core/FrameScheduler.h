#pragma once

#include <cstdint>
#include <functional>
#include <vector>

// FrameScheduler — frame-driven timers standing in for the engine's coroutines.
//
// Everything runs on the frame thread inside tick(). A timer created while a tick is
// in progress first becomes eligible on the following tick. cancel() is safe from
// inside a timer callback, including on the timer itself.
namespace core {

using TimerId = uint64_t;
constexpr TimerId kInvalidTimer = 0;

class FrameScheduler {
public:
    // Returning false from a repeating callback stops it.
    using RepeatFn = std::function<bool()>;
    using OnceFn = std::function<void()>;

    TimerId after(double delaySeconds, OnceFn fn);
    // First invocation after `intervalSeconds`; set `immediate` to also run on the next tick.
    TimerId every(double intervalSeconds, RepeatFn fn, bool immediate = false);
    bool cancel(TimerId id);
    void cancelAll();

    void tick(double dt);

    double now() const { return now_; }
    uint64_t frame() const { return frame_; }
    bool isPending(TimerId id) const;
    std::size_t pendingCount() const;

private:
    struct Timer {
        TimerId id = kInvalidTimer;
        double due = 0.0;
        double interval = 0.0;
        bool repeating = false;
        bool cancelled = false;
        uint64_t eligibleFrame = 0;
        OnceFn once;
        RepeatFn repeat;
    };

    std::vector<Timer> timers_;
    double now_ = 0.0;
    uint64_t frame_ = 0;
    TimerId nextId_ = kInvalidTimer;
};

} // namespace core
