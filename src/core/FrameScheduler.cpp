#include "FrameScheduler.h"

#include <algorithm>

namespace core {

namespace {
// Absorbs accumulated float error in now_ so a 2s timer fires on the frame that reaches 2s.
constexpr double kDueEpsilon = 1e-6;
}

TimerId FrameScheduler::after(double delaySeconds, OnceFn fn) {
    Timer t;
    t.id = ++nextId_;
    t.due = now_ + std::max(0.0, delaySeconds);
    t.eligibleFrame = frame_ + 1;
    t.once = std::move(fn);
    timers_.push_back(std::move(t));
    return nextId_;
}

TimerId FrameScheduler::every(double intervalSeconds, RepeatFn fn, bool immediate) {
    Timer t;
    t.id = ++nextId_;
    t.interval = std::max(0.0, intervalSeconds);
    t.due = immediate ? now_ : now_ + t.interval;
    t.repeating = true;
    t.eligibleFrame = frame_ + 1;
    t.repeat = std::move(fn);
    timers_.push_back(std::move(t));
    return nextId_;
}

bool FrameScheduler::cancel(TimerId id) {
    for (auto& t : timers_) {
        if (t.id == id && !t.cancelled) {
            t.cancelled = true;
            return true;
        }
    }
    return false;
}

void FrameScheduler::cancelAll() {
    for (auto& t : timers_) t.cancelled = true;
}

bool FrameScheduler::isPending(TimerId id) const {
    return std::any_of(timers_.begin(), timers_.end(),
                       [id](const Timer& t) { return t.id == id && !t.cancelled; });
}

std::size_t FrameScheduler::pendingCount() const {
    return static_cast<std::size_t>(std::count_if(timers_.begin(), timers_.end(),
                                                  [](const Timer& t) { return !t.cancelled; }));
}

void FrameScheduler::tick(double dt) {
    ++frame_;
    now_ += std::max(0.0, dt);

    // Callbacks may append to timers_; index instead of iterating.
    const std::size_t count = timers_.size();
    for (std::size_t i = 0; i < count; ++i) {
        if (timers_[i].cancelled || timers_[i].eligibleFrame > frame_ || timers_[i].due > now_ + kDueEpsilon) continue;
        if (!timers_[i].repeating) {
            timers_[i].cancelled = true;
            OnceFn fn = std::move(timers_[i].once);
            fn();
            continue;
        }
        RepeatFn fn = timers_[i].repeat;
        bool keep = fn();
        if (!keep) {
            timers_[i].cancelled = true;
        } else if (!timers_[i].cancelled) {
            timers_[i].due = now_ + timers_[i].interval;
        }
    }

    timers_.erase(std::remove_if(timers_.begin(), timers_.end(), [](const Timer& t) { return t.cancelled; }),
                  timers_.end());
}

} // namespace core
