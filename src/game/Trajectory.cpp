#include "Trajectory.h"

#include <algorithm>
#include <cmath>
#include <utility>

#include <glm/geometric.hpp>
#include <glm/gtc/constants.hpp>
#include <glm/gtc/quaternion.hpp>
#include <spdlog/spdlog.h>

namespace game {

namespace {
constexpr float kSameHeightEpsilon = 0.01f;
constexpr float kDefaultSpeed = 5.0f;

float phaseTime(float distance, float speed) {
    return distance > 0.0f ? distance / speed : 0.0f;
}
}

const char* trajectoryStateName(Trajectory::State state) {
    switch (state) {
        case Trajectory::State::Inactive: return "Inactive";
        case Trajectory::State::Initializing: return "Initializing";
        case Trajectory::State::MovingHorizontal: return "MovingHorizontal";
        case Trajectory::State::MovingVertical: return "MovingVertical";
        case Trajectory::State::Arriving: return "Arriving";
        case Trajectory::State::Complete: return "Complete";
    }
    return "Unknown";
}

Trajectory::Trajectory(float worldRadius) : radius_(worldRadius) {}

void Trajectory::startDirect(const glm::vec3& start, const glm::vec3& target, float speed, float height,
                             ArrivalFn onArrival) {
    begin(start, target, speed, height, height, std::move(onArrival));
}

void Trajectory::startTwoPhase(const glm::vec3& start, const glm::vec3& target, float speed,
                               float startHeight, float endHeight, ArrivalFn onArrival) {
    begin(start, target, speed, startHeight, endHeight, std::move(onArrival));
}

void Trajectory::begin(const glm::vec3& start, const glm::vec3& target, float speed,
                       float startHeight, float endHeight, ArrivalFn onArrival) {
    state_ = State::Initializing;
    if (speed <= 0.0f) {
        spdlog::warn("[trajectory] non-positive speed {:.2f}, using {:.1f}", speed, kDefaultSpeed);
        speed = kDefaultSpeed;
    }
    start_ = start;
    target_ = target;
    startHeight_ = startHeight;
    endHeight_ = endHeight;
    elapsed_ = 0.0f;
    onArrival_ = std::move(onArrival);

    const float horizontal = glm::distance(start, target);
    const float vertical = std::fabs(endHeight - startHeight);
    if (vertical < kSameHeightEpsilon) {
        type_ = Type::Direct;
        endHeight_ = startHeight_;
        phase1Duration_ = phaseTime(horizontal, speed);
        phase2Duration_ = 0.0f;
        state_ = State::MovingHorizontal;
    } else if (endHeight > startHeight) {
        type_ = Type::VerticalThenHorizontal;
        phase1Duration_ = phaseTime(vertical, speed);
        phase2Duration_ = phaseTime(horizontal, speed);
        state_ = State::MovingVertical;
    } else {
        type_ = Type::HorizontalThenVertical;
        phase1Duration_ = phaseTime(horizontal, speed);
        phase2Duration_ = phaseTime(vertical, speed);
        state_ = State::MovingHorizontal;
    }

    position_ = math::adjustHeight(start, startHeight_, radius_);
    rotation_ = math::surfaceOrientation(position_);
    spdlog::trace("[trajectory] start h={:.2f} v={:.2f} durations {:.2f}+{:.2f}s",
                  horizontal, vertical, phase1Duration_, phase2Duration_);
}

float Trajectory::progress() const {
    if (state_ == State::Complete) return 1.0f;
    if (state_ == State::Inactive) return 0.0f;
    const float total = totalDuration();
    return total > 0.0f ? std::clamp(elapsed_ / total, 0.0f, 1.0f) : 1.0f;
}

glm::vec3 Trajectory::horizontalAt(float t, float height) const {
    const glm::vec3 a = math::surfaceNormal(start_);
    const glm::vec3 b = math::surfaceNormal(target_);
    const float cosAngle = std::clamp(glm::dot(a, b), -1.0f, 1.0f);
    glm::vec3 dir;
    if (cosAngle > 0.9995f) {
        dir = glm::normalize(a + (b - a) * t);
    } else if (cosAngle < -0.9995f) {
        // Antipodal ends: every great circle through a joins them, rotate about any
        // axis perpendicular to a.
        glm::vec3 axis = glm::cross(a, glm::vec3(0.0f, 1.0f, 0.0f));
        if (glm::length(axis) < 1e-3f) axis = glm::cross(a, glm::vec3(1.0f, 0.0f, 0.0f));
        dir = glm::angleAxis(t * glm::pi<float>(), glm::normalize(axis)) * a;
    } else {
        const float angle = std::acos(cosAngle);
        const float s = std::sin(angle);
        dir = a * (std::sin((1.0f - t) * angle) / s) + b * (std::sin(t * angle) / s);
    }
    return math::adjustHeight(dir, height, radius_);
}

glm::vec3 Trajectory::verticalAt(const glm::vec3& base, float t, float fromHeight, float toHeight) const {
    return math::adjustHeight(base, fromHeight + (toHeight - fromHeight) * t, radius_);
}

bool Trajectory::tick(float dt) {
    if (!isActive()) return false;
    if (state_ == State::Arriving) {
        finish();
        return false;
    }
    elapsed_ += dt;

    if (elapsed_ >= totalDuration()) {
        state_ = State::Arriving;
        position_ = math::adjustHeight(target_, endHeight_, radius_);
        rotation_ = math::surfaceOrientation(position_);
        return true;
    }

    const bool inPhase1 = elapsed_ < phase1Duration_;
    const float t = inPhase1 ? (phase1Duration_ > 0.0f ? elapsed_ / phase1Duration_ : 1.0f)
                             : (phase2Duration_ > 0.0f ? (elapsed_ - phase1Duration_) / phase2Duration_ : 1.0f);
    switch (type_) {
        case Type::Direct:
            state_ = State::MovingHorizontal;
            position_ = horizontalAt(t, startHeight_);
            break;
        case Type::VerticalThenHorizontal:
            if (inPhase1) {
                state_ = State::MovingVertical;
                position_ = verticalAt(start_, t, startHeight_, endHeight_);
            } else {
                state_ = State::MovingHorizontal;
                position_ = horizontalAt(t, endHeight_);
            }
            break;
        case Type::HorizontalThenVertical:
            if (inPhase1) {
                state_ = State::MovingHorizontal;
                position_ = horizontalAt(t, startHeight_);
            } else {
                state_ = State::MovingVertical;
                position_ = verticalAt(target_, t, startHeight_, endHeight_);
            }
            break;
    }
    rotation_ = math::surfaceOrientation(position_);
    return true;
}

void Trajectory::finish() {
    state_ = State::Complete;
    spdlog::trace("[trajectory] arrived after {:.2f}s", elapsed_);
    // The callback may destroy the owner of this trajectory.
    ArrivalFn cb = std::move(onArrival_);
    onArrival_ = nullptr;
    if (cb) cb();
}

} // namespace game
