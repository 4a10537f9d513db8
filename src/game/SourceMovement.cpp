#include "SourceMovement.h"

#include <algorithm>

#include <glm/geometric.hpp>
#include <spdlog/spdlog.h>

#include "math/Spherical.h"

namespace game {

namespace {
constexpr uint8_t kMovingH = static_cast<uint8_t>(net::SourceState::MovingHorizontal);
constexpr uint8_t kArrivedH0 = static_cast<uint8_t>(net::SourceState::ArrivedAtSurface);
constexpr uint8_t kRising = static_cast<uint8_t>(net::SourceState::Rising);
constexpr uint8_t kStationary = static_cast<uint8_t>(net::SourceState::Stationary);
constexpr float kMinClampDistance = 0.01f;
}

float recommendedSourceAlpha(uint8_t state) {
    switch (state) {
        case kMovingH:
        case kArrivedH0:
            return 0.6f;
        case kRising:
            return 0.8f;
        default:
            return 1.0f;
    }
}

void SourceMovement::initialize(const glm::vec3& position, const glm::vec3& velocity,
                                const glm::vec3& destination, uint8_t state) {
    anchor_ = position;
    velocity_ = velocity;
    destination_ = destination;
    state_ = state;
    stateElapsed_ = 0.0f;
    position_ = position;
    rotation_ = math::surfaceOrientation(position);
    if (state > kStationary) {
        spdlog::warn("[source] unknown server state {}", state);
    }
    active_ = state < kStationary;
    spdlog::debug("[source] movement init pos=({:.1f}, {:.1f}, {:.1f}) state={}",
                  position.x, position.y, position.z, state);
}

std::optional<SourceMovement::StateChange> SourceMovement::updateFromServer(
    const glm::vec3& position, const glm::vec3& velocity, const glm::vec3& destination, uint8_t state) {
    std::optional<StateChange> change;
    if (state != state_) {
        anchor_ = position;
        stateElapsed_ = 0.0f;
        change = StateChange{state_, state};
        spdlog::debug("[source] state {} -> {} at ({:.1f}, {:.1f}, {:.1f})",
                      state_, state, position.x, position.y, position.z);
    }
    velocity_ = velocity;
    destination_ = destination;
    state_ = state;

    if (state >= kStationary && active_) {
        complete();
    } else if (state < kStationary && !active_) {
        active_ = true;
        stateElapsed_ = 0.0f;
    }
    return change;
}

glm::vec3 SourceMovement::predict(float elapsed) const {
    const float R = config_.worldRadius;
    switch (state_) {
        case kMovingH: {
            const float speed = glm::length(velocity_);
            const glm::vec3 axis = glm::cross(math::surfaceNormal(anchor_),
                                              math::safeNormalize(velocity_, glm::vec3(0.0f)));
            if (speed <= 0.0f || glm::dot(axis, axis) < 1e-12f) return anchor_;
            const float angle = (speed / R) * elapsed;
            glm::vec3 predicted = glm::angleAxis(angle, glm::normalize(axis)) * anchor_;
            const float remaining = glm::distance(anchor_, destination_);
            if (angle * R >= remaining && remaining > kMinClampDistance) {
                predicted = destination_;
            }
            return predicted;
        }
        case kArrivedH0:
            return math::constrainToSurface(destination_, R);
        case kRising: {
            const float height = std::min(kRiseSpeed * elapsed, kFinalHeight);
            return math::surfaceNormal(anchor_) * (R + height);
        }
        default:
            return position_;
    }
}

void SourceMovement::tick(float dt) {
    if (!active_ || state_ >= kStationary) return;
    stateElapsed_ += dt;
    const glm::vec3 target = predict(stateElapsed_);
    const float t = std::clamp(dt * config_.interpolationSpeed, 0.0f, 1.0f);
    position_ = glm::mix(position_, target, t);
    rotation_ = math::surfaceOrientation(position_);
}

float SourceMovement::recommendedAlpha() const {
    return recommendedSourceAlpha(state_);
}

void SourceMovement::complete() {
    active_ = false;
    position_ = math::surfaceNormal(destination_) * (config_.worldRadius + kFinalHeight);
    rotation_ = math::surfaceOrientation(position_);
    spdlog::debug("[source] movement complete at ({:.1f}, {:.1f}, {:.1f})", position_.x, position_.y, position_.z);
}

} // namespace game
