#include "CameraRig.h"

#include <algorithm>
#include <cmath>

#include <glm/geometric.hpp>
#include <glm/trigonometric.hpp>
#include <spdlog/spdlog.h>

#include "math/Spherical.h"

namespace game {

namespace {
const glm::vec3 kUp(0.0f, 1.0f, 0.0f);
const glm::vec3 kForward(0.0f, 0.0f, 1.0f);
const glm::vec3 kRight(1.0f, 0.0f, 0.0f);

int attemptsFor(double timeout, double interval) {
    if (interval <= 0.0) return 1;
    return std::max(1, static_cast<int>(std::lround(timeout / interval)));
}
}

CameraRig::CameraRig(scene::SceneGraph& scene, PlayerViews& views, core::FrameScheduler& scheduler)
    : CameraRig(scene, views, scheduler, Config{}) {}

CameraRig::CameraRig(scene::SceneGraph& scene, PlayerViews& views, core::FrameScheduler& scheduler,
                     const Config& config)
    : scene_(scene), views_(views), scheduler_(scheduler), config_(config) {}

CameraRig::~CameraRig() {
    detach();
}

void CameraRig::attach(TrackerLocator locator) {
    if (tracker_ || waitingForTracker()) return;
    if (PlayerTracker* tracker = locator ? locator() : nullptr) {
        bindTracker(*tracker);
        return;
    }
    const int maxAttempts = attemptsFor(config_.trackerTimeout, config_.trackerPollInterval);
    spdlog::debug("[camera] player tracker not available, polling");
    trackerPoll_ = scheduler_.every(config_.trackerPollInterval,
                                    [this, locator, attempts = 0, maxAttempts]() mutable {
        ++attempts;
        if (PlayerTracker* tracker = locator ? locator() : nullptr) {
            trackerPoll_ = core::kInvalidTimer;
            spdlog::info("[camera] player tracker found after waiting");
            bindTracker(*tracker);
            return false;
        }
        if (attempts >= maxAttempts) {
            trackerPoll_ = core::kInvalidTimer;
            spdlog::error("[camera] player tracker not found after waiting {:.0f} seconds", config_.trackerTimeout);
            return false;
        }
        return true;
    });
}

void CameraRig::detach() {
    cancelAcquire();
    if (trackerPoll_ != core::kInvalidTimer) {
        scheduler_.cancel(trackerPoll_);
        trackerPoll_ = core::kInvalidTimer;
    }
    if (tracker_) {
        tracker_->localPlayerChanged.disconnect(localSlot_);
        tracker_->playerLeft.disconnect(leftSlot_);
        tracker_ = nullptr;
    }
    localSlot_ = leftSlot_ = 0;
}

void CameraRig::bindTracker(PlayerTracker& tracker) {
    tracker_ = &tracker;
    localSlot_ = tracker.localPlayerChanged.connect([this](const TrackedPlayer& p) { onLocalPlayerChanged(p); });
    leftSlot_ = tracker.playerLeft.connect([this](const TrackedPlayer& p) {
        if (targetPlayer_ && *targetPlayer_ == p.playerId()) {
            spdlog::info("[camera] target {} left, clearing", p.name());
            cancelAcquire();
            target_ = scene::kInvalidNode;
            targetPlayer_.reset();
        }
    });
    if (const TrackedPlayer* local = tracker.localPlayer()) {
        spdlog::debug("[camera] local player already present");
        onLocalPlayerChanged(*local);
    }
}

void CameraRig::onLocalPlayerChanged(const TrackedPlayer& p) {
    spdlog::info("[camera] local player changed to {} (id {})", p.name(), p.playerId());
    cancelAcquire();
    targetPlayer_ = p.playerId();
    if (tryAcquire(p.playerId())) return;

    spdlog::warn("[camera] node for {} not found immediately, retrying", p.name());
    const uint64_t playerId = p.playerId();
    const std::string name = p.name();
    const int maxAttempts = attemptsFor(config_.acquireTimeout, config_.acquireInterval);
    acquireTimer_ = scheduler_.every(config_.acquireInterval,
                                     [this, playerId, name, attempts = 0, maxAttempts]() mutable {
        ++attempts;
        if (tryAcquire(playerId)) {
            acquireTimer_ = core::kInvalidTimer;
            spdlog::info("[camera] found node for {} after {:.1f}s", name, attempts * config_.acquireInterval);
            return false;
        }
        if (attempts >= maxAttempts) {
            acquireTimer_ = core::kInvalidTimer;
            spdlog::error("[camera] failed to find node for {} after {:.0f}s", name, config_.acquireTimeout);
            return false;
        }
        return true;
    });
}

bool CameraRig::tryAcquire(uint64_t playerId) {
    const scene::NodeId node = views_.nodeFor(playerId);
    if (node == scene::kInvalidNode || !scene_.find(node)) return false;
    setFollowTarget(node);
    return true;
}

void CameraRig::cancelAcquire() {
    if (acquireTimer_ == core::kInvalidTimer) return;
    scheduler_.cancel(acquireTimer_);
    acquireTimer_ = core::kInvalidTimer;
}

void CameraRig::setFollowTarget(scene::NodeId node) {
    target_ = node;
    const scene::Node* n = scene_.find(node);
    if (!n) return;
    const glm::vec3 up = n->rotation * kUp;
    const glm::vec3 forward = n->rotation * kForward;
    currentPosition_ = n->position - forward * config_.distance + up * config_.height;
    currentRotation_ = math::lookRotation(forward, up);
    auto& cam = scene_.camera();
    cam.position = currentPosition_;
    cam.rotation = currentRotation_;
    spdlog::info("[camera] following '{}' (pitch {:.1f})", n->name, pitch_);
}

bool CameraRig::hasTarget() const {
    return target_ != scene::kInvalidNode && scene_.find(target_) != nullptr;
}

void CameraRig::refresh() {
    if (!hasTarget()) return;
    setFollowTarget(target_);
    spdlog::debug("[camera] refreshed");
}

void CameraRig::setPitch(float degrees) {
    const float old = pitch_;
    pitch_ = std::clamp(degrees, config_.minPitch, config_.maxPitch);
    if (std::fabs(old - pitch_) > 0.1f) {
        spdlog::trace("[camera] pitch {:.1f} -> {:.1f}", old, pitch_);
    }
}

glm::vec3 CameraRig::orbitalPosition(const glm::vec3& pos, const glm::vec3& forward, const glm::vec3& up) const {
    const glm::vec3 right = math::safeNormalize(glm::cross(up, forward), kRight);
    glm::vec3 offset = -forward * config_.distance + up * config_.height;
    if (std::fabs(pitch_) > 0.01f) {
        offset = glm::angleAxis(glm::radians(pitch_), right) * offset;
    }
    return pos + offset;
}

glm::vec3 CameraRig::resolveOcclusion(const glm::vec3& pos, const glm::vec3& ideal, const glm::vec3& up) const {
    const glm::vec3 direction = ideal - pos;
    const float distance = glm::length(direction);
    if (distance <= 0.01f) return ideal;
    const glm::vec3 dir = direction / distance;
    const glm::vec3 rayStart = pos + up * 0.5f;
    float hit = 0.0f;
    if (!math::raycastSphere(rayStart, dir, distance, config_.worldRadius, hit)) return ideal;
    const float adjusted = std::max(hit - config_.collisionOffset, config_.minCollisionDistance);
    return rayStart + dir * adjusted;
}

glm::vec3 CameraRig::lookTarget(const glm::vec3& pos, const glm::vec3& up) const {
    return pos + up * config_.height * 0.3f;
}

void CameraRig::snapToTarget() {
    const scene::Node* n = scene_.find(target_);
    if (!n) return;
    const glm::vec3 up = n->rotation * kUp;
    const glm::vec3 forward = n->rotation * kForward;
    currentPosition_ = orbitalPosition(n->position, forward, up);
    const glm::vec3 look = math::safeNormalize(lookTarget(n->position, up) - currentPosition_, forward);
    currentRotation_ = math::lookRotation(look, up);
    auto& cam = scene_.camera();
    cam.position = currentPosition_;
    cam.rotation = currentRotation_;
}

void CameraRig::update(float dt) {
    if (target_ == scene::kInvalidNode) return;
    const scene::Node* n = scene_.find(target_);
    if (!n) {
        spdlog::warn("[camera] target node #{} is gone", target_);
        target_ = scene::kInvalidNode;
        return;
    }
    const glm::vec3 pos = n->position;
    const glm::vec3 up = n->rotation * kUp;
    const glm::vec3 forward = n->rotation * kForward;

    glm::vec3 ideal = orbitalPosition(pos, forward, up);
    if (config_.occlusion) ideal = resolveOcclusion(pos, ideal, up);

    bool snap = false;
    const bool moving = targetPlayer_ && views_.isMoving(*targetPlayer_);
    if (moving != wasMoving_) {
        spdlog::trace("[camera] target {} moving, resetting smoothing", moving ? "started" : "stopped");
        currentPosition_ = ideal;
        wasMoving_ = moving;
        snap = true;
    }

    if (!config_.smoothing) {
        currentPosition_ = ideal;
    } else {
        // Horizontal components ease; height follows the ideal exactly.
        const float a = math::expSmoothing(config_.positionRate, dt);
        currentPosition_.x = currentPosition_.x + (ideal.x - currentPosition_.x) * a;
        currentPosition_.z = currentPosition_.z + (ideal.z - currentPosition_.z) * a;
        currentPosition_.y = ideal.y;
    }

    const glm::vec3 look = math::safeNormalize(lookTarget(pos, up) - currentPosition_, forward);
    const glm::quat targetRotation = math::lookRotation(look, up);
    if (config_.smoothing && !snap) {
        currentRotation_ = glm::slerp(currentRotation_, targetRotation, math::expSmoothing(config_.rotationRate, dt));
    } else {
        currentRotation_ = targetRotation;
    }

    auto& cam = scene_.camera();
    cam.position = currentPosition_;
    cam.rotation = currentRotation_;
}

} // namespace game
