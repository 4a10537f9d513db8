#pragma once

#include <cstdint>
#include <functional>
#include <optional>

#include <glm/vec3.hpp>
#include <glm/gtc/quaternion.hpp>

#include "core/FrameScheduler.h"
#include "game/PlayerTracker.h"
#include "game/PlayerViews.h"
#include "scene/SceneGraph.h"

// CameraRig — orbital follow camera for the local player on a spherical world.
//
// The camera sits behind and above the character in the character's own frame
// (up = surface normal), pitched about the character's right axis. The target is
// the local player's scene node, acquired whenever the tracker reports a new local
// player; acquisition retries for a while because the node may not exist yet.
namespace game {

class CameraRig {
public:
    struct Config {
        float distance = 6.0f;
        float height = 2.5f;
        float minPitch = -60.0f;
        float maxPitch = 85.0f;

        bool occlusion = false;
        float collisionOffset = 0.2f;
        float minCollisionDistance = 1.0f;
        float worldRadius = 300.0f;

        bool smoothing = false;          // off = camera pose recomputed fresh every frame
        float positionRate = 15.0f;
        float rotationRate = 10.0f;

        double acquireInterval = 0.2;
        double acquireTimeout = 5.0;
        double trackerPollInterval = 0.5;
        double trackerTimeout = 10.0;
    };

    using TrackerLocator = std::function<PlayerTracker*()>;

    CameraRig(scene::SceneGraph& scene, PlayerViews& views, core::FrameScheduler& scheduler);
    CameraRig(scene::SceneGraph& scene, PlayerViews& views, core::FrameScheduler& scheduler, const Config& config);
    ~CameraRig();

    // Subscribes to the tracker's local-player changes. When the locator yields
    // nothing, it is polled until a tracker shows up or the wait times out.
    void attach(TrackerLocator locator);
    void detach();

    void update(float dt);

    void setPitch(float degrees);
    float pitch() const { return pitch_; }
    void snapToTarget();
    bool hasTarget() const;
    scene::NodeId currentTarget() const { return target_; }
    std::optional<uint64_t> targetPlayerId() const { return targetPlayer_; }
    void refresh();
    bool waitingForTracker() const { return trackerPoll_ != core::kInvalidTimer; }
    bool acquiring() const { return acquireTimer_ != core::kInvalidTimer; }

    // Ideal camera position for a character pose (before occlusion).
    glm::vec3 orbitalPosition(const glm::vec3& pos, const glm::vec3& forward, const glm::vec3& up) const;
    glm::vec3 resolveOcclusion(const glm::vec3& pos, const glm::vec3& ideal, const glm::vec3& up) const;

private:
    void bindTracker(PlayerTracker& tracker);
    void onLocalPlayerChanged(const TrackedPlayer& p);
    bool tryAcquire(uint64_t playerId);
    void setFollowTarget(scene::NodeId node);
    void cancelAcquire();
    glm::vec3 lookTarget(const glm::vec3& pos, const glm::vec3& up) const;

    scene::SceneGraph& scene_;
    PlayerViews& views_;
    core::FrameScheduler& scheduler_;
    Config config_{};

    PlayerTracker* tracker_ = nullptr;
    core::SlotId localSlot_ = 0;
    core::SlotId leftSlot_ = 0;
    core::TimerId trackerPoll_ = core::kInvalidTimer;
    core::TimerId acquireTimer_ = core::kInvalidTimer;

    scene::NodeId target_ = scene::kInvalidNode;
    std::optional<uint64_t> targetPlayer_;
    float pitch_ = 0.0f;
    glm::vec3 currentPosition_{0.0f};
    glm::quat currentRotation_{1.0f, 0.0f, 0.0f, 0.0f};
    bool wasMoving_ = false;
};

} // namespace game
