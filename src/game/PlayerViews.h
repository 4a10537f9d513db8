#pragma once

#include <cstdint>
#include <string>
#include <unordered_map>

#include <glm/vec3.hpp>
#include <glm/gtc/quaternion.hpp>

#include "game/PlayerTracker.h"
#include "scene/SceneGraph.h"

// PlayerViews — scene nodes for the players the tracker reports. Remote players ease
// toward their last server pose; the local player is placed exactly.
namespace game {

class PlayerViews {
public:
    struct Config {
        float remoteSmoothing = 10.0f;    // blend factor per second
        float movingEpsilon = 0.001f;     // per-frame displacement that counts as moving
    };

    PlayerViews(PlayerTracker& tracker, scene::SceneGraph& scene);
    PlayerViews(PlayerTracker& tracker, scene::SceneGraph& scene, const Config& config);
    ~PlayerViews();

    void attach();
    void detach();
    void update(float dt);

    bool setStatus(uint64_t playerId, const std::string& text);
    bool clearStatus(uint64_t playerId);
    std::string status(uint64_t playerId) const;

    bool hasView(uint64_t playerId) const { return views_.count(playerId) != 0; }
    std::size_t viewCount() const { return views_.size(); }
    scene::NodeId nodeFor(uint64_t playerId) const;
    bool isMoving(uint64_t playerId) const;

private:
    struct View {
        scene::NodeId node = scene::kInvalidNode;
        bool isLocal = false;
        glm::vec3 target{0.0f};
        glm::quat targetRotation{1.0f, 0.0f, 0.0f, 0.0f};
        bool moving = false;
    };

    void onJoined(const TrackedPlayer& p);
    void onLeft(const TrackedPlayer& p);
    void onUpdated(const TrackedPlayer& p);

    PlayerTracker& tracker_;
    scene::SceneGraph& scene_;
    Config config_{};
    std::unordered_map<uint64_t, View> views_;
    core::SlotId joinedSlot_ = 0;
    core::SlotId leftSlot_ = 0;
    core::SlotId updatedSlot_ = 0;
};

} // namespace game
