#pragma once

#include <optional>
#include <string>

#include <glm/vec3.hpp>
#include <glm/gtc/quaternion.hpp>

#include "game/PlayerTracker.h"
#include "net/RemoteStore.h"

// DevicePlacement — drops a storage device a few units in front of the local
// player, on the sphere, unless something already sits there.
namespace game {

class DevicePlacement {
public:
    struct Config {
        float placementDistance = 5.0f;
        float proximityCheckRadius = 1.0f;
        float surfaceClearance = 1.0f;
        float worldRadius = 300.0f;
        std::string defaultDeviceName = "Storage Device";
    };

    DevicePlacement(net::RemoteStore& store, PlayerTracker& tracker);
    DevicePlacement(net::RemoteStore& store, PlayerTracker& tracker, const Config& config);

    // Point `placementDistance` along the pose's forward, lifted onto the sphere.
    glm::vec3 placementPosition(const glm::vec3& position, const glm::quat& rotation) const;
    // False when a device or source of the current world lies within the check radius.
    bool isPositionValid(const glm::vec3& position) const;

    // Requests a device in front of the local player. Returns the name it was
    // requested under, or nullopt when placement was refused.
    std::optional<std::string> placeInFrontOfLocalPlayer();
    std::optional<std::string> placeAt(const glm::vec3& position);

    int nextDeviceNumber() const { return deviceCounter_; }

private:
    net::RemoteStore& store_;
    PlayerTracker& tracker_;
    Config config_{};
    int deviceCounter_ = 1;
};

} // namespace game
