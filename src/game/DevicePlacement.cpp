#include "DevicePlacement.h"

#include <glm/geometric.hpp>
#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>

#include "math/Spherical.h"

namespace game {

DevicePlacement::DevicePlacement(net::RemoteStore& store, PlayerTracker& tracker)
    : DevicePlacement(store, tracker, Config{}) {}

DevicePlacement::DevicePlacement(net::RemoteStore& store, PlayerTracker& tracker, const Config& config)
    : store_(store), tracker_(tracker), config_(config) {}

glm::vec3 DevicePlacement::placementPosition(const glm::vec3& position, const glm::quat& rotation) const {
    const glm::vec3 forward = rotation * glm::vec3(0.0f, 0.0f, 1.0f);
    const glm::vec3 ahead = position + forward * config_.placementDistance;
    return math::adjustHeight(ahead, config_.surfaceClearance, config_.worldRadius);
}

bool DevicePlacement::isPositionValid(const glm::vec3& position) const {
    const auto& world = tracker_.currentWorld();
    int blocking = 0;
    for (const auto& device : store_.devices().iter()) {
        if (world && !(device.worldCoords == *world)) continue;
        const float d = glm::distance(position, net::toVec3(device.position));
        if (d <= config_.proximityCheckRadius) {
            spdlog::debug("[placement]   device '{}' at distance {:.2f}", device.deviceName, d);
            ++blocking;
        }
    }
    for (const auto& source : store_.sources().iter()) {
        if (world && !(source.worldCoords == *world)) continue;
        const float d = glm::distance(position, net::toVec3(source.position));
        if (d <= config_.proximityCheckRadius) {
            spdlog::debug("[placement]   source #{} at distance {:.2f}", source.sourceId, d);
            ++blocking;
        }
    }
    if (blocking > 0) {
        spdlog::debug("[placement] {} objects within {:.1f} units", blocking, config_.proximityCheckRadius);
    }
    return blocking == 0;
}

std::optional<std::string> DevicePlacement::placeInFrontOfLocalPlayer() {
    const TrackedPlayer* local = tracker_.localPlayer();
    if (!local) {
        spdlog::warn("[placement] no local player, ignoring placement");
        return std::nullopt;
    }
    return placeAt(placementPosition(local->position, local->rotation));
}

std::optional<std::string> DevicePlacement::placeAt(const glm::vec3& position) {
    if (!store_.isConnected()) {
        spdlog::warn("[placement] cannot place device, not connected");
        return std::nullopt;
    }
    if (!isPositionValid(position)) {
        spdlog::warn("[placement] blocked, too close to another object (min distance {:.1f})",
                     config_.proximityCheckRadius);
        return std::nullopt;
    }
    std::string name = fmt::format("{} #{}", config_.defaultDeviceName, deviceCounter_++);
    spdlog::info("[placement] requesting '{}' at ({:.2f}, {:.2f}, {:.2f})", name, position.x, position.y, position.z);
    store_.reducers().createStorageDevice(position.x, position.y, position.z, name);
    return name;
}

} // namespace game
