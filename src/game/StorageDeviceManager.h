#pragma once

#include <cstdint>
#include <unordered_map>
#include <vector>

#include <glm/vec4.hpp>

#include "core/EventBus.h"
#include "net/Rows.h"
#include "scene/SceneGraph.h"

// StorageDeviceManager — one node per storage device in the current world, tinted by
// how full it is and which frequency dominates its contents.
namespace game {

class StorageDeviceManager {
public:
    struct Config {
        float visualScale = 3.0f;
        glm::vec4 emptyColor{0.3f, 0.3f, 0.5f, 0.8f};
        float minEmission = 0.5f;
        float maxEmission = 3.0f;
    };

    struct Appearance {
        float fullness = 0.0f;
        glm::vec4 color{0.0f};
        float emission = 0.0f;
    };

    StorageDeviceManager(core::EventBus& bus, scene::SceneGraph& scene);
    StorageDeviceManager(core::EventBus& bus, scene::SceneGraph& scene, const Config& config);
    ~StorageDeviceManager();

    void attach();
    void detach();
    bool attached() const { return !subs_.empty(); }
    void clear();

    // stored / (capacityPerFrequency * 6), clamped to [0, 1]; 0 without capacity.
    static float fullness(const net::StorageDevice& device);
    Appearance appearanceFor(const net::StorageDevice& device) const;

    bool hasDevice(uint64_t deviceId) const { return devices_.count(deviceId) != 0; }
    std::size_t deviceCount() const { return devices_.size(); }
    scene::NodeId nodeFor(uint64_t deviceId) const;

private:
    void createVisual(const net::StorageDevice& device);
    void updateVisual(const net::StorageDevice& device);
    void removeVisual(uint64_t deviceId);
    void applyAppearance(scene::Node& node, const net::StorageDevice& device) const;

    core::EventBus& bus_;
    scene::SceneGraph& scene_;
    Config config_{};
    std::unordered_map<uint64_t, scene::NodeId> devices_;
    std::vector<core::EventBus::Subscription> subs_;
};

} // namespace game
