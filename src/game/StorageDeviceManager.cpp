#include "StorageDeviceManager.h"

#include <algorithm>

#include <glm/common.hpp>
#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>

#include "game/Frequency.h"
#include "math/Spherical.h"

namespace game {

namespace {
constexpr uint32_t kFrequencyBands = 6;
}

StorageDeviceManager::StorageDeviceManager(core::EventBus& bus, scene::SceneGraph& scene)
    : StorageDeviceManager(bus, scene, Config{}) {}

StorageDeviceManager::StorageDeviceManager(core::EventBus& bus, scene::SceneGraph& scene, const Config& config)
    : bus_(bus), scene_(scene), config_(config) {}

StorageDeviceManager::~StorageDeviceManager() {
    detach();
}

void StorageDeviceManager::attach() {
    if (attached()) return;
    subs_.push_back(bus_.subscribe<core::DeviceInsertedEvent>(
        [this](const core::DeviceInsertedEvent& e) { createVisual(e.device); }));
    subs_.push_back(bus_.subscribe<core::DeviceUpdatedEvent>(
        [this](const core::DeviceUpdatedEvent& e) { updateVisual(e.newDevice); }));
    subs_.push_back(bus_.subscribe<core::DeviceDeletedEvent>(
        [this](const core::DeviceDeletedEvent& e) { removeVisual(e.device.deviceId); }));
    subs_.push_back(bus_.subscribe<core::InitialDevicesLoadedEvent>(
        [this](const core::InitialDevicesLoadedEvent& e) {
            spdlog::info("[devices] initial load of {} devices", e.devices.size());
            for (const auto& device : e.devices) createVisual(device);
        }));
    subs_.push_back(bus_.subscribe<core::WorldTransitionStartedEvent>(
        [this](const core::WorldTransitionStartedEvent&) {
            spdlog::info("[devices] world transition, clearing {} devices", devices_.size());
            clear();
        }));
    subs_.push_back(bus_.subscribe<core::StateChangedEvent>([this](const core::StateChangedEvent& e) {
        if (e.newState != core::GameState::Disconnected) return;
        spdlog::info("[devices] disconnected, clearing {} devices", devices_.size());
        clear();
    }));
}

void StorageDeviceManager::detach() {
    subs_.clear();
}

void StorageDeviceManager::clear() {
    for (const auto& kv : devices_) scene_.destroyNode(kv.second);
    devices_.clear();
}

scene::NodeId StorageDeviceManager::nodeFor(uint64_t deviceId) const {
    auto it = devices_.find(deviceId);
    return it == devices_.end() ? scene::kInvalidNode : it->second;
}

float StorageDeviceManager::fullness(const net::StorageDevice& device) {
    const uint64_t capacity = static_cast<uint64_t>(device.capacityPerFrequency) * kFrequencyBands;
    if (capacity == 0) return 0.0f;
    const float f = static_cast<float>(net::totalCount(device.storedComposition)) / static_cast<float>(capacity);
    return std::clamp(f, 0.0f, 1.0f);
}

StorageDeviceManager::Appearance StorageDeviceManager::appearanceFor(const net::StorageDevice& device) const {
    Appearance out;
    out.fullness = fullness(device);
    auto dominant = frequency::dominantFrequency(device.storedComposition);
    const glm::vec4 dominantColor = dominant ? frequency::storageColor(*dominant) : config_.emptyColor;
    out.color = glm::mix(config_.emptyColor, dominantColor, out.fullness);
    out.emission = glm::mix(config_.minEmission, config_.maxEmission, out.fullness);
    return out;
}

void StorageDeviceManager::applyAppearance(scene::Node& node, const net::StorageDevice& device) const {
    const Appearance look = appearanceFor(device);
    node.color = look.color;
    node.emission = look.emission;
    node.label = fmt::format("{} ({}/{})", device.deviceName, net::totalCount(device.storedComposition),
                             static_cast<uint64_t>(device.capacityPerFrequency) * kFrequencyBands);
}

void StorageDeviceManager::createVisual(const net::StorageDevice& device) {
    if (devices_.count(device.deviceId)) {
        spdlog::debug("[devices] device #{} already exists, updating instead", device.deviceId);
        updateVisual(device);
        return;
    }
    const glm::vec3 position = net::toVec3(device.position);
    const scene::NodeId id = scene_.createNode(scene::NodeKind::StorageDevice,
                                               fmt::format("storage_{}_{}", device.deviceId, device.deviceName),
                                               position);
    scene::Node* node = scene_.find(id);
    node->scale = config_.visualScale;
    node->rotation = math::surfaceOrientation(position);
    applyAppearance(*node, device);
    devices_.emplace(device.deviceId, id);
    spdlog::debug("[devices] created #{} '{}' at ({:.1f}, {:.1f}, {:.1f})", device.deviceId, device.deviceName,
                  position.x, position.y, position.z);
}

void StorageDeviceManager::updateVisual(const net::StorageDevice& device) {
    auto it = devices_.find(device.deviceId);
    if (it == devices_.end()) {
        spdlog::debug("[devices] device #{} not found for update, creating", device.deviceId);
        createVisual(device);
        return;
    }
    scene::Node* node = scene_.find(it->second);
    if (!node) {
        spdlog::error("[devices] node for device #{} is gone", device.deviceId);
        devices_.erase(it);
        return;
    }
    node->position = net::toVec3(device.position);
    node->rotation = math::surfaceOrientation(node->position);
    applyAppearance(*node, device);
}

void StorageDeviceManager::removeVisual(uint64_t deviceId) {
    auto it = devices_.find(deviceId);
    if (it == devices_.end()) {
        spdlog::warn("[devices] device #{} not found for removal", deviceId);
        return;
    }
    scene_.destroyNode(it->second);
    devices_.erase(it);
    spdlog::debug("[devices] removed #{}", deviceId);
}

} // namespace game
