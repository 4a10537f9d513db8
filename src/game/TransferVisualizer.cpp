#include "TransferVisualizer.h"

#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>

#include <glm/geometric.hpp>

#include "game/Frequency.h"
#include "math/Spherical.h"

namespace game {

TransferVisualizer::TransferVisualizer(core::EventBus& bus, net::RemoteStore& store, scene::SceneGraph& scene)
    : TransferVisualizer(bus, store, scene, Config{}) {}

TransferVisualizer::TransferVisualizer(core::EventBus& bus, net::RemoteStore& store, scene::SceneGraph& scene,
                                       const Config& config)
    : bus_(bus), store_(store), scene_(scene), config_(config) {}

TransferVisualizer::~TransferVisualizer() {
    detach();
}

void TransferVisualizer::attach() {
    if (attached()) return;
    subs_.push_back(bus_.subscribe<core::TransferInsertedEvent>([this](const core::TransferInsertedEvent& e) {
        if (!isLocalTransfer(e.transfer)) return;
        startTransfer(e.transfer);
    }));
    subs_.push_back(bus_.subscribe<core::TransferUpdatedEvent>([this](const core::TransferUpdatedEvent& e) {
        if (e.newTransfer.completed && isAnimating(e.newTransfer.transferId)) {
            spdlog::debug("[transfer] #{} completed by server", e.newTransfer.transferId);
            stopTransfer(e.newTransfer.transferId);
        }
    }));
    subs_.push_back(bus_.subscribe<core::TransferDeletedEvent>([this](const core::TransferDeletedEvent& e) {
        stopTransfer(e.transfer.transferId);
    }));
}

void TransferVisualizer::detach() {
    subs_.clear();
    stopAll();
}

bool TransferVisualizer::isLocalTransfer(const net::PacketTransfer& transfer) {
    auto local = net::findLocalPlayer(store_);
    return local && local->playerId == transfer.playerId;
}

scene::NodeId TransferVisualizer::packetNode(uint64_t transferId) const {
    auto it = active_.find(transferId);
    return it == active_.end() ? scene::kInvalidNode : it->second.packet;
}

int TransferVisualizer::currentSegment(uint64_t transferId) const {
    auto it = active_.find(transferId);
    return it == active_.end() ? -1 : it->second.segment;
}

bool TransferVisualizer::startTransfer(const net::PacketTransfer& transfer, float speed) {
    if (isAnimating(transfer.transferId)) {
        spdlog::warn("[transfer] #{} already animating", transfer.transferId);
        return false;
    }
    if (transfer.routeWaypoints.size() < 2) {
        spdlog::error("[transfer] #{} has {} waypoints, need at least 2", transfer.transferId,
                      transfer.routeWaypoints.size());
        return false;
    }

    Animation anim;
    anim.transferId = transfer.transferId;
    anim.waypoints.reserve(transfer.routeWaypoints.size());
    for (const auto& wp : transfer.routeWaypoints) anim.waypoints.push_back(net::toVec3(wp));
    anim.color = transfer.composition.empty() ? glm::vec4(1.0f)
                                              : frequency::colorFor(transfer.composition.front().frequency);
    anim.speed = speed > 0.0f ? speed : config_.transferSpeed;

    auto it = active_.emplace(transfer.transferId, std::move(anim)).first;
    spawnSegment(it->second);
    ++stats_.started;
    spdlog::info("[transfer] #{} started: {} waypoints, {} packets", transfer.transferId,
                 it->second.waypoints.size(), net::totalCount(transfer.composition));
    return true;
}

void TransferVisualizer::spawnSegment(Animation& anim) {
    const glm::vec3& start = anim.waypoints[anim.segment];
    const glm::vec3& end = anim.waypoints[anim.segment + 1];
    anim.packet = scene_.createNode(scene::NodeKind::TransferPacket,
                                    fmt::format("transfer_{}_seg{}", anim.transferId, anim.segment), start);
    if (scene::Node* node = scene_.find(anim.packet)) {
        node->scale = config_.packetScale;
        node->color = anim.color;
        node->trail = true;
        node->rotation = math::lookRotation(math::safeNormalize(end - start, glm::vec3(0.0f, 0.0f, 1.0f)),
                                            math::surfaceNormal(start));
    }
    ++stats_.segments;
    spdlog::debug("[transfer] #{} segment {} ({:.1f}, {:.1f}, {:.1f}) -> ({:.1f}, {:.1f}, {:.1f})",
                  anim.transferId, anim.segment, start.x, start.y, start.z, end.x, end.y, end.z);
}

bool TransferVisualizer::onSegmentArrived(Animation& anim) {
    const int n = static_cast<int>(anim.waypoints.size());
    const int i = anim.segment;
    const glm::vec3 end = anim.waypoints[i + 1];
    scene_.destroyNode(anim.packet);
    anim.packet = scene::kInvalidNode;

    if (i > 0 && i < n - 2) {
        scene_.spawnEffect(scene::EffectKind::SpireFlash, end, config_.spireFlashColor, config_.spireFlashDuration);
        spdlog::debug("[transfer] #{} flashing spire at ({:.1f}, {:.1f}, {:.1f})", anim.transferId, end.x, end.y, end.z);
    }
    if (i == n - 2) {
        scene_.spawnEffect(scene::EffectKind::DeviceArrival, end, config_.deviceArrivalColor,
                           config_.deviceArrivalDuration);
    }

    anim.segment = i + 1;
    if (anim.segment >= n - 1) return true;
    spawnSegment(anim);
    return false;
}

void TransferVisualizer::update(float dt) {
    std::vector<uint64_t> finished;
    for (auto& kv : active_) {
        Animation& anim = kv.second;
        scene::Node* node = scene_.find(anim.packet);
        if (!node) {
            spdlog::warn("[transfer] #{} lost its packet node, stopping", anim.transferId);
            finished.push_back(anim.transferId);
            continue;
        }
        const glm::vec3& end = anim.waypoints[anim.segment + 1];
        node->position = math::moveTowards(node->position, end, anim.speed * dt);
        if (glm::distance(node->position, end) < config_.arrivalDistance) {
            if (onSegmentArrived(anim)) finished.push_back(anim.transferId);
        }
    }
    for (uint64_t id : finished) {
        auto it = active_.find(id);
        if (it == active_.end()) continue;
        if (it->second.segment >= static_cast<int>(it->second.waypoints.size()) - 1) {
            complete(id);
        } else {
            stopTransfer(id);
        }
    }
}

void TransferVisualizer::complete(uint64_t transferId) {
    active_.erase(transferId);
    ++stats_.completed;
    spdlog::info("[transfer] #{} animation complete, notifying server", transferId);
    store_.reducers().completeTransfer(transferId);
}

bool TransferVisualizer::stopTransfer(uint64_t transferId) {
    auto it = active_.find(transferId);
    if (it == active_.end()) return false;
    if (it->second.packet != scene::kInvalidNode) scene_.destroyNode(it->second.packet);
    active_.erase(it);
    ++stats_.stopped;
    spdlog::debug("[transfer] #{} stopped", transferId);
    return true;
}

void TransferVisualizer::stopAll() {
    for (const auto& kv : active_) {
        if (kv.second.packet != scene::kInvalidNode) scene_.destroyNode(kv.second.packet);
    }
    if (!active_.empty()) spdlog::debug("[transfer] stopped {} animations", active_.size());
    stats_.stopped += static_cast<uint32_t>(active_.size());
    active_.clear();
}

} // namespace game
