#include "TransferBatcher.h"

#include <algorithm>
#include <cmath>

#include <glm/geometric.hpp>
#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>

#include "game/Frequency.h"
#include "math/Spherical.h"

namespace game {

using net::TransferLegType;

bool BatchKey::matches(const BatchKey& other, float distanceTolerance, double timeTolerance) const {
    return glm::distance(start, other.start) < distanceTolerance &&
           glm::distance(end, other.end) < distanceTolerance &&
           std::fabs(departureTime - other.departureTime) < timeTolerance;
}

TransferBatcher::TransferBatcher(core::EventBus& bus, net::RemoteStore& store, core::FrameScheduler& scheduler,
                                 scene::SceneGraph& scene)
    : TransferBatcher(bus, store, scheduler, scene, Config{}) {}

TransferBatcher::TransferBatcher(core::EventBus& bus, net::RemoteStore& store, core::FrameScheduler& scheduler,
                                 scene::SceneGraph& scene, const Config& config)
    : bus_(bus), store_(store), scheduler_(scheduler), scene_(scene), config_(config) {}

TransferBatcher::~TransferBatcher() {
    detach();
}

void TransferBatcher::attach() {
    if (attached()) return;
    subs_.push_back(bus_.subscribe<core::TransferInsertedEvent>(
        [this](const core::TransferInsertedEvent& e) { onTransferChanged(e.transfer); }));
    subs_.push_back(bus_.subscribe<core::TransferUpdatedEvent>(
        [this](const core::TransferUpdatedEvent& e) { onTransferChanged(e.newTransfer); }));
    subs_.push_back(bus_.subscribe<core::TransferDeletedEvent>(
        [this](const core::TransferDeletedEvent& e) { onTransferDeleted(e.transfer); }));
    subs_.push_back(bus_.subscribe<core::WorldTransitionStartedEvent>(
        [this](const core::WorldTransitionStartedEvent&) { clear(); }));
}

void TransferBatcher::detach() {
    subs_.clear();
    clear();
}

void TransferBatcher::clear() {
    for (auto& kv : batches_) {
        if (kv.second.spawnTimer != core::kInvalidTimer) scheduler_.cancel(kv.second.spawnTimer);
        if (kv.second.info.packet != scene::kInvalidNode) scene_.destroyNode(kv.second.info.packet);
    }
    if (!batches_.empty()) spdlog::debug("[batch] cleared {} batches", batches_.size());
    batches_.clear();
    transferToBatch_.clear();
    lastProcessed_.clear();
    completed_.clear();
    arrived_.clear();
}

bool TransferBatcher::isTracked(uint64_t transferId) const {
    return lastProcessed_.count(transferId) != 0 || transferToBatch_.count(transferId) != 0;
}

TransferBatcher::BatchId TransferBatcher::batchOf(uint64_t transferId) const {
    auto it = transferToBatch_.find(transferId);
    return it == transferToBatch_.end() ? kInvalidBatch : it->second;
}

const TransferBatcher::BatchInfo* TransferBatcher::batch(BatchId id) const {
    auto it = batches_.find(id);
    return it == batches_.end() ? nullptr : &it->second.info;
}

std::size_t TransferBatcher::pendingBatchCount() const {
    std::size_t n = 0;
    for (const auto& kv : batches_) n += kv.second.info.spawned ? 0 : 1;
    return n;
}

std::size_t TransferBatcher::flyingBatchCount() const {
    return batches_.size() - pendingBatchCount();
}

const Trajectory* TransferBatcher::trajectory(BatchId id) const {
    auto it = batches_.find(id);
    return it == batches_.end() ? nullptr : it->second.trajectory.get();
}

void TransferBatcher::onTransferChanged(const net::PacketTransfer& transfer) {
    const uint64_t id = transfer.transferId;
    auto last = lastProcessed_.find(id);
    const bool changed = last == lastProcessed_.end() || last->second != transfer.currentLegType;
    if (changed) {
        lastProcessed_[id] = transfer.currentLegType;
        spdlog::debug("[batch] transfer #{} now {} (leg {})", id, net::transferLegTypeName(transfer.currentLegType),
                      transfer.currentLeg);
        switch (transfer.currentLegType) {
            case TransferLegType::ObjectToSphere:
            case TransferLegType::SphereToObject:
                startLegVisualization(transfer);
                break;
            case TransferLegType::SphereToSphere:
                ++stats_.sphereHops;
                startLegVisualization(transfer);
                break;
            case TransferLegType::ArrivedAtSphere: {
                const BatchId b = batchOf(id);
                auto it = batches_.find(b);
                if (it != batches_.end() && it->second.info.spawned) {
                    spdlog::debug("[batch] transfer #{} reached its sphere, removing batch {}", id, b);
                    destroyBatch(b);
                }
                break;
            }
            case TransferLegType::PendingAtObject:
                spdlog::debug("[batch] transfer #{} waiting at source", id);
                break;
        }
    }

    if (transfer.completed && completed_.insert(id).second) {
        spdlog::debug("[batch] transfer #{} marked complete", id);
    }
}

void TransferBatcher::onTransferDeleted(const net::PacketTransfer& transfer) {
    const uint64_t id = transfer.transferId;
    if (!isTracked(id)) return;
    auto mapped = transferToBatch_.find(id);
    if (mapped != transferToBatch_.end()) {
        auto it = batches_.find(mapped->second);
        if (it != batches_.end() && !it->second.info.spawned) {
            auto& ids = it->second.info.transferIds;
            ids.erase(std::remove(ids.begin(), ids.end(), id), ids.end());
        }
        transferToBatch_.erase(mapped);
    }
    lastProcessed_.erase(id);
    completed_.erase(id);
    spdlog::debug("[batch] transfer #{} deleted", id);
}

void TransferBatcher::startLegVisualization(const net::PacketTransfer& transfer) {
    const uint64_t id = transfer.transferId;
    const std::size_t leg = transfer.currentLeg;
    glm::vec3 start;
    glm::vec3 end;
    if (transfer.currentLegType == TransferLegType::SphereToSphere) {
        // Hops run from the current sphere waypoint to the next one.
        if (leg + 1 >= transfer.routeWaypoints.size()) {
            spdlog::warn("[batch] transfer #{} hop {} has no next sphere", id, leg);
            return;
        }
        start = net::toVec3(transfer.routeWaypoints[leg]);
        end = net::toVec3(transfer.routeWaypoints[leg + 1]);
    } else if (leg == 0) {
        if (transfer.routeWaypoints.size() < 2) {
            spdlog::warn("[batch] transfer #{} has insufficient waypoints", id);
            return;
        }
        start = net::toVec3(transfer.routeWaypoints[0]);
        end = net::toVec3(transfer.routeWaypoints[1]);
    } else {
        if (leg >= transfer.routeWaypoints.size()) {
            spdlog::warn("[batch] transfer #{} leg {} out of range", id, leg);
            return;
        }
        auto device = store_.devices().find(transfer.destinationDeviceId);
        if (!device) {
            spdlog::warn("[batch] storage device {} not found for transfer #{}", transfer.destinationDeviceId, id);
            return;
        }
        start = net::toVec3(transfer.routeWaypoints[leg]);
        end = net::toVec3(device->position);
    }

    float startHeight = 0.0f;
    float endHeight = 0.0f;
    if (transfer.currentLegType == TransferLegType::ObjectToSphere) {
        startHeight = config_.objectHeight;
        endHeight = config_.sphereHeight;
    } else if (transfer.currentLegType == TransferLegType::SphereToSphere) {
        startHeight = config_.sphereHeight;
        endHeight = config_.sphereHeight;
    } else {
        startHeight = config_.sphereHeight;
        endHeight = config_.objectHeight;
    }

    const BatchKey key{start, end, scheduler_.now()};
    BatchId target = kInvalidBatch;
    for (const auto& kv : batches_) {
        if (!kv.second.info.spawned && kv.second.info.legType == transfer.currentLegType &&
            kv.second.key.matches(key, config_.matchDistance, config_.matchTime)) {
            target = kv.first;
            break;
        }
    }
    if (target == kInvalidBatch) {
        target = ++nextBatch_;
        Batch b;
        b.info.id = target;
        b.info.legType = transfer.currentLegType;
        b.key = key;
        b.startHeight = startHeight;
        b.endHeight = endHeight;
        b.spawnTimer = scheduler_.after(config_.batchWindow, [this, target]() { spawnBatch(target); });
        batches_.emplace(target, std::move(b));
        spdlog::debug("[batch] new batch {} for {} leg {}", target, net::transferLegTypeName(transfer.currentLegType), leg);
    }

    Batch& b = batches_.at(target);
    b.info.transferIds.push_back(id);
    transferToBatch_[id] = target;
    frequency::mergeInto(b.info.composition, transfer.composition);
    ++stats_.departures;
}

void TransferBatcher::spawnBatch(BatchId id) {
    auto it = batches_.find(id);
    if (it == batches_.end()) return;
    Batch& b = it->second;
    b.spawnTimer = core::kInvalidTimer;
    b.info.spawned = true;
    if (b.info.transferIds.empty()) {
        spdlog::debug("[batch] batch {} emptied before spawning", id);
        batches_.erase(it);
        return;
    }

    const glm::vec3 startPos = math::adjustHeight(b.key.start, b.startHeight, config_.worldRadius);
    b.info.packet = scene_.createNode(scene::NodeKind::TransferPacket,
                                      fmt::format("TransferPacket_{}", scheduler_.frame()), startPos);
    if (scene::Node* node = scene_.find(b.info.packet)) {
        node->rotation = math::surfaceOrientation(startPos);
        node->scale = config_.packetScale;
        node->color = b.info.composition.empty() ? glm::vec4(1.0f)
                                                 : frequency::colorFor(b.info.composition.front().frequency);
        node->trail = true;
        node->label = fmt::format("{} packets", net::totalCount(b.info.composition));
    }
    b.trajectory = std::make_unique<Trajectory>(config_.worldRadius);
    auto onArrival = [this, id]() { arrived_.push_back(id); };
    if (b.info.legType == TransferLegType::SphereToSphere) {
        b.trajectory->startDirect(b.key.start, b.key.end, config_.packetSpeed, config_.sphereHeight, onArrival);
    } else {
        b.trajectory->startTwoPhase(b.key.start, b.key.end, config_.packetSpeed, b.startHeight, b.endHeight,
                                    onArrival);
    }
    ++stats_.batchesSpawned;
    spdlog::debug("[batch] spawned batch {} with {} transfers ({})", id, b.info.transferIds.size(),
                  net::transferLegTypeName(b.info.legType));
}

void TransferBatcher::update(float dt) {
    for (auto& kv : batches_) {
        Batch& b = kv.second;
        if (!b.trajectory) continue;
        b.trajectory->tick(dt);
        if (scene::Node* node = scene_.find(b.info.packet)) {
            node->position = b.trajectory->position();
            node->rotation = b.trajectory->rotation();
        }
    }
    std::vector<BatchId> arrived;
    arrived.swap(arrived_);
    for (BatchId id : arrived) onBatchArrived(id);
}

void TransferBatcher::onBatchArrived(BatchId id) {
    auto it = batches_.find(id);
    if (it == batches_.end()) return;
    for (uint64_t transferId : it->second.info.transferIds) {
        auto mapped = transferToBatch_.find(transferId);
        if (mapped == transferToBatch_.end() || mapped->second != id) continue;
        completed_.erase(transferId);
        lastProcessed_.erase(transferId);
        transferToBatch_.erase(mapped);
    }
    ++stats_.batchesArrived;
    spdlog::debug("[batch] batch {} arrived", id);
    destroyBatch(id);
}

void TransferBatcher::destroyBatch(BatchId id) {
    auto it = batches_.find(id);
    if (it == batches_.end()) return;
    if (it->second.spawnTimer != core::kInvalidTimer) scheduler_.cancel(it->second.spawnTimer);
    if (it->second.info.packet != scene::kInvalidNode) scene_.destroyNode(it->second.info.packet);
    batches_.erase(it);
}

} // namespace game
