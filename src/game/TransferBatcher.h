#pragma once

#include <cstdint>
#include <map>
#include <memory>
#include <unordered_map>
#include <unordered_set>
#include <vector>

#include <glm/vec3.hpp>

#include "core/EventBus.h"
#include "core/FrameScheduler.h"
#include "game/Trajectory.h"
#include "net/RemoteStore.h"
#include "scene/SceneGraph.h"

// TransferBatcher — leg view of packet transfers, driven by each transfer's
// current leg type.
//
// Departures of the same leg type that share a start, an end and a departure
// instant are merged into one batch, spawned as a single packet after a short
// collection window. Object legs fly a two-phase Trajectory; sphere-to-sphere hops
// stay at sphere height from waypoint[leg] to waypoint[leg + 1].
namespace game {

struct BatchKey {
    glm::vec3 start{0.0f};
    glm::vec3 end{0.0f};
    double departureTime = 0.0;

    bool matches(const BatchKey& other, float distanceTolerance = 0.1f, double timeTolerance = 0.1) const;
};

class TransferBatcher {
public:
    using BatchId = uint32_t;
    static constexpr BatchId kInvalidBatch = 0;

    struct Config {
        float packetSpeed = 5.0f;
        float packetScale = 1.5f;
        double batchWindow = 0.1;
        float objectHeight = 1.0f;
        float sphereHeight = 10.0f;
        float matchDistance = 0.1f;
        double matchTime = 0.1;
        float worldRadius = 300.0f;
    };

    struct Stats {
        uint32_t departures = 0;
        uint32_t batchesSpawned = 0;
        uint32_t batchesArrived = 0;
        uint32_t sphereHops = 0;
    };

    struct BatchInfo {
        BatchId id = kInvalidBatch;
        std::vector<uint64_t> transferIds;
        net::Composition composition;
        net::TransferLegType legType = net::TransferLegType::ObjectToSphere;
        bool spawned = false;
        scene::NodeId packet = scene::kInvalidNode;
    };

    TransferBatcher(core::EventBus& bus, net::RemoteStore& store, core::FrameScheduler& scheduler,
                    scene::SceneGraph& scene);
    TransferBatcher(core::EventBus& bus, net::RemoteStore& store, core::FrameScheduler& scheduler,
                    scene::SceneGraph& scene, const Config& config);
    ~TransferBatcher();

    void attach();
    void detach();
    bool attached() const { return !subs_.empty(); }

    // Flies spawned batches; arrivals are handled after every packet has moved.
    void update(float dt);
    void clear();

    void onTransferChanged(const net::PacketTransfer& transfer);
    void onTransferDeleted(const net::PacketTransfer& transfer);

    bool isTracked(uint64_t transferId) const;
    bool isCompleted(uint64_t transferId) const { return completed_.count(transferId) != 0; }
    BatchId batchOf(uint64_t transferId) const;
    const BatchInfo* batch(BatchId id) const;
    std::size_t pendingBatchCount() const;
    std::size_t flyingBatchCount() const;
    const Trajectory* trajectory(BatchId id) const;
    const Stats& stats() const { return stats_; }

private:
    struct Batch {
        BatchInfo info;
        BatchKey key;
        float startHeight = 0.0f;
        float endHeight = 0.0f;
        core::TimerId spawnTimer = core::kInvalidTimer;
        std::unique_ptr<Trajectory> trajectory;
    };

    void startLegVisualization(const net::PacketTransfer& transfer);
    void spawnBatch(BatchId id);
    void onBatchArrived(BatchId id);
    void destroyBatch(BatchId id);

    core::EventBus& bus_;
    net::RemoteStore& store_;
    core::FrameScheduler& scheduler_;
    scene::SceneGraph& scene_;
    Config config_{};
    Stats stats_{};

    std::map<BatchId, Batch> batches_;
    std::unordered_map<uint64_t, BatchId> transferToBatch_;
    std::unordered_map<uint64_t, net::TransferLegType> lastProcessed_;
    std::unordered_set<uint64_t> completed_;
    std::vector<BatchId> arrived_;
    BatchId nextBatch_ = kInvalidBatch;
    std::vector<core::EventBus::Subscription> subs_;
};

} // namespace game
