#pragma once

#include <cstdint>
#include <map>
#include <vector>

#include <glm/vec3.hpp>
#include <glm/vec4.hpp>

#include "core/EventBus.h"
#include "net/RemoteStore.h"
#include "scene/SceneGraph.h"

// TransferVisualizer — route view of the local player's packet transfers.
//
// A transfer animates as one packet per route segment, flown in sequence from
// waypoint to waypoint. Arriving at an intermediate spire flashes it; arriving at
// the last waypoint bursts at the device and asks the server to complete the
// transfer.
namespace game {

class TransferVisualizer {
public:
    struct Config {
        float transferSpeed = 5.0f;
        float packetScale = 1.5f;
        float arrivalDistance = 0.1f;
        float spireFlashDuration = 0.5f;
        float deviceArrivalDuration = 2.0f;
        glm::vec4 spireFlashColor{0.0f, 1.0f, 1.0f, 1.0f};
        glm::vec4 deviceArrivalColor{1.0f, 1.0f, 1.0f, 1.0f};
    };

    struct Stats {
        uint32_t started = 0;
        uint32_t completed = 0;
        uint32_t stopped = 0;
        uint32_t segments = 0;
    };

    TransferVisualizer(core::EventBus& bus, net::RemoteStore& store, scene::SceneGraph& scene);
    TransferVisualizer(core::EventBus& bus, net::RemoteStore& store, scene::SceneGraph& scene,
                       const Config& config);
    ~TransferVisualizer();

    void attach();
    // Unsubscribes and stops every running animation.
    void detach();
    bool attached() const { return !subs_.empty(); }

    // Moves the in-flight packets; segment arrivals chain to the next segment.
    void update(float dt);

    // speed <= 0 uses Config::transferSpeed. Returns false when not started.
    bool startTransfer(const net::PacketTransfer& transfer, float speed = 0.0f);
    bool stopTransfer(uint64_t transferId);
    void stopAll();

    bool isAnimating(uint64_t transferId) const { return active_.count(transferId) != 0; }
    std::size_t activeCount() const { return active_.size(); }
    scene::NodeId packetNode(uint64_t transferId) const;
    int currentSegment(uint64_t transferId) const;
    const Stats& stats() const { return stats_; }

private:
    struct Animation {
        uint64_t transferId = 0;
        std::vector<glm::vec3> waypoints;
        glm::vec4 color{1.0f};
        float speed = 0.0f;
        int segment = 0;
        scene::NodeId packet = scene::kInvalidNode;
    };

    bool isLocalTransfer(const net::PacketTransfer& transfer);
    void spawnSegment(Animation& anim);
    // Returns true when the whole route is finished.
    bool onSegmentArrived(Animation& anim);
    void complete(uint64_t transferId);

    core::EventBus& bus_;
    net::RemoteStore& store_;
    scene::SceneGraph& scene_;
    Config config_{};
    Stats stats_{};
    std::map<uint64_t, Animation> active_;
    std::vector<core::EventBus::Subscription> subs_;
};

} // namespace game
