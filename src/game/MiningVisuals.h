#pragma once

#include <array>
#include <cstdint>
#include <map>
#include <memory>
#include <vector>

#include <glm/vec4.hpp>

#include "core/EventBus.h"
#include "core/FrameScheduler.h"
#include "game/Trajectory.h"
#include "net/RemoteStore.h"
#include "scene/SceneGraph.h"

// MiningVisuals — active mining sessions of the current world.
//
// Every session shows an extraction node over the mined source, tinted by the
// dominant frequency of the miner's crystal. Packets extracted since the previous
// session update fly from the source to the miner. A fixed table of miner slots
// (position + colour, w = 1 when in use) is refreshed on an interval for the
// world-sphere glow to read; sessions past the table size are not shown there.
namespace game {

class MiningVisuals {
public:
    static constexpr std::size_t kMaxMiners = 10;

    struct Config {
        double refreshInterval = 0.1;
        float packetSpeed = 5.0f;
        float packetHeight = 1.0f;
        float packetScale = 1.0f;
        float extractionScale = 2.0f;
        float worldRadius = 300.0f;
    };

    struct MinerSlot {
        glm::vec4 position{0.0f};
        glm::vec4 color{0.0f};
    };

    struct Extraction {
        uint64_t sessionId = 0;
        uint64_t playerId = 0;
        uint64_t sourceId = 0;
        net::Composition crystal;
        glm::vec4 color{1.0f};
        uint32_t extracted = 0;
        double startTime = 0.0;
        scene::NodeId node = scene::kInvalidNode;
    };

    struct Stats {
        uint32_t sessionsStarted = 0;
        uint32_t sessionsEnded = 0;
        uint32_t packetsLaunched = 0;
        uint32_t packetsArrived = 0;
    };

    MiningVisuals(core::EventBus& bus, net::RemoteStore& store, core::FrameScheduler& scheduler,
                  scene::SceneGraph& scene);
    MiningVisuals(core::EventBus& bus, net::RemoteStore& store, core::FrameScheduler& scheduler,
                  scene::SceneGraph& scene, const Config& config);
    ~MiningVisuals();

    void attach();
    void detach();
    bool attached() const { return !subs_.empty(); }
    void clear();

    // Flies extracted packets.
    void update(float dt);
    // Rebuilds the miner slots from the player rows; drops sessions whose player is gone.
    void refresh();

    bool isPlayerMining(uint64_t playerId) const;
    const Extraction* extraction(uint64_t sessionId) const;
    std::size_t sessionCount() const { return sessions_.size(); }
    std::size_t flyingPacketCount() const { return packets_.size(); }
    const std::array<MinerSlot, kMaxMiners>& slots() const { return slots_; }
    std::size_t activeSlotCount() const;
    const Stats& stats() const { return stats_; }

private:
    struct FlyingPacket {
        scene::NodeId node = scene::kInvalidNode;
        std::unique_ptr<Trajectory> trajectory;
    };

    void startSession(const net::MiningSession& session);
    void updateSession(const net::MiningSession& session);
    void endSession(uint64_t sessionId);
    void launchPacket(const Extraction& extraction, uint32_t count);

    core::EventBus& bus_;
    net::RemoteStore& store_;
    core::FrameScheduler& scheduler_;
    scene::SceneGraph& scene_;
    Config config_{};
    Stats stats_{};

    std::map<uint64_t, Extraction> sessions_;
    std::vector<FlyingPacket> packets_;
    std::array<MinerSlot, kMaxMiners> slots_{};
    core::TimerId refreshTimer_ = core::kInvalidTimer;
    std::vector<core::EventBus::Subscription> subs_;
};

} // namespace game
