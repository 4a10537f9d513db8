#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <vector>

#include <glm/vec3.hpp>
#include <glm/gtc/quaternion.hpp>

#include "core/EventBus.h"
#include "core/FrameScheduler.h"
#include "core/Signal.h"
#include "net/RemoteStore.h"

// PlayerTracker — the set of players sharing the local player's world, keyed by
// playerId, plus periodic proximity bookkeeping around the local player.
//
// Until a world is known (LocalPlayerReady or WorldLoaded), player rows are ignored.
namespace game {

struct TrackedPlayer {
    net::Player player;
    bool isLocal = false;
    glm::vec3 position{0.0f};
    glm::quat rotation{1.0f, 0.0f, 0.0f, 0.0f};
    double lastUpdateTime = 0.0;
    bool isNearby = false;
    float distanceFromLocal = 0.0f;

    uint64_t playerId() const { return player.playerId; }
    const std::string& name() const { return player.name; }
    float distanceTo(const glm::vec3& p) const;
};

class PlayerTracker {
public:
    struct Config {
        bool proximityTracking = true;
        float proximityRadius = 50.0f;
        float proximityUpdateInterval = 0.5f;
    };

    core::Signal<TrackedPlayer> playerJoined;
    core::Signal<TrackedPlayer> playerLeft;
    core::Signal<TrackedPlayer, TrackedPlayer> playerUpdated;   // old, new
    core::Signal<TrackedPlayer> localPlayerChanged;
    core::Signal<std::vector<TrackedPlayer>> nearbyPlayersChanged;

    PlayerTracker(net::RemoteStore& store, core::EventBus& bus, core::FrameScheduler& scheduler);
    PlayerTracker(net::RemoteStore& store, core::EventBus& bus, core::FrameScheduler& scheduler,
                  const Config& config);
    ~PlayerTracker();

    void attach();
    void detach();
    bool attached() const { return attached_; }

    // Clears and re-scans the player table for the current world, firing
    // joined (and local-changed) for every player found. Previously tracked players
    // that are no longer in the world fire left.
    void refresh();
    void setCurrentWorld(const net::WorldCoords& coords);
    void updateProximity();

    const TrackedPlayer* localPlayer() const;
    const std::map<uint64_t, TrackedPlayer>& allPlayers() const { return players_; }
    const TrackedPlayer* player(uint64_t playerId) const;
    bool isTracked(uint64_t playerId) const { return players_.count(playerId) != 0; }
    std::vector<TrackedPlayer> playersInRadius(const glm::vec3& center, float radius) const;
    const std::vector<TrackedPlayer>& nearbyPlayers() const { return nearby_; }
    const TrackedPlayer* closestPlayer(const glm::vec3& position, bool excludeLocal = true) const;
    const TrackedPlayer* closestToLocal() const;
    std::vector<TrackedPlayer> sortedByDistance(const glm::vec3& position, bool excludeLocal = true) const;
    std::size_t playerCount() const { return players_.size(); }
    std::size_t otherPlayerCount() const;
    const std::optional<net::WorldCoords>& currentWorld() const { return currentWorld_; }

private:
    void handleInsert(const net::Player& row);
    void handleUpdate(const net::Player& oldRow, const net::Player& newRow);
    void handleDelete(const net::Player& row);
    void dropNearby(uint64_t playerId);
    bool inCurrentWorld(const net::Player& row) const;
    bool isLocalIdentity(const net::Player& row) const;
    TrackedPlayer makeTracked(const net::Player& row, bool isLocal) const;
    void track(const net::Player& row);

    net::RemoteStore& store_;
    core::EventBus& bus_;
    core::FrameScheduler& scheduler_;
    Config config_{};

    std::map<uint64_t, TrackedPlayer> players_;
    std::optional<uint64_t> localId_;
    std::optional<net::WorldCoords> currentWorld_;
    std::vector<TrackedPlayer> nearby_;

    bool attached_ = false;
    std::vector<core::EventBus::Subscription> subs_;
    std::vector<net::CallbackId> tableCallbacks_;
    core::TimerId proximityTimer_ = core::kInvalidTimer;
};

} // namespace game
