#include "PlayerTracker.h"

#include <algorithm>
#include <limits>

#include <glm/geometric.hpp>
#include <spdlog/spdlog.h>

namespace game {

float TrackedPlayer::distanceTo(const glm::vec3& p) const {
    return glm::distance(position, p);
}

PlayerTracker::PlayerTracker(net::RemoteStore& store, core::EventBus& bus, core::FrameScheduler& scheduler)
    : PlayerTracker(store, bus, scheduler, Config{}) {}

PlayerTracker::PlayerTracker(net::RemoteStore& store, core::EventBus& bus, core::FrameScheduler& scheduler,
                             const Config& config)
    : store_(store), bus_(bus), scheduler_(scheduler), config_(config) {}

PlayerTracker::~PlayerTracker() {
    detach();
}

void PlayerTracker::attach() {
    if (attached_) return;
    attached_ = true;

    subs_.push_back(bus_.subscribe<core::LocalPlayerReadyEvent>([this](const core::LocalPlayerReadyEvent& e) {
        spdlog::info("[tracker] local player ready: {}", e.player.name);
        setCurrentWorld(e.player.currentWorld);
    }));
    subs_.push_back(bus_.subscribe<core::WorldLoadedEvent>([this](const core::WorldLoadedEvent& e) {
        spdlog::info("[tracker] world loaded: {}", e.world.worldName);
        setCurrentWorld(e.world.worldCoords);
    }));

    auto& table = store_.players();
    tableCallbacks_.push_back(table.onInsert([this](const net::Player& p) { handleInsert(p); }));
    tableCallbacks_.push_back(table.onUpdate([this](const net::Player& o, const net::Player& n) { handleUpdate(o, n); }));
    tableCallbacks_.push_back(table.onDelete([this](const net::Player& p) { handleDelete(p); }));

    if (config_.proximityTracking) {
        proximityTimer_ = scheduler_.every(config_.proximityUpdateInterval, [this]() {
            updateProximity();
            return true;
        });
    }

    if (!currentWorld_) {
        if (auto local = net::findLocalPlayer(store_)) currentWorld_ = local->currentWorld;
    }
    if (currentWorld_) {
        refresh();
    } else {
        spdlog::debug("[tracker] no world yet, waiting for world load");
    }
}

void PlayerTracker::detach() {
    if (!attached_) return;
    attached_ = false;
    subs_.clear();
    for (net::CallbackId id : tableCallbacks_) store_.players().removeCallback(id);
    tableCallbacks_.clear();
    if (proximityTimer_ != core::kInvalidTimer) {
        scheduler_.cancel(proximityTimer_);
        proximityTimer_ = core::kInvalidTimer;
    }
}

void PlayerTracker::setCurrentWorld(const net::WorldCoords& coords) {
    currentWorld_ = coords;
    refresh();
}

bool PlayerTracker::inCurrentWorld(const net::Player& row) const {
    return currentWorld_ && row.currentWorld == *currentWorld_;
}

bool PlayerTracker::isLocalIdentity(const net::Player& row) const {
    auto id = store_.identity();
    return id && row.identity == *id;
}

TrackedPlayer PlayerTracker::makeTracked(const net::Player& row, bool isLocal) const {
    TrackedPlayer t;
    t.player = row;
    t.isLocal = isLocal;
    t.position = net::toVec3(row.position);
    t.rotation = net::toQuat(row.rotation);
    t.lastUpdateTime = scheduler_.now();
    return t;
}

void PlayerTracker::track(const net::Player& row) {
    const bool isLocal = isLocalIdentity(row);
    TrackedPlayer t = makeTracked(row, isLocal);
    players_[row.playerId] = t;
    if (isLocal) {
        localId_ = row.playerId;
        localPlayerChanged.emit(t);
    }
    playerJoined.emit(t);
}

void PlayerTracker::refresh() {
    if (!currentWorld_) return;
    std::map<uint64_t, TrackedPlayer> previous;
    previous.swap(players_);
    localId_.reset();
    nearby_.clear();
    const auto& w = *currentWorld_;
    spdlog::info("[tracker] refreshing world ({}, {}, {})", w.x, w.y, w.z);
    const auto rows = store_.players().iter();
    for (const auto& kv : previous) {
        const bool stillHere = std::any_of(rows.begin(), rows.end(), [&](const net::Player& row) {
            return row.playerId == kv.first && inCurrentWorld(row);
        });
        if (!stillHere) playerLeft.emit(kv.second);
    }
    for (const auto& row : rows) {
        if (inCurrentWorld(row)) track(row);
    }
    spdlog::info("[tracker] tracking {} players", players_.size());
}

void PlayerTracker::handleInsert(const net::Player& row) {
    if (!inCurrentWorld(row)) return;
    track(row);
    spdlog::debug("[tracker] {} joined (local: {})", row.name, isLocalIdentity(row));
}

void PlayerTracker::handleUpdate(const net::Player& oldRow, const net::Player& newRow) {
    const bool wasInWorld = inCurrentWorld(oldRow);
    const bool isInWorld = inCurrentWorld(newRow);
    const bool isLocal = isLocalIdentity(newRow);

    if (!wasInWorld && isInWorld) {
        track(newRow);
        spdlog::debug("[tracker] {} entered world", newRow.name);
        return;
    }
    if (wasInWorld && !isInWorld) {
        auto it = players_.find(oldRow.playerId);
        if (it == players_.end()) return;
        TrackedPlayer leaving = it->second;
        players_.erase(it);
        if (isLocal) localId_.reset();
        dropNearby(leaving.playerId());
        playerLeft.emit(leaving);
        spdlog::debug("[tracker] {} left world", oldRow.name);
        return;
    }
    if (!isInWorld) return;
    auto it = players_.find(newRow.playerId);
    if (it == players_.end()) return;

    const TrackedPlayer before = it->second;
    TrackedPlayer& current = it->second;
    current.player = newRow;
    current.position = net::toVec3(newRow.position);
    current.rotation = net::toQuat(newRow.rotation);
    current.lastUpdateTime = scheduler_.now();
    if (isLocal) localId_ = newRow.playerId;
    playerUpdated.emit(before, current);
}

void PlayerTracker::handleDelete(const net::Player& row) {
    auto it = players_.find(row.playerId);
    if (it == players_.end()) return;
    TrackedPlayer gone = it->second;
    players_.erase(it);
    if (gone.isLocal) localId_.reset();
    dropNearby(gone.playerId());
    playerLeft.emit(gone);
    spdlog::debug("[tracker] {} deleted", row.name);
}

void PlayerTracker::dropNearby(uint64_t playerId) {
    nearby_.erase(std::remove_if(nearby_.begin(), nearby_.end(),
                                 [playerId](const TrackedPlayer& p) { return p.playerId() == playerId; }),
                  nearby_.end());
}

void PlayerTracker::updateProximity() {
    const TrackedPlayer* local = localPlayer();
    if (!local) return;
    const glm::vec3 center = local->position;

    std::vector<uint64_t> previous;
    previous.reserve(nearby_.size());
    for (const auto& p : nearby_) previous.push_back(p.playerId());

    nearby_.clear();
    for (auto& kv : players_) {
        TrackedPlayer& p = kv.second;
        if (p.isLocal) continue;
        p.distanceFromLocal = p.distanceTo(center);
        p.isNearby = p.distanceFromLocal <= config_.proximityRadius;
        if (p.isNearby) nearby_.push_back(p);
    }
    std::stable_sort(nearby_.begin(), nearby_.end(), [](const TrackedPlayer& a, const TrackedPlayer& b) {
        return a.distanceFromLocal < b.distanceFromLocal;
    });

    bool changed = previous.size() != nearby_.size();
    for (std::size_t i = 0; !changed && i < previous.size(); ++i) {
        changed = previous[i] != nearby_[i].playerId();
    }
    if (changed) {
        spdlog::debug("[tracker] nearby players: {}", nearby_.size());
        nearbyPlayersChanged.emit(nearby_);
    }
}

const TrackedPlayer* PlayerTracker::localPlayer() const {
    if (!localId_) return nullptr;
    return player(*localId_);
}

const TrackedPlayer* PlayerTracker::player(uint64_t playerId) const {
    auto it = players_.find(playerId);
    return it == players_.end() ? nullptr : &it->second;
}

std::vector<TrackedPlayer> PlayerTracker::playersInRadius(const glm::vec3& center, float radius) const {
    std::vector<TrackedPlayer> out;
    for (const auto& kv : players_) {
        if (kv.second.distanceTo(center) <= radius) out.push_back(kv.second);
    }
    std::stable_sort(out.begin(), out.end(), [&](const TrackedPlayer& a, const TrackedPlayer& b) {
        return a.distanceTo(center) < b.distanceTo(center);
    });
    return out;
}

const TrackedPlayer* PlayerTracker::closestPlayer(const glm::vec3& position, bool excludeLocal) const {
    const TrackedPlayer* closest = nullptr;
    float best = std::numeric_limits<float>::max();
    for (const auto& kv : players_) {
        if (excludeLocal && kv.second.isLocal) continue;
        const float d = kv.second.distanceTo(position);
        if (d < best) {
            best = d;
            closest = &kv.second;
        }
    }
    return closest;
}

const TrackedPlayer* PlayerTracker::closestToLocal() const {
    const TrackedPlayer* local = localPlayer();
    if (!local) return nullptr;
    return closestPlayer(local->position, true);
}

std::vector<TrackedPlayer> PlayerTracker::sortedByDistance(const glm::vec3& position, bool excludeLocal) const {
    std::vector<TrackedPlayer> out;
    for (const auto& kv : players_) {
        if (excludeLocal && kv.second.isLocal) continue;
        out.push_back(kv.second);
    }
    std::stable_sort(out.begin(), out.end(), [&](const TrackedPlayer& a, const TrackedPlayer& b) {
        return a.distanceTo(position) < b.distanceTo(position);
    });
    return out;
}

std::size_t PlayerTracker::otherPlayerCount() const {
    return localPlayer() ? players_.size() - 1 : players_.size();
}

} // namespace game
