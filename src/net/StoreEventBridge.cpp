#include "StoreEventBridge.h"

#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>

namespace net {

StoreEventBridge::StoreEventBridge(RemoteStore& store, core::EventBus& bus)
    : StoreEventBridge(store, bus, Config{}) {}

StoreEventBridge::StoreEventBridge(RemoteStore& store, core::EventBus& bus, const Config& config)
    : store_(store), bus_(bus), config_(config) {}

StoreEventBridge::~StoreEventBridge() {
    detach();
}

std::string StoreEventBridge::worldName(const WorldCoords& coords) {
    if (coords == WorldCoords{}) return "Center World";
    return fmt::format("World ({}, {}, {})", coords.x, coords.y, coords.z);
}

void StoreEventBridge::attach() {
    if (attached()) return;
    storeCallbacks_.push_back(store_.onConnect(
        [this](const Identity& identity, const std::string& token) { onConnected(identity, token); }));
    storeCallbacks_.push_back(store_.onDisconnect([this](const std::string& reason) {
        spdlog::warn("[bridge] disconnected: {}", reason);
        unhookTables();
        local_.reset();
        world_.reset();
        bus_.publish(core::ConnectionLostEvent{reason});
    }));
    storeCallbacks_.push_back(store_.onConnectError([this](const std::string& error) {
        spdlog::error("[bridge] connection failed: {}", error);
        bus_.publish(core::ConnectionFailedEvent{error});
    }));
    storeCallbacks_.push_back(store_.onSubscriptionApplied([this]() { onSubscriptionApplied(); }));
    storeCallbacks_.push_back(store_.onReducerError([this](const std::string& reducer, const std::string& error) {
        spdlog::warn("[bridge] reducer {} failed: {}", reducer, error);
        bus_.publish(core::ReducerErrorEvent{reducer, error});
    }));
    if (store_.isConnected()) {
        if (auto id = store_.identity()) onConnected(*id, {});
    }
}

void StoreEventBridge::detach() {
    unhookTables();
    for (CallbackId id : storeCallbacks_) store_.removeCallback(id);
    storeCallbacks_.clear();
}

void StoreEventBridge::onConnected(const Identity& identity, const std::string& token) {
    spdlog::info("[bridge] connected as {}", identity);
    bus_.publish(core::ConnectionEstablishedEvent{identity, token});
    if (config_.autoSubscribe) store_.subscribeAll();
}

void StoreEventBridge::onSubscriptionApplied() {
    spdlog::info("[bridge] subscription applied: {} players, {} sources, {} devices, {} transfers",
                 store_.players().count(), store_.sources().count(), store_.devices().count(),
                 store_.transfers().count());
    hookTables();
    bus_.publish(core::SubscriptionReadyEvent{});
    checkLocalPlayer();
}

void StoreEventBridge::hookTables() {
    if (tablesHooked()) return;
    using T = TableHook::Table;
    auto& players = store_.players();
    tableCallbacks_.push_back({T::Players, players.onInsert([this](const Player& r) { onPlayerInserted(r); })});
    tableCallbacks_.push_back({T::Players, players.onUpdate(
        [this](const Player& o, const Player& n) { onPlayerUpdated(o, n); })});
    tableCallbacks_.push_back({T::Players, players.onDelete([this](const Player& r) { onPlayerDeleted(r); })});

    auto& sources = store_.sources();
    tableCallbacks_.push_back({T::Sources, sources.onInsert([this](const WavePacketSource& r) {
        if (inWorld(r.worldCoords)) bus_.publish(core::SourceInsertedEvent{r});
    })});
    tableCallbacks_.push_back({T::Sources, sources.onUpdate([this](const WavePacketSource& o, const WavePacketSource& n) {
        if (inWorld(n.worldCoords)) bus_.publish(core::SourceUpdatedEvent{o, n});
    })});
    tableCallbacks_.push_back({T::Sources, sources.onDelete([this](const WavePacketSource& r) {
        if (inWorld(r.worldCoords)) bus_.publish(core::SourceDeletedEvent{r});
    })});

    auto& devices = store_.devices();
    tableCallbacks_.push_back({T::Devices, devices.onInsert([this](const StorageDevice& r) {
        if (inWorld(r.worldCoords)) bus_.publish(core::DeviceInsertedEvent{r});
    })});
    tableCallbacks_.push_back({T::Devices, devices.onUpdate([this](const StorageDevice& o, const StorageDevice& n) {
        if (inWorld(n.worldCoords)) bus_.publish(core::DeviceUpdatedEvent{o, n});
    })});
    tableCallbacks_.push_back({T::Devices, devices.onDelete([this](const StorageDevice& r) {
        if (inWorld(r.worldCoords)) bus_.publish(core::DeviceDeletedEvent{r});
    })});

    auto& transfers = store_.transfers();
    tableCallbacks_.push_back({T::Transfers, transfers.onInsert(
        [this](const PacketTransfer& r) { bus_.publish(core::TransferInsertedEvent{r}); })});
    tableCallbacks_.push_back({T::Transfers, transfers.onUpdate(
        [this](const PacketTransfer& o, const PacketTransfer& n) { bus_.publish(core::TransferUpdatedEvent{o, n}); })});
    tableCallbacks_.push_back({T::Transfers, transfers.onDelete(
        [this](const PacketTransfer& r) { bus_.publish(core::TransferDeletedEvent{r}); })});

    auto& circuits = store_.circuits();
    tableCallbacks_.push_back({T::Circuits, circuits.onInsert([this](const WorldCircuit& r) {
        if (inWorld(r.worldCoords)) bus_.publish(core::CircuitInsertedEvent{r});
    })});
    tableCallbacks_.push_back({T::Circuits, circuits.onUpdate([this](const WorldCircuit& o, const WorldCircuit& n) {
        if (inWorld(n.worldCoords)) bus_.publish(core::CircuitUpdatedEvent{o, n});
    })});
    tableCallbacks_.push_back({T::Circuits, circuits.onDelete([this](const WorldCircuit& r) {
        if (inWorld(r.worldCoords)) bus_.publish(core::CircuitDeletedEvent{r});
    })});

    auto& spheres = store_.spheres();
    tableCallbacks_.push_back({T::Spheres, spheres.onInsert([this](const DistributionSphere& r) {
        if (inWorld(r.worldCoords)) bus_.publish(core::SphereInsertedEvent{r});
    })});
    tableCallbacks_.push_back({T::Spheres, spheres.onUpdate(
        [this](const DistributionSphere& o, const DistributionSphere& n) {
            if (inWorld(n.worldCoords)) bus_.publish(core::SphereUpdatedEvent{o, n});
        })});
    tableCallbacks_.push_back({T::Spheres, spheres.onDelete([this](const DistributionSphere& r) {
        if (inWorld(r.worldCoords)) bus_.publish(core::SphereDeletedEvent{r});
    })});

    auto& tunnels = store_.tunnels();
    tableCallbacks_.push_back({T::Tunnels, tunnels.onInsert([this](const QuantumTunnel& r) {
        if (inWorld(r.worldCoords)) bus_.publish(core::TunnelInsertedEvent{r});
    })});
    tableCallbacks_.push_back({T::Tunnels, tunnels.onUpdate([this](const QuantumTunnel& o, const QuantumTunnel& n) {
        if (inWorld(n.worldCoords)) bus_.publish(core::TunnelUpdatedEvent{o, n});
    })});
    tableCallbacks_.push_back({T::Tunnels, tunnels.onDelete([this](const QuantumTunnel& r) {
        if (inWorld(r.worldCoords)) bus_.publish(core::TunnelDeletedEvent{r});
    })});

    // An ended session whose source is already gone is still announced.
    auto& sessions = store_.miningSessions();
    tableCallbacks_.push_back({T::MiningSessions, sessions.onInsert([this](const MiningSession& r) {
        if (sourceInWorld(r.sourceId)) bus_.publish(core::MiningSessionStartedEvent{r});
    })});
    tableCallbacks_.push_back({T::MiningSessions, sessions.onUpdate(
        [this](const MiningSession& o, const MiningSession& n) {
            if (sourceInWorld(n.sourceId)) bus_.publish(core::MiningSessionUpdatedEvent{o, n});
        })});
    tableCallbacks_.push_back({T::MiningSessions, sessions.onDelete([this](const MiningSession& r) {
        if (!store_.sources().find(r.sourceId) || sourceInWorld(r.sourceId)) {
            bus_.publish(core::MiningSessionEndedEvent{r});
        }
    })});

    tableCallbacks_.push_back({T::Messages, store_.messages().onInsert([this](const BroadcastMessage& m) {
        bus_.publish(core::BroadcastMessageReceivedEvent{m.messageId, m.senderPlayerId, m.senderName, m.content});
    })});
    spdlog::debug("[bridge] hooked {} table callbacks", tableCallbacks_.size());
}

void StoreEventBridge::unhookTables() {
    using T = TableHook::Table;
    for (const auto& hook : tableCallbacks_) {
        switch (hook.table) {
            case T::Players: store_.players().removeCallback(hook.id); break;
            case T::Sources: store_.sources().removeCallback(hook.id); break;
            case T::Devices: store_.devices().removeCallback(hook.id); break;
            case T::Transfers: store_.transfers().removeCallback(hook.id); break;
            case T::Messages: store_.messages().removeCallback(hook.id); break;
            case T::Circuits: store_.circuits().removeCallback(hook.id); break;
            case T::Spheres: store_.spheres().removeCallback(hook.id); break;
            case T::Tunnels: store_.tunnels().removeCallback(hook.id); break;
            case T::MiningSessions: store_.miningSessions().removeCallback(hook.id); break;
        }
    }
    tableCallbacks_.clear();
}

void StoreEventBridge::checkLocalPlayer() {
    bus_.publish(core::LocalPlayerCheckStartedEvent{});
    if (auto player = findLocalPlayer(store_)) {
        spdlog::info("[bridge] found local player {} (id {})", player->name, player->playerId);
        markLocalReady(*player);
        return;
    }
    spdlog::info("[bridge] no player for this identity yet");
    bus_.publish(core::LocalPlayerNotFoundEvent{});
}

void StoreEventBridge::markLocalReady(const Player& player) {
    local_ = player;
    bus_.publish(core::LocalPlayerReadyEvent{player});
    loadWorld(player.currentWorld);
}

void StoreEventBridge::loadWorld(const WorldCoords& coords) {
    world_ = coords;
    const std::string name = worldName(coords);
    spdlog::info("[bridge] loading {}", name);
    bus_.publish(core::WorldLoadStartedEvent{coords});
    bus_.publish(core::WorldLoadedEvent{WorldRow{coords, name}});

    core::InitialSourcesLoadedEvent sources;
    for (auto& s : store_.sources().iter()) {
        if (inWorld(s.worldCoords)) sources.sources.push_back(std::move(s));
    }
    core::InitialDevicesLoadedEvent devices;
    for (auto& d : store_.devices().iter()) {
        if (inWorld(d.worldCoords)) devices.devices.push_back(std::move(d));
    }
    core::InitialSpiresLoadedEvent spires;
    for (auto& c : store_.circuits().iter()) {
        if (inWorld(c.worldCoords)) spires.circuits.push_back(std::move(c));
    }
    for (auto& sp : store_.spheres().iter()) {
        if (inWorld(sp.worldCoords)) spires.spheres.push_back(std::move(sp));
    }
    for (auto& t : store_.tunnels().iter()) {
        if (inWorld(t.worldCoords)) spires.tunnels.push_back(std::move(t));
    }
    spdlog::debug("[bridge] initial load: {} sources, {} devices, {} spheres", sources.sources.size(),
                  devices.devices.size(), spires.spheres.size());
    bus_.publish(sources);
    bus_.publish(devices);
    bus_.publish(spires);
    for (const auto& session : store_.miningSessions().iter()) {
        if (sourceInWorld(session.sourceId)) bus_.publish(core::MiningSessionStartedEvent{session});
    }
}

bool StoreEventBridge::isLocal(const Player& row) const {
    auto id = store_.identity();
    return id && row.identity == *id;
}

bool StoreEventBridge::inWorld(const WorldCoords& coords) const {
    if (!config_.filterToLocalWorld) return true;
    return world_ && *world_ == coords;
}

bool StoreEventBridge::sourceInWorld(uint64_t sourceId) const {
    auto source = store_.sources().find(sourceId);
    return source && inWorld(source->worldCoords);
}

void StoreEventBridge::onPlayerInserted(const Player& row) {
    if (!isLocal(row)) return;
    spdlog::info("[bridge] local player created: {}", row.name);
    bus_.publish(core::LocalPlayerCreatedEvent{row, true});
    markLocalReady(row);
}

void StoreEventBridge::onPlayerUpdated(const Player& oldRow, const Player& newRow) {
    if (!isLocal(newRow)) return;
    if (!isLocal(oldRow) || !local_) {
        spdlog::info("[bridge] local player restored: {}", newRow.name);
        bus_.publish(core::LocalPlayerRestoredEvent{newRow});
        markLocalReady(newRow);
        return;
    }
    if (oldRow.currentWorld != newRow.currentWorld) {
        spdlog::info("[bridge] world transition {} -> {}", worldName(oldRow.currentWorld),
                     worldName(newRow.currentWorld));
        local_ = newRow;
        bus_.publish(core::WorldTransitionStartedEvent{oldRow.currentWorld, newRow.currentWorld});
        loadWorld(newRow.currentWorld);
        return;
    }
    local_ = newRow;
}

void StoreEventBridge::onPlayerDeleted(const Player& row) {
    if (!isLocal(row)) return;
    spdlog::warn("[bridge] local player {} deleted", row.name);
    local_.reset();
    world_.reset();
    bus_.publish(core::ConnectionLostEvent{"local player deleted"});
}

} // namespace net
