#pragma once

#include <optional>
#include <string>
#include <vector>

#include "core/EventBus.h"
#include "net/RemoteStore.h"

// StoreEventBridge — turns RemoteStore connection and row callbacks into bus events.
//
// It also drives world loading: once the local player is known it announces the
// player's world (WorldLoadStarted, WorldLoaded) and hands over the initial source,
// device and spire rows of that world. When the local player moves to another world
// the bridge announces the transition and loads the new one. Source, device and
// spire events are filtered to the current world; mining sessions follow the world
// of the source being mined.
namespace net {

class StoreEventBridge {
public:
    struct Config {
        bool autoSubscribe = true;
        bool filterToLocalWorld = true;
    };

    StoreEventBridge(RemoteStore& store, core::EventBus& bus);
    StoreEventBridge(RemoteStore& store, core::EventBus& bus, const Config& config);
    ~StoreEventBridge();

    // Registers the connection-level callbacks. Table hooks follow once the
    // subscription is applied.
    void attach();
    void detach();
    bool attached() const { return !storeCallbacks_.empty(); }
    bool tablesHooked() const { return !tableCallbacks_.empty(); }

    const std::optional<Player>& localPlayer() const { return local_; }
    const std::optional<WorldCoords>& currentWorld() const { return world_; }

    static std::string worldName(const WorldCoords& coords);

private:
    void onConnected(const Identity& identity, const std::string& token);
    void onSubscriptionApplied();
    void hookTables();
    void unhookTables();
    void checkLocalPlayer();
    void markLocalReady(const Player& player);
    void loadWorld(const WorldCoords& coords);

    void onPlayerInserted(const Player& row);
    void onPlayerUpdated(const Player& oldRow, const Player& newRow);
    void onPlayerDeleted(const Player& row);

    bool isLocal(const Player& row) const;
    bool inWorld(const WorldCoords& coords) const;
    bool sourceInWorld(uint64_t sourceId) const;

    RemoteStore& store_;
    core::EventBus& bus_;
    Config config_{};

    std::optional<Player> local_;
    std::optional<WorldCoords> world_;

    std::vector<CallbackId> storeCallbacks_;
    struct TableHook {
        enum class Table {
            Players,
            Sources,
            Devices,
            Transfers,
            Messages,
            Circuits,
            Spheres,
            Tunnels,
            MiningSessions,
        } table;
        CallbackId id;
    };
    std::vector<TableHook> tableCallbacks_;
};

} // namespace net
