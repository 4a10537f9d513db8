// Store to event bus bridge: session flow, world filtering, world hops.
#include <string>
#include <vector>

#include "TestCheck.h"
#include "core/EventBus.h"
#include "net/LocalStore.h"
#include "net/StoreEventBridge.h"

using core::GameState;

namespace {

net::Player playerRow(uint64_t id, const std::string& identity, net::WorldCoords world = {}) {
    net::Player p;
    p.playerId = id;
    p.identity = identity;
    p.name = "player" + std::to_string(id);
    p.currentWorld = world;
    p.position = {0.0f, 300.0f, 0.0f};
    return p;
}

net::WavePacketSource sourceRow(uint64_t id, net::WorldCoords world = {}) {
    net::WavePacketSource s;
    s.sourceId = id;
    s.worldCoords = world;
    s.totalWavePackets = 5;
    return s;
}

} // namespace

int main() {
    bool success = true;

    CHECK(net::StoreEventBridge::worldName({}) == "Center World", "Center world name");
    CHECK(net::StoreEventBridge::worldName({1, -2, 0}) == "World (1, -2, 0)", "Named by coordinates");

    // Returning player: connect, subscribe, straight into the game
    {
        net::LocalStore store;
        core::EventBus bus(core::EventBus::Config{100, false});
        net::StoreEventBridge bridge(store, bus);
        bridge.attach();

        store.playerTable().insert(playerRow(1, "me"));
        store.sourceTable().insert(sourceRow(10));
        store.sourceTable().insert(sourceRow(11, {1, 0, 0}));
        net::StorageDevice device;
        device.deviceId = 20;
        store.deviceTable().insert(device);

        std::size_t initialSources = 99;
        std::size_t initialDevices = 99;
        std::string loadedName;
        int sourceEvents = 0;
        auto s1 = bus.subscribe<core::InitialSourcesLoadedEvent>(
            [&](const core::InitialSourcesLoadedEvent& e) { initialSources = e.sources.size(); });
        auto s2 = bus.subscribe<core::InitialDevicesLoadedEvent>(
            [&](const core::InitialDevicesLoadedEvent& e) { initialDevices = e.devices.size(); });
        auto s3 = bus.subscribe<core::WorldLoadedEvent>(
            [&](const core::WorldLoadedEvent& e) { loadedName = e.world.worldName; });
        auto s4 = bus.subscribe<core::SourceInsertedEvent>([&](const core::SourceInsertedEvent&) { ++sourceEvents; });

        bus.publish(core::ConnectionStartedEvent{"local://test"});
        store.connect("me", "tok");
        CHECK(bus.state() == GameState::Connected, "Connected (%s)", core::gameStateName(bus.state()));
        CHECK(store.subscriptionRequested(), "Bridge subscribes on connect");

        CHECK(store.applySubscription(), "Subscription applied");
        CHECK(bus.state() == GameState::InGame, "In game (%s)", core::gameStateName(bus.state()));
        CHECK(bridge.localPlayer() && bridge.localPlayer()->playerId == 1, "Local player remembered");
        CHECK(loadedName == "Center World", "World loaded");
        CHECK(initialSources == 1 && initialDevices == 1, "Initial load filtered to the local world (%zu, %zu)",
              initialSources, initialDevices);

        store.sourceTable().insert(sourceRow(12));
        store.sourceTable().insert(sourceRow(13, {0, 1, 0}));
        CHECK(sourceEvents == 1, "Only local-world sources forwarded (%d)", sourceEvents);

        // Hop to another world: transition, reload, remote rows become visible
        net::WorldCoords fromWorld{9, 9, 9};
        net::WorldCoords toWorld{};
        auto s5 = bus.subscribe<core::WorldTransitionStartedEvent>([&](const core::WorldTransitionStartedEvent& e) {
            fromWorld = e.fromWorld;
            toWorld = e.toWorld;
        });
        store.playerTable().update(playerRow(1, "me", {1, 0, 0}));
        CHECK(fromWorld == net::WorldCoords{} && toWorld == (net::WorldCoords{1, 0, 0}), "Transition reported");
        CHECK(loadedName == "World (1, 0, 0)", "New world loaded (%s)", loadedName.c_str());
        CHECK(initialSources == 1, "Initial sources of the new world");
        CHECK(bus.state() == GameState::InGame, "Back in game");

        // Unrelated player rows do not affect the session
        store.playerTable().insert(playerRow(2, "other"));
        store.playerTable().remove(2);
        CHECK(bus.state() == GameState::InGame, "Other players ignored");

        // Transfers are forwarded unfiltered, messages too
        int transfers = 0;
        std::string chat;
        auto s6 = bus.subscribe<core::TransferInsertedEvent>([&](const core::TransferInsertedEvent&) { ++transfers; });
        auto s7 = bus.subscribe<core::BroadcastMessageReceivedEvent>(
            [&](const core::BroadcastMessageReceivedEvent& e) { chat = e.senderName + ": " + e.content; });
        net::PacketTransfer t;
        t.transferId = 3;
        t.playerId = 2;
        store.transferTable().insert(t);
        net::BroadcastMessage m;
        m.messageId = 1;
        m.senderPlayerId = 2;
        m.senderName = "player2";
        m.content = "hi";
        store.messageTable().insert(m);
        CHECK(transfers == 1 && chat == "player2: hi", "Transfers and messages forwarded");

        // Local row deleted: the session is lost
        store.playerTable().remove(1);
        CHECK(bus.state() == GameState::Disconnected, "Deleted local player drops the session");
        CHECK(!bridge.localPlayer(), "Local player forgotten");
    }

    // New player: not found at first, created later
    {
        net::LocalStore store;
        core::EventBus bus(core::EventBus::Config{100, false});
        net::StoreEventBridge bridge(store, bus);
        bridge.attach();

        bool notFound = false;
        bool created = false;
        bool ready = false;
        auto s1 = bus.subscribe<core::LocalPlayerNotFoundEvent>([&](const core::LocalPlayerNotFoundEvent&) { notFound = true; });
        auto s2 = bus.subscribe<core::LocalPlayerCreatedEvent>(
            [&](const core::LocalPlayerCreatedEvent& e) { created = e.isNewPlayer; });
        auto s3 = bus.subscribe<core::LocalPlayerReadyEvent>([&](const core::LocalPlayerReadyEvent&) { ready = true; });

        bus.publish(core::ConnectionStartedEvent{"local://test"});
        store.connect("newbie", "tok");
        store.applySubscription();
        CHECK(notFound && bus.state() == GameState::WaitingForLogin, "Waiting for login (%s)",
              core::gameStateName(bus.state()));

        bus.publish(core::LoginStartedEvent{"newbie"});
        bus.publish(core::LoginSuccessfulEvent{"newbie", 1});
        bus.publish(core::PlayerCreationStartedEvent{"newbie"});
        CHECK(bus.state() == GameState::CreatingPlayer, "Creating player (%s)", core::gameStateName(bus.state()));

        store.playerTable().insert(playerRow(5, "newbie"));
        CHECK(created && ready, "Creation announced and player ready");
        CHECK(bus.state() == GameState::InGame, "New player in game (%s)", core::gameStateName(bus.state()));
        CHECK(bridge.localPlayer() && bridge.localPlayer()->playerId == 5, "Bridge tracks the new player");
    }

    // Restored player: the row appears through an update, lost connection resets
    {
        net::LocalStore store;
        core::EventBus bus(core::EventBus::Config{100, false});
        net::StoreEventBridge bridge(store, bus);
        bridge.attach();

        bool restored = false;
        auto s1 = bus.subscribe<core::LocalPlayerRestoredEvent>(
            [&](const core::LocalPlayerRestoredEvent&) { restored = true; });

        store.playerTable().insert(playerRow(8, "someone-else"));
        bus.publish(core::ConnectionStartedEvent{"local://test"});
        store.connect("me", "tok");
        store.applySubscription();
        bus.publish(core::LoginStartedEvent{"me"});
        bus.publish(core::LoginSuccessfulEvent{"me", 8});
        CHECK(bus.state() == GameState::Authenticated, "Authenticated (%s)", core::gameStateName(bus.state()));
        store.playerTable().update(playerRow(8, "me"));
        CHECK(restored, "Identity moved onto an existing row");
        CHECK(bus.state() == GameState::InGame, "Restored into the game (%s)", core::gameStateName(bus.state()));

        std::string lost;
        auto s2 = bus.subscribe<core::ConnectionLostEvent>([&](const core::ConnectionLostEvent& e) { lost = e.reason; });
        store.disconnect("server closed");
        CHECK(lost == "server closed" && bus.state() == GameState::Disconnected, "Connection lost");
        CHECK(!bridge.localPlayer(), "Session state cleared");

        // Tables are unhooked: later rows do not reach the bus
        int sources = 0;
        auto s3 = bus.subscribe<core::SourceInsertedEvent>([&](const core::SourceInsertedEvent&) { ++sources; });
        store.sourceTable().insert(sourceRow(1));
        CHECK(sources == 0, "No forwarding after disconnect");
    }

    // Unfiltered bridge and detach
    {
        net::LocalStore store;
        core::EventBus bus(core::EventBus::Config{100, false});
        net::StoreEventBridge::Config config;
        config.filterToLocalWorld = false;
        net::StoreEventBridge bridge(store, bus, config);
        bridge.attach();
        store.playerTable().insert(playerRow(1, "me"));
        store.connect("me", "tok");
        store.applySubscription();

        int sources = 0;
        auto s1 = bus.subscribe<core::SourceInsertedEvent>([&](const core::SourceInsertedEvent&) { ++sources; });
        store.sourceTable().insert(sourceRow(1, {4, 4, 4}));
        CHECK(sources == 1, "Every world forwarded when unfiltered");

        bridge.detach();
        store.sourceTable().insert(sourceRow(2));
        CHECK(sources == 1, "Detached bridge is silent");
        CHECK(store.sourceTable().callbackCount() == 0, "Callbacks removed");
    }

    return success ? 0 : 1;
}
