// Energy spires: cardinal placement, part lifecycle, ring charge, sphere flashes.
#include <cmath>
#include <string>

#include <glm/geometric.hpp>

#include "TestCheck.h"
#include "core/EventBus.h"
#include "game/SpireManager.h"
#include "net/LocalStore.h"
#include "net/StoreEventBridge.h"
#include "scene/SceneGraph.h"

using game::SpireManager;
using test::approx;

namespace {

bool near(const glm::vec3& a, const glm::vec3& b, float eps = 1e-3f) {
    return glm::distance(a, b) <= eps;
}

net::DistributionSphere sphereRow(uint64_t id, uint64_t routed = 0) {
    net::DistributionSphere s;
    s.sphereId = id;
    s.cardinalDirection = "North";
    s.spherePosition = {0.0f, 300.0f, 0.0f};
    s.packetsRouted = routed;
    return s;
}

net::QuantumTunnel tunnelRow(uint64_t id, float charge, const std::string& color = "Red") {
    net::QuantumTunnel t;
    t.tunnelId = id;
    t.cardinalDirection = "West";
    t.tunnelColor = color;
    t.ringCharge = charge;
    return t;
}

} // namespace

int main() {
    bool success = true;

    // Cardinal names: faces, edges, corners, and what does not parse
    {
        auto north = game::cardinalDirection("North");
        CHECK(north && near(*north, {0.0f, 1.0f, 0.0f}), "North is +Y");
        auto edge = game::cardinalDirection("EastForward");
        const float h = 1.0f / std::sqrt(2.0f);
        CHECK(edge && near(*edge, {h, 0.0f, h}), "Edge centre between East and Forward");
        auto corner = game::cardinalDirection("SouthWestBack");
        const float c = 1.0f / std::sqrt(3.0f);
        CHECK(corner && near(*corner, {-c, -c, -c}), "Corner between three negatives");
        CHECK(!game::cardinalDirection(""), "Empty name");
        CHECK(!game::cardinalDirection("Up"), "Unknown word");
        CHECK(!game::cardinalDirection("NorthSouth"), "Opposites do not combine");
        CHECK(!game::cardinalDirection("ForwardNorth"), "Parts come in North/East/Forward order");

        CHECK(approx(game::tunnelColor("Cyan").g, 1.0f) && approx(game::tunnelColor("Cyan").r, 0.0f), "Cyan ring");
        CHECK(approx(game::tunnelColor("Purple").r, 0.5f), "Unknown colours are grey");
    }

    // Bus-driven lifecycle of the three spire parts
    {
        core::EventBus bus(core::EventBus::Config{100, false});
        scene::SceneGraph scene;
        SpireManager spires(bus, scene);
        spires.attach();

        core::InitialSpiresLoadedEvent load;
        load.circuits = {{1, {}, "East"}};
        load.spheres = {sphereRow(1)};
        load.tunnels = {tunnelRow(1, 50.0f)};
        bus.publish(load);
        CHECK(spires.circuitCount() == 1 && spires.sphereCount() == 1 && spires.tunnelCount() == 1,
              "Initial load creates every part");

        const scene::Node* circuit = scene.find(spires.nodeForCircuit(1));
        CHECK(circuit && near(circuit->position, {300.0f, 0.0f, 0.0f}), "Circuit sits on the surface");
        CHECK(circuit && circuit->kind == scene::NodeKind::Circuit && approx(circuit->scale, 4.0f), "Circuit base");
        CHECK(circuit && circuit->name == "Circuit_1_East", "Circuit name (got %s)",
              circuit ? circuit->name.c_str() : "<none>");

        const scene::Node* sphere = scene.find(spires.nodeForSphere(1));
        CHECK(sphere && near(sphere->position, {0.0f, 305.0f, 0.0f}), "Sphere floats above its base");
        CHECK(sphere && sphere->label == "0 routed", "Sphere label (got %s)", sphere ? sphere->label.c_str() : "");

        const scene::Node* tunnel = scene.find(spires.nodeForTunnel(1));
        CHECK(tunnel && near(tunnel->position, {-310.0f, 0.0f, 0.0f}), "Ring tops the spire");
        CHECK(tunnel && approx(tunnel->emission, 0.5f) && approx(tunnel->color.r, 1.0f), "Half charged red ring");
        CHECK(tunnel && tunnel->label == "50%", "Charge label (got %s)", tunnel ? tunnel->label.c_str() : "");

        bus.publish(core::SphereInsertedEvent{sphereRow(1)});
        CHECK(spires.sphereCount() == 1 && spires.stats().duplicates == 1, "Known sphere is not created twice");

        // Routing packets through a sphere flashes it
        bus.publish(core::SphereUpdatedEvent{sphereRow(1), sphereRow(1, 2)});
        CHECK(scene.effectCount(scene::EffectKind::SpireFlash) == 1, "Routed packets flash the sphere");
        CHECK(!scene.effects().empty() && near(scene.effects().back().position, {0.0f, 305.0f, 0.0f}),
              "Flash at the sphere");
        sphere = scene.find(spires.nodeForSphere(1));
        CHECK(sphere && sphere->label == "2 routed", "Routed count shown");
        bus.publish(core::SphereUpdatedEvent{sphereRow(1, 2), sphereRow(1, 2)});
        CHECK(spires.stats().flashes == 1, "No flash without new traffic");
        CHECK(!spires.flashSphere(99), "Unknown sphere cannot flash");
        scene.update(1.0f);
        CHECK(scene.effectCount(scene::EffectKind::SpireFlash) == 0, "Flash fades after half a second");

        bus.publish(core::TunnelUpdatedEvent{tunnelRow(1, 50.0f), tunnelRow(1, 150.0f)});
        tunnel = scene.find(spires.nodeForTunnel(1));
        CHECK(tunnel && approx(tunnel->emission, 1.0f) && tunnel->label == "100%", "Charge clamps at 100");
        bus.publish(core::TunnelUpdatedEvent{tunnelRow(1, 150.0f), tunnelRow(1, 0.0f, "Blue")});
        tunnel = scene.find(spires.nodeForTunnel(1));
        CHECK(tunnel && approx(tunnel->emission, 0.0f) && approx(tunnel->color.b, 1.0f), "Empty blue ring is dark");

        bus.publish(core::TunnelUpdatedEvent{tunnelRow(7, 10.0f), tunnelRow(7, 20.0f)});
        CHECK(spires.tunnelCount() == 1, "Update of an unknown ring creates nothing");

        bus.publish(core::CircuitInsertedEvent{{2, {}, "Up"}});
        circuit = scene.find(spires.nodeForCircuit(2));
        CHECK(circuit && near(circuit->position, {0.0f, 300.0f, 0.0f}), "Unknown direction falls back to North");

        bus.publish(core::SphereDeletedEvent{sphereRow(1)});
        CHECK(spires.sphereCount() == 0 && !spires.flashSphere(1), "Deleted sphere is gone");

        bus.publish(core::WorldTransitionStartedEvent{{0, 0, 0}, {1, 0, 0}});
        CHECK(spires.circuitCount() == 0 && spires.tunnelCount() == 0 && scene.nodeCount() == 0,
              "World transition clears the spires");
    }

    // Rows from the store reach the scene through the bridge, filtered to the world
    {
        net::LocalStore store;
        core::EventBus bus(core::EventBus::Config{100, false});
        scene::SceneGraph scene;
        net::StoreEventBridge bridge(store, bus);
        SpireManager spires(bus, scene);
        bridge.attach();
        spires.attach();

        net::Player me;
        me.playerId = 1;
        me.identity = "me";
        me.position = {0.0f, 300.0f, 0.0f};
        store.playerTable().insert(me);
        store.circuitTable().insert({1, {}, "North"});
        store.sphereTable().insert(sphereRow(1));
        auto remote = sphereRow(2);
        remote.worldCoords = {1, 0, 0};
        store.sphereTable().insert(remote);

        bus.publish(core::ConnectionStartedEvent{"local://test"});
        store.connect("me", "tok");
        CHECK(store.applySubscription(), "Subscription applied");
        CHECK(spires.circuitCount() == 1 && spires.sphereCount() == 1, "Only this world's spire is shown");

        store.tunnelTable().insert(tunnelRow(1, 30.0f));
        auto elsewhere = tunnelRow(2, 30.0f);
        elsewhere.worldCoords = {0, 1, 0};
        store.tunnelTable().insert(elsewhere);
        CHECK(spires.tunnelCount() == 1, "Rings from other worlds are filtered");

        auto routed = sphereRow(1, 1);
        store.sphereTable().update(routed);
        CHECK(spires.stats().flashes == 1, "Server-side routing count drives the flash");

        store.disconnect("bye");
        CHECK(bus.state() == core::GameState::Disconnected, "Session dropped");
        CHECK(spires.sphereCount() == 0 && scene.nodeCount() == 0, "Disconnect clears the spires");
    }

    return success ? 0 : 1;
}
