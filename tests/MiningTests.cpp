// Mining sessions: extraction nodes, extracted packets, the miner slot table.
#include <string>

#include <glm/geometric.hpp>

#include "TestCheck.h"
#include "core/EventBus.h"
#include "core/FrameScheduler.h"
#include "game/Frequency.h"
#include "game/MiningVisuals.h"
#include "math/Spherical.h"
#include "net/LocalStore.h"
#include "net/StoreEventBridge.h"
#include "scene/SceneGraph.h"

using game::MiningVisuals;
using test::approx;

namespace {

net::Player minerRow(uint64_t id, const glm::vec3& position, const std::string& identity = "") {
    net::Player p;
    p.playerId = id;
    p.identity = identity.empty() ? "miner-" + std::to_string(id) : identity;
    p.name = "Miner " + std::to_string(id);
    p.position = net::toDb(position);
    return p;
}

net::WavePacketSource sourceRow(uint64_t id, const glm::vec3& position, net::WorldCoords world = {}) {
    net::WavePacketSource s;
    s.sourceId = id;
    s.worldCoords = world;
    s.position = net::toDb(position);
    s.destination = s.position;
    s.state = static_cast<uint8_t>(net::SourceState::Stationary);
    s.composition = {{game::frequency::kGreen, 30}};
    s.totalWavePackets = 30;
    return s;
}

net::MiningSession sessionRow(uint64_t id, uint64_t playerId, uint64_t sourceId, uint32_t extracted = 0) {
    net::MiningSession m;
    m.sessionId = id;
    m.playerId = playerId;
    m.sourceId = sourceId;
    m.crystalComposition = {{game::frequency::kGreen, 1}};
    m.totalExtracted = extracted;
    return m;
}

} // namespace

int main() {
    bool success = true;
    const glm::vec3 minerPos = math::adjustHeight({0.0f, 1.0f, 0.0f}, 0.0f);
    const glm::vec3 sourcePos = math::adjustHeight({0.1f, 1.0f, 0.0f}, 1.0f);

    // Session lifecycle driven by bus events
    {
        net::LocalStore store;
        core::EventBus bus(core::EventBus::Config{100, false});
        core::FrameScheduler scheduler;
        scene::SceneGraph scene;
        MiningVisuals mining(bus, store, scheduler, scene);
        mining.attach();

        store.playerTable().insert(minerRow(2, minerPos));
        store.sourceTable().insert(sourceRow(5, sourcePos));

        bus.publish(core::MiningSessionStartedEvent{sessionRow(1, 2, 5)});
        CHECK(mining.sessionCount() == 1 && mining.isPlayerMining(2), "Session started");
        const auto* ext = mining.extraction(1);
        CHECK(ext && approx(ext->color.g, 1.0f) && approx(ext->color.r, 0.0f), "Tinted by the crystal");
        const scene::Node* node = ext ? scene.find(ext->node) : nullptr;
        CHECK(node && node->kind == scene::NodeKind::Extraction && glm::distance(node->position, sourcePos) < 1e-3f,
              "Extraction shown at the source");
        CHECK(node && node->label == "0 extracted", "Extraction label (got %s)", node ? node->label.c_str() : "");
        CHECK(mining.activeSlotCount() == 1, "One miner slot in use");
        CHECK(glm::distance(glm::vec3(mining.slots()[0].position), minerPos) < 1e-3f &&
                  approx(mining.slots()[0].position.w, 1.0f) && approx(mining.slots()[0].color.g, 1.0f),
              "Slot holds the miner position and crystal colour");

        bus.publish(core::MiningSessionStartedEvent{sessionRow(2, 2, 99)});
        CHECK(mining.sessionCount() == 1, "Session on an unknown source is skipped");

        // Extraction progress launches packets toward the miner
        bus.publish(core::MiningSessionUpdatedEvent{sessionRow(1, 2, 5), sessionRow(1, 2, 5, 4)});
        CHECK(mining.flyingPacketCount() == 1 && mining.stats().packetsLaunched == 1, "Packet launched");
        CHECK(scene.nodeCount(scene::NodeKind::ExtractedPacket) == 1, "Packet node created");
        node = scene.findByName("Extraction_1");
        CHECK(node && node->label == "4 extracted", "Running total shown");
        bus.publish(core::MiningSessionUpdatedEvent{sessionRow(1, 2, 5, 4), sessionRow(1, 2, 5, 4)});
        CHECK(mining.stats().packetsLaunched == 1, "No packet without new extraction");

        int frames = 0;
        while (mining.flyingPacketCount() > 0 && frames < 200) {
            mining.update(0.1f);
            ++frames;
        }
        CHECK(mining.flyingPacketCount() == 0 && mining.stats().packetsArrived == 1,
              "Packet reaches the miner (frames=%d)", frames);
        CHECK(scene.nodeCount(scene::NodeKind::ExtractedPacket) == 0, "Landed packet removed");

        // Slots follow the miner on the refresh interval
        const glm::vec3 moved = math::adjustHeight({0.0f, 1.0f, 0.1f}, 0.0f);
        store.playerTable().update(minerRow(2, moved));
        scheduler.tick(0.1);
        CHECK(glm::distance(glm::vec3(mining.slots()[0].position), moved) < 1e-3f, "Slot refreshed");

        // A miner who leaves ends the session
        store.playerTable().remove(2);
        scheduler.tick(0.1);
        CHECK(!mining.isPlayerMining(2) && mining.sessionCount() == 0, "Departed miner dropped");
        CHECK(mining.stats().sessionsEnded == 1 && scene.nodeCount() == 0, "Extraction node removed");
        CHECK(mining.activeSlotCount() == 0, "Slot released");
    }

    // The slot table is bounded; the extra sessions are still tracked
    {
        net::LocalStore store;
        core::EventBus bus(core::EventBus::Config{100, false});
        core::FrameScheduler scheduler;
        scene::SceneGraph scene;
        MiningVisuals mining(bus, store, scheduler, scene);
        mining.attach();

        store.sourceTable().insert(sourceRow(5, sourcePos));
        for (uint64_t i = 0; i < 12; ++i) {
            store.playerTable().insert(minerRow(10 + i, minerPos));
            bus.publish(core::MiningSessionStartedEvent{sessionRow(100 + i, 10 + i, 5)});
        }
        CHECK(mining.sessionCount() == 12, "Every session tracked");
        CHECK(mining.activeSlotCount() == MiningVisuals::kMaxMiners, "Slots capped at %zu (got %zu)",
              MiningVisuals::kMaxMiners, mining.activeSlotCount());

        bus.publish(core::MiningSessionEndedEvent{sessionRow(100, 10, 5)});
        CHECK(mining.sessionCount() == 11 && !mining.isPlayerMining(10), "Ended session removed");

        bus.publish(core::WorldTransitionStartedEvent{{0, 0, 0}, {1, 0, 0}});
        CHECK(mining.sessionCount() == 0 && scene.nodeCount() == 0 && mining.activeSlotCount() == 0,
              "World transition clears mining");
    }

    // Sessions arrive through the bridge and follow the world of their source
    {
        net::LocalStore store;
        core::EventBus bus(core::EventBus::Config{100, false});
        core::FrameScheduler scheduler;
        scene::SceneGraph scene;
        net::StoreEventBridge bridge(store, bus);
        MiningVisuals mining(bus, store, scheduler, scene);
        bridge.attach();
        mining.attach();

        store.playerTable().insert(minerRow(1, minerPos, "me"));
        store.sourceTable().insert(sourceRow(5, sourcePos));
        store.sourceTable().insert(sourceRow(6, sourcePos, {1, 0, 0}));
        store.miningSessionTable().insert(sessionRow(1, 1, 5));

        bus.publish(core::ConnectionStartedEvent{"local://test"});
        store.connect("me", "tok");
        CHECK(store.applySubscription(), "Subscription applied");
        CHECK(mining.sessionCount() == 1 && mining.isPlayerMining(1), "Running session picked up on world load");

        store.miningSessionTable().insert(sessionRow(2, 1, 6));
        CHECK(mining.sessionCount() == 1, "Session on another world's source ignored");

        store.miningSessionTable().update(sessionRow(1, 1, 5, 3));
        CHECK(mining.stats().packetsLaunched == 1, "Extraction forwarded");

        store.sourceTable().remove(5);
        store.miningSessionTable().remove(1);
        CHECK(mining.sessionCount() == 0, "End announced even after the source vanished");

        mining.detach();
        bus.publish(core::MiningSessionStartedEvent{sessionRow(3, 1, 6)});
        CHECK(mining.sessionCount() == 0, "Detached view hears nothing");
    }

    return success ? 0 : 1;
}
