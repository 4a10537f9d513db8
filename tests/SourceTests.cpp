// Source dead reckoning and the source scene mirror.
#include <cmath>
#include <string>

#include <glm/geometric.hpp>

#include "TestCheck.h"
#include "core/EventBus.h"
#include "game/Frequency.h"
#include "game/SourceManager.h"
#include "game/SourceMovement.h"
#include "scene/SceneGraph.h"

using game::SourceMovement;
using test::approx;

namespace {

constexpr float R = 300.0f;
constexpr uint8_t kMoving = static_cast<uint8_t>(net::SourceState::MovingHorizontal);
constexpr uint8_t kArrived = static_cast<uint8_t>(net::SourceState::ArrivedAtSurface);
constexpr uint8_t kRising = static_cast<uint8_t>(net::SourceState::Rising);
constexpr uint8_t kStationary = static_cast<uint8_t>(net::SourceState::Stationary);

net::WavePacketSource makeSource(uint64_t id, uint8_t state, uint32_t packets) {
    net::WavePacketSource s;
    s.sourceId = id;
    s.position = {R, 0.0f, 0.0f};
    s.velocity = {0.0f, 0.0f, 6.0f};
    s.destination = {0.0f, 0.0f, R};
    s.state = state;
    s.totalWavePackets = packets;
    s.composition = {{game::frequency::kRed, packets / 2}, {game::frequency::kBlue, packets - packets / 2}};
    return s;
}

} // namespace

int main() {
    bool success = true;

    // Horizontal prediction follows the great circle at the server speed
    {
        SourceMovement m;
        m.initialize({R, 0.0f, 0.0f}, {0.0f, 0.0f, 6.0f}, {0.0f, 0.0f, R}, kMoving);
        CHECK(m.isActive(), "Moving source should be active");
        const glm::vec3 p = m.predict(1.0f);
        CHECK(approx(glm::length(p), R, 1e-2f), "Prediction stays on the surface (len=%g)", glm::length(p));
        CHECK(approx(p.z, 6.0f, 0.05f), "Moved ~6 units toward +Z (z=%g)", p.z);
        CHECK(approx(p.y, 0.0f, 1e-3f), "No drift off the great circle (y=%g)", p.y);
    }

    // Prediction clamps to the destination once the distance is covered
    {
        SourceMovement m;
        const glm::vec3 dest(R * std::cos(0.01f), 0.0f, R * std::sin(0.01f));
        m.initialize({R, 0.0f, 0.0f}, {0.0f, 0.0f, 6.0f}, dest, kMoving);
        const glm::vec3 p = m.predict(1.0f);
        CHECK(glm::length(p - dest) < 1e-3f, "Overshoot should clamp to the destination");
    }

    // Arrival, rise, completion
    {
        SourceMovement m;
        m.initialize({R, 0.0f, 0.0f}, {0.0f, 0.0f, 6.0f}, {0.0f, 0.0f, R}, kMoving);
        auto change = m.updateFromServer({0.0f, 0.0f, R}, {0.0f, 0.0f, 0.0f}, {0.0f, 0.0f, R}, kArrived);
        CHECK(change && change->from == kMoving && change->to == kArrived, "State change reported");
        CHECK(glm::length(m.predict(3.0f) - glm::vec3(0.0f, 0.0f, R)) < 1e-3f, "Arrived holds at the destination");

        change = m.updateFromServer({0.0f, 0.0f, R}, {0.0f, 0.0f, 0.0f}, {0.0f, 0.0f, R}, kRising);
        CHECK(change.has_value(), "Rising is a state change");
        CHECK(approx(glm::length(m.predict(0.25f)), R + 0.5f, 1e-3f), "Rises at 2 units/s");
        CHECK(approx(glm::length(m.predict(5.0f)), R + 1.0f, 1e-3f), "Rise caps at height 1");
        CHECK(approx(m.recommendedAlpha(), 0.8f), "Rising alpha");

        // dt * interpolationSpeed >= 1 snaps onto the prediction
        m.tick(0.2f);
        CHECK(approx(glm::length(m.position()), R + 0.4f, 1e-3f), "Tick follows the rise (len=%g)",
              glm::length(m.position()));

        auto same = m.updateFromServer({0.0f, 0.0f, R}, {0.0f, 0.0f, 0.0f}, {0.0f, 0.0f, R}, kRising);
        CHECK(!same.has_value(), "Same state does not re-anchor");

        m.updateFromServer({0.0f, 0.0f, R + 1.0f}, {0.0f, 0.0f, 0.0f}, {0.0f, 0.0f, R}, kStationary);
        CHECK(!m.isActive() && m.isComplete(), "Stationary completes the movement");
        CHECK(glm::length(m.position() - glm::vec3(0.0f, 0.0f, R + 1.0f)) < 1e-3f, "Completion snaps to final height");
        CHECK(approx(game::recommendedSourceAlpha(kStationary), 1.0f), "Stationary is opaque");
    }

    // Manager: inserts, duplicates, labels and alpha
    {
        core::EventBus bus(core::EventBus::Config{100, false});
        scene::SceneGraph scene;
        game::SourceManager sources(bus, scene);
        sources.attach();

        bus.publish(core::SourceInsertedEvent{makeSource(1, kMoving, 10)});
        bus.publish(core::SourceInsertedEvent{makeSource(1, kMoving, 10)});
        CHECK(sources.sourceCount() == 1, "Duplicate insert skipped");
        CHECK(sources.stats().skipped == 1, "Skip counted");
        const scene::Node* node = scene.find(sources.nodeFor(1));
        CHECK(node && node->label == "10 packets", "Packet label");
        CHECK(node && approx(node->color.a, 0.6f), "Moving sources are translucent");
        CHECK(sources.movement(1) && sources.movement(1)->isActive(), "Moving source gets dead reckoning");

        auto mined = makeSource(1, kMoving, 10);
        mined.activeMinerCount = 2;
        bus.publish(core::SourceUpdatedEvent{makeSource(1, kMoving, 10), mined});
        node = scene.find(sources.nodeFor(1));
        CHECK(node && node->label == "10 packets (2 mining)", "Mining label (got %s)",
              node ? node->label.c_str() : "<none>");

        sources.update(0.2f);
        node = scene.find(sources.nodeFor(1));
        CHECK(node && node->position.z > 0.0f, "Update moves the node along the path");

        bus.publish(core::SourceInsertedEvent{makeSource(2, kStationary, 4)});
        CHECK(sources.movement(2) == nullptr, "Stationary source has no movement");
        node = scene.find(sources.nodeFor(2));
        CHECK(node && approx(node->color.a, 1.0f), "Stationary source is opaque");

        bus.publish(core::SourceDeletedEvent{makeSource(2, kStationary, 4)});
        CHECK(!sources.hasSource(2) && scene.nodeCount(scene::NodeKind::Source) == 1, "Delete removes the node");
    }

    // Dissipation needs a dropped total and a new lastDissipation
    {
        core::EventBus bus(core::EventBus::Config{100, false});
        scene::SceneGraph scene;
        game::SourceManager sources(bus, scene);
        sources.attach();
        auto before = makeSource(3, kStationary, 10);
        bus.publish(core::SourceInsertedEvent{before});

        auto minedOnly = before;
        minedOnly.totalWavePackets = 9;
        minedOnly.composition[0].count -= 1;
        bus.publish(core::SourceUpdatedEvent{before, minedOnly});
        CHECK(scene.effectCount(scene::EffectKind::Dissipation) == 0, "Mining alone is not dissipation");

        auto decayed = minedOnly;
        decayed.totalWavePackets = 8;
        decayed.composition[1].count -= 1;
        decayed.lastDissipation = 42;
        bus.publish(core::SourceUpdatedEvent{minedOnly, decayed});
        CHECK(scene.effectCount(scene::EffectKind::Dissipation) == 1, "Dissipation effect spawned");
        CHECK(sources.stats().dissipations == 1, "Dissipation counted");
        scene.update(5.0f);
        CHECK(scene.effects().empty(), "Effect expires");
    }

    // Initial load and world transition
    {
        core::EventBus bus(core::EventBus::Config{100, false});
        scene::SceneGraph scene;
        game::SourceManager sources(bus, scene);
        sources.attach();
        core::InitialSourcesLoadedEvent load;
        load.sources = {makeSource(1, kMoving, 5), makeSource(2, kRising, 5), makeSource(1, kMoving, 5)};
        bus.publish(load);
        CHECK(sources.stats().lastInitialCreated == 2 && sources.stats().lastInitialSkipped == 1,
              "Initial load counts (created=%u skipped=%u)", sources.stats().lastInitialCreated,
              sources.stats().lastInitialSkipped);
        bus.publish(core::WorldTransitionStartedEvent{{0, 0, 0}, {1, 0, 0}});
        CHECK(sources.sourceCount() == 0 && scene.nodeCount() == 0, "World transition clears the sources");

        bus.publish(load);
        CHECK(sources.sourceCount() == 2, "Reloaded after the transition");
        bus.publish(core::ConnectionStartedEvent{"local://test"});
        bus.publish(core::ConnectionLostEvent{"timeout"});
        CHECK(sources.sourceCount() == 0 && scene.nodeCount() == 0, "Disconnect clears the sources");

        sources.detach();
        bus.publish(core::SourceInsertedEvent{makeSource(9, kMoving, 1)});
        CHECK(sources.sourceCount() == 0, "Detached manager ignores events");
    }

    return success ? 0 : 1;
}
