#include "DemoScenario.h"

#include <algorithm>

#include <glm/geometric.hpp>
#include <glm/gtc/quaternion.hpp>
#include <spdlog/spdlog.h>

#include "game/Frequency.h"
#include "math/Spherical.h"

namespace app {

namespace {
constexpr uint64_t kLocalPlayerId = 1;
constexpr uint64_t kWandererId = 2;
constexpr uint64_t kFarawayId = 3;
constexpr uint64_t kMovingSourceId = 1;
constexpr uint64_t kMinedSourceId = 2;
constexpr uint64_t kOtherWorldSourceId = 3;
constexpr uint64_t kHomeDeviceId = 10;
constexpr uint64_t kSpireId = 1;
constexpr uint64_t kSphereAId = 1;
constexpr uint64_t kSphereBId = 2;
constexpr uint64_t kMiningSessionId = 1;
constexpr float kSourceMoveSpeed = 6.0f;
constexpr float kSphereHeight = 10.0f;

const net::WorldCoords kCenterWorld{0, 0, 0};
const net::WorldCoords kEastWorld{1, 0, 0};

glm::vec3 surfacePoint(const glm::vec3& dir, float height = 0.0f) {
    return math::adjustHeight(dir, height);
}

net::Player makePlayer(uint64_t id, const std::string& identity, const std::string& name, const glm::vec3& pos) {
    net::Player p;
    p.identity = identity;
    p.playerId = id;
    p.name = name;
    p.currentWorld = kCenterWorld;
    p.position = net::toDb(pos);
    p.rotation = net::toDb(math::surfaceOrientation(pos));
    return p;
}
}

DemoScenario::DemoScenario(net::LocalStore& store, core::FrameScheduler& scheduler)
    : DemoScenario(store, scheduler, Config{}) {}

DemoScenario::DemoScenario(net::LocalStore& store, core::FrameScheduler& scheduler, const Config& config)
    : store_(store), scheduler_(scheduler), config_(config) {}

DemoScenario::~DemoScenario() {
    stop();
}

void DemoScenario::start() {
    seed();
    scheduleScript();
    spdlog::info("[demo] scenario started ({} timers)", timers_.size());
}

void DemoScenario::stop() {
    for (core::TimerId id : timers_) scheduler_.cancel(id);
    timers_.clear();
}

void DemoScenario::seed() {
    auto& players = store_.playerTable();
    players.insert(makePlayer(kLocalPlayerId, config_.localIdentity, "Explorer", surfacePoint({0.0f, 1.0f, 0.0f})));
    players.insert(makePlayer(kWandererId, "identity-wanderer", "Wanderer", surfacePoint({0.06f, 1.0f, 0.0f})));
    players.insert(makePlayer(kFarawayId, "identity-faraway", "Faraway", surfacePoint({1.0f, 1.0f, 0.0f})));

    sphereA_ = surfacePoint({0.05f, 1.0f, 0.1f}, kSphereHeight);
    sphereB_ = surfacePoint({-0.05f, 1.0f, 0.15f}, kSphereHeight);

    net::WavePacketSource moving;
    moving.sourceId = kMovingSourceId;
    moving.worldCoords = kCenterWorld;
    const glm::vec3 start = surfacePoint({-0.1f, 1.0f, 0.05f});
    const glm::vec3 dest = surfacePoint({-0.2f, 1.0f, 0.12f});
    const glm::vec3 n = math::surfaceNormal(start);
    const glm::vec3 chord = dest - start;
    const glm::vec3 tangent = glm::normalize(chord - n * glm::dot(chord, n));
    moving.position = net::toDb(start);
    moving.velocity = net::toDb(tangent * kSourceMoveSpeed);
    moving.destination = net::toDb(dest);
    moving.state = static_cast<uint8_t>(net::SourceState::MovingHorizontal);
    moving.composition = {{game::frequency::kYellow, 8}, {game::frequency::kCyan, 4}};
    moving.totalWavePackets = net::totalCount(moving.composition);
    store_.sourceTable().insert(moving);

    net::WavePacketSource mined;
    mined.sourceId = kMinedSourceId;
    mined.worldCoords = kCenterWorld;
    mined.position = net::toDb(surfacePoint({0.1f, 1.0f, -0.05f}, 1.0f));
    mined.destination = mined.position;
    mined.state = static_cast<uint8_t>(net::SourceState::Stationary);
    mined.composition = {{game::frequency::kRed, 20}, {game::frequency::kBlue, 10}};
    mined.totalWavePackets = net::totalCount(mined.composition);
    mined.activeMinerCount = 2;
    store_.sourceTable().insert(mined);

    net::WavePacketSource remote;
    remote.sourceId = kOtherWorldSourceId;
    remote.worldCoords = kEastWorld;
    remote.position = net::toDb(surfacePoint({0.0f, 1.0f, 0.2f}, 1.0f));
    remote.destination = remote.position;
    remote.state = static_cast<uint8_t>(net::SourceState::Stationary);
    remote.composition = {{game::frequency::kMagenta, 15}};
    remote.totalWavePackets = 15;
    store_.sourceTable().insert(remote);

    net::StorageDevice home;
    home.deviceId = kHomeDeviceId;
    home.ownerPlayerId = kLocalPlayerId;
    home.deviceName = "Home Storage";
    home.worldCoords = kCenterWorld;
    home.position = net::toDb(surfacePoint({0.0f, 1.0f, -0.08f}, 1.0f));
    home.capacityPerFrequency = 50;
    home.storedComposition = {{game::frequency::kGreen, 40}};
    store_.deviceTable().insert(home);

    // One spire over the north pole; its two spheres carry the transfer routes.
    store_.circuitTable().insert({kSpireId, kCenterWorld, "North"});
    store_.sphereTable().insert({kSphereAId, kCenterWorld, "North", net::toDb(math::constrainToSurface(sphereA_)), 0});
    store_.sphereTable().insert({kSphereBId, kCenterWorld, "North", net::toDb(math::constrainToSurface(sphereB_)), 0});
    store_.tunnelTable().insert({kSpireId, kCenterWorld, "North", "Cyan", 20.0f});

    net::MiningSession session;
    session.sessionId = kMiningSessionId;
    session.playerId = kWandererId;
    session.sourceId = kMinedSourceId;
    session.crystalComposition = {{game::frequency::kRed, 1}};
    store_.miningSessionTable().insert(session);
    spdlog::debug("[demo] seeded {} players, {} sources, {} devices, {} spheres", store_.playerTable().count(),
                  store_.sourceTable().count(), store_.deviceTable().count(), store_.sphereTable().count());
}

void DemoScenario::scheduleScript() {
    timers_.push_back(scheduler_.after(config_.connectDelay, [this]() {
        store_.connect(config_.localIdentity, config_.token);
    }));
    timers_.push_back(scheduler_.after(config_.connectDelay + config_.subscribeDelay, [this]() {
        if (!store_.applySubscription()) spdlog::warn("[demo] no subscription was requested");
    }));
    timers_.push_back(scheduler_.every(0.1, [this]() {
        walkWanderer();
        return true;
    }));
    timers_.push_back(scheduler_.after(2.0, [this]() {
        store_.messageTable().insert({nextMessageId_++, kWandererId, "Wanderer",
                                      "Hello there! Those sources look rich, want to mine together? See you at the spire."});
    }));
    timers_.push_back(scheduler_.after(3.5, [this]() {
        store_.messageTable().insert({nextMessageId_++, kFarawayId, "Faraway", "brb"});
    }));
    timers_.push_back(scheduler_.after(4.0, [this]() { startTransfers(); }));

    // Moving source: arrive, rise, settle.
    timers_.push_back(scheduler_.after(4.5, [this]() {
        auto s = store_.sourceTable().find(kMovingSourceId);
        if (!s) return;
        s->position = s->destination;
        s->velocity = {};
        s->state = static_cast<uint8_t>(net::SourceState::ArrivedAtSurface);
        store_.sourceTable().update(*s);
    }));
    timers_.push_back(scheduler_.after(5.5, [this]() {
        auto s = store_.sourceTable().find(kMovingSourceId);
        if (!s) return;
        s->state = static_cast<uint8_t>(net::SourceState::Rising);
        store_.sourceTable().update(*s);
    }));
    timers_.push_back(scheduler_.after(6.5, [this]() {
        auto s = store_.sourceTable().find(kMovingSourceId);
        if (!s) return;
        s->position = net::toDb(math::adjustHeight(net::toVec3(s->destination), 1.0f));
        s->state = static_cast<uint8_t>(net::SourceState::Stationary);
        store_.sourceTable().update(*s);
    }));

    // Mining drains the stationary source.
    timers_.push_back(scheduler_.every(2.0, [this]() {
        auto s = store_.sourceTable().find(kMinedSourceId);
        if (!s || s->composition.empty() || s->composition.front().count < 3) return false;
        s->composition.front().count -= 3;
        s->totalWavePackets = net::totalCount(s->composition);
        ++s->lastDissipation;
        store_.sourceTable().update(*s);
        if (auto session = store_.miningSessionTable().find(kMiningSessionId)) {
            session->totalExtracted += 3;
            store_.miningSessionTable().update(*session);
        }
        return true;
    }));
    timers_.push_back(scheduler_.after(12.0, [this]() {
        spdlog::info("[demo] Wanderer stops mining");
        store_.miningSessionTable().remove(kMiningSessionId);
    }));

    // The spire's ring charges up while the session runs.
    timers_.push_back(scheduler_.every(2.0, [this]() {
        auto t = store_.tunnelTable().find(kSpireId);
        if (!t || t->ringCharge >= 100.0f) return false;
        t->ringCharge = std::min(100.0f, t->ringCharge + 10.0f);
        store_.tunnelTable().update(*t);
        return true;
    }));

    timers_.push_back(scheduler_.after(10.0, [this]() {
        spdlog::info("[demo] Faraway logs off");
        store_.playerTable().remove(kFarawayId);
    }));
    if (config_.worldHop) {
        timers_.push_back(scheduler_.after(config_.worldHopTime, [this]() { hopWorld(); }));
    }
}

void DemoScenario::walkWanderer() {
    auto p = store_.playerTable().find(kWandererId);
    if (!p) return;
    const glm::vec3 pos = net::toVec3(p->position);
    const glm::quat step = glm::angleAxis(0.002f, glm::vec3(0.0f, 0.0f, 1.0f));
    const glm::vec3 next = step * pos;
    const glm::vec3 heading = math::safeNormalize(next - pos, glm::vec3(0.0f, 0.0f, 1.0f));
    p->position = net::toDb(next);
    p->rotation = net::toDb(math::lookRotation(heading, math::surfaceNormal(next)));
    store_.playerTable().update(*p);
}

void DemoScenario::startTransfers() {
    auto local = store_.playerTable().find(kLocalPlayerId);
    auto device = store_.deviceTable().find(kHomeDeviceId);
    if (!local || !device) {
        spdlog::warn("[demo] cannot start transfers, local player or home device missing");
        return;
    }
    const std::vector<net::DbVector3> route = {
        net::toDb(math::adjustHeight(net::toVec3(local->position), 1.0f)),
        net::toDb(sphereA_),
        net::toDb(sphereB_),
        device->position,
    };
    const net::Composition composition = {{game::frequency::kRed, 3}, {game::frequency::kGreen, 2}};
    // Two identical departures; the leg view merges them into one packet.
    for (int i = 0; i < 2; ++i) {
        net::PacketTransfer t;
        t.transferId = nextTransferId_++;
        t.playerId = kLocalPlayerId;
        t.composition = composition;
        t.routeWaypoints = route;
        t.destinationDeviceId = kHomeDeviceId;
        t.currentLegType = net::TransferLegType::PendingAtObject;
        store_.transferTable().insert(t);
        legTransfers_.push_back(t.transferId);
    }
    spdlog::info("[demo] {} transfers queued to '{}'", legTransfers_.size(), device->deviceName);
    timers_.push_back(scheduler_.every(config_.legInterval, [this]() {
        advanceLegs();
        return !legTransfers_.empty();
    }));
}

void DemoScenario::advanceLegs() {
    using L = net::TransferLegType;
    const std::vector<uint64_t> ids = legTransfers_;
    for (uint64_t id : ids) {
        auto t = store_.transferTable().find(id);
        if (!t) {
            legTransfers_.erase(std::remove(legTransfers_.begin(), legTransfers_.end(), id), legTransfers_.end());
            continue;
        }
        const uint32_t lastLeg = static_cast<uint32_t>(t->routeWaypoints.size()) - 2;
        switch (t->currentLegType) {
            case L::PendingAtObject:
                t->currentLegType = L::ObjectToSphere;
                break;
            case L::ObjectToSphere:
                t->currentLegType = L::ArrivedAtSphere;
                routeThrough(kSphereAId);
                break;
            case L::SphereToSphere:
                routeThrough(kSphereBId);
                [[fallthrough]];
            case L::ArrivedAtSphere:
                ++t->currentLeg;
                t->currentLegType = t->currentLeg >= lastLeg ? L::SphereToObject : L::SphereToSphere;
                break;
            case L::SphereToObject: {
                auto device = store_.deviceTable().find(t->destinationDeviceId);
                if (device) {
                    game::frequency::mergeInto(device->storedComposition, t->composition);
                    store_.deviceTable().update(*device);
                }
                finishTransfer(id);
                continue;
            }
        }
        store_.transferTable().update(*t);
    }
}

void DemoScenario::finishTransfer(uint64_t transferId) {
    legTransfers_.erase(std::remove(legTransfers_.begin(), legTransfers_.end(), transferId), legTransfers_.end());
    auto t = store_.transferTable().find(transferId);
    if (!t) return;
    if (!t->completed) {
        t->completed = true;
        store_.transferTable().update(*t);
    }
    store_.transferTable().remove(transferId);
}

void DemoScenario::routeThrough(uint64_t sphereId) {
    auto sphere = store_.sphereTable().find(sphereId);
    if (!sphere) return;
    ++sphere->packetsRouted;
    store_.sphereTable().update(*sphere);
}

void DemoScenario::hopWorld() {
    auto p = store_.playerTable().find(kLocalPlayerId);
    if (!p) return;
    spdlog::info("[demo] Explorer travels to world ({}, {}, {})", kEastWorld.x, kEastWorld.y, kEastWorld.z);
    p->currentWorld = kEastWorld;
    const glm::vec3 pos = surfacePoint({0.0f, 1.0f, 0.1f});
    p->position = net::toDb(pos);
    p->rotation = net::toDb(math::surfaceOrientation(pos));
    store_.playerTable().update(*p);
}

void DemoScenario::serve() {
    for (const auto& call : store_.takePendingCalls()) {
        answer(call);
        ++served_;
    }
}

void DemoScenario::answer(const net::ReducerCall& call) {
    spdlog::debug("[demo] serving {}", call.describe());
    if (call.reducer == "create_storage_device") {
        auto owner = store_.playerTable().find(kLocalPlayerId);
        if (!owner) {
            store_.failReducer(call.reducer, "no player for caller");
            return;
        }
        net::StorageDevice device;
        device.deviceId = nextDeviceId_++;
        device.ownerPlayerId = owner->playerId;
        device.deviceName = call.text;
        device.worldCoords = owner->currentWorld;
        device.position = call.position;
        device.capacityPerFrequency = 100;
        store_.deviceTable().insert(device);
    } else if (call.reducer == "initiate_transfer") {
        auto local = store_.playerTable().find(kLocalPlayerId);
        auto device = store_.deviceTable().find(call.targetId);
        if (!local || !device) {
            store_.failReducer(call.reducer, "destination device not found");
            return;
        }
        net::PacketTransfer t;
        t.transferId = nextTransferId_++;
        t.playerId = local->playerId;
        t.composition = call.composition;
        t.routeWaypoints = {local->position, net::toDb(sphereA_), device->position};
        t.destinationDeviceId = device->deviceId;
        store_.transferTable().insert(t);
    } else if (call.reducer == "complete_transfer") {
        finishTransfer(call.targetId);
    } else if (call.reducer == "ensure_player_inventory") {
        spdlog::debug("[demo] inventory ok");
    } else {
        store_.failReducer(call.reducer, "unknown reducer");
    }
}

} // namespace app
