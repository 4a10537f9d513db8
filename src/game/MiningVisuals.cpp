#include "MiningVisuals.h"

#include <algorithm>

#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>

#include "game/Frequency.h"
#include "math/Spherical.h"

namespace game {

MiningVisuals::MiningVisuals(core::EventBus& bus, net::RemoteStore& store, core::FrameScheduler& scheduler,
                             scene::SceneGraph& scene)
    : MiningVisuals(bus, store, scheduler, scene, Config{}) {}

MiningVisuals::MiningVisuals(core::EventBus& bus, net::RemoteStore& store, core::FrameScheduler& scheduler,
                             scene::SceneGraph& scene, const Config& config)
    : bus_(bus), store_(store), scheduler_(scheduler), scene_(scene), config_(config) {}

MiningVisuals::~MiningVisuals() {
    detach();
    clear();
}

void MiningVisuals::attach() {
    if (attached()) return;
    subs_.push_back(bus_.subscribe<core::MiningSessionStartedEvent>(
        [this](const core::MiningSessionStartedEvent& e) { startSession(e.session); }));
    subs_.push_back(bus_.subscribe<core::MiningSessionUpdatedEvent>(
        [this](const core::MiningSessionUpdatedEvent& e) { updateSession(e.newSession); }));
    subs_.push_back(bus_.subscribe<core::MiningSessionEndedEvent>(
        [this](const core::MiningSessionEndedEvent& e) { endSession(e.session.sessionId); }));
    subs_.push_back(bus_.subscribe<core::WorldTransitionStartedEvent>(
        [this](const core::WorldTransitionStartedEvent&) {
            spdlog::info("[mining] world transition, clearing {} sessions", sessions_.size());
            clear();
        }));
    subs_.push_back(bus_.subscribe<core::StateChangedEvent>([this](const core::StateChangedEvent& e) {
        if (e.newState != core::GameState::Disconnected) return;
        spdlog::info("[mining] disconnected, clearing {} sessions", sessions_.size());
        clear();
    }));
    refreshTimer_ = scheduler_.every(config_.refreshInterval, [this]() {
        refresh();
        return true;
    });
}

void MiningVisuals::detach() {
    subs_.clear();
    if (refreshTimer_ != core::kInvalidTimer) {
        scheduler_.cancel(refreshTimer_);
        refreshTimer_ = core::kInvalidTimer;
    }
}

void MiningVisuals::clear() {
    for (const auto& kv : sessions_) scene_.destroyNode(kv.second.node);
    for (const auto& p : packets_) scene_.destroyNode(p.node);
    sessions_.clear();
    packets_.clear();
    slots_.fill(MinerSlot{});
}

bool MiningVisuals::isPlayerMining(uint64_t playerId) const {
    return std::any_of(sessions_.begin(), sessions_.end(),
                       [playerId](const auto& kv) { return kv.second.playerId == playerId; });
}

const MiningVisuals::Extraction* MiningVisuals::extraction(uint64_t sessionId) const {
    auto it = sessions_.find(sessionId);
    return it == sessions_.end() ? nullptr : &it->second;
}

std::size_t MiningVisuals::activeSlotCount() const {
    return static_cast<std::size_t>(
        std::count_if(slots_.begin(), slots_.end(), [](const MinerSlot& s) { return s.position.w > 0.0f; }));
}

void MiningVisuals::startSession(const net::MiningSession& session) {
    if (sessions_.count(session.sessionId)) {
        updateSession(session);
        return;
    }
    auto source = store_.sources().find(session.sourceId);
    if (!source) {
        spdlog::warn("[mining] source {} not found for session #{}", session.sourceId, session.sessionId);
        return;
    }
    Extraction ext;
    ext.sessionId = session.sessionId;
    ext.playerId = session.playerId;
    ext.sourceId = session.sourceId;
    ext.crystal = session.crystalComposition;
    auto dominant = frequency::dominantFrequency(session.crystalComposition);
    ext.color = dominant ? frequency::colorFor(*dominant) : glm::vec4(1.0f);
    ext.extracted = session.totalExtracted;
    ext.startTime = scheduler_.now();

    const glm::vec3 position = net::toVec3(source->position);
    ext.node = scene_.createNode(scene::NodeKind::Extraction, fmt::format("Extraction_{}", session.sessionId),
                                 position);
    if (scene::Node* node = scene_.find(ext.node)) {
        node->rotation = math::surfaceOrientation(position);
        node->scale = config_.extractionScale;
        node->color = ext.color;
        node->label = fmt::format("{} extracted", ext.extracted);
    }
    spdlog::debug("[mining] player {} started mining source {} (session #{}, {} frequencies)", session.playerId,
                  session.sourceId, session.sessionId, session.crystalComposition.size());
    sessions_.emplace(session.sessionId, std::move(ext));
    ++stats_.sessionsStarted;
    refresh();
}

void MiningVisuals::updateSession(const net::MiningSession& session) {
    auto it = sessions_.find(session.sessionId);
    if (it == sessions_.end()) {
        startSession(session);
        return;
    }
    Extraction& ext = it->second;
    if (session.totalExtracted > ext.extracted) {
        launchPacket(ext, session.totalExtracted - ext.extracted);
        ext.extracted = session.totalExtracted;
        if (scene::Node* node = scene_.find(ext.node)) node->label = fmt::format("{} extracted", ext.extracted);
    }
}

void MiningVisuals::endSession(uint64_t sessionId) {
    auto it = sessions_.find(sessionId);
    if (it == sessions_.end()) return;
    spdlog::debug("[mining] session #{} ended after {:.1f}s, {} extracted", sessionId,
                  scheduler_.now() - it->second.startTime, it->second.extracted);
    scene_.destroyNode(it->second.node);
    sessions_.erase(it);
    ++stats_.sessionsEnded;
    refresh();
}

void MiningVisuals::launchPacket(const Extraction& extraction, uint32_t count) {
    auto source = store_.sources().find(extraction.sourceId);
    auto miner = store_.players().find(extraction.playerId);
    if (!source || !miner) {
        spdlog::debug("[mining] session #{} lost its source or miner, not launching", extraction.sessionId);
        return;
    }
    FlyingPacket packet;
    packet.trajectory = std::make_unique<Trajectory>(config_.worldRadius);
    packet.trajectory->startDirect(net::toVec3(source->position), net::toVec3(miner->position), config_.packetSpeed,
                                   config_.packetHeight);
    packet.node = scene_.createNode(scene::NodeKind::ExtractedPacket,
                                    fmt::format("ExtractedPacket_{}", scheduler_.frame()),
                                    packet.trajectory->position());
    if (scene::Node* node = scene_.find(packet.node)) {
        node->rotation = packet.trajectory->rotation();
        node->scale = config_.packetScale;
        node->color = extraction.color;
        node->trail = true;
        node->label = fmt::format("{} packets", count);
    }
    packets_.push_back(std::move(packet));
    ++stats_.packetsLaunched;
}

void MiningVisuals::update(float dt) {
    for (auto& p : packets_) {
        p.trajectory->tick(dt);
        if (scene::Node* node = scene_.find(p.node)) {
            node->position = p.trajectory->position();
            node->rotation = p.trajectory->rotation();
        }
    }
    auto done = std::remove_if(packets_.begin(), packets_.end(), [this](const FlyingPacket& p) {
        if (!p.trajectory->isComplete()) return false;
        scene_.destroyNode(p.node);
        ++stats_.packetsArrived;
        return true;
    });
    packets_.erase(done, packets_.end());
}

void MiningVisuals::refresh() {
    slots_.fill(MinerSlot{});
    std::size_t index = 0;
    for (auto it = sessions_.begin(); it != sessions_.end();) {
        auto miner = store_.players().find(it->second.playerId);
        if (!miner) {
            spdlog::debug("[mining] player {} left, ending session #{}", it->second.playerId, it->first);
            scene_.destroyNode(it->second.node);
            it = sessions_.erase(it);
            ++stats_.sessionsEnded;
            continue;
        }
        if (index < kMaxMiners) {
            const glm::vec3 p = net::toVec3(miner->position);
            slots_[index].position = glm::vec4(p, 1.0f);
            slots_[index].color = glm::vec4(glm::vec3(it->second.color), 1.0f);
            ++index;
        }
        ++it;
    }
}

} // namespace game
