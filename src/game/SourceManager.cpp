#include "SourceManager.h"

#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>

#include "game/Frequency.h"
#include "math/Spherical.h"

namespace game {

namespace {
constexpr uint8_t kStationary = static_cast<uint8_t>(net::SourceState::Stationary);

std::string packetLabel(const net::WavePacketSource& source) {
    if (source.activeMinerCount > 0) {
        return fmt::format("{} packets ({} mining)", source.totalWavePackets, source.activeMinerCount);
    }
    return fmt::format("{} packets", source.totalWavePackets);
}
}

SourceManager::SourceManager(core::EventBus& bus, scene::SceneGraph& scene)
    : SourceManager(bus, scene, Config{}) {}

SourceManager::SourceManager(core::EventBus& bus, scene::SceneGraph& scene, const Config& config)
    : bus_(bus), scene_(scene), config_(config) {}

SourceManager::~SourceManager() {
    detach();
}

void SourceManager::attach() {
    if (attached()) return;
    subs_.push_back(bus_.subscribe<core::SourceInsertedEvent>(
        [this](const core::SourceInsertedEvent& e) { onInserted(e.source); }));
    subs_.push_back(bus_.subscribe<core::SourceUpdatedEvent>(
        [this](const core::SourceUpdatedEvent& e) { onUpdated(e.oldSource, e.newSource); }));
    subs_.push_back(bus_.subscribe<core::SourceDeletedEvent>(
        [this](const core::SourceDeletedEvent& e) { onDeleted(e.source); }));
    subs_.push_back(bus_.subscribe<core::InitialSourcesLoadedEvent>(
        [this](const core::InitialSourcesLoadedEvent& e) { onInitialLoad(e.sources); }));
    subs_.push_back(bus_.subscribe<core::WorldTransitionStartedEvent>(
        [this](const core::WorldTransitionStartedEvent&) {
            spdlog::info("[sources] world transition, clearing {} sources", sources_.size());
            clear();
        }));
    subs_.push_back(bus_.subscribe<core::StateChangedEvent>([this](const core::StateChangedEvent& e) {
        if (e.newState != core::GameState::Disconnected) return;
        spdlog::info("[sources] disconnected, clearing {} sources", sources_.size());
        clear();
    }));
}

void SourceManager::detach() {
    subs_.clear();
}

void SourceManager::clear() {
    for (const auto& kv : sources_) scene_.destroyNode(kv.second.node);
    sources_.clear();
}

scene::NodeId SourceManager::nodeFor(uint64_t sourceId) const {
    auto it = sources_.find(sourceId);
    return it == sources_.end() ? scene::kInvalidNode : it->second.node;
}

const SourceMovement* SourceManager::movement(uint64_t sourceId) const {
    auto it = sources_.find(sourceId);
    if (it == sources_.end() || !it->second.movement) return nullptr;
    return &*it->second.movement;
}

void SourceManager::update(float dt) {
    for (auto& kv : sources_) {
        Entry& entry = kv.second;
        if (!entry.movement || !entry.movement->isActive()) continue;
        entry.movement->tick(dt);
        if (scene::Node* node = scene_.find(entry.node)) {
            node->position = entry.movement->position();
            node->rotation = entry.movement->rotation();
        }
    }
}

void SourceManager::onInserted(const net::WavePacketSource& source) {
    spdlog::debug("[sources] inserted #{} state={} packets={}", source.sourceId, source.state, source.totalWavePackets);
    if (createVisual(source)) initMovement(source);
}

void SourceManager::onUpdated(const net::WavePacketSource& oldSource, const net::WavePacketSource& newSource) {
    spdlog::trace("[sources] updated #{} state={} packets={}", newSource.sourceId, newSource.state,
                  newSource.totalWavePackets);
    refreshVisual(oldSource, newSource);
    updateMovement(newSource);
    detectDissipation(oldSource, newSource);
}

void SourceManager::onDeleted(const net::WavePacketSource& source) {
    removeVisual(source.sourceId);
}

void SourceManager::onInitialLoad(const std::vector<net::WavePacketSource>& sources) {
    uint32_t created = 0;
    uint32_t skipped = 0;
    for (const auto& source : sources) {
        if (createVisual(source)) {
            initMovement(source);
            ++created;
        } else {
            ++skipped;
        }
    }
    stats_.lastInitialCreated = created;
    stats_.lastInitialSkipped = skipped;
    spdlog::info("[sources] initial load: {} created, {} skipped ({} active)", created, skipped, sources_.size());
}

bool SourceManager::createVisual(const net::WavePacketSource& source) {
    if (sources_.count(source.sourceId)) {
        spdlog::warn("[sources] source #{} already exists, skipping", source.sourceId);
        ++stats_.skipped;
        return false;
    }
    const glm::vec3 position = net::toVec3(source.position);
    Entry entry;
    entry.node = scene_.createNode(scene::NodeKind::Source, fmt::format("source_{}", source.sourceId), position);
    entry.state = source.state;
    if (scene::Node* node = scene_.find(entry.node)) {
        node->rotation = math::surfaceOrientation(position);
        node->scale = config_.visualScale;
        glm::vec4 color = frequency::blendComposition(source.composition);
        color.a = recommendedSourceAlpha(source.state);
        node->color = color;
        node->label = packetLabel(source);
    }
    sources_.emplace(source.sourceId, std::move(entry));
    ++stats_.created;
    return true;
}

void SourceManager::refreshVisual(const net::WavePacketSource& oldSource, const net::WavePacketSource& newSource) {
    auto it = sources_.find(newSource.sourceId);
    if (it == sources_.end()) {
        createVisual(newSource);
        return;
    }
    scene::Node* node = scene_.find(it->second.node);
    if (!node) {
        spdlog::debug("[sources] node for #{} vanished, recreating", newSource.sourceId);
        sources_.erase(it);
        createVisual(newSource);
        return;
    }
    // Pose belongs to the movement; only counts and tint change here.
    node->label = packetLabel(newSource);
    if (frequency::compositionChanged(oldSource.composition, newSource.composition) ||
        oldSource.state != newSource.state) {
        glm::vec4 color = frequency::blendComposition(newSource.composition);
        color.a = node->color.a;
        node->color = color;
    }
}

void SourceManager::removeVisual(uint64_t sourceId) {
    auto it = sources_.find(sourceId);
    if (it == sources_.end()) return;
    scene_.destroyNode(it->second.node);
    sources_.erase(it);
    ++stats_.removed;
    spdlog::debug("[sources] removed #{}", sourceId);
}

void SourceManager::initMovement(const net::WavePacketSource& source) {
    auto it = sources_.find(source.sourceId);
    if (it == sources_.end()) {
        spdlog::warn("[sources] cannot initialize movement for #{}: no visual", source.sourceId);
        return;
    }
    Entry& entry = it->second;
    entry.state = source.state;
    const glm::vec3 position = net::toVec3(source.position);
    if (source.state >= kStationary) {
        // Server position already includes the final height.
        entry.movement.reset();
        if (scene::Node* node = scene_.find(entry.node)) {
            node->position = position;
            node->rotation = math::surfaceOrientation(position);
        }
        applyAlpha(source.sourceId);
        return;
    }
    entry.movement.emplace(config_.movement);
    entry.movement->initialize(position, net::toVec3(source.velocity), net::toVec3(source.destination), source.state);
    applyAlpha(source.sourceId);
}

void SourceManager::updateMovement(const net::WavePacketSource& source) {
    auto it = sources_.find(source.sourceId);
    if (it == sources_.end()) return;
    Entry& entry = it->second;
    if (!entry.movement) {
        initMovement(source);
        return;
    }
    auto change = entry.movement->updateFromServer(net::toVec3(source.position), net::toVec3(source.velocity),
                                                   net::toVec3(source.destination), source.state);
    entry.state = source.state;
    if (change) {
        applyAlpha(source.sourceId);
        if (entry.movement->isComplete()) {
            if (scene::Node* node = scene_.find(entry.node)) {
                node->position = entry.movement->position();
                node->rotation = entry.movement->rotation();
            }
        }
    }
}

void SourceManager::applyAlpha(uint64_t sourceId) {
    auto it = sources_.find(sourceId);
    if (it == sources_.end()) return;
    scene::Node* node = scene_.find(it->second.node);
    if (!node) return;
    node->color.a = it->second.movement ? it->second.movement->recommendedAlpha()
                                        : recommendedSourceAlpha(it->second.state);
}

void SourceManager::detectDissipation(const net::WavePacketSource& oldSource, const net::WavePacketSource& newSource) {
    // Mining also lowers the total; only a changed lastDissipation marks decay.
    if (oldSource.totalWavePackets <= newSource.totalWavePackets) return;
    if (oldSource.lastDissipation == newSource.lastDissipation) return;
    auto freq = frequency::findDecreasedFrequency(oldSource.composition, newSource.composition);
    if (!freq) return;
    const scene::Node* node = scene_.find(nodeFor(newSource.sourceId));
    if (!node) return;
    scene_.spawnEffect(scene::EffectKind::Dissipation, node->position, frequency::sourceColor(*freq),
                       config_.dissipationEffectLifetime);
    ++stats_.dissipations;
    spdlog::debug("[sources] #{} dissipated {}", newSource.sourceId, frequency::name(*freq));
}

} // namespace game
