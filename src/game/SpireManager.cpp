#include "SpireManager.h"

#include <algorithm>

#include <glm/geometric.hpp>
#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>

#include "math/Spherical.h"

namespace game {

namespace {

struct CardinalAxis {
    std::string_view positive;
    std::string_view negative;
    glm::vec3 direction;
};

const CardinalAxis kCardinalAxes[] = {
    {"North", "South", {0.0f, 1.0f, 0.0f}},
    {"East", "West", {1.0f, 0.0f, 0.0f}},
    {"Forward", "Back", {0.0f, 0.0f, 1.0f}},
};

} // namespace

std::optional<glm::vec3> cardinalDirection(std::string_view name) {
    glm::vec3 sum(0.0f);
    int parts = 0;
    for (const CardinalAxis& axis : kCardinalAxes) {
        if (name.starts_with(axis.positive)) {
            sum += axis.direction;
            name.remove_prefix(axis.positive.size());
            ++parts;
        } else if (name.starts_with(axis.negative)) {
            sum -= axis.direction;
            name.remove_prefix(axis.negative.size());
            ++parts;
        }
    }
    if (parts == 0 || !name.empty()) return std::nullopt;
    return glm::normalize(sum);
}

glm::vec4 tunnelColor(std::string_view name) {
    if (name == "Red") return {1.0f, 0.0f, 0.0f, 1.0f};
    if (name == "Green") return {0.0f, 1.0f, 0.0f, 1.0f};
    if (name == "Blue") return {0.0f, 0.0f, 1.0f, 1.0f};
    if (name == "Yellow") return {1.0f, 0.92f, 0.016f, 1.0f};
    if (name == "Cyan") return {0.0f, 1.0f, 1.0f, 1.0f};
    if (name == "Magenta") return {1.0f, 0.0f, 1.0f, 1.0f};
    if (name == "White") return {1.0f, 1.0f, 1.0f, 1.0f};
    return {0.5f, 0.5f, 0.5f, 1.0f};
}

SpireManager::SpireManager(core::EventBus& bus, scene::SceneGraph& scene)
    : SpireManager(bus, scene, Config{}) {}

SpireManager::SpireManager(core::EventBus& bus, scene::SceneGraph& scene, const Config& config)
    : bus_(bus), scene_(scene), config_(config) {}

SpireManager::~SpireManager() {
    detach();
}

void SpireManager::attach() {
    if (attached()) return;
    subs_.push_back(bus_.subscribe<core::InitialSpiresLoadedEvent>([this](const core::InitialSpiresLoadedEvent& e) {
        spdlog::info("[spires] initial load: {} circuits, {} spheres, {} tunnels", e.circuits.size(),
                     e.spheres.size(), e.tunnels.size());
        // Ground up: bases, then spheres, then rings.
        for (const auto& circuit : e.circuits) createCircuit(circuit);
        for (const auto& sphere : e.spheres) createSphere(sphere);
        for (const auto& tunnel : e.tunnels) createTunnel(tunnel);
    }));

    subs_.push_back(bus_.subscribe<core::CircuitInsertedEvent>(
        [this](const core::CircuitInsertedEvent& e) { createCircuit(e.circuit); }));
    subs_.push_back(bus_.subscribe<core::CircuitUpdatedEvent>(
        [this](const core::CircuitUpdatedEvent& e) { updateCircuit(e.newCircuit); }));
    subs_.push_back(bus_.subscribe<core::CircuitDeletedEvent>(
        [this](const core::CircuitDeletedEvent& e) { destroyVisual(circuits_, e.circuit.circuitId, "circuit"); }));

    subs_.push_back(bus_.subscribe<core::SphereInsertedEvent>(
        [this](const core::SphereInsertedEvent& e) { createSphere(e.sphere); }));
    subs_.push_back(bus_.subscribe<core::SphereUpdatedEvent>(
        [this](const core::SphereUpdatedEvent& e) { updateSphere(e.oldSphere, e.newSphere); }));
    subs_.push_back(bus_.subscribe<core::SphereDeletedEvent>(
        [this](const core::SphereDeletedEvent& e) { destroyVisual(spheres_, e.sphere.sphereId, "sphere"); }));

    subs_.push_back(bus_.subscribe<core::TunnelInsertedEvent>(
        [this](const core::TunnelInsertedEvent& e) { createTunnel(e.tunnel); }));
    subs_.push_back(bus_.subscribe<core::TunnelUpdatedEvent>(
        [this](const core::TunnelUpdatedEvent& e) { updateTunnel(e.newTunnel); }));
    subs_.push_back(bus_.subscribe<core::TunnelDeletedEvent>(
        [this](const core::TunnelDeletedEvent& e) { destroyVisual(tunnels_, e.tunnel.tunnelId, "tunnel"); }));

    subs_.push_back(bus_.subscribe<core::WorldTransitionStartedEvent>(
        [this](const core::WorldTransitionStartedEvent&) {
            spdlog::info("[spires] world transition, clearing {} spheres", spheres_.size());
            clear();
        }));
    subs_.push_back(bus_.subscribe<core::StateChangedEvent>([this](const core::StateChangedEvent& e) {
        if (e.newState != core::GameState::Disconnected) return;
        spdlog::info("[spires] disconnected, clearing {} spheres", spheres_.size());
        clear();
    }));
}

void SpireManager::detach() {
    subs_.clear();
}

void SpireManager::clear() {
    for (NodeMap* map : {&circuits_, &spheres_, &tunnels_}) {
        for (const auto& kv : *map) scene_.destroyNode(kv.second);
        map->clear();
    }
}

bool SpireManager::flashSphere(uint64_t sphereId) {
    const scene::Node* node = scene_.find(nodeForSphere(sphereId));
    if (!node) {
        spdlog::debug("[spires] no sphere #{} to flash", sphereId);
        return false;
    }
    scene_.spawnEffect(scene::EffectKind::SpireFlash, node->position, config_.flashColor, config_.flashDuration);
    ++stats_.flashes;
    spdlog::debug("[spires] flashing sphere #{}", sphereId);
    return true;
}

glm::vec3 SpireManager::surfacePoint(std::string_view direction) const {
    auto dir = cardinalDirection(direction);
    if (!dir) {
        spdlog::warn("[spires] unknown cardinal direction '{}', using North", direction);
        dir = glm::vec3(0.0f, 1.0f, 0.0f);
    }
    return *dir * config_.worldRadius;
}

glm::vec3 SpireManager::circuitPosition(std::string_view direction) const {
    return surfacePoint(direction);
}

glm::vec3 SpireManager::spherePosition(const net::DistributionSphere& sphere) const {
    glm::vec3 base = net::toVec3(sphere.spherePosition);
    if (glm::length(base) < 1e-3f) base = surfacePoint(sphere.cardinalDirection);
    return base + glm::normalize(base) * config_.sphereHeightOffset;
}

glm::vec3 SpireManager::tunnelPosition(std::string_view direction) const {
    const glm::vec3 base = surfacePoint(direction);
    return base + glm::normalize(base) * config_.tunnelHeightOffset;
}

scene::NodeId SpireManager::nodeForCircuit(uint64_t circuitId) const {
    auto it = circuits_.find(circuitId);
    return it == circuits_.end() ? scene::kInvalidNode : it->second;
}

scene::NodeId SpireManager::nodeForSphere(uint64_t sphereId) const {
    auto it = spheres_.find(sphereId);
    return it == spheres_.end() ? scene::kInvalidNode : it->second;
}

scene::NodeId SpireManager::nodeForTunnel(uint64_t tunnelId) const {
    auto it = tunnels_.find(tunnelId);
    return it == tunnels_.end() ? scene::kInvalidNode : it->second;
}

void SpireManager::createCircuit(const net::WorldCircuit& circuit) {
    if (circuits_.count(circuit.circuitId)) {
        spdlog::warn("[spires] circuit #{} already exists, skipping", circuit.circuitId);
        ++stats_.duplicates;
        return;
    }
    const glm::vec3 position = circuitPosition(circuit.cardinalDirection);
    const scene::NodeId id = scene_.createNode(
        scene::NodeKind::Circuit, fmt::format("Circuit_{}_{}", circuit.circuitId, circuit.cardinalDirection), position);
    scene::Node* node = scene_.find(id);
    node->rotation = math::surfaceOrientation(position);
    node->scale = config_.circuitBaseRadius * 2.0f;
    node->color = config_.circuitColor;
    circuits_.emplace(circuit.circuitId, id);
    ++stats_.created;
    spdlog::debug("[spires] created circuit #{} at {}", circuit.circuitId, circuit.cardinalDirection);
}

void SpireManager::createSphere(const net::DistributionSphere& sphere) {
    if (spheres_.count(sphere.sphereId)) {
        spdlog::warn("[spires] sphere #{} already exists, skipping", sphere.sphereId);
        ++stats_.duplicates;
        return;
    }
    const glm::vec3 position = spherePosition(sphere);
    const scene::NodeId id = scene_.createNode(
        scene::NodeKind::DistributionSphere, fmt::format("Sphere_{}_{}", sphere.sphereId, sphere.cardinalDirection),
        position);
    scene::Node* node = scene_.find(id);
    node->rotation = math::surfaceOrientation(position);
    node->scale = config_.sphereRadius * 2.0f;
    node->color = config_.sphereColor;
    node->emission = config_.sphereEmission;
    node->label = fmt::format("{} routed", sphere.packetsRouted);
    spheres_.emplace(sphere.sphereId, id);
    ++stats_.created;
    spdlog::debug("[spires] created sphere #{} at {}", sphere.sphereId, sphere.cardinalDirection);
}

void SpireManager::createTunnel(const net::QuantumTunnel& tunnel) {
    if (tunnels_.count(tunnel.tunnelId)) {
        spdlog::warn("[spires] tunnel #{} already exists, skipping", tunnel.tunnelId);
        ++stats_.duplicates;
        return;
    }
    const glm::vec3 position = tunnelPosition(tunnel.cardinalDirection);
    const scene::NodeId id = scene_.createNode(
        scene::NodeKind::QuantumTunnel, fmt::format("Tunnel_{}_{}", tunnel.tunnelId, tunnel.cardinalDirection),
        position);
    scene::Node* node = scene_.find(id);
    node->rotation = math::surfaceOrientation(position);
    node->scale = config_.tunnelRingRadius * 2.0f;
    applyCharge(*node, tunnel);
    tunnels_.emplace(tunnel.tunnelId, id);
    ++stats_.created;
    spdlog::debug("[spires] created tunnel #{} at {} with charge {:.0f}%", tunnel.tunnelId,
                  tunnel.cardinalDirection, tunnel.ringCharge);
}

scene::Node* SpireManager::nodeIn(NodeMap& map, uint64_t id, const char* what) {
    auto it = map.find(id);
    if (it == map.end()) {
        spdlog::warn("[spires] cannot update {} #{}: not found", what, id);
        return nullptr;
    }
    scene::Node* node = scene_.find(it->second);
    if (!node) {
        spdlog::error("[spires] node for {} #{} is gone", what, id);
        map.erase(it);
    }
    return node;
}

void SpireManager::updateCircuit(const net::WorldCircuit& circuit) {
    scene::Node* node = nodeIn(circuits_, circuit.circuitId, "circuit");
    if (!node) return;
    node->position = circuitPosition(circuit.cardinalDirection);
    node->rotation = math::surfaceOrientation(node->position);
}

void SpireManager::updateSphere(const net::DistributionSphere& oldSphere, const net::DistributionSphere& newSphere) {
    scene::Node* node = nodeIn(spheres_, newSphere.sphereId, "sphere");
    if (!node) return;
    node->position = spherePosition(newSphere);
    node->rotation = math::surfaceOrientation(node->position);
    node->label = fmt::format("{} routed", newSphere.packetsRouted);
    if (newSphere.packetsRouted > oldSphere.packetsRouted) flashSphere(newSphere.sphereId);
}

void SpireManager::updateTunnel(const net::QuantumTunnel& tunnel) {
    scene::Node* node = nodeIn(tunnels_, tunnel.tunnelId, "tunnel");
    if (!node) return;
    applyCharge(*node, tunnel);
    spdlog::debug("[spires] tunnel #{} charge now {:.0f}%", tunnel.tunnelId, tunnel.ringCharge);
}

void SpireManager::destroyVisual(NodeMap& map, uint64_t id, const char* what) {
    auto it = map.find(id);
    if (it == map.end()) return;
    scene_.destroyNode(it->second);
    map.erase(it);
    spdlog::debug("[spires] destroyed {} #{}", what, id);
}

void SpireManager::applyCharge(scene::Node& node, const net::QuantumTunnel& tunnel) const {
    const float charge = std::clamp(tunnel.ringCharge, 0.0f, 100.0f);
    node.color = tunnelColor(tunnel.tunnelColor);
    node.emission = charge / 100.0f;
    node.label = fmt::format("{:.0f}%", charge);
}

} // namespace game
