#include "SceneGraph.h"

#include <algorithm>

#include <spdlog/spdlog.h>

namespace scene {

const char* nodeKindName(NodeKind kind) {
    switch (kind) {
        case NodeKind::Generic: return "generic";
        case NodeKind::Player: return "player";
        case NodeKind::Source: return "source";
        case NodeKind::StorageDevice: return "storage";
        case NodeKind::TransferPacket: return "packet";
        case NodeKind::WorldSphere: return "world";
        case NodeKind::Circuit: return "circuit";
        case NodeKind::DistributionSphere: return "sphere";
        case NodeKind::QuantumTunnel: return "tunnel";
        case NodeKind::Extraction: return "extraction";
        case NodeKind::ExtractedPacket: return "extracted";
    }
    return "unknown";
}

const char* effectKindName(EffectKind kind) {
    switch (kind) {
        case EffectKind::Dissipation: return "dissipation";
        case EffectKind::SpireFlash: return "spire-flash";
        case EffectKind::DeviceArrival: return "device-arrival";
    }
    return "unknown";
}

NodeId SceneGraph::createNode(NodeKind kind, std::string name, const glm::vec3& position) {
    Node node;
    node.id = ++nextId_;
    node.kind = kind;
    node.name = std::move(name);
    node.position = position;
    spdlog::trace("[scene] create {} '{}' #{}", nodeKindName(kind), node.name, node.id);
    nodes_.emplace(node.id, std::move(node));
    return nextId_;
}

bool SceneGraph::destroyNode(NodeId id) {
    auto it = nodes_.find(id);
    if (it == nodes_.end()) return false;
    spdlog::trace("[scene] destroy {} '{}' #{}", nodeKindName(it->second.kind), it->second.name, id);
    nodes_.erase(it);
    return true;
}

Node* SceneGraph::find(NodeId id) {
    auto it = nodes_.find(id);
    return it == nodes_.end() ? nullptr : &it->second;
}

const Node* SceneGraph::find(NodeId id) const {
    auto it = nodes_.find(id);
    return it == nodes_.end() ? nullptr : &it->second;
}

const Node* SceneGraph::findByName(std::string_view name) const {
    for (const auto& kv : nodes_) {
        if (kv.second.name == name) return &kv.second;
    }
    return nullptr;
}

std::size_t SceneGraph::nodeCount(NodeKind kind) const {
    return static_cast<std::size_t>(std::count_if(nodes_.begin(), nodes_.end(),
                                                  [kind](const auto& kv) { return kv.second.kind == kind; }));
}

void SceneGraph::clear() {
    nodes_.clear();
    effects_.clear();
}

void SceneGraph::spawnEffect(EffectKind kind, const glm::vec3& position, const glm::vec4& color, float lifetime) {
    if (lifetime <= 0.0f) return;
    effects_.push_back({kind, position, color, lifetime});
    ++effectsSpawned_;
    spdlog::debug("[scene] effect {} at ({:.1f}, {:.1f}, {:.1f}) for {:.1f}s",
                  effectKindName(kind), position.x, position.y, position.z, lifetime);
}

std::size_t SceneGraph::effectCount(EffectKind kind) const {
    return static_cast<std::size_t>(std::count_if(effects_.begin(), effects_.end(),
                                                  [kind](const Effect& e) { return e.kind == kind; }));
}

void SceneGraph::update(float dt) {
    for (auto& e : effects_) e.remaining -= dt;
    effects_.erase(std::remove_if(effects_.begin(), effects_.end(),
                                  [](const Effect& e) { return e.remaining <= 0.0f; }),
                   effects_.end());
}

} // namespace scene
