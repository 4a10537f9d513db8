#pragma once

#include <cstdint>
#include <map>
#include <string>
#include <string_view>
#include <vector>

#include <glm/vec3.hpp>
#include <glm/vec4.hpp>
#include <glm/gtc/quaternion.hpp>

#include "math/Camera.h"

// SceneGraph — flat set of visual nodes the presentation layer mutates.
//
// Nodes carry transform, tint and label state only; whatever draws them reads this
// graph. Transient effects (flashes, dissipation bursts) expire on update(dt).
namespace scene {

using NodeId = uint32_t;
constexpr NodeId kInvalidNode = 0;

enum class NodeKind : uint8_t {
    Generic,
    Player,
    Source,
    StorageDevice,
    TransferPacket,
    WorldSphere,
    Circuit,
    DistributionSphere,
    QuantumTunnel,
    Extraction,
    ExtractedPacket,
};

const char* nodeKindName(NodeKind kind);

struct Node {
    NodeId id = kInvalidNode;
    NodeKind kind = NodeKind::Generic;
    std::string name;
    glm::vec3 position{0.0f};
    glm::quat rotation{1.0f, 0.0f, 0.0f, 0.0f};
    float scale = 1.0f;
    glm::vec4 color{1.0f};
    float emission = 0.0f;
    std::string label;   // floating text (status bubble, counts)
    bool visible = true;
    bool trail = false;
    uint64_t meshVertices = 0;
};

enum class EffectKind : uint8_t {
    Dissipation,
    SpireFlash,
    DeviceArrival,
};

const char* effectKindName(EffectKind kind);

struct Effect {
    EffectKind kind = EffectKind::Dissipation;
    glm::vec3 position{0.0f};
    glm::vec4 color{1.0f};
    float remaining = 0.0f;
};

class SceneGraph {
public:
    NodeId createNode(NodeKind kind, std::string name, const glm::vec3& position);
    bool destroyNode(NodeId id);
    Node* find(NodeId id);
    const Node* find(NodeId id) const;
    const Node* findByName(std::string_view name) const;
    std::size_t nodeCount() const { return nodes_.size(); }
    std::size_t nodeCount(NodeKind kind) const;
    void clear();

    void spawnEffect(EffectKind kind, const glm::vec3& position, const glm::vec4& color, float lifetime);
    const std::vector<Effect>& effects() const { return effects_; }
    std::size_t effectCount(EffectKind kind) const;
    uint64_t effectsSpawned() const { return effectsSpawned_; }

    // Ages transient effects.
    void update(float dt);

    math::Camera& camera() { return camera_; }
    const math::Camera& camera() const { return camera_; }

private:
    std::map<NodeId, Node> nodes_;
    std::vector<Effect> effects_;
    math::Camera camera_{};
    NodeId nextId_ = kInvalidNode;
    uint64_t effectsSpawned_ = 0;
};

} // namespace scene
