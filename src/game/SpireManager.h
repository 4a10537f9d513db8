#pragma once

#include <cstdint>
#include <optional>
#include <string_view>
#include <unordered_map>
#include <vector>

#include <glm/vec3.hpp>
#include <glm/vec4.hpp>

#include "core/EventBus.h"
#include "net/Rows.h"
#include "scene/SceneGraph.h"

// SpireManager — energy spires of the current world. A spire stacks three parts
// over one cardinal direction: the circuit base on the surface, the distribution
// sphere above it and the quantum tunnel ring on top.
//
// Cardinal names combine at most one of North/South (+-Y), East/West (+-X) and
// Forward/Back (+-Z), in that order: 6 face centres, 12 edge centres, 8 corners.
namespace game {

// Unit direction for a cardinal name; nullopt when the name does not parse.
std::optional<glm::vec3> cardinalDirection(std::string_view name);

// Ring colour by name (Red, Green, Blue, Yellow, Cyan, Magenta, White); grey otherwise.
glm::vec4 tunnelColor(std::string_view name);

class SpireManager {
public:
    struct Config {
        float worldRadius = 300.0f;
        float circuitBaseRadius = 2.0f;
        float sphereRadius = 1.5f;
        float sphereHeightOffset = 5.0f;
        float tunnelRingRadius = 3.0f;
        float tunnelHeightOffset = 10.0f;
        glm::vec4 circuitColor{0.3f, 0.3f, 0.3f, 1.0f};
        glm::vec4 sphereColor{0.2f, 0.6f, 1.0f, 1.0f};
        float sphereEmission = 0.3f;
        glm::vec4 flashColor{0.0f, 1.0f, 1.0f, 1.0f};
        float flashDuration = 0.5f;
    };

    struct Stats {
        uint32_t created = 0;
        uint32_t duplicates = 0;
        uint32_t flashes = 0;
    };

    SpireManager(core::EventBus& bus, scene::SceneGraph& scene);
    SpireManager(core::EventBus& bus, scene::SceneGraph& scene, const Config& config);
    ~SpireManager();

    void attach();
    void detach();
    bool attached() const { return !subs_.empty(); }
    void clear();

    // Flashes a distribution sphere; false when the sphere is not shown.
    bool flashSphere(uint64_t sphereId);

    glm::vec3 circuitPosition(std::string_view direction) const;
    glm::vec3 spherePosition(const net::DistributionSphere& sphere) const;
    glm::vec3 tunnelPosition(std::string_view direction) const;

    std::size_t circuitCount() const { return circuits_.size(); }
    std::size_t sphereCount() const { return spheres_.size(); }
    std::size_t tunnelCount() const { return tunnels_.size(); }
    scene::NodeId nodeForCircuit(uint64_t circuitId) const;
    scene::NodeId nodeForSphere(uint64_t sphereId) const;
    scene::NodeId nodeForTunnel(uint64_t tunnelId) const;
    const Stats& stats() const { return stats_; }

private:
    using NodeMap = std::unordered_map<uint64_t, scene::NodeId>;

    void createCircuit(const net::WorldCircuit& circuit);
    void createSphere(const net::DistributionSphere& sphere);
    void createTunnel(const net::QuantumTunnel& tunnel);
    void updateCircuit(const net::WorldCircuit& circuit);
    void updateSphere(const net::DistributionSphere& oldSphere, const net::DistributionSphere& newSphere);
    void updateTunnel(const net::QuantumTunnel& tunnel);
    void destroyVisual(NodeMap& map, uint64_t id, const char* what);
    void applyCharge(scene::Node& node, const net::QuantumTunnel& tunnel) const;
    glm::vec3 surfacePoint(std::string_view direction) const;
    scene::Node* nodeIn(NodeMap& map, uint64_t id, const char* what);

    core::EventBus& bus_;
    scene::SceneGraph& scene_;
    Config config_{};
    Stats stats_{};
    NodeMap circuits_;
    NodeMap spheres_;
    NodeMap tunnels_;
    std::vector<core::EventBus::Subscription> subs_;
};

} // namespace game
