#pragma once

#include <cstdint>
#include <optional>
#include <unordered_map>
#include <vector>

#include "core/EventBus.h"
#include "game/SourceMovement.h"
#include "net/Rows.h"
#include "scene/SceneGraph.h"

// SourceManager — one scene node per wave packet source of the current world.
// Driven entirely by the bus (Source*, InitialSourcesLoaded, WorldTransitionStarted).
namespace game {

class SourceManager {
public:
    struct Config {
        float visualScale = 2.0f;
        float dissipationEffectLifetime = 2.0f;
        SourceMovement::Config movement{};
    };

    struct Stats {
        uint32_t created = 0;
        uint32_t skipped = 0;
        uint32_t removed = 0;
        uint32_t dissipations = 0;
        uint32_t lastInitialCreated = 0;
        uint32_t lastInitialSkipped = 0;
    };

    SourceManager(core::EventBus& bus, scene::SceneGraph& scene);
    SourceManager(core::EventBus& bus, scene::SceneGraph& scene, const Config& config);
    ~SourceManager();

    void attach();
    void detach();
    bool attached() const { return !subs_.empty(); }

    // Advances dead reckoning and pushes poses onto the nodes.
    void update(float dt);
    void clear();

    bool hasSource(uint64_t sourceId) const { return sources_.count(sourceId) != 0; }
    std::size_t sourceCount() const { return sources_.size(); }
    scene::NodeId nodeFor(uint64_t sourceId) const;
    const SourceMovement* movement(uint64_t sourceId) const;
    const Stats& stats() const { return stats_; }

private:
    struct Entry {
        scene::NodeId node = scene::kInvalidNode;
        std::optional<SourceMovement> movement;
        uint8_t state = 0;
    };

    void onInserted(const net::WavePacketSource& source);
    void onUpdated(const net::WavePacketSource& oldSource, const net::WavePacketSource& newSource);
    void onDeleted(const net::WavePacketSource& source);
    void onInitialLoad(const std::vector<net::WavePacketSource>& sources);

    bool createVisual(const net::WavePacketSource& source);
    void refreshVisual(const net::WavePacketSource& oldSource, const net::WavePacketSource& newSource);
    void removeVisual(uint64_t sourceId);
    void initMovement(const net::WavePacketSource& source);
    void updateMovement(const net::WavePacketSource& source);
    void applyAlpha(uint64_t sourceId);
    void detectDissipation(const net::WavePacketSource& oldSource, const net::WavePacketSource& newSource);

    core::EventBus& bus_;
    scene::SceneGraph& scene_;
    Config config_{};
    Stats stats_{};
    std::unordered_map<uint64_t, Entry> sources_;
    std::vector<core::EventBus::Subscription> subs_;
};

} // namespace game
