#include "PlayerViews.h"

#include <algorithm>

#include <glm/geometric.hpp>
#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>

namespace game {

PlayerViews::PlayerViews(PlayerTracker& tracker, scene::SceneGraph& scene)
    : PlayerViews(tracker, scene, Config{}) {}

PlayerViews::PlayerViews(PlayerTracker& tracker, scene::SceneGraph& scene, const Config& config)
    : tracker_(tracker), scene_(scene), config_(config) {}

PlayerViews::~PlayerViews() {
    detach();
}

void PlayerViews::attach() {
    if (joinedSlot_ != 0) return;
    joinedSlot_ = tracker_.playerJoined.connect([this](const TrackedPlayer& p) { onJoined(p); });
    leftSlot_ = tracker_.playerLeft.connect([this](const TrackedPlayer& p) { onLeft(p); });
    updatedSlot_ = tracker_.playerUpdated.connect(
        [this](const TrackedPlayer&, const TrackedPlayer& now) { onUpdated(now); });
    for (const auto& kv : tracker_.allPlayers()) onJoined(kv.second);
}

void PlayerViews::detach() {
    if (joinedSlot_ == 0) return;
    tracker_.playerJoined.disconnect(joinedSlot_);
    tracker_.playerLeft.disconnect(leftSlot_);
    tracker_.playerUpdated.disconnect(updatedSlot_);
    joinedSlot_ = leftSlot_ = updatedSlot_ = 0;
    for (const auto& kv : views_) scene_.destroyNode(kv.second.node);
    views_.clear();
}

void PlayerViews::onJoined(const TrackedPlayer& p) {
    auto it = views_.find(p.playerId());
    if (it != views_.end()) {
        // Re-announced on world refresh; keep the node.
        it->second.isLocal = p.isLocal;
        onUpdated(p);
        return;
    }
    View view;
    view.isLocal = p.isLocal;
    view.target = p.position;
    view.targetRotation = p.rotation;
    view.node = scene_.createNode(scene::NodeKind::Player, fmt::format("player_{}", p.name()), p.position);
    if (scene::Node* node = scene_.find(view.node)) node->rotation = p.rotation;
    views_.emplace(p.playerId(), view);
    spdlog::debug("[views] spawned {} (local: {})", p.name(), p.isLocal);
}

void PlayerViews::onLeft(const TrackedPlayer& p) {
    auto it = views_.find(p.playerId());
    if (it == views_.end()) return;
    scene_.destroyNode(it->second.node);
    views_.erase(it);
    spdlog::debug("[views] removed {}", p.name());
}

void PlayerViews::onUpdated(const TrackedPlayer& p) {
    auto it = views_.find(p.playerId());
    if (it == views_.end()) return;
    it->second.target = p.position;
    it->second.targetRotation = p.rotation;
}

void PlayerViews::update(float dt) {
    const float t = std::clamp(dt * config_.remoteSmoothing, 0.0f, 1.0f);
    for (auto& kv : views_) {
        View& view = kv.second;
        scene::Node* node = scene_.find(view.node);
        if (!node) continue;
        const glm::vec3 before = node->position;
        if (view.isLocal) {
            node->position = view.target;
            node->rotation = view.targetRotation;
        } else {
            node->position = glm::mix(node->position, view.target, t);
            node->rotation = glm::slerp(node->rotation, view.targetRotation, t);
        }
        view.moving = glm::distance(before, node->position) > config_.movingEpsilon;
    }
}

bool PlayerViews::setStatus(uint64_t playerId, const std::string& text) {
    scene::Node* node = scene_.find(nodeFor(playerId));
    if (!node) return false;
    node->label = text;
    return true;
}

bool PlayerViews::clearStatus(uint64_t playerId) {
    scene::Node* node = scene_.find(nodeFor(playerId));
    if (!node) return false;
    node->label.clear();
    return true;
}

std::string PlayerViews::status(uint64_t playerId) const {
    const scene::Node* node = scene_.find(nodeFor(playerId));
    return node ? node->label : std::string{};
}

scene::NodeId PlayerViews::nodeFor(uint64_t playerId) const {
    auto it = views_.find(playerId);
    return it == views_.end() ? scene::kInvalidNode : it->second.node;
}

bool PlayerViews::isMoving(uint64_t playerId) const {
    auto it = views_.find(playerId);
    return it != views_.end() && it->second.moving;
}

} // namespace game
