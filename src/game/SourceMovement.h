#pragma once

#include <cstdint>
#include <optional>

#include <glm/vec3.hpp>
#include <glm/gtc/quaternion.hpp>

#include "net/Rows.h"

// SourceMovement — client-side dead reckoning of a server-driven source.
//
// The server walks each source through MOVING_H -> ARRIVED_H0 -> RISING -> STATIONARY
// and only sends a row when something changes. Between rows the position is predicted
// from the last anchor (position at the most recent state change), and the visual
// position eases toward that prediction.
namespace game {

class SourceMovement {
public:
    static constexpr float kMoveSpeed = 6.0f;
    static constexpr float kRiseSpeed = 2.0f;
    static constexpr float kFinalHeight = 1.0f;

    struct Config {
        float interpolationSpeed = 10.0f;
        float worldRadius = 300.0f;
    };

    struct StateChange {
        uint8_t from = 0;
        uint8_t to = 0;
    };

    SourceMovement() = default;
    explicit SourceMovement(const Config& config) : config_(config) {}

    void initialize(const glm::vec3& position, const glm::vec3& velocity,
                    const glm::vec3& destination, uint8_t state);

    // Re-anchors only when the server state changed; velocity and destination are
    // always refreshed.
    std::optional<StateChange> updateFromServer(const glm::vec3& position, const glm::vec3& velocity,
                                                const glm::vec3& destination, uint8_t state);

    void tick(float dt);

    // Where the server is expected to have the source `elapsed` seconds after the anchor.
    glm::vec3 predict(float elapsed) const;

    const glm::vec3& position() const { return position_; }
    const glm::quat& rotation() const { return rotation_; }
    uint8_t serverState() const { return state_; }
    bool isActive() const { return active_; }
    bool isComplete() const { return state_ >= static_cast<uint8_t>(net::SourceState::Stationary); }
    float stateElapsed() const { return stateElapsed_; }
    float recommendedAlpha() const;

private:
    void complete();

    Config config_{};
    glm::vec3 anchor_{0.0f};
    glm::vec3 velocity_{0.0f};
    glm::vec3 destination_{0.0f};
    glm::vec3 position_{0.0f};
    glm::quat rotation_{1.0f, 0.0f, 0.0f, 0.0f};
    uint8_t state_ = 0;
    float stateElapsed_ = 0.0f;
    bool active_ = false;
};

float recommendedSourceAlpha(uint8_t state);

} // namespace game
