#pragma once

#include <cstdint>
#include <functional>

#include <glm/vec3.hpp>
#include <glm/gtc/quaternion.hpp>

#include "math/Spherical.h"

// Trajectory — timed packet flight between two points above the sphere.
//
// Equal start and end heights fly a single great-circle arc at that height. A
// climb goes vertical first and then across; a descent goes across first and then
// down. Each phase lasts distance / speed, and time left over when one phase ends
// carries into the next. The tick that reaches the target parks the packet there
// (Arriving); the following tick completes it and fires the arrival callback once.
namespace game {

class Trajectory {
public:
    enum class State : uint8_t {
        Inactive,
        Initializing,
        MovingHorizontal,
        MovingVertical,
        Arriving,
        Complete,
    };

    enum class Type : uint8_t {
        Direct,
        VerticalThenHorizontal,
        HorizontalThenVertical,
    };

    using ArrivalFn = std::function<void()>;

    explicit Trajectory(float worldRadius = math::kWorldRadius);

    void startDirect(const glm::vec3& start, const glm::vec3& target, float speed, float height,
                     ArrivalFn onArrival = {});
    void startTwoPhase(const glm::vec3& start, const glm::vec3& target, float speed,
                       float startHeight, float endHeight, ArrivalFn onArrival = {});

    // Advances the flight. Returns false once complete (or never started).
    bool tick(float dt);

    const glm::vec3& position() const { return position_; }
    const glm::quat& rotation() const { return rotation_; }
    State state() const { return state_; }
    Type type() const { return type_; }
    bool isComplete() const { return state_ == State::Complete; }
    bool isActive() const { return state_ != State::Inactive && state_ != State::Complete; }
    float elapsed() const { return elapsed_; }
    float totalDuration() const { return phase1Duration_ + phase2Duration_; }
    // 0..1 over the whole flight.
    float progress() const;

private:
    void begin(const glm::vec3& start, const glm::vec3& target, float speed,
               float startHeight, float endHeight, ArrivalFn onArrival);
    glm::vec3 horizontalAt(float t, float height) const;
    glm::vec3 verticalAt(const glm::vec3& base, float t, float fromHeight, float toHeight) const;
    void finish();

    float radius_;
    Type type_ = Type::Direct;
    State state_ = State::Inactive;

    glm::vec3 start_{0.0f};
    glm::vec3 target_{0.0f};
    float startHeight_ = 0.0f;
    float endHeight_ = 0.0f;
    float phase1Duration_ = 0.0f;
    float phase2Duration_ = 0.0f;
    float elapsed_ = 0.0f;

    glm::vec3 position_{0.0f};
    glm::quat rotation_{1.0f, 0.0f, 0.0f, 0.0f};
    ArrivalFn onArrival_;
};

const char* trajectoryStateName(Trajectory::State state);

} // namespace game
