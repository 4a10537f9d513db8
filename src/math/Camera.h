#pragma once

#include <glm/vec3.hpp>
#include <glm/gtc/quaternion.hpp>

// Camera — world-space pose of the follow camera (local +Z forward, +Y up).
namespace math {
struct Camera {
    glm::vec3 position{0.0f};
    glm::quat rotation{1.0f, 0.0f, 0.0f, 0.0f};
    float fovDeg = 60.0f;

    glm::vec3 forward() const { return rotation * glm::vec3(0.0f, 0.0f, 1.0f); }
    glm::vec3 up() const { return rotation * glm::vec3(0.0f, 1.0f, 0.0f); }
};
}
