#pragma once

#include <glm/vec3.hpp>
#include <glm/gtc/quaternion.hpp>

// Spherical — planet-surface helpers: radial frames, surface projection, orientation
// quaternions and ray/sphere tests.
//
// Conventions: object-local +Y is "up" (away from the planet centre) and +Z is
// "forward". Positions are relative to the centre of the current world.
namespace math {

constexpr float kWorldRadius = 300.0f;

// Unit radial direction; +Y for points at the centre.
glm::vec3 surfaceNormal(const glm::vec3& p);
glm::vec3 constrainToSurface(const glm::vec3& p, float radius = kWorldRadius);
glm::vec3 adjustHeight(const glm::vec3& p, float height, float radius = kWorldRadius);

// Shortest-arc rotation taking `from` onto `to` (both need not be unit length).
glm::quat fromToRotation(const glm::vec3& from, const glm::vec3& to);
// Rotation that stands an object upright on the sphere at p.
glm::quat surfaceOrientation(const glm::vec3& p);
// Rotation whose local +Z is `forward` and local +Y is as close to `up` as possible.
glm::quat lookRotation(const glm::vec3& forward, const glm::vec3& up);

glm::vec3 moveTowards(const glm::vec3& current, const glm::vec3& target, float maxDistanceDelta);
// Frame-rate independent blend weight 1 - exp(-rate * dt).
float expSmoothing(float rate, float dt);
glm::vec3 safeNormalize(const glm::vec3& v, const glm::vec3& fallback);

// Ray vs sphere centred at the origin. d need not be normalized; t in units of d.
bool intersectSphere(const glm::vec3& o, const glm::vec3& d, float R, float& t0, float& t1);
// First non-negative hit along a normalized ray within maxDistance.
bool raycastSphere(const glm::vec3& origin, const glm::vec3& dir, float maxDistance,
                   float radius, float& hitDistance);
} // namespace math
