#include "Spherical.h"

#include <algorithm>
#include <cmath>
#include <glm/geometric.hpp>
#include <glm/mat3x3.hpp>
#include <glm/gtc/constants.hpp>

namespace math {

namespace {
constexpr float kEpsilon = 1e-6f;
const glm::vec3 kUp(0.0f, 1.0f, 0.0f);
const glm::vec3 kForward(0.0f, 0.0f, 1.0f);
} // namespace

glm::vec3 safeNormalize(const glm::vec3& v, const glm::vec3& fallback) {
    const float len = glm::length(v);
    if (!std::isfinite(len) || len < kEpsilon) return fallback;
    return v / len;
}

glm::vec3 surfaceNormal(const glm::vec3& p) {
    return safeNormalize(p, kUp);
}

glm::vec3 constrainToSurface(const glm::vec3& p, float radius) {
    return surfaceNormal(p) * radius;
}

glm::vec3 adjustHeight(const glm::vec3& p, float height, float radius) {
    return surfaceNormal(p) * (radius + height);
}

glm::quat fromToRotation(const glm::vec3& from, const glm::vec3& to) {
    const glm::vec3 a = safeNormalize(from, kUp);
    const glm::vec3 b = safeNormalize(to, kUp);
    const float d = glm::dot(a, b);
    if (d >= 1.0f - kEpsilon) return glm::quat(1.0f, 0.0f, 0.0f, 0.0f);
    if (d <= -1.0f + kEpsilon) {
        // Opposite vectors: any perpendicular axis works.
        glm::vec3 axis = glm::cross(glm::vec3(1.0f, 0.0f, 0.0f), a);
        if (glm::dot(axis, axis) < kEpsilon) axis = glm::cross(glm::vec3(0.0f, 0.0f, 1.0f), a);
        return glm::angleAxis(glm::pi<float>(), glm::normalize(axis));
    }
    const glm::vec3 axis = glm::cross(a, b);
    const float s = std::sqrt((1.0f + d) * 2.0f);
    return glm::normalize(glm::quat(s * 0.5f, axis.x / s, axis.y / s, axis.z / s));
}

glm::quat surfaceOrientation(const glm::vec3& p) {
    return fromToRotation(kUp, surfaceNormal(p));
}

glm::quat lookRotation(const glm::vec3& forward, const glm::vec3& up) {
    const glm::vec3 f = safeNormalize(forward, kForward);
    glm::vec3 r = glm::cross(up, f);
    if (glm::dot(r, r) < kEpsilon) {
        // forward parallel to up: pick any right vector.
        r = glm::cross(std::fabs(f.y) < 0.99f ? kUp : glm::vec3(1.0f, 0.0f, 0.0f), f);
    }
    r = glm::normalize(r);
    const glm::vec3 u = glm::cross(f, r);
    return glm::normalize(glm::quat_cast(glm::mat3(r, u, f)));
}

glm::vec3 moveTowards(const glm::vec3& current, const glm::vec3& target, float maxDistanceDelta) {
    const glm::vec3 delta = target - current;
    const float dist = glm::length(delta);
    if (dist <= maxDistanceDelta || dist < kEpsilon) return target;
    return current + delta / dist * maxDistanceDelta;
}

float expSmoothing(float rate, float dt) {
    return 1.0f - std::exp(-rate * dt);
}

bool intersectSphere(const glm::vec3& o, const glm::vec3& d, float R,
                     float& t0, float& t1) {
    const float a = glm::dot(d, d);
    if (a <= 0.0f) return false; // degenerate direction
    const float b = glm::dot(o, d);              // quadratic uses 2b; keep b and adjust disc
    const float c = glm::dot(o, o) - R * R;
    const float disc = b * b - a * c;
    if (disc < 0.0f) return false;
    const float s = std::sqrt(std::max(disc, 0.0f));
    const float invA = 1.0f / a;
    float tnear = (-b - s) * invA;
    float tfar  = (-b + s) * invA;
    if (tnear > tfar) std::swap(tnear, tfar);
    t0 = tnear; t1 = tfar;
    return true;
}

bool raycastSphere(const glm::vec3& origin, const glm::vec3& dir, float maxDistance,
                   float radius, float& hitDistance) {
    float t0 = 0.0f, t1 = 0.0f;
    if (!intersectSphere(origin, dir, radius, t0, t1)) return false;
    float t = t0 >= 0.0f ? t0 : t1;
    if (t < 0.0f || t > maxDistance) return false;
    hitDistance = t;
    return true;
}

} // namespace math
