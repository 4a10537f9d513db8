#include "Icosphere.h"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <unordered_map>

#include <glm/geometric.hpp>
#include <glm/gtc/constants.hpp>
#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>

namespace world {

namespace {

constexpr uint32_t kBaseFaces[20][3] = {
    // 5 faces around vertex 0
    {0, 11, 5}, {0, 5, 1}, {0, 1, 7}, {0, 7, 10}, {0, 10, 11},
    // 5 adjacent faces
    {1, 5, 9}, {5, 11, 4}, {11, 10, 2}, {10, 7, 6}, {7, 1, 8},
    // 5 faces around vertex 3
    {3, 9, 4}, {3, 4, 2}, {3, 2, 6}, {3, 6, 8}, {3, 8, 9},
    // 5 adjacent faces
    {4, 9, 5}, {2, 4, 11}, {6, 2, 10}, {8, 6, 7}, {9, 8, 1},
};

glm::vec3 toRadius(const glm::vec3& v, float radius) {
    const glm::dvec3 d = glm::normalize(glm::dvec3(v)) * static_cast<double>(radius);
    return glm::vec3(d);
}

void buildIcosahedron(float radius, std::vector<glm::vec3>& positions, std::vector<uint32_t>& indices) {
    const float t = (1.0f + std::sqrt(5.0f)) * 0.5f;
    const glm::vec3 base[12] = {
        glm::vec3(-1.0f,  t, 0.0f), glm::vec3( 1.0f,  t, 0.0f), glm::vec3(-1.0f, -t, 0.0f), glm::vec3( 1.0f, -t, 0.0f),
        glm::vec3(0.0f, -1.0f,  t), glm::vec3(0.0f,  1.0f,  t), glm::vec3(0.0f, -1.0f, -t), glm::vec3(0.0f,  1.0f, -t),
        glm::vec3( t, 0.0f, -1.0f), glm::vec3( t, 0.0f,  1.0f), glm::vec3(-t, 0.0f, -1.0f), glm::vec3(-t, 0.0f,  1.0f),
    };
    positions.clear();
    for (const auto& v : base) positions.push_back(toRadius(v, radius));
    indices.clear();
    for (const auto& f : kBaseFaces) indices.insert(indices.end(), {f[0], f[1], f[2]});
}

uint32_t midpoint(uint32_t a, uint32_t b, std::vector<glm::vec3>& positions,
                  std::unordered_map<uint64_t, uint32_t>& cache, float radius) {
    const uint64_t key = (static_cast<uint64_t>(std::min(a, b)) << 32) | std::max(a, b);
    auto it = cache.find(key);
    if (it != cache.end()) return it->second;
    const uint32_t index = static_cast<uint32_t>(positions.size());
    positions.push_back(toRadius((positions[a] + positions[b]) * 0.5f, radius));
    cache.emplace(key, index);
    return index;
}

void subdivide(std::vector<glm::vec3>& positions, std::vector<uint32_t>& indices, float radius) {
    std::unordered_map<uint64_t, uint32_t> cache;
    cache.reserve(indices.size());
    std::vector<uint32_t> next;
    next.reserve(indices.size() * 4);
    for (std::size_t i = 0; i + 2 < indices.size(); i += 3) {
        const uint32_t v0 = indices[i], v1 = indices[i + 1], v2 = indices[i + 2];
        const uint32_t m01 = midpoint(v0, v1, positions, cache, radius);
        const uint32_t m12 = midpoint(v1, v2, positions, cache, radius);
        const uint32_t m20 = midpoint(v2, v0, positions, cache, radius);
        next.insert(next.end(), {v0, m01, m20});
        next.insert(next.end(), {v1, m12, m01});
        next.insert(next.end(), {v2, m20, m12});
        next.insert(next.end(), {m01, m12, m20});
    }
    indices.swap(next);
}

} // namespace

std::string IcosphereMesh::name() const {
    return fmt::format("icosphere_{}_{}", radius, subdivisions);
}

IcosphereMesh generateIcosphere(float radius, int subdivisions) {
    auto start = std::chrono::steady_clock::now();
    IcosphereMesh mesh;
    mesh.radius = radius;
    mesh.subdivisions = std::clamp(subdivisions, 0, kMaxIcosphereSubdivisions);

    buildIcosahedron(radius, mesh.positions, mesh.indices);
    for (int i = 0; i < mesh.subdivisions; ++i) {
        subdivide(mesh.positions, mesh.indices, radius);
    }

    const float pi = glm::pi<float>();
    mesh.normals.reserve(mesh.positions.size());
    mesh.uvs.reserve(mesh.positions.size());
    for (const auto& p : mesh.positions) {
        const glm::vec3 n = glm::normalize(p);
        mesh.normals.push_back(n);
        const float phi = std::atan2(n.z, n.x);
        const float theta = std::asin(std::clamp(n.y, -1.0f, 1.0f));
        mesh.uvs.emplace_back((phi + pi) / (2.0f * pi), (theta + pi * 0.5f) / pi);
    }

    const IcosphereValidation check = validateIcosphere(mesh);
    if (!check.ok()) {
        spdlog::warn("[icosphere] {} vertices off radius (max error {})", check.offRadiusCount, check.maxError);
    }
    const double ms = std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - start).count();
    spdlog::debug("[icosphere] generated {}: {} vertices, {} triangles in {:.2f} ms{}",
                  mesh.name(), mesh.vertexCount(), mesh.triangleCount(), ms,
                  mesh.needsWideIndices() ? " (32-bit indices)" : "");
    return mesh;
}

IcosphereValidation validateIcosphere(const IcosphereMesh& mesh, float tolerance) {
    IcosphereValidation out;
    const float limit = tolerance * std::max(mesh.radius, 1.0f);
    for (const auto& p : mesh.positions) {
        const float err = static_cast<float>(std::fabs(glm::length(glm::dvec3(p)) - static_cast<double>(mesh.radius)));
        if (err > limit) {
            ++out.offRadiusCount;
            out.maxError = std::max(out.maxError, err);
        }
    }
    return out;
}

std::size_t expectedIcosphereVertices(int subdivisions) {
    const int n = std::clamp(subdivisions, 0, kMaxIcosphereSubdivisions);
    return 10u * (std::size_t(1) << (2 * n)) + 2u;
}

std::size_t expectedIcosphereTriangles(int subdivisions) {
    const int n = std::clamp(subdivisions, 0, kMaxIcosphereSubdivisions);
    return 20u * (std::size_t(1) << (2 * n));
}

int recommendedSubdivisions(Platform platform) {
    switch (platform) {
        case Platform::Web: return 3;
        case Platform::Mobile: return 4;
        case Platform::Desktop: return 5;
        case Platform::Editor: return 5;
        case Platform::Other: return 4;
    }
    return 4;
}

std::shared_ptr<const IcosphereMesh> IcosphereCache::get(float radius, int subdivisions) {
    const auto key = std::make_pair(radius, std::clamp(subdivisions, 0, kMaxIcosphereSubdivisions));
    auto it = meshes_.find(key);
    if (it != meshes_.end()) {
        ++hits_;
        return it->second;
    }
    ++misses_;
    auto mesh = std::make_shared<const IcosphereMesh>(generateIcosphere(radius, key.second));
    meshes_.emplace(key, mesh);
    return mesh;
}

void IcosphereCache::clear() {
    spdlog::debug("[icosphere] cache cleared ({} meshes)", meshes_.size());
    meshes_.clear();
}

} // namespace world
