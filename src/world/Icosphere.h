#pragma once

#include <cstdint>
#include <map>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include <glm/vec2.hpp>
#include <glm/vec3.hpp>

// Icosphere — subdivided icosahedron for world spheres. Every vertex sits exactly on
// the requested radius; normals are radial and UVs come from longitude/latitude.
namespace world {

struct IcosphereMesh {
    float radius = 0.0f;
    int subdivisions = 0;
    std::vector<glm::vec3> positions;
    std::vector<glm::vec3> normals;
    std::vector<glm::vec2> uvs;
    std::vector<uint32_t> indices; // triangle list

    std::size_t vertexCount() const { return positions.size(); }
    std::size_t triangleCount() const { return indices.size() / 3; }
    // More than 65535 vertices need 32-bit indices on the GPU side.
    bool needsWideIndices() const { return positions.size() > 65535u; }
    std::string name() const;
};

struct IcosphereValidation {
    std::size_t offRadiusCount = 0;
    float maxError = 0.0f;
    bool ok() const { return offRadiusCount == 0; }
};

constexpr int kMaxIcosphereSubdivisions = 6;

// Subdivisions are clamped to [0, kMaxIcosphereSubdivisions].
IcosphereMesh generateIcosphere(float radius, int subdivisions);
// Tolerance is relative to the radius for spheres larger than 1.
IcosphereValidation validateIcosphere(const IcosphereMesh& mesh, float tolerance = 1e-4f);

// Expected sizes for n subdivisions: V = 10*4^n + 2, T = 20*4^n.
std::size_t expectedIcosphereVertices(int subdivisions);
std::size_t expectedIcosphereTriangles(int subdivisions);

enum class Platform : uint8_t { Desktop, Editor, Mobile, Web, Other };
int recommendedSubdivisions(Platform platform);

class IcosphereCache {
public:
    std::shared_ptr<const IcosphereMesh> get(float radius, int subdivisions);
    void clear();
    std::size_t size() const { return meshes_.size(); }
    uint64_t hits() const { return hits_; }
    uint64_t misses() const { return misses_; }

private:
    std::map<std::pair<float, int>, std::shared_ptr<const IcosphereMesh>> meshes_;
    uint64_t hits_ = 0;
    uint64_t misses_ = 0;
};

} // namespace world
