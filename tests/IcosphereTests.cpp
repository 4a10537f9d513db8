// Icosphere generation, validation and caching.
#include <cmath>
#include <set>
#include <utility>

#include <glm/geometric.hpp>

#include "TestCheck.h"
#include "world/Icosphere.h"

int main() {
    bool success = true;

    // Sizes follow V = 10*4^n + 2, T = 20*4^n
    for (int n = 0; n <= 3; ++n) {
        const auto mesh = world::generateIcosphere(1.0f, n);
        CHECK(mesh.vertexCount() == world::expectedIcosphereVertices(n), "Vertices at %d: %zu", n, mesh.vertexCount());
        CHECK(mesh.triangleCount() == world::expectedIcosphereTriangles(n), "Triangles at %d: %zu", n,
              mesh.triangleCount());
        CHECK(mesh.normals.size() == mesh.vertexCount() && mesh.uvs.size() == mesh.vertexCount(),
              "Per-vertex attributes at %d", n);
        CHECK(world::validateIcosphere(mesh).ok(), "Unit sphere on radius at %d", n);
    }
    CHECK(world::expectedIcosphereVertices(0) == 12 && world::expectedIcosphereTriangles(0) == 20, "Icosahedron");
    CHECK(world::expectedIcosphereVertices(5) == 10242, "Five subdivisions");

    // Shared edges are split once: every index is in range and each vertex is used
    {
        const auto mesh = world::generateIcosphere(2.0f, 2);
        std::set<uint32_t> used(mesh.indices.begin(), mesh.indices.end());
        CHECK(used.size() == mesh.vertexCount(), "Every vertex referenced");
        CHECK(!used.empty() && *used.rbegin() < mesh.vertexCount(), "Indices in range");
        bool normalsOk = true;
        for (std::size_t i = 0; i < mesh.vertexCount(); ++i) {
            if (glm::dot(mesh.normals[i], glm::normalize(mesh.positions[i])) < 0.9999f) normalsOk = false;
        }
        CHECK(normalsOk, "Normals are radial");
        bool uvsOk = true;
        for (const auto& uv : mesh.uvs) {
            if (uv.x < 0.0f || uv.x > 1.0f || uv.y < 0.0f || uv.y > 1.0f) uvsOk = false;
        }
        CHECK(uvsOk, "UVs in [0, 1]");
    }

    // World-sized sphere stays on its radius
    {
        const auto mesh = world::generateIcosphere(300.0f, 4);
        const auto check = world::validateIcosphere(mesh, 1e-3f);
        CHECK(check.ok(), "Radius 300 (off=%zu max=%g)", check.offRadiusCount, check.maxError);
        CHECK(mesh.name() == "icosphere_300_4", "Mesh name (%s)", mesh.name().c_str());

        auto squashed = mesh;
        squashed.positions[0] *= 0.5f;
        CHECK(world::validateIcosphere(squashed, 1e-3f).offRadiusCount == 1, "Displaced vertex detected");
    }

    // Subdivision level is clamped
    {
        CHECK(world::generateIcosphere(1.0f, -3).subdivisions == 0, "Negative clamps to 0");
        const auto top = world::generateIcosphere(1.0f, 9);
        CHECK(top.subdivisions == world::kMaxIcosphereSubdivisions, "Clamped to the maximum");
        CHECK(top.needsWideIndices(), "Six subdivisions need 32-bit indices (%zu vertices)", top.vertexCount());
        CHECK(!world::generateIcosphere(1.0f, 5).needsWideIndices(), "Five fit in 16 bits");
    }

    CHECK(world::recommendedSubdivisions(world::Platform::Web) == 3, "Web");
    CHECK(world::recommendedSubdivisions(world::Platform::Mobile) == 4, "Mobile");
    CHECK(world::recommendedSubdivisions(world::Platform::Desktop) == 5, "Desktop");
    CHECK(world::recommendedSubdivisions(world::Platform::Editor) == 5, "Editor");
    CHECK(world::recommendedSubdivisions(world::Platform::Other) == 4, "Other");

    // Cache
    {
        world::IcosphereCache cache;
        auto a = cache.get(300.0f, 2);
        auto b = cache.get(300.0f, 2);
        CHECK(a == b && cache.hits() == 1 && cache.misses() == 1, "Second lookup is a hit");
        auto c = cache.get(300.0f, 3);
        auto d = cache.get(150.0f, 2);
        CHECK(c != a && d != a && cache.size() == 3, "Keyed by radius and level");
        auto e = cache.get(300.0f, 42);
        auto f = cache.get(300.0f, world::kMaxIcosphereSubdivisions);
        CHECK(e == f && cache.size() == 4, "Clamped level shares an entry");
        cache.clear();
        CHECK(cache.size() == 0, "Cleared");
        CHECK(a->vertexCount() == world::expectedIcosphereVertices(2), "Handed-out meshes outlive the cache");
    }

    return success ? 0 : 1;
}
