#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <string>
#include <string_view>

#include "math/Spherical.h"
#include "world/Icosphere.h"

namespace fs = std::filesystem;

struct Options {
    float radius = math::kWorldRadius;
    int subdivisions = -1; // < 0 dumps every level
    fs::path objFile;
};

[[nodiscard]] Options parse_cli(int argc, char** argv) {
    Options opts;
    for (int i = 1; i < argc; ++i) {
        std::string_view arg{argv[i]};
        if (arg == "--radius" && i + 1 < argc) {
            opts.radius = std::strtof(argv[++i], nullptr);
        } else if (arg == "--subdivisions" && i + 1 < argc) {
            opts.subdivisions = std::atoi(argv[++i]);
        } else if (arg == "--obj" && i + 1 < argc) {
            opts.objFile = fs::path(argv[++i]);
        } else if (arg == "--help" || arg == "-h") {
            std::cout << "Usage: mesh_dump [--radius R] [--subdivisions N] [--obj FILE]\n";
            std::exit(0);
        } else {
            std::cerr << "Unknown argument: " << arg << "\n";
            std::exit(1);
        }
    }
    return opts;
}

bool dump(const world::IcosphereMesh& mesh) {
    const auto check = world::validateIcosphere(mesh);
    const bool countsOk = mesh.vertexCount() == world::expectedIcosphereVertices(mesh.subdivisions) &&
                          mesh.triangleCount() == world::expectedIcosphereTriangles(mesh.subdivisions);
    std::cout << std::left << std::setw(28) << mesh.name() << " vertices=" << std::setw(7) << mesh.vertexCount()
              << " triangles=" << std::setw(7) << mesh.triangleCount()
              << " index=" << (mesh.needsWideIndices() ? "u32" : "u16")
              << " maxRadiusError=" << check.maxError
              << (countsOk && check.ok() ? "  ok" : "  FAILED") << "\n";
    return countsOk && check.ok();
}

bool write_obj(const world::IcosphereMesh& mesh, const fs::path& path) {
    std::ofstream out(path);
    if (!out) {
        std::cerr << "Cannot open " << path << " for writing\n";
        return false;
    }
    out << "# " << mesh.name() << "\n";
    for (const auto& p : mesh.positions) out << "v " << p.x << ' ' << p.y << ' ' << p.z << "\n";
    for (const auto& uv : mesh.uvs) out << "vt " << uv.x << ' ' << uv.y << "\n";
    for (const auto& n : mesh.normals) out << "vn " << n.x << ' ' << n.y << ' ' << n.z << "\n";
    for (std::size_t i = 0; i + 2 < mesh.indices.size(); i += 3) {
        out << 'f';
        for (std::size_t k = 0; k < 3; ++k) {
            const uint32_t v = mesh.indices[i + k] + 1;
            out << ' ' << v << '/' << v << '/' << v;
        }
        out << "\n";
    }
    return static_cast<bool>(out);
}

int main(int argc, char** argv) {
    const Options opts = parse_cli(argc, argv);
    if (opts.radius <= 0.0f) {
        std::cerr << "Radius must be positive\n";
        return EXIT_FAILURE;
    }

    bool ok = true;
    if (opts.subdivisions < 0) {
        for (int n = 0; n <= world::kMaxIcosphereSubdivisions; ++n) {
            ok = dump(world::generateIcosphere(opts.radius, n)) && ok;
        }
        if (!opts.objFile.empty()) std::cerr << "--obj needs --subdivisions, skipping export\n";
        return ok ? EXIT_SUCCESS : EXIT_FAILURE;
    }

    const auto mesh = world::generateIcosphere(opts.radius, opts.subdivisions);
    ok = dump(mesh);
    if (!opts.objFile.empty()) {
        if (!write_obj(mesh, opts.objFile)) return EXIT_FAILURE;
        std::cout << "Wrote " << opts.objFile << "\n";
    }
    return ok ? EXIT_SUCCESS : EXIT_FAILURE;
}
