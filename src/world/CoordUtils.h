#pragma once

#include <cstdint>

// CoordUtils — integer world-lattice coordinates.
namespace world {

struct WorldCoords {
    int32_t x = 0;
    int32_t y = 0;
    int32_t z = 0;

    bool operator==(const WorldCoords& o) const { return x == o.x && y == o.y && z == o.z; }
    bool operator!=(const WorldCoords& o) const { return !(*this == o); }
};

} // namespace world
