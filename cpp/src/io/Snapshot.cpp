#include "io/Snapshot.hpp"

#include <algorithm>
#include <string>

#include "io/Errors.hpp"

namespace amtraj {

void Snapshot::load(const std::vector<Vec3>& source, const std::optional<UnitCell>& cell, std::size_t frameIndex) {
    if (source.size() != positions.size()) {
        throw FormatError("Frame " + std::to_string(frameIndex) + " has " + std::to_string(source.size()) +
                          " atoms, expected " + std::to_string(positions.size()));
    }
    std::copy(source.begin(), source.end(), positions.begin());
    if (periodic && cell) {
        unitcell = *cell;
    } else {
        unitcell.reset();
    }
    frame = frameIndex;
}

Mat3 Snapshot::boxMatrix() const {
    if (!unitcell) {
        return Mat3{};
    }
    return cellToBox(*unitcell);
}

}  // namespace amtraj
