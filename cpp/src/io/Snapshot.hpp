#pragma once

#include <array>
#include <cstddef>
#include <optional>
#include <vector>

#include "util/Math.hpp"

namespace amtraj {

// [a, b, c, alpha, beta, gamma], lengths in Angstrom, angles in degrees.
using UnitCell = std::array<double, 6>;

// Coordinates of the frame a reader currently points at.
//
// A reader owns exactly one Snapshot and overwrites it on every read, so a
// reference obtained from TrjReader::snapshot() always shows the latest
// frame. Copy the value to keep a frame around.
struct Snapshot {
    std::size_t frame{0};
    std::vector<Vec3> positions;
    std::optional<UnitCell> unitcell;
    bool periodic{false};

    std::size_t nAtoms() const { return positions.size(); }

    // Overwrites the contents in place; the positions buffer keeps its storage.
    void load(const std::vector<Vec3>& source, const std::optional<UnitCell>& cell, std::size_t frameIndex);

    // Box vectors of the unit cell, a zero matrix when there is none.
    Mat3 boxMatrix() const;
};

}  // namespace amtraj
