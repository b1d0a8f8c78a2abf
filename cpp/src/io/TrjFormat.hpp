#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "io/Snapshot.hpp"
#include "io/TextStream.hpp"
#include "util/Math.hpp"

namespace amtraj {

// Fixed-width shape of an AMBER ASCII trajectory record: coordinates are
// written 10 per line in F8.3 columns, optionally followed by a box line.
struct FrameLayout {
    std::size_t fieldWidth{8};
    std::size_t fieldsPerLine{10};
    std::size_t newlineWidth{1};
    // 0 (no box), 3 (lengths) or 6 (lengths and angles)
    std::size_t boxFields{0};

    bool periodic() const { return boxFields > 0; }
};

bool operator==(const FrameLayout& lhs, const FrameLayout& rhs);
bool operator!=(const FrameLayout& lhs, const FrameLayout& rhs);

struct TrjHeader {
    std::string title;
    std::size_t natoms{0};
    // bytes up to and including the title line terminator
    std::uint64_t size{0};
    std::size_t newlineWidth{1};
};

// Reads the title line. Throws FormatError for an empty or binary file, or
// when no atom count is available.
TrjHeader parseHeader(TextStream& stream, std::size_t natoms);

std::size_t coordinateLineCount(std::size_t natoms, const FrameLayout& layout);

// Parses one frame at the current stream position into `positions` (already
// sized to natoms) and `cell`. Returns false only when the stream is at its
// end before the first line of the frame.
bool parseFrame(TextStream& stream,
                std::size_t natoms,
                const FrameLayout& layout,
                std::vector<Vec3>& positions,
                std::optional<UnitCell>& cell);

// Number of box fields per frame (0, 3 or 6). Reads the first frame from the
// current position, which must be the end of the header. `periodic` forces
// the answer when set; a forced box that is not in the file is a FormatError.
// A candidate box line as wide as a coordinate line (one or two atoms) is
// never taken for a box without `periodic`. `bodySize` may include a blank
// tail. Moves the stream position.
std::size_t detectBoxFields(TextStream& stream,
                            std::size_t natoms,
                            const FrameLayout& layout,
                            std::uint64_t bodySize,
                            std::optional<bool> periodic);

}  // namespace amtraj
