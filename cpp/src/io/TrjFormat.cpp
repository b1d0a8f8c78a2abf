#include "io/TrjFormat.hpp"

#include <algorithm>
#include <cerrno>
#include <cmath>
#include <cstdlib>

#include "io/Errors.hpp"
#include "io/FrameIndex.hpp"
#include "util/Logging.hpp"

namespace amtraj {

namespace {

// bytes inspected for a blank tail while detecting the layout
constexpr std::uint64_t kBlankTailLimit = 4096;

std::optional<double> tryParseField(const std::string& line, std::size_t index, const FrameLayout& layout) {
    std::size_t start = index * layout.fieldWidth;
    if (start + layout.fieldWidth > line.size()) {
        return std::nullopt;
    }
    std::string token = line.substr(start, layout.fieldWidth);
    const char* begin = token.c_str();
    char* end = nullptr;
    errno = 0;
    double value = std::strtod(begin, &end);
    if (end == begin || errno == ERANGE || !std::isfinite(value)) {
        return std::nullopt;
    }
    while (*end == ' ') {
        ++end;
    }
    if (*end != '\0') {
        return std::nullopt;
    }
    return value;
}

double parseField(const std::string& line, std::size_t index, const FrameLayout& layout, const TextStream& stream, std::uint64_t lineOffset) {
    auto value = tryParseField(line, index, layout);
    if (!value) {
        std::size_t start = index * layout.fieldWidth;
        std::string token = start < line.size() ? line.substr(start, layout.fieldWidth) : std::string();
        throw FormatError("Invalid numeric field '" + token + "' in " + stream.path() + " at byte " +
                          std::to_string(lineOffset + start) + " (column " + std::to_string(start + 1) + ")");
    }
    return *value;
}

// Reads one record and removes the CR of a CRLF terminator.
bool readRecord(TextStream& stream, const FrameLayout& layout, std::string& line, std::uint64_t& offset) {
    offset = stream.tell();
    if (!stream.readLine(line)) {
        return false;
    }
    if (layout.newlineWidth == 2) {
        if (line.empty() || line.back() != '\r') {
            throw FormatError("Expected CRLF line ending in " + stream.path() + " at byte " + std::to_string(offset));
        }
        line.pop_back();
    }
    return true;
}

void requireWidth(const std::string& line, std::size_t expected, const char* what, const TextStream& stream, std::uint64_t offset) {
    if (line.size() != expected) {
        throw FormatError(std::string(what) + " in " + stream.path() + " at byte " + std::to_string(offset) + " is " +
                          std::to_string(line.size()) + " characters wide, expected " + std::to_string(expected));
    }
}

std::size_t boxLineFields(const std::string& line, const FrameLayout& layout) {
    for (std::size_t fields : {std::size_t{3}, std::size_t{6}}) {
        if (line.size() != fields * layout.fieldWidth) {
            continue;
        }
        bool numeric = true;
        for (std::size_t i = 0; i < fields && numeric; ++i) {
            numeric = tryParseField(line, i, layout).has_value();
        }
        if (numeric) {
            return fields;
        }
    }
    return 0;
}

}  // namespace

bool operator==(const FrameLayout& lhs, const FrameLayout& rhs) {
    return lhs.fieldWidth == rhs.fieldWidth && lhs.fieldsPerLine == rhs.fieldsPerLine &&
           lhs.newlineWidth == rhs.newlineWidth && lhs.boxFields == rhs.boxFields;
}

bool operator!=(const FrameLayout& lhs, const FrameLayout& rhs) {
    return !(lhs == rhs);
}

TrjHeader parseHeader(TextStream& stream, std::size_t natoms) {
    if (natoms == 0) {
        throw FormatError("No atom count available for " + stream.path() + "; the trajectory format does not store it");
    }
    TrjHeader header;
    header.natoms = natoms;
    std::string title;
    if (!stream.readLine(title)) {
        throw FormatError("Empty trajectory file: " + stream.path());
    }
    header.size = stream.tell();
    if (!title.empty() && title.back() == '\r') {
        header.newlineWidth = 2;
        title.pop_back();
    }
    bool text = std::all_of(title.begin(), title.end(), [](char c) {
        auto u = static_cast<unsigned char>(c);
        return u >= 0x20 || u == '\t';
    });
    if (!text) {
        throw FormatError("Title line of " + stream.path() + " is not text; not an AMBER ASCII trajectory");
    }
    header.title = title;
    return header;
}

std::size_t coordinateLineCount(std::size_t natoms, const FrameLayout& layout) {
    std::size_t values = natoms * 3;
    return (values + layout.fieldsPerLine - 1) / layout.fieldsPerLine;
}

bool parseFrame(TextStream& stream,
                std::size_t natoms,
                const FrameLayout& layout,
                std::vector<Vec3>& positions,
                std::optional<UnitCell>& cell) {
    const std::size_t values = natoms * 3;
    const std::size_t lines = coordinateLineCount(natoms, layout);
    std::string line;
    std::uint64_t offset = 0;
    std::size_t value = 0;
    for (std::size_t i = 0; i < lines; ++i) {
        if (!readRecord(stream, layout, line, offset)) {
            if (i == 0) {
                return false;
            }
            throw FormatError("Truncated frame in " + stream.path() + ": expected " + std::to_string(lines) +
                              " coordinate lines, found " + std::to_string(i));
        }
        std::size_t fields = std::min(layout.fieldsPerLine, values - value);
        requireWidth(line, fields * layout.fieldWidth, "Coordinate line", stream, offset);
        for (std::size_t f = 0; f < fields; ++f, ++value) {
            double x = parseField(line, f, layout, stream, offset);
            Vec3& atom = positions[value / 3];
            switch (value % 3) {
                case 0:
                    atom.x = x;
                    break;
                case 1:
                    atom.y = x;
                    break;
                default:
                    atom.z = x;
                    break;
            }
        }
    }
    if (!layout.periodic()) {
        cell.reset();
        return true;
    }
    if (!readRecord(stream, layout, line, offset)) {
        throw FormatError("Missing box line at end of " + stream.path());
    }
    requireWidth(line, layout.boxFields * layout.fieldWidth, "Box line", stream, offset);
    UnitCell box{0.0, 0.0, 0.0, 90.0, 90.0, 90.0};
    for (std::size_t f = 0; f < layout.boxFields; ++f) {
        box[f] = parseField(line, f, layout, stream, offset);
    }
    cell = box;
    return true;
}

std::size_t detectBoxFields(TextStream& stream,
                            std::size_t natoms,
                            const FrameLayout& layout,
                            std::uint64_t bodySize,
                            std::optional<bool> periodic) {
    if (periodic && !*periodic) {
        return 0;
    }
    FrameLayout plain = layout;
    plain.boxFields = 0;
    std::vector<Vec3> scratch(natoms);
    std::optional<UnitCell> cell;
    if (!parseFrame(stream, natoms, plain, scratch, cell)) {
        throw FormatError("Trajectory " + stream.path() + " contains no frames");
    }

    std::string line;
    std::uint64_t offset = 0;
    std::size_t candidate = 0;
    bool crlfOk = true;
    try {
        if (readRecord(stream, layout, line, offset)) {
            candidate = boxLineFields(line, layout);
        }
    } catch (const FormatError&) {
        // a line without the expected terminator cannot be a box line
        crlfOk = false;
    }

    if (periodic) {
        if (candidate == 0) {
            throw FormatError("Expected a box line after the first frame of " + stream.path() +
                              " but found none (" + (crlfOk ? "line does not hold 3 or 6 fields" : "bad line ending") + ")");
        }
        return candidate;
    }
    if (candidate == 0) {
        return 0;
    }

    std::size_t firstWidth = std::min(layout.fieldsPerLine, natoms * 3) * layout.fieldWidth;
    if (line.size() != firstWidth) {
        return candidate;
    }

    // The line has the shape of the next frame's first coordinate line too.
    // Its width equals a coordinate line, so the boxed stride is a multiple of
    // the plain one and the sizes cannot settle it either. Such box lines are
    // read only when the periodicity is given.
    FrameLayout boxed = layout;
    boxed.boxFields = candidate;
    const std::uint64_t blank = trailingBlankBytes(stream, std::min<std::uint64_t>(bodySize, kBlankTailLimit));
    if (bodySize % frameStride(natoms, boxed) <= blank) {
        logWarn("Box line detection in " + stream.path() +
                " is ambiguous; assuming non-periodic (pass the periodicity explicitly to read box lines)");
    }
    return 0;
}

}  // namespace amtraj
