#include "io/FrameIndex.hpp"

#include <algorithm>
#include <cctype>
#include <string>
#include <vector>

#include "io/Errors.hpp"
#include "util/Logging.hpp"

namespace amtraj {

std::uint64_t frameStride(std::size_t natoms, const FrameLayout& layout) {
    const std::uint64_t values = static_cast<std::uint64_t>(natoms) * 3;
    const std::uint64_t fullLines = values / layout.fieldsPerLine;
    const std::uint64_t lastFields = values % layout.fieldsPerLine;
    std::uint64_t stride = fullLines * (layout.fieldsPerLine * layout.fieldWidth + layout.newlineWidth);
    if (lastFields > 0) {
        stride += lastFields * layout.fieldWidth + layout.newlineWidth;
    }
    if (layout.periodic()) {
        stride += layout.boxFields * layout.fieldWidth + layout.newlineWidth;
    }
    return stride;
}

std::size_t frameCount(std::uint64_t streamSize, std::uint64_t headerSize, std::uint64_t stride) {
    if (stride == 0) {
        throw FormatError("Frame stride must be positive");
    }
    if (streamSize < headerSize) {
        throw FormatError("Trajectory is shorter than its header (" + std::to_string(streamSize) + " < " +
                          std::to_string(headerSize) + " bytes)");
    }
    std::uint64_t body = streamSize - headerSize;
    if (body % stride != 0) {
        throw FormatError("Truncated or corrupt trajectory: " + std::to_string(body) + " bytes of frame data is not a multiple of the " +
                          std::to_string(stride) + " byte frame size (" + std::to_string(body % stride) + " bytes left over)");
    }
    return static_cast<std::size_t>(body / stride);
}

std::uint64_t trailingBlankBytes(TextStream& stream, std::uint64_t limit) {
    const std::uint64_t total = stream.size();
    limit = std::min(limit, total);
    if (limit == 0) {
        return 0;
    }
    std::vector<char> bytes(static_cast<std::size_t>(limit));
    stream.seek(total - limit);
    if (stream.read(bytes.data(), bytes.size()) != bytes.size()) {
        throw IOError("Short read at the end of " + stream.path());
    }
    auto last = std::find_if(bytes.rbegin(), bytes.rend(), [](char c) { return std::isspace(static_cast<unsigned char>(c)) == 0; });
    return static_cast<std::uint64_t>(last - bytes.rbegin());
}

FrameIndex::FrameIndex(std::size_t natoms, const FrameLayout& layout, std::uint64_t headerSize, std::uint64_t streamSize)
    : headerSize_(headerSize), stride_(frameStride(natoms, layout)) {
    nFrames_ = frameCount(streamSize, headerSize_, stride_);
}

FrameIndex FrameIndex::build(TextStream& stream, std::size_t natoms, const FrameLayout& layout, std::uint64_t headerSize) {
    const std::uint64_t total = stream.size();
    const std::uint64_t stride = frameStride(natoms, layout);
    std::uint64_t tail = 0;
    if (total > headerSize && stride > 0) {
        tail = (total - headerSize) % stride;
    }
    if (tail > 0) {
        if (trailingBlankBytes(stream, tail) == tail) {
            logWarn("Ignoring " + std::to_string(tail) + " trailing whitespace bytes in " + stream.path());
        } else {
            // reported with the full remainder
            tail = 0;
        }
    }
    FrameIndex index(natoms, layout, headerSize, total - tail);
    index.trailing_ = tail;
    return index;
}

std::uint64_t FrameIndex::offsetOf(std::size_t frame) const {
    if (frame >= nFrames_) {
        throw IndexError("Frame index " + std::to_string(frame) + " out of range [0, " + std::to_string(nFrames_) + ")");
    }
    return headerSize_ + static_cast<std::uint64_t>(frame) * stride_;
}

bool FrameIndex::operator==(const FrameIndex& other) const {
    return headerSize_ == other.headerSize_ && stride_ == other.stride_ && nFrames_ == other.nFrames_ &&
           trailing_ == other.trailing_;
}

}  // namespace amtraj
