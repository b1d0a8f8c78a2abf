#pragma once

#include <cstddef>
#include <cstdint>

#include "io/TextStream.hpp"
#include "io/TrjFormat.hpp"

namespace amtraj {

// Bytes occupied by one frame record, terminators included.
std::uint64_t frameStride(std::size_t natoms, const FrameLayout& layout);

// Number of whole frames after the header. Any remainder is a FormatError.
std::size_t frameCount(std::uint64_t streamSize, std::uint64_t headerSize, std::uint64_t stride);

// Number of whitespace bytes ending the stream, looking at the last `limit`
// bytes at most. Moves the stream position.
std::uint64_t trailingBlankBytes(TextStream& stream, std::uint64_t limit);

// Byte offset of every frame, derived from the layout alone.
class FrameIndex {
  public:
    FrameIndex() = default;
    FrameIndex(std::size_t natoms, const FrameLayout& layout, std::uint64_t headerSize, std::uint64_t streamSize);

    // Like the constructor, but tolerates a whitespace-only tail (a trailing
    // blank line) which it reads from the stream to check.
    static FrameIndex build(TextStream& stream, std::size_t natoms, const FrameLayout& layout, std::uint64_t headerSize);

    std::uint64_t offsetOf(std::size_t frame) const;

    std::size_t size() const { return nFrames_; }
    bool empty() const { return nFrames_ == 0; }
    std::uint64_t stride() const { return stride_; }
    std::uint64_t headerSize() const { return headerSize_; }
    std::uint64_t trailingBytes() const { return trailing_; }

    bool operator==(const FrameIndex& other) const;
    bool operator!=(const FrameIndex& other) const { return !(*this == other); }

  private:
    std::uint64_t headerSize_{0};
    std::uint64_t stride_{0};
    std::size_t nFrames_{0};
    std::uint64_t trailing_{0};
};

}  // namespace amtraj
