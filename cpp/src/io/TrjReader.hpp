#pragma once

#include <cstddef>
#include <iterator>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "io/FrameIndex.hpp"
#include "io/Snapshot.hpp"
#include "io/TextStream.hpp"
#include "io/Topology.hpp"
#include "io/TrjFormat.hpp"

namespace amtraj {

struct ReaderOptions {
    // Unset: detect box lines from the file.
    std::optional<bool> periodic;
    // Parse every frame once while opening.
    bool validateFrames{false};
};

class TrjReader;

class FrameIterator {
  public:
    using iterator_category = std::input_iterator_tag;
    using value_type = Snapshot;
    using difference_type = std::ptrdiff_t;
    using pointer = const Snapshot*;
    using reference = const Snapshot&;

    FrameIterator() = default;
    explicit FrameIterator(TrjReader* reader) : reader_(reader) {}

    reference operator*() const;
    pointer operator->() const;
    FrameIterator& operator++();

    bool operator==(const FrameIterator& other) const { return reader_ == other.reader_; }
    bool operator!=(const FrameIterator& other) const { return reader_ != other.reader_; }

  private:
    TrjReader* reader_{nullptr};
};

// All frames in order. Each begin() rewinds the reader, so the range can be
// walked any number of times.
class FrameRange {
  public:
    explicit FrameRange(TrjReader& reader) : reader_(&reader) {}

    FrameIterator begin();
    FrameIterator end() const { return FrameIterator(); }

  private:
    TrjReader* reader_;
};

// Reader for AMBER ASCII trajectories (.trj, .mdcrd), plain or compressed.
//
// The constructor validates the file and loads frame 0. next() reads
// sequentially and needs an open stream; seek() reopens a closed reader on
// its own. All reads overwrite the single Snapshot returned by snapshot().
// Not safe to share between threads.
class TrjReader {
  public:
    TrjReader(std::string path, std::size_t natoms, ReaderOptions options = {});
    TrjReader(std::string path, const Topology& topology, ReaderOptions options = {});

    TrjReader(const TrjReader&) = delete;
    TrjReader& operator=(const TrjReader&) = delete;

    std::size_t nAtoms() const { return natoms_; }
    std::size_t nFrames() const { return index_.size(); }
    bool periodic() const { return layout_.periodic(); }
    const std::string& path() const { return path_; }
    const std::string& title() const { return header_.title; }
    Compression compression() const { return compression_; }
    const FrameLayout& layout() const { return layout_; }
    const FrameIndex& frameIndex() const { return index_; }
    bool isOpen() const { return stream_ != nullptr; }

    // Contents change on the next read; copy to keep.
    const Snapshot& snapshot() const { return snapshot_; }

    // Advances one frame. Returns false, leaving the snapshot alone, at the
    // last frame. Throws ClosedHandleError after close().
    bool next();

    const Snapshot& seek(std::size_t frame);
    const Snapshot& rewind();

    void close();
    void reopen();

    FrameRange frames() { return FrameRange(*this); }

  private:
    void open();
    void validateFrames();
    void readFrame(std::size_t frame);

    std::string path_;
    std::size_t natoms_;
    ReaderOptions options_;
    std::unique_ptr<TextStream> stream_;
    Compression compression_{Compression::None};
    TrjHeader header_;
    FrameLayout layout_;
    FrameIndex index_;
    Snapshot snapshot_;
    std::vector<Vec3> scratch_;
    std::optional<UnitCell> scratchCell_;
};

}  // namespace amtraj
