#include "io/TrjReader.hpp"

#include <utility>

#include "io/Errors.hpp"
#include "util/Logging.hpp"

namespace amtraj {

namespace {

ReaderOptions withTopology(ReaderOptions options, const Topology& topology) {
    if (!options.periodic) {
        options.periodic = topology.periodic;
    }
    return options;
}

}  // namespace

FrameIterator::reference FrameIterator::operator*() const {
    return reader_->snapshot();
}

FrameIterator::pointer FrameIterator::operator->() const {
    return &reader_->snapshot();
}

FrameIterator& FrameIterator::operator++() {
    if (!reader_->next()) {
        reader_ = nullptr;
    }
    return *this;
}

FrameIterator FrameRange::begin() {
    reader_->rewind();
    return FrameIterator(reader_);
}

TrjReader::TrjReader(std::string path, std::size_t natoms, ReaderOptions options)
    : path_(std::move(path)), natoms_(natoms), options_(options) {
    open();
}

TrjReader::TrjReader(std::string path, const Topology& topology, ReaderOptions options)
    : path_(std::move(path)), natoms_(topology.atomCount()), options_(withTopology(options, topology)) {
    open();
}

void TrjReader::open() {
    if (natoms_ == 0) {
        throw FormatError("No atom count for " + path_ + "; AMBER trajectories take it from the topology");
    }
    stream_ = std::make_unique<TextStream>(path_);
    compression_ = stream_->compression();
    header_ = parseHeader(*stream_, natoms_);
    layout_ = FrameLayout{};
    layout_.newlineWidth = header_.newlineWidth;

    const std::uint64_t total = stream_->size();
    layout_.boxFields = detectBoxFields(*stream_, natoms_, layout_, total - header_.size, options_.periodic);
    index_ = FrameIndex::build(*stream_, natoms_, layout_, header_.size);
    if (index_.empty()) {
        throw FormatError("Trajectory " + path_ + " contains no complete frame");
    }

    snapshot_.periodic = layout_.periodic();
    snapshot_.positions.assign(natoms_, Vec3{});
    scratch_.assign(natoms_, Vec3{});

    if (options_.validateFrames) {
        validateFrames();
    }
    stream_->seek(index_.offsetOf(0));
    readFrame(0);

    logInfo("Opened " + path_ + ": " + std::to_string(natoms_) + " atoms, " + std::to_string(index_.size()) + " frames, " +
            (layout_.periodic() ? "periodic (" + std::to_string(layout_.boxFields) + " box fields)" : std::string("no box")) +
            ", compression " + compressionName(compression_));
}

void TrjReader::validateFrames() {
    stream_->seek(index_.offsetOf(0));
    for (std::size_t frame = 0; frame < index_.size(); ++frame) {
        if (!parseFrame(*stream_, natoms_, layout_, scratch_, scratchCell_)) {
            throw FormatError("Unexpected end of " + path_ + " at frame " + std::to_string(frame));
        }
    }
    logDebug("Validated " + std::to_string(index_.size()) + " frames of " + path_);
}

void TrjReader::readFrame(std::size_t frame) {
    const std::uint64_t expected = index_.offsetOf(frame);
    if (stream_->tell() != expected) {
        throw FormatError("Frame " + std::to_string(frame) + " of " + path_ + " does not start at byte " + std::to_string(expected));
    }
    if (!parseFrame(*stream_, natoms_, layout_, scratch_, scratchCell_)) {
        throw FormatError("Unexpected end of " + path_ + " at frame " + std::to_string(frame));
    }
    snapshot_.load(scratch_, scratchCell_, frame);
}

bool TrjReader::next() {
    if (!isOpen()) {
        throw ClosedHandleError("Trajectory " + path_ + " is closed; seek() or reopen() it before reading on");
    }
    if (snapshot_.frame + 1 >= index_.size()) {
        return false;
    }
    readFrame(snapshot_.frame + 1);
    return true;
}

const Snapshot& TrjReader::seek(std::size_t frame) {
    const std::uint64_t offset = index_.offsetOf(frame);
    if (!isOpen()) {
        reopen();
    }
    stream_->seek(offset);
    readFrame(frame);
    return snapshot_;
}

const Snapshot& TrjReader::rewind() {
    return seek(0);
}

void TrjReader::close() {
    if (stream_) {
        stream_->close();
        stream_.reset();
        logDebug("Closed " + path_);
    }
}

void TrjReader::reopen() {
    auto stream = std::make_unique<TextStream>(path_);
    TrjHeader header = parseHeader(*stream, natoms_);
    FrameIndex index = FrameIndex::build(*stream, natoms_, layout_, header.size);
    if (header.size != header_.size || header.newlineWidth != header_.newlineWidth || index != index_) {
        throw FormatError("Trajectory " + path_ + " changed on disk since it was opened");
    }
    // continue sequential reads after the current frame
    stream->seek(index_.offsetOf(snapshot_.frame) + index_.stride());
    stream_ = std::move(stream);
    logDebug("Reopened " + path_ + " at frame " + std::to_string(snapshot_.frame));
}

}  // namespace amtraj
