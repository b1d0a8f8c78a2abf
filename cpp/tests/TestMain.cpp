#include <bzlib.h>
#include <unistd.h>
#include <zlib.h>

#include <cmath>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <functional>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include "config/Parser.hpp"
#include "io/Errors.hpp"
#include "io/FrameIndex.hpp"
#include "io/TextStream.hpp"
#include "io/Topology.hpp"
#include "io/TrjReader.hpp"
#include "util/Logging.hpp"
#include "util/Math.hpp"

using namespace amtraj;
namespace fs = std::filesystem;

namespace {

int failures = 0;

void check(bool condition, const std::string& what) {
    if (!condition) {
        std::cerr << "FAILED: " << what << std::endl;
        ++failures;
    }
}

bool approxEqual(double a, double b, double eps = 1e-6) {
    return std::abs(a - b) < eps;
}

template <typename Error>
bool throwsAs(const std::function<void()>& fn) {
    try {
        fn();
    } catch (const Error&) {
        return true;
    } catch (const std::exception& ex) {
        std::cerr << "  unexpected exception: " << ex.what() << std::endl;
        return false;
    }
    return false;
}

// Multiples of 1/8 survive the F8.3 round trip exactly.
Vec3 atomPosition(std::size_t frame, std::size_t atom) {
    return Vec3{1.0 + 0.5 * atom + 0.25 * frame, 2.0 + 0.125 * atom + frame, 3.0 + 1.5 * frame + 0.75 * atom};
}

std::vector<Vec3> framePositions(std::size_t frame, std::size_t natoms) {
    std::vector<Vec3> positions;
    for (std::size_t a = 0; a < natoms; ++a) {
        positions.push_back(atomPosition(frame, a));
    }
    return positions;
}

std::string field(double value) {
    char buffer[32];
    std::snprintf(buffer, sizeof(buffer), "%8.3f", value);
    return buffer;
}

struct TrjFixture {
    std::string title{"amtraj generated trajectory"};
    std::size_t natoms{5};
    std::size_t nframes{4};
    std::vector<UnitCell> cells;
    std::size_t boxFields{3};
    std::string newline{"\n"};
};

std::string render(const TrjFixture& fixture) {
    std::string out = fixture.title + fixture.newline;
    for (std::size_t f = 0; f < fixture.nframes; ++f) {
        std::vector<double> values;
        for (const auto& p : framePositions(f, fixture.natoms)) {
            values.push_back(p.x);
            values.push_back(p.y);
            values.push_back(p.z);
        }
        for (std::size_t v = 0; v < values.size(); ++v) {
            out += field(values[v]);
            if ((v + 1) % 10 == 0 || v + 1 == values.size()) {
                out += fixture.newline;
            }
        }
        if (!fixture.cells.empty()) {
            const UnitCell& cell = fixture.cells[f % fixture.cells.size()];
            for (std::size_t b = 0; b < fixture.boxFields; ++b) {
                out += field(cell[b]);
            }
            out += fixture.newline;
        }
    }
    return out;
}

void writeFile(const fs::path& path, const std::string& contents) {
    std::ofstream out(path, std::ios::binary);
    out << contents;
    if (!out) {
        throw std::runtime_error("Failed to write fixture " + path.string());
    }
}

void writeGzip(const fs::path& path, const std::string& contents) {
    gzFile gz = gzopen(path.string().c_str(), "wb");
    if (!gz) {
        throw std::runtime_error("Failed to write fixture " + path.string());
    }
    int written = gzwrite(gz, contents.data(), static_cast<unsigned>(contents.size()));
    gzclose(gz);
    if (written != static_cast<int>(contents.size())) {
        throw std::runtime_error("Short gzip write for " + path.string());
    }
}

// `streams` > 1 writes concatenated bzip2 streams, like pbzip2 does.
void writeBzip2(const fs::path& path, const std::string& contents, std::size_t streams = 1) {
    std::FILE* file = std::fopen(path.string().c_str(), "wb");
    if (!file) {
        throw std::runtime_error("Failed to write fixture " + path.string());
    }
    std::size_t chunk = (contents.size() + streams - 1) / streams;
    for (std::size_t begin = 0; begin < contents.size(); begin += chunk) {
        std::string part = contents.substr(begin, chunk);
        int err = BZ_OK;
        BZFILE* bz = BZ2_bzWriteOpen(&err, file, 9, 0, 0);
        BZ2_bzWrite(&err, bz, const_cast<char*>(part.data()), static_cast<int>(part.size()));
        BZ2_bzWriteClose(&err, bz, 0, nullptr, nullptr);
        if (err != BZ_OK) {
            std::fclose(file);
            throw std::runtime_error("bzip2 compression failed for " + path.string());
        }
    }
    std::fclose(file);
}

const char* kPrmtop =
    "%VERSION  VERSION_STAMP = V0001.000  DATE = 01/01/26  00:00:00\n"
    "%FLAG TITLE\n"
    "%FORMAT(20a4)\n"
    "ALA in water\n"
    "%FLAG POINTERS\n"
    "%FORMAT(10I8)\n"
    "       5       2       0       0       0       0       0       0       0       0\n"
    "       0       2       0       0       0       0       0       0       0       0\n"
    "       0       0       0       0       0       0       0       1       0       0\n"
    "       0\n"
    "%FLAG ATOM_NAME\n"
    "%FORMAT(20a4)\n"
    "N   CA  C   O   OW  \n"
    "%FLAG CHARGE\n"
    "%FORMAT(5E16.8)\n"
    " -7.59761400E+00  6.19852000E-01  1.08303380E+01 -1.03821540E+01 -1.51336000E+01\n"
    "%FLAG RESIDUE_LABEL\n"
    "%FORMAT(20a4)\n"
    "ALA WAT \n"
    "%FLAG RESIDUE_POINTER\n"
    "%FORMAT(10I8)\n"
    "       1       5\n";

void testStrideArithmetic() {
    FrameLayout layout;
    check(frameStride(5, layout) == 81 + 41, "stride of 5 atoms without box");
    FrameLayout boxed = layout;
    boxed.boxFields = 3;
    check(frameStride(5, boxed) == 81 + 41 + 25, "stride of 5 atoms with box");
    check(frameStride(2, boxed) == 49 + 25, "stride of 2 atoms with box");
    FrameLayout crlf = layout;
    crlf.newlineWidth = 2;
    check(frameStride(5, crlf) == 82 + 42, "stride with CRLF terminators");
    check(frameStride(10, layout) == 3 * 81, "stride of whole lines only");

    check(frameCount(10 + 3 * 122, 10, 122) == 3, "frame count of exact body");
    check(frameCount(10, 10, 122) == 0, "frame count of header only");
    check(throwsAs<FormatError>([] { frameCount(10 + 3 * 122 + 5, 10, 122); }), "remainder is a format error");

    FrameIndex index(5, layout, 10, 10 + 3 * 122);
    check(index.size() == 3, "index frame count");
    check(index.offsetOf(0) == 10, "offset of frame 0");
    check(index.offsetOf(2) == 10 + 2 * 122, "offset of frame 2");
    check(throwsAs<IndexError>([&] { index.offsetOf(3); }), "offset past the end");
    check(index == FrameIndex(5, layout, 10, 10 + 3 * 122), "index is a pure function of its inputs");
}

// Exercises one trajectory of generator data through the whole reader surface.
void testReaderSurface(const fs::path& path, const std::string& label, std::size_t natoms, std::size_t nframes, bool periodic,
                       Compression compression) {
    TrjReader reader(path.string(), natoms);
    check(reader.nAtoms() == natoms, label + ": n_atoms");
    check(reader.nFrames() == nframes, label + ": n_frames");
    check(reader.periodic() == periodic, label + ": periodic flag");
    check(reader.compression() == compression, label + ": compression detected");
    check(reader.title() == "amtraj generated trajectory", label + ": title");

    // frame 0 is there before any read
    const Snapshot& ts = reader.snapshot();
    check(ts.frame == 0, label + ": initial frame is 0");
    check(ts.nAtoms() == natoms, label + ": snapshot atom count");
    bool anyPositive = false;
    for (const auto& p : ts.positions) {
        anyPositive = anyPositive || p.x > 0 || p.y > 0 || p.z > 0;
    }
    check(anyPositive, label + ": positions populated right away");
    check(ts.positions == framePositions(0, natoms), label + ": frame 0 coordinates");
    const Snapshot initial = ts;
    const Vec3* buffer = ts.positions.data();

    // rewind
    check(reader.next() && reader.next(), label + ": advance twice");
    check(ts.frame == 2, label + ": forwarded to frame 2");
    check(ts.positions == framePositions(2, natoms), label + ": frame 2 coordinates");
    reader.rewind();
    check(ts.frame == 0, label + ": rewound to frame 0");
    check(ts.positions == initial.positions, label + ": rewind reproduces frame 0 bit for bit");

    // random access
    Vec3 pos1 = reader.snapshot().positions[0];
    reader.next();
    reader.next();
    Vec3 pos3 = reader.snapshot().positions[0];
    check(reader.seek(0).positions[0] == pos1, label + ": seek back to frame 0");
    check(reader.seek(2).positions[0] == pos3, label + ": seek to frame 2");
    for (std::size_t i = 0; i < nframes; ++i) {
        for (std::size_t j = 0; j < nframes; ++j) {
            std::vector<Vec3> first = reader.seek(i).positions;
            reader.seek(j);
            check(reader.seek(i).positions == first, label + ": seek " + std::to_string(i) + " after " + std::to_string(j));
        }
    }
    check(reader.snapshot().positions.data() == buffer, label + ": positions buffer reused");

    // full range, twice
    for (int pass = 0; pass < 2; ++pass) {
        std::vector<std::size_t> frames;
        Vec3 cogSum;
        Vec3 expectedSum;
        for (const Snapshot& frame : reader.frames()) {
            frames.push_back(frame.frame);
            cogSum += centerOfGeometry(frame.positions);
            expectedSum += centerOfGeometry(framePositions(frame.frame, natoms));
            check(frame.unitcell.has_value() == periodic, label + ": unit cell present iff periodic");
        }
        std::vector<std::size_t> expected;
        for (std::size_t i = 0; i < nframes; ++i) {
            expected.push_back(i);
        }
        check(frames == expected, label + ": full range yields every frame in order");
        check(approxEqual(cogSum.x + cogSum.y + cogSum.z, expectedSum.x + expectedSum.y + expectedSum.z),
              label + ": sum of centres of geometry");
    }
    check(!reader.next(), label + ": next at the last frame reports exhaustion");
    check(reader.snapshot().frame == nframes - 1, label + ": exhausted next leaves the snapshot alone");

    // close / reopen
    reader.close();
    check(!reader.isOpen(), label + ": closed");
    check(throwsAs<ClosedHandleError>([&] { reader.next(); }), label + ": next on a closed reader");
    check(reader.seek(2).frame == 2, label + ": seek reopens a closed reader");
    check(reader.isOpen(), label + ": open again after seek");
    if (nframes > 3) {
        check(reader.next() && reader.snapshot().frame == 3, label + ": sequential read after reopen");
        check(reader.snapshot().positions == framePositions(3, natoms), label + ": frame 3 coordinates after reopen");
    }
    check(throwsAs<IndexError>([&] { reader.seek(nframes); }), label + ": seek out of range");
}

void testFormats(const fs::path& dir) {
    TrjFixture plain;
    std::string text = render(plain);
    writeFile(dir / "plain.trj", text);
    writeGzip(dir / "plain.trj.gz", text);
    writeBzip2(dir / "plain.trj.bz2", text);
    writeBzip2(dir / "multi.trj.bz2", text, 3);
    testReaderSurface(dir / "plain.trj", "plain", 5, 4, false, Compression::None);
    testReaderSurface(dir / "plain.trj.gz", "gzip", 5, 4, false, Compression::Gzip);
    testReaderSurface(dir / "plain.trj.bz2", "bzip2", 5, 4, false, Compression::Bzip2);
    testReaderSurface(dir / "multi.trj.bz2", "bzip2 multistream", 5, 4, false, Compression::Bzip2);

    TrjFixture pbc;
    pbc.natoms = 7;
    pbc.cells = {UnitCell{30.0, 31.0, 32.0, 90.0, 90.0, 90.0}};
    std::string pbcText = render(pbc);
    writeFile(dir / "pbc.trj", pbcText);
    writeBzip2(dir / "pbc.trj.bz2", pbcText);
    testReaderSurface(dir / "pbc.trj", "periodic", 7, 4, true, Compression::None);
    testReaderSurface(dir / "pbc.trj.bz2", "periodic bzip2", 7, 4, true, Compression::Bzip2);

    TrjFixture crlf = pbc;
    crlf.newline = "\r\n";
    writeFile(dir / "crlf.trj", render(crlf));
    testReaderSurface(dir / "crlf.trj", "CRLF", 7, 4, true, Compression::None);

    // detection goes by content, not by name
    writeGzip(dir / "compressed.txt", text);
    writeFile(dir / "uncompressed.gz", text);
    check(TrjReader((dir / "compressed.txt").string(), 5).compression() == Compression::Gzip, "gzip content with .txt name");
    check(TrjReader((dir / "uncompressed.gz").string(), 5).compression() == Compression::None, "plain content with .gz name");
}

void testUnitCellScenario(const fs::path& dir) {
    TrjFixture fixture;
    fixture.natoms = 2;
    fixture.nframes = 3;
    fixture.cells = {UnitCell{10.0, 11.0, 12.0, 90.0, 90.0, 90.0}};
    writeFile(dir / "cell.trj", render(fixture));

    TrjReader reader((dir / "cell.trj").string(), 2);
    check(reader.nFrames() == 3, "cell scenario: n_frames");
    check(reader.periodic(), "cell scenario: periodic");
    const Snapshot& ts = reader.seek(2);
    check(ts.unitcell.has_value(), "cell scenario: unit cell present");
    if (ts.unitcell) {
        UnitCell expected{10.0, 11.0, 12.0, 90.0, 90.0, 90.0};
        check(*ts.unitcell == expected, "cell scenario: unit cell values");
    }
    check(approxEqual(ts.boxMatrix().determinant(), 1320.0), "cell scenario: box volume");

    TrjFixture triclinic = fixture;
    triclinic.natoms = 3;
    triclinic.boxFields = 6;
    triclinic.cells = {UnitCell{20.0, 20.0, 20.0, 109.5, 109.5, 109.5}};
    writeFile(dir / "triclinic.trj", render(triclinic));
    TrjReader octahedron((dir / "triclinic.trj").string(), 3);
    check(octahedron.layout().boxFields == 6, "triclinic: six box fields");
    check(octahedron.snapshot().unitcell && (*octahedron.snapshot().unitcell)[4] == 109.5, "triclinic: angles read");
}

void testLayoutDetection(const fs::path& dir) {
    // one atom: every line holds three fields, like a box line would
    TrjFixture single;
    single.natoms = 1;
    single.nframes = 3;
    writeFile(dir / "single.trj", render(single));
    TrjReader plain((dir / "single.trj").string(), 1);
    check(!plain.periodic() && plain.nFrames() == 3, "single atom without box");

    // an even frame count fits both strides; positions are never read as a box
    TrjFixture two = single;
    two.nframes = 2;
    writeFile(dir / "single_two.trj", render(two));
    TrjReader evenSingle((dir / "single_two.trj").string(), 1);
    check(!evenSingle.periodic() && evenSingle.nFrames() == 2, "single atom, two frames without box");
    check(!evenSingle.snapshot().unitcell && evenSingle.seek(1).positions[0] == atomPosition(1, 0),
          "single atom: second frame read as coordinates");

    TrjFixture pair = two;
    pair.natoms = 2;
    writeFile(dir / "pair_two.trj", render(pair));
    TrjReader evenPair((dir / "pair_two.trj").string(), 2);
    check(!evenPair.periodic() && evenPair.nFrames() == 2, "two atoms, two frames without box");
    check(evenPair.seek(1).positions == framePositions(1, 2), "two atoms: second frame read as coordinates");

    // a blank tail does not change the answer
    writeFile(dir / "pair_blank.trj", render(pair) + "\n");
    TrjReader blankPair((dir / "pair_blank.trj").string(), 2);
    check(!blankPair.periodic() && blankPair.nFrames() == 2 && blankPair.frameIndex().trailingBytes() == 1,
          "two atoms with a trailing blank line");

    // boxes as wide as a coordinate line need the periodicity spelled out
    ReaderOptions wantBox;
    wantBox.periodic = true;
    single.cells = {UnitCell{20.0, 20.0, 20.0, 90.0, 90.0, 90.0}};
    writeFile(dir / "single_pbc.trj", render(single));
    TrjReader boxed((dir / "single_pbc.trj").string(), 1, wantBox);
    check(boxed.periodic() && boxed.nFrames() == 3, "single atom with box");
    check(boxed.seek(2).unitcell && (*boxed.snapshot().unitcell)[0] == 20.0, "single atom: box values");
    pair.cells = {UnitCell{30.0, 30.0, 30.0, 60.0, 60.0, 90.0}};
    pair.boxFields = 6;
    writeFile(dir / "pair_pbc.trj", render(pair));
    TrjReader boxedPair((dir / "pair_pbc.trj").string(), 2, wantBox);
    check(boxedPair.layout().boxFields == 6 && boxedPair.nFrames() == 2, "two atoms with a six field box");

    ReaderOptions forced;
    forced.periodic = false;
    TrjReader explicitPlain((dir / "single_two.trj").string(), 1, forced);
    check(!explicitPlain.periodic() && explicitPlain.nFrames() == 2, "explicit periodicity overrides detection");

    Topology topology;
    topology.atoms.resize(1);
    topology.periodic = false;
    TrjReader fromTopology((dir / "single_two.trj").string(), topology);
    check(!fromTopology.periodic(), "topology box flag overrides detection");

    check(throwsAs<FormatError>([&] { TrjReader((dir / "plain.trj").string(), 5, wantBox); }),
          "box required but missing");

    // fixed columns: fields touching each other are still separate values
    writeFile(dir / "packed.trj", "packed\n-123.456-100.000 -99.500\n");
    TrjReader packed((dir / "packed.trj").string(), 1);
    const Vec3& p = packed.snapshot().positions[0];
    check(p.x == -123.456 && p.y == -100.0 && p.z == -99.5, "adjacent fixed-width fields");
}

void testInvalidInputs(const fs::path& dir) {
    std::string valid = render(TrjFixture{});
    check(throwsAs<FormatError>([&] { TrjReader((dir / "plain.trj").string(), 0); }), "missing atom count");
    check(throwsAs<IOError>([&] { TrjReader((dir / "does_not_exist.trj").string(), 5); }), "missing file");

    writeFile(dir / "notes.txt", "This is not a trajectory\nsome words here\nand more\n");
    check(throwsAs<FormatError>([&] { TrjReader((dir / "notes.txt").string(), 2); }), "arbitrary text file");

    writeFile(dir / "empty.trj", "");
    check(throwsAs<FormatError>([&] { TrjReader((dir / "empty.trj").string(), 5); }), "empty file");

    writeFile(dir / "title_only.trj", "just a title\n");
    check(throwsAs<FormatError>([&] { TrjReader((dir / "title_only.trj").string(), 5); }), "title without frames");

    writeFile(dir / "binary.trj", std::string("\x00\x01\x02\x03\x04\n\x05\x06", 8));
    check(throwsAs<FormatError>([&] { TrjReader((dir / "binary.trj").string(), 5); }), "binary file");

    writeFile(dir / "truncated.trj", valid.substr(0, valid.size() - 12));
    check(throwsAs<FormatError>([&] { TrjReader((dir / "truncated.trj").string(), 5); }), "truncated trajectory");
    writeGzip(dir / "truncated.trj.gz", valid.substr(0, valid.size() - 12));
    check(throwsAs<FormatError>([&] { TrjReader((dir / "truncated.trj.gz").string(), 5); }), "truncated gzip trajectory");

    writeFile(dir / "wrong_atoms.trj", valid);
    check(throwsAs<FormatError>([&] { TrjReader((dir / "wrong_atoms.trj").string(), 4); }), "atom count mismatch");

    writeFile(dir / "trailing.trj", valid + "\n  \n");
    TrjReader trailing((dir / "trailing.trj").string(), 5);
    check(trailing.nFrames() == 4, "trailing blank lines tolerated");
    check(trailing.frameIndex().trailingBytes() == 4, "trailing bytes recorded");

    // malformed field in frame 1 (the header is 28 bytes, a frame 122)
    std::string broken = valid;
    broken.replace(28 + 122 + 8, 8, "  abc.de");
    writeFile(dir / "broken.trj", broken);
    TrjReader lazy((dir / "broken.trj").string(), 5);
    std::vector<Vec3> before = lazy.snapshot().positions;
    check(throwsAs<FormatError>([&] { lazy.seek(1); }), "malformed field reported on access");
    check(lazy.snapshot().frame == 0 && lazy.snapshot().positions == before, "failed read leaves the snapshot intact");
    ReaderOptions strict;
    strict.validateFrames = true;
    check(throwsAs<FormatError>([&] { TrjReader((dir / "broken.trj").string(), 5, strict); }),
          "malformed field reported at construction when validating");
    check(TrjReader((dir / "plain.trj").string(), 5, strict).nFrames() == 4, "validation of a clean file");

    std::string overflow = valid;
    overflow.replace(28, 8, "********");
    writeFile(dir / "overflow.trj", overflow);
    check(throwsAs<FormatError>([&] { TrjReader((dir / "overflow.trj").string(), 5); }), "overflowed field is not zero");
}

std::size_t openDescriptorCount() {
    std::size_t count = 0;
    for (const auto& entry : fs::directory_iterator("/proc/self/fd")) {
        (void)entry;
        ++count;
    }
    return count;
}

void testReopen(const fs::path& dir) {
    fs::path path = dir / "reopen.trj";
    std::string text = render(TrjFixture{});
    writeFile(path, text);
    TrjReader reader(path.string(), 5);
    FrameIndex before = reader.frameIndex();
    reader.seek(1);
    reader.close();
    reader.reopen();
    check(reader.frameIndex() == before, "reopen rebuilds an identical index");
    check(reader.frameIndex().offsetOf(3) == before.offsetOf(3), "reopen keeps offsets");
    check(reader.next() && reader.snapshot().frame == 2, "reopen continues after the current frame");

    reader.close();
    writeFile(path, text + text.substr(28, 122));
    check(throwsAs<FormatError>([&] { reader.seek(0); }), "file changed on disk is detected on reopen");

    std::size_t fdsBefore = openDescriptorCount();
    {
        TrjReader scoped((dir / "plain.trj.gz").string(), 5);
        scoped.seek(3);
        check(openDescriptorCount() > fdsBefore, "open reader holds a descriptor");
    }
    check(openDescriptorCount() == fdsBefore, "destructor releases the descriptor");
    TrjReader closing((dir / "plain.trj.bz2").string(), 5);
    closing.close();
    check(openDescriptorCount() == fdsBefore, "close releases the descriptor");
}

void testTextStream(const fs::path& dir) {
    TextStream stream((dir / "plain.trj.gz").string());
    std::string expected = render(TrjFixture{});
    check(stream.compression() == Compression::Gzip, "stream: gzip detected");
    check(stream.size() == expected.size(), "stream: decoded size");
    std::string line;
    check(stream.readLine(line) && line == "amtraj generated trajectory", "stream: title line");
    check(stream.tell() == 28, "stream: position after title");
    stream.seek(expected.size() - 10);
    std::vector<char> tail(10);
    check(stream.read(tail.data(), tail.size()) == 10 && std::string(tail.begin(), tail.end()) == expected.substr(expected.size() - 10),
          "stream: forward seek");
    check(!stream.readLine(line), "stream: end of stream");
    stream.seek(0);
    check(stream.readLine(line) && line == "amtraj generated trajectory", "stream: backward seek restarts the decoder");
    check(throwsAs<IOError>([&] { stream.seek(expected.size() + 1); }), "stream: seek past the end");
    stream.close();
    check(!stream.isOpen(), "stream: closed");
    check(throwsAs<ClosedHandleError>([&] { stream.readLine(line); }), "stream: read after close");
    check(throwsAs<ClosedHandleError>([&] { stream.seek(0); }), "stream: seek after close");
    check(throwsAs<IOError>([&] { detectCompression((dir / "missing.gz").string()); }), "stream: missing file");

    writeFile(dir / "blank_tail.txt", "abc \n\n");
    TextStream blank((dir / "blank_tail.txt").string());
    check(trailingBlankBytes(blank, 100) == 3, "stream: blank tail length");
    check(trailingBlankBytes(blank, 2) == 2, "stream: blank tail within limit");
}

void testTopology(const fs::path& dir) {
    writeFile(dir / "ala.prmtop", kPrmtop);
    Topology topology = loadTopology((dir / "ala.prmtop").string());
    check(topology.atomCount() == 5, "prmtop: atom count");
    check(topology.periodic && *topology.periodic, "prmtop: IFBOX");
    check(topology.atoms[1].name == "CA" && topology.atoms[4].name == "OW", "prmtop: atom names");
    check(topology.atoms[0].residue == "ALA" && topology.atoms[3].residue == "ALA", "prmtop: first residue");
    check(topology.atoms[4].residue == "WAT", "prmtop: last residue");

    TrjFixture fixture;
    fixture.cells = {UnitCell{25.0, 25.0, 25.0, 90.0, 90.0, 90.0}};
    writeFile(dir / "ala.trj", render(fixture));
    TrjReader reader((dir / "ala.trj").string(), topology);
    check(reader.nAtoms() == topology.atomCount() && reader.periodic(), "prmtop: reader takes atom count and box flag");

    check(throwsAs<FormatError>([&] { loadTopology((dir / "ala.pdb").string()); }), "topology: unsupported extension");
    check(throwsAs<IOError>([&] { loadTopology((dir / "missing.prmtop").string()); }), "topology: missing file");
    writeFile(dir / "nopointers.prmtop", "%FLAG TITLE\n%FORMAT(20a4)\nx\n");
    check(throwsAs<FormatError>([&] { loadTopology((dir / "nopointers.prmtop").string()); }), "topology: no POINTERS");
}

void testConfig() {
    std::istringstream input(
        "# reader settings\n"
        "TRJ\n"
        "  NATOMS 5\n"
        "  periodic no   # explicit\n"
        "  VALIDATE yes\n"
        "  LOG_LEVEL debug\n"
        "  TOPOLOGY ala.prmtop\n"
        "  TRAJECTORY ala.trj.bz2\n"
        "  COLOUR blue\n"
        "... TRJ\n"
        "NATOMS 99\n");
    TrjConfig config = parseConfigStream(input);
    check(config.natoms == 5, "config: NATOMS");
    check(config.reader.periodic && !*config.reader.periodic, "config: PERIODIC");
    check(config.reader.validateFrames, "config: VALIDATE");
    check(config.logLevel == LogLevel::Debug, "config: LOG_LEVEL");
    check(config.topology == "ala.prmtop" && config.trajectory == "ala.trj.bz2", "config: paths");

    std::istringstream autoBox("TRJ\nPERIODIC auto\n... TRJ\n");
    check(!parseConfigStream(autoBox).reader.periodic, "config: PERIODIC auto");
    std::istringstream bad("TRJ\nNATOMS -3\n... TRJ\n");
    check(throwsAs<std::runtime_error>([&] { parseConfigStream(bad); }), "config: invalid NATOMS");
    check(parseCount("12", "--frame", 0) == 12 && parseCount("0", "--frame", 0) == 0, "count: accepted values");
    check(throwsAs<std::runtime_error>([] { parseCount("-1", "--frame", 0); }), "count: negative value");
    check(throwsAs<std::runtime_error>([] { parseCount("0", "--natoms", 1); }), "count: below minimum");
    check(throwsAs<std::runtime_error>([] { parseCount("7x", "--natoms", 1); }), "count: trailing text");
    check(throwsAs<std::runtime_error>([] { parseConfigFile("/nonexistent/trj.conf"); }), "config: missing file");

    check(parseLogLevel("WARNING") == LogLevel::Warn, "log level: warning alias");
    check(throwsAs<std::runtime_error>([] { parseLogLevel("loud"); }), "log level: unknown name");
}

}  // namespace

int main() {
    Logger::instance().setLevel(LogLevel::Error);
    fs::path dir = fs::temp_directory_path() / ("amtraj_tests_" + std::to_string(::getpid()));
    fs::create_directories(dir);

    try {
        testStrideArithmetic();
        testFormats(dir);
        testUnitCellScenario(dir);
        testLayoutDetection(dir);
        testInvalidInputs(dir);
        testReopen(dir);
        testTextStream(dir);
        testTopology(dir);
        testConfig();
    } catch (const std::exception& ex) {
        std::cerr << "Unexpected exception: " << ex.what() << std::endl;
        ++failures;
    }

    std::error_code ec;
    fs::remove_all(dir, ec);
    if (failures > 0) {
        std::cerr << failures << " check(s) failed." << std::endl;
        return 1;
    }
    return 0;
}
