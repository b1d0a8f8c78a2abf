#include "io/TextStream.hpp"

#include <algorithm>
#include <cerrno>
#include <climits>
#include <cstring>
#include <type_traits>

#include <bzlib.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <zlib.h>

#include "io/Errors.hpp"
#include "util/Logging.hpp"

namespace amtraj {

namespace {

std::string systemError() {
    return std::strerror(errno);
}

std::unique_ptr<std::FILE, detail::FileCloser> openFile(const std::string& path) {
    std::unique_ptr<std::FILE, detail::FileCloser> file(std::fopen(path.c_str(), "rb"));
    if (!file) {
        throw IOError("Failed to open trajectory file: " + path + ": " + systemError());
    }
    return file;
}

}  // namespace

const char* compressionName(Compression compression) {
    switch (compression) {
        case Compression::None:
            return "none";
        case Compression::Gzip:
            return "gzip";
        case Compression::Bzip2:
            return "bzip2";
    }
    return "none";
}

Compression detectCompression(const std::string& path) {
    auto file = openFile(path);
    unsigned char magic[3] = {0, 0, 0};
    std::size_t n = std::fread(magic, 1, sizeof(magic), file.get());
    if (n < sizeof(magic) && std::ferror(file.get())) {
        throw IOError("Failed to read trajectory file: " + path + ": " + systemError());
    }
    if (n >= 2 && magic[0] == 0x1f && magic[1] == 0x8b) {
        return Compression::Gzip;
    }
    if (n == 3 && magic[0] == 'B' && magic[1] == 'Z' && magic[2] == 'h') {
        return Compression::Bzip2;
    }
    return Compression::None;
}

namespace detail {

void FileCloser::operator()(std::FILE* file) const {
    std::fclose(file);
}

void GzipCloser::operator()(gzFile_s* file) const {
    gzclose(file);
}

void Bzip2Closer::operator()(void* handle) const {
    int err = BZ_OK;
    BZ2_bzReadClose(&err, handle);
}

PlainSource::PlainSource(const std::string& path) : path_(path), file_(openFile(path)) {}

std::size_t PlainSource::fill(char* buffer, std::size_t capacity) {
    std::size_t n = std::fread(buffer, 1, capacity, file_.get());
    if (n < capacity && std::ferror(file_.get())) {
        throw IOError("Read error on " + path_ + ": " + systemError());
    }
    return n;
}

void PlainSource::restart() {
    seek(0);
}

void PlainSource::seek(std::uint64_t offset) {
    if (fseeko(file_.get(), static_cast<off_t>(offset), SEEK_SET) != 0) {
        throw IOError("Failed to seek to byte " + std::to_string(offset) + " in " + path_ + ": " + systemError());
    }
}

std::uint64_t PlainSource::size() const {
    struct stat st;
    if (fstat(fileno(file_.get()), &st) != 0) {
        throw IOError("Failed to stat " + path_ + ": " + systemError());
    }
    return static_cast<std::uint64_t>(st.st_size);
}

GzipSource::GzipSource(const std::string& path) : path_(path), file_(gzopen(path.c_str(), "rb")) {
    if (!file_) {
        throw IOError("Failed to open gzip stream: " + path);
    }
    gzbuffer(file_.get(), 128 * 1024);
}

std::size_t GzipSource::fill(char* buffer, std::size_t capacity) {
    unsigned want = static_cast<unsigned>(std::min<std::size_t>(capacity, INT_MAX));
    int n = gzread(file_.get(), buffer, want);
    if (n < 0) {
        int errnum = Z_OK;
        const char* message = gzerror(file_.get(), &errnum);
        throw IOError("Corrupt gzip data in " + path_ + ": " + (message ? message : "unknown error"));
    }
    return static_cast<std::size_t>(n);
}

void GzipSource::restart() {
    if (gzrewind(file_.get()) != 0) {
        throw IOError("Failed to rewind gzip stream: " + path_);
    }
}

Bzip2Source::Bzip2Source(const std::string& path) : path_(path), file_(openFile(path)) {
    openDecoder(nullptr, 0);
}

void Bzip2Source::openDecoder(const char* pending, int pendingSize) {
    handle_.reset();
    int err = BZ_OK;
    BZFILE* bz = BZ2_bzReadOpen(&err, file_.get(), 0, 0, const_cast<char*>(pending), pendingSize);
    if (err != BZ_OK) {
        if (bz) {
            int ignored = BZ_OK;
            BZ2_bzReadClose(&ignored, bz);
        }
        throw IOError("Failed to initialise bzip2 decoder for " + path_ + " (error " + std::to_string(err) + ")");
    }
    handle_.reset(bz);
    finished_ = false;
}

std::size_t Bzip2Source::fill(char* buffer, std::size_t capacity) {
    std::size_t total = 0;
    while (total < capacity && !finished_) {
        int err = BZ_OK;
        int want = static_cast<int>(std::min<std::size_t>(capacity - total, INT_MAX));
        int n = BZ2_bzRead(&err, handle_.get(), buffer + total, want);
        if (err != BZ_OK && err != BZ_STREAM_END) {
            throw IOError("Corrupt bzip2 data in " + path_ + " (error " + std::to_string(err) + ")");
        }
        if (n > 0) {
            total += static_cast<std::size_t>(n);
        }
        if (err == BZ_STREAM_END) {
            // concatenated streams (pbzip2 output) continue with the unused tail
            void* unused = nullptr;
            int nUnused = 0;
            BZ2_bzReadGetUnused(&err, handle_.get(), &unused, &nUnused);
            if (err != BZ_OK) {
                throw IOError("Corrupt bzip2 data in " + path_ + " (error " + std::to_string(err) + ")");
            }
            std::vector<char> pending(static_cast<char*>(unused), static_cast<char*>(unused) + nUnused);
            if (pending.empty()) {
                int c = std::fgetc(file_.get());
                if (c == EOF) {
                    finished_ = true;
                    break;
                }
                std::ungetc(c, file_.get());
            }
            openDecoder(pending.empty() ? nullptr : pending.data(), static_cast<int>(pending.size()));
        }
    }
    return total;
}

void Bzip2Source::restart() {
    handle_.reset();
    std::rewind(file_.get());
    openDecoder(nullptr, 0);
}

}  // namespace detail

TextStream::TextStream(std::string path) : path_(std::move(path)) {
    compression_ = detectCompression(path_);
    switch (compression_) {
        case Compression::None:
            source_.emplace<detail::PlainSource>(path_);
            break;
        case Compression::Gzip:
            source_.emplace<detail::GzipSource>(path_);
            break;
        case Compression::Bzip2:
            source_.emplace<detail::Bzip2Source>(path_);
            break;
    }
    buffer_.resize(BUFFER_SIZE);
    logDebug("Opened " + path_ + " (compression: " + compressionName(compression_) + ")");
}

bool TextStream::isOpen() const {
    return !std::holds_alternative<std::monostate>(source_);
}

void TextStream::requireOpen(const char* operation) const {
    if (!isOpen()) {
        throw ClosedHandleError(std::string("Cannot ") + operation + " closed trajectory stream: " + path_);
    }
}

bool TextStream::refill() {
    bufferOffset_ += bufUsed_;
    bufPos_ = 0;
    bufUsed_ = std::visit(
        [this](auto& source) -> std::size_t {
            using Source = std::decay_t<decltype(source)>;
            if constexpr (std::is_same_v<Source, std::monostate>) {
                return 0;
            } else {
                return source.fill(buffer_.data(), buffer_.size());
            }
        },
        source_);
    return bufUsed_ > 0;
}

bool TextStream::readLine(std::string& line) {
    requireOpen("read");
    line.clear();
    while (true) {
        const char* begin = buffer_.data() + bufPos_;
        const char* end = buffer_.data() + bufUsed_;
        const char* newline = static_cast<const char*>(std::memchr(begin, '\n', static_cast<std::size_t>(end - begin)));
        if (newline) {
            line.append(begin, newline);
            bufPos_ = static_cast<std::size_t>(newline - buffer_.data()) + 1;
            return true;
        }
        line.append(begin, end);
        bufPos_ = bufUsed_;
        if (!refill()) {
            return !line.empty();
        }
    }
}

std::size_t TextStream::read(char* buffer, std::size_t capacity) {
    requireOpen("read");
    std::size_t written = 0;
    while (written < capacity) {
        if (bufPos_ == bufUsed_ && !refill()) {
            break;
        }
        std::size_t take = std::min(bufUsed_ - bufPos_, capacity - written);
        std::memcpy(buffer + written, buffer_.data() + bufPos_, take);
        bufPos_ += take;
        written += take;
    }
    return written;
}

std::uint64_t TextStream::tell() const {
    requireOpen("tell");
    return bufferOffset_ + bufPos_;
}

void TextStream::seek(std::uint64_t offset) {
    requireOpen("seek");
    std::uint64_t total = size();
    if (offset > total) {
        throw IOError("Cannot seek to byte " + std::to_string(offset) + " of " + path_ + " (size " + std::to_string(total) + ")");
    }
    if (offset >= bufferOffset_ && offset <= bufferOffset_ + bufUsed_) {
        bufPos_ = static_cast<std::size_t>(offset - bufferOffset_);
        return;
    }
    if (auto* plain = std::get_if<detail::PlainSource>(&source_)) {
        plain->seek(offset);
        bufferOffset_ = offset;
        bufPos_ = 0;
        bufUsed_ = 0;
        return;
    }
    if (offset < bufferOffset_) {
        std::visit(
            [](auto& source) {
                using Source = std::decay_t<decltype(source)>;
                if constexpr (!std::is_same_v<Source, std::monostate>) {
                    source.restart();
                }
            },
            source_);
        bufferOffset_ = 0;
        bufPos_ = 0;
        bufUsed_ = 0;
    }
    while (bufferOffset_ + bufUsed_ < offset) {
        bufPos_ = bufUsed_;
        if (!refill()) {
            throw IOError("Unexpected end of compressed stream while seeking in " + path_);
        }
    }
    bufPos_ = static_cast<std::size_t>(offset - bufferOffset_);
}

std::uint64_t TextStream::size() {
    requireOpen("measure");
    if (size_) {
        return *size_;
    }
    if (auto* plain = std::get_if<detail::PlainSource>(&source_)) {
        size_ = plain->size();
        return *size_;
    }
    std::uint64_t saved = tell();
    bufPos_ = bufUsed_;
    while (refill()) {
        bufPos_ = bufUsed_;
    }
    size_ = bufferOffset_ + bufUsed_;
    logDebug("Decoded size of " + path_ + ": " + std::to_string(*size_) + " bytes");
    seek(saved);
    return *size_;
}

void TextStream::close() {
    source_.emplace<std::monostate>();
    bufPos_ = 0;
    bufUsed_ = 0;
    bufferOffset_ = 0;
}

}  // namespace amtraj
