#pragma once

#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <memory>
#include <optional>
#include <string>
#include <variant>
#include <vector>

struct gzFile_s;

namespace amtraj {

enum class Compression { None, Gzip, Bzip2 };

const char* compressionName(Compression compression);

// Sniffs the leading magic bytes; the file name is not consulted.
Compression detectCompression(const std::string& path);

namespace detail {

struct FileCloser {
    void operator()(std::FILE* file) const;
};

struct GzipCloser {
    void operator()(gzFile_s* file) const;
};

struct Bzip2Closer {
    void operator()(void* handle) const;
};

class PlainSource {
  public:
    explicit PlainSource(const std::string& path);

    std::size_t fill(char* buffer, std::size_t capacity);
    void restart();
    void seek(std::uint64_t offset);
    std::uint64_t size() const;

  private:
    std::string path_;
    std::unique_ptr<std::FILE, FileCloser> file_;
};

class GzipSource {
  public:
    explicit GzipSource(const std::string& path);

    std::size_t fill(char* buffer, std::size_t capacity);
    void restart();

  private:
    std::string path_;
    std::unique_ptr<gzFile_s, GzipCloser> file_;
};

class Bzip2Source {
  public:
    explicit Bzip2Source(const std::string& path);

    std::size_t fill(char* buffer, std::size_t capacity);
    void restart();

  private:
    void openDecoder(const char* pending, int pendingSize);

    std::string path_;
    // declared before handle_ so the decoder is released first
    std::unique_ptr<std::FILE, FileCloser> file_;
    std::unique_ptr<void, Bzip2Closer> handle_;
    bool finished_{false};
};

}  // namespace detail

// Line oriented reader over a plain, gzip or bzip2 file.
//
// Offsets, sizes and positions are always in uncompressed bytes. Compressed
// streams cannot seek natively: a forward seek decodes and discards, a
// backward seek restarts the decoder from the beginning of the file.
class TextStream {
  public:
    static constexpr std::size_t BUFFER_SIZE = 64 * 1024;

    // Throws IOError when the path is missing or unreadable.
    explicit TextStream(std::string path);

    TextStream(const TextStream&) = delete;
    TextStream& operator=(const TextStream&) = delete;

    // Next record without its '\n'. A '\r' before the newline is kept.
    // Returns false at end of stream.
    bool readLine(std::string& line);

    // Raw bytes; returns 0 at end of stream.
    std::size_t read(char* buffer, std::size_t capacity);

    void seek(std::uint64_t offset);
    std::uint64_t tell() const;

    // Uncompressed size. Decodes the whole stream once for compressed input.
    std::uint64_t size();

    void close();
    bool isOpen() const;

    Compression compression() const { return compression_; }
    const std::string& path() const { return path_; }

  private:
    bool refill();
    void requireOpen(const char* operation) const;

    std::string path_;
    Compression compression_{Compression::None};
    std::variant<std::monostate, detail::PlainSource, detail::GzipSource, detail::Bzip2Source> source_;
    std::vector<char> buffer_;
    std::size_t bufPos_{0};
    std::size_t bufUsed_{0};
    // uncompressed offset of buffer_[0]
    std::uint64_t bufferOffset_{0};
    std::optional<std::uint64_t> size_;
};

}  // namespace amtraj
