#ifndef SOURCE_STREAM_HPP
#define SOURCE_STREAM_HPP

#include <cstddef>
#include <cstdint>
#include <istream>
#include <string>

namespace GzSplit {

// Sequential byte source. read() returns the number of bytes placed in
// buffer; 0 means the source is exhausted. A short non-zero read is valid.
// Throws SourceReadError on failure.
class ISourceStream {
public:
    virtual ~ISourceStream() = default;
    virtual size_t read(std::byte* buffer, size_t capacity) = 0;
};

// Reads from a file (or an inherited descriptor such as stdin) with read(2).
class FileSourceStream : public ISourceStream {
public:
    explicit FileSourceStream(const std::string& path);
    explicit FileSourceStream(int fd); // borrowed, not closed
    ~FileSourceStream() override;

    FileSourceStream(const FileSourceStream&) = delete;
    FileSourceStream& operator=(const FileSourceStream&) = delete;

    size_t read(std::byte* buffer, size_t capacity) override;

private:
    int fd_;
    bool ownsFd_;
    std::string description_;
};

// Adapts an std::istream. Useful for tests and in-memory sources.
class IStreamSourceStream : public ISourceStream {
public:
    explicit IStreamSourceStream(std::istream& in) : in_(in) {}
    size_t read(std::byte* buffer, size_t capacity) override;

private:
    std::istream& in_;
};

} // namespace GzSplit

#endif // SOURCE_STREAM_HPP
