#include "SourceStream.hpp"
#include "SplitterErrors.hpp"
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <unistd.h>

namespace GzSplit {

FileSourceStream::FileSourceStream(const std::string& path)
    : fd_(::open(path.c_str(), O_RDONLY)), ownsFd_(true), description_(path)
{
    if (fd_ < 0) {
        throw SourceReadError("Failed to open source file " + path + ": " + std::strerror(errno));
    }
}

FileSourceStream::FileSourceStream(int fd)
    : fd_(fd), ownsFd_(false), description_("fd " + std::to_string(fd))
{
    if (fd_ < 0) {
        throw SourceReadError("Invalid source descriptor");
    }
}

FileSourceStream::~FileSourceStream() {
    if (ownsFd_ && fd_ >= 0) {
        ::close(fd_);
    }
}

size_t FileSourceStream::read(std::byte* buffer, size_t capacity) {
    while (true) {
        ssize_t n = ::read(fd_, buffer, capacity);
        if (n >= 0) {
            return static_cast<size_t>(n);
        }
        if (errno != EINTR) {
            throw SourceReadError("Failed to read from " + description_ + ": " + std::strerror(errno));
        }
    }
}

size_t IStreamSourceStream::read(std::byte* buffer, size_t capacity) {
    if (in_.eof()) {
        return 0;
    }
    in_.read(reinterpret_cast<char*>(buffer), static_cast<std::streamsize>(capacity));
    if (in_.bad()) {
        throw SourceReadError("Failed to read from input stream");
    }
    return static_cast<size_t>(in_.gcount());
}

} // namespace GzSplit
