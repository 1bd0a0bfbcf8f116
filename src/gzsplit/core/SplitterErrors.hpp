#ifndef SPLITTER_ERRORS_HPP
#define SPLITTER_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace GzSplit {

// Base class for every failure that terminates a split/upload run
class SplitterError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// The source stream could not be read
class SourceReadError : public SplitterError {
public:
    using SplitterError::SplitterError;
};

// The compression stage failed (zlib error or broken input)
class CompressionError : public SplitterError {
public:
    using SplitterError::SplitterError;
};

// Writing or committing a remote object failed
class UploadError : public SplitterError {
public:
    using SplitterError::SplitterError;
};

} // namespace GzSplit

#endif // SPLITTER_ERRORS_HPP
