#ifndef COMPRESSION_STRATEGY_HPP
#define COMPRESSION_STRATEGY_HPP

#include "../core/SplitterErrors.hpp"
#include <cstddef>
#include <istream>
#include <memory>
#include <ostream>
#include <string>
#include <vector>

namespace GzSplit {

// One streaming compression session, bound to a single segment.
// Bytes are compressed in arrival order; output is appended to `out`.
// Throws CompressionError on failure.
class IStreamCompressor {
public:
    virtual ~IStreamCompressor() = default;

    virtual void compress(const std::byte* data, size_t size, std::vector<std::byte>& out) = 0;

    // Flushes everything buffered and writes the trailer. No further
    // compress() calls are allowed afterwards.
    virtual void finish(std::vector<std::byte>& out) = 0;
};

// Interface for a compression strategy: a factory for per-segment sessions
// plus the matching decoder.
class ICompressionStrategy {
public:
    virtual ~ICompressionStrategy() = default;

    virtual std::unique_ptr<IStreamCompressor> createCompressor() const = 0;

    // Decodes a whole compressed object from `in` into `out`, returning the
    // number of bytes written. Throws CompressionError on corrupt input.
    virtual uint64_t decompress(std::istream& in, std::ostream& out) const = 0;

    // Object name suffix, e.g. ".gz"
    virtual std::string extension() const = 0;
};

} // namespace GzSplit

#endif // COMPRESSION_STRATEGY_HPP
