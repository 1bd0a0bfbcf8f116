#ifndef CHUNK_READER_HPP
#define CHUNK_READER_HPP

#include "ChunkEvent.hpp"
#include "SourceStream.hpp"
#include <cstddef>
#include <cstdint>

namespace GzSplit {

// Pulls chunks of at most chunkSize bytes from a source, strictly in order.
// Each call to next() performs exactly one read; a short read is forwarded
// as-is. Once the source reports exhaustion, next() yields EndOfStream.
class ChunkReader {
public:
    ChunkReader(ISourceStream& source, size_t chunkSize);

    ChunkEvent next();

    uint64_t bytesRead() const { return bytesRead_; }
    bool exhausted() const { return exhausted_; }

private:
    ISourceStream& source_;
    size_t chunkSize_;
    uint64_t bytesRead_ = 0;
    bool exhausted_ = false;
};

} // namespace GzSplit

#endif // CHUNK_READER_HPP
