#include "ChunkReader.hpp"
#include <stdexcept>

namespace GzSplit {

ChunkReader::ChunkReader(ISourceStream& source, size_t chunkSize)
    : source_(source), chunkSize_(chunkSize)
{
    if (chunkSize_ == 0) {
        throw std::invalid_argument("Chunk size must be greater than zero.");
    }
}

ChunkEvent ChunkReader::next() {
    if (exhausted_) {
        return EndOfStream{};
    }

    DataChunk chunk;
    chunk.bytes.resize(chunkSize_);
    size_t n = source_.read(chunk.bytes.data(), chunkSize_);
    if (n == 0) {
        exhausted_ = true;
        return EndOfStream{};
    }

    chunk.bytes.resize(n);
    bytesRead_ += n;
    return chunk;
}

} // namespace GzSplit
