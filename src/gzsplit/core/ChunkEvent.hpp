#ifndef CHUNK_EVENT_HPP
#define CHUNK_EVENT_HPP

#include <cstddef>
#include <variant>
#include <vector>

namespace GzSplit {

// A slice of the source stream. May be shorter than the configured chunk size.
struct DataChunk {
    std::vector<std::byte> bytes;
};

// Marks that the source stream is exhausted.
struct EndOfStream {};

// What the chunk reader hands to the splitter. An empty DataChunk is still
// data, never end-of-stream.
using ChunkEvent = std::variant<DataChunk, EndOfStream>;

inline bool isEndOfStream(const ChunkEvent& event) {
    return std::holds_alternative<EndOfStream>(event);
}

} // namespace GzSplit

#endif // CHUNK_EVENT_HPP
