#ifndef SPLITTER_HPP
#define SPLITTER_HPP

#include "BufferGauge.hpp"
#include "ChunkEvent.hpp"
#include "CompletionSignal.hpp"
#include "SegmentPipeline.hpp"
#include "../strategies/CompressionStrategy.hpp"
#include "../storage/ObjectStore.hpp"
#include <cstddef>
#include <cstdint>
#include <exception>
#include <memory>
#include <string>
#include <vector>

namespace GzSplit {

constexpr uint64_t DEFAULT_CHUNK_SIZE = 8ull << 20;        // 8 MiB
constexpr uint64_t DEFAULT_MAX_SEGMENT_SIZE = 4ull << 30;  // 4 GiB

struct SplitterConfig {
    uint64_t chunkSize = DEFAULT_CHUNK_SIZE;
    uint64_t maxSegmentSize = DEFAULT_MAX_SEGMENT_SIZE;
    bool verbose = false;
};

enum class SplitterState {
    Idle,         // no segment open, more data may follow
    SegmentOpen,  // a pipeline is accepting chunks
    Finalizing,   // end-of-stream seen, last segment being flushed
    Done          // completion delivered (or the run failed)
};

const char* toString(SplitterState state);

// Divides a chunk stream into size-bounded segments, each compressed and
// uploaded by its own SegmentPipeline. Only one segment is open at a time;
// the next one is not opened until the previous object is committed.
//
// A chunk is never split: if the open segment cannot take the whole chunk
// it is closed first, and a chunk larger than maxSegmentSize forms a
// segment of its own. Segments may therefore exceed maxSegmentSize by up to
// one chunk.
class Splitter {
public:
    Splitter(SplitterConfig config,
             std::string basePath,
             std::shared_ptr<const ICompressionStrategy> strategy,
             std::shared_ptr<IObjectStore> store);

    Splitter(const Splitter&) = delete;
    Splitter& operator=(const Splitter&) = delete;

    // Must be called from a single producer thread. EndOfStream flushes the
    // open segment and delivers the completion signal. Empty data chunks are
    // ignored. Failures propagate to the caller; call abort() afterwards.
    void submit(ChunkEvent event);

    // Drops the open segment (if any) and fails the completion signal with
    // `error`. No-op once the signal was delivered.
    void abort(std::exception_ptr error) noexcept;

    CompletionSignal& completion() { return completion_; }

    SplitterState state() const { return state_; }
    const std::vector<std::string>& producedObjects() const { return producedObjects_; }
    const std::vector<SegmentResult>& segments() const { return segments_; }
    const BufferGauge& bufferGauge() const { return gauge_; }

    std::string segmentName(size_t index) const;

private:
    void openSegment();
    void finalizeSegment();

    SplitterConfig config_;
    std::string basePath_;
    std::shared_ptr<const ICompressionStrategy> strategy_;
    std::shared_ptr<IObjectStore> store_;

    SplitterState state_ = SplitterState::Idle;
    size_t segmentIndex_ = 0;
    uint64_t currentSize_ = 0;
    std::unique_ptr<SegmentPipeline> pipeline_;

    std::vector<std::string> producedObjects_;
    std::vector<SegmentResult> segments_;
    BufferGauge gauge_;
    CompletionSignal completion_;
};

} // namespace GzSplit

#endif // SPLITTER_HPP
