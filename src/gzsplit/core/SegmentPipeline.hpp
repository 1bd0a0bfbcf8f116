#ifndef SEGMENT_PIPELINE_HPP
#define SEGMENT_PIPELINE_HPP

#include "BoundedChannel.hpp"
#include "BufferGauge.hpp"
#include "../strategies/CompressionStrategy.hpp"
#include "../storage/ObjectStore.hpp"
#include <cstddef>
#include <cstdint>
#include <exception>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace GzSplit {

// Summary of one closed segment
struct SegmentResult {
    size_t index = 0;
    std::string objectName;
    uint64_t originalSize = 0;
    uint64_t compressedSize = 0;
};

// The compression and upload workers bound to one open segment.
//
//   producer --push()--> [input, cap 1] --> compress worker
//            --> [compressed, cap 1] --> upload worker --> IObjectSink
//
// push() blocks while the previous chunk has not been taken by the
// compression worker. close() ends the input, waits for both workers and
// for the sink to commit the object. A failure in either worker is rethrown
// from the next push() or from close().
class SegmentPipeline {
public:
    SegmentPipeline(size_t index,
                    std::string objectName,
                    std::unique_ptr<IStreamCompressor> compressor,
                    std::unique_ptr<IObjectSink> sink,
                    BufferGauge* gauge = nullptr);

    // Abandons the segment if close() was not reached. Never throws.
    ~SegmentPipeline();

    SegmentPipeline(const SegmentPipeline&) = delete;
    SegmentPipeline& operator=(const SegmentPipeline&) = delete;

    void push(std::vector<std::byte> chunk);

    SegmentResult close();

    size_t index() const { return index_; }
    const std::string& objectName() const { return objectName_; }
    uint64_t bytesSubmitted() const { return bytesSubmitted_; }

private:
    void compressLoop();
    void uploadLoop();
    void recordFailure(std::exception_ptr error);
    void rethrowFailure();
    void shutdown() noexcept;

    size_t index_;
    std::string objectName_;
    std::unique_ptr<IStreamCompressor> compressor_;
    std::unique_ptr<IObjectSink> sink_;
    BufferGauge* gauge_;

    BoundedChannel<std::vector<std::byte>> input_{1};
    BoundedChannel<std::vector<std::byte>> compressed_{1};

    std::mutex errorMutex_;
    std::exception_ptr error_;

    uint64_t bytesSubmitted_ = 0;
    bool closed_ = false;

    std::thread compressWorker_;
    std::thread uploadWorker_;
};

} // namespace GzSplit

#endif // SEGMENT_PIPELINE_HPP
