#include "SegmentPipeline.hpp"
#include <stdexcept>

namespace GzSplit {

SegmentPipeline::SegmentPipeline(size_t index,
                                 std::string objectName,
                                 std::unique_ptr<IStreamCompressor> compressor,
                                 std::unique_ptr<IObjectSink> sink,
                                 BufferGauge* gauge)
    : index_(index),
      objectName_(std::move(objectName)),
      compressor_(std::move(compressor)),
      sink_(std::move(sink)),
      gauge_(gauge)
{
    if (!compressor_ || !sink_) {
        throw std::invalid_argument("SegmentPipeline requires a compressor and a sink");
    }
    compressWorker_ = std::thread([this] { compressLoop(); });
    try {
        uploadWorker_ = std::thread([this] { uploadLoop(); });
    } catch (...) {
        input_.abort();
        compressed_.abort();
        compressWorker_.join();
        throw;
    }
}

SegmentPipeline::~SegmentPipeline() {
    if (!closed_) {
        input_.abort();
        compressed_.abort();
    }
    shutdown();
}

void SegmentPipeline::shutdown() noexcept {
    if (compressWorker_.joinable()) {
        compressWorker_.join();
    }
    if (uploadWorker_.joinable()) {
        uploadWorker_.join();
    }
}

void SegmentPipeline::recordFailure(std::exception_ptr error) {
    {
        std::lock_guard<std::mutex> lock(errorMutex_);
        if (!error_) {
            error_ = error;
        }
    }
    // Wake everyone: the producer blocked in push() and the other worker
    input_.abort();
    compressed_.abort();
}

void SegmentPipeline::rethrowFailure() {
    std::exception_ptr error;
    {
        std::lock_guard<std::mutex> lock(errorMutex_);
        error = error_;
    }
    if (error) {
        std::rethrow_exception(error);
    }
}

void SegmentPipeline::push(std::vector<std::byte> chunk) {
    if (closed_) {
        throw std::logic_error("push on closed segment " + objectName_);
    }
    const uint64_t size = chunk.size();
    if (gauge_) gauge_->acquire(size);
    if (!input_.push(std::move(chunk))) {
        if (gauge_) gauge_->release(size);
        rethrowFailure();
        throw UploadError("Segment pipeline for " + objectName_ + " was aborted");
    }
    bytesSubmitted_ += size;
}

SegmentResult SegmentPipeline::close() {
    if (closed_) {
        throw std::logic_error("segment " + objectName_ + " closed twice");
    }
    closed_ = true;
    input_.close();
    shutdown();
    rethrowFailure();

    SegmentResult result;
    result.index = index_;
    result.objectName = objectName_;
    result.originalSize = bytesSubmitted_;
    result.compressedSize = sink_->bytesWritten();
    return result;
}

void SegmentPipeline::compressLoop() {
    try {
        std::vector<std::byte> chunk;
        while (input_.pop(chunk)) {
            std::vector<std::byte> out;
            compressor_->compress(chunk.data(), chunk.size(), out);
            if (gauge_) gauge_->release(chunk.size());
            chunk = std::vector<std::byte>();

            if (!out.empty()) {
                const uint64_t size = out.size();
                if (gauge_) gauge_->acquire(size);
                if (!compressed_.push(std::move(out))) {
                    if (gauge_) gauge_->release(size);
                    return;
                }
            }
        }
        if (input_.aborted()) {
            return;
        }

        std::vector<std::byte> trailer;
        compressor_->finish(trailer);
        const uint64_t size = trailer.size();
        if (gauge_) gauge_->acquire(size);
        if (!compressed_.push(std::move(trailer))) {
            if (gauge_) gauge_->release(size);
            return;
        }
        compressed_.close();
    } catch (...) {
        recordFailure(std::current_exception());
    }
}

void SegmentPipeline::uploadLoop() {
    try {
        std::vector<std::byte> block;
        while (compressed_.pop(block)) {
            sink_->write(block.data(), block.size());
            if (gauge_) gauge_->release(block.size());
            block = std::vector<std::byte>();
        }
        if (compressed_.aborted()) {
            sink_->abort();
            return;
        }
        sink_->close();
    } catch (...) {
        sink_->abort();
        recordFailure(std::current_exception());
    }
}

} // namespace GzSplit
