#include "Splitter.hpp"
#include <cstdio>
#include <iostream>
#include <stdexcept>

namespace GzSplit {

const char* toString(SplitterState state) {
    switch (state) {
        case SplitterState::Idle: return "Idle";
        case SplitterState::SegmentOpen: return "SegmentOpen";
        case SplitterState::Finalizing: return "Finalizing";
        case SplitterState::Done: return "Done";
    }
    return "Unknown";
}

Splitter::Splitter(SplitterConfig config,
                   std::string basePath,
                   std::shared_ptr<const ICompressionStrategy> strategy,
                   std::shared_ptr<IObjectStore> store)
    : config_(config),
      basePath_(std::move(basePath)),
      strategy_(std::move(strategy)),
      store_(std::move(store))
{
    if (config_.chunkSize == 0 || config_.maxSegmentSize == 0) {
        throw std::invalid_argument("Chunk size and max segment size must be greater than zero.");
    }
    if (!strategy_ || !store_) {
        throw std::invalid_argument("Splitter requires a compression strategy and an object store.");
    }
    if (basePath_.empty()) {
        throw std::invalid_argument("Splitter base path must not be empty.");
    }
}

std::string Splitter::segmentName(size_t index) const {
    char suffix[32];
    std::snprintf(suffix, sizeof(suffix), "_chunk%09zu", index);
    return basePath_ + suffix + strategy_->extension();
}

void Splitter::submit(ChunkEvent event) {
    if (state_ == SplitterState::Done || state_ == SplitterState::Finalizing) {
        throw std::logic_error(std::string("Splitter::submit called in state ") + toString(state_));
    }

    if (isEndOfStream(event)) {
        state_ = SplitterState::Finalizing;
        if (pipeline_) {
            finalizeSegment();
        }
        state_ = SplitterState::Done;
        if (config_.verbose) {
            std::cout << "End of stream: " << producedObjects_.size() << " segment(s) written for "
                      << basePath_ << std::endl;
        }
        completion_.notify();
        return;
    }

    std::vector<std::byte> bytes = std::move(std::get<DataChunk>(event).bytes);
    if (bytes.empty()) {
        return;
    }
    const uint64_t len = bytes.size();

    if (state_ == SplitterState::SegmentOpen && currentSize_ + len > config_.maxSegmentSize) {
        finalizeSegment();
    }
    if (state_ == SplitterState::Idle) {
        openSegment();
    }

    pipeline_->push(std::move(bytes));
    currentSize_ += len;
}

void Splitter::openSegment() {
    std::string name = segmentName(segmentIndex_);
    if (config_.verbose) {
        std::cout << "Opening segment " << segmentIndex_ << ": " << store_->describe(name) << std::endl;
    }
    pipeline_ = std::make_unique<SegmentPipeline>(
        segmentIndex_, name, strategy_->createCompressor(), store_->openSink(name), &gauge_);
    state_ = SplitterState::SegmentOpen;
}

void Splitter::finalizeSegment() {
    SegmentResult result = pipeline_->close();
    pipeline_.reset();

    if (config_.verbose) {
        std::cout << "Closed segment " << result.index << ": " << result.originalSize << " -> "
                  << result.compressedSize << " bytes" << std::endl;
    }
    producedObjects_.push_back(result.objectName);
    segments_.push_back(std::move(result));

    currentSize_ = 0;
    ++segmentIndex_;
    if (state_ == SplitterState::SegmentOpen) {
        state_ = SplitterState::Idle;
    }
}

void Splitter::abort(std::exception_ptr error) noexcept {
    pipeline_.reset();
    state_ = SplitterState::Done;
    if (completion_.isSignaled() || !error) {
        return;
    }
    try {
        completion_.fail(error);
    } catch (const std::exception& e) {
        std::cerr << "Error: failed to deliver splitter failure: " << e.what() << std::endl;
    }
}

} // namespace GzSplit
