#ifndef GZSPLIT_TEST_HELPERS_HPP
#define GZSPLIT_TEST_HELPERS_HPP

#include "gzsplit/core/SourceStream.hpp"
#include "gzsplit/core/SplitterErrors.hpp"
#include "gzsplit/storage/ObjectStore.hpp"
#include "gzsplit/strategies/GzipStrategy.hpp"
#include <algorithm>
#include <atomic>
#include <cstring>
#include <map>
#include <mutex>
#include <sstream>
#include <string>
#include <vector>

namespace GzSplitTest {

using namespace GzSplit;

inline std::vector<std::byte> toBytes(const std::string& s) {
    std::vector<std::byte> out(s.size());
    std::memcpy(out.data(), s.data(), s.size());
    return out;
}

inline std::string toString(const std::vector<std::byte>& bytes) {
    return std::string(reinterpret_cast<const char*>(bytes.data()), bytes.size());
}

// Deterministic, mildly compressible payload
inline std::string makePayload(size_t size, unsigned seed = 7) {
    std::string out(size, '\0');
    uint32_t state = seed;
    for (size_t i = 0; i < size; ++i) {
        state = state * 1103515245u + 12345u;
        out[i] = static_cast<char>('a' + ((state >> 16) % 16));
    }
    return out;
}

inline std::string gunzip(const std::string& compressed) {
    GzipStrategy strategy;
    std::istringstream in(compressed);
    std::ostringstream out;
    strategy.decompress(in, out);
    return out.str();
}

// Object store kept in memory. Objects appear in objects() only after close().
class MemoryObjectStore : public IObjectStore {
public:
    class Sink : public IObjectSink {
    public:
        Sink(MemoryObjectStore& store, std::string name) : store_(store), name_(std::move(name)) {}
        ~Sink() override { abort(); }

        void write(const std::byte* data, size_t size) override {
            if (store_.failWriteAfter_ >= 0 &&
                static_cast<long long>(buffer_.size() + size) > store_.failWriteAfter_) {
                throw UploadError("injected write failure for " + name_);
            }
            buffer_.append(reinterpret_cast<const char*>(data), size);
        }

        void close() override {
            if (done_) return;
            done_ = true;
            std::lock_guard<std::mutex> lock(store_.mutex_);
            store_.objects_[name_] = buffer_;
            store_.commitOrder_.push_back(name_);
        }

        void abort() noexcept override {
            if (done_) return;
            done_ = true;
            store_.aborted_.fetch_add(1);
        }

        uint64_t bytesWritten() const override { return buffer_.size(); }

    private:
        MemoryObjectStore& store_;
        std::string name_;
        std::string buffer_;
        bool done_ = false;
    };

    void ensureContainer() override { ++ensureCalls_; }

    std::unique_ptr<IObjectSink> openSink(const std::string& objectName) override {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            ++openSinks_;
            committedAtOpen_.push_back(commitOrder_.size());
        }
        return std::make_unique<Sink>(*this, objectName);
    }

    std::string describe(const std::string& objectName) const override { return "mem://" + objectName; }

    std::map<std::string, std::string> objects() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return objects_;
    }

    std::vector<std::string> commitOrder() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return commitOrder_;
    }

    // Number of committed objects at the moment each sink was opened
    std::vector<size_t> committedAtOpen() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return committedAtOpen_;
    }

    // Throws UploadError once a single object would exceed `bytes`
    void failWritesAfter(long long bytes) { failWriteAfter_ = bytes; }

    int abortedCount() const { return aborted_.load(); }
    int openedCount() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return openSinks_;
    }
    int ensureCalls() const { return ensureCalls_; }

private:
    mutable std::mutex mutex_;
    std::map<std::string, std::string> objects_;
    std::vector<std::string> commitOrder_;
    std::vector<size_t> committedAtOpen_;
    long long failWriteAfter_ = -1;
    std::atomic<int> aborted_{0};
    int openSinks_ = 0;
    int ensureCalls_ = 0;
};

// Source that returns a fixed script of read sizes, then exhausts
class ScriptedSource : public ISourceStream {
public:
    ScriptedSource(std::string data, std::vector<size_t> readSizes)
        : data_(std::move(data)), readSizes_(std::move(readSizes)) {}

    size_t read(std::byte* buffer, size_t capacity) override {
        if (offset_ >= data_.size()) return 0;
        size_t want = step_ < readSizes_.size() ? readSizes_[step_++] : capacity;
        size_t n = std::min({want, capacity, data_.size() - offset_});
        std::memcpy(buffer, data_.data() + offset_, n);
        offset_ += n;
        return n;
    }

private:
    std::string data_;
    std::vector<size_t> readSizes_;
    size_t step_ = 0;
    size_t offset_ = 0;
};

// Generates `total` bytes of a repeating pattern without holding them
class PatternSource : public ISourceStream {
public:
    explicit PatternSource(uint64_t total) : total_(total) {}

    size_t read(std::byte* buffer, size_t capacity) override {
        uint64_t left = total_ - produced_;
        size_t n = static_cast<size_t>(std::min<uint64_t>(left, capacity));
        for (size_t i = 0; i < n; ++i) {
            buffer[i] = static_cast<std::byte>((produced_ + i) % 251);
        }
        produced_ += n;
        return n;
    }

private:
    uint64_t total_;
    uint64_t produced_ = 0;
};

// Source that fails after delivering `good` bytes
class FailingSource : public ISourceStream {
public:
    explicit FailingSource(size_t good) : good_(good) {}

    size_t read(std::byte* buffer, size_t capacity) override {
        if (delivered_ >= good_) {
            throw SourceReadError("injected read failure");
        }
        size_t n = std::min(capacity, good_ - delivered_);
        std::memset(buffer, 'x', n);
        delivered_ += n;
        return n;
    }

private:
    size_t good_;
    size_t delivered_ = 0;
};

// Compression strategy whose sessions fail on the Nth compress() call
class FailingCompressionStrategy : public ICompressionStrategy {
public:
    explicit FailingCompressionStrategy(int failOnCall) : failOnCall_(failOnCall) {}

    class Session : public IStreamCompressor {
    public:
        explicit Session(int failOnCall) : failOnCall_(failOnCall) {}
        void compress(const std::byte*, size_t, std::vector<std::byte>&) override {
            if (++calls_ >= failOnCall_) {
                throw CompressionError("injected compression failure");
            }
        }
        void finish(std::vector<std::byte>&) override {}
    private:
        int failOnCall_;
        int calls_ = 0;
    };

    std::unique_ptr<IStreamCompressor> createCompressor() const override {
        return std::make_unique<Session>(failOnCall_);
    }
    uint64_t decompress(std::istream&, std::ostream&) const override { return 0; }
    std::string extension() const override { return ".fail"; }

private:
    int failOnCall_;
};

} // namespace GzSplitTest

#endif // GZSPLIT_TEST_HELPERS_HPP
