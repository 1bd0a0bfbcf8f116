#ifndef BUFFER_GAUGE_HPP
#define BUFFER_GAUGE_HPP

#include <atomic>
#include <cstdint>

namespace GzSplit {

// Counts bytes currently held in pipeline buffers and remembers the peak.
class BufferGauge {
public:
    void acquire(uint64_t bytes) {
        uint64_t now = current_.fetch_add(bytes) + bytes;
        uint64_t peak = peak_.load();
        while (now > peak && !peak_.compare_exchange_weak(peak, now)) {
        }
    }

    void release(uint64_t bytes) { current_.fetch_sub(bytes); }

    uint64_t current() const { return current_.load(); }
    uint64_t peak() const { return peak_.load(); }

private:
    std::atomic<uint64_t> current_{0};
    std::atomic<uint64_t> peak_{0};
};

} // namespace GzSplit

#endif // BUFFER_GAUGE_HPP
