#ifndef BOUNDED_CHANNEL_HPP
#define BOUNDED_CHANNEL_HPP

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <stdexcept>

namespace GzSplit {

// Blocking hand-off queue between two threads with a fixed capacity.
// push() blocks while the channel is full; pop() blocks while it is empty.
//
// close() is the producer's normal end: queued items are still delivered,
// then pop() returns false. abort() tears the channel down from either side:
// queued items are dropped and both push() and pop() return false at once.
template <typename T>
class BoundedChannel {
public:
    explicit BoundedChannel(size_t capacity = 1) : capacity_(capacity) {
        if (capacity_ == 0) {
            throw std::invalid_argument("BoundedChannel capacity must be at least 1");
        }
    }

    BoundedChannel(const BoundedChannel&) = delete;
    BoundedChannel& operator=(const BoundedChannel&) = delete;

    // Returns false if the channel was aborted before the item was accepted.
    bool push(T item) {
        std::unique_lock<std::mutex> lock(mutex_);
        notFull_.wait(lock, [this] { return aborted_ || queue_.size() < capacity_; });
        if (aborted_) {
            return false;
        }
        if (closed_) {
            throw std::logic_error("push on closed BoundedChannel");
        }
        queue_.push_back(std::move(item));
        notEmpty_.notify_one();
        return true;
    }

    // Returns false once the channel is closed and drained, or aborted.
    bool pop(T& out) {
        std::unique_lock<std::mutex> lock(mutex_);
        notEmpty_.wait(lock, [this] { return aborted_ || closed_ || !queue_.empty(); });
        if (aborted_ || queue_.empty()) {
            return false;
        }
        out = std::move(queue_.front());
        queue_.pop_front();
        notFull_.notify_one();
        return true;
    }

    void close() {
        std::lock_guard<std::mutex> lock(mutex_);
        closed_ = true;
        notEmpty_.notify_all();
    }

    void abort() {
        std::lock_guard<std::mutex> lock(mutex_);
        aborted_ = true;
        queue_.clear();
        notEmpty_.notify_all();
        notFull_.notify_all();
    }

    bool aborted() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return aborted_;
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return queue_.size();
    }

    size_t capacity() const { return capacity_; }

private:
    const size_t capacity_;
    mutable std::mutex mutex_;
    std::condition_variable notEmpty_;
    std::condition_variable notFull_;
    std::deque<T> queue_;
    bool closed_ = false;
    bool aborted_ = false;
};

} // namespace GzSplit

#endif // BOUNDED_CHANNEL_HPP
