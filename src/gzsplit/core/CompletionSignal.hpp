#ifndef COMPLETION_SIGNAL_HPP
#define COMPLETION_SIGNAL_HPP

#include <exception>
#include <future>
#include <mutex>

namespace GzSplit {

// One-shot handshake between the thread that drives a Splitter and the
// thread that waits for the stream to be fully flushed.
//
// Exactly one of notify() or fail() may be called; a second call throws
// std::logic_error. wait() returns once notify() was called, or rethrows the
// exception passed to fail().
class CompletionSignal {
public:
    CompletionSignal();

    void notify();
    void fail(std::exception_ptr error);

    void wait() const;
    bool isSignaled() const;

private:
    void markSignaled(const char* caller);

    mutable std::mutex mutex_;
    bool signaled_ = false;
    std::promise<void> promise_;
    std::shared_future<void> future_;
};

} // namespace GzSplit

#endif // COMPLETION_SIGNAL_HPP
