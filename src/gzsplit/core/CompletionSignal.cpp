#include "CompletionSignal.hpp"
#include <stdexcept>
#include <string>

namespace GzSplit {

CompletionSignal::CompletionSignal()
    : future_(promise_.get_future().share())
{
}

void CompletionSignal::markSignaled(const char* caller) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (signaled_) {
        throw std::logic_error(std::string("CompletionSignal::") + caller +
                               " called after the signal was already delivered");
    }
    signaled_ = true;
}

void CompletionSignal::notify() {
    markSignaled("notify");
    promise_.set_value();
}

void CompletionSignal::fail(std::exception_ptr error) {
    if (!error) {
        throw std::invalid_argument("CompletionSignal::fail requires an exception");
    }
    markSignaled("fail");
    promise_.set_exception(error);
}

void CompletionSignal::wait() const {
    future_.get();
}

bool CompletionSignal::isSignaled() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return signaled_;
}

} // namespace GzSplit
