#include "ShutdownSignal.hpp"

void ShutdownSignal::Trigger() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        triggered_ = true;
    }
    cv_.notify_all();
}

bool ShutdownSignal::Triggered() const {
    return triggered_;
}

bool ShutdownSignal::WaitFor(std::chrono::milliseconds duration) {
    return WaitUntil(std::chrono::steady_clock::now() + duration);
}

bool ShutdownSignal::WaitUntil(std::chrono::steady_clock::time_point deadline) {
    std::unique_lock<std::mutex> lock(mutex_);
    return !cv_.wait_until(lock, deadline, [this] { return triggered_.load(); });
}
