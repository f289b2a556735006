#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>

class ShutdownSignal {
public:
    void Trigger();
    bool Triggered() const;

    // Both return true when the wait ran its full course and false when
    // shutdown was signalled first.
    bool WaitFor(std::chrono::milliseconds duration);
    bool WaitUntil(std::chrono::steady_clock::time_point deadline);

private:
    std::atomic<bool> triggered_{false};
    std::mutex mutex_;
    std::condition_variable cv_;
};
