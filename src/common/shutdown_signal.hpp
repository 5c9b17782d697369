#ifndef SHUTDOWN_SIGNAL_HPP
#define SHUTDOWN_SIGNAL_HPP

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <mutex>

// Stop flag with interruptible waits.
// Every backoff and idle sleep goes through waitFor() so that a stop request
// wakes it up instead of letting it run to completion.
class ShutdownSignal {
public:
    ShutdownSignal();

    void trigger();

    bool isTriggered() const { return triggered_.load(); }

    // Sleep for up to duration. Returns true if the signal was triggered
    // before or during the wait.
    bool waitFor(std::chrono::milliseconds duration) const;

private:
    std::atomic<bool> triggered_;
    mutable std::mutex mutex_;
    mutable std::condition_variable cv_;
};

// Wall-clock milliseconds since epoch, used for lease expiry timestamps
int64_t currentTimeMillis();

#endif // SHUTDOWN_SIGNAL_HPP
