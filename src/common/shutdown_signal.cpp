#include "shutdown_signal.hpp"

ShutdownSignal::ShutdownSignal()
    : triggered_(false) {
}

void ShutdownSignal::trigger() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        triggered_ = true;
    }
    cv_.notify_all();
}

bool ShutdownSignal::waitFor(std::chrono::milliseconds duration) const {
    std::unique_lock<std::mutex> lock(mutex_);
    return cv_.wait_for(lock, duration, [this] { return triggered_.load(); });
}

int64_t currentTimeMillis() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}
