#include "rangexfer/transfer_signal.hpp"

namespace rangexfer {

void TransferSignal::raise(Kind kind) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (kind_.load() < static_cast<int>(kind)) {
            kind_.store(static_cast<int>(kind));
        }
    }
    cv_.notify_all();
}

void TransferSignal::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    kind_.store(static_cast<int>(Kind::None));
}

bool TransferSignal::waitFor(std::chrono::milliseconds delay) const {
    std::unique_lock<std::mutex> lock(mutex_);
    return cv_.wait_for(lock, delay, [this] { return stopRequested(); });
}

} // namespace rangexfer
