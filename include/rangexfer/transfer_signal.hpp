#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>

namespace rangexfer {

// Pause/cancel token shared by a coordinator session and its workers.
class TransferSignal {
public:
    enum class Kind : int { None = 0, Pause = 1, Cancel = 2, Abort = 3 };

    // A stronger request is never downgraded by a weaker one.
    void raise(Kind kind);
    void clear();

    [[nodiscard]] Kind current() const noexcept { return static_cast<Kind>(kind_.load()); }
    [[nodiscard]] bool stopRequested() const noexcept { return current() != Kind::None; }

    // Sleeps up to `delay`; returns true if a stop was requested meanwhile.
    bool waitFor(std::chrono::milliseconds delay) const;

private:
    std::atomic<int> kind_{0};
    mutable std::mutex mutex_;
    mutable std::condition_variable cv_;
};

} // namespace rangexfer
