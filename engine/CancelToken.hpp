// Cancellation flag shared by every step of one transfer.
#pragma once
#include <QString>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>

class CancelToken {
public:
    void cancel(const QString &reason = QString()) {
        {
            std::lock_guard<std::mutex> lk(mtx_);
            if (cancelled_.load())
                return;
            reason_ = reason;
            cancelled_.store(true);
        }
        cv_.notify_all();
    }

    bool isCancelled() const { return cancelled_.load(); }

    QString reason() const {
        std::lock_guard<std::mutex> lk(mtx_);
        return reason_;
    }

    // Sleeps for `delay` unless cancelled first. Returns true if cancelled.
    bool waitFor(std::chrono::milliseconds delay) const {
        std::unique_lock<std::mutex> lk(mtx_);
        return cv_.wait_for(lk, delay, [this] { return cancelled_.load(); });
    }

private:
    mutable std::mutex mtx_;
    mutable std::condition_variable cv_;
    std::atomic<bool> cancelled_{false};
    QString reason_;
};

using CancelTokenPtr = std::shared_ptr<CancelToken>;
