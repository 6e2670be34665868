///////////////////////////////////////////////////////////////////////////////////////////////////
/**
 * @file channel.h
 * @brief Unbounded multi-producer queue with blocking receive and close
 *
 * Producers Send(); a consumer blocks in Receive() until an item arrives or
 * the channel is closed and drained.
 */
///////////////////////////////////////////////////////////////////////////////////////////////////

#pragma once

#include <chrono>
#include <cstddef>
#include <condition_variable>
#include <mutex>
#include <optional>
#include <queue>
#include <utility>

namespace FlightBridge {

template <typename T>
class Channel {
public:
    /// @return false if the channel is closed; the item is dropped
    bool Send(T item) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (closed_) {
                return false;
            }
            queue_.push(std::move(item));
        }
        cv_.notify_one();
        return true;
    }

    /// Blocks until an item is available; nullopt once closed and empty
    std::optional<T> Receive() {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait(lock, [this] { return closed_ || !queue_.empty(); });
        return PopLocked();
    }

    /// Like Receive() but gives up after `timeout`
    template <typename Rep, typename Period>
    std::optional<T> ReceiveFor(std::chrono::duration<Rep, Period> timeout) {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait_for(lock, timeout, [this] { return closed_ || !queue_.empty(); });
        return PopLocked();
    }

    std::optional<T> TryReceive() {
        std::lock_guard<std::mutex> lock(mutex_);
        return PopLocked();
    }

    /// Wake all receivers; items already queued can still be received
    void Close() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            closed_ = true;
        }
        cv_.notify_all();
    }

    /// Reopen after Close() and discard leftovers
    void Reset() {
        std::lock_guard<std::mutex> lock(mutex_);
        closed_ = false;
        std::queue<T>().swap(queue_);
    }

    bool IsClosed() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return closed_;
    }

    size_t Size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return queue_.size();
    }

private:
    std::optional<T> PopLocked() {
        if (queue_.empty()) {
            return std::nullopt;
        }
        T item = std::move(queue_.front());
        queue_.pop();
        return item;
    }

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::queue<T> queue_;
    bool closed_ = false;
};

} // namespace FlightBridge
