/**
 * @file bounded_channel.h
 * @brief Blocking FIFO channel with fixed capacity
 */

#ifndef KCENON_BLOB_TRANSFER_CORE_BOUNDED_CHANNEL_H
#define KCENON_BLOB_TRANSFER_CORE_BOUNDED_CHANNEL_H

#include <kcenon/blob_transfer/core/types.h>

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>

namespace kcenon::blob_transfer {

/**
 * @brief Multi-producer multi-consumer channel of fixed capacity
 *
 * send() blocks while the channel is full and receive() blocks while it is
 * empty. close() wakes every waiter; afterwards send() fails and receive()
 * drains what is left before failing.
 *
 * @tparam T Movable element type
 */
template <typename T>
class bounded_channel {
public:
    explicit bounded_channel(std::size_t capacity) : capacity_(capacity == 0 ? 1 : capacity) {}

    bounded_channel(const bounded_channel&) = delete;
    auto operator=(const bounded_channel&) -> bounded_channel& = delete;

    /**
     * @brief Push a value, blocking while the channel is full
     * @return Error if the channel was closed
     */
    [[nodiscard]] auto send(T value) -> result<void> {
        std::unique_lock<std::mutex> lock(mutex_);
        not_full_.wait(lock, [this] { return closed_ || items_.size() < capacity_; });
        if (closed_) {
            return unexpected{error{error_code::invalid_state, "channel closed"}};
        }
        items_.push_back(std::move(value));
        not_empty_.notify_one();
        return {};
    }

    /**
     * @brief Push a value without blocking
     * @return false if the channel is full or closed
     */
    [[nodiscard]] auto try_send(T value) -> bool {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_ || items_.size() >= capacity_) {
            return false;
        }
        items_.push_back(std::move(value));
        not_empty_.notify_one();
        return true;
    }

    /**
     * @brief Pop a value, blocking while the channel is empty
     * @return Error once the channel is closed and drained
     */
    [[nodiscard]] auto receive() -> result<T> {
        std::unique_lock<std::mutex> lock(mutex_);
        not_empty_.wait(lock, [this] { return closed_ || !items_.empty(); });
        if (items_.empty()) {
            return unexpected{error{error_code::invalid_state, "channel closed"}};
        }
        T value = std::move(items_.front());
        items_.pop_front();
        not_full_.notify_one();
        return value;
    }

    [[nodiscard]] auto try_receive() -> std::optional<T> {
        std::lock_guard<std::mutex> lock(mutex_);
        if (items_.empty()) {
            return std::nullopt;
        }
        T value = std::move(items_.front());
        items_.pop_front();
        not_full_.notify_one();
        return value;
    }

    void close() {
        std::lock_guard<std::mutex> lock(mutex_);
        closed_ = true;
        not_full_.notify_all();
        not_empty_.notify_all();
    }

    [[nodiscard]] auto is_closed() const -> bool {
        std::lock_guard<std::mutex> lock(mutex_);
        return closed_;
    }

    [[nodiscard]] auto size() const -> std::size_t {
        std::lock_guard<std::mutex> lock(mutex_);
        return items_.size();
    }

    [[nodiscard]] auto capacity() const noexcept -> std::size_t { return capacity_; }

private:
    const std::size_t capacity_;
    mutable std::mutex mutex_;
    std::condition_variable not_full_;
    std::condition_variable not_empty_;
    std::deque<T> items_;
    bool closed_ = false;
};

}  // namespace kcenon::blob_transfer

#endif  // KCENON_BLOB_TRANSFER_CORE_BOUNDED_CHANNEL_H
