/**
 * @file batch_scheduler.h
 * @brief Bounded-concurrency dispatcher for transfer operations
 */

#ifndef KCENON_BLOB_TRANSFER_TRANSFER_BATCH_SCHEDULER_H
#define KCENON_BLOB_TRANSFER_TRANSFER_BATCH_SCHEDULER_H

#include <kcenon/blob_transfer/adapters/worker_pool_adapter.h>
#include <kcenon/blob_transfer/core/types.h>

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace kcenon::blob_transfer {

/**
 * @brief Unit of work run by a batch_scheduler
 *
 * Every operation handed to a scheduler reaches its completion hook
 * exactly once, either after execute() or, when the batch has already
 * failed, with the batch's first error and without running.
 */
class batch_operation {
public:
    using completion_hook = std::function<void(const error&)>;

    virtual ~batch_operation() = default;

    [[nodiscard]] virtual auto execute() -> result<void> = 0;

    /// Short label for logs
    [[nodiscard]] virtual auto describe() const -> std::string = 0;

    void set_completion(completion_hook hook) { on_complete_ = std::move(hook); }

    /**
     * @brief Report the outcome; a default error (success) means done
     */
    void complete(const error& err) {
        if (on_complete_) {
            on_complete_(err);
        }
    }

private:
    completion_hook on_complete_;
};

/**
 * @brief Runs operations on a worker pool with at most `limit` in flight
 *
 * The first failure marks the batch failed: operations added or queued
 * afterwards complete with that error and never run, while operations
 * already in flight always drain. The end event fires once, after
 * enable_complete() has been called and nothing is in flight or queued.
 *
 * Events fire on whichever thread causes the transition, usually a worker.
 */
class batch_scheduler {
public:
    using drain_handler = std::function<void()>;
    using end_handler = std::function<void(const std::optional<error>&)>;

    /**
     * @param limit Maximum operations in flight (at least 1)
     * @param pool Worker pool running the operations
     * @param stage Stage name the tasks are counted under
     */
    batch_scheduler(std::size_t limit,
                    std::shared_ptr<adapters::worker_pool_interface> pool,
                    std::string stage = adapters::worker_stage::chunk_operation);

    /**
     * @brief Waits for every dispatched task to return
     */
    ~batch_scheduler();

    batch_scheduler(const batch_scheduler&) = delete;
    auto operator=(const batch_scheduler&) -> batch_scheduler& = delete;

    void on_drain(drain_handler handler);
    void on_end(end_handler handler);

    /**
     * @brief Dispatch or queue an operation
     * @return true if the scheduler is now full (in flight + queued >= limit)
     */
    auto add_operation(std::unique_ptr<batch_operation> op) -> bool;

    /**
     * @brief No more operations will be added
     */
    void enable_complete();

    /**
     * @brief Block until the end event
     * @return First error of the batch, if any
     */
    auto wait_for_end() -> std::optional<error>;

    [[nodiscard]] auto is_full() const -> bool;
    [[nodiscard]] auto is_ended() const -> bool;
    [[nodiscard]] auto limit() const noexcept -> std::size_t { return limit_; }
    [[nodiscard]] auto in_flight() const -> std::size_t;
    [[nodiscard]] auto queued() const -> std::size_t;
    [[nodiscard]] auto peak_in_flight() const -> std::size_t;
    [[nodiscard]] auto dispatched() const -> std::size_t;
    [[nodiscard]] auto completed() const -> std::size_t;
    [[nodiscard]] auto failed() const -> bool;
    [[nodiscard]] auto first_error() const -> std::optional<error>;

private:
    void dispatch(std::unique_ptr<batch_operation> op);
    void run(const std::shared_ptr<batch_operation>& op);
    void complete_without_running(std::vector<std::unique_ptr<batch_operation>> ops,
                                  const error& err);

    [[nodiscard]] auto full_locked() const -> bool { return in_flight_ + queue_.size() >= limit_; }
    [[nodiscard]] auto end_ready_locked() const -> bool {
        return complete_enabled_ && !ended_ && in_flight_ == 0 && queue_.empty();
    }

    /// Fire the end event if the batch just ended; releases the lock
    void settle(std::unique_lock<std::mutex>& lock, bool was_full);

    const std::size_t limit_;
    std::shared_ptr<adapters::worker_pool_interface> pool_;
    const std::string stage_;

    mutable std::mutex mutex_;
    std::condition_variable end_cv_;
    std::deque<std::unique_ptr<batch_operation>> queue_;
    std::vector<std::future<void>> tasks_;

    std::size_t in_flight_ = 0;
    std::size_t peak_in_flight_ = 0;
    std::size_t dispatched_ = 0;
    std::size_t completed_ = 0;
    bool failed_ = false;
    std::optional<error> first_error_;
    bool complete_enabled_ = false;
    bool ended_ = false;

    /// Set once the end handler has returned
    bool end_signalled_ = false;

    drain_handler on_drain_;
    end_handler on_end_;
};

}  // namespace kcenon::blob_transfer

#endif  // KCENON_BLOB_TRANSFER_TRANSFER_BATCH_SCHEDULER_H
