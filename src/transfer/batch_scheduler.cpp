/**
 * @file batch_scheduler.cpp
 * @brief Implementation of the bounded-concurrency dispatcher
 */

#include <kcenon/blob_transfer/transfer/batch_scheduler.h>

#include <kcenon/blob_transfer/core/logging.h>

#include <algorithm>
#include <chrono>
#include <exception>

namespace kcenon::blob_transfer {

batch_scheduler::batch_scheduler(std::size_t limit,
                                 std::shared_ptr<adapters::worker_pool_interface> pool,
                                 std::string stage)
    : limit_(std::max<std::size_t>(limit, 1)),
      pool_(std::move(pool)),
      stage_(std::move(stage)) {}

batch_scheduler::~batch_scheduler() {
    // A finishing task may still dispatch a queued successor
    for (;;) {
        std::vector<std::future<void>> tasks;
        {
            std::lock_guard lock(mutex_);
            tasks.swap(tasks_);
        }
        if (tasks.empty()) {
            break;
        }
        for (auto& task : tasks) {
            if (task.valid()) {
                task.wait();
            }
        }
    }
}

void batch_scheduler::on_drain(drain_handler handler) {
    std::lock_guard lock(mutex_);
    on_drain_ = std::move(handler);
}

void batch_scheduler::on_end(end_handler handler) {
    std::lock_guard lock(mutex_);
    on_end_ = std::move(handler);
}

auto batch_scheduler::add_operation(std::unique_ptr<batch_operation> op) -> bool {
    std::unique_lock lock(mutex_);

    if (failed_) {
        const auto err = *first_error_;
        ++completed_;
        const bool full = full_locked();
        lock.unlock();
        op->complete(err);
        return full;
    }

    if (in_flight_ < limit_) {
        ++in_flight_;
        ++dispatched_;
        peak_in_flight_ = std::max(peak_in_flight_, in_flight_);
        const bool full = full_locked();
        lock.unlock();
        dispatch(std::move(op));
        return full;
    }

    queue_.push_back(std::move(op));
    return full_locked();
}

void batch_scheduler::enable_complete() {
    std::unique_lock lock(mutex_);
    complete_enabled_ = true;
    settle(lock, full_locked());
}

auto batch_scheduler::wait_for_end() -> std::optional<error> {
    std::unique_lock lock(mutex_);
    end_cv_.wait(lock, [this] { return end_signalled_; });
    return first_error_;
}

void batch_scheduler::dispatch(std::unique_ptr<batch_operation> op) {
    std::shared_ptr<batch_operation> shared(std::move(op));

    BT_LOG_TRACE(log_category::scheduler, "Dispatching " + shared->describe());

    auto future = pool_->submit_to_stage([this, shared]() { run(shared); }, stage_);

    std::lock_guard lock(mutex_);
    // Finished tasks no longer need their futures
    tasks_.erase(std::remove_if(tasks_.begin(), tasks_.end(),
                                [](std::future<void>& task) {
                                    return task.wait_for(std::chrono::seconds(0)) ==
                                           std::future_status::ready;
                                }),
                 tasks_.end());
    tasks_.push_back(std::move(future));
}

void batch_scheduler::run(const std::shared_ptr<batch_operation>& op) {
    result<void> outcome;
    try {
        outcome = op->execute();
    } catch (const std::exception& e) {
        outcome = unexpected{error{error_code::internal_error,
            op->describe() + " threw: " + e.what()}};
    }

    op->complete(outcome ? error{} : outcome.error());

    std::unique_lock lock(mutex_);
    const bool was_full = full_locked();
    --in_flight_;
    ++completed_;

    if (!outcome && !failed_) {
        failed_ = true;
        first_error_ = outcome.error();
        BT_LOG_WARN(log_category::scheduler,
                    op->describe() + " failed, batch marked failed: " +
                    outcome.error().message);
    }

    std::unique_ptr<batch_operation> next;
    std::vector<std::unique_ptr<batch_operation>> abandoned;
    if (!failed_) {
        if (!queue_.empty()) {
            next = std::move(queue_.front());
            queue_.pop_front();
            ++in_flight_;
            ++dispatched_;
            peak_in_flight_ = std::max(peak_in_flight_, in_flight_);
        }
    } else {
        while (!queue_.empty()) {
            abandoned.push_back(std::move(queue_.front()));
            queue_.pop_front();
        }
        completed_ += abandoned.size();
    }
    const auto err = first_error_;

    if (next) {
        lock.unlock();
        dispatch(std::move(next));
        lock.lock();
    }
    if (!abandoned.empty()) {
        lock.unlock();
        complete_without_running(std::move(abandoned), *err);
        lock.lock();
    }

    settle(lock, was_full);
}

void batch_scheduler::complete_without_running(
    std::vector<std::unique_ptr<batch_operation>> ops, const error& err) {
    for (auto& op : ops) {
        op->complete(err);
    }
}

void batch_scheduler::settle(std::unique_lock<std::mutex>& lock, bool was_full) {
    const bool drained = was_full && !full_locked();
    const bool ending = end_ready_locked();
    if (ending) {
        ended_ = true;
    }
    auto drain = drained ? on_drain_ : drain_handler{};
    auto end = ending ? on_end_ : end_handler{};
    const auto err = first_error_;
    lock.unlock();

    if (drain) {
        drain();
    }
    if (ending) {
        BT_LOG_DEBUG(log_category::scheduler,
                     "Batch ended" + (err ? ": " + err->message : std::string{}));
        if (end) {
            end(err);
        }
        {
            std::lock_guard guard(mutex_);
            end_signalled_ = true;
        }
        end_cv_.notify_all();
    }
}

auto batch_scheduler::is_full() const -> bool {
    std::lock_guard lock(mutex_);
    return full_locked();
}

auto batch_scheduler::is_ended() const -> bool {
    std::lock_guard lock(mutex_);
    return ended_;
}

auto batch_scheduler::in_flight() const -> std::size_t {
    std::lock_guard lock(mutex_);
    return in_flight_;
}

auto batch_scheduler::queued() const -> std::size_t {
    std::lock_guard lock(mutex_);
    return queue_.size();
}

auto batch_scheduler::peak_in_flight() const -> std::size_t {
    std::lock_guard lock(mutex_);
    return peak_in_flight_;
}

auto batch_scheduler::dispatched() const -> std::size_t {
    std::lock_guard lock(mutex_);
    return dispatched_;
}

auto batch_scheduler::completed() const -> std::size_t {
    std::lock_guard lock(mutex_);
    return completed_;
}

auto batch_scheduler::failed() const -> bool {
    std::lock_guard lock(mutex_);
    return failed_;
}

auto batch_scheduler::first_error() const -> std::optional<error> {
    std::lock_guard lock(mutex_);
    return first_error_;
}

}  // namespace kcenon::blob_transfer
