// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

/**
 * @file worker_pool_adapter.cpp
 * @brief Worker pool adapter implementation
 */

#include "kcenon/blob_transfer/adapters/worker_pool_adapter.h"

#include <thread>

#if KCENON_WITH_THREAD_SYSTEM
#pragma clang diagnostic push
#pragma clang diagnostic ignored "-Wdeprecated-declarations"
#include <kcenon/thread/core/job.h>
#include <kcenon/thread/core/job_queue.h>
#include <kcenon/thread/core/thread_worker.h>
#pragma clang diagnostic pop
#endif

namespace kcenon::blob_transfer::adapters {

namespace {

auto default_worker_count(std::size_t requested) -> std::size_t {
    if (requested != 0) return requested;
    auto count = std::thread::hardware_concurrency();
    return count > 0 ? count : 4;
}

/**
 * @brief Run a task and route its outcome into a promise
 */
void run_into(const std::function<void()>& task, std::promise<void>& promise) {
    try {
        task();
        promise.set_value();
    } catch (...) {
        promise.set_exception(std::current_exception());
    }
}

/**
 * @brief Counts a task against its stage until the task returns or throws
 */
auto staged(stage_tracker& tracker, const std::string& stage_name, std::function<void()> task)
    -> std::function<void()> {
    tracker.increment(stage_name);
    return [&tracker, stage = stage_name, task = std::move(task)]() {
        struct scope_exit {
            stage_tracker& tracker;
            const std::string& stage;
            ~scope_exit() { tracker.decrement(stage); }
        } done{tracker, stage};
        task();
    };
}

}  // namespace

// ============================================================================
// stage_tracker
// ============================================================================

void stage_tracker::increment(const std::string& stage_name) {
    std::lock_guard<std::mutex> lock(mutex_);
    ++counts_[stage_name];
}

void stage_tracker::decrement(const std::string& stage_name) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = counts_.find(stage_name);
    if (it != counts_.end() && it->second > 0) {
        --it->second;
    }
}

auto stage_tracker::count(const std::string& stage_name) const -> std::size_t {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = counts_.find(stage_name);
    return it != counts_.end() ? it->second : 0;
}

// ============================================================================
// thread_system_worker_pool
// ============================================================================

#if KCENON_WITH_THREAD_SYSTEM

namespace {

class function_job : public kcenon::thread::job {
public:
    explicit function_job(std::function<void()> func, const std::string& name)
        : job(name), func_(std::move(func)) {}

    [[nodiscard]] auto do_work() -> common::VoidResult override {
        if (func_) {
            func_();
        }
        return common::ok();
    }

private:
    std::function<void()> func_;
};

}  // namespace

struct thread_system_worker_pool::impl {
    std::shared_ptr<kcenon::thread::thread_pool> pool;
    std::string pool_name;
    std::size_t worker_count{0};
    std::atomic<std::size_t> active{0};
    stage_tracker tracker;
};

thread_system_worker_pool::thread_system_worker_pool(
    std::shared_ptr<kcenon::thread::thread_pool> pool,
    const std::string& pool_name,
    std::size_t worker_count)
    : pimpl_(std::make_unique<impl>()) {
    pimpl_->pool = std::move(pool);
    pimpl_->pool_name = pool_name;
    pimpl_->worker_count = worker_count;
}

thread_system_worker_pool::~thread_system_worker_pool() = default;

auto thread_system_worker_pool::create_default(std::size_t worker_count,
                                               const std::string& pool_name)
    -> std::shared_ptr<thread_system_worker_pool> {
    worker_count = default_worker_count(worker_count);

    auto pool = std::make_shared<kcenon::thread::thread_pool>(pool_name);
    for (std::size_t i = 0; i < worker_count; ++i) {
        auto worker = std::make_unique<kcenon::thread::thread_worker>();
        worker->set_job_queue(pool->get_job_queue());
        pool->enqueue(std::move(worker));
    }
    pool->start();

    return std::make_shared<thread_system_worker_pool>(std::move(pool), pool_name,
                                                       worker_count);
}

auto thread_system_worker_pool::submit(std::function<void()> task) -> std::future<void> {
    auto promise = std::make_shared<std::promise<void>>();
    auto future = promise->get_future();

    auto* state = pimpl_.get();
    state->active.fetch_add(1, std::memory_order_relaxed);
    auto wrapped = [task = std::move(task), promise, state]() {
        run_into(task, *promise);
        state->active.fetch_sub(1, std::memory_order_relaxed);
    };

    pimpl_->pool->enqueue(std::make_unique<function_job>(std::move(wrapped), "blob_task"));
    return future;
}

auto thread_system_worker_pool::submit_to_stage(std::function<void()> task,
                                                const std::string& stage_name)
    -> std::future<void> {
    return submit(staged(pimpl_->tracker, stage_name, std::move(task)));
}

auto thread_system_worker_pool::worker_count() const -> std::size_t {
    return pimpl_->worker_count;
}

auto thread_system_worker_pool::is_running() const -> bool {
    return pimpl_->pool != nullptr;
}

auto thread_system_worker_pool::pending_tasks() const -> std::size_t {
    return pimpl_->active.load(std::memory_order_relaxed);
}

auto thread_system_worker_pool::pending_tasks(const std::string& stage_name) const
    -> std::size_t {
    return pimpl_->tracker.count(stage_name);
}

auto thread_system_worker_pool::underlying_pool() const
    -> std::shared_ptr<kcenon::thread::thread_pool> {
    return pimpl_->pool;
}

#endif  // KCENON_WITH_THREAD_SYSTEM

// ============================================================================
// network_worker_pool
// ============================================================================

#if KCENON_WITH_NETWORK_SYSTEM

struct network_worker_pool::impl {
    std::shared_ptr<kcenon::network::integration::thread_pool_interface> pool;
    stage_tracker tracker;
};

network_worker_pool::network_worker_pool(
    std::shared_ptr<kcenon::network::integration::thread_pool_interface> pool)
    : pimpl_(std::make_unique<impl>()) {
    pimpl_->pool = std::move(pool);
}

network_worker_pool::~network_worker_pool() = default;

auto network_worker_pool::create_basic(std::size_t worker_count)
    -> std::shared_ptr<network_worker_pool> {
    auto pool = std::make_shared<kcenon::network::integration::basic_thread_pool>(
        default_worker_count(worker_count));
    return std::make_shared<network_worker_pool>(std::move(pool));
}

auto network_worker_pool::submit(std::function<void()> task) -> std::future<void> {
    return pimpl_->pool->submit(std::move(task));
}

auto network_worker_pool::submit_to_stage(std::function<void()> task,
                                          const std::string& stage_name)
    -> std::future<void> {
    return pimpl_->pool->submit(staged(pimpl_->tracker, stage_name, std::move(task)));
}

auto network_worker_pool::worker_count() const -> std::size_t {
    return pimpl_->pool ? pimpl_->pool->worker_count() : 0;
}

auto network_worker_pool::is_running() const -> bool {
    return pimpl_->pool ? pimpl_->pool->is_running() : false;
}

auto network_worker_pool::pending_tasks() const -> std::size_t {
    return pimpl_->pool ? pimpl_->pool->pending_tasks() : 0;
}

auto network_worker_pool::pending_tasks(const std::string& stage_name) const
    -> std::size_t {
    return pimpl_->tracker.count(stage_name);
}

#endif  // KCENON_WITH_NETWORK_SYSTEM

// ============================================================================
// async_worker_pool
// ============================================================================

struct async_worker_pool::impl {
    std::atomic<std::size_t> active_tasks{0};
    stage_tracker tracker;
};

async_worker_pool::async_worker_pool() : pimpl_(std::make_unique<impl>()) {}

async_worker_pool::~async_worker_pool() = default;

auto async_worker_pool::submit(std::function<void()> task) -> std::future<void> {
    pimpl_->active_tasks.fetch_add(1, std::memory_order_relaxed);

    auto& active = pimpl_->active_tasks;
    return std::async(std::launch::async, [&active, task = std::move(task)]() {
        struct scope_exit {
            std::atomic<std::size_t>& active;
            ~scope_exit() { active.fetch_sub(1, std::memory_order_relaxed); }
        } done{active};
        task();
    });
}

auto async_worker_pool::submit_to_stage(std::function<void()> task,
                                        const std::string& stage_name)
    -> std::future<void> {
    return submit(staged(pimpl_->tracker, stage_name, std::move(task)));
}

auto async_worker_pool::worker_count() const -> std::size_t {
    return default_worker_count(0);
}

auto async_worker_pool::pending_tasks() const -> std::size_t {
    return pimpl_->active_tasks.load(std::memory_order_relaxed);
}

auto async_worker_pool::pending_tasks(const std::string& stage_name) const -> std::size_t {
    return pimpl_->tracker.count(stage_name);
}

// ============================================================================
// worker_pool_factory
// ============================================================================

auto worker_pool_factory::create(std::size_t worker_count, const std::string& pool_name)
    -> std::shared_ptr<worker_pool_interface> {
#if KCENON_WITH_THREAD_SYSTEM
    return thread_system_worker_pool::create_default(worker_count, pool_name);
#elif KCENON_WITH_NETWORK_SYSTEM
    (void)pool_name;
    return network_worker_pool::create_basic(worker_count);
#else
    (void)worker_count;
    (void)pool_name;
    return std::make_shared<async_worker_pool>();
#endif
}

}  // namespace kcenon::blob_transfer::adapters
