// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

/**
 * @file worker_pool_adapter.h
 * @brief Worker pool adapter for blob transfer operations
 *
 * Chunk operations, range fetches and asynchronous transfers all run on a
 * worker_pool_interface. The factory picks thread_system's thread_pool when
 * it is linked, network_system's basic pool next, and std::async otherwise.
 *
 * Tasks are counted per stage ("chunk_operation", "range_fetch", ...) so a
 * caller can observe how much work of each kind is outstanding.
 */

#pragma once

#include <atomic>
#include <cstddef>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

#include "../config/feature_flags.h"

#if KCENON_WITH_NETWORK_SYSTEM
#include <kcenon/network/integration/thread_integration.h>
#endif

#if KCENON_WITH_THREAD_SYSTEM
#include <kcenon/thread/core/thread_pool.h>
#endif

namespace kcenon::blob_transfer::adapters {

/**
 * @brief Stage names used by the transfer engine
 */
struct worker_stage {
    static constexpr const char* chunk_operation = "chunk_operation";
    static constexpr const char* range_fetch = "range_fetch";
    static constexpr const char* transfer = "transfer";
};

/**
 * @brief Per-stage count of submitted but unfinished tasks
 */
class stage_tracker {
public:
    void increment(const std::string& stage_name);
    void decrement(const std::string& stage_name);
    [[nodiscard]] auto count(const std::string& stage_name) const -> std::size_t;

private:
    mutable std::mutex mutex_;
    std::unordered_map<std::string, std::size_t> counts_;
};

/**
 * @brief Interface for the pool that runs transfer work
 */
class worker_pool_interface {
public:
    virtual ~worker_pool_interface() = default;

    /**
     * @brief Submit a task for execution
     * @return Future for the task completion; exceptions surface through it
     */
    virtual auto submit(std::function<void()> task) -> std::future<void> = 0;

    /**
     * @brief Submit a task counted against a stage
     * @param stage_name Name of the stage (see worker_stage)
     */
    virtual auto submit_to_stage(std::function<void()> task,
                                 const std::string& stage_name) -> std::future<void> = 0;

    [[nodiscard]] virtual auto worker_count() const -> std::size_t = 0;
    [[nodiscard]] virtual auto is_running() const -> bool = 0;

    /**
     * @brief Tasks submitted but not yet finished
     */
    [[nodiscard]] virtual auto pending_tasks() const -> std::size_t = 0;

    /**
     * @brief Unfinished tasks of one stage
     */
    [[nodiscard]] virtual auto pending_tasks(const std::string& stage_name) const
        -> std::size_t = 0;
};

#if KCENON_WITH_THREAD_SYSTEM

/**
 * @brief Worker pool backed by thread_system's thread_pool
 *
 * @note Thread-safe: All public methods are safe to call from multiple threads.
 */
class thread_system_worker_pool : public worker_pool_interface {
public:
    explicit thread_system_worker_pool(std::shared_ptr<kcenon::thread::thread_pool> pool,
                                       const std::string& pool_name = "blob_transfer_pool",
                                       std::size_t worker_count = 0);
    ~thread_system_worker_pool() override;

    thread_system_worker_pool(const thread_system_worker_pool&) = delete;
    auto operator=(const thread_system_worker_pool&) -> thread_system_worker_pool& = delete;

    /**
     * @brief Create and start a pool
     * @param worker_count Number of workers (0 = hardware concurrency)
     */
    [[nodiscard]] static auto create_default(std::size_t worker_count = 0,
                                             const std::string& pool_name = "blob_transfer_pool")
        -> std::shared_ptr<thread_system_worker_pool>;

    auto submit(std::function<void()> task) -> std::future<void> override;
    auto submit_to_stage(std::function<void()> task,
                         const std::string& stage_name) -> std::future<void> override;

    [[nodiscard]] auto worker_count() const -> std::size_t override;
    [[nodiscard]] auto is_running() const -> bool override;
    [[nodiscard]] auto pending_tasks() const -> std::size_t override;
    [[nodiscard]] auto pending_tasks(const std::string& stage_name) const
        -> std::size_t override;

    [[nodiscard]] auto underlying_pool() const -> std::shared_ptr<kcenon::thread::thread_pool>;

private:
    struct impl;
    std::unique_ptr<impl> pimpl_;
};

#endif  // KCENON_WITH_THREAD_SYSTEM

#if KCENON_WITH_NETWORK_SYSTEM

/**
 * @brief Worker pool backed by network_system's thread_pool_interface
 *
 * Lets transfers share the pool the HTTP client already uses.
 */
class network_worker_pool : public worker_pool_interface {
public:
    explicit network_worker_pool(
        std::shared_ptr<kcenon::network::integration::thread_pool_interface> pool);
    ~network_worker_pool() override;

    network_worker_pool(const network_worker_pool&) = delete;
    auto operator=(const network_worker_pool&) -> network_worker_pool& = delete;

    [[nodiscard]] static auto create_basic(std::size_t worker_count = 0)
        -> std::shared_ptr<network_worker_pool>;

    auto submit(std::function<void()> task) -> std::future<void> override;
    auto submit_to_stage(std::function<void()> task,
                         const std::string& stage_name) -> std::future<void> override;

    [[nodiscard]] auto worker_count() const -> std::size_t override;
    [[nodiscard]] auto is_running() const -> bool override;
    [[nodiscard]] auto pending_tasks() const -> std::size_t override;
    [[nodiscard]] auto pending_tasks(const std::string& stage_name) const
        -> std::size_t override;

private:
    struct impl;
    std::unique_ptr<impl> pimpl_;
};

#endif  // KCENON_WITH_NETWORK_SYSTEM

/**
 * @brief Fallback pool running each task on std::async
 *
 * The returned futures block on destruction, so callers must keep them
 * until the task is known to be finished.
 */
class async_worker_pool : public worker_pool_interface {
public:
    async_worker_pool();
    ~async_worker_pool() override;

    async_worker_pool(const async_worker_pool&) = delete;
    auto operator=(const async_worker_pool&) -> async_worker_pool& = delete;

    auto submit(std::function<void()> task) -> std::future<void> override;
    auto submit_to_stage(std::function<void()> task,
                         const std::string& stage_name) -> std::future<void> override;

    [[nodiscard]] auto worker_count() const -> std::size_t override;
    [[nodiscard]] auto is_running() const -> bool override { return true; }
    [[nodiscard]] auto pending_tasks() const -> std::size_t override;
    [[nodiscard]] auto pending_tasks(const std::string& stage_name) const
        -> std::size_t override;

private:
    struct impl;
    std::unique_ptr<impl> pimpl_;
};

/**
 * @brief Creates the best available worker pool
 *
 * Priority: thread_system, then network_system, then std::async.
 */
class worker_pool_factory {
public:
    [[nodiscard]] static auto create(std::size_t worker_count = 0,
                                     const std::string& pool_name = "blob_transfer_pool")
        -> std::shared_ptr<worker_pool_interface>;

    [[nodiscard]] static constexpr auto has_thread_system() noexcept -> bool {
#if KCENON_WITH_THREAD_SYSTEM
        return true;
#else
        return false;
#endif
    }

    [[nodiscard]] static constexpr auto has_network_pool() noexcept -> bool {
#if KCENON_WITH_NETWORK_SYSTEM
        return true;
#else
        return false;
#endif
    }
};

}  // namespace kcenon::blob_transfer::adapters
