// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

/**
 * @file thread_pool_adapter.h
 * @brief Worker pool abstraction for batch transfers
 *
 * Batch transfers run on a fixed-size pool created per batch. The pool is
 * backed by thread_system when it is compiled in, otherwise by a set of
 * std::thread workers draining a shared queue.
 */

#pragma once

#include <cstddef>
#include <functional>
#include <future>
#include <memory>
#include <string>

#include "kcenon/webhdfs/config/feature_flags.h"

#if WEBHDFS_HAS_THREAD_SYSTEM
#include <kcenon/thread/core/thread_pool.h>
#endif

namespace kcenon::webhdfs::adapters {

/**
 * @brief Interface for fixed-size transfer worker pools
 */
class transfer_thread_pool_interface {
public:
    virtual ~transfer_thread_pool_interface() = default;

    /**
     * @brief Submit a task for execution
     * @param task The task to execute
     * @return Future for the task completion
     */
    virtual std::future<void> submit(std::function<void()> task) = 0;

    /**
     * @brief Get the number of worker threads
     */
    [[nodiscard]] virtual size_t worker_count() const = 0;

    [[nodiscard]] virtual bool is_running() const = 0;

    /**
     * @brief Get the number of tasks waiting for a worker
     */
    [[nodiscard]] virtual size_t pending_tasks() const = 0;
};

#if WEBHDFS_HAS_THREAD_SYSTEM

/**
 * @brief Adapter that wraps thread_system::thread_pool
 *
 * @note Thread-safe: All public methods are safe to call from multiple threads.
 */
class thread_system_transfer_adapter : public transfer_thread_pool_interface {
public:
    explicit thread_system_transfer_adapter(
        std::shared_ptr<kcenon::thread::thread_pool> pool,
        const std::string& pool_name = "webhdfs_transfer_pool",
        size_t worker_count = 0);

    ~thread_system_transfer_adapter() override;

    thread_system_transfer_adapter(const thread_system_transfer_adapter&) = delete;
    thread_system_transfer_adapter& operator=(const thread_system_transfer_adapter&) = delete;

    /**
     * @brief Create a started pool with exactly worker_count workers
     */
    [[nodiscard]] static std::shared_ptr<thread_system_transfer_adapter> create(
        size_t worker_count,
        const std::string& pool_name = "webhdfs_transfer_pool");

    std::future<void> submit(std::function<void()> task) override;

    [[nodiscard]] size_t worker_count() const override;
    [[nodiscard]] bool is_running() const override;
    [[nodiscard]] size_t pending_tasks() const override;

    [[nodiscard]] std::shared_ptr<kcenon::thread::thread_pool> underlying_pool() const;

private:
    struct impl;
    std::unique_ptr<impl> pimpl_;
};

#endif  // WEBHDFS_HAS_THREAD_SYSTEM

/**
 * @brief Fallback pool of std::thread workers
 *
 * Workers are started in the constructor and joined in the destructor after
 * the queue has been drained.
 */
class fixed_transfer_pool : public transfer_thread_pool_interface {
public:
    explicit fixed_transfer_pool(size_t worker_count);
    ~fixed_transfer_pool() override;

    fixed_transfer_pool(const fixed_transfer_pool&) = delete;
    fixed_transfer_pool& operator=(const fixed_transfer_pool&) = delete;

    std::future<void> submit(std::function<void()> task) override;

    [[nodiscard]] size_t worker_count() const override;
    [[nodiscard]] bool is_running() const override;
    [[nodiscard]] size_t pending_tasks() const override;

private:
    struct impl;
    std::unique_ptr<impl> pimpl_;
};

/**
 * @brief Factory selecting the pool implementation
 *
 * 1. thread_system_transfer_adapter (when WEBHDFS_HAS_THREAD_SYSTEM)
 * 2. fixed_transfer_pool (fallback)
 */
class transfer_pool_factory {
public:
    /**
     * @param worker_count Number of workers (at least one is created)
     * @param pool_name Name for identification
     */
    [[nodiscard]] static std::shared_ptr<transfer_thread_pool_interface> create(
        size_t worker_count,
        const std::string& pool_name = "webhdfs_transfer_pool");

    [[nodiscard]] static constexpr bool has_thread_system() noexcept {
#if WEBHDFS_HAS_THREAD_SYSTEM
        return true;
#else
        return false;
#endif
    }
};

}  // namespace kcenon::webhdfs::adapters
