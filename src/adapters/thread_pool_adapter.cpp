// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

/**
 * @file thread_pool_adapter.cpp
 * @brief Worker pool implementations for batch transfers
 */

#include "kcenon/webhdfs/adapters/thread_pool_adapter.h"

#include <atomic>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <thread>
#include <vector>

#if WEBHDFS_HAS_THREAD_SYSTEM
// Suppress deprecation warnings from thread_system headers
#pragma clang diagnostic push
#pragma clang diagnostic ignored "-Wdeprecated-declarations"
#include <kcenon/thread/core/job.h>
#include <kcenon/thread/core/job_queue.h>
#include <kcenon/thread/core/thread_worker.h>
#pragma clang diagnostic pop
#endif

namespace kcenon::webhdfs::adapters {

namespace {

/// Run a task and route its outcome into a promise
void run_into(const std::function<void()>& task, std::promise<void>& promise) {
    try {
        task();
        promise.set_value();
    } catch (...) {
        promise.set_exception(std::current_exception());
    }
}

}  // namespace

// ============================================================================
// thread_system_transfer_adapter implementation
// ============================================================================

#if WEBHDFS_HAS_THREAD_SYSTEM

/**
 * @brief Job that wraps a function for thread_system execution
 */
class function_job : public kcenon::thread::job {
public:
    explicit function_job(std::function<void()> func, const std::string& name = "transfer_worker")
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

struct thread_system_transfer_adapter::impl {
    std::shared_ptr<kcenon::thread::thread_pool> pool;
    std::string pool_name;
    size_t worker_count{0};
};

thread_system_transfer_adapter::thread_system_transfer_adapter(
    std::shared_ptr<kcenon::thread::thread_pool> pool,
    const std::string& pool_name,
    size_t worker_count)
    : pimpl_(std::make_unique<impl>()) {
    pimpl_->pool = std::move(pool);
    pimpl_->pool_name = pool_name;
    pimpl_->worker_count = worker_count;
}

thread_system_transfer_adapter::~thread_system_transfer_adapter() = default;

std::shared_ptr<thread_system_transfer_adapter>
thread_system_transfer_adapter::create(size_t worker_count, const std::string& pool_name) {
    if (worker_count == 0) {
        worker_count = 1;
    }

    auto pool = std::make_shared<kcenon::thread::thread_pool>(pool_name);

    for (size_t i = 0; i < worker_count; ++i) {
        auto worker = std::make_unique<kcenon::thread::thread_worker>();
        worker->set_job_queue(pool->get_job_queue());
        pool->enqueue(std::move(worker));
    }

    pool->start();

    return std::make_shared<thread_system_transfer_adapter>(std::move(pool), pool_name, worker_count);
}

std::future<void> thread_system_transfer_adapter::submit(std::function<void()> task) {
    auto promise = std::make_shared<std::promise<void>>();
    auto future = promise->get_future();

    auto wrapped_task = [task = std::move(task), promise]() { run_into(task, *promise); };

    auto job = std::make_unique<function_job>(std::move(wrapped_task), pimpl_->pool_name);
    pimpl_->pool->enqueue(std::move(job));

    return future;
}

size_t thread_system_transfer_adapter::worker_count() const {
    return pimpl_->worker_count;
}

bool thread_system_transfer_adapter::is_running() const {
    return pimpl_->pool != nullptr;
}

size_t thread_system_transfer_adapter::pending_tasks() const {
    if (pimpl_->pool) {
        auto queue = pimpl_->pool->get_job_queue();
        return queue ? queue->size() : 0;
    }
    return 0;
}

std::shared_ptr<kcenon::thread::thread_pool>
thread_system_transfer_adapter::underlying_pool() const {
    return pimpl_->pool;
}

#endif  // WEBHDFS_HAS_THREAD_SYSTEM

// ============================================================================
// fixed_transfer_pool implementation
// ============================================================================

struct fixed_transfer_pool::impl {
    struct queued_task {
        std::function<void()> task;
        std::shared_ptr<std::promise<void>> promise;
    };

    std::mutex mutex;
    std::condition_variable cv;
    std::deque<queued_task> queue;
    std::vector<std::thread> workers;
    bool stopping = false;

    void worker_loop() {
        while (true) {
            queued_task item;
            {
                std::unique_lock<std::mutex> lock(mutex);
                cv.wait(lock, [this] { return stopping || !queue.empty(); });
                if (queue.empty()) {
                    return;
                }
                item = std::move(queue.front());
                queue.pop_front();
            }
            run_into(item.task, *item.promise);
        }
    }
};

fixed_transfer_pool::fixed_transfer_pool(size_t worker_count)
    : pimpl_(std::make_unique<impl>()) {
    if (worker_count == 0) {
        worker_count = 1;
    }
    pimpl_->workers.reserve(worker_count);
    for (size_t i = 0; i < worker_count; ++i) {
        pimpl_->workers.emplace_back([pimpl = pimpl_.get()] { pimpl->worker_loop(); });
    }
}

fixed_transfer_pool::~fixed_transfer_pool() {
    {
        std::lock_guard<std::mutex> lock(pimpl_->mutex);
        pimpl_->stopping = true;
    }
    pimpl_->cv.notify_all();
    for (auto& worker : pimpl_->workers) {
        if (worker.joinable()) {
            worker.join();
        }
    }
}

std::future<void> fixed_transfer_pool::submit(std::function<void()> task) {
    auto promise = std::make_shared<std::promise<void>>();
    auto future = promise->get_future();
    {
        std::lock_guard<std::mutex> lock(pimpl_->mutex);
        pimpl_->queue.push_back({std::move(task), std::move(promise)});
    }
    pimpl_->cv.notify_one();
    return future;
}

size_t fixed_transfer_pool::worker_count() const {
    return pimpl_->workers.size();
}

bool fixed_transfer_pool::is_running() const {
    std::lock_guard<std::mutex> lock(pimpl_->mutex);
    return !pimpl_->stopping;
}

size_t fixed_transfer_pool::pending_tasks() const {
    std::lock_guard<std::mutex> lock(pimpl_->mutex);
    return pimpl_->queue.size();
}

// ============================================================================
// transfer_pool_factory implementation
// ============================================================================

std::shared_ptr<transfer_thread_pool_interface> transfer_pool_factory::create(
    size_t worker_count, const std::string& pool_name) {
#if WEBHDFS_HAS_THREAD_SYSTEM
    return thread_system_transfer_adapter::create(worker_count, pool_name);
#else
    (void)pool_name;
    return std::make_shared<fixed_transfer_pool>(worker_count);
#endif
}

}  // namespace kcenon::webhdfs::adapters
