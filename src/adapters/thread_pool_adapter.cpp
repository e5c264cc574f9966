/**
 * @file thread_pool_adapter.cpp
 * @brief Worker pool adapter implementation
 */

#include "cavesync/remote_project/adapters/thread_pool_adapter.h"

#include <thread>

#if KCENON_WITH_THREAD_SYSTEM
#pragma clang diagnostic push
#pragma clang diagnostic ignored "-Wdeprecated-declarations"
#include <kcenon/thread/core/job.h>
#include <kcenon/thread/core/job_queue.h>
#include <kcenon/thread/core/thread_worker.h>
#pragma clang diagnostic pop
#endif

namespace cavesync::remote_project::adapters {

namespace {

auto default_worker_count(size_t requested) -> size_t {
    if (requested != 0) {
        return requested;
    }
    auto count = std::thread::hardware_concurrency();
    return count > 0 ? count : 4;
}

#if KCENON_WITH_THREAD_SYSTEM

/**
 * @brief Wraps a task so its outcome lands in a promise and the pending
 *        counter is decremented even when it throws
 */
auto wrap_task(std::function<void()> task,
               std::shared_ptr<std::promise<void>> promise,
               std::shared_ptr<std::atomic<size_t>> pending) -> std::function<void()> {
    return [task = std::move(task), promise = std::move(promise),
            pending = std::move(pending)]() {
        try {
            task();
            promise->set_value();
        } catch (...) {
            promise->set_exception(std::current_exception());
        }
        pending->fetch_sub(1, std::memory_order_relaxed);
    };
}

#endif  // KCENON_WITH_THREAD_SYSTEM

}  // namespace

// ============================================================================
// thread_system_executor implementation
// ============================================================================

#if KCENON_WITH_THREAD_SYSTEM

class function_job : public kcenon::thread::job {
public:
    explicit function_job(std::function<void()> func, const std::string& name = "function_job")
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

struct thread_system_executor::impl {
    std::shared_ptr<kcenon::thread::thread_pool> pool;
    std::string pool_name;
    size_t worker_count{0};
    std::shared_ptr<std::atomic<size_t>> pending = std::make_shared<std::atomic<size_t>>(0);
};

thread_system_executor::thread_system_executor(
    std::shared_ptr<kcenon::thread::thread_pool> pool,
    const std::string& pool_name,
    size_t worker_count)
    : pimpl_(std::make_shared<impl>()) {
    pimpl_->pool = std::move(pool);
    pimpl_->pool_name = pool_name;
    pimpl_->worker_count = worker_count;
}

thread_system_executor::~thread_system_executor() {
    if (pimpl_->pool) {
        pimpl_->pool->stop();
    }
}

std::shared_ptr<thread_system_executor> thread_system_executor::create_default(
    size_t worker_count, const std::string& pool_name) {
    worker_count = default_worker_count(worker_count);

    auto pool = std::make_shared<kcenon::thread::thread_pool>(pool_name);

    for (size_t i = 0; i < worker_count; ++i) {
        auto worker = std::make_unique<kcenon::thread::thread_worker>();
        worker->set_job_queue(pool->get_job_queue());
        pool->enqueue(std::move(worker));
    }

    pool->start();

    return std::make_shared<thread_system_executor>(std::move(pool), pool_name, worker_count);
}

std::future<void> thread_system_executor::submit(std::function<void()> task) {
    auto promise = std::make_shared<std::promise<void>>();
    auto future = promise->get_future();

    pimpl_->pending->fetch_add(1, std::memory_order_relaxed);
    auto job = std::make_unique<function_job>(
        wrap_task(std::move(task), std::move(promise), pimpl_->pending),
        "remote_project_task");
    pimpl_->pool->enqueue(std::move(job));

    return future;
}

size_t thread_system_executor::worker_count() const {
    return pimpl_->worker_count;
}

bool thread_system_executor::is_running() const {
    return pimpl_->pool != nullptr;
}

size_t thread_system_executor::pending_tasks() const {
    return pimpl_->pending->load(std::memory_order_relaxed);
}

std::string thread_system_executor::pool_name() const {
    return pimpl_->pool_name;
}

#endif  // KCENON_WITH_THREAD_SYSTEM

// ============================================================================
// async_executor implementation
// ============================================================================

struct async_executor::impl {
    std::shared_ptr<std::atomic<size_t>> pending = std::make_shared<std::atomic<size_t>>(0);
};

async_executor::async_executor() : pimpl_(std::make_shared<impl>()) {}

async_executor::~async_executor() = default;

std::future<void> async_executor::submit(std::function<void()> task) {
    pimpl_->pending->fetch_add(1, std::memory_order_relaxed);

    auto pending = pimpl_->pending;
    return std::async(std::launch::async, [task = std::move(task), pending]() {
        try {
            task();
        } catch (...) {
            pending->fetch_sub(1, std::memory_order_relaxed);
            throw;
        }
        pending->fetch_sub(1, std::memory_order_relaxed);
    });
}

size_t async_executor::worker_count() const {
    return default_worker_count(0);
}

bool async_executor::is_running() const { return true; }

size_t async_executor::pending_tasks() const {
    return pimpl_->pending->load(std::memory_order_relaxed);
}

// ============================================================================
// executor_factory implementation
// ============================================================================

std::shared_ptr<task_executor_interface> executor_factory::create(
    size_t worker_count, const std::string& pool_name) {
#if KCENON_WITH_THREAD_SYSTEM
    return thread_system_executor::create_default(worker_count, pool_name);
#else
    (void)worker_count;
    (void)pool_name;
    return std::make_shared<async_executor>();
#endif
}

}  // namespace cavesync::remote_project::adapters
