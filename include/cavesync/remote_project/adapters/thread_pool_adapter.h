/**
 * @file thread_pool_adapter.h
 * @brief Worker pool abstraction for asynchronous client operations
 *
 * Uses thread_system's thread_pool when available, std::async otherwise.
 */

#pragma once

#include <atomic>
#include <cstddef>
#include <functional>
#include <future>
#include <memory>
#include <string>

#include "../config/feature_flags.h"

#if KCENON_WITH_THREAD_SYSTEM
#include <kcenon/thread/core/thread_pool.h>
#endif

namespace cavesync::remote_project::adapters {

/**
 * @brief Executes blocking client operations off the caller's thread
 */
class task_executor_interface {
public:
    virtual ~task_executor_interface() = default;

    /**
     * @brief Submit a task for execution
     * @param task The task to execute
     * @return Future for the task completion (carries any thrown exception)
     */
    virtual std::future<void> submit(std::function<void()> task) = 0;

    [[nodiscard]] virtual size_t worker_count() const = 0;

    [[nodiscard]] virtual bool is_running() const = 0;

    /**
     * @brief Tasks submitted but not yet finished
     */
    [[nodiscard]] virtual size_t pending_tasks() const = 0;
};

#if KCENON_WITH_THREAD_SYSTEM

/**
 * @brief Executor backed by kcenon::thread::thread_pool
 *
 * @note Thread-safe.
 */
class thread_system_executor : public task_executor_interface {
public:
    explicit thread_system_executor(
        std::shared_ptr<kcenon::thread::thread_pool> pool,
        const std::string& pool_name = "remote_project_pool",
        size_t worker_count = 0);

    ~thread_system_executor() override;

    thread_system_executor(const thread_system_executor&) = delete;
    thread_system_executor& operator=(const thread_system_executor&) = delete;

    /**
     * @brief Create and start a pool
     * @param worker_count Number of worker threads (0 = hardware concurrency)
     */
    [[nodiscard]] static std::shared_ptr<thread_system_executor> create_default(
        size_t worker_count = 0,
        const std::string& pool_name = "remote_project_pool");

    std::future<void> submit(std::function<void()> task) override;

    [[nodiscard]] size_t worker_count() const override;
    [[nodiscard]] bool is_running() const override;
    [[nodiscard]] size_t pending_tasks() const override;

    [[nodiscard]] std::string pool_name() const;

private:
    struct impl;
    std::shared_ptr<impl> pimpl_;
};

#endif  // KCENON_WITH_THREAD_SYSTEM

/**
 * @brief Fallback executor: one std::async task per submission
 *
 * @note The returned future blocks in its destructor until the task ends,
 *       so callers must keep it alive for the task to run detached.
 */
class async_executor : public task_executor_interface {
public:
    async_executor();
    ~async_executor() override;

    async_executor(const async_executor&) = delete;
    async_executor& operator=(const async_executor&) = delete;

    std::future<void> submit(std::function<void()> task) override;

    [[nodiscard]] size_t worker_count() const override;
    [[nodiscard]] bool is_running() const override;
    [[nodiscard]] size_t pending_tasks() const override;

private:
    struct impl;
    std::shared_ptr<impl> pimpl_;
};

/**
 * @brief Picks thread_system when compiled in, std::async otherwise
 */
class executor_factory {
public:
    [[nodiscard]] static std::shared_ptr<task_executor_interface> create(
        size_t worker_count = 0,
        const std::string& pool_name = "remote_project_pool");

    [[nodiscard]] static constexpr bool has_thread_system() noexcept {
#if KCENON_WITH_THREAD_SYSTEM
        return true;
#else
        return false;
#endif
    }
};

}  // namespace cavesync::remote_project::adapters
