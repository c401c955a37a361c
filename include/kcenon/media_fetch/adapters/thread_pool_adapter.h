// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

/**
 * @file thread_pool_adapter.h
 * @brief Thread pool adapter for media_fetch
 *
 * One bounded pool abstraction serves both levels of fan-out: files per
 * run (MAX_TRANSFERS) and segments per file (CHUNKS).
 *
 * Features:
 * - Stage-based task tracking ("file_transfer", "segment_download")
 * - Integration with thread_system when available
 * - Fixed-size std::thread fallback that never exceeds its worker count
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

#if KCENON_WITH_THREAD_SYSTEM
#include <kcenon/thread/core/thread_pool.h>
#endif

namespace kcenon::media_fetch::adapters {

/**
 * @brief Interface for thread pool operations in media_fetch
 *
 * Implementations must run at most worker_count() tasks at a time.
 * Exceptions thrown by a task are delivered through its future.
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
     * @brief Submit a task to a named pipeline stage for tracking
     * @param task The task to execute
     * @param stage_name Name of the stage (e.g., "segment_download")
     * @return Future for the task completion
     */
    virtual std::future<void> submit_to_stage(
        std::function<void()> task,
        const std::string& stage_name) = 0;

    /**
     * @brief Get the number of worker threads
     */
    [[nodiscard]] virtual size_t worker_count() const = 0;

    /**
     * @brief Check if the pool accepts tasks
     */
    [[nodiscard]] virtual bool is_running() const = 0;

    /**
     * @brief Get total pending task count (queued, not yet started)
     */
    [[nodiscard]] virtual size_t pending_tasks() const = 0;

    /**
     * @brief Get count of submitted but unfinished tasks for a stage
     * @param stage_name Name of the stage
     */
    [[nodiscard]] virtual size_t pending_tasks(const std::string& stage_name) const = 0;
};

#if KCENON_WITH_THREAD_SYSTEM

/**
 * @brief Adapter that wraps thread_system::thread_pool
 *
 * @note Thread-safe: All public methods are safe to call from multiple threads.
 */
class thread_system_transfer_adapter : public transfer_thread_pool_interface {
public:
    /**
     * @brief Construct with an existing thread_pool
     * @param pool Shared pointer to thread_system's thread_pool
     * @param pool_name Name for identification in logs
     * @param worker_count Number of workers in the pool (for reporting)
     */
    explicit thread_system_transfer_adapter(
        std::shared_ptr<kcenon::thread::thread_pool> pool,
        const std::string& pool_name = "media_fetch_pool",
        size_t worker_count = 0);

    ~thread_system_transfer_adapter() override;

    thread_system_transfer_adapter(const thread_system_transfer_adapter&) = delete;
    thread_system_transfer_adapter& operator=(const thread_system_transfer_adapter&) = delete;

    thread_system_transfer_adapter(thread_system_transfer_adapter&&) noexcept;
    thread_system_transfer_adapter& operator=(thread_system_transfer_adapter&&) noexcept;

    /**
     * @brief Create a started pool with a fixed number of workers
     * @param worker_count Number of worker threads (0 = hardware concurrency)
     * @param pool_name Name for identification
     */
    [[nodiscard]] static std::shared_ptr<thread_system_transfer_adapter> create_default(
        size_t worker_count = 0,
        const std::string& pool_name = "media_fetch_pool");

    std::future<void> submit(std::function<void()> task) override;
    std::future<void> submit_to_stage(
        std::function<void()> task,
        const std::string& stage_name) override;

    [[nodiscard]] size_t worker_count() const override;
    [[nodiscard]] bool is_running() const override;
    [[nodiscard]] size_t pending_tasks() const override;
    [[nodiscard]] size_t pending_tasks(const std::string& stage_name) const override;

    [[nodiscard]] std::string pool_name() const;

private:
    struct impl;
    std::unique_ptr<impl> pimpl_;
};

#endif  // KCENON_WITH_THREAD_SYSTEM

/**
 * @brief Fixed-size pool of std::thread workers over a FIFO queue
 *
 * Used when thread_system is unavailable. The destructor lets queued
 * tasks finish, then joins every worker.
 */
class bounded_transfer_pool : public transfer_thread_pool_interface {
public:
    /**
     * @brief Start the workers
     * @param worker_count Number of worker threads (0 = hardware concurrency)
     * @param pool_name Name for identification in logs
     */
    explicit bounded_transfer_pool(size_t worker_count,
                                   const std::string& pool_name = "media_fetch_pool");
    ~bounded_transfer_pool() override;

    bounded_transfer_pool(const bounded_transfer_pool&) = delete;
    bounded_transfer_pool& operator=(const bounded_transfer_pool&) = delete;

    std::future<void> submit(std::function<void()> task) override;
    std::future<void> submit_to_stage(
        std::function<void()> task,
        const std::string& stage_name) override;

    [[nodiscard]] size_t worker_count() const override;
    [[nodiscard]] bool is_running() const override;
    [[nodiscard]] size_t pending_tasks() const override;
    [[nodiscard]] size_t pending_tasks(const std::string& stage_name) const override;

    /**
     * @brief Stop accepting tasks, drain the queue and join the workers
     */
    void shutdown();

private:
    struct impl;
    std::unique_ptr<impl> pimpl_;
};

/**
 * @brief Factory for creating the thread pool adapter
 *
 * Selects thread_system_transfer_adapter when KCENON_WITH_THREAD_SYSTEM,
 * otherwise bounded_transfer_pool.
 */
class transfer_pool_factory {
public:
    /**
     * @brief Create the best available thread pool adapter
     * @param worker_count Number of worker threads (0 = auto-detect)
     * @param pool_name Name for identification
     */
    [[nodiscard]] static std::shared_ptr<transfer_thread_pool_interface> create(
        size_t worker_count = 0,
        const std::string& pool_name = "media_fetch_pool");

    [[nodiscard]] static constexpr bool has_thread_system() noexcept {
#if KCENON_WITH_THREAD_SYSTEM
        return true;
#else
        return false;
#endif
    }
};

}  // namespace kcenon::media_fetch::adapters
