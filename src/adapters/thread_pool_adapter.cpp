// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

/**
 * @file thread_pool_adapter.cpp
 * @brief Thread pool adapter implementation for media_fetch
 */

#include "kcenon/media_fetch/adapters/thread_pool_adapter.h"

#include "kcenon/media_fetch/core/logging.h"

#include <condition_variable>
#include <deque>
#include <exception>
#include <stdexcept>
#include <thread>
#include <vector>

#if KCENON_WITH_THREAD_SYSTEM
// Suppress deprecation warnings from thread_system headers
#pragma clang diagnostic push
#pragma clang diagnostic ignored "-Wdeprecated-declarations"
#include <kcenon/thread/core/job.h>
#include <kcenon/thread/core/job_queue.h>
#include <kcenon/thread/core/thread_worker.h>
#pragma clang diagnostic pop
#endif

namespace kcenon::media_fetch::adapters {

// ============================================================================
// Shared helpers
// ============================================================================

namespace {

class stage_tracker {
public:
    void increment(const std::string& stage_name) {
        std::lock_guard<std::mutex> lock(mutex_);
        ++counts_[stage_name];
    }

    void decrement(const std::string& stage_name) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = counts_.find(stage_name);
        if (it != counts_.end() && it->second > 0) {
            --it->second;
        }
    }

    [[nodiscard]] size_t count(const std::string& stage_name) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = counts_.find(stage_name);
        return it != counts_.end() ? it->second : 0;
    }

private:
    mutable std::mutex mutex_;
    std::unordered_map<std::string, size_t> counts_;
};

auto resolve_worker_count(size_t worker_count) -> size_t {
    if (worker_count == 0) {
        worker_count = std::thread::hardware_concurrency();
        if (worker_count == 0) {
            worker_count = 4;
        }
    }
    return worker_count;
}

// Runs task and routes its outcome into promise
auto make_promised_task(std::function<void()> task,
                        std::shared_ptr<std::promise<void>> promise,
                        stage_tracker* tracker = nullptr,
                        std::string stage = {}) -> std::function<void()> {
    return [task = std::move(task), promise = std::move(promise), tracker,
            stage = std::move(stage)]() {
        std::exception_ptr failure;
        try {
            task();
        } catch (...) {
            failure = std::current_exception();
        }
        // Stage count drops before the future becomes ready
        if (tracker) {
            tracker->decrement(stage);
        }
        if (failure) {
            promise->set_exception(failure);
        } else {
            promise->set_value();
        }
    };
}

}  // namespace

// ============================================================================
// thread_system_transfer_adapter implementation
// ============================================================================

#if KCENON_WITH_THREAD_SYSTEM

/**
 * @brief Simple job that wraps a function for thread_system execution
 */
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

struct thread_system_transfer_adapter::impl {
    std::shared_ptr<kcenon::thread::thread_pool> pool;
    std::string pool_name;
    size_t worker_count{0};
    stage_tracker tracker;
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

thread_system_transfer_adapter::thread_system_transfer_adapter(
    thread_system_transfer_adapter&&) noexcept = default;

thread_system_transfer_adapter& thread_system_transfer_adapter::operator=(
    thread_system_transfer_adapter&&) noexcept = default;

std::shared_ptr<thread_system_transfer_adapter>
thread_system_transfer_adapter::create_default(size_t worker_count,
                                                const std::string& pool_name) {
    worker_count = resolve_worker_count(worker_count);

    auto pool = std::make_shared<kcenon::thread::thread_pool>(pool_name);

    for (size_t i = 0; i < worker_count; ++i) {
        auto worker = std::make_unique<kcenon::thread::thread_worker>();
        worker->set_job_queue(pool->get_job_queue());
        pool->enqueue(std::move(worker));
    }

    pool->start();

    return std::make_shared<thread_system_transfer_adapter>(std::move(pool), pool_name,
                                                            worker_count);
}

std::future<void> thread_system_transfer_adapter::submit(std::function<void()> task) {
    auto promise = std::make_shared<std::promise<void>>();
    auto future = promise->get_future();

    auto job = std::make_unique<function_job>(
        make_promised_task(std::move(task), std::move(promise)), "media_fetch_task");
    pimpl_->pool->enqueue(std::move(job));

    return future;
}

std::future<void> thread_system_transfer_adapter::submit_to_stage(
    std::function<void()> task, const std::string& stage_name) {
    pimpl_->tracker.increment(stage_name);

    auto promise = std::make_shared<std::promise<void>>();
    auto future = promise->get_future();

    auto job = std::make_unique<function_job>(
        make_promised_task(std::move(task), std::move(promise), &pimpl_->tracker, stage_name),
        stage_name);
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

size_t thread_system_transfer_adapter::pending_tasks(const std::string& stage_name) const {
    return pimpl_->tracker.count(stage_name);
}

std::string thread_system_transfer_adapter::pool_name() const {
    return pimpl_->pool_name;
}

#endif  // KCENON_WITH_THREAD_SYSTEM

// ============================================================================
// bounded_transfer_pool implementation
// ============================================================================

struct bounded_transfer_pool::impl {
    std::string pool_name;
    std::vector<std::thread> workers;
    std::deque<std::function<void()>> queue;
    mutable std::mutex mutex;
    std::condition_variable cv;
    bool stopping{false};
    stage_tracker tracker;

    void worker_loop() {
        while (true) {
            std::function<void()> task;
            {
                std::unique_lock<std::mutex> lock(mutex);
                cv.wait(lock, [this] { return stopping || !queue.empty(); });
                if (queue.empty()) {
                    return;
                }
                task = std::move(queue.front());
                queue.pop_front();
            }
            task();
        }
    }

    auto enqueue(std::function<void()> task) -> bool {
        {
            std::lock_guard<std::mutex> lock(mutex);
            if (stopping) {
                return false;
            }
            queue.push_back(std::move(task));
        }
        cv.notify_one();
        return true;
    }
};

bounded_transfer_pool::bounded_transfer_pool(size_t worker_count,
                                             const std::string& pool_name)
    : pimpl_(std::make_unique<impl>()) {
    pimpl_->pool_name = pool_name;

    worker_count = resolve_worker_count(worker_count);
    pimpl_->workers.reserve(worker_count);
    for (size_t i = 0; i < worker_count; ++i) {
        pimpl_->workers.emplace_back([p = pimpl_.get()] { p->worker_loop(); });
    }
}

bounded_transfer_pool::~bounded_transfer_pool() { shutdown(); }

void bounded_transfer_pool::shutdown() {
    {
        std::lock_guard<std::mutex> lock(pimpl_->mutex);
        if (pimpl_->stopping && pimpl_->workers.empty()) {
            return;
        }
        pimpl_->stopping = true;
    }
    pimpl_->cv.notify_all();

    for (auto& worker : pimpl_->workers) {
        if (worker.joinable()) {
            worker.join();
        }
    }
    pimpl_->workers.clear();
}

std::future<void> bounded_transfer_pool::submit(std::function<void()> task) {
    auto promise = std::make_shared<std::promise<void>>();
    auto future = promise->get_future();

    if (!pimpl_->enqueue(make_promised_task(std::move(task), promise))) {
        promise->set_exception(std::make_exception_ptr(
            std::runtime_error(pimpl_->pool_name + " is shut down")));
    }
    return future;
}

std::future<void> bounded_transfer_pool::submit_to_stage(
    std::function<void()> task, const std::string& stage_name) {
    pimpl_->tracker.increment(stage_name);

    auto promise = std::make_shared<std::promise<void>>();
    auto future = promise->get_future();

    if (!pimpl_->enqueue(
            make_promised_task(std::move(task), promise, &pimpl_->tracker, stage_name))) {
        pimpl_->tracker.decrement(stage_name);
        promise->set_exception(std::make_exception_ptr(
            std::runtime_error(pimpl_->pool_name + " is shut down")));
    }
    return future;
}

size_t bounded_transfer_pool::worker_count() const { return pimpl_->workers.size(); }

bool bounded_transfer_pool::is_running() const {
    std::lock_guard<std::mutex> lock(pimpl_->mutex);
    return !pimpl_->stopping;
}

size_t bounded_transfer_pool::pending_tasks() const {
    std::lock_guard<std::mutex> lock(pimpl_->mutex);
    return pimpl_->queue.size();
}

size_t bounded_transfer_pool::pending_tasks(const std::string& stage_name) const {
    return pimpl_->tracker.count(stage_name);
}

// ============================================================================
// transfer_pool_factory implementation
// ============================================================================

std::shared_ptr<transfer_thread_pool_interface> transfer_pool_factory::create(
    size_t worker_count, const std::string& pool_name) {
    MF_LOG_DEBUG(log_category::transfer,
                 "Creating pool '" + pool_name + "' on " +
                     (has_thread_system() ? "thread_system" : "bounded_transfer_pool"));
#if KCENON_WITH_THREAD_SYSTEM
    return thread_system_transfer_adapter::create_default(worker_count, pool_name);
#else
    return std::make_shared<bounded_transfer_pool>(worker_count, pool_name);
#endif
}

}  // namespace kcenon::media_fetch::adapters
