// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

/**
 * @file thread_pool_adapter.cpp
 * @brief Worker pools for the traditional transfer path
 */

#include "kcenon/object_transfer/adapters/thread_pool_adapter.h"

#include <exception>

#if KCENON_WITH_THREAD_SYSTEM
#pragma clang diagnostic push
#pragma clang diagnostic ignored "-Wdeprecated-declarations"
#include <kcenon/thread/core/job.h>
#include <kcenon/thread/core/job_queue.h>
#include <kcenon/thread/core/thread_worker.h>
#pragma clang diagnostic pop
#endif

namespace kcenon::object_transfer::adapters {

// ============================================================================
// thread_system_worker_pool
// ============================================================================

#if KCENON_WITH_THREAD_SYSTEM

namespace {

class worker_loop_job : public kcenon::thread::job {
public:
    worker_loop_job(std::function<void()> loop, std::shared_ptr<std::promise<void>> done)
        : job("traditional_worker"), loop_(std::move(loop)), done_(std::move(done)) {}

    [[nodiscard]] auto do_work() -> common::VoidResult override {
        try {
            loop_();
            done_->set_value();
        } catch (...) {
            done_->set_exception(std::current_exception());
        }
        return common::ok();
    }

private:
    std::function<void()> loop_;
    std::shared_ptr<std::promise<void>> done_;
};

}  // namespace

thread_system_worker_pool::thread_system_worker_pool(
    std::shared_ptr<kcenon::thread::thread_pool> pool, std::size_t capacity)
    : pool_(std::move(pool)), capacity_(capacity) {}

std::shared_ptr<thread_system_worker_pool> thread_system_worker_pool::start(
    std::size_t workers, const std::string& name) {
    auto pool = std::make_shared<kcenon::thread::thread_pool>(name);
    for (std::size_t i = 0; i < workers; ++i) {
        auto worker = std::make_unique<kcenon::thread::thread_worker>();
        worker->set_job_queue(pool->get_job_queue());
        pool->enqueue(std::move(worker));
    }
    pool->start();
    return std::make_shared<thread_system_worker_pool>(std::move(pool), workers);
}

std::future<void> thread_system_worker_pool::launch(std::function<void()> loop) {
    auto done = std::make_shared<std::promise<void>>();
    auto future = done->get_future();
    pool_->enqueue(std::make_unique<worker_loop_job>(std::move(loop), std::move(done)));
    return future;
}

#endif  // KCENON_WITH_THREAD_SYSTEM

// ============================================================================
// async_worker_pool
// ============================================================================

async_worker_pool::async_worker_pool(std::size_t capacity)
    : capacity_(capacity > 0 ? capacity : 1) {}

std::future<void> async_worker_pool::launch(std::function<void()> loop) {
    return std::async(std::launch::async, std::move(loop));
}

// ============================================================================
// Helpers
// ============================================================================

auto run_worker_loops(worker_pool_interface& pool,
                      std::size_t workers,
                      const std::function<void()>& loop) -> worker_run {
    worker_run run;

    std::vector<std::future<void>> futures;
    futures.reserve(workers);
    for (std::size_t i = 0; i < workers; ++i) {
        futures.push_back(pool.launch(loop));
    }
    run.launched = futures.size();

    for (auto& future : futures) {
        try {
            future.get();
        } catch (const std::exception& e) {
            run.failures.emplace_back(e.what());
        } catch (...) {
            run.failures.emplace_back("non-standard exception");
        }
    }
    return run;
}

auto make_worker_pool(std::size_t workers) -> std::shared_ptr<worker_pool_interface> {
    if (workers == 0) {
        workers = 1;
    }
#if KCENON_WITH_THREAD_SYSTEM
    return thread_system_worker_pool::start(workers, "object_transfer_workers");
#else
    return std::make_shared<async_worker_pool>(workers);
#endif
}

}  // namespace kcenon::object_transfer::adapters
