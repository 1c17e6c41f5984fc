// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

/**
 * @file thread_pool_adapter.h
 * @brief Worker pools for the traditional transfer path
 *
 * The traditional path runs a fixed number of worker loops; each loop claims
 * descriptors until none are left. Loops run on thread_system when the build
 * integrates it and on std::async threads otherwise.
 */

#pragma once

#include <cstddef>
#include <functional>
#include <future>
#include <memory>
#include <string>
#include <vector>

#include "../config/feature_flags.h"

#if KCENON_WITH_THREAD_SYSTEM
#include <kcenon/thread/core/thread_pool.h>
#endif

namespace kcenon::object_transfer::adapters {

/**
 * @brief Launches worker loops
 */
class worker_pool_interface {
public:
    virtual ~worker_pool_interface() = default;

    /**
     * @brief Start one worker loop
     * @return Future for the loop; an exception it throws is rethrown from get()
     */
    virtual std::future<void> launch(std::function<void()> loop) = 0;

    /**
     * @brief Loops that can run at the same time
     */
    [[nodiscard]] virtual std::size_t capacity() const = 0;
};

#if KCENON_WITH_THREAD_SYSTEM

/**
 * @brief Worker loops as thread_system jobs
 *
 * Loops beyond the pool's worker count wait in its job queue.
 */
class thread_system_worker_pool : public worker_pool_interface {
public:
    thread_system_worker_pool(std::shared_ptr<kcenon::thread::thread_pool> pool,
                              std::size_t capacity);

    /**
     * @brief Create and start a pool with the given number of workers
     */
    [[nodiscard]] static std::shared_ptr<thread_system_worker_pool> start(
        std::size_t workers, const std::string& name);

    std::future<void> launch(std::function<void()> loop) override;
    [[nodiscard]] std::size_t capacity() const override { return capacity_; }

private:
    std::shared_ptr<kcenon::thread::thread_pool> pool_;
    std::size_t capacity_;
};

#endif  // KCENON_WITH_THREAD_SYSTEM

/**
 * @brief One std::async thread per loop
 */
class async_worker_pool : public worker_pool_interface {
public:
    explicit async_worker_pool(std::size_t capacity);

    std::future<void> launch(std::function<void()> loop) override;
    [[nodiscard]] std::size_t capacity() const override { return capacity_; }

private:
    std::size_t capacity_;
};

/**
 * @brief What run_worker_loops observed
 */
struct worker_run {
    std::size_t launched = 0;

    /// One message per loop that ended with an exception
    std::vector<std::string> failures;
};

/**
 * @brief Run `loop` on `workers` loops and wait for every one of them
 */
[[nodiscard]] auto run_worker_loops(worker_pool_interface& pool,
                                    std::size_t workers,
                                    const std::function<void()>& loop) -> worker_run;

/**
 * @brief Pool sized for one traditional run
 *
 * thread_system_worker_pool when the build integrates thread_system,
 * async_worker_pool otherwise.
 */
[[nodiscard]] auto make_worker_pool(std::size_t workers) -> std::shared_ptr<worker_pool_interface>;

[[nodiscard]] constexpr bool has_thread_system() noexcept {
#if KCENON_WITH_THREAD_SYSTEM
    return true;
#else
    return false;
#endif
}

}  // namespace kcenon::object_transfer::adapters
