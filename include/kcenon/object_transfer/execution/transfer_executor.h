/**
 * @file transfer_executor.h
 * @brief Runs a batch in its selected mode
 * @version 0.1.0
 *
 * Direct-sync batches run one bulk tool invocation per command document,
 * sequentially, and map the tool's output lines back to descriptors. A tool
 * that cannot be started or fails without reporting a single object escalates
 * every descriptor still open to the traditional path. Traditional batches
 * run on a bounded worker pool.
 *
 * Per-descriptor retries use exponential backoff. A direct-sync retry round
 * regenerates a command document holding only the descriptors that failed
 * retryably.
 */

#ifndef KCENON_OBJECT_TRANSFER_EXECUTION_TRANSFER_EXECUTOR_H
#define KCENON_OBJECT_TRANSFER_EXECUTION_TRANSFER_EXECUTOR_H

#include "output_classifier.h"
#include "process_runner.h"
#include "result_accumulator.h"
#include "transfer_events.h"

#include "kcenon/object_transfer/adapters/thread_pool_adapter.h"
#include "kcenon/object_transfer/cloud/cloud_config.h"
#include "kcenon/object_transfer/command/batch_command_generator.h"
#include "kcenon/object_transfer/core/cancellation.h"
#include "kcenon/object_transfer/core/transfer_types.h"
#include "kcenon/object_transfer/fallback/traditional_transfer.h"

#include <chrono>
#include <cstddef>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace kcenon::object_transfer {

/**
 * @brief Everything execute() produced
 */
struct batch_outcome {
    /// Terminal results ordered by descriptor index; descriptors that never
    /// started (cancellation) have none
    std::vector<transfer_result> results;

    std::vector<mode_switch_event> mode_switches;

    /// Tool output lines that could not be mapped to a descriptor
    std::vector<std::string> audit_lines;

    /// Destination objects a prefix sync deleted
    std::vector<std::string> removed_objects;

    /// Mode the batch finished in
    transfer_mode final_mode = transfer_mode::traditional;

    bool cancelled = false;

    std::chrono::steady_clock::duration elapsed{};
};

/**
 * @brief Executor settings derived from the request and engine config
 */
struct executor_options {
    /// Concurrent descriptors on the traditional path
    std::size_t worker_count = 4;

    /// Retry policy for direct-sync rounds
    cloud_retry_policy retry;
};

class transfer_executor {
public:
    /**
     * @param runner Launches the bulk tool
     * @param classifier Parses tool output lines
     * @param generator Renders retry documents
     * @param fallback Per-descriptor traditional transfer
     * @param pool Worker pool for the traditional path; a pool sized to
     *        options.worker_count is created per execution when null
     * @param options Worker count and retry policy
     */
    transfer_executor(std::shared_ptr<process_runner_interface> runner,
                      std::shared_ptr<const line_classifier> classifier,
                      std::shared_ptr<const batch_command_generator> generator,
                      std::shared_ptr<const traditional_transfer> fallback,
                      std::shared_ptr<adapters::worker_pool_interface> pool,
                      executor_options options);

    void set_event_handler(transfer_event_handler handler);

    /**
     * @brief Execute a batch whose mode has been selected
     *
     * Never fails as a whole: per-descriptor errors end up in the results
     * and tool failures are recovered by escalation. Updates batch.state and,
     * after an escalation, batch.mode.
     *
     * @param batch Batch in state mode_selected; direct-sync batches carry
     *        their command documents
     * @param token Cancellation
     */
    [[nodiscard]] auto execute(transfer_batch& batch, const cancellation_token& token)
        -> batch_outcome;

    /**
     * @brief Mirror a prefix with one bulk tool `sync` invocation
     *
     * The batch starts empty; every object the tool reports becomes a
     * descriptor with its result. The tool's own retries are the only ones,
     * and there is no escalation since nothing lists the objects up front.
     *
     * @return The outcome, or the tool failure when the sync as a whole
     *         failed (not started, timed out, or exited non-zero without
     *         reporting any object)
     */
    [[nodiscard]] auto sync_prefix(const prefix_sync_request& request, transfer_batch& batch,
                                   const cancellation_token& token) -> result<batch_outcome>;

private:
    struct execution;
    struct document_run;

    void run_direct_sync(execution& exec);
    [[nodiscard]] auto run_document(execution& exec, const command_document& document)
        -> document_run;
    void run_traditional(execution& exec, const std::vector<std::size_t>& indices);

    void escalate(execution& exec, const error& cause);
    void commit(execution& exec, transfer_result result);
    void notify_attempt(const transfer_result& result);

    std::shared_ptr<process_runner_interface> runner_;
    std::shared_ptr<const line_classifier> classifier_;
    std::shared_ptr<const batch_command_generator> generator_;
    std::shared_ptr<const traditional_transfer> fallback_;
    std::shared_ptr<adapters::worker_pool_interface> pool_;
    executor_options options_;

    transfer_event_handler handler_;
    std::mutex event_mutex_;
};

}  // namespace kcenon::object_transfer

#endif  // KCENON_OBJECT_TRANSFER_EXECUTION_TRANSFER_EXECUTOR_H
