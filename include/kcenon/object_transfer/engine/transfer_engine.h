/**
 * @file transfer_engine.h
 * @brief Entry point: turns a transfer request into a report
 * @version 0.1.0
 *
 * A run goes through validate, build, probe, select, generate, execute and
 * report. Nothing is cached between runs: every run probes the environment
 * again (unless capabilities are supplied) and gets its own staging area,
 * command documents and executor.
 *
 * @code
 * auto engine_result = transfer_engine::builder()
 *     .with_s3_store(s3_store_config_builder().with_region("ap-northeast-1").build())
 *     .with_event_handler(handler)
 *     .build();
 *
 * if (engine_result.has_value()) {
 *     transfer_request request;
 *     request.sources = {"s3://data.binance.vision/data/spot/daily/klines/BTCUSDT/1m/BTCUSDT-1m-2024-01-01.zip"};
 *     request.destination_prefix = "s3://my-bucket/binance";
 *     auto outcome = engine_result.value().run(request);
 * }
 * @endcode
 */

#ifndef KCENON_OBJECT_TRANSFER_ENGINE_TRANSFER_ENGINE_H
#define KCENON_OBJECT_TRANSFER_ENGINE_TRANSFER_ENGINE_H

#include "kcenon/object_transfer/adapters/thread_pool_adapter.h"
#include "kcenon/object_transfer/config/engine_config.h"
#include "kcenon/object_transfer/core/cancellation.h"
#include "kcenon/object_transfer/core/transfer_types.h"
#include "kcenon/object_transfer/core/types.h"
#include "kcenon/object_transfer/execution/output_classifier.h"
#include "kcenon/object_transfer/execution/process_runner.h"
#include "kcenon/object_transfer/execution/transfer_events.h"
#include "kcenon/object_transfer/mode/mode_selector.h"
#include "kcenon/object_transfer/reporting/efficiency_reporter.h"
#include "kcenon/object_transfer/storage/http_source.h"
#include "kcenon/object_transfer/storage/object_store.h"

#include <memory>
#include <string>
#include <vector>

namespace kcenon::object_transfer {

/**
 * @brief Everything a run produced
 */
struct transfer_outcome {
    efficiency_report report;

    /// Terminal results ordered by descriptor index
    std::vector<transfer_result> results;

    std::vector<mode_switch_event> mode_switches;

    /// Tool output lines that could not be mapped to a descriptor
    std::vector<std::string> audit_lines;

    /// Destination objects removed by a prefix sync with delete_extraneous
    std::vector<std::string> removed_objects;
};

class transfer_engine {
public:
    /**
     * @brief Builder for transfer_engine
     */
    class builder {
    public:
        builder();

        /**
         * @brief Replace the whole configuration
         */
        auto with_config(engine_config config) -> builder&;

        auto with_tool(bulk_tool_config tool) -> builder&;
        auto with_command_options(command_options options) -> builder&;

        /**
         * @brief Backoff timing; max_attempts is taken from each request
         */
        auto with_retry_policy(cloud_retry_policy policy) -> builder&;

        auto with_staging(staging_config staging) -> builder&;

        /**
         * @brief Register an object store client for its family
         */
        auto with_store(std::shared_ptr<object_store_interface> store) -> builder&;

        /**
         * @brief Register an s3_object_store over cloud_http_client
         */
        auto with_s3_store(s3_store_config config) -> builder&;

        /**
         * @brief Source for http(s) URLs; defaults to one over cloud_http_client
         */
        auto with_http_source(std::shared_ptr<http_source> source) -> builder&;

        /**
         * @brief Bulk tool launcher; defaults to posix_process_runner
         */
        auto with_process_runner(std::shared_ptr<process_runner_interface> runner) -> builder&;

        /**
         * @brief Worker pool for the traditional path; defaults to a pool per run
         */
        auto with_thread_pool(
            std::shared_ptr<adapters::worker_pool_interface> pool) -> builder&;

        /**
         * @brief Tool output classifier; defaults to the s5cmd patterns
         */
        auto with_classifier(std::shared_ptr<const line_classifier> classifier) -> builder&;

        auto with_event_handler(transfer_event_handler handler) -> builder&;

        /**
         * @brief Build the engine
         * @return Engine, or invalid_configuration (or a more specific
         *         configuration error)
         */
        [[nodiscard]] auto build() -> result<transfer_engine>;

    private:
        engine_config config_;
        std::shared_ptr<object_store_registry> stores_;
        std::vector<s3_store_config> s3_stores_;
        std::shared_ptr<http_source> http_;
        std::shared_ptr<process_runner_interface> runner_;
        std::shared_ptr<adapters::worker_pool_interface> pool_;
        std::shared_ptr<const line_classifier> classifier_;
        transfer_event_handler handler_;
    };

    ~transfer_engine();

    transfer_engine(const transfer_engine&) = delete;
    auto operator=(const transfer_engine&) -> transfer_engine& = delete;
    transfer_engine(transfer_engine&&) noexcept;
    auto operator=(transfer_engine&&) noexcept -> transfer_engine&;

    /**
     * @brief Transfer every source of the request
     *
     * Fails only before execution starts: invalid options, an invalid
     * descriptor, or an explicit direct_sync request the environment cannot
     * honour. Once execution starts the run always returns an outcome;
     * per-descriptor failures are in the results.
     *
     * @param request Sources, destination prefix, mode and options
     * @param token Cancellation
     */
    [[nodiscard]] auto run(const transfer_request& request,
                           const cancellation_token& token = {})
        -> result<transfer_outcome>;

    /**
     * @brief Same as run() with known capabilities (no probing)
     */
    [[nodiscard]] auto run_with_capabilities(const transfer_request& request,
                                             const environment_capabilities& capabilities,
                                             const cancellation_token& token = {})
        -> result<transfer_outcome>;

    /**
     * @brief Mirror a source prefix into a destination prefix in one `sync`
     *
     * Always direct sync. The results list the objects the tool reported,
     * in report order.
     *
     * @return Outcome, or the error when the sync could not run at all
     *         (invalid prefixes or filters, tool missing, timeout, or a
     *         failed exit without any object reported)
     */
    [[nodiscard]] auto sync_prefix(const prefix_sync_request& request,
                                   const cancellation_token& token = {})
        -> result<transfer_outcome>;

    /**
     * @brief Probe the bulk tool and the destination store
     */
    [[nodiscard]] auto probe_capabilities(const object_url& destination,
                                          const cancellation_token& token = {})
        -> environment_capabilities;

    [[nodiscard]] auto config() const -> const engine_config&;

private:
    struct impl;
    explicit transfer_engine(std::unique_ptr<impl> state);

    std::unique_ptr<impl> impl_;
};

}  // namespace kcenon::object_transfer

#endif  // KCENON_OBJECT_TRANSFER_ENGINE_TRANSFER_ENGINE_H
