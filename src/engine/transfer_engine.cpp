/**
 * @file transfer_engine.cpp
 * @brief Transfer engine implementation
 */

#include "kcenon/object_transfer/engine/transfer_engine.h"

#include "kcenon/object_transfer/cloud/cloud_http_client.h"
#include "kcenon/object_transfer/cloud/cloud_utils.h"
#include "kcenon/object_transfer/command/batch_command_generator.h"
#include "kcenon/object_transfer/core/logging.h"
#include "kcenon/object_transfer/descriptor/descriptor_builder.h"
#include "kcenon/object_transfer/execution/transfer_executor.h"
#include "kcenon/object_transfer/fallback/staging_area.h"
#include "kcenon/object_transfer/fallback/traditional_transfer.h"
#include "kcenon/object_transfer/mode/capability_probe.h"
#include "kcenon/object_transfer/storage/s3_object_store.h"

#include <numeric>
#include <optional>

namespace kcenon::object_transfer {

struct transfer_engine::impl {
    engine_config config;
    std::shared_ptr<object_store_registry> stores;
    std::shared_ptr<http_source> http;
    std::shared_ptr<process_runner_interface> runner;
    std::shared_ptr<adapters::worker_pool_interface> pool;
    std::shared_ptr<const line_classifier> classifier;
    transfer_event_handler handler;

    auto execute(const transfer_request& request,
                 const std::optional<environment_capabilities>& known,
                 const cancellation_token& token) -> result<transfer_outcome>;

    auto sync(const prefix_sync_request& request, const cancellation_token& token)
        -> result<transfer_outcome>;

    auto probe(const object_url& destination, const cancellation_token& token)
        -> environment_capabilities {
        return capability_probe::probe(config.tool, *stores, destination, *runner, token);
    }
};

// ============================================================================
// builder
// ============================================================================

transfer_engine::builder::builder()
    : stores_(std::make_shared<object_store_registry>()) {}

auto transfer_engine::builder::with_config(engine_config config) -> builder& {
    config_ = std::move(config);
    return *this;
}

auto transfer_engine::builder::with_tool(bulk_tool_config tool) -> builder& {
    config_.tool = std::move(tool);
    return *this;
}

auto transfer_engine::builder::with_command_options(command_options options) -> builder& {
    config_.commands = std::move(options);
    return *this;
}

auto transfer_engine::builder::with_retry_policy(cloud_retry_policy policy) -> builder& {
    config_.retry = policy;
    return *this;
}

auto transfer_engine::builder::with_staging(staging_config staging) -> builder& {
    config_.staging = std::move(staging);
    return *this;
}

auto transfer_engine::builder::with_store(std::shared_ptr<object_store_interface> store)
    -> builder& {
    stores_->add(std::move(store));
    return *this;
}

auto transfer_engine::builder::with_s3_store(s3_store_config config) -> builder& {
    s3_stores_.push_back(std::move(config));
    return *this;
}

auto transfer_engine::builder::with_http_source(std::shared_ptr<http_source> source)
    -> builder& {
    http_ = std::move(source);
    return *this;
}

auto transfer_engine::builder::with_process_runner(
    std::shared_ptr<process_runner_interface> runner) -> builder& {
    runner_ = std::move(runner);
    return *this;
}

auto transfer_engine::builder::with_thread_pool(
    std::shared_ptr<adapters::worker_pool_interface> pool) -> builder& {
    pool_ = std::move(pool);
    return *this;
}

auto transfer_engine::builder::with_classifier(
    std::shared_ptr<const line_classifier> classifier) -> builder& {
    classifier_ = std::move(classifier);
    return *this;
}

auto transfer_engine::builder::with_event_handler(transfer_event_handler handler)
    -> builder& {
    handler_ = std::move(handler);
    return *this;
}

auto transfer_engine::builder::build() -> result<transfer_engine> {
    auto valid = config_.validate();
    if (!valid) {
        return unexpected{valid.error()};
    }

    // Initialize logger (safe to call multiple times)
    get_logger().initialize();

    auto state = std::make_unique<impl>();
    state->config = config_;
    state->stores = stores_;
    state->runner = runner_ ? runner_ : std::make_shared<posix_process_runner>();
    state->pool = pool_;
    state->classifier = classifier_ ? classifier_
                                    : std::make_shared<const regex_line_classifier>();
    state->handler = handler_;

    std::shared_ptr<http_client_interface> http_client;
    auto shared_client = [&]() -> std::shared_ptr<http_client_interface> {
        if (!http_client) {
            http_client = make_cloud_http_client();
        }
        return http_client;
    };

    for (const auto& s3 : s3_stores_) {
        stores_->add(std::make_shared<s3_object_store>(s3, shared_client()));
    }
    state->http = http_ ? http_ : std::make_shared<http_source>(shared_client());

    OT_LOG_DEBUG(log_category::engine,
                 "engine built with " + std::to_string(stores_->size()) +
                 " object store client(s), bulk tool " + config_.tool.executable);

    return transfer_engine{std::move(state)};
}

// ============================================================================
// transfer_engine
// ============================================================================

transfer_engine::transfer_engine(std::unique_ptr<impl> state) : impl_(std::move(state)) {}

transfer_engine::~transfer_engine() = default;
transfer_engine::transfer_engine(transfer_engine&&) noexcept = default;
auto transfer_engine::operator=(transfer_engine&&) noexcept -> transfer_engine& = default;

auto transfer_engine::run(const transfer_request& request, const cancellation_token& token)
    -> result<transfer_outcome> {
    return impl_->execute(request, std::nullopt, token);
}

auto transfer_engine::run_with_capabilities(const transfer_request& request,
                                            const environment_capabilities& capabilities,
                                            const cancellation_token& token)
    -> result<transfer_outcome> {
    return impl_->execute(request, capabilities, token);
}

auto transfer_engine::sync_prefix(const prefix_sync_request& request,
                                  const cancellation_token& token)
    -> result<transfer_outcome> {
    return impl_->sync(request, token);
}

auto transfer_engine::probe_capabilities(const object_url& destination,
                                         const cancellation_token& token)
    -> environment_capabilities {
    return impl_->probe(destination, token);
}

auto transfer_engine::config() const -> const engine_config& {
    return impl_->config;
}

auto transfer_engine::impl::execute(const transfer_request& request,
                                    const std::optional<environment_capabilities>& known,
                                    const cancellation_token& token)
    -> result<transfer_outcome> {
    auto valid = validate_options(request.options);
    if (!valid) {
        return unexpected{valid.error()};
    }

    auto destination = descriptor_builder::parse_destination(request.destination_prefix);
    if (!destination) {
        return unexpected{destination.error()};
    }

    auto descriptors = descriptor_builder::build(request);
    if (!descriptors) {
        OT_LOG_ERROR(log_category::engine,
                     "request rejected: " + descriptors.error().message);
        return unexpected{descriptors.error()};
    }

    transfer_batch batch;
    batch.id = cloud_utils::generate_random_hex(8);
    batch.descriptors = std::move(descriptors.value());
    batch.requested_mode = request.mode;

    transfer_log_context ctx;
    ctx.batch_id = batch.id;
    ctx.destination = request.destination_prefix;
    ctx.object_count = batch.size();
    ctx.mode = to_string(request.mode);
    OT_LOG_INFO_CTX(log_category::engine, "batch built", ctx);

    const auto capabilities = known ? *known : probe(object_url{destination.value()}, token);

    auto mode = mode_selector::select(batch.descriptors, capabilities, request.mode);
    if (!mode) {
        OT_LOG_ERROR_CTX(log_category::mode, mode.error().message, ctx);
        return unexpected{mode.error()};
    }
    batch.mode = mode.value();
    batch.state = batch_state::mode_selected;

    ctx.mode = to_string(batch.mode);
    OT_LOG_INFO_CTX(log_category::mode, "mode selected", ctx);
    if (handler.on_mode_selected) {
        handler.on_mode_selected(batch.mode);
    }

    auto commands = config.commands;
    commands.max_batch_size = request.options.max_batch_size;
    auto generator = std::make_shared<const batch_command_generator>(config.tool, commands);

    if (batch.mode == transfer_mode::direct_sync) {
        auto documents = generator->generate(batch.descriptors);
        if (!documents) {
            OT_LOG_ERROR_CTX(log_category::command, documents.error().message, ctx);
            return unexpected{documents.error()};
        }
        batch.commands = std::move(documents.value());
    } else {
        batch.staged_plan.resize(batch.size());
        std::iota(batch.staged_plan.begin(), batch.staged_plan.end(), std::size_t{0});
    }

    auto retry = config.retry;
    retry.max_attempts = request.options.max_retries + 1;

    auto fallback = std::make_shared<const traditional_transfer>(
        stores, http, std::make_shared<staging_area>(config.staging), retry);

    transfer_executor executor(runner, classifier, generator, std::move(fallback), pool,
                               executor_options{request.options.worker_count, retry});
    executor.set_event_handler(handler);

    auto outcome = executor.execute(batch, token);

    auto report = efficiency_reporter::report(batch, outcome.results, outcome.elapsed,
                                              outcome.mode_switches);

    ctx.mode = to_string(report.mode);
    ctx.bytes_transferred = report.total_bytes;
    ctx.duration_ms = static_cast<uint64_t>(report.elapsed_seconds * 1000.0);
    OT_LOG_INFO_CTX(log_category::report, report.summary(), ctx);
    if (handler.on_report) {
        handler.on_report(report);
    }

    transfer_outcome result_value;
    result_value.report = std::move(report);
    result_value.results = std::move(outcome.results);
    result_value.mode_switches = std::move(outcome.mode_switches);
    result_value.audit_lines = std::move(outcome.audit_lines);
    return result_value;
}

auto transfer_engine::impl::sync(const prefix_sync_request& request,
                                 const cancellation_token& token)
    -> result<transfer_outcome> {
    transfer_batch batch;
    batch.id = cloud_utils::generate_random_hex(8);
    batch.requested_mode = transfer_mode::direct_sync;
    batch.mode = transfer_mode::direct_sync;
    batch.state = batch_state::mode_selected;

    if (handler.on_mode_selected) {
        handler.on_mode_selected(batch.mode);
    }

    auto generator = std::make_shared<const batch_command_generator>(config.tool,
                                                                     config.commands);
    transfer_executor executor(runner, classifier, generator, nullptr, pool,
                               executor_options{1, config.retry});
    executor.set_event_handler(handler);

    auto outcome = executor.sync_prefix(request, batch, token);
    if (!outcome) {
        transfer_log_context ctx;
        ctx.batch_id = batch.id;
        ctx.source = request.source_prefix;
        ctx.destination = request.destination_prefix;
        ctx.error_message = outcome.error().message;
        OT_LOG_ERROR_CTX(log_category::engine, "prefix sync failed", ctx);
        return unexpected{outcome.error()};
    }

    auto& synced = outcome.value();
    auto report = efficiency_reporter::report(batch, synced.results, synced.elapsed,
                                              synced.mode_switches);
    OT_LOG_INFO(log_category::report, report.summary());
    if (handler.on_report) {
        handler.on_report(report);
    }

    transfer_outcome result_value;
    result_value.report = std::move(report);
    result_value.results = std::move(synced.results);
    result_value.mode_switches = std::move(synced.mode_switches);
    result_value.audit_lines = std::move(synced.audit_lines);
    result_value.removed_objects = std::move(synced.removed_objects);
    return result_value;
}

}  // namespace kcenon::object_transfer
