/**
 * @file transfer_executor.cpp
 * @brief Direct-sync and traditional batch execution
 */

#include "kcenon/object_transfer/execution/transfer_executor.h"

#include "kcenon/object_transfer/cloud/cloud_utils.h"
#include "kcenon/object_transfer/core/error_codes.h"
#include "kcenon/object_transfer/core/logging.h"

#include <algorithm>
#include <atomic>
#include <numeric>
#include <optional>
#include <unordered_map>
#include <utility>

namespace kcenon::object_transfer {

namespace {

auto context_for(const transfer_batch& batch, const transfer_result& r) -> transfer_log_context {
    transfer_log_context ctx;
    ctx.batch_id = batch.id;
    ctx.source = r.descriptor.source().to_string();
    ctx.destination = r.descriptor.destination().to_string();
    ctx.mode = to_string(r.mode);
    ctx.attempt = r.attempt;
    if (r.succeeded()) {
        ctx.bytes_transferred = r.bytes_transferred;
    } else if (r.error_detail) {
        ctx.error_message = r.error_detail->message;
    }
    return ctx;
}

auto tool_failure_error(const process_outcome& process, const std::string& last_error_line)
    -> error {
    std::string message;
    error_code code = error_code::tool_invocation_failed;
    if (process.term_signal != 0) {
        code = error_code::tool_crashed;
        message = "bulk tool killed by signal " + std::to_string(process.term_signal);
    } else {
        message = "bulk tool exited with code " + std::to_string(process.exit_code) +
                  " without reporting any object";
    }
    if (!last_error_line.empty()) {
        message += ": " + last_error_line;
    }
    return error{code, std::move(message)};
}

void apply_line(transfer_result& r, const line_classification& c) {
    switch (c.kind) {
        case line_kind::success:
            r.status = transfer_status::success;
            r.bytes_transferred = c.bytes.value_or(r.descriptor.size_hint().value_or(0));
            r.network_transfers = 1;
            break;
        case line_kind::skipped:
            r.status = transfer_status::success;
            r.skipped = true;
            break;
        default:
            r.status = transfer_status::failed;
            r.error_detail = error{c.code, c.message.empty() ? std::string(to_string(c.code))
                                                             : c.message};
            break;
    }
}

}  // namespace

// ============================================================================
// Execution state
// ============================================================================

struct transfer_executor::execution {
    execution(transfer_batch& b, const cancellation_token& t)
        : batch(b),
          token(t),
          results(b.size()),
          attempts(b.size(), 1),
          operations(b.size(), 0) {}

    transfer_batch& batch;
    const cancellation_token& token;
    result_accumulator results;
    batch_outcome outcome;

    /// Direct-sync attempt number per descriptor
    std::vector<uint32_t> attempts;

    /// Direct-sync operations issued per descriptor; carried into
    /// traditional results after an escalation
    std::vector<uint32_t> operations;
};

struct transfer_executor::document_run {
    std::vector<transfer_result> results;
    std::optional<error> tool_failure;
    bool cancelled = false;
};

// ============================================================================
// transfer_executor
// ============================================================================

transfer_executor::transfer_executor(
    std::shared_ptr<process_runner_interface> runner,
    std::shared_ptr<const line_classifier> classifier,
    std::shared_ptr<const batch_command_generator> generator,
    std::shared_ptr<const traditional_transfer> fallback,
    std::shared_ptr<adapters::worker_pool_interface> pool,
    executor_options options)
    : runner_(std::move(runner)),
      classifier_(std::move(classifier)),
      generator_(std::move(generator)),
      fallback_(std::move(fallback)),
      pool_(std::move(pool)),
      options_(options) {}

void transfer_executor::set_event_handler(transfer_event_handler handler) {
    std::lock_guard<std::mutex> lock(event_mutex_);
    handler_ = std::move(handler);
}

auto transfer_executor::execute(transfer_batch& batch, const cancellation_token& token)
    -> batch_outcome {
    const auto started = std::chrono::steady_clock::now();

    execution exec(batch, token);
    exec.outcome.final_mode = batch.mode;
    batch.state = batch_state::executing;

    transfer_log_context ctx;
    ctx.batch_id = batch.id;
    ctx.mode = to_string(batch.mode);
    ctx.object_count = batch.size();
    OT_LOG_INFO_CTX(log_category::executor, "executing batch", ctx);

    switch (batch.mode) {
        case transfer_mode::direct_sync:
            run_direct_sync(exec);
            break;
        case transfer_mode::traditional: {
            auto plan = batch.staged_plan;
            if (plan.empty()) {
                plan.resize(batch.size());
                std::iota(plan.begin(), plan.end(), std::size_t{0});
            }
            run_traditional(exec, plan);
            break;
        }
        default:
            for (std::size_t i = 0; i < batch.size(); ++i) {
                transfer_result r(i, batch.descriptors[i]);
                r.mode = batch.mode;
                r.error_detail = error{error_code::mode_unavailable,
                                       "batch mode was not resolved before execution"};
                commit(exec, std::move(r));
            }
            break;
    }

    // Descriptors that reached the tool but never got a terminal result
    for (auto index : exec.results.unresolved()) {
        if (exec.operations[index] == 0) {
            continue;
        }
        transfer_result r(index, batch.descriptors[index]);
        r.mode = transfer_mode::direct_sync;
        r.attempt = exec.attempts[index];
        r.operations = exec.operations[index];
        r.error_detail = token.is_cancelled()
            ? error{error_code::cancelled, "transfer cancelled"}
            : error{error_code::internal_error, "no terminal result recorded"};
        commit(exec, std::move(r));
    }

    if (token.is_cancelled()) {
        exec.outcome.cancelled = true;
    }

    exec.outcome.results = exec.results.snapshot();
    const bool all_succeeded =
        exec.outcome.results.size() == batch.size() &&
        std::all_of(exec.outcome.results.begin(), exec.outcome.results.end(),
                    [](const transfer_result& r) { return r.succeeded(); });
    batch.state = all_succeeded ? batch_state::completed : batch_state::partially_failed;

    exec.outcome.elapsed = std::chrono::steady_clock::now() - started;

    ctx.mode = to_string(exec.outcome.final_mode);
    ctx.duration_ms = static_cast<uint64_t>(
        std::chrono::duration_cast<std::chrono::milliseconds>(exec.outcome.elapsed).count());
    OT_LOG_INFO_CTX(log_category::executor,
                    std::string("batch finished: ") + to_string(batch.state), ctx);

    return std::move(exec.outcome);
}

// ============================================================================
// Direct sync
// ============================================================================

void transfer_executor::run_direct_sync(execution& exec) {
    auto& batch = exec.batch;

    std::vector<command_document> documents = batch.commands;
    if (documents.empty() && !batch.empty()) {
        auto generated = generator_->generate(batch.descriptors);
        if (!generated) {
            escalate(exec, generated.error());
            return;
        }
        documents = std::move(generated.value());
    }

    const auto max_attempts = std::max<std::size_t>(options_.retry.max_attempts, 1);

    for (std::size_t round = 1;; ++round) {
        std::vector<transfer_result> pending;

        for (const auto& document : documents) {
            if (exec.token.is_cancelled()) {
                exec.outcome.cancelled = true;
                break;
            }

            auto run = run_document(exec, document);
            if (run.tool_failure) {
                escalate(exec, *run.tool_failure);
                return;
            }

            for (auto& r : run.results) {
                const bool retryable = !r.succeeded() && r.error_detail &&
                                       is_retryable(r.error_detail->code) &&
                                       r.attempt < max_attempts;
                if (!retryable) {
                    commit(exec, std::move(r));
                    continue;
                }

                transfer_result snapshot = r;
                snapshot.status = transfer_status::retried;
                notify_attempt(snapshot);
                auto retry_ctx = context_for(batch, r);
                OT_LOG_WARN_CTX(log_category::executor, "object failed, retry scheduled",
                                retry_ctx);
                pending.push_back(std::move(r));
            }

            if (run.cancelled) {
                exec.outcome.cancelled = true;
                break;
            }
        }

        if (pending.empty()) {
            return;
        }

        if (exec.outcome.cancelled ||
            exec.token.wait_for(cloud_utils::calculate_retry_delay(options_.retry, round))) {
            exec.outcome.cancelled = true;
            for (auto& r : pending) {
                r.error_detail = error{error_code::cancelled, "transfer cancelled"};
                commit(exec, std::move(r));
            }
            return;
        }

        batch.state = batch_state::retrying;

        std::vector<std::size_t> indices;
        indices.reserve(pending.size());
        for (const auto& r : pending) {
            ++exec.attempts[r.index];
            indices.push_back(r.index);
        }

        auto regenerated = generator_->generate_for(batch.descriptors, indices);
        if (!regenerated) {
            escalate(exec, regenerated.error());
            return;
        }
        documents = std::move(regenerated.value());

        transfer_log_context ctx;
        ctx.batch_id = batch.id;
        ctx.attempt = static_cast<uint32_t>(round + 1);
        ctx.object_count = indices.size();
        OT_LOG_INFO_CTX(log_category::executor, "starting retry round", ctx);
    }
}

auto transfer_executor::run_document(execution& exec, const command_document& document)
    -> document_run {
    const auto& batch = exec.batch;
    const auto& tool = generator_->tool();
    const auto count = document.descriptor_indices.size();

    process_spec spec;
    spec.argv = document.argv;
    spec.stdin_data = document.text;
    spec.timeout = tool.invocation_timeout;
    spec.kill_grace = tool.kill_grace;

    std::vector<std::optional<line_classification>> lines(count);
    std::unordered_map<std::string, std::vector<std::size_t>> by_source;
    std::unordered_map<std::string, std::vector<std::size_t>> by_destination;
    for (std::size_t pos = 0; pos < count; ++pos) {
        const auto& descriptor = batch.descriptors[document.descriptor_indices[pos]];
        by_source[descriptor.source().to_string()].push_back(pos);
        by_destination[descriptor.destination().to_string()].push_back(pos);
    }

    auto first_open = [&](const std::unordered_map<std::string, std::vector<std::size_t>>& map,
                          const std::string& key) -> std::optional<std::size_t> {
        auto it = map.find(key);
        if (it == map.end()) {
            return std::nullopt;
        }
        for (auto pos : it->second) {
            if (!lines[pos]) {
                return pos;
            }
        }
        return std::nullopt;
    };

    std::size_t identified = 0;
    std::string last_error_line;

    // Result lines without identifiers, in arrival order; mapped after exit
    std::vector<std::pair<std::string, line_classification>> positional;

    auto audit = [&](std::string_view line, const char* what) {
        exec.outcome.audit_lines.emplace_back(line);
        OT_LOG_DEBUG(log_category::executor, std::string(what) + ": " + std::string(line));
    };

    auto on_line = [&](output_stream stream, std::string_view line) {
        if (stream == output_stream::standard_error && !line.empty()) {
            last_error_line = std::string(line);
        }

        auto c = classifier_->classify(stream, line);
        if (!c.is_object_result()) {
            if (line.find_first_not_of(" \t") != std::string_view::npos) {
                audit(line, "unmapped tool output");
            }
            return;
        }

        if (!c.is_identified()) {
            positional.emplace_back(std::string(line), std::move(c));
            return;
        }

        std::optional<std::size_t> pos;
        if (c.source) {
            pos = first_open(by_source, *c.source);
        }
        if (!pos && c.destination) {
            pos = first_open(by_destination, *c.destination);
        }
        if (!pos) {
            audit(line, "tool output for unknown object");
            return;
        }
        lines[*pos] = std::move(c);
        ++identified;
    };

    transfer_log_context ctx;
    ctx.batch_id = batch.id;
    ctx.mode = to_string(transfer_mode::direct_sync);
    ctx.object_count = count;
    OT_LOG_DEBUG_CTX(log_category::executor,
                     "running command document " + std::to_string(document.sequence), ctx);

    document_run out;
    auto run = runner_->run(spec, on_line, exec.token);
    if (!run) {
        out.tool_failure = run.error();
        return out;
    }

    const auto& process = run.value();

    // Nothing named an object: a failed exit is the tool failing, whatever
    // generic error lines it printed
    if (!process.succeeded() && !process.timed_out && !process.cancelled && identified == 0) {
        for (const auto& [line, c] : positional) {
            audit(line, "tool-level error");
        }
        out.tool_failure = tool_failure_error(process, last_error_line);
        return out;
    }

    // Worker output interleaves, so position only means something when no
    // line in the document carried identifiers
    for (auto& [line, c] : positional) {
        if (identified > 0) {
            audit(line, "unattributed tool output");
            continue;
        }
        auto open = std::find_if(lines.begin(), lines.end(),
                                 [](const auto& entry) { return !entry.has_value(); });
        if (open == lines.end()) {
            audit(line, "tool output for unknown object");
            continue;
        }
        *open = std::move(c);
    }

    out.cancelled = process.cancelled;
    out.results.reserve(count);
    for (std::size_t pos = 0; pos < count; ++pos) {
        const auto index = document.descriptor_indices[pos];
        const auto& descriptor = batch.descriptors[index];

        transfer_result r(index, descriptor);
        r.mode = transfer_mode::direct_sync;
        r.attempt = exec.attempts[index];
        r.operations = ++exec.operations[index];

        if (lines[pos]) {
            apply_line(r, *lines[pos]);
        } else if (process.cancelled) {
            r.error_detail = error{error_code::cancelled, "transfer cancelled"};
        } else if (process.timed_out) {
            r.error_detail = error{error_code::process_timeout,
                "bulk tool invocation timed out after " +
                std::to_string(tool.invocation_timeout.count()) + " ms"};
        } else if (process.succeeded()) {
            // Conditional copy found nothing to do
            r.status = transfer_status::success;
            r.skipped = true;
        } else {
            r.error_detail = error{error_code::result_not_reported,
                "bulk tool exited with code " + std::to_string(process.exit_code) +
                " without reporting this object"};
        }

        out.results.push_back(std::move(r));
    }

    return out;
}

// ============================================================================
// Prefix sync
// ============================================================================

auto transfer_executor::sync_prefix(const prefix_sync_request& request, transfer_batch& batch,
                                    const cancellation_token& token) -> result<batch_outcome> {
    const auto started = std::chrono::steady_clock::now();

    auto document = generator_->generate_prefix_sync(request);
    if (!document) {
        return unexpected{document.error()};
    }
    auto source_prefix = object_url::parse(request.source_prefix, false);
    if (!source_prefix) {
        return unexpected{source_prefix.error()};
    }
    // The directive's own source; lines naming it are about the sync itself
    const auto wildcard = source_prefix.value().store().to_string() + "/*";

    batch.descriptors.clear();
    batch.commands = {document.value()};
    batch.mode = transfer_mode::direct_sync;
    batch.state = batch_state::executing;

    const auto& tool = generator_->tool();
    process_spec spec;
    spec.argv = document.value().argv;
    spec.stdin_data = document.value().text;
    spec.timeout = tool.invocation_timeout;
    spec.kill_grace = tool.kill_grace;

    batch_outcome outcome;
    outcome.final_mode = transfer_mode::direct_sync;

    std::vector<line_classification> reported;
    std::unordered_map<std::string, std::size_t> by_source;
    std::string last_error_line;

    auto audit = [&](std::string_view line, const char* what) {
        outcome.audit_lines.emplace_back(line);
        OT_LOG_DEBUG(log_category::executor, std::string(what) + ": " + std::string(line));
    };

    auto on_line = [&](output_stream stream, std::string_view line) {
        if (stream == output_stream::standard_error && !line.empty()) {
            last_error_line = std::string(line);
        }

        auto c = classifier_->classify(stream, line);
        if (c.kind == line_kind::removed && c.source) {
            outcome.removed_objects.push_back(*c.source);
            return;
        }
        if (!c.is_object_result() || !c.source || !c.destination) {
            if (c.kind == line_kind::failure) {
                last_error_line = std::string(line);
            }
            if (line.find_first_not_of(" \t") != std::string_view::npos) {
                audit(line, "unmapped tool output");
            }
            return;
        }
        if (*c.source == wildcard) {
            if (c.kind == line_kind::failure) {
                last_error_line = c.message;
            }
            audit(line, "sync-level tool output");
            return;
        }

        // The tool reports an object once per attempt; the last report wins
        auto [it, inserted] = by_source.try_emplace(*c.source, reported.size());
        if (inserted) {
            reported.push_back(std::move(c));
        } else {
            reported[it->second] = std::move(c);
        }
    };

    transfer_log_context ctx;
    ctx.batch_id = batch.id;
    ctx.mode = to_string(transfer_mode::direct_sync);
    ctx.source = request.source_prefix;
    ctx.destination = request.destination_prefix;
    OT_LOG_INFO_CTX(log_category::executor, "syncing prefix", ctx);

    auto run = runner_->run(spec, on_line, token);
    if (!run) {
        batch.state = batch_state::partially_failed;
        return unexpected{run.error()};
    }

    const auto& process = run.value();
    if (process.timed_out) {
        batch.state = batch_state::partially_failed;
        return unexpected{error{error_code::process_timeout,
            "prefix sync timed out after " +
            std::to_string(tool.invocation_timeout.count()) + " ms"}};
    }
    if (!process.succeeded() && !process.cancelled && reported.empty() &&
        outcome.removed_objects.empty()) {
        batch.state = batch_state::partially_failed;
        return unexpected{tool_failure_error(process, last_error_line)};
    }

    std::vector<const line_classification*> mapped;
    for (const auto& c : reported) {
        auto source = object_url::parse(*c.source);
        auto destination = object_url::parse(*c.destination);
        if (!source || !destination) {
            audit(*c.source + " -> " + *c.destination, "unparsable object in sync output");
            continue;
        }
        auto size = c.kind == line_kind::success ? c.bytes : std::nullopt;
        batch.descriptors.emplace_back(std::move(source.value()),
                                       std::move(destination.value()), size);
        mapped.push_back(&c);
    }

    execution exec(batch, token);
    exec.outcome = std::move(outcome);

    for (std::size_t index = 0; index < mapped.size(); ++index) {
        transfer_result r(index, batch.descriptors[index]);
        r.mode = transfer_mode::direct_sync;
        r.operations = 1;
        apply_line(r, *mapped[index]);
        commit(exec, std::move(r));
    }

    exec.outcome.cancelled = process.cancelled || token.is_cancelled();
    exec.outcome.results = exec.results.snapshot();
    const bool all_succeeded =
        !exec.outcome.cancelled && process.succeeded() &&
        std::all_of(exec.outcome.results.begin(), exec.outcome.results.end(),
                    [](const transfer_result& r) { return r.succeeded(); });
    batch.state = all_succeeded ? batch_state::completed : batch_state::partially_failed;
    exec.outcome.elapsed = std::chrono::steady_clock::now() - started;

    ctx.object_count = batch.size();
    ctx.duration_ms = static_cast<uint64_t>(
        std::chrono::duration_cast<std::chrono::milliseconds>(exec.outcome.elapsed).count());
    OT_LOG_INFO_CTX(log_category::executor,
                    "prefix sync finished: " + std::to_string(batch.size()) + " objects, " +
                    std::to_string(exec.outcome.removed_objects.size()) + " removed",
                    ctx);

    return std::move(exec.outcome);
}

void transfer_executor::escalate(execution& exec, const error& cause) {
    auto remaining = exec.results.unresolved();

    mode_switch_event event;
    event.from = transfer_mode::direct_sync;
    event.to = transfer_mode::traditional;
    event.cause = cause;
    event.descriptor_count = remaining.size();

    transfer_log_context ctx;
    ctx.batch_id = exec.batch.id;
    ctx.mode = to_string(transfer_mode::traditional);
    ctx.object_count = remaining.size();
    ctx.error_message = cause.message;
    OT_LOG_WARN_CTX(log_category::executor,
                    "bulk tool failed, escalating remaining descriptors to traditional", ctx);

    exec.outcome.mode_switches.push_back(event);
    exec.outcome.final_mode = transfer_mode::traditional;
    exec.batch.mode = transfer_mode::traditional;
    exec.batch.staged_plan = remaining;
    {
        std::lock_guard<std::mutex> lock(event_mutex_);
        if (handler_.on_mode_switch) {
            handler_.on_mode_switch(event);
        }
    }

    run_traditional(exec, remaining);
}

// ============================================================================
// Traditional
// ============================================================================

void transfer_executor::run_traditional(execution& exec, const std::vector<std::size_t>& indices) {
    if (indices.empty() || exec.token.is_cancelled()) {
        return;
    }

    if (!fallback_) {
        for (auto index : indices) {
            transfer_result r(index, exec.batch.descriptors[index]);
            r.mode = transfer_mode::traditional;
            r.error_detail = error{error_code::not_initialized,
                                   "traditional transfer is not configured"};
            commit(exec, std::move(r));
        }
        return;
    }

    const auto worker_limit = std::max<std::size_t>(options_.worker_count, 1);
    auto pool = pool_ ? pool_ : adapters::make_worker_pool(worker_limit);
    const auto workers = std::min(worker_limit, indices.size());

    std::atomic<std::size_t> next{0};
    const retry_callback on_retry = [this](const transfer_result& r) { notify_attempt(r); };

    auto worker = [&]() {
        while (!exec.token.is_cancelled()) {
            const auto slot = next.fetch_add(1, std::memory_order_relaxed);
            if (slot >= indices.size()) {
                return;
            }
            const auto index = indices[slot];

            auto r = fallback_->transfer(index, exec.batch.descriptors[index], exec.token,
                                         on_retry);
            const auto prior = exec.operations[index];
            r.operations += prior;
            r.attempt += prior;
            commit(exec, std::move(r));
        }
    };

    auto run = adapters::run_worker_loops(*pool, workers, worker);
    for (const auto& failure : run.failures) {
        OT_LOG_ERROR(log_category::executor, "traditional worker stopped: " + failure);
    }

    // A worker that threw leaves its claimed descriptor without a result
    const auto claimed = std::min(next.load(), indices.size());
    for (std::size_t slot = 0; slot < claimed; ++slot) {
        const auto index = indices[slot];
        if (exec.results.contains(index)) {
            continue;
        }
        transfer_result r(index, exec.batch.descriptors[index]);
        r.mode = transfer_mode::traditional;
        r.error_detail = error{error_code::internal_error,
                               "worker stopped before reporting a result"};
        commit(exec, std::move(r));
    }
}

// ============================================================================
// Results and events
// ============================================================================

void transfer_executor::commit(execution& exec, transfer_result r) {
    auto ctx = context_for(exec.batch, r);
    if (r.succeeded()) {
        OT_LOG_DEBUG_CTX(log_category::executor,
                         r.skipped ? "object up to date, skipped" : "object transferred", ctx);
    } else {
        OT_LOG_WARN_CTX(log_category::executor, "object failed", ctx);
    }

    auto added = exec.results.add(r);
    if (!added) {
        OT_LOG_ERROR(log_category::executor, added.error().message);
        return;
    }

    std::lock_guard<std::mutex> lock(event_mutex_);
    if (handler_.on_result) {
        handler_.on_result(r);
    }
}

void transfer_executor::notify_attempt(const transfer_result& r) {
    std::lock_guard<std::mutex> lock(event_mutex_);
    if (handler_.on_attempt) {
        handler_.on_attempt(r);
    }
}

}  // namespace kcenon::object_transfer
