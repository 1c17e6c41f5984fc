/**
 * @file traditional_transfer.cpp
 * @brief Download-then-upload transfer implementation
 */

#include "kcenon/object_transfer/fallback/traditional_transfer.h"

#include "kcenon/object_transfer/cloud/cloud_utils.h"
#include "kcenon/object_transfer/core/error_codes.h"
#include "kcenon/object_transfer/core/logging.h"

#include <algorithm>

namespace kcenon::object_transfer {

namespace {

auto last_segment(const std::string& key) -> std::string {
    auto slash = key.find_last_of('/');
    return slash == std::string::npos ? key : key.substr(slash + 1);
}

auto cancelled_error() -> error {
    return error{error_code::cancelled, "transfer cancelled"};
}

}  // namespace

traditional_transfer::traditional_transfer(std::shared_ptr<const object_store_registry> stores,
                                           std::shared_ptr<http_source> http,
                                           std::shared_ptr<staging_area> staging,
                                           cloud_retry_policy retry)
    : stores_(std::move(stores)),
      http_(std::move(http)),
      staging_(std::move(staging)),
      retry_(retry) {}

auto traditional_transfer::transfer(std::size_t index,
                                    const transfer_descriptor& descriptor,
                                    const cancellation_token& token,
                                    const retry_callback& on_retry) const
    -> transfer_result {
    transfer_result res(index, descriptor);
    res.mode = transfer_mode::traditional;
    res.attempt = 1;

    auto fail = [&](error err) -> transfer_result {
        res.status = transfer_status::failed;
        res.error_detail = std::move(err);
        return res;
    };

    // Runs one step with retries. Every try counts as an operation.
    auto run_step = [&](const char* step_name, auto&& step) -> result<uint64_t> {
        const auto max_attempts = std::max<std::size_t>(retry_.max_attempts, 1);
        for (std::size_t attempt = 1;; ++attempt) {
            if (token.is_cancelled()) {
                return unexpected{cancelled_error()};
            }

            auto outcome = step();
            ++res.operations;
            if (outcome) {
                ++res.network_transfers;
                return outcome;
            }

            const auto& err = outcome.error();
            if (!is_retryable(err.code) || attempt >= max_attempts) {
                return outcome;
            }

            transfer_result snapshot = res;
            snapshot.status = transfer_status::retried;
            snapshot.error_detail = err;
            if (on_retry) {
                on_retry(snapshot);
            }
            ++res.attempt;

            transfer_log_context ctx;
            ctx.source = descriptor.source().to_string();
            ctx.destination = descriptor.destination().to_string();
            ctx.mode = to_string(transfer_mode::traditional);
            ctx.attempt = res.attempt;
            ctx.error_message = err.message;
            OT_LOG_WARN_CTX(log_category::fallback,
                            std::string(step_name) + " failed, retrying", ctx);

            if (token.wait_for(cloud_utils::calculate_retry_delay(retry_, attempt))) {
                return unexpected{cancelled_error()};
            }
        }
    };

    if (token.is_cancelled()) {
        return fail(cancelled_error());
    }

    const auto& destination = descriptor.destination();
    if (!destination.is_object_store()) {
        return fail(error{error_code::invalid_destination,
            "destination must be an object store URL: " + destination.to_string()});
    }
    auto target_store = stores_->get(destination.store().store);
    if (!target_store) {
        return fail(target_store.error());
    }

    std::shared_ptr<object_store_interface> source_store;
    const auto& source = descriptor.source();
    if (source.is_object_store()) {
        auto found = stores_->get(source.store().store);
        if (!found) {
            return fail(found.error());
        }
        source_store = found.value();
    } else if (!http_) {
        return fail(error{error_code::store_not_registered,
            "no HTTP source configured for " + source.to_string()});
    }

    auto lease = staging_->acquire(last_segment(source.object_key()));
    if (!lease) {
        return fail(lease.error());
    }
    const auto staged_file = lease.value().file();

    auto downloaded = run_step("download", [&]() -> result<uint64_t> {
        if (source_store) {
            return source_store->download(source.store(), staged_file);
        }
        return http_->download(source.http(), staged_file);
    });
    if (!downloaded) {
        return fail(downloaded.error());
    }

    if (token.is_cancelled()) {
        return fail(cancelled_error());
    }

    auto uploaded = run_step("upload", [&]() {
        return target_store.value()->upload(staged_file, destination.store());
    });
    if (!uploaded) {
        return fail(uploaded.error());
    }

    lease.value().release();

    res.status = transfer_status::success;
    res.bytes_transferred = uploaded.value();
    return res;
}

}  // namespace kcenon::object_transfer
