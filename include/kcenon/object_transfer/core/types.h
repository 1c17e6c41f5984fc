/**
 * @file types.h
 * @brief Core type definitions for object_trans_system
 */

#ifndef KCENON_OBJECT_TRANSFER_CORE_TYPES_H
#define KCENON_OBJECT_TRANSFER_CORE_TYPES_H

#include <cstdint>
#include <optional>
#include <string>
#include <utility>

namespace kcenon::object_transfer {

/**
 * @brief Error codes for object transfer operations
 */
enum class error_code {
    success = 0,

    // Descriptor errors (-100 to -119)
    invalid_descriptor = -100,
    invalid_url = -101,
    unsupported_scheme = -102,
    missing_bucket = -103,
    missing_key = -104,
    invalid_destination = -105,

    // Mode errors (-120 to -139)
    mode_unavailable = -120,
    bulk_tool_unavailable = -121,
    store_family_mismatch = -122,

    // Configuration errors (-140 to -159)
    invalid_configuration = -140,
    invalid_batch_size = -141,
    invalid_worker_count = -142,
    store_not_registered = -143,

    // Transient transfer errors (-160 to -179)
    transient_failure = -160,
    network_timeout = -161,
    throttled = -162,
    connection_failed = -163,
    service_unavailable = -164,
    process_timeout = -165,
    result_not_reported = -166,

    // Permanent transfer errors (-180 to -199)
    permanent_failure = -180,
    object_not_found = -181,
    access_denied = -182,
    invalid_object = -183,
    bucket_not_found = -184,

    // Tool invocation errors (-200 to -219)
    tool_invocation_failed = -200,
    tool_not_found = -201,
    tool_start_failed = -202,
    tool_usage_error = -203,
    tool_crashed = -204,

    // Staging errors (-220 to -239)
    staging_create_failed = -220,
    staging_io_error = -221,

    // Control and internal errors (-240 to -259)
    cancelled = -240,
    internal_error = -241,
    not_initialized = -242,
};

/**
 * @brief Convert error code to string
 */
[[nodiscard]] constexpr auto to_string(error_code code) -> const char* {
    switch (code) {
        case error_code::success:
            return "success";
        case error_code::invalid_descriptor:
            return "invalid descriptor";
        case error_code::invalid_url:
            return "invalid object url";
        case error_code::unsupported_scheme:
            return "unsupported url scheme";
        case error_code::missing_bucket:
            return "missing bucket";
        case error_code::missing_key:
            return "missing object key";
        case error_code::invalid_destination:
            return "invalid destination prefix";
        case error_code::mode_unavailable:
            return "transfer mode unavailable";
        case error_code::bulk_tool_unavailable:
            return "bulk transfer tool unavailable";
        case error_code::store_family_mismatch:
            return "source and destination store families differ";
        case error_code::invalid_configuration:
            return "invalid configuration";
        case error_code::invalid_batch_size:
            return "invalid batch size";
        case error_code::invalid_worker_count:
            return "invalid worker count";
        case error_code::store_not_registered:
            return "no object store registered for store family";
        case error_code::transient_failure:
            return "transient transfer failure";
        case error_code::network_timeout:
            return "network timeout";
        case error_code::throttled:
            return "request throttled";
        case error_code::connection_failed:
            return "connection failed";
        case error_code::service_unavailable:
            return "service unavailable";
        case error_code::process_timeout:
            return "bulk tool invocation timed out";
        case error_code::result_not_reported:
            return "no result reported by tool";
        case error_code::permanent_failure:
            return "permanent transfer failure";
        case error_code::object_not_found:
            return "object not found";
        case error_code::access_denied:
            return "access denied";
        case error_code::invalid_object:
            return "invalid object";
        case error_code::bucket_not_found:
            return "bucket not found";
        case error_code::tool_invocation_failed:
            return "bulk tool invocation failed";
        case error_code::tool_not_found:
            return "bulk tool executable not found";
        case error_code::tool_start_failed:
            return "bulk tool could not be started";
        case error_code::tool_usage_error:
            return "bulk tool rejected its arguments";
        case error_code::tool_crashed:
            return "bulk tool terminated abnormally";
        case error_code::staging_create_failed:
            return "staging area could not be created";
        case error_code::staging_io_error:
            return "staging area i/o error";
        case error_code::cancelled:
            return "cancelled";
        case error_code::internal_error:
            return "internal error";
        case error_code::not_initialized:
            return "not initialized";
        default:
            return "unknown error";
    }
}

/**
 * @brief Error type with code and optional message
 */
struct error {
    error_code code;
    std::string message;

    error() : code(error_code::success) {}
    explicit error(error_code c) : code(c), message(to_string(c)) {}
    error(error_code c, std::string msg) : code(c), message(std::move(msg)) {}

    [[nodiscard]] explicit operator bool() const noexcept {
        return code != error_code::success;
    }
};

/**
 * @brief Wrapper for unexpected error (used with result<T>)
 */
struct unexpected {
    error err;

    explicit unexpected(error e) : err(std::move(e)) {}
};

/**
 * @brief Result type for operations that can fail
 *
 * A simple Result type similar to std::expected (C++23).
 * Contains either a value of type T or an error.
 */
template <typename T>
class result {
public:
    result() : value_(std::nullopt), error_{} {}

    result(T value) : value_(std::move(value)), error_{} {}

    result(unexpected u) : value_(std::nullopt), error_(std::move(u.err)) {}

    result(const result&) = default;
    result(result&&) noexcept = default;
    auto operator=(const result&) -> result& = default;
    auto operator=(result&&) noexcept -> result& = default;

    [[nodiscard]] auto has_value() const noexcept -> bool { return value_.has_value(); }
    [[nodiscard]] explicit operator bool() const noexcept { return value_.has_value(); }

    [[nodiscard]] auto value() & -> T& { return *value_; }
    [[nodiscard]] auto value() const& -> const T& { return *value_; }
    [[nodiscard]] auto value() && -> T&& { return std::move(*value_); }

    [[nodiscard]] auto error() const -> const struct error& { return error_; }

private:
    std::optional<T> value_;
    struct error error_;
};

/**
 * @brief Specialization of result for void return type
 */
template <>
class result<void> {
public:
    result() : has_value_(true) {}

    result(unexpected u) : has_value_(false), error_(std::move(u.err)) {}

    result(const result&) = default;
    result(result&&) noexcept = default;
    auto operator=(const result&) -> result& = default;
    auto operator=(result&&) noexcept -> result& = default;

    [[nodiscard]] auto has_value() const noexcept -> bool { return has_value_; }
    [[nodiscard]] explicit operator bool() const noexcept { return has_value_; }

    [[nodiscard]] auto error() const -> const struct error& { return error_; }

private:
    bool has_value_;
    struct error error_;
};

}  // namespace kcenon::object_transfer

#endif  // KCENON_OBJECT_TRANSFER_CORE_TYPES_H
