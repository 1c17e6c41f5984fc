/**
 * @file error_codes.h
 * @brief Error taxonomy for object_trans_system
 * @version 0.1.0
 *
 * Groups the numeric error_code ranges into the five error kinds the engine
 * reacts to. Only invalid_descriptor and mode_unavailable (plus configuration
 * errors) abort a batch; transient errors are retried, permanent errors fail a
 * single descriptor, and tool_invocation errors escalate a direct-sync batch to
 * the traditional path.
 *
 * Error code ranges:
 * - -100 to -119: Descriptor Errors
 * - -120 to -139: Mode Errors
 * - -140 to -159: Configuration Errors
 * - -160 to -179: Transient Transfer Errors
 * - -180 to -199: Permanent Transfer Errors
 * - -200 to -219: Tool Invocation Errors
 * - -220 to -239: Staging Errors
 * - -240 to -259: Control and Internal Errors
 */

#ifndef KCENON_OBJECT_TRANSFER_CORE_ERROR_CODES_H
#define KCENON_OBJECT_TRANSFER_CORE_ERROR_CODES_H

#include "types.h"

#include <cstdint>
#include <string_view>

namespace kcenon::object_transfer {

/**
 * @brief Coarse classification of an error_code
 */
enum class error_kind {
    none,
    invalid_descriptor,
    mode_unavailable,
    configuration,
    transient,
    permanent,
    tool_invocation,
    staging,
    cancelled,
    internal,
};

[[nodiscard]] constexpr auto to_string(error_kind kind) noexcept -> std::string_view {
    switch (kind) {
        case error_kind::none: return "none";
        case error_kind::invalid_descriptor: return "invalid_descriptor";
        case error_kind::mode_unavailable: return "mode_unavailable";
        case error_kind::configuration: return "configuration";
        case error_kind::transient: return "transient";
        case error_kind::permanent: return "permanent";
        case error_kind::tool_invocation: return "tool_invocation";
        case error_kind::staging: return "staging";
        case error_kind::cancelled: return "cancelled";
        case error_kind::internal: return "internal";
        default: return "unknown";
    }
}

/**
 * @brief Check if error code is in descriptor error range
 */
[[nodiscard]] constexpr auto is_descriptor_error(int32_t code) noexcept -> bool {
    return code <= -100 && code >= -119;
}

/**
 * @brief Check if error code is in mode error range
 */
[[nodiscard]] constexpr auto is_mode_error(int32_t code) noexcept -> bool {
    return code <= -120 && code >= -139;
}

/**
 * @brief Check if error code is in configuration error range
 */
[[nodiscard]] constexpr auto is_config_error(int32_t code) noexcept -> bool {
    return code <= -140 && code >= -159;
}

/**
 * @brief Check if error code is in transient transfer error range
 */
[[nodiscard]] constexpr auto is_transient_error(int32_t code) noexcept -> bool {
    return code <= -160 && code >= -179;
}

/**
 * @brief Check if error code is in permanent transfer error range
 */
[[nodiscard]] constexpr auto is_permanent_error(int32_t code) noexcept -> bool {
    return code <= -180 && code >= -199;
}

/**
 * @brief Check if error code is in tool invocation error range
 */
[[nodiscard]] constexpr auto is_tool_invocation_error(int32_t code) noexcept -> bool {
    return code <= -200 && code >= -219;
}

/**
 * @brief Check if error code is in staging error range
 */
[[nodiscard]] constexpr auto is_staging_error(int32_t code) noexcept -> bool {
    return code <= -220 && code >= -239;
}

/**
 * @brief Classify an error code into its error_kind
 */
[[nodiscard]] constexpr auto classify(error_code code) noexcept -> error_kind {
    const auto value = static_cast<int32_t>(code);
    if (code == error_code::success) return error_kind::none;
    if (code == error_code::cancelled) return error_kind::cancelled;
    if (is_descriptor_error(value)) return error_kind::invalid_descriptor;
    if (is_mode_error(value)) return error_kind::mode_unavailable;
    if (is_config_error(value)) return error_kind::configuration;
    if (is_transient_error(value)) return error_kind::transient;
    if (is_permanent_error(value)) return error_kind::permanent;
    if (is_tool_invocation_error(value)) return error_kind::tool_invocation;
    if (is_staging_error(value)) return error_kind::staging;
    return error_kind::internal;
}

/**
 * @brief Check if a failed descriptor with this error may be retried
 *
 * Staging i/o errors count as retryable: a full disk or a racing cleanup is
 * usually gone on the next attempt.
 */
[[nodiscard]] constexpr auto is_retryable(error_code code) noexcept -> bool {
    switch (classify(code)) {
        case error_kind::transient:
        case error_kind::staging:
            return true;
        default:
            return false;
    }
}

/**
 * @brief Check if the error aborts a batch before execution starts
 */
[[nodiscard]] constexpr auto is_batch_fatal(error_code code) noexcept -> bool {
    switch (classify(code)) {
        case error_kind::invalid_descriptor:
        case error_kind::mode_unavailable:
        case error_kind::configuration:
            return true;
        default:
            return false;
    }
}

}  // namespace kcenon::object_transfer

#endif  // KCENON_OBJECT_TRANSFER_CORE_ERROR_CODES_H
