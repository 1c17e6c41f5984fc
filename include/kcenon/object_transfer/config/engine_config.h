/**
 * @file engine_config.h
 * @brief Configuration for the transfer engine
 * @version 0.1.0
 *
 * Configuration is plain structs with defaults. Loading from files or the
 * command line is left to the embedding application.
 */

#ifndef KCENON_OBJECT_TRANSFER_CONFIG_ENGINE_CONFIG_H
#define KCENON_OBJECT_TRANSFER_CONFIG_ENGINE_CONFIG_H

#include "kcenon/object_transfer/cloud/cloud_config.h"
#include "kcenon/object_transfer/core/transfer_types.h"
#include "kcenon/object_transfer/core/types.h"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

namespace kcenon::object_transfer {

/**
 * @brief External bulk transfer tool (s5cmd) invocation settings
 */
struct bulk_tool_config {
    /// Executable name or path, resolved through PATH
    std::string executable = "s5cmd";

    /// Pass --no-sign-request (public source buckets)
    bool no_sign_request = true;

    /// Custom endpoint (--endpoint-url), e.g. a MinIO deployment
    std::optional<std::string> endpoint_url;

    /// Tool-side parallelism (--numworkers)
    std::size_t num_workers = 10;

    /// Tool-internal retries (--retry-count); engine retries are separate
    std::size_t tool_retry_count = 0;

    /// Tool log level (--log); empty leaves the tool default
    std::string log_level;

    /// Timeout for a single tool invocation
    std::chrono::milliseconds invocation_timeout{std::chrono::minutes(30)};

    /// Timeout for the availability probe
    std::chrono::milliseconds probe_timeout{5000};

    /// Grace period between SIGTERM and SIGKILL
    std::chrono::milliseconds kill_grace{2000};
};

/**
 * @brief Copy directive verb
 */
enum class directive_verb {
    cp,    ///< cp --if-size-differ
    sync,  ///< sync --size-only
};

/**
 * @brief Directive rendering options
 */
struct command_options {
    /// Maximum directives per command document
    std::size_t max_batch_size = 1000;

    /// Multipart chunk size in MiB (--part-size)
    std::size_t part_size_mb = 50;

    /// Skip objects whose destination already matches by size
    bool conditional_copy = true;

    /// Source region hint when the source URL does not carry one
    std::optional<std::string> default_source_region;

    directive_verb verb = directive_verb::cp;
};

/**
 * @brief Local staging area settings for the traditional path
 */
struct staging_config {
    /// Parent directory of the per-descriptor stages
    std::filesystem::path root =
        std::filesystem::temp_directory_path() / "object_trans_staging";
};

/**
 * @brief Complete engine configuration
 */
struct engine_config {
    bulk_tool_config tool;
    command_options commands;
    cloud_retry_policy retry;
    staging_config staging;

    /**
     * @brief Validate the configuration
     * @return invalid_configuration (or a more specific code) on failure
     */
    [[nodiscard]] auto validate() const -> result<void>;
};

/**
 * @brief Validate per-request options
 */
[[nodiscard]] auto validate_options(const transfer_options& options) -> result<void>;

}  // namespace kcenon::object_transfer

#endif  // KCENON_OBJECT_TRANSFER_CONFIG_ENGINE_CONFIG_H
