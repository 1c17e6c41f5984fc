/**
 * @file engine_config.cpp
 * @brief Configuration validation
 */

#include "kcenon/object_transfer/config/engine_config.h"

#include <cstdlib>

namespace kcenon::object_transfer {

auto s3_credentials::from_environment() -> std::optional<s3_credentials> {
    const char* key_id = std::getenv("AWS_ACCESS_KEY_ID");
    const char* secret = std::getenv("AWS_SECRET_ACCESS_KEY");
    if (!key_id || !secret || *key_id == '\0' || *secret == '\0') {
        return std::nullopt;
    }

    s3_credentials creds;
    creds.access_key_id = key_id;
    creds.secret_access_key = secret;
    if (const char* token = std::getenv("AWS_SESSION_TOKEN"); token && *token != '\0') {
        creds.session_token = token;
    }
    return creds;
}

auto engine_config::validate() const -> result<void> {
    if (tool.executable.empty()) {
        return unexpected{error{error_code::invalid_configuration,
            "bulk tool executable is empty"}};
    }
    if (tool.num_workers == 0) {
        return unexpected{error{error_code::invalid_configuration,
            "bulk tool worker count must be at least 1"}};
    }
    if (tool.invocation_timeout.count() <= 0) {
        return unexpected{error{error_code::invalid_configuration,
            "bulk tool invocation timeout must be positive"}};
    }
    if (commands.max_batch_size == 0) {
        return unexpected{error{error_code::invalid_batch_size,
            "max batch size must be at least 1"}};
    }
    if (commands.part_size_mb == 0) {
        return unexpected{error{error_code::invalid_configuration,
            "part size must be at least 1 MiB"}};
    }
    if (retry.max_attempts == 0) {
        return unexpected{error{error_code::invalid_configuration,
            "retry policy must allow at least one attempt"}};
    }
    if (retry.backoff_multiplier < 1.0) {
        return unexpected{error{error_code::invalid_configuration,
            "backoff multiplier must be >= 1.0"}};
    }
    if (staging.root.empty()) {
        return unexpected{error{error_code::invalid_configuration,
            "staging root is empty"}};
    }
    return {};
}

auto validate_options(const transfer_options& options) -> result<void> {
    if (options.max_batch_size == 0) {
        return unexpected{error{error_code::invalid_batch_size,
            "max batch size must be at least 1"}};
    }
    if (options.worker_count == 0) {
        return unexpected{error{error_code::invalid_worker_count,
            "worker count must be at least 1"}};
    }
    return {};
}

}  // namespace kcenon::object_transfer
