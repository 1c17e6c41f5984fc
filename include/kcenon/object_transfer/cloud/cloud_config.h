/**
 * @file cloud_config.h
 * @brief Object store client configuration types
 * @version 0.1.0
 *
 * Retry policy shared by the executor and the store clients, plus the S3
 * client configuration used on the traditional path.
 */

#ifndef KCENON_OBJECT_TRANSFER_CLOUD_CLOUD_CONFIG_H
#define KCENON_OBJECT_TRANSFER_CLOUD_CLOUD_CONFIG_H

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

namespace kcenon::object_transfer {

/**
 * @brief Retry policy for transfer operations
 *
 * max_attempts counts the first try, so a policy with max_attempts = 4
 * allows three retries.
 */
struct cloud_retry_policy {
    /// Maximum number of attempts including the first
    std::size_t max_attempts = 4;

    /// Initial delay between retries
    std::chrono::milliseconds initial_delay{1000};

    /// Maximum delay between retries
    std::chrono::milliseconds max_delay{30000};

    /// Multiplier for exponential backoff
    double backoff_multiplier = 2.0;

    /// Add jitter to retry delays
    bool use_jitter = true;

    /**
     * @brief Policy allowing the given number of retries
     */
    [[nodiscard]] static auto with_retries(std::size_t retries) -> cloud_retry_policy {
        cloud_retry_policy policy;
        policy.max_attempts = retries + 1;
        return policy;
    }
};

/**
 * @brief Static S3 credentials
 */
struct s3_credentials {
    std::string access_key_id;
    std::string secret_access_key;
    std::optional<std::string> session_token;

    /**
     * @brief Read AWS_ACCESS_KEY_ID, AWS_SECRET_ACCESS_KEY and AWS_SESSION_TOKEN
     * @return Credentials, or nullopt when the key pair is not set
     */
    [[nodiscard]] static auto from_environment() -> std::optional<s3_credentials>;
};

/**
 * @brief S3 (or S3-compatible) object store client configuration
 */
struct s3_store_config {
    /// Signing region
    std::string region = "us-east-1";

    /// Custom endpoint URL (MinIO and other S3-compatible stores)
    std::optional<std::string> endpoint;

    /// Use path-style URLs (vs virtual-hosted style)
    bool use_path_style = false;

    /// Enable SSL/TLS for the default AWS endpoint
    bool use_ssl = true;

    /// Credentials; anonymous requests when empty
    std::optional<s3_credentials> credentials;

    /// Request timeout
    std::chrono::milliseconds request_timeout{60000};
};

/**
 * @brief Fluent builder for s3_store_config
 */
class s3_store_config_builder {
public:
    auto with_region(const std::string& region) -> s3_store_config_builder& {
        config_.region = region;
        return *this;
    }

    auto with_endpoint(const std::string& endpoint) -> s3_store_config_builder& {
        config_.endpoint = endpoint;
        return *this;
    }

    auto with_path_style(bool enable) -> s3_store_config_builder& {
        config_.use_path_style = enable;
        return *this;
    }

    auto with_ssl(bool enable) -> s3_store_config_builder& {
        config_.use_ssl = enable;
        return *this;
    }

    auto with_credentials(s3_credentials credentials) -> s3_store_config_builder& {
        config_.credentials = std::move(credentials);
        return *this;
    }

    auto with_environment_credentials() -> s3_store_config_builder& {
        config_.credentials = s3_credentials::from_environment();
        return *this;
    }

    auto with_request_timeout(std::chrono::milliseconds timeout) -> s3_store_config_builder& {
        config_.request_timeout = timeout;
        return *this;
    }

    [[nodiscard]] auto build() const -> s3_store_config { return config_; }

private:
    s3_store_config config_;
};

}  // namespace kcenon::object_transfer

#endif  // KCENON_OBJECT_TRANSFER_CLOUD_CLOUD_CONFIG_H
