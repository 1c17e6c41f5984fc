/**
 * @file cloud_http_client.h
 * @brief HTTP client adapter over network_system
 * @version 0.1.0
 *
 * Wraps the network_system HTTP client for use by s3_object_store and
 * http_source. Without network_system every request fails with
 * error_code::not_initialized, so the traditional path reports a permanent
 * failure instead of retrying.
 */

#ifndef KCENON_OBJECT_TRANSFER_CLOUD_CLOUD_HTTP_CLIENT_H
#define KCENON_OBJECT_TRANSFER_CLOUD_CLOUD_HTTP_CLIENT_H

#include "http_client.h"

#include <chrono>
#include <memory>

// Forward declaration for network_system HTTP client
namespace kcenon::network::core {
class http_client;
}

namespace kcenon::object_transfer {

/**
 * @brief network_system backed http_client_interface
 *
 * @note This client is thread-safe for concurrent operations.
 */
class cloud_http_client : public http_client_interface {
public:
    /**
     * @brief Construct HTTP client with timeout
     * @param timeout Request timeout duration
     */
    explicit cloud_http_client(
        std::chrono::milliseconds timeout = std::chrono::milliseconds(30000));

    ~cloud_http_client() override;

    cloud_http_client(const cloud_http_client&) = delete;
    auto operator=(const cloud_http_client&) -> cloud_http_client& = delete;
    cloud_http_client(cloud_http_client&&) noexcept;
    auto operator=(cloud_http_client&&) noexcept -> cloud_http_client&;

    [[nodiscard]] auto get(const std::string& url,
                           const std::map<std::string, std::string>& query,
                           const http_headers& headers)
        -> result<http_response> override;

    [[nodiscard]] auto put(const std::string& url,
                           const std::vector<uint8_t>& body,
                           const http_headers& headers)
        -> result<http_response> override;

    [[nodiscard]] auto head(const std::string& url,
                            const http_headers& headers)
        -> result<http_response> override;

    /**
     * @brief Check if the HTTP client is available
     * @return true if network system is available, false otherwise
     */
    [[nodiscard]] auto is_available() const noexcept -> bool;

private:
    struct impl;
    std::unique_ptr<impl> impl_;
};

/**
 * @brief Factory function to create cloud HTTP client
 * @param timeout Request timeout
 */
[[nodiscard]] auto make_cloud_http_client(
    std::chrono::milliseconds timeout = std::chrono::milliseconds(30000))
    -> std::shared_ptr<cloud_http_client>;

}  // namespace kcenon::object_transfer

#endif  // KCENON_OBJECT_TRANSFER_CLOUD_CLOUD_HTTP_CLIENT_H
