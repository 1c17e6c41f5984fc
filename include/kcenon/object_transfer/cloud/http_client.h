/**
 * @file http_client.h
 * @brief HTTP seam used by the object store clients
 * @version 0.1.0
 *
 * s3_object_store and http_source only see http_client_interface, so tests
 * can answer requests from memory.
 */

#ifndef KCENON_OBJECT_TRANSFER_CLOUD_HTTP_CLIENT_H
#define KCENON_OBJECT_TRANSFER_CLOUD_HTTP_CLIENT_H

#include "kcenon/object_transfer/core/types.h"

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace kcenon::object_transfer {

using http_headers = std::map<std::string, std::string>;

/**
 * @brief HTTP response as seen by the store clients
 */
struct http_response {
    /// HTTP status code
    int status_code = 0;

    /// Response headers
    http_headers headers;

    /// Response body
    std::vector<uint8_t> body;

    /**
     * @brief Get body as string
     */
    [[nodiscard]] auto get_body_string() const -> std::string {
        return std::string(body.begin(), body.end());
    }

    /**
     * @brief Get header value by key (case-insensitive)
     */
    [[nodiscard]] auto get_header(const std::string& key) const
        -> std::optional<std::string> {
        auto it = headers.find(key);
        if (it != headers.end()) {
            return it->second;
        }

        auto lower = [](std::string value) {
            std::transform(value.begin(), value.end(), value.begin(),
                           [](unsigned char c) { return std::tolower(c); });
            return value;
        };
        const auto lower_key = lower(key);
        for (const auto& [k, v] : headers) {
            if (lower(k) == lower_key) {
                return v;
            }
        }
        return std::nullopt;
    }

    [[nodiscard]] auto is_success() const noexcept -> bool {
        return status_code >= 200 && status_code < 300;
    }

    [[nodiscard]] auto is_client_error() const noexcept -> bool {
        return status_code >= 400 && status_code < 500;
    }

    [[nodiscard]] auto is_server_error() const noexcept -> bool {
        return status_code >= 500 && status_code < 600;
    }
};

/**
 * @brief HTTP operations needed by the object store clients
 *
 * Implementations return an error only when no response was received
 * (connection failure, timeout). Any HTTP status, including 4xx and 5xx, is a
 * successful result carrying that status.
 */
class http_client_interface {
public:
    virtual ~http_client_interface() = default;

    /**
     * @brief Execute GET request
     */
    [[nodiscard]] virtual auto get(const std::string& url,
                                   const std::map<std::string, std::string>& query,
                                   const http_headers& headers)
        -> result<http_response> = 0;

    /**
     * @brief Execute PUT request with binary body
     */
    [[nodiscard]] virtual auto put(const std::string& url,
                                   const std::vector<uint8_t>& body,
                                   const http_headers& headers)
        -> result<http_response> = 0;

    /**
     * @brief Execute HEAD request
     */
    [[nodiscard]] virtual auto head(const std::string& url,
                                    const http_headers& headers)
        -> result<http_response> = 0;
};

/**
 * @brief Map an HTTP status to an object transfer error code
 *
 * 404 is object_not_found, 403 and 401 are access_denied, 429 and 503 are
 * throttled, other 5xx are service_unavailable and remaining 4xx are
 * permanent_failure. Success statuses map to error_code::success.
 */
[[nodiscard]] constexpr auto error_from_status(int status_code) noexcept -> error_code {
    if (status_code >= 200 && status_code < 300) return error_code::success;
    switch (status_code) {
        case 401:
        case 403:
            return error_code::access_denied;
        case 404:
            return error_code::object_not_found;
        case 408:
            return error_code::network_timeout;
        case 429:
        case 503:
            return error_code::throttled;
        default:
            break;
    }
    if (status_code >= 500) return error_code::service_unavailable;
    if (status_code >= 400) return error_code::permanent_failure;
    return error_code::transient_failure;
}

}  // namespace kcenon::object_transfer

#endif  // KCENON_OBJECT_TRANSFER_CLOUD_HTTP_CLIENT_H
