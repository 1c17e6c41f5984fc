/**
 * @file cloud_http_client.cpp
 * @brief HTTP client adapter implementation
 * @version 0.1.0
 */

#include "kcenon/object_transfer/cloud/cloud_http_client.h"

#include "kcenon/object_transfer/config/feature_flags.h"

#if KCENON_WITH_NETWORK_SYSTEM
#include <kcenon/network/core/http_client.h>
#endif

namespace kcenon::object_transfer {

namespace {

[[maybe_unused]] auto unavailable() -> unexpected {
    return unexpected{error{error_code::not_initialized,
        "HTTP client not available (KCENON_WITH_NETWORK_SYSTEM not defined)"}};
}

}  // namespace

// ============================================================================
// Implementation
// ============================================================================

struct cloud_http_client::impl {
#if KCENON_WITH_NETWORK_SYSTEM
    std::shared_ptr<kcenon::network::core::http_client> client;
#endif
    bool available = false;

    explicit impl(std::chrono::milliseconds timeout) {
#if KCENON_WITH_NETWORK_SYSTEM
        client = std::make_shared<kcenon::network::core::http_client>(timeout);
        available = true;
#else
        (void)timeout;
        available = false;
#endif
    }

#if KCENON_WITH_NETWORK_SYSTEM
    static auto convert_response(
        const kcenon::network::internal::http_response& resp) -> http_response {
        http_response converted;
        converted.status_code = resp.status_code;
        converted.headers = resp.headers;
        converted.body = std::vector<uint8_t>(resp.body.begin(), resp.body.end());
        return converted;
    }

    template <typename Response>
    static auto finish(Response&& response, const char* method, const std::string& url)
        -> result<http_response> {
        if (response.is_err()) {
            return unexpected{error{error_code::connection_failed,
                std::string("HTTP ") + method + " " + url + " failed"}};
        }
        return convert_response(response.value());
    }
#endif
};

// ============================================================================
// Constructor / Destructor
// ============================================================================

cloud_http_client::cloud_http_client(std::chrono::milliseconds timeout)
    : impl_(std::make_unique<impl>(timeout)) {}

cloud_http_client::~cloud_http_client() = default;

cloud_http_client::cloud_http_client(cloud_http_client&&) noexcept = default;
auto cloud_http_client::operator=(cloud_http_client&&) noexcept
    -> cloud_http_client& = default;

// ============================================================================
// HTTP Operations
// ============================================================================

auto cloud_http_client::get(const std::string& url,
                            const std::map<std::string, std::string>& query,
                            const http_headers& headers)
    -> result<http_response> {
#if KCENON_WITH_NETWORK_SYSTEM
    return impl::finish(impl_->client->get(url, query, headers), "GET", url);
#else
    (void)url;
    (void)query;
    (void)headers;
    return unavailable();
#endif
}

auto cloud_http_client::put(const std::string& url,
                            const std::vector<uint8_t>& body,
                            const http_headers& headers)
    -> result<http_response> {
#if KCENON_WITH_NETWORK_SYSTEM
    std::string body_str(body.begin(), body.end());
    return impl::finish(impl_->client->put(url, body_str, headers), "PUT", url);
#else
    (void)url;
    (void)body;
    (void)headers;
    return unavailable();
#endif
}

auto cloud_http_client::head(const std::string& url, const http_headers& headers)
    -> result<http_response> {
#if KCENON_WITH_NETWORK_SYSTEM
    return impl::finish(impl_->client->head(url, headers), "HEAD", url);
#else
    (void)url;
    (void)headers;
    return unavailable();
#endif
}

auto cloud_http_client::is_available() const noexcept -> bool {
    return impl_->available;
}

// ============================================================================
// Factory Function
// ============================================================================

auto make_cloud_http_client(std::chrono::milliseconds timeout)
    -> std::shared_ptr<cloud_http_client> {
    return std::make_shared<cloud_http_client>(timeout);
}

}  // namespace kcenon::object_transfer
