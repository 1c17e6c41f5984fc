/**
 * @file s3_object_store.h
 * @brief S3 (and S3-compatible) object store client
 * @version 0.1.0
 *
 * Whole-object GET/PUT/HEAD over http_client_interface. Requests are signed
 * with AWS Signature Version 4 when credentials are configured and the build
 * has request signing; otherwise they are sent anonymously, which is enough
 * for public source buckets.
 *
 * @code
 * auto config = s3_store_config_builder()
 *     .with_region("ap-northeast-1")
 *     .with_environment_credentials()
 *     .build();
 * auto store = std::make_shared<s3_object_store>(config, make_cloud_http_client());
 * @endcode
 */

#ifndef KCENON_OBJECT_TRANSFER_STORAGE_S3_OBJECT_STORE_H
#define KCENON_OBJECT_TRANSFER_STORAGE_S3_OBJECT_STORE_H

#include "object_store.h"

#include "kcenon/object_transfer/cloud/cloud_config.h"
#include "kcenon/object_transfer/cloud/http_client.h"

#include <chrono>
#include <memory>
#include <string>

namespace kcenon::object_transfer {

/**
 * @brief Resolved request location for one bucket/key
 */
struct s3_request_target {
    /// Full request URL with the key percent-encoded
    std::string url;

    /// Host header value (including a non-default port)
    std::string host;

    /// Canonical URI used for signing
    std::string canonical_uri;
};

class s3_object_store : public object_store_interface {
public:
    /**
     * @param config Region, endpoint and credentials
     * @param http HTTP transport
     * @param family Store family served; gs:// can be served through the GCS
     *        XML interoperability endpoint with family = store_family::gcs
     */
    s3_object_store(s3_store_config config,
                    std::shared_ptr<http_client_interface> http,
                    store_family family = store_family::s3);

    [[nodiscard]] auto family() const -> store_family override { return family_; }
    [[nodiscard]] auto name() const -> std::string_view override { return "s3"; }

    [[nodiscard]] auto probe(const std::string& bucket) -> result<void> override;
    [[nodiscard]] auto head(const object_store_url& url) -> result<object_metadata> override;
    [[nodiscard]] auto download(const object_store_url& url,
                                const std::filesystem::path& target)
        -> result<uint64_t> override;
    [[nodiscard]] auto upload(const std::filesystem::path& source,
                              const object_store_url& url)
        -> result<uint64_t> override;

    /**
     * @brief Build the request location for an object (empty key for the bucket)
     */
    [[nodiscard]] auto target_for(const std::string& bucket, const std::string& key,
                                  const std::string& region) const -> s3_request_target;

    /**
     * @brief Build request headers, including SigV4 authorization when possible
     * @param method HTTP method
     * @param target Request location
     * @param payload_hash Hex SHA-256 of the body or "UNSIGNED-PAYLOAD"
     * @param region Signing region
     * @param now Signing time
     */
    [[nodiscard]] auto request_headers(const std::string& method,
                                       const s3_request_target& target,
                                       const std::string& payload_hash,
                                       const std::string& region,
                                       std::chrono::system_clock::time_point now) const
        -> http_headers;

    [[nodiscard]] auto config() const -> const s3_store_config& { return config_; }

private:
    [[nodiscard]] auto region_for(const object_store_url& url) const -> std::string;

    s3_store_config config_;
    std::shared_ptr<http_client_interface> http_;
    store_family family_;
};

}  // namespace kcenon::object_transfer

#endif  // KCENON_OBJECT_TRANSFER_STORAGE_S3_OBJECT_STORE_H
