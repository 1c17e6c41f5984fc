/**
 * @file object_url.h
 * @brief Object store and HTTP URL model
 * @version 0.1.0
 *
 * An object_url is either an object_store_url (store family, bucket, key) or
 * a plain http_url. Only object_store_url endpoints are eligible for a direct
 * store-to-store copy.
 */

#ifndef KCENON_OBJECT_TRANSFER_CORE_OBJECT_URL_H
#define KCENON_OBJECT_TRANSFER_CORE_OBJECT_URL_H

#include "types.h"

#include <optional>
#include <string>
#include <string_view>
#include <variant>

namespace kcenon::object_transfer {

/**
 * @brief Object store family
 *
 * Direct copies are only possible between endpoints of the same family.
 */
enum class store_family {
    s3,
    gcs,
};

[[nodiscard]] constexpr auto to_string(store_family family) -> const char* {
    switch (family) {
        case store_family::s3: return "s3";
        case store_family::gcs: return "gs";
        default: return "unknown";
    }
}

/**
 * @brief Location of an object inside an object store
 */
struct object_store_url {
    store_family store = store_family::s3;
    std::string bucket;
    std::string key;

    /// Region when the URL names one (AWS virtual-hosted or path-style hosts)
    std::optional<std::string> region;

    /**
     * @brief Render as scheme://bucket/key
     */
    [[nodiscard]] auto to_string() const -> std::string;

    [[nodiscard]] auto operator==(const object_store_url& other) const -> bool = default;
};

/**
 * @brief Plain HTTP(S) location, downloadable but never a copy endpoint
 */
struct http_url {
    std::string url;

    /// URL path without the leading slash and without query or fragment
    [[nodiscard]] auto path() const -> std::string;

    [[nodiscard]] auto to_string() const -> std::string { return url; }

    [[nodiscard]] auto operator==(const http_url& other) const -> bool = default;
};

/**
 * @brief Tagged object location
 */
class object_url {
public:
    object_url(object_store_url url) : value_(std::move(url)) {}
    object_url(http_url url) : value_(std::move(url)) {}

    /**
     * @brief Parse a raw identifier
     *
     * Accepted forms:
     * - s3://bucket/key, gs://bucket/key
     * - https://bucket.s3[.region].amazonaws.com/key
     * - https://s3[.region].amazonaws.com/bucket/key
     * - any other http(s)://host/path (becomes an http_url)
     *
     * @param raw Raw identifier
     * @param require_key Reject store URLs without an object key
     * @return Parsed URL or an invalid_url / unsupported_scheme /
     *         missing_bucket / missing_key error
     */
    [[nodiscard]] static auto parse(std::string_view raw, bool require_key = true)
        -> result<object_url>;

    [[nodiscard]] auto is_object_store() const noexcept -> bool {
        return std::holds_alternative<object_store_url>(value_);
    }

    [[nodiscard]] auto is_http() const noexcept -> bool {
        return std::holds_alternative<http_url>(value_);
    }

    /// @pre is_object_store()
    [[nodiscard]] auto store() const -> const object_store_url& {
        return std::get<object_store_url>(value_);
    }

    /// @pre is_http()
    [[nodiscard]] auto http() const -> const http_url& {
        return std::get<http_url>(value_);
    }

    /**
     * @brief Store family for object store URLs, nullopt for HTTP URLs
     */
    [[nodiscard]] auto family() const -> std::optional<store_family>;

    /**
     * @brief Object key for store URLs, URL path for HTTP URLs
     */
    [[nodiscard]] auto object_key() const -> std::string;

    [[nodiscard]] auto to_string() const -> std::string;

    [[nodiscard]] auto operator==(const object_url& other) const -> bool = default;

private:
    std::variant<object_store_url, http_url> value_;
};

/**
 * @brief Check whether a bucket name is acceptable (3-63 chars, lowercase
 *        letters, digits, dots and hyphens, alphanumeric at both ends)
 */
[[nodiscard]] auto is_valid_bucket_name(std::string_view bucket) -> bool;

/**
 * @brief Join two key segments with a single '/', dropping empty segments
 */
[[nodiscard]] auto join_key(std::string_view prefix, std::string_view key) -> std::string;

}  // namespace kcenon::object_transfer

#endif  // KCENON_OBJECT_TRANSFER_CORE_OBJECT_URL_H
