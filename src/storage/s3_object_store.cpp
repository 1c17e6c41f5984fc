/**
 * @file s3_object_store.cpp
 * @brief S3 object store client implementation
 * @version 0.1.0
 */

#include "kcenon/object_transfer/storage/s3_object_store.h"

#include "kcenon/object_transfer/cloud/cloud_utils.h"
#include "kcenon/object_transfer/config/feature_flags.h"
#include "kcenon/object_transfer/core/logging.h"

#include "file_io.h"

#include <algorithm>
#include <cctype>
#include <sstream>

namespace kcenon::object_transfer {

using cloud_utils::bytes_to_hex;
using cloud_utils::hmac_sha256;
using cloud_utils::sha256;
using cloud_utils::url_encode;

namespace {

/// Largest object accepted by a single PUT
constexpr uint64_t max_single_put_bytes = 5ULL * 1024 * 1024 * 1024;

struct endpoint_parts {
    std::string scheme;
    std::string authority;
};

auto parse_endpoint(const std::string& endpoint) -> endpoint_parts {
    endpoint_parts parts;
    auto scheme_end = endpoint.find("://");
    std::string rest = endpoint;
    if (scheme_end != std::string::npos) {
        parts.scheme = endpoint.substr(0, scheme_end);
        rest = endpoint.substr(scheme_end + 3);
    } else {
        parts.scheme = "https";
    }
    auto slash = rest.find('/');
    parts.authority = slash == std::string::npos ? rest : rest.substr(0, slash);
    return parts;
}

auto response_error(const http_response& response, const std::string& what) -> error {
    auto code = error_from_status(response.status_code);
    auto body = response.get_body_string();
    auto s3_code = cloud_utils::extract_xml_element(body, "Code");

    if (s3_code) {
        if (*s3_code == "NoSuchBucket") {
            code = error_code::bucket_not_found;
        } else if (*s3_code == "SlowDown") {
            code = error_code::throttled;
        } else if (*s3_code == "RequestTimeout") {
            code = error_code::network_timeout;
        }
    }

    std::string message = what + ": HTTP " + std::to_string(response.status_code);
    if (s3_code) {
        message += " " + *s3_code;
    }
    if (auto detail = cloud_utils::extract_xml_element(body, "Message")) {
        message += " (" + *detail + ")";
    }
    return error{code, message};
}

}  // namespace

s3_object_store::s3_object_store(s3_store_config config,
                                 std::shared_ptr<http_client_interface> http,
                                 store_family family)
    : config_(std::move(config)), http_(std::move(http)), family_(family) {
#if !OBJECT_TRANS_HAS_REQUEST_SIGNING
    if (config_.credentials) {
        OT_LOG_WARN(log_category::storage,
                    "request signing is not built in; S3 requests will be anonymous");
    }
#endif
}

auto s3_object_store::region_for(const object_store_url& url) const -> std::string {
    return url.region.value_or(config_.region);
}

auto s3_object_store::target_for(const std::string& bucket, const std::string& key,
                                 const std::string& region) const -> s3_request_target {
    std::string scheme;
    std::string host;
    bool path_style = config_.use_path_style;

    if (config_.endpoint) {
        auto parts = parse_endpoint(*config_.endpoint);
        scheme = parts.scheme;
        host = parts.authority;
        if (!path_style) {
            host = bucket + "." + host;
        }
    } else if (family_ == store_family::gcs) {
        scheme = "https";
        host = "storage.googleapis.com";
        path_style = true;
    } else {
        scheme = config_.use_ssl ? "https" : "http";
        // Dotted bucket names break the wildcard certificate of virtual hosts.
        if (bucket.find('.') != std::string::npos) {
            path_style = true;
        }
        host = path_style ? "s3." + region + ".amazonaws.com"
                          : bucket + ".s3." + region + ".amazonaws.com";
    }

    std::string path = path_style ? "/" + bucket + "/" + key : "/" + key;
    if (path_style && key.empty()) {
        path = "/" + bucket;
    }

    s3_request_target target;
    target.canonical_uri = url_encode(path, false);
    target.host = host;
    target.url = scheme + "://" + host + target.canonical_uri;
    return target;
}

auto s3_object_store::request_headers(const std::string& method,
                                      const s3_request_target& target,
                                      const std::string& payload_hash,
                                      const std::string& region,
                                      std::chrono::system_clock::time_point now) const
    -> http_headers {
    http_headers headers;

    if (!config_.credentials) {
        return headers;
    }
    const auto& creds = *config_.credentials;

    std::string amz_date = cloud_utils::format_iso8601_basic(now);
    std::string date_stamp = cloud_utils::format_date_stamp(now);

    headers["Host"] = target.host;
    headers["x-amz-date"] = amz_date;
    headers["x-amz-content-sha256"] = payload_hash;

    if (creds.session_token) {
        headers["x-amz-security-token"] = *creds.session_token;
    }

#if OBJECT_TRANS_HAS_REQUEST_SIGNING
    // Canonical headers, sorted by lowercase key
    std::map<std::string, std::string> sorted_headers;
    for (const auto& [k, v] : headers) {
        std::string lower_key = k;
        std::transform(lower_key.begin(), lower_key.end(), lower_key.begin(),
                       [](unsigned char c) { return std::tolower(c); });
        sorted_headers[lower_key] = v;
    }

    std::ostringstream canonical_headers;
    std::ostringstream signed_headers_builder;
    bool first = true;
    for (const auto& [k, v] : sorted_headers) {
        canonical_headers << k << ":" << v << "\n";
        if (!first) signed_headers_builder << ";";
        signed_headers_builder << k;
        first = false;
    }
    std::string signed_headers = signed_headers_builder.str();

    std::ostringstream canonical_request;
    canonical_request << method << "\n";
    canonical_request << target.canonical_uri << "\n";
    canonical_request << "\n";
    canonical_request << canonical_headers.str() << "\n";
    canonical_request << signed_headers << "\n";
    canonical_request << payload_hash;

    std::string algorithm = "AWS4-HMAC-SHA256";
    std::string credential_scope = date_stamp + "/" + region + "/s3/aws4_request";

    std::ostringstream string_to_sign;
    string_to_sign << algorithm << "\n";
    string_to_sign << amz_date << "\n";
    string_to_sign << credential_scope << "\n";
    string_to_sign << bytes_to_hex(sha256(canonical_request.str()));

    auto k_date = hmac_sha256("AWS4" + creds.secret_access_key, date_stamp);
    auto k_region = hmac_sha256(k_date, region);
    auto k_service = hmac_sha256(k_region, "s3");
    auto k_signing = hmac_sha256(k_service, "aws4_request");
    auto signature = hmac_sha256(k_signing, string_to_sign.str());

    std::ostringstream auth_header;
    auth_header << algorithm << " ";
    auth_header << "Credential=" << creds.access_key_id << "/" << credential_scope << ", ";
    auth_header << "SignedHeaders=" << signed_headers << ", ";
    auth_header << "Signature=" << bytes_to_hex(signature);

    headers["Authorization"] = auth_header.str();
#else
    (void)method;
    (void)region;
#endif

    return headers;
}

auto s3_object_store::probe(const std::string& bucket) -> result<void> {
    const auto& region = config_.region;
    auto target = target_for(bucket, "", region);
    auto headers = request_headers("HEAD", target, bytes_to_hex(sha256("")), region,
                                   std::chrono::system_clock::now());

    auto response = http_->head(target.url, headers);
    if (!response) {
        return unexpected{response.error()};
    }
    const auto& r = response.value();
    // A bucket in another region answers 301 with its region header.
    if (r.is_success() || r.status_code == 301) {
        return {};
    }
    if (r.status_code == 404) {
        return unexpected{error{error_code::bucket_not_found, "Bucket not found: " + bucket}};
    }
    return unexpected{response_error(r, "HEAD bucket " + bucket)};
}

auto s3_object_store::head(const object_store_url& url) -> result<object_metadata> {
    auto region = region_for(url);
    auto target = target_for(url.bucket, url.key, region);
    auto headers = request_headers("HEAD", target, bytes_to_hex(sha256("")), region,
                                   std::chrono::system_clock::now());

    auto response = http_->head(target.url, headers);
    if (!response) {
        return unexpected{response.error()};
    }
    const auto& r = response.value();
    if (!r.is_success()) {
        return unexpected{response_error(r, "HEAD " + url.to_string())};
    }

    object_metadata meta;
    meta.key = url.key;
    if (auto length = r.get_header("Content-Length")) {
        try {
            meta.size = std::stoull(*length);
        } catch (const std::exception&) {
            meta.size = 0;
        }
    }
    meta.etag = r.get_header("ETag");
    meta.content_type = r.get_header("Content-Type");
    return meta;
}

auto s3_object_store::download(const object_store_url& url,
                               const std::filesystem::path& target_path)
    -> result<uint64_t> {
    auto region = region_for(url);
    auto target = target_for(url.bucket, url.key, region);
    auto headers = request_headers("GET", target, bytes_to_hex(sha256("")), region,
                                   std::chrono::system_clock::now());

    auto response = http_->get(target.url, {}, headers);
    if (!response) {
        return unexpected{response.error()};
    }
    const auto& r = response.value();
    if (!r.is_success()) {
        return unexpected{response_error(r, "GET " + url.to_string())};
    }

    if (auto length = r.get_header("Content-Length")) {
        try {
            if (std::stoull(*length) != r.body.size()) {
                return unexpected{error{error_code::transient_failure,
                    "GET " + url.to_string() + ": truncated response body"}};
            }
        } catch (const std::exception&) {
            OT_LOG_DEBUG(log_category::storage,
                         "ignoring malformed Content-Length: " + *length);
        }
    }

    return detail::write_file(target_path, r.body);
}

auto s3_object_store::upload(const std::filesystem::path& source,
                             const object_store_url& url)
    -> result<uint64_t> {
    auto data = detail::read_file(source);
    if (!data) {
        return unexpected{data.error()};
    }
    const auto& body = data.value();
    if (body.size() > max_single_put_bytes) {
        return unexpected{error{error_code::invalid_object,
            url.to_string() + ": object exceeds the single PUT limit"}};
    }

    auto region = region_for(url);
    auto target = target_for(url.bucket, url.key, region);
    auto payload_hash = bytes_to_hex(cloud_utils::sha256_bytes(body));
    auto headers = request_headers("PUT", target, payload_hash, region,
                                   std::chrono::system_clock::now());
    headers["Content-Type"] = cloud_utils::detect_content_type(url.key);

    auto response = http_->put(target.url, body, headers);
    if (!response) {
        return unexpected{response.error()};
    }
    const auto& r = response.value();
    if (!r.is_success()) {
        return unexpected{response_error(r, "PUT " + url.to_string())};
    }
    return static_cast<uint64_t>(body.size());
}

}  // namespace kcenon::object_transfer
