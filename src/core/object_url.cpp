/**
 * @file object_url.cpp
 * @brief Object store and HTTP URL parsing
 */

#include "kcenon/object_transfer/core/object_url.h"

#include <algorithm>
#include <cctype>
#include <regex>

namespace kcenon::object_transfer {

namespace {

auto lowercase(std::string_view text) -> std::string {
    std::string out(text);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    return out;
}

auto strip_query(std::string_view path) -> std::string_view {
    auto pos = path.find_first_of("?#");
    return pos == std::string_view::npos ? path : path.substr(0, pos);
}

auto strip_slashes(std::string_view text) -> std::string_view {
    while (!text.empty() && text.front() == '/') text.remove_prefix(1);
    while (!text.empty() && text.back() == '/') text.remove_suffix(1);
    return text;
}

auto invalid(std::string_view raw, error_code code, const std::string& why)
    -> unexpected {
    return unexpected{error{code, "'" + std::string(raw) + "': " + why}};
}

auto make_store_url(std::string_view raw,
                    store_family family,
                    std::string_view bucket,
                    std::string_view key,
                    std::optional<std::string> region,
                    bool require_key) -> result<object_url> {
    if (bucket.empty()) {
        return invalid(raw, error_code::missing_bucket, "bucket name is empty");
    }
    if (!is_valid_bucket_name(bucket)) {
        return invalid(raw, error_code::invalid_url,
                       "invalid bucket name '" + std::string(bucket) + "'");
    }
    if (require_key && key.empty()) {
        return invalid(raw, error_code::missing_key, "object key is empty");
    }

    object_store_url url;
    url.store = family;
    url.bucket = std::string(bucket);
    url.key = std::string(key);
    url.region = std::move(region);
    return object_url{std::move(url)};
}

auto parse_amazonaws_host(std::string_view raw,
                          std::string_view host,
                          std::string_view path,
                          bool require_key) -> std::optional<result<object_url>> {
    // bucket.s3.amazonaws.com, bucket.s3.region.amazonaws.com,
    // bucket.s3-region.amazonaws.com
    static const std::regex virtual_hosted(
        R"(^(.+)\.s3(?:[.-]([a-z0-9-]+))?\.amazonaws\.com$)");
    // s3.amazonaws.com, s3.region.amazonaws.com, s3-region.amazonaws.com
    static const std::regex path_style(
        R"(^s3(?:[.-]([a-z0-9-]+))?\.amazonaws\.com$)");

    const std::string host_str(host);
    std::smatch match;

    auto region_of = [](const std::ssub_match& group) -> std::optional<std::string> {
        if (!group.matched) return std::nullopt;
        std::string value = group.str();
        if (value.empty() || value == "dualstack" || value == "accelerate") {
            return std::nullopt;
        }
        return value;
    };

    if (std::regex_match(host_str, match, path_style)) {
        auto trimmed = strip_slashes(path);
        auto slash = trimmed.find('/');
        auto bucket = trimmed.substr(0, slash);
        auto key = slash == std::string_view::npos ? std::string_view{}
                                                   : trimmed.substr(slash + 1);
        return make_store_url(raw, store_family::s3, bucket, key,
                              region_of(match[1]), require_key);
    }

    if (std::regex_match(host_str, match, virtual_hosted)) {
        return make_store_url(raw, store_family::s3, match[1].str(),
                              strip_slashes(path), region_of(match[2]),
                              require_key);
    }

    return std::nullopt;
}

}  // namespace

// ============================================================================
// object_store_url / http_url
// ============================================================================

auto object_store_url::to_string() const -> std::string {
    std::string out = kcenon::object_transfer::to_string(store);
    out += "://";
    out += bucket;
    if (!key.empty()) {
        out += '/';
        out += key;
    }
    return out;
}

auto http_url::path() const -> std::string {
    auto scheme_end = url.find("://");
    if (scheme_end == std::string::npos) {
        return {};
    }
    auto path_start = url.find('/', scheme_end + 3);
    if (path_start == std::string::npos) {
        return {};
    }
    return std::string(strip_slashes(strip_query(std::string_view(url).substr(path_start))));
}

// ============================================================================
// object_url
// ============================================================================

auto object_url::parse(std::string_view raw, bool require_key) -> result<object_url> {
    // Surrounding whitespace is an input artifact, not part of the identifier.
    while (!raw.empty() && std::isspace(static_cast<unsigned char>(raw.front()))) {
        raw.remove_prefix(1);
    }
    while (!raw.empty() && std::isspace(static_cast<unsigned char>(raw.back()))) {
        raw.remove_suffix(1);
    }

    if (raw.empty()) {
        return unexpected{error{error_code::invalid_url, "empty identifier"}};
    }

    auto scheme_end = raw.find("://");
    if (scheme_end == std::string_view::npos || scheme_end == 0) {
        return invalid(raw, error_code::invalid_url, "missing url scheme");
    }

    const auto scheme = lowercase(raw.substr(0, scheme_end));
    auto rest = raw.substr(scheme_end + 3);

    // Store keys may contain spaces; line breaks would split a command document
    if (rest.find_first_of("\t\r\n") != std::string_view::npos) {
        return invalid(raw, error_code::invalid_url, "control character inside url");
    }

    if (scheme == "s3" || scheme == "gs") {
        auto slash = rest.find('/');
        auto bucket = rest.substr(0, slash);
        auto key = slash == std::string_view::npos
                       ? std::string_view{}
                       : strip_slashes(rest.substr(slash + 1));
        return make_store_url(raw, scheme == "s3" ? store_family::s3 : store_family::gcs,
                              bucket, key, std::nullopt, require_key);
    }

    if (scheme == "http" || scheme == "https") {
        if (rest.find(' ') != std::string_view::npos) {
            return invalid(raw, error_code::invalid_url, "whitespace inside url");
        }
        auto slash = rest.find('/');
        auto host = lowercase(rest.substr(0, slash));
        auto path = slash == std::string_view::npos ? std::string_view{}
                                                    : strip_query(rest.substr(slash));

        // Drop an explicit port before matching the host.
        if (auto colon = host.find(':'); colon != std::string::npos) {
            host.erase(colon);
        }
        if (host.empty()) {
            return invalid(raw, error_code::invalid_url, "missing host");
        }

        if (auto store = parse_amazonaws_host(raw, host, path, require_key)) {
            return std::move(*store);
        }

        if (host == "storage.googleapis.com") {
            auto trimmed = strip_slashes(path);
            auto bucket_end = trimmed.find('/');
            auto bucket = trimmed.substr(0, bucket_end);
            auto key = bucket_end == std::string_view::npos
                           ? std::string_view{}
                           : trimmed.substr(bucket_end + 1);
            return make_store_url(raw, store_family::gcs, bucket, key,
                                  std::nullopt, require_key);
        }

        if (require_key && strip_slashes(path).empty()) {
            return invalid(raw, error_code::missing_key, "url has no object path");
        }
        return object_url{http_url{std::string(raw)}};
    }

    return invalid(raw, error_code::unsupported_scheme,
                   "unsupported scheme '" + scheme + "'");
}

auto object_url::family() const -> std::optional<store_family> {
    if (!is_object_store()) {
        return std::nullopt;
    }
    return store().store;
}

auto object_url::object_key() const -> std::string {
    if (is_object_store()) {
        return store().key;
    }
    return http().path();
}

auto object_url::to_string() const -> std::string {
    return std::visit([](const auto& url) { return url.to_string(); }, value_);
}

// ============================================================================
// Helpers
// ============================================================================

auto is_valid_bucket_name(std::string_view bucket) -> bool {
    if (bucket.size() < 3 || bucket.size() > 63) {
        return false;
    }
    auto alnum = [](char c) {
        return std::islower(static_cast<unsigned char>(c)) ||
               std::isdigit(static_cast<unsigned char>(c));
    };
    if (!alnum(bucket.front()) || !alnum(bucket.back())) {
        return false;
    }
    return std::all_of(bucket.begin(), bucket.end(), [&](char c) {
        return alnum(c) || c == '.' || c == '-';
    });
}

auto join_key(std::string_view prefix, std::string_view key) -> std::string {
    prefix = strip_slashes(prefix);
    key = strip_slashes(key);
    if (prefix.empty()) return std::string(key);
    if (key.empty()) return std::string(prefix);

    std::string out(prefix);
    out += '/';
    out += key;
    return out;
}

}  // namespace kcenon::object_transfer
