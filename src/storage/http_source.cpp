/**
 * @file http_source.cpp
 * @brief Plain HTTP(S) source implementation
 */

#include "kcenon/object_transfer/storage/http_source.h"

#include "file_io.h"

namespace kcenon::object_transfer {

http_source::http_source(std::shared_ptr<http_client_interface> http)
    : http_(std::move(http)) {}

auto http_source::head(const http_url& url) -> result<object_metadata> {
    if (!http_) {
        return unexpected{error{error_code::not_initialized, "no HTTP client configured"}};
    }

    auto response = http_->head(url.url, {});
    if (!response) {
        return unexpected{response.error()};
    }
    const auto& r = response.value();
    if (!r.is_success()) {
        return unexpected{error{error_from_status(r.status_code),
            "HEAD " + url.url + ": HTTP " + std::to_string(r.status_code)}};
    }

    object_metadata meta;
    meta.key = url.path();
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

auto http_source::download(const http_url& url, const std::filesystem::path& target)
    -> result<uint64_t> {
    if (!http_) {
        return unexpected{error{error_code::not_initialized, "no HTTP client configured"}};
    }

    auto response = http_->get(url.url, {}, {});
    if (!response) {
        return unexpected{response.error()};
    }
    const auto& r = response.value();
    if (!r.is_success()) {
        return unexpected{error{error_from_status(r.status_code),
            "GET " + url.url + ": HTTP " + std::to_string(r.status_code)}};
    }
    return detail::write_file(target, r.body);
}

}  // namespace kcenon::object_transfer
