/**
 * @file http_source.h
 * @brief Plain HTTP(S) source for the traditional path
 * @version 0.1.0
 */

#ifndef KCENON_OBJECT_TRANSFER_STORAGE_HTTP_SOURCE_H
#define KCENON_OBJECT_TRANSFER_STORAGE_HTTP_SOURCE_H

#include "object_store.h"

#include "kcenon/object_transfer/cloud/http_client.h"

#include <filesystem>
#include <memory>

namespace kcenon::object_transfer {

/**
 * @brief Downloads objects addressed by an arbitrary http(s) URL
 *
 * HTTP URLs are read-only sources; they can never be a destination.
 */
class http_source {
public:
    explicit http_source(std::shared_ptr<http_client_interface> http);

    /**
     * @brief HEAD the URL
     */
    [[nodiscard]] auto head(const http_url& url) -> result<object_metadata>;

    /**
     * @brief GET the URL into a local file
     * @return Bytes written
     */
    [[nodiscard]] auto download(const http_url& url, const std::filesystem::path& target)
        -> result<uint64_t>;

private:
    std::shared_ptr<http_client_interface> http_;
};

}  // namespace kcenon::object_transfer

#endif  // KCENON_OBJECT_TRANSFER_STORAGE_HTTP_SOURCE_H
