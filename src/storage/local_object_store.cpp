/**
 * @file local_object_store.cpp
 * @brief Filesystem-backed object store implementation
 */

#include "kcenon/object_transfer/storage/local_object_store.h"

#include "kcenon/object_transfer/core/logging.h"

#include <fstream>

namespace kcenon::object_transfer {

namespace {

// Keys must stay inside their bucket directory.
auto is_safe_key(const std::string& key) -> bool {
    if (key.empty() || key.front() == '/') {
        return false;
    }
    for (const auto& part : std::filesystem::path(key)) {
        if (part == "..") {
            return false;
        }
    }
    return true;
}

auto copy_into(const std::filesystem::path& from, const std::filesystem::path& to)
    -> result<uint64_t> {
    std::error_code ec;
    auto size = std::filesystem::file_size(from, ec);
    if (ec) {
        return unexpected{error{error_code::staging_io_error,
            "Failed to get file size: " + from.string()}};
    }

    auto parent = to.parent_path();
    if (!parent.empty() && !std::filesystem::exists(parent, ec)) {
        std::filesystem::create_directories(parent, ec);
        if (ec) {
            return unexpected{error{error_code::staging_io_error,
                "Failed to create directory: " + ec.message()}};
        }
    }

    std::filesystem::copy_file(from, to,
        std::filesystem::copy_options::overwrite_existing, ec);
    if (ec) {
        return unexpected{error{error_code::staging_io_error,
            "Failed to copy file: " + ec.message()}};
    }
    return static_cast<uint64_t>(size);
}

}  // namespace

local_object_store::local_object_store(std::filesystem::path root, store_family family)
    : root_(std::move(root)), family_(family) {}

auto local_object_store::path_for(const object_store_url& url) const -> std::filesystem::path {
    return root_ / url.bucket / url.key;
}

auto local_object_store::check_bucket(const std::string& bucket) const -> result<void> {
    std::error_code ec;
    if (!std::filesystem::is_directory(root_ / bucket, ec) || ec) {
        return unexpected{error{error_code::bucket_not_found,
            "Bucket not found: " + bucket}};
    }
    return {};
}

auto local_object_store::probe(const std::string& bucket) -> result<void> {
    return check_bucket(bucket);
}

auto local_object_store::head(const object_store_url& url) -> result<object_metadata> {
    if (auto bucket = check_bucket(url.bucket); !bucket) {
        return unexpected{bucket.error()};
    }
    if (!is_safe_key(url.key)) {
        return unexpected{error{error_code::invalid_object, "Invalid key: " + url.key}};
    }

    auto path = path_for(url);
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec) || ec) {
        return unexpected{error{error_code::object_not_found,
            "Object not found: " + url.to_string()}};
    }

    auto size = std::filesystem::file_size(path, ec);
    if (ec) {
        return unexpected{error{error_code::transient_failure,
            "Failed to get file size: " + url.to_string()}};
    }

    object_metadata meta;
    meta.key = url.key;
    meta.size = size;
    return meta;
}

auto local_object_store::download(const object_store_url& url,
                                  const std::filesystem::path& target)
    -> result<uint64_t> {
    if (auto meta = head(url); !meta) {
        return unexpected{meta.error()};
    }
    return copy_into(path_for(url), target);
}

auto local_object_store::upload(const std::filesystem::path& source,
                                const object_store_url& url)
    -> result<uint64_t> {
    if (auto bucket = check_bucket(url.bucket); !bucket) {
        return unexpected{bucket.error()};
    }
    if (!is_safe_key(url.key)) {
        return unexpected{error{error_code::invalid_object, "Invalid key: " + url.key}};
    }

    std::error_code ec;
    if (!std::filesystem::is_regular_file(source, ec) || ec) {
        return unexpected{error{error_code::staging_io_error,
            "Source file not found: " + source.string()}};
    }
    return copy_into(source, path_for(url));
}

auto local_object_store::copy(const object_store_url& source,
                              const object_store_url& destination) -> result<uint64_t> {
    if (auto meta = head(source); !meta) {
        return unexpected{meta.error()};
    }
    if (auto bucket = check_bucket(destination.bucket); !bucket) {
        return unexpected{bucket.error()};
    }
    if (!is_safe_key(destination.key)) {
        return unexpected{error{error_code::invalid_object,
            "Invalid key: " + destination.key}};
    }
    return copy_into(path_for(source), path_for(destination));
}

auto local_object_store::put(const object_store_url& url, std::string_view content)
    -> result<uint64_t> {
    if (auto bucket = check_bucket(url.bucket); !bucket) {
        return unexpected{bucket.error()};
    }
    if (!is_safe_key(url.key)) {
        return unexpected{error{error_code::invalid_object, "Invalid key: " + url.key}};
    }

    auto path = path_for(url);
    std::error_code ec;
    std::filesystem::create_directories(path.parent_path(), ec);
    if (ec) {
        return unexpected{error{error_code::staging_io_error,
            "Failed to create directory: " + ec.message()}};
    }

    std::ofstream file(path, std::ios::binary | std::ios::trunc);
    if (!file) {
        return unexpected{error{error_code::staging_io_error,
            "Failed to open file for writing: " + path.string()}};
    }
    file.write(content.data(), static_cast<std::streamsize>(content.size()));
    if (!file) {
        return unexpected{error{error_code::staging_io_error,
            "Failed to write file: " + path.string()}};
    }
    return static_cast<uint64_t>(content.size());
}

auto local_object_store::create_bucket(const std::string& bucket) -> result<void> {
    if (!is_valid_bucket_name(bucket)) {
        return unexpected{error{error_code::missing_bucket, "Invalid bucket name: " + bucket}};
    }
    std::error_code ec;
    std::filesystem::create_directories(root_ / bucket, ec);
    if (ec) {
        return unexpected{error{error_code::staging_io_error,
            "Failed to create bucket directory: " + ec.message()}};
    }
    OT_LOG_DEBUG(log_category::storage, "created local bucket " + bucket);
    return {};
}

}  // namespace kcenon::object_transfer
