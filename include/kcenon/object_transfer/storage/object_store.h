/**
 * @file object_store.h
 * @brief Object store abstraction for the traditional transfer path
 * @version 0.1.0
 *
 * The traditional path moves each object through a local stage: download from
 * the source store, then upload to the destination store. Store access goes
 * through object_store_interface, looked up per store family in an
 * object_store_registry.
 */

#ifndef KCENON_OBJECT_TRANSFER_STORAGE_OBJECT_STORE_H
#define KCENON_OBJECT_TRANSFER_STORAGE_OBJECT_STORE_H

#include "kcenon/object_transfer/core/object_url.h"
#include "kcenon/object_transfer/core/types.h"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace kcenon::object_transfer {

/**
 * @brief Object metadata returned by head()
 */
struct object_metadata {
    std::string key;
    uint64_t size = 0;
    std::optional<std::string> etag;
    std::optional<std::string> content_type;
};

/**
 * @brief Access to one object store family
 *
 * Errors use the transfer error ranges so callers can retry transient
 * failures (throttled, service_unavailable, connection_failed) and fail
 * permanent ones (object_not_found, access_denied, bucket_not_found) at once.
 *
 * @note Implementations must be safe to call from several traditional-path
 *       workers at the same time.
 */
class object_store_interface {
public:
    virtual ~object_store_interface() = default;

    /**
     * @brief Store family served by this client
     */
    [[nodiscard]] virtual auto family() const -> store_family = 0;

    /**
     * @brief Human-readable backend name for logs
     */
    [[nodiscard]] virtual auto name() const -> std::string_view = 0;

    /**
     * @brief Check that the bucket is reachable
     */
    [[nodiscard]] virtual auto probe(const std::string& bucket) -> result<void> = 0;

    /**
     * @brief Fetch object metadata
     */
    [[nodiscard]] virtual auto head(const object_store_url& url) -> result<object_metadata> = 0;

    /**
     * @brief Download an object to a local file
     * @return Bytes written
     */
    [[nodiscard]] virtual auto download(const object_store_url& url,
                                        const std::filesystem::path& target)
        -> result<uint64_t> = 0;

    /**
     * @brief Upload a local file as an object
     * @return Bytes uploaded
     */
    [[nodiscard]] virtual auto upload(const std::filesystem::path& source,
                                      const object_store_url& url)
        -> result<uint64_t> = 0;
};

/**
 * @brief Store clients keyed by store family
 *
 * Populated once while building the engine and read-only afterwards.
 */
class object_store_registry {
public:
    /**
     * @brief Register a store, replacing any previous one for its family
     */
    void add(std::shared_ptr<object_store_interface> store) {
        if (store) {
            const auto family = store->family();
            stores_[family] = std::move(store);
        }
    }

    [[nodiscard]] auto find(store_family family) const
        -> std::shared_ptr<object_store_interface> {
        auto it = stores_.find(family);
        return it == stores_.end() ? nullptr : it->second;
    }

    /**
     * @brief Store for a family, or store_not_registered
     */
    [[nodiscard]] auto get(store_family family) const
        -> result<std::shared_ptr<object_store_interface>> {
        if (auto store = find(family)) {
            return store;
        }
        return unexpected{error{error_code::store_not_registered,
            std::string("no object store registered for ") + to_string(family) + "://"}};
    }

    [[nodiscard]] auto empty() const noexcept -> bool { return stores_.empty(); }
    [[nodiscard]] auto size() const noexcept -> std::size_t { return stores_.size(); }

private:
    std::map<store_family, std::shared_ptr<object_store_interface>> stores_;
};

}  // namespace kcenon::object_transfer

#endif  // KCENON_OBJECT_TRANSFER_STORAGE_OBJECT_STORE_H
