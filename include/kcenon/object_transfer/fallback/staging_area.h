/**
 * @file staging_area.h
 * @brief Scoped local staging directories for the traditional path
 * @version 0.1.0
 *
 * Every descriptor on the traditional path gets its own directory under the
 * staging root. A staging_lease owns that directory and removes it when it
 * goes out of scope, on success, failure, cancellation or exception alike.
 *
 * @code
 * auto lease = staging.acquire("a.zip");
 * if (!lease) return unexpected{lease.error()};
 * auto file = lease.value().file();
 * // download into file, upload from file; the directory is removed here
 * @endcode
 */

#ifndef KCENON_OBJECT_TRANSFER_FALLBACK_STAGING_AREA_H
#define KCENON_OBJECT_TRANSFER_FALLBACK_STAGING_AREA_H

#include "kcenon/object_transfer/config/engine_config.h"
#include "kcenon/object_transfer/core/types.h"

#include <atomic>
#include <cstddef>
#include <filesystem>
#include <memory>
#include <string>
#include <string_view>

namespace kcenon::object_transfer {

/**
 * @brief Owns one staging directory
 *
 * Move-only. The directory and everything in it is removed on destruction.
 */
class staging_lease {
public:
    staging_lease(std::filesystem::path directory, std::string file_name,
                  std::shared_ptr<std::atomic<std::size_t>> active);
    ~staging_lease();

    staging_lease(const staging_lease&) = delete;
    staging_lease& operator=(const staging_lease&) = delete;
    staging_lease(staging_lease&& other) noexcept;
    staging_lease& operator=(staging_lease&& other) noexcept;

    [[nodiscard]] auto directory() const -> const std::filesystem::path& { return directory_; }

    /**
     * @brief Path of the staged object file inside the directory
     */
    [[nodiscard]] auto file() const -> std::filesystem::path { return directory_ / file_name_; }

    /**
     * @brief Remove the directory now
     */
    void release() noexcept;

private:
    std::filesystem::path directory_;
    std::string file_name_;
    std::shared_ptr<std::atomic<std::size_t>> active_;
};

/**
 * @brief Hands out unique per-descriptor staging directories
 *
 * Thread-safe.
 */
class staging_area {
public:
    explicit staging_area(staging_config config = {});

    /**
     * @brief Create a fresh staging directory
     * @param object_name Name hint for the staged file (last key segment)
     * @return Lease, or staging_create_failed
     */
    [[nodiscard]] auto acquire(std::string_view object_name) -> result<staging_lease>;

    /**
     * @brief Leases currently alive
     */
    [[nodiscard]] auto active_leases() const noexcept -> std::size_t {
        return active_->load(std::memory_order_acquire);
    }

    [[nodiscard]] auto root() const -> const std::filesystem::path& { return config_.root; }

private:
    staging_config config_;
    std::atomic<std::size_t> sequence_{0};
    std::shared_ptr<std::atomic<std::size_t>> active_;
};

}  // namespace kcenon::object_transfer

#endif  // KCENON_OBJECT_TRANSFER_FALLBACK_STAGING_AREA_H
