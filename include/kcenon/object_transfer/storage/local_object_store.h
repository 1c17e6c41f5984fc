/**
 * @file local_object_store.h
 * @brief Filesystem-backed object store
 * @version 0.1.0
 *
 * Maps bucket "b" and key "k" to <root>/b/k. Used for development without a
 * real store and as the backing store of the test fixtures.
 */

#ifndef KCENON_OBJECT_TRANSFER_STORAGE_LOCAL_OBJECT_STORE_H
#define KCENON_OBJECT_TRANSFER_STORAGE_LOCAL_OBJECT_STORE_H

#include "object_store.h"

#include <filesystem>
#include <memory>

namespace kcenon::object_transfer {

class local_object_store : public object_store_interface {
public:
    /**
     * @brief Create a store rooted at a directory
     * @param root Directory holding one subdirectory per bucket
     * @param family Store family this instance answers for
     */
    explicit local_object_store(std::filesystem::path root,
                                store_family family = store_family::s3);

    [[nodiscard]] auto family() const -> store_family override { return family_; }
    [[nodiscard]] auto name() const -> std::string_view override { return "local"; }

    [[nodiscard]] auto probe(const std::string& bucket) -> result<void> override;
    [[nodiscard]] auto head(const object_store_url& url) -> result<object_metadata> override;
    [[nodiscard]] auto download(const object_store_url& url,
                                const std::filesystem::path& target)
        -> result<uint64_t> override;
    [[nodiscard]] auto upload(const std::filesystem::path& source,
                              const object_store_url& url)
        -> result<uint64_t> override;

    /**
     * @brief Store-side copy between two objects (no local staging)
     * @return Bytes copied
     */
    [[nodiscard]] auto copy(const object_store_url& source,
                            const object_store_url& destination) -> result<uint64_t>;

    /**
     * @brief Write an object from memory
     */
    [[nodiscard]] auto put(const object_store_url& url, std::string_view content)
        -> result<uint64_t>;

    /**
     * @brief Create a bucket directory
     */
    [[nodiscard]] auto create_bucket(const std::string& bucket) -> result<void>;

    /**
     * @brief Filesystem path of an object
     */
    [[nodiscard]] auto path_for(const object_store_url& url) const -> std::filesystem::path;

    [[nodiscard]] auto root() const -> const std::filesystem::path& { return root_; }

private:
    [[nodiscard]] auto check_bucket(const std::string& bucket) const -> result<void>;

    std::filesystem::path root_;
    store_family family_;
};

}  // namespace kcenon::object_transfer

#endif  // KCENON_OBJECT_TRANSFER_STORAGE_LOCAL_OBJECT_STORE_H
