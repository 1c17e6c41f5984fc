/**
 * @file traditional_transfer.h
 * @brief Download-then-upload transfer of a single descriptor
 * @version 0.1.0
 *
 * The traditional path is the universal fallback: any source the engine can
 * read (object store or plain HTTP) to any registered destination store,
 * through a local stage. It costs two operations and two network transfers
 * per object where a direct sync costs one of each.
 */

#ifndef KCENON_OBJECT_TRANSFER_FALLBACK_TRADITIONAL_TRANSFER_H
#define KCENON_OBJECT_TRANSFER_FALLBACK_TRADITIONAL_TRANSFER_H

#include "staging_area.h"

#include "kcenon/object_transfer/cloud/cloud_config.h"
#include "kcenon/object_transfer/core/cancellation.h"
#include "kcenon/object_transfer/core/transfer_types.h"
#include "kcenon/object_transfer/storage/http_source.h"
#include "kcenon/object_transfer/storage/object_store.h"

#include <functional>
#include <memory>

namespace kcenon::object_transfer {

/**
 * @brief Called with a status=retried snapshot before each retry wait
 */
using retry_callback = std::function<void(const transfer_result&)>;

class traditional_transfer {
public:
    /**
     * @param stores Store clients by family
     * @param http HTTP source for http(s) URLs; may be null when no request
     *        has HTTP sources
     * @param staging Staging area shared by all workers
     * @param retry Per-step retry policy
     */
    traditional_transfer(std::shared_ptr<const object_store_registry> stores,
                         std::shared_ptr<http_source> http,
                         std::shared_ptr<staging_area> staging,
                         cloud_retry_policy retry);

    /**
     * @brief Move one object through a local stage
     *
     * Download and upload are retried independently for retryable errors. A
     * failed upload never repeats a completed download. The stage is removed
     * before this returns.
     *
     * @param index Batch index of the descriptor
     * @param descriptor Descriptor to transfer
     * @param token Cancellation; a cancelled transfer fails with
     *        error_code::cancelled
     * @param on_retry Optional retry notification
     * @return Terminal result (success or failed)
     */
    [[nodiscard]] auto transfer(std::size_t index,
                                const transfer_descriptor& descriptor,
                                const cancellation_token& token,
                                const retry_callback& on_retry = {}) const
        -> transfer_result;

    [[nodiscard]] auto retry_policy() const -> const cloud_retry_policy& { return retry_; }

private:
    std::shared_ptr<const object_store_registry> stores_;
    std::shared_ptr<http_source> http_;
    std::shared_ptr<staging_area> staging_;
    cloud_retry_policy retry_;
};

}  // namespace kcenon::object_transfer

#endif  // KCENON_OBJECT_TRANSFER_FALLBACK_TRADITIONAL_TRANSFER_H
