/**
 * @file mode_selector.h
 * @brief Per-batch choice between direct sync and the traditional path
 */

#ifndef KCENON_OBJECT_TRANSFER_MODE_MODE_SELECTOR_H
#define KCENON_OBJECT_TRANSFER_MODE_MODE_SELECTOR_H

#include "kcenon/object_transfer/core/transfer_types.h"
#include "kcenon/object_transfer/core/types.h"

#include <span>
#include <string>

namespace kcenon::object_transfer {

/**
 * @brief What the environment can do, as reported by capability probing
 */
struct environment_capabilities {
    /// Destination store accepts server-side copies from the source family
    bool same_store_copy_supported = false;

    /// Bulk transfer tool responded to its version probe
    bool bulk_tool_available = false;

    [[nodiscard]] auto operator==(const environment_capabilities& other) const -> bool = default;
};

/**
 * @brief Resolves the transfer mode of a batch
 *
 * The decision is a pure function of its inputs and is uniform for the whole
 * batch. Only transfer_mode::automatic may downgrade to traditional; an
 * explicit direct_sync request that cannot be honoured fails with
 * error_code::mode_unavailable.
 */
class mode_selector {
public:
    /**
     * @brief Select a concrete mode
     * @param descriptors Batch descriptors
     * @param capabilities Environment capability flags
     * @param requested Caller's requested mode
     * @return direct_sync or traditional, never automatic
     */
    [[nodiscard]] static auto select(std::span<const transfer_descriptor> descriptors,
                                     const environment_capabilities& capabilities,
                                     transfer_mode requested = transfer_mode::automatic)
        -> result<transfer_mode>;

    /**
     * @brief Check whether every descriptor is a same-family store pair
     * @param descriptors Batch descriptors
     * @param reason Receives the first disqualifying descriptor, if any
     */
    [[nodiscard]] static auto all_same_store(std::span<const transfer_descriptor> descriptors,
                                             std::string* reason = nullptr) -> bool;
};

}  // namespace kcenon::object_transfer

#endif  // KCENON_OBJECT_TRANSFER_MODE_MODE_SELECTOR_H
