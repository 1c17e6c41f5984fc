/**
 * @file descriptor_builder.h
 * @brief Turns a transfer_request into normalized transfer descriptors
 */

#ifndef KCENON_OBJECT_TRANSFER_DESCRIPTOR_DESCRIPTOR_BUILDER_H
#define KCENON_OBJECT_TRANSFER_DESCRIPTOR_DESCRIPTOR_BUILDER_H

#include "kcenon/object_transfer/core/transfer_types.h"
#include "kcenon/object_transfer/core/types.h"

#include <vector>

namespace kcenon::object_transfer {

/**
 * @brief Builds (source, destination) pairs from raw identifiers
 *
 * The destination of each source is `<prefix key>/<source key>`, so the
 * archive's partition layout is preserved under the destination prefix.
 * Validation is fail-fast: the first malformed identifier aborts the whole
 * request with error_code::invalid_descriptor.
 */
class descriptor_builder {
public:
    /**
     * @brief Build descriptors in request order
     * @param request Sources and destination prefix
     * @return Descriptors, or an invalid_descriptor error naming the
     *         offending identifier
     */
    [[nodiscard]] static auto build(const transfer_request& request)
        -> result<std::vector<transfer_descriptor>>;

    /**
     * @brief Parse and validate a destination prefix
     *
     * The prefix must be an object store URL; its key may be empty.
     */
    [[nodiscard]] static auto parse_destination(const std::string& prefix)
        -> result<object_store_url>;
};

}  // namespace kcenon::object_transfer

#endif  // KCENON_OBJECT_TRANSFER_DESCRIPTOR_DESCRIPTOR_BUILDER_H
