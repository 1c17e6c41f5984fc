/**
 * @file capability_probe.h
 * @brief Discovers what the environment supports before mode selection
 */

#ifndef KCENON_OBJECT_TRANSFER_MODE_CAPABILITY_PROBE_H
#define KCENON_OBJECT_TRANSFER_MODE_CAPABILITY_PROBE_H

#include "mode_selector.h"

#include "kcenon/object_transfer/config/engine_config.h"
#include "kcenon/object_transfer/core/cancellation.h"
#include "kcenon/object_transfer/core/object_url.h"
#include "kcenon/object_transfer/execution/process_runner.h"
#include "kcenon/object_transfer/storage/object_store.h"

namespace kcenon::object_transfer {

class capability_probe {
public:
    /**
     * @brief Probe the bulk tool and the destination store
     *
     * - bulk_tool_available: `<tool> version` exits 0 within
     *   bulk_tool_config::probe_timeout.
     * - same_store_copy_supported: the destination is an object store URL of
     *   a family the tool can address, and its registered store client (if
     *   any) answers probe() for the destination bucket.
     *
     * Failures are reported as false flags, never as errors.
     */
    [[nodiscard]] static auto probe(const bulk_tool_config& tool,
                                    const object_store_registry& stores,
                                    const object_url& destination,
                                    process_runner_interface& runner,
                                    const cancellation_token& token = {})
        -> environment_capabilities;

    /**
     * @brief Run only the bulk tool version probe
     */
    [[nodiscard]] static auto tool_available(const bulk_tool_config& tool,
                                             process_runner_interface& runner,
                                             const cancellation_token& token = {}) -> bool;

    /**
     * @brief Whether the bulk tool can address a store family
     *
     * s3 always; gcs through its S3 interoperability endpoint, so an
     * endpoint_url must be configured.
     */
    [[nodiscard]] static auto tool_supports(const bulk_tool_config& tool,
                                            store_family family) -> bool;
};

}  // namespace kcenon::object_transfer

#endif  // KCENON_OBJECT_TRANSFER_MODE_CAPABILITY_PROBE_H
