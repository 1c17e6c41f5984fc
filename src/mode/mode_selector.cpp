/**
 * @file mode_selector.cpp
 * @brief Mode selector implementation
 */

#include "kcenon/object_transfer/mode/mode_selector.h"

namespace kcenon::object_transfer {

auto mode_selector::all_same_store(std::span<const transfer_descriptor> descriptors,
                                   std::string* reason) -> bool {
    for (std::size_t i = 0; i < descriptors.size(); ++i) {
        const auto& desc = descriptors[i];
        auto source_family = desc.source().family();
        auto target_family = desc.destination().family();

        if (!source_family) {
            if (reason) {
                *reason = "descriptor #" + std::to_string(i) + " source " +
                          desc.source().to_string() + " is not an object store url";
            }
            return false;
        }
        if (!target_family || *source_family != *target_family) {
            if (reason) {
                *reason = "descriptor #" + std::to_string(i) +
                          " crosses store families";
            }
            return false;
        }
    }
    return true;
}

auto mode_selector::select(std::span<const transfer_descriptor> descriptors,
                           const environment_capabilities& capabilities,
                           transfer_mode requested) -> result<transfer_mode> {
    if (requested == transfer_mode::traditional) {
        return transfer_mode::traditional;
    }

    std::string reason;
    bool eligible = all_same_store(descriptors, &reason);
    if (eligible && !capabilities.bulk_tool_available) {
        eligible = false;
        reason = "bulk transfer tool is not available";
    }
    if (eligible && !capabilities.same_store_copy_supported) {
        eligible = false;
        reason = "destination store does not support direct copies";
    }

    if (eligible) {
        return transfer_mode::direct_sync;
    }

    if (requested == transfer_mode::direct_sync) {
        return unexpected{error{error_code::mode_unavailable,
            "direct_sync requested but " + reason}};
    }

    return transfer_mode::traditional;
}

}  // namespace kcenon::object_transfer
