/**
 * @file capability_probe.cpp
 * @brief Environment capability probing
 */

#include "kcenon/object_transfer/mode/capability_probe.h"

#include "kcenon/object_transfer/command/batch_command_generator.h"
#include "kcenon/object_transfer/core/logging.h"

namespace kcenon::object_transfer {

auto capability_probe::tool_available(const bulk_tool_config& tool,
                                      process_runner_interface& runner,
                                      const cancellation_token& token) -> bool {
    process_spec spec;
    spec.argv = batch_command_generator(tool, command_options{}).probe_argv();
    spec.timeout = tool.probe_timeout;
    spec.kill_grace = tool.kill_grace;

    std::string version;
    auto outcome = runner.run(
        spec,
        [&version](output_stream stream, std::string_view line) {
            if (stream == output_stream::standard_output && version.empty()) {
                version = std::string(line);
            }
        },
        token);

    if (!outcome) {
        OT_LOG_INFO(log_category::mode,
                    "bulk tool unavailable: " + outcome.error().message);
        return false;
    }
    if (!outcome.value().succeeded()) {
        OT_LOG_INFO(log_category::mode,
                    "bulk tool version probe failed with exit code " +
                    std::to_string(outcome.value().exit_code));
        return false;
    }

    OT_LOG_DEBUG(log_category::mode, "bulk tool available: " + version);
    return true;
}

auto capability_probe::tool_supports(const bulk_tool_config& tool, store_family family)
    -> bool {
    switch (family) {
        case store_family::s3:
            return true;
        case store_family::gcs:
            return tool.endpoint_url.has_value();
        default:
            return false;
    }
}

auto capability_probe::probe(const bulk_tool_config& tool,
                             const object_store_registry& stores,
                             const object_url& destination,
                             process_runner_interface& runner,
                             const cancellation_token& token) -> environment_capabilities {
    environment_capabilities caps;
    caps.bulk_tool_available = tool_available(tool, runner, token);

    if (!destination.is_object_store()) {
        return caps;
    }

    const auto& target = destination.store();
    if (!tool_supports(tool, target.store)) {
        OT_LOG_INFO(log_category::mode,
                    std::string("bulk tool cannot address ") + to_string(target.store) +
                    ":// without an endpoint");
        return caps;
    }

    auto store = stores.find(target.store);
    if (!store) {
        // The tool is the only client for this family
        caps.same_store_copy_supported = true;
        return caps;
    }

    auto reachable = store->probe(target.bucket);
    if (!reachable) {
        OT_LOG_INFO(log_category::mode,
                    "destination bucket " + target.bucket + " not reachable: " +
                    reachable.error().message);
        return caps;
    }

    caps.same_store_copy_supported = true;
    return caps;
}

}  // namespace kcenon::object_transfer
