/**
 * @file descriptor_builder.cpp
 * @brief Descriptor builder implementation
 */

#include "kcenon/object_transfer/descriptor/descriptor_builder.h"

#include "kcenon/object_transfer/core/logging.h"

namespace kcenon::object_transfer {

auto descriptor_builder::parse_destination(const std::string& prefix)
    -> result<object_store_url> {
    auto parsed = object_url::parse(prefix, /*require_key=*/false);
    if (!parsed) {
        return unexpected{error{error_code::invalid_descriptor,
            "invalid destination prefix " + parsed.error().message}};
    }
    if (!parsed.value().is_object_store()) {
        return unexpected{error{error_code::invalid_descriptor,
            "destination prefix '" + prefix + "' is not an object store url"}};
    }
    return parsed.value().store();
}

auto descriptor_builder::build(const transfer_request& request)
    -> result<std::vector<transfer_descriptor>> {
    auto destination = parse_destination(request.destination_prefix);
    if (!destination) {
        OT_LOG_ERROR(log_category::descriptor, destination.error().message);
        return unexpected{destination.error()};
    }
    const auto& prefix = destination.value();

    std::vector<transfer_descriptor> descriptors;
    descriptors.reserve(request.sources.size());

    for (std::size_t i = 0; i < request.sources.size(); ++i) {
        const auto& entry = request.sources[i];

        auto source = object_url::parse(entry.identifier);
        if (!source) {
            auto message = "source #" + std::to_string(i) + " rejected: " +
                           source.error().message;
            OT_LOG_ERROR(log_category::descriptor, message);
            return unexpected{error{error_code::invalid_descriptor, message}};
        }

        auto key = source.value().object_key();
        if (key.empty()) {
            auto message = "source #" + std::to_string(i) + " '" +
                           entry.identifier + "' has no object key";
            OT_LOG_ERROR(log_category::descriptor, message);
            return unexpected{error{error_code::invalid_descriptor, message}};
        }

        object_store_url target;
        target.store = prefix.store;
        target.bucket = prefix.bucket;
        target.key = join_key(prefix.key, key);
        target.region = prefix.region;

        descriptors.emplace_back(std::move(source.value()),
                                 object_url{std::move(target)},
                                 entry.size_hint);
    }

    OT_LOG_DEBUG(log_category::descriptor,
                 "built " + std::to_string(descriptors.size()) +
                 " descriptors for " + prefix.to_string());
    return descriptors;
}

}  // namespace kcenon::object_transfer
