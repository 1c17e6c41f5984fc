/**
 * @file batch_command_generator.cpp
 * @brief Batch command generator implementation
 */

#include "kcenon/object_transfer/command/batch_command_generator.h"

#include "kcenon/object_transfer/core/logging.h"

#include <algorithm>
#include <numeric>
#include <sstream>

namespace kcenon::object_transfer {

batch_command_generator::batch_command_generator(bulk_tool_config tool,
                                                 command_options options)
    : tool_(std::move(tool)), options_(std::move(options)) {}

auto batch_command_generator::quote(std::string_view value) -> std::string {
    std::string out;
    out.reserve(value.size() + 2);
    out += '\'';
    for (char c : value) {
        if (c == '\'') {
            out += "'\\''";
        } else {
            out += c;
        }
    }
    out += '\'';
    return out;
}

auto batch_command_generator::source_region(const transfer_descriptor& descriptor) const
    -> std::optional<std::string> {
    if (descriptor.source().is_object_store() && descriptor.source().store().region) {
        return descriptor.source().store().region;
    }
    return options_.default_source_region;
}

auto batch_command_generator::render_directive(const transfer_descriptor& descriptor) const
    -> std::string {
    std::ostringstream line;

    if (options_.verb == directive_verb::sync) {
        line << "sync";
        if (options_.conditional_copy) {
            line << " --size-only";
        }
    } else {
        line << "cp";
        if (options_.conditional_copy) {
            line << " --if-size-differ";
        }
        line << " --part-size " << options_.part_size_mb;
    }

    if (auto region = source_region(descriptor)) {
        line << " --source-region " << *region;
    }

    line << ' ' << quote(descriptor.source().to_string())
         << ' ' << quote(descriptor.destination().to_string());
    return line.str();
}

auto batch_command_generator::run_argv() const -> std::vector<std::string> {
    std::vector<std::string> argv{tool_.executable};

    if (tool_.no_sign_request) {
        argv.emplace_back("--no-sign-request");
    }
    if (tool_.endpoint_url) {
        argv.emplace_back("--endpoint-url");
        argv.push_back(*tool_.endpoint_url);
    }
    if (!tool_.log_level.empty()) {
        argv.emplace_back("--log");
        argv.push_back(tool_.log_level);
    }
    argv.emplace_back("--numworkers");
    argv.push_back(std::to_string(tool_.num_workers));
    argv.emplace_back("--retry-count");
    argv.push_back(std::to_string(tool_.tool_retry_count));
    argv.emplace_back("run");
    return argv;
}

auto batch_command_generator::probe_argv() const -> std::vector<std::string> {
    return {tool_.executable, "version"};
}

auto batch_command_generator::generate(std::span<const transfer_descriptor> descriptors) const
    -> result<std::vector<command_document>> {
    std::vector<std::size_t> indices(descriptors.size());
    std::iota(indices.begin(), indices.end(), std::size_t{0});
    return generate_for(descriptors, indices);
}

auto batch_command_generator::generate_for(std::span<const transfer_descriptor> descriptors,
                                           std::span<const std::size_t> indices) const
    -> result<std::vector<command_document>> {
    if (options_.max_batch_size == 0) {
        return unexpected{error{error_code::invalid_batch_size,
            "max batch size must be at least 1"}};
    }

    for (auto index : indices) {
        if (index >= descriptors.size()) {
            return unexpected{error{error_code::internal_error,
                "descriptor index " + std::to_string(index) + " out of range"}};
        }
        const auto& desc = descriptors[index];
        if (!desc.source().is_object_store() || !desc.destination().is_object_store() ||
            desc.source().store().store != desc.destination().store().store) {
            return unexpected{error{error_code::store_family_mismatch,
                "descriptor #" + std::to_string(index) +
                " cannot be expressed as a direct copy"}};
        }
    }

    const auto argv = run_argv();
    std::vector<command_document> documents;
    documents.reserve((indices.size() + options_.max_batch_size - 1) / options_.max_batch_size);

    for (std::size_t start = 0; start < indices.size(); start += options_.max_batch_size) {
        const auto end = std::min(indices.size(), start + options_.max_batch_size);

        command_document doc;
        doc.argv = argv;
        doc.sequence = documents.size() + 1;
        doc.descriptor_indices.assign(indices.begin() + static_cast<std::ptrdiff_t>(start),
                                      indices.begin() + static_cast<std::ptrdiff_t>(end));

        std::string text;
        for (auto index : doc.descriptor_indices) {
            text += render_directive(descriptors[index]);
            text += '\n';
        }
        doc.text = std::move(text);

        documents.push_back(std::move(doc));
    }

    OT_LOG_DEBUG(log_category::command,
                 "rendered " + std::to_string(indices.size()) + " directives into " +
                 std::to_string(documents.size()) + " command documents");
    return documents;
}

auto batch_command_generator::generate_prefix_sync(const prefix_sync_request& request) const
    -> result<command_document> {
    auto source = object_url::parse(request.source_prefix, false);
    if (!source.has_value()) {
        return unexpected{source.error()};
    }
    auto destination = object_url::parse(request.destination_prefix, false);
    if (!destination.has_value()) {
        return unexpected{destination.error()};
    }

    const auto& src = source.value();
    const auto& dst = destination.value();
    if (!src.is_object_store() || !dst.is_object_store() ||
        src.store().store != dst.store().store) {
        return unexpected{error{error_code::store_family_mismatch,
            "prefix sync needs two prefixes in the same object store family"}};
    }

    std::ostringstream line;
    line << "sync";
    if (options_.conditional_copy) {
        line << " --size-only";
    }

    auto append_patterns = [&line](std::string_view flag,
                                   const std::vector<std::string>& patterns) -> bool {
        for (const auto& pattern : patterns) {
            if (pattern.empty() || pattern.find_first_of("\r\n") != std::string::npos) {
                return false;
            }
            line << ' ' << flag << ' ' << quote(pattern);
        }
        return true;
    };
    if (!append_patterns("--include", request.include_patterns) ||
        !append_patterns("--exclude", request.exclude_patterns)) {
        return unexpected{error{error_code::invalid_configuration,
            "sync filter patterns must be non-empty single-line wildcards"}};
    }

    if (request.delete_extraneous) {
        line << " --delete";
    }

    auto region = src.store().region ? src.store().region : options_.default_source_region;
    if (region) {
        line << " --source-region " << *region;
    }

    line << ' ' << quote(src.store().to_string() + "/*")
         << ' ' << quote(dst.store().to_string() + "/");

    command_document doc;
    doc.argv = run_argv();
    doc.sequence = 1;
    doc.text = line.str() + "\n";

    OT_LOG_DEBUG(log_category::command,
                 "rendered prefix sync " + src.to_string() + " -> " + dst.to_string());
    return doc;
}

}  // namespace kcenon::object_transfer
