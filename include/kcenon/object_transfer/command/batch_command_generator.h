/**
 * @file batch_command_generator.h
 * @brief Renders direct-sync descriptors into bulk tool command documents
 * @version 0.1.0
 *
 * Command documents use the s5cmd `run` grammar, one directive per line:
 *
 * @code
 * cp --if-size-differ --part-size 50 --source-region ap-northeast-1 's3://src/a.zip' 's3://dst/a.zip'
 * @endcode
 *
 * Each document is bounded by command_options::max_batch_size and keeps the
 * descriptor order, so result lines can be correlated by position when the
 * tool does not echo identifiers.
 */

#ifndef KCENON_OBJECT_TRANSFER_COMMAND_BATCH_COMMAND_GENERATOR_H
#define KCENON_OBJECT_TRANSFER_COMMAND_BATCH_COMMAND_GENERATOR_H

#include "kcenon/object_transfer/config/engine_config.h"
#include "kcenon/object_transfer/core/transfer_types.h"
#include "kcenon/object_transfer/core/types.h"

#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace kcenon::object_transfer {

class batch_command_generator {
public:
    batch_command_generator(bulk_tool_config tool, command_options options);

    /**
     * @brief Render all descriptors
     * @param descriptors Batch descriptors; every one must be a same-family
     *        object store pair
     * @return Documents covering indices [0, descriptors.size()) in order
     */
    [[nodiscard]] auto generate(std::span<const transfer_descriptor> descriptors) const
        -> result<std::vector<command_document>>;

    /**
     * @brief Render a subset of descriptors (used for retry rounds)
     * @param descriptors All batch descriptors
     * @param indices Batch indices to render, in the order given
     */
    [[nodiscard]] auto generate_for(std::span<const transfer_descriptor> descriptors,
                                    std::span<const std::size_t> indices) const
        -> result<std::vector<command_document>>;

    /**
     * @brief Render a whole-prefix mirror as a single `sync` directive
     *
     * @code
     * sync --size-only --include '*.zip' --delete 's3://src/klines/*' 's3://dst/klines/'
     * @endcode
     *
     * The document lists no descriptors; objects are discovered from the
     * tool's result lines.
     */
    [[nodiscard]] auto generate_prefix_sync(const prefix_sync_request& request) const
        -> result<command_document>;

    /**
     * @brief Render one directive line (without trailing newline)
     */
    [[nodiscard]] auto render_directive(const transfer_descriptor& descriptor) const
        -> std::string;

    /**
     * @brief Tool argv for a `run` invocation reading directives from stdin
     */
    [[nodiscard]] auto run_argv() const -> std::vector<std::string>;

    /**
     * @brief Tool argv for the availability probe
     */
    [[nodiscard]] auto probe_argv() const -> std::vector<std::string>;

    /**
     * @brief Region hint for a descriptor's source, if one can be derived
     */
    [[nodiscard]] auto source_region(const transfer_descriptor& descriptor) const
        -> std::optional<std::string>;

    /**
     * @brief Quote a URL for the run grammar
     */
    [[nodiscard]] static auto quote(std::string_view value) -> std::string;

    [[nodiscard]] auto options() const -> const command_options& { return options_; }
    [[nodiscard]] auto tool() const -> const bulk_tool_config& { return tool_; }

private:
    bulk_tool_config tool_;
    command_options options_;
};

}  // namespace kcenon::object_transfer

#endif  // KCENON_OBJECT_TRANSFER_COMMAND_BATCH_COMMAND_GENERATOR_H
