/**
 * @file transfer_types.h
 * @brief Shared data model of the transfer engine
 */

#ifndef KCENON_OBJECT_TRANSFER_CORE_TRANSFER_TYPES_H
#define KCENON_OBJECT_TRANSFER_CORE_TRANSFER_TYPES_H

#include "object_url.h"
#include "types.h"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace kcenon::object_transfer {

/**
 * @brief How a batch moves its objects
 */
enum class transfer_mode {
    automatic,    ///< Resolved to direct_sync or traditional before execution
    direct_sync,  ///< Store-to-store copy through the bulk tool
    traditional,  ///< Download to local stage, then upload
};

[[nodiscard]] constexpr auto to_string(transfer_mode mode) -> const char* {
    switch (mode) {
        case transfer_mode::automatic: return "auto";
        case transfer_mode::direct_sync: return "direct_sync";
        case transfer_mode::traditional: return "traditional";
        default: return "unknown";
    }
}

/**
 * @brief Per-descriptor outcome status
 *
 * success and failed are terminal. retried only appears on attempt events
 * emitted while a descriptor waits for another attempt.
 */
enum class transfer_status {
    success,
    failed,
    retried,
};

[[nodiscard]] constexpr auto to_string(transfer_status status) -> const char* {
    switch (status) {
        case transfer_status::success: return "success";
        case transfer_status::failed: return "failed";
        case transfer_status::retried: return "retried";
        default: return "unknown";
    }
}

/**
 * @brief Batch lifecycle
 */
enum class batch_state {
    building,
    mode_selected,
    executing,
    retrying,
    completed,
    partially_failed,
};

[[nodiscard]] constexpr auto to_string(batch_state state) -> const char* {
    switch (state) {
        case batch_state::building: return "building";
        case batch_state::mode_selected: return "mode_selected";
        case batch_state::executing: return "executing";
        case batch_state::retrying: return "retrying";
        case batch_state::completed: return "completed";
        case batch_state::partially_failed: return "partially_failed";
        default: return "unknown";
    }
}

/**
 * @brief Per-request execution options
 */
struct transfer_options {
    /// Maximum directives per command document
    std::size_t max_batch_size = 1000;

    /// Retries after the first attempt for transient failures
    std::size_t max_retries = 3;

    /// Concurrent descriptors on the traditional path
    std::size_t worker_count = 4;
};

/**
 * @brief Raw source identifier with an optional size hint
 */
struct source_entry {
    std::string identifier;
    std::optional<uint64_t> size_hint;

    source_entry(std::string id, std::optional<uint64_t> hint = std::nullopt)
        : identifier(std::move(id)), size_hint(hint) {}
    source_entry(const char* id) : identifier(id) {}
};

/**
 * @brief Inbound request: sources plus one destination prefix
 */
struct transfer_request {
    std::vector<source_entry> sources;
    std::string destination_prefix;
    transfer_mode mode = transfer_mode::automatic;
    transfer_options options;
};

/**
 * @brief Mirror every object under a source prefix to a destination prefix
 *
 * Runs as a single bulk tool `sync`; the objects are discovered by the tool,
 * so there is no traditional fallback for this request.
 */
struct prefix_sync_request {
    std::string source_prefix;
    std::string destination_prefix;

    /// Wildcard patterns (--include / --exclude), relative to the prefix
    std::vector<std::string> include_patterns;
    std::vector<std::string> exclude_patterns;

    /// Remove destination objects that have no source counterpart (--delete)
    bool delete_extraneous = false;
};

/**
 * @brief Normalized (source, destination) pair for one object
 *
 * Immutable after construction.
 */
class transfer_descriptor {
public:
    transfer_descriptor(object_url source,
                        object_url destination,
                        std::optional<uint64_t> size_hint = std::nullopt)
        : source_(std::move(source)),
          destination_(std::move(destination)),
          size_hint_(size_hint) {}

    [[nodiscard]] auto source() const -> const object_url& { return source_; }
    [[nodiscard]] auto destination() const -> const object_url& { return destination_; }
    [[nodiscard]] auto size_hint() const -> std::optional<uint64_t> { return size_hint_; }

    [[nodiscard]] auto operator==(const transfer_descriptor& other) const -> bool = default;

private:
    object_url source_;
    object_url destination_;
    std::optional<uint64_t> size_hint_;
};

/**
 * @brief Outcome of one descriptor
 */
struct transfer_result {
    /// Position of the descriptor in the batch
    std::size_t index;
    transfer_descriptor descriptor;
    transfer_status status = transfer_status::failed;
    uint64_t bytes_transferred = 0;
    std::optional<error> error_detail;

    /// Attempts made, starting at 1
    uint32_t attempt = 1;

    /// Mode that produced this result (differs from the batch mode after escalation)
    transfer_mode mode = transfer_mode::direct_sync;

    /// Store operations actually issued (copy, or download + upload)
    uint32_t operations = 0;

    /// Network transfers actually performed
    uint32_t network_transfers = 0;

    /// Conditional copy found the destination already up to date
    bool skipped = false;

    transfer_result(std::size_t idx, transfer_descriptor desc)
        : index(idx), descriptor(std::move(desc)) {}

    [[nodiscard]] auto is_terminal() const noexcept -> bool {
        return status != transfer_status::retried;
    }

    [[nodiscard]] auto succeeded() const noexcept -> bool {
        return status == transfer_status::success;
    }
};

/**
 * @brief Rendered bulk-tool invocation for a contiguous run of descriptors
 */
struct command_document {
    /// Tool argv; the document text is written to stdin
    std::vector<std::string> argv;

    /// One directive per line, in descriptor order
    std::string text;

    /// Batch indices in line order, used for result correlation
    std::vector<std::size_t> descriptor_indices;

    /// 1-based document sequence inside the batch
    std::size_t sequence = 0;
};

/**
 * @brief Automatic escalation from one mode to another during execution
 */
struct mode_switch_event {
    transfer_mode from = transfer_mode::direct_sync;
    transfer_mode to = transfer_mode::traditional;
    error cause;

    /// Descriptors without a terminal result at the time of the switch
    std::size_t descriptor_count = 0;

    std::chrono::system_clock::time_point at = std::chrono::system_clock::now();
};

/**
 * @brief One invocation's worth of work
 *
 * Created per invocation and discarded afterwards.
 */
struct transfer_batch {
    std::string id;
    std::vector<transfer_descriptor> descriptors;
    transfer_mode requested_mode = transfer_mode::automatic;
    transfer_mode mode = transfer_mode::automatic;

    /// Direct-sync command documents
    std::vector<command_document> commands;

    /// Traditional path plan: descriptor indices in processing order
    std::vector<std::size_t> staged_plan;

    batch_state state = batch_state::building;

    [[nodiscard]] auto size() const noexcept -> std::size_t { return descriptors.size(); }
    [[nodiscard]] auto empty() const noexcept -> bool { return descriptors.empty(); }
};

}  // namespace kcenon::object_transfer

#endif  // KCENON_OBJECT_TRANSFER_CORE_TRANSFER_TYPES_H
