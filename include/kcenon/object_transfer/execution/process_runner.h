// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

/**
 * @file process_runner.h
 * @brief Subprocess execution with line-streamed output
 *
 * The executor talks to the bulk transfer tool only through
 * process_runner_interface, so tests can substitute a scripted tool.
 */

#pragma once

#include "kcenon/object_transfer/core/cancellation.h"
#include "kcenon/object_transfer/core/types.h"

#include <chrono>
#include <functional>
#include <string>
#include <string_view>
#include <vector>

namespace kcenon::object_transfer {

/**
 * @brief Which pipe a line came from
 */
enum class output_stream {
    standard_output,
    standard_error,
};

/**
 * @brief What to run
 */
struct process_spec {
    /// argv[0] is resolved through PATH
    std::vector<std::string> argv;

    /// Written to the child's stdin, which is then closed
    std::string stdin_data;

    /// Wall-clock limit for this invocation; zero disables it
    std::chrono::milliseconds timeout{0};

    /// Delay between SIGTERM and SIGKILL when stopping the child
    std::chrono::milliseconds kill_grace{2000};
};

/**
 * @brief How a started process ended
 */
struct process_outcome {
    int exit_code = -1;

    /// Signal that terminated the child, 0 if it exited normally
    int term_signal = 0;

    bool timed_out = false;
    bool cancelled = false;

    [[nodiscard]] auto succeeded() const noexcept -> bool {
        return exit_code == 0 && term_signal == 0 && !timed_out && !cancelled;
    }
};

/**
 * @brief Receives each complete output line without its line terminator
 *
 * Called on the runner's thread, in arrival order per stream.
 */
using line_handler = std::function<void(output_stream, std::string_view)>;

/**
 * @brief Interface for launching the external bulk transfer tool
 */
class process_runner_interface {
public:
    virtual ~process_runner_interface() = default;

    /**
     * @brief Run a process to completion
     * @param spec Command, stdin payload and timeout
     * @param on_line Line callback for stdout and stderr
     * @param token Cancellation; a cancelled run stops the child
     * @return Outcome once the child has been reaped, or a tool_not_found /
     *         tool_start_failed error when it could not be started
     */
    [[nodiscard]] virtual auto run(const process_spec& spec,
                                   const line_handler& on_line,
                                   const cancellation_token& token)
        -> result<process_outcome> = 0;
};

/**
 * @brief fork/exec implementation over POSIX pipes
 *
 * The child runs in its own process group so termination reaches helpers it
 * spawned. SIGPIPE is ignored process-wide on first construction, since a
 * child that exits early would otherwise kill the caller while its stdin is
 * being written.
 */
class posix_process_runner : public process_runner_interface {
public:
    posix_process_runner();

    [[nodiscard]] auto run(const process_spec& spec,
                           const line_handler& on_line,
                           const cancellation_token& token)
        -> result<process_outcome> override;
};

}  // namespace kcenon::object_transfer
