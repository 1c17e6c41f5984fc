/**
 * @file transfer_events.h
 * @brief Per-batch event callbacks
 */

#ifndef KCENON_OBJECT_TRANSFER_EXECUTION_TRANSFER_EVENTS_H
#define KCENON_OBJECT_TRANSFER_EXECUTION_TRANSFER_EVENTS_H

#include "kcenon/object_transfer/core/transfer_types.h"
#include "kcenon/object_transfer/reporting/efficiency_reporter.h"

#include <functional>

namespace kcenon::object_transfer {

/**
 * @brief Optional observers of a run
 *
 * Unset members are skipped. Callbacks are serialized by the executor but may
 * run on worker threads; they must not call back into the engine.
 */
struct transfer_event_handler {
    /// Mode chosen for the batch, before execution starts
    std::function<void(transfer_mode)> on_mode_selected;

    /// A descriptor failed retryably and another attempt is scheduled
    /// (status is transfer_status::retried)
    std::function<void(const transfer_result&)> on_attempt;

    /// Terminal result of a descriptor, exactly once per started descriptor
    std::function<void(const transfer_result&)> on_result;

    std::function<void(const mode_switch_event&)> on_mode_switch;

    /// Final report, once per run
    std::function<void(const efficiency_report&)> on_report;
};

}  // namespace kcenon::object_transfer

#endif  // KCENON_OBJECT_TRANSFER_EXECUTION_TRANSFER_EVENTS_H
