/**
 * @file efficiency_reporter.h
 * @brief Per-batch cost and outcome aggregation
 * @version 0.1.0
 *
 * The report counts what the batch actually did: store operations issued and
 * network transfers performed. A direct-sync batch of N objects costs N of
 * each; the traditional path costs up to 2N of each.
 *
 * @code
 * auto report = efficiency_reporter::report(batch, results, elapsed, switches);
 * auto baseline = efficiency_reporter::traditional_baseline(report);
 * auto cmp = efficiency_reporter::compare(report, baseline);
 * // cmp.operations_reduced == N for a clean direct-sync batch
 * @endcode
 */

#ifndef KCENON_OBJECT_TRANSFER_REPORTING_EFFICIENCY_REPORTER_H
#define KCENON_OBJECT_TRANSFER_REPORTING_EFFICIENCY_REPORTER_H

#include "kcenon/object_transfer/core/transfer_types.h"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <span>
#include <string>

namespace kcenon::object_transfer {

/**
 * @brief Aggregated outcome of one batch
 */
struct efficiency_report {
    std::string batch_id;

    /// Descriptors in the batch
    std::size_t object_count = 0;

    /// Store operations issued, retries included
    std::size_t operation_count = 0;

    /// Network transfers performed
    std::size_t network_transfer_count = 0;

    uint64_t total_bytes = 0;
    double elapsed_seconds = 0.0;

    /// succeeded / object_count, 0 for an empty batch
    double success_rate = 0.0;

    std::size_t succeeded = 0;
    std::size_t failed = 0;

    /// Successful results that were conditional-copy skips
    std::size_t skipped = 0;

    /// Descriptors that never produced a terminal result (cancelled before start)
    std::size_t unresolved = 0;

    /// Mode the batch finished in
    transfer_mode mode = transfer_mode::traditional;

    /// A mode switch happened during execution
    bool escalated = false;

    batch_state state = batch_state::completed;

    /**
     * @brief One-line human readable summary
     */
    [[nodiscard]] auto summary() const -> std::string;
};

/**
 * @brief Difference between two reports
 */
struct efficiency_comparison {
    int64_t operations_reduced = 0;
    int64_t network_transfers_reduced = 0;

    /// Operation reduction relative to the baseline, in percent
    double improvement_percent = 0.0;
};

class efficiency_reporter {
public:
    /**
     * @brief Aggregate the results of a batch
     *
     * Pure function. The state is completed only when every descriptor has a
     * successful terminal result; an empty batch is completed with all
     * counters at zero.
     *
     * @param batch Executed batch (id, size and final mode)
     * @param results Terminal results, at most one per descriptor
     * @param elapsed Wall-clock duration of the run
     * @param mode_switches Escalations recorded during execution
     */
    [[nodiscard]] static auto report(const transfer_batch& batch,
                                     std::span<const transfer_result> results,
                                     std::chrono::steady_clock::duration elapsed,
                                     std::span<const mode_switch_event> mode_switches = {})
        -> efficiency_report;

    /**
     * @brief Compare a candidate report against a baseline
     */
    [[nodiscard]] static auto compare(const efficiency_report& candidate,
                                      const efficiency_report& baseline)
        -> efficiency_comparison;

    /**
     * @brief Project what the same batch costs on the traditional path
     *
     * Two operations and two network transfers per object.
     */
    [[nodiscard]] static auto traditional_baseline(const efficiency_report& report)
        -> efficiency_report;
};

}  // namespace kcenon::object_transfer

#endif  // KCENON_OBJECT_TRANSFER_REPORTING_EFFICIENCY_REPORTER_H
