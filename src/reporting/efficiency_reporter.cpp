/**
 * @file efficiency_reporter.cpp
 * @brief Efficiency report aggregation
 */

#include "kcenon/object_transfer/reporting/efficiency_reporter.h"

#include <iomanip>
#include <sstream>

namespace kcenon::object_transfer {

auto efficiency_report::summary() const -> std::string {
    std::ostringstream oss;
    oss << "batch " << batch_id << ": " << succeeded << "/" << object_count
        << " succeeded (" << skipped << " skipped, " << failed << " failed";
    if (unresolved > 0) {
        oss << ", " << unresolved << " not started";
    }
    oss << "), mode=" << to_string(mode);
    if (escalated) {
        oss << " (escalated)";
    }
    oss << ", ops=" << operation_count
        << ", transfers=" << network_transfer_count
        << ", bytes=" << total_bytes
        << ", elapsed=" << std::fixed << std::setprecision(3) << elapsed_seconds << "s"
        << ", state=" << to_string(state);
    return oss.str();
}

auto efficiency_reporter::report(const transfer_batch& batch,
                                 std::span<const transfer_result> results,
                                 std::chrono::steady_clock::duration elapsed,
                                 std::span<const mode_switch_event> mode_switches)
    -> efficiency_report {
    efficiency_report report;
    report.batch_id = batch.id;
    report.object_count = batch.size();
    report.mode = batch.mode;
    report.escalated = !mode_switches.empty();
    report.elapsed_seconds = std::chrono::duration<double>(elapsed).count();

    for (const auto& r : results) {
        if (!r.is_terminal()) {
            continue;
        }
        report.operation_count += r.operations;
        report.network_transfer_count += r.network_transfers;
        report.total_bytes += r.bytes_transferred;

        if (r.succeeded()) {
            ++report.succeeded;
            if (r.skipped) {
                ++report.skipped;
            }
        } else {
            ++report.failed;
        }
    }

    const auto resolved = report.succeeded + report.failed;
    report.unresolved = report.object_count > resolved ? report.object_count - resolved : 0;

    if (report.object_count > 0) {
        report.success_rate = static_cast<double>(report.succeeded) /
                              static_cast<double>(report.object_count);
    }

    report.state = report.succeeded == report.object_count ? batch_state::completed
                                                           : batch_state::partially_failed;
    return report;
}

auto efficiency_reporter::compare(const efficiency_report& candidate,
                                  const efficiency_report& baseline)
    -> efficiency_comparison {
    efficiency_comparison cmp;
    cmp.operations_reduced = static_cast<int64_t>(baseline.operation_count) -
                             static_cast<int64_t>(candidate.operation_count);
    cmp.network_transfers_reduced = static_cast<int64_t>(baseline.network_transfer_count) -
                                    static_cast<int64_t>(candidate.network_transfer_count);
    if (baseline.operation_count > 0) {
        cmp.improvement_percent = 100.0 * static_cast<double>(cmp.operations_reduced) /
                                  static_cast<double>(baseline.operation_count);
    }
    return cmp;
}

auto efficiency_reporter::traditional_baseline(const efficiency_report& report)
    -> efficiency_report {
    efficiency_report baseline = report;
    baseline.mode = transfer_mode::traditional;
    baseline.escalated = false;
    baseline.skipped = 0;
    baseline.operation_count = 2 * report.object_count;
    baseline.network_transfer_count = 2 * report.object_count;
    return baseline;
}

}  // namespace kcenon::object_transfer
