/**
 * @file result_accumulator.h
 * @brief Thread-safe collection of terminal results
 */

#ifndef KCENON_OBJECT_TRANSFER_EXECUTION_RESULT_ACCUMULATOR_H
#define KCENON_OBJECT_TRANSFER_EXECUTION_RESULT_ACCUMULATOR_H

#include "kcenon/object_transfer/core/transfer_types.h"
#include "kcenon/object_transfer/core/types.h"

#include <cstddef>
#include <mutex>
#include <optional>
#include <vector>

namespace kcenon::object_transfer {

/**
 * @brief Holds at most one terminal result per descriptor index
 *
 * The only state shared between traditional workers.
 */
class result_accumulator {
public:
    explicit result_accumulator(std::size_t descriptor_count);

    /**
     * @brief Record a terminal result
     * @return internal_error for a non-terminal result, an index outside the
     *         batch, or a second result for the same index
     */
    [[nodiscard]] auto add(transfer_result r) -> result<void>;

    [[nodiscard]] auto contains(std::size_t index) const -> bool;

    /**
     * @brief Number of recorded results
     */
    [[nodiscard]] auto size() const -> std::size_t;

    /**
     * @brief Indices without a result, ascending
     */
    [[nodiscard]] auto unresolved() const -> std::vector<std::size_t>;

    /**
     * @brief Recorded results ordered by index
     */
    [[nodiscard]] auto snapshot() const -> std::vector<transfer_result>;

private:
    mutable std::mutex mutex_;
    std::vector<std::optional<transfer_result>> slots_;
    std::size_t count_ = 0;
};

}  // namespace kcenon::object_transfer

#endif  // KCENON_OBJECT_TRANSFER_EXECUTION_RESULT_ACCUMULATOR_H
