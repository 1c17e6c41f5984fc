/**
 * @file result_accumulator.cpp
 * @brief Terminal result collection
 */

#include "kcenon/object_transfer/execution/result_accumulator.h"

namespace kcenon::object_transfer {

result_accumulator::result_accumulator(std::size_t descriptor_count)
    : slots_(descriptor_count) {}

auto result_accumulator::add(transfer_result r) -> result<void> {
    if (!r.is_terminal()) {
        return unexpected{error{error_code::internal_error,
            "non-terminal result for descriptor " + std::to_string(r.index)}};
    }

    std::lock_guard<std::mutex> lock(mutex_);
    if (r.index >= slots_.size()) {
        return unexpected{error{error_code::internal_error,
            "result index " + std::to_string(r.index) + " outside batch of " +
            std::to_string(slots_.size())}};
    }

    auto& slot = slots_[r.index];
    if (slot.has_value()) {
        return unexpected{error{error_code::internal_error,
            "duplicate terminal result for descriptor " + std::to_string(r.index)}};
    }

    slot.emplace(std::move(r));
    ++count_;
    return {};
}

auto result_accumulator::contains(std::size_t index) const -> bool {
    std::lock_guard<std::mutex> lock(mutex_);
    return index < slots_.size() && slots_[index].has_value();
}

auto result_accumulator::size() const -> std::size_t {
    std::lock_guard<std::mutex> lock(mutex_);
    return count_;
}

auto result_accumulator::unresolved() const -> std::vector<std::size_t> {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::size_t> indices;
    for (std::size_t i = 0; i < slots_.size(); ++i) {
        if (!slots_[i].has_value()) {
            indices.push_back(i);
        }
    }
    return indices;
}

auto result_accumulator::snapshot() const -> std::vector<transfer_result> {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<transfer_result> results;
    results.reserve(count_);
    for (const auto& slot : slots_) {
        if (slot.has_value()) {
            results.push_back(*slot);
        }
    }
    return results;
}

}  // namespace kcenon::object_transfer
