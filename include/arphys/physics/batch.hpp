/// @file batch.hpp
/// @brief Fixed-size batching of homogeneous work items

#pragma once

#include "fwd.hpp"

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <span>

namespace arphys_physics {

/// Hands a work list to a callback in slices of at most `batch_size`
/// items and counts how many slices it produced.
class BatchProcessor {
public:
    explicit BatchProcessor(std::size_t batch_size = 64)
        : m_batch_size(std::max<std::size_t>(batch_size, 1)) {}

    /// @return Number of batches dispatched for `items`
    template<typename T, typename F>
    std::size_t process(std::span<T> items, F&& func) {
        std::size_t batches = 0;
        for (std::size_t offset = 0; offset < items.size(); offset += m_batch_size) {
            const std::size_t count = std::min(m_batch_size, items.size() - offset);
            func(items.subspan(offset, count));
            ++batches;
        }
        m_total_batches += batches;
        m_total_items += items.size();
        return batches;
    }

    [[nodiscard]] std::size_t batch_size() const noexcept { return m_batch_size; }

    void set_batch_size(std::size_t batch_size) noexcept {
        m_batch_size = std::max<std::size_t>(batch_size, 1);
    }

    [[nodiscard]] std::uint64_t total_batches() const noexcept { return m_total_batches; }
    [[nodiscard]] std::uint64_t total_items() const noexcept { return m_total_items; }

    void reset_stats() noexcept {
        m_total_batches = 0;
        m_total_items = 0;
    }

private:
    std::size_t m_batch_size;
    std::uint64_t m_total_batches = 0;
    std::uint64_t m_total_items = 0;
};

} // namespace arphys_physics
