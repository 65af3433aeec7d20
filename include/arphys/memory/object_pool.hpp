#pragma once

/// @file object_pool.hpp
/// @brief Bounded free list of reusable objects
///
/// Objects are handed out by value and returned when the caller is done.
/// Returning resets the object (for containers this keeps the capacity,
/// which is the point of pooling them) and keeps it only while fewer than
/// `max_size` are idle.

#include "fwd.hpp"

#include <cstddef>
#include <functional>
#include <utility>
#include <vector>

namespace arphys_memory {

/// Pool counters
struct PoolStats {
    std::size_t max_size = 0;
    std::size_t idle = 0;         ///< Objects waiting for reuse
    std::size_t created = 0;      ///< acquire() calls that found the pool empty
    std::size_t reused = 0;       ///< acquire() calls served from the pool
    std::size_t dropped = 0;      ///< release() calls refused because the pool was full
    std::size_t trimmed = 0;      ///< Objects discarded by trim() or clear()
};

template<typename T>
class ObjectPool {
public:
    using ResetFn = std::function<void(T&)>;

    explicit ObjectPool(std::size_t max_size = 100, ResetFn reset = {})
        : m_max_size(max_size)
        , m_reset(std::move(reset)) {}

    ObjectPool(const ObjectPool&) = delete;
    ObjectPool& operator=(const ObjectPool&) = delete;
    ObjectPool(ObjectPool&&) = default;
    ObjectPool& operator=(ObjectPool&&) = default;

    /// Most recently released object, or a fresh one
    [[nodiscard]] T acquire() {
        if (m_idle.empty()) {
            ++m_stats.created;
            return T{};
        }
        T obj = std::move(m_idle.back());
        m_idle.pop_back();
        ++m_stats.reused;
        return obj;
    }

    void release(T obj) {
        if (m_idle.size() >= m_max_size) {
            ++m_stats.dropped;
            return;
        }
        if (m_reset) {
            m_reset(obj);
        }
        m_idle.push_back(std::move(obj));
    }

    /// Shrink the idle list to half the maximum
    /// @return Number of objects discarded
    std::size_t trim() {
        const std::size_t keep = m_max_size / 2;
        if (m_idle.size() <= keep) {
            return 0;
        }
        const std::size_t removed = m_idle.size() - keep;
        m_idle.resize(keep);
        m_stats.trimmed += removed;
        return removed;
    }

    /// Discard every idle object
    std::size_t clear() {
        const std::size_t removed = m_idle.size();
        m_idle.clear();
        m_idle.shrink_to_fit();
        m_stats.trimmed += removed;
        return removed;
    }

    [[nodiscard]] std::size_t idle_count() const noexcept { return m_idle.size(); }
    [[nodiscard]] std::size_t max_size() const noexcept { return m_max_size; }

    void set_max_size(std::size_t max_size) noexcept { m_max_size = max_size; }

    [[nodiscard]] PoolStats stats() const noexcept {
        PoolStats s = m_stats;
        s.max_size = m_max_size;
        s.idle = m_idle.size();
        return s;
    }

private:
    std::size_t m_max_size;
    ResetFn m_reset;
    std::vector<T> m_idle;
    PoolStats m_stats;
};

} // namespace arphys_memory
