#pragma once

/// @file command_queue.hpp
/// @brief Mutex-guarded multi-producer queue drained by a single consumer
///
/// Producers on any thread push; the owning loop swaps the pending batch
/// out under the lock and runs it without holding the lock, so a command
/// may safely push follow-up commands for the next drain.

#include "fwd.hpp"

#include <cstddef>
#include <mutex>
#include <utility>
#include <vector>

namespace arphys_structures {

template<typename T>
class CommandQueue {
public:
    CommandQueue() = default;

    CommandQueue(const CommandQueue&) = delete;
    CommandQueue& operator=(const CommandQueue&) = delete;

    void push(T item) {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_pending.push_back(std::move(item));
    }

    /// Take everything queued so far, in push order
    [[nodiscard]] std::vector<T> take_all() {
        std::vector<T> out;
        std::lock_guard<std::mutex> lock(m_mutex);
        out.swap(m_pending);
        return out;
    }

    /// Take the pending batch and hand each item to `func`
    /// @return Number of items processed
    template<typename F>
    std::size_t drain(F&& func) {
        auto batch = take_all();
        for (auto& item : batch) {
            func(item);
        }
        return batch.size();
    }

    [[nodiscard]] std::size_t size() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_pending.size();
    }

    [[nodiscard]] bool empty() const {
        return size() == 0;
    }

private:
    mutable std::mutex m_mutex;
    std::vector<T> m_pending;
};

} // namespace arphys_structures
