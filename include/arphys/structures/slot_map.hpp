#pragma once

/// @file slot_map.hpp
/// @brief Generational slot storage for arphys_structures
///
/// Removing a value bumps the slot generation so keys handed out earlier
/// stop resolving. Freed slots are reused in LIFO order.

#include "fwd.hpp"

#include <cstdint>
#include <functional>
#include <limits>
#include <optional>
#include <stdexcept>
#include <vector>

namespace arphys_structures {

// =============================================================================
// SlotKey
// =============================================================================

/// @tparam T Tag type, only used to keep keys of different maps apart
template<typename T>
struct SlotKey {
    static constexpr std::uint32_t NULL_INDEX = std::numeric_limits<std::uint32_t>::max();

    std::uint32_t index = NULL_INDEX;
    std::uint32_t generation = 0;

    constexpr SlotKey() noexcept = default;
    constexpr SlotKey(std::uint32_t idx, std::uint32_t gen) noexcept
        : index(idx), generation(gen) {}

    [[nodiscard]] static constexpr SlotKey null() noexcept { return SlotKey{}; }

    [[nodiscard]] constexpr bool is_null() const noexcept { return index == NULL_INDEX; }
    [[nodiscard]] constexpr bool is_valid() const noexcept { return index != NULL_INDEX; }

    /// Pack into 64 bits, generation in the high word
    [[nodiscard]] constexpr std::uint64_t to_bits() const noexcept {
        return (static_cast<std::uint64_t>(generation) << 32) | index;
    }

    [[nodiscard]] static constexpr SlotKey from_bits(std::uint64_t bits) noexcept {
        return SlotKey(static_cast<std::uint32_t>(bits & 0xFFFFFFFFu),
                       static_cast<std::uint32_t>(bits >> 32));
    }

    constexpr bool operator==(const SlotKey& other) const noexcept {
        return index == other.index && generation == other.generation;
    }

    constexpr bool operator!=(const SlotKey& other) const noexcept {
        return !(*this == other);
    }

    constexpr bool operator<(const SlotKey& other) const noexcept {
        return to_bits() < other.to_bits();
    }
};

} // namespace arphys_structures

template<typename T>
struct std::hash<arphys_structures::SlotKey<T>> {
    std::size_t operator()(const arphys_structures::SlotKey<T>& key) const noexcept {
        return std::hash<std::uint64_t>{}(key.to_bits());
    }
};

namespace arphys_structures {

// =============================================================================
// SlotMap
// =============================================================================

template<typename T>
class SlotMap {
public:
    using key_type = SlotKey<T>;
    using value_type = T;

    SlotMap() = default;

    explicit SlotMap(std::size_t capacity) {
        slots_.reserve(capacity);
    }

    // =========================================================================
    // Mutation
    // =========================================================================

    key_type insert(T value) {
        return emplace(std::move(value));
    }

    template<typename... Args>
    key_type emplace(Args&&... args) {
        std::uint32_t index;
        if (!free_.empty()) {
            index = free_.back();
            free_.pop_back();
        } else {
            index = static_cast<std::uint32_t>(slots_.size());
            slots_.emplace_back();
        }

        Slot& slot = slots_[index];
        slot.value.emplace(std::forward<Args>(args)...);
        ++size_;
        return key_type(index, slot.generation);
    }

    /// Remove and return the value, or nullopt for a stale key
    std::optional<T> remove(key_type key) {
        Slot* slot = live_slot(key);
        if (slot == nullptr) {
            return std::nullopt;
        }

        std::optional<T> out = std::move(slot->value);
        slot->value.reset();
        ++slot->generation;
        free_.push_back(key.index);
        --size_;
        return out;
    }

    bool erase(key_type key) {
        return remove(key).has_value();
    }

    /// Drop all values; every outstanding key becomes stale
    void clear() {
        free_.clear();
        for (std::uint32_t i = static_cast<std::uint32_t>(slots_.size()); i-- > 0;) {
            Slot& slot = slots_[i];
            if (slot.value.has_value()) {
                slot.value.reset();
                ++slot.generation;
            }
            free_.push_back(i);
        }
        size_ = 0;
    }

    // =========================================================================
    // Lookup
    // =========================================================================

    [[nodiscard]] bool contains(key_type key) const noexcept {
        return live_slot(key) != nullptr;
    }

    [[nodiscard]] T* get(key_type key) noexcept {
        Slot* slot = live_slot(key);
        return slot ? &*slot->value : nullptr;
    }

    [[nodiscard]] const T* get(key_type key) const noexcept {
        const Slot* slot = live_slot(key);
        return slot ? &*slot->value : nullptr;
    }

    /// @throws std::out_of_range for a null or stale key
    [[nodiscard]] T& at(key_type key) {
        T* value = get(key);
        if (value == nullptr) {
            throw std::out_of_range("SlotMap::at: stale or null key");
        }
        return *value;
    }

    [[nodiscard]] std::size_t size() const noexcept { return size_; }
    [[nodiscard]] bool empty() const noexcept { return size_ == 0; }
    [[nodiscard]] std::size_t capacity() const noexcept { return slots_.size(); }

    // =========================================================================
    // Iteration
    // =========================================================================

    /// Visit (key, value&) for every live slot in index order
    template<typename F>
    void for_each(F&& func) {
        for (std::uint32_t i = 0; i < slots_.size(); ++i) {
            Slot& slot = slots_[i];
            if (slot.value.has_value()) {
                func(key_type(i, slot.generation), *slot.value);
            }
        }
    }

    template<typename F>
    void for_each(F&& func) const {
        for (std::uint32_t i = 0; i < slots_.size(); ++i) {
            const Slot& slot = slots_[i];
            if (slot.value.has_value()) {
                func(key_type(i, slot.generation), *slot.value);
            }
        }
    }

    [[nodiscard]] std::vector<key_type> keys() const {
        std::vector<key_type> out;
        out.reserve(size_);
        for_each([&out](key_type key, const T&) { out.push_back(key); });
        return out;
    }

private:
    struct Slot {
        std::uint32_t generation = 0;
        std::optional<T> value;
    };

    Slot* live_slot(key_type key) noexcept {
        if (key.index >= slots_.size()) return nullptr;
        Slot& slot = slots_[key.index];
        return (slot.value.has_value() && slot.generation == key.generation) ? &slot : nullptr;
    }

    const Slot* live_slot(key_type key) const noexcept {
        if (key.index >= slots_.size()) return nullptr;
        const Slot& slot = slots_[key.index];
        return (slot.value.has_value() && slot.generation == key.generation) ? &slot : nullptr;
    }

    std::vector<Slot> slots_;
    std::vector<std::uint32_t> free_;
    std::size_t size_ = 0;
};

} // namespace arphys_structures
