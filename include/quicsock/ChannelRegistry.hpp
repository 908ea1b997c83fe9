#pragma once

#include <stdint.h>
#include <stddef.h>
#include <optional>
#include <vector>

namespace qs {

// Maps QUIC stream ids to channels.
// Bidirectional stream ids are `4n` (client) and `4n + 1` (server), so the slot index
// `2n + initiator` packs them densely into a growable array with O(1) lookup and removal.
template <typename T>
class ChannelRegistry {
public:
    ChannelRegistry() = default;

    ChannelRegistry(const ChannelRegistry&) = delete;
    ChannelRegistry& operator=(const ChannelRegistry&) = delete;
    ChannelRegistry(ChannelRegistry&&) = default;
    ChannelRegistry& operator=(ChannelRegistry&&) = default;

    static size_t slotFor(int64_t streamId) {
        return static_cast<size_t>(((streamId >> 2) << 1) | (streamId & 0x1));
    }

    static bool isValidId(int64_t streamId) {
        // unidirectional streams are never registered
        return streamId >= 0 && (streamId & 0x2) == 0;
    }

    /// Returns false if the id is invalid or already taken.
    bool insert(int64_t streamId, T value) {
        if (!isValidId(streamId)) {
            return false;
        }

        size_t slot = slotFor(streamId);
        if (slot >= m_slots.size()) {
            m_slots.resize(slot + 1);
        }

        if (m_slots[slot].has_value()) {
            return false;
        }

        m_slots[slot].emplace(std::move(value));
        m_count++;
        return true;
    }

    T* get(int64_t streamId) {
        if (!isValidId(streamId)) return nullptr;

        size_t slot = slotFor(streamId);
        if (slot >= m_slots.size() || !m_slots[slot]) {
            return nullptr;
        }

        return &*m_slots[slot];
    }

    const T* get(int64_t streamId) const {
        return const_cast<ChannelRegistry*>(this)->get(streamId);
    }

    bool contains(int64_t streamId) const {
        return this->get(streamId) != nullptr;
    }

    std::optional<T> remove(int64_t streamId) {
        if (!isValidId(streamId)) return std::nullopt;

        size_t slot = slotFor(streamId);
        if (slot >= m_slots.size() || !m_slots[slot]) {
            return std::nullopt;
        }

        auto out = std::move(m_slots[slot]);
        m_slots[slot].reset();
        m_count--;

        // shrink past trailing holes
        while (!m_slots.empty() && !m_slots.back()) {
            m_slots.pop_back();
        }

        return out;
    }

    size_t size() const {
        return m_count;
    }

    bool empty() const {
        return m_count == 0;
    }

    /// Number of slots currently allocated, including holes.
    size_t slotCount() const {
        return m_slots.size();
    }

    template <typename F>
    void forEach(F&& func) {
        for (auto& slot : m_slots) {
            if (slot) func(*slot);
        }
    }

    /// Removes every entry, returning them in stream id order.
    std::vector<T> drain() {
        std::vector<T> out;
        out.reserve(m_count);

        for (auto& slot : m_slots) {
            if (slot) out.push_back(std::move(*slot));
        }

        m_slots.clear();
        m_count = 0;
        return out;
    }

private:
    std::vector<std::optional<T>> m_slots;
    size_t m_count = 0;
};

}
