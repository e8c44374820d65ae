#pragma once

#include <algorithm>
#include <cstddef>
#include <deque>
#include <optional>

#include "sim/item.h"

// Simulation ItemBuffer subsystem
// Responsible for: a bounded FIFO of items used for machine input and output ports.
// Should NOT do: recipe decisions or routing.
namespace tinyfactory::sim {

class ItemBuffer {
public:
    static constexpr std::size_t kDefaultCapacity = 5;

    ItemBuffer() = default;
    explicit ItemBuffer(std::size_t capacity);

    bool push(ItemKind item);
    std::optional<ItemKind> popFront();
    std::optional<ItemKind> front() const;
    bool removeFirst(ItemKind item);
    bool contains(ItemKind item) const;
    std::size_t count(ItemKind item) const;
    void clear();

    std::size_t size() const;
    std::size_t capacity() const;
    bool empty() const;
    bool full() const;
    const std::deque<ItemKind>& items() const;

private:
    std::size_t m_capacity = kDefaultCapacity;
    std::deque<ItemKind> m_items;
};

inline ItemBuffer::ItemBuffer(std::size_t capacity) : m_capacity(capacity) {}

// Returns false and leaves the buffer unchanged when full.
inline bool ItemBuffer::push(ItemKind item) {
    if (full()) {
        return false;
    }
    m_items.push_back(item);
    return true;
}

inline std::optional<ItemKind> ItemBuffer::popFront() {
    if (m_items.empty()) {
        return std::nullopt;
    }
    const ItemKind item = m_items.front();
    m_items.pop_front();
    return item;
}

inline std::optional<ItemKind> ItemBuffer::front() const {
    if (m_items.empty()) {
        return std::nullopt;
    }
    return m_items.front();
}

inline bool ItemBuffer::removeFirst(ItemKind item) {
    const auto found = std::find(m_items.begin(), m_items.end(), item);
    if (found == m_items.end()) {
        return false;
    }
    m_items.erase(found);
    return true;
}

inline bool ItemBuffer::contains(ItemKind item) const {
    return std::find(m_items.begin(), m_items.end(), item) != m_items.end();
}

inline std::size_t ItemBuffer::count(ItemKind item) const {
    return static_cast<std::size_t>(std::count(m_items.begin(), m_items.end(), item));
}

inline void ItemBuffer::clear() {
    m_items.clear();
}

inline std::size_t ItemBuffer::size() const {
    return m_items.size();
}

inline std::size_t ItemBuffer::capacity() const {
    return m_capacity;
}

inline bool ItemBuffer::empty() const {
    return m_items.empty();
}

inline bool ItemBuffer::full() const {
    return m_items.size() >= m_capacity;
}

inline const std::deque<ItemKind>& ItemBuffer::items() const {
    return m_items;
}

} // namespace tinyfactory::sim
