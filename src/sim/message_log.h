#pragma once

#include <cstddef>
#include <deque>
#include <string>
#include <utility>

// Simulation MessageLog subsystem
// Responsible for: the bounded, player-facing history of factory events.
// Should NOT do: diagnostics output (see core/log.h).
namespace tinyfactory::sim {

class MessageLog {
public:
    static constexpr std::size_t kDefaultCapacity = 30;

    MessageLog() = default;
    explicit MessageLog(std::size_t capacity) : m_capacity(capacity == 0 ? 1 : capacity) {}

    // Evicts the oldest entries once capacity is exceeded.
    void push(std::string message) {
        m_entries.push_back(std::move(message));
        while (m_entries.size() > m_capacity) {
            m_entries.pop_front();
        }
    }

    void clear() { m_entries.clear(); }

    std::size_t size() const { return m_entries.size(); }
    std::size_t capacity() const { return m_capacity; }
    bool empty() const { return m_entries.empty(); }

    // Oldest first.
    const std::deque<std::string>& entries() const { return m_entries; }

    const std::string& latest() const {
        static const std::string kNone;
        return m_entries.empty() ? kNone : m_entries.back();
    }

private:
    std::size_t m_capacity = kDefaultCapacity;
    std::deque<std::string> m_entries;
};

} // namespace tinyfactory::sim
