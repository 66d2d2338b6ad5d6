/**
 * @file EventBus.cpp
 * @brief Backend-to-UI event queue
 * @author Courier Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 Courier. All rights reserved.
 */

#include <Courier/Shell/EventBus.hpp>
#include <algorithm>

namespace Courier::Shell {

EventBus::EventBus(size_t capacity)
    : m_capacity(std::max<size_t>(capacity, 1)) {}

uint64_t EventBus::emit(std::string name, nlohmann::json payload) {
    std::lock_guard<std::mutex> lock(m_mutex);

    while (m_events.size() >= m_capacity) {
        m_events.pop_front();
        ++m_dropped;
    }

    Event event;
    event.seq = m_nextSeq++;
    event.name = std::move(name);
    event.payload = std::move(payload);
    m_events.push_back(std::move(event));

    return m_events.back().seq;
}

std::vector<Event> EventBus::since(uint64_t after) const {
    std::lock_guard<std::mutex> lock(m_mutex);

    // seq is strictly increasing along the deque
    auto first = std::upper_bound(m_events.begin(), m_events.end(), after,
                                  [](uint64_t value, const Event& e) { return value < e.seq; });

    return std::vector<Event>(first, m_events.end());
}

uint64_t EventBus::lastSeq() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_nextSeq - 1;
}

size_t EventBus::size() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_events.size();
}

size_t EventBus::dropped() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_dropped;
}

} // namespace Courier::Shell
