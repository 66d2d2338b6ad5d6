/**
 * @file EventBus.hpp
 * @brief Backend-to-UI event queue
 * @author Courier Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 Courier. All rights reserved.
 */

#pragma once

#ifndef COURIER_SHELL_EVENT_BUS_HPP
#define COURIER_SHELL_EVENT_BUS_HPP

#include <nlohmann/json.hpp>
#include <cstdint>
#include <deque>
#include <mutex>
#include <string>
#include <vector>

namespace Courier::Shell {

struct Event {
    uint64_t seq = 0;
    std::string name;
    nlohmann::json payload;
};

/**
 * @brief Bounded, thread-safe event queue polled by the UI
 *
 * Sequence numbers start at 1 and never repeat. When the queue is full the
 * oldest event is dropped; a poller that falls behind sees a gap in seq.
 */
class EventBus {
public:
    static constexpr size_t DEFAULT_CAPACITY = 256;

    explicit EventBus(size_t capacity = DEFAULT_CAPACITY);

    /**
     * @return Sequence number assigned to the event
     */
    uint64_t emit(std::string name, nlohmann::json payload);

    /**
     * @brief Events with seq greater than @p after, oldest first
     */
    std::vector<Event> since(uint64_t after) const;

    uint64_t lastSeq() const;

    size_t size() const;

    size_t dropped() const;

private:
    const size_t m_capacity;

    mutable std::mutex m_mutex;
    std::deque<Event> m_events;
    uint64_t m_nextSeq = 1;
    size_t m_dropped = 0;
};

} // namespace Courier::Shell

#endif // COURIER_SHELL_EVENT_BUS_HPP
