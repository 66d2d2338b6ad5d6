/**
 * @file CommandBridge.hpp
 * @brief Local HTTP bridge through which the UI invokes backend commands
 * @author Courier Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 Courier. All rights reserved.
 *
 * Endpoints:
 *   POST /invoke/fetch       RequestDescriptor -> ResponseDescriptor
 *   GET  /events?after=N     events emitted after sequence N
 *   POST /instance/activate  notice from a secondary instance
 *   GET  /health             liveness
 */

#pragma once

#ifndef COURIER_SHELL_COMMAND_BRIDGE_HPP
#define COURIER_SHELL_COMMAND_BRIDGE_HPP

#include <Courier/Core/ErrorCodes.hpp>
#include <Courier/Core/RequestForwarder.hpp>
#include <Courier/Shell/EventBus.hpp>
#include <cstdint>
#include <memory>
#include <string>

namespace Courier::Shell {

/// Event name used for secondary-instance notices
inline constexpr const char* SINGLE_INSTANCE_EVENT = "single-instance";

/// Event name used for log lines routed to the UI console
inline constexpr const char* LOG_EVENT = "log";

/**
 * @brief HTTP/JSON bridge bound to a local address
 *
 * The forwarder and event bus are borrowed and must outlive the bridge.
 *
 * @example
 * ```cpp
 * Network::RequestForwarder forwarder(config.http);
 * EventBus events;
 * CommandBridge bridge(forwarder, events);
 *
 * auto port = bridge.start("127.0.0.1", 0);
 * if (port.isSuccess()) {
 *     // UI connects to http://127.0.0.1:<port>
 * }
 * ```
 */
class CommandBridge {
public:
    CommandBridge(Network::RequestForwarder& forwarder, EventBus& events);
    ~CommandBridge();

    CommandBridge(const CommandBridge&) = delete;
    CommandBridge& operator=(const CommandBridge&) = delete;

    /**
     * @brief Bind and start serving on a background thread
     * @param host Address to bind
     * @param port Port to bind; 0 picks a free port
     * @return The bound port, BindFailed, or InvalidState if already running
     */
    Result<uint16_t> start(const std::string& host, uint16_t port);

    /**
     * @brief Stop serving and join the listener thread
     */
    void stop();

    [[nodiscard]] bool isRunning() const;

    /**
     * @return Bound port, 0 when not running
     */
    [[nodiscard]] uint16_t port() const;

private:
    class Impl;
    std::unique_ptr<Impl> m_impl;
};

} // namespace Courier::Shell

#endif // COURIER_SHELL_COMMAND_BRIDGE_HPP
