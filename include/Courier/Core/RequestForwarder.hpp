/**
 * @file RequestForwarder.hpp
 * @brief Forwards UI-described HTTP requests to arbitrary URLs
 * @author Courier Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 Courier. All rights reserved.
 *
 * The UI cannot talk to hosts with self-signed certificates or read
 * cross-origin responses, so it describes the request and Courier performs
 * it. Each call is one network attempt; failures come back as one of
 * ClientInitFailed, InvalidMethod, TransportFailed or DecodeFailed.
 */

#pragma once

#ifndef COURIER_CORE_REQUEST_FORWARDER_HPP
#define COURIER_CORE_REQUEST_FORWARDER_HPP

#include <Courier/Core/Types.hpp>
#include <Courier/Core/ErrorCodes.hpp>
#include <Courier/Core/HttpClient.hpp>
#include <cstdint>
#include <functional>
#include <future>
#include <map>
#include <mutex>
#include <optional>
#include <string>

namespace Courier::Network {

/**
 * @brief Request as described by the UI
 */
struct RequestDescriptor {
    std::string url;

    /// HTTP verb, any letter case
    std::string method;

    std::optional<std::map<std::string, std::string>> headers;

    std::optional<std::string> body;
};

/**
 * @brief Response handed back to the UI
 */
struct ResponseDescriptor {
    bool success = false;
    uint16_t statusCode = 0;

    /// Lower-case names; one value per name, the last one received wins
    std::map<std::string, std::string> headers;

    std::string body;
};

/**
 * @brief Builds the transport the forwarder pools
 */
using TransportFactory =
    std::function<Result<std::shared_ptr<ITransport>>(const HttpClientConfig&)>;

/**
 * @brief Forwards RequestDescriptors through a pooled transport
 *
 * The transport is created on first use and reused afterwards; a failed
 * creation is retried by the next call. forward() may be called from any
 * number of threads.
 *
 * @example
 * ```cpp
 * HttpClientConfig config;
 * config.acceptInvalidCertificates = true;
 * RequestForwarder forwarder(config);
 *
 * RequestDescriptor request;
 * request.url = "https://127.0.0.1:8443/api/stats";
 * request.method = "get";
 *
 * auto response = forwarder.forward(request);
 * if (response.isFailure()) {
 *     std::string text(describeForwardError(response.error()));
 * }
 * ```
 */
class RequestForwarder {
public:
    /**
     * @param config Transport settings
     * @param factory Transport constructor; defaults to HttpClient::create
     */
    explicit RequestForwarder(HttpClientConfig config = {}, TransportFactory factory = {});

    RequestForwarder(const RequestForwarder&) = delete;
    RequestForwarder& operator=(const RequestForwarder&) = delete;

    /**
     * @brief Perform one forwarded round trip
     * @return Response with success set, or one of the four forwarding errors
     */
    Result<ResponseDescriptor> forward(const RequestDescriptor& request);

    /**
     * @brief forward() on a detached worker thread
     *
     * The worker shares ownership of the transport, so the forwarder may be
     * destroyed first. Dropping the future does not wait for the request.
     */
    std::future<Result<ResponseDescriptor>> forwardAsync(RequestDescriptor request);

    [[nodiscard]] const HttpClientConfig& config() const noexcept { return m_config; }

private:
    Result<std::shared_ptr<ITransport>> acquireTransport();

    HttpClientConfig m_config;
    TransportFactory m_factory;

    std::mutex m_mutex;
    std::shared_ptr<ITransport> m_transport;
};

/**
 * @brief Short user-facing text for a forwarding error
 *
 * Errors outside the four forwarding codes are reported as a send failure.
 */
[[nodiscard]] std::string_view describeForwardError(ErrorCode code) noexcept;

} // namespace Courier::Network

#endif // COURIER_CORE_REQUEST_FORWARDER_HPP
