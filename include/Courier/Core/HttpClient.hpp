/**
 * @file HttpClient.hpp
 * @brief Pooled HTTP client used as the forwarding transport
 * @author Courier Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 Courier. All rights reserved.
 *
 * libcurl-backed client. Connections, DNS results and TLS sessions are
 * pooled across requests; every request runs on its own easy handle, so
 * one client may be shared by any number of threads.
 */

#pragma once

#ifndef COURIER_CORE_HTTP_CLIENT_HPP
#define COURIER_CORE_HTTP_CLIENT_HPP

#include <Courier/Core/Types.hpp>
#include <Courier/Core/ErrorCodes.hpp>
#include <string>
#include <string_view>
#include <map>
#include <memory>
#include <optional>

namespace Courier::Network {

// ============================================================================
// HTTP Types
// ============================================================================

/**
 * @brief Standard HTTP methods
 */
enum class HttpMethod {
    GET,
    HEAD,
    POST,
    PUT,
    DELETE_,  // DELETE is a macro on some platforms
    CONNECT,
    OPTIONS,
    TRACE,
    PATCH
};

/**
 * @brief Resolve a method token, ignoring case
 * @param token Method token such as "get" or "PATCH"
 * @return The method, or ErrorCode::InvalidMethod for anything that is not
 *         a standard verb
 */
[[nodiscard]] Result<HttpMethod> parseHttpMethod(std::string_view token);

/**
 * @brief Canonical upper-case token for a method
 */
[[nodiscard]] const char* httpMethodToString(HttpMethod method) noexcept;

/**
 * @brief HTTP header map
 *
 * Response header names are stored lower-case; values are kept as the raw
 * bytes the server sent.
 */
using HttpHeaders = std::map<std::string, std::string>;

/**
 * @brief Outbound request
 */
struct HttpRequest {
    HttpMethod method = HttpMethod::GET;
    std::string url;
    HttpHeaders headers;

    /// Sent verbatim when present; no payload otherwise
    std::optional<std::string> body;
};

/**
 * @brief Response of the final hop
 */
struct HttpResponse {
    /// HTTP status code
    int statusCode = 0;

    /// Response headers of the final hop
    HttpHeaders headers;

    /// Response body
    ByteBuffer body;

    /// URL of the final hop
    std::string effectiveUrl;

    /// Number of redirects followed
    int redirectCount = 0;

    /// Total time taken
    Milliseconds elapsed{0};

    [[nodiscard]] bool isSuccess() const noexcept {
        return statusCode >= 200 && statusCode < 300;
    }

    [[nodiscard]] bool isRedirect() const noexcept {
        return statusCode >= 300 && statusCode < 400;
    }

    [[nodiscard]] bool isClientError() const noexcept {
        return statusCode >= 400 && statusCode < 500;
    }

    [[nodiscard]] bool isServerError() const noexcept {
        return statusCode >= 500 && statusCode < 600;
    }

    [[nodiscard]] std::string bodyAsString() const {
        return std::string(body.begin(), body.end());
    }

    /// Get header value (case-insensitive), empty if absent
    [[nodiscard]] std::string getHeader(const std::string& name) const;
};

/**
 * @brief Transport configuration
 */
struct HttpClientConfig {
    /// Skip peer certificate and hostname validation
    bool acceptInvalidCertificates = false;

    /// Redirect hops to follow; the response after the last hop is returned
    /// as-is even when it is itself a redirect
    int maxRedirects = 15;

    /// Connection timeout, zero keeps the libcurl default (300 s)
    Milliseconds connectTimeout{0};

    /// Whole-transfer timeout, zero means no limit
    Milliseconds requestTimeout{0};

    std::string userAgent = "Courier/1.0";
};

// ============================================================================
// Transport Interface
// ============================================================================

/**
 * @brief One complete HTTP round trip
 *
 * Implementations must be safe to call from several threads at once.
 */
class ITransport {
public:
    ITransport() = default;
    virtual ~ITransport() = default;
    ITransport(const ITransport&) = delete;
    ITransport& operator=(const ITransport&) = delete;

    /**
     * @brief Send a request and read the full response
     * @return Response of the final hop, or a Network-category error
     */
    virtual Result<HttpResponse> send(const HttpRequest& request) = 0;
};

// ============================================================================
// HTTP Client
// ============================================================================

/**
 * @brief libcurl transport with a shared connection pool
 *
 * @example
 * ```cpp
 * HttpClientConfig config;
 * config.acceptInvalidCertificates = true;
 *
 * auto client = HttpClient::create(config);
 * if (client.isFailure()) {
 *     return client.error();
 * }
 *
 * HttpRequest request;
 * request.url = "https://localhost:8443/status";
 * auto response = client.value()->send(request);
 * ```
 */
class HttpClient : public ITransport {
public:
    /**
     * @brief Build a client
     * @return The client, or ErrorCode::CurlInitFailed if libcurl or its
     *         TLS backend could not be initialised
     */
    [[nodiscard]] static Result<std::shared_ptr<HttpClient>> create(const HttpClientConfig& config);

    ~HttpClient() override;

    Result<HttpResponse> send(const HttpRequest& request) override;

    [[nodiscard]] const HttpClientConfig& config() const noexcept;

private:
    class Impl;

    explicit HttpClient(std::unique_ptr<Impl> impl);

    std::unique_ptr<Impl> m_impl;
};

} // namespace Courier::Network

#endif // COURIER_CORE_HTTP_CLIENT_HPP
