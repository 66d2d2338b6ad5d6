/**
 * @file RequestForwarder.cpp
 * @brief Request forwarding implementation
 * @author Courier Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 Courier. All rights reserved.
 */

#include <Courier/Core/RequestForwarder.hpp>
#include <Courier/Core/Logger.hpp>
#include <Courier/Core/TextDecode.hpp>

#include <thread>

namespace Courier::Network {

namespace {
    Result<std::shared_ptr<ITransport>> createHttpClient(const HttpClientConfig& config) {
        auto client = HttpClient::create(config);
        if (client.isFailure()) {
            return client.error();
        }
        return std::shared_ptr<ITransport>(std::move(client).value());
    }

    Result<ResponseDescriptor> forwardThrough(ITransport& transport, const RequestDescriptor& request) {
        auto method = parseHttpMethod(request.method);
        if (method.isFailure()) {
            COURIER_LOG_WARNING_F("Rejected request with method '%s'", request.method.c_str());
            return ErrorCode::InvalidMethod;
        }

        HttpRequest outbound;
        outbound.method = method.value();
        outbound.url = request.url;
        if (request.headers) {
            for (const auto& [name, value] : *request.headers) {
                outbound.headers[name] = value;
            }
        }
        outbound.body = request.body;

        COURIER_LOG_DEBUG_F("Forwarding %s %s", httpMethodToString(outbound.method), outbound.url.c_str());

        auto sent = transport.send(outbound);
        if (sent.isFailure()) {
            COURIER_LOG_WARNING_F("Forwarding %s %s failed: %s",
                                  httpMethodToString(outbound.method), outbound.url.c_str(),
                                  std::string(getErrorMessage(sent.error())).c_str());
            return ErrorCode::TransportFailed;
        }

        const HttpResponse& response = sent.value();

        if (response.statusCode < 0 || response.statusCode > 0xFFFF) {
            return ErrorCode::DecodeFailed;
        }

        ResponseDescriptor descriptor;
        descriptor.success = true;
        descriptor.statusCode = static_cast<uint16_t>(response.statusCode);

        for (const auto& [name, raw] : response.headers) {
            if (!Text::isHeaderName(name)) {
                COURIER_LOG_WARNING_F("Response from %s carries a malformed header name",
                                      outbound.url.c_str());
                return ErrorCode::DecodeFailed;
            }
            auto value = Text::decodeHeaderValue(raw);
            if (value.isFailure()) {
                COURIER_LOG_WARNING_F("Response header '%s' from %s is not valid text",
                                      name.c_str(), outbound.url.c_str());
                return ErrorCode::DecodeFailed;
            }
            descriptor.headers[name] = std::move(value).value();
        }

        auto body = Text::decodeUtf8(ByteSpan(response.body.data(), response.body.size()));
        if (body.isFailure()) {
            COURIER_LOG_WARNING_F("Response body from %s is not valid UTF-8", outbound.url.c_str());
            return ErrorCode::DecodeFailed;
        }
        descriptor.body = std::move(body).value();

        COURIER_LOG_DEBUG_F("%s %s -> %d (%zu bytes)", httpMethodToString(outbound.method),
                            outbound.url.c_str(), response.statusCode, descriptor.body.size());

        return descriptor;
    }
}

RequestForwarder::RequestForwarder(HttpClientConfig config, TransportFactory factory)
    : m_config(std::move(config))
    , m_factory(factory ? std::move(factory) : TransportFactory(createHttpClient)) {
    if (m_config.acceptInvalidCertificates) {
        COURIER_LOG_WARNING("TLS certificate validation is disabled for forwarded requests");
    }
}

Result<std::shared_ptr<ITransport>> RequestForwarder::acquireTransport() {
    std::lock_guard<std::mutex> lock(m_mutex);

    if (m_transport) {
        return m_transport;
    }

    auto created = m_factory(m_config);
    if (created.isFailure() || !created.value()) {
        COURIER_LOG_ERROR_F("Failed to create HTTP client: %s",
                            std::string(getErrorMessage(created.errorOr(ErrorCode::NullPointer))).c_str());
        return ErrorCode::ClientInitFailed;
    }

    m_transport = created.value();
    return m_transport;
}

Result<ResponseDescriptor> RequestForwarder::forward(const RequestDescriptor& request) {
    auto transport = acquireTransport();
    if (transport.isFailure()) {
        return transport.error();
    }
    return forwardThrough(*transport.value(), request);
}

std::future<Result<ResponseDescriptor>> RequestForwarder::forwardAsync(RequestDescriptor request) {
    std::promise<Result<ResponseDescriptor>> promise;
    auto future = promise.get_future();

    auto transport = acquireTransport();
    if (transport.isFailure()) {
        promise.set_value(Result<ResponseDescriptor>(transport.error()));
        return future;
    }

    // The worker owns the transport and the promise; nothing waits on it
    std::thread([transport = std::move(transport).value(), request = std::move(request),
                 promise = std::move(promise)]() mutable {
        promise.set_value(forwardThrough(*transport, request));
    }).detach();

    return future;
}

std::string_view describeForwardError(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::ClientInitFailed:
        case ErrorCode::InvalidMethod:
        case ErrorCode::TransportFailed:
        case ErrorCode::DecodeFailed:
            return getErrorMessage(code);
        default:
            return getErrorMessage(ErrorCode::TransportFailed);
    }
}

} // namespace Courier::Network
