/**
 * @file ErrorCodes.cpp
 * @brief Human-readable text for error codes and categories
 * @author Courier Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 Courier. All rights reserved.
 */

#include <Courier/Core/ErrorCodes.hpp>

namespace Courier {

std::string_view getErrorMessage(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::Success:              return "Success";

        case ErrorCode::SystemError:          return "System error";
        case ErrorCode::Timeout:              return "Operation timed out";
        case ErrorCode::Cancelled:            return "Operation was cancelled";
        case ErrorCode::AlreadyRunning:       return "Another instance is already running";

        case ErrorCode::NetworkError:         return "Network error";
        case ErrorCode::ConnectionFailed:     return "Failed to connect to server";
        case ErrorCode::ConnectionReset:      return "Connection was reset";
        case ErrorCode::DnsResolutionFailed:  return "DNS resolution failed";
        case ErrorCode::TlsHandshakeFailed:   return "TLS handshake failed";
        case ErrorCode::HttpRequestFailed:    return "HTTP request failed";
        case ErrorCode::HttpResponseInvalid:  return "Invalid HTTP response";
        case ErrorCode::InvalidUrl:           return "Malformed or unsupported URL";
        case ErrorCode::CurlInitFailed:       return "cURL initialization failed";
        case ErrorCode::CertificateInvalid:   return "Peer certificate validation failed";
        case ErrorCode::BindFailed:           return "Failed to bind listener";

        case ErrorCode::ClientInitFailed:     return "Failed to create HTTP client.";
        case ErrorCode::InvalidMethod:        return "Invalid HTTP method.";
        case ErrorCode::TransportFailed:      return "Failed to send HTTP request.";
        case ErrorCode::DecodeFailed:         return "Failed to decode HTTP response.";

        case ErrorCode::ConfigError:          return "Configuration error";
        case ErrorCode::ConfigMissing:        return "Missing required configuration";
        case ErrorCode::ConfigInvalid:        return "Invalid configuration value";
        case ErrorCode::ConfigFileNotFound:   return "Configuration file not found";
        case ErrorCode::ConfigParseFailed:    return "Configuration parse error";

        case ErrorCode::IOError:              return "I/O error";
        case ErrorCode::FileNotFound:         return "File not found";
        case ErrorCode::FileReadError:        return "File read error";
        case ErrorCode::FileWriteError:       return "File write error";
        case ErrorCode::FileTooLarge:         return "File too large";
        case ErrorCode::InvalidPath:          return "Invalid file path";
        case ErrorCode::AccessDenied:         return "Access denied";

        case ErrorCode::ParseError:           return "Parse error";
        case ErrorCode::JsonParseFailed:      return "JSON parse error";
        case ErrorCode::JsonInvalid:          return "Invalid JSON structure";
        case ErrorCode::MissingField:         return "Missing required field";
        case ErrorCode::InvalidFieldType:     return "Invalid field type";

        case ErrorCode::InternalError:        return "Internal error";
        case ErrorCode::NotImplemented:       return "Not implemented";
        case ErrorCode::InvalidState:         return "Invalid state";
        case ErrorCode::NullPointer:          return "Null pointer";
        case ErrorCode::InvalidArgument:      return "Invalid argument";
    }
    return "Unknown error";
}

std::string_view getCategoryName(ErrorCategory category) noexcept {
    switch (category) {
        case ErrorCategory::None:     return "None";
        case ErrorCategory::System:   return "System";
        case ErrorCategory::Network:  return "Network";
        case ErrorCategory::Forward:  return "Forward";
        case ErrorCategory::Config:   return "Config";
        case ErrorCategory::IO:       return "IO";
        case ErrorCategory::Parse:    return "Parse";
        case ErrorCategory::Internal: return "Internal";
    }
    return "Unknown";
}

} // namespace Courier
