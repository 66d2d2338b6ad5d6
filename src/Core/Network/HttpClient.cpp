/**
 * @file HttpClient.cpp
 * @brief Method tokens and response helpers
 * @author Courier Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 Courier. All rights reserved.
 */

#include <Courier/Core/HttpClient.hpp>
#include <algorithm>
#include <array>
#include <cctype>
#include <utility>

namespace Courier::Network {

namespace {
    constexpr std::array<std::pair<const char*, HttpMethod>, 9> kMethods = {{
        {"GET", HttpMethod::GET},
        {"HEAD", HttpMethod::HEAD},
        {"POST", HttpMethod::POST},
        {"PUT", HttpMethod::PUT},
        {"DELETE", HttpMethod::DELETE_},
        {"CONNECT", HttpMethod::CONNECT},
        {"OPTIONS", HttpMethod::OPTIONS},
        {"TRACE", HttpMethod::TRACE},
        {"PATCH", HttpMethod::PATCH},
    }};
}

Result<HttpMethod> parseHttpMethod(std::string_view token) {
    std::string upper(token);
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });

    for (const auto& [name, method] : kMethods) {
        if (upper == name) {
            return method;
        }
    }
    return ErrorCode::InvalidMethod;
}

const char* httpMethodToString(HttpMethod method) noexcept {
    for (const auto& [name, value] : kMethods) {
        if (value == method) {
            return name;
        }
    }
    return "GET";
}

std::string HttpResponse::getHeader(const std::string& name) const {
    std::string lowerName = name;
    std::transform(lowerName.begin(), lowerName.end(), lowerName.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    auto it = headers.find(lowerName);
    if (it != headers.end()) {
        return it->second;
    }
    return "";
}

} // namespace Courier::Network
