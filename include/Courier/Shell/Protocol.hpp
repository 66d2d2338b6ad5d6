/**
 * @file Protocol.hpp
 * @brief JSON shapes exchanged with the UI
 * @author Courier Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 Courier. All rights reserved.
 *
 * Request:  {"url": "...", "method": "...", "headers": {...}?, "body": "..."?}
 * Response: {"success": true, "status": 200, "headers": {...}, "body": "..."}
 */

#pragma once

#ifndef COURIER_SHELL_PROTOCOL_HPP
#define COURIER_SHELL_PROTOCOL_HPP

#include <Courier/Core/ErrorCodes.hpp>
#include <Courier/Core/RequestForwarder.hpp>
#include <nlohmann/json.hpp>
#include <string>
#include <string_view>
#include <vector>

namespace Courier::Shell {

using json = nlohmann::json;

/**
 * @brief Arguments a secondary instance hands to the primary
 */
struct InstanceNotice {
    std::vector<std::string> args;
    std::string cwd;
};

/**
 * @brief Parse a fetch request body
 *
 * `headers` must be an object of strings when present; `body` a string or
 * null.
 *
 * @return Descriptor, JsonParseFailed for malformed text, MissingField for a
 *         missing url/method, InvalidFieldType for a wrongly typed field
 */
Result<Network::RequestDescriptor> parseRequestDescriptor(std::string_view text);

json toJson(const Network::ResponseDescriptor& response);

Result<InstanceNotice> parseInstanceNotice(std::string_view text);

json toJson(const InstanceNotice& notice);

} // namespace Courier::Shell

#endif // COURIER_SHELL_PROTOCOL_HPP
