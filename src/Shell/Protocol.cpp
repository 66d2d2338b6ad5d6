/**
 * @file Protocol.cpp
 * @brief JSON conversion for bridge payloads
 * @author Courier Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 Courier. All rights reserved.
 */

#include <Courier/Shell/Protocol.hpp>

namespace Courier::Shell {

namespace {
    ErrorCode parseObject(std::string_view text, json& data) {
        data = json::parse(text.begin(), text.end(), nullptr, false);
        if (data.is_discarded()) {
            return ErrorCode::JsonParseFailed;
        }
        if (!data.is_object()) {
            return ErrorCode::JsonInvalid;
        }
        return ErrorCode::Success;
    }
}

Result<Network::RequestDescriptor> parseRequestDescriptor(std::string_view text) {
    json data;
    ErrorCode parsed = parseObject(text, data);
    if (isFailure(parsed)) {
        return parsed;
    }

    if (!data.contains("url") || !data.contains("method")) {
        return ErrorCode::MissingField;
    }
    if (!data["url"].is_string() || !data["method"].is_string()) {
        return ErrorCode::InvalidFieldType;
    }

    Network::RequestDescriptor request;
    request.url = data["url"].get<std::string>();
    request.method = data["method"].get<std::string>();

    if (data.contains("headers") && !data["headers"].is_null()) {
        const json& headers = data["headers"];
        if (!headers.is_object()) {
            return ErrorCode::InvalidFieldType;
        }

        std::map<std::string, std::string> map;
        for (auto it = headers.begin(); it != headers.end(); ++it) {
            if (!it.value().is_string()) {
                return ErrorCode::InvalidFieldType;
            }
            map[it.key()] = it.value().get<std::string>();
        }
        request.headers = std::move(map);
    }

    if (data.contains("body") && !data["body"].is_null()) {
        if (!data["body"].is_string()) {
            return ErrorCode::InvalidFieldType;
        }
        request.body = data["body"].get<std::string>();
    }

    return request;
}

json toJson(const Network::ResponseDescriptor& response) {
    json out;
    out["success"] = response.success;
    out["status"] = response.statusCode;
    out["headers"] = response.headers;
    out["body"] = response.body;
    return out;
}

Result<InstanceNotice> parseInstanceNotice(std::string_view text) {
    json data;
    ErrorCode parsed = parseObject(text, data);
    if (isFailure(parsed)) {
        return parsed;
    }

    InstanceNotice notice;

    if (data.contains("args")) {
        if (!data["args"].is_array()) {
            return ErrorCode::InvalidFieldType;
        }
        for (const auto& arg : data["args"]) {
            if (!arg.is_string()) {
                return ErrorCode::InvalidFieldType;
            }
            notice.args.push_back(arg.get<std::string>());
        }
    }

    if (data.contains("cwd")) {
        if (!data["cwd"].is_string()) {
            return ErrorCode::InvalidFieldType;
        }
        notice.cwd = data["cwd"].get<std::string>();
    }

    return notice;
}

json toJson(const InstanceNotice& notice) {
    json out;
    out["args"] = notice.args;
    out["cwd"] = notice.cwd;
    return out;
}

} // namespace Courier::Shell
