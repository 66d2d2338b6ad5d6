/**
 * @file TextDecode.cpp
 * @brief Strict decoding of remote bytes into text
 * @author Courier Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 Courier. All rights reserved.
 */

#include <Courier/Core/TextDecode.hpp>

namespace Courier::Text {

bool isValidUtf8(std::string_view bytes) noexcept {
    const auto* p = reinterpret_cast<const unsigned char*>(bytes.data());
    const size_t size = bytes.size();
    size_t i = 0;

    while (i < size) {
        const unsigned char lead = p[i];

        if (lead < 0x80) {
            ++i;
            continue;
        }

        size_t length = 0;
        uint32_t codePoint = 0;
        uint32_t minimum = 0;

        if ((lead & 0xE0) == 0xC0) {
            length = 2;
            codePoint = lead & 0x1F;
            minimum = 0x80;
        } else if ((lead & 0xF0) == 0xE0) {
            length = 3;
            codePoint = lead & 0x0F;
            minimum = 0x800;
        } else if ((lead & 0xF8) == 0xF0) {
            length = 4;
            codePoint = lead & 0x07;
            minimum = 0x10000;
        } else {
            return false;
        }

        if (size - i < length) {
            return false;
        }

        for (size_t k = 1; k < length; ++k) {
            const unsigned char next = p[i + k];
            if ((next & 0xC0) != 0x80) {
                return false;
            }
            codePoint = (codePoint << 6) | (next & 0x3F);
        }

        if (codePoint < minimum || codePoint > 0x10FFFF ||
            (codePoint >= 0xD800 && codePoint <= 0xDFFF)) {
            return false;
        }

        i += length;
    }

    return true;
}

Result<std::string> decodeUtf8(ByteSpan bytes) {
    std::string text(reinterpret_cast<const char*>(bytes.data()), bytes.size());
    if (!isValidUtf8(text)) {
        return ErrorCode::DecodeFailed;
    }
    return text;
}

Result<std::string> decodeHeaderValue(std::string_view raw) {
    for (char ch : raw) {
        const auto c = static_cast<unsigned char>(ch);
        if (c != '\t' && (c < 0x20 || c >= 0x7F)) {
            return ErrorCode::DecodeFailed;
        }
    }
    return std::string(raw);
}

bool isHeaderName(std::string_view name) noexcept {
    if (name.empty()) {
        return false;
    }
    for (char ch : name) {
        const auto c = static_cast<unsigned char>(ch);
        const bool alnum = (c >= '0' && c <= '9') || (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z');
        if (!alnum && std::string_view("!#$%&'*+-.^_`|~").find(ch) == std::string_view::npos) {
            return false;
        }
    }
    return true;
}

} // namespace Courier::Text
