/**
 * @file TextDecode.hpp
 * @brief Strict decoding of remote bytes into text
 * @author Courier Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 Courier. All rights reserved.
 *
 * Remote peers control these bytes, so every check reports
 * ErrorCode::DecodeFailed instead of truncating or replacing.
 */

#pragma once

#ifndef COURIER_CORE_TEXT_DECODE_HPP
#define COURIER_CORE_TEXT_DECODE_HPP

#include <Courier/Core/Types.hpp>
#include <Courier/Core/ErrorCodes.hpp>
#include <string>
#include <string_view>

namespace Courier::Text {

/**
 * @brief Check that bytes form well-formed UTF-8
 *
 * Rejects overlong encodings, surrogates and code points above U+10FFFF.
 */
[[nodiscard]] bool isValidUtf8(std::string_view bytes) noexcept;

/**
 * @brief Decode a body as UTF-8
 * @return The text, or ErrorCode::DecodeFailed
 */
[[nodiscard]] Result<std::string> decodeUtf8(ByteSpan bytes);

/**
 * @brief Decode a header value
 *
 * Header values are accepted only when every byte is visible ASCII or a
 * horizontal tab.
 *
 * @return The value, or ErrorCode::DecodeFailed
 */
[[nodiscard]] Result<std::string> decodeHeaderValue(std::string_view raw);

/**
 * @brief Check that a header name is a non-empty HTTP token
 */
[[nodiscard]] bool isHeaderName(std::string_view name) noexcept;

} // namespace Courier::Text

#endif // COURIER_CORE_TEXT_DECODE_HPP
