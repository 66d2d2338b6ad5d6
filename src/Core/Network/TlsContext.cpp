/**
 * @file TlsContext.cpp
 * @brief TLS settings applied to every transport handle
 * @author Courier Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 Courier. All rights reserved.
 *
 * Certificate validation can be switched off per client. That mode trusts
 * any certificate the peer presents and any host name it claims.
 */

#include <Courier/Core/HttpClient.hpp>
#include <Courier/Core/ErrorCodes.hpp>
#include <curl/curl.h>

namespace Courier::Network {

/**
 * @brief Configure cURL handle for TLS 1.2+ minimum
 * @param curl The cURL handle to configure
 * @return Success or error code
 */
ErrorCode configureTlsVersion(CURL* curl) {
    if (!curl) {
        return ErrorCode::InvalidArgument;
    }

    CURLcode res = curl_easy_setopt(curl, CURLOPT_SSLVERSION, CURL_SSLVERSION_TLSv1_2);
    if (res != CURLE_OK) {
        return ErrorCode::TlsHandshakeFailed;
    }

    return ErrorCode::Success;
}

/**
 * @brief Configure SSL/TLS verification options
 * @param curl The cURL handle to configure
 * @param verifyPeer Whether to verify peer certificate
 * @param verifyHost Whether to verify hostname
 * @return Success or error code
 */
ErrorCode configureTlsVerification(CURL* curl, bool verifyPeer, bool verifyHost) {
    if (!curl) {
        return ErrorCode::InvalidArgument;
    }

    if (curl_easy_setopt(curl, CURLOPT_SSL_VERIFYPEER, verifyPeer ? 1L : 0L) != CURLE_OK) {
        return ErrorCode::TlsHandshakeFailed;
    }

    if (curl_easy_setopt(curl, CURLOPT_SSL_VERIFYHOST, verifyHost ? 2L : 0L) != CURLE_OK) {
        return ErrorCode::TlsHandshakeFailed;
    }

    return ErrorCode::Success;
}

} // namespace Courier::Network
