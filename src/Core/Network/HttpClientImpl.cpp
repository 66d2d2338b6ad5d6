/**
 * @file HttpClientImpl.cpp
 * @brief HTTP client implementation using libcurl
 * @author Courier Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 Courier. All rights reserved.
 */

#include <Courier/Core/HttpClient.hpp>
#include <Courier/Core/ErrorCodes.hpp>
#include <Courier/Core/Logger.hpp>

#include <curl/curl.h>
#include <algorithm>
#include <array>
#include <cctype>
#include <cstring>
#include <mutex>
#include <new>

namespace Courier::Network {

// Defined in TlsContext.cpp
ErrorCode configureTlsVersion(CURL* curl);
ErrorCode configureTlsVerification(CURL* curl, bool verifyPeer, bool verifyHost);

// ============================================================================
// Global cURL initialization
// ============================================================================

namespace {
    std::once_flag g_curlInitFlag;
    bool g_curlInitialized = false;

    bool initializeCurl() {
        std::call_once(g_curlInitFlag, []() {
            CURLcode res = curl_global_init(CURL_GLOBAL_ALL);
            g_curlInitialized = (res == CURLE_OK);
        });
        return g_curlInitialized;
    }

    // curl_global_cleanup() is not called: it is not thread-safe and the
    // process exit reclaims everything anyway
}

// ============================================================================
// cURL callbacks
// ============================================================================

namespace {
    size_t writeCallback(void* contents, size_t size, size_t nmemb, void* userp) {
        size_t realsize = size * nmemb;
        auto* buffer = static_cast<ByteBuffer*>(userp);

        try {
            const Byte* data = static_cast<const Byte*>(contents);
            buffer->insert(buffer->end(), data, data + realsize);
            return realsize;
        } catch (const std::bad_alloc&) {
            return 0; // makes curl abort with CURLE_WRITE_ERROR
        }
    }

    // Receives every header line of every response on the handle, interim
    // 1xx responses included, so a new status line starts a fresh map.
    size_t headerCallback(char* buffer, size_t size, size_t nmemb, void* userp) {
        size_t realsize = size * nmemb;
        auto* headers = static_cast<HttpHeaders*>(userp);

        std::string header(buffer, realsize);

        if (header.rfind("HTTP/", 0) == 0) {
            headers->clear();
            return realsize;
        }

        // Parse header (format: "Name: Value\r\n")
        size_t colonPos = header.find(':');
        if (colonPos != std::string::npos && colonPos > 0) {
            std::string name = header.substr(0, colonPos);
            std::string value = header.substr(colonPos + 1);

            value.erase(0, value.find_first_not_of(" \t"));
            const size_t end = value.find_last_not_of(" \t\r\n");
            value.erase(end == std::string::npos ? 0 : end + 1);

            std::transform(name.begin(), name.end(), name.begin(),
                           [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

            (*headers)[name] = value;
        }

        return realsize;
    }

    std::string toLower(std::string value) {
        std::transform(value.begin(), value.end(), value.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return value;
    }

    bool hasHeader(const HttpHeaders& headers, const std::string& lowerName) {
        return std::any_of(headers.begin(), headers.end(), [&](const auto& entry) {
            return toLower(entry.first) == lowerName;
        });
    }

    void eraseHeader(HttpHeaders& headers, const std::string& lowerName) {
        for (auto it = headers.begin(); it != headers.end();) {
            if (toLower(it->first) == lowerName) {
                it = headers.erase(it);
            } else {
                ++it;
            }
        }
    }

    std::string hostOf(const std::string& url) {
        std::string host;
        CURLU* handle = curl_url();
        if (!handle) {
            return host;
        }
        if (curl_url_set(handle, CURLUPART_URL, url.c_str(), 0) == CURLUE_OK) {
            char* part = nullptr;
            if (curl_url_get(handle, CURLUPART_HOST, &part, 0) == CURLUE_OK && part) {
                host = toLower(part);
                curl_free(part);
            }
        }
        curl_url_cleanup(handle);
        return host;
    }

    // Only http and https are ever handed to curl, for the first request and
    // for every redirect target
    bool isWebUrl(const std::string& url) {
        bool web = false;
        CURLU* handle = curl_url();
        if (!handle) {
            return web;
        }
        if (curl_url_set(handle, CURLUPART_URL, url.c_str(), CURLU_NON_SUPPORT_SCHEME) == CURLUE_OK) {
            char* scheme = nullptr;
            if (curl_url_get(handle, CURLUPART_SCHEME, &scheme, 0) == CURLUE_OK && scheme) {
                const std::string lower = toLower(scheme);
                web = lower == "http" || lower == "https";
                curl_free(scheme);
            }
        }
        curl_url_cleanup(handle);
        return web;
    }

    bool isFollowableRedirect(int status) {
        return status == 301 || status == 302 || status == 303 ||
               status == 307 || status == 308;
    }

    ErrorCode mapCurlError(CURLcode res) {
        switch (res) {
            case CURLE_UNSUPPORTED_PROTOCOL:
            case CURLE_URL_MALFORMAT:
                return ErrorCode::InvalidUrl;
            case CURLE_COULDNT_RESOLVE_HOST:
            case CURLE_COULDNT_RESOLVE_PROXY:
                return ErrorCode::DnsResolutionFailed;
            case CURLE_COULDNT_CONNECT:
                return ErrorCode::ConnectionFailed;
            case CURLE_OPERATION_TIMEDOUT:
                return ErrorCode::Timeout;
            case CURLE_SSL_CONNECT_ERROR:
            case CURLE_SSL_CERTPROBLEM:
            case CURLE_SSL_CIPHER:
                return ErrorCode::TlsHandshakeFailed;
            case CURLE_PEER_FAILED_VERIFICATION:
                return ErrorCode::CertificateInvalid;
            case CURLE_SEND_ERROR:
            case CURLE_RECV_ERROR:
            case CURLE_GOT_NOTHING:
                return ErrorCode::ConnectionReset;
            case CURLE_WEIRD_SERVER_REPLY:
                return ErrorCode::HttpResponseInvalid;
            default:
                return ErrorCode::NetworkError;
        }
    }

    // Response of one hop plus where it points to, if anywhere
    struct Hop {
        HttpResponse response;
        std::string location;
    };
}

// ============================================================================
// HttpClient::Impl
// ============================================================================

class HttpClient::Impl {
public:
    explicit Impl(const HttpClientConfig& config) : m_config(config) {}

    ~Impl() {
        if (m_share) {
            curl_share_cleanup(m_share);
        }
    }

    Impl(const Impl&) = delete;
    Impl& operator=(const Impl&) = delete;

    ErrorCode initialize() {
        if (!initializeCurl()) {
            return ErrorCode::CurlInitFailed;
        }

        // The TLS backend must be usable with the requested policy
        const curl_version_info_data* info = curl_version_info(CURLVERSION_NOW);
        if (!info || !(info->features & CURL_VERSION_SSL)) {
            COURIER_LOG_ERROR("libcurl was built without TLS support");
            return ErrorCode::CurlInitFailed;
        }

        m_share = curl_share_init();
        if (!m_share) {
            return ErrorCode::CurlInitFailed;
        }

        if (curl_share_setopt(m_share, CURLSHOPT_LOCKFUNC, &Impl::lockShared) != CURLSHE_OK ||
            curl_share_setopt(m_share, CURLSHOPT_UNLOCKFUNC, &Impl::unlockShared) != CURLSHE_OK ||
            curl_share_setopt(m_share, CURLSHOPT_USERDATA, this) != CURLSHE_OK) {
            return ErrorCode::CurlInitFailed;
        }

        if (curl_share_setopt(m_share, CURLSHOPT_SHARE, CURL_LOCK_DATA_CONNECT) != CURLSHE_OK ||
            curl_share_setopt(m_share, CURLSHOPT_SHARE, CURL_LOCK_DATA_DNS) != CURLSHE_OK ||
            curl_share_setopt(m_share, CURLSHOPT_SHARE, CURL_LOCK_DATA_SSL_SESSION) != CURLSHE_OK) {
            return ErrorCode::CurlInitFailed;
        }

        return ErrorCode::Success;
    }

    Result<HttpResponse> send(const HttpRequest& request) {
        const auto startTime = Clock::now();

        HttpRequest current = request;
        for (int hop = 0;; ++hop) {
            if (!isWebUrl(current.url)) {
                if (hop > 0) {
                    COURIER_LOG_WARNING("Refusing redirect to a non-HTTP location");
                }
                return ErrorCode::InvalidUrl;
            }

            auto result = performOnce(current);
            if (result.isFailure()) {
                return result.error();
            }

            Hop& step = result.value();
            const bool follow = isFollowableRedirect(step.response.statusCode) &&
                                !step.location.empty() &&
                                hop < m_config.maxRedirects;
            if (!follow) {
                step.response.redirectCount = hop;
                step.response.elapsed = std::chrono::duration_cast<Milliseconds>(
                    Clock::now() - startTime);
                return std::move(step.response);
            }

            prepareRedirect(current, step.response.statusCode, step.location);
        }
    }

    const HttpClientConfig& config() const noexcept {
        return m_config;
    }

private:
    // 301/302 turn POST into GET, 303 turns everything but HEAD into GET,
    // 307/308 replay the request unchanged. Credentials do not follow a
    // redirect to another host.
    static void prepareRedirect(HttpRequest& request, int status, const std::string& location) {
        const bool toGet =
            (status == 303 && request.method != HttpMethod::HEAD) ||
            ((status == 301 || status == 302) && request.method == HttpMethod::POST);

        if (toGet) {
            request.method = HttpMethod::GET;
            request.body.reset();
            eraseHeader(request.headers, "content-type");
            eraseHeader(request.headers, "content-length");
        }

        if (hostOf(location) != hostOf(request.url)) {
            eraseHeader(request.headers, "authorization");
            eraseHeader(request.headers, "cookie");
            eraseHeader(request.headers, "proxy-authorization");
        }

        request.url = location;
    }

    Result<Hop> performOnce(const HttpRequest& request) {
        CURL* curl = curl_easy_init();
        if (!curl) {
            return ErrorCode::CurlInitFailed;
        }

        // RAII wrapper for cURL handle and header list
        struct CurlGuard {
            CURL* handle;
            curl_slist* headers = nullptr;
            ~CurlGuard() {
                if (headers) curl_slist_free_all(headers);
                if (handle) curl_easy_cleanup(handle);
            }
        } guard{curl};

        ErrorCode tlsResult = configureTlsVersion(curl);
        if (tlsResult != ErrorCode::Success) {
            return tlsResult;
        }

        const bool verify = !m_config.acceptInvalidCertificates;
        tlsResult = configureTlsVerification(curl, verify, verify);
        if (tlsResult != ErrorCode::Success) {
            return tlsResult;
        }

        curl_easy_setopt(curl, CURLOPT_SHARE, m_share);
        curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
        curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 0L);
#if LIBCURL_VERSION_NUM >= 0x075500
        if (curl_easy_setopt(curl, CURLOPT_PROTOCOLS_STR, "http,https") != CURLE_OK) {
            return ErrorCode::CurlInitFailed;
        }
#else
        if (curl_easy_setopt(curl, CURLOPT_PROTOCOLS, CURLPROTO_HTTP | CURLPROTO_HTTPS) != CURLE_OK) {
            return ErrorCode::CurlInitFailed;
        }
#endif
        curl_easy_setopt(curl, CURLOPT_URL, request.url.c_str());
        curl_easy_setopt(curl, CURLOPT_USERAGENT, m_config.userAgent.c_str());

        if (m_config.connectTimeout.count() > 0) {
            curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT_MS,
                             static_cast<long>(m_config.connectTimeout.count()));
        }
        if (m_config.requestTimeout.count() > 0) {
            curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS,
                             static_cast<long>(m_config.requestTimeout.count()));
        }

        // Body first: CURLOPT_POSTFIELDS switches the handle to POST, a custom
        // verb set afterwards replaces the verb but keeps the payload
        if (request.body) {
            curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE_LARGE,
                             static_cast<curl_off_t>(request.body->size()));
            curl_easy_setopt(curl, CURLOPT_POSTFIELDS, request.body->data());
        }

        switch (request.method) {
            case HttpMethod::GET:
                if (request.body) {
                    curl_easy_setopt(curl, CURLOPT_CUSTOMREQUEST, "GET");
                } else {
                    curl_easy_setopt(curl, CURLOPT_HTTPGET, 1L);
                }
                break;
            case HttpMethod::HEAD:
                curl_easy_setopt(curl, CURLOPT_NOBODY, 1L);
                break;
            case HttpMethod::POST:
                if (!request.body) {
                    curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, 0L);
                    curl_easy_setopt(curl, CURLOPT_POSTFIELDS, "");
                }
                break;
            default:
                curl_easy_setopt(curl, CURLOPT_CUSTOMREQUEST, httpMethodToString(request.method));
                break;
        }

        for (const auto& [name, value] : request.headers) {
            // "Name;" is how libcurl is told to send a header with no value
            std::string line = value.empty() ? name + ";" : name + ": " + value;
            curl_slist* next = curl_slist_append(guard.headers, line.c_str());
            if (!next) {
                return ErrorCode::InternalError;
            }
            guard.headers = next;
        }

        // Suppress headers libcurl would add on its own
        if (request.body && !hasHeader(request.headers, "content-type")) {
            guard.headers = curl_slist_append(guard.headers, "Content-Type:");
        }
        if (!hasHeader(request.headers, "expect")) {
            guard.headers = curl_slist_append(guard.headers, "Expect:");
        }

        if (guard.headers) {
            curl_easy_setopt(curl, CURLOPT_HTTPHEADER, guard.headers);
        }

        Hop hop;
        curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, writeCallback);
        curl_easy_setopt(curl, CURLOPT_WRITEDATA, &hop.response.body);
        curl_easy_setopt(curl, CURLOPT_HEADERFUNCTION, headerCallback);
        curl_easy_setopt(curl, CURLOPT_HEADERDATA, &hop.response.headers);

        std::array<char, CURL_ERROR_SIZE> errorBuffer{};
        curl_easy_setopt(curl, CURLOPT_ERRORBUFFER, errorBuffer.data());

        CURLcode res = curl_easy_perform(curl);
        if (res != CURLE_OK) {
            COURIER_LOG_WARNING_F("%s %s failed: %s",
                                  httpMethodToString(request.method),
                                  request.url.c_str(),
                                  errorBuffer[0] != '\0' ? errorBuffer.data() : curl_easy_strerror(res));
            return mapCurlError(res);
        }

        long httpCode = 0;
        curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &httpCode);
        hop.response.statusCode = static_cast<int>(httpCode);

        char* effectiveUrl = nullptr;
        if (curl_easy_getinfo(curl, CURLINFO_EFFECTIVE_URL, &effectiveUrl) == CURLE_OK && effectiveUrl) {
            hop.response.effectiveUrl = effectiveUrl;
        }

        char* redirectUrl = nullptr;
        if (curl_easy_getinfo(curl, CURLINFO_REDIRECT_URL, &redirectUrl) == CURLE_OK && redirectUrl) {
            hop.location = redirectUrl;
        }

        // curl leaves REDIRECT_URL unset for schemes it will not speak; keep the
        // raw target so the scheme check in send() rejects it
        if (hop.location.empty() && isFollowableRedirect(hop.response.statusCode)) {
            auto raw = hop.response.headers.find("location");
            if (raw != hop.response.headers.end()) {
                hop.location = raw->second;
            }
        }

        return hop;
    }

    static void lockShared(CURL*, curl_lock_data data, curl_lock_access, void* userptr) {
        auto* self = static_cast<Impl*>(userptr);
        self->m_shareLocks[static_cast<size_t>(data) % self->m_shareLocks.size()].lock();
    }

    static void unlockShared(CURL*, curl_lock_data data, void* userptr) {
        auto* self = static_cast<Impl*>(userptr);
        self->m_shareLocks[static_cast<size_t>(data) % self->m_shareLocks.size()].unlock();
    }

    HttpClientConfig m_config;
    CURLSH* m_share = nullptr;
    std::array<std::mutex, static_cast<size_t>(CURL_LOCK_DATA_LAST)> m_shareLocks;
};

// ============================================================================
// HttpClient public interface
// ============================================================================

Result<std::shared_ptr<HttpClient>> HttpClient::create(const HttpClientConfig& config) {
    if (config.maxRedirects < 0) {
        return ErrorCode::InvalidArgument;
    }

    auto impl = std::make_unique<Impl>(config);
    ErrorCode status = impl->initialize();
    if (status != ErrorCode::Success) {
        return status;
    }

    return std::shared_ptr<HttpClient>(new HttpClient(std::move(impl)));
}

HttpClient::HttpClient(std::unique_ptr<Impl> impl) : m_impl(std::move(impl)) {}

HttpClient::~HttpClient() = default;

Result<HttpResponse> HttpClient::send(const HttpRequest& request) {
    return m_impl->send(request);
}

const HttpClientConfig& HttpClient::config() const noexcept {
    return m_impl->config();
}

} // namespace Courier::Network
