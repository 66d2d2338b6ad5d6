/**
 * @file SingleInstance.cpp
 * @brief flock-based single-instance guard
 * @author Courier Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 Courier. All rights reserved.
 */

#include <Courier/Shell/SingleInstance.hpp>
#include <Courier/Core/HttpClient.hpp>
#include <Courier/Core/Logger.hpp>

#include <fcntl.h>
#include <sys/file.h>
#include <sys/stat.h>
#include <unistd.h>

#include <cerrno>
#include <charconv>
#include <filesystem>
#include <system_error>

namespace Courier::Shell {

namespace {
    std::string lockPath(const std::string& runtimeDir) {
        return (std::filesystem::path(runtimeDir) / InstanceLock::LOCK_FILE_NAME).string();
    }
}

InstanceLock::InstanceLock(int fd, std::string path) noexcept
    : m_fd(fd)
    , m_path(std::move(path)) {}

InstanceLock::InstanceLock(InstanceLock&& other) noexcept
    : m_fd(other.m_fd)
    , m_path(std::move(other.m_path)) {
    other.m_fd = -1;
}

InstanceLock& InstanceLock::operator=(InstanceLock&& other) noexcept {
    if (this != &other) {
        release();
        m_fd = other.m_fd;
        m_path = std::move(other.m_path);
        other.m_fd = -1;
    }
    return *this;
}

InstanceLock::~InstanceLock() {
    release();
}

void InstanceLock::release() noexcept {
    if (m_fd >= 0) {
        // Closing the descriptor drops the flock
        close(m_fd);
        m_fd = -1;
    }
}

Result<InstanceLock> InstanceLock::acquire(const std::string& runtimeDir) {
    std::error_code ec;
    std::filesystem::create_directories(runtimeDir, ec);
    if (ec) {
        COURIER_LOG_ERROR_F("Cannot create runtime directory %s: %s",
                            runtimeDir.c_str(), ec.message().c_str());
        return ErrorCode::FileWriteError;
    }

    std::string path = lockPath(runtimeDir);

    int fd = open(path.c_str(), O_RDWR | O_CREAT | O_NOFOLLOW | O_CLOEXEC, 0600);
    if (fd < 0) {
        int err = errno;
        COURIER_LOG_ERROR_F("Cannot open lock file %s (errno %d)", path.c_str(), err);
        return err == EACCES ? ErrorCode::AccessDenied : ErrorCode::IOError;
    }

    if (flock(fd, LOCK_EX | LOCK_NB) != 0) {
        int err = errno;
        close(fd);
        if (err == EWOULDBLOCK) {
            return ErrorCode::AlreadyRunning;
        }
        return ErrorCode::IOError;
    }

    return InstanceLock(fd, std::move(path));
}

VoidResult InstanceLock::publishPort(uint16_t port) {
    if (m_fd < 0) {
        return ErrorCode::InvalidState;
    }

    std::string text = std::to_string(port) + "\n";

    if (ftruncate(m_fd, 0) != 0) {
        return ErrorCode::FileWriteError;
    }

    ssize_t written = pwrite(m_fd, text.data(), text.size(), 0);
    if (written != static_cast<ssize_t>(text.size())) {
        return ErrorCode::FileWriteError;
    }

    if (fsync(m_fd) != 0) {
        return ErrorCode::FileWriteError;
    }
    return VoidResult::Success();
}

Result<uint16_t> InstanceLock::readPrimaryPort(const std::string& runtimeDir) {
    std::string path = lockPath(runtimeDir);

    int fd = open(path.c_str(), O_RDONLY | O_NOFOLLOW | O_CLOEXEC);
    if (fd < 0) {
        return errno == ENOENT ? ErrorCode::FileNotFound : ErrorCode::FileReadError;
    }

    char buffer[16] = {};
    ssize_t n = read(fd, buffer, sizeof(buffer) - 1);
    close(fd);

    if (n <= 0) {
        return ErrorCode::FileReadError;
    }

    const char* first = buffer;
    const char* last = buffer + n;
    while (last > first && (last[-1] == '\n' || last[-1] == '\r' || last[-1] == ' ')) {
        --last;
    }

    uint16_t port = 0;
    auto [end, err] = std::from_chars(first, last, port);
    if (err != std::errc() || end != last || port == 0) {
        return ErrorCode::ConfigInvalid;
    }

    return port;
}

VoidResult notifyPrimary(const std::string& host, uint16_t port, const InstanceNotice& notice) {
    Network::HttpClientConfig config;
    config.maxRedirects = 0;
    config.connectTimeout = Milliseconds(2000);
    config.requestTimeout = Milliseconds(5000);

    auto client = Network::HttpClient::create(config);
    if (client.isFailure()) {
        return client.error();
    }

    Network::HttpRequest request;
    request.method = Network::HttpMethod::POST;
    request.url = "http://" + host + ":" + std::to_string(port) + "/instance/activate";
    request.headers["Content-Type"] = "application/json";
    // argv and the working directory are raw bytes; invalid UTF-8 becomes U+FFFD
    request.body = toJson(notice).dump(-1, ' ', false, json::error_handler_t::replace);

    auto response = client.value()->send(request);
    if (response.isFailure()) {
        COURIER_LOG_WARNING_F("Primary instance on port %u did not answer: %s",
                              static_cast<unsigned>(port),
                              std::string(getErrorMessage(response.error())).c_str());
        return response.error();
    }

    if (!response.value().isSuccess()) {
        COURIER_LOG_WARNING_F("Primary instance rejected activation with status %d",
                              response.value().statusCode);
        return ErrorCode::HttpRequestFailed;
    }

    return VoidResult::Success();
}

} // namespace Courier::Shell
