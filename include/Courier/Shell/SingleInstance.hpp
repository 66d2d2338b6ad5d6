/**
 * @file SingleInstance.hpp
 * @brief One Courier process per user session
 * @author Courier Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 Courier. All rights reserved.
 *
 * The primary instance holds an exclusive flock on <runtimeDir>/courier.lock
 * and records its bridge port in the file. A later instance fails to take the
 * lock, reads the port and forwards its arguments to the primary.
 */

#pragma once

#ifndef COURIER_SHELL_SINGLE_INSTANCE_HPP
#define COURIER_SHELL_SINGLE_INSTANCE_HPP

#include <Courier/Core/ErrorCodes.hpp>
#include <Courier/Shell/Protocol.hpp>
#include <cstdint>
#include <string>

namespace Courier::Shell {

/**
 * @brief Exclusive lock held for the lifetime of the primary instance
 */
class InstanceLock {
public:
    static constexpr const char* LOCK_FILE_NAME = "courier.lock";

    /**
     * @brief Try to become the primary instance
     * @param runtimeDir Directory for the lock file (created if missing)
     * @return Held lock, AlreadyRunning when another process holds it, or an
     *         IO error
     */
    static Result<InstanceLock> acquire(const std::string& runtimeDir);

    /**
     * @brief Port of the primary instance recorded in the lock file
     * @return Port, FileNotFound/FileReadError, or ConfigInvalid when the file
     *         does not hold a port
     */
    static Result<uint16_t> readPrimaryPort(const std::string& runtimeDir);

    InstanceLock(InstanceLock&& other) noexcept;
    InstanceLock& operator=(InstanceLock&& other) noexcept;
    ~InstanceLock();

    InstanceLock(const InstanceLock&) = delete;
    InstanceLock& operator=(const InstanceLock&) = delete;

    /**
     * @brief Record the bridge port for secondary instances
     */
    VoidResult publishPort(uint16_t port);

    [[nodiscard]] const std::string& path() const noexcept { return m_path; }

private:
    InstanceLock(int fd, std::string path) noexcept;

    void release() noexcept;

    int m_fd = -1;
    std::string m_path;
};

/**
 * @brief Hand a secondary instance's arguments to the primary
 * @param host Bridge host of the primary
 * @param port Bridge port of the primary
 * @return Success once the primary acknowledged the notice
 */
VoidResult notifyPrimary(const std::string& host, uint16_t port, const InstanceNotice& notice);

} // namespace Courier::Shell

#endif // COURIER_SHELL_SINGLE_INSTANCE_HPP
