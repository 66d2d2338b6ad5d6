/**
 * @file Config.hpp
 * @brief Configuration loading for Courier
 * @author Courier Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 Courier. All rights reserved.
 *
 * Configuration files are plain key=value text. The loader protects against:
 * - Path traversal outside an allowed directory
 * - Symlink substitution between check and open
 * - Oversized files
 */

#pragma once

#ifndef COURIER_CORE_CONFIG_HPP
#define COURIER_CORE_CONFIG_HPP

#include <Courier/Core/Types.hpp>
#include <Courier/Core/ErrorCodes.hpp>
#include <Courier/Core/HttpClient.hpp>
#include <Courier/Core/Logger.hpp>
#include <cstdint>
#include <map>
#include <memory>
#include <string>
#include <variant>

namespace Courier::Config {

/**
 * @brief A parsed value
 *
 * "true"/"false" become bool, integer literals become int64_t, decimal
 * literals become double and everything else stays a string.
 */
using ConfigValue = std::variant<
    bool,
    int64_t,
    double,
    std::string
>;

using ConfigMap = std::map<std::string, ConfigValue>;

/**
 * @brief Key=value configuration loader
 *
 * - Path canonicalization
 * - Optional restriction to a directory
 * - O_NOFOLLOW open and size check on the open descriptor
 */
class ConfigLoader {
public:
    struct Options {
        size_t max_file_size = 64 * 1024;   // 64KB default
        std::string allowed_directory;      // Restrict to directory
    };

    ConfigLoader();
    explicit ConfigLoader(const Options& options);
    ~ConfigLoader();

    /**
     * @brief Load configuration from file
     * @param path Path to configuration file
     * @return Parsed configuration or error
     */
    Result<ConfigMap> load(const std::string& path);

    /**
     * @brief Parse configuration held in memory
     * @param data Configuration text
     * @return Parsed configuration or ConfigParseFailed
     */
    Result<ConfigMap> loadFromMemory(ByteSpan data);

private:
    class Impl;
    std::unique_ptr<Impl> m_impl;
};

/**
 * @brief Typed application settings
 */
struct AppConfig {
    // log.*
    Core::LogLevel logLevel = Core::LogLevel::Info;
    bool logConsole = true;
    bool logFile = true;
    bool logUi = true;
    std::string logDir;

    // bridge.*
    std::string bridgeHost = "127.0.0.1";
    uint16_t bridgePort = 0;

    // tls.* and http.*
    Network::HttpClientConfig http;

    // instance.*
    std::string runtimeDir;

    /**
     * @brief Defaults used when no configuration file is given
     *
     * Certificate validation is off, the log and runtime directories come
     * from XDG_STATE_HOME / XDG_RUNTIME_DIR with /tmp fallbacks.
     */
    static AppConfig defaults();

    /**
     * @brief Overlay parsed values on defaults()
     *
     * Unknown keys are ignored with a warning.
     *
     * @return Settings, or ConfigInvalid when a known key has a bad value
     */
    static Result<AppConfig> fromMap(const ConfigMap& map);

    /**
     * @brief Logger outputs selected by log.console, log.file and log.ui
     */
    [[nodiscard]] Core::LogOutput logOutputs() const;

    [[nodiscard]] std::string logFilePath() const;
};

} // namespace Courier::Config

#endif // COURIER_CORE_CONFIG_HPP
