/**
 * @file CommandLine.hpp
 * @brief Command-line options for the courier executable
 * @author Courier Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 Courier. All rights reserved.
 */

#pragma once

#ifndef COURIER_SHELL_COMMAND_LINE_HPP
#define COURIER_SHELL_COMMAND_LINE_HPP

#include <Courier/Core/ErrorCodes.hpp>
#include <Courier/Core/Config.hpp>
#include <Courier/Core/Logger.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace Courier::Shell {

struct CommandLineOptions {
    std::optional<std::string> configPath;     ///< --config <path>
    std::optional<uint16_t> port;              ///< --port <n>
    std::optional<Core::LogLevel> logLevel;    ///< --log-level <name>
    bool strictTls = false;                    ///< --strict-tls
    bool showHelp = false;                     ///< --help, -h
    bool showVersion = false;                  ///< --version

    /// Everything else, handed to the primary instance when one is running
    std::vector<std::string> passthrough;
};

/**
 * @brief Parse argv (argv[0] is skipped)
 *
 * Options take their value either as the next argument or after '='.
 * "--" ends option parsing.
 *
 * @return Options, or InvalidArgument for a missing or malformed value
 */
Result<CommandLineOptions> parseCommandLine(int argc, const char* const* argv);

/**
 * @brief Apply command-line overrides on top of loaded settings
 */
void applyOverrides(const CommandLineOptions& options, Config::AppConfig& config);

const char* usageText() noexcept;

} // namespace Courier::Shell

#endif // COURIER_SHELL_COMMAND_LINE_HPP
