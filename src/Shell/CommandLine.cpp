/**
 * @file CommandLine.cpp
 * @brief Command-line parsing
 * @author Courier Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 Courier. All rights reserved.
 */

#include <Courier/Shell/CommandLine.hpp>
#include <charconv>
#include <string_view>

namespace Courier::Shell {

namespace {
    /**
     * @brief Split "--name=value" or take the value from the next argument
     * @return false when the option expects a value and none is available
     */
    bool takeValue(std::string_view arg, std::string_view name, int argc,
                   const char* const* argv, int& index, std::string& value) {
        if (arg.size() > name.size() && arg[name.size()] == '=') {
            value = std::string(arg.substr(name.size() + 1));
            return true;
        }
        if (index + 1 >= argc) {
            return false;
        }
        value = argv[++index];
        return true;
    }

    bool matches(std::string_view arg, std::string_view name) {
        return arg == name || (arg.size() > name.size() && arg.compare(0, name.size(), name) == 0
                               && arg[name.size()] == '=');
    }
}

Result<CommandLineOptions> parseCommandLine(int argc, const char* const* argv) {
    CommandLineOptions options;
    bool optionsEnded = false;

    for (int i = 1; i < argc; ++i) {
        std::string_view arg(argv[i]);

        if (optionsEnded) {
            options.passthrough.emplace_back(arg);
            continue;
        }

        if (arg == "--") {
            optionsEnded = true;
        } else if (arg == "--help" || arg == "-h") {
            options.showHelp = true;
        } else if (arg == "--version") {
            options.showVersion = true;
        } else if (arg == "--strict-tls") {
            options.strictTls = true;
        } else if (matches(arg, "--config")) {
            std::string value;
            if (!takeValue(arg, "--config", argc, argv, i, value) || value.empty()) {
                return ErrorCode::InvalidArgument;
            }
            options.configPath = value;
        } else if (matches(arg, "--port")) {
            std::string value;
            if (!takeValue(arg, "--port", argc, argv, i, value)) {
                return ErrorCode::InvalidArgument;
            }
            uint16_t port = 0;
            auto [end, err] = std::from_chars(value.data(), value.data() + value.size(), port);
            if (value.empty() || err != std::errc() || end != value.data() + value.size()) {
                return ErrorCode::InvalidArgument;
            }
            options.port = port;
        } else if (matches(arg, "--log-level")) {
            std::string value;
            Core::LogLevel level = Core::LogLevel::Info;
            if (!takeValue(arg, "--log-level", argc, argv, i, value) || !Core::ParseLogLevel(value, level)) {
                return ErrorCode::InvalidArgument;
            }
            options.logLevel = level;
        } else {
            options.passthrough.emplace_back(arg);
        }
    }

    return options;
}

void applyOverrides(const CommandLineOptions& options, Config::AppConfig& config) {
    if (options.port) {
        config.bridgePort = *options.port;
    }
    if (options.logLevel) {
        config.logLevel = *options.logLevel;
    }
    if (options.strictTls) {
        config.http.acceptInvalidCertificates = false;
    }
}

const char* usageText() noexcept {
    return "Usage: courier [options] [args...]\n"
           "\n"
           "Options:\n"
           "  --config <path>      Load settings from a key=value file\n"
           "  --port <n>           Bridge port (0 picks a free port)\n"
           "  --log-level <name>   trace, debug, info, warning, error, critical, off\n"
           "  --strict-tls         Validate server certificates\n"
           "  --version            Print version and exit\n"
           "  -h, --help           Print this help and exit\n";
}

} // namespace Courier::Shell
