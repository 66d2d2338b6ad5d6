/**
 * @file main.cpp
 * @brief Courier backend entry point
 * @author Courier Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 Courier. All rights reserved.
 */

#include <Courier/Core/Config.hpp>
#include <Courier/Core/Logger.hpp>
#include <Courier/Core/RequestForwarder.hpp>
#include <Courier/Core/Types.hpp>
#include <Courier/Shell/CommandBridge.hpp>
#include <Courier/Shell/CommandLine.hpp>
#include <Courier/Shell/EventBus.hpp>
#include <Courier/Shell/SingleInstance.hpp>

#include <chrono>
#include <csignal>
#include <cstdio>
#include <filesystem>
#include <system_error>

#include <pthread.h>
#include <signal.h>

using namespace Courier;

namespace {

/**
 * @brief Settings from --config, or defaults
 */
Result<Config::AppConfig> loadSettings(const Shell::CommandLineOptions& options) {
    if (!options.configPath) {
        return Config::AppConfig::defaults();
    }

    Config::ConfigLoader loader;
    auto map = loader.load(*options.configPath);
    if (map.isFailure()) {
        return map.error();
    }
    return Config::AppConfig::fromMap(map.value());
}

/**
 * @brief Route log lines to the console, the log file and the UI
 */
void initializeLogging(const Config::AppConfig& config, Shell::EventBus& events) {
    auto& logger = Core::Logger::Instance();
    if (!logger.Initialize(config.logLevel, config.logOutputs(), config.logFilePath())) {
        std::fprintf(stderr, "courier: log file %s unavailable, logging to console only\n",
                     config.logFilePath().c_str());
        if (!logger.Initialize(config.logLevel, Core::LogOutput::Console | Core::LogOutput::Callback)) {
            std::fputs("courier: logging unavailable\n", stderr);
        }
    }

    logger.SetCallback([&events](Core::LogLevel level, std::string_view message,
                                 std::chrono::system_clock::time_point timestamp) {
        Shell::json payload;
        payload["level"] = Core::LogLevelName(level);
        payload["message"] = std::string(message);
        payload["timestamp"] = std::chrono::duration_cast<std::chrono::milliseconds>(
            timestamp.time_since_epoch()).count();
        events.emit(Shell::LOG_EVENT, std::move(payload));
    });
}

/**
 * @brief Forward our arguments to the running primary instance
 */
int handOffToPrimary(const Config::AppConfig& config, const Shell::CommandLineOptions& options) {
    auto port = Shell::InstanceLock::readPrimaryPort(config.runtimeDir);
    if (port.isFailure()) {
        COURIER_LOG_ERROR("Another instance holds the lock but has not published its port");
        return 1;
    }

    Shell::InstanceNotice notice;
    notice.args = options.passthrough;
    std::error_code ec;
    notice.cwd = std::filesystem::current_path(ec).string();

    auto result = Shell::notifyPrimary(config.bridgeHost, port.value(), notice);
    if (result.isFailure()) {
        COURIER_LOG_ERROR_F("Could not notify primary instance: %s",
                            std::string(getErrorMessage(result.error())).c_str());
        return 1;
    }

    COURIER_LOG_INFO_F("Handed off to primary instance on port %u",
                       static_cast<unsigned>(port.value()));
    return 0;
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    auto parsed = Shell::parseCommandLine(argc, argv);
    if (parsed.isFailure()) {
        std::fputs(Shell::usageText(), stderr);
        return 2;
    }
    const Shell::CommandLineOptions& options = parsed.value();

    if (options.showHelp) {
        std::fputs(Shell::usageText(), stdout);
        return 0;
    }
    if (options.showVersion) {
        std::printf("courier %s\n", VERSION_STRING);
        return 0;
    }

    // Block before any thread starts so only the sigwait below sees them
    sigset_t stopSignals;
    sigemptyset(&stopSignals);
    sigaddset(&stopSignals, SIGINT);
    sigaddset(&stopSignals, SIGTERM);
    pthread_sigmask(SIG_BLOCK, &stopSignals, nullptr);

    auto settings = loadSettings(options);
    if (settings.isFailure()) {
        std::fprintf(stderr, "courier: invalid configuration: %s\n",
                     std::string(getErrorMessage(settings.error())).c_str());
        return 1;
    }
    Config::AppConfig config = settings.value();
    Shell::applyOverrides(options, config);

    Shell::EventBus events;
    initializeLogging(config, events);

    COURIER_LOG_INFO_F("Courier %s starting", VERSION_STRING);

    auto lock = Shell::InstanceLock::acquire(config.runtimeDir);
    if (lock.isFailure()) {
        int code = 1;
        if (lock.error() == ErrorCode::AlreadyRunning) {
            code = handOffToPrimary(config, options);
        } else {
            COURIER_LOG_CRITICAL("Cannot take the single-instance lock");
        }
        Core::Logger::Instance().Shutdown();
        return code;
    }

    Network::RequestForwarder forwarder(config.http);
    Shell::CommandBridge bridge(forwarder, events);

    auto port = bridge.start(config.bridgeHost, config.bridgePort);
    if (port.isFailure()) {
        COURIER_LOG_CRITICAL_F("Cannot start command bridge: %s",
                               std::string(getErrorMessage(port.error())).c_str());
        Core::Logger::Instance().Shutdown();
        return 1;
    }

    auto published = lock.value().publishPort(port.value());
    if (published.isFailure()) {
        COURIER_LOG_WARNING("Could not record bridge port; secondary instances cannot hand off");
    }

    int received = 0;
    if (sigwait(&stopSignals, &received) != 0) {
        COURIER_LOG_ERROR("sigwait failed, shutting down");
    } else {
        COURIER_LOG_INFO_F("Received signal %d, shutting down", received);
    }

    bridge.stop();
    Core::Logger::Instance().Shutdown();
    return 0;
}
