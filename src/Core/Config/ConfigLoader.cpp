/**
 * @file ConfigLoader.cpp
 * @brief Implementation of configuration loading
 * @author Courier Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 Courier. All rights reserved.
 */

#include <Courier/Core/Config.hpp>

#include <unistd.h>
#include <fcntl.h>
#include <sys/stat.h>
#include <stdlib.h>

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <charconv>
#include <cstdlib>
#include <filesystem>
#include <limits>
#include <sstream>

namespace Courier::Config {

class ConfigLoader::Impl {
public:
    Options options;

    explicit Impl(const Options& opts) : options(opts) {}

    Result<std::string> canonicalizePath(const std::string& path) {
        char* resolved = realpath(path.c_str(), nullptr);
        if (!resolved) {
            return errno == ENOENT ? ErrorCode::ConfigFileNotFound : ErrorCode::InvalidPath;
        }
        std::string result(resolved);
        free(resolved);
        return result;
    }

    Result<bool> isPathAllowed(const std::string& canonicalPath) {
        if (options.allowed_directory.empty()) {
            return true;  // No restriction
        }

        auto allowedResult = canonicalizePath(options.allowed_directory);
        if (allowedResult.isFailure()) {
            return ErrorCode::InvalidPath;
        }

        std::string allowed = allowedResult.value();
        if (allowed.back() != '/') {
            allowed += '/';
        }

        // "/etc/courier-evil" must not pass for "/etc/courier"
        if (canonicalPath.compare(0, allowed.length(), allowed) != 0) {
            return false;
        }

        return true;
    }

    Result<ByteBuffer> readFile(const std::string& path) {
        auto canonResult = canonicalizePath(path);
        if (canonResult.isFailure()) {
            return canonResult.error();
        }
        const std::string& canonPath = canonResult.value();

        auto allowedResult = isPathAllowed(canonPath);
        if (allowedResult.isFailure()) {
            return allowedResult.error();
        }
        if (!allowedResult.value()) {
            return ErrorCode::AccessDenied;
        }

        // O_NOFOLLOW: the canonical path must not have become a symlink since
        int fd = open(canonPath.c_str(), O_RDONLY | O_NOFOLLOW | O_CLOEXEC);
        if (fd < 0) {
            return errno == ENOENT ? ErrorCode::ConfigFileNotFound : ErrorCode::FileReadError;
        }

        // Size is taken from the open descriptor, not the path
        struct stat st;
        if (fstat(fd, &st) < 0) {
            close(fd);
            return ErrorCode::IOError;
        }

        if (!S_ISREG(st.st_mode)) {
            close(fd);
            return ErrorCode::InvalidPath;
        }

        if (static_cast<size_t>(st.st_size) > options.max_file_size) {
            close(fd);
            return ErrorCode::FileTooLarge;
        }

        ByteBuffer data(static_cast<size_t>(st.st_size));
        size_t total = 0;
        while (total < data.size()) {
            ssize_t n = read(fd, data.data() + total, data.size() - total);
            if (n < 0 && errno == EINTR) {
                continue;
            }
            if (n <= 0) {
                break;
            }
            total += static_cast<size_t>(n);
        }
        close(fd);

        if (total != data.size()) {
            return ErrorCode::FileReadError;
        }

        return data;
    }

    static ConfigValue inferValue(const std::string& text) {
        if (text == "true") {
            return true;
        }
        if (text == "false") {
            return false;
        }

        const char* first = text.data();
        const char* last = text.data() + text.size();

        int64_t integer = 0;
        auto [intEnd, intErr] = std::from_chars(first, last, integer);
        if (!text.empty() && intErr == std::errc() && intEnd == last) {
            return integer;
        }

        // strtod accepts "inf", "nan" and hex; only plain decimals qualify
        bool decimalShape = !text.empty() && text.find_first_not_of("+-.0123456789eE") == std::string::npos
                            && text.find('.') != std::string::npos;
        if (decimalShape) {
            char* end = nullptr;
            double number = std::strtod(text.c_str(), &end);
            if (end == text.c_str() + text.size()) {
                return number;
            }
        }

        return text;
    }

    Result<ConfigMap> parseConfig(ByteSpan data) {
        ConfigMap config;

        std::string content(reinterpret_cast<const char*>(data.data()), data.size());
        if (content.find('\0') != std::string::npos) {
            return ErrorCode::ConfigParseFailed;
        }

        std::istringstream stream(content);
        std::string line;

        while (std::getline(stream, line)) {
            line.erase(0, line.find_first_not_of(" \t"));

            // Skip comments and empty lines
            if (line.empty() || line[0] == '#' || line[0] == ';' || line == "\r") {
                continue;
            }

            size_t pos = line.find('=');
            if (pos == std::string::npos) {
                return ErrorCode::ConfigParseFailed;
            }

            std::string key = line.substr(0, pos);
            std::string value = line.substr(pos + 1);

            key.erase(key.find_last_not_of(" \t") + 1);
            value.erase(0, value.find_first_not_of(" \t"));
            value.erase(value.find_last_not_of(" \t\r\n") + 1);

            if (key.empty()) {
                return ErrorCode::ConfigParseFailed;
            }

            config[key] = inferValue(value);
        }

        return config;
    }
};

ConfigLoader::ConfigLoader()
    : m_impl(std::make_unique<Impl>(Options{})) {}

ConfigLoader::ConfigLoader(const Options& options)
    : m_impl(std::make_unique<Impl>(options)) {}

ConfigLoader::~ConfigLoader() = default;

Result<ConfigMap> ConfigLoader::load(const std::string& path) {
    auto dataResult = m_impl->readFile(path);
    if (dataResult.isFailure()) {
        COURIER_LOG_ERROR_F("Cannot read configuration %s: %s", path.c_str(),
                            std::string(getErrorMessage(dataResult.error())).c_str());
        return dataResult.error();
    }

    return loadFromMemory(dataResult.value());
}

Result<ConfigMap> ConfigLoader::loadFromMemory(ByteSpan data) {
    return m_impl->parseConfig(data);
}

// ============================================================================
// AppConfig
// ============================================================================

namespace {
    std::string envOr(const char* name, const std::string& fallback) {
        const char* value = std::getenv(name);
        if (value && *value) {
            return value;
        }
        return fallback;
    }

    bool readBool(const ConfigValue& value, bool& out) {
        if (const bool* b = std::get_if<bool>(&value)) {
            out = *b;
            return true;
        }
        return false;
    }

    bool readInt(const ConfigValue& value, int64_t min, int64_t max, int64_t& out) {
        const int64_t* i = std::get_if<int64_t>(&value);
        if (!i || *i < min || *i > max) {
            return false;
        }
        out = *i;
        return true;
    }

    bool readString(const ConfigValue& value, std::string& out) {
        if (const std::string* s = std::get_if<std::string>(&value)) {
            out = *s;
            return true;
        }
        return false;
    }
}

AppConfig AppConfig::defaults() {
    AppConfig config;

    std::string stateHome = envOr("XDG_STATE_HOME", "");
    if (stateHome.empty()) {
        std::string home = envOr("HOME", "");
        stateHome = home.empty() ? "/tmp" : home + "/.local/state";
    }
    config.logDir = stateHome + "/courier/logs";

    config.runtimeDir = envOr("XDG_RUNTIME_DIR", "/tmp");

    // Game servers behind the dashboard ship self-signed certificates
    config.http.acceptInvalidCertificates = true;
    config.http.maxRedirects = 15;

    return config;
}

Result<AppConfig> AppConfig::fromMap(const ConfigMap& map) {
    AppConfig config = defaults();

    for (const auto& [key, value] : map) {
        bool ok = true;
        int64_t number = 0;

        if (key == "log.level") {
            std::string name;
            ok = readString(value, name) && Core::ParseLogLevel(name, config.logLevel);
        } else if (key == "log.console") {
            ok = readBool(value, config.logConsole);
        } else if (key == "log.file") {
            ok = readBool(value, config.logFile);
        } else if (key == "log.ui") {
            ok = readBool(value, config.logUi);
        } else if (key == "log.dir") {
            ok = readString(value, config.logDir) && !config.logDir.empty();
        } else if (key == "bridge.host") {
            ok = readString(value, config.bridgeHost) && !config.bridgeHost.empty();
        } else if (key == "bridge.port") {
            ok = readInt(value, 0, std::numeric_limits<uint16_t>::max(), number);
            config.bridgePort = static_cast<uint16_t>(number);
        } else if (key == "tls.accept_invalid_certs") {
            ok = readBool(value, config.http.acceptInvalidCertificates);
        } else if (key == "http.max_redirects") {
            ok = readInt(value, 0, 50, number);
            config.http.maxRedirects = static_cast<int>(number);
        } else if (key == "http.connect_timeout_ms") {
            ok = readInt(value, 0, std::numeric_limits<int32_t>::max(), number);
            config.http.connectTimeout = Milliseconds(number);
        } else if (key == "http.timeout_ms") {
            ok = readInt(value, 0, std::numeric_limits<int32_t>::max(), number);
            config.http.requestTimeout = Milliseconds(number);
        } else if (key == "http.user_agent") {
            ok = readString(value, config.http.userAgent);
        } else if (key == "instance.runtime_dir") {
            ok = readString(value, config.runtimeDir) && !config.runtimeDir.empty();
        } else {
            COURIER_LOG_WARNING_F("Ignoring unknown configuration key '%s'", key.c_str());
        }

        if (!ok) {
            COURIER_LOG_ERROR_F("Invalid value for configuration key '%s'", key.c_str());
            return ErrorCode::ConfigInvalid;
        }
    }

    return config;
}

Core::LogOutput AppConfig::logOutputs() const {
    Core::LogOutput outputs = Core::LogOutput::None;
    if (logConsole) {
        outputs = outputs | Core::LogOutput::Console;
    }
    if (logFile) {
        outputs = outputs | Core::LogOutput::File;
    }
    if (logUi) {
        outputs = outputs | Core::LogOutput::Callback;
    }
    return outputs;
}

std::string AppConfig::logFilePath() const {
    return (std::filesystem::path(logDir) / "courier.log").string();
}

} // namespace Courier::Config
