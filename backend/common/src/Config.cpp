#include "../include/Callout/Config.h"
#include "../include/Callout/Logger.h"

#include <algorithm>
#include <cctype>
#include <cstdlib>

namespace Callout {

namespace {

std::string GetEnvVar(const char* varName) {
#ifdef _WIN32
#pragma warning(push)
#pragma warning(disable : 4996) // Suppress getenv warning
#endif
    const char* envValue = std::getenv(varName);
#ifdef _WIN32
#pragma warning(pop)
#endif
    return envValue ? std::string(envValue) : std::string();
}

bool HasEnvVar(const char* varName) {
    return std::getenv(varName) != nullptr;
}

std::string ToLower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

bool IsAllDigits(const std::string& value) {
    return !value.empty() && std::all_of(value.begin(), value.end(),
                                         [](unsigned char c) { return std::isdigit(c) != 0; });
}

} // namespace

LogLevel ParseLogLevel(const std::string& name, LogLevel fallback) {
    std::string level = ToLower(name);
    if (level == "debug")
        return LogLevel::DEBUG;
    if (level == "info")
        return LogLevel::INFO;
    if (level == "warning" || level == "warn")
        return LogLevel::WARNING;
    if (level == "error")
        return LogLevel::ERROR;
    return fallback;
}

Config LoadConfigFromEnvironment() {
    Config config;

    std::string apiKey = GetEnvVar("CALLOUT_EXPLORER_API_KEY");
    if (apiKey.empty()) {
        apiKey = GetEnvVar("ETHERSCAN_API_KEY");
    }
    config.explorerApiKey = apiKey;

    // An explicitly empty CALLOUT_LOG_FILE means console-only logging
    if (HasEnvVar("CALLOUT_LOG_FILE")) {
        config.logFilePath = GetEnvVar("CALLOUT_LOG_FILE");
    }

    std::string level = GetEnvVar("CALLOUT_LOG_LEVEL");
    if (!level.empty()) {
        config.logLevel = ParseLogLevel(level, config.logLevel);
    }

    std::string console = ToLower(GetEnvVar("CALLOUT_LOG_CONSOLE"));
    config.logToConsole = (console == "1" || console == "true" || console == "yes");

    std::string chain = GetEnvVar("CALLOUT_PREFERRED_CHAIN_ID");
    if (IsAllDigits(chain) && chain.size() <= 18) {
        config.preferredChainId = std::stoull(chain);
    }

    std::string timeout = GetEnvVar("CALLOUT_HTTP_TIMEOUT_MS");
    if (IsAllDigits(timeout) && timeout.size() <= 9) {
        config.httpTimeoutMs = std::stol(timeout);
    }

    return config;
}

bool InitializeLogging(const Config& config) {
    return Logger::getInstance().initialize(config.logFilePath, config.logLevel,
                                            config.logToConsole);
}

} // namespace Callout
