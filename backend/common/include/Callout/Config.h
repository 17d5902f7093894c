#pragma once

#include "CalloutTypes.h"
#include <cstdint>
#include <optional>
#include <string>

namespace Callout {

// Runtime configuration
struct Config {
  std::string explorerApiKey;            // Etherscan-compatible API key
  std::string logFilePath = "callout.log";
  LogLevel logLevel = LogLevel::INFO;
  bool logToConsole = false;
  std::optional<uint64_t> preferredChainId;
  long httpTimeoutMs = 10000;            // Applied by the HTTP transport only
};

// Load configuration from environment variables
// Expected variables:
//   CALLOUT_EXPLORER_API_KEY (falls back to ETHERSCAN_API_KEY)
//   CALLOUT_LOG_FILE (default: callout.log, empty for console only)
//   CALLOUT_LOG_LEVEL (debug|info|warning|error)
//   CALLOUT_LOG_CONSOLE (1/true to echo log lines to stderr)
//   CALLOUT_PREFERRED_CHAIN_ID (chain to try first during address recovery)
//   CALLOUT_HTTP_TIMEOUT_MS (default: 10000)
Config LoadConfigFromEnvironment();

// Parse a level name, returning fallback for anything unrecognized
LogLevel ParseLogLevel(const std::string &name, LogLevel fallback = LogLevel::INFO);

// Initialize the process logger from a loaded configuration
bool InitializeLogging(const Config &config);

} // namespace Callout
