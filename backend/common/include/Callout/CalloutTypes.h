#pragma once

#include <chrono>
#include <cstdint>
#include <string>

namespace Callout {

/**
 * @brief Stable failure kinds shared by every module
 *
 * Callers discriminate retryable (network/availability) failures from
 * cryptographic and validation failures with IsRetryable().
 */
enum class ErrorKind {
    None = 0,
    EmptyInput,
    MalformedHex,
    NetworkError,
    MissingApiKey,
    TransactionNotFound,
    TransactionNotFoundOnAnyNetwork,
    SignatureRecoveryFailed,
    AddressMismatch,
    NoOutgoingTransactionsFound,
    UnsupportedChain,
    InvalidPublicKey,
    InvalidPrivateKey,
    DecryptionFailed,
    NotAnEncryptedPayload,
    EncryptionFailed
};

/**
 * @brief Result wrapper for fallible operations
 */
template<typename T>
struct Result {
    bool success;
    std::string errorMessage;
    T data;
    ErrorKind errorKind;

    Result() : success(false), data(), errorKind(ErrorKind::None) {}
    Result(const T& value) : success(true), data(value), errorKind(ErrorKind::None) {}
    Result(ErrorKind kind, const std::string& error)
        : success(false), errorMessage(error), data(), errorKind(kind) {}

    operator bool() const { return success; }
    const T& operator*() const { return data; }
    T& operator*() { return data; }
    const T* operator->() const { return &data; }
    T* operator->() { return &data; }

    bool hasValue() const { return success; }
    const std::string& error() const { return errorMessage; }
    ErrorKind kind() const { return errorKind; }
};

/**
 * @brief Log levels
 */
enum class LogLevel {
    DEBUG = 0,
    INFO = 1,
    WARNING = 2,
    ERROR = 3
};

/**
 * @brief Log entry structure
 */
struct LogEntry {
    std::chrono::system_clock::time_point timestamp;
    LogLevel level;
    std::string component;
    std::string message;
    std::string details;

    LogEntry(LogLevel lvl, const std::string& comp, const std::string& msg, const std::string& det = "")
        : timestamp(std::chrono::system_clock::now()), level(lvl), component(comp), message(msg), details(det) {}
};

} // namespace Callout
