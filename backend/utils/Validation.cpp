#include "include/Validation.h"

#include <cctype>
#include <regex>

namespace Validation {

namespace {

ValidationResult Invalid(const std::string& error, const std::string& suggestion) {
    ValidationResult result;
    result.isValid = false;
    result.error = error;
    result.suggestion = suggestion;
    return result;
}

bool StartsWith0x(const std::string& value) {
    return value.size() >= 2 && value[0] == '0' && value[1] == 'x';
}

} // namespace

std::string Trim(const std::string& value) {
    size_t start = 0;
    while (start < value.size() && std::isspace(static_cast<unsigned char>(value[start]))) {
        ++start;
    }
    size_t end = value.size();
    while (end > start && std::isspace(static_cast<unsigned char>(value[end - 1]))) {
        --end;
    }
    return value.substr(start, end - start);
}

ValidationResult ValidateAddress(const std::string& address) {
    std::string trimmed = Trim(address);

    if (trimmed.empty()) {
        return Invalid("Address is required", "Enter a valid Ethereum address (0x...)");
    }

    if (!StartsWith0x(trimmed)) {
        return Invalid("Address must start with 0x", "Prepend 0x to the address");
    }

    if (trimmed.size() != 42) {
        return Invalid("Address must be 42 characters (got " + std::to_string(trimmed.size()) + ")",
                       trimmed.size() < 42 ? "Address is too short" : "Address is too long");
    }

    if (!IsAddress(trimmed)) {
        return Invalid("Address contains invalid characters",
                       "Only hexadecimal characters (0-9, a-f) are allowed after 0x");
    }

    return ValidationResult();
}

ValidationResult ValidatePublicKey(const std::string& publicKey) {
    std::string trimmed = Trim(publicKey);

    if (trimmed.empty()) {
        return ValidationResult();  // Optional field
    }

    std::string hex = StartsWith0x(trimmed) ? trimmed.substr(2) : trimmed;

    if (hex.size() != 128 && hex.size() != 130) {
        return Invalid("Public key must be 128 or 130 hex characters (got " +
                           std::to_string(hex.size()) + ")",
                       "Export your uncompressed public key from your wallet");
    }

    for (char c : hex) {
        if (!std::isxdigit(static_cast<unsigned char>(c))) {
            return Invalid("Public key contains invalid characters",
                           "Only hexadecimal characters (0-9, a-f) are allowed");
        }
    }

    if (hex.size() == 130 && hex.compare(0, 2, "04") != 0) {
        return Invalid("Uncompressed public key must start with 04",
                       "Make sure you exported the uncompressed format");
    }

    return ValidationResult();
}

ValidationResult ValidateTxHash(const std::string& txHash) {
    std::string trimmed = Trim(txHash);

    if (trimmed.empty()) {
        return Invalid("Transaction hash is required", "Enter a valid transaction hash (0x...)");
    }

    if (!StartsWith0x(trimmed)) {
        return Invalid("Transaction hash must start with 0x", "Prepend 0x to the hash");
    }

    if (trimmed.size() != 66) {
        return Invalid("Transaction hash must be 66 characters (got " +
                           std::to_string(trimmed.size()) + ")",
                       trimmed.size() < 66 ? "Hash is too short" : "Hash is too long");
    }

    if (!IsTxHash(trimmed)) {
        return Invalid("Transaction hash contains invalid characters",
                       "Only hexadecimal characters (0-9, a-f) are allowed after 0x");
    }

    return ValidationResult();
}

bool IsTxHash(const std::string& input) {
    static const std::regex pattern("^0x[0-9a-fA-F]{64}$");
    return std::regex_match(Trim(input), pattern);
}

bool IsAddress(const std::string& input) {
    static const std::regex pattern("^0x[a-fA-F0-9]{40}$");
    return std::regex_match(Trim(input), pattern);
}

} // namespace Validation
