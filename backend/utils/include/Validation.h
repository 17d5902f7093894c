#pragma once

#include <string>

namespace Validation {

/**
 * @brief Outcome of validating user input, with a hint on how to fix it
 */
struct ValidationResult {
    bool isValid = true;
    std::string error;
    std::string suggestion;
};

// Required 0x + 40 hex characters (input is trimmed)
ValidationResult ValidateAddress(const std::string& address);

// Optional: blank is valid; otherwise 128 or 130 hex characters, 130 starting with 04
ValidationResult ValidatePublicKey(const std::string& publicKey);

// Required 0x + 64 hex characters (input is trimmed)
ValidationResult ValidateTxHash(const std::string& txHash);

bool IsTxHash(const std::string& input);
bool IsAddress(const std::string& input);

std::string Trim(const std::string& value);

} // namespace Validation
