#pragma once

#include "Callout/CalloutTypes.h"
#include <optional>
#include <string>

namespace SignedMessage {

/**
 * @brief A message framed as
 *   MESSAGE: "<content>"
 *   SIGNATURE: 0x<hex>
 */
struct ParsedSignedMessage {
  std::string message;
  std::string signature;  // 0x-prefixed
};

// Finds the framing anywhere in the text; nullopt if absent
std::optional<ParsedSignedMessage> ParseSignedMessage(const std::string &text);

// Quoted content of the MESSAGE/SIGNATURE framing, whatever follows SIGNATURE:
std::optional<std::string> ExtractFramedContent(const std::string &text);

// EIP-191 personal-sign recovery; nullopt unless the signature is 65 bytes with v in {0,1,27,28}
std::optional<std::string> RecoverSignedMessageAddress(const ParsedSignedMessage &parsed);

std::string FormatSignedMessage(const std::string &message, const std::string &signature);

/**
 * @brief EIP-191 sign a message
 * @param message Text to sign
 * @param privateKeyHex 32-byte key, with or without 0x
 * @return 0x-prefixed r || s || v signature with v in {27, 28}
 */
Callout::Result<std::string> SignMessage(const std::string &message,
                                         const std::string &privateKeyHex);

} // namespace SignedMessage
