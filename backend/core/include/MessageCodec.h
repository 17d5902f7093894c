#pragma once

#include "Callout/CalloutTypes.h"
#include <string>

namespace Codec {

/**
 * @brief Encode UTF-8 text as 0x-prefixed lowercase hex calldata
 *
 * Pure and stateless; the empty string encodes to "0x".
 */
std::string Encode(const std::string &text);

/**
 * @brief Decode hex calldata back to the original UTF-8 bytes
 * @param hex Hex string with or without the 0x prefix
 * @return Decoded text, or ErrorKind::MalformedHex on odd length or a non-hex character
 */
Callout::Result<std::string> Decode(const std::string &hex);

/**
 * @brief Decide whether calldata decodes to something that reads like text
 *
 * True when printable ASCII (0x20-0x7E plus tab, LF, CR) makes up at least
 * 80% of the decoded code points. Empty or undecodable input is not text.
 */
bool IsLikelyText(const std::string &hex);

// Ratio used by IsLikelyText
constexpr double PRINTABLE_THRESHOLD = 0.8;

} // namespace Codec
