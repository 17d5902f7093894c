#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace RLP {

/**
 * @brief RLP (Recursive Length Prefix) encoding utility for Ethereum transactions
 *
 * Implements RLP encoding as specified in the Ethereum Yellow Paper.
 * Used to rebuild the exact payload a sender signed so that the signer's
 * public key can be recovered from the signature.
 */
class Encoder {
public:
    /**
     * @brief Encode a byte array
     * @param data Input data
     * @return RLP-encoded data
     */
    static std::vector<uint8_t> EncodeBytes(const std::vector<uint8_t>& data);

    /**
     * @brief Encode an unsigned integer (converts to minimal big-endian bytes)
     * @param value Input value
     * @return RLP-encoded data
     */
    static std::vector<uint8_t> EncodeUInt(uint64_t value);

    /**
     * @brief Encode a hex quantity of any width ("0x0", "0x1bc16d674ec80000", ...)
     *
     * Leading zero bytes are stripped so zero encodes as the empty string.
     * @param hex Hex string, with or without 0x
     * @return RLP-encoded data, or nullopt if hex has no digits or non-hex characters
     */
    static std::optional<std::vector<uint8_t>> EncodeQuantity(const std::string& hex);

    /**
     * @brief Encode a hex byte string (addresses, calldata, storage keys) as-is
     * @param hex Hex string, with or without 0x
     * @return RLP-encoded data, or nullopt if hex contains non-hex characters
     */
    static std::optional<std::vector<uint8_t>> EncodeHex(const std::string& hex);

    /**
     * @brief Encode a list of items
     * @param items Vector of RLP-encoded items
     * @return RLP-encoded list
     */
    static std::vector<uint8_t> EncodeList(const std::vector<std::vector<uint8_t>>& items);

    /**
     * @brief Convert hex string to bytes (removes 0x prefix, left-pads odd lengths)
     * @param hex Hex string
     * @param out Byte vector
     * @return false if a non-hex character is present
     */
    static bool HexToBytes(const std::string& hex, std::vector<uint8_t>& out);

    /**
     * @brief Convert bytes to hex string (adds 0x prefix)
     */
    static std::string BytesToHex(const std::vector<uint8_t>& data);

private:
    static std::vector<uint8_t> encodeRaw(const std::vector<uint8_t>& data);

    /**
     * @brief Convert uint64 to big-endian byte representation (minimal encoding)
     */
    static std::vector<uint8_t> toBigEndian(uint64_t value);

    /**
     * @brief Encode the length prefix of a payload
     * @param length Length to encode
     * @param offset Offset value (0x80 for strings, 0xc0 for lists)
     * @return Length prefix
     */
    static std::vector<uint8_t> encodeLength(size_t length, uint8_t offset);
};

} // namespace RLP
