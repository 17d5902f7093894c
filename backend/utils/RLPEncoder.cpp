#include "include/RLPEncoder.h"
#include <cctype>
#include <iomanip>
#include <sstream>

namespace RLP {

std::vector<uint8_t> Encoder::EncodeBytes(const std::vector<uint8_t>& data) {
    return encodeRaw(data);
}

std::vector<uint8_t> Encoder::EncodeUInt(uint64_t value) {
    // Zero encodes as the empty string
    return encodeRaw(toBigEndian(value));
}

std::optional<std::vector<uint8_t>> Encoder::EncodeQuantity(const std::string& hex) {
    std::vector<uint8_t> bytes;
    // A quantity needs at least one digit; zero is "0x0"
    if (hex.empty() || hex == "0x" || hex == "0X" || !HexToBytes(hex, bytes)) {
        return std::nullopt;
    }

    size_t first = 0;
    while (first < bytes.size() && bytes[first] == 0) {
        ++first;
    }
    bytes.erase(bytes.begin(), bytes.begin() + static_cast<std::ptrdiff_t>(first));
    return encodeRaw(bytes);
}

std::optional<std::vector<uint8_t>> Encoder::EncodeHex(const std::string& hex) {
    std::vector<uint8_t> bytes;
    if (!HexToBytes(hex, bytes)) {
        return std::nullopt;
    }
    return encodeRaw(bytes);
}

std::vector<uint8_t> Encoder::EncodeList(const std::vector<std::vector<uint8_t>>& items) {
    std::vector<uint8_t> payload;
    for (const auto& item : items) {
        payload.insert(payload.end(), item.begin(), item.end());
    }

    std::vector<uint8_t> result = encodeLength(payload.size(), 0xc0);
    result.insert(result.end(), payload.begin(), payload.end());
    return result;
}

bool Encoder::HexToBytes(const std::string& hex, std::vector<uint8_t>& out) {
    std::string clean_hex = hex;

    if (clean_hex.size() >= 2 && clean_hex[0] == '0' && (clean_hex[1] == 'x' || clean_hex[1] == 'X')) {
        clean_hex = clean_hex.substr(2);
    }

    // Ensure even length
    if (clean_hex.size() % 2 != 0) {
        clean_hex = "0" + clean_hex;
    }

    std::vector<uint8_t> bytes;
    bytes.reserve(clean_hex.size() / 2);

    for (size_t i = 0; i < clean_hex.size(); i += 2) {
        if (!std::isxdigit(static_cast<unsigned char>(clean_hex[i])) ||
            !std::isxdigit(static_cast<unsigned char>(clean_hex[i + 1]))) {
            return false;
        }
        std::string byte_str = clean_hex.substr(i, 2);
        bytes.push_back(static_cast<uint8_t>(std::stoi(byte_str, nullptr, 16)));
    }

    out = std::move(bytes);
    return true;
}

std::string Encoder::BytesToHex(const std::vector<uint8_t>& data) {
    std::ostringstream oss;
    oss << "0x";
    oss << std::hex << std::setfill('0');

    for (uint8_t byte : data) {
        oss << std::setw(2) << static_cast<int>(byte);
    }

    return oss.str();
}

std::vector<uint8_t> Encoder::encodeRaw(const std::vector<uint8_t>& data) {
    if (data.size() == 1 && data[0] < 0x80) {
        // Single byte in range [0x00, 0x7f]: encode as itself
        return data;
    }

    std::vector<uint8_t> result = encodeLength(data.size(), 0x80);
    result.insert(result.end(), data.begin(), data.end());
    return result;
}

std::vector<uint8_t> Encoder::toBigEndian(uint64_t value) {
    std::vector<uint8_t> bytes;

    while (value > 0) {
        bytes.insert(bytes.begin(), static_cast<uint8_t>(value & 0xFF));
        value >>= 8;
    }

    return bytes;
}

std::vector<uint8_t> Encoder::encodeLength(size_t length, uint8_t offset) {
    if (length < 56) {
        return {static_cast<uint8_t>(offset + length)};
    }

    // Long form: [offset + 55 + length_of_length, ...length]
    auto length_bytes = toBigEndian(length);
    std::vector<uint8_t> result;
    result.push_back(static_cast<uint8_t>(offset + 55 + length_bytes.size()));
    result.insert(result.end(), length_bytes.begin(), length_bytes.end());
    return result;
}

} // namespace RLP
