#include "include/MessageCodec.h"
#include "include/Crypto.h"

#include <cstdint>
#include <vector>

namespace Codec {

namespace {

// Advance over one UTF-8 code point starting at pos. Returns the code point,
// or -1 for an invalid sequence (which then consumes a single byte).
long NextCodePoint(const std::string& text, size_t &pos) {
    unsigned char lead = static_cast<unsigned char>(text[pos]);
    size_t length = 0;
    long codePoint = 0;

    if (lead < 0x80) {
        pos += 1;
        return lead;
    } else if ((lead & 0xE0) == 0xC0) {
        length = 2;
        codePoint = lead & 0x1F;
    } else if ((lead & 0xF0) == 0xE0) {
        length = 3;
        codePoint = lead & 0x0F;
    } else if ((lead & 0xF8) == 0xF0) {
        length = 4;
        codePoint = lead & 0x07;
    } else {
        pos += 1;
        return -1;
    }

    if (pos + length > text.size()) {
        pos += 1;
        return -1;
    }

    for (size_t i = 1; i < length; ++i) {
        unsigned char cont = static_cast<unsigned char>(text[pos + i]);
        if ((cont & 0xC0) != 0x80) {
            pos += 1;
            return -1;
        }
        codePoint = (codePoint << 6) | (cont & 0x3F);
    }

    pos += length;
    return codePoint;
}

bool IsPrintable(long codePoint) {
    return (codePoint >= 0x20 && codePoint <= 0x7E) || codePoint == '\n' || codePoint == '\r' ||
           codePoint == '\t';
}

} // namespace

std::string Encode(const std::string& text) {
    return "0x" + Crypto::BytesToHex(reinterpret_cast<const uint8_t*>(text.data()), text.size());
}

Callout::Result<std::string> Decode(const std::string& hex) {
    std::vector<uint8_t> bytes;
    if (!Crypto::HexToBytes(hex, bytes)) {
        return Callout::Result<std::string>(Callout::ErrorKind::MalformedHex,
                                            "Calldata is not valid hex (odd length or non-hex character)");
    }
    return Callout::Result<std::string>(std::string(bytes.begin(), bytes.end()));
}

bool IsLikelyText(const std::string& hex) {
    auto decoded = Decode(hex);
    if (!decoded || decoded->empty()) {
        return false;
    }

    const std::string& text = *decoded;
    size_t total = 0;
    size_t printable = 0;
    size_t pos = 0;
    while (pos < text.size()) {
        long codePoint = NextCodePoint(text, pos);
        ++total;
        if (IsPrintable(codePoint)) {
            ++printable;
        }
    }

    return static_cast<double>(printable) >= PRINTABLE_THRESHOLD * static_cast<double>(total);
}

} // namespace Codec
