#include "include/SignedMessage.h"
#include "include/Crypto.h"
#include "Callout/Logger.h"

#include <cctype>
#include <vector>

namespace SignedMessage {

namespace {

const std::string MESSAGE_TAG = "MESSAGE:";
const std::string SIGNATURE_TAG = "SIGNATURE:";

size_t SkipSpaces(const std::string& text, size_t pos) {
    while (pos < text.size() && std::isspace(static_cast<unsigned char>(text[pos]))) {
        ++pos;
    }
    return pos;
}

// Index just past SIGNATURE: when the quote at pos closes the message, npos otherwise.
// The whitespace between the quote and the tag must end in a newline.
size_t SignatureTagAfterQuote(const std::string& text, size_t quote) {
    size_t pos = SkipSpaces(text, quote + 1);
    if (pos == quote + 1 || text[pos - 1] != '\n' ||
        text.compare(pos, SIGNATURE_TAG.size(), SIGNATURE_TAG) != 0) {
        return std::string::npos;
    }
    return pos + SIGNATURE_TAG.size();
}

// Length of the 0x-prefixed hex run at pos, 0 if there is none
size_t HexRunLength(const std::string& text, size_t pos) {
    if (text.compare(pos, 2, "0x") != 0) {
        return 0;
    }
    size_t end = pos + 2;
    while (end < text.size() && std::isxdigit(static_cast<unsigned char>(text[end]))) {
        ++end;
    }
    return end == pos + 2 ? 0 : end - pos;
}

// Single forward scan; the first quote that closes the framing wins
std::optional<ParsedSignedMessage> FindFraming(const std::string& text, bool requireSignature) {
    for (size_t tag = text.find(MESSAGE_TAG); tag != std::string::npos;
         tag = text.find(MESSAGE_TAG, tag + 1)) {
        size_t open = SkipSpaces(text, tag + MESSAGE_TAG.size());
        if (open >= text.size() || text[open] != '"') {
            continue;
        }

        for (size_t quote = text.find('"', open + 1); quote != std::string::npos;
             quote = text.find('"', quote + 1)) {
            size_t afterTag = SignatureTagAfterQuote(text, quote);
            if (afterTag == std::string::npos) {
                continue;
            }

            ParsedSignedMessage parsed;
            if (requireSignature) {
                size_t signatureStart = SkipSpaces(text, afterTag);
                size_t length = HexRunLength(text, signatureStart);
                if (length == 0) {
                    continue;
                }
                parsed.signature = text.substr(signatureStart, length);
            }
            parsed.message = text.substr(open + 1, quote - open - 1);
            return parsed;
        }

        // A later tag would only see a subset of the quotes already tried
        return std::nullopt;
    }
    return std::nullopt;
}

} // namespace

std::optional<ParsedSignedMessage> ParseSignedMessage(const std::string& text) {
    if (text.empty()) {
        return std::nullopt;
    }
    return FindFraming(text, true);
}

std::optional<std::string> ExtractFramedContent(const std::string& text) {
    auto framing = FindFraming(text, false);
    if (!framing) {
        return std::nullopt;
    }
    return framing->message;
}

std::optional<std::string> RecoverSignedMessageAddress(const ParsedSignedMessage& parsed) {
    std::vector<uint8_t> signature;
    if (!Crypto::HexToBytes(parsed.signature, signature) || signature.size() != 65) {
        return std::nullopt;
    }

    int v = signature[64];
    if (v >= 27) {
        v -= 27;
    }
    if (v != 0 && v != 1) {
        return std::nullopt;
    }

    std::array<uint8_t, 32> hash;
    if (!Crypto::PersonalMessageHash(parsed.message, hash)) {
        return std::nullopt;
    }

    std::vector<uint8_t> r(signature.begin(), signature.begin() + 32);
    std::vector<uint8_t> s(signature.begin() + 32, signature.begin() + 64);
    std::vector<uint8_t> publicKey;
    if (!Crypto::RecoverPublicKey(hash, r, s, v, publicKey)) {
        CALLOUT_LOG_DEBUG("SignedMessage", "Signature recovery failed");
        return std::nullopt;
    }

    std::string address;
    if (!Crypto::PublicKeyToAddress(publicKey, address)) {
        return std::nullopt;
    }
    return address;
}

std::string FormatSignedMessage(const std::string& message, const std::string& signature) {
    return "MESSAGE: \"" + message + "\"\nSIGNATURE: " + signature;
}

Callout::Result<std::string> SignMessage(const std::string& message,
                                         const std::string& privateKeyHex) {
    std::vector<uint8_t> privateKey;
    std::string digits = Crypto::StripHexPrefix(privateKeyHex);
    if (digits.size() != 64 || !Crypto::HexToBytes(digits, privateKey) ||
        !Crypto::IsValidPrivateKey(privateKey)) {
        Crypto::SecureWipeVector(privateKey);
        return Callout::Result<std::string>(Callout::ErrorKind::InvalidPrivateKey,
                                            "Invalid private key: expected 32 bytes of hex");
    }

    std::array<uint8_t, 32> hash;
    Crypto::RecoverableSignature signature;
    bool ok = Crypto::PersonalMessageHash(message, hash) &&
              Crypto::SignHashRecoverable(privateKey, hash, signature);
    Crypto::SecureWipeVector(privateKey);
    if (!ok) {
        return Callout::Result<std::string>(Callout::ErrorKind::InvalidPrivateKey,
                                            "Signing failed");
    }

    std::vector<uint8_t> compact(signature.r);
    compact.insert(compact.end(), signature.s.begin(), signature.s.end());
    compact.push_back(static_cast<uint8_t>(27 + signature.recovery_id));
    return Callout::Result<std::string>("0x" + Crypto::BytesToHex(compact));
}

} // namespace SignedMessage
