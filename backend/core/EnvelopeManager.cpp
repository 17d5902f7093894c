#include "include/EnvelopeManager.h"
#include "include/Crypto.h"
#include "Callout/Logger.h"

#include <algorithm>
#include <cctype>
#include <cstring>

using Callout::ErrorKind;
using Callout::Result;

namespace Envelope {

namespace {

bool StartsWith(const std::string& value, const char* prefix) {
    size_t length = std::strlen(prefix);
    return value.size() >= length && value.compare(0, length, prefix) == 0;
}

bool EndsWith(const std::string& value, const char* suffix) {
    size_t length = std::strlen(suffix);
    return value.size() >= length && value.compare(value.size() - length, length, suffix) == 0;
}

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

// Parse a 32-byte private key given as hex, with or without 0x
bool ParsePrivateKey(const std::string& privateKeyHex, std::vector<uint8_t>& key) {
    std::string digits = Crypto::StripHexPrefix(Trim(privateKeyHex));
    if (digits.size() != 64) {
        return false;
    }
    if (!Crypto::HexToBytes(digits, key)) {
        return false;
    }
    if (!Crypto::IsValidPrivateKey(key)) {
        Crypto::SecureWipeVector(key);
        return false;
    }
    return true;
}

Result<std::string> DecryptionFailed() {
    return Result<std::string>(ErrorKind::DecryptionFailed,
                               "Decryption failed: wrong key or passphrase, or corrupted data");
}

} // namespace

std::string FormatToString(Format format) {
    switch (format) {
        case Format::PublicKey:
            return "public-key";
        case Format::Passphrase:
            return "passphrase";
        case Format::LegacyPassphrase:
            return "legacy-passphrase";
    }
    return "unknown";
}

std::optional<Format> DetectFormat(const std::string& text) {
    std::string trimmed = Trim(text);
    if (StartsWith(trimmed, PUBKEY_PREFIX)) {
        return Format::PublicKey;
    }
    if (StartsWith(trimmed, PASSPHRASE_PREFIX)) {
        return Format::Passphrase;
    }
    if (StartsWith(trimmed, LEGACY_PREFIX) && EndsWith(trimmed, LEGACY_SUFFIX)) {
        return Format::LegacyPassphrase;
    }
    return std::nullopt;
}

bool IsEncrypted(const std::string& text) {
    return DetectFormat(text).has_value();
}

bool LooksLikeEciesCiphertext(const std::string& hex) {
    std::string digits = Crypto::StripHexPrefix(Trim(hex));
    return digits.size() >= MIN_ECIES_HEX_LENGTH && Crypto::IsHexString(digits);
}

// === Public-key mode ===

Result<std::vector<uint8_t>> EciesEncrypt(const std::string& plaintext,
                                          const std::string& publicKeyHex) {
    std::vector<uint8_t> publicKey;
    if (!Crypto::NormalizePublicKey(Trim(publicKeyHex), publicKey)) {
        CALLOUT_LOG_WARNING("Envelope", "Rejected recipient public key");
        return Result<std::vector<uint8_t>>(
            ErrorKind::InvalidPublicKey,
            "Invalid public key: expected an uncompressed secp256k1 key (128 or 130 hex characters)");
    }

    std::vector<uint8_t> message(plaintext.begin(), plaintext.end());
    std::vector<uint8_t> ciphertext;
    bool ok = Crypto::ECIES_Encrypt(publicKey, message, ciphertext);
    Crypto::SecureWipeVector(message);

    if (!ok) {
        CALLOUT_LOG_ERROR("Envelope", "ECIES encryption failed");
        return Result<std::vector<uint8_t>>(ErrorKind::EncryptionFailed, "ECIES encryption failed");
    }

    CALLOUT_LOG_DEBUG("Envelope", "ECIES encryption complete",
                      "Bytes: " + std::to_string(ciphertext.size()));
    return Result<std::vector<uint8_t>>(ciphertext);
}

Result<std::string> EciesDecrypt(const std::vector<uint8_t>& ciphertext,
                                 const std::string& privateKeyHex) {
    std::vector<uint8_t> privateKey;
    if (!ParsePrivateKey(privateKeyHex, privateKey)) {
        return Result<std::string>(ErrorKind::InvalidPrivateKey,
                                   "Invalid private key: expected 32 bytes of hex");
    }

    if (ciphertext.size() < Crypto::ECIES_OVERHEAD) {
        Crypto::SecureWipeVector(privateKey);
        return Result<std::string>(ErrorKind::NotAnEncryptedPayload,
                                   "Payload is too short to be ECIES ciphertext");
    }

    std::vector<uint8_t> ephemeral(ciphertext.begin(),
                                   ciphertext.begin() + Crypto::ECIES_EPHEMERAL_KEY_SIZE);
    std::vector<uint8_t> parsed;
    if (!Crypto::ParsePublicKey(ephemeral, parsed)) {
        Crypto::SecureWipeVector(privateKey);
        return Result<std::string>(ErrorKind::NotAnEncryptedPayload,
                                   "Payload does not start with a valid ephemeral public key");
    }

    std::vector<uint8_t> plaintext;
    bool ok = Crypto::ECIES_Decrypt(privateKey, ciphertext, plaintext);
    Crypto::SecureWipeVector(privateKey);

    if (!ok) {
        CALLOUT_LOG_WARNING("Envelope", "ECIES authentication failed");
        return DecryptionFailed();
    }

    std::string message(plaintext.begin(), plaintext.end());
    Crypto::SecureWipeVector(plaintext);
    return Result<std::string>(message);
}

Result<std::string> EncryptWithPublicKey(const std::string& plaintext,
                                         const std::string& publicKeyHex) {
    auto encrypted = EciesEncrypt(plaintext, publicKeyHex);
    if (!encrypted) {
        return Result<std::string>(encrypted.kind(), encrypted.error());
    }
    return Result<std::string>(std::string(PUBKEY_PREFIX) + Crypto::B64Encode(*encrypted));
}

Result<std::string> EncryptWithPublicKeyRaw(const std::string& plaintext,
                                            const std::string& publicKeyHex) {
    auto encrypted = EciesEncrypt(plaintext, publicKeyHex);
    if (!encrypted) {
        return Result<std::string>(encrypted.kind(), encrypted.error());
    }
    return Result<std::string>(Crypto::BytesToHex(*encrypted));
}

Result<std::string> DecryptWithPrivateKey(const std::string& input,
                                          const std::string& privateKeyHex) {
    std::string trimmed = Trim(input);
    std::vector<uint8_t> ciphertext;

    auto format = DetectFormat(trimmed);
    if (format) {
        if (*format != Format::PublicKey) {
            return Result<std::string>(ErrorKind::NotAnEncryptedPayload,
                                       "Payload is a passphrase envelope, not public-key encrypted");
        }
        if (!Crypto::B64Decode(trimmed.substr(std::strlen(PUBKEY_PREFIX)), ciphertext)) {
            return Result<std::string>(ErrorKind::NotAnEncryptedPayload,
                                       "Public-key envelope body is not valid base64");
        }
    } else if (!Crypto::HexToBytes(trimmed, ciphertext)) {
        return Result<std::string>(ErrorKind::NotAnEncryptedPayload,
                                   "Payload is neither an envelope nor hex ciphertext");
    }

    return EciesDecrypt(ciphertext, privateKeyHex);
}

// === Passphrase mode ===

Result<std::string> EncryptWithPassphrase(const std::string& plaintext,
                                          const std::string& passphrase) {
    if (passphrase.empty()) {
        return Result<std::string>(ErrorKind::EmptyInput, "Passphrase must not be empty");
    }

    std::vector<uint8_t> salt(SALT_SIZE);
    if (!Crypto::RandBytes(salt.data(), salt.size())) {
        return Result<std::string>(ErrorKind::EncryptionFailed, "Failed to generate salt");
    }

    std::vector<uint8_t> key;
    if (!Crypto::PBKDF2_HMAC_SHA256(passphrase, salt.data(), salt.size(), PBKDF2_ITERATIONS, key,
                                    KEY_SIZE)) {
        return Result<std::string>(ErrorKind::EncryptionFailed, "Key derivation failed");
    }

    std::vector<uint8_t> message(plaintext.begin(), plaintext.end());
    std::vector<uint8_t> ciphertext;
    std::vector<uint8_t> iv;  // generated by AES_GCM_Encrypt
    std::vector<uint8_t> tag;
    bool ok = Crypto::AES_GCM_Encrypt(key, message, {}, ciphertext, iv, tag);
    Crypto::SecureWipeVector(key);
    Crypto::SecureWipeVector(message);

    if (!ok || iv.size() != IV_SIZE || tag.size() != TAG_SIZE) {
        CALLOUT_LOG_ERROR("Envelope", "Passphrase encryption failed");
        return Result<std::string>(ErrorKind::EncryptionFailed, "AES-GCM encryption failed");
    }

    // salt || iv || ciphertext || tag
    std::vector<uint8_t> blob;
    blob.reserve(SALT_SIZE + IV_SIZE + ciphertext.size() + TAG_SIZE);
    blob.insert(blob.end(), salt.begin(), salt.end());
    blob.insert(blob.end(), iv.begin(), iv.end());
    blob.insert(blob.end(), ciphertext.begin(), ciphertext.end());
    blob.insert(blob.end(), tag.begin(), tag.end());

    CALLOUT_LOG_DEBUG("Envelope", "Passphrase encryption complete",
                      "Bytes: " + std::to_string(blob.size()));
    return Result<std::string>(std::string(PASSPHRASE_PREFIX) + Crypto::B64Encode(blob));
}

Result<std::string> DecryptWithPassphrase(const std::string& envelope,
                                          const std::string& passphrase) {
    std::string trimmed = Trim(envelope);
    auto format = DetectFormat(trimmed);

    std::string body;
    if (format && *format == Format::Passphrase) {
        body = trimmed.substr(std::strlen(PASSPHRASE_PREFIX));
    } else if (format && *format == Format::LegacyPassphrase) {
        size_t prefixLength = std::strlen(LEGACY_PREFIX);
        body = trimmed.substr(prefixLength,
                              trimmed.size() - prefixLength - std::strlen(LEGACY_SUFFIX));
    } else {
        return Result<std::string>(ErrorKind::NotAnEncryptedPayload,
                                   "Not a passphrase-encrypted message");
    }

    std::vector<uint8_t> blob;
    if (!Crypto::B64Decode(body, blob) || blob.size() < SALT_SIZE + IV_SIZE + TAG_SIZE) {
        return DecryptionFailed();
    }

    std::vector<uint8_t> salt(blob.begin(), blob.begin() + SALT_SIZE);
    std::vector<uint8_t> iv(blob.begin() + SALT_SIZE, blob.begin() + SALT_SIZE + IV_SIZE);
    std::vector<uint8_t> ciphertext(blob.begin() + SALT_SIZE + IV_SIZE, blob.end() - TAG_SIZE);
    std::vector<uint8_t> tag(blob.end() - TAG_SIZE, blob.end());

    std::vector<uint8_t> key;
    if (!Crypto::PBKDF2_HMAC_SHA256(passphrase, salt.data(), salt.size(), PBKDF2_ITERATIONS, key,
                                    KEY_SIZE)) {
        return DecryptionFailed();
    }

    std::vector<uint8_t> plaintext;
    bool ok = Crypto::AES_GCM_Decrypt(key, ciphertext, {}, iv, tag, plaintext);
    Crypto::SecureWipeVector(key);

    if (!ok) {
        CALLOUT_LOG_WARNING("Envelope", "Passphrase decryption failed",
                            "Format: " + FormatToString(*format));
        return DecryptionFailed();
    }

    std::string message(plaintext.begin(), plaintext.end());
    Crypto::SecureWipeVector(plaintext);
    return Result<std::string>(message);
}

Result<std::string> Decrypt(const std::string& text, const std::string& secret) {
    auto format = DetectFormat(text);
    if (format) {
        switch (*format) {
            case Format::Passphrase:
            case Format::LegacyPassphrase:
                return DecryptWithPassphrase(text, secret);
            case Format::PublicKey:
                return DecryptWithPrivateKey(text, secret);
        }
    }

    if (LooksLikeEciesCiphertext(text)) {
        return DecryptWithPrivateKey(text, secret);
    }

    return Result<std::string>(ErrorKind::NotAnEncryptedPayload,
                               "Message is not encrypted with a recognized format");
}

} // namespace Envelope
