#pragma once

#include "Callout/CalloutTypes.h"
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace Envelope {

/**
 * @brief Self-describing envelope variants
 *
 * The literal prefix of an envelope selects its decryption algorithm;
 * no external metadata is needed.
 */
enum class Format {
    PublicKey,        // "ENC:PUBKEY:v1:" + base64(ECIES ciphertext)
    Passphrase,       // "ENC:PASS:v1:" + base64(salt || iv || ciphertext || tag)
    LegacyPassphrase  // "[ENCRYPTED:v1:" + base64(...) + "]", read-only
};

constexpr const char* PUBKEY_PREFIX = "ENC:PUBKEY:v1:";
constexpr const char* PASSPHRASE_PREFIX = "ENC:PASS:v1:";
constexpr const char* LEGACY_PREFIX = "[ENCRYPTED:v1:";
constexpr const char* LEGACY_SUFFIX = "]";

// Passphrase mode parameters
constexpr uint32_t PBKDF2_ITERATIONS = 100000;
constexpr size_t SALT_SIZE = 16;
constexpr size_t IV_SIZE = 12;
constexpr size_t TAG_SIZE = 16;
constexpr size_t KEY_SIZE = 32;

// Minimum hex length (50 bytes) for a raw ECIES candidate
constexpr size_t MIN_ECIES_HEX_LENGTH = 100;

std::string FormatToString(Format format);

/**
 * @brief Identify the envelope variant from its literal framing
 *
 * Never throws. Surrounding whitespace is ignored; the legacy variant also
 * requires the closing bracket.
 */
std::optional<Format> DetectFormat(const std::string& text);

bool IsEncrypted(const std::string& text);

/**
 * @brief Guess whether unframed data is raw ECIES ciphertext
 *
 * True for at least 100 hex characters (after an optional 0x) and nothing else.
 */
bool LooksLikeEciesCiphertext(const std::string& hex);

// === Public-key mode (ECIES) ===

/**
 * @brief Encrypt to a recipient's secp256k1 public key
 * @param plaintext Message bytes
 * @param publicKeyHex Uncompressed key, with or without 0x and with or without the 04 marker
 * @return Raw ECIES bytes, or InvalidPublicKey / EncryptionFailed
 */
Callout::Result<std::vector<uint8_t>> EciesEncrypt(const std::string& plaintext,
                                                  const std::string& publicKeyHex);

/**
 * @brief Decrypt raw ECIES bytes
 * @return Plaintext, or InvalidPrivateKey, NotAnEncryptedPayload (too short or
 *         unparseable ephemeral key) or DecryptionFailed (authentication failure)
 */
Callout::Result<std::string> EciesDecrypt(const std::vector<uint8_t>& ciphertext,
                                         const std::string& privateKeyHex);

// "ENC:PUBKEY:v1:" envelope around EciesEncrypt
Callout::Result<std::string> EncryptWithPublicKey(const std::string& plaintext,
                                                 const std::string& publicKeyHex);

// Unprefixed lowercase hex of the ECIES bytes, for use directly as calldata
Callout::Result<std::string> EncryptWithPublicKeyRaw(const std::string& plaintext,
                                                    const std::string& publicKeyHex);

/**
 * @brief Decrypt either a "ENC:PUBKEY:v1:" envelope or raw ECIES hex
 * @param input Envelope text, or hex with or without 0x
 * @param privateKeyHex 32-byte key, with or without 0x
 */
Callout::Result<std::string> DecryptWithPrivateKey(const std::string& input,
                                                  const std::string& privateKeyHex);

// === Passphrase mode (PBKDF2-SHA256 + AES-256-GCM) ===

// Fresh random salt and IV on every call; empty passphrase is EmptyInput
Callout::Result<std::string> EncryptWithPassphrase(const std::string& plaintext,
                                                  const std::string& passphrase);

/**
 * @brief Decrypt a current or legacy passphrase envelope
 *
 * Any failure after the framing is recognized (bad base64, short blob,
 * tag mismatch) is reported as the same DecryptionFailed.
 */
Callout::Result<std::string> DecryptWithPassphrase(const std::string& envelope,
                                                  const std::string& passphrase);

/**
 * @brief Dispatch on the detected format
 *
 * Passphrase envelopes use secret as the passphrase; public-key envelopes and
 * raw ECIES candidates use it as the private key. Anything else is
 * NotAnEncryptedPayload. No fallback between modes is attempted.
 */
Callout::Result<std::string> Decrypt(const std::string& text, const std::string& secret);

} // namespace Envelope
