#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace Crypto {

// === Random Number Generation ===
bool RandBytes(void *buf, size_t len);

// === Base64 Encoding/Decoding ===
std::string B64Encode(const std::vector<uint8_t> &data);
// Strict decode: rejects characters outside the base64 alphabet and bad padding
bool B64Decode(const std::string &s, std::vector<uint8_t> &out);

// === Hex Encoding/Decoding ===
// Lowercase, no 0x prefix
std::string BytesToHex(const uint8_t *data, size_t len);
std::string BytesToHex(const std::vector<uint8_t> &data);
// Accepts an optional 0x/0X prefix; fails on odd length or non-hex characters
bool HexToBytes(const std::string &hex, std::vector<uint8_t> &out);
std::string StripHexPrefix(const std::string &hex);
bool IsHexString(const std::string &s);

// === Hash Functions ===
bool SHA256(const uint8_t *data, size_t len, std::array<uint8_t, 32> &out);
// Original Keccak padding (0x01), as used by Ethereum; not NIST SHA3-256
bool Keccak256(const uint8_t *data, size_t len, std::array<uint8_t, 32> &out);
bool HMAC_SHA256(const std::vector<uint8_t> &key, const uint8_t *data, size_t data_len, std::vector<uint8_t> &out);

// === Key Derivation Functions ===
bool PBKDF2_HMAC_SHA256(const std::string &password, const uint8_t *salt, size_t salt_len,
                        uint32_t iterations, std::vector<uint8_t> &out_key, size_t dk_len = 32);
// RFC 5869 extract-and-expand; an empty salt means a zero-filled salt of hash length
bool HKDF_SHA256(const std::vector<uint8_t> &ikm, const std::vector<uint8_t> &salt,
                 const std::vector<uint8_t> &info, size_t out_len, std::vector<uint8_t> &out_key);

// === AES-256-GCM Encryption/Decryption ===
// If iv is empty a random 12-byte IV is generated; otherwise iv must be 12 or 16 bytes.
// The tag is always 16 bytes.
bool AES_GCM_Encrypt(const std::vector<uint8_t> &key, const std::vector<uint8_t> &plaintext,
                     const std::vector<uint8_t> &aad, std::vector<uint8_t> &ciphertext,
                     std::vector<uint8_t> &iv, std::vector<uint8_t> &tag);
// Returns false on tag mismatch; plaintext is wiped in that case
bool AES_GCM_Decrypt(const std::vector<uint8_t> &key, const std::vector<uint8_t> &ciphertext,
                     const std::vector<uint8_t> &aad, const std::vector<uint8_t> &iv,
                     const std::vector<uint8_t> &tag, std::vector<uint8_t> &plaintext);

// === Utility Functions ===
bool ConstantTimeEquals(const std::vector<uint8_t> &a, const std::vector<uint8_t> &b);

// === Memory Security Functions ===
void SecureClear(void *ptr, size_t size);
void SecureWipeVector(std::vector<uint8_t> &vec);
void SecureWipeString(std::string &str);

// === secp256k1 ===

// Compact recoverable signature
struct RecoverableSignature {
  std::vector<uint8_t> r;  // 32 bytes
  std::vector<uint8_t> s;  // 32 bytes
  int recovery_id;         // 0 or 1

  RecoverableSignature() : recovery_id(0) {}
};

bool IsValidPrivateKey(const std::vector<uint8_t> &private_key);

// Sign a 32-byte hash, returning r, s and the recovery id
bool SignHashRecoverable(const std::vector<uint8_t> &private_key,
                         const std::array<uint8_t, 32> &hash, RecoverableSignature &signature);

// Recover the 65-byte uncompressed public key (0x04 || X || Y) that produced (r, s) over hash.
// r and s may be shorter than 32 bytes (they are left-padded); recovery_id must be 0..3.
bool RecoverPublicKey(const std::array<uint8_t, 32> &hash, const std::vector<uint8_t> &r,
                      const std::vector<uint8_t> &s, int recovery_id,
                      std::vector<uint8_t> &public_key);

// Derive the 65-byte uncompressed public key from a 32-byte private key
bool DerivePublicKeyUncompressed(const std::vector<uint8_t> &private_key,
                                 std::vector<uint8_t> &public_key);

// Parse a 33- or 65-byte SEC1 point, verify it lies on the curve and re-serialize uncompressed
bool ParsePublicKey(const std::vector<uint8_t> &input, std::vector<uint8_t> &public_key);

// Accepts hex with or without 0x and with or without the 04 marker; output is 65 bytes
bool NormalizePublicKey(const std::string &hex, std::vector<uint8_t> &public_key);

// Multiply public_key by private_key; output is the uncompressed shared point
bool ECDH_SharedPoint(const std::vector<uint8_t> &public_key,
                      const std::vector<uint8_t> &private_key, std::vector<uint8_t> &shared_point);

// === ECIES (secp256k1 + HKDF-SHA256 + AES-256-GCM) ===
// Output layout: ephemeral public key (65) || nonce (16) || tag (16) || ciphertext
bool ECIES_Encrypt(const std::vector<uint8_t> &recipient_public_key,
                   const std::vector<uint8_t> &plaintext, std::vector<uint8_t> &out);
// Caller validates the private key first; false here means a parse or authentication failure
bool ECIES_Decrypt(const std::vector<uint8_t> &private_key, const std::vector<uint8_t> &payload,
                   std::vector<uint8_t> &plaintext);

constexpr size_t ECIES_EPHEMERAL_KEY_SIZE = 65;
constexpr size_t ECIES_NONCE_SIZE = 16;
constexpr size_t ECIES_TAG_SIZE = 16;
constexpr size_t ECIES_OVERHEAD = ECIES_EPHEMERAL_KEY_SIZE + ECIES_NONCE_SIZE + ECIES_TAG_SIZE;

// === Ethereum Addresses and Messages ===

// Address = last 20 bytes of keccak256(X || Y), EIP-55 checksummed with 0x prefix
bool PublicKeyToAddress(const std::vector<uint8_t> &public_key, std::string &address);

bool EIP55_ToChecksumAddress(const std::string &address, std::string &checksummed);
bool EIP55_ValidateChecksumAddress(const std::string &address);

// keccak256("\x19Ethereum Signed Message:\n" + len(message) + message)
bool PersonalMessageHash(const std::string &message, std::array<uint8_t, 32> &out);

} // namespace Crypto
