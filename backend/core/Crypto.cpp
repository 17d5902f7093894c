// Crypto.cpp - Hashing, key derivation, AES-GCM, secp256k1 and ECIES primitives

#include <openssl/evp.h>
#include <openssl/hmac.h>
#include <openssl/kdf.h>
#include <openssl/rand.h>
#include <sodium.h>

#include <algorithm>
#include <array>
#include <cctype>
#include <cstring>
#include <sstream>
#include <string>
#include <vector>

#include <secp256k1.h>
#include <secp256k1_recovery.h>

#include "include/Crypto.h"

namespace Crypto {

// Global secp256k1 context (initialized once)
static secp256k1_context* GetSecp256k1Context() {
    static secp256k1_context* ctx =
        secp256k1_context_create(SECP256K1_CONTEXT_SIGN | SECP256K1_CONTEXT_VERIFY);
    return ctx;
}

// === Random Number Generation ===
bool RandBytes(void* buf, size_t len) {
    if (len == 0)
        return true;
    return RAND_bytes(static_cast<unsigned char*>(buf), static_cast<int>(len)) == 1;
}

// === Base64 Encoding/Decoding ===
std::string B64Encode(const std::vector<uint8_t>& data) {
    if (data.empty())
        return {};
    int outLen = static_cast<int>(4 * ((data.size() + 2) / 3));
    std::string out(outLen + 1, '\0');
    int ret = EVP_EncodeBlock(reinterpret_cast<unsigned char*>(&out[0]), data.data(),
                              static_cast<int>(data.size()));
    if (ret < 0)
        return {};
    out.resize(ret);
    return out;
}

bool B64Decode(const std::string& s, std::vector<uint8_t>& out) {
    out.clear();
    if (s.empty())
        return true;
    if (s.size() % 4 != 0)
        return false;

    // '=' may only appear as the last one or two characters
    size_t padding = 0;
    for (size_t i = 0; i < s.size(); ++i) {
        unsigned char c = static_cast<unsigned char>(s[i]);
        if (c == '=') {
            if (i < s.size() - 2)
                return false;
            padding++;
            continue;
        }
        if (padding > 0)
            return false;
        if (!std::isalnum(c) && c != '+' && c != '/')
            return false;
    }

    std::vector<uint8_t> buffer(3 * (s.size() / 4));
    int ret = EVP_DecodeBlock(buffer.data(), reinterpret_cast<const unsigned char*>(s.data()),
                              static_cast<int>(s.size()));
    if (ret < 0 || static_cast<size_t>(ret) < padding)
        return false;

    buffer.resize(static_cast<size_t>(ret) - padding);
    out = std::move(buffer);
    return true;
}

// === Hex Encoding/Decoding ===
std::string BytesToHex(const uint8_t* data, size_t len) {
    static const char* HEX_DIGITS = "0123456789abcdef";
    std::string out;
    out.reserve(len * 2);
    for (size_t i = 0; i < len; ++i) {
        out.push_back(HEX_DIGITS[data[i] >> 4]);
        out.push_back(HEX_DIGITS[data[i] & 0x0F]);
    }
    return out;
}

std::string BytesToHex(const std::vector<uint8_t>& data) {
    return BytesToHex(data.data(), data.size());
}

std::string StripHexPrefix(const std::string& hex) {
    if (hex.size() >= 2 && hex[0] == '0' && (hex[1] == 'x' || hex[1] == 'X')) {
        return hex.substr(2);
    }
    return hex;
}

bool IsHexString(const std::string& s) {
    return std::all_of(s.begin(), s.end(),
                       [](unsigned char c) { return std::isxdigit(c) != 0; });
}

static int HexNibble(char c) {
    if (c >= '0' && c <= '9')
        return c - '0';
    if (c >= 'a' && c <= 'f')
        return c - 'a' + 10;
    if (c >= 'A' && c <= 'F')
        return c - 'A' + 10;
    return -1;
}

bool HexToBytes(const std::string& hex, std::vector<uint8_t>& out) {
    std::string digits = StripHexPrefix(hex);
    if (digits.size() % 2 != 0)
        return false;

    std::vector<uint8_t> bytes;
    bytes.reserve(digits.size() / 2);
    for (size_t i = 0; i < digits.size(); i += 2) {
        int hi = HexNibble(digits[i]);
        int lo = HexNibble(digits[i + 1]);
        if (hi < 0 || lo < 0)
            return false;
        bytes.push_back(static_cast<uint8_t>((hi << 4) | lo));
    }
    out = std::move(bytes);
    return true;
}

// === Hash Functions ===
bool SHA256(const uint8_t* data, size_t len, std::array<uint8_t, 32>& out) {
    out.fill(uint8_t(0));
    unsigned int outLen = 0;
    if (EVP_Digest(data, len, out.data(), &outLen, EVP_sha256(), nullptr) != 1)
        return false;
    return outLen == out.size();
}

// Keccak-f[1600] permutation
static const uint64_t KECCAK_ROUND_CONSTANTS[24] = {
    0x0000000000000001ULL, 0x0000000000008082ULL, 0x800000000000808aULL, 0x8000000080008000ULL,
    0x000000000000808bULL, 0x0000000080000001ULL, 0x8000000080008081ULL, 0x8000000000008009ULL,
    0x000000000000008aULL, 0x0000000000000088ULL, 0x0000000080008009ULL, 0x000000008000000aULL,
    0x000000008000808bULL, 0x800000000000008bULL, 0x8000000000008089ULL, 0x8000000000008003ULL,
    0x8000000000008002ULL, 0x8000000000000080ULL, 0x000000000000800aULL, 0x800000008000000aULL,
    0x8000000080008081ULL, 0x8000000000008080ULL, 0x0000000080000001ULL, 0x8000000080008008ULL};

// Rotation offsets and lane order for the combined rho/pi step
static const int KECCAK_ROTATIONS[24] = {1,  3,  6,  10, 15, 21, 28, 36, 45, 55, 2,  14,
                                         27, 41, 56, 8,  25, 43, 62, 18, 39, 61, 20, 44};
static const int KECCAK_PI_LANES[24] = {10, 7,  11, 17, 18, 3, 5,  16, 8,  21, 24, 4,
                                        15, 23, 19, 13, 12, 2, 20, 14, 22, 9,  6,  1};

static inline uint64_t ROTL64(uint64_t x, int n) {
    return (x << n) | (x >> (64 - n));
}

static void Keccak_f1600(uint64_t state[25]) {
    uint64_t bc[5];
    for (int round = 0; round < 24; ++round) {
        // Theta
        for (int i = 0; i < 5; ++i)
            bc[i] = state[i] ^ state[i + 5] ^ state[i + 10] ^ state[i + 15] ^ state[i + 20];
        for (int i = 0; i < 5; ++i) {
            uint64_t t = bc[(i + 4) % 5] ^ ROTL64(bc[(i + 1) % 5], 1);
            for (int j = 0; j < 25; j += 5)
                state[j + i] ^= t;
        }

        // Rho and Pi
        uint64_t t = state[1];
        for (int i = 0; i < 24; ++i) {
            int j = KECCAK_PI_LANES[i];
            uint64_t tmp = state[j];
            state[j] = ROTL64(t, KECCAK_ROTATIONS[i]);
            t = tmp;
        }

        // Chi
        for (int j = 0; j < 25; j += 5) {
            for (int i = 0; i < 5; ++i)
                bc[i] = state[j + i];
            for (int i = 0; i < 5; ++i)
                state[j + i] ^= (~bc[(i + 1) % 5]) & bc[(i + 2) % 5];
        }

        // Iota
        state[0] ^= KECCAK_ROUND_CONSTANTS[round];
    }
}

static void KeccakAbsorbBlock(uint64_t state[25], const uint8_t* block, size_t rate) {
    for (size_t i = 0; i < rate / 8; ++i) {
        uint64_t lane = 0;
        for (size_t b = 0; b < 8; ++b)
            lane |= static_cast<uint64_t>(block[i * 8 + b]) << (8 * b);
        state[i] ^= lane;
    }
}

bool Keccak256(const uint8_t* data, size_t len, std::array<uint8_t, 32>& out) {
    const size_t rate = 136;  // 1088 bits for a 256-bit output
    uint64_t state[25] = {0};

    while (len >= rate) {
        KeccakAbsorbBlock(state, data, rate);
        Keccak_f1600(state);
        data += rate;
        len -= rate;
    }

    uint8_t last[rate] = {0};
    if (len > 0)
        std::memcpy(last, data, len);
    last[len] ^= 0x01;
    last[rate - 1] ^= 0x80;
    KeccakAbsorbBlock(state, last, rate);
    Keccak_f1600(state);

    for (size_t i = 0; i < out.size(); ++i)
        out[i] = static_cast<uint8_t>(state[i / 8] >> (8 * (i % 8)));
    return true;
}

bool HMAC_SHA256(const std::vector<uint8_t>& key, const uint8_t* data, size_t data_len,
                 std::vector<uint8_t>& out) {
    std::vector<uint8_t> hmac_result(32, 0);
    unsigned int outLen = 0;
    if (!HMAC(EVP_sha256(), key.data(), static_cast<int>(key.size()), data, data_len,
              hmac_result.data(), &outLen)) {
        return false;
    }
    out = std::move(hmac_result);
    return true;
}

// === Key Derivation Functions ===
bool PBKDF2_HMAC_SHA256(const std::string& password, const uint8_t* salt, size_t salt_len,
                        uint32_t iterations, std::vector<uint8_t>& out_key, size_t dk_len) {
    if (iterations == 0 || dk_len == 0)
        return false;

    out_key.assign(dk_len, 0);
    if (PKCS5_PBKDF2_HMAC(password.data(), static_cast<int>(password.size()), salt,
                          static_cast<int>(salt_len), static_cast<int>(iterations), EVP_sha256(),
                          static_cast<int>(dk_len), out_key.data()) != 1) {
        SecureWipeVector(out_key);
        return false;
    }
    return true;
}

bool HKDF_SHA256(const std::vector<uint8_t>& ikm, const std::vector<uint8_t>& salt,
                 const std::vector<uint8_t>& info, size_t out_len, std::vector<uint8_t>& out_key) {
    if (ikm.empty() || out_len == 0)
        return false;

    EVP_PKEY_CTX* pctx = EVP_PKEY_CTX_new_id(EVP_PKEY_HKDF, nullptr);
    if (!pctx)
        return false;

    bool ok = EVP_PKEY_derive_init(pctx) == 1 &&
              EVP_PKEY_CTX_set_hkdf_md(pctx, EVP_sha256()) == 1 &&
              EVP_PKEY_CTX_set1_hkdf_key(pctx, ikm.data(), static_cast<int>(ikm.size())) == 1;
    if (ok && !salt.empty()) {
        ok = EVP_PKEY_CTX_set1_hkdf_salt(pctx, salt.data(), static_cast<int>(salt.size())) == 1;
    }
    if (ok && !info.empty()) {
        ok = EVP_PKEY_CTX_add1_hkdf_info(pctx, info.data(), static_cast<int>(info.size())) == 1;
    }

    std::vector<uint8_t> derived(out_len, 0);
    size_t derivedLen = out_len;
    if (ok) {
        ok = EVP_PKEY_derive(pctx, derived.data(), &derivedLen) == 1 && derivedLen == out_len;
    }
    EVP_PKEY_CTX_free(pctx);

    if (!ok) {
        SecureWipeVector(derived);
        return false;
    }
    out_key = std::move(derived);
    return true;
}

// === AES-GCM Encryption/Decryption ===
bool AES_GCM_Encrypt(const std::vector<uint8_t>& key, const std::vector<uint8_t>& plaintext,
                     const std::vector<uint8_t>& aad, std::vector<uint8_t>& ciphertext,
                     std::vector<uint8_t>& iv, std::vector<uint8_t>& tag) {
    if (key.size() != 32)  // AES-256 key required
        return false;

    if (iv.empty()) {
        iv.resize(12);  // 96-bit IV for GCM
        if (!RandBytes(iv.data(), iv.size()))
            return false;
    } else if (iv.size() != 12 && iv.size() != 16) {
        return false;
    }

    EVP_CIPHER_CTX* ctx = EVP_CIPHER_CTX_new();
    if (!ctx)
        return false;

    if (EVP_EncryptInit_ex(ctx, EVP_aes_256_gcm(), nullptr, nullptr, nullptr) != 1 ||
        EVP_CIPHER_CTX_ctrl(ctx, EVP_CTRL_GCM_SET_IVLEN, static_cast<int>(iv.size()), nullptr) != 1 ||
        EVP_EncryptInit_ex(ctx, nullptr, nullptr, key.data(), iv.data()) != 1) {
        EVP_CIPHER_CTX_free(ctx);
        return false;
    }

    int len = 0;
    if (!aad.empty()) {
        if (EVP_EncryptUpdate(ctx, nullptr, &len, aad.data(), static_cast<int>(aad.size())) != 1) {
            EVP_CIPHER_CTX_free(ctx);
            return false;
        }
    }

    ciphertext.resize(plaintext.size());
    if (!plaintext.empty()) {
        if (EVP_EncryptUpdate(ctx, ciphertext.data(), &len, plaintext.data(),
                              static_cast<int>(plaintext.size())) != 1) {
            EVP_CIPHER_CTX_free(ctx);
            SecureWipeVector(ciphertext);
            return false;
        }
    }

    if (EVP_EncryptFinal_ex(ctx, ciphertext.data() + ciphertext.size(), &len) != 1) {
        EVP_CIPHER_CTX_free(ctx);
        SecureWipeVector(ciphertext);
        return false;
    }

    tag.resize(16);
    if (EVP_CIPHER_CTX_ctrl(ctx, EVP_CTRL_GCM_GET_TAG, 16, tag.data()) != 1) {
        EVP_CIPHER_CTX_free(ctx);
        SecureWipeVector(ciphertext);
        return false;
    }

    EVP_CIPHER_CTX_free(ctx);
    return true;
}

bool AES_GCM_Decrypt(const std::vector<uint8_t>& key, const std::vector<uint8_t>& ciphertext,
                     const std::vector<uint8_t>& aad, const std::vector<uint8_t>& iv,
                     const std::vector<uint8_t>& tag, std::vector<uint8_t>& plaintext) {
    if (key.size() != 32 || (iv.size() != 12 && iv.size() != 16) || tag.size() != 16)
        return false;

    EVP_CIPHER_CTX* ctx = EVP_CIPHER_CTX_new();
    if (!ctx)
        return false;

    if (EVP_DecryptInit_ex(ctx, EVP_aes_256_gcm(), nullptr, nullptr, nullptr) != 1 ||
        EVP_CIPHER_CTX_ctrl(ctx, EVP_CTRL_GCM_SET_IVLEN, static_cast<int>(iv.size()), nullptr) != 1 ||
        EVP_DecryptInit_ex(ctx, nullptr, nullptr, key.data(), iv.data()) != 1) {
        EVP_CIPHER_CTX_free(ctx);
        return false;
    }

    int len = 0;
    if (!aad.empty()) {
        if (EVP_DecryptUpdate(ctx, nullptr, &len, aad.data(), static_cast<int>(aad.size())) != 1) {
            EVP_CIPHER_CTX_free(ctx);
            return false;
        }
    }

    plaintext.resize(ciphertext.size());
    if (!ciphertext.empty()) {
        if (EVP_DecryptUpdate(ctx, plaintext.data(), &len, ciphertext.data(),
                              static_cast<int>(ciphertext.size())) != 1) {
            EVP_CIPHER_CTX_free(ctx);
            SecureWipeVector(plaintext);
            return false;
        }
    }

    if (EVP_CIPHER_CTX_ctrl(ctx, EVP_CTRL_GCM_SET_TAG, 16, const_cast<uint8_t*>(tag.data())) != 1) {
        EVP_CIPHER_CTX_free(ctx);
        SecureWipeVector(plaintext);
        return false;
    }

    int ret = EVP_DecryptFinal_ex(ctx, plaintext.data() + plaintext.size(), &len);
    EVP_CIPHER_CTX_free(ctx);

    if (ret <= 0) {
        SecureWipeVector(plaintext);
        return false;
    }

    return true;
}

// === Utility Functions ===
bool ConstantTimeEquals(const std::vector<uint8_t>& a, const std::vector<uint8_t>& b) {
    if (a.size() != b.size())
        return false;
    unsigned char diff = 0;
    for (size_t i = 0; i < a.size(); ++i)
        diff |= (a[i] ^ b[i]);
    return diff == 0;
}

// === Memory Security Functions ===
void SecureClear(void* ptr, size_t size) {
    if (!ptr || size == 0)
        return;

    static bool sodium_initialized = false;
    if (!sodium_initialized) {
        if (sodium_init() < 0) {
            volatile uint8_t* vptr = static_cast<volatile uint8_t*>(ptr);
            for (size_t i = 0; i < size; ++i) {
                vptr[i] = 0;
            }
            __sync_synchronize();
            return;
        }
        sodium_initialized = true;
    }
    sodium_memzero(ptr, size);
}

void SecureWipeVector(std::vector<uint8_t>& vec) {
    if (!vec.empty()) {
        SecureClear(vec.data(), vec.size());
        vec.clear();
        vec.shrink_to_fit();
    }
}

void SecureWipeString(std::string& str) {
    if (!str.empty()) {
        SecureClear(&str[0], str.size());
        str.clear();
        str.shrink_to_fit();
    }
}

// === secp256k1 ===
bool IsValidPrivateKey(const std::vector<uint8_t>& private_key) {
    if (private_key.size() != 32)
        return false;
    return secp256k1_ec_seckey_verify(GetSecp256k1Context(), private_key.data()) == 1;
}

bool SignHashRecoverable(const std::vector<uint8_t>& private_key,
                         const std::array<uint8_t, 32>& hash, RecoverableSignature& signature) {
    if (private_key.size() != 32) {
        return false;
    }

    auto* ctx = GetSecp256k1Context();

    secp256k1_ecdsa_recoverable_signature sig;
    if (!secp256k1_ecdsa_sign_recoverable(ctx, &sig, hash.data(), private_key.data(), nullptr,
                                          nullptr)) {
        return false;
    }

    // Serialize to compact format (64 bytes) + recovery id
    uint8_t compact[64];
    int recid = 0;
    secp256k1_ecdsa_recoverable_signature_serialize_compact(ctx, compact, &recid, &sig);

    signature.r.assign(compact, compact + 32);
    signature.s.assign(compact + 32, compact + 64);
    signature.recovery_id = recid;

    return true;
}

static bool SerializeUncompressed(const secp256k1_pubkey& pubkey, std::vector<uint8_t>& out) {
    unsigned char serialized[65];
    size_t serialized_len = sizeof(serialized);
    if (!secp256k1_ec_pubkey_serialize(GetSecp256k1Context(), serialized, &serialized_len,
                                       &pubkey, SECP256K1_EC_UNCOMPRESSED)) {
        return false;
    }
    out.assign(serialized, serialized + serialized_len);
    return serialized_len == 65;
}

bool RecoverPublicKey(const std::array<uint8_t, 32>& hash, const std::vector<uint8_t>& r,
                      const std::vector<uint8_t>& s, int recovery_id,
                      std::vector<uint8_t>& public_key) {
    if (r.empty() || s.empty() || r.size() > 32 || s.size() > 32)
        return false;
    if (recovery_id < 0 || recovery_id > 3)
        return false;

    // Left-pad each component to 32 bytes
    uint8_t compact[64] = {0};
    std::memcpy(compact + (32 - r.size()), r.data(), r.size());
    std::memcpy(compact + 32 + (32 - s.size()), s.data(), s.size());

    auto* ctx = GetSecp256k1Context();

    secp256k1_ecdsa_recoverable_signature sig;
    if (!secp256k1_ecdsa_recoverable_signature_parse_compact(ctx, &sig, compact, recovery_id)) {
        return false;
    }

    secp256k1_pubkey pubkey;
    if (!secp256k1_ecdsa_recover(ctx, &pubkey, &sig, hash.data())) {
        return false;
    }

    return SerializeUncompressed(pubkey, public_key);
}

bool DerivePublicKeyUncompressed(const std::vector<uint8_t>& private_key,
                                 std::vector<uint8_t>& public_key) {
    if (private_key.size() != 32) {
        return false;
    }

    secp256k1_pubkey pubkey;
    if (!secp256k1_ec_pubkey_create(GetSecp256k1Context(), &pubkey, private_key.data())) {
        return false;
    }

    return SerializeUncompressed(pubkey, public_key);
}

bool ParsePublicKey(const std::vector<uint8_t>& input, std::vector<uint8_t>& public_key) {
    if (input.size() != 33 && input.size() != 65)
        return false;

    secp256k1_pubkey pubkey;
    if (!secp256k1_ec_pubkey_parse(GetSecp256k1Context(), &pubkey, input.data(), input.size())) {
        return false;
    }

    return SerializeUncompressed(pubkey, public_key);
}

bool NormalizePublicKey(const std::string& hex, std::vector<uint8_t>& public_key) {
    std::string digits = StripHexPrefix(hex);
    if (digits.size() == 128)
        digits = "04" + digits;
    if (digits.size() != 130)
        return false;

    std::vector<uint8_t> bytes;
    if (!HexToBytes(digits, bytes) || bytes[0] != 0x04)
        return false;

    return ParsePublicKey(bytes, public_key);
}

bool ECDH_SharedPoint(const std::vector<uint8_t>& public_key,
                      const std::vector<uint8_t>& private_key, std::vector<uint8_t>& shared_point) {
    if (!IsValidPrivateKey(private_key))
        return false;

    auto* ctx = GetSecp256k1Context();

    secp256k1_pubkey point;
    if (!secp256k1_ec_pubkey_parse(ctx, &point, public_key.data(), public_key.size())) {
        return false;
    }

    if (!secp256k1_ec_pubkey_tweak_mul(ctx, &point, private_key.data())) {
        return false;
    }

    return SerializeUncompressed(point, shared_point);
}

// === ECIES ===

// HKDF-SHA256 over (ephemeral public key || shared point), both uncompressed, no salt or info
static bool DeriveEciesKey(const std::vector<uint8_t>& ephemeral_public_key,
                           const std::vector<uint8_t>& shared_point, std::vector<uint8_t>& key) {
    std::vector<uint8_t> master;
    master.reserve(ephemeral_public_key.size() + shared_point.size());
    master.insert(master.end(), ephemeral_public_key.begin(), ephemeral_public_key.end());
    master.insert(master.end(), shared_point.begin(), shared_point.end());

    bool ok = HKDF_SHA256(master, {}, {}, 32, key);
    SecureWipeVector(master);
    return ok;
}

bool ECIES_Encrypt(const std::vector<uint8_t>& recipient_public_key,
                   const std::vector<uint8_t>& plaintext, std::vector<uint8_t>& out) {
    std::vector<uint8_t> recipient;
    if (!ParsePublicKey(recipient_public_key, recipient))
        return false;

    std::vector<uint8_t> ephemeral_private(32);
    do {
        if (!RandBytes(ephemeral_private.data(), ephemeral_private.size()))
            return false;
    } while (!IsValidPrivateKey(ephemeral_private));

    std::vector<uint8_t> ephemeral_public;
    std::vector<uint8_t> shared_point;
    std::vector<uint8_t> key;
    bool ok = DerivePublicKeyUncompressed(ephemeral_private, ephemeral_public) &&
              ECDH_SharedPoint(recipient, ephemeral_private, shared_point) &&
              DeriveEciesKey(ephemeral_public, shared_point, key);
    SecureWipeVector(ephemeral_private);
    SecureWipeVector(shared_point);
    if (!ok) {
        SecureWipeVector(key);
        return false;
    }

    std::vector<uint8_t> nonce(ECIES_NONCE_SIZE);
    if (!RandBytes(nonce.data(), nonce.size())) {
        SecureWipeVector(key);
        return false;
    }

    std::vector<uint8_t> ciphertext;
    std::vector<uint8_t> tag;
    ok = AES_GCM_Encrypt(key, plaintext, {}, ciphertext, nonce, tag);
    SecureWipeVector(key);
    if (!ok)
        return false;

    out.clear();
    out.reserve(ECIES_OVERHEAD + ciphertext.size());
    out.insert(out.end(), ephemeral_public.begin(), ephemeral_public.end());
    out.insert(out.end(), nonce.begin(), nonce.end());
    out.insert(out.end(), tag.begin(), tag.end());
    out.insert(out.end(), ciphertext.begin(), ciphertext.end());
    return true;
}

bool ECIES_Decrypt(const std::vector<uint8_t>& private_key, const std::vector<uint8_t>& payload,
                   std::vector<uint8_t>& plaintext) {
    if (payload.size() < ECIES_OVERHEAD)
        return false;

    auto it = payload.begin();
    std::vector<uint8_t> ephemeral_public(it, it + ECIES_EPHEMERAL_KEY_SIZE);
    it += ECIES_EPHEMERAL_KEY_SIZE;
    std::vector<uint8_t> nonce(it, it + ECIES_NONCE_SIZE);
    it += ECIES_NONCE_SIZE;
    std::vector<uint8_t> tag(it, it + ECIES_TAG_SIZE);
    it += ECIES_TAG_SIZE;
    std::vector<uint8_t> ciphertext(it, payload.end());

    std::vector<uint8_t> sender;
    if (!ParsePublicKey(ephemeral_public, sender))
        return false;

    std::vector<uint8_t> shared_point;
    std::vector<uint8_t> key;
    bool ok = ECDH_SharedPoint(sender, private_key, shared_point) &&
              DeriveEciesKey(sender, shared_point, key);
    SecureWipeVector(shared_point);
    if (!ok) {
        SecureWipeVector(key);
        return false;
    }

    ok = AES_GCM_Decrypt(key, ciphertext, {}, nonce, tag, plaintext);
    SecureWipeVector(key);
    return ok;
}

// === Ethereum Addresses and Messages ===
bool PublicKeyToAddress(const std::vector<uint8_t>& public_key, std::string& address) {
    if (public_key.size() != 65 || public_key[0] != 0x04)
        return false;

    std::array<uint8_t, 32> hash;
    if (!Keccak256(public_key.data() + 1, 64, hash))
        return false;

    // Address is the last 20 bytes of the hash
    return EIP55_ToChecksumAddress(BytesToHex(hash.data() + 12, 20), address);
}

bool EIP55_ToChecksumAddress(const std::string& address, std::string& checksummed) {
    std::string addr = StripHexPrefix(address);

    if (addr.size() != 40 || !IsHexString(addr)) {
        return false;
    }

    std::string lowercase_addr = addr;
    std::transform(lowercase_addr.begin(), lowercase_addr.end(), lowercase_addr.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    std::array<uint8_t, 32> hash;
    if (!Keccak256(reinterpret_cast<const uint8_t*>(lowercase_addr.c_str()), lowercase_addr.size(),
                   hash)) {
        return false;
    }

    // Capitalize letters where the matching hash nibble is >= 8
    std::ostringstream oss;
    oss << "0x";
    for (size_t i = 0; i < lowercase_addr.size(); i++) {
        char c = lowercase_addr[i];
        if (std::isalpha(static_cast<unsigned char>(c))) {
            uint8_t hash_byte = hash[i / 2];
            uint8_t nibble = (i % 2 == 0) ? (hash_byte >> 4) : (hash_byte & 0x0F);
            if (nibble >= 8) {
                c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
            }
        }
        oss << c;
    }

    checksummed = oss.str();
    return true;
}

bool EIP55_ValidateChecksumAddress(const std::string& address) {
    std::string addr = StripHexPrefix(address);

    if (addr.size() != 40 || !IsHexString(addr)) {
        return false;
    }

    bool all_lower = true;
    bool all_upper = true;
    for (char c : addr) {
        if (std::isalpha(static_cast<unsigned char>(c))) {
            if (std::isupper(static_cast<unsigned char>(c))) {
                all_lower = false;
            } else {
                all_upper = false;
            }
        }
    }

    // Unchecksummed addresses are valid
    if (all_lower || all_upper) {
        return true;
    }

    std::string checksummed;
    if (!EIP55_ToChecksumAddress(addr, checksummed)) {
        return false;
    }

    return addr == StripHexPrefix(checksummed);
}

bool PersonalMessageHash(const std::string& message, std::array<uint8_t, 32>& out) {
    std::string prefixed = "\x19" "Ethereum Signed Message:\n" + std::to_string(message.size()) +
                           message;
    return Keccak256(reinterpret_cast<const uint8_t*>(prefixed.data()), prefixed.size(), out);
}

} // namespace Crypto
