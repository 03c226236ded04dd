// Copyright (c) 2025 The Canary Core developers
// Distributed under the MIT software license

#ifndef CANARY_VAULT_CRYPTER_H
#define CANARY_VAULT_CRYPTER_H

#include <util/secure_allocator.h>

#include <cstdint>
#include <string>
#include <vector>

/**
 * Key wrapping for the vault.
 *
 * - PBKDF2-HMAC-SHA256 turns the PIN and a random salt into a wrapping key
 * - HKDF-Expand (HMAC-SHA3-256) splits the wrapping key into an AES key and a MAC key
 * - AES-256-CBC with PKCS#7 padding encrypts the 32-byte signing key
 * - HMAC-SHA3-512 over IV || ciphertext authenticates the result
 *
 * Unwrapping always checks the tag, in constant time, before the cipher sees
 * the ciphertext.
 */

static const unsigned int VAULT_KEY_SIZE = 32;           // Wrapping key and AES-256 key size
static const unsigned int VAULT_SALT_SIZE = 16;          // PBKDF2 salt
static const unsigned int VAULT_IV_SIZE = 16;            // AES block size
static const unsigned int VAULT_MAC_SIZE = 64;           // HMAC-SHA3-512
static const unsigned int VAULT_CIPHERTEXT_SIZE = 48;    // 32-byte key plus a full padding block

static const uint32_t VAULT_DEFAULT_KDF_ITERATIONS = 150000;
static const uint32_t VAULT_MIN_KDF_ITERATIONS = 100000;
static const uint32_t VAULT_MAX_KDF_ITERATIONS = 300000;
// Upper bound accepted from a stored bundle, so a doctored count cannot stall unlock forever
static const uint32_t VAULT_MAX_BUNDLE_KDF_ITERATIONS = 10000000;

/**
 * CCrypter
 *
 * Holds the AES and MAC sub-keys for one wrap or unwrap. Both are wiped by
 * Clear() and by the destructor.
 *
 * Thread Safety: Not thread-safe. Create separate instances per thread.
 */
class CCrypter {
private:
    SecureBytes vchEncKey;
    SecureBytes vchMacKey;
    std::vector<uint8_t> vchIV;
    bool fKeySet;

public:
    CCrypter() : fKeySet(false) {}
    ~CCrypter() { Clear(); }

    CCrypter(const CCrypter&) = delete;
    CCrypter& operator=(const CCrypter&) = delete;

    /**
     * Derive the sub-keys from a wrapping key and remember the IV.
     *
     * @param wrappingKey PBKDF2 output (must be VAULT_KEY_SIZE bytes)
     * @param iv Initialization vector (must be VAULT_IV_SIZE bytes)
     * @return false if key or IV have the wrong size
     */
    bool SetKey(const SecureBytes& wrappingKey, const std::vector<uint8_t>& iv);

    void Clear();

    bool Encrypt(const SecureBytes& plaintext, std::vector<uint8_t>& ciphertext) const;

    /**
     * @return false on a padding error or any other cipher failure
     */
    bool Decrypt(const std::vector<uint8_t>& ciphertext, SecureBytes& plaintext) const;

    /**
     * HMAC-SHA3-512(macKey, IV || ciphertext)
     */
    bool ComputeMAC(const std::vector<uint8_t>& ciphertext, std::vector<uint8_t>& mac) const;

    /**
     * Recompute the tag and compare it with TimingResistantEqual.
     */
    bool VerifyMAC(const std::vector<uint8_t>& ciphertext, const std::vector<uint8_t>& mac) const;

    bool IsKeySet() const { return fKeySet; }
};

/**
 * Derive a wrapping key from a PIN.
 *
 * @param pin PIN bytes, already accepted by the PIN policy
 * @param salt Random salt, must not be empty
 * @param iterations PBKDF2 iteration count, must be > 0
 * @param outputLength Requested key length in bytes
 * @param keyOut Receives the key; wiped and emptied on failure
 * @return false on malformed input or primitive failure
 */
bool DeriveWrappingKey(const SecureString& pin,
                       const std::vector<uint8_t>& salt,
                       uint32_t iterations,
                       size_t outputLength,
                       SecureBytes& keyOut);

/**
 * HKDF-Expand one block: HMAC-SHA3-256(key, "canary-vault-" + context || 0x01).
 *
 * @param context Domain separation label ("enc", "mac")
 */
void DeriveSubKey(const SecureBytes& wrappingKey, const char* context, SecureBytes& subKey);

bool GenerateSalt(std::vector<uint8_t>& salt);
bool GenerateIV(std::vector<uint8_t>& iv);

enum class UnwrapStatus {
    OK,
    AUTHENTICATION_FAILED,   // Tag mismatch, cipher never ran
    DECRYPTION_FAILED,       // Tag matched but the cipher or padding failed
    BAD_PARAMETERS           // Wrong sizes for key, IV, ciphertext or tag
};

/**
 * Encrypt and authenticate a signing key.
 *
 * @param iv Fresh IV chosen by the caller (VAULT_IV_SIZE bytes)
 */
bool WrapKey(const SecureBytes& signingKey,
             const SecureBytes& wrappingKey,
             const std::vector<uint8_t>& iv,
             std::vector<uint8_t>& ciphertext,
             std::vector<uint8_t>& tag);

/**
 * Authenticate-then-decrypt. signingKey is only written on OK.
 */
UnwrapStatus UnwrapKey(const std::vector<uint8_t>& ciphertext,
                       const SecureBytes& wrappingKey,
                       const std::vector<uint8_t>& iv,
                       const std::vector<uint8_t>& tag,
                       SecureBytes& signingKey);

#endif // CANARY_VAULT_CRYPTER_H
