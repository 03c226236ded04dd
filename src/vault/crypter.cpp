// Copyright (c) 2025 The Canary Core developers
// Distributed under the MIT software license

#include <vault/crypter.h>
#include <crypto/hmac_sha3.h>
#include <crypto/pbkdf2.h>
#include <crypto/random.h>
#include <util/strencodings.h>

#include <openssl/evp.h>

#include <climits>
#include <cstring>
#include <string>

// ============================================================================
// CCrypter Implementation
// ============================================================================

bool CCrypter::SetKey(const SecureBytes& wrappingKey, const std::vector<uint8_t>& iv) {
    Clear();
    if (wrappingKey.size() != VAULT_KEY_SIZE) return false;
    if (iv.size() != VAULT_IV_SIZE) return false;

    DeriveSubKey(wrappingKey, "enc", vchEncKey);
    DeriveSubKey(wrappingKey, "mac", vchMacKey);
    vchIV = iv;
    fKeySet = true;

    return true;
}

void CCrypter::Clear() {
    if (!vchEncKey.empty()) memory_cleanse(vchEncKey.data(), vchEncKey.size());
    if (!vchMacKey.empty()) memory_cleanse(vchMacKey.data(), vchMacKey.size());
    vchEncKey.clear();
    vchMacKey.clear();
    vchIV.clear();
    fKeySet = false;
}

bool CCrypter::Encrypt(const SecureBytes& plaintext, std::vector<uint8_t>& ciphertext) const {
    if (!fKeySet) return false;
    if (plaintext.empty() || plaintext.size() > INT_MAX - VAULT_IV_SIZE) return false;

    EVP_CIPHER_CTX* ctx = EVP_CIPHER_CTX_new();
    if (!ctx) {
        return false;
    }

    // EVP_aes_256_cbc applies PKCS#7 padding by default
    if (EVP_EncryptInit_ex(ctx, EVP_aes_256_cbc(), nullptr,
                           vchEncKey.data(), vchIV.data()) != 1) {
        EVP_CIPHER_CTX_free(ctx);
        return false;
    }

    ciphertext.resize(plaintext.size() + VAULT_IV_SIZE);
    int len = 0;
    int ciphertext_len = 0;

    if (EVP_EncryptUpdate(ctx, ciphertext.data(), &len,
                          plaintext.data(), static_cast<int>(plaintext.size())) != 1) {
        EVP_CIPHER_CTX_free(ctx);
        ciphertext.clear();
        return false;
    }
    ciphertext_len = len;

    if (EVP_EncryptFinal_ex(ctx, ciphertext.data() + len, &len) != 1) {
        EVP_CIPHER_CTX_free(ctx);
        ciphertext.clear();
        return false;
    }
    ciphertext_len += len;

    ciphertext.resize(ciphertext_len);
    EVP_CIPHER_CTX_free(ctx);
    return true;
}

bool CCrypter::Decrypt(const std::vector<uint8_t>& ciphertext, SecureBytes& plaintext) const {
    if (!fKeySet) return false;
    if (ciphertext.empty() || ciphertext.size() > INT_MAX) return false;
    if (ciphertext.size() % VAULT_IV_SIZE != 0) return false;

    EVP_CIPHER_CTX* ctx = EVP_CIPHER_CTX_new();
    if (!ctx) {
        return false;
    }

    if (EVP_DecryptInit_ex(ctx, EVP_aes_256_cbc(), nullptr,
                           vchEncKey.data(), vchIV.data()) != 1) {
        EVP_CIPHER_CTX_free(ctx);
        return false;
    }

    SecureBytes buffer(ciphertext.size() + VAULT_IV_SIZE);
    int len = 0;
    int plaintext_len = 0;

    if (EVP_DecryptUpdate(ctx, buffer.data(), &len,
                          ciphertext.data(), static_cast<int>(ciphertext.size())) != 1) {
        EVP_CIPHER_CTX_free(ctx);
        return false;
    }
    plaintext_len = len;

    // Fails on bad padding
    if (EVP_DecryptFinal_ex(ctx, buffer.data() + len, &len) != 1) {
        EVP_CIPHER_CTX_free(ctx);
        return false;
    }
    plaintext_len += len;
    EVP_CIPHER_CTX_free(ctx);

    buffer.resize(plaintext_len);
    plaintext = std::move(buffer);
    return true;
}

bool CCrypter::ComputeMAC(const std::vector<uint8_t>& ciphertext, std::vector<uint8_t>& mac) const {
    if (!fKeySet) return false;
    if (ciphertext.empty()) return false;

    std::vector<uint8_t> data;
    data.reserve(vchIV.size() + ciphertext.size());
    data.insert(data.end(), vchIV.begin(), vchIV.end());
    data.insert(data.end(), ciphertext.begin(), ciphertext.end());

    mac.resize(VAULT_MAC_SIZE);
    HMAC_SHA3_512(vchMacKey.data(), vchMacKey.size(), data.data(), data.size(), mac.data());
    return true;
}

bool CCrypter::VerifyMAC(const std::vector<uint8_t>& ciphertext, const std::vector<uint8_t>& mac) const {
    if (!fKeySet) return false;
    if (mac.size() != VAULT_MAC_SIZE) return false;

    std::vector<uint8_t> expected_mac;
    if (!ComputeMAC(ciphertext, expected_mac)) {
        return false;
    }

    return TimingResistantEqual(expected_mac.data(), mac.data(), VAULT_MAC_SIZE);
}

// ============================================================================
// Key derivation
// ============================================================================

bool DeriveWrappingKey(const SecureString& pin,
                       const std::vector<uint8_t>& salt,
                       uint32_t iterations,
                       size_t outputLength,
                       SecureBytes& keyOut) {
    keyOut.clear();
    if (salt.empty() || iterations == 0 || outputLength == 0) {
        return false;
    }

    SecureBytes key(outputLength, 0);
    if (!PBKDF2_HMAC_SHA256(reinterpret_cast<const uint8_t*>(pin.data()), pin.size(),
                            salt.data(), salt.size(), iterations,
                            key.data(), key.size())) {
        return false;
    }

    keyOut = std::move(key);
    return true;
}

void DeriveSubKey(const SecureBytes& wrappingKey, const char* context, SecureBytes& subKey) {
    // T(1) = HMAC(PRK, info || 0x01); one block covers a 32-byte key
    std::string info = std::string("canary-vault-") + context;
    std::vector<uint8_t> data(info.begin(), info.end());
    data.push_back(0x01);

    subKey.assign(32, 0);
    HMAC_SHA3_256(wrappingKey.data(), wrappingKey.size(), data.data(), data.size(), subKey.data());
}

bool GenerateSalt(std::vector<uint8_t>& salt) {
    salt.resize(VAULT_SALT_SIZE);
    return GetStrongRandBytes(salt.data(), VAULT_SALT_SIZE);
}

bool GenerateIV(std::vector<uint8_t>& iv) {
    iv.resize(VAULT_IV_SIZE);
    return GetStrongRandBytes(iv.data(), VAULT_IV_SIZE);
}

// ============================================================================
// Wrap / unwrap
// ============================================================================

bool WrapKey(const SecureBytes& signingKey,
             const SecureBytes& wrappingKey,
             const std::vector<uint8_t>& iv,
             std::vector<uint8_t>& ciphertext,
             std::vector<uint8_t>& tag) {
    ciphertext.clear();
    tag.clear();

    CCrypter crypter;
    if (!crypter.SetKey(wrappingKey, iv)) {
        return false;
    }
    if (!crypter.Encrypt(signingKey, ciphertext)) {
        return false;
    }
    if (!crypter.ComputeMAC(ciphertext, tag)) {
        ciphertext.clear();
        return false;
    }
    return true;
}

UnwrapStatus UnwrapKey(const std::vector<uint8_t>& ciphertext,
                       const SecureBytes& wrappingKey,
                       const std::vector<uint8_t>& iv,
                       const std::vector<uint8_t>& tag,
                       SecureBytes& signingKey) {
    if (ciphertext.empty() || tag.size() != VAULT_MAC_SIZE) {
        return UnwrapStatus::BAD_PARAMETERS;
    }

    CCrypter crypter;
    if (!crypter.SetKey(wrappingKey, iv)) {
        return UnwrapStatus::BAD_PARAMETERS;
    }

    if (!crypter.VerifyMAC(ciphertext, tag)) {
        return UnwrapStatus::AUTHENTICATION_FAILED;
    }

    SecureBytes plaintext;
    if (!crypter.Decrypt(ciphertext, plaintext)) {
        return UnwrapStatus::DECRYPTION_FAILED;
    }

    signingKey = std::move(plaintext);
    return UnwrapStatus::OK;
}
