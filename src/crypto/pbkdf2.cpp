// Copyright (c) 2025 The Canary Core developers
// Distributed under the MIT software license

#include <crypto/pbkdf2.h>
#include <util/secure_allocator.h>

#include <openssl/evp.h>

#include <climits>

bool PBKDF2_HMAC_SHA256(const uint8_t* password, size_t password_len,
                        const uint8_t* salt, size_t salt_len,
                        uint32_t iterations,
                        uint8_t* output, size_t output_len) {
    if (output == nullptr || output_len == 0) return false;
    if (password == nullptr && password_len > 0) return false;
    if (salt == nullptr || salt_len == 0) return false;
    if (iterations == 0) return false;
    if (password_len > INT_MAX || salt_len > INT_MAX || output_len > INT_MAX ||
        iterations > static_cast<uint32_t>(INT_MAX)) {
        return false;
    }

    static const char empty = 0;
    const char* pass = password_len > 0 ? reinterpret_cast<const char*>(password) : &empty;

    if (PKCS5_PBKDF2_HMAC(pass, static_cast<int>(password_len),
                          salt, static_cast<int>(salt_len),
                          static_cast<int>(iterations), EVP_sha256(),
                          static_cast<int>(output_len), output) != 1) {
        memory_cleanse(output, output_len);
        return false;
    }
    return true;
}
