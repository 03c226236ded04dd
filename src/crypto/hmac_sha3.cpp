// Copyright (c) 2025 The Canary Core developers
// Distributed under the MIT software license

#include <crypto/hmac_sha3.h>

#include <openssl/evp.h>
#include <openssl/hmac.h>

#include <climits>
#include <stdexcept>
#include <string>

namespace {

void ComputeHMAC(const EVP_MD* md, const char* name, size_t expected_len,
                 const uint8_t* key, size_t key_len,
                 const uint8_t* data, size_t data_len,
                 uint8_t* output) {
    if (key == nullptr && key_len > 0) {
        throw std::invalid_argument(std::string(name) + ": key is NULL but key_len > 0");
    }
    if (data == nullptr && data_len > 0) {
        throw std::invalid_argument(std::string(name) + ": data is NULL but data_len > 0");
    }
    if (output == nullptr) {
        throw std::invalid_argument(std::string(name) + ": output buffer is NULL");
    }
    if (key_len > static_cast<size_t>(INT_MAX)) {
        throw std::invalid_argument(std::string(name) + ": key too long");
    }

    // OpenSSL wants non-null pointers even for empty input
    static const uint8_t empty = 0;
    if (key == nullptr) key = &empty;
    if (data == nullptr) data = &empty;

    unsigned int out_len = 0;
    if (HMAC(md, key, static_cast<int>(key_len), data, data_len, output, &out_len) == nullptr ||
        out_len != expected_len) {
        throw std::runtime_error(std::string(name) + ": OpenSSL HMAC failed");
    }
}

} // namespace

void HMAC_SHA3_512(const uint8_t* key, size_t key_len,
                   const uint8_t* data, size_t data_len,
                   uint8_t output[64]) {
    ComputeHMAC(EVP_sha3_512(), "HMAC_SHA3_512", 64, key, key_len, data, data_len, output);
}

void HMAC_SHA3_256(const uint8_t* key, size_t key_len,
                   const uint8_t* data, size_t data_len,
                   uint8_t output[32]) {
    ComputeHMAC(EVP_sha3_256(), "HMAC_SHA3_256", 32, key, key_len, data, data_len, output);
}
