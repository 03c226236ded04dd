// Copyright (c) 2025 The Canary Core developers
// Distributed under the MIT software license

#ifndef CANARY_CRYPTO_HMAC_SHA3_H
#define CANARY_CRYPTO_HMAC_SHA3_H

#include <stdint.h>
#include <stdlib.h>
#include <vector>

/**
 * HMAC over SHA-3 (RFC 2104 with FIPS 202 hashes), backed by OpenSSL.
 *
 * HMAC-SHA3-512 authenticates key bundles (IV || ciphertext).
 * HMAC-SHA3-256 is the PRF for the HKDF-Expand step that splits the
 * wrapping key into an encryption key and a MAC key.
 *
 * Both throw std::invalid_argument on null buffers with a non-zero length
 * and std::runtime_error if OpenSSL reports a failure.
 */

/**
 * @param output Output buffer for the 64-byte tag
 */
void HMAC_SHA3_512(const uint8_t* key, size_t key_len,
                   const uint8_t* data, size_t data_len,
                   uint8_t output[64]);

/**
 * @param output Output buffer for the 32-byte tag
 */
void HMAC_SHA3_256(const uint8_t* key, size_t key_len,
                   const uint8_t* data, size_t data_len,
                   uint8_t output[32]);

inline void HMAC_SHA3_512(const std::vector<uint8_t>& key,
                          const std::vector<uint8_t>& data,
                          uint8_t output[64]) {
    HMAC_SHA3_512(key.data(), key.size(), data.data(), data.size(), output);
}

#endif // CANARY_CRYPTO_HMAC_SHA3_H
