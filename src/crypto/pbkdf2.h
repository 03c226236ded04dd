// Copyright (c) 2025 The Canary Core developers
// Distributed under the MIT software license

#ifndef CANARY_CRYPTO_PBKDF2_H
#define CANARY_CRYPTO_PBKDF2_H

#include <stdint.h>
#include <stdlib.h>

/**
 * PBKDF2-HMAC-SHA256 (RFC 8018), backed by OpenSSL.
 *
 *   DK = T1 || T2 || ... || Tdklen/hlen
 *   Ti = U1 ^ U2 ^ ... ^ Uc
 *   U1 = HMAC-SHA256(Password, Salt || INT_32_BE(i))
 *   Uj = HMAC-SHA256(Password, Uj-1)
 *
 * Deterministic in (password, salt, iterations, output_len).
 *
 * @param password Password bytes (may be empty)
 * @param salt Salt bytes, must be non-empty
 * @param iterations Iteration count c, must be > 0
 * @param output Output buffer of output_len bytes, output_len must be > 0
 * @return false on malformed input or if OpenSSL fails; output is zeroed in that case
 */
bool PBKDF2_HMAC_SHA256(const uint8_t* password, size_t password_len,
                        const uint8_t* salt, size_t salt_len,
                        uint32_t iterations,
                        uint8_t* output, size_t output_len);

#endif // CANARY_CRYPTO_PBKDF2_H
