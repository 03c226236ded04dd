// Copyright (c) 2025 The Canary Core developers
// Distributed under the MIT software license

#ifndef CANARY_CRYPTO_KECCAK_H
#define CANARY_CRYPTO_KECCAK_H

#include <stdint.h>
#include <stdlib.h>

/**
 * Keccak-256 as used by Ethereum: the original Keccak submission with
 * pad10*1 (domain byte 0x01), not the FIPS 202 SHA3-256 (domain byte 0x06).
 * OpenSSL 3.0 does not expose this variant, hence the local permutation.
 *
 * @param hash Output buffer for the 32-byte digest
 */
void Keccak256(const uint8_t* data, size_t len, uint8_t hash[32]);

#endif // CANARY_CRYPTO_KECCAK_H
