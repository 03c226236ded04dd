// Copyright (c) 2025 The Canary Core developers
// Distributed under the MIT software license

#ifndef CANARY_CRYPTO_RANDOM_H
#define CANARY_CRYPTO_RANDOM_H

#include <stddef.h>
#include <stdint.h>

/**
 * Fill buf with len bytes from the kernel CSPRNG (/dev/urandom).
 *
 * @return true on success, false if the device cannot be read
 */
bool GetStrongRandBytes(uint8_t* buf, size_t len);

#endif // CANARY_CRYPTO_RANDOM_H
