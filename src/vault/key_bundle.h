// Copyright (c) 2025 The Canary Core developers
// Distributed under the MIT software license

#ifndef CANARY_VAULT_KEY_BUNDLE_H
#define CANARY_VAULT_KEY_BUNDLE_H

#include <vault/vault_errors.h>

#include <cstdint>
#include <string>
#include <vector>

/**
 * The only persisted artifact: a wrapped signing key plus what is needed to
 * unwrap it, and the cleartext address of the key for lookups without a PIN.
 *
 * Serialized (little-endian):
 *   magic "CNRYKEY1" | version u32 | body
 * Version 1 body:
 *   iterations u32 | salt | iv | ciphertext | tag | address
 * where each variable field is a u32 length followed by its bytes.
 */
struct CKeyBundle {
    static constexpr uint32_t VERSION_1 = 1;
    static constexpr uint32_t CURRENT_VERSION = VERSION_1;

    uint32_t nVersion;
    uint32_t nDeriveIterations;
    std::vector<uint8_t> vchSalt;
    std::vector<uint8_t> vchIV;
    std::vector<uint8_t> vchCiphertext;
    std::vector<uint8_t> vchMAC;
    std::string strAddress;

    CKeyBundle() : nVersion(CURRENT_VERSION), nDeriveIterations(0) {}

    //! Field sizes and ranges match what version 1 produces
    bool IsValid() const;
};

std::vector<uint8_t> EncodeKeyBundle(const CKeyBundle& bundle);

/**
 * Strict decode: wrong magic, truncation, trailing bytes or out-of-range
 * fields give DATA_CORRUPTION; an unknown version gives UNSUPPORTED_VERSION.
 */
VaultError DecodeKeyBundle(const std::vector<uint8_t>& blob, CKeyBundle& bundle);

#endif // CANARY_VAULT_KEY_BUNDLE_H
