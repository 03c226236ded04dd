// Copyright (c) 2025 The Canary Core developers
// Distributed under the MIT software license

#ifndef CANARY_VAULT_VAULT_ERRORS_H
#define CANARY_VAULT_VAULT_ERRORS_H

#include <string>

/**
 * Outcome of every public vault operation.
 *
 * INCORRECT_PIN covers both a tag mismatch and a decryption failure and is
 * never split further. DATA_CORRUPTION means the PIN was right but the bundle
 * does not describe the key it holds (or cannot be parsed at all).
 */
enum class VaultError {
    OK,
    INVALID_PIN,           // PIN rejected by the format policy, no crypto attempted
    NO_VAULT_FOUND,        // Nothing persisted under the service id
    INCORRECT_PIN,         // Authentication or decryption failed
    DATA_CORRUPTION,       // Address mismatch or unparseable bundle
    STORAGE_FAILURE,       // Secure storage could not read or write
    INVALID_KEY,           // Imported private key is malformed or out of range
    UNSUPPORTED_VERSION,   // Bundle written by an unknown format version
    VAULT_LOCKED,          // Signing key requested while not unlocked
    CRYPTO_FAILURE         // RNG or primitive failure
};

/**
 * User-facing text for an error. Identical for every INCORRECT_PIN cause.
 */
std::string GetVaultErrorMessage(VaultError error);

/**
 * Short stable identifier ("incorrect_pin") for logs and scripting.
 */
const char* GetVaultErrorName(VaultError error);

/**
 * Whether asking the user for the PIN again can fix the error.
 */
bool IsRetryableWithPin(VaultError error);

#endif // CANARY_VAULT_VAULT_ERRORS_H
