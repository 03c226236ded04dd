// Copyright (c) 2025 The Canary Core developers
// Distributed under the MIT software license

#include <vault/vault_errors.h>

std::string GetVaultErrorMessage(VaultError error) {
    switch (error) {
        case VaultError::OK:
            return "Success";
        case VaultError::INVALID_PIN:
            return "PIN does not match the required format";
        case VaultError::NO_VAULT_FOUND:
            return "No vault found on this device";
        case VaultError::INCORRECT_PIN:
            return "Incorrect PIN";
        case VaultError::DATA_CORRUPTION:
            return "Stored key data is corrupted. Reset the vault and restore the key from a backup";
        case VaultError::STORAGE_FAILURE:
            return "Secure storage is unavailable";
        case VaultError::INVALID_KEY:
            return "Invalid private key";
        case VaultError::UNSUPPORTED_VERSION:
            return "Stored key data was written by an unsupported version";
        case VaultError::VAULT_LOCKED:
            return "Vault is locked";
        case VaultError::CRYPTO_FAILURE:
            return "Cryptographic operation failed";
    }
    return "Unknown error";
}

const char* GetVaultErrorName(VaultError error) {
    switch (error) {
        case VaultError::OK: return "ok";
        case VaultError::INVALID_PIN: return "invalid_pin";
        case VaultError::NO_VAULT_FOUND: return "no_vault_found";
        case VaultError::INCORRECT_PIN: return "incorrect_pin";
        case VaultError::DATA_CORRUPTION: return "data_corruption";
        case VaultError::STORAGE_FAILURE: return "storage_failure";
        case VaultError::INVALID_KEY: return "invalid_key";
        case VaultError::UNSUPPORTED_VERSION: return "unsupported_version";
        case VaultError::VAULT_LOCKED: return "vault_locked";
        case VaultError::CRYPTO_FAILURE: return "crypto_failure";
    }
    return "unknown";
}

bool IsRetryableWithPin(VaultError error) {
    return error == VaultError::INVALID_PIN ||
           error == VaultError::INCORRECT_PIN ||
           error == VaultError::VAULT_LOCKED;
}
