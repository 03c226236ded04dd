// Copyright (c) 2025 The Canary Core developers
// Distributed under the MIT software license

#ifndef CANARY_VAULT_VAULT_H
#define CANARY_VAULT_VAULT_H

#include <key.h>
#include <storage/secure_storage.h>
#include <util/secure_allocator.h>
#include <vault/key_bundle.h>
#include <vault/vault_errors.h>
#include <vault/vault_options.h>

#include <cstdint>
#include <functional>
#include <future>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>

enum class VaultState {
    NO_VAULT,
    LOCKED,
    UNLOCKED
};

const char* VaultStateToString(VaultState state);

/**
 * CVault
 *
 * Local key vault: keeps one Ethereum signing key wrapped under a PIN in
 * secure storage and holds the unwrapped key in memory only while unlocked.
 *
 *   NO_VAULT --create/import--> UNLOCKED <--unlock-- LOCKED
 *   UNLOCKED --lock--> LOCKED,  any --reset--> NO_VAULT
 *
 * Every operation takes cs_vault for its whole duration, so operations on
 * one instance are linearizable and a Lock() issued while an unlock is
 * running takes effect right after it.
 *
 * The vault is the only writer of its storage entry. A new bundle is fully
 * built in memory before it replaces the old one.
 */
class CVault {
public:
    CVault(CSecureStorage& storage, const CVaultOptions& options = CVaultOptions());
    ~CVault();

    CVault(const CVault&) = delete;
    CVault& operator=(const CVault&) = delete;

    /**
     * Re-read the stored bundle (if any) and set the state to LOCKED or NO_VAULT.
     * The constructor already does this and logs a failure; call it to get
     * the error. A corrupt bundle still counts as an existing vault.
     */
    VaultError Initialize();

    /**
     * Generate a new signing key, wrap it under pin and persist it,
     * replacing any previous vault. Leaves the vault UNLOCKED.
     */
    VaultError CreateVault(const SecureString& pin, std::string& address);

    /**
     * As CreateVault, with a caller-supplied key (64 hex digits, optional 0x).
     */
    VaultError ImportVault(const SecureString& privateKeyHex, const SecureString& pin, std::string& address);
    VaultError ImportVault(const CKey& key, const SecureString& pin, std::string& address);

    /**
     * Authenticate, decrypt and check the stored address.
     * @param address If non-null, receives the address on success
     */
    VaultError Unlock(const SecureString& pin, std::string* address = nullptr);

    /**
     * Run Unlock on a worker thread. The vault must outlive the returned future.
     */
    std::future<VaultError> UnlockAsync(const SecureString& pin);

    /**
     * Wipe the in-memory key. No-op when already LOCKED or NO_VAULT.
     */
    void Lock();

    /**
     * Unlock with currentPin, then re-wrap the same key under newPin with a
     * fresh salt and IV. The stored bundle is replaced in one Put.
     */
    VaultError ChangePin(const SecureString& currentPin, const SecureString& newPin);

    /**
     * Delete the stored bundle and wipe memory. Succeeds when nothing is stored.
     */
    VaultError Reset();

    VaultError HasVault(bool& exists);

    /**
     * Address recorded in the stored bundle, std::nullopt if there is no vault.
     */
    VaultError GetAddress(std::optional<std::string>& address);

    VaultState GetState() const;
    bool IsUnlocked() const;

    /**
     * Give fn access to the signing key for one operation. fn runs under
     * cs_vault and must not call back into the vault or keep the key.
     * @return VAULT_LOCKED unless UNLOCKED
     */
    VaultError WithSigningKey(const std::function<void(const CKey&)>& fn);

    /**
     * DER-encoded ECDSA signature of a 32-byte hash with the unlocked key.
     */
    VaultError SignHash(const uint8_t hash[32], std::vector<unsigned char>& vchSig);

    //! Wrong-PIN results since the last successful unlock
    unsigned int GetFailedUnlockAttempts() const;

    const CVaultOptions& GetOptions() const { return m_options; }

private:
    CSecureStorage& m_storage;
    const CVaultOptions m_options;

    mutable std::mutex cs_vault;
    VaultState m_state;
    CKey m_key;                 // Valid only while UNLOCKED
    unsigned int nUnlockFailedAttempts;

    // Every salt and IV this instance has written or read; never reused
    std::set<std::vector<uint8_t>> usedSalts;
    std::set<std::vector<uint8_t>> usedIVs;

    VaultError Refresh_Locked();
    VaultError LoadBundle_Locked(std::optional<CKeyBundle>& bundle);
    VaultError UnwrapBundle_Locked(const SecureString& pin, const CKeyBundle& bundle, CKey& keyOut);
    VaultError Unlock_Locked(const SecureString& pin, std::string* address);
    VaultError StoreKey_Locked(CKey&& key, const SecureString& pin, std::string& address);
    VaultError CheckPin(const SecureString& pin) const;
    bool GenerateUniqueSalt_Locked(std::vector<uint8_t>& salt);
    bool GenerateUniqueIV_Locked(std::vector<uint8_t>& iv);
    void Lock_Locked();
};

#endif // CANARY_VAULT_VAULT_H
