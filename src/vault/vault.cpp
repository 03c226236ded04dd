// Copyright (c) 2025 The Canary Core developers
// Distributed under the MIT software license

#include <vault/vault.h>
#include <vault/crypter.h>
#include <util/logging.h>
#include <util/strencodings.h>

#include <exception>
#include <utility>

// Collisions on 16 random bytes mean the RNG is broken
static const int MAX_UNIQUE_RANDOM_ATTEMPTS = 10;

const char* VaultStateToString(VaultState state) {
    switch (state) {
        case VaultState::NO_VAULT: return "no_vault";
        case VaultState::LOCKED: return "locked";
        case VaultState::UNLOCKED: return "unlocked";
    }
    return "unknown";
}

CVault::CVault(CSecureStorage& storage, const CVaultOptions& options)
    : m_storage(storage),
      m_options(options),
      m_state(VaultState::NO_VAULT),
      nUnlockFailedAttempts(0) {
    std::lock_guard<std::mutex> lock(cs_vault);
    VaultError err = Refresh_Locked();
    if (err != VaultError::OK) {
        LogPrintVault(WARN, "Vault state not fully loaded at construction: %s", GetVaultErrorName(err));
    }
}

CVault::~CVault() {
    std::lock_guard<std::mutex> lock(cs_vault);
    Lock_Locked();
}

// ============================================================================
// Internal helpers (caller holds cs_vault)
// ============================================================================

VaultError CVault::CheckPin(const SecureString& pin) const {
    PinValidationResult result = m_options.pinPolicy.Validate(pin);
    if (!result.is_valid) {
        LogPrintVault(INFO, "PIN rejected by policy: %s", result.error_message.c_str());
        return VaultError::INVALID_PIN;
    }
    return VaultError::OK;
}

void CVault::Lock_Locked() {
    m_key.Clear();
    if (m_state == VaultState::UNLOCKED) {
        m_state = VaultState::LOCKED;
        LogPrintVault(INFO, "Vault locked");
    }
}

bool CVault::GenerateUniqueSalt_Locked(std::vector<uint8_t>& salt) {
    for (int attempts = 0; attempts < MAX_UNIQUE_RANDOM_ATTEMPTS; attempts++) {
        if (!GenerateSalt(salt)) {
            return false;
        }
        if (usedSalts.insert(salt).second) {
            return true;
        }
    }
    return false;
}

bool CVault::GenerateUniqueIV_Locked(std::vector<uint8_t>& iv) {
    for (int attempts = 0; attempts < MAX_UNIQUE_RANDOM_ATTEMPTS; attempts++) {
        if (!GenerateIV(iv)) {
            return false;
        }
        if (usedIVs.insert(iv).second) {
            return true;
        }
    }
    return false;
}

VaultError CVault::Refresh_Locked() {
    std::optional<std::vector<uint8_t>> blob;
    if (!m_storage.Get(m_options.strServiceId, blob)) {
        LogPrintVault(ERROR, "Secure storage read failed during initialization");
        return VaultError::STORAGE_FAILURE;
    }

    m_key.Clear();
    if (!blob.has_value()) {
        m_state = VaultState::NO_VAULT;
        return VaultError::OK;
    }

    m_state = VaultState::LOCKED;
    std::optional<CKeyBundle> bundle;
    return LoadBundle_Locked(bundle);
}

VaultError CVault::LoadBundle_Locked(std::optional<CKeyBundle>& bundle) {
    bundle = std::nullopt;

    std::optional<std::vector<uint8_t>> blob;
    if (!m_storage.Get(m_options.strServiceId, blob)) {
        LogPrintVault(ERROR, "Secure storage read failed");
        return VaultError::STORAGE_FAILURE;
    }
    if (!blob.has_value()) {
        return VaultError::OK;
    }

    CKeyBundle decoded;
    VaultError err = DecodeKeyBundle(*blob, decoded);
    if (err != VaultError::OK) {
        return err;
    }

    usedSalts.insert(decoded.vchSalt);
    usedIVs.insert(decoded.vchIV);
    bundle = std::move(decoded);
    return VaultError::OK;
}

VaultError CVault::UnwrapBundle_Locked(const SecureString& pin, const CKeyBundle& bundle, CKey& keyOut) {
    SecureBytes wrappingKey;
    if (!DeriveWrappingKey(pin, bundle.vchSalt, bundle.nDeriveIterations, VAULT_KEY_SIZE, wrappingKey)) {
        LogPrintCrypto(ERROR, "Wrapping key derivation failed");
        return VaultError::CRYPTO_FAILURE;
    }

    SecureBytes plaintext;
    UnwrapStatus status = UnwrapKey(bundle.vchCiphertext, wrappingKey, bundle.vchIV, bundle.vchMAC, plaintext);
    memory_cleanse(wrappingKey.data(), wrappingKey.size());

    switch (status) {
        case UnwrapStatus::OK:
            break;
        case UnwrapStatus::AUTHENTICATION_FAILED:
        case UnwrapStatus::DECRYPTION_FAILED:
            nUnlockFailedAttempts++;
            LogPrintVault(INFO, "Unlock rejected (failed attempts: %u)", nUnlockFailedAttempts);
            return VaultError::INCORRECT_PIN;
        case UnwrapStatus::BAD_PARAMETERS:
            return VaultError::DATA_CORRUPTION;
    }

    // The tag matched, so from here on the PIN was right
    if (!keyOut.Set(plaintext.data(), plaintext.data() + plaintext.size())) {
        LogPrintVault(ERROR, "Authenticated bundle holds an invalid secp256k1 key");
        return VaultError::DATA_CORRUPTION;
    }

    const std::string recovered = keyOut.GetAddress();
    if (!CaseInsensitiveEqual(recovered, bundle.strAddress)) {
        LogPrintVault(ERROR, "Recovered key address %s does not match stored address %s",
                      recovered.c_str(), bundle.strAddress.c_str());
        keyOut.Clear();
        return VaultError::DATA_CORRUPTION;
    }

    return VaultError::OK;
}

VaultError CVault::Unlock_Locked(const SecureString& pin, std::string* address) {
    std::optional<CKeyBundle> bundle;
    VaultError err = LoadBundle_Locked(bundle);
    if (err != VaultError::OK) {
        return err;
    }
    if (!bundle.has_value()) {
        m_key.Clear();
        m_state = VaultState::NO_VAULT;
        return VaultError::NO_VAULT_FOUND;
    }
    if (m_state == VaultState::NO_VAULT) {
        m_state = VaultState::LOCKED;
    }

    CKey key;
    err = UnwrapBundle_Locked(pin, *bundle, key);
    if (err != VaultError::OK) {
        return err;
    }

    m_key = std::move(key);
    m_state = VaultState::UNLOCKED;
    nUnlockFailedAttempts = 0;
    LogPrintVault(INFO, "Vault unlocked for %s", bundle->strAddress.c_str());

    if (address != nullptr) {
        *address = bundle->strAddress;
    }
    return VaultError::OK;
}

VaultError CVault::StoreKey_Locked(CKey&& key, const SecureString& pin, std::string& address) {
    CKeyBundle bundle;
    bundle.nVersion = CKeyBundle::CURRENT_VERSION;
    bundle.nDeriveIterations = m_options.nKdfIterations;
    bundle.strAddress = key.GetAddress();
    if (bundle.strAddress.empty()) {
        return VaultError::INVALID_KEY;
    }

    if (!GenerateUniqueSalt_Locked(bundle.vchSalt) || !GenerateUniqueIV_Locked(bundle.vchIV)) {
        LogPrintCrypto(ERROR, "Could not obtain a fresh salt and IV");
        return VaultError::CRYPTO_FAILURE;
    }

    SecureBytes wrappingKey;
    if (!DeriveWrappingKey(pin, bundle.vchSalt, bundle.nDeriveIterations, VAULT_KEY_SIZE, wrappingKey)) {
        LogPrintCrypto(ERROR, "Wrapping key derivation failed");
        return VaultError::CRYPTO_FAILURE;
    }

    SecureBytes plaintext(key.data(), key.data() + key.size());
    bool wrapped = WrapKey(plaintext, wrappingKey, bundle.vchIV, bundle.vchCiphertext, bundle.vchMAC);
    memory_cleanse(wrappingKey.data(), wrappingKey.size());
    memory_cleanse(plaintext.data(), plaintext.size());
    if (!wrapped || !bundle.IsValid()) {
        LogPrintCrypto(ERROR, "Key wrapping failed");
        return VaultError::CRYPTO_FAILURE;
    }

    if (!m_storage.Put(m_options.strServiceId, EncodeKeyBundle(bundle))) {
        LogPrintVault(ERROR, "Secure storage write failed, previous vault left in place");
        return VaultError::STORAGE_FAILURE;
    }

    m_key = std::move(key);
    m_state = VaultState::UNLOCKED;
    nUnlockFailedAttempts = 0;
    address = bundle.strAddress;
    LogPrintVault(INFO, "Stored new key bundle for %s", address.c_str());
    return VaultError::OK;
}

// ============================================================================
// Public operations
// ============================================================================

VaultError CVault::Initialize() {
    std::lock_guard<std::mutex> lock(cs_vault);
    return Refresh_Locked();
}

VaultError CVault::CreateVault(const SecureString& pin, std::string& address) {
    std::lock_guard<std::mutex> lock(cs_vault);

    VaultError err = CheckPin(pin);
    if (err != VaultError::OK) {
        return err;
    }

    try {
        CKey key;
        if (!key.MakeNewKey()) {
            LogPrintCrypto(ERROR, "Signing key generation failed");
            return VaultError::CRYPTO_FAILURE;
        }
        return StoreKey_Locked(std::move(key), pin, address);
    } catch (const std::exception& e) {
        LogPrintVault(ERROR, "CreateVault failed: %s", e.what());
        return VaultError::CRYPTO_FAILURE;
    }
}

VaultError CVault::ImportVault(const SecureString& privateKeyHex, const SecureString& pin, std::string& address) {
    std::lock_guard<std::mutex> lock(cs_vault);

    VaultError err = CheckPin(pin);
    if (err != VaultError::OK) {
        return err;
    }

    try {
        CKey key;
        if (!key.SetHex(privateKeyHex)) {
            LogPrintVault(INFO, "Rejected malformed private key");
            return VaultError::INVALID_KEY;
        }
        return StoreKey_Locked(std::move(key), pin, address);
    } catch (const std::exception& e) {
        LogPrintVault(ERROR, "ImportVault failed: %s", e.what());
        return VaultError::CRYPTO_FAILURE;
    }
}

VaultError CVault::ImportVault(const CKey& key, const SecureString& pin, std::string& address) {
    std::lock_guard<std::mutex> lock(cs_vault);

    VaultError err = CheckPin(pin);
    if (err != VaultError::OK) {
        return err;
    }
    if (!key.IsValid()) {
        return VaultError::INVALID_KEY;
    }

    try {
        CKey copy;
        if (!copy.Set(key.data(), key.data() + key.size())) {
            return VaultError::INVALID_KEY;
        }
        return StoreKey_Locked(std::move(copy), pin, address);
    } catch (const std::exception& e) {
        LogPrintVault(ERROR, "ImportVault failed: %s", e.what());
        return VaultError::CRYPTO_FAILURE;
    }
}

VaultError CVault::Unlock(const SecureString& pin, std::string* address) {
    std::lock_guard<std::mutex> lock(cs_vault);

    VaultError err = CheckPin(pin);
    if (err != VaultError::OK) {
        return err;
    }

    try {
        return Unlock_Locked(pin, address);
    } catch (const std::exception& e) {
        LogPrintVault(ERROR, "Unlock failed: %s", e.what());
        return VaultError::CRYPTO_FAILURE;
    }
}

std::future<VaultError> CVault::UnlockAsync(const SecureString& pin) {
    return std::async(std::launch::async, [this, pin]() {
        return Unlock(pin);
    });
}

void CVault::Lock() {
    std::lock_guard<std::mutex> lock(cs_vault);
    Lock_Locked();
}

VaultError CVault::ChangePin(const SecureString& currentPin, const SecureString& newPin) {
    std::lock_guard<std::mutex> lock(cs_vault);

    VaultError err = CheckPin(newPin);
    if (err != VaultError::OK) {
        return err;
    }
    err = CheckPin(currentPin);
    if (err != VaultError::OK) {
        return err;
    }

    try {
        err = Unlock_Locked(currentPin, nullptr);
        if (err != VaultError::OK) {
            return err;
        }

        CKey key;
        if (!key.Set(m_key.data(), m_key.data() + m_key.size())) {
            return VaultError::CRYPTO_FAILURE;
        }

        std::string address;
        err = StoreKey_Locked(std::move(key), newPin, address);
        if (err == VaultError::OK) {
            LogPrintVault(INFO, "PIN changed for %s", address.c_str());
        }
        return err;
    } catch (const std::exception& e) {
        LogPrintVault(ERROR, "ChangePin failed: %s", e.what());
        return VaultError::CRYPTO_FAILURE;
    }
}

VaultError CVault::Reset() {
    std::lock_guard<std::mutex> lock(cs_vault);

    m_key.Clear();
    nUnlockFailedAttempts = 0;

    if (!m_storage.Delete(m_options.strServiceId)) {
        LogPrintVault(ERROR, "Secure storage delete failed during reset");
        m_state = (m_state == VaultState::NO_VAULT) ? VaultState::NO_VAULT : VaultState::LOCKED;
        return VaultError::STORAGE_FAILURE;
    }

    if (m_state != VaultState::NO_VAULT) {
        LogPrintVault(INFO, "Vault reset");
    }
    m_state = VaultState::NO_VAULT;
    return VaultError::OK;
}

VaultError CVault::HasVault(bool& exists) {
    std::lock_guard<std::mutex> lock(cs_vault);

    std::optional<std::vector<uint8_t>> blob;
    if (!m_storage.Get(m_options.strServiceId, blob)) {
        return VaultError::STORAGE_FAILURE;
    }
    exists = blob.has_value();
    return VaultError::OK;
}

VaultError CVault::GetAddress(std::optional<std::string>& address) {
    std::lock_guard<std::mutex> lock(cs_vault);

    address = std::nullopt;
    std::optional<CKeyBundle> bundle;
    VaultError err = LoadBundle_Locked(bundle);
    if (err != VaultError::OK) {
        return err;
    }
    if (bundle.has_value()) {
        address = bundle->strAddress;
    }
    return VaultError::OK;
}

VaultState CVault::GetState() const {
    std::lock_guard<std::mutex> lock(cs_vault);
    return m_state;
}

bool CVault::IsUnlocked() const {
    std::lock_guard<std::mutex> lock(cs_vault);
    return m_state == VaultState::UNLOCKED && m_key.IsValid();
}

VaultError CVault::WithSigningKey(const std::function<void(const CKey&)>& fn) {
    std::lock_guard<std::mutex> lock(cs_vault);

    if (m_state != VaultState::UNLOCKED || !m_key.IsValid()) {
        return VaultError::VAULT_LOCKED;
    }
    fn(m_key);
    return VaultError::OK;
}

VaultError CVault::SignHash(const uint8_t hash[32], std::vector<unsigned char>& vchSig) {
    std::lock_guard<std::mutex> lock(cs_vault);

    vchSig.clear();
    if (m_state != VaultState::UNLOCKED || !m_key.IsValid()) {
        return VaultError::VAULT_LOCKED;
    }
    if (!m_key.Sign(hash, vchSig)) {
        LogPrintCrypto(ERROR, "ECDSA signing failed");
        return VaultError::CRYPTO_FAILURE;
    }
    return VaultError::OK;
}

unsigned int CVault::GetFailedUnlockAttempts() const {
    std::lock_guard<std::mutex> lock(cs_vault);
    return nUnlockFailedAttempts;
}
