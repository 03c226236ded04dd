// Copyright (c) 2025 The Canary Core developers
// Distributed under the MIT software license

#ifndef CANARY_STORAGE_SECURE_STORAGE_H
#define CANARY_STORAGE_SECURE_STORAGE_H

#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

//! Largest blob any adapter will store or return
static const size_t MAX_SECURE_BLOB_SIZE = 64 * 1024;

//! Storage identifier of the wrapped signing key
static const char* const DEFAULT_VAULT_SERVICE_ID = "canary_eth_key_bundle";

/**
 * At-rest storage for opaque blobs, one per service id.
 *
 * Adapters must store and return blobs byte for byte. A blob is either
 * fully replaced or left untouched by Put.
 */
class CSecureStorage {
public:
    virtual ~CSecureStorage() = default;

    /**
     * Store a blob, replacing any previous one.
     * @return false if the blob could not be persisted; the previous blob survives
     */
    virtual bool Put(const std::string& serviceId, const std::vector<uint8_t>& blob) = 0;

    /**
     * @param blob Set to the stored blob, or std::nullopt if nothing is stored
     * @return false on a read failure (blob is then unspecified)
     */
    virtual bool Get(const std::string& serviceId, std::optional<std::vector<uint8_t>>& blob) = 0;

    /**
     * Remove the blob. Removing a missing blob succeeds.
     */
    virtual bool Delete(const std::string& serviceId) = 0;
};

/**
 * In-process storage used by tests and short-lived tools.
 * SetFailReads / SetFailWrites simulate adapter failures.
 */
class CMemorySecureStorage : public CSecureStorage {
public:
    bool Put(const std::string& serviceId, const std::vector<uint8_t>& blob) override;
    bool Get(const std::string& serviceId, std::optional<std::vector<uint8_t>>& blob) override;
    bool Delete(const std::string& serviceId) override;

    void SetFailReads(bool fail);
    void SetFailWrites(bool fail);

    //! Successful Put calls so far
    size_t GetWriteCount() const;

    //! Direct access for tests that tamper with stored blobs
    bool Peek(const std::string& serviceId, std::vector<uint8_t>& blob) const;
    void Poke(const std::string& serviceId, const std::vector<uint8_t>& blob);

private:
    mutable std::mutex cs_storage;
    std::map<std::string, std::vector<uint8_t>> m_blobs;
    bool fFailReads{false};
    bool fFailWrites{false};
    size_t nWrites{0};
};

/**
 * One file per service id in a private directory.
 *
 * Writes go to "<id>.bin.tmp" (mode 0600), are fsync()ed and then renamed
 * over "<id>.bin", followed by an fsync() of the directory.
 */
class CFileSecureStorage : public CSecureStorage {
public:
    explicit CFileSecureStorage(const std::string& directory);

    bool Put(const std::string& serviceId, const std::vector<uint8_t>& blob) override;
    bool Get(const std::string& serviceId, std::optional<std::vector<uint8_t>>& blob) override;
    bool Delete(const std::string& serviceId) override;

    //! Path of the file backing serviceId, empty if the id is not usable as a file name
    std::string GetPath(const std::string& serviceId) const;

private:
    std::string m_directory;
    std::mutex cs_storage;
};

/**
 * Service ids are restricted to [A-Za-z0-9_.-], 1 to 64 characters, not starting with '.'.
 */
bool IsValidServiceId(const std::string& serviceId);

#endif // CANARY_STORAGE_SECURE_STORAGE_H
