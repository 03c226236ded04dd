// Copyright (c) 2025 The Canary Core developers
// Distributed under the MIT software license

#ifndef CANARY_KEY_H
#define CANARY_KEY_H

#include <pubkey.h>
#include <util/secure_allocator.h>

#include <cstdint>
#include <string>
#include <vector>

/**
 * CKey: an encapsulated secp256k1 secret key, the Ethereum signing key.
 *
 * Key bytes live in SecureBytes (mlock()ed, wiped on release). CKey is
 * move-only so ownership of a secret is never shared by accident.
 */
class CKey
{
public:
    static constexpr size_t SIZE = 32;

private:
    //! Whether this private key is valid (1 <= k < n)
    bool fValid;

    SecureBytes keydata;

public:
    //! Construct an invalid private key
    CKey() : fValid(false), keydata(SIZE, 0) {}

    ~CKey() { Clear(); }

    //! Initialize from 32 big-endian bytes; rejects 0 and values >= n
    bool Set(const unsigned char* pbegin, const unsigned char* pend);

    //! Initialize from 64 hex digits, optionally prefixed with "0x"
    bool SetHex(const char* str, size_t len);
    bool SetHex(const SecureString& str) { return SetHex(str.data(), str.size()); }

    //! Generate a new random private key
    bool MakeNewKey();

    //! Overwrite the secret and mark the key invalid
    void Clear();

    bool IsValid() const { return fValid; }

    CPubKey GetPubKey() const;

    //! Shorthand for GetPubKey().GetAddress()
    std::string GetAddress() const;

    //! DER-encoded ECDSA signature over a 32-byte message hash
    bool Sign(const uint8_t hash[32], std::vector<unsigned char>& vchSig) const;

    //! Check that pubkey belongs to this secret
    bool VerifyPubKey(const CPubKey& pubkey) const;

    const unsigned char* data() const { return keydata.data(); }
    static constexpr size_t size() { return SIZE; }

    CKey(const CKey&) = delete;
    CKey& operator=(const CKey&) = delete;

    CKey(CKey&& other) noexcept;
    CKey& operator=(CKey&& other) noexcept;
};

/**
 * True if vch encodes a scalar in [1, n-1] for the secp256k1 group order n.
 */
bool IsValidSecretKey(const unsigned char* vch, size_t len);

#endif // CANARY_KEY_H
