// Copyright (c) 2025 The Canary Core developers
// Distributed under the MIT software license

#ifndef CANARY_PUBKEY_H
#define CANARY_PUBKEY_H

#include <cstdint>
#include <cstring>
#include <string>
#include <vector>

/**
 * CPubKey: an uncompressed secp256k1 public key (0x04 || X || Y).
 *
 * Set() only accepts encodings of a point that lies on the curve, so a
 * valid CPubKey always has a well-defined Ethereum address.
 */
class CPubKey
{
public:
    static constexpr unsigned int SIZE = 65;

private:
    unsigned char vch[SIZE];
    bool fValid;

public:
    CPubKey() : fValid(false) {
        memset(vch, 0, sizeof(vch));
    }

    CPubKey(const unsigned char* pbegin, const unsigned char* pend) : CPubKey() {
        Set(pbegin, pend);
    }

    friend bool operator==(const CPubKey& a, const CPubKey& b) {
        return a.fValid == b.fValid && memcmp(a.vch, b.vch, SIZE) == 0;
    }
    friend bool operator!=(const CPubKey& a, const CPubKey& b) {
        return !(a == b);
    }

    unsigned int size() const { return SIZE; }
    const unsigned char* data() const { return vch; }
    const unsigned char* begin() const { return vch; }
    const unsigned char* end() const { return vch + SIZE; }

    bool IsValid() const { return fValid; }

    //! Parse and validate; on failure the key becomes invalid
    bool Set(const unsigned char* pbegin, const unsigned char* pend);

    //! EIP-55 checksummed address, "0x" + 40 hex digits. Empty if invalid.
    std::string GetAddress() const;

    //! Verify a DER-encoded ECDSA signature over a 32-byte message hash
    bool Verify(const uint8_t hash[32], const std::vector<unsigned char>& vchSig) const;
};

/**
 * Apply the EIP-55 mixed-case checksum to 20 address bytes.
 */
std::string EncodeChecksumAddress(const uint8_t addr[20]);

/**
 * "0x" followed by exactly 40 hex digits, any case.
 */
bool IsHexAddress(const std::string& address);

#endif // CANARY_PUBKEY_H
