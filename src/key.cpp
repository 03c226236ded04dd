// Copyright (c) 2025 The Canary Core developers
// Distributed under the MIT software license

#include <key.h>
#include <crypto/random.h>
#include <util/strencodings.h>

#include <openssl/bn.h>
#include <openssl/core_names.h>
#include <openssl/ec.h>
#include <openssl/evp.h>
#include <openssl/obj_mac.h>
#include <openssl/param_build.h>

#include <cstring>

namespace {

//! secp256k1 group order n, big-endian
const unsigned char SECP256K1_ORDER[CKey::SIZE] = {
    0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF,
    0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFE,
    0xBA, 0xAE, 0xDC, 0xE6, 0xAF, 0x48, 0xA0, 0x3B,
    0xBF, 0xD2, 0x5E, 0x8C, 0xD0, 0x36, 0x41, 0x41};

//! Rejection sampling bound for MakeNewKey
const int MAX_KEYGEN_ATTEMPTS = 128;

} // namespace

bool IsValidSecretKey(const unsigned char* vch, size_t len)
{
    if (vch == nullptr || len != CKey::SIZE) {
        return false;
    }

    unsigned char acc = 0;
    for (size_t i = 0; i < len; i++) {
        acc |= vch[i];
    }
    if (acc == 0) {
        return false;
    }

    return memcmp(vch, SECP256K1_ORDER, CKey::SIZE) < 0;
}

CKey::CKey(CKey&& other) noexcept : fValid(other.fValid), keydata(std::move(other.keydata))
{
    other.fValid = false;
}

CKey& CKey::operator=(CKey&& other) noexcept
{
    if (this != &other) {
        Clear();
        keydata = std::move(other.keydata);
        fValid = other.fValid;
        other.fValid = false;
    }
    return *this;
}

void CKey::Clear()
{
    if (!keydata.empty()) {
        memory_cleanse(keydata.data(), keydata.size());
    }
    fValid = false;
}

bool CKey::Set(const unsigned char* pbegin, const unsigned char* pend)
{
    Clear();
    if (pbegin == nullptr || pend < pbegin ||
        !IsValidSecretKey(pbegin, static_cast<size_t>(pend - pbegin))) {
        return false;
    }

    keydata.assign(pbegin, pend);
    fValid = true;
    return true;
}

bool CKey::SetHex(const char* str, size_t len)
{
    Clear();
    if (str == nullptr) {
        return false;
    }

    if (len >= 2 && str[0] == '0' && (str[1] == 'x' || str[1] == 'X')) {
        str += 2;
        len -= 2;
    }
    if (len != SIZE * 2) {
        return false;
    }

    SecureBytes bytes(SIZE, 0);
    for (size_t i = 0; i < SIZE; i++) {
        int8_t high = HexDigit(str[2 * i]);
        int8_t low = HexDigit(str[2 * i + 1]);
        if (high < 0 || low < 0) {
            return false;
        }
        bytes[i] = static_cast<uint8_t>((high << 4) | low);
    }

    return Set(bytes.data(), bytes.data() + bytes.size());
}

bool CKey::MakeNewKey()
{
    Clear();

    SecureBytes candidate(SIZE, 0);
    for (int attempt = 0; attempt < MAX_KEYGEN_ATTEMPTS; attempt++) {
        if (!GetStrongRandBytes(candidate.data(), candidate.size())) {
            return false;
        }
        if (IsValidSecretKey(candidate.data(), candidate.size())) {
            return Set(candidate.data(), candidate.data() + candidate.size());
        }
    }
    return false;
}

CPubKey CKey::GetPubKey() const
{
    CPubKey result;
    if (!fValid) {
        return result;
    }

    EC_GROUP* group = EC_GROUP_new_by_curve_name(NID_secp256k1);
    BN_CTX* ctx = BN_CTX_secure_new();
    BIGNUM* priv = BN_secure_new();
    EC_POINT* point = group ? EC_POINT_new(group) : nullptr;
    unsigned char buf[CPubKey::SIZE];

    if (ctx != nullptr && priv != nullptr && point != nullptr &&
        BN_bin2bn(keydata.data(), SIZE, priv) != nullptr &&
        EC_POINT_mul(group, point, priv, nullptr, nullptr, ctx) == 1 &&
        EC_POINT_point2oct(group, point, POINT_CONVERSION_UNCOMPRESSED,
                           buf, sizeof(buf), ctx) == sizeof(buf)) {
        result.Set(buf, buf + sizeof(buf));
    }

    EC_POINT_free(point);
    BN_clear_free(priv);
    BN_CTX_free(ctx);
    EC_GROUP_free(group);
    return result;
}

std::string CKey::GetAddress() const
{
    return GetPubKey().GetAddress();
}

bool CKey::Sign(const uint8_t hash[32], std::vector<unsigned char>& vchSig) const
{
    vchSig.clear();
    if (!fValid || hash == nullptr) {
        return false;
    }

    CPubKey pubkey = GetPubKey();
    if (!pubkey.IsValid()) {
        return false;
    }

    OSSL_PARAM_BLD* bld = OSSL_PARAM_BLD_new();
    BIGNUM* priv = BN_secure_new();
    OSSL_PARAM* params = nullptr;
    EVP_PKEY_CTX* fromdata = nullptr;
    EVP_PKEY* pkey = nullptr;
    EVP_PKEY_CTX* sctx = nullptr;
    bool result = false;
    size_t siglen = 0;

    if (bld != nullptr && priv != nullptr &&
        BN_bin2bn(keydata.data(), SIZE, priv) != nullptr &&
        OSSL_PARAM_BLD_push_utf8_string(bld, OSSL_PKEY_PARAM_GROUP_NAME, "secp256k1", 0) == 1 &&
        OSSL_PARAM_BLD_push_BN(bld, OSSL_PKEY_PARAM_PRIV_KEY, priv) == 1 &&
        OSSL_PARAM_BLD_push_octet_string(bld, OSSL_PKEY_PARAM_PUB_KEY, pubkey.data(), pubkey.size()) == 1 &&
        (params = OSSL_PARAM_BLD_to_param(bld)) != nullptr &&
        (fromdata = EVP_PKEY_CTX_new_from_name(nullptr, "EC", nullptr)) != nullptr &&
        EVP_PKEY_fromdata_init(fromdata) == 1 &&
        EVP_PKEY_fromdata(fromdata, &pkey, EVP_PKEY_KEYPAIR, params) == 1 &&
        (sctx = EVP_PKEY_CTX_new(pkey, nullptr)) != nullptr &&
        EVP_PKEY_sign_init(sctx) == 1 &&
        EVP_PKEY_sign(sctx, nullptr, &siglen, hash, 32) == 1) {
        vchSig.resize(siglen);
        if (EVP_PKEY_sign(sctx, vchSig.data(), &siglen, hash, 32) == 1) {
            vchSig.resize(siglen);
            result = true;
        } else {
            vchSig.clear();
        }
    }

    EVP_PKEY_CTX_free(sctx);
    EVP_PKEY_free(pkey);
    EVP_PKEY_CTX_free(fromdata);
    OSSL_PARAM_free(params);
    BN_clear_free(priv);
    OSSL_PARAM_BLD_free(bld);
    return result;
}

bool CKey::VerifyPubKey(const CPubKey& pubkey) const
{
    if (!fValid || !pubkey.IsValid()) {
        return false;
    }
    return GetPubKey() == pubkey;
}
