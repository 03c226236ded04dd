// Copyright (c) 2025 The Canary Core developers
// Distributed under the MIT software license

#include <pubkey.h>
#include <crypto/keccak.h>
#include <util/strencodings.h>

#include <openssl/core_names.h>
#include <openssl/ec.h>
#include <openssl/evp.h>
#include <openssl/obj_mac.h>
#include <openssl/param_build.h>

#include <cctype>
#include <cstddef>

bool CPubKey::Set(const unsigned char* pbegin, const unsigned char* pend)
{
    fValid = false;
    memset(vch, 0, sizeof(vch));

    if (pbegin == nullptr || pend - pbegin != static_cast<ptrdiff_t>(SIZE) || pbegin[0] != 0x04) {
        return false;
    }

    EC_GROUP* group = EC_GROUP_new_by_curve_name(NID_secp256k1);
    EC_POINT* point = group ? EC_POINT_new(group) : nullptr;
    bool ok = point != nullptr &&
              EC_POINT_oct2point(group, point, pbegin, SIZE, nullptr) == 1 &&
              EC_POINT_is_on_curve(group, point, nullptr) == 1;
    EC_POINT_free(point);
    EC_GROUP_free(group);

    if (!ok) {
        return false;
    }

    memcpy(vch, pbegin, SIZE);
    fValid = true;
    return true;
}

std::string CPubKey::GetAddress() const
{
    if (!fValid) {
        return std::string();
    }

    // Address = last 20 bytes of Keccak-256(X || Y)
    uint8_t hash[32];
    Keccak256(vch + 1, SIZE - 1, hash);
    return EncodeChecksumAddress(hash + 12);
}

bool CPubKey::Verify(const uint8_t hash[32], const std::vector<unsigned char>& vchSig) const
{
    if (!fValid || hash == nullptr || vchSig.empty()) {
        return false;
    }

    OSSL_PARAM_BLD* bld = OSSL_PARAM_BLD_new();
    OSSL_PARAM* params = nullptr;
    EVP_PKEY_CTX* fromdata = nullptr;
    EVP_PKEY* pkey = nullptr;
    EVP_PKEY_CTX* vctx = nullptr;
    bool result = false;

    if (bld != nullptr &&
        OSSL_PARAM_BLD_push_utf8_string(bld, OSSL_PKEY_PARAM_GROUP_NAME, "secp256k1", 0) == 1 &&
        OSSL_PARAM_BLD_push_octet_string(bld, OSSL_PKEY_PARAM_PUB_KEY, vch, SIZE) == 1 &&
        (params = OSSL_PARAM_BLD_to_param(bld)) != nullptr &&
        (fromdata = EVP_PKEY_CTX_new_from_name(nullptr, "EC", nullptr)) != nullptr &&
        EVP_PKEY_fromdata_init(fromdata) == 1 &&
        EVP_PKEY_fromdata(fromdata, &pkey, EVP_PKEY_PUBLIC_KEY, params) == 1 &&
        (vctx = EVP_PKEY_CTX_new(pkey, nullptr)) != nullptr &&
        EVP_PKEY_verify_init(vctx) == 1) {
        result = EVP_PKEY_verify(vctx, vchSig.data(), vchSig.size(), hash, 32) == 1;
    }

    EVP_PKEY_CTX_free(vctx);
    EVP_PKEY_free(pkey);
    EVP_PKEY_CTX_free(fromdata);
    OSSL_PARAM_free(params);
    OSSL_PARAM_BLD_free(bld);
    return result;
}

std::string EncodeChecksumAddress(const uint8_t addr[20])
{
    const std::string lower = HexStr(addr, 20);

    // EIP-55: hash the lowercase hex text, uppercase letters whose nibble is >= 8
    uint8_t hash[32];
    Keccak256(reinterpret_cast<const uint8_t*>(lower.data()), lower.size(), hash);

    std::string out = "0x";
    out.reserve(42);
    for (size_t i = 0; i < lower.size(); i++) {
        char c = lower[i];
        uint8_t nibble = (i % 2 == 0) ? (hash[i / 2] >> 4) : (hash[i / 2] & 0x0F);
        if (c >= 'a' && c <= 'f' && nibble >= 8) {
            c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
        }
        out.push_back(c);
    }
    return out;
}

bool IsHexAddress(const std::string& address)
{
    if (address.size() != 42 || address[0] != '0' || (address[1] != 'x' && address[1] != 'X')) {
        return false;
    }
    return IsHex(address.substr(2));
}
