// Copyright (c) 2025 The Canary Core developers
// Distributed under the MIT software license

/**
 * HMAC-SHA3 Tests
 *
 * HMAC-SHA3-512 authenticates key bundles and HMAC-SHA3-256 derives the
 * codec sub-keys. The long-key case is checked against the HMAC definition
 * (keys longer than the block are hashed first).
 */

#include <boost/test/unit_test.hpp>

#include <crypto/hmac_sha3.h>

#include <openssl/evp.h>

#include <algorithm>
#include <cstring>
#include <stdexcept>
#include <vector>

BOOST_AUTO_TEST_SUITE(hmac_sha3_tests)

static std::vector<uint8_t> Sha3(const EVP_MD* md, const std::vector<uint8_t>& data) {
    std::vector<uint8_t> digest(EVP_MD_size(md));
    unsigned int len = 0;
    BOOST_REQUIRE(EVP_Digest(data.data(), data.size(), digest.data(), &len, md, nullptr) == 1);
    digest.resize(len);
    return digest;
}

BOOST_AUTO_TEST_CASE(hmac_sha3_512_empty_inputs) {
    uint8_t output[64];
    HMAC_SHA3_512(nullptr, 0, nullptr, 0, output);

    bool all_zeros = std::all_of(output, output + 64, [](uint8_t b) { return b == 0; });
    BOOST_CHECK(!all_zeros);
}

BOOST_AUTO_TEST_CASE(hmac_sha3_512_deterministic) {
    uint8_t key[20];
    std::memset(key, 0x0b, sizeof(key));
    const uint8_t data[] = {'H', 'i', ' ', 'T', 'h', 'e', 'r', 'e'};

    uint8_t output1[64];
    uint8_t output2[64];
    HMAC_SHA3_512(key, sizeof(key), data, sizeof(data), output1);
    HMAC_SHA3_512(key, sizeof(key), data, sizeof(data), output2);

    BOOST_CHECK_EQUAL_COLLECTIONS(output1, output1 + 64, output2, output2 + 64);
}

BOOST_AUTO_TEST_CASE(hmac_sha3_512_key_and_data_sensitivity) {
    std::vector<uint8_t> key(32, 0x11);
    std::vector<uint8_t> data(48, 0x22);
    uint8_t base[64], other[64];

    HMAC_SHA3_512(key, data, base);

    key[31] ^= 0x01;
    HMAC_SHA3_512(key, data, other);
    BOOST_CHECK(std::memcmp(base, other, 64) != 0);

    key[31] ^= 0x01;
    data[0] ^= 0x80;
    HMAC_SHA3_512(key, data, other);
    BOOST_CHECK(std::memcmp(base, other, 64) != 0);
}

/**
 * SHA3-512 block size is 72 bytes; a 100-byte key must behave like its digest
 */
BOOST_AUTO_TEST_CASE(hmac_sha3_512_long_key_is_hashed) {
    std::vector<uint8_t> longKey(100);
    for (size_t i = 0; i < longKey.size(); i++) {
        longKey[i] = static_cast<uint8_t>(i);
    }
    std::vector<uint8_t> data = {'c', 'a', 'n', 'a', 'r', 'y'};

    uint8_t direct[64], viaDigest[64];
    HMAC_SHA3_512(longKey, data, direct);
    HMAC_SHA3_512(Sha3(EVP_sha3_512(), longKey), data, viaDigest);

    BOOST_CHECK_EQUAL_COLLECTIONS(direct, direct + 64, viaDigest, viaDigest + 64);
}

BOOST_AUTO_TEST_CASE(hmac_sha3_256_long_key_is_hashed) {
    // SHA3-256 block size is 136 bytes
    std::vector<uint8_t> longKey(200, 0x5c);
    std::vector<uint8_t> data = {'e', 'n', 'c', 0x01};

    std::vector<uint8_t> digestKey = Sha3(EVP_sha3_256(), longKey);
    uint8_t direct[32], viaDigest[32];
    HMAC_SHA3_256(longKey.data(), longKey.size(), data.data(), data.size(), direct);
    HMAC_SHA3_256(digestKey.data(), digestKey.size(), data.data(), data.size(), viaDigest);

    BOOST_CHECK_EQUAL_COLLECTIONS(direct, direct + 32, viaDigest, viaDigest + 32);
}

BOOST_AUTO_TEST_CASE(hmac_sha3_256_differs_from_512_prefix) {
    const uint8_t key[] = {1, 2, 3, 4};
    const uint8_t data[] = {5, 6, 7, 8};
    uint8_t out256[32], out512[64];

    HMAC_SHA3_256(key, sizeof(key), data, sizeof(data), out256);
    HMAC_SHA3_512(key, sizeof(key), data, sizeof(data), out512);

    BOOST_CHECK(std::memcmp(out256, out512, 32) != 0);
}

BOOST_AUTO_TEST_CASE(hmac_sha3_null_with_length_throws) {
    const uint8_t data[] = {1};
    uint8_t output[64];

    BOOST_CHECK_THROW(HMAC_SHA3_512(nullptr, 16, data, sizeof(data), output), std::invalid_argument);
    BOOST_CHECK_THROW(HMAC_SHA3_512(data, sizeof(data), nullptr, 16, output), std::invalid_argument);
}

BOOST_AUTO_TEST_SUITE_END()
