// Copyright (c) 2025 The Canary Core developers
// Distributed under the MIT software license

#include <boost/test/unit_test.hpp>

#include <vault/crypter.h>
#include <vault/key_bundle.h>
#include <vault/vault_errors.h>

#include <cstring>
#include <vector>

BOOST_AUTO_TEST_SUITE(key_bundle_tests)

// Encoded layout offsets for a version 1 bundle
static const size_t OFFSET_VERSION = 8;
static const size_t OFFSET_ITERATIONS = 12;
static const size_t OFFSET_SALT_LEN = 16;
static const size_t OFFSET_CIPHERTEXT = 60;
static const size_t ENCODED_SIZE = 222;

static CKeyBundle MakeBundle() {
    CKeyBundle bundle;
    bundle.nDeriveIterations = VAULT_DEFAULT_KDF_ITERATIONS;
    bundle.vchSalt.assign(VAULT_SALT_SIZE, 0x11);
    bundle.vchIV.assign(VAULT_IV_SIZE, 0x22);
    bundle.vchCiphertext.assign(VAULT_CIPHERTEXT_SIZE, 0x33);
    bundle.vchMAC.assign(VAULT_MAC_SIZE, 0x44);
    bundle.strAddress = "0x2c7536E3605D9C16a7a3D7b1898e529396a65c23";
    return bundle;
}

static void PutUint32(std::vector<uint8_t>& blob, size_t offset, uint32_t value) {
    for (int i = 0; i < 4; i++) {
        blob[offset + i] = static_cast<uint8_t>(value >> (8 * i));
    }
}

BOOST_AUTO_TEST_CASE(encode_layout) {
    std::vector<uint8_t> blob = EncodeKeyBundle(MakeBundle());

    BOOST_REQUIRE_EQUAL(blob.size(), ENCODED_SIZE);
    BOOST_CHECK(std::memcmp(blob.data(), "CNRYKEY1", 8) == 0);
    // Little-endian version and iteration count
    BOOST_CHECK_EQUAL(blob[OFFSET_VERSION], 1);
    BOOST_CHECK_EQUAL(blob[OFFSET_VERSION + 1], 0);
    BOOST_CHECK_EQUAL(blob[OFFSET_ITERATIONS], VAULT_DEFAULT_KDF_ITERATIONS & 0xFF);
    BOOST_CHECK_EQUAL(blob[OFFSET_SALT_LEN], VAULT_SALT_SIZE);
    BOOST_CHECK_EQUAL(blob[OFFSET_CIPHERTEXT], 0x33);
}

BOOST_AUTO_TEST_CASE(decode_restores_every_field) {
    CKeyBundle original = MakeBundle();
    CKeyBundle decoded;

    BOOST_REQUIRE(DecodeKeyBundle(EncodeKeyBundle(original), decoded) == VaultError::OK);
    BOOST_CHECK_EQUAL(decoded.nVersion, CKeyBundle::VERSION_1);
    BOOST_CHECK_EQUAL(decoded.nDeriveIterations, original.nDeriveIterations);
    BOOST_CHECK(decoded.vchSalt == original.vchSalt);
    BOOST_CHECK(decoded.vchIV == original.vchIV);
    BOOST_CHECK(decoded.vchCiphertext == original.vchCiphertext);
    BOOST_CHECK(decoded.vchMAC == original.vchMAC);
    BOOST_CHECK_EQUAL(decoded.strAddress, original.strAddress);
}

BOOST_AUTO_TEST_CASE(wrong_magic_is_corruption) {
    std::vector<uint8_t> blob = EncodeKeyBundle(MakeBundle());
    blob[0] = 'X';
    CKeyBundle decoded;
    BOOST_CHECK(DecodeKeyBundle(blob, decoded) == VaultError::DATA_CORRUPTION);
}

BOOST_AUTO_TEST_CASE(unknown_version_is_unsupported) {
    std::vector<uint8_t> blob = EncodeKeyBundle(MakeBundle());
    PutUint32(blob, OFFSET_VERSION, 2);
    CKeyBundle decoded;
    BOOST_CHECK(DecodeKeyBundle(blob, decoded) == VaultError::UNSUPPORTED_VERSION);

    PutUint32(blob, OFFSET_VERSION, 0);
    BOOST_CHECK(DecodeKeyBundle(blob, decoded) == VaultError::UNSUPPORTED_VERSION);
}

BOOST_AUTO_TEST_CASE(truncation_at_every_length_is_corruption) {
    std::vector<uint8_t> blob = EncodeKeyBundle(MakeBundle());
    CKeyBundle decoded;

    for (size_t len = 0; len < blob.size(); len++) {
        std::vector<uint8_t> cut(blob.begin(), blob.begin() + len);
        BOOST_CHECK_MESSAGE(DecodeKeyBundle(cut, decoded) == VaultError::DATA_CORRUPTION,
                            "truncated to " << len << " bytes");
    }
}

BOOST_AUTO_TEST_CASE(trailing_bytes_are_corruption) {
    std::vector<uint8_t> blob = EncodeKeyBundle(MakeBundle());
    blob.push_back(0x00);
    CKeyBundle decoded;
    BOOST_CHECK(DecodeKeyBundle(blob, decoded) == VaultError::DATA_CORRUPTION);
}

BOOST_AUTO_TEST_CASE(oversized_length_prefix_is_corruption) {
    std::vector<uint8_t> blob = EncodeKeyBundle(MakeBundle());
    PutUint32(blob, OFFSET_SALT_LEN, 0xFFFFFFFF);
    CKeyBundle decoded;
    BOOST_CHECK(DecodeKeyBundle(blob, decoded) == VaultError::DATA_CORRUPTION);
}

BOOST_AUTO_TEST_CASE(out_of_range_fields_are_corruption) {
    CKeyBundle decoded;

    CKeyBundle shortSalt = MakeBundle();
    shortSalt.vchSalt.resize(8);
    BOOST_CHECK(!shortSalt.IsValid());
    BOOST_CHECK(DecodeKeyBundle(EncodeKeyBundle(shortSalt), decoded) == VaultError::DATA_CORRUPTION);

    CKeyBundle weak = MakeBundle();
    weak.nDeriveIterations = 1000;
    BOOST_CHECK(DecodeKeyBundle(EncodeKeyBundle(weak), decoded) == VaultError::DATA_CORRUPTION);

    CKeyBundle stalling = MakeBundle();
    stalling.nDeriveIterations = VAULT_MAX_BUNDLE_KDF_ITERATIONS + 1;
    BOOST_CHECK(DecodeKeyBundle(EncodeKeyBundle(stalling), decoded) == VaultError::DATA_CORRUPTION);

    CKeyBundle badAddress = MakeBundle();
    badAddress.strAddress = "not-an-address";
    BOOST_CHECK(DecodeKeyBundle(EncodeKeyBundle(badAddress), decoded) == VaultError::DATA_CORRUPTION);
}

BOOST_AUTO_TEST_CASE(failed_decode_leaves_output_untouched) {
    CKeyBundle decoded = MakeBundle();
    decoded.strAddress = "0x0000000000000000000000000000000000000001";

    std::vector<uint8_t> garbage(10, 0xAB);
    BOOST_CHECK(DecodeKeyBundle(garbage, decoded) == VaultError::DATA_CORRUPTION);
    BOOST_CHECK_EQUAL(decoded.strAddress, "0x0000000000000000000000000000000000000001");
}

BOOST_AUTO_TEST_SUITE_END()
