// Copyright (c) 2025 The Canary Core developers
// Distributed under the MIT software license

#include <boost/test/unit_test.hpp>

#include <crypto/keccak.h>
#include <pubkey.h>
#include <util/strencodings.h>

#include <string>
#include <vector>

BOOST_AUTO_TEST_SUITE(keccak_tests)

static std::string KeccakHex(const std::string& input) {
    uint8_t hash[32];
    Keccak256(reinterpret_cast<const uint8_t*>(input.data()), input.size(), hash);
    return HexStr(hash, sizeof(hash));
}

// Ethereum Keccak-256 uses the original 0x01 padding, not SHA3-256's 0x06
BOOST_AUTO_TEST_CASE(keccak256_known_answers) {
    BOOST_CHECK_EQUAL(KeccakHex(""),
                      "c5d2460186f7233c927e7db2dcc703c0e500b653ca82273b7bfad8045d85a470");
    BOOST_CHECK_EQUAL(KeccakHex("abc"),
                      "4e03657aea45a94fc7d47ba826c8d667c0d1e6e33a64a036ec44f58fa12d6c45");
}

BOOST_AUTO_TEST_CASE(keccak256_block_boundaries) {
    // Rate is 136 bytes; inputs around it exercise the padding paths
    std::string prev;
    for (size_t len : {135, 136, 137, 272}) {
        std::string h = KeccakHex(std::string(len, 'a'));
        BOOST_CHECK_EQUAL(h.size(), 64U);
        BOOST_CHECK(h != prev);
        BOOST_CHECK_EQUAL(h, KeccakHex(std::string(len, 'a')));
        prev = h;
    }
}

BOOST_AUTO_TEST_CASE(eip55_checksum_addresses) {
    const char* cases[] = {
        "0x5aAeb6053F3E94C9b9A09f33669435E7Ef1BeAed",
        "0xfB6916095ca1df60bB79Ce92cE3Ea74c37c5d359",
        "0xdbF03B407c01E7cD3CBea99509d93f8DDDC8C6FB",
        "0xD1220A0cf47c7B9Be7A2E6BA89F429762e7b9aDb",
    };
    for (const char* expected : cases) {
        std::vector<uint8_t> raw = ParseHex(StripHexPrefix(expected));
        BOOST_REQUIRE_EQUAL(raw.size(), 20U);
        BOOST_CHECK_EQUAL(EncodeChecksumAddress(raw.data()), expected);
    }
}

BOOST_AUTO_TEST_CASE(hex_address_shape) {
    BOOST_CHECK(IsHexAddress("0x5aAeb6053F3E94C9b9A09f33669435E7Ef1BeAed"));
    BOOST_CHECK(IsHexAddress("0x5aaeb6053f3e94c9b9a09f33669435e7ef1beaed"));
    BOOST_CHECK(!IsHexAddress("5aaeb6053f3e94c9b9a09f33669435e7ef1beaed"));
    BOOST_CHECK(!IsHexAddress("0x5aaeb6053f3e94c9b9a09f33669435e7ef1beae"));
    BOOST_CHECK(!IsHexAddress("0x5aaeb6053f3e94c9b9a09f33669435e7ef1beaeg"));
    BOOST_CHECK(!IsHexAddress(""));
}

BOOST_AUTO_TEST_SUITE_END()
