// Copyright (c) 2025 The Canary Core developers
// Distributed under the MIT software license

/**
 * Utility Tests
 *
 * Hex encoding, constant-time comparison, the length-prefixed stream and
 * the secure allocator.
 */

#include <boost/test/unit_test.hpp>

#include <util/secure_allocator.h>
#include <util/serialize.h>
#include <util/strencodings.h>

#include <algorithm>
#include <cstring>
#include <functional>
#include <new>
#include <stdexcept>
#include <string>
#include <vector>

BOOST_AUTO_TEST_SUITE(util_tests)

BOOST_AUTO_TEST_SUITE(strencodings_tests)

BOOST_AUTO_TEST_CASE(hex_encode_decode) {
    const uint8_t data[] = {0x00, 0x01, 0x7f, 0x80, 0xab, 0xff};
    BOOST_CHECK_EQUAL(HexStr(data, sizeof(data)), "00017f80abff");
    BOOST_CHECK_EQUAL(HexStr(std::vector<uint8_t>()), "");

    std::vector<uint8_t> parsed = ParseHex("00017F80abFF");
    BOOST_CHECK_EQUAL_COLLECTIONS(parsed.begin(), parsed.end(), data, data + sizeof(data));
}

BOOST_AUTO_TEST_CASE(hex_validation) {
    BOOST_CHECK(IsHex("00"));
    BOOST_CHECK(IsHex("deadBEEF"));
    BOOST_CHECK(!IsHex(""));
    BOOST_CHECK(!IsHex("0"));
    BOOST_CHECK(!IsHex("0g"));
    BOOST_CHECK(!IsHex("0x00"));
    BOOST_CHECK(ParseHex("abc").empty());
    BOOST_CHECK(ParseHex("zz").empty());
}

BOOST_AUTO_TEST_CASE(strip_hex_prefix) {
    BOOST_CHECK_EQUAL(StripHexPrefix("0xabcd"), "abcd");
    BOOST_CHECK_EQUAL(StripHexPrefix("0Xabcd"), "abcd");
    BOOST_CHECK_EQUAL(StripHexPrefix("abcd"), "abcd");
    BOOST_CHECK_EQUAL(StripHexPrefix("0x"), "");
    BOOST_CHECK_EQUAL(StripHexPrefix("0"), "0");
}

BOOST_AUTO_TEST_CASE(timing_resistant_equal) {
    uint8_t a[64], b[64];
    std::memset(a, 0x5A, sizeof(a));
    std::memset(b, 0x5A, sizeof(b));
    BOOST_CHECK(TimingResistantEqual(a, b, sizeof(a)));

    // Mismatch in the first, a middle and the last byte
    for (size_t pos : {size_t(0), size_t(31), size_t(63)}) {
        b[pos] ^= 0x01;
        BOOST_CHECK(!TimingResistantEqual(a, b, sizeof(a)));
        b[pos] ^= 0x01;
    }
    BOOST_CHECK(TimingResistantEqual(a, b, 0));
}

BOOST_AUTO_TEST_CASE(case_insensitive_equal) {
    BOOST_CHECK(CaseInsensitiveEqual("0xAbCd", "0xabcd"));
    BOOST_CHECK(!CaseInsensitiveEqual("0xabcd", "0xabce"));
    BOOST_CHECK(!CaseInsensitiveEqual("0xabcd", "0xabcd0"));
    BOOST_CHECK(CaseInsensitiveEqual("", ""));
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE(serialize_tests)

BOOST_AUTO_TEST_CASE(stream_fields) {
    CDataStream out;
    out.WriteUint32(0x01020304);
    out.WriteBytes(std::vector<uint8_t>{9, 8, 7});
    out.WriteString("canary");

    const std::vector<uint8_t>& raw = out.GetData();
    BOOST_REQUIRE_EQUAL(raw.size(), 4U + 4U + 3U + 4U + 6U);
    BOOST_CHECK_EQUAL(raw[0], 0x04);
    BOOST_CHECK_EQUAL(raw[3], 0x01);

    CDataStream in(raw);
    BOOST_CHECK_EQUAL(in.ReadUint32(), 0x01020304U);
    BOOST_CHECK(in.ReadBytes(16) == std::vector<uint8_t>({9, 8, 7}));
    BOOST_CHECK_EQUAL(in.ReadString(16), "canary");
    BOOST_CHECK(in.eof());
    BOOST_CHECK_EQUAL(in.remaining(), 0U);
}

BOOST_AUTO_TEST_CASE(stream_bounds) {
    CDataStream out;
    out.WriteBytes(std::vector<uint8_t>(10, 0xEE));

    CDataStream tooLarge(out.GetData());
    BOOST_CHECK_THROW(tooLarge.ReadBytes(9), std::runtime_error);

    std::vector<uint8_t> truncated = out.GetData();
    truncated.pop_back();
    CDataStream shortStream(truncated);
    BOOST_CHECK_THROW(shortStream.ReadBytes(16), std::runtime_error);

    CDataStream empty;
    BOOST_CHECK_THROW(empty.ReadUint32(), std::runtime_error);
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE(secure_allocator_tests)

BOOST_AUTO_TEST_CASE(secure_containers) {
    SecureBytes bytes(32, 0xAB);
    bytes.resize(4096, 0xCD);
    BOOST_CHECK_EQUAL(bytes[0], 0xAB);
    BOOST_CHECK_EQUAL(bytes[4095], 0xCD);

    SecureString pin("123456");
    pin += "7";
    BOOST_CHECK_EQUAL(pin.size(), 7U);
    BOOST_CHECK(pin == SecureString("1234567"));
}

BOOST_AUTO_TEST_CASE(secure_string_holds_no_characters_inline) {
    alignas(SecureString) unsigned char raw[sizeof(SecureString)];
    const unsigned char* rawEnd = raw + sizeof(raw);
    const char digits[] = "123456";

    SecureString* pin = new (raw) SecureString(digits);
    const unsigned char* chars = reinterpret_cast<const unsigned char*>(pin->data());
    std::less<const unsigned char*> before;
    BOOST_CHECK(before(chars, raw) || !before(chars, rawEnd));
    pin->~SecureString();

    BOOST_CHECK(std::search(static_cast<const unsigned char*>(raw), rawEnd, digits, digits + 6) == rawEnd);
}

BOOST_AUTO_TEST_CASE(secure_string_wipes_dropped_characters) {
    SecureString pin("654321");
    pin.push_back('\r');
    const char* buf = pin.data();

    pin.pop_back();
    BOOST_CHECK_EQUAL(static_cast<int>(buf[6]), 0);
    BOOST_CHECK(pin == SecureString("654321"));

    pin.clear();
    BOOST_CHECK(pin.empty());
    for (size_t i = 0; i < 7; i++) {
        BOOST_CHECK_EQUAL(static_cast<int>(buf[i]), 0);
    }
}

BOOST_AUTO_TEST_CASE(secure_string_assignment_wipes_old_tail) {
    SecureString pin("12345678");
    const char* buf = pin.data();
    const SecureString shorter("90");

    pin = shorter;
    BOOST_CHECK(pin == shorter);
    if (pin.data() == buf) {
        for (size_t i = 2; i < 8; i++) {
            BOOST_CHECK_EQUAL(static_cast<int>(buf[i]), 0);
        }
    }
}

BOOST_AUTO_TEST_CASE(memory_cleanse_zeroes) {
    uint8_t buf[48];
    std::memset(buf, 0xFF, sizeof(buf));
    memory_cleanse(buf, sizeof(buf));
    for (uint8_t b : buf) {
        BOOST_CHECK_EQUAL(b, 0);
    }
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE_END()
