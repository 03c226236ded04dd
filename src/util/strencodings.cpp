// Copyright (c) 2025 The Canary Core developers
// Distributed under the MIT software license

#include <util/strencodings.h>

#include <cctype>

std::string HexStr(const uint8_t* data, size_t len) {
    static const char hexmap[16] = {'0', '1', '2', '3', '4', '5', '6', '7',
                                     '8', '9', 'a', 'b', 'c', 'd', 'e', 'f'};

    std::string result;
    result.reserve(len * 2);

    for (size_t i = 0; i < len; ++i) {
        result.push_back(hexmap[(data[i] >> 4) & 0x0F]);
        result.push_back(hexmap[data[i] & 0x0F]);
    }

    return result;
}

std::string HexStr(const std::vector<uint8_t>& vch) {
    return HexStr(vch.data(), vch.size());
}

std::vector<uint8_t> ParseHex(const std::string& str) {
    if (!IsHex(str)) {
        return std::vector<uint8_t>();
    }

    std::vector<uint8_t> result;
    result.reserve(str.size() / 2);

    for (size_t i = 0; i < str.size(); i += 2) {
        int8_t high = HexDigit(str[i]);
        int8_t low = HexDigit(str[i + 1]);
        result.push_back(static_cast<uint8_t>((high << 4) | low));
    }

    return result;
}

bool IsHex(const std::string& str) {
    if (str.empty() || str.size() % 2 != 0) {
        return false;
    }

    for (char c : str) {
        if (HexDigit(c) < 0) {
            return false;
        }
    }

    return true;
}

std::string StripHexPrefix(const std::string& str) {
    if (str.size() >= 2 && str[0] == '0' && (str[1] == 'x' || str[1] == 'X')) {
        return str.substr(2);
    }
    return str;
}

bool TimingResistantEqual(const uint8_t* a, const uint8_t* b, size_t len) {
    if (len == 0) return true;

    uint8_t result = 0;
    for (size_t i = 0; i < len; i++) {
        result |= a[i] ^ b[i];
    }
    return result == 0;
}

bool CaseInsensitiveEqual(const std::string& a, const std::string& b) {
    if (a.size() != b.size()) {
        return false;
    }
    for (size_t i = 0; i < a.size(); i++) {
        if (std::tolower(static_cast<unsigned char>(a[i])) !=
            std::tolower(static_cast<unsigned char>(b[i]))) {
            return false;
        }
    }
    return true;
}
