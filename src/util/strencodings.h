// Copyright (c) 2025 The Canary Core developers
// Distributed under the MIT software license

#ifndef CANARY_UTIL_STRENCODINGS_H
#define CANARY_UTIL_STRENCODINGS_H

#include <string>
#include <vector>
#include <cstdarg>
#include <cstdio>
#include <cstdint>

inline std::string strprintf(const char* format, ...) {
    char buffer[1024];
    va_list args;
    va_start(args, format);
    vsnprintf(buffer, sizeof(buffer), format, args);
    va_end(args);
    return std::string(buffer);
}

/**
 * Convert byte array to lowercase hexadecimal string
 */
std::string HexStr(const uint8_t* data, size_t len);

std::string HexStr(const std::vector<uint8_t>& vch);

/**
 * Parse hexadecimal string to byte array.
 * Returns an empty vector if the input is not valid hex (odd length, bad digit).
 */
std::vector<uint8_t> ParseHex(const std::string& str);

/**
 * Check if string is valid hexadecimal (even length, hex digits only)
 */
bool IsHex(const std::string& str);

/**
 * Strip a leading "0x" or "0X", if present.
 */
std::string StripHexPrefix(const std::string& str);

/**
 * Compare two buffers without an early exit on the first differing byte.
 */
bool TimingResistantEqual(const uint8_t* a, const uint8_t* b, size_t len);

/**
 * Case-insensitive ASCII string comparison (used for hex addresses).
 */
bool CaseInsensitiveEqual(const std::string& a, const std::string& b);

inline int8_t HexDigit(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

#endif // CANARY_UTIL_STRENCODINGS_H
