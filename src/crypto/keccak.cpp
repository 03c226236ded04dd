// Copyright (c) 2025 The Canary Core developers
// Distributed under the MIT software license

#include <crypto/keccak.h>

#include <cstring>
#include <stdexcept>

namespace {

const uint64_t KECCAK_ROUND_CONSTANTS[24] = {
    0x0000000000000001ULL, 0x0000000000008082ULL, 0x800000000000808AULL, 0x8000000080008000ULL,
    0x000000000000808BULL, 0x0000000080000001ULL, 0x8000000080008081ULL, 0x8000000000008009ULL,
    0x000000000000008AULL, 0x0000000000000088ULL, 0x0000000080008009ULL, 0x000000008000000AULL,
    0x000000008000808BULL, 0x800000000000008BULL, 0x8000000000008089ULL, 0x8000000000008003ULL,
    0x8000000000008002ULL, 0x8000000000000080ULL, 0x000000000000800AULL, 0x800000008000000AULL,
    0x8000000080008081ULL, 0x8000000000008080ULL, 0x0000000080000001ULL, 0x8000000080008008ULL};

const int KECCAK_ROTATIONS[24] = {1,  3,  6,  10, 15, 21, 28, 36, 45, 55, 2,  14,
                                  27, 41, 56, 8,  25, 43, 62, 18, 39, 61, 20, 44};

const int KECCAK_PI_LANES[24] = {10, 7,  11, 17, 18, 3, 5,  16, 8,  21, 24, 4,
                                 15, 23, 19, 13, 12, 2, 20, 14, 22, 9,  6,  1};

// Rate for a 512-bit capacity
const size_t KECCAK256_RATE = 136;

inline uint64_t ROTL64(uint64_t x, int n) {
    return (x << n) | (x >> (64 - n));
}

void KeccakF1600(uint64_t st[25]) {
    uint64_t bc[5];

    for (int round = 0; round < 24; round++) {
        // Theta
        for (int i = 0; i < 5; i++) {
            bc[i] = st[i] ^ st[i + 5] ^ st[i + 10] ^ st[i + 15] ^ st[i + 20];
        }
        for (int i = 0; i < 5; i++) {
            uint64_t t = bc[(i + 4) % 5] ^ ROTL64(bc[(i + 1) % 5], 1);
            for (int j = 0; j < 25; j += 5) {
                st[j + i] ^= t;
            }
        }

        // Rho and Pi
        uint64_t t = st[1];
        for (int i = 0; i < 24; i++) {
            int j = KECCAK_PI_LANES[i];
            uint64_t tmp = st[j];
            st[j] = ROTL64(t, KECCAK_ROTATIONS[i]);
            t = tmp;
        }

        // Chi
        for (int j = 0; j < 25; j += 5) {
            for (int i = 0; i < 5; i++) {
                bc[i] = st[j + i];
            }
            for (int i = 0; i < 5; i++) {
                st[j + i] ^= (~bc[(i + 1) % 5]) & bc[(i + 2) % 5];
            }
        }

        // Iota
        st[0] ^= KECCAK_ROUND_CONSTANTS[round];
    }
}

void AbsorbBlock(uint64_t st[25], const uint8_t* block) {
    for (size_t i = 0; i < KECCAK256_RATE / 8; i++) {
        uint64_t word = 0;
        for (size_t j = 0; j < 8; j++) {
            word |= static_cast<uint64_t>(block[i * 8 + j]) << (j * 8);
        }
        st[i] ^= word;
    }
    KeccakF1600(st);
}

} // namespace

void Keccak256(const uint8_t* data, size_t len, uint8_t hash[32]) {
    if (data == nullptr && len > 0) {
        throw std::invalid_argument("Keccak256: data is NULL but len > 0");
    }
    if (hash == nullptr) {
        throw std::invalid_argument("Keccak256: hash output buffer is NULL");
    }

    uint64_t st[25] = {0};

    while (len >= KECCAK256_RATE) {
        AbsorbBlock(st, data);
        data += KECCAK256_RATE;
        len -= KECCAK256_RATE;
    }

    uint8_t last[KECCAK256_RATE] = {0};
    if (len > 0) {
        std::memcpy(last, data, len);
    }
    last[len] = 0x01;
    last[KECCAK256_RATE - 1] |= 0x80;
    AbsorbBlock(st, last);

    for (size_t i = 0; i < 4; i++) {
        for (size_t j = 0; j < 8; j++) {
            hash[i * 8 + j] = static_cast<uint8_t>(st[i] >> (j * 8));
        }
    }
}
