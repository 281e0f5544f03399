// Copyright (c) 2009-2010 Satoshi Nakamoto
// Copyright (c) 2009-2016 The Bitcoin Core developers
// Copyright (c) 2024 The Cascoin Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <random.h>

#include <random>

static inline uint64_t rotl(const uint64_t x, int k)
{
    return (x << k) | (x >> (64 - k));
}

static uint64_t SplitMix64(uint64_t& x)
{
    uint64_t z = (x += 0x9e3779b97f4a7c15ULL);
    z = (z ^ (z >> 30)) * 0xbf58476d1ce4e5b9ULL;
    z = (z ^ (z >> 27)) * 0x94d049bb133111ebULL;
    return z ^ (z >> 31);
}

void GetOSRand(unsigned char* buf, size_t len)
{
    std::random_device rd;
    for (size_t i = 0; i < len; ++i) {
        buf[i] = static_cast<unsigned char>(rd());
    }
}

FastRandomContext::FastRandomContext(bool fDeterministic) : bitbuf(0), bitbuf_size(0)
{
    uint64_t seed = 0;
    if (!fDeterministic) {
        GetOSRand(reinterpret_cast<unsigned char*>(&seed), sizeof(seed));
    }
    for (int i = 0; i < 4; ++i) {
        state[i] = SplitMix64(seed);
    }
}

// xoshiro256**
uint64_t FastRandomContext::Next()
{
    const uint64_t result = rotl(state[1] * 5, 7) * 9;
    const uint64_t t = state[1] << 17;

    state[2] ^= state[0];
    state[3] ^= state[1];
    state[1] ^= state[2];
    state[0] ^= state[3];

    state[2] ^= t;
    state[3] = rotl(state[3], 45);

    return result;
}

uint160 FastRandomContext::rand160()
{
    uint160 ret;
    for (unsigned char* p = ret.begin(); p < ret.end(); p += 4) {
        uint32_t val = rand32();
        for (int i = 0; i < 4 && p + i < ret.end(); ++i) {
            p[i] = static_cast<unsigned char>(val >> (8 * i));
        }
    }
    return ret;
}
