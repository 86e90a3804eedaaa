/*
 * RapidHash
 * Copyright (C) 2021-2025  Frank J. T. Wojcik
 *
 * This program is free software: you can redistribute it and/or
 * modify it under the terms of the GNU General Public License as
 * published by the Free Software Foundation, either version 3 of the
 * License, or (at your option) any later version.
 *
 * This program is distributed in the hope that it will be useful, but
 * WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the GNU
 * General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License
 * along with this program.  If not, see
 * <https://www.gnu.org/licenses/>.
 */
#include "Platform.h"
#include "TestGlobals.h"
#include "Random.h"
#include "RapidHash.h"

#include "StreamingTest.h"

#include <vector>

using RapidHash::Hasher;
using RapidHash::BuildHasher;

//-----------------------------------------------------------------------------
// Every way of feeding bytes to a Hasher must agree with the one-shot hash
// of the same bytes.

static const size_t maxlen = 1024;

static bool compare( uint64_t streamed, uint64_t expected, const char * how, size_t len, flags_t flags ) {
    if (streamed == expected) {
        return true;
    }
    maybeprintf("\n  %s, len %zu: streamed 0x%016" PRIx64 " != one-shot 0x%016" PRIx64,
            how, len, streamed, expected);
    return false;
}

// One split point at every position, for every length through a few
// multiples of the block size.
static bool TwoPieceTest( flags_t flags ) {
    Rand    r( 271828, g_seed );
    uint8_t key[maxlen];
    bool    result = true;

    maybeprintf("Testing two-piece splits     ");

    r.rand_n(key, sizeof(key));
    for (size_t len = 0; len <= 4 * Hasher::BLOCKLEN + 1; len++) {
        const uint64_t seed     = r.rand_u64();
        const uint64_t expected = RapidHash::hash(key, len, seed);
        for (size_t split = 0; split <= len; split++) {
            Hasher h( seed );
            h.append(key, split).append(key + split, len - split);
            if (!compare(h.finalize(), expected, "two pieces", len, flags)) {
                result = false;
                goto out;
            }
        }
    }

  out:
    reportResult(result, flags);
    recordTestResult(result, "Streaming", "Two pieces");

    return result;
}

static bool ByteAtATimeTest( flags_t flags ) {
    Rand    r( 314159, g_seed );
    uint8_t key[maxlen];
    bool    result = true;

    maybeprintf("Testing byte-at-a-time input ");

    r.rand_n(key, sizeof(key));
    for (size_t len = 0; len <= maxlen; len += (len < 200) ? 1 : 41) {
        Hasher h;
        for (size_t i = 0; i < len; i++) {
            h.append_u8(key[i]);
        }
        if (!compare(h.finalize(), RapidHash::hash(key, len), "byte at a time", len, flags)) {
            result = false;
            break;
        }
    }

    reportResult(result, flags);
    recordTestResult(result, "Streaming", "Byte at a time");

    return result;
}

// Random chunkings, with chunk sizes chosen to straddle the 8, 16 and 48
// byte edges, including empty appends.
static bool RandomChunkTest( flags_t flags ) {
    static const size_t sizes[] = { 0, 1, 7, 8, 9, 15, 16, 17, 47, 48, 49, 95, 96, 97 };
    const size_t reps = 2000;
    Rand    r( 161803, g_seed );
    uint8_t key[maxlen];
    bool    result = true;

    maybeprintf("Testing random chunkings     ");

    for (size_t rep = 0; rep < reps; rep++) {
        if (REPORT(PROGRESS, flags)) {
            progressdots(rep, 0, reps - 1, 10);
        }

        const size_t   len  = r.rand_range(maxlen + 1);
        const uint64_t seed = (rep & 1) ? r.rand_u64() : RapidHash::DEFAULT_SEED;
        r.rand_n(key, len);

        Hasher h( seed );
        size_t pos = 0;
        while (pos < len) {
            size_t n = (rep & 2) ? sizes[r.rand_range(sizeof(sizes) / sizeof(sizes[0]))] :
                                   r.rand_range(len - pos + 1);
            if (n > len - pos) {
                n = len - pos;
            }
            h.append(key + pos, n);
            pos += n;
        }
        if ((h.length() != len) ||
                !compare(h.finalize(), RapidHash::hash(key, len, seed), "random chunks", len, flags)) {
            result = false;
            break;
        }
    }

    reportResult(result, flags);
    recordTestResult(result, "Streaming", "Random chunks");

    return result;
}

// finalize() must be repeatable, and must leave the Hasher ready to take
// more input.
static bool FinalizeTest( flags_t flags ) {
    Rand    r( 577215, g_seed );
    uint8_t key[maxlen];
    bool    result = true;

    maybeprintf("Testing repeated finalize    ");

    r.rand_n(key, sizeof(key));
    for (size_t len = 0; len <= 3 * Hasher::BLOCKLEN; len++) {
        Hasher h;
        h.append(key, len);

        const uint64_t f1 = h.finalize();
        const uint64_t f2 = h.finalize();
        if (!compare(f1, RapidHash::hash(key, len), "finalize", len, flags) ||
                !compare(f2, f1, "second finalize", len, flags)) {
            result = false;
            break;
        }

        const size_t more = 1 + r.rand_range(100);
        h.append(key + len, more);
        if (!compare(h.finalize(), RapidHash::hash(key, len + more), "append after finalize", len + more, flags)) {
            result = false;
            break;
        }
    }

    reportResult(result, flags);
    recordTestResult(result, "Streaming", "Finalize");

    return result;
}

// Typed writes are the same as appending their little-endian bytes
static bool TypedWriteTest( flags_t flags ) {
    Rand r( 662607, g_seed );
    bool result = true;

    maybeprintf("Testing typed writes         ");

    for (int rep = 0; rep < 1000; rep++) {
        const uint64_t v = r.rand_u64();
        const uint64_t w = r.rand_u64();
        uint8_t        bytes[31];
        Hasher         typed;

        typed.append_u8((uint8_t)v).append_u16((uint16_t)v).append_u32((uint32_t)v).append_u64(v);
        typed.append_u128(v, w);

        bytes[0] = (uint8_t)v;
        for (int i = 0; i < 2; i++) { bytes[1 + i] = (uint8_t)(v >> (8 * i)); }
        for (int i = 0; i < 4; i++) { bytes[3 + i] = (uint8_t)(v >> (8 * i)); }
        for (int i = 0; i < 8; i++) { bytes[7 + i] = (uint8_t)(v >> (8 * i)); }
        for (int i = 0; i < 8; i++) { bytes[15 + i] = (uint8_t)(v >> (8 * i)); }
        for (int i = 0; i < 8; i++) { bytes[23 + i] = (uint8_t)(w >> (8 * i)); }

        if ((typed.length() != sizeof(bytes)) ||
                !compare(typed.finalize(), RapidHash::hash(bytes, sizeof(bytes)), "typed writes", sizeof(bytes), flags)) {
            result = false;
            break;
        }
    }

    reportResult(result, flags);
    recordTestResult(result, "Streaming", "Typed writes");

    return result;
}

// Each Hasher from a BuildHasher starts fresh, with the builder's seed
static bool BuildHasherTest( flags_t flags ) {
    Rand    r( 602214, g_seed );
    uint8_t key[256];
    bool    result = true;

    maybeprintf("Testing BuildHasher          ");

    r.rand_n(key, sizeof(key));
    for (int rep = 0; rep < 100; rep++) {
        const uint64_t    seed = r.rand_u64();
        const size_t      len  = r.rand_range(sizeof(key) + 1);
        const BuildHasher bh( seed );
        const uint64_t    expected = RapidHash::hash(key, len, seed);

        Hasher h1 = bh.build();
        h1.append(key, len);
        Hasher h2 = bh.build();
        h2.append(key, len);

        if ((bh.getSeed() != seed) ||
                !compare(h1.finalize(), expected, "build()", len, flags) ||
                !compare(h2.finalize(), expected, "second build()", len, flags) ||
                !compare(bh.hash(key, len), expected, "BuildHasher::hash()", len, flags)) {
            result = false;
            break;
        }
    }

    // The default builder uses the default seed
    const BuildHasher defbh;
    Hasher            dh = defbh.build();
    dh.append("hello world", 11);
    result &= compare(dh.finalize(), UINT64_C(17498481775468162579), "default BuildHasher", 11, flags);

    reportResult(result, flags);
    recordTestResult(result, "Streaming", "BuildHasher");

    return result;
}

//-----------------------------------------------------------------------------

bool StreamingTest( flags_t flags ) {
    bool result = true;

    printf("[[[ Streaming Tests ]]]\n\n");

    flags |= FLAG_REPORT_VERBOSE;

    result &= TwoPieceTest(flags);
    result &= ByteAtATimeTest(flags);
    result &= RandomChunkTest(flags);
    result &= FinalizeTest(flags);
    result &= TypedWriteTest(flags);
    result &= BuildHasherTest(flags);

    printf("\n%s", result ? "" : g_failstr);

    return result;
}
