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

#include "RngTest.h"

#include <vector>
#include <algorithm>

using RapidHash::Rng;

//-----------------------------------------------------------------------------
// Tests of the mixer-based RNG. This is not a statistical test battery;
// it checks the exact output sequence, the API contracts, and that no seed
// (including 0) gives a stuck or short-period stream.

static const uint64_t default_seq[] = {
    UINT64_C(11309894468111973329), UINT64_C( 2084709671725469304),
    UINT64_C( 6736592243300188124), UINT64_C(15652448723025939223),
};

// rng_fast() starting from a state of 0. Unlike Rng, it takes the state
// as given.
static const uint64_t fast_zero_seq[] = {
    UINT64_C(11116517241604665558), UINT64_C(   91298403691422709),
    UINT64_C( 1747996488805885078),
};

static uint64_t get_le64( const uint8_t * p ) {
    return isLE() ? GET_U64<false>(p, 0) : GET_U64<true>(p, 0);
}

static bool KnownSequenceTest( flags_t flags ) {
    bool result = true;

    maybeprintf("Checking output sequences    ");

    Rng      rdef;
    Rng      rzero( 0 );
    Rng      rseed( RapidHash::DEFAULT_SEED );
    uint64_t state = 0;

    for (size_t i = 0; i < sizeof(default_seq) / sizeof(default_seq[0]); i++) {
        const uint64_t a = rdef.next_u64();
        const uint64_t b = rzero.next_u64();
        const uint64_t c = rseed.next_u64();
        if ((a != default_seq[i]) || (b != default_seq[i]) || (c != default_seq[i])) {
            maybeprintf("\n  output %zu: got %" PRIu64 "/%" PRIu64 "/%" PRIu64 ", expected %" PRIu64,
                    i, a, b, c, default_seq[i]);
            result = false;
        }
    }
    for (size_t i = 0; i < sizeof(fast_zero_seq) / sizeof(fast_zero_seq[0]); i++) {
        const uint64_t v = RapidHash::rng_fast(state);
        if (v != fast_zero_seq[i]) {
            maybeprintf("\n  rng_fast output %zu: got %" PRIu64 ", expected %" PRIu64, i, v, fast_zero_seq[i]);
            result = false;
        }
    }

    reportResult(result, flags);
    recordTestResult(result, "Rng", "Known sequence");

    return result;
}

// Rng and rng_fast() must agree, state() must track the counter, and
// from_bytes() must accept what state() exports
static bool ApiTest( flags_t flags ) {
    Rand r( 993441, g_seed );
    bool result = true;

    maybeprintf("Checking Rng API             ");

    for (int rep = 0; rep < 100; rep++) {
        uint64_t seed = r.rand_u64();
        if (seed == 0) { seed = 1; }

        Rng      rng( seed );
        Rng      rng32( seed );
        uint64_t state = seed;
        uint8_t  st[8];

        rng.state(st);
        if (get_le64(st) != seed) {
            maybeprintf("\n  initial state mismatch for seed 0x%016" PRIx64, seed);
            result = false;
            break;
        }

        Rng fromst = Rng::from_bytes(st);
        if (fromst.next_u64() != Rng(seed).next_u64()) {
            maybeprintf("\n  from_bytes() mismatch for seed 0x%016" PRIx64, seed);
            result = false;
            break;
        }

        for (int i = 0; i < 50; i++) {
            const uint64_t v = rng.next_u64();
            if ((v != RapidHash::rng_fast(state)) || (rng32.next_u32() != (uint32_t)v)) {
                maybeprintf("\n  output %d mismatch for seed 0x%016" PRIx64, i, seed);
                result = false;
                goto out;
            }
        }

        rng.state(st);
        if ((get_le64(st) != state) || (state != seed + 50 * RapidHash::SECRETS[0])) {
            maybeprintf("\n  final state mismatch for seed 0x%016" PRIx64, seed);
            result = false;
            break;
        }
    }

    if (result) {
        const uint8_t zero[8] = { 0 };
        Rng           rng = Rng::from_bytes(zero);
        uint8_t       st[8];

        rng.state(st);
        if (get_le64(st) != RapidHash::DEFAULT_SEED) {
            maybeprintf("\n  all-zero byte seed was not replaced");
            result = false;
        }
    }

  out:
    reportResult(result, flags);
    recordTestResult(result, "Rng", "API");

    return result;
}

// fill() writes the little-endian bytes of successive next_u64() values,
// truncating the last one
static bool FillTest( flags_t flags ) {
    Rand r( 511373, g_seed );
    bool result = true;

    maybeprintf("Checking fill()              ");

    for (size_t len = 0; len <= 80; len++) {
        const uint64_t seed = r.rand_u64() | 1;
        Rng            filler( seed );
        Rng            words( seed );
        uint8_t        buf[88];
        uint8_t        expected[88];

        memset(buf, 0xa5, sizeof(buf));
        memset(expected, 0xa5, sizeof(expected));
        filler.fill(buf, len);
        for (size_t i = 0; i < len; i += 8) {
            const uint64_t v = words.next_u64();
            for (size_t j = 0; (j < 8) && (i + j < len); j++) {
                expected[i + j] = (uint8_t)(v >> (8 * j));
            }
        }
        if (memcmp(buf, expected, sizeof(buf)) != 0) {
            maybeprintf("\n  fill() mismatch at len %zu", len);
            result = false;
            break;
        }
        // Both must have consumed the same number of words
        if (filler.next_u64() != words.next_u64()) {
            maybeprintf("\n  fill() consumed the wrong number of words at len %zu", len);
            result = false;
            break;
        }
    }

    reportResult(result, flags);
    recordTestResult(result, "Rng", "Fill");

    return result;
}

// Outputs from a zero seed must not repeat, and each output bit should be
// set about half the time.
static bool DegeneracyTest( flags_t flags ) {
    const size_t count = 100000;
    bool         result = true;
    Rng          rng( 0 );

    maybeprintf("Checking for degenerate output");

    std::vector<uint64_t> vals( count );
    std::vector<uint32_t> bitcounts( 64 );
    for (size_t i = 0; i < count; i++) {
        vals[i] = rng.next_u64();
        for (int b = 0; b < 64; b++) {
            bitcounts[b] += (uint32_t)((vals[i] >> b) & 1);
        }
    }

    // Allowed deviation is about 10 standard deviations
    for (int b = 0; b < 64; b++) {
        if ((bitcounts[b] < count / 2 - 1600) || (bitcounts[b] > count / 2 + 1600)) {
            maybeprintf("\n  bit %d set %u times out of %zu", b, bitcounts[b], count);
            result = false;
        }
    }

    std::sort(vals.begin(), vals.end());
    if (std::adjacent_find(vals.begin(), vals.end()) != vals.end()) {
        maybeprintf("\n  repeated output in first %zu values", count);
        result = false;
    }

    reportResult(result, flags);
    recordTestResult(result, "Rng", "Degeneracy");

    return result;
}

//-----------------------------------------------------------------------------

bool RngTest( flags_t flags ) {
    bool result = true;

    printf("[[[ Rng Tests ]]]\n\n");

    flags |= FLAG_REPORT_VERBOSE;

    result &= KnownSequenceTest(flags);
    result &= ApiTest(flags);
    result &= FillTest(flags);
    result &= DegeneracyTest(flags);

    printf("\n%s", result ? "" : g_failstr);

    return result;
}
