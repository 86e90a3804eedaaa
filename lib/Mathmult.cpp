/*
 * Unit tests for RapidHash's Mathmult routines
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
#include "Mathmult.h"

#include <cstdio>
#include <cinttypes>
#include <initializer_list>

using namespace MathMult;

static void fail( const char * test, int idx, const uint64_t * expected, std::initializer_list<uint64_t> actual ) {
    if (idx >= 0) {
        printf("Test %s #%d failed!\n\tGot     :", test, idx);
    } else {
        printf("Test %s failed!\n\tGot     :", test);
    }
    int count = 0;
    for (auto val: actual) {
        printf(" %016" PRIx64, val);
        count++;
    }
    printf("\n\tExpected:");
    for (int i = 0; i < count; i++) {
        printf(" %016" PRIx64, expected[i]);
    }
    printf("\n\n");
}

//-----------------------------------------------------------------------------
// {a, b, rhi, rlo}
static const uint64_t test_64[][4] = {
    { UINT64_C(0x0000000000000001), UINT64_C(0x0000000000000001),
      UINT64_C(0x0000000000000000), UINT64_C(0x0000000000000001) },
    { UINT64_C(0x2F9AC342168A6741), UINT64_C(0x0000000000000000),
      UINT64_C(0x0000000000000000), UINT64_C(0x0000000000000000) },
    { UINT64_C(0x418FD883CEB217D8), UINT64_C(0x7213F60E1222CE60),
      UINT64_C(0x1D372B1B98652CD8), UINT64_C(0xC1E418E52CA8C100) },
    { UINT64_C(0x477B3604218D2514), UINT64_C(0xA6019680FBEACF3B),
      UINT64_C(0x2E5A5688195E73C4), UINT64_C(0x1E1F1A735CCAB79C) },
    { UINT64_C(0xA7E5AD86B74C236C), UINT64_C(0x1522F8FF937041C7),
      UINT64_C(0x0DDCC70B3782740B), UINT64_C(0x0249EA7D546DF4F4) },
    { UINT64_C(0x7FFFFFFFFFFFFFFF), UINT64_C(0x0000000000000002),
      UINT64_C(0x0000000000000000), UINT64_C(0xFFFFFFFFFFFFFFFE) },
    { UINT64_C(0x7FFFFFFFFFFFFFFF), UINT64_C(0x0000000000000003),
      UINT64_C(0x0000000000000001), UINT64_C(0x7FFFFFFFFFFFFFFD) },
    { UINT64_C(0xFFFFFFFFFFFFFFFF), UINT64_C(0x0000000000000001),
      UINT64_C(0x0000000000000000), UINT64_C(0xFFFFFFFFFFFFFFFF) },
    { UINT64_C(0xFFFFFFFFFFFFFFFF), UINT64_C(0x0000000000000008),
      UINT64_C(0x0000000000000007), UINT64_C(0xFFFFFFFFFFFFFFF8) },
    { UINT64_C(0xFFFFFFFFFFFFFFFF), UINT64_C(0x1111111111111111),
      UINT64_C(0x1111111111111110), UINT64_C(0xEEEEEEEEEEEEEEEF) },
    { UINT64_C(0xFFFFFFFFFFFFFFFF), UINT64_C(0xFFFFFFFFFFFFFFFF),
      UINT64_C(0xFFFFFFFFFFFFFFFE), UINT64_C(0x0000000000000001) },
    { UINT64_C(0x2D358DCCAA6C78A5), UINT64_C(0x8BB84B93962EACC9),
      UINT64_C(0x18AC9FD4CC746524), UINT64_C(0xD22DA4200BDF958D) },
    { UINT64_C(0x8BB84B93962EACC9), UINT64_C(0x4B33A62ED433D4A3),
      UINT64_C(0x290B2E8E5B56C82D), UINT64_C(0x6B2C4BD826D977FB) },
    { UINT64_C(0x00000000FFFFFFFF), UINT64_C(0x00000000FFFFFFFF),
      UINT64_C(0x0000000000000000), UINT64_C(0xFFFFFFFE00000001) },
    { UINT64_C(0xFFFFFFFF00000000), UINT64_C(0xFFFFFFFF00000000),
      UINT64_C(0xFFFFFFFE00000001), UINT64_C(0x0000000000000000) },
    { UINT64_C(0x00000001FFFFFFFF), UINT64_C(0xFFFFFFFF00000001),
      UINT64_C(0x00000001FFFFFFFD), UINT64_C(0x00000002FFFFFFFF) },
};

static bool test_known( void ) {
    bool     passed = true;
    uint64_t r1_lo, r1_hi, r2_lo, r2_hi;

    for (int i = 0; i < (int)(sizeof(test_64) / sizeof(test_64[0])); i++) {
        const uint64_t * t = test_64[i];

        mult64_128(r1_lo, r1_hi, t[0], t[1]);
        mult64_128(r2_lo, r2_hi, t[1], t[0]);
        if ((r1_hi != t[2]) || (r1_lo != t[3])) {
            fail("mult64_128, r1, rhi:rlo", i, &t[2], { r1_hi, r1_lo });
            passed = false;
        }
        if ((r2_hi != t[2]) || (r2_lo != t[3])) {
            fail("mult64_128, r2, rhi:rlo", i, &t[2], { r2_hi, r2_lo });
            passed = false;
        }

        mult64_128_portable(r1_lo, r1_hi, t[0], t[1]);
        mult64_128_portable(r2_lo, r2_hi, t[1], t[0]);
        if ((r1_hi != t[2]) || (r1_lo != t[3])) {
            fail("mult64_128_portable, r1, rhi:rlo", i, &t[2], { r1_hi, r1_lo });
            passed = false;
        }
        if ((r2_hi != t[2]) || (r2_lo != t[3])) {
            fail("mult64_128_portable, r2, rhi:rlo", i, &t[2], { r2_hi, r2_lo });
            passed = false;
        }
    }

    return passed;
}

// Operands are drawn from a simple LCG, with some words forced to have
// all-ones or all-zeroes halves to stress the carry paths.
static bool test_agreement( void ) {
    uint64_t x = UINT64_C(0x9E3779B97F4A7C15);

    for (int i = 0; i < 100000; i++) {
        uint64_t a, b, n_lo, n_hi, p_lo, p_hi;

        x = x * UINT64_C(6364136223846793005) + UINT64_C(1442695040888963407);
        a = x;
        x = x * UINT64_C(6364136223846793005) + UINT64_C(1442695040888963407);
        b = x;
        switch (i & 7) {
        case 1: a |= UINT64_C(0xFFFFFFFF); break;
        case 2: b |= UINT64_C(0xFFFFFFFF00000000); break;
        case 3: a |= UINT64_C(0xFFFFFFFF); b |= UINT64_C(0xFFFFFFFF); break;
        case 4: a &= UINT64_C(0xFFFFFFFF); break;
        default: break;
        }

        mult64_128(n_lo, n_hi, a, b);
        mult64_128_portable(p_lo, p_hi, a, b);
        if ((n_lo != p_lo) || (n_hi != p_hi)) {
            const uint64_t expected[2] = { n_hi, n_lo };
            printf("Operands %016" PRIx64 " %016" PRIx64 "\n", a, b);
            fail("mult64_128_portable vs mult64_128", i, expected, { p_hi, p_lo });
            return false;
        }
    }

    return true;
}

bool Mathmult_selftest( bool verbose ) {
    bool passed = true;

    passed &= test_known();
    passed &= test_agreement();

    if (verbose) {
        printf("Multiply self-test %s\n", passed ? "passed" : "FAILED");
    }

    return passed;
}
