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
#include "Random.h"

// Default to zero
uint64_t Rand::GLOBAL_SEED = 0;

//-----------------------------------------------------------------------------
// This is the Threefry-4x64-16 CBRNG as documented in:
//   "Parallel random numbers: as easy as 1, 2, 3", by John K. Salmon,
//     Mark A. Moraes, Ron O. Dror, and David E. Shaw
//     https://www.thesalmons.org/john/random123/papers/random123sc11.pdf
//
// The input block is { 0, counter, counter, 0 }.
static const int threefry_rot[8][2] = {
    { 14, 16 }, { 52, 57 }, { 23, 40 }, {  5, 37 },
    { 25, 33 }, { 46, 12 }, { 58, 22 }, { 32, 32 },
};

static void threefry( uint64_t out[4], const uint64_t counter, const uint64_t * ks ) {
    uint64_t x0 = ks[0], x1 = ks[1] + counter, x2 = ks[2] + counter, x3 = ks[3];

    for (unsigned r = 0; r < 16; r++) {
        const int * rot = threefry_rot[r & 7];
        if ((r & 1) == 0) {
            x0 += x1; x1 = ROTL64(x1, rot[0]); x1 ^= x0;
            x2 += x3; x3 = ROTL64(x3, rot[1]); x3 ^= x2;
        } else {
            x0 += x3; x3 = ROTL64(x3, rot[0]); x3 ^= x0;
            x2 += x1; x1 = ROTL64(x1, rot[1]); x1 ^= x2;
        }
        // Key injection after every 4 rounds, except the last
        if (((r & 3) == 3) && (r != 15)) {
            const unsigned s = (r + 1) / 4;
            x0 += ks[(s    ) % Rand::RNG_KEYS];
            x1 += ks[(s + 1) % Rand::RNG_KEYS];
            x2 += ks[(s + 2) % Rand::RNG_KEYS];
            x3 += ks[(s + 3) % Rand::RNG_KEYS] + s;
        }
    }

    out[0] = x0; out[1] = x1; out[2] = x2; out[3] = x3;
}

void Rand::refill_buf( void ) {
    threefry(rngbuf, counter, xseed);
    counter++;
}

//-----------------------------------------------------------------------------
void Rand::rand_n( void * buf, size_t bytes ) {
    uint8_t * out = static_cast<uint8_t *>(buf);
    uint8_t   tmp[8];

    while (bytes > 0) {
        const uint64_t v = rand_u64();
        const size_t   n = (bytes < 8) ? bytes : 8;
        if (isLE()) {
            PUT_U64<false>(v, tmp, 0);
        } else {
            PUT_U64<true>(v, tmp, 0);
        }
        memcpy(out, tmp, n);
        out   += n;
        bytes -= n;
    }
}
