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
 *
 * This file incorporates work covered by the following copyright and
 * permission notice:
 *
 *     rapidhash - Very fast, high quality, platform independant hashing algorithm.
 *     Copyright (C) 2024 Nicolas De Carli
 *
 *     Based on 'wyhash', by Wang Yi <godspeed_china@yeah.net>
 *
 *     Permission is hereby granted, free of charge, to any person
 *     obtaining a copy of this software and associated documentation
 *     files (the "Software"), to deal in the Software without
 *     restriction, including without limitation the rights to use,
 *     copy, modify, merge, publish, distribute, sublicense, and/or
 *     sell copies of the Software, and to permit persons to whom the
 *     Software is furnished to do so, subject to the following
 *     conditions:
 *
 *     The above copyright notice and this permission notice shall be
 *     included in all copies or substantial portions of the Software.
 *
 *     THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND,
 *     EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES
 *     OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND
 *     NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT
 *     HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY,
 *     WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING
 *     FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR
 *     OTHER DEALINGS IN THE SOFTWARE.
 */
#include "Platform.h"
#include "RapidCore.h"

namespace RapidHash {

//-----------------------------------------------------------------------------
// The counter is stepped by an odd constant, so it visits every 64-bit
// value once per cycle. Each output is the counter mixed with a
// secret-perturbed copy of itself.

uint64_t rng_fast( uint64_t & state ) {
    state += SECRETS[0];
    return rapid_mix<RAPID_PORTABLE>(state, state ^ SECRETS[1]);
}

Rng::Rng( uint64_t seed ) :
    counter( (seed == 0) ? DEFAULT_SEED : seed ) {}

Rng Rng::from_bytes( const uint8_t seed[8] ) {
    return Rng(isLE() ? GET_U64<false>(seed, 0) : GET_U64<true>(seed, 0));
}

uint64_t Rng::next_u64( void ) {
    return rng_fast(counter);
}

void Rng::fill( void * buf, size_t len ) {
    uint8_t * out = (uint8_t *)buf;
    uint8_t   tmp[8];

    while (len > 0) {
        const uint64_t v = next_u64();
        if (isLE()) {
            PUT_U64<false>(v, tmp, 0);
        } else {
            PUT_U64<true>(v, tmp, 0);
        }
        const size_t n = (len < 8) ? len : 8;
        memcpy(out, tmp, n);
        out += n;
        len -= n;
    }
}

void Rng::state( uint8_t out[8] ) const {
    if (isLE()) {
        PUT_U64<false>(counter, out, 0);
    } else {
        PUT_U64<true>(counter, out, 0);
    }
}

} // namespace RapidHash
