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

const size_t Hasher::BLOCKLEN;

//-----------------------------------------------------------------------------
void mum( uint64_t & a, uint64_t & b ) {
    rapid_mum<RAPID_PORTABLE>(a, b);
}

uint64_t mix( uint64_t a, uint64_t b ) {
    return rapid_mix<RAPID_PORTABLE>(a, b);
}

uint64_t hash( const void * data, size_t len, uint64_t seed ) {
    const uint8_t * p = (const uint8_t *)data;

    seed = rapid_seed<RAPID_PORTABLE>(seed);
    if (isLE()) {
        return rapidhash_core<RapidReaderLE, RAPID_PORTABLE>(p, len, seed);
    } else {
        return rapidhash_core<RapidReaderBE, RAPID_PORTABLE>(p, len, seed);
    }
}

//-----------------------------------------------------------------------------
// Hasher
//
// A block is only folded into the lanes once at least one more byte is
// known to follow it. That way the pending buffer always holds the same
// 1..48 trailing bytes that rapidhash_core() would hand to rapid_tail(),
// and the block boundaries line up with the one-shot loop.

Hasher::Hasher( uint64_t userseed ) :
    seed( rapid_seed<RAPID_PORTABLE>(userseed) ), total( 0 ), pending( 0 ) {
    see1 = see2 = seed;
    memset(buf, 0, sizeof(buf));
    memset(lastblock, 0, sizeof(lastblock));
}

template <class Reader, bool portable>
void Hasher::absorb( const uint8_t * p, size_t len ) {
    total += len;

    if (pending + len <= BLOCKLEN) {
        memcpy(&buf[pending], p, len);
        pending += len;
        return;
    }

    // Complete and fold the pending block. At least one input byte is
    // left over afterwards.
    if (pending > 0) {
        const size_t fill = BLOCKLEN - pending;
        memcpy(&buf[pending], p, fill);
        p   += fill;
        len -= fill;
        rapid_block<Reader, portable>(buf, seed, see1, see2);
        memcpy(lastblock, &buf[BLOCKLEN - 16], 16);
        pending = 0;
    }

    // Fold directly from the input while more than a block remains
    if (len > BLOCKLEN) {
        do {
            rapid_block<Reader, portable>(p, seed, see1, see2);
            p   += BLOCKLEN;
            len -= BLOCKLEN;
        } while (len > BLOCKLEN);
        memcpy(lastblock, p - 16, 16);
    }

    memcpy(buf, p, len);
    pending = len;
}

template <class Reader, bool portable>
uint64_t Hasher::finish( void ) const {
    if (total <= 16) {
        return rapid_short<Reader, portable>(buf, pending, seed);
    }
    if (total <= BLOCKLEN) {
        return rapid_tail<Reader, portable>(buf, pending, &buf[pending - 16], seed ^ total, total);
    }

    // At least one block has been folded. Work on copies of the lanes so
    // the hasher can keep accepting input.
    uint64_t        s0 = seed, s1 = see1, s2 = see2;
    size_t          remain  = pending;
    const uint8_t * prev    = lastblock;
    const uint8_t * plast;
    uint8_t         last[16];

    if (remain == BLOCKLEN) {
        rapid_block<Reader, portable>(buf, s0, s1, s2);
        prev   = &buf[BLOCKLEN - 16];
        remain = 0;
    }

    // The final 16 bytes of the input may straddle the previous block
    if (remain >= 16) {
        plast = &buf[remain - 16];
    } else {
        memcpy(last, &prev[remain], 16 - remain);
        memcpy(&last[16 - remain], buf, remain);
        plast = last;
    }

    s0 ^= s1 ^ s2;
    return rapid_tail<Reader, portable>(buf, remain, plast, s0 ^ total, total);
}

Hasher & Hasher::append( const void * data, size_t len ) {
    if (len == 0) {
        return *this;
    }
    if (isLE()) {
        absorb<RapidReaderLE, RAPID_PORTABLE>((const uint8_t *)data, len);
    } else {
        absorb<RapidReaderBE, RAPID_PORTABLE>((const uint8_t *)data, len);
    }
    return *this;
}

Hasher & Hasher::append_u8( uint8_t v ) {
    return append(&v, 1);
}

Hasher & Hasher::append_u16( uint16_t v ) {
    uint8_t tmp[2];

    if (isLE()) {
        PUT_U16<false>(v, tmp, 0);
    } else {
        PUT_U16<true>(v, tmp, 0);
    }
    return append(tmp, sizeof(tmp));
}

Hasher & Hasher::append_u32( uint32_t v ) {
    uint8_t tmp[4];

    if (isLE()) {
        PUT_U32<false>(v, tmp, 0);
    } else {
        PUT_U32<true>(v, tmp, 0);
    }
    return append(tmp, sizeof(tmp));
}

Hasher & Hasher::append_u64( uint64_t v ) {
    uint8_t tmp[8];

    if (isLE()) {
        PUT_U64<false>(v, tmp, 0);
    } else {
        PUT_U64<true>(v, tmp, 0);
    }
    return append(tmp, sizeof(tmp));
}

Hasher & Hasher::append_u128( uint64_t lo, uint64_t hi ) {
    uint8_t tmp[16];

    if (isLE()) {
        PUT_U64<false>(lo, tmp, 0);
        PUT_U64<false>(hi, tmp, 8);
    } else {
        PUT_U64<true>(lo, tmp, 0);
        PUT_U64<true>(hi, tmp, 8);
    }
    return append(tmp, sizeof(tmp));
}

uint64_t Hasher::finalize( void ) const {
    if (isLE()) {
        return finish<RapidReaderLE, RAPID_PORTABLE>();
    } else {
        return finish<RapidReaderBE, RAPID_PORTABLE>();
    }
}

} // namespace RapidHash
