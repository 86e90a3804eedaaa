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
//-----------------------------------------------------------------------------
// RapidHash building blocks
//
// Everything here is templated on the way bytes are read (Reader) and on
// which 64x64->128 multiply is used (portable). The public functions in
// RapidHash.h use the build-time defaults selected at the bottom of this
// file. The self-tests instantiate the other combinations directly.
#pragma once

#include "Platform.h"
#include "Mathmult.h"
#include "RapidHash.h"

namespace RapidHash {

//-----------------------------------------------------------------------------
// Readers. Both produce little-endian integers from unaligned memory.

// memcpy() loads, byteswapped when bswap is set.
template <bool bswap>
struct WordReader {
    static FORCE_INLINE uint64_t read64( const uint8_t * p ) {
        return GET_U64<bswap>(p, 0);
    }

    static FORCE_INLINE uint64_t read32( const uint8_t * p ) {
        return GET_U32<bswap>(p, 0);
    }
};

// Byte-at-a-time assembly. Never touches memory through a wider type, and
// gives the same result on every host without needing to know its
// endianness.
struct ByteReader {
    static FORCE_INLINE uint64_t read64( const uint8_t * p ) {
        return ((uint64_t)p[0]      ) | ((uint64_t)p[1] <<  8) |
               ((uint64_t)p[2] << 16) | ((uint64_t)p[3] << 24) |
               ((uint64_t)p[4] << 32) | ((uint64_t)p[5] << 40) |
               ((uint64_t)p[6] << 48) | ((uint64_t)p[7] << 56);
    }

    static FORCE_INLINE uint64_t read32( const uint8_t * p ) {
        return ((uint64_t)p[0]      ) | ((uint64_t)p[1] <<  8) |
               ((uint64_t)p[2] << 16) | ((uint64_t)p[3] << 24);
    }
};

//-----------------------------------------------------------------------------
// 64*64 -> 128bit multiply. a is overwritten with the low 64 bits of the
// product, and b with the high 64 bits.
template <bool portable>
static FORCE_INLINE void rapid_mum( uint64_t & a, uint64_t & b ) {
    uint64_t rlo, rhi;

    if (portable) {
        MathMult::mult64_128_portable(rlo, rhi, a, b);
    } else {
        MathMult::mult64_128(rlo, rhi, a, b);
    }
    a = rlo; b = rhi;
}

// Multiply and fold: the XOR of the high and low halves of a*b.
template <bool portable>
static FORCE_INLINE uint64_t rapid_mix( uint64_t a, uint64_t b ) {
    rapid_mum<portable>(a, b);
    return a ^ b;
}

// Perturbs the user seed. This keeps a seed of 0 (or any other simple
// value) from being a fixed point of the first mix.
template <bool portable>
static FORCE_INLINE uint64_t rapid_seed( uint64_t seed ) {
    return seed ^ rapid_mix<portable>(seed ^ SECRETS[0], SECRETS[1]);
}

//-----------------------------------------------------------------------------
// Folds one 48-byte block into the three bulk lanes.
template <class Reader, bool portable>
static FORCE_INLINE void rapid_block( const uint8_t * p, uint64_t & seed, uint64_t & see1, uint64_t & see2 ) {
    seed = rapid_mix<portable>(Reader::read64(p     ) ^ SECRETS[0], Reader::read64(p +  8) ^ seed);
    see1 = rapid_mix<portable>(Reader::read64(p + 16) ^ SECRETS[1], Reader::read64(p + 24) ^ see1);
    see2 = rapid_mix<portable>(Reader::read64(p + 32) ^ SECRETS[2], Reader::read64(p + 40) ^ see2);
}

// Final avalanche. seed must already have had the length XORed in.
template <bool portable>
static FORCE_INLINE uint64_t rapid_finish( uint64_t a, uint64_t b, uint64_t seed, uint64_t len ) {
    a ^= SECRETS[1];
    b ^= seed;
    rapid_mum<portable>(a, b);
    return rapid_mix<portable>(a ^ SECRETS[0] ^ len, b ^ SECRETS[1]);
}

// Whole inputs of 0..16 bytes. Every read is within [p, p+len).
template <class Reader, bool portable>
static FORCE_INLINE uint64_t rapid_short( const uint8_t * p, size_t len, uint64_t seed ) {
    uint64_t a, b;

    seed ^= len;
    if (likely(len >= 4)) {
        const uint8_t * plast = p + len - 4;
        const size_t    delta = (len & 24) >> (len >> 3);
        a = (Reader::read32(p        ) << 32) | Reader::read32(plast        );
        b = (Reader::read32(p + delta) << 32) | Reader::read32(plast - delta);
    } else if (likely(len > 0)) {
        a = (((uint64_t)p[0]) << 56) | (((uint64_t)p[len >> 1]) << 32) | p[len - 1];
        b = 0;
    } else {
        a = b = 0;
    }
    return rapid_finish<portable>(a, b, seed, len);
}

// The 0..48 trailing bytes of an input of more than 16 bytes. p points to
// the bytes not consumed by rapid_block(), and plast to the final 16 bytes
// of the whole input, which may lie partly in already-consumed data. seed
// must already have had the length XORed in.
template <class Reader, bool portable>
static FORCE_INLINE uint64_t rapid_tail( const uint8_t * p, size_t remain,
        const uint8_t * plast, uint64_t seed, uint64_t len ) {
    if (remain > 16) {
        seed = rapid_mix<portable>(Reader::read64(p) ^ SECRETS[2], Reader::read64(p + 8) ^ seed ^ SECRETS[1]);
        if (remain > 32) {
            seed = rapid_mix<portable>(Reader::read64(p + 16) ^ SECRETS[2], Reader::read64(p + 24) ^ seed);
        }
    }
    return rapid_finish<portable>(Reader::read64(plast), Reader::read64(plast + 8), seed, len);
}

//-----------------------------------------------------------------------------
// rapidhash main function.
//
// @param p     Buffer to be hashed.
// @param len   @p length, in bytes.
// @param seed  Seed, already passed through rapid_seed().
//
// The length is mixed in after the bulk lanes are combined, rather than
// into the initial seed, so that Hasher can begin folding blocks before the
// total length is known.
template <class Reader, bool portable>
static inline uint64_t rapidhash_core( const uint8_t * p, size_t len, uint64_t seed ) {
    if (likely(len <= 16)) {
        return rapid_short<Reader, portable>(p, len, seed);
    }

    const uint8_t * plast = p + len - 16;
    size_t          i     = len;

    if (len > 48) {
        uint64_t see1 = seed, see2 = seed;
        while (i >= 96) {
            rapid_block<Reader, portable>(p     , seed, see1, see2);
            rapid_block<Reader, portable>(p + 48, seed, see1, see2);
            p += 96; i -= 96;
        }
        if (i >= 48) {
            rapid_block<Reader, portable>(p, seed, see1, see2);
            p += 48; i -= 48;
        }
        seed ^= see1 ^ see2;
    }

    return rapid_tail<Reader, portable>(p, i, plast, seed ^ len, len);
}

//-----------------------------------------------------------------------------
// Build-time defaults

#if defined(RAPIDHASH_PORTABLE_MULTIPLY)
static const bool RAPID_PORTABLE = true;
#else
static const bool RAPID_PORTABLE = false;
#endif

#if defined(RAPIDHASH_BYTEWISE_READS)
typedef ByteReader        RapidReaderLE;
typedef ByteReader        RapidReaderBE;
#else
typedef WordReader<false> RapidReaderLE;
typedef WordReader<true>  RapidReaderBE;
#endif

} // namespace RapidHash
