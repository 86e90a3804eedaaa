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
#include "Hashlib.h"
#include "RapidCore.h"

using RapidHash::WordReader;
using RapidHash::ByteReader;

//------------------------------------------------------------
// Output is always the little-endian encoding of the 64-bit result
static FORCE_INLINE void rapid_put( uint64_t h, void * out ) {
    if (isLE()) {
        PUT_U64<false>(h, (uint8_t *)out, 0);
    } else {
        PUT_U64<true>(h, (uint8_t *)out, 0);
    }
}

template <class ReaderLE, class ReaderBE, bool portable>
static void RapidHash64( const void * in, const size_t len, const seed_t seed, void * out ) {
    const uint8_t * p = (const uint8_t *)in;
    const uint64_t  s = RapidHash::rapid_seed<portable>(seed);
    uint64_t        h;

    if (isLE()) {
        h = RapidHash::rapidhash_core<ReaderLE, portable>(p, len, s);
    } else {
        h = RapidHash::rapidhash_core<ReaderBE, portable>(p, len, s);
    }
    rapid_put(h, out);
}

static void RapidHash64_default( const void * in, const size_t len, const seed_t seed, void * out ) {
    rapid_put(RapidHash::hash(in, len, seed), out);
}

// Feeds the input to a Hasher in uneven pieces, so that the block
// boundaries and the append() boundaries rarely line up.
static void RapidHash64_streaming( const void * in, const size_t len, const seed_t seed, void * out ) {
    static const size_t chunks[] = { 1, 7, 16, 3, 48, 0, 29, 64, 5 };
    const uint8_t *     p        = (const uint8_t *)in;
    RapidHash::Hasher   hasher( seed );
    size_t              remain   = len;
    size_t              i        = 0;

    while (remain > 0) {
        size_t n = chunks[i++ % (sizeof(chunks) / sizeof(chunks[0]))];
        if (n > remain) {
            n = remain;
        }
        hasher.append(p, n);
        p      += n;
        remain -= n;
    }
    rapid_put(hasher.finalize(), out);
}

//------------------------------------------------------------
// Keys of up to 48 bytes hash exactly as in upstream rapidhash v1. Longer
// keys mix in their length after the bulk loop instead of before it, so
// their hashes are NOT interchangeable with upstream's.
REGISTER_FAMILY(rapidhash,
   $.src_url    = "https://github.com/Nicoshev/rapidhash",
   $.src_status = HashFamilyInfo::SRC_STABLEISH
 );

REGISTER_HASH(rapidhash,
   $.desc       = "rapidhash, 64-bit, build-time default (matches v1 only for keys <= 48 bytes)",
   $.impl       = "default",
   $.sort_order = 0,
   $.impl_flags =
         FLAG_IMPL_MULTIPLY_64_128  |
         FLAG_IMPL_CANONICAL_LE     |
         FLAG_IMPL_LICENSE_MIT,
   $.bits = 64,
   $.verification = 0x5CC3AE98,
   $.hashfn       = RapidHash64_default
);

REGISTER_HASH(rapidhash_native,
   $.desc       = "rapidhash, 64-bit, word reads and native multiply",
   $.impl       = "native",
   $.sort_order = 10,
   $.impl_flags =
         FLAG_IMPL_MULTIPLY_64_128  |
         FLAG_IMPL_CANONICAL_LE     |
         FLAG_IMPL_LICENSE_MIT,
   $.bits = 64,
   $.verification = 0x5CC3AE98,
   $.hashfn       = RapidHash64<WordReader<false>, WordReader<true>, false>
);

REGISTER_HASH(rapidhash_portable,
   $.desc       = "rapidhash, 64-bit, word reads and portable multiply",
   $.impl       = "portable",
   $.sort_order = 20,
   $.impl_flags =
         FLAG_IMPL_MULTIPLY_64_128  |
         FLAG_IMPL_PORTABLE_MULTIPLY |
         FLAG_IMPL_CANONICAL_LE     |
         FLAG_IMPL_LICENSE_MIT,
   $.bits = 64,
   $.verification = 0x5CC3AE98,
   $.hashfn       = RapidHash64<WordReader<false>, WordReader<true>, true>
);

REGISTER_HASH(rapidhash_bytewise,
   $.desc       = "rapidhash, 64-bit, byte-at-a-time reads",
   $.impl       = "bytewise",
   $.sort_order = 30,
   $.impl_flags =
         FLAG_IMPL_MULTIPLY_64_128  |
         FLAG_IMPL_BYTEWISE_READS   |
         FLAG_IMPL_CANONICAL_LE     |
         FLAG_IMPL_LICENSE_MIT,
   $.bits = 64,
   $.verification = 0x5CC3AE98,
   $.hashfn       = RapidHash64<ByteReader, ByteReader, RapidHash::RAPID_PORTABLE>
);

REGISTER_HASH(rapidhash_streaming,
   $.desc       = "rapidhash, 64-bit, via the incremental Hasher",
   $.impl       = "streaming",
   $.sort_order = 40,
   $.impl_flags =
         FLAG_IMPL_INCREMENTAL      |
         FLAG_IMPL_MULTIPLY_64_128  |
         FLAG_IMPL_CANONICAL_LE     |
         FLAG_IMPL_LICENSE_MIT,
   $.bits = 64,
   $.verification = 0x5CC3AE98,
   $.hashfn       = RapidHash64_streaming
);
