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
#include "Hashinfo.h"

#include <cstdio>
#include <string>
#include <algorithm>

const char * HashInfo::_fixup_name( const char * in ) {
    // Since dashes can't be in C/C++ identifiers, but humans want
    // them in names, replace underscores with dashes.
    std::string out( in );

    std::replace(out.begin(), out.end(), '_', '-');
    return strdup(out.c_str());
}

const char * HashFamilyInfo::_fixup_name( const char * in ) {
    return HashInfo::_fixup_name(in);
}

//-----------------------------------------------------------------------------
// This should hopefully be a thorough and unambiguous test of whether a
// variant is computing the same function as every other one.

uint32_t HashInfo::ComputedVerify( void ) const {
    const uint32_t hashbytes = bits / 8;

    uint8_t * key    = new uint8_t[            256];
    uint8_t * hashes = new uint8_t[hashbytes * 256];
    uint8_t * total  = new uint8_t[hashbytes      ];

    memset(key   , 0,             256);
    memset(hashes, 0, hashbytes * 256);
    memset(total , 0,       hashbytes);

    // Hash keys of the form {}, {0}, {0,1}, {0,1,2}... up to N=255, using
    // 256-N as the seed
    for (int i = 0; i < 256; i++) {
        seed_t seed = 256 - i;
        hashfn(key, i, seed, &hashes[i * hashbytes]);
        key[i] = (uint8_t)i;
    }

    // Then hash the result array
    hashfn(hashes, hashbytes * 256, 0, total);

    // The first four bytes of that hash, interpreted as a little-endian
    // integer, is our verification value
    uint32_t verification = (total[0] << 0) | (total[1] << 8) |
            (total[2] << 16) | ((uint32_t)total[3] << 24);

    delete [] total;
    delete [] hashes;
    delete [] key;

    return verification;
}
