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
#pragma once

#include <cstdlib>

#include "Platform.h"

//-----------------------------------------------------------------------------
// Hash variants are described by a HashInfo, and grouped into families
// by a HashFamilyInfo. See Hashlib.h for how they get registered.

typedef uint64_t seed_t;

#define IMPL_FLAGS                          \
    FLAG_EXPAND(IMPL_INCREMENTAL)           \
    FLAG_EXPAND(IMPL_MULTIPLY_64_128)       \
    FLAG_EXPAND(IMPL_PORTABLE_MULTIPLY)     \
    FLAG_EXPAND(IMPL_BYTEWISE_READS)        \
    FLAG_EXPAND(IMPL_CANONICAL_LE)          \
    FLAG_EXPAND(IMPL_LICENSE_MIT)

#define FLAG_EXPAND(name) FLAG_ENUM_ ## name,
typedef enum {
    IMPL_FLAGS
} implflag_enum_t;
#undef FLAG_EXPAND

#define FLAG_EXPAND(name) FLAG_ ## name = (1ULL << FLAG_ENUM_ ## name),
typedef enum : uint64_t {
    IMPL_FLAGS
} ImplFlags;
#undef FLAG_EXPAND

//-----------------------------------------------------------------------------
class HashInfo;

// Hashes write bits/8 bytes to out, in little-endian order
typedef void       (* HashFn)( const void * in, const size_t len, const seed_t seed, void * out );

class HashInfo {
    friend class HashFamilyInfo;

  protected:
    static const char * _fixup_name( const char * in );

  public:
    const char *  name;
    const char *  family;
    const char *  desc;
    const char *  impl;
    uint64_t      impl_flags;
    uint32_t      sort_order;
    uint32_t      bits;
    uint32_t      verification;
    HashFn        hashfn;

    HashInfo( const char * n, const char * f ) :
        name( _fixup_name( n ) ), family( f ), desc( "" ), impl( "" ),
        impl_flags( 0 ), sort_order( 0 ), bits( 0 ), verification( 0 ),
        hashfn( NULL ) {}

    // Hashes of keys {}, {0}, {0,1}, ... {0..254} with seeds 256..1,
    // hashed together with seed 0. The first 4 bytes of that, as a
    // little-endian integer, identify the implementation.
    uint32_t ComputedVerify( void ) const;

    FORCE_INLINE void hash( const void * in, const size_t len, const seed_t seed, void * out ) const {
        hashfn(in, len, seed, out);
    }

    FORCE_INLINE bool isIncremental( void ) const {
        return !!(impl_flags & FLAG_IMPL_INCREMENTAL);
    }
}; // class HashInfo

class HashFamilyInfo {
  public:
    const char * name;
    const char * src_url;
    enum SrcStatus : uint32_t {
        SRC_UNKNOWN,
        SRC_FROZEN,    // Very unlikely to change
        SRC_STABLEISH, // Fairly unlikely to change
        SRC_ACTIVE,    // Likely to change
    }  src_status;

    HashFamilyInfo( const char * n ) :
        name( _fixup_name( n )),
        src_url( NULL ), src_status( SRC_UNKNOWN ) {}

  private:
    static const char * _fixup_name( const char * in );
}; // class HashFamilyInfo
