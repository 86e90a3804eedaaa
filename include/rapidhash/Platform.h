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
//-----------------------------------------------------------------------------
// Platform-specific functions and macros
#pragma once

#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <cstring>

#if !defined(HAVE_X86_64)
  #if defined(__x86_64) || defined(_M_AMD64) || defined(_M_X64)
    #define HAVE_X86_64
  #endif
#endif

//-----------------------------------------------------------------------------
// Microsoft Visual Studio

#if defined(_MSC_VER)

#include <stdlib.h>
#include <intrin.h>

#define FORCE_INLINE __forceinline

#define ROTL64(x, y) _rotl64(x, y)
#define ROTR64(x, y) _rotr64(x, y)

#if defined(_M_AMD64) || defined(_M_X64)
  #define HAVE_UMUL128
#endif

#define likely(x) (x)
#define unlikely(x) (x)

//-----------------------------------------------------------------------------
// Other compilers

#else //  !defined(_MSC_VER)

#define FORCE_INLINE inline __attribute__((always_inline))

// Deliberately unsafe! Assumes r is not 0 or >=64
inline uint64_t rotl64( uint64_t x, int8_t r ) {
    return (x << r) | (x >> (64 - r));
}

inline uint64_t rotr64( uint64_t x, int8_t r ) {
    return (x >> r) | (x << (64 - r));
}

#define ROTL64(x, y) rotl64(x, y)
#define ROTR64(x, y) rotr64(x, y)

#define likely(x) __builtin_expect(!!(x), 1)
#define unlikely(x) __builtin_expect(!!(x), 0)

#endif //  !defined(_MSC_VER)

#if defined(HAVE_INT128)
typedef unsigned __int128 uint128_t;
#endif

//-----------------------------------------------------------------------------
static FORCE_INLINE bool isLE( void ) {
    const uint32_t  value = 0xb000000e;
    const void *    addr  = static_cast<const void *>(&value);
    const uint8_t * lsb   = static_cast<const uint8_t *>(addr);

    return (*lsb) == 0x0e;
}

static FORCE_INLINE bool isBE( void ) {
    const uint32_t  value = 0xb000000e;
    const void *    addr  = static_cast<const void *>(&value);
    const uint8_t * lsb   = static_cast<const uint8_t *>(addr);

    return (*lsb) == 0xb0;
}

template <typename T>
static FORCE_INLINE T BSWAP( T value ) {
    switch (sizeof(T)) {
#if defined(_MSC_VER)
    case 2: value = _byteswap_ushort((uint16_t)value); break;
    case 4: value = _byteswap_ulong((uint32_t)value); break;
    case 8: value = _byteswap_uint64((uint64_t)value); break;
#else
    case 2: value = __builtin_bswap16((uint16_t)value); break;
    case 4: value = __builtin_bswap32((uint32_t)value); break;
    case 8: value = __builtin_bswap64((uint64_t)value); break;
#endif
    default: break;
    }
    return value;
}

template <typename T>
static FORCE_INLINE T COND_BSWAP( T value, bool doit ) {
    if (!doit || (sizeof(T) < 2)) { return value; }
    return BSWAP(value);
}

//-----------------------------------------------------------------------------
// Integer load/store functions. These move data in alignment-safe ways,
// with optional byte swapping.

template <bool bswap>
static FORCE_INLINE uint64_t GET_U64( const uint8_t * b, const uint32_t i ) {
    uint64_t n;

    memcpy(&n, &b[i], 8);
    n = COND_BSWAP(n, bswap);
    return n;
}

template <bool bswap>
static FORCE_INLINE uint32_t GET_U32( const uint8_t * b, const uint32_t i ) {
    uint32_t n;

    memcpy(&n, &b[i], 4);
    n = COND_BSWAP(n, bswap);
    return n;
}

template <bool bswap>
static FORCE_INLINE void PUT_U16( uint16_t n, uint8_t * b, const uint32_t i ) {
    n = COND_BSWAP(n, bswap);
    memcpy(&b[i], &n, 2);
}

template <bool bswap>
static FORCE_INLINE void PUT_U32( uint32_t n, uint8_t * b, const uint32_t i ) {
    n = COND_BSWAP(n, bswap);
    memcpy(&b[i], &n, 4);
}

template <bool bswap>
static FORCE_INLINE void PUT_U64( uint64_t n, uint8_t * b, const uint32_t i ) {
    n = COND_BSWAP(n, bswap);
    memcpy(&b[i], &n, 8);
}
