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
// RapidHash public interface
//
// A fast, platform-independent, non-cryptographic 64-bit hash, an
// incremental hasher which gives identical results no matter how the input
// is split up, and a small RNG built from the same mixing function.
//
// Every result is defined purely in terms of the input bytes, read as
// little-endian, so outputs are the same on every host.
#pragma once

#include <cstddef>
#include <cstdint>

namespace RapidHash {

// The published default seed.
const uint64_t DEFAULT_SEED = UINT64_C(0xbdd89aa982704029);

// Fixed public secrets. These are part of the algorithm definition, and
// changing any of them changes every output.
static const uint64_t SECRETS[3] = {
    UINT64_C(0x2d358dccaa6c78a5), UINT64_C(0x8bb84b93962eacc9), UINT64_C(0x4b33a62ed433d4a3),
};

//-----------------------------------------------------------------------------
// The 64x64->128 multiply at the heart of the hash. mum() replaces a with
// the low half of a*b and b with the high half. mix() returns the two
// halves XORed together.
void mum( uint64_t & a, uint64_t & b );
uint64_t mix( uint64_t a, uint64_t b );

//-----------------------------------------------------------------------------
// One-shot hash of len bytes at data. data may be NULL if len is 0.
uint64_t hash( const void * data, size_t len, uint64_t seed = DEFAULT_SEED );

//-----------------------------------------------------------------------------
// Incremental hash. Any sequence of append() calls followed by finalize()
// gives the same value as hash() over the concatenation of all appended
// bytes with the same seed. finalize() does not change the hasher, so it
// may be called repeatedly, and more data may be appended afterwards.
//
// Memory use is constant: at most one 48-byte block is kept pending.
class Hasher {
  public:
    static const size_t BLOCKLEN = 48;

    explicit Hasher( uint64_t seed = DEFAULT_SEED );

    Hasher & append( const void * data, size_t len );

    // These append the little-endian encoding of their argument
    Hasher & append_u8( uint8_t v );
    Hasher & append_u16( uint16_t v );
    Hasher & append_u32( uint32_t v );
    Hasher & append_u64( uint64_t v );
    Hasher & append_u128( uint64_t lo, uint64_t hi );

    uint64_t finalize( void ) const;

    uint64_t length( void ) const { return total; }

  private:
    template <class Reader, bool portable>
    void absorb( const uint8_t * p, size_t len );

    template <class Reader, bool portable>
    uint64_t finish( void ) const;

    uint64_t  seed;               // Premixed seed, and bulk lane 0
    uint64_t  see1, see2;         // Bulk lanes 1 and 2
    uint64_t  total;              // Bytes appended so far
    size_t    pending;            // Valid bytes in buf[]
    uint8_t   buf[BLOCKLEN];      // Bytes not yet folded into the lanes
    uint8_t   lastblock[16];      // Final 16 bytes of the last folded block
}; // class Hasher

//-----------------------------------------------------------------------------
// Makes identically-seeded Hashers, one per key, for hash tables and
// similar containers.
class BuildHasher {
  public:
    explicit BuildHasher( uint64_t seed = DEFAULT_SEED ) :
        seed( seed ) {}

    Hasher build( void ) const {
        return Hasher(seed);
    }

    uint64_t hash( const void * data, size_t len ) const {
        return RapidHash::hash(data, len, seed);
    }

    uint64_t getSeed( void ) const {
        return seed;
    }

  private:
    uint64_t  seed;
}; // class BuildHasher

//-----------------------------------------------------------------------------
// A fast, deterministic, NON-cryptographic RNG. The state is a single
// 64-bit counter which is stepped by a fixed odd constant, so every seed
// gives a single full-period cycle over all 2^64 states.
class Rng {
  public:
    // A seed of 0 is replaced by DEFAULT_SEED
    explicit Rng( uint64_t seed = DEFAULT_SEED );

    // The inverse of state(): the seed is read as 8 little-endian bytes.
    // An all-zero seed is replaced by DEFAULT_SEED, as above.
    static Rng from_bytes( const uint8_t seed[8] );

    uint64_t next_u64( void );

    uint32_t next_u32( void ) {
        return (uint32_t)next_u64();
    }

    // Fills buf[] with the little-endian bytes of successive next_u64()
    // values. A final partial word uses that word's low bytes.
    void fill( void * buf, size_t len );

    // Exports the current state as 8 little-endian bytes
    void state( uint8_t out[8] ) const;

  private:
    uint64_t  counter;
}; // class Rng

// Advances a caller-owned state exactly as Rng::next_u64() does, and
// returns the next value.
uint64_t rng_fast( uint64_t & state );

} // namespace RapidHash
