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
/*
 * Random number generation for test data, via CBRNG.
 *
 * The Rand object uses the Threefry algorithm as the base RNG. A single
 * 64-bit seed value (either explicitly specified, or condensed from
 * several user-supplied values) gives a stream of 2^64 random numbers.
 *
 * Threefry is counter-based: instead of evolving a state, it encrypts an
 * incrementing counter. By resetting this counter via seek(), random
 * outputs can be replayed at later times without computing the values in
 * between.
 *
 * rand_u64() returns the next random 64-bit integer.
 *
 * rand_range(max) returns a value in [0, max). The bias is negligible.
 *
 * rand_n(buf, len) fills buf[] with len random bytes. It follows the
 * sequence of rand_u64() values, written in little-endian order, and
 * always consumes a whole number of them.
 *
 * This generator exists to make test data. It is unrelated to the
 * RapidHash::Rng being tested.
 */
#pragma once

#include <type_traits>

class Rand {
  public:
    // These constants are all defined by the fact that this uses Threefry
    static const unsigned  RANDS_PER_ROUND = 4;
    static const unsigned  RNG_KEYS        = 5;
    static uint64_t        GLOBAL_SEED;

  private:
    uint64_t  rngbuf[RANDS_PER_ROUND];
    uint64_t  xseed[RNG_KEYS]; // Threefry keys
    uint64_t  counter;
    uint64_t  bufidx;          // The next rngbuf[] index to be given out
    uint64_t  rseed;           // The actual seed value

    void refill_buf( void );

    inline void update_xseed( void ) {
        // Keys 1-3 are derived from the seed value. This derivation is
        // fairly arbitrary, but leaves the low bits of keys 1-3 set.
        const uint64_t M1 = UINT64_C(0x9E3779B97F4A7C15); // phi
        const uint64_t M2 = UINT64_C(0x6A09E667F3BCC90B); // sqrt(2) - 1
        const uint64_t M3 = UINT64_C(0xBB67AE8584CAA73D); // sqrt(3) - 1

        xseed[0] = 0;
        xseed[1] = ((rseed             | 1) * M1);
        xseed[2] = ((ROTR64(rseed, 21) | 1) * M2);
        xseed[3] = ((ROTR64(rseed, 43) | 1) * M3);

        // Key 4 is from the Threefish specification
        const uint64_t K1 = UINT64_C(0x1BD11BDAA9FC1A22);
        xseed[4] = K1 ^ xseed[1] ^ xseed[2] ^ xseed[3];
    }

    // A weak mixing function, used only to condense seeds. It makes output
    // collisions unlikely given combinations of real-world inputs, but
    // does not attempt diffusion.
    static inline uint64_t weakmix( uint64_t a, uint64_t b ) {
        const uint64_t K = UINT64_C(0x3C6EF372FE94F82B); // sqrt(5) - 1

        return (3 * a) + (5 * b) + (4 * a * b) + K;
    }

  public:
    Rand( uint64_t seed = 0 ) {
        reseed(seed);
    }

    template <typename T, typename U, typename ... Remaining>
    Rand( T seed1, U seed2, Remaining... seeds ) {
        static_assert(std::is_integral<typename std::common_type<uint64_t, T, U, Remaining...>::type>::value,
                "Rand() only takes integer seeds");
        reseed(seed1, seed2, seeds...);
    }

    inline void reseed( uint64_t seed ) {
        rseed = weakmix(seed, GLOBAL_SEED);
        seek(0);
        update_xseed();
    }

    // Multiple seeds are condensed pairwise via weakmix() until only one
    // remains.
    template <typename T, typename U, typename ... Remaining>
    inline void reseed( T seed1, U seed2, Remaining... seeds ) {
        reseed(weakmix((uint64_t)seed1, (uint64_t)seed2), seeds...);
    }

    inline void seek( uint64_t offset ) {
        counter = offset / RANDS_PER_ROUND;
        bufidx  = RANDS_PER_ROUND + (offset % RANDS_PER_ROUND);
    }

    inline uint64_t rand_u64( void ) {
        if (unlikely(bufidx >= RANDS_PER_ROUND)) {
            refill_buf();
            bufidx -= RANDS_PER_ROUND;
        }
        return rngbuf[bufidx++];
    }

    inline uint32_t rand_range( uint32_t max ) {
        return (uint32_t)(((rand_u64() >> 32) * max) >> 32);
    }

    void rand_n( void * buf, size_t bytes );
}; // class Rand
