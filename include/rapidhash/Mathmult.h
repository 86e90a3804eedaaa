/*
 * Multiplication routines for 64x64->128-bit math,
 * in terms of <=64-bit variables.
 *
 * Copyright (C) 2021-2023  Frank J. T. Wojcik
 * Copyright (C) 2023       jason
 * Copyright (c) 2016 Vladimir Makarov <vmakarov@gcc.gnu.org>
 *
 * Permission is hereby granted, free of charge, to any person
 * obtaining a copy of this software and associated documentation
 * files (the "Software"), to deal in the Software without
 * restriction, including without limitation the rights to use, copy,
 * modify, merge, publish, distribute, sublicense, and/or sell copies
 * of the Software, and to permit persons to whom the Software is
 * furnished to do so, subject to the following conditions:
 *
 * The above copyright notice and this permission notice shall be
 * included in all copies or substantial portions of the Software.
 *
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND,
 * EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF
 * MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND
 * NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS
 * BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN
 * ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN
 * CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE
 * SOFTWARE.
 */

/*
 * Both versions of the 64x64->128 multiply are always available, so that
 * they can be checked against each other on any platform. Which one the
 * hash itself uses is decided in RapidCore.h.
 *
 * clang is not given the option of memory operands in the asm version,
 * since it tends to spill registers to the stack and operate on the
 * stack copy. See:
 *    https://github.com/llvm/llvm-project/issues/20571
 */
#pragma once

#include "Platform.h"

#if !defined(_MSC_VER) && defined(HAVE_X86_64) && !defined(HAVE_X86_64_ASM)
  #define HAVE_X86_64_ASM
#endif

namespace MathMult {

// 64x64->128 multiplication [rhi:rlo = a * b], by four 32x32->64 bit
// multiplications and explicit carry propagation.
static FORCE_INLINE void mult64_128_portable( uint64_t & rlo, uint64_t & rhi, uint64_t a, uint64_t b ) {
    uint64_t ahi     = a >> 32, bhi = b >> 32;
    uint64_t alo     = (uint32_t)a, blo = (uint32_t)b;
    uint64_t tmphi   = ahi * bhi;
    uint64_t tmpmi_0 = ahi * blo;
    uint64_t tmpmi_1 = alo * bhi;
    uint64_t tmplo   = alo * blo;
    uint64_t t, carry = 0;

    t      = (tmpmi_0 << 32) + tmplo;
    carry += (t < tmplo);
    rlo    = (tmpmi_1 << 32) + t;
    carry += (rlo < t);
    rhi    = (tmpmi_0 >> 32) + (tmpmi_1 >> 32) + tmphi + carry;
}

// 64x64->128 multiplication [rhi:rlo = a * b], using the widest multiply
// the platform offers.
static FORCE_INLINE void mult64_128( uint64_t & rlo, uint64_t & rhi, uint64_t a, uint64_t b ) {
#if defined(HAVE_UMUL128)
    rlo = _umul128(a, b, &rhi);
#elif defined(HAVE_INT128)
    uint128_t r = (uint128_t)a * (uint128_t)b;
    rhi = (uint64_t)(r >> 64);
    rlo = (uint64_t)r;
#elif defined(HAVE_X86_64_ASM)
    __asm__ ("mulq %3"
  #if defined(__clang__)
             : "=d" (rhi), "=a" (rlo)
             : "%1" (a), "r" (b)
  #else
             : "=d" (rhi), "=a" (rlo)
             : "%1" (a), "rm" (b)
  #endif
             : "cc"
    );
#else
    mult64_128_portable(rlo, rhi, a, b);
#endif
}

} // namespace MathMult

// Checks both multiply versions against known products and against each
// other. Returns false and prints the mismatches on failure.
bool Mathmult_selftest( bool verbose );
