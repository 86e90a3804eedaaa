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
#include "TestGlobals.h"
#include "Random.h"
#include "RapidHash.h"

#include "ThreadingTest.h"

#include <vector>
#include <algorithm>

#if defined(HAVE_THREADS)
  #include <thread>
  #include <functional>
#endif

//----------------------------------------------------------------------------
// Make sure results are consistent across threads, both 1) for the
// registered hash function, and 2) for per-thread Hasher instances fed in
// uneven pieces.

static const uint32_t reps = 1024 * 4;

template <bool incremental>
static void hashthings( const HashInfo * hinfo, seed_t seed, uint32_t order,
        const std::vector<uint8_t> & keys, std::vector<uint64_t> & hashes, flags_t flags ) {
    // Each thread should hash the keys in a different, random order
    std::vector<uint32_t> idxs( reps );

    for (uint32_t i = 0; i < reps; i++) { idxs[i] = i; }
    if (order != 0) {
        Rand r( 583015, order );
        for (uint32_t i = reps - 1; i > 0; i--) {
            std::swap(idxs[i], idxs[r.rand_range(i + 1)]);
        }
    }

    // Key i is i+1 bytes long, starting at offset i
    for (uint32_t i = 0; i < reps; i++) {
        const uint32_t  idx = idxs[i];
        const uint8_t * key = &keys[idx];
        const size_t    len = idx + 1;

        if (incremental) {
            RapidHash::Hasher h( seed );
            size_t            pos = 0, step = 1;
            while (pos < len) {
                const size_t n = std::min(step, len - pos);
                h.append(key + pos, n);
                pos  += n;
                step  = step * 3 + 1;
            }
            hashes[idx] = h.finalize();
        } else {
            uint8_t out[8];
            hinfo->hash(key, len, seed, out);
            hashes[idx] = isLE() ? GET_U64<false>(out, 0) : GET_U64<true>(out, 0);
        }
        if (REPORT(PROGRESS, flags) && (order < 2)) { progressdots(i, 0, reps - 1, 4); }
    }
}

template <bool incremental>
static bool ThreadingTestImpl( const HashInfo * hinfo, flags_t flags ) {
    Rand r( 955165, g_seed );

    const seed_t          seed = incremental ? RapidHash::DEFAULT_SEED : 0x12345;
    std::vector<uint8_t>  keys( 2 * reps );
    std::vector<uint64_t> mainhashes( reps );
    bool result = true;

    maybeprintf("Running thread-safety test %d ", incremental ? 2 : 1);

    if (g_NCPU > 1) {
#if defined(HAVE_THREADS)
        r.rand_n(&keys[0], keys.size());
        maybeprintf(".");

        // Compute all the hashes in order on the main process
        hashthings<incremental>(hinfo, seed, 0, keys, mainhashes, flags);

        // Compute all the hashes in different random orders in threads
        std::vector<std::vector<uint64_t>> threadhashes( g_NCPU, std::vector<uint64_t>(reps));
        std::vector<std::thread> t(g_NCPU);
        for (unsigned i = 0; i < g_NCPU; i++) {
            t[i] = std::thread {
                hashthings<incremental>, hinfo, seed, i + 1, std::cref(keys), std::ref(threadhashes[i]), flags
            };
        }
        for (unsigned i = 0; i < g_NCPU; i++) {
            t[i].join();
        }

        // Make sure all thread results match the main process
        maybeprintf(".");
        for (unsigned i = 0; i < g_NCPU; i++) {
            for (uint32_t j = 0; j < reps; j++) {
                if (mainhashes[j] != threadhashes[i][j]) {
                    maybeprintf("\nMismatch between main process and thread #%d at index %d\n", i, j);
                    maybeprintf("  main   : 0x%016" PRIx64 "\n", mainhashes[j]);
                    maybeprintf("  thread : 0x%016" PRIx64 "\n", threadhashes[i][j]);
                    result = false;
                    break; // Only breaks out of j loop
                }
            }
        }

        reportResult(result, flags);

        recordTestResult(result, "Threads", incremental ? "Hasher" : "Hash function");
#endif
    } else {
#if defined(HAVE_THREADS)
        maybeprintf("..... SKIPPED (ncpu set to 1)\n");
#else
        maybeprintf("..... SKIPPED (compiled without threads)\n");
#endif
    }

    return result;
}

//----------------------------------------------------------------------------

bool ThreadingTest( const HashInfo * hinfo, flags_t flags ) {
    bool result = true;

    printf("[[[ Thread-safety Tests ]]]\n\n");

    flags |= FLAG_REPORT_VERBOSE;

    result &= ThreadingTestImpl<false>(hinfo, flags);
    result &= ThreadingTestImpl<true>(hinfo, flags);

    if (!result) {
        DisableThreads();
    }

    printf("\n%s", result ? "" : g_failstr);

    return result;
}
